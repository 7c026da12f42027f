#include "planwarden/json_util.h"

#include <cctype>
#include <cmath>

namespace planwarden {

// NaN and Infinity have no JSON spelling; a tree holding one cannot be
// canonicalized.
static bool has_non_finite(json_object* o) {
    if (!o) return false;
    switch (json_object_get_type(o)) {
    case json_type_double:
        return !std::isfinite(json_object_get_double(o));
    case json_type_object: {
        json_object_object_foreach(o, k, v) {
            (void)k;
            if (has_non_finite(v)) return true;
        }
        return false;
    }
    case json_type_array: {
        const size_t n = json_object_array_length(o);
        for (size_t i = 0; i < n; i++) {
            if (has_non_finite(json_object_array_get_idx(o, i))) return true;
        }
        return false;
    }
    default:
        return false;
    }
}

bool json_parse_document(const std::string& text, json_object** out, std::string* err) {
    *out = nullptr;

    // trailing whitespace dropped; the terminating NUL is passed along so a
    // top-level number is complete
    size_t len = text.size();
    while (len > 0 && std::isspace((unsigned char)text[len - 1])) len--;
    const std::string body(text, 0, len);

    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "json_tokener_new failed";
        return false;
    }
    // strict: no comments, single quotes, trailing commas or NaN
    json_tokener_set_flags(tok, JSON_TOKENER_STRICT);

    json_object* obj = json_tokener_parse_ex(tok, body.c_str(), (int)len + 1);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);

    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) {
            *err = (jerr == json_tokener_continue) ? "unexpected end of input"
                                                   : json_tokener_error_desc(jerr);
        }
        return false;
    }

    if (end < len) {
        if (obj) json_object_put(obj);
        if (err) *err = "trailing data at offset " + std::to_string(end);
        return false;
    }

    if (has_non_finite(obj)) {
        json_object_put(obj);
        if (err) *err = "non-finite number";
        return false;
    }

    *out = obj;
    return true;
}

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = json_object_get_string(v);
    return true;
}

json_object* json_get_member(json_object* o, const char* k) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v)) return nullptr;
    return v;
}

std::string json_to_pretty(json_object* o) {
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED |
                                             JSON_C_TO_STRING_NOSLASHESCAPE);
}

} // namespace planwarden
