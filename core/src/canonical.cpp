#include "planwarden/canonical.h"
#include "planwarden/json_util.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace planwarden {

// Shortest decimal that reads back as `v`, in ECMAScript Number::toString
// layout: plain notation for exponents in [-7, 21), e-notation otherwise.
static std::string format_double(double v) {
    if (!std::isfinite(v)) return "null";
    if (v == 0) return "0";

    char buf[40];
    for (int prec = 1; prec <= 17; prec++) {
        std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, v);
        if (std::strtod(buf, nullptr) == v) break;
    }

    // buf: [-]d[.ddd]e(+|-)xx
    std::string s(buf);
    std::string out;
    size_t i = 0;
    if (s[0] == '-') {
        out.push_back('-');
        i = 1;
    }
    const size_t epos = s.find('e');
    std::string digits;
    for (size_t j = i; j < epos; j++) {
        if (s[j] != '.') digits.push_back(s[j]);
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();
    const int n = std::atoi(s.c_str() + epos + 1) + 1; // decimal point position
    const int k = (int)digits.size();

    if (k <= n && n <= 21) {
        out += digits;
        out.append((size_t)(n - k), '0');
    } else if (0 < n && n <= 21) {
        out += digits.substr(0, (size_t)n);
        out += ".";
        out += digits.substr((size_t)n);
    } else if (-6 < n && n <= 0) {
        out += "0.";
        out.append((size_t)(-n), '0');
        out += digits;
    } else {
        out += digits.substr(0, 1);
        if (k > 1) {
            out += ".";
            out += digits.substr(1);
        }
        out += (n - 1 >= 0) ? "e+" : "e-";
        out += std::to_string(std::abs(n - 1));
    }
    return out;
}

static void serialize_into(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        // std::string orders by byte value, never by locale
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            serialize_into(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            serialize_into(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    case json_type_string:
        out << json_quote(std::string(json_object_get_string(obj), (size_t)json_object_get_string_len(obj)));
        break;
    case json_type_double:
        out << format_double(json_object_get_double(obj));
        break;
    default:
        // null, boolean and int: json-c's plain literal
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_serialize(json_object* obj) {
    std::ostringstream out;
    serialize_into(obj, out);
    return out.str();
}

bool canonicalize_json(const std::string& raw, std::string* out, std::string* err) {
    json_object* obj = nullptr;
    if (!json_parse_document(raw, &obj, err)) return false;
    *out = canonical_serialize(obj);
    if (obj) json_object_put(obj);
    return true;
}

} // namespace planwarden
