#pragma once

#include <json-c/json.h>

#include <string>

namespace planwarden {

// --- JSON helpers (json-c wrappers) ---

// Parses a complete JSON document. Trailing non-whitespace is an error.
// Returns true on success; *out receives a new reference (may be nullptr for
// the literal `null`). On failure *err describes the problem.
bool json_parse_document(const std::string& text, json_object** out, std::string* err);

// JSON string literal for s (quotes included), '/' not escaped.
std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
json_object* json_get_member(json_object* o, const char* k);

// Pretty form used when a plan is written back to disk.
std::string json_to_pretty(json_object* o);

} // namespace planwarden
