#pragma once

#include <json-c/json.h>

#include <string>

namespace planwarden {

// Canonical JSON encoding used for every digest in planwarden.
//
// - object keys sorted by raw byte value (no locale collation)
// - arrays keep element order
// - strings, booleans and integers use json-c's plain encoder, '/' not escaped
// - doubles are written from their value: shortest round-trip decimal,
//   integral values without a fraction (1.0 -> 1)
// - no whitespace anywhere
// - a null json_object* encodes as `null`
//
// Two structurally equal values always produce byte-identical output,
// regardless of the member order they were built or parsed in.
std::string canonical_serialize(json_object* obj);

// Parses `raw` and returns its canonical encoding. On parse failure returns
// false and leaves *out untouched.
bool canonicalize_json(const std::string& raw, std::string* out, std::string* err = nullptr);

} // namespace planwarden
