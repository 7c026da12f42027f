#pragma once
#include <string>
#include <utility>

namespace planwarden {

// Every fatal condition a run can end in. None of these are retried.
enum class ErrorKind {
    NONE,
    PLAN_NOT_FOUND,
    PLAN_PARSE_ERROR,
    MISSING_ATTESTATION,
    HASH_MISMATCH,
    STEP_GENERATION_ERROR,
    ARTIFACT_WRITE_ERROR,
    INTEGRITY_ERROR,
    AUDIT_WRITE_ERROR,
};

// "PlanNotFound", "HashMismatch", ...
const char* error_kind_name(ErrorKind k);

struct Error {
    ErrorKind kind{ErrorKind::NONE};
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }
    // Single-line operator diagnostic: "<Kind>: <message>"
    std::string describe() const;
};

inline void set_error(Error* err, ErrorKind kind, std::string message) {
    if (!err) return;
    err->kind = kind;
    err->message = std::move(message);
}

} // namespace planwarden
