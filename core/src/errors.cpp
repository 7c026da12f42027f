#include "planwarden/errors.h"

namespace planwarden {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                  return "None";
        case ErrorKind::PLAN_NOT_FOUND:        return "PlanNotFound";
        case ErrorKind::PLAN_PARSE_ERROR:      return "PlanParseError";
        case ErrorKind::MISSING_ATTESTATION:   return "MissingAttestation";
        case ErrorKind::HASH_MISMATCH:         return "HashMismatch";
        case ErrorKind::STEP_GENERATION_ERROR: return "StepGenerationError";
        case ErrorKind::ARTIFACT_WRITE_ERROR:  return "ArtifactWriteError";
        case ErrorKind::INTEGRITY_ERROR:       return "IntegrityError";
        case ErrorKind::AUDIT_WRITE_ERROR:     return "AuditWriteError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = error_kind_name(kind);
    if (!message.empty()) {
        out += ": ";
        // keep diagnostics on one line
        for (char c : message) out.push_back((c == '\n' || c == '\r') ? ' ' : c);
    }
    return out;
}

} // namespace planwarden
