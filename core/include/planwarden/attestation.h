#pragma once

#include "plan.h"

#include <json-c/json.h>

#include <array>
#include <string>

namespace planwarden {

// Field-selection contract for plan digests.
//
// plan-hash/v1: SHA-256 over the canonical encoding of an object holding
// exactly those of the members below that the plan carries. Every other
// top-level member (attestation included) is outside the digest, so
// auxiliary metadata can be added to an attested plan without breaking it,
// and the stored hash never covers itself.
//
// Producers (`planwarden hash`, `planwarden attest`) and the verifier share
// this one definition. Changing the list requires a new contract version.
inline constexpr const char* kHashContractVersion = "plan-hash/v1";
inline constexpr std::array<const char*, 6> kHashedPlanFields = {
    "plan_id", "skill_id", "skill_version", "inputs", "constraints", "steps"
};

// New object with the hashed members of `plan` (caller owns the reference).
json_object* hash_payload(const Plan& plan);

// Canonical encoding of hash_payload(plan).
std::string canonical_plan_payload(const Plan& plan);

// Lowercase hex SHA-256 of canonical_plan_payload(plan).
std::string compute_expected_hash(const Plan& plan);

struct AttestationError {
    ErrorKind kind{ErrorKind::NONE}; // MISSING_ATTESTATION or HASH_MISMATCH
    std::string expected;            // recomputed digest
    std::string actual;              // digest stored in the plan (may be empty)
    std::string message;
};

// Hard gate: true when attestation.plan_hash equals the recomputed digest
// (case-insensitive). On success *digest receives the recomputed lowercase
// digest; on failure *err carries both digests for forensic comparison.
bool verify_attestation(const Plan& plan, std::string* digest, AttestationError* err);

// Stores compute_expected_hash(plan) in attestation.plan_hash and returns it.
std::string attest_plan(Plan& plan);

} // namespace planwarden
