#include "planwarden/attestation.h"
#include "planwarden/canonical.h"
#include "planwarden/crypto.h"
#include "planwarden/json_util.h"

namespace planwarden {

json_object* hash_payload(const Plan& plan) {
    json_object* payload = json_object_new_object();
    json_object* doc = plan.document();
    for (const char* field : kHashedPlanFields) {
        json_object* v = nullptr;
        if (!doc || !json_object_object_get_ex(doc, field, &v)) continue; // absent: omitted
        // shared child; canonical_serialize only reads it
        json_object_object_add(payload, field, v ? json_object_get(v) : nullptr);
    }
    return payload;
}

std::string canonical_plan_payload(const Plan& plan) {
    json_object* payload = hash_payload(plan);
    std::string out = canonical_serialize(payload);
    json_object_put(payload);
    return out;
}

std::string compute_expected_hash(const Plan& plan) {
    return sha256_hex(canonical_plan_payload(plan));
}

bool verify_attestation(const Plan& plan, std::string* digest, AttestationError* err) {
    const std::string expected = compute_expected_hash(plan);
    auto stored = plan.plan_hash();

    if (!stored) {
        if (err) {
            err->kind = ErrorKind::MISSING_ATTESTATION;
            err->expected = expected;
            err->actual.clear();
            err->message = "missing attestation.plan_hash in plan " + plan.plan_id();
        }
        return false;
    }

    if (!hex_digest_eq(*stored, expected)) {
        if (err) {
            err->kind = ErrorKind::HASH_MISMATCH;
            err->expected = expected;
            err->actual = *stored;
            err->message = "plan hash mismatch for " + plan.plan_id() +
                           " (expected " + expected + ", found " + *stored + ")";
        }
        return false;
    }

    if (digest) *digest = expected;
    return true;
}

std::string attest_plan(Plan& plan) {
    std::string h = compute_expected_hash(plan);
    plan.set_plan_hash(h);
    return h;
}

} // namespace planwarden
