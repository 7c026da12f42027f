#include "test_common.h"
#include "plan_fixtures.h"

#include "planwarden/attestation.h"
#include "planwarden/crypto.h"

#include <algorithm>
#include <cctype>

using namespace planwarden;

static std::string replace_once(std::string s, const std::string& from, const std::string& to) {
    auto pos = s.find(from);
    if (pos == std::string::npos) die("fixture does not contain " + from);
    return s.replace(pos, from.size(), to);
}

static bool verifies(const Plan& p, ErrorKind* kind = nullptr) {
    std::string digest;
    AttestationError err;
    bool ok = verify_attestation(p, &digest, &err);
    if (kind) *kind = ok ? ErrorKind::NONE : err.kind;
    return ok;
}

int main() {
    // Test 1: digest of the sample plan matches an independently computed value
    {
        Plan p = parse_or_die(sample_plan_json());
        expect_eq_str(compute_expected_hash(p), kSamplePlanDigest, "plan-hash/v1 digest");
        expect_eq_str(canonical_plan_payload(p).substr(0, 16), "{\"constraints\":{", "payload starts sorted");
    }

    // Test 2: the stored hash never feeds into the digest
    {
        Plan a = parse_or_die(sample_plan_json());
        Plan b = parse_or_die(sample_plan_json("deadbeef"));
        expect_eq_str(compute_expected_hash(a), compute_expected_hash(b), "attestation excluded");
    }

    // Test 3: attest then verify; verification hands back the digest
    {
        Plan p = attested_sample_plan();
        std::string digest;
        AttestationError err;
        expect_true(verify_attestation(p, &digest, &err), "attested plan verifies");
        expect_eq_str(digest, kSamplePlanDigest, "verified digest returned");
    }

    // Test 4: uppercase stored hash still verifies
    {
        std::string upper = kSamplePlanDigest;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
        Plan p = parse_or_die(sample_plan_json(upper));
        expect_true(verifies(p), "case-insensitive comparison");
    }

    // Test 5: missing attestation
    {
        ErrorKind k;
        Plan p = parse_or_die(sample_plan_json());
        expect_true(!verifies(p, &k) && k == ErrorKind::MISSING_ATTESTATION, "empty plan_hash");

        Plan q = parse_or_die(R"({"plan_id":"P","steps":[]})");
        expect_true(!verifies(q, &k) && k == ErrorKind::MISSING_ATTESTATION, "no attestation object");

        Plan r = parse_or_die(R"({"plan_id":"P","steps":[],"attestation":{"plan_hash":7}})");
        expect_true(!verifies(r, &k) && k == ErrorKind::MISSING_ATTESTATION, "non-string plan_hash");
    }

    // Test 6: tampering with a hashed field is a mismatch and both digests are reported
    {
        std::string text = sample_plan_json(kSamplePlanDigest);
        Plan tampered = parse_or_die(replace_once(text, "\"Acme\"", "\"Acmf\""));
        std::string digest;
        AttestationError err;
        expect_true(!verify_attestation(tampered, &digest, &err), "tampered inputs rejected");
        expect_true(err.kind == ErrorKind::HASH_MISMATCH, "HashMismatch");
        expect_eq_str(err.actual, kSamplePlanDigest, "actual = stored");
        expect_eq_str(err.expected, compute_expected_hash(tampered), "expected = recomputed");
        expect_true(digest.empty(), "no digest on failure");

        ErrorKind k;
        Plan step_swap = parse_or_die(replace_once(text, "\"sitemap.md\"", "\"sitemap2.md\""));
        expect_true(!verifies(step_swap, &k) && k == ErrorKind::HASH_MISMATCH, "tampered steps");
        Plan version = parse_or_die(replace_once(text, "\"skill_version\": \"1\"", "\"skill_version\": \"2\""));
        expect_true(!verifies(version, &k) && k == ErrorKind::HASH_MISMATCH, "tampered skill_version");
        Plan cons = parse_or_die(replace_once(text, "\"constraints\": {}", "\"constraints\": {\"x\":1}"));
        expect_true(!verifies(cons, &k) && k == ErrorKind::HASH_MISMATCH, "tampered constraints");
    }

    // Test 7: stored hash off by one hex character
    {
        std::string bad = kSamplePlanDigest;
        bad[10] = (bad[10] == '0') ? '1' : '0';
        ErrorKind k;
        expect_true(!verifies(parse_or_die(sample_plan_json(bad)), &k) && k == ErrorKind::HASH_MISMATCH,
                    "one hex char changed");
    }

    // Test 8: members outside the contract do not affect verification
    {
        std::string text = sample_plan_json(kSamplePlanDigest);
        Plan extra = parse_or_die(replace_once(text, "\"plan_id\": \"P1\",",
                                               "\"plan_id\": \"P1\", \"approved_by\": \"ops\", \"notes\": [1,2],"));
        expect_true(verifies(extra), "auxiliary metadata outside the digest");

        Plan att_extra = parse_or_die(replace_once(text, "\"attestation\": {",
                                                   "\"attestation\": { \"signed_at\": \"2026-01-01\","));
        expect_true(verifies(att_extra), "extra attestation members outside the digest");
    }

    // Test 9: reordering members of the plan does not change the digest
    {
        Plan reordered = parse_or_die(R"({
          "steps": [
            { "output": "sitemap.md", "generator": "sitemap" },
            { "output": "copy.md", "generator": "copy" },
            { "output": "tokens.json", "generator": "tokens" },
            { "output": "scaffold-tree.txt", "generator": "scaffold_tree" },
            { "output": "content-map.json", "generator": "content_map" }
          ],
          "constraints": {},
          "inputs": { "city_region": "X", "business_name": "Acme" },
          "skill_version": "1", "skill_id": "s", "plan_id": "P1"
        })");
        expect_eq_str(compute_expected_hash(reordered), kSamplePlanDigest, "order independent");
    }

    // Test 10: absent members are omitted, null members are not
    {
        Plan absent = parse_or_die(R"({"plan_id":"P","steps":[]})");
        Plan nulled = parse_or_die(R"({"plan_id":"P","steps":[],"inputs":null})");
        expect_eq_str(canonical_plan_payload(absent), R"({"plan_id":"P","steps":[]})", "absent omitted");
        expect_eq_str(canonical_plan_payload(nulled), R"({"inputs":null,"plan_id":"P","steps":[]})", "null kept");
        expect_true(compute_expected_hash(absent) != compute_expected_hash(nulled), "absent != null");
    }

    std::cerr << "test_attestation: ALL PASSED" << std::endl;
    return 0;
}
