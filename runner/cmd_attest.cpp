#include "commands.h"

#include "planwarden/attestation.h"
#include "planwarden/plan.h"

#include <iostream>

using namespace planwarden;

// Loads argv[2] or prints the diagnostic. Returns false on failure.
static bool load_arg(int argc, char** argv, const char* cmd, Plan* plan, int* rc) {
    if (argc < 3) {
        std::cerr << "usage: planwarden " << cmd << " <plan.json>\n";
        *rc = 2;
        return false;
    }
    Error err;
    if (!load_plan(argv[2], plan, &err)) {
        std::cerr << err.describe() << "\n";
        *rc = 1;
        return false;
    }
    return true;
}

int cmd_hash(int argc, char** argv) {
    Plan plan;
    int rc = 0;
    if (!load_arg(argc, argv, "hash", &plan, &rc)) return rc;
    std::cout << compute_expected_hash(plan) << "\n";
    return 0;
}

int cmd_attest(int argc, char** argv) {
    Plan plan;
    int rc = 0;
    if (!load_arg(argc, argv, "attest", &plan, &rc)) return rc;

    std::string h = attest_plan(plan);
    std::string werr = write_plan_file(plan.source_path(), plan);
    if (!werr.empty()) {
        std::cerr << "attest: " << werr << "\n";
        return 1;
    }
    std::cout << "updated plan_hash: " << h << "\n";
    return 0;
}

int cmd_verify(int argc, char** argv) {
    Plan plan;
    int rc = 0;
    if (!load_arg(argc, argv, "verify", &plan, &rc)) return rc;

    std::string digest;
    AttestationError aerr;
    if (!verify_attestation(plan, &digest, &aerr)) {
        Error e{aerr.kind, aerr.message};
        std::cerr << e.describe() << "\n";
        return 1;
    }
    std::cout << "attestation ok: " << plan.plan_id() << " " << digest << "\n";
    return 0;
}
