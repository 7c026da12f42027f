#include "commands.h"

#include "planwarden/config.h"

#include <exception>
#include <iostream>
#include <string>

static void usage() {
    std::cerr << "planwarden <run|hash|attest|verify> <plan.json>\n"
                 "  run     verify the attestation, then execute the plan's steps\n"
                 "  hash    print the plan digest (plan-hash/v1) for signing\n"
                 "  attest  write the plan digest into attestation.plan_hash\n"
                 "  verify  check attestation.plan_hash without executing\n"
                 "env: PLANWARDEN_PROFILE=dev|prod, PLANWARDEN_ROOT, PLANWARDEN_LOG_FSYNC, "
                 "PLANWARDEN_STRICT_INTEGRITY\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    planwarden::apply_profile_defaults(planwarden::detect_profile());

    std::string cmd = argv[1];
    try {
        if (cmd == "run") return cmd_run(argc, argv);
        if (cmd == "hash") return cmd_hash(argc, argv);
        if (cmd == "attest") return cmd_attest(argc, argv);
        if (cmd == "verify") return cmd_verify(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return 2;
}
