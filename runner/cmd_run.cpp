#include "commands.h"
#include "tools/site_draft/site_draft.h"

#include "planwarden/config.h"
#include "planwarden/pipeline.h"

#include <filesystem>
#include <iostream>

using namespace planwarden;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: planwarden run <plan.json>\n";
        return 2;
    }

    const RunnerConfig cfg = load_runner_config();

    GeneratorRegistry generators;
    register_site_draft_generators(generators);

    ArtifactStore store(cfg.artifacts_dir());
    FileAuditLog audit(cfg.audit_log_path(), cfg.log_fsync);

    RunOptions opts;
    opts.strict_integrity = cfg.strict_integrity;
    PlanRunner runner(store, audit, generators, opts);

    RunOutcome out = runner.run_file(argv[2]);
    if (!out.ok()) {
        std::cerr << out.error.describe() << "\n";
        return 1;
    }

    if (!out.integrity.ok) {
        std::cerr << "[WARN] missing required outputs: " << json_string_list(out.integrity.missing) << "\n";
    }
    std::cout << "Completed: " << out.plan_id << "\n";
    std::cout << "Artifacts: " << store.dir_for(out.plan_id).string() << "\n";
    std::cout << "Audit log: " << audit.path().string() << "\n";
    return 0;
}
