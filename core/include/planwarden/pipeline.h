#pragma once

#include "artifacts.h"
#include "audit.h"
#include "errors.h"
#include "generators.h"
#include "integrity.h"
#include "plan.h"

#include <filesystem>
#include <string>
#include <vector>

namespace planwarden {

// LOADED -> ATTESTED -> RUNNING -> INTEGRITY_CHECKED -> COMPLETED
// FAILED is terminal and reachable from every state before COMPLETED.
enum class RunState {
    LOADED,
    ATTESTED,
    RUNNING,
    INTEGRITY_CHECKED,
    COMPLETED,
    FAILED,
};

const char* run_state_name(RunState s);

struct RunOptions {
    // Missing required artifacts fail the run instead of being reported
    // as a warning in the summary.
    bool strict_integrity{false};
};

struct RunOutcome {
    RunState state{RunState::LOADED};
    RunState failed_in{RunState::LOADED}; // last state reached before FAILED
    Error error;
    std::string plan_id;
    std::string attested_hash;
    std::vector<WrittenArtifact> artifacts; // in write order
    IntegrityReport integrity;

    bool ok() const { return state == RunState::COMPLETED; }
};

// Runs one plan start to finish: attestation gate, each declared step in
// order, integrity check, summary. Every transition is appended to the
// audit sink before the next one starts. Nothing written before a failure
// is rolled back.
//
// Runs of the same plan id are serialized within the process.
class PlanRunner {
public:
    PlanRunner(const ArtifactStore& store,
               AuditSink& audit,
               const GeneratorRegistry& generators,
               RunOptions opts = {});

    RunOutcome run(const Plan& plan);

    // Loads the plan first. Load failures (PlanNotFound, PlanParseError)
    // return before anything is appended to the audit sink.
    RunOutcome run_file(const std::filesystem::path& plan_path);

private:
    const ArtifactStore& store_;
    AuditSink& audit_;
    const GeneratorRegistry& generators_;
    RunOptions opts_;

    RunOutcome run_locked(const Plan& plan);
};

// Body of summary.md. Deterministic for a given plan and integrity report.
std::string render_summary(const Plan& plan,
                           const std::string& attested_hash,
                           const std::vector<std::string>& outputs,
                           const IntegrityReport& integrity);

} // namespace planwarden
