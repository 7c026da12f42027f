#include "planwarden/pipeline.h"
#include "planwarden/attestation.h"

#include <cstdio>
#include <memory>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace planwarden {

const char* run_state_name(RunState s) {
    switch (s) {
        case RunState::LOADED:            return "LOADED";
        case RunState::ATTESTED:          return "ATTESTED";
        case RunState::RUNNING:           return "RUNNING";
        case RunState::INTEGRITY_CHECKED: return "INTEGRITY_CHECKED";
        case RunState::COMPLETED:         return "COMPLETED";
        case RunState::FAILED:            return "FAILED";
    }
    return "FAILED";
}

// ---- per plan id mutex ----

static std::shared_ptr<std::mutex> plan_mutex(const std::string& plan_id) {
    static std::mutex table_mu;
    static std::unordered_map<std::string, std::shared_ptr<std::mutex>> table;
    std::lock_guard<std::mutex> lk(table_mu);
    auto& m = table[plan_id];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

static std::string step_number(size_t n) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02zu", n);
    return buf;
}

PlanRunner::PlanRunner(const ArtifactStore& store,
                       AuditSink& audit,
                       const GeneratorRegistry& generators,
                       RunOptions opts)
    : store_(store), audit_(audit), generators_(generators), opts_(opts) {}

RunOutcome PlanRunner::run_file(const std::filesystem::path& plan_path) {
    Plan plan;
    Error err;
    if (!load_plan(plan_path, &plan, &err)) {
        RunOutcome out;
        out.failed_in = RunState::LOADED;
        out.state = RunState::FAILED;
        out.error = err;
        return out;
    }
    return run(plan);
}

RunOutcome PlanRunner::run(const Plan& plan) {
    auto mu = plan_mutex(plan.plan_id());
    std::lock_guard<std::mutex> lk(*mu);
    return run_locked(plan);
}

RunOutcome PlanRunner::run_locked(const Plan& plan) {
    RunOutcome out;
    out.plan_id = plan.plan_id();
    out.state = RunState::LOADED;

    auto fail = [&](ErrorKind kind, std::string message) {
        out.failed_in = out.state;
        out.state = RunState::FAILED;
        set_error(&out.error, kind, std::move(message));
    };

    // Appends one entry. A lost audit line is fatal: the run may not move
    // past a transition that is not on record.
    auto record = [&](const AuditEntry& e) -> bool {
        std::string err = audit_.append(e);
        if (err.empty()) return true;
        fail(ErrorKind::AUDIT_WRITE_ERROR, "audit append failed: " + err);
        return false;
    };

    auto record_end_failed = [&]() {
        auto e = make_audit_entry("END", plan.plan_id());
        e.with("status", "failed")
         .with("state", run_state_name(out.failed_in))
         .with("error_kind", error_kind_name(out.error.kind));
        std::string err = audit_.append(e);
        if (!err.empty()) {
            // keep the original failure; the audit error is secondary
            out.error.message += " (audit append failed: " + err + ")";
        }
    };

    {
        auto e = make_audit_entry("START", plan.plan_id());
        if (!plan.source_path().empty()) e.with("plan_path", plan.source_path().string());
        if (!record(e)) return out;
    }

    // ---- attestation gate ----
    std::string digest;
    AttestationError aerr;
    if (!verify_attestation(plan, &digest, &aerr)) {
        auto e = make_audit_entry("ATTEST fail", plan.plan_id());
        e.with("reason", error_kind_name(aerr.kind))
         .with("expected", aerr.expected)
         .with("actual", aerr.actual);
        if (!record(e)) return out;
        fail(aerr.kind, aerr.message);
        out.failed_in = RunState::ATTESTED;
        record_end_failed();
        return out;
    }
    {
        auto e = make_audit_entry("ATTEST ok", plan.plan_id());
        e.with("hash", digest).with("contract", kHashContractVersion);
        if (!record(e)) return out;
    }
    out.attested_hash = digest;
    out.state = RunState::ATTESTED;

    // ---- declared steps, strictly in order ----
    out.state = RunState::RUNNING;
    std::vector<std::string> required;
    for (const auto& step : plan.steps()) {
        StepResult r = generators_.run(plan, step);
        if (r.status != StepStatus::OK) {
            auto e = make_audit_entry("STEP " + step.id + " fail", plan.plan_id());
            e.with("generator", step.generator).with("output", step.output).with("error", r.error);
            if (!record(e)) return out;
            fail(ErrorKind::STEP_GENERATION_ERROR, "step " + step.id + " (" + step.generator + "): " + r.error);
            record_end_failed();
            return out;
        }

        WrittenArtifact wa;
        std::string werr = store_.write(plan.plan_id(), step.output, r.content, &wa);
        if (!werr.empty()) {
            auto e = make_audit_entry("STEP " + step.id + " fail", plan.plan_id());
            e.with("generator", step.generator).with("output", step.output).with("error", werr);
            if (!record(e)) return out;
            fail(ErrorKind::ARTIFACT_WRITE_ERROR, "step " + step.id + ": " + werr);
            record_end_failed();
            return out;
        }

        auto e = make_audit_entry("STEP " + step.id, plan.plan_id());
        e.with("output", wa.path.string()).with("hash", wa.sha256);
        if (!record(e)) return out;
        out.artifacts.push_back(wa);
        required.push_back(step.output);
    }

    // ---- integrity check ----
    size_t next_step = plan.steps().size() + 1;
    out.integrity = check_integrity(store_, plan.plan_id(), required);
    {
        WrittenArtifact wa;
        std::string werr = store_.write(plan.plan_id(), kIntegrityReportName,
                                        render_integrity_report(out.integrity), &wa);
        const std::string num = step_number(next_step++);
        if (!werr.empty()) {
            auto e = make_audit_entry("STEP " + num + " fail", plan.plan_id());
            e.with("output", kIntegrityReportName).with("error", werr);
            if (!record(e)) return out;
            fail(ErrorKind::ARTIFACT_WRITE_ERROR, "integrity report: " + werr);
            record_end_failed();
            return out;
        }
        auto e = make_audit_entry("STEP " + num, plan.plan_id());
        e.with("output", wa.path.string())
         .with("hash", wa.sha256)
         .with("integrity_ok", out.integrity.ok ? "true" : "false")
         .with("missing", json_string_list(out.integrity.missing));
        if (!record(e)) return out;
        out.artifacts.push_back(wa);
    }
    out.state = RunState::INTEGRITY_CHECKED;

    if (!out.integrity.ok && opts_.strict_integrity) {
        fail(ErrorKind::INTEGRITY_ERROR, "missing required artifacts: " + json_string_list(out.integrity.missing));
        record_end_failed();
        return out;
    }

    // ---- summary ----
    // what is on disk now: written artifacts minus any that went missing
    std::vector<std::string> outputs;
    for (const auto& a : out.artifacts) {
        bool gone = false;
        for (const auto& m : out.integrity.missing) gone = gone || (m == a.filename);
        if (!gone) outputs.push_back(a.filename);
    }
    outputs.push_back(kSummaryName);
    {
        WrittenArtifact wa;
        std::string werr = store_.write(plan.plan_id(), kSummaryName,
                                        render_summary(plan, digest, outputs, out.integrity), &wa);
        const std::string num = step_number(next_step++);
        if (!werr.empty()) {
            auto e = make_audit_entry("STEP " + num + " fail", plan.plan_id());
            e.with("output", kSummaryName).with("error", werr);
            if (!record(e)) return out;
            fail(ErrorKind::ARTIFACT_WRITE_ERROR, "summary: " + werr);
            record_end_failed();
            return out;
        }
        auto e = make_audit_entry("STEP " + num, plan.plan_id());
        e.with("output", wa.path.string()).with("hash", wa.sha256);
        if (!record(e)) return out;
        out.artifacts.push_back(wa);
    }

    {
        auto e = make_audit_entry("END", plan.plan_id());
        e.with("status", "success").with("outputs", std::to_string(out.artifacts.size()));
        if (!record(e)) return out;
    }
    out.state = RunState::COMPLETED;
    return out;
}

std::string render_summary(const Plan& plan,
                           const std::string& attested_hash,
                           const std::vector<std::string>& outputs,
                           const IntegrityReport& integrity) {
    std::ostringstream md;
    md << "# Summary (DEMO / DRAFT)\n\n";
    md << "Plan: " << plan.plan_id() << "\n";
    md << "Skill: " << plan.skill_id() << " v" << plan.skill_version() << "\n";
    md << "Attested Hash: " << attested_hash << "\n";
    md << "Hash Contract: " << kHashContractVersion << "\n\n";

    md << "Outputs generated:\n";
    for (const auto& o : outputs) md << "- " << o << "\n";
    md << "\n";

    md << "Integrity:\n";
    if (integrity.ok) {
        md << "- all required outputs present\n";
    } else {
        md << "- WARNING: missing required outputs: " << json_string_list(integrity.missing) << "\n";
    }
    md << "\n";

    md << "Limits:\n";
    md << "- No outreach\n";
    md << "- No deployment\n";
    md << "- No real contact data\n";
    md << "- No proof claims (certs/awards/metrics)\n";
    return md.str();
}

} // namespace planwarden
