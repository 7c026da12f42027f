#pragma once
#include <filesystem>
#include <string>

namespace planwarden {

enum class Profile { DEV, PROD };

// Detect profile from PLANWARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no fsync on the audit log, integrity check advisory)
// PROD: strict (fsync every audit line, missing artifacts fail the run)
void apply_profile_defaults(Profile p);

struct RunnerConfig {
    std::filesystem::path root;  // holds artifacts/ and logs/
    bool log_fsync{false};
    bool strict_integrity{false};

    std::filesystem::path artifacts_dir() const { return root / "artifacts"; }
    std::filesystem::path audit_log_path() const { return root / "logs" / "audit.log"; }
};

// Reads PLANWARDEN_ROOT (default: current directory), PLANWARDEN_LOG_FSYNC
// and PLANWARDEN_STRICT_INTEGRITY.
RunnerConfig load_runner_config();

// "1", "true", "yes" (any case) -> true; "0", "false", "no" -> false;
// anything else, or unset, -> defv.
bool env_flag(const char* key, bool defv);

} // namespace planwarden
