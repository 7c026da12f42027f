#include "planwarden/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace planwarden {

static std::string lower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return val;
}

Profile detect_profile() {
    const char* env = std::getenv("PLANWARDEN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before anything reads the environment concurrently.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("PLANWARDEN_LOG_FSYNC",        "0", NO_OVERWRITE);
            setenv("PLANWARDEN_STRICT_INTEGRITY", "0", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("PLANWARDEN_LOG_FSYNC",        "1", NO_OVERWRITE);
            setenv("PLANWARDEN_STRICT_INTEGRITY", "1", NO_OVERWRITE);
            break;
    }
}

bool env_flag(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    return defv;
}

RunnerConfig load_runner_config() {
    RunnerConfig cfg;
    if (const char* r = std::getenv("PLANWARDEN_ROOT"); r && *r) {
        cfg.root = std::filesystem::absolute(r);
    } else {
        cfg.root = std::filesystem::current_path();
    }
    cfg.log_fsync = env_flag("PLANWARDEN_LOG_FSYNC", false);
    cfg.strict_integrity = env_flag("PLANWARDEN_STRICT_INTEGRITY", false);
    return cfg;
}

} // namespace planwarden
