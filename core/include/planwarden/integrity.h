#pragma once

#include "artifacts.h"

#include <string>
#include <vector>

namespace planwarden {

struct IntegrityReport {
    bool ok{true};
    std::vector<std::string> missing; // in the order they were required
};

// Read-only probe: which of `required` are not present as regular files
// under the plan's artifact directory. Never fails; absence is reported.
IntegrityReport check_integrity(const ArtifactStore& store,
                                const std::string& plan_id,
                                const std::vector<std::string>& required);

// Body of integrity-report.md.
std::string render_integrity_report(const IntegrityReport& r);

// ["a","b"] in canonical JSON form.
std::string json_string_list(const std::vector<std::string>& items);

} // namespace planwarden
