#include "planwarden/integrity.h"
#include "planwarden/json_util.h"

#include <sstream>

namespace planwarden {

IntegrityReport check_integrity(const ArtifactStore& store,
                                const std::string& plan_id,
                                const std::vector<std::string>& required) {
    IntegrityReport r;
    for (const auto& name : required) {
        if (!store.exists(plan_id, name)) r.missing.push_back(name);
    }
    r.ok = r.missing.empty();
    return r;
}

std::string json_string_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += ",";
        out += json_quote(items[i]);
    }
    out += "]";
    return out;
}

std::string render_integrity_report(const IntegrityReport& r) {
    std::ostringstream oss;
    oss << "# Integrity Report\n";
    oss << "ok=" << (r.ok ? "true" : "false") << "\n";
    oss << "missing=" << json_string_list(r.missing) << "\n";
    return oss.str();
}

} // namespace planwarden
