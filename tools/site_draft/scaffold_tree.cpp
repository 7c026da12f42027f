#include "site_draft.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace planwarden {

StepResult gen_scaffold_tree(const Plan& plan, const StepDef& step) {
    (void)plan;
    (void)step;
    static const std::vector<std::pair<std::string, std::vector<std::string>>> kTree = {
        {"pages", {"index", "services", "projects", "about", "trust-compliance", "contact"}},
        {"components", {"Hero", "ProofStrip", "ServicesGrid", "CaseStudyCard", "ProcessSteps", "FAQ",
                        "FooterLegalCluster"}},
        {"content", {"sitemap.md", "copy.md", "content-map.json"}},
        {"styles", {"tokens.json"}},
    };

    std::ostringstream out;
    out << "/site\n";
    for (const auto& dir : kTree) {
        out << "  /" << dir.first << "\n";
        for (const auto& leaf : dir.second) out << "    " << leaf << "\n";
    }
    return {StepStatus::OK, out.str(), ""};
}

} // namespace planwarden
