#include "site_draft.h"

#include <sstream>

namespace planwarden {

StepResult gen_sitemap(const Plan& plan, const StepDef& step) {
    (void)plan;
    (void)step;
    std::ostringstream md;
    md << "# Sitemap (DEMO / DRAFT)\n\n";
    md << "- Home\n"
          "  - Hero\n"
          "  - Trust Strip (placeholders)\n"
          "  - Services Snapshot\n"
          "  - Featured Work (placeholders)\n"
          "  - Process\n"
          "  - Safety & Compliance (generic)\n"
          "  - FAQ\n"
          "  - Contact (placeholder)\n\n";
    md << "- Services\n"
          "  - Trenching & Excavation\n"
          "  - Underground Utilities Support\n"
          "  - Site Servicing\n\n";
    md << "- Projects (placeholders)\n"
          "- About\n"
          "- Trust & Compliance\n"
          "- Contact\n";
    return {StepStatus::OK, md.str(), ""};
}

} // namespace planwarden
