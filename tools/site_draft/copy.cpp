#include "site_draft.h"

#include <sstream>

namespace planwarden {

StepResult gen_copy(const Plan& plan, const StepDef& step) {
    std::string business, region;
    if (!plan.input_string("business_name", &business)) {
        return {StepStatus::GENERATION_ERROR, "", step.generator + ": inputs.business_name missing or not a string"};
    }
    if (!plan.input_string("city_region", &region)) {
        return {StepStatus::GENERATION_ERROR, "", step.generator + ": inputs.city_region missing or not a string"};
    }

    std::ostringstream md;
    md << "# Copy (DEMO / DRAFT - NOT FOR PUBLIC USE)\n\n";

    md << "## HOME\n\n";
    md << "**Hero:** Built for the jobs that can't fail.\n\n";
    md << "**Subhead:** Civil excavation and underground utility support for contractors "
          "and public-sector work across " << region << ".\n\n";
    md << "**Note:** Replace all placeholders with verified proof before public use.\n\n";
    md << "**CTA:** Request a Demo Walkthrough (draft)\n\n";

    md << "### Trust Strip (placeholders only)\n";
    md << "- Serving " << region << "\n";
    md << "- Safety-first crews\n";
    md << "- Documented process\n";
    md << "- [CERTIFICATION / PREQUALIFICATION]\n\n";

    md << "## SERVICES (draft)\n";
    md << "- Trenching & Excavation: clean execution, controlled site discipline.\n";
    md << "- Underground Utilities Support: inspection-ready coordination.\n";
    md << "- Site Servicing: staged work to reduce rework and delays.\n\n";

    md << "## ABOUT (draft)\n";
    md << business << " operates like a serious partner on serious sites: "
          "clear communication and predictable process.\n\n";

    md << "## CONTACT (draft)\n";
    md << "Form fields only. No real phone/email/address in demo.\n";
    return {StepStatus::OK, md.str(), ""};
}

} // namespace planwarden
