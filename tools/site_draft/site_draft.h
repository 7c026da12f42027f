#pragma once

#include "planwarden/generators.h"

namespace planwarden {

// Draft website generators. Output is placeholder content only: no contact
// data, no proof claims, nothing fit for public use without review.
StepResult gen_sitemap(const Plan& plan, const StepDef& step);
StepResult gen_copy(const Plan& plan, const StepDef& step);
StepResult gen_design_tokens(const Plan& plan, const StepDef& step);
StepResult gen_scaffold_tree(const Plan& plan, const StepDef& step);
StepResult gen_content_map(const Plan& plan, const StepDef& step);

// Registers the generators above as "sitemap", "copy", "tokens",
// "scaffold_tree" and "content_map".
void register_site_draft_generators(GeneratorRegistry& reg);

} // namespace planwarden
