#include "site_draft.h"

namespace planwarden {

void register_site_draft_generators(GeneratorRegistry& reg) {
    reg.registerGenerator("sitemap", gen_sitemap);
    reg.registerGenerator("copy", gen_copy);
    reg.registerGenerator("tokens", gen_design_tokens);
    reg.registerGenerator("scaffold_tree", gen_scaffold_tree);
    reg.registerGenerator("content_map", gen_content_map);
}

} // namespace planwarden
