#include "site_draft.h"
#include "planwarden/json_util.h"

#include <json-c/json.h>

#include <initializer_list>

namespace planwarden {

static json_object* string_array(std::initializer_list<const char*> items) {
    json_object* a = json_object_new_array();
    for (const char* s : items) json_object_array_add(a, json_object_new_string(s));
    return a;
}

static json_object* int_array(std::initializer_list<int> items) {
    json_object* a = json_object_new_array();
    for (int v : items) json_object_array_add(a, json_object_new_int(v));
    return a;
}

// Emits the document and releases it.
static StepResult emit(json_object* doc) {
    std::string text = json_to_pretty(doc);
    json_object_put(doc);
    return {StepStatus::OK, text, ""};
}

StepResult gen_design_tokens(const Plan& plan, const StepDef& step) {
    (void)plan;
    (void)step;
    json_object* doc = json_object_new_object();

    json_object* typo = json_object_new_object();
    json_object_object_add(typo, "h1", json_object_new_string("2.25rem"));
    json_object_object_add(typo, "h2", json_object_new_string("1.5rem"));
    json_object_object_add(typo, "body", json_object_new_string("1rem"));
    json_object_object_add(doc, "typography", typo);

    json_object_object_add(doc, "spacing", int_array({4, 8, 12, 16, 24, 32}));
    json_object_object_add(doc, "radius", int_array({8, 16, 24}));
    json_object_object_add(doc, "shadows", string_array({"sm", "md", "lg"}));
    return emit(doc);
}

StepResult gen_content_map(const Plan& plan, const StepDef& step) {
    (void)plan;
    (void)step;
    json_object* doc = json_object_new_object();
    json_object_object_add(doc, "home", string_array({"hero", "trust_strip", "services_snapshot",
                                                      "featured_work", "process", "faq", "contact"}));
    json_object_object_add(doc, "services", string_array({"trenching", "utilities_support", "site_servicing"}));
    json_object_object_add(doc, "about", string_array({"story", "values"}));
    json_object_object_add(doc, "contact", string_array({"form"}));
    return emit(doc);
}

} // namespace planwarden
