#include "planwarden/plan.h"
#include "planwarden/canonical.h"
#include "planwarden/json_util.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace planwarden {

Plan::~Plan() {
    if (doc_) json_object_put(doc_);
}

Plan::Plan(Plan&& o) noexcept
    : doc_(o.doc_),
      plan_id_(std::move(o.plan_id_)),
      skill_id_(std::move(o.skill_id_)),
      skill_version_(std::move(o.skill_version_)),
      steps_(std::move(o.steps_)),
      source_path_(std::move(o.source_path_)) {
    o.doc_ = nullptr;
}

Plan& Plan::operator=(Plan&& o) noexcept {
    if (this != &o) {
        if (doc_) json_object_put(doc_);
        doc_ = o.doc_;
        o.doc_ = nullptr;
        plan_id_ = std::move(o.plan_id_);
        skill_id_ = std::move(o.skill_id_);
        skill_version_ = std::move(o.skill_version_);
        steps_ = std::move(o.steps_);
        source_path_ = std::move(o.source_path_);
    }
    return *this;
}

bool is_safe_path_component(const std::string& name) {
    if (name.empty() || name.size() > 255) return false;
    if (name == "." || name == "..") return false;
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) return false;
    }
    return true;
}

// Display form for scalar metadata such as skill_version (string or number).
static std::string scalar_text(json_object* v) {
    if (!v) return "";
    if (json_object_is_type(v, json_type_string)) return json_object_get_string(v);
    return canonical_serialize(v);
}

static bool parse_steps(json_object* arr, std::vector<StepDef>* out, std::string* why) {
    const size_t n = json_object_array_length(arr);
    std::unordered_set<std::string> outputs;
    for (size_t i = 0; i < n; i++) {
        json_object* s = json_object_array_get_idx(arr, i);
        const std::string where = "steps[" + std::to_string(i) + "]";
        if (!s || !json_object_is_type(s, json_type_object)) {
            *why = where + " is not an object";
            return false;
        }

        StepDef d;
        d.def = s;
        if (!json_get_string(s, "generator", &d.generator) || d.generator.empty()) {
            *why = where + ".generator missing or not a string";
            return false;
        }
        if (!json_get_string(s, "output", &d.output)) {
            *why = where + ".output missing or not a string";
            return false;
        }
        if (!is_safe_path_component(d.output)) {
            *why = where + ".output is not a plain file name: " + d.output;
            return false;
        }
        if (d.output == kIntegrityReportName || d.output == kSummaryName) {
            *why = where + ".output is reserved for the pipeline: " + d.output;
            return false;
        }
        if (!outputs.insert(d.output).second) {
            *why = where + ".output duplicates an earlier step: " + d.output;
            return false;
        }

        if (!json_get_string(s, "id", &d.id) || d.id.empty()) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%02zu", i + 1);
            d.id = buf;
        }
        out->push_back(std::move(d));
    }
    return true;
}

bool Plan::from_json(json_object* doc, Plan* out, Error* err) {
    Plan p;
    p.doc_ = doc;

    if (!doc || !json_object_is_type(doc, json_type_object)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "plan is not a JSON object");
        return false;
    }

    if (!json_get_string(doc, "plan_id", &p.plan_id_) || p.plan_id_.empty()) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "plan_id missing or not a string");
        return false;
    }
    if (!is_safe_path_component(p.plan_id_)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "plan_id is not usable as a directory name: " + p.plan_id_);
        return false;
    }

    p.skill_id_ = scalar_text(json_get_member(doc, "skill_id"));
    p.skill_version_ = scalar_text(json_get_member(doc, "skill_version"));

    json_object* steps = json_get_member(doc, "steps");
    if (!steps || !json_object_is_type(steps, json_type_array)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "steps missing or not an array");
        return false;
    }
    std::string why;
    if (!parse_steps(steps, &p.steps_, &why)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, why);
        return false;
    }

    json_object* att = json_get_member(doc, "attestation");
    if (att && !json_object_is_type(att, json_type_object)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "attestation is not an object");
        return false;
    }

    *out = std::move(p);
    return true;
}

json_object* Plan::inputs() const { return json_get_member(doc_, "inputs"); }
json_object* Plan::constraints() const { return json_get_member(doc_, "constraints"); }

bool Plan::input_string(const char* key, std::string* out) const {
    json_object* in = inputs();
    if (!in || !json_object_is_type(in, json_type_object)) return false;
    return json_get_string(in, key, out);
}

std::optional<std::string> Plan::plan_hash() const {
    std::string h;
    if (!json_get_string(json_get_member(doc_, "attestation"), "plan_hash", &h) || h.empty()) {
        return std::nullopt;
    }
    return h;
}

void Plan::set_plan_hash(const std::string& hex) {
    if (!doc_) return;
    json_object* att = json_get_member(doc_, "attestation");
    if (!att || !json_object_is_type(att, json_type_object)) {
        att = json_object_new_object();
        json_object_object_add(doc_, "attestation", att);
    }
    json_object_object_add(att, "plan_hash", json_object_new_string(hex.c_str()));
}

bool parse_plan(const std::string& text, Plan* out, Error* err) {
    std::string body = text;
    if (body.size() >= 3 && (unsigned char)body[0] == 0xEF &&
        (unsigned char)body[1] == 0xBB && (unsigned char)body[2] == 0xBF) {
        body.erase(0, 3);
    }

    json_object* doc = nullptr;
    std::string perr;
    if (!json_parse_document(body, &doc, &perr)) {
        set_error(err, ErrorKind::PLAN_PARSE_ERROR, "invalid JSON: " + perr);
        return false;
    }
    return Plan::from_json(doc, out, err);
}

bool load_plan(const std::filesystem::path& path, Plan* out, Error* err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        set_error(err, ErrorKind::PLAN_NOT_FOUND, "plan file not found: " + path.string());
        return false;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        set_error(err, ErrorKind::PLAN_NOT_FOUND, "cannot open plan file: " + path.string());
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();

    Error perr;
    if (!parse_plan(ss.str(), out, &perr)) {
        set_error(err, perr.kind, perr.message + " (" + path.string() + ")");
        return false;
    }
    out->set_source_path(path);
    return true;
}

std::string write_plan_file(const std::filesystem::path& path, const Plan& plan) {
    if (!plan.document()) return "plan has no document";

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << json_to_pretty(plan.document()) << "\n";
        f.flush();
        if (!f) return "write failed: " + tmp.string();
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename failed: " + path.string();
    }
    return "";
}

} // namespace planwarden
