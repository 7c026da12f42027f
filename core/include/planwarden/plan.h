#pragma once

#include "errors.h"

#include <json-c/json.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace planwarden {

// Written by the pipeline after the declared steps; no step may claim them.
inline constexpr const char* kIntegrityReportName = "integrity-report.md";
inline constexpr const char* kSummaryName = "summary.md";

// One entry of a plan's `steps` array.
struct StepDef {
    std::string id;         // "01", "02", ... unless the plan names it
    std::string generator;  // name looked up in the GeneratorRegistry
    std::string output;     // artifact file name under artifacts/<plan_id>/
    json_object* def{nullptr}; // borrowed from the owning Plan's document
};

// A parsed plan document. Owns the json-c tree; StepDef::def and the
// accessors below return borrowed pointers into it.
class Plan {
public:
    Plan() = default;
    ~Plan();

    Plan(const Plan&) = delete;
    Plan& operator=(const Plan&) = delete;
    Plan(Plan&& o) noexcept;
    Plan& operator=(Plan&& o) noexcept;

    // Validates the document and takes ownership of `doc` (also on failure).
    static bool from_json(json_object* doc, Plan* out, Error* err);

    const std::string& plan_id() const { return plan_id_; }
    const std::string& skill_id() const { return skill_id_; }
    const std::string& skill_version() const { return skill_version_; }
    const std::vector<StepDef>& steps() const { return steps_; }

    json_object* document() const { return doc_; }
    json_object* inputs() const;
    json_object* constraints() const;

    // String member of `inputs`; false if absent or not a string.
    bool input_string(const char* key, std::string* out) const;

    // attestation.plan_hash when present as a non-empty string
    std::optional<std::string> plan_hash() const;
    void set_plan_hash(const std::string& hex);

    const std::filesystem::path& source_path() const { return source_path_; }
    void set_source_path(std::filesystem::path p) { source_path_ = std::move(p); }

private:
    json_object* doc_{nullptr};
    std::string plan_id_;
    std::string skill_id_;
    std::string skill_version_;
    std::vector<StepDef> steps_;
    std::filesystem::path source_path_;
};

// A name that is safe as a single path component: non-empty, no separators,
// no control characters, not "." or "..".
bool is_safe_path_component(const std::string& name);

// Parse plan text (leading UTF-8 BOM tolerated). PLAN_PARSE_ERROR on failure.
bool parse_plan(const std::string& text, Plan* out, Error* err);

// Read and parse a plan file. PLAN_NOT_FOUND when the file is missing or
// unreadable, PLAN_PARSE_ERROR when its content is not a valid plan.
bool load_plan(const std::filesystem::path& path, Plan* out, Error* err);

// Rewrite the plan document as pretty JSON. Returns empty string on success.
std::string write_plan_file(const std::filesystem::path& path, const Plan& plan);

} // namespace planwarden
