#include "test_common.h"
#include "plan_fixtures.h"

#include <filesystem>

using namespace planwarden;

static ErrorKind parse_kind(const std::string& text) {
    Plan p;
    Error err;
    if (parse_plan(text, &p, &err)) return ErrorKind::NONE;
    return err.kind;
}

int main() {
    namespace fs = std::filesystem;

    // Test 1: sample plan fields and steps
    {
        Plan p = parse_or_die(sample_plan_json());
        expect_eq_str(p.plan_id(), "P1", "plan_id");
        expect_eq_str(p.skill_id(), "s", "skill_id");
        expect_eq_str(p.skill_version(), "1", "skill_version");
        expect_eq_ll((long long)p.steps().size(), 5, "five steps");
        expect_eq_str(p.steps()[0].id, "01", "default step id");
        expect_eq_str(p.steps()[4].id, "05", "default step id");
        expect_eq_str(p.steps()[1].generator, "copy", "generator");
        expect_eq_str(p.steps()[3].output, "scaffold-tree.txt", "output");
        std::string b;
        expect_true(p.input_string("business_name", &b) && b == "Acme", "inputs.business_name");
        expect_true(!p.plan_hash().has_value(), "empty plan_hash counts as absent");
    }

    // Test 2: explicit step ids and numeric skill_version
    {
        Plan p = parse_or_die(R"({"plan_id":"P2","skill_version":2,
            "steps":[{"id":"gen-a","generator":"sitemap","output":"a.md"}]})");
        expect_eq_str(p.steps()[0].id, "gen-a", "explicit step id");
        expect_eq_str(p.skill_version(), "2", "numeric skill_version rendered");
    }

    // Test 3: schema violations are parse errors
    {
        expect_true(parse_kind("not json") == ErrorKind::PLAN_PARSE_ERROR, "invalid JSON");
        expect_true(parse_kind("{\"plan_id\":\"P\",") == ErrorKind::PLAN_PARSE_ERROR, "truncated JSON");
        expect_true(parse_kind("[]") == ErrorKind::PLAN_PARSE_ERROR, "top level must be object");
        expect_true(parse_kind(R"({"steps":[]})") == ErrorKind::PLAN_PARSE_ERROR, "plan_id required");
        expect_true(parse_kind(R"({"plan_id":"../x","steps":[]})") == ErrorKind::PLAN_PARSE_ERROR,
                    "plan_id with separators");
        expect_true(parse_kind(R"({"plan_id":"P"})") == ErrorKind::PLAN_PARSE_ERROR, "steps required");
        expect_true(parse_kind(R"({"plan_id":"P","steps":["sitemap"]})") == ErrorKind::PLAN_PARSE_ERROR,
                    "steps must be objects");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[{"generator":"g","output":"a/b"}]})")
                    == ErrorKind::PLAN_PARSE_ERROR, "output must be a plain name");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[{"generator":"g","output":"a"},
                                                        {"generator":"h","output":"a"}]})")
                    == ErrorKind::PLAN_PARSE_ERROR, "duplicate outputs");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[],"attestation":"x"})") == ErrorKind::PLAN_PARSE_ERROR,
                    "attestation must be an object");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[{"generator":"g","output":"summary.md"}]})")
                    == ErrorKind::PLAN_PARSE_ERROR, "summary.md is reserved");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[{"generator":"g","output":"integrity-report.md"}]})")
                    == ErrorKind::PLAN_PARSE_ERROR, "integrity-report.md is reserved");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[],})") == ErrorKind::PLAN_PARSE_ERROR,
                    "trailing comma");
        expect_true(parse_kind(R"({'plan_id':'P','steps':[]})") == ErrorKind::PLAN_PARSE_ERROR,
                    "single quotes");
        expect_true(parse_kind(R"(/*c*/{"plan_id":"P","steps":[]})") == ErrorKind::PLAN_PARSE_ERROR,
                    "comment");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[],"inputs":{"n":NaN}})") == ErrorKind::PLAN_PARSE_ERROR,
                    "NaN");
        expect_true(parse_kind(R"({"plan_id":"P","steps":[]})") == ErrorKind::NONE, "minimal plan ok");
        expect_true(parse_kind("{\"plan_id\":\"P\",\"steps\":[]}\n") == ErrorKind::NONE, "trailing newline ok");
    }

    // Test 4: path component rules
    {
        expect_true(is_safe_path_component("summary.md"), "plain name");
        expect_true(!is_safe_path_component(""), "empty");
        expect_true(!is_safe_path_component(".."), "dotdot");
        expect_true(!is_safe_path_component("a/b"), "slash");
        expect_true(!is_safe_path_component("a\\b"), "backslash");
        expect_true(!is_safe_path_component(std::string("a\nb")), "control char");
    }

    // Test 5: load_plan: missing file, BOM, source path
    {
        fs::path dir = fresh_temp_dir("planwarden_test_plan");
        Plan p;
        Error err;
        expect_true(!load_plan(dir / "nope.json", &p, &err), "missing file fails");
        expect_true(err.kind == ErrorKind::PLAN_NOT_FOUND, "PlanNotFound");

        fs::path bom = dir / "bom.json";
        write_text(bom, "\xEF\xBB\xBF" + sample_plan_json());
        expect_true(load_plan(bom, &p, &err), "BOM is tolerated: " + err.describe());
        expect_true(p.source_path() == bom, "source path kept");

        fs::path bad = dir / "bad.json";
        write_text(bad, "{ this is not json");
        Error err2;
        expect_true(!load_plan(bad, &p, &err2), "bad JSON fails");
        expect_true(err2.kind == ErrorKind::PLAN_PARSE_ERROR, "PlanParseError");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Test 6: set_plan_hash + write_plan_file round trip keeps other members
    {
        fs::path dir = fresh_temp_dir("planwarden_test_plan_write");
        fs::path f = dir / "plan.json";
        write_text(f, R"({"plan_id":"W","steps":[],"note":"keep me"})");
        Plan p;
        Error err;
        expect_true(load_plan(f, &p, &err), "load");
        p.set_plan_hash("abc123");
        expect_true(write_plan_file(f, p).empty(), "write_plan_file");

        Plan q;
        expect_true(load_plan(f, &q, &err), "reload");
        expect_true(q.plan_hash().value_or("") == "abc123", "hash persisted");
        std::string text = read_text(f);
        expect_true(text.find("keep me") != std::string::npos, "unrelated member kept");
        expect_true(!text.empty() && text.back() == '\n', "trailing newline");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::cerr << "test_plan: ALL PASSED" << std::endl;
    return 0;
}
