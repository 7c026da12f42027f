#include "test_common.h"
#include "plan_fixtures.h"

#include "runner/commands.h"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <vector>

using CommandFn = int (*)(int, char**);

struct CliResult {
    int rc{-1};
    std::string out;
    std::string err;
};

// Runs one command in-process with std::cout / std::cerr captured.
static CliResult call(CommandFn fn, std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::ostringstream out, err;
    std::streambuf* old_out = std::cout.rdbuf(out.rdbuf());
    std::streambuf* old_err = std::cerr.rdbuf(err.rdbuf());
    CliResult r;
    r.rc = fn((int)args.size(), argv.data());
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    r.out = out.str();
    r.err = err.str();
    return r;
}

static bool one_line(const std::string& s) {
    return !s.empty() && s.back() == '\n' && s.find('\n') == s.size() - 1;
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_temp_dir("planwarden_test_cli");
    fs::path plan = dir / "plan.json";
    write_text(plan, sample_plan_json());
    setenv("PLANWARDEN_ROOT", (dir / "root").c_str(), 1);
    setenv("PLANWARDEN_STRICT_INTEGRITY", "1", 1);
    const std::string digest = kSamplePlanDigest;

    // Test 1: hash prints the whitelist digest
    {
        CliResult r = call(cmd_hash, {"planwarden", "hash", plan.string()});
        expect_eq_ll(r.rc, 0, "hash exit code");
        expect_eq_str(r.out, digest + "\n", "hash output");
    }

    // Test 2: verify before attest fails with a one-line diagnostic
    {
        CliResult r = call(cmd_verify, {"planwarden", "verify", plan.string()});
        expect_eq_ll(r.rc, 1, "verify exit code on unattested plan");
        expect_true(r.err.rfind("MissingAttestation: ", 0) == 0, "kind first: " + r.err);
        expect_true(one_line(r.err), "single line: " + r.err);
    }

    // Test 3: attest rewrites the file, then verify and hash agree with it
    {
        CliResult a = call(cmd_attest, {"planwarden", "attest", plan.string()});
        expect_eq_ll(a.rc, 0, "attest exit code");
        expect_eq_str(a.out, "updated plan_hash: " + digest + "\n", "attest output");
        expect_true(read_text(plan).find("\"plan_hash\": \"" + digest + "\"") != std::string::npos,
                    "digest stored in the file");

        CliResult v = call(cmd_verify, {"planwarden", "verify", plan.string()});
        expect_eq_ll(v.rc, 0, "verify after attest: " + v.err);
        expect_eq_str(v.out, "attestation ok: P1 " + digest + "\n", "verify output");

        CliResult h = call(cmd_hash, {"planwarden", "hash", plan.string()});
        expect_eq_str(h.out, digest + "\n", "attestation is outside the digest");
    }

    // Test 4: run on the attested file writes artifacts and the audit log
    {
        CliResult r = call(cmd_run, {"planwarden", "run", plan.string()});
        expect_eq_ll(r.rc, 0, "run exit code: " + r.err);
        expect_true(r.out.find("Completed: P1\n") != std::string::npos, "completion line");
        expect_true(fs::is_regular_file(dir / "root" / "artifacts" / "P1" / "summary.md"), "summary written");
        expect_true(fs::is_regular_file(dir / "root" / "logs" / "audit.log"), "audit log written");
    }

    // Test 5: one changed hex char: verify and run both exit 1
    {
        std::string text = read_text(plan);
        std::string bad = digest;
        bad[0] = (bad[0] == 'a') ? 'b' : 'a';
        size_t pos = text.find(digest);
        expect_true(pos != std::string::npos, "digest present");
        text.replace(pos, digest.size(), bad);
        write_text(plan, text);

        CliResult v = call(cmd_verify, {"planwarden", "verify", plan.string()});
        expect_eq_ll(v.rc, 1, "verify exit code on tampered plan");
        expect_true(v.err.rfind("HashMismatch: ", 0) == 0, "HashMismatch: " + v.err);
        expect_true(one_line(v.err), "single line");

        CliResult r = call(cmd_run, {"planwarden", "run", plan.string()});
        expect_eq_ll(r.rc, 1, "run exit code on tampered plan");
        expect_true(r.err.rfind("HashMismatch: ", 0) == 0, "HashMismatch: " + r.err);
        expect_true(one_line(r.err), "single line");
        expect_true(r.out.empty(), "nothing on stdout");
    }

    // Test 6: load failures and usage errors
    {
        CliResult nf = call(cmd_run, {"planwarden", "run", (dir / "nope.json").string()});
        expect_eq_ll(nf.rc, 1, "missing plan exit code");
        expect_true(nf.err.rfind("PlanNotFound: ", 0) == 0, "PlanNotFound: " + nf.err);

        write_text(dir / "bad.json", "{\"plan_id\":\"P1\",}");
        CliResult pe = call(cmd_hash, {"planwarden", "hash", (dir / "bad.json").string()});
        expect_eq_ll(pe.rc, 1, "invalid plan exit code");
        expect_true(pe.err.rfind("PlanParseError: ", 0) == 0, "PlanParseError: " + pe.err);

        CliResult u = call(cmd_verify, {"planwarden", "verify"});
        expect_eq_ll(u.rc, 2, "usage exit code");
    }

    unsetenv("PLANWARDEN_ROOT");
    unsetenv("PLANWARDEN_STRICT_INTEGRITY");
    std::error_code ec;
    fs::remove_all(dir, ec);

    std::cerr << "test_cli: ALL PASSED" << std::endl;
    return 0;
}
