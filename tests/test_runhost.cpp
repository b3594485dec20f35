#include "test_common.h"

#include "pitchbox/capture.h"
#include "pitchbox/dataset.h"
#include "pitchbox/policy.h"
#include "pitchbox/proc.h"
#include "pitchbox/protocol.h"
#include "pitchbox/sandbox_env.h"
#include "pitchbox/seccomp.h"

#include <filesystem>
#include <string>

using namespace pitchbox;

static std::string g_runhost;

static RunRequest base_request(const std::string& source) {
    RunRequest r;
    r.submission_id = "sub-test";
    r.source = source;
    std::string err;
    if (!dataset_from_csv("player,x,y\nSaka,102,38\nRice,50,40\n", &r.dataset, &err)) die("csv: " + err);
    r.capabilities = {Capability::DatasetRead, Capability::Plot, Capability::TextOutput, Capability::Numeric};
    r.bindings = default_allowed_bindings();
    r.modules = default_policy().module_bindings;
    r.memory_limit_bytes = 64ULL << 20;
    r.lockdown = LockdownMode::BestEffort;
    return r;
}

static ProcResult spawn(const std::string& stdin_data, const std::vector<std::string>& extra_args = {}) {
    ProcLimits lim;
    lim.timeout_ms = 10000;
    lim.rlimit_cpu_sec = 8;
    std::vector<std::string> argv = {g_runhost};
    argv.insert(argv.end(), extra_args.begin(), extra_args.end());
    ProcResult pr;
    if (!proc_run_capture_sandboxed_stdin(argv, "", stdin_data, lim, &pr)) die("runhost did not start: " + pr.error);
    return pr;
}

static RunReport run(const RunRequest& req) {
    ProcResult pr = spawn(encode_request(req));
    expect_eq_ll(pr.exit_code, 0, "runhost writes a report (stderr: " + pr.errout + ")");
    RunReport rep;
    std::string err;
    if (!decode_report(pr.output, CaptureLimits{}, &rep, &err)) die("report: " + err + "\n" + pr.output);
    return rep;
}

static void test_print() {
    RunReport rep = run(base_request("print(1 + 1)\n"));
    expect_true(rep.outcome == RunOutcome::Completed, "completed");
    expect_eq_ll((long long)rep.artifacts.size(), 1, "one artifact");
    expect_true(rep.artifacts[0].kind == ArtifactKind::TextOutput && rep.artifacts[0].payload == "2\n", "printed 2");
    expect_true(rep.artifacts[0].digest.size() == 64, "digest computed");
}

static void test_figure() {
    RunReport rep = run(base_request(
        "from mplsoccer import Pitch\n"
        "pitch = Pitch()\n"
        "fig, ax = pitch.draw()\n"
        "pitch.scatter(df['x'], df['y'], ax=ax)\n"));
    expect_true(rep.outcome == RunOutcome::Completed, "completed: " + rep.error_message);
    expect_eq_ll((long long)rep.artifacts.size(), 1, "one figure");
    expect_true(rep.artifacts[0].kind == ArtifactKind::Figure, "figure kind");
    expect_true(rep.artifacts[0].payload.find("<svg") != std::string::npos, "svg");
}

static void test_errors() {
    RunReport rep = run(base_request("x = 1\nprint(x / 0)\n"));
    expect_true(rep.outcome == RunOutcome::ScriptFailed, "script failed");
    expect_true(rep.error_type == "ZeroDivisionError", "error type: " + rep.error_type);
    expect_eq_ll(rep.error_line, 2, "error line");

    rep = run(base_request("def f(:\n"));
    expect_true(rep.outcome == RunOutcome::ScriptFailed && rep.error_type == "SyntaxError", "syntax error");

    rep = run(base_request("xs = [0]\nwhile True:\n    xs = xs + xs\n"));
    expect_true(rep.outcome == RunOutcome::MemoryExceeded, "memory exceeded");
    expect_true(rep.artifacts.empty(), "no artifacts after memory failure");
}

static void test_dataset_snapshot_is_private() {
    RunReport rep = run(base_request(
        "d = df.copy()\n"
        "d['x'] = d['x'] * 0\n"
        "print(df['x'].sum(), d['x'].sum())\n"));
    expect_true(rep.outcome == RunOutcome::Completed, "completed: " + rep.error_message);
    expect_true(rep.artifacts.at(0).payload == "152 0\n", "original frame untouched: " + rep.artifacts.at(0).payload);
}

static void test_bad_request() {
    ProcResult pr = spawn("{\"not\":\"a request\"}");
    expect_eq_ll(pr.exit_code, 0, "bad request still gets a report");
    RunReport rep;
    std::string err;
    expect_true(decode_report(pr.output, CaptureLimits{}, &rep, &err), "decodes: " + err);
    expect_true(rep.outcome == RunOutcome::BadRequest, "bad request outcome");

    pr = spawn("", {"--help"});
    expect_eq_ll(pr.exit_code, 2, "arguments are a usage error");
}

static void test_lockdown() {
    RunRequest req = base_request("print(sum(range(10)))\n");
    req.lockdown = seccomp_available() ? LockdownMode::Required : LockdownMode::BestEffort;
    RunReport rep = run(req);
    expect_true(rep.outcome == RunOutcome::Completed, "runs under lockdown: " + rep.error_message);
    expect_true(rep.artifacts.at(0).payload == "45\n", "output under lockdown");
}

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_runhost <pitchbox_runhost>");
    g_runhost = argv[1];
    expect_true(std::filesystem::exists(g_runhost), "runhost binary not found: " + g_runhost);

    test_print();
    test_figure();
    test_errors();
    test_dataset_snapshot_is_private();
    test_bad_request();
    test_lockdown();
    std::cerr << "test_runhost: ALL PASSED" << std::endl;
    return 0;
}
