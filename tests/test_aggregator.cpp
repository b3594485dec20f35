#include "test_common.h"

#include "pitchbox/aggregator.h"
#include "pitchbox/capture.h"
#include "pitchbox/protocol.h"

#include <string>

using namespace pitchbox;

static Artifact text_artifact(const std::string& s) {
    Artifact a;
    a.kind = ArtifactKind::TextOutput;
    a.media_type = kTextMediaType;
    a.payload = s;
    return a;
}

static Artifact figure_artifact() {
    Artifact a;
    a.kind = ArtifactKind::Figure;
    a.media_type = kSvgMediaType;
    a.payload = "<svg/>";
    return a;
}

static bool has_diag(const ExecutionResult& r, const std::string& needle) {
    for (const auto& d : r.diagnostics)
        if (d.find(needle) != std::string::npos) return true;
    return false;
}

static void test_rejection() {
    SafetyVerdict v;
    v.allowed = false;
    v.policy_version = "pitchbox-denylist/1";
    Violation x;
    x.pattern_id = "AST.IMPORT_DENIED";
    x.location.line = 2;
    x.location.column = 1;
    x.message = "import of module 'os' is not allowed";
    v.violations.push_back(x);

    ExecutionResult r = aggregate_rejected("sub-1", v, std::chrono::milliseconds(3));
    expect_true(r.status == ExecutionStatus::SafetyRejected, "status");
    expect_true(r.error_kind == ErrorKind::SafetyViolation, "kind");
    expect_true(r.artifacts.empty(), "no artifacts");
    expect_true(has_diag(r, "AST.IMPORT_DENIED at 2:"), "violation located");
    expect_true(has_diag(r, "policy pitchbox-denylist/1"), "policy version");
    expect_true(terminal_state(r) == SubmissionState::Rejected, "terminal state");
}

static void test_success_keeps_artifacts() {
    RunUnitOutcome o;
    o.result = RunUnitResult::Completed;
    o.report.outcome = RunOutcome::Completed;
    o.report.artifacts = {figure_artifact(), text_artifact("hello\nworld\n")};
    o.elapsed = std::chrono::milliseconds(120);

    ExecutionResult r = aggregate_run("sub-2", o, SandboxConfig{});
    expect_true(r.status == ExecutionStatus::Success && r.error_kind == ErrorKind::None, "success");
    expect_eq_ll((long long)r.artifacts.size(), 2, "artifacts kept");
    expect_true(has_diag(r, "hello") && has_diag(r, "world"), "printed lines in diagnostics");
    expect_eq_ll(r.elapsed.count(), 120, "elapsed from run unit");
    expect_true(terminal_state(r) == SubmissionState::Succeeded, "succeeded");
}

static void test_script_failure() {
    RunUnitOutcome o;
    o.result = RunUnitResult::ScriptFailed;
    o.report.outcome = RunOutcome::ScriptFailed;
    o.report.error_type = "KeyError";
    o.report.error_message = "'xg'";
    o.report.error_line = 7;
    o.report.artifacts = {figure_artifact(), text_artifact("before the error\n")};
    o.report.printed_truncated = true;

    ExecutionResult r = aggregate_run("sub-3", o, SandboxConfig{});
    expect_true(r.status == ExecutionStatus::RuntimeError, "runtime error");
    expect_true(r.error_kind == ErrorKind::RuntimeExecutionError, "execution error kind");
    expect_true(r.artifacts.empty(), "partial artifacts dropped");
    expect_true(has_diag(r, "KeyError: 'xg' (line 7)"), "error diagnostic");
    expect_true(has_diag(r, "before the error"), "printed text kept");
    expect_true(has_diag(r, "truncated"), "truncation noted");
}

static void test_limits() {
    SandboxConfig cfg;
    cfg.timeout_seconds = 2;
    cfg.memory_limit_bytes = 64ULL * 1024 * 1024;

    RunUnitOutcome o;
    o.result = RunUnitResult::TimedOut;
    ExecutionResult r = aggregate_run("sub-4", o, cfg);
    expect_true(r.status == ExecutionStatus::Timeout && r.error_kind == ErrorKind::TimeoutError, "timeout");
    expect_true(has_diag(r, "2.0 s"), "limit named");
    expect_true(terminal_state(r) == SubmissionState::TimedOut, "timed out state");

    o.result = RunUnitResult::MemoryExceeded;
    r = aggregate_run("sub-5", o, cfg);
    expect_true(r.status == ExecutionStatus::ResourceExceeded && r.error_kind == ErrorKind::ResourceLimitError,
                "memory");
    expect_true(has_diag(r, "64 MB"), "memory limit named");
}

static void test_infra_and_cancel() {
    RunUnitOutcome o;
    o.result = RunUnitResult::InfraFailed;
    o.infra_error = "runhost exited with code 3: seccomp unavailable";
    ExecutionResult r = aggregate_run("sub-6", o, SandboxConfig{});
    expect_true(r.error_kind == ErrorKind::InternalInfrastructureError, "infra kind");
    expect_true(!has_diag(r, "seccomp"), "operator detail not leaked");

    o.result = RunUnitResult::Cancelled;
    r = aggregate_run("sub-7", o, SandboxConfig{});
    expect_true(r.status == ExecutionStatus::Cancelled && r.error_kind == ErrorKind::Cancelled, "cancelled");

    r = capacity_exceeded("sub-8", "queue full");
    expect_true(r.error_kind == ErrorKind::CapacityExceeded && r.status == ExecutionStatus::RuntimeError, "capacity");
    expect_true(has_diag(r, "queue full"), "capacity reason");
}

int main() {
    test_rejection();
    test_success_keeps_artifacts();
    test_script_failure();
    test_limits();
    test_infra_and_cancel();
    std::cerr << "test_aggregator: ALL PASSED" << std::endl;
    return 0;
}
