#include "test_common.h"

#include "pitchbox/audit_log.h"
#include "pitchbox/config.h"
#include "pitchbox/dataset.h"
#include "pitchbox/policy.h"
#include "pitchbox/sandbox_env.h"
#include "pitchbox/service.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

using namespace pitchbox;
using namespace std::chrono_literals;

static std::string g_runhost;

static ServiceConfig service_config(size_t workers, size_t queue_limit, Admission adm = Admission::Queue) {
    ServiceConfig c;
    c.max_concurrent = workers;
    c.queue_limit = queue_limit;
    c.admission = adm;
    c.executor.runhost_bin = g_runhost;
    c.executor.lockdown = LockdownMode::BestEffort;
    return c;
}

static SandboxConfig sandbox(double timeout_s = 10, uint64_t memory = 128ULL << 20) {
    SandboxConfig c;
    c.timeout_seconds = timeout_s;
    c.memory_limit_bytes = memory;
    c.allowed_bindings = default_allowed_bindings();
    return c;
}

static DatasetHandle events() {
    auto ds = std::make_shared<Dataset>();
    std::string err;
    if (!dataset_from_csv("player,type,x,y,xg\nSaka,Shot,102,38,0.12\nRice,Pass,50,40,\nPalmer,Shot,110,42,0.45\n",
                          ds.get(), &err))
        die("csv: " + err);
    return ds;
}

static CodeSubmission submission(const std::string& src, const std::string& id = "") {
    CodeSubmission s;
    s.submission_id = id;
    s.source_text = src;
    s.allowed_dataset_handle = events();
    s.requested_capabilities = {Capability::DatasetRead, Capability::Plot, Capability::TextOutput, Capability::Numeric};
    return s;
}

static bool has_diag(const ExecutionResult& r, const std::string& needle) {
    for (const auto& d : r.diagnostics)
        if (d.find(needle) != std::string::npos) return true;
    return false;
}

static std::string diags(const ExecutionResult& r) {
    std::string s;
    for (const auto& d : r.diagnostics) s += d + " | ";
    return s;
}

// Waits until the submission is running in a run unit.
static void wait_executing(SandboxService& svc, const std::string& id) {
    for (int i = 0; i < 200; i++) {
        auto st = svc.state(id);
        if (st && *st == SubmissionState::Executing) return;
        std::this_thread::sleep_for(20ms);
    }
    die("submission never started executing: " + id);
}

static void test_success() {
    SandboxService svc(service_config(1, 4), default_policy());
    expect_true(svc.ok(), "service ok");
    ExecutionResult r = svc.submit(submission("print(1 + 1)\n"), sandbox());
    expect_true(r.status == ExecutionStatus::Success, "success: " + diags(r));
    expect_true(r.error_kind == ErrorKind::None, "no error kind");
    expect_true(!r.submission_id.empty(), "id assigned");
    expect_eq_ll((long long)r.artifacts.size(), 1, "one text artifact");
    expect_true(r.artifacts[0].payload == "2\n", "printed 2");
    expect_true(has_diag(r, "2"), "printed line in diagnostics");

    r = svc.submit(submission(
                       "from mplsoccer import Pitch\n"
                       "pitch = Pitch(pitch_type='statsbomb')\n"
                       "fig, ax = pitch.draw()\n"
                       "shots = df[df['type'] == 'Shot']\n"
                       "pitch.scatter(shots['x'], shots['y'], ax=ax)\n"),
                   sandbox());
    expect_true(r.status == ExecutionStatus::Success, "figure run: " + diags(r));
    expect_true(r.artifacts.size() == 1 && r.artifacts[0].kind == ArtifactKind::Figure, "figure artifact");
    expect_eq_ll((long long)r.artifacts[0].digest.size(), 64, "artifact digest");

    // same input, same bytes
    ExecutionResult again = svc.submit(submission(
                                           "from mplsoccer import Pitch\n"
                                           "pitch = Pitch(pitch_type='statsbomb')\n"
                                           "fig, ax = pitch.draw()\n"
                                           "shots = df[df['type'] == 'Shot']\n"
                                           "pitch.scatter(shots['x'], shots['y'], ax=ax)\n"),
                                       sandbox());
    expect_true(again.status == ExecutionStatus::Success, "repeat run");
    expect_true(again.artifacts.at(0).digest == r.artifacts[0].digest, "deterministic artifact bytes");
}

static void test_rejected_code_never_runs() {
    SandboxService svc(service_config(1, 4), default_policy());
    ExecutionResult r = svc.submit(submission("m = __import__('os')\nm.system('touch /tmp/pitchbox_pwned')\n"), sandbox());
    expect_true(r.status == ExecutionStatus::SafetyRejected, "rejected");
    expect_true(r.error_kind == ErrorKind::SafetyViolation, "violation kind");
    expect_true(r.artifacts.empty(), "no artifacts");
    expect_true(has_diag(r, "TXT.DUNDER_IMPORT"), "violation listed: " + diags(r));
    expect_true(!std::filesystem::exists("/tmp/pitchbox_pwned"), "code did not run");
}

static void test_script_error() {
    SandboxService svc(service_config(1, 4), default_policy());
    ExecutionResult r = svc.submit(submission("print('start')\nx = df['nope']\n"), sandbox());
    expect_true(r.status == ExecutionStatus::RuntimeError, "runtime error");
    expect_true(r.error_kind == ErrorKind::RuntimeExecutionError, "execution error");
    expect_true(has_diag(r, "KeyError") && has_diag(r, "line 2"), "error diagnostic: " + diags(r));
    expect_true(has_diag(r, "start"), "printed text before the error");
    expect_true(r.artifacts.empty(), "no artifacts on failure");
}

static void test_timeout() {
    SandboxService svc(service_config(1, 4), default_policy());
    auto t0 = std::chrono::steady_clock::now();
    ExecutionResult r = svc.submit(submission("while True:\n    pass\n"), sandbox(2.0));
    auto took = std::chrono::steady_clock::now() - t0;
    expect_true(r.status == ExecutionStatus::Timeout, "timeout: " + diags(r));
    expect_true(r.error_kind == ErrorKind::TimeoutError, "timeout kind");
    expect_true(took >= 1900ms && took < 4s, "terminated near the limit");
    expect_true(r.elapsed >= 1900ms && r.elapsed < 4s, "elapsed reported near the limit");
}

static void test_run_unit_limits() {
    ExecutorConfig ecfg;
    ProcLimits lim;
    std::string err;
    expect_true(run_unit_limits(sandbox(2.5), ecfg, &lim, &err), "limits: " + err);
    expect_eq_ll(lim.timeout_ms, 2500, "deadline in ms");
    expect_eq_ll((long long)lim.rlimit_as_bytes, (128LL << 20) + (512LL << 20), "budget plus headroom");

    // a 35-day request is clamped, never wrapped into an instant deadline
    expect_true(run_unit_limits(sandbox(3e6), ecfg, &lim, &err), "long timeout: " + err);
    expect_eq_ll(lim.timeout_ms, (long long)(kMaxTimeoutSeconds * 1000), "deadline clamped");

    ecfg.runtime_headroom_bytes = UINT64_MAX;
    expect_true(run_unit_limits(sandbox(10, UINT64_MAX), ecfg, &lim, &err), "huge memory: " + err);
    expect_true(lim.rlimit_as_bytes == UINT64_MAX, "RLIMIT_AS saturates");

    expect_true(!run_unit_limits(sandbox(std::numeric_limits<double>::infinity()), ecfg, &lim, &err), "inf refused");
    expect_true(!run_unit_limits(sandbox(std::nan("")), ecfg, &lim, &err), "nan refused");
    expect_true(!run_unit_limits(sandbox(0), ecfg, &lim, &err), "zero refused");
    expect_true(!run_unit_limits(sandbox(10, 0), ecfg, &lim, &err), "zero memory refused");

    SandboxService svc(service_config(1, 4), default_policy());
    ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox(3e6));
    expect_true(r.status == ExecutionStatus::Success, "long timeout still runs: " + diags(r));
    r = svc.submit(submission("print(1)\n"), sandbox(std::nan("")));
    expect_true(r.error_kind == ErrorKind::InternalInfrastructureError, "invalid timeout reported: " + diags(r));
}

static void test_memory_limit() {
    SandboxService svc(service_config(1, 4), default_policy());
    ExecutionResult r = svc.submit(submission("xs = [0]\nwhile True:\n    xs = xs + xs\n"), sandbox(10, 32ULL << 20));
    expect_true(r.status == ExecutionStatus::ResourceExceeded, "memory exceeded: " + diags(r));
    expect_true(r.error_kind == ErrorKind::ResourceLimitError, "resource kind");

    // live strings well under RLIMIT_AS still hit the script budget
    r = svc.submit(submission("keep = []\ns = 'a' * 1000000\nfor i in range(300):\n    keep.append(s + str(i))\n"),
                   sandbox(10, 32ULL << 20));
    expect_true(r.status == ExecutionStatus::ResourceExceeded, "retained strings: " + diags(r));

    r = svc.submit(submission("import numpy as np\nkeep = []\nfor i in range(60):\n    keep.append(np.arange(1000000))\n"),
                   sandbox(10, 32ULL << 20));
    expect_true(r.status == ExecutionStatus::ResourceExceeded, "retained arrays: " + diags(r));
}

static void test_killed_run_unit() {
    char dir[] = "/tmp/pitchbox_kill_XXXXXX";
    expect_true(mkdtemp(dir) != nullptr, "mkdtemp");
    const std::string killer = std::string(dir) + "/killer";
    {
        std::ofstream f(killer);
        f << "#!/bin/sh\nkill -9 $$\n";
    }
    expect_true(chmod(killer.c_str(), 0755) == 0, "chmod");

    // no wrapper: only the kernel sends SIGKILL, so it reads as the memory ceiling
    ServiceConfig c = service_config(1, 4);
    c.executor.runhost_bin = killer;
    {
        SandboxService svc(c, default_policy());
        ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox());
        expect_true(r.status == ExecutionStatus::ResourceExceeded, "bare SIGKILL: " + diags(r));
        expect_true(has_diag(r, "likely out of memory"), "kill reported as likely OOM: " + diags(r));
    }

    // under a wrapper a SIGKILL may be the wrapper's own limit
    c = service_config(1, 4);
    c.executor.wrapper = {"/bin/sh", "-c", "kill -9 $$", "wrapper"};
    {
        SandboxService svc(c, default_policy());
        ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox());
        expect_true(r.status == ExecutionStatus::RuntimeError, "wrapped SIGKILL: " + diags(r));
        expect_true(r.error_kind == ErrorKind::RuntimeExecutionError, "wrapped SIGKILL kind");
        expect_true(has_diag(r, "under the process wrapper"), "wrapper kill named: " + diags(r));
    }
    std::filesystem::remove_all(dir);
}

static void test_dataset_not_mutated() {
    SandboxService svc(service_config(1, 4), default_policy());
    CodeSubmission s = submission("df['x'] = 0\n");
    DatasetHandle ds = s.allowed_dataset_handle;
    const std::string before = ds->digest();
    ExecutionResult r = svc.submit(std::move(s), sandbox());
    expect_true(r.status == ExecutionStatus::RuntimeError, "mutation refused: " + diags(r));
    expect_true(ds->digest() == before, "caller dataset unchanged");
}

static void test_concurrent_submissions() {
    SandboxService svc(service_config(10, 16), default_policy());
    std::vector<std::future<ExecutionResult>> futs;
    for (int i = 0; i < 10; i++) {
        futs.push_back(std::async(std::launch::async, [&svc, i] {
            return svc.submit(submission("print(" + std::to_string(i) + " * 2)\n"), sandbox());
        }));
    }
    std::set<std::string> ids;
    for (int i = 0; i < 10; i++) {
        ExecutionResult r = futs[(size_t)i].get();
        expect_true(r.status == ExecutionStatus::Success, "concurrent run " + std::to_string(i) + ": " + diags(r));
        expect_true(r.artifacts.at(0).payload == std::to_string(i * 2) + "\n", "own output");
        ids.insert(r.submission_id);
    }
    expect_eq_ll((long long)ids.size(), 10, "distinct ids");
}

static void test_cancel() {
    SandboxService svc(service_config(1, 4), default_policy());
    auto fut = std::async(std::launch::async,
                          [&svc] { return svc.submit(submission("while True:\n    pass\n", "sub-cancel-me"), sandbox(30)); });
    wait_executing(svc, "sub-cancel-me");
    auto t0 = std::chrono::steady_clock::now();
    expect_true(svc.cancel("sub-cancel-me"), "cancel accepted");
    ExecutionResult r = fut.get();
    expect_true(r.status == ExecutionStatus::Cancelled && r.error_kind == ErrorKind::Cancelled, "cancelled");
    expect_true(std::chrono::steady_clock::now() - t0 < 2s, "cancel answered promptly");
    expect_true(!svc.cancel("sub-cancel-me"), "second cancel is a no-op");
    expect_true(!svc.cancel("sub-unknown"), "unknown id");

    // the worker is free again once the run unit is gone
    r = svc.submit(submission("print('after')\n"), sandbox());
    expect_true(r.status == ExecutionStatus::Success, "service usable after cancel: " + diags(r));
}

static void test_capacity() {
    SandboxService svc(service_config(1, 4, Admission::Reject), default_policy());
    auto busy = std::async(std::launch::async,
                           [&svc] { return svc.submit(submission("while True:\n    pass\n", "sub-busy"), sandbox(30)); });
    wait_executing(svc, "sub-busy");

    ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox());
    expect_true(r.error_kind == ErrorKind::CapacityExceeded, "refused at capacity: " + diags(r));
    expect_true(r.status == ExecutionStatus::RuntimeError, "capacity status");

    // a second submission with the same active id is refused
    r = svc.submit(submission("print(1)\n", "sub-busy"), sandbox());
    expect_true(r.error_kind == ErrorKind::InternalInfrastructureError, "duplicate id refused");

    expect_true(svc.cancel("sub-busy"), "cancel busy");
    expect_true(busy.get().status == ExecutionStatus::Cancelled, "busy cancelled");
}

static void test_queue_limit() {
    SandboxService svc(service_config(1, 1), default_policy());
    auto busy = std::async(std::launch::async,
                           [&svc] { return svc.submit(submission("while True:\n    pass\n", "sub-q-busy"), sandbox(30)); });
    wait_executing(svc, "sub-q-busy");
    auto waiting = std::async(std::launch::async,
                              [&svc] { return svc.submit(submission("print('queued')\n", "sub-q-wait"), sandbox()); });
    for (int i = 0; i < 200 && svc.queued() == 0; i++) std::this_thread::sleep_for(10ms);
    expect_eq_ll((long long)svc.queued(), 1, "one waiting");

    ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox());
    expect_true(r.error_kind == ErrorKind::CapacityExceeded, "queue full: " + diags(r));

    // cancelling the queued one answers it without running it
    expect_true(svc.cancel("sub-q-wait"), "cancel queued");
    expect_true(waiting.get().status == ExecutionStatus::Cancelled, "queued cancelled");
    expect_true(svc.cancel("sub-q-busy"), "cancel running");
    expect_true(busy.get().status == ExecutionStatus::Cancelled, "running cancelled");
}

static void test_audit_trail() {
    char path[] = "/tmp/pitchbox_service_audit_XXXXXX";
    int fd = mkstemp(path);
    expect_true(fd >= 0, "mkstemp");
    close(fd);
    unlink(path);

    {
        ServiceConfig c = service_config(1, 4);
        c.audit_log_path = path;
        SandboxService svc(c, default_policy());
        svc.submit(submission("print('audited')\n", "sub-audit-ok"), sandbox());
        svc.submit(submission("e = eval\n", "sub-audit-bad"), sandbox());
    }
    size_t lines = 0;
    std::string err;
    expect_true(audit_log_verify(path, &lines, &err), "audit chain verifies: " + err);
    expect_true(lines >= 6, "events recorded");

    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    const std::string text = ss.str();
    for (const char* ev : {"submission.received", "analysis.verdict", "run.started", "run.finished"}) {
        expect_true(text.find(std::string("\"event\":\"") + ev + "\"") != std::string::npos, std::string("event ") + ev);
    }
    expect_true(text.find("print('audited')") == std::string::npos, "source not logged");
    unlink(path);
}

static void test_shutdown() {
    SandboxService svc(service_config(1, 4), default_policy());
    svc.shutdown();
    ExecutionResult r = svc.submit(submission("print(1)\n"), sandbox());
    expect_true(r.error_kind == ErrorKind::CapacityExceeded, "submissions after shutdown refused");
}

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_service <pitchbox_runhost>");
    g_runhost = argv[1];
    expect_true(std::filesystem::exists(g_runhost), "runhost binary not found: " + g_runhost);

    test_success();
    test_rejected_code_never_runs();
    test_script_error();
    test_timeout();
    test_run_unit_limits();
    test_memory_limit();
    test_killed_run_unit();
    test_dataset_not_mutated();
    test_concurrent_submissions();
    test_cancel();
    test_capacity();
    test_queue_limit();
    test_audit_trail();
    test_shutdown();
    std::cerr << "test_service: ALL PASSED" << std::endl;
    return 0;
}
