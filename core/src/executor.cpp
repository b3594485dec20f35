#include "pitchbox/executor.h"
#include "pitchbox/proc.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace pitchbox {

const char* run_unit_result_to_str(RunUnitResult r) {
    switch (r) {
        case RunUnitResult::Completed:      return "completed";
        case RunUnitResult::ScriptFailed:   return "script_failed";
        case RunUnitResult::MemoryExceeded: return "memory_exceeded";
        case RunUnitResult::TimedOut:       return "timed_out";
        case RunUnitResult::Cancelled:      return "cancelled";
        case RunUnitResult::InfraFailed:    return "infra_failed";
    }
    return "infra_failed";
}

std::string default_runhost_path() {
    std::string dir = self_exe_dir();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::path p = std::filesystem::path(dir) / "pitchbox_runhost";
        if (std::filesystem::exists(p, ec)) return p.string();
    }
    return "pitchbox_runhost";
}

RunRequest build_run_request(const CodeSubmission& sub,
                             const SandboxConfig& cfg,
                             const std::map<std::string, std::string>& modules,
                             const ExecutorConfig& ecfg) {
    RunRequest r;
    r.submission_id = sub.submission_id;
    r.source = sub.source_text;
    if (sub.allowed_dataset_handle) r.dataset = *sub.allowed_dataset_handle;
    r.capabilities = sub.requested_capabilities;
    r.bindings = cfg.allowed_bindings;
    r.modules = modules;
    r.memory_limit_bytes = std::min(cfg.memory_limit_bytes, kMaxMemoryLimitBytes);
    r.max_print_bytes = ecfg.max_print_bytes;
    r.max_call_depth = ecfg.max_call_depth;
    r.lockdown = ecfg.lockdown;
    return r;
}

Executor::Executor(ExecutorConfig cfg) : cfg_(std::move(cfg)) {
    runhost_ = cfg_.runhost_bin.empty() ? default_runhost_path() : cfg_.runhost_bin;
#ifndef _WIN32
    // A run unit that dies early must not take the service down with SIGPIPE
    // while its request is still being written.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
#endif
}

static RunUnitOutcome infra(RunUnitOutcome o, const std::string& why) {
    o.result = RunUnitResult::InfraFailed;
    o.infra_error = why;
    return o;
}

bool run_unit_limits(const SandboxConfig& cfg, const ExecutorConfig& ecfg, ProcLimits* out, std::string* err) {
    if (!std::isfinite(cfg.timeout_seconds) || cfg.timeout_seconds <= 0) {
        if (err) *err = "invalid timeout_seconds: " + std::to_string(cfg.timeout_seconds);
        return false;
    }
    if (cfg.memory_limit_bytes == 0) {
        if (err) *err = "memory_limit_bytes must be positive";
        return false;
    }
    const double seconds = std::min(cfg.timeout_seconds, kMaxTimeoutSeconds);
    const uint64_t memory = std::min(cfg.memory_limit_bytes, kMaxMemoryLimitBytes);

    ProcLimits lim;
    lim.timeout_ms = std::max(1, (int)std::ceil(seconds * 1000.0));
    // CPU seconds only as a backstop; the wall-clock deadline fires first.
    lim.rlimit_cpu_sec = (int)std::ceil(seconds) + 1;
    lim.rlimit_as_bytes = memory > UINT64_MAX - ecfg.runtime_headroom_bytes ? UINT64_MAX
                                                                             : memory + ecfg.runtime_headroom_bytes;
    lim.stdout_max_bytes = ecfg.max_artifacts * ecfg.max_artifact_bytes + (1u << 20);
    lim.enable_seccomp = ecfg.enable_seccomp;
    lim.wrapper = ecfg.wrapper;
    *out = std::move(lim);
    return true;
}

RunUnitOutcome Executor::run(const CodeSubmission& sub,
                             const SandboxConfig& cfg,
                             const std::map<std::string, std::string>& modules,
                             const std::atomic<bool>* cancel) const {
    RunUnitOutcome o;
    if (cancel && cancel->load()) {
        o.result = RunUnitResult::Cancelled;
        return o;
    }

    ProcLimits lim;
    std::string bad;
    if (!run_unit_limits(cfg, cfg_, &lim, &bad)) return infra(std::move(o), "bad sandbox config: " + bad);

    const std::string request = encode_request(build_run_request(sub, cfg, modules, cfg_));

    ProcResult pr;
    if (!proc_run_capture_sandboxed_stdin({runhost_}, "", request, lim, &pr, cancel)) {
        return infra(std::move(o), "run unit did not start: " + pr.error);
    }
    o.elapsed = pr.elapsed;
    o.exit_code = pr.exit_code;
    o.term_signal = pr.term_signal;
    o.child_stderr = pr.errout;

    if (pr.cancelled) {
        o.result = RunUnitResult::Cancelled;
        return o;
    }
    if (pr.timed_out) {
        o.result = RunUnitResult::TimedOut;
        return o;
    }
    if (pr.term_signal != 0) {
#ifndef _WIN32
        if (pr.term_signal == SIGXCPU) {
            o.result = RunUnitResult::TimedOut;
            return o;
        }
        if (pr.term_signal == SIGKILL) {
            if (!cfg_.wrapper.empty()) {
                // the wrapper enforces limits of its own; its kills say nothing about memory
                o.result = RunUnitResult::ScriptFailed;
                o.report.error_type = "Killed";
                o.report.error_message = "run unit was killed (SIGKILL) under the process wrapper";
                return o;
            }
            // the deadline path reports timed_out, so this is most likely the OOM killer
            o.result = RunUnitResult::MemoryExceeded;
            o.report.error_message = "run unit was killed (SIGKILL, likely out of memory)";
            return o;
        }
#endif
        o.result = RunUnitResult::ScriptFailed;
        o.report.error_type = "Crash";
        o.report.error_message = "run unit crashed (signal " + std::to_string(pr.term_signal) + ")";
        return o;
    }
    if (pr.exit_code != 0) {
        return infra(std::move(o), "run unit exited with code " + std::to_string(pr.exit_code));
    }
    if (pr.output_truncated) {
        return infra(std::move(o), "run unit response exceeds " + std::to_string(lim.stdout_max_bytes) + " bytes");
    }

    CaptureLimits cl;
    cl.max_artifact_bytes = cfg_.max_artifact_bytes;
    cl.max_artifacts = cfg_.max_artifacts;
    std::string err;
    if (!decode_report(pr.output, cl, &o.report, &err)) {
        return infra(std::move(o), err);
    }
    switch (o.report.outcome) {
        case RunOutcome::Completed:      o.result = RunUnitResult::Completed; break;
        case RunOutcome::ScriptFailed:   o.result = RunUnitResult::ScriptFailed; break;
        case RunOutcome::MemoryExceeded: o.result = RunUnitResult::MemoryExceeded; break;
        case RunOutcome::BadRequest:
            return infra(std::move(o), "run unit refused the request: " + o.report.error_message);
    }
    return o;
}

} // namespace pitchbox
