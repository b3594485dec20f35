#include "pitchbox/aggregator.h"

#include <cstdio>

namespace pitchbox {

static ExecutionResult make(const std::string& id, ExecutionStatus s, ErrorKind k, std::chrono::milliseconds elapsed) {
    ExecutionResult r;
    r.submission_id = id;
    r.status = s;
    r.error_kind = k;
    r.elapsed = elapsed;
    return r;
}

static std::string seconds(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", s);
    return buf;
}

ExecutionResult aggregate_rejected(const std::string& submission_id, const SafetyVerdict& verdict,
                                   std::chrono::milliseconds elapsed) {
    ExecutionResult r = make(submission_id, ExecutionStatus::SafetyRejected, ErrorKind::SafetyViolation, elapsed);
    for (const auto& v : verdict.violations) {
        std::string d = v.pattern_id;
        if (v.location.line > 0) d += " at " + v.location.toString();
        d += ": " + v.message;
        r.diagnostics.push_back(std::move(d));
    }
    r.diagnostics.push_back("policy " + verdict.policy_version);
    return r;
}

ExecutionResult aggregate_run(const std::string& submission_id, const RunUnitOutcome& o, const SandboxConfig& cfg) {
    const RunReport& rep = o.report;
    ExecutionResult r;
    switch (o.result) {
        case RunUnitResult::Completed:
            r = make(submission_id, ExecutionStatus::Success, ErrorKind::None, o.elapsed);
            r.artifacts = rep.artifacts;
            break;
        case RunUnitResult::ScriptFailed: {
            r = make(submission_id, ExecutionStatus::RuntimeError, ErrorKind::RuntimeExecutionError, o.elapsed);
            std::string d = rep.error_type.empty() ? "Error" : rep.error_type;
            d += ": " + rep.error_message;
            if (rep.error_line > 0) d += " (line " + std::to_string(rep.error_line) + ")";
            r.diagnostics.push_back(std::move(d));
            break;
        }
        case RunUnitResult::MemoryExceeded:
            r = make(submission_id, ExecutionStatus::ResourceExceeded, ErrorKind::ResourceLimitError, o.elapsed);
            r.diagnostics.push_back("memory limit of " + std::to_string(cfg.memory_limit_bytes / (1024 * 1024)) +
                                    " MB exceeded" + (rep.error_message.empty() ? "" : ": " + rep.error_message));
            break;
        case RunUnitResult::TimedOut:
            r = make(submission_id, ExecutionStatus::Timeout, ErrorKind::TimeoutError, o.elapsed);
            r.diagnostics.push_back("execution exceeded the " + seconds(cfg.timeout_seconds) + " s time limit");
            break;
        case RunUnitResult::Cancelled:
            return cancelled_result(submission_id, o.elapsed);
        case RunUnitResult::InfraFailed:
            return infrastructure_failure(submission_id, o.elapsed);
    }

    for (const auto& line : printed_lines(rep.artifacts)) r.diagnostics.push_back(line);
    if (rep.printed_truncated) r.diagnostics.push_back("printed output truncated");
    return r;
}

ExecutionResult capacity_exceeded(const std::string& submission_id, const std::string& why) {
    ExecutionResult r = make(submission_id, ExecutionStatus::RuntimeError, ErrorKind::CapacityExceeded,
                             std::chrono::milliseconds(0));
    r.diagnostics.push_back("service at capacity: " + why);
    return r;
}

ExecutionResult cancelled_result(const std::string& submission_id, std::chrono::milliseconds elapsed) {
    ExecutionResult r = make(submission_id, ExecutionStatus::Cancelled, ErrorKind::Cancelled, elapsed);
    r.diagnostics.push_back("cancelled");
    return r;
}

ExecutionResult infrastructure_failure(const std::string& submission_id, std::chrono::milliseconds elapsed) {
    ExecutionResult r = make(submission_id, ExecutionStatus::RuntimeError, ErrorKind::InternalInfrastructureError,
                             elapsed);
    r.diagnostics.push_back("internal error: the execution environment failed");
    return r;
}

SubmissionState terminal_state(const ExecutionResult& r) {
    switch (r.status) {
        case ExecutionStatus::Success:          return SubmissionState::Succeeded;
        case ExecutionStatus::SafetyRejected:   return SubmissionState::Rejected;
        case ExecutionStatus::Timeout:          return SubmissionState::TimedOut;
        case ExecutionStatus::ResourceExceeded: return SubmissionState::ResourceExceeded;
        case ExecutionStatus::RuntimeError:     return SubmissionState::RuntimeFailed;
        case ExecutionStatus::Cancelled:        return SubmissionState::Cancelled;
    }
    return SubmissionState::RuntimeFailed;
}

} // namespace pitchbox
