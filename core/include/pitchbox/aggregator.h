#pragma once
#include "executor.h"
#include "types.h"

#include <chrono>
#include <string>

namespace pitchbox {

// Merges analyzer and run-unit outcomes into the single ExecutionResult a
// caller sees. Every function here produces exactly one status.
//
//   analyzer  run unit          status            error_kind
//   reject    -                 SafetyRejected    SafetyViolation
//   accept    completed         Success           None
//   accept    timed out         Timeout           TimeoutError
//   accept    memory ceiling    ResourceExceeded  ResourceLimitError
//   accept    script error      RuntimeError      RuntimeExecutionError
//   accept    infra failure     RuntimeError      InternalInfrastructureError
//   accept    cancelled         Cancelled         Cancelled
//   -         over capacity     RuntimeError      CapacityExceeded

ExecutionResult aggregate_rejected(const std::string& submission_id, const SafetyVerdict& verdict,
                                   std::chrono::milliseconds elapsed);

// Artifacts are kept only for Success; other outcomes carry printed lines
// and the error in diagnostics. Infrastructure details stay in the operator
// log and the caller gets a generic message.
ExecutionResult aggregate_run(const std::string& submission_id, const RunUnitOutcome& outcome,
                              const SandboxConfig& cfg);

ExecutionResult capacity_exceeded(const std::string& submission_id, const std::string& why);
ExecutionResult cancelled_result(const std::string& submission_id, std::chrono::milliseconds elapsed);
ExecutionResult infrastructure_failure(const std::string& submission_id, std::chrono::milliseconds elapsed);

// Last state of the lifecycle for a result.
SubmissionState terminal_state(const ExecutionResult& r);

} // namespace pitchbox
