#pragma once
#include "capture.h"
#include "config.h"
#include "proc.h"
#include "protocol.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <map>
#include <string>

namespace pitchbox {

// Terminal outcome of one run unit, as seen by the parent.
enum class RunUnitResult {
    Completed,
    ScriptFailed,
    MemoryExceeded,
    TimedOut,
    Cancelled,
    InfraFailed,  // did not start, died without a report, or sent garbage
};

const char* run_unit_result_to_str(RunUnitResult r);

struct RunUnitOutcome {
    RunUnitResult result{RunUnitResult::InfraFailed};
    RunReport report;              // decoded response, when there was one
    std::string infra_error;       // operator-facing detail for InfraFailed
    std::chrono::milliseconds elapsed{0};
    int exit_code{0};
    int term_signal{0};
    std::string child_stderr;      // tail, for operator logs only
};

// Builds the stdin request for pitchbox_runhost. The dataset is copied into
// the request, so every run unit gets its own snapshot.
RunRequest build_run_request(const CodeSubmission& sub,
                             const SandboxConfig& cfg,
                             const std::map<std::string, std::string>& modules,
                             const ExecutorConfig& ecfg);

// Process limits for one run unit. The deadline and memory ceiling are
// clamped to kMaxTimeoutSeconds / kMaxMemoryLimitBytes and the RLIMIT_AS sum
// saturates. Returns false for a non-finite or non-positive limit.
bool run_unit_limits(const SandboxConfig& cfg, const ExecutorConfig& ecfg, ProcLimits* out, std::string* err);

// Launches pitchbox_runhost per submission and supervises it: wall-clock
// deadline, memory ceiling (interpreter budget plus RLIMIT_AS) and
// cancellation. Exactly one RunUnitOutcome comes back from every run().
class Executor {
public:
    explicit Executor(ExecutorConfig cfg);

    RunUnitOutcome run(const CodeSubmission& sub,
                       const SandboxConfig& cfg,
                       const std::map<std::string, std::string>& modules,
                       const std::atomic<bool>* cancel = nullptr) const;

    const std::string& runhost_path() const { return runhost_; }
    const ExecutorConfig& config() const { return cfg_; }

private:
    ExecutorConfig cfg_;
    std::string runhost_;
};

// Where pitchbox_runhost lives when the config does not say.
std::string default_runhost_path();

} // namespace pitchbox
