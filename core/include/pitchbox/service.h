#pragma once
#include "analyzer.h"
#include "audit_log.h"
#include "config.h"
#include "executor.h"
#include "types.h"
#include "work_queue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pitchbox {

// Entry point for callers. Analyzes each submission, admits accepted ones to
// a bounded FIFO and runs them on max_concurrent worker threads, one run unit
// per worker at a time.
//
// Every submit() returns exactly one well-formed ExecutionResult; nothing
// escapes as an exception. cancel() answers the waiting caller at once and
// kills the run unit (or drops the queued entry).
class SandboxService {
public:
    SandboxService(ServiceConfig cfg, DenylistPolicy policy);
    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    // Blocks until the submission reaches a terminal state.
    ExecutionResult submit(CodeSubmission sub, const SandboxConfig& cfg);

    // Best-effort. False when no active submission has this id.
    bool cancel(const std::string& submission_id);

    // Analysis only; nothing is admitted or run.
    SafetyVerdict check(const std::string& source) const { return analyzer_.analyze(source); }

    std::optional<SubmissionState> state(const std::string& submission_id) const;

    size_t queued() const { return queue_.size(); }
    size_t running() const { return running_.load(); }

    // Cancels whatever is pending or running and joins the workers.
    // Later submissions get CapacityExceeded.
    void shutdown();

    bool ok() const { return analyzer_.ok(); }
    const std::string& init_error() const { return analyzer_.init_error(); }
    const ServiceConfig& config() const { return cfg_; }
    const Executor& executor() const { return executor_; }

private:
    struct Job;
    using JobPtr = std::shared_ptr<Job>;

    void worker_loop(size_t index);
    void fulfil(const JobPtr& job, ExecutionResult r);
    std::string next_id();
    void audit_result(const std::string& id, const char* event, const ExecutionResult& r);

    ServiceConfig cfg_;
    SafetyAnalyzer analyzer_;
    Executor executor_;
    AuditLog audit_;

    WorkQueue<JobPtr> queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex mu_;
    std::map<std::string, JobPtr> active_;   // admitted and not yet returned to the caller
    size_t admitted_{0};                     // queued + running
    bool stopping_{false};
    uint64_t id_seq_{0};

    std::atomic<size_t> running_{0};
};

} // namespace pitchbox
