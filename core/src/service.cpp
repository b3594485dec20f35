#include "pitchbox/service.h"
#include "pitchbox/aggregator.h"
#include "pitchbox/hash.h"
#include "pitchbox/serialization.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>

namespace pitchbox {

struct SandboxService::Job {
    CodeSubmission sub;
    SandboxConfig cfg;
    std::promise<ExecutionResult> promise;
    std::atomic<bool> fulfilled{false};
    std::atomic<bool> cancel{false};
    std::atomic<SubmissionState> state{SubmissionState::Accepted};
    std::chrono::steady_clock::time_point accepted_at{std::chrono::steady_clock::now()};
};

static std::chrono::milliseconds since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
}

SandboxService::SandboxService(ServiceConfig cfg, DenylistPolicy policy)
    : cfg_(std::move(cfg)),
      analyzer_(std::move(policy)),
      executor_(cfg_.executor),
      audit_(cfg_.audit_log_path, profile_name(detect_profile())),
      queue_(cfg_.queue_limit + std::max<size_t>(cfg_.max_concurrent, 1)) {
    if (cfg_.max_concurrent == 0) cfg_.max_concurrent = 1;
    if (!analyzer_.ok()) std::cerr << "[service] policy is invalid, every submission will be rejected: "
                                   << analyzer_.init_error() << "\n";
    workers_.reserve(cfg_.max_concurrent);
    for (size_t i = 0; i < cfg_.max_concurrent; i++) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
}

SandboxService::~SandboxService() {
    shutdown();
}

std::string SandboxService::next_id() {
    uint64_t n;
    {
        std::lock_guard<std::mutex> lk(mu_);
        n = ++id_seq_;
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch().count();
    std::string salt = hash::sha256_hex(std::to_string(now) + "/" + std::to_string(n) + "/" +
                                        std::to_string((uintptr_t)this));
    return "sub-" + salt.substr(0, 12) + "-" + std::to_string(n);
}

void SandboxService::fulfil(const JobPtr& job, ExecutionResult r) {
    if (job->fulfilled.exchange(true)) return;
    job->state = terminal_state(r);
    job->promise.set_value(std::move(r));
}

void SandboxService::audit_result(const std::string& id, const char* event, const ExecutionResult& r) {
    if (!audit_.enabled()) return;
    json_object* p = json_object_new_object();
    json_object_object_add(p, "status", json_object_new_string(status_to_str(r.status)));
    json_object_object_add(p, "error_kind", json_object_new_string(error_kind_to_str(r.error_kind)));
    json_object_object_add(p, "elapsed_ms", json_object_new_int64((int64_t)r.elapsed.count()));
    json_object* digests = json_object_new_array();
    for (const auto& a : r.artifacts) json_object_array_add(digests, json_new_string(a.digest));
    json_object_object_add(p, "artifact_digests", digests);
    audit_.event(id, event, p);
}

ExecutionResult SandboxService::submit(CodeSubmission sub, const SandboxConfig& cfg) {
    const auto t0 = std::chrono::steady_clock::now();
    if (sub.submission_id.empty()) sub.submission_id = next_id();
    const std::string id = sub.submission_id;

    if (audit_.enabled()) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "source_bytes", json_object_new_int64((int64_t)sub.source_text.size()));
        json_object_object_add(p, "source_sha256", json_new_string(hash::sha256_hex(sub.source_text)));
        json_object* caps = json_object_new_array();
        for (Capability c : sub.requested_capabilities) json_object_array_add(caps, json_object_new_string(capability_to_str(c)));
        json_object_object_add(p, "capabilities", caps);
        if (sub.allowed_dataset_handle) {
            json_object_object_add(p, "dataset_rows", json_object_new_int64((int64_t)sub.allowed_dataset_handle->row_count()));
            json_object_object_add(p, "dataset_columns", json_object_new_int64((int64_t)sub.allowed_dataset_handle->columns.size()));
        }
        audit_.event(id, "submission.received", p);
    }

    // Analyzing
    SafetyVerdict verdict;
    try {
        verdict = analyzer_.analyze(sub.source_text);
    } catch (const std::exception& e) {
        std::cerr << "[service] " << id << ": analyzer failed: " << e.what() << "\n";
        if (audit_.enabled()) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "stage", json_object_new_string("analysis"));
            json_object_object_add(p, "error", json_new_string(e.what()));
            audit_.event(id, "infra.error", p);
        }
        return infrastructure_failure(id, since(t0));
    }
    if (audit_.enabled()) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "allowed", json_object_new_boolean(verdict.allowed ? 1 : 0));
        json_object_object_add(p, "policy_version", json_new_string(verdict.policy_version));
        json_object* ids = json_object_new_array();
        for (const auto& v : verdict.violations) json_object_array_add(ids, json_new_string(v.pattern_id));
        json_object_object_add(p, "violations", ids);
        audit_.event(id, "analysis.verdict", p);
    }
    if (!verdict.allowed) return aggregate_rejected(id, verdict, since(t0));

    // Accepted: admit to the queue or answer at once.
    auto job = std::make_shared<Job>();
    job->sub = std::move(sub);
    job->cfg = cfg;
    std::future<ExecutionResult> fut = job->promise.get_future();

    std::string refusal;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) {
            refusal = "service is shutting down";
        } else if (active_.count(id)) {
            ExecutionResult r = infrastructure_failure(id, since(t0));
            r.diagnostics = {"submission id already in use: " + id};
            return r;
        } else if (cfg_.admission == Admission::Reject && admitted_ >= cfg_.max_concurrent) {
            refusal = "all " + std::to_string(cfg_.max_concurrent) + " workers are busy";
        } else if (admitted_ >= cfg_.max_concurrent + cfg_.queue_limit) {
            refusal = "queue is full (" + std::to_string(cfg_.queue_limit) + " pending)";
        } else {
            active_[id] = job;
            admitted_++;
            JobPtr tmp = job;
            if (!queue_.try_push(tmp)) {
                active_.erase(id);
                admitted_--;
                refusal = "queue refused the submission";
            }
        }
    }
    if (!refusal.empty()) {
        ExecutionResult r = capacity_exceeded(id, refusal);
        audit_result(id, "submission.refused", r);
        return r;
    }

    ExecutionResult r = fut.get();
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = active_.find(id);
        if (it != active_.end() && it->second == job) active_.erase(it);
    }
    return r;
}

void SandboxService::worker_loop(size_t index) {
    JobPtr job;
    while (queue_.pop(job)) {
        const std::string& id = job->sub.submission_id;
        if (!job->cancel.load()) {
            job->state = SubmissionState::Executing;
            running_++;
            if (audit_.enabled()) {
                json_object* p = json_object_new_object();
                json_object_object_add(p, "worker", json_object_new_int((int)index));
                const double t = job->cfg.timeout_seconds;
                json_object_object_add(p, "timeout_seconds",
                                       std::isfinite(t) ? json_object_new_double(t) : json_object_new_string("invalid"));
                json_object_object_add(p, "memory_limit_bytes", json_object_new_int64(
                                                                    (int64_t)std::min(job->cfg.memory_limit_bytes, kMaxMemoryLimitBytes)));
                audit_.event(id, "run.started", p);
            }

            RunUnitOutcome o;
            try {
                o = executor_.run(job->sub, job->cfg, analyzer_.policy().module_bindings, &job->cancel);
            } catch (const std::exception& e) {
                o = RunUnitOutcome{};
                o.result = RunUnitResult::InfraFailed;
                o.infra_error = std::string("executor threw: ") + e.what();
            }
            running_--;

            if (o.result == RunUnitResult::InfraFailed) {
                std::cerr << "[service] " << id << ": " << o.infra_error << "\n";
                if (!o.child_stderr.empty()) std::cerr << "[service] " << id << " run unit stderr:\n" << o.child_stderr << "\n";
                if (audit_.enabled()) {
                    json_object* p = json_object_new_object();
                    json_object_object_add(p, "stage", json_object_new_string("run"));
                    json_object_object_add(p, "error", json_new_string(o.infra_error));
                    json_object_object_add(p, "exit_code", json_object_new_int(o.exit_code));
                    json_object_object_add(p, "signal", json_object_new_int(o.term_signal));
                    audit_.event(id, "infra.error", p);
                }
            }
            ExecutionResult r = aggregate_run(id, o, job->cfg);
            audit_result(id, "run.finished", r);
            fulfil(job, std::move(r));
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            admitted_--;
        }
        job.reset();
    }
}

bool SandboxService::cancel(const std::string& submission_id) {
    JobPtr job;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = active_.find(submission_id);
        if (it == active_.end()) return false;
        job = it->second;
    }
    if (job->fulfilled.load()) return false;

    job->cancel = true;
    const bool was_queued = queue_.remove_if([&](const JobPtr& j) { return j == job; });
    if (was_queued) {
        std::lock_guard<std::mutex> lk(mu_);
        admitted_--;
    }
    if (job->fulfilled.load()) return false;
    fulfil(job, cancelled_result(submission_id, since(job->accepted_at)));

    if (audit_.enabled()) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "while", json_object_new_string(was_queued ? "queued" : "executing"));
        audit_.event(submission_id, "submission.cancelled", p);
    }
    return true;
}

std::optional<SubmissionState> SandboxService::state(const std::string& submission_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(submission_id);
    if (it == active_.end()) return std::nullopt;
    return it->second->state.load();
}

void SandboxService::shutdown() {
    std::vector<JobPtr> pending;
    std::vector<JobPtr> inflight;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
        for (auto& kv : active_) inflight.push_back(kv.second);
    }
    queue_.shutdown();
    pending = queue_.drain();
    {
        std::lock_guard<std::mutex> lk(mu_);
        admitted_ -= std::min(admitted_, pending.size());
    }
    for (auto& job : inflight) {
        job->cancel = true;
        fulfil(job, cancelled_result(job->sub.submission_id, since(job->accepted_at)));
    }
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

} // namespace pitchbox
