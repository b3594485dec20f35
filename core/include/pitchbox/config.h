#pragma once
#include "policy.h"
#include "protocol.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pitchbox {

enum class Profile { DEV, PROD };

// Detect profile from PITCHBOX_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no launch seccomp, best-effort lockdown, generous limits)
// PROD: strict (launch seccomp, required lockdown, tight timeout and memory)
void apply_profile_defaults(Profile p);

// What the service does with a submission when every worker is busy.
enum class Admission { Queue, Reject };

const char* admission_to_str(Admission a);
std::optional<Admission> admission_from_str(const std::string& s);

// How the executor launches and supervises pitchbox_runhost.
struct ExecutorConfig {
    std::string runhost_bin;              // empty = next to the current executable, then PATH
    bool enable_seccomp{false};           // launch profile between fork and exec
    LockdownMode lockdown{LockdownMode::BestEffort};
    std::vector<std::string> wrapper;     // nsjail/bwrap argv prefix
    uint64_t runtime_headroom_bytes{512ULL * 1024 * 1024};  // RLIMIT_AS above the script budget
    int max_call_depth{100};
    size_t max_print_bytes{1 << 20};
    size_t max_artifact_bytes{8u << 20};
    size_t max_artifacts{32};
};

constexpr size_t kMaxConcurrent = 256;
constexpr size_t kMaxQueueLimit = 1u << 20;

struct ServiceConfig {
    size_t max_concurrent{4};
    size_t queue_limit{64};               // submissions waiting beyond the running ones
    Admission admission{Admission::Queue};
    ExecutorConfig executor;
    std::string audit_log_path;           // empty = audit log disabled
};

bool env_true(const char* key);

// PITCHBOX_TIMEOUT_SEC, PITCHBOX_MEMORY_LIMIT_MB, PITCHBOX_ALLOWED_BINDINGS.
// Unset or malformed values keep the defaults.
SandboxConfig sandbox_config_from_env();

// PITCHBOX_MAX_CONCURRENT, PITCHBOX_QUEUE_LIMIT, PITCHBOX_ADMISSION,
// PITCHBOX_RUNHOST_BIN, PITCHBOX_SECCOMP_ENABLE, PITCHBOX_LOCKDOWN,
// PITCHBOX_PROC_WRAPPER[_ENABLE], PITCHBOX_AUDIT_LOG.
ServiceConfig service_config_from_env();

// default_policy(), merged with PITCHBOX_POLICY_FILE when it is set.
bool policy_from_env(DenylistPolicy* out, std::string* err);

// Directory of the running executable, or empty when unknown.
std::string self_exe_dir();

} // namespace pitchbox
