#pragma once
#include "dataset.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pitchbox {

// What a submission asks to be able to do inside the sandbox.
enum class Capability {
    DatasetRead,
    Plot,
    TextOutput,
    Numeric,
};

enum class ExecutionStatus {
    Success,
    SafetyRejected,
    Timeout,
    ResourceExceeded,
    RuntimeError,
    Cancelled,
};

// Error taxonomy carried next to the status.
enum class ErrorKind {
    None,
    SafetyViolation,
    TimeoutError,
    ResourceLimitError,
    RuntimeExecutionError,
    InternalInfrastructureError,
    CapacityExceeded,
    Cancelled,
};

// Per-submission lifecycle.
enum class SubmissionState {
    Received,
    Analyzing,
    Rejected,
    Accepted,
    Executing,
    Succeeded,
    TimedOut,
    ResourceExceeded,
    RuntimeFailed,
    Cancelled,
};

enum class ArtifactKind {
    Figure,
    TextOutput,
};

struct SourceLocation {
    int line{0};   // 1-based, 0 = whole text
    int column{0}; // 1-based, 0 = unknown
    std::string toString() const; // "3:7"
};

struct Violation {
    std::string pattern_id; // e.g. "AST.BANNED_NAME"
    SourceLocation location;
    std::string message;
};

struct SafetyVerdict {
    bool allowed{false};
    std::string policy_version;
    std::vector<Violation> violations;
};

// Candidate code plus the dataset it may use. Consumed by one submit().
struct CodeSubmission {
    std::string submission_id;  // empty: the service assigns one
    std::string source_text;
    DatasetHandle allowed_dataset_handle;
    std::set<Capability> requested_capabilities;
};

struct SandboxConfig {
    double timeout_seconds{30.0};
    uint64_t memory_limit_bytes{256ULL * 1024 * 1024};
    std::set<std::string> allowed_bindings;
};

// Largest limits one run may ask for; bigger requests are clamped.
constexpr double kMaxTimeoutSeconds = 24 * 3600.0;
constexpr uint64_t kMaxMemoryLimitBytes = 1ULL << 40;

struct Artifact {
    ArtifactKind kind{ArtifactKind::TextOutput};
    std::string media_type; // "image/svg+xml" | "text/plain"
    std::string payload;    // opaque serialized blob
    std::string digest;     // sha256 hex of payload
};

struct ExecutionResult {
    std::string submission_id;
    ExecutionStatus status{ExecutionStatus::RuntimeError};
    ErrorKind error_kind{ErrorKind::InternalInfrastructureError};
    std::vector<Artifact> artifacts;
    std::vector<std::string> diagnostics;
    std::chrono::milliseconds elapsed{0};
};

const char* capability_to_str(Capability c);
std::optional<Capability> capability_from_str(const std::string& s);

const char* status_to_str(ExecutionStatus s);
const char* error_kind_to_str(ErrorKind k);
const char* state_to_str(SubmissionState s);
const char* artifact_kind_to_str(ArtifactKind k);
std::optional<ArtifactKind> artifact_kind_from_str(const std::string& s);

// True for the rightmost states of the lifecycle.
bool is_terminal(SubmissionState s);

} // namespace pitchbox
