#include "pitchbox/types.h"
#include <sstream>

namespace pitchbox {

std::string SourceLocation::toString() const {
    std::ostringstream oss;
    oss << line << ":" << column;
    return oss.str();
}

const char* capability_to_str(Capability c) {
    switch (c) {
        case Capability::DatasetRead: return "dataset_read";
        case Capability::Plot:        return "plot";
        case Capability::TextOutput:  return "text_output";
        case Capability::Numeric:     return "numeric";
    }
    return "dataset_read";
}

std::optional<Capability> capability_from_str(const std::string& s) {
    if (s == "dataset_read") return Capability::DatasetRead;
    if (s == "plot") return Capability::Plot;
    if (s == "text_output") return Capability::TextOutput;
    if (s == "numeric") return Capability::Numeric;
    return std::nullopt;
}

const char* status_to_str(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::Success:          return "Success";
        case ExecutionStatus::SafetyRejected:   return "SafetyRejected";
        case ExecutionStatus::Timeout:          return "Timeout";
        case ExecutionStatus::ResourceExceeded: return "ResourceExceeded";
        case ExecutionStatus::RuntimeError:     return "RuntimeError";
        case ExecutionStatus::Cancelled:        return "Cancelled";
    }
    return "RuntimeError";
}

const char* error_kind_to_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                        return "None";
        case ErrorKind::SafetyViolation:             return "SafetyViolation";
        case ErrorKind::TimeoutError:                return "TimeoutError";
        case ErrorKind::ResourceLimitError:          return "ResourceLimitError";
        case ErrorKind::RuntimeExecutionError:       return "RuntimeExecutionError";
        case ErrorKind::InternalInfrastructureError: return "InternalInfrastructureError";
        case ErrorKind::CapacityExceeded:            return "CapacityExceeded";
        case ErrorKind::Cancelled:                   return "Cancelled";
    }
    return "InternalInfrastructureError";
}

const char* state_to_str(SubmissionState s) {
    switch (s) {
        case SubmissionState::Received:         return "received";
        case SubmissionState::Analyzing:        return "analyzing";
        case SubmissionState::Rejected:         return "rejected";
        case SubmissionState::Accepted:         return "accepted";
        case SubmissionState::Executing:        return "executing";
        case SubmissionState::Succeeded:        return "succeeded";
        case SubmissionState::TimedOut:         return "timed_out";
        case SubmissionState::ResourceExceeded: return "resource_exceeded";
        case SubmissionState::RuntimeFailed:    return "runtime_failed";
        case SubmissionState::Cancelled:        return "cancelled";
    }
    return "received";
}

const char* artifact_kind_to_str(ArtifactKind k) {
    switch (k) {
        case ArtifactKind::Figure:     return "figure";
        case ArtifactKind::TextOutput: return "text";
    }
    return "text";
}

std::optional<ArtifactKind> artifact_kind_from_str(const std::string& s) {
    if (s == "figure") return ArtifactKind::Figure;
    if (s == "text") return ArtifactKind::TextOutput;
    return std::nullopt;
}

bool is_terminal(SubmissionState s) {
    switch (s) {
        case SubmissionState::Rejected:
        case SubmissionState::Succeeded:
        case SubmissionState::TimedOut:
        case SubmissionState::ResourceExceeded:
        case SubmissionState::RuntimeFailed:
        case SubmissionState::Cancelled:
            return true;
        default:
            return false;
    }
}

} // namespace pitchbox
