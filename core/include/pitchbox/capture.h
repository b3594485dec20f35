#pragma once
#include "sandbox_env.h"
#include "types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pitchbox {

// How a run ended, as seen from inside the run unit.
enum class RunOutcome {
    Completed,
    ScriptFailed,     // ScriptError or syntax error
    MemoryExceeded,   // allocation budget exhausted
    BadRequest,       // the request itself was unusable
};

const char* run_outcome_to_str(RunOutcome o);

// Response written by pitchbox_runhost on stdout.
struct RunReport {
    RunOutcome outcome{RunOutcome::BadRequest};
    std::string error_type;     // "ZeroDivisionError", ...
    std::string error_message;
    int error_line{0};
    std::vector<Artifact> artifacts;  // digest filled in by decode_report()
    bool printed_truncated{false};
    uint64_t budget_used{0};
};

struct CaptureLimits {
    size_t max_artifact_bytes{8u << 20};
    size_t max_artifacts{32};
};

constexpr const char* kSvgMediaType = "image/svg+xml";
constexpr const char* kTextMediaType = "text/plain; charset=utf-8";

// Child side: every open figure as SVG, in creation order, then the printed
// text (when there is any). No live object leaves the run unit.
std::vector<Artifact> capture_artifacts(const ScopeOutputs& outputs);

std::string encode_report(const RunReport& r);

// Parent side: decodes the response, refuses unknown kinds, media types and
// oversized payloads, and computes each artifact's SHA-256 digest.
bool decode_report(const std::string& text, const CaptureLimits& limits, RunReport* out, std::string* err);

// Lines of the text artifacts, for the diagnostics of the result.
std::vector<std::string> printed_lines(const std::vector<Artifact>& artifacts);

} // namespace pitchbox
