#pragma once
#include "dataset.h"
#include "types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace pitchbox {

// Compute-only seccomp profile applied by the run unit after reading its
// request. BestEffort carries on (with a stderr note) where seccomp is
// unavailable; Required refuses to run.
enum class LockdownMode {
    Off,
    BestEffort,
    Required,
};

const char* lockdown_mode_to_str(LockdownMode m);
std::optional<LockdownMode> lockdown_mode_from_str(const std::string& s);

// Request sent to pitchbox_runhost on stdin. Everything the run unit needs
// travels in it; the child inherits no other state from the service.
struct RunRequest {
    std::string submission_id;
    std::string source;
    Dataset dataset;
    std::set<Capability> capabilities;
    std::set<std::string> bindings;
    std::map<std::string, std::string> modules;  // importable module -> binding
    uint64_t memory_limit_bytes{256ULL * 1024 * 1024};
    uint64_t max_print_bytes{1ULL << 20};
    int max_call_depth{100};
    LockdownMode lockdown{LockdownMode::BestEffort};
};

std::string encode_request(const RunRequest& r);
bool decode_request(const std::string& text, RunRequest* out, std::string* err);

} // namespace pitchbox
