#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace pitchbox {

// Append-only, hash-chained JSONL event log for operators.
//
// Each line is canonical JSON (sorted keys) with
//   chain_hash = SHA256(chain_prev || canonical record without chain fields).
// Reopening an existing file continues its chain. Records events only; no
// submission source or result payload is written.
class AuditLog {
public:
    // Empty path: disabled, event() does nothing.
    AuditLog(const std::string& path, const std::string& profile);

    bool enabled() const { return !path_.empty(); }
    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }
    const std::string& path() const { return path_; }

    // Takes ownership of payload (may be null). Thread-safe.
    void event(const std::string& submission_id, const std::string& name, json_object* payload);

    uint64_t seq() const;

private:
    std::string path_;
    std::string profile_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
    std::string error_;
    mutable std::mutex mu_;
};

// Recursively serialize JSON with sorted keys (RFC 8785 JCS subset).
std::string canonical_json(json_object* obj);

// Re-reads a log and checks every link of the chain.
bool audit_log_verify(const std::string& path, size_t* lines, std::string* err);

} // namespace pitchbox
