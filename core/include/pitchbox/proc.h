#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pitchbox {

struct ProcLimits {
    int timeout_ms{30000};                 // wall clock; 0 = none
    size_t stdout_max_bytes{64u << 20};
    size_t stderr_max_bytes{16 * 1024};    // only the tail is kept

    int rlimit_cpu_sec{0};                 // CPU time seconds, 0 = unlimited
    uint64_t rlimit_as_bytes{0};           // virtual memory, 0 = unlimited
    int rlimit_nofile{16};                 // max open fds
    int rlimit_nproc{16};                  // max processes (best-effort)
    // RLIMIT_FSIZE is always 0: the child may not grow any file.

    bool no_new_privs{true};

    // Launch seccomp profile, installed between fork and exec (Linux only,
    // requires no_new_privs). A failed install aborts the launch.
    bool enable_seccomp{false};

    // Operator wrapper (nsjail, bwrap, ...) prepended to argv.
    std::vector<std::string> wrapper;
};

struct ProcResult {
    int exit_code{127};
    int term_signal{0};          // signal that ended the child, 0 if it exited
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string output;          // child stdout
    std::string errout;          // tail of child stderr
    std::string error;           // internal runner error, not child stderr
    std::chrono::milliseconds elapsed{0};
};

// Run a process and provide stdin data. The child gets a new process group,
// an empty environment, no inherited fds beyond 0-2 and the rlimits above.
// stdout and stderr are captured separately. When the deadline passes or
// *cancel becomes true, the whole process group is SIGKILLed; the flag is
// polled every 50 ms. Returns true if the process started.
bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res,
                                      const std::atomic<bool>* cancel = nullptr);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// PATH lookup done in the parent, since the child runs without an environment.
// Names containing '/' are returned unchanged; empty result when not found.
std::string resolve_executable(const std::string& name);

} // namespace pitchbox
