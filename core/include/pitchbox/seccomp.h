#pragma once

// seccomp-BPF syscall allowlists for the run unit.
//
// Allowlist-only: a syscall not on the active list kills the process.
// mprotect is allowed only without PROT_EXEC. Both profiles require
// PR_SET_NO_NEW_PRIVS to be set first. x86_64 and aarch64 are supported.

#include <string>
#include <vector>

#ifdef __linux__
#include <linux/filter.h>
#endif

namespace pitchbox {

enum class SeccompProfile {
    // Installed between fork and exec: enough for the dynamic loader and
    // process start-up, but no sockets, no fork/clone, no filesystem writes.
    Launch,
    // Installed by pitchbox_runhost once its request is read: memory
    // management and I/O on already-open descriptors, nothing else.
    // No open, exec, fork or socket.
    ComputeOnly,
};

const char* seccomp_profile_name(SeccompProfile p);

// A compiled filter. Build it before fork(): installing it afterwards
// allocates nothing, so a child of a multi-threaded parent may do it.
struct SeccompProgram {
#ifdef __linux__
    std::vector<sock_filter> filter;
#endif
    std::string error;  // set when the profile cannot be compiled here
};

SeccompProgram build_seccomp_program(SeccompProfile profile);

// nullptr on success, otherwise a static message. Only calls prctl().
const char* install_seccomp_program(const SeccompProgram& prog);

// Build + install in one step. Returns empty string on success, error
// message on failure. On non-Linux platforms returns success without doing anything.
std::string install_seccomp_filter(SeccompProfile profile);

bool seccomp_available();

} // namespace pitchbox
