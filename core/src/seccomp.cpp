#include "pitchbox/seccomp.h"

const char* pitchbox::seccomp_profile_name(SeccompProfile p) {
    return p == SeccompProfile::Launch ? "launch" : "compute-only";
}

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define PITCHBOX_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define PITCHBOX_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define PITCHBOX_AUDIT_ARCH 0
#endif

namespace pitchbox {

namespace {

sock_filter stmt(unsigned short code, unsigned int k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter jump(unsigned short code, unsigned int k, unsigned char jt, unsigned char jf) {
    return sock_filter{code, jt, jf, k};
}

// Syscalls shared by both profiles: memory, signals needed by abort(),
// time, and I/O on descriptors that are already open.
std::vector<unsigned int> compute_syscalls() {
    return {
        SYS_read, SYS_write, SYS_readv, SYS_writev, SYS_close, SYS_fstat, SYS_lseek,
        SYS_mmap, SYS_munmap, SYS_mprotect, SYS_mremap, SYS_madvise, SYS_brk,
        SYS_rt_sigreturn, SYS_rt_sigaction, SYS_rt_sigprocmask,
        SYS_futex, SYS_clock_gettime, SYS_gettid, SYS_getpid, SYS_tgkill,
        SYS_exit, SYS_exit_group,
#ifdef SYS_newfstatat
        SYS_newfstatat,
#endif
    };
}

std::vector<unsigned int> launch_syscalls() {
    std::vector<unsigned int> out = compute_syscalls();
    const unsigned int extra[] = {
        SYS_execve, SYS_openat, SYS_pread64, SYS_faccessat, SYS_readlinkat, SYS_getcwd,
        SYS_uname, SYS_fcntl, SYS_dup, SYS_dup3, SYS_ioctl, SYS_ppoll, SYS_sigaltstack,
        SYS_set_tid_address, SYS_set_robust_list, SYS_prlimit64, SYS_getrandom,
        SYS_getuid, SYS_geteuid, SYS_getgid, SYS_getegid, SYS_sched_getaffinity, SYS_sched_yield,
        SYS_nanosleep, SYS_clock_nanosleep, SYS_prctl, SYS_seccomp,
#ifdef SYS_statx
        SYS_statx,
#endif
#ifdef SYS_rseq
        SYS_rseq,
#endif
#ifdef SYS_faccessat2
        SYS_faccessat2,
#endif
#if defined(__x86_64__)
        SYS_open, SYS_stat, SYS_lstat, SYS_access, SYS_readlink, SYS_arch_prctl, SYS_dup2,
        SYS_poll, SYS_getrlimit,
#endif
    };
    out.insert(out.end(), std::begin(extra), std::end(extra));
    return out;
}

} // namespace

SeccompProgram build_seccomp_program(SeccompProfile profile) {
    SeccompProgram out;
#if PITCHBOX_AUDIT_ARCH == 0
    (void)profile;
    out.error = "seccomp: unsupported architecture";
    return out;
#else
    const std::vector<unsigned int> allowlist =
        profile == SeccompProfile::Launch ? launch_syscalls() : compute_syscalls();
    const size_t n = allowlist.size();
    if (n + 5 > 255) {
        out.error = "seccomp: allowlist too long for 8-bit jumps";
        return out;
    }

    // [0]        load arch
    // [1]        arch matches -> skip kill
    // [2]        kill
    // [3]        load syscall nr
    // [4..4+n)   nr == allowed[s] -> ALLOW (or MPROTECT_CHECK for mprotect)
    // [4+n]      kill (default deny)
    // [4+n+1]    MPROTECT_CHECK: load prot argument
    // [4+n+2]    PROT_EXEC set -> kill
    // [4+n+3]    allow
    // [4+n+4]    kill
    // [4+n+5]    ALLOW
    std::vector<sock_filter>& prog = out.filter;
    prog.reserve(n + 10);
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, PITCHBOX_AUDIT_ARCH, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
    for (size_t s = 0; s < n; s++) {
        const bool is_mprotect = allowlist[s] == (unsigned int)SYS_mprotect;
        const unsigned char jt = (unsigned char)(is_mprotect ? n - s : n + 4 - s);
        prog.push_back(jump(BPF_JMP | BPF_JEQ | BPF_K, allowlist[s], jt, 0));
    }
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    prog.push_back(jump(BPF_JMP | BPF_JSET | BPF_K, 0x4 /* PROT_EXEC */, 1, 0));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    return out;
#endif
}

const char* install_seccomp_program(const SeccompProgram& prog) {
    if (!prog.error.empty() || prog.filter.empty()) return "seccomp: no compiled program";
    struct sock_fprog fprog = {};
    fprog.len = (unsigned short)prog.filter.size();
    fprog.filter = const_cast<sock_filter*>(prog.filter.data());
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog, 0, 0) != 0) return "seccomp install failed";
    return nullptr;
}

std::string install_seccomp_filter(SeccompProfile profile) {
    SeccompProgram prog = build_seccomp_program(profile);
    if (!prog.error.empty()) return prog.error;
    if (install_seccomp_program(prog)) return std::string("seccomp install failed: ") + std::strerror(errno);
    return "";
}

bool seccomp_available() {
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace pitchbox

#else // !__linux__

namespace pitchbox {

SeccompProgram build_seccomp_program(SeccompProfile) {
    return SeccompProgram{};
}

const char* install_seccomp_program(const SeccompProgram&) {
    return nullptr;
}

std::string install_seccomp_filter(SeccompProfile) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace pitchbox

#endif
