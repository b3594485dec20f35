#include "test_common.h"
#include "pitchbox/seccomp.h"

#ifdef __linux__
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

#ifdef __linux__
// Runs body in a forked child after installing the profile; returns the wait status.
template <typename Body>
static int run_confined(pitchbox::SeccompProfile profile, Body body) {
    pid_t pid = fork();
    if (pid == 0) {
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        std::string err = pitchbox::install_seccomp_filter(profile);
        if (!err.empty()) _exit(1);
        _exit(body());
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return status;
}
#endif

int main() {
    // Test 1: profile names
    expect_true(std::string(pitchbox::seccomp_profile_name(pitchbox::SeccompProfile::Launch)) == "launch", "launch name");
    expect_true(std::string(pitchbox::seccomp_profile_name(pitchbox::SeccompProfile::ComputeOnly)) == "compute-only",
                "compute name");

#ifndef __linux__
    std::string err = pitchbox::install_seccomp_filter(pitchbox::SeccompProfile::ComputeOnly);
    expect_true(err.empty(), "install_seccomp_filter should no-op on non-Linux");
    expect_true(!pitchbox::seccomp_available(), "seccomp should not be available on non-Linux");
#else
    if (!pitchbox::seccomp_available()) return skip_all("test_seccomp", "seccomp unavailable");

    // Test 2: compute profile still allows I/O on open fds and heap growth
    int st = run_confined(pitchbox::SeccompProfile::ComputeOnly, [] {
        const char* msg = "seccomp_ok\n";
        ssize_t n = write(STDOUT_FILENO, msg, 11);
        void* p = mmap(nullptr, 1 << 20, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) return 3;
        munmap(p, 1 << 20);
        return n > 0 ? 0 : 2;
    });
    expect_true(WIFEXITED(st) && WEXITSTATUS(st) == 0, "compute profile allows write/mmap");

    // Test 3: compute profile kills on socket()
    st = run_confined(pitchbox::SeccompProfile::ComputeOnly, [] {
        int s = socket(AF_INET, SOCK_STREAM, 0);
        return s >= 0 ? 0 : 4;
    });
    expect_true(WIFSIGNALED(st) && WTERMSIG(st) == SIGSYS, "socket() is fatal under the compute profile");

    // Test 4: compute profile kills on open
    st = run_confined(pitchbox::SeccompProfile::ComputeOnly, [] {
        int fd = open("/etc/hostname", O_RDONLY);
        return fd >= 0 ? 0 : 4;
    });
    expect_true(WIFSIGNALED(st) && WTERMSIG(st) == SIGSYS, "open() is fatal under the compute profile");

    // Test 5: executable mappings are refused
    st = run_confined(pitchbox::SeccompProfile::ComputeOnly, [] {
        void* p = mmap(nullptr, 4096, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) return 3;
        return mprotect(p, 4096, PROT_READ | PROT_EXEC) == 0 ? 0 : 4;
    });
    expect_true(WIFSIGNALED(st) && WTERMSIG(st) == SIGSYS, "mprotect(PROT_EXEC) is fatal");

    // Test 6: launch profile still allows open, but not fork
    st = run_confined(pitchbox::SeccompProfile::Launch, [] {
        int fd = open("/dev/null", O_RDONLY);
        if (fd < 0) return 5;
        close(fd);
        return 0;
    });
    expect_true(WIFEXITED(st) && WEXITSTATUS(st) == 0, "launch profile allows open");
    st = run_confined(pitchbox::SeccompProfile::Launch, [] {
        pid_t p = fork();
        if (p == 0) _exit(0);
        return 0;
    });
    expect_true(WIFSIGNALED(st) && WTERMSIG(st) == SIGSYS, "fork is fatal under the launch profile");

    // Test 7: a program compiled before fork installs in the child as is
    pitchbox::SeccompProgram prog = pitchbox::build_seccomp_program(pitchbox::SeccompProfile::Launch);
    expect_true(prog.error.empty() && !prog.filter.empty(), "launch program compiles: " + prog.error);
    pid_t pid = fork();
    if (pid == 0) {
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        if (pitchbox::install_seccomp_program(prog)) _exit(1);
        int s = socket(AF_INET, SOCK_STREAM, 0);
        _exit(s >= 0 ? 0 : 4);
    }
    st = 0;
    waitpid(pid, &st, 0);
    expect_true(WIFSIGNALED(st) && WTERMSIG(st) == SIGSYS, "prebuilt launch program is enforced in the child");

    pitchbox::SeccompProgram none;
    none.error = "not compiled";
    expect_true(pitchbox::install_seccomp_program(none) != nullptr, "uncompiled program is refused");
#endif

    std::cerr << "test_seccomp: ALL PASSED" << std::endl;
    return 0;
}
