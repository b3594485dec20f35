#include "pitchbox/proc.h"
#include "pitchbox/seccomp.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #include <poll.h>
  #ifdef __linux__
    #include <sys/prctl.h>
    #include <sys/syscall.h>
  #endif
#endif

namespace pitchbox {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string resolve_executable(const std::string& name) {
#ifdef _WIN32
    return name;
#else
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) return name;
    const char* path = std::getenv("PATH");
    std::string p = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= p.size()) {
        size_t colon = p.find(':', start);
        if (colon == std::string::npos) colon = p.size();
        std::string dir = p.substr(start, colon - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (access(cand.c_str(), X_OK) == 0) return cand;
        start = colon + 1;
    }
    return "";
#endif
}

#ifndef _WIN32
namespace {

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

void set_rlimit(int resource, rlim_t v) {
    set_rlimit(resource, v, v);
}

void child_fail(const char* what) {
    // async-signal-safe path to the stderr pipe
    const char* prefix = "[proc] ";
    (void)!write(STDERR_FILENO, prefix, std::strlen(prefix));
    (void)!write(STDERR_FILENO, what, std::strlen(what));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(126);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

} // namespace
#endif

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res,
                                      const std::atomic<bool>* cancel) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    (void)argv; (void)cwd; (void)stdin_data; (void)lim; (void)cancel;
    res->error = "proc_run_capture_sandboxed_stdin: not supported on Windows";
    return false;
#else
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    std::vector<std::string> eff_argv;
    eff_argv.reserve(lim.wrapper.size() + argv.size());
    eff_argv.insert(eff_argv.end(), lim.wrapper.begin(), lim.wrapper.end());
    eff_argv.insert(eff_argv.end(), argv.begin(), argv.end());

    // The child has no PATH, so the executable is resolved here.
    const std::string exe = resolve_executable(eff_argv[0]);
    if (exe.empty()) {
        res->error = "executable not found: " + eff_argv[0];
        return false;
    }

    // Everything the child touches after fork is prepared up front.
    SeccompProgram launch_filter;
    if (lim.enable_seccomp) {
        launch_filter = build_seccomp_program(SeccompProfile::Launch);
        if (!launch_filter.error.empty()) {
            res->error = launch_filter.error;
            return false;
        }
    }
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    char* empty_env[] = {nullptr};

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(in_pipe) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        return false;
    }
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(in_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        (void)setpgid(0, 0);
        (void)umask(077);

        bool closed_all = false;
#ifdef SYS_close_range
        closed_all = syscall(SYS_close_range, 3U, ~0U, 0U) == 0;
#endif
        if (!closed_all) {
            long maxfd = sysconf(_SC_OPEN_MAX);
            if (maxfd < 256) maxfd = 256;
            for (int fd = 3; fd < maxfd; fd++) {
                (void)close(fd);
            }
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) child_fail("chdir failed");

#ifdef __linux__
        if (lim.no_new_privs && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail("no_new_privs failed");
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
        // the parent may already be gone
        if (getppid() == 1) _exit(125);
#endif

        // SIGXCPU at the soft limit, SIGKILL one second later
        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec + 1);
        if (lim.rlimit_as_bytes > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_bytes);
        set_rlimit(RLIMIT_FSIZE, 0);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif
#ifdef RLIMIT_CORE
        set_rlimit(RLIMIT_CORE, 0);
#endif

        if (lim.enable_seccomp) {
            if (const char* e = install_seccomp_program(launch_filter)) child_fail(e);
        }

        execve(exe.c_str(), cargv.data(), empty_env);
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(in_pipe[0]);

    // Interleaved stdin write + stdout/stderr read using poll() so a large
    // request cannot deadlock against a child that is already writing.
    int in_fd = in_pipe[1];
    if (!stdin_data.empty()) {
        set_nonblocking(in_fd);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    std::string out;
    std::string err;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto append_stdout = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, buf + take);
    };
    auto append_stderr = [&](const char* buf, ssize_t n) {
        err.append(buf, buf + n);
        if (err.size() > lim.stderr_max_bytes) err.erase(0, err.size() - lim.stderr_max_bytes);
    };
    auto drain = [&](int fd, bool is_err) {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                if (is_err) append_stderr(buf, n);
                else append_stdout(buf, n);
                continue;
            }
            if (n == -1 && errno == EINTR) continue;
            break;
        }
    };
    auto kill_group = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    };

    bool child_exited = false;
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        const int out_idx = (int)nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;
        const int err_idx = (int)nfds;
        fds[nfds].fd = err_pipe[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;

        if (cancel && cancel->load()) {
            res->cancelled = true;
            kill_group();
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                kill_group();
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            if (remaining < slice) slice = remaining;
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                // EPIPE: the child stopped reading; its exit status tells the rest
                write_off = stdin_data.size();
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain(out_pipe[0], false);
        if (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain(err_pipe[0], true);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);

    // Leftover members of the group (wrapper helpers) go with the child.
    (void)kill(-pid, SIGKILL);

    drain(out_pipe[0], false);
    drain(err_pipe[0], true);
    close(out_pipe[0]);
    close(err_pipe[0]);

    res->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    res->output = std::move(out);
    res->errout = std::move(err);
    if (child_exited) {
        if (WIFEXITED(status)) {
            res->exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            res->term_signal = WTERMSIG(status);
            res->exit_code = 128 + res->term_signal;
        } else {
            res->exit_code = 127;
        }
    } else {
        res->exit_code = 127;
        res->error = "child did not exit";
    }
    return true;
#endif
}

} // namespace pitchbox
