#include "test_common.h"

#include "pitchbox/proc.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

using pitchbox::ProcLimits;
using pitchbox::ProcResult;
using pitchbox::proc_run_capture_sandboxed_stdin;

int main() {
    // Test 1: stdin is delivered and stdout captured
    {
        ProcLimits lim;
        lim.timeout_ms = 5000;
        ProcResult r;
        const std::string input(200000, 'x');  // larger than a pipe buffer
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/cat"}, "", input, lim, &r), "cat starts: " + r.error);
        expect_eq_ll(r.exit_code, 0, "cat exit code");
        expect_true(r.output == input, "cat echoes stdin");
        expect_true(!r.timed_out && !r.cancelled && !r.output_truncated, "clean run");
    }

    // Test 2: exit code and separate stderr
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, "", "", lim, &r),
                    "sh starts");
        expect_eq_ll(r.exit_code, 3, "exit code propagated");
        expect_true(r.output == "out\n", "stdout only: " + r.output);
        expect_true(r.errout == "err\n", "stderr separate: " + r.errout);
    }

    // Test 3: the child runs with an empty environment
    {
        setenv("PITCHBOX_SECRET_FOR_TEST", "leak", 1);
        ProcLimits lim;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/sh", "-c", "echo \"[$PITCHBOX_SECRET_FOR_TEST]\""}, "", "",
                                                     lim, &r),
                    "sh starts");
        expect_true(r.output == "[]\n", "environment not inherited: " + r.output);
        unsetenv("PITCHBOX_SECRET_FOR_TEST");
    }

    // Test 4: wall-clock deadline kills the child
    {
        ProcLimits lim;
        lim.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/sleep", "30"}, "", "", lim, &r), "sleep starts");
        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        expect_true(r.timed_out, "timed out");
        expect_eq_ll(r.term_signal, SIGKILL, "killed");
        expect_true(took.count() < 5000, "returned promptly");
    }

    // Test 5: cancellation flag kills the child
    {
        ProcLimits lim;
        lim.timeout_ms = 30000;
        ProcResult r;
        std::atomic<bool> cancel{false};
        std::thread t([&cancel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            cancel.store(true);
        });
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/sleep", "30"}, "", "", lim, &r, &cancel), "sleep starts");
        t.join();
        expect_true(r.cancelled && !r.timed_out, "cancelled");
        expect_true(r.elapsed.count() < 5000, "cancel observed promptly");
    }

    // Test 6: stdout cap
    {
        ProcLimits lim;
        lim.stdout_max_bytes = 1000;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed_stdin(
                        {"/bin/sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done"}, "", "",
                        lim, &r),
                    "sh starts");
        expect_true(r.output_truncated, "truncation flagged");
        expect_eq_ll((long long)r.output.size(), 1000, "output capped");
    }

    // Test 7: files cannot grow (RLIMIT_FSIZE 0)
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed_stdin({"/bin/sh", "-c", "echo data > /tmp/pitchbox_fsize_out_$$"}, "/tmp",
                                                     "", lim, &r),
                    "sh starts");
        expect_true(r.exit_code != 0, "write past RLIMIT_FSIZE fails");
    }

    // Test 8: missing executable is reported, not run
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(!proc_run_capture_sandboxed_stdin({"pitchbox-no-such-binary"}, "", "", lim, &r), "not started");
        expect_true(!r.error.empty(), "error set");
    }

    // Test 9: argv splitting and PATH lookup
    {
        auto v = pitchbox::split_argv_quoted("bwrap --bind \"/a b\" '/c' \"q\\\"t\"");
        expect_eq_ll((long long)v.size(), 5, "token count");
        expect_true(v[2] == "/a b" && v[3] == "/c" && v[4] == "q\"t", "quoted tokens");
        expect_true(pitchbox::split_argv_quoted("\"unterminated").empty(), "parse error");
        expect_true(pitchbox::resolve_executable("/bin/sh") == "/bin/sh", "absolute path unchanged");
        expect_true(!pitchbox::resolve_executable("sh").empty(), "sh found on PATH");
        expect_true(pitchbox::resolve_executable("pitchbox-no-such-binary").empty(), "missing binary");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
