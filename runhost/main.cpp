#include "pitchbox/capture.h"
#include "pitchbox/interp.h"
#include "pitchbox/parser.h"
#include "pitchbox/protocol.h"
#include "pitchbox/sandbox_env.h"
#include "pitchbox/seccomp.h"

#include <iostream>
#include <memory>
#include <new>
#include <string>

#ifdef __linux__
  #include <sys/prctl.h>
#endif

using namespace pitchbox;

// Exit codes other than 0 mean no report was written; the parent treats
// them as an infrastructure failure.
static constexpr int kExitUsage = 2;
static constexpr int kExitLockdown = 3;
static constexpr int kExitWrite = 4;

static constexpr size_t MAX_STDIN_BYTES = 256ULL * 1024 * 1024;

static bool slurp_stdin(std::string* out) {
    out->reserve(64 * 1024);
    char buf[8192];
    while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
        out->append(buf, (size_t)std::cin.gcount());
        if (out->size() > MAX_STDIN_BYTES) return false;
    }
    return true;
}

static int emit(const RunReport& r) {
    std::cout << encode_report(r);
    std::cout.flush();
    return std::cout.good() ? 0 : kExitWrite;
}

static int bad_request(const std::string& msg) {
    RunReport r;
    r.outcome = RunOutcome::BadRequest;
    r.error_type = "BadRequest";
    r.error_message = msg;
    return emit(r);
}

static std::string lockdown() {
#ifdef __linux__
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return "no_new_privs failed";
#endif
    return install_seccomp_filter(SeccompProfile::ComputeOnly);
}

static void run_script(const RunRequest& req, const script::Module& module, RunReport* rep) {
    script::InterpLimits limits;
    limits.memory_limit_bytes = req.memory_limit_bytes;
    limits.max_call_depth = req.max_call_depth;
    script::Interpreter in(limits);

    ScopeRequest sr;
    sr.dataset = std::make_shared<const Dataset>(req.dataset);
    sr.capabilities = req.capabilities;
    sr.allowed_bindings = req.bindings;
    sr.modules = req.modules;
    sr.max_print_bytes = (size_t)req.max_print_bytes;
    auto outputs = std::make_shared<ScopeOutputs>();

    try {
        build_sandbox_scope(in, sr, outputs);
        in.run(module);
        rep->outcome = RunOutcome::Completed;
    } catch (const script::ResourceLimitError& e) {
        rep->outcome = RunOutcome::MemoryExceeded;
        rep->error_type = "MemoryError";
        rep->error_message = e.what();
    } catch (const std::bad_alloc&) {
        rep->outcome = RunOutcome::MemoryExceeded;
        rep->error_type = "MemoryError";
        rep->error_message = "out of memory";
    } catch (const script::ScriptError& e) {
        rep->outcome = RunOutcome::ScriptFailed;
        rep->error_type = e.type();
        rep->error_message = e.what();
        rep->error_line = e.line();
    } catch (const std::exception& e) {
        rep->outcome = RunOutcome::ScriptFailed;
        rep->error_type = "RuntimeError";
        rep->error_message = e.what();
    }
    rep->budget_used = in.budget().used();
    rep->printed_truncated = outputs->printed_truncated;

    // A run that ran out of memory reports no artifacts; rendering could
    // push it over the edge again.
    if (rep->outcome == RunOutcome::MemoryExceeded) return;
    try {
        rep->artifacts = capture_artifacts(*outputs);
    } catch (const std::bad_alloc&) {
        rep->artifacts.clear();
        rep->outcome = RunOutcome::MemoryExceeded;
        rep->error_type = "MemoryError";
        rep->error_message = "out of memory while rendering figures";
    }
}

int main(int argc, char**) {
    if (argc > 1) {
        std::cerr << "usage:\n  pitchbox_runhost   (reads one JSON run request from stdin, writes the report to stdout)\n";
        return kExitUsage;
    }

    std::string input;
    if (!slurp_stdin(&input)) return bad_request("stdin exceeds 256MB limit");

    RunRequest req;
    std::string err;
    if (!decode_request(input, &req, &err)) return bad_request(err);
    input.clear();
    input.shrink_to_fit();

    if (req.lockdown != LockdownMode::Off) {
        std::string e = lockdown();
        if (!e.empty()) {
            std::cerr << "[runhost] lockdown failed: " << e << "\n";
            if (req.lockdown == LockdownMode::Required) return kExitLockdown;
        }
    }

    RunReport rep;
    script::Module module;
    script::SyntaxError se;
    if (!script::parse_module(req.source, &module, &se)) {
        rep.outcome = RunOutcome::ScriptFailed;
        rep.error_type = "SyntaxError";
        rep.error_message = se.message;
        rep.error_line = se.line;
        return emit(rep);
    }

    run_script(req, module, &rep);
    return emit(rep);
}
