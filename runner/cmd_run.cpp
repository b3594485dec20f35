#include "cmd_run.h"
#include "runner_utils.h"

#include "pitchbox/code_repair.h"
#include "pitchbox/config.h"
#include "pitchbox/serialization.h"
#include "pitchbox/service.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace {

const char* kRunUsage =
    "usage: pitchbox_cli run <script.py> --data <csv> [--timeout SEC] [--memory-mb MB]\n"
    "                        [--caps a,b,..] [--out DIR] [--repair] [--payloads]\n";

bool parse_positive(const std::string& s, double max, double* out) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v) || !(v > 0) || v > max) return false;
    *out = v;
    return true;
}

// figure_N.svg per figure, everything printed in output.txt.
bool write_artifacts(const std::filesystem::path& dir, const pitchbox::ExecutionResult& r, std::string* err) {
    using namespace pitchbox;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        *err = "cannot create " + dir.string() + ": " + ec.message();
        return false;
    }
    size_t fig = 0;
    std::string text;
    for (const auto& a : r.artifacts) {
        if (a.kind == ArtifactKind::Figure) {
            if (!write_file(dir / ("figure_" + std::to_string(++fig) + ".svg"), a.payload, err)) return false;
        } else {
            text += a.payload;
        }
    }
    if (!text.empty() && !write_file(dir / "output.txt", text, err)) return false;
    return true;
}

} // namespace

// pitchbox_cli run <script.py> --data <csv> ...
// Analyzes and, when allowed, executes the script against the dataset.
// Exit 0 on Success, 1 for any other terminal status.
int cmd_run(int argc, char** argv) {
    using namespace pitchbox;
    CliArgs args;
    std::string err;
    if (!parse_cli(argc, argv, 2, {"data", "timeout", "memory-mb", "caps", "out"}, {"repair", "payloads"}, &args,
                   &err) ||
        args.positional.size() != 1 || !args.has("data")) {
        if (!err.empty()) std::cerr << err << "\n";
        std::cerr << kRunUsage;
        return 2;
    }

    SandboxConfig cfg = sandbox_config_from_env();
    if (args.has("timeout") && !parse_positive(args.get("timeout"), kMaxTimeoutSeconds, &cfg.timeout_seconds)) {
        std::cerr << "--timeout must be a positive number of seconds, at most " << kMaxTimeoutSeconds << "\n";
        return 2;
    }
    if (args.has("memory-mb")) {
        double mb = 0;
        if (!parse_positive(args.get("memory-mb"), (double)(kMaxMemoryLimitBytes >> 20), &mb)) {
            std::cerr << "--memory-mb must be a positive number, at most " << (kMaxMemoryLimitBytes >> 20) << "\n";
            return 2;
        }
        cfg.memory_limit_bytes = (uint64_t)(mb * 1024 * 1024);
    }

    CodeSubmission sub;
    sub.requested_capabilities = all_capabilities();
    if (args.has("caps") && !parse_caps(args.get("caps"), &sub.requested_capabilities, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    if (!load_dataset(args.get("data"), &sub.allowed_dataset_handle, &err)) {
        std::cerr << "[run] dataset: " << err << "\n";
        return 1;
    }
    sub.source_text = slurp(args.positional[0]);

    std::vector<std::string> corrections;
    if (args.has("repair")) {
        RepairResult rr = auto_repair(sub.source_text, sub.allowed_dataset_handle->column_names());
        sub.source_text = std::move(rr.source);
        corrections = std::move(rr.corrections);
    }

    DenylistPolicy policy;
    if (!policy_from_env(&policy, &err)) {
        std::cerr << "[run] policy: " << err << "\n";
        return 2;
    }
    ServiceConfig scfg = service_config_from_env();
    scfg.max_concurrent = 1;
    SandboxService service(scfg, std::move(policy));
    if (!service.ok()) {
        std::cerr << "[run] policy: " << service.init_error() << "\n";
        return 2;
    }

    ExecutionResult r = service.submit(std::move(sub), cfg);
    service.shutdown();
    r.diagnostics.insert(r.diagnostics.begin(), corrections.begin(), corrections.end());

    if (args.has("out") && !write_artifacts(args.get("out"), r, &err)) {
        std::cerr << "[run] " << err << "\n";
        print_json(result_to_json(r, args.has("payloads")));
        return 1;
    }
    print_json(result_to_json(r, args.has("payloads")));
    return r.status == ExecutionStatus::Success ? 0 : 1;
}
