#include "pitchbox/config.h"
#include "pitchbox/proc.h"
#include "pitchbox/sandbox_env.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace pitchbox {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

Profile detect_profile() {
    const char* env = std::getenv("PITCHBOX_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("PITCHBOX_SECCOMP_ENABLE",   "0",           NO_OVERWRITE);
            setenv("PITCHBOX_LOCKDOWN",         "best_effort", NO_OVERWRITE);
            setenv("PITCHBOX_TIMEOUT_SEC",      "30",          NO_OVERWRITE);
            setenv("PITCHBOX_MEMORY_LIMIT_MB",  "512",         NO_OVERWRITE);
            setenv("PITCHBOX_ADMISSION",        "queue",       NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("PITCHBOX_SECCOMP_ENABLE",   "1",           NO_OVERWRITE);
            setenv("PITCHBOX_LOCKDOWN",         "required",    NO_OVERWRITE);
            setenv("PITCHBOX_TIMEOUT_SEC",      "10",          NO_OVERWRITE);
            setenv("PITCHBOX_MEMORY_LIMIT_MB",  "256",         NO_OVERWRITE);
            setenv("PITCHBOX_ADMISSION",        "queue",       NO_OVERWRITE);
            break;
    }
}

const char* admission_to_str(Admission a) {
    return a == Admission::Reject ? "reject" : "queue";
}

std::optional<Admission> admission_from_str(const std::string& s) {
    std::string v = lower(s);
    if (v == "queue") return Admission::Queue;
    if (v == "reject") return Admission::Reject;
    return std::nullopt;
}

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = lower(v);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

// Positive finite number, clamped to `max`.
static bool env_positive(const char* key, double max, double* out) {
    const char* v = std::getenv(key);
    if (!v || !*v) return false;
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (!end || *end != '\0' || !std::isfinite(d) || !(d > 0)) {
        std::cerr << "[config] ignoring " << key << "=" << v << " (expected a positive number)\n";
        return false;
    }
    if (d > max) {
        std::cerr << "[config] " << key << "=" << v << " clamped to " << max << "\n";
        d = max;
    }
    *out = d;
    return true;
}

// Whole count of at least 1, clamped to `max`.
static bool env_count(const char* key, size_t max, size_t* out) {
    double d = 0;
    if (!env_positive(key, (double)max, &d)) return false;
    if (d < 1) {
        std::cerr << "[config] ignoring " << key << " (expected at least 1)\n";
        return false;
    }
    *out = (size_t)d;
    return true;
}

SandboxConfig sandbox_config_from_env() {
    SandboxConfig c;
    c.allowed_bindings = default_allowed_bindings();
    double d = 0;
    if (env_positive("PITCHBOX_TIMEOUT_SEC", kMaxTimeoutSeconds, &d)) c.timeout_seconds = d;
    if (env_positive("PITCHBOX_MEMORY_LIMIT_MB", (double)(kMaxMemoryLimitBytes >> 20), &d)) {
        c.memory_limit_bytes = (uint64_t)(d * 1024 * 1024);
    }
    if (const char* b = std::getenv("PITCHBOX_ALLOWED_BINDINGS")) {
        std::set<std::string> known = default_allowed_bindings();
        std::set<std::string> picked;
        std::string list = b;
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            if (comma == std::string::npos) comma = list.size();
            std::string name = list.substr(start, comma - start);
            name.erase(0, name.find_first_not_of(" \t"));
            name.erase(name.find_last_not_of(" \t") + 1);
            if (!name.empty()) {
                if (known.count(name)) picked.insert(name);
                else std::cerr << "[config] unknown binding in PITCHBOX_ALLOWED_BINDINGS: " << name << "\n";
            }
            start = comma + 1;
        }
        c.allowed_bindings = std::move(picked);
    }
    return c;
}

std::string self_exe_dir() {
#ifdef __linux__
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path().string();
#endif
    return "";
}

ServiceConfig service_config_from_env() {
    ServiceConfig c;
    env_count("PITCHBOX_MAX_CONCURRENT", kMaxConcurrent, &c.max_concurrent);
    env_count("PITCHBOX_QUEUE_LIMIT", kMaxQueueLimit, &c.queue_limit);
    if (const char* a = std::getenv("PITCHBOX_ADMISSION")) {
        auto adm = admission_from_str(a);
        if (adm) c.admission = *adm;
        else std::cerr << "[config] ignoring PITCHBOX_ADMISSION=" << a << " (expected queue|reject)\n";
    }

    ExecutorConfig& e = c.executor;
    if (const char* bin = std::getenv("PITCHBOX_RUNHOST_BIN")) e.runhost_bin = bin;
    e.enable_seccomp = env_true("PITCHBOX_SECCOMP_ENABLE");
    if (const char* l = std::getenv("PITCHBOX_LOCKDOWN")) {
        auto m = lockdown_mode_from_str(lower(l));
        if (m) e.lockdown = *m;
        else std::cerr << "[config] ignoring PITCHBOX_LOCKDOWN=" << l << " (expected off|best_effort|required)\n";
    }
    // Optional operator-provided wrapper (e.g., nsjail/bwrap).
    // Disabled by default; enable explicitly to avoid surprising behavior.
    if (env_true("PITCHBOX_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("PITCHBOX_PROC_WRAPPER")) {
            e.wrapper = split_argv_quoted(w);
            if (e.wrapper.empty()) std::cerr << "[config] PITCHBOX_PROC_WRAPPER does not parse; running unwrapped\n";
        }
    }
    if (const char* p = std::getenv("PITCHBOX_AUDIT_LOG")) c.audit_log_path = p;
    return c;
}

bool policy_from_env(DenylistPolicy* out, std::string* err) {
    DenylistPolicy p = default_policy();
    if (const char* path = std::getenv("PITCHBOX_POLICY_FILE")) {
        if (*path && !load_policy_file(path, &p, err)) return false;
    }
    *out = std::move(p);
    return true;
}

} // namespace pitchbox
