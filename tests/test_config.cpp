#include "test_common.h"
#include "pitchbox/config.h"
#include <cstdlib>
#include <fstream>
#include <unistd.h>

static void clear_env() {
    for (const char* k : {"PITCHBOX_PROFILE", "PITCHBOX_SECCOMP_ENABLE", "PITCHBOX_LOCKDOWN", "PITCHBOX_TIMEOUT_SEC",
                          "PITCHBOX_MEMORY_LIMIT_MB", "PITCHBOX_ADMISSION", "PITCHBOX_ALLOWED_BINDINGS",
                          "PITCHBOX_MAX_CONCURRENT", "PITCHBOX_QUEUE_LIMIT", "PITCHBOX_POLICY_FILE",
                          "PITCHBOX_PROC_WRAPPER", "PITCHBOX_PROC_WRAPPER_ENABLE", "PITCHBOX_AUDIT_LOG"})
        unsetenv(k);
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = pitchbox::detect_profile();
    expect_true(p == pitchbox::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("PITCHBOX_PROFILE", "prod", 1);
    expect_true(pitchbox::detect_profile() == pitchbox::Profile::PROD, "should detect PROD");
    setenv("PITCHBOX_PROFILE", "PROD", 1);
    expect_true(pitchbox::detect_profile() == pitchbox::Profile::PROD, "should detect PROD case-insensitive");

    // Test 3: Apply defaults (won't override existing)
    setenv("PITCHBOX_TIMEOUT_SEC", "42", 1);
    pitchbox::apply_profile_defaults(pitchbox::Profile::PROD);
    std::string val = std::getenv("PITCHBOX_TIMEOUT_SEC") ? std::getenv("PITCHBOX_TIMEOUT_SEC") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");

    // Test 4: PROD fills in the strict settings
    val = std::getenv("PITCHBOX_LOCKDOWN") ? std::getenv("PITCHBOX_LOCKDOWN") : "";
    expect_true(val == "required", "PROD should require lockdown");
    auto sc = pitchbox::sandbox_config_from_env();
    expect_true(sc.timeout_seconds == 42.0, "timeout from env");
    expect_eq_ll((long long)sc.memory_limit_bytes, 256LL * 1024 * 1024, "PROD memory limit");
    auto svc = pitchbox::service_config_from_env();
    expect_true(svc.executor.enable_seccomp, "PROD enables launch seccomp");
    expect_true(svc.executor.lockdown == pitchbox::LockdownMode::Required, "PROD lockdown required");

    // Test 5: DEV is lenient
    clear_env();
    pitchbox::apply_profile_defaults(pitchbox::Profile::DEV);
    svc = pitchbox::service_config_from_env();
    expect_true(!svc.executor.enable_seccomp, "DEV leaves launch seccomp off");
    expect_true(svc.executor.lockdown == pitchbox::LockdownMode::BestEffort, "DEV lockdown best effort");
    expect_true(svc.admission == pitchbox::Admission::Queue, "DEV queues");
    expect_true(svc.audit_log_path.empty(), "audit log off by default");

    // Test 6: malformed values keep defaults
    clear_env();
    setenv("PITCHBOX_TIMEOUT_SEC", "soon", 1);
    setenv("PITCHBOX_MAX_CONCURRENT", "-3", 1);
    setenv("PITCHBOX_ADMISSION", "lottery", 1);
    sc = pitchbox::sandbox_config_from_env();
    expect_true(sc.timeout_seconds == 30.0, "bad timeout ignored");
    svc = pitchbox::service_config_from_env();
    expect_eq_ll((long long)svc.max_concurrent, 4, "bad concurrency ignored");
    expect_true(svc.admission == pitchbox::Admission::Queue, "bad admission ignored");

    // Test 7: out-of-range values are clamped, non-finite ones ignored
    clear_env();
    setenv("PITCHBOX_TIMEOUT_SEC", "3e6", 1);
    setenv("PITCHBOX_MEMORY_LIMIT_MB", "1e30", 1);
    setenv("PITCHBOX_MAX_CONCURRENT", "1e30", 1);
    setenv("PITCHBOX_QUEUE_LIMIT", "0.5", 1);
    sc = pitchbox::sandbox_config_from_env();
    expect_true(sc.timeout_seconds == pitchbox::kMaxTimeoutSeconds, "huge timeout clamped");
    expect_true(sc.memory_limit_bytes == pitchbox::kMaxMemoryLimitBytes, "huge memory limit clamped");
    svc = pitchbox::service_config_from_env();
    expect_eq_ll((long long)svc.max_concurrent, (long long)pitchbox::kMaxConcurrent, "huge concurrency clamped");
    expect_eq_ll((long long)svc.queue_limit, 64, "fractional queue limit ignored");
    setenv("PITCHBOX_TIMEOUT_SEC", "inf", 1);
    setenv("PITCHBOX_MEMORY_LIMIT_MB", "nan", 1);
    sc = pitchbox::sandbox_config_from_env();
    expect_true(sc.timeout_seconds == 30.0, "infinite timeout ignored");
    expect_eq_ll((long long)sc.memory_limit_bytes, 256LL * 1024 * 1024, "nan memory ignored");

    // Test 8: service knobs
    clear_env();
    setenv("PITCHBOX_MAX_CONCURRENT", "8", 1);
    setenv("PITCHBOX_QUEUE_LIMIT", "2", 1);
    setenv("PITCHBOX_ADMISSION", "reject", 1);
    setenv("PITCHBOX_PROC_WRAPPER_ENABLE", "1", 1);
    setenv("PITCHBOX_PROC_WRAPPER", "bwrap --unshare-net --", 1);
    svc = pitchbox::service_config_from_env();
    expect_eq_ll((long long)svc.max_concurrent, 8, "max concurrent");
    expect_eq_ll((long long)svc.queue_limit, 2, "queue limit");
    expect_true(svc.admission == pitchbox::Admission::Reject, "reject admission");
    expect_eq_ll((long long)svc.executor.wrapper.size(), 3, "wrapper argv");
    expect_true(svc.executor.wrapper[0] == "bwrap", "wrapper program");

    // Test 9: allowed bindings narrow the scope; unknown names are dropped
    clear_env();
    setenv("PITCHBOX_ALLOWED_BINDINGS", "df,print, len ,bogus", 1);
    sc = pitchbox::sandbox_config_from_env();
    expect_eq_ll((long long)sc.allowed_bindings.size(), 3, "three known bindings");
    expect_true(sc.allowed_bindings.count("len") == 1, "whitespace trimmed");
    expect_true(sc.allowed_bindings.count("bogus") == 0, "unknown binding dropped");

    // Test 10: policy file merge
    clear_env();
    char path[] = "/tmp/pitchbox_policy_XXXXXX";
    int fd = mkstemp(path);
    expect_true(fd >= 0, "mkstemp");
    close(fd);
    {
        std::ofstream f(path);
        f << R"({"version":"site/7","deny_modules":["math"]})";
    }
    setenv("PITCHBOX_POLICY_FILE", path, 1);
    pitchbox::DenylistPolicy pol;
    std::string err;
    expect_true(pitchbox::policy_from_env(&pol, &err), "policy loads: " + err);
    expect_true(pol.version == "site/7", "policy version from file");
    expect_true(!pol.module_allowed("math"), "module denied by file");
    setenv("PITCHBOX_POLICY_FILE", "/nonexistent/policy.json", 1);
    expect_true(!pitchbox::policy_from_env(&pol, &err), "missing policy file is an error");
    unlink(path);

    // Test 11: names
    expect_true(std::string(pitchbox::profile_name(pitchbox::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(pitchbox::profile_name(pitchbox::Profile::PROD)) == "prod", "prod name");
    expect_true(pitchbox::admission_from_str("reject") == pitchbox::Admission::Reject, "admission parse");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
