#include "test_common.h"

#include "pitchbox/audit_log.h"
#include "pitchbox/serialization.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

static std::string temp_path() {
    char path[] = "/tmp/pitchbox_audit_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) die("mkstemp failed");
    close(fd);
    unlink(path);
    return path;
}

static std::string read_all(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int main() {
    // canonical form sorts keys at every level
    pitchbox::JsonDoc doc = pitchbox::json_parse(R"({"b":1,"a":{"d":true,"c":[2,"x"]}})");
    expect_true((bool)doc, "parse");
    expect_true(pitchbox::canonical_json(doc.root) == R"({"a":{"c":[2,"x"],"d":true},"b":1})", "canonical order");

    const std::string path = temp_path();
    {
        pitchbox::AuditLog log(path, "dev");
        expect_true(log.enabled() && log.ok(), "log opens");
        json_object* p = json_object_new_object();
        json_object_object_add(p, "allowed", json_object_new_boolean(0));
        log.event("sub-1", "analysis.verdict", p);
        log.event("sub-1", "run.finished", nullptr);
        log.event("sub-2", "submission.received", nullptr);
        expect_eq_ll((long long)log.seq(), 3, "seq advanced");
    }

    size_t lines = 0;
    std::string err;
    expect_true(pitchbox::audit_log_verify(path, &lines, &err), "chain verifies: " + err);
    expect_eq_ll((long long)lines, 3, "three records");

    // reopening continues the chain and the sequence
    {
        pitchbox::AuditLog log(path, "dev");
        expect_eq_ll((long long)log.seq(), 3, "seq restored from file");
        std::vector<std::thread> ts;
        for (int i = 0; i < 4; i++) {
            ts.emplace_back([&log, i] { log.event("sub-" + std::to_string(10 + i), "submission.received", nullptr); });
        }
        for (auto& t : ts) t.join();
    }
    expect_true(pitchbox::audit_log_verify(path, &lines, &err), "reopened chain verifies: " + err);
    expect_eq_ll((long long)lines, 7, "seven records");

    // records carry the event fields and never the source
    std::string text = read_all(path);
    expect_true(text.find("\"event\":\"analysis.verdict\"") != std::string::npos, "event name written");
    expect_true(text.find("\"profile\":\"dev\"") != std::string::npos, "profile written");

    // tampering breaks the chain
    size_t pos = text.find("\"allowed\":false");
    expect_true(pos != std::string::npos, "payload written");
    text.replace(pos, 15, "\"allowed\":true ");
    {
        std::ofstream f(path, std::ios::trunc);
        f << text;
    }
    expect_true(!pitchbox::audit_log_verify(path, &lines, &err), "tampered log rejected");
    expect_true(err.find("line 1") != std::string::npos, "tampered line reported: " + err);
    unlink(path.c_str());

    // empty path disables logging
    pitchbox::AuditLog off("", "dev");
    expect_true(!off.enabled(), "disabled");
    off.event("sub-x", "noop", json_object_new_object());
    expect_eq_ll((long long)off.seq(), 0, "nothing recorded");

    std::cerr << "test_audit_log: ALL PASSED" << std::endl;
    return 0;
}
