#include "pitchbox/analyzer.h"
#include "pitchbox/policy.h"

#include "test_common.h"

#include <string>

using namespace pitchbox;

namespace {

bool has_violation(const SafetyVerdict& v, const std::string& id) {
    for (const auto& x : v.violations)
        if (x.pattern_id == id) return true;
    return false;
}

std::string ids(const SafetyVerdict& v) {
    std::string s;
    for (const auto& x : v.violations) s += x.pattern_id + " ";
    return s;
}

void expect_rejected(const SafetyAnalyzer& a, const std::string& src, const std::string& id) {
    SafetyVerdict v = a.analyze(src);
    expect_true(!v.allowed, "should be rejected: " + src);
    expect_true(has_violation(v, id), "expected " + id + " for: " + src + " got: " + ids(v));
}

void test_plain_visualization_allowed() {
    SafetyAnalyzer a;
    expect_true(a.ok(), "default policy compiles");
    const std::string src =
        "import matplotlib.pyplot as plt\n"
        "from mplsoccer import Pitch\n"
        "import numpy as np\n"
        "pitch = Pitch(pitch_type='statsbomb')\n"
        "fig, ax = pitch.draw(figsize=(10, 7))\n"
        "shots = df[df['type'] == 'Shot']\n"
        "pitch.scatter(shots['x'], shots['y'], ax=ax, s=np.sqrt(shots['xg']) * 300)\n"
        "ax.set_title('Shots')\n";
    SafetyVerdict v = a.analyze(src);
    expect_true(v.allowed, "visualization script allowed, got: " + ids(v));
    expect_true(v.violations.empty(), "no violations");
    expect_true(v.policy_version == kDenylistVersion, "policy version stamped");
}

void test_text_layer() {
    SafetyAnalyzer a;
    expect_rejected(a, "import os\nos.system('ls')\n", "TXT.IMPORT_OS");
    expect_rejected(a, "m = __import__('os')\n", "TXT.DUNDER_IMPORT");
    expect_rejected(a, "eval('1+1')\n", "TXT.EVAL_CALL");
    expect_rejected(a, "f = open('/etc/passwd')\n", "TXT.OPEN_CALL");
    expect_rejected(a, "import requests\n", "TXT.URL_FETCH");
}

void test_structural_layer() {
    SafetyAnalyzer a;
    expect_rejected(a, "import pickle\n", "AST.IMPORT_DENIED");
    expect_rejected(a, "import json\n", "AST.IMPORT_DENIED");
    // aliasing a banned builtin is caught even without the call syntax
    expect_rejected(a, "e = eval\n", "AST.BANNED_NAME");
    expect_rejected(a, "x = ().__class__\n", "AST.DUNDER_ATTRIBUTE");
    expect_rejected(a, "np.save('x.npy', [1])\n", "AST.RESTRICTED_ATTRIBUTE");
    expect_rejected(a, "df.to_csv('out.csv')\n", "AST.RESTRICTED_ATTRIBUTE");
    expect_rejected(a, "name = 'ev' + 'al'\nk = 'eval'\n", "AST.SUSPICIOUS_STRING");
}

void test_locations_and_collection() {
    SafetyAnalyzer a;
    SafetyVerdict v = a.analyze("x = 1\nimport pickle\ne = eval\n");
    expect_true(!v.allowed, "rejected");
    expect_true(v.violations.size() >= 2, "every violation collected: " + ids(v));
    bool saw_line2 = false, saw_line3 = false;
    for (const auto& x : v.violations) {
        if (x.pattern_id == "AST.IMPORT_DENIED" && x.location.line == 2) saw_line2 = true;
        if (x.pattern_id == "AST.BANNED_NAME" && x.location.line == 3) saw_line3 = true;
    }
    expect_true(saw_line2 && saw_line3, "violation lines reported");
}

void test_parse_error_rejected() {
    SafetyAnalyzer a;
    SafetyVerdict v = a.analyze("def broken(:\n    pass\n");
    expect_true(!v.allowed, "unparseable source rejected");
    expect_true(has_violation(v, "AST.PARSE_ERROR"), "parse error reported");
}

void test_source_length_cap() {
    DenylistPolicy p = default_policy();
    p.max_source_chars = 20;
    SafetyAnalyzer a(p);
    SafetyVerdict v = a.analyze("x = 1\ny = 2\nz = 3\nw = 4\n");
    expect_true(!v.allowed, "oversized source rejected");
    expect_true(has_violation(v, "TXT.SOURCE_TOO_LONG"), "length violation");
}

void test_nesting_cap() {
    DenylistPolicy p = default_policy();
    p.max_nesting_depth = 4;
    SafetyAnalyzer a(p);
    std::string src = "x = " + std::string(10, '[') + std::string(10, ']') + "\n";
    SafetyVerdict v = a.analyze(src);
    expect_true(has_violation(v, "AST.NESTING_TOO_DEEP"), "nesting cap: " + ids(v));
}

void test_policy_merge() {
    DenylistPolicy p = default_policy();
    std::string err;
    expect_true(policy_merge_json(R"({"version":"site/2","deny_modules":["math"],"banned_names":["sorted"]})", &p, &err),
                "merge ok: " + err);
    expect_true(p.version == "site/2", "version override");
    expect_true(!p.module_allowed("math"), "module denied");
    SafetyAnalyzer a(p);
    expect_rejected(a, "import math\n", "AST.IMPORT_DENIED");
    expect_rejected(a, "y = sorted([2, 1])\n", "AST.BANNED_NAME");

    DenylistPolicy q = default_policy();
    expect_true(!policy_merge_json(R"({"text_patterns":[{"id":"X","regex":"(","message":"m"}]})", &q, &err),
                "invalid regex refused");
    expect_true(!policy_merge_json("not json", &q, &err), "invalid json refused");
}

void test_analysis_is_deterministic() {
    SafetyAnalyzer a;
    const std::string src = "import os\ne = eval\nx = ().__class__\n";
    SafetyVerdict v1 = a.analyze(src), v2 = a.analyze(src);
    expect_eq_ll((long long)v1.violations.size(), (long long)v2.violations.size(), "same count");
    for (size_t i = 0; i < v1.violations.size(); i++) {
        expect_true(v1.violations[i].pattern_id == v2.violations[i].pattern_id, "same order");
        expect_eq_ll(v1.violations[i].location.line, v2.violations[i].location.line, "same line");
    }
}

} // namespace

int main() {
    test_plain_visualization_allowed();
    test_text_layer();
    test_structural_layer();
    test_locations_and_collection();
    test_parse_error_rejected();
    test_source_length_cap();
    test_nesting_cap();
    test_policy_merge();
    test_analysis_is_deterministic();
    std::cerr << "test_analyzer: ALL PASSED\n";
    return 0;
}
