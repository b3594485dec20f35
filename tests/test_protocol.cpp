#include "pitchbox/capture.h"
#include "pitchbox/dataset.h"
#include "pitchbox/hash.h"
#include "pitchbox/protocol.h"
#include "pitchbox/serialization.h"

#include "test_common.h"

#include <string>

using namespace pitchbox;

static void test_csv_parsing() {
    Dataset ds;
    std::string err;
    expect_true(dataset_from_csv("name,x,note\n\"Smith, J\",1.5,\n\"say \"\"hi\"\"\",2,ok\n", &ds, &err), "csv: " + err);
    expect_eq_ll((long long)ds.columns.size(), 3, "columns");
    expect_eq_ll((long long)ds.row_count(), 2, "rows");
    expect_true(ds.columns[0].cells[0].text == "Smith, J", "quoted comma");
    expect_true(ds.columns[0].cells[1].text == "say \"hi\"", "escaped quote");
    expect_true(ds.columns[1].cells[0].type == Cell::Type::Number && ds.columns[1].cells[0].number == 1.5, "number cell");
    expect_true(ds.columns[2].cells[0].type == Cell::Type::Null, "empty cell is null");
    expect_true(ds.find("x") != nullptr && ds.find("nope") == nullptr, "find");

    Dataset bad;
    expect_true(!dataset_from_csv("a,b\n1,2,3\n", &bad, &err), "ragged row rejected");
    expect_true(!dataset_from_csv("a,b\n\"open,2\n", &bad, &err), "unterminated quote rejected");
    expect_true(!dataset_from_csv("", &bad, &err), "missing header rejected");
}

static void test_dataset_digest() {
    Dataset a, b;
    std::string err;
    expect_true(dataset_from_csv("x,y\n1,2\n", &a, &err), "a");
    expect_true(dataset_from_csv("x,y\n1,2\n", &b, &err), "b");
    expect_true(a.digest() == b.digest(), "equal data, equal digest");
    b.columns[1].cells[0] = Cell::num(3);
    expect_true(a.digest() != b.digest(), "changed cell, changed digest");
    expect_eq_ll((long long)a.digest().size(), 64, "sha256 hex");
}

static void test_request_wire_form() {
    RunRequest r;
    r.submission_id = "sub-1";
    r.source = "print(len(df))\n";
    std::string err;
    expect_true(dataset_from_csv("x\n1\n2\n", &r.dataset, &err), "csv");
    r.capabilities = {Capability::DatasetRead, Capability::TextOutput};
    r.bindings = {"df", "print", "len"};
    r.modules = {{"numpy", "np"}};
    r.memory_limit_bytes = 1234567;
    r.lockdown = LockdownMode::Required;

    RunRequest d;
    expect_true(decode_request(encode_request(r), &d, &err), "decode: " + err);
    expect_true(d.source == r.source && d.submission_id == "sub-1", "source and id");
    expect_true(d.dataset.digest() == r.dataset.digest(), "dataset carried");
    expect_true(d.capabilities == r.capabilities && d.bindings == r.bindings && d.modules == r.modules, "grants carried");
    expect_eq_ll((long long)d.memory_limit_bytes, 1234567, "memory limit");
    expect_true(d.lockdown == LockdownMode::Required, "lockdown mode");

    std::string text = encode_request(r);
    size_t pos = text.find("\"required\"");
    expect_true(pos != std::string::npos, "lockdown encoded as string");
    text.replace(pos, 10, "\"sometimes\"");
    expect_true(!decode_request(text, &d, &err), "unknown lockdown mode refused");

    expect_true(!decode_request("{\"source\":1}", &d, &err), "malformed request refused");
    expect_true(!decode_request("{not json", &d, &err), "invalid json refused");
}

static void test_lockdown_mode_strings() {
    expect_true(lockdown_mode_from_str("best_effort") == LockdownMode::BestEffort, "best_effort");
    expect_true(lockdown_mode_from_str("0") == LockdownMode::Off, "0 is off");
    expect_true(lockdown_mode_from_str("1") == LockdownMode::Required, "1 is required");
    expect_true(!lockdown_mode_from_str("maybe"), "unknown mode");
}

static RunReport sample_report() {
    RunReport r;
    r.outcome = RunOutcome::Completed;
    Artifact fig;
    fig.kind = ArtifactKind::Figure;
    fig.media_type = kSvgMediaType;
    fig.payload = "<svg xmlns=\"http://www.w3.org/2000/svg\"></svg>";
    Artifact txt;
    txt.kind = ArtifactKind::TextOutput;
    txt.media_type = kTextMediaType;
    txt.payload = "a\nb\n";
    r.artifacts = {fig, txt};
    r.budget_used = 4096;
    return r;
}

static void test_report_decoding() {
    RunReport d;
    std::string err;
    expect_true(decode_report(encode_report(sample_report()), CaptureLimits{}, &d, &err), "decode: " + err);
    expect_true(d.outcome == RunOutcome::Completed, "outcome");
    expect_eq_ll((long long)d.artifacts.size(), 2, "artifacts");
    expect_true(d.artifacts[0].digest == hash::sha256_hex(d.artifacts[0].payload), "digest computed by parent");
    expect_eq_ll((long long)d.budget_used, 4096, "budget");

    auto lines = printed_lines(d.artifacts);
    expect_eq_ll((long long)lines.size(), 2, "printed lines");
    expect_true(lines[0] == "a" && lines[1] == "b", "line split");

    CaptureLimits tight;
    tight.max_artifact_bytes = 10;
    expect_true(!decode_report(encode_report(sample_report()), tight, &d, &err), "oversized payload refused");
    tight = CaptureLimits{};
    tight.max_artifacts = 1;
    expect_true(!decode_report(encode_report(sample_report()), tight, &d, &err), "too many artifacts refused");

    RunReport odd = sample_report();
    odd.artifacts[0].media_type = "application/octet-stream";
    expect_true(!decode_report(encode_report(odd), CaptureLimits{}, &d, &err), "unexpected media type refused");

    std::string text = encode_report(sample_report());
    text.replace(text.find("\"figure\""), 8, "\"pickle\"");
    expect_true(!decode_report(text, CaptureLimits{}, &d, &err), "unknown kind refused");
    expect_true(!decode_report("garbage", CaptureLimits{}, &d, &err), "garbage refused");
}

static void test_failed_report_carries_error() {
    RunReport r;
    r.outcome = RunOutcome::ScriptFailed;
    r.error_type = "ZeroDivisionError";
    r.error_message = "division by zero";
    r.error_line = 4;
    RunReport d;
    std::string err;
    expect_true(decode_report(encode_report(r), CaptureLimits{}, &d, &err), "decode: " + err);
    expect_true(d.outcome == RunOutcome::ScriptFailed, "outcome");
    expect_true(d.error_type == "ZeroDivisionError" && d.error_line == 4, "error carried");
}

int main() {
    test_csv_parsing();
    test_dataset_digest();
    test_request_wire_form();
    test_lockdown_mode_strings();
    test_report_decoding();
    test_failed_report_carries_error();
    std::cerr << "test_protocol: ALL PASSED\n";
    return 0;
}
