#include "pitchbox/capture.h"

#include "pitchbox/figure.h"
#include "pitchbox/hash.h"
#include "pitchbox/serialization.h"

namespace pitchbox {

const char* run_outcome_to_str(RunOutcome o) {
    switch (o) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::ScriptFailed: return "script_failed";
        case RunOutcome::MemoryExceeded: return "memory_exceeded";
        case RunOutcome::BadRequest: return "bad_request";
    }
    return "bad_request";
}

static bool run_outcome_from_str(const std::string& s, RunOutcome* out) {
    for (RunOutcome o : {RunOutcome::Completed, RunOutcome::ScriptFailed, RunOutcome::MemoryExceeded,
                         RunOutcome::BadRequest}) {
        if (s == run_outcome_to_str(o)) {
            *out = o;
            return true;
        }
    }
    return false;
}

std::vector<Artifact> capture_artifacts(const ScopeOutputs& outputs) {
    std::vector<Artifact> out;
    if (outputs.plots) {
        for (const auto& fig : outputs.plots->open_figures()) {
            Artifact a;
            a.kind = ArtifactKind::Figure;
            a.media_type = kSvgMediaType;
            a.payload = render_svg(fig->model);
            out.push_back(std::move(a));
        }
    }
    if (!outputs.printed.empty()) {
        Artifact a;
        a.kind = ArtifactKind::TextOutput;
        a.media_type = kTextMediaType;
        a.payload = outputs.printed;
        out.push_back(std::move(a));
    }
    return out;
}

std::string encode_report(const RunReport& r) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "outcome", json_object_new_string(run_outcome_to_str(r.outcome)));
    if (r.outcome != RunOutcome::Completed) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "type", json_new_string(r.error_type));
        json_object_object_add(e, "message", json_new_string(r.error_message));
        json_object_object_add(e, "line", json_object_new_int(r.error_line));
        json_object_object_add(root, "error", e);
    }
    json_object* arts = json_object_new_array();
    for (const auto& a : r.artifacts) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "kind", json_object_new_string(artifact_kind_to_str(a.kind)));
        json_object_object_add(o, "media_type", json_new_string(a.media_type));
        json_object_object_add(o, "payload", json_new_string(a.payload));
        json_object_array_add(arts, o);
    }
    json_object_object_add(root, "artifacts", arts);
    json_object_object_add(root, "printed_truncated", json_object_new_boolean(r.printed_truncated ? 1 : 0));
    json_object_object_add(root, "budget_used", json_object_new_int64((int64_t)r.budget_used));
    std::string s = json_dump(root);
    json_object_put(root);
    return s;
}

bool decode_report(const std::string& text, const CaptureLimits& limits, RunReport* out, std::string* err) {
    JsonDoc doc = json_parse(text);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "report: invalid JSON";
        return false;
    }
    RunReport r;
    std::string outcome;
    if (!json_get_string(doc.root, "outcome", &outcome) || !run_outcome_from_str(outcome, &r.outcome)) {
        if (err) *err = "report: missing or unknown outcome";
        return false;
    }
    json_object* e = nullptr;
    if (json_object_object_get_ex(doc.root, "error", &e)) {
        (void)json_get_string(e, "type", &r.error_type);
        (void)json_get_string(e, "message", &r.error_message);
        int64_t line = 0;
        if (json_get_int64(e, "line", &line)) r.error_line = (int)line;
    }

    json_object* arts = nullptr;
    if (!json_object_object_get_ex(doc.root, "artifacts", &arts) || !json_object_is_type(arts, json_type_array)) {
        if (err) *err = "report: missing artifacts";
        return false;
    }
    const size_t n = json_object_array_length(arts);
    if (n > limits.max_artifacts) {
        if (err) *err = "report: too many artifacts (" + std::to_string(n) + ")";
        return false;
    }
    for (size_t i = 0; i < n; i++) {
        json_object* o = json_object_array_get_idx(arts, i);
        Artifact a;
        std::string kind;
        if (!json_get_string(o, "kind", &kind)) {
            if (err) *err = "report: artifact without kind";
            return false;
        }
        auto k = artifact_kind_from_str(kind);
        if (!k) {
            if (err) *err = "report: unknown artifact kind '" + kind + "'";
            return false;
        }
        a.kind = *k;
        if (!json_get_string(o, "media_type", &a.media_type) ||
            a.media_type != (a.kind == ArtifactKind::Figure ? kSvgMediaType : kTextMediaType)) {
            if (err) *err = "report: unexpected media type for " + kind;
            return false;
        }
        if (!json_get_string(o, "payload", &a.payload)) {
            if (err) *err = "report: artifact without payload";
            return false;
        }
        if (a.payload.size() > limits.max_artifact_bytes) {
            if (err) *err = "report: artifact of " + std::to_string(a.payload.size()) + " bytes exceeds the cap";
            return false;
        }
        a.digest = hash::sha256_hex(a.payload);
        r.artifacts.push_back(std::move(a));
    }
    (void)json_get_bool(doc.root, "printed_truncated", &r.printed_truncated);
    int64_t used = 0;
    if (json_get_int64(doc.root, "budget_used", &used) && used > 0) r.budget_used = (uint64_t)used;
    *out = std::move(r);
    return true;
}

std::vector<std::string> printed_lines(const std::vector<Artifact>& artifacts) {
    std::vector<std::string> out;
    for (const auto& a : artifacts) {
        if (a.kind != ArtifactKind::TextOutput) continue;
        size_t start = 0;
        while (start < a.payload.size()) {
            size_t nl = a.payload.find('\n', start);
            if (nl == std::string::npos) nl = a.payload.size();
            out.push_back(a.payload.substr(start, nl - start));
            start = nl + 1;
        }
    }
    return out;
}

} // namespace pitchbox
