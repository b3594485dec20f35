#include "pitchbox/protocol.h"

#include "pitchbox/serialization.h"

namespace pitchbox {

const char* lockdown_mode_to_str(LockdownMode m) {
    switch (m) {
        case LockdownMode::Off: return "off";
        case LockdownMode::BestEffort: return "best_effort";
        case LockdownMode::Required: return "required";
    }
    return "required";
}

std::optional<LockdownMode> lockdown_mode_from_str(const std::string& s) {
    if (s == "off" || s == "0") return LockdownMode::Off;
    if (s == "best_effort" || s == "1") return LockdownMode::BestEffort;
    if (s == "required") return LockdownMode::Required;
    return std::nullopt;
}

std::string encode_request(const RunRequest& r) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "submission_id", json_new_string(r.submission_id));
    json_object_object_add(root, "source", json_new_string(r.source));
    json_object_object_add(root, "dataset", dataset_to_json(r.dataset));

    json_object* caps = json_object_new_array();
    for (Capability c : r.capabilities) json_object_array_add(caps, json_object_new_string(capability_to_str(c)));
    json_object_object_add(root, "capabilities", caps);

    json_object* bindings = json_object_new_array();
    for (const auto& b : r.bindings) json_object_array_add(bindings, json_new_string(b));
    json_object_object_add(root, "bindings", bindings);

    json_object* modules = json_object_new_object();
    for (const auto& kv : r.modules) json_object_object_add(modules, kv.first.c_str(), json_new_string(kv.second));
    json_object_object_add(root, "modules", modules);

    json_object* limits = json_object_new_object();
    json_object_object_add(limits, "memory_limit_bytes", json_object_new_int64((int64_t)r.memory_limit_bytes));
    json_object_object_add(limits, "max_print_bytes", json_object_new_int64((int64_t)r.max_print_bytes));
    json_object_object_add(limits, "max_call_depth", json_object_new_int(r.max_call_depth));
    json_object_object_add(root, "limits", limits);
    json_object_object_add(root, "lockdown", json_object_new_string(lockdown_mode_to_str(r.lockdown)));

    std::string out = json_dump(root);
    json_object_put(root);
    return out;
}

bool decode_request(const std::string& text, RunRequest* out, std::string* err) {
    JsonDoc doc = json_parse(text);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "request: invalid JSON";
        return false;
    }
    RunRequest r;
    (void)json_get_string(doc.root, "submission_id", &r.submission_id);
    if (!json_get_string(doc.root, "source", &r.source)) {
        if (err) *err = "request: missing source";
        return false;
    }
    json_object* ds = nullptr;
    if (!json_object_object_get_ex(doc.root, "dataset", &ds)) {
        if (err) *err = "request: missing dataset";
        return false;
    }
    if (!dataset_from_json(ds, &r.dataset, err)) return false;

    for (const auto& c : json_get_string_array(doc.root, "capabilities")) {
        auto cap = capability_from_str(c);
        if (!cap) {
            if (err) *err = "request: unknown capability '" + c + "'";
            return false;
        }
        r.capabilities.insert(*cap);
    }
    for (const auto& b : json_get_string_array(doc.root, "bindings")) r.bindings.insert(b);

    json_object* modules = nullptr;
    if (json_object_object_get_ex(doc.root, "modules", &modules) && json_object_is_type(modules, json_type_object)) {
        json_object_object_foreach(modules, key, val) {
            if (json_object_is_type(val, json_type_string)) r.modules[key] = json_object_get_string(val);
        }
    }

    json_object* limits = nullptr;
    if (!json_object_object_get_ex(doc.root, "limits", &limits)) {
        if (err) *err = "request: missing limits";
        return false;
    }
    int64_t v = 0;
    if (!json_get_int64(limits, "memory_limit_bytes", &v) || v <= 0) {
        if (err) *err = "request: invalid memory_limit_bytes";
        return false;
    }
    r.memory_limit_bytes = (uint64_t)v;
    if (json_get_int64(limits, "max_print_bytes", &v) && v >= 0) r.max_print_bytes = (uint64_t)v;
    if (json_get_int64(limits, "max_call_depth", &v) && v > 0) r.max_call_depth = (int)v;
    std::string lockdown;
    if (json_get_string(doc.root, "lockdown", &lockdown)) {
        auto m = lockdown_mode_from_str(lockdown);
        if (!m) {
            if (err) *err = "request: unknown lockdown mode '" + lockdown + "'";
            return false;
        }
        r.lockdown = *m;
    }

    *out = std::move(r);
    return true;
}

} // namespace pitchbox
