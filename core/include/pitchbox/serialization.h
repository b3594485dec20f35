#pragma once

#include "dataset.h"
#include "types.h"

#include <json-c/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace pitchbox {

// Owning handle for a json-c tree.
struct JsonDoc {
    json_object* root{nullptr};

    JsonDoc() = default;
    explicit JsonDoc(json_object* r) : root(r) {}
    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;
    JsonDoc(JsonDoc&& o) noexcept : root(o.root) { o.root = nullptr; }
    JsonDoc& operator=(JsonDoc&& o) noexcept {
        if (this != &o) {
            if (root) json_object_put(root);
            root = o.root;
            o.root = nullptr;
        }
        return *this;
    }
    ~JsonDoc() { if (root) json_object_put(root); }

    explicit operator bool() const { return root != nullptr; }
    json_object* release() { json_object* r = root; root = nullptr; return r; }
};

// Strict parse: trailing garbage or truncation yields an empty doc.
JsonDoc json_parse(const std::string& text);

std::string json_quote(const std::string& s);
std::string json_dump(json_object* o);

json_object* json_new_string(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);
bool json_get_double(json_object* o, const char* k, double* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);

// --- Dataset snapshot (wire form for the run unit) ---
// {"columns":[{"name":..,"cells":[null|number|string,..]},..]}
json_object* dataset_to_json(const Dataset& ds);
bool dataset_from_json(json_object* o, Dataset* out, std::string* err);

// --- Caller-facing documents ---
json_object* verdict_to_json(const SafetyVerdict& v);
json_object* result_to_json(const ExecutionResult& r, bool include_payloads);

} // namespace pitchbox
