#include "pitchbox/serialization.h"

#include <algorithm>
#include <climits>

namespace pitchbox {

JsonDoc json_parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return JsonDoc{};
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return JsonDoc{};
    }
    // tolerate trailing whitespace only
    for (size_t i = consumed; i < text.size(); i++) {
        char c = text[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return JsonDoc{};
        }
    }
    return JsonDoc{obj};
}

std::string json_quote(const std::string& s) {
    json_object* o = json_new_string(s);
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

std::string json_dump(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

json_object* json_new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    out->assign(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!json_object_is_type(v, json_type_boolean)) return false;
    *out = json_object_get_boolean(v) != 0;
    return true;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_int)) return false;
    *out = json_object_get_int64(v);
    return true;
}

bool json_get_double(json_object* o, const char* k, double* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return false;
    *out = json_object_get_double(v);
    return true;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.emplace_back(json_object_get_string(it));
    }
    return out;
}

// --- Dataset snapshot ---

json_object* dataset_to_json(const Dataset& ds) {
    json_object* root = json_object_new_object();
    json_object* cols = json_object_new_array();
    for (const auto& c : ds.columns) {
        json_object* co = json_object_new_object();
        json_object_object_add(co, "name", json_new_string(c.name));
        json_object* cells = json_object_new_array();
        for (const auto& cell : c.cells) {
            switch (cell.type) {
                case Cell::Type::Null:
                    json_object_array_add(cells, nullptr);
                    break;
                case Cell::Type::Number:
                    json_object_array_add(cells, json_object_new_double(cell.number));
                    break;
                case Cell::Type::String:
                    json_object_array_add(cells, json_new_string(cell.text));
                    break;
            }
        }
        json_object_object_add(co, "cells", cells);
        json_object_array_add(cols, co);
    }
    json_object_object_add(root, "columns", cols);
    return root;
}

bool dataset_from_json(json_object* o, Dataset* out, std::string* err) {
    if (!o || !out || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "dataset: expected object";
        return false;
    }
    *out = Dataset{};
    json_object* cols = nullptr;
    if (!json_object_object_get_ex(o, "columns", &cols) || !json_object_is_type(cols, json_type_array)) {
        if (err) *err = "dataset: missing columns array";
        return false;
    }
    const size_t ncols = json_object_array_length(cols);
    size_t rows = 0;
    for (size_t i = 0; i < ncols; i++) {
        json_object* co = json_object_array_get_idx(cols, i);
        Column c;
        if (!json_get_string(co, "name", &c.name)) {
            if (err) *err = "dataset: column without name";
            return false;
        }
        json_object* cells = nullptr;
        if (!json_object_object_get_ex(co, "cells", &cells) || !json_object_is_type(cells, json_type_array)) {
            if (err) *err = "dataset: column '" + c.name + "' without cells";
            return false;
        }
        const size_t n = json_object_array_length(cells);
        if (i == 0) rows = n;
        if (n != rows) {
            if (err) *err = "dataset: column '" + c.name + "' has ragged length";
            return false;
        }
        c.cells.reserve(n);
        for (size_t r = 0; r < n; r++) {
            json_object* v = json_object_array_get_idx(cells, r);
            if (!v) {
                c.cells.push_back(Cell::null());
            } else if (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int)) {
                c.cells.push_back(Cell::num(json_object_get_double(v)));
            } else if (json_object_is_type(v, json_type_string)) {
                c.cells.push_back(Cell::str(std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v))));
            } else {
                if (err) *err = "dataset: unsupported cell type in '" + c.name + "'";
                return false;
            }
        }
        out->columns.push_back(std::move(c));
    }
    return true;
}

// --- Caller-facing documents ---

json_object* verdict_to_json(const SafetyVerdict& v) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "allowed", json_object_new_boolean(v.allowed ? 1 : 0));
    json_object_object_add(root, "policy_version", json_new_string(v.policy_version));
    json_object* arr = json_object_new_array();
    for (const auto& viol : v.violations) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "pattern_id", json_new_string(viol.pattern_id));
        json_object_object_add(o, "line", json_object_new_int(viol.location.line));
        json_object_object_add(o, "column", json_object_new_int(viol.location.column));
        json_object_object_add(o, "message", json_new_string(viol.message));
        json_object_array_add(arr, o);
    }
    json_object_object_add(root, "violations", arr);
    return root;
}

json_object* result_to_json(const ExecutionResult& r, bool include_payloads) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "submission_id", json_new_string(r.submission_id));
    json_object_object_add(root, "status", json_object_new_string(status_to_str(r.status)));
    json_object_object_add(root, "error_kind", json_object_new_string(error_kind_to_str(r.error_kind)));
    json_object_object_add(root, "elapsed_ms", json_object_new_int64((int64_t)r.elapsed.count()));

    json_object* arts = json_object_new_array();
    for (const auto& a : r.artifacts) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "kind", json_object_new_string(artifact_kind_to_str(a.kind)));
        json_object_object_add(o, "media_type", json_new_string(a.media_type));
        json_object_object_add(o, "size_bytes", json_object_new_int64((int64_t)a.payload.size()));
        json_object_object_add(o, "digest", json_new_string(a.digest));
        if (include_payloads) json_object_object_add(o, "payload", json_new_string(a.payload));
        json_object_array_add(arts, o);
    }
    json_object_object_add(root, "artifacts", arts);

    json_object* diags = json_object_new_array();
    for (const auto& d : r.diagnostics) json_object_array_add(diags, json_new_string(d));
    json_object_object_add(root, "diagnostics", diags);
    return root;
}

} // namespace pitchbox
