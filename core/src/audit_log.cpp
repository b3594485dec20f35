#include "pitchbox/audit_log.h"
#include "pitchbox/hash.h"
#include "pitchbox/serialization.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace pitchbox {

static const std::string kGenesis(64, '0');

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        // json-c output is already canonical for strings, numbers, booleans and null.
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

// chain_hash of the last line, so a reopened log continues its chain.
static std::string last_chain_hash(const std::string& path, uint64_t* lines) {
    std::ifstream in(path);
    std::string line, last;
    uint64_t n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        last = line;
        n++;
    }
    *lines = n;
    if (last.empty()) return kGenesis;
    JsonDoc doc = json_parse(last);
    std::string h;
    if (!doc || !json_get_string(doc.root, "chain_hash", &h) || h.size() != 64) return kGenesis;
    return h;
}

AuditLog::AuditLog(const std::string& path, const std::string& profile)
    : path_(path), profile_(profile), chain_prev_(kGenesis) {
    if (path_.empty()) return;
    chain_prev_ = last_chain_hash(path_, &seq_);
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        error_ = "cannot open audit log " + path_;
        std::cerr << "[audit] " << error_ << "\n";
    }
}

uint64_t AuditLog::seq() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

void AuditLog::event(const std::string& submission_id, const std::string& name, json_object* payload) {
    if (!enabled() || !out_) {
        if (payload) json_object_put(payload);
        return;
    }

    std::lock_guard<std::mutex> lk(mu_);
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_new_string(name));
    json_object_object_add(rec, "payload", payload ? payload : json_object_new_object());
    json_object_object_add(rec, "profile", json_new_string(profile_));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)seq_));
    json_object_object_add(rec, "submission_id", json_new_string(submission_id));
    json_object_object_add(rec, "ts", json_new_string(iso_now()));

    const std::string record = canonical_json(rec);
    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec, "chain_hash", json_new_string(chain_hash));
    json_object_object_add(rec, "chain_prev", json_new_string(chain_prev_));
    out_ << canonical_json(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    if (!out_) std::cerr << "[audit] write failed: " << path_ << "\n";
    chain_prev_ = chain_hash;
    seq_++;
}

bool audit_log_verify(const std::string& path, size_t* lines, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string prev = kGenesis;
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        n++;
        JsonDoc doc = json_parse(line);
        std::string hash_field, prev_field;
        if (!doc || !json_get_string(doc.root, "chain_hash", &hash_field) ||
            !json_get_string(doc.root, "chain_prev", &prev_field)) {
            if (err) *err = "line " + std::to_string(n) + ": not a chained record";
            return false;
        }
        if (prev_field != prev) {
            if (err) *err = "line " + std::to_string(n) + ": chain_prev does not match the previous line";
            return false;
        }
        json_object_object_del(doc.root, "chain_hash");
        json_object_object_del(doc.root, "chain_prev");
        if (hash::sha256_hex(prev + canonical_json(doc.root)) != hash_field) {
            if (err) *err = "line " + std::to_string(n) + ": chain_hash mismatch";
            return false;
        }
        prev = hash_field;
    }
    if (lines) *lines = n;
    return true;
}

} // namespace pitchbox
