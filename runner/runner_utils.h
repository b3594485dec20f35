#pragma once

#include "pitchbox/dataset.h"
#include "pitchbox/types.h"

#include <json-c/json.h>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pitchbox {

// ---- Shared helpers for the pitchbox_cli commands ----

void set_env_if_missing(const char* key, const std::string& value);

// Profile defaults plus PITCHBOX_RUNHOST_BIN next to the cli binary.
// Must run before any service (and its worker threads) exists.
void prepare_runtime_env(const char* argv0);

// Throws std::runtime_error when the file cannot be read.
std::string slurp(const std::string& path);
bool write_file(const std::filesystem::path& p, const std::string& body, std::string* err);

struct CliArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> opts;   // --key value
    std::set<std::string> flags;               // --flag

    bool has(const std::string& k) const { return opts.count(k) > 0 || flags.count(k) > 0; }
    std::string get(const std::string& k, const std::string& defv = "") const {
        auto it = opts.find(k);
        return it == opts.end() ? defv : it->second;
    }
};

// Parses argv[first..]. Options not named in value_opts or flag_opts are errors.
bool parse_cli(int argc, char** argv, int first,
               const std::set<std::string>& value_opts,
               const std::set<std::string>& flag_opts,
               CliArgs* out, std::string* err);

// "plot,text_output" -> {Plot, TextOutput}
bool parse_caps(const std::string& s, std::set<Capability>* out, std::string* err);
std::set<Capability> all_capabilities();

bool load_dataset(const std::string& csv_path, DatasetHandle* out, std::string* err);

// Pretty-prints to stdout and releases the object.
void print_json(json_object* o);

} // namespace pitchbox
