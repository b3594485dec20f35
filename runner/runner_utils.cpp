#include "runner_utils.h"

#include "pitchbox/config.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pitchbox {

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
#ifdef _WIN32
    _putenv_s(key, value.c_str());
#else
    setenv(key, value.c_str(), 0);
#endif
}

void prepare_runtime_env(const char* argv0) {
    apply_profile_defaults(detect_profile());
    std::filesystem::path dir = self_exe_dir();
    if (dir.empty() && argv0) {
        std::error_code ec;
        dir = std::filesystem::absolute(std::filesystem::path(argv0), ec).parent_path();
    }
    if (!dir.empty()) set_env_if_missing("PITCHBOX_RUNHOST_BIN", (dir / "pitchbox_runhost").string());
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

bool write_file(const std::filesystem::path& p, const std::string& body, std::string* err) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) {
        if (err) *err = "cannot write " + p.string();
        return false;
    }
    f << body;
    f.flush();
    if (!f) {
        if (err) *err = "short write to " + p.string();
        return false;
    }
    return true;
}

bool parse_cli(int argc, char** argv, int first,
               const std::set<std::string>& value_opts,
               const std::set<std::string>& flag_opts,
               CliArgs* out, std::string* err) {
    CliArgs a;
    for (int i = first; i < argc; i++) {
        std::string s = argv[i];
        if (s.size() > 2 && s.compare(0, 2, "--") == 0) {
            std::string k = s.substr(2);
            if (flag_opts.count(k)) {
                a.flags.insert(k);
            } else if (value_opts.count(k)) {
                if (i + 1 >= argc) {
                    if (err) *err = "missing value for " + s;
                    return false;
                }
                a.opts[k] = argv[++i];
            } else {
                if (err) *err = "unknown option " + s;
                return false;
            }
        } else {
            a.positional.push_back(std::move(s));
        }
    }
    *out = std::move(a);
    return true;
}

std::set<Capability> all_capabilities() {
    return {Capability::DatasetRead, Capability::Plot, Capability::TextOutput, Capability::Numeric};
}

bool parse_caps(const std::string& s, std::set<Capability>* out, std::string* err) {
    std::set<Capability> caps;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string name = s.substr(start, comma - start);
        if (!name.empty()) {
            auto c = capability_from_str(name);
            if (!c) {
                if (err) *err = "unknown capability '" + name + "' (dataset_read, plot, text_output, numeric)";
                return false;
            }
            caps.insert(*c);
        }
        start = comma + 1;
    }
    *out = std::move(caps);
    return true;
}

bool load_dataset(const std::string& csv_path, DatasetHandle* out, std::string* err) {
    auto ds = std::make_shared<Dataset>();
    if (!dataset_from_csv_file(csv_path, ds.get(), err)) return false;
    *out = std::move(ds);
    return true;
}

void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE) << "\n";
    json_object_put(o);
}

} // namespace pitchbox
