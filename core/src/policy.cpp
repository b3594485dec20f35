#include "pitchbox/policy.h"
#include "pitchbox/serialization.h"

#include <fstream>
#include <regex>
#include <sstream>

namespace pitchbox {

DenylistPolicy default_policy() {
    DenylistPolicy p;

    p.text_patterns = {
        // process / OS
        {"TXT.IMPORT_OS",          R"(\bimport\s+os\b)",                         "imports the os module"},
        {"TXT.IMPORT_SYS",         R"(\bimport\s+sys\b)",                        "imports the sys module"},
        {"TXT.IMPORT_SUBPROCESS",  R"(\bimport\s+subprocess\b)",                 "imports the subprocess module"},
        {"TXT.FROM_RESTRICTED",    R"(\bfrom\s+(os|sys|subprocess|socket|shutil|ctypes|importlib|pickle|marshal|builtins)\b)",
                                                                                  "imports from a restricted module"},
        {"TXT.OS_PRIMITIVE",       R"(\bos\s*\.\s*(system|popen|exec\w*|spawn\w*|fork|kill|remove|unlink|rmdir|environ|getenv))",
                                                                                  "uses an os process/filesystem primitive"},
        {"TXT.SUBPROCESS",         R"(\bsubprocess\b)",                          "references subprocess"},
        // network
        {"TXT.SOCKET",             R"(\bsocket\b)",                              "references socket"},
        {"TXT.URL_FETCH",          R"(\b(urllib|requests|http\.client|ftplib)\b)", "references a network client"},
        // filesystem
        {"TXT.OPEN_CALL",          R"(\bopen\s*\()",                             "calls open()"},
        // dynamic import / reflection
        {"TXT.DUNDER_IMPORT",      R"(__import__)",                              "uses __import__"},
        {"TXT.IMPORTLIB",          R"(\bimportlib\b)",                           "references importlib"},
        {"TXT.BUILTINS",           R"(__builtins__)",                            "references __builtins__"},
        {"TXT.INTROSPECTION",      R"(__(subclasses|globals|code|mro|bases|class|dict|closure|func|self|getattribute)__)",
                                                                                  "uses an introspection dunder"},
        {"TXT.REFLECTION_CALL",    R"(\b(getattr|setattr|delattr|globals|locals|vars)\s*\()",
                                                                                  "calls a reflection builtin"},
        // code generation
        {"TXT.EVAL_CALL",          R"(\beval\s*\()",                             "calls eval()"},
        {"TXT.EXEC_CALL",          R"(\bexec\s*\()",                             "calls exec()"},
        {"TXT.COMPILE_CALL",       R"(\bcompile\s*\()",                          "calls compile()"},
        // interactive
        {"TXT.INPUT_CALL",         R"(\b(input|breakpoint)\s*\()",               "calls an interactive builtin"},
    };

    p.module_bindings = {
        {"matplotlib.pyplot", "plt"},
        {"numpy",             "np"},
        {"pandas",            "pd"},
        {"mplsoccer",         "mplsoccer"},
        {"math",              "math"},
    };

    p.banned_names = {
        "eval", "exec", "compile", "__import__", "open", "input", "breakpoint", "help",
        "globals", "locals", "vars", "dir", "getattr", "setattr", "delattr", "hasattr",
        "type", "object", "super", "classmethod", "staticmethod", "property", "memoryview",
        "exit", "quit", "__builtins__", "__loader__", "__spec__", "__name__", "__file__",
        "os", "sys", "subprocess", "socket", "shutil", "ctypes", "importlib", "builtins",
        "pickle", "marshal", "io", "pathlib",
    };

    p.restricted_attributes = {
        // filesystem writes/reads reachable through whitelisted modules
        "savefig", "imsave", "imread", "load", "loadtxt", "genfromtxt", "fromfile", "tofile",
        "save", "savez", "savez_compressed", "savetxt", "memmap", "DataSource",
        "read_csv", "read_excel", "read_json", "read_pickle", "read_parquet", "read_sql",
        "read_html", "read_table", "read_clipboard", "read_feather", "read_hdf", "read_xml",
        "to_csv", "to_excel", "to_json", "to_pickle", "to_parquet", "to_sql", "to_html",
        "to_clipboard", "to_feather", "to_hdf", "to_xml",
        // escape hatches into restricted namespaces
        "os", "sys", "subprocess", "builtins", "ctypes", "ctypeslib", "f2py", "testing",
        "distutils", "io", "system", "popen", "environ", "lib", "eval", "exec",
    };

    p.suspicious_strings = {
        "eval", "exec", "compile", "__import__", "getattr", "setattr", "delattr", "globals",
        "locals", "vars", "builtins", "__builtins__", "importlib", "subprocess", "system", "popen",
    };

    return p;
}

static bool add_string_set(json_object* root, const char* key, std::set<std::string>* dst) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(root, key, &v)) return true;
    if (!json_object_is_type(v, json_type_array)) return false;
    for (const auto& s : json_get_string_array(root, key)) dst->insert(s);
    return true;
}

bool policy_merge_json(const std::string& json, DenylistPolicy* inout, std::string* err) {
    if (!inout) return false;
    JsonDoc doc = json_parse(json);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "policy: invalid JSON object";
        return false;
    }
    DenylistPolicy p = *inout;

    std::string version;
    if (json_get_string(doc.root, "version", &version)) p.version = version;

    int64_t n = 0;
    if (json_get_int64(doc.root, "max_source_chars", &n)) {
        if (n <= 0) { if (err) *err = "policy: max_source_chars must be > 0"; return false; }
        p.max_source_chars = (size_t)n;
    }
    if (json_get_int64(doc.root, "max_nesting_depth", &n)) {
        if (n <= 0) { if (err) *err = "policy: max_nesting_depth must be > 0"; return false; }
        p.max_nesting_depth = (int)n;
    }

    json_object* v = nullptr;
    if (json_object_object_get_ex(doc.root, "allow_modules", &v)) {
        if (!json_object_is_type(v, json_type_object)) {
            if (err) *err = "policy: allow_modules must be an object";
            return false;
        }
        json_object_object_foreach(v, mod, binding) {
            if (!json_object_is_type(binding, json_type_string)) {
                if (err) *err = std::string("policy: binding for '") + mod + "' must be a string";
                return false;
            }
            p.module_bindings[mod] = json_object_get_string(binding);
        }
    }
    for (const auto& m : json_get_string_array(doc.root, "deny_modules")) p.module_bindings.erase(m);

    if (!add_string_set(doc.root, "banned_names", &p.banned_names) ||
        !add_string_set(doc.root, "restricted_attributes", &p.restricted_attributes) ||
        !add_string_set(doc.root, "suspicious_strings", &p.suspicious_strings)) {
        if (err) *err = "policy: name lists must be arrays of strings";
        return false;
    }
    for (const auto& s : json_get_string_array(doc.root, "allowed_names")) p.banned_names.erase(s);

    if (json_object_object_get_ex(doc.root, "text_patterns", &v)) {
        if (!json_object_is_type(v, json_type_array)) {
            if (err) *err = "policy: text_patterns must be an array";
            return false;
        }
        const size_t cnt = json_object_array_length(v);
        for (size_t i = 0; i < cnt; i++) {
            json_object* po = json_object_array_get_idx(v, i);
            TextPattern tp;
            if (!json_get_string(po, "id", &tp.id) || !json_get_string(po, "regex", &tp.regex)) {
                if (err) *err = "policy: text pattern needs id and regex";
                return false;
            }
            (void)json_get_string(po, "message", &tp.message);
            try {
                std::regex re(tp.regex, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                if (err) *err = "policy: pattern " + tp.id + ": " + e.what();
                return false;
            }
            p.text_patterns.push_back(std::move(tp));
        }
    }

    *inout = std::move(p);
    return true;
}

bool load_policy_file(const std::string& path, DenylistPolicy* inout, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "policy: cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return policy_merge_json(ss.str(), inout, err);
}

} // namespace pitchbox
