#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pitchbox {

// Version tag of the built-in denylist. Bump whenever default_policy()
// changes what is accepted or rejected.
constexpr const char* kDenylistVersion = "pitchbox-denylist/1";

struct TextPattern {
    std::string id;      // "TXT.EVAL_CALL"
    std::string regex;   // ECMAScript syntax
    std::string message;
};

// Explicit policy consumed by the static analyzer.
struct DenylistPolicy {
    std::string version{kDenylistVersion};
    size_t max_source_chars{5000};
    int max_nesting_depth{32};

    // Layer (a): cheap textual pre-filter.
    std::vector<TextPattern> text_patterns;

    // Layer (b): structural rules.
    // Importable module -> sandbox binding it resolves to.
    std::map<std::string, std::string> module_bindings;
    // Names that may not appear as a load, call target or assignment target.
    std::set<std::string> banned_names;
    // Attribute names that may not be accessed on any object.
    std::set<std::string> restricted_attributes;
    // String constants that spell a code-generation ingredient.
    std::set<std::string> suspicious_strings;

    bool module_allowed(const std::string& module) const { return module_bindings.count(module) > 0; }
};

DenylistPolicy default_policy();

// Merge an operator JSON policy file into `inout`. Recognized keys:
//   version, max_source_chars, max_nesting_depth,
//   allow_modules {module: binding}, deny_modules [..],
//   banned_names [..], allowed_names [..], restricted_attributes [..],
//   suspicious_strings [..],
//   text_patterns [{id, regex, message}].
// Every regex is compiled up front; an invalid one fails the whole load.
bool load_policy_file(const std::string& path, DenylistPolicy* inout, std::string* err);
bool policy_merge_json(const std::string& json, DenylistPolicy* inout, std::string* err);

} // namespace pitchbox
