#pragma once
#include "policy.h"
#include "types.h"

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace pitchbox {

// Static safety analysis of candidate source. Never executes the code.
//
// Layer (a) runs the policy's text patterns against the raw source and
// enforces the source length cap. Layer (b) parses the source and walks the
// AST. Every violation from both layers is collected; the verdict is allowed
// only when the list is empty.
class SafetyAnalyzer {
public:
    SafetyAnalyzer();
    explicit SafetyAnalyzer(DenylistPolicy policy);

    // False when a text pattern does not compile.
    bool ok() const { return init_error_.empty(); }
    const std::string& init_error() const { return init_error_; }

    SafetyVerdict analyze(const std::string& source) const;

    const DenylistPolicy& policy() const { return policy_; }

private:
    DenylistPolicy policy_;
    std::vector<std::pair<size_t, std::regex>> compiled_;  // index into text_patterns
    std::string init_error_;
};

} // namespace pitchbox
