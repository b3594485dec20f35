#pragma once
#include "dataset.h"
#include "interp.h"
#include "plotting.h"
#include "types.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pitchbox {

// Capability that grants a binding. Pure builtins (len, range, ...) need none.
std::optional<Capability> binding_capability(const std::string& name);
bool is_pure_builtin(const std::string& name);

// Every binding the scope knows how to build.
std::set<std::string> default_allowed_bindings();

struct ScopeRequest {
    DatasetHandle dataset;
    std::set<Capability> capabilities;
    std::set<std::string> allowed_bindings;
    // Importable module -> binding it resolves to (from the denylist policy).
    std::map<std::string, std::string> modules;
    size_t max_print_bytes{1 << 20};
};

// What the script produced, collected after the run.
struct ScopeOutputs {
    std::string printed;
    bool printed_truncated{false};
    std::shared_ptr<script::PlotState> plots;
    std::vector<std::string> bound;  // bindings actually installed
};

// Populates a fresh interpreter with the bindings the request grants and
// nothing else. The dataset is exposed as a read-only frame over a private
// copy. `import` resolves only to installed bindings.
void build_sandbox_scope(script::Interpreter& in, const ScopeRequest& req, const std::shared_ptr<ScopeOutputs>& out);

} // namespace pitchbox
