#pragma once
#include "ast.h"
#include "value.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pitchbox::script {

struct InterpLimits {
    uint64_t memory_limit_bytes{256ULL * 1024 * 1024};
    int max_call_depth{100};
};

// One lexical scope. Lookups walk the parent chain; writes stay local.
class Env {
public:
    explicit Env(std::shared_ptr<Env> parent = nullptr) : parent_(std::move(parent)) {}

    bool lookup(const std::string& name, Value* out) const;
    void set(const std::string& name, Value v) { vars_[name] = std::move(v); }
    bool erase(const std::string& name) { return vars_.erase(name) > 0; }
    bool has_local(const std::string& name) const { return vars_.count(name) > 0; }
    const std::shared_ptr<Env>& parent() const { return parent_; }

private:
    std::unordered_map<std::string, Value> vars_;
    std::shared_ptr<Env> parent_;
};

// Lazy integer range; materialized only by list()/sorted()/etc.
class RangeObject : public Object {
public:
    RangeObject(int64_t start, int64_t stop, int64_t step);
    std::string type_name() const override { return "range"; }
    bool has_len() const override { return true; }
    size_t len() const override { return count_; }
    bool iterable() const override { return true; }
    std::vector<Value> iterate(Interpreter& in) override;
    Value get_item(Interpreter& in, const Value& key) override;
    bool contains(Interpreter& in, const Value& v, bool* out) override;
    std::string repr() const override;

    int64_t at(size_t i) const { return start_ + (int64_t)i * step_; }

private:
    int64_t start_, stop_, step_;
    size_t count_;
};

// Result of `a[lo:hi:step]` before it is applied to a container.
class SliceObject : public Object {
public:
    std::optional<int64_t> lower, upper, step;

    std::string type_name() const override { return "slice"; }
    // Python slice.indices(): clamps to `len` and fills in defaults.
    void indices(size_t len, int64_t* start, int64_t* stop, int64_t* stride) const;
    std::vector<size_t> positions(size_t len) const;
};

class UserFunction;

using ImportResolver = std::function<bool(const std::string& module, Value* out)>;

// Tree-walking evaluator for pitchbox scripts.
//
// Errors raised by the script surface as ScriptError (with the line of the
// failing statement); exhausting the allocation budget raises
// ResourceLimitError. Both escape run() and are the caller's to map.
class Interpreter {
public:
    explicit Interpreter(InterpLimits limits = InterpLimits{});

    Env& builtins() { return *builtins_; }
    Env& globals() { return *globals_; }
    MemoryBudget& budget() { return budget_; }

    // Resolves `import x` / `from x import y`; false means "not available".
    void set_import_resolver(ImportResolver r) { resolver_ = std::move(r); }

    void run(const Module& m);

    // Operations shared with host bindings.
    Value call(const Value& fn, CallArgs& args);
    Value call(const Value& fn, std::vector<Value> pos);
    std::vector<Value> iterate(const Value& v);
    Value binary(const std::string& op, const Value& a, const Value& b);
    bool compare(const std::string& op, const Value& a, const Value& b);
    bool contains(const Value& container, const Value& item);
    Value get_attr(const Value& obj, const std::string& name);
    Value subscript(const Value& obj, const Value& key);
    size_t length(const Value& v);
    // Stable sort with an optional key function.
    std::vector<Value> sorted(std::vector<Value> items, const Value& key, bool reverse);

private:
    enum class Flow { Normal, Break, Continue, Return };

    struct Frame {
        std::shared_ptr<Env> env;
        Value ret;
    };

    friend class UserFunction;

    InterpLimits limits_;
    MemoryBudget budget_;
    std::shared_ptr<Env> builtins_;
    std::shared_ptr<Env> globals_;
    ImportResolver resolver_;
    int call_depth_{0};

    Flow exec_block(const std::vector<StmtPtr>& body, Frame& f);
    Flow exec(const Stmt& s, Frame& f);
    Flow exec_for(const Stmt& s, Frame& f);
    void exec_import(const Stmt& s, Frame& f);
    Value eval(const Expr& e, Frame& f);
    Value eval_call(const Expr& e, Frame& f);
    Value eval_compare(const Expr& e, Frame& f);
    Value eval_fstring(const Expr& e, Frame& f);
    Value eval_listcomp(const Expr& e, Frame& f);
    void comp_level(const Expr& e, size_t gen, Frame& f, std::vector<Value>* out);
    void assign(const Expr& target, const Value& v, Frame& f);
    void del(const Expr& target, Frame& f);
    Value lookup(const std::string& name, const Frame& f) const;
    Value resolve_module(const std::string& module);
    Value invoke_user(const UserFunction& fn, CallArgs& args);

    Value str_method(const Value& self, const std::string& name);
    Value list_method(const Value& self, const std::string& name);
    Value dict_method(const Value& self, const std::string& name);
};

// Numeric result of applying `op` to two primitive numbers.
Value numeric_binary(const std::string& op, const Value& a, const Value& b);

// printf-style `"%.2f" % x` formatting.
std::string percent_format(const std::string& fmt, const Value& args);

} // namespace pitchbox::script
