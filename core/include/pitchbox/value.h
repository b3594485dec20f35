#pragma once
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace pitchbox::script {

// Raised for errors the script itself causes. `type` follows Python naming
// ("TypeError", "ZeroDivisionError", ...) so messages read familiar to the
// code generator; `line` is 0 until the interpreter attaches a location.
class ScriptError : public std::runtime_error {
public:
    ScriptError(std::string type, const std::string& msg, int line = 0)
        : std::runtime_error(msg), type_(std::move(type)), line_(line) {}
    const std::string& type() const { return type_; }
    int line() const { return line_; }
    void set_line(int l) { if (line_ == 0) line_ = l; }

private:
    std::string type_;
    int line_;
};

// Raised when the allocation budget of a run is exhausted.
class ResourceLimitError : public std::runtime_error {
public:
    explicit ResourceLimitError(const std::string& msg) : std::runtime_error(msg) {}
};

// Accounting for container memory owned by the script. One budget is active
// per thread while a script runs; containers charge it as they grow.
class MemoryBudget {
public:
    explicit MemoryBudget(uint64_t limit_bytes) : limit_(limit_bytes) {}

    void charge(uint64_t bytes);
    void release(uint64_t bytes);
    // Refuses a single transient allocation that would not fit.
    void check(uint64_t bytes) const;

    uint64_t used() const { return used_; }
    uint64_t limit() const { return limit_; }

    static MemoryBudget* current();

    class Scope {
    public:
        explicit Scope(MemoryBudget* b);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        MemoryBudget* prev_;
    };

private:
    uint64_t limit_;
    uint64_t used_{0};
};

void budget_charge(uint64_t bytes);
void budget_release(uint64_t bytes);
void budget_check(uint64_t bytes);

// Bytes charged on behalf of one script-visible object and released when
// the owner dies. Nothing is recorded while no budget is active, so objects
// built before the run (the dataset frame) never count against the script.
class BudgetCharge {
public:
    BudgetCharge() = default;
    ~BudgetCharge() { budget_release(bytes_); }
    BudgetCharge(const BudgetCharge&) = delete;
    BudgetCharge& operator=(const BudgetCharge&) = delete;

    // Moves the charge to `bytes`; throws ResourceLimitError when growth does not fit.
    void set(uint64_t bytes);
    uint64_t bytes() const { return bytes_; }

private:
    uint64_t bytes_{0};
};

// Immutable string storage shared by every copy of a str value.
struct StrObj {
    explicit StrObj(std::string v);
    std::string s;
    BudgetCharge charge;
};

struct ListObj;
struct DictObj;
class Callable;
class Object;

using ListPtr = std::shared_ptr<ListObj>;
using DictPtr = std::shared_ptr<DictObj>;
using CallablePtr = std::shared_ptr<Callable>;
using ObjectPtr = std::shared_ptr<Object>;
using StrPtr = std::shared_ptr<const StrObj>;

class Value {
public:
    enum class Type { None, Bool, Int, Float, Str, List, Tuple, Dict, Callable, Object };

    Value() = default;

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value number(double d);
    static Value str(std::string s);
    static Value list(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value list_ref(ListPtr p);
    static Value dict_ref(DictPtr p);
    static Value callable(CallablePtr p);
    static Value object(ObjectPtr p);

    Type type() const { return type_; }
    bool is_none() const { return type_ == Type::None; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_int() const { return type_ == Type::Int; }
    bool is_float() const { return type_ == Type::Float; }
    bool is_str() const { return type_ == Type::Str; }
    bool is_list() const { return type_ == Type::List; }
    bool is_tuple() const { return type_ == Type::Tuple; }
    bool is_sequence() const { return type_ == Type::List || type_ == Type::Tuple; }
    bool is_dict() const { return type_ == Type::Dict; }
    bool is_callable() const { return type_ == Type::Callable; }
    bool is_object() const { return type_ == Type::Object; }
    // Bool, Int or Float.
    bool is_number() const { return type_ == Type::Bool || type_ == Type::Int || type_ == Type::Float; }

    bool as_bool() const { return std::get<bool>(v_); }
    // Bool and Int widen to int64.
    int64_t as_int() const;
    // Any numeric type widens to double.
    double as_float() const;
    const std::string& as_str() const { return std::get<StrPtr>(v_)->s; }
    const ListPtr& as_list() const { return std::get<ListPtr>(v_); }
    const DictPtr& as_dict() const { return std::get<DictPtr>(v_); }
    const CallablePtr& as_callable() const { return std::get<CallablePtr>(v_); }
    const ObjectPtr& as_object() const { return std::get<ObjectPtr>(v_); }

    const char* type_name() const;

private:
    Type type_{Type::None};
    std::variant<std::monostate, bool, int64_t, double, StrPtr, ListPtr, DictPtr, CallablePtr, ObjectPtr> v_;
};

// Backing store of lists and tuples. Growth is charged to the active budget.
struct ListObj {
    std::vector<Value> items;

    ListObj() = default;
    explicit ListObj(std::vector<Value> v);
    ~ListObj();
    ListObj(const ListObj&) = delete;
    ListObj& operator=(const ListObj&) = delete;

    // Re-synchronize the budget charge after `items` changed size.
    void sync();

private:
    uint64_t charged_{0};
};

// Insertion-ordered dict with hashable keys (None, bool, numbers, str, tuple).
struct DictObj {
    std::vector<Value> keys;
    std::vector<Value> vals;

    DictObj() = default;
    ~DictObj();
    DictObj(const DictObj&) = delete;
    DictObj& operator=(const DictObj&) = delete;

    bool get(const Value& k, Value* out) const;
    void set(const Value& k, Value v);
    bool erase(const Value& k);
    size_t size() const { return keys.size(); }

private:
    std::unordered_map<std::string, size_t> index_;
    uint64_t charged_{0};
    void sync();
};

// Canonical hash key; throws TypeError for unhashable values.
std::string hash_key(const Value& v);

class Interpreter;

struct CallArgs {
    std::vector<Value> pos;
    std::vector<std::pair<std::string, Value>> kw;

    size_t size() const { return pos.size(); }
    bool has_kw(const std::string& name) const;
    // Keyword or positional argument `i`, or `fallback` when absent.
    Value get(size_t i, const std::string& name, const Value& fallback = Value()) const;
    bool present(size_t i, const std::string& name) const;
    // Rejects keywords not in `allowed`.
    void check_kw(const char* fn, std::initializer_list<const char*> allowed) const;
    void check_max(const char* fn, size_t max_pos) const;
};

class Callable {
public:
    virtual ~Callable() = default;
    virtual std::string name() const = 0;
    virtual Value call(Interpreter& in, CallArgs& args) = 0;
};

// A host function exposed to scripts.
class NativeFunction : public Callable {
public:
    using Fn = std::function<Value(Interpreter&, CallArgs&)>;
    NativeFunction(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
    std::string name() const override { return name_; }
    Value call(Interpreter& in, CallArgs& args) override { return fn_(in, args); }

private:
    std::string name_;
    Fn fn_;
};

Value native(std::string name, NativeFunction::Fn fn);

// Base of every host object reachable from a script. The defaults reject
// the operation with the Python-style error a script author would expect.
class Object : public std::enable_shared_from_this<Object> {
public:
    virtual ~Object() = default;
    virtual std::string type_name() const = 0;

    virtual Value get_attr(const std::string& name);
    virtual void set_attr(const std::string& name, const Value& v);
    virtual Value get_item(Interpreter& in, const Value& key);
    virtual void set_item(const Value& key, const Value& v);
    virtual void del_item(const Value& key);

    virtual bool has_len() const { return false; }
    virtual size_t len() const { return 0; }
    virtual bool iterable() const { return false; }
    virtual std::vector<Value> iterate(Interpreter& in);

    // Operator hooks; return false when the operand combination is unsupported.
    virtual bool binary_op(Interpreter& in, const std::string& op, const Value& other, bool reflected, Value* out);
    virtual bool unary_op(Interpreter& in, const std::string& op, Value* out);
    virtual bool contains(Interpreter& in, const Value& v, bool* out);

    virtual std::string repr() const;
    virtual bool truthy() const { return true; }
};

// Named bag of attributes: np, pd, math, plt, mplsoccer.
class ModuleObject : public Object {
public:
    explicit ModuleObject(std::string name) : name_(std::move(name)) {}
    std::string type_name() const override { return "module"; }
    Value get_attr(const std::string& name) override;
    std::string repr() const override { return "<module '" + name_ + "'>"; }

    void define(const std::string& name, Value v) { attrs_[name] = std::move(v); }
    const std::map<std::string, Value>& attrs() const { return attrs_; }
    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::map<std::string, Value> attrs_;
};

// --- text rendering ---
std::string float_repr(double d);
std::string repr_value(const Value& v);
std::string str_value(const Value& v);
// Python format-spec mini language: [[fill]align][sign][,][0][width][.prec][type]
std::string format_value(const Value& v, const std::string& spec);

// Numeric helpers shared by the bindings.
bool is_truthy(const Value& v);
bool values_equal(const Value& a, const Value& b);
// -1/0/1 ordering; throws TypeError for unorderable pairs.
int compare_values(const Value& a, const Value& b);
double to_double(const Value& v, const char* what);
int64_t to_index(const Value& v, const char* what);
// Round half to even at `ndigits` decimals.
double round_half_even(double x, int ndigits);

} // namespace pitchbox::script
