#include "pitchbox/interp.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <numeric>

namespace pitchbox::script {

// ---------------------------------------------------------------------------
// helpers

namespace {

std::vector<std::string> utf8_chars(const std::string& s) {
    std::vector<std::string> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = (unsigned char)s[i];
        size_t n = 1;
        if (c >= 0xF0) n = 4;
        else if (c >= 0xE0) n = 3;
        else if (c >= 0xC0) n = 2;
        if (i + n > s.size()) n = s.size() - i;
        out.push_back(s.substr(i, n));
        i += n;
    }
    return out;
}

size_t utf8_len(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) if ((c & 0xC0) != 0x80) n++;
    return n;
}

int64_t normalize_index(int64_t i, size_t len, const char* what) {
    const int64_t n = (int64_t)len;
    if (i < 0) i += n;
    if (i < 0 || i >= n) throw ScriptError("IndexError", std::string(what) + " index out of range");
    return i;
}

Value make_str_list(const std::vector<std::string>& parts) {
    std::vector<Value> items;
    items.reserve(parts.size());
    for (const auto& p : parts) items.push_back(Value::str(p));
    return Value::list(std::move(items));
}

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

std::string strip_chars(const std::string& s, const Value& chars, bool left, bool right) {
    auto strip_it = [&](char c) {
        if (chars.is_none()) return is_space(c);
        return chars.as_str().find(c) != std::string::npos;
    };
    size_t b = 0, e = s.size();
    if (left) while (b < e && strip_it(s[b])) b++;
    if (right) while (e > b && strip_it(s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::string format_fields(const std::string& fmt, const CallArgs& args) {
    std::string out;
    size_t auto_idx = 0;
    for (size_t i = 0; i < fmt.size(); i++) {
        char c = fmt[i];
        if (c == '{') {
            if (i + 1 < fmt.size() && fmt[i + 1] == '{') { out.push_back('{'); i++; continue; }
            size_t close = fmt.find('}', i);
            if (close == std::string::npos) throw ScriptError("ValueError", "Single '{' encountered in format string");
            std::string field = fmt.substr(i + 1, close - i - 1);
            std::string spec;
            char conv = 0;
            size_t colon = field.find(':');
            if (colon != std::string::npos) { spec = field.substr(colon + 1); field.resize(colon); }
            size_t bang = field.find('!');
            if (bang != std::string::npos) {
                if (bang + 1 < field.size()) conv = field[bang + 1];
                field.resize(bang);
            }
            Value v;
            if (field.empty()) {
                if (auto_idx >= args.pos.size()) throw ScriptError("IndexError", "Replacement index out of range");
                v = args.pos[auto_idx++];
            } else if (std::all_of(field.begin(), field.end(), [](char d) { return d >= '0' && d <= '9'; })) {
                size_t idx = std::stoul(field);
                if (idx >= args.pos.size()) throw ScriptError("IndexError", "Replacement index out of range");
                v = args.pos[idx];
            } else {
                bool found = false;
                for (const auto& kv : args.kw) {
                    if (kv.first == field) { v = kv.second; found = true; break; }
                }
                if (!found) throw ScriptError("KeyError", "'" + field + "'");
            }
            if (conv == 'r') v = Value::str(repr_value(v));
            else if (conv == 's') v = Value::str(str_value(v));
            out += format_value(v, spec);
            i = close;
            continue;
        }
        if (c == '}') {
            if (i + 1 < fmt.size() && fmt[i + 1] == '}') { out.push_back('}'); i++; continue; }
            throw ScriptError("ValueError", "Single '}' encountered in format string");
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

bool Env::lookup(const std::string& name, Value* out) const {
    for (const Env* e = this; e; e = e->parent_.get()) {
        auto it = e->vars_.find(name);
        if (it != e->vars_.end()) {
            if (out) *out = it->second;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// range / slice

RangeObject::RangeObject(int64_t start, int64_t stop, int64_t step) : start_(start), stop_(stop), step_(step) {
    if (step == 0) throw ScriptError("ValueError", "range() arg 3 must not be zero");
    if (step > 0) count_ = start < stop ? (size_t)((stop - start - 1) / step + 1) : 0;
    else count_ = start > stop ? (size_t)((start - stop - 1) / (-step) + 1) : 0;
}

std::vector<Value> RangeObject::iterate(Interpreter&) {
    budget_check((uint64_t)count_ * sizeof(Value));
    std::vector<Value> out;
    out.reserve(count_);
    for (size_t i = 0; i < count_; i++) out.push_back(Value::integer(at(i)));
    return out;
}

Value RangeObject::get_item(Interpreter&, const Value& key) {
    return Value::integer(at((size_t)normalize_index(to_index(key, "range"), count_, "range object")));
}

bool RangeObject::contains(Interpreter&, const Value& v, bool* out) {
    if (!v.is_number()) { *out = false; return true; }
    const double d = v.as_float();
    if (d != std::floor(d)) { *out = false; return true; }
    const int64_t x = (int64_t)d;
    if (step_ > 0) *out = x >= start_ && x < stop_ && (x - start_) % step_ == 0;
    else *out = x <= start_ && x > stop_ && (start_ - x) % (-step_) == 0;
    return true;
}

std::string RangeObject::repr() const {
    std::string s = "range(" + std::to_string(start_) + ", " + std::to_string(stop_);
    if (step_ != 1) s += ", " + std::to_string(step_);
    return s + ")";
}

void SliceObject::indices(size_t len, int64_t* start, int64_t* stop, int64_t* stride) const {
    const int64_t n = (int64_t)len;
    const int64_t st = step.value_or(1);
    if (st == 0) throw ScriptError("ValueError", "slice step cannot be zero");
    auto clamp = [&](std::optional<int64_t> v, int64_t dflt) -> int64_t {
        if (!v) return dflt;
        int64_t x = *v;
        if (x < 0) {
            x += n;
            if (x < 0) x = st < 0 ? -1 : 0;
        } else if (x >= n) {
            x = st < 0 ? n - 1 : n;
        }
        return x;
    };
    *start = clamp(lower, st < 0 ? n - 1 : 0);
    *stop = clamp(upper, st < 0 ? -1 : n);
    *stride = st;
}

std::vector<size_t> SliceObject::positions(size_t len) const {
    int64_t start = 0, stop = 0, stride = 1;
    indices(len, &start, &stop, &stride);
    std::vector<size_t> out;
    if (stride > 0) for (int64_t i = start; i < stop; i += stride) out.push_back((size_t)i);
    else for (int64_t i = start; i > stop; i += stride) out.push_back((size_t)i);
    return out;
}

// ---------------------------------------------------------------------------
// user functions

class UserFunction : public Callable {
public:
    std::string fname;
    const std::vector<Param>* params{nullptr};
    std::vector<std::optional<Value>> defaults;
    const std::vector<StmtPtr>* body{nullptr};
    const Expr* expr_body{nullptr};
    std::shared_ptr<Env> closure;

    std::string name() const override { return fname; }
    Value call(Interpreter& in, CallArgs& args) override { return in.invoke_user(*this, args); }
};

Value Interpreter::invoke_user(const UserFunction& fn, CallArgs& args) {
    const auto& ps = *fn.params;
    if (args.pos.size() > ps.size()) {
        throw ScriptError("TypeError", fn.fname + "() takes " + std::to_string(ps.size()) +
                                           " positional arguments but " + std::to_string(args.pos.size()) +
                                           " were given");
    }
    auto env = std::make_shared<Env>(fn.closure);
    std::vector<bool> bound(ps.size(), false);
    for (size_t i = 0; i < args.pos.size(); i++) {
        env->set(ps[i].name, args.pos[i]);
        bound[i] = true;
    }
    for (const auto& kv : args.kw) {
        size_t idx = ps.size();
        for (size_t i = 0; i < ps.size(); i++) if (ps[i].name == kv.first) { idx = i; break; }
        if (idx == ps.size()) {
            throw ScriptError("TypeError", fn.fname + "() got an unexpected keyword argument '" + kv.first + "'");
        }
        if (bound[idx]) throw ScriptError("TypeError", fn.fname + "() got multiple values for argument '" + kv.first + "'");
        env->set(kv.first, kv.second);
        bound[idx] = true;
    }
    for (size_t i = 0; i < ps.size(); i++) {
        if (bound[i]) continue;
        if (!fn.defaults[i]) {
            throw ScriptError("TypeError", fn.fname + "() missing required argument: '" + ps[i].name + "'");
        }
        env->set(ps[i].name, *fn.defaults[i]);
    }

    if (call_depth_ >= limits_.max_call_depth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded");
    }
    struct DepthGuard {
        int* d;
        explicit DepthGuard(int* dd) : d(dd) { ++*d; }
        ~DepthGuard() { --*d; }
    } guard(&call_depth_);

    Frame f;
    f.env = env;
    if (fn.expr_body) return eval(*fn.expr_body, f);
    Flow fl = exec_block(*fn.body, f);
    if (fl == Flow::Break || fl == Flow::Continue) {
        throw ScriptError("SyntaxError", "'break' or 'continue' outside loop");
    }
    return fl == Flow::Return ? f.ret : Value();
}

// ---------------------------------------------------------------------------
// Interpreter

Interpreter::Interpreter(InterpLimits limits)
    : limits_(limits),
      budget_(limits.memory_limit_bytes),
      builtins_(std::make_shared<Env>()),
      globals_(std::make_shared<Env>(builtins_)) {}

void Interpreter::run(const Module& m) {
    MemoryBudget::Scope scope(&budget_);
    Frame f;
    f.env = globals_;
    Flow fl = exec_block(m.body, f);
    if (fl == Flow::Return) throw ScriptError("SyntaxError", "'return' outside function");
    if (fl != Flow::Normal) throw ScriptError("SyntaxError", "'break' or 'continue' outside loop");
}

Interpreter::Flow Interpreter::exec_block(const std::vector<StmtPtr>& body, Frame& f) {
    for (const auto& s : body) {
        Flow fl = exec(*s, f);
        if (fl != Flow::Normal) return fl;
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec(const Stmt& s, Frame& f) {
    try {
        switch (s.kind) {
            case StmtKind::Expr:
                (void)eval(*s.value, f);
                return Flow::Normal;
            case StmtKind::Assign: {
                Value v = eval(*s.value, f);
                for (const auto& t : s.targets) assign(*t, v, f);
                return Flow::Normal;
            }
            case StmtKind::AugAssign: {
                Value cur = eval(*s.target, f);
                Value rhs = eval(*s.value, f);
                if (cur.is_list() && s.name == "+") {
                    auto& lst = *cur.as_list();
                    std::vector<Value> extra = iterate(rhs);
                    budget_check(extra.size() * sizeof(Value));
                    lst.items.insert(lst.items.end(), extra.begin(), extra.end());
                    lst.sync();
                    return Flow::Normal;
                }
                assign(*s.target, binary(s.name, cur, rhs), f);
                return Flow::Normal;
            }
            case StmtKind::If:
                if (is_truthy(eval(*s.value, f))) return exec_block(s.body, f);
                return exec_block(s.orelse, f);
            case StmtKind::While: {
                while (is_truthy(eval(*s.value, f))) {
                    Flow fl = exec_block(s.body, f);
                    if (fl == Flow::Break) return Flow::Normal;
                    if (fl == Flow::Return) return fl;
                }
                return exec_block(s.orelse, f);
            }
            case StmtKind::For:
                return exec_for(s, f);
            case StmtKind::Break:
                return Flow::Break;
            case StmtKind::Continue:
                return Flow::Continue;
            case StmtKind::Pass:
                return Flow::Normal;
            case StmtKind::FunctionDef: {
                auto fn = std::make_shared<UserFunction>();
                fn->fname = s.name;
                fn->params = &s.params;
                for (const auto& p : s.params) {
                    if (p.default_value) fn->defaults.emplace_back(eval(*p.default_value, f));
                    else fn->defaults.emplace_back(std::nullopt);
                }
                fn->body = &s.body;
                fn->closure = f.env;
                f.env->set(s.name, Value::callable(fn));
                return Flow::Normal;
            }
            case StmtKind::Return:
                f.ret = s.value ? eval(*s.value, f) : Value();
                return Flow::Return;
            case StmtKind::Import:
            case StmtKind::ImportFrom:
                exec_import(s, f);
                return Flow::Normal;
            case StmtKind::Global:
            case StmtKind::Nonlocal:
                throw ScriptError("SyntaxError", "scope declarations are not supported");
            case StmtKind::Del:
                for (const auto& t : s.targets) del(*t, f);
                return Flow::Normal;
            case StmtKind::Assert:
                if (!is_truthy(eval(*s.value, f))) {
                    std::string msg = s.target ? str_value(eval(*s.target, f)) : std::string("assertion failed");
                    throw ScriptError("AssertionError", msg);
                }
                return Flow::Normal;
        }
    } catch (ScriptError& e) {
        e.set_line(s.line);
        throw;
    }
    return Flow::Normal;
}

Interpreter::Flow Interpreter::exec_for(const Stmt& s, Frame& f) {
    Value it = eval(*s.value, f);
    auto body = [&](const Value& item) -> Flow {
        assign(*s.target, item, f);
        return exec_block(s.body, f);
    };
    if (it.is_object()) {
        if (auto r = std::dynamic_pointer_cast<RangeObject>(it.as_object())) {
            for (size_t i = 0; i < r->len(); i++) {
                Flow fl = body(Value::integer(r->at(i)));
                if (fl == Flow::Break) return Flow::Normal;
                if (fl == Flow::Return) return fl;
            }
            return exec_block(s.orelse, f);
        }
    }
    std::vector<Value> items = iterate(it);
    for (const auto& item : items) {
        Flow fl = body(item);
        if (fl == Flow::Break) return Flow::Normal;
        if (fl == Flow::Return) return fl;
    }
    return exec_block(s.orelse, f);
}

Value Interpreter::resolve_module(const std::string& module) {
    Value v;
    if (!resolver_ || !resolver_(module, &v)) {
        throw ScriptError("ImportError", "No module named '" + module + "' in this sandbox");
    }
    return v;
}

void Interpreter::exec_import(const Stmt& s, Frame& f) {
    if (s.kind == StmtKind::Import) {
        for (const auto& a : s.names) {
            Value mod = resolve_module(a.name);
            if (!a.asname.empty()) {
                f.env->set(a.asname, mod);
                continue;
            }
            size_t dot = a.name.find('.');
            if (dot == std::string::npos) {
                f.env->set(a.name, mod);
                continue;
            }
            // `import a.b.c` binds `a` with the chain a.b.c reachable from it
            std::vector<std::string> parts;
            size_t start = 0;
            while (true) {
                size_t d = a.name.find('.', start);
                parts.push_back(a.name.substr(start, d == std::string::npos ? std::string::npos : d - start));
                if (d == std::string::npos) break;
                start = d + 1;
            }
            Value inner = mod;
            for (size_t i = parts.size() - 1; i > 0; i--) {
                std::string prefix;
                for (size_t k = 0; k < i; k++) prefix += (k ? "." : "") + parts[k];
                auto holder = std::make_shared<ModuleObject>(prefix);
                holder->define(parts[i], inner);
                inner = Value::object(holder);
            }
            f.env->set(parts[0], inner);
        }
        return;
    }
    for (const auto& a : s.names) {
        if (a.name == "*") {
            Value mod = resolve_module(s.name);
            auto mo = mod.is_object() ? std::dynamic_pointer_cast<ModuleObject>(mod.as_object()) : nullptr;
            if (!mo) throw ScriptError("ImportError", "cannot import * from '" + s.name + "'");
            for (const auto& kv : mo->attrs()) f.env->set(kv.first, kv.second);
            continue;
        }
        Value v;
        if (resolver_ && resolver_(s.name + "." + a.name, &v)) {
            // submodule
        } else {
            Value mod = resolve_module(s.name);
            try {
                v = get_attr(mod, a.name);
            } catch (const ScriptError&) {
                throw ScriptError("ImportError", "cannot import name '" + a.name + "' from '" + s.name + "'");
            }
        }
        f.env->set(a.asname.empty() ? a.name : a.asname, v);
    }
}

void Interpreter::assign(const Expr& target, const Value& v, Frame& f) {
    switch (target.kind) {
        case ExprKind::Name:
            f.env->set(target.text, v);
            return;
        case ExprKind::Tuple:
        case ExprKind::List: {
            std::vector<Value> items = iterate(v);
            if (items.size() != target.items.size()) {
                throw ScriptError("ValueError", items.size() < target.items.size()
                    ? "not enough values to unpack (expected " + std::to_string(target.items.size()) + ", got " +
                          std::to_string(items.size()) + ")"
                    : "too many values to unpack (expected " + std::to_string(target.items.size()) + ")");
            }
            for (size_t i = 0; i < items.size(); i++) assign(*target.items[i], items[i], f);
            return;
        }
        case ExprKind::Subscript: {
            Value obj = eval(*target.a, f);
            Value key = eval(*target.b, f);
            if (obj.is_list()) {
                auto& items = obj.as_list()->items;
                items[(size_t)normalize_index(to_index(key, "list"), items.size(), "list assignment")] = v;
                return;
            }
            if (obj.is_dict()) {
                obj.as_dict()->set(key, v);
                return;
            }
            if (obj.is_object()) {
                obj.as_object()->set_item(key, v);
                return;
            }
            throw ScriptError("TypeError", std::string("'") + obj.type_name() + "' object does not support item assignment");
        }
        case ExprKind::Attribute: {
            Value obj = eval(*target.a, f);
            if (obj.is_object()) {
                obj.as_object()->set_attr(target.text, v);
                return;
            }
            throw ScriptError("AttributeError", std::string("'") + obj.type_name() + "' object attribute '" +
                                                    target.text + "' is read-only");
        }
        default:
            throw ScriptError("SyntaxError", "cannot assign to expression");
    }
}

void Interpreter::del(const Expr& target, Frame& f) {
    switch (target.kind) {
        case ExprKind::Name:
            if (!f.env->erase(target.text)) throw ScriptError("NameError", "name '" + target.text + "' is not defined");
            return;
        case ExprKind::Tuple:
        case ExprKind::List:
            for (const auto& t : target.items) del(*t, f);
            return;
        case ExprKind::Subscript: {
            Value obj = eval(*target.a, f);
            Value key = eval(*target.b, f);
            if (obj.is_list()) {
                auto& lst = *obj.as_list();
                int64_t i = normalize_index(to_index(key, "list"), lst.items.size(), "list assignment");
                lst.items.erase(lst.items.begin() + i);
                lst.sync();
                return;
            }
            if (obj.is_dict()) {
                if (!obj.as_dict()->erase(key)) throw ScriptError("KeyError", repr_value(key));
                return;
            }
            if (obj.is_object()) {
                obj.as_object()->del_item(key);
                return;
            }
            throw ScriptError("TypeError", std::string("'") + obj.type_name() + "' object does not support item deletion");
        }
        default:
            throw ScriptError("SyntaxError", "cannot delete expression");
    }
}

Value Interpreter::lookup(const std::string& name, const Frame& f) const {
    Value v;
    if (f.env->lookup(name, &v)) return v;
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

Value Interpreter::eval(const Expr& e, Frame& f) {
    try {
        switch (e.kind) {
            case ExprKind::Name: return lookup(e.text, f);
            case ExprKind::Int: return Value::integer(e.ival);
            case ExprKind::Float: return Value::number(e.fval);
            case ExprKind::Str: return Value::str(e.text);
            case ExprKind::Bool: return Value::boolean(e.bval);
            case ExprKind::NoneLit: return Value();
            case ExprKind::FString: return eval_fstring(e, f);
            case ExprKind::FormattedValue: {
                Value v = eval(*e.a, f);
                if (e.conversion == 'r' || e.conversion == 'a') v = Value::str(repr_value(v));
                else if (e.conversion == 's') v = Value::str(str_value(v));
                return Value::str(format_value(v, e.text));
            }
            case ExprKind::List:
            case ExprKind::Tuple: {
                std::vector<Value> items;
                items.reserve(e.items.size());
                for (const auto& it : e.items) items.push_back(eval(*it, f));
                return e.kind == ExprKind::List ? Value::list(std::move(items)) : Value::tuple(std::move(items));
            }
            case ExprKind::Dict: {
                auto d = std::make_shared<DictObj>();
                for (size_t i = 0; i < e.items.size(); i++) {
                    Value k = eval(*e.items[i], f);
                    d->set(k, eval(*e.values[i], f));
                }
                return Value::dict_ref(d);
            }
            case ExprKind::BinOp: {
                Value a = eval(*e.a, f);
                Value b = eval(*e.b, f);
                return binary(e.text, a, b);
            }
            case ExprKind::UnaryOp: {
                Value a = eval(*e.a, f);
                if (e.text == "not") return Value::boolean(!is_truthy(a));
                if (a.is_object()) {
                    Value out;
                    if (a.as_object()->unary_op(*this, e.text, &out)) return out;
                    throw ScriptError("TypeError", "bad operand type for unary " + e.text + ": '" +
                                                       a.as_object()->type_name() + "'");
                }
                if (!a.is_number()) {
                    throw ScriptError("TypeError", "bad operand type for unary " + e.text + ": '" + a.type_name() + "'");
                }
                if (e.text == "+") return a.is_bool() ? Value::integer(a.as_int()) : a;
                if (e.text == "-") {
                    if (a.is_float()) return Value::number(-a.as_float());
                    if (a.as_int() == INT64_MIN) return Value::number(-(double)a.as_int());
                    return Value::integer(-a.as_int());
                }
                if (e.text == "~") {
                    if (a.is_float()) throw ScriptError("TypeError", "bad operand type for unary ~: 'float'");
                    return Value::integer(~a.as_int());
                }
                throw ScriptError("SyntaxError", "unknown unary operator " + e.text);
            }
            case ExprKind::BoolOp: {
                Value v;
                for (const auto& it : e.items) {
                    v = eval(*it, f);
                    const bool t = is_truthy(v);
                    if (e.text == "and" ? !t : t) return v;
                }
                return v;
            }
            case ExprKind::Compare: return eval_compare(e, f);
            case ExprKind::Call: return eval_call(e, f);
            case ExprKind::Attribute: return get_attr(eval(*e.a, f), e.text);
            case ExprKind::Subscript: {
                Value obj = eval(*e.a, f);
                Value key = eval(*e.b, f);
                return subscript(obj, key);
            }
            case ExprKind::Slice: {
                auto sl = std::make_shared<SliceObject>();
                auto bound = [&](const ExprPtr& p) -> std::optional<int64_t> {
                    if (!p) return std::nullopt;
                    Value v = eval(*p, f);
                    if (v.is_none()) return std::nullopt;
                    return to_index(v, "slice");
                };
                sl->lower = bound(e.a);
                sl->upper = bound(e.b);
                sl->step = bound(e.c);
                return Value::object(sl);
            }
            case ExprKind::IfExp:
                return is_truthy(eval(*e.b, f)) ? eval(*e.a, f) : eval(*e.c, f);
            case ExprKind::ListComp: return eval_listcomp(e, f);
            case ExprKind::Lambda: {
                auto fn = std::make_shared<UserFunction>();
                fn->fname = "<lambda>";
                fn->params = &e.params;
                for (const auto& p : e.params) {
                    if (p.default_value) fn->defaults.emplace_back(eval(*p.default_value, f));
                    else fn->defaults.emplace_back(std::nullopt);
                }
                fn->expr_body = e.a.get();
                fn->closure = f.env;
                return Value::callable(fn);
            }
            case ExprKind::Starred:
                throw ScriptError("SyntaxError", "can't use starred expression here");
        }
    } catch (ScriptError& err) {
        err.set_line(e.line);
        throw;
    }
    return Value();
}

Value Interpreter::eval_fstring(const Expr& e, Frame& f) {
    std::string out;
    for (const auto& part : e.items) {
        Value v = eval(*part, f);
        out += v.is_str() ? v.as_str() : str_value(v);
        budget_check(out.size());
    }
    return Value::str(std::move(out));
}

Value Interpreter::eval_compare(const Expr& e, Frame& f) {
    Value left = eval(*e.a, f);
    for (size_t i = 0; i < e.cmp_ops.size(); i++) {
        Value right = eval(*e.items[i], f);
        const std::string& op = e.cmp_ops[i];
        // element-wise comparisons on host objects (series masks) yield a value
        if ((left.is_object() || right.is_object()) && op != "in" && op != "not in" && op != "is" && op != "is not") {
            Value out;
            bool handled = false;
            if (left.is_object()) handled = left.as_object()->binary_op(*this, op, right, false, &out);
            if (!handled && right.is_object()) handled = right.as_object()->binary_op(*this, op, left, true, &out);
            if (handled && !out.is_bool()) {
                if (e.cmp_ops.size() == 1) return out;
                throw ScriptError("ValueError", "chained comparison of element-wise values is ambiguous");
            }
            if (handled) {
                if (!out.as_bool()) return Value::boolean(false);
                left = right;
                continue;
            }
        }
        if (!compare(op, left, right)) return Value::boolean(false);
        left = right;
    }
    return Value::boolean(true);
}

bool Interpreter::compare(const std::string& op, const Value& a, const Value& b) {
    if (op == "==") return values_equal(a, b);
    if (op == "!=") return !values_equal(a, b);
    if (op == "in") return contains(b, a);
    if (op == "not in") return !contains(b, a);
    if (op == "is" || op == "is not") {
        bool same;
        if (a.is_none() || b.is_none()) same = a.is_none() && b.is_none();
        else if (a.type() != b.type()) same = false;
        else if (a.is_bool() || a.is_int() || a.is_float() || a.is_str()) same = values_equal(a, b);
        else if (a.is_sequence()) same = a.as_list() == b.as_list();
        else same = values_equal(a, b);
        return op == "is" ? same : !same;
    }
    int c = 0;
    try {
        c = compare_values(a, b);
    } catch (const ScriptError&) {
        throw ScriptError("TypeError", "'" + op + "' not supported between instances of '" + a.type_name() +
                                           "' and '" + b.type_name() + "'");
    }
    if ((a.is_float() && std::isnan(a.as_float())) || (b.is_float() && std::isnan(b.as_float()))) return false;
    if (op == "<") return c < 0;
    if (op == "<=") return c <= 0;
    if (op == ">") return c > 0;
    if (op == ">=") return c >= 0;
    throw ScriptError("SyntaxError", "unknown comparison " + op);
}

bool Interpreter::contains(const Value& container, const Value& item) {
    switch (container.type()) {
        case Value::Type::Str:
            if (!item.is_str()) throw ScriptError("TypeError", "'in <string>' requires string as left operand");
            return container.as_str().find(item.as_str()) != std::string::npos;
        case Value::Type::List:
        case Value::Type::Tuple:
            for (const auto& v : container.as_list()->items)
                if (values_equal(v, item)) return true;
            return false;
        case Value::Type::Dict:
            return container.as_dict()->get(item, nullptr);
        case Value::Type::Object: {
            bool out = false;
            if (container.as_object()->contains(*this, item, &out)) return out;
            for (const auto& v : iterate(container))
                if (values_equal(v, item)) return true;
            return false;
        }
        default:
            throw ScriptError("TypeError", std::string("argument of type '") + container.type_name() + "' is not iterable");
    }
}

Value Interpreter::eval_call(const Expr& e, Frame& f) {
    Value fn = eval(*e.a, f);
    CallArgs args;
    for (const auto& a : e.items) {
        if (a->kind == ExprKind::Starred) {
            for (auto& v : iterate(eval(*a->a, f))) args.pos.push_back(std::move(v));
        } else {
            args.pos.push_back(eval(*a, f));
        }
    }
    for (const auto& kw : e.keywords) args.kw.emplace_back(kw.name, eval(*kw.value, f));
    return call(fn, args);
}

Value Interpreter::call(const Value& fn, CallArgs& args) {
    if (!fn.is_callable()) {
        std::string tn = fn.is_object() ? fn.as_object()->type_name() : fn.type_name();
        throw ScriptError("TypeError", "'" + tn + "' object is not callable");
    }
    return fn.as_callable()->call(*this, args);
}

Value Interpreter::call(const Value& fn, std::vector<Value> pos) {
    CallArgs args;
    args.pos = std::move(pos);
    return call(fn, args);
}

Value Interpreter::eval_listcomp(const Expr& e, Frame& f) {
    Frame inner;
    inner.env = std::make_shared<Env>(f.env);
    std::vector<Value> out;
    comp_level(e, 0, inner, &out);
    budget_check(out.size() * sizeof(Value));
    return Value::list(std::move(out));
}

void Interpreter::comp_level(const Expr& e, size_t gen, Frame& f, std::vector<Value>* out) {
    if (gen == e.generators.size()) {
        out->push_back(eval(*e.a, f));
        if ((out->size() & 0xFFF) == 0) budget_check(out->size() * sizeof(Value));
        return;
    }
    const Comprehension& g = e.generators[gen];
    Value src = eval(*g.iter, f);
    auto visit = [&](const Value& item) {
        assign(*g.target, item, f);
        for (const auto& c : g.conds)
            if (!is_truthy(eval(*c, f))) return;
        comp_level(e, gen + 1, f, out);
    };
    if (src.is_object()) {
        if (auto r = std::dynamic_pointer_cast<RangeObject>(src.as_object())) {
            for (size_t i = 0; i < r->len(); i++) visit(Value::integer(r->at(i)));
            return;
        }
    }
    for (const auto& item : iterate(src)) visit(item);
}

std::vector<Value> Interpreter::iterate(const Value& v) {
    switch (v.type()) {
        case Value::Type::List:
        case Value::Type::Tuple:
            return v.as_list()->items;
        case Value::Type::Str: {
            std::vector<Value> out;
            for (auto& ch : utf8_chars(v.as_str())) out.push_back(Value::str(std::move(ch)));
            return out;
        }
        case Value::Type::Dict:
            return v.as_dict()->keys;
        case Value::Type::Object:
            if (v.as_object()->iterable()) return v.as_object()->iterate(*this);
            throw ScriptError("TypeError", "'" + v.as_object()->type_name() + "' object is not iterable");
        default:
            throw ScriptError("TypeError", std::string("'") + v.type_name() + "' object is not iterable");
    }
}

size_t Interpreter::length(const Value& v) {
    switch (v.type()) {
        case Value::Type::Str: return utf8_len(v.as_str());
        case Value::Type::List:
        case Value::Type::Tuple: return v.as_list()->items.size();
        case Value::Type::Dict: return v.as_dict()->size();
        case Value::Type::Object:
            if (v.as_object()->has_len()) return v.as_object()->len();
            throw ScriptError("TypeError", "object of type '" + v.as_object()->type_name() + "' has no len()");
        default:
            throw ScriptError("TypeError", std::string("object of type '") + v.type_name() + "' has no len()");
    }
}

Value Interpreter::subscript(const Value& obj, const Value& key) {
    std::shared_ptr<SliceObject> sl;
    if (key.is_object()) sl = std::dynamic_pointer_cast<SliceObject>(key.as_object());

    switch (obj.type()) {
        case Value::Type::List:
        case Value::Type::Tuple: {
            const auto& items = obj.as_list()->items;
            if (sl) {
                std::vector<Value> out;
                for (size_t p : sl->positions(items.size())) out.push_back(items[p]);
                return obj.is_list() ? Value::list(std::move(out)) : Value::tuple(std::move(out));
            }
            return items[(size_t)normalize_index(to_index(key, obj.type_name()), items.size(), obj.type_name())];
        }
        case Value::Type::Str: {
            std::vector<std::string> chars = utf8_chars(obj.as_str());
            if (sl) {
                std::string out;
                for (size_t p : sl->positions(chars.size())) out += chars[p];
                return Value::str(std::move(out));
            }
            return Value::str(chars[(size_t)normalize_index(to_index(key, "string"), chars.size(), "string")]);
        }
        case Value::Type::Dict: {
            Value out;
            if (!obj.as_dict()->get(key, &out)) throw ScriptError("KeyError", repr_value(key));
            return out;
        }
        case Value::Type::Object:
            return obj.as_object()->get_item(*this, key);
        default:
            throw ScriptError("TypeError", std::string("'") + obj.type_name() + "' object is not subscriptable");
    }
}

Value Interpreter::get_attr(const Value& obj, const std::string& name) {
    if (name.compare(0, 2, "__") == 0) {
        throw ScriptError("AttributeError", "access to '" + name + "' is not permitted");
    }
    switch (obj.type()) {
        case Value::Type::Object: return obj.as_object()->get_attr(name);
        case Value::Type::Str: return str_method(obj, name);
        case Value::Type::List:
        case Value::Type::Tuple: return list_method(obj, name);
        case Value::Type::Dict: return dict_method(obj, name);
        case Value::Type::Float:
            if (name == "is_integer") {
                const double d = obj.as_float();
                return native("is_integer", [d](Interpreter&, CallArgs&) {
                    return Value::boolean(std::isfinite(d) && d == std::floor(d));
                });
            }
            break;
        default:
            break;
    }
    throw ScriptError("AttributeError", std::string("'") + obj.type_name() + "' object has no attribute '" + name + "'");
}

std::vector<Value> Interpreter::sorted(std::vector<Value> items, const Value& key, bool reverse) {
    std::vector<Value> keys;
    keys.reserve(items.size());
    for (const auto& it : items) keys.push_back(key.is_none() ? it : call(key, std::vector<Value>{it}));
    std::vector<size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
        return reverse ? compare_values(keys[y], keys[x]) < 0 : compare_values(keys[x], keys[y]) < 0;
    });
    std::vector<Value> out;
    out.reserve(items.size());
    for (size_t i : order) out.push_back(std::move(items[i]));
    return out;
}

// ---------------------------------------------------------------------------
// arithmetic

Value numeric_binary(const std::string& op, const Value& a, const Value& b) {
    const bool ints = !a.is_float() && !b.is_float();
    if (ints) {
        const int64_t x = a.as_int(), y = b.as_int();
        int64_t r = 0;
        if (op == "+") {
            if (__builtin_add_overflow(x, y, &r)) return Value::number((double)x + (double)y);
            return Value::integer(r);
        }
        if (op == "-") {
            if (__builtin_sub_overflow(x, y, &r)) return Value::number((double)x - (double)y);
            return Value::integer(r);
        }
        if (op == "*") {
            if (__builtin_mul_overflow(x, y, &r)) return Value::number((double)x * (double)y);
            return Value::integer(r);
        }
        if (op == "/") {
            if (y == 0) throw ScriptError("ZeroDivisionError", "division by zero");
            return Value::number((double)x / (double)y);
        }
        if (op == "//") {
            if (y == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
            if (x == INT64_MIN && y == -1) return Value::number(-(double)x);
            int64_t q = x / y;
            if ((x % y != 0) && ((x < 0) != (y < 0))) q--;
            return Value::integer(q);
        }
        if (op == "%") {
            if (y == 0) throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
            if (y == -1) return Value::integer(0);
            int64_t m = x % y;
            if (m != 0 && ((m < 0) != (y < 0))) m += y;
            return Value::integer(m);
        }
        if (op == "**") {
            if (y < 0) {
                if (x == 0) throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
                return Value::number(std::pow((double)x, (double)y));
            }
            int64_t result = 1, base = x, e = y;
            bool overflow = false;
            while (e > 0 && !overflow) {
                if (e & 1) overflow = __builtin_mul_overflow(result, base, &result);
                e >>= 1;
                if (e > 0 && !overflow) overflow = __builtin_mul_overflow(base, base, &base);
            }
            if (overflow) return Value::number(std::pow((double)x, (double)y));
            return Value::integer(result);
        }
        if (op == "&" || op == "|" || op == "^") {
            int64_t v = op == "&" ? (x & y) : (op == "|" ? (x | y) : (x ^ y));
            if (a.is_bool() && b.is_bool()) return Value::boolean(v != 0);
            return Value::integer(v);
        }
    } else {
        const double x = a.as_float(), y = b.as_float();
        if (op == "+") return Value::number(x + y);
        if (op == "-") return Value::number(x - y);
        if (op == "*") return Value::number(x * y);
        if (op == "/") {
            if (y == 0.0) throw ScriptError("ZeroDivisionError", "float division by zero");
            return Value::number(x / y);
        }
        if (op == "//") {
            if (y == 0.0) throw ScriptError("ZeroDivisionError", "float floor division by zero");
            return Value::number(std::floor(x / y));
        }
        if (op == "%") {
            if (y == 0.0) throw ScriptError("ZeroDivisionError", "float modulo");
            double m = std::fmod(x, y);
            if (m != 0.0 && ((m < 0) != (y < 0))) m += y;
            return Value::number(m);
        }
        if (op == "**") {
            if (x == 0.0 && y < 0) throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            if (x < 0 && y != std::floor(y)) throw ScriptError("ValueError", "math domain error");
            return Value::number(std::pow(x, y));
        }
    }
    throw ScriptError("TypeError", "unsupported operand type(s) for " + op + ": '" + a.type_name() + "' and '" +
                                       b.type_name() + "'");
}

Value Interpreter::binary(const std::string& op, const Value& a, const Value& b) {
    if (a.is_object() || b.is_object()) {
        Value out;
        if (a.is_object() && a.as_object()->binary_op(*this, op, b, false, &out)) return out;
        if (b.is_object() && b.as_object()->binary_op(*this, op, a, true, &out)) return out;
        std::string an = a.is_object() ? a.as_object()->type_name() : a.type_name();
        std::string bn = b.is_object() ? b.as_object()->type_name() : b.type_name();
        throw ScriptError("TypeError", "unsupported operand type(s) for " + op + ": '" + an + "' and '" + bn + "'");
    }
    if (a.is_number() && b.is_number()) return numeric_binary(op, a, b);

    if (op == "+") {
        if (a.is_str() && b.is_str()) {
            budget_check(a.as_str().size() + b.as_str().size());
            return Value::str(a.as_str() + b.as_str());
        }
        if (a.is_sequence() && a.type() == b.type()) {
            const auto& x = a.as_list()->items;
            const auto& y = b.as_list()->items;
            budget_check((x.size() + y.size()) * sizeof(Value));
            std::vector<Value> out;
            out.reserve(x.size() + y.size());
            out.insert(out.end(), x.begin(), x.end());
            out.insert(out.end(), y.begin(), y.end());
            return a.is_list() ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
    }
    if (op == "*") {
        const Value* seq = nullptr;
        const Value* count = nullptr;
        if ((a.is_str() || a.is_sequence()) && (b.is_int() || b.is_bool())) { seq = &a; count = &b; }
        if ((b.is_str() || b.is_sequence()) && (a.is_int() || a.is_bool())) { seq = &b; count = &a; }
        if (seq) {
            const int64_t n = std::max<int64_t>(0, count->as_int());
            if (seq->is_str()) {
                const uint64_t unit = seq->as_str().size();
                if (unit && (uint64_t)n > UINT64_MAX / unit) throw ResourceLimitError("memory limit exceeded: string repetition");
                budget_check(unit * (uint64_t)n);
                std::string out;
                out.reserve(unit * (uint64_t)n);
                for (int64_t i = 0; i < n; i++) out += seq->as_str();
                return Value::str(std::move(out));
            }
            const auto& items = seq->as_list()->items;
            const uint64_t unit = items.size() * sizeof(Value);
            if (unit && (uint64_t)n > UINT64_MAX / unit) throw ResourceLimitError("memory limit exceeded: sequence repetition");
            budget_check(unit * (uint64_t)n);
            std::vector<Value> out;
            out.reserve(items.size() * (size_t)n);
            for (int64_t i = 0; i < n; i++) out.insert(out.end(), items.begin(), items.end());
            return seq->is_list() ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
    }
    if (op == "%" && a.is_str()) return Value::str(percent_format(a.as_str(), b));

    throw ScriptError("TypeError", "unsupported operand type(s) for " + op + ": '" + a.type_name() + "' and '" +
                                       b.type_name() + "'");
}

std::string percent_format(const std::string& fmt, const Value& args) {
    std::vector<Value> vals;
    if (args.is_tuple()) vals = args.as_list()->items;
    else vals.push_back(args);
    size_t next = 0;
    std::string out;
    for (size_t i = 0; i < fmt.size(); i++) {
        if (fmt[i] != '%') { out.push_back(fmt[i]); continue; }
        if (++i >= fmt.size()) throw ScriptError("ValueError", "incomplete format");
        if (fmt[i] == '%') { out.push_back('%'); continue; }
        std::string flags, width, prec;
        while (i < fmt.size() && (fmt[i] == '-' || fmt[i] == '+' || fmt[i] == '0' || fmt[i] == ' ')) flags.push_back(fmt[i++]);
        while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) width.push_back(fmt[i++]);
        if (i < fmt.size() && fmt[i] == '.') {
            i++;
            prec = "0";
            std::string p;
            while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) p.push_back(fmt[i++]);
            if (!p.empty()) prec = p;
        }
        if (i >= fmt.size()) throw ScriptError("ValueError", "incomplete format");
        char conv = fmt[i];
        if (next >= vals.size()) throw ScriptError("TypeError", "not enough arguments for format string");
        Value v = vals[next++];

        std::string spec;
        if (flags.find('-') != std::string::npos) spec += '<';
        if (flags.find('+') != std::string::npos) spec += '+';
        else if (flags.find(' ') != std::string::npos) spec += ' ';
        if (flags.find('0') != std::string::npos && flags.find('-') == std::string::npos) spec += '0';
        spec += width;
        switch (conv) {
            case 's':
            case 'r':
                v = Value::str(conv == 's' ? str_value(v) : repr_value(v));
                if (!prec.empty()) spec += "." + prec;
                break;
            case 'd':
            case 'i':
            case 'u':
                if (!v.is_number()) throw ScriptError("TypeError", "%d format: a number is required");
                v = Value::integer(v.is_float() ? (int64_t)std::trunc(v.as_float()) : v.as_int());
                spec += 'd';
                break;
            case 'f':
            case 'F':
            case 'e':
            case 'E':
            case 'g':
            case 'G':
                if (!v.is_number()) throw ScriptError("TypeError", std::string("%") + conv + " format: a number is required");
                v = Value::number(v.as_float());
                spec += "." + (prec.empty() ? std::string("6") : prec) + conv;
                break;
            default:
                throw ScriptError("ValueError", std::string("unsupported format character '") + conv + "'");
        }
        out += format_value(v, spec);
    }
    if (next < vals.size() && args.is_tuple()) {
        throw ScriptError("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

// ---------------------------------------------------------------------------
// methods of builtin types

Value Interpreter::str_method(const Value& self, const std::string& name) {
    const std::string s = self.as_str();
    if (name == "upper" || name == "lower") {
        const bool up = name == "upper";
        return native(name, [s, up](Interpreter&, CallArgs&) {
            std::string out = s;
            for (auto& c : out) c = (char)(up ? std::toupper((unsigned char)c) : std::tolower((unsigned char)c));
            return Value::str(out);
        });
    }
    if (name == "title" || name == "capitalize") {
        const bool title = name == "title";
        return native(name, [s, title](Interpreter&, CallArgs&) {
            std::string out = s;
            bool start = true;
            for (size_t i = 0; i < out.size(); i++) {
                unsigned char c = (unsigned char)out[i];
                if (std::isalpha(c)) {
                    out[i] = (char)(start ? std::toupper(c) : std::tolower(c));
                    start = false;
                } else if (title) {
                    start = true;
                }
                if (!title && i == 0 && !std::isalpha(c)) start = false;
            }
            return Value::str(out);
        });
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        const bool l = name != "rstrip", r = name != "lstrip";
        return native(name, [s, l, r](Interpreter&, CallArgs& a) {
            Value chars = a.get(0, "chars");
            if (!chars.is_none() && !chars.is_str()) throw ScriptError("TypeError", "strip arg must be None or str");
            return Value::str(strip_chars(s, chars, l, r));
        });
    }
    if (name == "split") {
        return native(name, [s](Interpreter&, CallArgs& a) {
            Value sep = a.get(0, "sep");
            int64_t maxsplit = a.present(1, "maxsplit") ? to_index(a.get(1, "maxsplit"), "split") : -1;
            std::vector<std::string> parts;
            if (sep.is_none()) {
                size_t i = 0;
                while (i < s.size()) {
                    while (i < s.size() && is_space(s[i])) i++;
                    if (i >= s.size()) break;
                    if (maxsplit >= 0 && (int64_t)parts.size() == maxsplit) {
                        std::string rest = s.substr(i);
                        while (!rest.empty() && is_space(rest.back())) rest.pop_back();
                        parts.push_back(rest);
                        break;
                    }
                    size_t j = i;
                    while (j < s.size() && !is_space(s[j])) j++;
                    parts.push_back(s.substr(i, j - i));
                    i = j;
                }
            } else {
                if (!sep.is_str() || sep.as_str().empty()) throw ScriptError("ValueError", "empty separator");
                const std::string& d = sep.as_str();
                size_t start = 0;
                while (true) {
                    if (maxsplit >= 0 && (int64_t)parts.size() == maxsplit) break;
                    size_t p = s.find(d, start);
                    if (p == std::string::npos) break;
                    parts.push_back(s.substr(start, p - start));
                    start = p + d.size();
                }
                parts.push_back(s.substr(start));
            }
            return make_str_list(parts);
        });
    }
    if (name == "join") {
        return native(name, [s](Interpreter& in, CallArgs& a) {
            std::string out;
            bool first = true;
            for (const auto& v : in.iterate(a.get(0, "iterable"))) {
                if (!v.is_str()) throw ScriptError("TypeError", std::string("sequence item: expected str instance, ") + v.type_name() + " found");
                if (!first) out += s;
                out += v.as_str();
                first = false;
                budget_check(out.size());
            }
            return Value::str(out);
        });
    }
    if (name == "replace") {
        return native(name, [s](Interpreter&, CallArgs& a) {
            Value from = a.get(0, "old"), to = a.get(1, "new");
            if (!from.is_str() || !to.is_str()) throw ScriptError("TypeError", "replace() arguments must be str");
            const std::string& o = from.as_str();
            const std::string& n = to.as_str();
            if (o.empty()) return Value::str(s);
            std::string out;
            size_t start = 0;
            while (true) {
                size_t p = s.find(o, start);
                if (p == std::string::npos) break;
                out += s.substr(start, p - start) + n;
                start = p + o.size();
                budget_check(out.size());
            }
            out += s.substr(start);
            return Value::str(out);
        });
    }
    if (name == "startswith" || name == "endswith") {
        const bool starts = name == "startswith";
        return native(name, [s, starts](Interpreter&, CallArgs& a) {
            Value arg = a.get(0, "prefix");
            std::vector<Value> options;
            if (arg.is_tuple()) options = arg.as_list()->items;
            else options.push_back(arg);
            for (const auto& o : options) {
                if (!o.is_str()) throw ScriptError("TypeError", "startswith/endswith argument must be str");
                const std::string& p = o.as_str();
                if (p.size() > s.size()) continue;
                if (starts ? s.compare(0, p.size(), p) == 0 : s.compare(s.size() - p.size(), p.size(), p) == 0)
                    return Value::boolean(true);
            }
            return Value::boolean(false);
        });
    }
    if (name == "find" || name == "count" || name == "index") {
        return native(name, [s, name](Interpreter&, CallArgs& a) {
            Value sub = a.get(0, "sub");
            if (!sub.is_str()) throw ScriptError("TypeError", "must be str, not " + std::string(sub.type_name()));
            const std::string& t = sub.as_str();
            if (name == "count") {
                if (t.empty()) return Value::integer((int64_t)utf8_len(s) + 1);
                int64_t n = 0;
                for (size_t p = s.find(t); p != std::string::npos; p = s.find(t, p + t.size())) n++;
                return Value::integer(n);
            }
            size_t p = s.find(t);
            if (p == std::string::npos) {
                if (name == "index") throw ScriptError("ValueError", "substring not found");
                return Value::integer(-1);
            }
            return Value::integer((int64_t)utf8_len(s.substr(0, p)));
        });
    }
    if (name == "format") {
        return native(name, [s](Interpreter&, CallArgs& a) { return Value::str(format_fields(s, a)); });
    }
    if (name == "zfill") {
        return native(name, [s](Interpreter&, CallArgs& a) {
            int64_t w = to_index(a.get(0, "width"), "zfill");
            if ((int64_t)s.size() >= w) return Value::str(s);
            std::string body = s;
            std::string sign;
            if (!body.empty() && (body[0] == '-' || body[0] == '+')) { sign = body.substr(0, 1); body.erase(0, 1); }
            return Value::str(sign + std::string((size_t)w - s.size(), '0') + body);
        });
    }
    if (name == "isdigit" || name == "isalpha" || name == "isnumeric" || name == "isspace" ||
        name == "isupper" || name == "islower") {
        return native(name, [s, name](Interpreter&, CallArgs&) {
            if (s.empty()) return Value::boolean(false);
            bool cased = false;
            for (unsigned char c : s) {
                if (name == "isdigit" || name == "isnumeric") { if (!std::isdigit(c)) return Value::boolean(false); }
                else if (name == "isalpha") { if (!std::isalpha(c)) return Value::boolean(false); }
                else if (name == "isspace") { if (!is_space((char)c)) return Value::boolean(false); }
                else if (name == "isupper") { if (std::islower(c)) return Value::boolean(false); if (std::isupper(c)) cased = true; }
                else { if (std::isupper(c)) return Value::boolean(false); if (std::islower(c)) cased = true; }
            }
            if (name == "isupper" || name == "islower") return Value::boolean(cased);
            return Value::boolean(true);
        });
    }
    throw ScriptError("AttributeError", "'str' object has no attribute '" + name + "'");
}

Value Interpreter::list_method(const Value& self, const std::string& name) {
    ListPtr lst = self.as_list();
    const bool is_list = self.is_list();
    if (name == "count") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            int64_t n = 0;
            for (const auto& v : lst->items) if (values_equal(v, a.get(0, "value"))) n++;
            return Value::integer(n);
        });
    }
    if (name == "index") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            Value x = a.get(0, "value");
            for (size_t i = 0; i < lst->items.size(); i++)
                if (values_equal(lst->items[i], x)) return Value::integer((int64_t)i);
            throw ScriptError("ValueError", repr_value(x) + " is not in list");
        });
    }
    if (!is_list) throw ScriptError("AttributeError", "'tuple' object has no attribute '" + name + "'");

    if (name == "append") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            if (a.pos.size() != 1) throw ScriptError("TypeError", "append() takes exactly one argument");
            lst->items.push_back(a.pos[0]);
            lst->sync();
            return Value();
        });
    }
    if (name == "extend") {
        return native(name, [lst](Interpreter& in, CallArgs& a) {
            std::vector<Value> extra = in.iterate(a.get(0, "iterable"));
            budget_check(extra.size() * sizeof(Value));
            lst->items.insert(lst->items.end(), extra.begin(), extra.end());
            lst->sync();
            return Value();
        });
    }
    if (name == "insert") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            int64_t i = to_index(a.get(0, "index"), "insert");
            const int64_t n = (int64_t)lst->items.size();
            if (i < 0) i = std::max<int64_t>(0, i + n);
            if (i > n) i = n;
            lst->items.insert(lst->items.begin() + i, a.get(1, "object"));
            lst->sync();
            return Value();
        });
    }
    if (name == "pop") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            if (lst->items.empty()) throw ScriptError("IndexError", "pop from empty list");
            int64_t i = a.present(0, "index") ? to_index(a.get(0, "index"), "pop") : -1;
            i = normalize_index(i, lst->items.size(), "pop");
            Value v = lst->items[(size_t)i];
            lst->items.erase(lst->items.begin() + i);
            lst->sync();
            return v;
        });
    }
    if (name == "remove") {
        return native(name, [lst](Interpreter&, CallArgs& a) {
            Value x = a.get(0, "value");
            for (size_t i = 0; i < lst->items.size(); i++) {
                if (values_equal(lst->items[i], x)) {
                    lst->items.erase(lst->items.begin() + (long)i);
                    lst->sync();
                    return Value();
                }
            }
            throw ScriptError("ValueError", "list.remove(x): x not in list");
        });
    }
    if (name == "sort") {
        return native(name, [lst](Interpreter& in, CallArgs& a) {
            a.check_kw("sort", {"key", "reverse"});
            lst->items = in.sorted(lst->items, a.get(99, "key"), is_truthy(a.get(99, "reverse", Value::boolean(false))));
            return Value();
        });
    }
    if (name == "reverse") {
        return native(name, [lst](Interpreter&, CallArgs&) {
            std::reverse(lst->items.begin(), lst->items.end());
            return Value();
        });
    }
    if (name == "copy") {
        return native(name, [lst](Interpreter&, CallArgs&) { return Value::list(lst->items); });
    }
    if (name == "clear") {
        return native(name, [lst](Interpreter&, CallArgs&) {
            lst->items.clear();
            lst->sync();
            return Value();
        });
    }
    throw ScriptError("AttributeError", "'list' object has no attribute '" + name + "'");
}

Value Interpreter::dict_method(const Value& self, const std::string& name) {
    DictPtr d = self.as_dict();
    if (name == "get") {
        return native(name, [d](Interpreter&, CallArgs& a) {
            Value out;
            if (d->get(a.get(0, "key"), &out)) return out;
            return a.get(1, "default");
        });
    }
    if (name == "keys") return native(name, [d](Interpreter&, CallArgs&) { return Value::list(d->keys); });
    if (name == "values") return native(name, [d](Interpreter&, CallArgs&) { return Value::list(d->vals); });
    if (name == "items") {
        return native(name, [d](Interpreter&, CallArgs&) {
            std::vector<Value> out;
            out.reserve(d->size());
            for (size_t i = 0; i < d->size(); i++) out.push_back(Value::tuple({d->keys[i], d->vals[i]}));
            return Value::list(std::move(out));
        });
    }
    if (name == "update") {
        return native(name, [d](Interpreter& in, CallArgs& a) {
            if (!a.pos.empty()) {
                const Value& other = a.pos[0];
                if (other.is_dict()) {
                    const auto& o = *other.as_dict();
                    for (size_t i = 0; i < o.size(); i++) d->set(o.keys[i], o.vals[i]);
                } else {
                    for (const auto& pair : in.iterate(other)) {
                        std::vector<Value> kv = in.iterate(pair);
                        if (kv.size() != 2) throw ScriptError("ValueError", "dictionary update sequence element has wrong length");
                        d->set(kv[0], kv[1]);
                    }
                }
            }
            for (const auto& kv : a.kw) d->set(Value::str(kv.first), kv.second);
            return Value();
        });
    }
    if (name == "pop") {
        return native(name, [d](Interpreter&, CallArgs& a) {
            Value k = a.get(0, "key");
            Value out;
            if (d->get(k, &out)) {
                d->erase(k);
                return out;
            }
            if (a.present(1, "default")) return a.get(1, "default");
            throw ScriptError("KeyError", repr_value(k));
        });
    }
    if (name == "setdefault") {
        return native(name, [d](Interpreter&, CallArgs& a) {
            Value k = a.get(0, "key");
            Value out;
            if (d->get(k, &out)) return out;
            Value dflt = a.get(1, "default");
            d->set(k, dflt);
            return dflt;
        });
    }
    if (name == "copy") {
        return native(name, [d](Interpreter&, CallArgs&) {
            auto c = std::make_shared<DictObj>();
            for (size_t i = 0; i < d->size(); i++) c->set(d->keys[i], d->vals[i]);
            return Value::dict_ref(c);
        });
    }
    throw ScriptError("AttributeError", "'dict' object has no attribute '" + name + "'");
}

} // namespace pitchbox::script
