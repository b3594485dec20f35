#include "pitchbox/value.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace pitchbox::script {

// --- MemoryBudget ---

namespace {
thread_local MemoryBudget* g_budget = nullptr;
}

void MemoryBudget::charge(uint64_t bytes) {
    if (bytes > limit_ || used_ > limit_ - bytes) {
        throw ResourceLimitError("memory limit exceeded: requested " + std::to_string(bytes) +
                                 " bytes with " + std::to_string(used_) + " of " + std::to_string(limit_) +
                                 " in use");
    }
    used_ += bytes;
}

void MemoryBudget::release(uint64_t bytes) {
    used_ = bytes > used_ ? 0 : used_ - bytes;
}

void MemoryBudget::check(uint64_t bytes) const {
    if (bytes > limit_ || used_ > limit_ - bytes) {
        throw ResourceLimitError("memory limit exceeded: allocation of " + std::to_string(bytes) + " bytes");
    }
}

MemoryBudget* MemoryBudget::current() { return g_budget; }

MemoryBudget::Scope::Scope(MemoryBudget* b) : prev_(g_budget) { g_budget = b; }
MemoryBudget::Scope::~Scope() { g_budget = prev_; }

void budget_charge(uint64_t bytes) { if (g_budget) g_budget->charge(bytes); }
void budget_release(uint64_t bytes) { if (g_budget) g_budget->release(bytes); }
void budget_check(uint64_t bytes) { if (g_budget) g_budget->check(bytes); }

void BudgetCharge::set(uint64_t bytes) {
    if (!g_budget) return;
    if (bytes > bytes_) g_budget->charge(bytes - bytes_);
    else if (bytes < bytes_) g_budget->release(bytes_ - bytes);
    bytes_ = bytes;
}

StrObj::StrObj(std::string v) : s(std::move(v)) { charge.set(s.size() + sizeof(StrObj)); }

// --- Value ---

Value Value::boolean(bool b) { Value v; v.type_ = Type::Bool; v.v_ = b; return v; }
Value Value::integer(int64_t i) { Value v; v.type_ = Type::Int; v.v_ = i; return v; }
Value Value::number(double d) { Value v; v.type_ = Type::Float; v.v_ = d; return v; }
Value Value::str(std::string s) {
    Value v;
    v.type_ = Type::Str;
    v.v_ = StrPtr(std::make_shared<StrObj>(std::move(s)));
    return v;
}
Value Value::list(std::vector<Value> items) { return list_ref(std::make_shared<ListObj>(std::move(items))); }
Value Value::tuple(std::vector<Value> items) {
    Value v;
    v.type_ = Type::Tuple;
    v.v_ = std::make_shared<ListObj>(std::move(items));
    return v;
}
Value Value::list_ref(ListPtr p) { Value v; v.type_ = Type::List; v.v_ = std::move(p); return v; }
Value Value::dict_ref(DictPtr p) { Value v; v.type_ = Type::Dict; v.v_ = std::move(p); return v; }
Value Value::callable(CallablePtr p) { Value v; v.type_ = Type::Callable; v.v_ = std::move(p); return v; }
Value Value::object(ObjectPtr p) { Value v; v.type_ = Type::Object; v.v_ = std::move(p); return v; }

int64_t Value::as_int() const {
    if (type_ == Type::Bool) return std::get<bool>(v_) ? 1 : 0;
    return std::get<int64_t>(v_);
}

double Value::as_float() const {
    switch (type_) {
        case Type::Bool: return std::get<bool>(v_) ? 1.0 : 0.0;
        case Type::Int: return (double)std::get<int64_t>(v_);
        default: return std::get<double>(v_);
    }
}

const char* Value::type_name() const {
    switch (type_) {
        case Type::None: return "NoneType";
        case Type::Bool: return "bool";
        case Type::Int: return "int";
        case Type::Float: return "float";
        case Type::Str: return "str";
        case Type::List: return "list";
        case Type::Tuple: return "tuple";
        case Type::Dict: return "dict";
        case Type::Callable: return "function";
        case Type::Object: return "object";
    }
    return "?";
}

// --- containers ---

ListObj::ListObj(std::vector<Value> v) : items(std::move(v)) { sync(); }

ListObj::~ListObj() { budget_release(charged_); }

void ListObj::sync() {
    const uint64_t want = (uint64_t)items.size() * sizeof(Value);
    if (want > charged_) {
        budget_charge(want - charged_);
    } else if (want < charged_) {
        budget_release(charged_ - want);
    }
    charged_ = want;
}

DictObj::~DictObj() { budget_release(charged_); }

void DictObj::sync() {
    const uint64_t want = (uint64_t)keys.size() * (2 * sizeof(Value) + 48);
    if (want > charged_) budget_charge(want - charged_);
    else if (want < charged_) budget_release(charged_ - want);
    charged_ = want;
}

std::string hash_key(const Value& v) {
    switch (v.type()) {
        case Value::Type::None: return "N";
        case Value::Type::Bool:
        case Value::Type::Int: return "i" + std::to_string(v.as_int());
        case Value::Type::Float: {
            double d = v.as_float();
            if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.2e18) {
                return "i" + std::to_string((int64_t)d);
            }
            return "f" + float_repr(d);
        }
        case Value::Type::Str: return "s" + v.as_str();
        case Value::Type::Tuple: {
            std::string k = "t(";
            for (const auto& it : v.as_list()->items) {
                std::string part = hash_key(it);
                k += std::to_string(part.size()) + ":" + part;
            }
            return k + ")";
        }
        default:
            throw ScriptError("TypeError", std::string("unhashable type: '") + v.type_name() + "'");
    }
}

bool DictObj::get(const Value& k, Value* out) const {
    auto it = index_.find(hash_key(k));
    if (it == index_.end()) return false;
    if (out) *out = vals[it->second];
    return true;
}

void DictObj::set(const Value& k, Value v) {
    std::string hk = hash_key(k);
    auto it = index_.find(hk);
    if (it != index_.end()) {
        vals[it->second] = std::move(v);
        return;
    }
    index_.emplace(std::move(hk), keys.size());
    keys.push_back(k);
    vals.push_back(std::move(v));
    sync();
}

bool DictObj::erase(const Value& k) {
    auto it = index_.find(hash_key(k));
    if (it == index_.end()) return false;
    const size_t pos = it->second;
    keys.erase(keys.begin() + (long)pos);
    vals.erase(vals.begin() + (long)pos);
    index_.clear();
    for (size_t i = 0; i < keys.size(); i++) index_.emplace(hash_key(keys[i]), i);
    sync();
    return true;
}

// --- CallArgs ---

bool CallArgs::has_kw(const std::string& name) const {
    for (const auto& p : kw) if (p.first == name) return true;
    return false;
}

Value CallArgs::get(size_t i, const std::string& name, const Value& fallback) const {
    for (const auto& p : kw) if (p.first == name) return p.second;
    if (i < pos.size()) return pos[i];
    return fallback;
}

bool CallArgs::present(size_t i, const std::string& name) const {
    return i < pos.size() || has_kw(name);
}

void CallArgs::check_kw(const char* fn, std::initializer_list<const char*> allowed) const {
    for (const auto& p : kw) {
        bool ok = false;
        for (const char* a : allowed) if (p.first == a) { ok = true; break; }
        if (!ok) throw ScriptError("TypeError", std::string(fn) + "() got an unexpected keyword argument '" + p.first + "'");
    }
}

void CallArgs::check_max(const char* fn, size_t max_pos) const {
    if (pos.size() > max_pos) {
        throw ScriptError("TypeError", std::string(fn) + "() takes at most " + std::to_string(max_pos) +
                                           " positional arguments (" + std::to_string(pos.size()) + " given)");
    }
}

Value native(std::string name, NativeFunction::Fn fn) {
    return Value::callable(std::make_shared<NativeFunction>(std::move(name), std::move(fn)));
}

// --- Object defaults ---

Value Object::get_attr(const std::string& name) {
    throw ScriptError("AttributeError", "'" + type_name() + "' object has no attribute '" + name + "'");
}

void Object::set_attr(const std::string& name, const Value&) {
    throw ScriptError("AttributeError", "cannot set attribute '" + name + "' on '" + type_name() + "' object");
}

Value Object::get_item(Interpreter&, const Value&) {
    throw ScriptError("TypeError", "'" + type_name() + "' object is not subscriptable");
}

void Object::set_item(const Value&, const Value&) {
    throw ScriptError("TypeError", "'" + type_name() + "' object does not support item assignment");
}

void Object::del_item(const Value&) {
    throw ScriptError("TypeError", "'" + type_name() + "' object does not support item deletion");
}

std::vector<Value> Object::iterate(Interpreter&) {
    throw ScriptError("TypeError", "'" + type_name() + "' object is not iterable");
}

bool Object::binary_op(Interpreter&, const std::string&, const Value&, bool, Value*) { return false; }
bool Object::unary_op(Interpreter&, const std::string&, Value*) { return false; }
bool Object::contains(Interpreter&, const Value&, bool*) { return false; }

std::string Object::repr() const { return "<" + type_name() + " object>"; }

Value ModuleObject::get_attr(const std::string& name) {
    auto it = attrs_.find(name);
    if (it == attrs_.end()) {
        throw ScriptError("AttributeError", "module '" + name_ + "' has no attribute '" + name + "'");
    }
    return it->second;
}

// --- text rendering ---

std::string float_repr(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if (d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

    // shortest round-tripping digits
    char buf[64];
    int prec = 1;
    for (; prec <= 17; prec++) {
        std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string s(buf);
    const size_t epos = s.find('e');
    const int exp = std::atoi(s.c_str() + epos + 1);
    std::string mant = s.substr(0, epos);
    bool neg = false;
    if (!mant.empty() && mant[0] == '-') { neg = true; mant.erase(0, 1); }
    std::string digits;
    for (char c : mant) if (c != '.') digits.push_back(c);
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    std::string out;
    if (exp >= -4 && exp < 16) {
        if (exp < 0) {
            out = "0." + std::string((size_t)(-exp - 1), '0') + digits;
        } else if ((size_t)exp + 1 >= digits.size()) {
            out = digits + std::string((size_t)exp + 1 - digits.size(), '0') + ".0";
        } else {
            out = digits.substr(0, (size_t)exp + 1) + "." + digits.substr((size_t)exp + 1);
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        char eb[16];
        std::snprintf(eb, sizeof(eb), "e%c%02d", exp < 0 ? '-' : '+', exp < 0 ? -exp : exp);
        out += eb;
    }
    return neg ? "-" + out : out;
}

static std::string quote_str(const std::string& s) {
    const bool use_double = s.find('\'') != std::string::npos && s.find('"') == std::string::npos;
    const char q = use_double ? '"' : '\'';
    std::string out(1, q);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == (unsigned char)q) { out.push_back('\\'); out.push_back((char)c); }
                else if (c < 0x20 || c == 0x7f) {
                    char b[8];
                    std::snprintf(b, sizeof(b), "\\x%02x", c);
                    out += b;
                } else {
                    out.push_back((char)c);
                }
        }
    }
    out.push_back(q);
    return out;
}

std::string repr_value(const Value& v) {
    switch (v.type()) {
        case Value::Type::None: return "None";
        case Value::Type::Bool: return v.as_bool() ? "True" : "False";
        case Value::Type::Int: return std::to_string(v.as_int());
        case Value::Type::Float: return float_repr(v.as_float());
        case Value::Type::Str: return quote_str(v.as_str());
        case Value::Type::List:
        case Value::Type::Tuple: {
            const auto& items = v.as_list()->items;
            std::string out = v.is_list() ? "[" : "(";
            for (size_t i = 0; i < items.size(); i++) {
                if (i) out += ", ";
                out += repr_value(items[i]);
            }
            if (v.is_tuple() && items.size() == 1) out += ",";
            out += v.is_list() ? "]" : ")";
            return out;
        }
        case Value::Type::Dict: {
            const auto& d = *v.as_dict();
            std::string out = "{";
            for (size_t i = 0; i < d.keys.size(); i++) {
                if (i) out += ", ";
                out += repr_value(d.keys[i]) + ": " + repr_value(d.vals[i]);
            }
            return out + "}";
        }
        case Value::Type::Callable: return "<function " + v.as_callable()->name() + ">";
        case Value::Type::Object: return v.as_object()->repr();
    }
    return "?";
}

std::string str_value(const Value& v) {
    if (v.is_str()) return v.as_str();
    return repr_value(v);
}

namespace {

struct Spec {
    char fill{' '};
    char align{0};
    char sign{'-'};
    bool comma{false};
    int width{-1};
    int precision{-1};
    char type{0};
};

Spec parse_spec(const std::string& s) {
    Spec sp;
    size_t i = 0;
    auto is_align = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
    if (s.size() >= 2 && is_align(s[1])) {
        sp.fill = s[0];
        sp.align = s[1];
        i = 2;
    } else if (!s.empty() && is_align(s[0])) {
        sp.align = s[0];
        i = 1;
    }
    if (i < s.size() && (s[i] == '+' || s[i] == '-' || s[i] == ' ')) sp.sign = s[i++];
    if (i < s.size() && s[i] == '0') {
        if (!sp.align) { sp.fill = '0'; sp.align = '='; }
        i++;
    }
    int w = -1;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        w = (w < 0 ? 0 : w * 10) + (s[i++] - '0');
        if (w > 1000) throw ScriptError("ValueError", "format width too large");
    }
    sp.width = w;
    if (i < s.size() && (s[i] == ',' || s[i] == '_')) { sp.comma = true; i++; }
    if (i < s.size() && s[i] == '.') {
        i++;
        int p = 0;
        bool any = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            p = p * 10 + (s[i++] - '0');
            any = true;
            if (p > 100) throw ScriptError("ValueError", "format precision too large");
        }
        if (!any) throw ScriptError("ValueError", "format specifier missing precision");
        sp.precision = p;
    }
    if (i < s.size()) sp.type = s[i++];
    if (i != s.size()) throw ScriptError("ValueError", "invalid format specifier '" + s + "'");
    return sp;
}

std::string group_thousands(const std::string& digits) {
    // digits: optional integer part followed by optional fraction
    size_t dot = digits.find_first_of(".eE");
    std::string ip = digits.substr(0, dot);
    std::string rest = dot == std::string::npos ? "" : digits.substr(dot);
    std::string out;
    int n = 0;
    for (size_t k = ip.size(); k > 0; k--) {
        out.insert(out.begin(), ip[k - 1]);
        if (++n % 3 == 0 && k > 1) out.insert(out.begin(), ',');
    }
    return out + rest;
}

std::string pad(std::string body, const std::string& sign, const Spec& sp, char default_align) {
    const char align = sp.align ? sp.align : default_align;
    const int len = (int)(body.size() + sign.size());
    if (sp.width <= len) return sign + body;
    const size_t fill_n = (size_t)(sp.width - len);
    std::string f(fill_n, sp.fill);
    switch (align) {
        case '<': return sign + body + f;
        case '^': return std::string(fill_n / 2, sp.fill) + sign + body + std::string(fill_n - fill_n / 2, sp.fill);
        case '=': return sign + f + body;
        default: return f + sign + body;
    }
}

std::string fixed(double d, int prec) {
    char buf[512];
    std::snprintf(buf, sizeof(buf), "%.*f", prec, d);
    return buf;
}

} // namespace

std::string format_value(const Value& v, const std::string& spec) {
    if (spec.empty()) return str_value(v);
    Spec sp = parse_spec(spec);

    if (v.is_str() || (!v.is_number() && sp.type == 0) || sp.type == 's') {
        if (sp.type != 0 && sp.type != 's') {
            throw ScriptError("ValueError", std::string("unknown format code '") + sp.type + "' for object of type '" +
                                                v.type_name() + "'");
        }
        std::string body = str_value(v);
        if (sp.precision >= 0 && (size_t)sp.precision < body.size()) body.resize((size_t)sp.precision);
        return pad(body, "", sp, '<');
    }
    if (!v.is_number()) {
        throw ScriptError("TypeError", std::string("unsupported format string passed to ") + v.type_name() + ".__format__");
    }

    char type = sp.type;
    if (type == 0) type = v.is_float() ? (sp.precision >= 0 ? 'g' : 'r') : 'd';
    if (type == 'd' && v.is_float()) {
        throw ScriptError("ValueError", "unknown format code 'd' for object of type 'float'");
    }

    double d = v.as_float();
    const bool neg = std::signbit(d) && !std::isnan(d);
    std::string sign;
    if (neg) sign = "-";
    else if (sp.sign == '+') sign = "+";
    else if (sp.sign == ' ') sign = " ";
    const double a = std::fabs(d);

    std::string body;
    switch (type) {
        case 'd':
        case 'n':
            body = std::to_string(v.as_int() < 0 ? -(v.as_int()) : v.as_int());
            if (v.as_int() < 0) sign = "-";
            break;
        case 'f':
        case 'F':
            body = std::isfinite(a) ? fixed(a, sp.precision < 0 ? 6 : sp.precision) : (std::isnan(a) ? "nan" : "inf");
            break;
        case '%':
            body = fixed(a * 100.0, sp.precision < 0 ? 6 : sp.precision) + "%";
            break;
        case 'e':
        case 'E': {
            char buf[512];
            std::snprintf(buf, sizeof(buf), type == 'e' ? "%.*e" : "%.*E", sp.precision < 0 ? 6 : sp.precision, a);
            body = buf;
            break;
        }
        case 'g':
        case 'G': {
            char buf[512];
            std::snprintf(buf, sizeof(buf), type == 'g' ? "%.*g" : "%.*G", sp.precision < 0 ? 6 : (sp.precision == 0 ? 1 : sp.precision), a);
            body = buf;
            break;
        }
        case 'r':
            body = v.is_float() ? float_repr(a) : std::to_string(v.as_int());
            if (!v.is_float() && v.as_int() < 0) body = std::to_string(-v.as_int());
            break;
        default:
            throw ScriptError("ValueError", std::string("unknown format code '") + type + "'");
    }
    if (sp.comma) body = group_thousands(body);
    return pad(body, sign, sp, '>');
}

// --- numeric helpers ---

bool is_truthy(const Value& v) {
    switch (v.type()) {
        case Value::Type::None: return false;
        case Value::Type::Bool: return v.as_bool();
        case Value::Type::Int: return v.as_int() != 0;
        case Value::Type::Float: return v.as_float() != 0.0;
        case Value::Type::Str: return !v.as_str().empty();
        case Value::Type::List:
        case Value::Type::Tuple: return !v.as_list()->items.empty();
        case Value::Type::Dict: return v.as_dict()->size() > 0;
        case Value::Type::Callable: return true;
        case Value::Type::Object: return v.as_object()->truthy();
    }
    return false;
}

bool values_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if ((a.is_int() || a.is_bool()) && (b.is_int() || b.is_bool())) return a.as_int() == b.as_int();
        return a.as_float() == b.as_float();
    }
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
        case Value::Type::None: return true;
        case Value::Type::Str: return a.as_str() == b.as_str();
        case Value::Type::List:
        case Value::Type::Tuple: {
            const auto& x = a.as_list()->items;
            const auto& y = b.as_list()->items;
            if (x.size() != y.size()) return false;
            for (size_t i = 0; i < x.size(); i++)
                if (!values_equal(x[i], y[i])) return false;
            return true;
        }
        case Value::Type::Dict: {
            const auto& x = *a.as_dict();
            const auto& y = *b.as_dict();
            if (x.size() != y.size()) return false;
            for (size_t i = 0; i < x.keys.size(); i++) {
                Value other;
                if (!y.get(x.keys[i], &other) || !values_equal(x.vals[i], other)) return false;
            }
            return true;
        }
        case Value::Type::Callable: return a.as_callable() == b.as_callable();
        case Value::Type::Object: return a.as_object() == b.as_object();
        default: return false;
    }
}

int compare_values(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if ((a.is_int() || a.is_bool()) && (b.is_int() || b.is_bool())) {
            return a.as_int() < b.as_int() ? -1 : (a.as_int() > b.as_int() ? 1 : 0);
        }
        const double x = a.as_float(), y = b.as_float();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_str() && b.is_str()) {
        int c = a.as_str().compare(b.as_str());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.is_sequence() && b.is_sequence() && a.type() == b.type()) {
        const auto& x = a.as_list()->items;
        const auto& y = b.as_list()->items;
        for (size_t i = 0; i < x.size() && i < y.size(); i++) {
            if (values_equal(x[i], y[i])) continue;
            return compare_values(x[i], y[i]);
        }
        return x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
    }
    throw ScriptError("TypeError", std::string("'<' not supported between instances of '") + a.type_name() +
                                       "' and '" + b.type_name() + "'");
}

double to_double(const Value& v, const char* what) {
    if (v.is_number()) return v.as_float();
    throw ScriptError("TypeError", std::string(what) + ": expected a number, got '" + v.type_name() + "'");
}

int64_t to_index(const Value& v, const char* what) {
    if (v.is_int() || v.is_bool()) return v.as_int();
    throw ScriptError("TypeError", std::string(what) + ": expected an integer, got '" + v.type_name() + "'");
}

double round_half_even(double x, int ndigits) {
    if (!std::isfinite(x)) return x;
    const double scale = std::pow(10.0, ndigits);
    const double y = x * scale;
    if (!std::isfinite(y)) return x;
    double r = std::round(y);
    if (std::fabs(y - std::trunc(y)) == 0.5) r = 2.0 * std::round(y / 2.0);
    return r / scale;
}

} // namespace pitchbox::script
