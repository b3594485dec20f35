#include "pitchbox/sandbox_env.h"

#include "pitchbox/frame.h"
#include "pitchbox/numeric.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace pitchbox {

using namespace script;

namespace {

constexpr size_t kKw = static_cast<size_t>(-1);

const char* const kPureBuiltins[] = {
    "len", "range", "min", "max", "sum", "abs", "round", "sorted", "enumerate", "zip",
    "list", "dict", "str", "int", "float", "bool",
};

struct GatedBinding {
    const char* name;
    Capability cap;
};

const GatedBinding kGated[] = {
    {"df", Capability::DatasetRead},
    {"plt", Capability::Plot},
    {"Pitch", Capability::Plot},
    {"VerticalPitch", Capability::Plot},
    {"mplsoccer", Capability::Plot},
    {"print", Capability::TextOutput},
    {"np", Capability::Numeric},
    {"pd", Capability::Numeric},
    {"math", Capability::Numeric},
};

std::string trimmed(const std::string& s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(" \t\r\n") - b + 1);
}

bool parse_int_text(const std::string& text, int64_t* out) {
    std::string s = trimmed(text);
    s.erase(std::remove(s.begin(), s.end(), '_'), s.end());
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    *out = (int64_t)v;
    return true;
}

bool parse_float_text(const std::string& text, double* out) {
    const std::string s = trimmed(text);
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (*end != '\0') return false;
    *out = v;
    return true;
}

// min()/max() over an iterable or over several arguments.
Value extreme(Interpreter& in, CallArgs& a, bool want_max) {
    const char* fn = want_max ? "max" : "min";
    a.check_kw(fn, {"key", "default"});
    std::vector<Value> items = a.size() == 1 ? in.iterate(a.pos[0]) : a.pos;
    if (items.empty()) {
        if (a.has_kw("default")) return a.get(kKw, "default");
        throw ScriptError("ValueError", std::string(fn) + "() arg is an empty sequence");
    }
    Value key = a.get(kKw, "key");
    size_t best = 0;
    Value best_key = key.is_none() ? items[0] : in.call(key, std::vector<Value>{items[0]});
    for (size_t i = 1; i < items.size(); i++) {
        Value k = key.is_none() ? items[i] : in.call(key, std::vector<Value>{items[i]});
        const int c = compare_values(k, best_key);
        if (want_max ? c > 0 : c < 0) {
            best = i;
            best_key = k;
        }
    }
    return items[best];
}

void install_builtins(Interpreter& interp, const std::set<std::string>& allowed) {
    Env& env = interp.builtins();
    auto def = [&](const char* name, NativeFunction::Fn fn) {
        if (allowed.count(name)) env.set(name, native(name, std::move(fn)));
    };

    def("len", [](Interpreter& in, CallArgs& a) {
        a.check_max("len", 1);
        return Value::integer((int64_t)in.length(a.get(0, "obj")));
    });
    def("range", [](Interpreter&, CallArgs& a) {
        a.check_max("range", 3);
        if (a.size() == 0) throw ScriptError("TypeError", "range expected at least 1 argument, got 0");
        int64_t start = 0, stop = 0, step = 1;
        if (a.size() == 1) {
            stop = to_index(a.pos[0], "range");
        } else {
            start = to_index(a.pos[0], "range");
            stop = to_index(a.pos[1], "range");
            if (a.size() == 3) step = to_index(a.pos[2], "range");
        }
        return Value::object(std::make_shared<RangeObject>(start, stop, step));
    });
    def("min", [](Interpreter& in, CallArgs& a) { return extreme(in, a, false); });
    def("max", [](Interpreter& in, CallArgs& a) { return extreme(in, a, true); });
    def("sum", [](Interpreter& in, CallArgs& a) {
        Value acc = a.get(1, "start", Value::integer(0));
        for (const auto& v : in.iterate(a.get(0, "iterable"))) acc = in.binary("+", acc, v);
        return acc;
    });
    def("abs", [](Interpreter& in, CallArgs& a) {
        Value x = a.get(0, "x");
        if (x.is_float()) return Value::number(std::fabs(x.as_float()));
        if (x.is_number()) return numeric_binary("*", x, Value::integer(x.as_int() < 0 ? -1 : 1));
        if (x.is_object()) return in.call(in.get_attr(x, "abs"), std::vector<Value>{});
        throw ScriptError("TypeError", std::string("bad operand type for abs(): '") + x.type_name() + "'");
    });
    def("round", [](Interpreter& in, CallArgs& a) {
        Value x = a.get(0, "number");
        Value nd = a.get(1, "ndigits");
        if (x.is_object()) {
            return in.call(in.get_attr(x, "round"), nd.is_none() ? std::vector<Value>{} : std::vector<Value>{nd});
        }
        if (nd.is_none()) {
            if (x.is_int() || x.is_bool()) return Value::integer(x.as_int());
            const double r = round_half_even(to_double(x, "round"), 0);
            if (!std::isfinite(r)) throw ScriptError("ValueError", "cannot convert float " + float_repr(r) + " to integer");
            return Value::integer((int64_t)r);
        }
        const int64_t digits = to_index(nd, "round");
        if (x.is_int() || x.is_bool()) {
            if (digits >= 0) return Value::integer(x.as_int());
            return Value::integer((int64_t)round_half_even((double)x.as_int(), (int)digits));
        }
        return Value::number(round_half_even(to_double(x, "round"), (int)digits));
    });
    def("sorted", [](Interpreter& in, CallArgs& a) {
        a.check_kw("sorted", {"key", "reverse"});
        return Value::list(in.sorted(in.iterate(a.get(0, "iterable")), a.get(kKw, "key"),
                                     is_truthy(a.get(kKw, "reverse", Value::boolean(false)))));
    });
    def("enumerate", [](Interpreter& in, CallArgs& a) {
        int64_t i = to_index(a.get(1, "start", Value::integer(0)), "enumerate");
        std::vector<Value> out;
        for (const auto& v : in.iterate(a.get(0, "iterable"))) out.push_back(Value::tuple({Value::integer(i++), v}));
        return Value::list(std::move(out));
    });
    def("zip", [](Interpreter& in, CallArgs& a) {
        std::vector<std::vector<Value>> cols;
        size_t n = a.size() == 0 ? 0 : std::numeric_limits<size_t>::max();
        for (const auto& p : a.pos) {
            cols.push_back(in.iterate(p));
            n = std::min(n, cols.back().size());
        }
        std::vector<Value> out;
        out.reserve(n);
        for (size_t i = 0; i < n; i++) {
            std::vector<Value> row;
            for (const auto& c : cols) row.push_back(c[i]);
            out.push_back(Value::tuple(std::move(row)));
        }
        return Value::list(std::move(out));
    });
    def("list", [](Interpreter& in, CallArgs& a) {
        a.check_max("list", 1);
        if (a.size() == 0) return Value::list({});
        return Value::list(in.iterate(a.pos[0]));
    });
    def("dict", [](Interpreter& in, CallArgs& a) {
        auto d = std::make_shared<DictObj>();
        if (a.size() == 1) {
            const Value& src = a.pos[0];
            if (src.is_dict()) {
                for (size_t i = 0; i < src.as_dict()->keys.size(); i++) d->set(src.as_dict()->keys[i], src.as_dict()->vals[i]);
            } else {
                for (const auto& pair : in.iterate(src)) {
                    std::vector<Value> kv = in.iterate(pair);
                    if (kv.size() != 2) {
                        throw ScriptError("ValueError", "dictionary update sequence element has length " +
                                                            std::to_string(kv.size()) + "; 2 is required");
                    }
                    d->set(kv[0], kv[1]);
                }
            }
        }
        for (const auto& kv : a.kw) d->set(Value::str(kv.first), kv.second);
        return Value::dict_ref(d);
    });
    def("str", [](Interpreter&, CallArgs& a) {
        if (a.size() == 0) return Value::str("");
        return Value::str(str_value(a.pos[0]));
    });
    def("int", [](Interpreter&, CallArgs& a) {
        if (a.size() == 0) return Value::integer(0);
        const Value& x = a.pos[0];
        if (x.is_int() || x.is_bool()) return Value::integer(x.as_int());
        if (x.is_float()) {
            const double d = x.as_float();
            if (std::isnan(d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
            if (!std::isfinite(d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
            return Value::integer((int64_t)std::trunc(d));
        }
        if (x.is_str()) {
            int64_t v = 0;
            if (!parse_int_text(x.as_str(), &v)) {
                throw ScriptError("ValueError", "invalid literal for int() with base 10: " + repr_value(x));
            }
            return Value::integer(v);
        }
        throw ScriptError("TypeError", std::string("int() argument must be a string or a number, not '") +
                                           x.type_name() + "'");
    });
    def("float", [](Interpreter&, CallArgs& a) {
        if (a.size() == 0) return Value::number(0.0);
        const Value& x = a.pos[0];
        if (x.is_number()) return Value::number(x.as_float());
        if (x.is_str()) {
            double v = 0.0;
            if (!parse_float_text(x.as_str(), &v)) {
                throw ScriptError("ValueError", "could not convert string to float: " + repr_value(x));
            }
            return Value::number(v);
        }
        throw ScriptError("TypeError", std::string("float() argument must be a string or a number, not '") +
                                           x.type_name() + "'");
    });
    def("bool", [](Interpreter&, CallArgs& a) {
        return Value::boolean(a.size() > 0 && is_truthy(a.pos[0]));
    });
}

} // namespace

std::optional<Capability> binding_capability(const std::string& name) {
    for (const auto& g : kGated)
        if (name == g.name) return g.cap;
    return std::nullopt;
}

bool is_pure_builtin(const std::string& name) {
    for (const char* b : kPureBuiltins)
        if (name == b) return true;
    return false;
}

std::set<std::string> default_allowed_bindings() {
    std::set<std::string> out;
    for (const char* b : kPureBuiltins) out.insert(b);
    for (const auto& g : kGated) out.insert(g.name);
    return out;
}

void build_sandbox_scope(Interpreter& in, const ScopeRequest& req, const std::shared_ptr<ScopeOutputs>& out) {
    install_builtins(in, req.allowed_bindings);
    out->plots = std::make_shared<PlotState>();

    auto granted = [&](const char* name) {
        if (!req.allowed_bindings.count(name)) return false;
        auto cap = binding_capability(name);
        return cap && req.capabilities.count(*cap) > 0;
    };
    auto modules = std::make_shared<std::map<std::string, Value>>();  // binding name -> value
    auto bind = [&](const char* name, Value v) {
        in.globals().set(name, v);
        (*modules)[name] = std::move(v);
        out->bound.push_back(name);
    };

    if (granted("df")) {
        // private copy: nothing the script does can reach the caller's dataset
        std::shared_ptr<FrameData> data = req.dataset ? frame_data_from_dataset(*req.dataset) : std::make_shared<FrameData>();
        bind("df", Value::object(std::make_shared<FrameObject>(data, true)));
    }
    if (granted("plt")) bind("plt", make_pyplot_module(out->plots));
    if (granted("mplsoccer") || granted("Pitch") || granted("VerticalPitch")) {
        Value mplsoccer = make_mplsoccer_module(out->plots);
        if (granted("mplsoccer")) bind("mplsoccer", mplsoccer);
        if (granted("Pitch")) bind("Pitch", mplsoccer.as_object()->get_attr("Pitch"));
        if (granted("VerticalPitch")) bind("VerticalPitch", mplsoccer.as_object()->get_attr("VerticalPitch"));
    }
    if (granted("np")) bind("np", make_numpy_module());
    if (granted("pd")) bind("pd", make_pandas_module());
    if (granted("math")) bind("math", make_math_module());
    if (granted("print")) {
        const size_t cap = req.max_print_bytes;
        std::weak_ptr<ScopeOutputs> sink = out;
        bind("print", native("print", [sink, cap](Interpreter&, CallArgs& a) {
                 a.check_kw("print", {"sep", "end", "flush"});
                 Value sep = a.get(kKw, "sep"), end = a.get(kKw, "end");
                 std::string line;
                 for (size_t i = 0; i < a.pos.size(); i++) {
                     if (i) line += sep.is_none() ? " " : str_value(sep);
                     line += str_value(a.pos[i]);
                 }
                 line += end.is_none() ? "\n" : str_value(end);
                 auto o = sink.lock();
                 if (!o || o->printed_truncated) return Value();
                 if (o->printed.size() + line.size() > cap) {
                     o->printed.append(line, 0, cap - o->printed.size());
                     o->printed_truncated = true;
                     return Value();
                 }
                 budget_charge(line.size());
                 o->printed += line;
                 return Value();
             }));
    }

    // Imports only ever see the bindings installed above.
    auto table = req.modules;
    in.set_import_resolver([modules, table](const std::string& module, Value* v) {
        auto it = table.find(module);
        if (it == table.end()) return false;
        auto b = modules->find(it->second);
        if (b == modules->end()) return false;
        *v = b->second;
        return true;
    });
}

} // namespace pitchbox
