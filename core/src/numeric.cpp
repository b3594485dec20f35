#include "pitchbox/numeric.h"

#include "pitchbox/frame.h"
#include "pitchbox/interp.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <memory>
#include <unordered_set>

namespace pitchbox::script {

namespace {

constexpr size_t kKw = static_cast<size_t>(-1);
constexpr double kPi = 3.14159265358979323846;
const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Upper bound on arrays built from scratch (arange, linspace, zeros).
constexpr int64_t kMaxGenerated = 10'000'000;

bool is_scalar(const Value& v) { return v.is_none() || v.is_number() || v.is_str(); }

std::vector<Value> values_of(Interpreter& in, const Value& v) {
    if (v.is_object()) {
        if (auto s = std::dynamic_pointer_cast<SeriesObject>(v.as_object())) return s->values();
    }
    return in.iterate(v);
}

std::shared_ptr<SeriesObject> as_series(const Value& v) {
    if (!v.is_object()) return nullptr;
    auto s = std::dynamic_pointer_cast<SeriesObject>(v.as_object());
    return s && s->kind() == SeriesObject::Kind::Series ? s : nullptr;
}

// Result keeps the Series shape (labels, name) of the input when it has one.
Value same_shape(const Value& like, std::vector<Value> values) {
    if (auto s = as_series(like)) return SeriesObject::series(std::move(values), s->labels(), s->name());
    return SeriesObject::array(std::move(values));
}

Value float_or_nan(double d) { return Value::number(d); }

double number_of(const Value& v, const char* fn) {
    if (is_missing(v)) return kNaN;
    if (!v.is_number()) {
        throw ScriptError("TypeError", std::string("ufunc '") + fn + "' not supported for the input type " + repr_value(v));
    }
    return v.as_float();
}

// Elementwise math over a scalar, list, array or Series.
Value unary_map(Interpreter& in, const Value& x, const char* fn, const std::function<double(double)>& f) {
    if (is_scalar(x)) return float_or_nan(f(number_of(x, fn)));
    std::vector<Value> out;
    for (const auto& v : values_of(in, x)) out.push_back(float_or_nan(f(number_of(v, fn))));
    return same_shape(x, std::move(out));
}

Value binary_map(Interpreter& in, const Value& x, const Value& y, const char* fn,
                 const std::function<double(double, double)>& f) {
    if (is_scalar(x) && is_scalar(y)) return float_or_nan(f(number_of(x, fn), number_of(y, fn)));
    std::vector<Value> xs = is_scalar(x) ? std::vector<Value>{} : values_of(in, x);
    std::vector<Value> ys = is_scalar(y) ? std::vector<Value>{} : values_of(in, y);
    const size_t n = is_scalar(x) ? ys.size() : xs.size();
    if (!is_scalar(x) && !is_scalar(y) && xs.size() != ys.size()) {
        throw ScriptError("ValueError", "operands could not be broadcast together with shapes (" +
                                            std::to_string(xs.size()) + ",) (" + std::to_string(ys.size()) + ",)");
    }
    std::vector<Value> out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        const double a = number_of(is_scalar(x) ? x : xs[i], fn);
        const double b = number_of(is_scalar(y) ? y : ys[i], fn);
        out.push_back(float_or_nan(f(a, b)));
    }
    return same_shape(is_scalar(x) ? y : x, std::move(out));
}

Value reduction(const char* name, const char* how) {
    const std::string h = how;
    return native(name, [h](Interpreter& in, CallArgs& a) {
        Value x = a.get(0, "a");
        if (is_scalar(x)) x = Value::list({x});
        std::vector<Value> vals = values_of(in, x);
        // numpy propagates NaN where pandas skips it
        if (h != "count") {
            for (const auto& v : vals)
                if (v.is_float() && std::isnan(v.as_float())) return Value::number(kNaN);
        }
        const int ddof = (int)to_index(a.get(kKw, "ddof", Value::integer(0)), "ddof");
        if (vals.empty() && (h == "min" || h == "max")) {
            throw ScriptError("ValueError", "zero-size array to reduction operation " + h + " which has no identity");
        }
        return reduce_values(vals, h, ddof);
    });
}

Value nan_reduction(const char* name, const char* how) {
    const std::string h = how;
    return native(name, [h](Interpreter& in, CallArgs& a) {
        Value x = a.get(0, "a");
        if (is_scalar(x)) x = Value::list({x});
        return reduce_values(values_of(in, x), h, (int)to_index(a.get(kKw, "ddof", Value::integer(0)), "ddof"));
    });
}

Value unary_fn(const char* name, double (*f)(double)) {
    const std::string fn = name;
    return native(name, [fn, f](Interpreter& in, CallArgs& a) {
        return unary_map(in, a.get(0, "x"), fn.c_str(), [f](double d) { return f(d); });
    });
}

std::vector<double> doubles_of(Interpreter& in, const Value& v, const char* fn) {
    std::vector<double> out;
    if (is_scalar(v)) {
        out.push_back(number_of(v, fn));
        return out;
    }
    for (const auto& it : values_of(in, v)) out.push_back(number_of(it, fn));
    return out;
}

Value array_of_doubles(const std::vector<double>& xs) {
    std::vector<Value> out;
    out.reserve(xs.size());
    for (double d : xs) out.push_back(Value::number(d));
    return SeriesObject::array(std::move(out));
}

Value filled(const CallArgs& a, double fill, const char* fn) {
    Value shape = a.get(0, "shape");
    int64_t n = 0;
    if (shape.is_sequence()) {
        n = 1;
        for (const auto& d : shape.as_list()->items) n *= to_index(d, fn);
        if (shape.as_list()->items.size() > 1) {
            throw ScriptError("NotImplementedError", std::string(fn) + ": only one-dimensional arrays are supported");
        }
    } else {
        n = to_index(shape, fn);
    }
    if (n < 0 || n > kMaxGenerated) throw ScriptError("ValueError", std::string(fn) + ": array size out of range");
    budget_check((uint64_t)n * sizeof(Value));
    std::vector<Value> out((size_t)n, Value::number(fill));
    return SeriesObject::array(std::move(out));
}

double percentile_of(std::vector<double> xs, double q) {
    xs.erase(std::remove_if(xs.begin(), xs.end(), [](double d) { return std::isnan(d); }), xs.end());
    if (xs.empty()) return kNaN;
    std::sort(xs.begin(), xs.end());
    const double pos = q / 100.0 * (double)(xs.size() - 1);
    const size_t lo = (size_t)std::floor(pos);
    const size_t hi = std::min(xs.size() - 1, lo + 1);
    return xs[lo] + (xs[hi] - xs[lo]) * (pos - (double)lo);
}

// Position of the extreme element, first on ties.
Value arg_extreme(Interpreter& in, const Value& x, bool want_max) {
    std::vector<Value> vals = values_of(in, x);
    if (vals.empty()) throw ScriptError("ValueError", "attempt to get argmax of an empty sequence");
    size_t best = 0;
    for (size_t i = 0; i < vals.size(); i++) {
        if (is_missing(vals[i])) return Value::integer((int64_t)i);
        const int c = compare_values(vals[i], vals[best]);
        if (want_max ? c > 0 : c < 0) best = i;
    }
    return Value::integer((int64_t)best);
}

} // namespace

Value make_numpy_module() {
    auto m = std::make_shared<ModuleObject>("numpy");
    m->define("pi", Value::number(kPi));
    m->define("e", Value::number(std::exp(1.0)));
    m->define("nan", Value::number(kNaN));
    m->define("inf", Value::number(std::numeric_limits<double>::infinity()));

    m->define("array", native("array", [](Interpreter& in, CallArgs& a) {
                  Value x = a.get(0, "object");
                  if (is_scalar(x)) return SeriesObject::array({x});
                  std::vector<Value> vals = values_of(in, x);
                  for (const auto& v : vals) {
                      if (v.is_sequence() || (v.is_object() && v.as_object()->iterable())) {
                          throw ScriptError("NotImplementedError", "np.array: only one-dimensional arrays are supported");
                      }
                  }
                  return SeriesObject::array(std::move(vals));
              }));
    m->define("asarray", m->get_attr("array"));
    m->define("arange", native("arange", [](Interpreter&, CallArgs& a) {
                  Value start = a.get(0, "start"), stop = a.get(1, "stop"), step = a.get(2, "step", Value::integer(1));
                  if (stop.is_none()) {
                      stop = start;
                      start = Value::integer(0);
                  }
                  const bool ints = start.is_int() && stop.is_int() && step.is_int();
                  const double lo = to_double(start, "arange"), hi = to_double(stop, "arange"),
                               st = to_double(step, "arange");
                  if (st == 0.0) throw ScriptError("ZeroDivisionError", "arange: step must not be zero");
                  const double count = std::ceil((hi - lo) / st);
                  if (count > (double)kMaxGenerated) throw ScriptError("ValueError", "arange: array size out of range");
                  std::vector<Value> out;
                  for (int64_t i = 0; i < (int64_t)std::max(0.0, count); i++) {
                      if (ints) out.push_back(Value::integer(start.as_int() + i * step.as_int()));
                      else out.push_back(Value::number(lo + (double)i * st));
                  }
                  return SeriesObject::array(std::move(out));
              }));
    m->define("linspace", native("linspace", [](Interpreter&, CallArgs& a) {
                  const double lo = to_double(a.get(0, "start"), "linspace");
                  const double hi = to_double(a.get(1, "stop"), "linspace");
                  const int64_t n = to_index(a.get(2, "num", Value::integer(50)), "num");
                  if (n < 0 || n > kMaxGenerated) throw ScriptError("ValueError", "linspace: num out of range");
                  const bool endpoint = is_truthy(a.get(kKw, "endpoint", Value::boolean(true)));
                  const double div = endpoint ? (double)(n - 1) : (double)n;
                  std::vector<Value> out;
                  for (int64_t i = 0; i < n; i++) {
                      out.push_back(Value::number(n == 1 ? lo : lo + (hi - lo) * (double)i / div));
                  }
                  return SeriesObject::array(std::move(out));
              }));
    m->define("zeros", native("zeros", [](Interpreter&, CallArgs& a) { return filled(a, 0.0, "zeros"); }));
    m->define("ones", native("ones", [](Interpreter&, CallArgs& a) { return filled(a, 1.0, "ones"); }));

    static const std::pair<const char*, const char*> kReductions[] = {
        {"sum", "sum"}, {"mean", "mean"}, {"median", "median"}, {"min", "min"}, {"max", "max"},
        {"amin", "min"}, {"amax", "max"}, {"std", "std"}, {"var", "var"}, {"count_nonzero", "count"},
    };
    for (const auto& r : kReductions) m->define(r.first, reduction(r.first, r.second));
    static const std::pair<const char*, const char*> kNanReductions[] = {
        {"nansum", "sum"}, {"nanmean", "mean"}, {"nanmedian", "median"}, {"nanmin", "min"},
        {"nanmax", "max"}, {"nanstd", "std"},
    };
    for (const auto& r : kNanReductions) m->define(r.first, nan_reduction(r.first, r.second));

    m->define("sqrt", unary_fn("sqrt", [](double d) { return std::sqrt(d); }));
    m->define("abs", unary_fn("abs", [](double d) { return std::fabs(d); }));
    m->define("absolute", m->get_attr("abs"));
    m->define("log", unary_fn("log", [](double d) { return std::log(d); }));
    m->define("log10", unary_fn("log10", [](double d) { return std::log10(d); }));
    m->define("log2", unary_fn("log2", [](double d) { return std::log2(d); }));
    m->define("exp", unary_fn("exp", [](double d) { return std::exp(d); }));
    m->define("sin", unary_fn("sin", [](double d) { return std::sin(d); }));
    m->define("cos", unary_fn("cos", [](double d) { return std::cos(d); }));
    m->define("tan", unary_fn("tan", [](double d) { return std::tan(d); }));
    m->define("arctan", unary_fn("arctan", [](double d) { return std::atan(d); }));
    m->define("floor", unary_fn("floor", [](double d) { return std::floor(d); }));
    m->define("ceil", unary_fn("ceil", [](double d) { return std::ceil(d); }));
    m->define("radians", unary_fn("radians", [](double d) { return d * kPi / 180.0; }));
    m->define("degrees", unary_fn("degrees", [](double d) { return d * 180.0 / kPi; }));
    m->define("deg2rad", m->get_attr("radians"));
    m->define("rad2deg", m->get_attr("degrees"));
    m->define("square", unary_fn("square", [](double d) { return d * d; }));

    m->define("round", native("round", [](Interpreter& in, CallArgs& a) {
                  const int nd = (int)to_index(a.get(1, "decimals", Value::integer(0)), "decimals");
                  return unary_map(in, a.get(0, "a"), "round", [nd](double d) { return round_half_even(d, nd); });
              }));
    m->define("around", m->get_attr("round"));
    m->define("arctan2", native("arctan2", [](Interpreter& in, CallArgs& a) {
                  return binary_map(in, a.get(0, "y"), a.get(1, "x"), "arctan2",
                                    [](double y, double x) { return std::atan2(y, x); });
              }));
    m->define("hypot", native("hypot", [](Interpreter& in, CallArgs& a) {
                  return binary_map(in, a.get(0, "x1"), a.get(1, "x2"), "hypot",
                                    [](double x, double y) { return std::hypot(x, y); });
              }));
    m->define("power", native("power", [](Interpreter& in, CallArgs& a) {
                  return binary_map(in, a.get(0, "x1"), a.get(1, "x2"), "power",
                                    [](double x, double y) { return std::pow(x, y); });
              }));
    m->define("isnan", native("isnan", [](Interpreter& in, CallArgs& a) {
                  Value x = a.get(0, "x");
                  if (is_scalar(x)) return Value::boolean(is_missing(x));
                  std::vector<Value> out;
                  for (const auto& v : values_of(in, x)) out.push_back(Value::boolean(is_missing(v)));
                  return same_shape(x, std::move(out));
              }));
    m->define("clip", native("clip", [](Interpreter& in, CallArgs& a) {
                  Value lo = a.get(1, "a_min"), hi = a.get(2, "a_max");
                  const double l = lo.is_none() ? -std::numeric_limits<double>::infinity() : to_double(lo, "a_min");
                  const double h = hi.is_none() ? std::numeric_limits<double>::infinity() : to_double(hi, "a_max");
                  return unary_map(in, a.get(0, "a"), "clip", [l, h](double d) { return std::isnan(d) ? d : std::min(h, std::max(l, d)); });
              }));
    m->define("where", native("where", [](Interpreter& in, CallArgs& a) {
                  std::vector<Value> cond = values_of(in, a.get(0, "condition"));
                  if (!a.present(1, "x")) {
                      std::vector<Value> idx;
                      for (size_t i = 0; i < cond.size(); i++)
                          if (!is_missing(cond[i]) && is_truthy(cond[i])) idx.push_back(Value::integer((int64_t)i));
                      return Value::tuple({SeriesObject::array(std::move(idx))});
                  }
                  Value x = a.get(1, "x"), y = a.get(2, "y");
                  std::vector<Value> xs = is_scalar(x) ? std::vector<Value>{} : values_of(in, x);
                  std::vector<Value> ys = is_scalar(y) ? std::vector<Value>{} : values_of(in, y);
                  if ((!xs.empty() && xs.size() != cond.size()) || (!ys.empty() && ys.size() != cond.size())) {
                      throw ScriptError("ValueError", "operands could not be broadcast together");
                  }
                  std::vector<Value> out;
                  for (size_t i = 0; i < cond.size(); i++) {
                      const bool pick = !is_missing(cond[i]) && is_truthy(cond[i]);
                      out.push_back(pick ? (xs.empty() ? x : xs[i]) : (ys.empty() ? y : ys[i]));
                  }
                  return SeriesObject::array(std::move(out));
              }));
    m->define("cumsum", native("cumsum", [](Interpreter& in, CallArgs& a) {
                  std::vector<Value> out;
                  Value acc = Value::integer(0);
                  for (const auto& v : values_of(in, a.get(0, "a"))) {
                      acc = is_missing(v) || is_missing(acc) ? Value::number(kNaN) : numeric_binary("+", acc, v);
                      out.push_back(acc);
                  }
                  return SeriesObject::array(std::move(out));
              }));
    m->define("diff", native("diff", [](Interpreter& in, CallArgs& a) {
                  std::vector<Value> vals = values_of(in, a.get(0, "a"));
                  std::vector<Value> out;
                  for (size_t i = 1; i < vals.size(); i++) {
                      if (is_missing(vals[i]) || is_missing(vals[i - 1])) out.push_back(Value::number(kNaN));
                      else out.push_back(numeric_binary("-", vals[i], vals[i - 1]));
                  }
                  return SeriesObject::array(std::move(out));
              }));
    m->define("percentile", native("percentile", [](Interpreter& in, CallArgs& a) {
                  std::vector<double> xs = doubles_of(in, a.get(0, "a"), "percentile");
                  Value q = a.get(1, "q");
                  auto one = [&](double p) {
                      if (p < 0.0 || p > 100.0) throw ScriptError("ValueError", "Percentiles must be in the range [0, 100]");
                      return percentile_of(xs, p);
                  };
                  if (q.is_number()) return Value::number(one(q.as_float()));
                  std::vector<double> out;
                  for (double p : doubles_of(in, q, "percentile")) out.push_back(one(p));
                  return array_of_doubles(out);
              }));
    m->define("quantile", native("quantile", [](Interpreter& in, CallArgs& a) {
                  const double q = to_double(a.get(1, "q"), "quantile");
                  if (q < 0.0 || q > 1.0) throw ScriptError("ValueError", "Quantiles must be in the range [0, 1]");
                  return Value::number(percentile_of(doubles_of(in, a.get(0, "a"), "quantile"), q * 100.0));
              }));
    m->define("argmax", native("argmax", [](Interpreter& in, CallArgs& a) { return arg_extreme(in, a.get(0, "a"), true); }));
    m->define("argmin", native("argmin", [](Interpreter& in, CallArgs& a) { return arg_extreme(in, a.get(0, "a"), false); }));
    m->define("unique", native("unique", [](Interpreter& in, CallArgs& a) {
                  std::vector<Value> vals = values_of(in, a.get(0, "ar"));
                  std::unordered_set<std::string> seen;
                  std::vector<Value> out;
                  for (const auto& v : vals)
                      if (seen.insert(hash_key(v)).second) out.push_back(v);
                  std::stable_sort(out.begin(), out.end(), [](const Value& x, const Value& y) {
                      if (is_missing(x) || is_missing(y)) return !is_missing(x) && is_missing(y);
                      return compare_values(x, y) < 0;
                  });
                  return SeriesObject::array(std::move(out));
              }));
    m->define("concatenate", native("concatenate", [](Interpreter& in, CallArgs& a) {
                  std::vector<Value> out;
                  for (const auto& part : in.iterate(a.get(0, "arrays"))) {
                      for (const auto& v : values_of(in, part)) out.push_back(v);
                  }
                  return SeriesObject::array(std::move(out));
              }));
    return Value::object(m);
}

Value make_pandas_module() {
    auto m = std::make_shared<ModuleObject>("pandas");

    m->define("DataFrame", native("DataFrame", [](Interpreter& in, CallArgs& a) {
                  Value src = a.get(0, "data");
                  auto data = std::make_shared<FrameData>();
                  if (src.is_dict()) {
                      const auto& d = *src.as_dict();
                      size_t rows = 0;
                      bool first = true;
                      for (size_t i = 0; i < d.keys.size(); i++) {
                          std::vector<Value> col = is_scalar(d.vals[i]) ? std::vector<Value>{d.vals[i]} : values_of(in, d.vals[i]);
                          if (first) rows = col.size();
                          else if (col.size() != rows) throw ScriptError("ValueError", "All arrays must be of the same length");
                          first = false;
                          data->names.push_back(str_value(d.keys[i]));
                          data->cols.push_back(std::move(col));
                      }
                      for (size_t r = 0; r < rows; r++) data->index.push_back(Value::integer((int64_t)r));
                  } else if (!src.is_none()) {
                      // list of records
                      std::vector<Value> records = in.iterate(src);
                      for (const auto& rec : records) {
                          if (!rec.is_dict()) throw ScriptError("TypeError", "DataFrame rows must be dicts");
                          for (const auto& k : rec.as_dict()->keys) {
                              const std::string name = str_value(k);
                              if (data->find(name) < 0) {
                                  data->names.push_back(name);
                                  data->cols.emplace_back();
                              }
                          }
                      }
                      for (size_t r = 0; r < records.size(); r++) {
                          for (size_t c = 0; c < data->names.size(); c++) {
                              Value v;
                              if (!records[r].as_dict()->get(Value::str(data->names[c]), &v)) v = Value::number(kNaN);
                              data->cols[c].push_back(v);
                          }
                          data->index.push_back(Value::integer((int64_t)r));
                      }
                  }
                  budget_check((uint64_t)data->rows() * (data->cols.size() + 1) * sizeof(Value));
                  return Value::object(std::make_shared<FrameObject>(data, false));
              }));
    m->define("Series", native("Series", [](Interpreter& in, CallArgs& a) {
                  Value src = a.get(0, "data");
                  std::vector<Value> vals, labels;
                  if (src.is_dict()) {
                      labels = src.as_dict()->keys;
                      vals = src.as_dict()->vals;
                  } else if (!src.is_none()) {
                      vals = values_of(in, src);
                  }
                  Value index = a.get(1, "index");
                  if (!index.is_none()) labels = values_of(in, index);
                  Value name = a.get(kKw, "name");
                  return SeriesObject::series(std::move(vals), std::move(labels), name.is_none() ? "" : str_value(name));
              }));
    static const std::pair<const char*, bool> kMissingTests[] = {
        {"isna", true}, {"isnull", true}, {"notna", false}, {"notnull", false},
    };
    for (const auto& test : kMissingTests) {
        const char* name = test.first;
        const bool want_missing = test.second;
        m->define(name, native(name, [want_missing](Interpreter& in, CallArgs& a) {
                      Value x = a.get(0, "obj");
                      if (is_scalar(x)) return Value::boolean(is_missing(x) == want_missing);
                      std::vector<Value> out;
                      for (const auto& v : values_of(in, x)) out.push_back(Value::boolean(is_missing(v) == want_missing));
                      return same_shape(x, std::move(out));
                  }));
    }
    m->define("to_numeric", native("to_numeric", [](Interpreter& in, CallArgs& a) {
                  const std::string errors = a.get(kKw, "errors").is_none() ? "raise" : str_value(a.get(kKw, "errors"));
                  auto convert = [&errors](const Value& v) {
                      if (v.is_number() || is_missing(v)) return v;
                      const std::string s = str_value(v);
                      char* end = nullptr;
                      const double d = std::strtod(s.c_str(), &end);
                      if (!s.empty() && end && *end == '\0') {
                          if (d == std::floor(d) && s.find_first_of(".eE") == std::string::npos && std::fabs(d) < 9e15) {
                              return Value::integer((int64_t)d);
                          }
                          return Value::number(d);
                      }
                      if (errors == "coerce") return Value::number(kNaN);
                      if (errors == "ignore") return v;
                      throw ScriptError("ValueError", "Unable to parse string \"" + s + "\"");
                  };
                  Value x = a.get(0, "arg");
                  if (is_scalar(x)) return convert(x);
                  std::vector<Value> out;
                  for (const auto& v : values_of(in, x)) out.push_back(convert(v));
                  return same_shape(x, std::move(out));
              }));
    m->define("NA", Value::number(kNaN));
    return Value::object(m);
}

Value make_math_module() {
    auto m = std::make_shared<ModuleObject>("math");
    m->define("pi", Value::number(kPi));
    m->define("e", Value::number(std::exp(1.0)));
    m->define("tau", Value::number(2 * kPi));
    m->define("inf", Value::number(std::numeric_limits<double>::infinity()));
    m->define("nan", Value::number(kNaN));

    auto scalar = [&m](const char* name, double (*f)(double), bool domain_check) {
        const std::string fn = name;
        m->define(name, native(name, [fn, f, domain_check](Interpreter&, CallArgs& a) {
                      const double r = f(to_double(a.get(0, "x"), fn.c_str()));
                      if (domain_check && std::isnan(r)) throw ScriptError("ValueError", "math domain error");
                      return Value::number(r);
                  }));
    };
    scalar("sqrt", [](double d) { return std::sqrt(d); }, true);
    scalar("log10", [](double d) { return d <= 0 ? std::nan("") : std::log10(d); }, true);
    scalar("exp", [](double d) { return std::exp(d); }, false);
    scalar("sin", [](double d) { return std::sin(d); }, false);
    scalar("cos", [](double d) { return std::cos(d); }, false);
    scalar("tan", [](double d) { return std::tan(d); }, false);
    scalar("atan", [](double d) { return std::atan(d); }, false);
    scalar("asin", [](double d) { return std::asin(d); }, true);
    scalar("acos", [](double d) { return std::acos(d); }, true);
    scalar("fabs", [](double d) { return std::fabs(d); }, false);
    scalar("radians", [](double d) { return d * kPi / 180.0; }, false);
    scalar("degrees", [](double d) { return d * 180.0 / kPi; }, false);

    m->define("log", native("log", [](Interpreter&, CallArgs& a) {
                  const double x = to_double(a.get(0, "x"), "log");
                  if (x <= 0) throw ScriptError("ValueError", "math domain error");
                  if (!a.present(1, "base")) return Value::number(std::log(x));
                  const double b = to_double(a.get(1, "base"), "log");
                  if (b <= 0 || b == 1) throw ScriptError("ValueError", "math domain error");
                  return Value::number(std::log(x) / std::log(b));
              }));
    for (const char* name : {"floor", "ceil", "trunc"}) {
        const std::string fn = name;
        m->define(name, native(name, [fn](Interpreter&, CallArgs& a) {
                      Value x = a.get(0, "x");
                      if (x.is_int() || x.is_bool()) return Value::integer(x.as_int());
                      const double d = to_double(x, fn.c_str());
                      if (!std::isfinite(d)) throw ScriptError("ValueError", "cannot convert float " + float_repr(d) + " to integer");
                      const double r = fn == "floor" ? std::floor(d) : (fn == "ceil" ? std::ceil(d) : std::trunc(d));
                      return Value::integer((int64_t)r);
                  }));
    }
    m->define("atan2", native("atan2", [](Interpreter&, CallArgs& a) {
                  return Value::number(std::atan2(to_double(a.get(0, "y"), "atan2"), to_double(a.get(1, "x"), "atan2")));
              }));
    m->define("hypot", native("hypot", [](Interpreter&, CallArgs& a) {
                  double acc = 0.0;
                  for (const auto& v : a.pos) acc = std::hypot(acc, to_double(v, "hypot"));
                  return Value::number(acc);
              }));
    m->define("pow", native("pow", [](Interpreter&, CallArgs& a) {
                  return Value::number(std::pow(to_double(a.get(0, "x"), "pow"), to_double(a.get(1, "y"), "pow")));
              }));
    m->define("isnan", native("isnan", [](Interpreter&, CallArgs& a) {
                  return Value::boolean(std::isnan(to_double(a.get(0, "x"), "isnan")));
              }));
    m->define("isfinite", native("isfinite", [](Interpreter&, CallArgs& a) {
                  return Value::boolean(std::isfinite(to_double(a.get(0, "x"), "isfinite")));
              }));
    return Value::object(m);
}

} // namespace pitchbox::script
