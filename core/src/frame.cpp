#include "pitchbox/frame.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_set>

namespace pitchbox::script {

namespace {

constexpr const char* kReadOnly = "dataset is read-only";

Value nan_value() { return Value::number(std::numeric_limits<double>::quiet_NaN()); }

void charge_cells(uint64_t n) { budget_check(n * sizeof(Value)); }

std::vector<double> numeric_of(const std::vector<Value>& values, const std::string& how) {
    std::vector<double> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        if (is_missing(v)) continue;
        if (!v.is_number()) {
            throw ScriptError("TypeError", "could not compute " + how + " of non-numeric value " + repr_value(v));
        }
        out.push_back(v.as_float());
    }
    return out;
}

const char* dtype_of(const std::vector<Value>& values) {
    bool all_bool = !values.empty(), all_int = !values.empty(), all_num = !values.empty();
    for (const auto& v : values) {
        if (!v.is_bool()) all_bool = false;
        if (!v.is_int() && !v.is_bool()) all_int = false;
        if (!v.is_number() && !is_missing(v)) all_num = false;
    }
    if (all_bool) return "bool";
    if (all_int) return "int64";
    if (all_num) return "float64";
    return "object";
}

bool is_numeric_column(const std::vector<Value>& values) {
    for (const auto& v : values)
        if (!v.is_number() && !is_missing(v)) return false;
    return true;
}

std::string cell_text(const Value& v) {
    if (v.is_float() && std::isnan(v.as_float())) return "NaN";
    return str_value(v);
}

// Missing values sort last in either direction.
bool less_for_sort(const Value& a, const Value& b, bool ascending) {
    const bool ma = is_missing(a), mb = is_missing(b);
    if (ma || mb) return !ma && mb;
    return ascending ? compare_values(a, b) < 0 : compare_values(b, a) < 0;
}

std::vector<bool> bool_flags(const std::vector<Value>& values) {
    std::vector<bool> out;
    out.reserve(values.size());
    for (const auto& v : values) out.push_back(!is_missing(v) && is_truthy(v));
    return out;
}

bool all_bools(const std::vector<Value>& values) {
    for (const auto& v : values)
        if (!v.is_bool()) return false;
    return true;
}

std::vector<std::string> string_list(Interpreter& in, const Value& v, const char* what) {
    std::vector<std::string> out;
    if (v.is_str()) {
        out.push_back(v.as_str());
        return out;
    }
    for (const auto& it : in.iterate(v)) {
        if (!it.is_str()) throw ScriptError("TypeError", std::string(what) + ": expected column names");
        out.push_back(it.as_str());
    }
    return out;
}

Value elementwise(Interpreter& in, const std::string& op, const Value& x, const Value& y) {
    const bool cmp = op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=";
    if (cmp) {
        if (is_missing(x) || is_missing(y)) return Value::boolean(op == "!=");
        return Value::boolean(in.compare(op, x, y));
    }
    if (op == "&" || op == "|" || op == "^") {
        if (x.is_bool() || y.is_bool() || is_missing(x) || is_missing(y)) {
            const bool a = !is_missing(x) && is_truthy(x);
            const bool b = !is_missing(y) && is_truthy(y);
            return Value::boolean(op == "&" ? (a && b) : (op == "|" ? (a || b) : (a != b)));
        }
        return in.binary(op, x, y);
    }
    if (is_missing(x) || is_missing(y)) return nan_value();
    if (x.is_number() && y.is_number() && y.as_float() == 0.0 && (op == "/" || op == "//" || op == "%")) {
        const double a = x.as_float();
        if (op == "%" || a == 0.0 || std::isnan(a)) return nan_value();
        return Value::number(a > 0 ? std::numeric_limits<double>::infinity() : -std::numeric_limits<double>::infinity());
    }
    return in.binary(op, x, y);
}

// df.loc / df.iloc
class Indexer : public Object {
public:
    Indexer(std::shared_ptr<FrameObject> frame, bool positional, bool read_only)
        : frame_(std::move(frame)), positional_(positional), frame_read_only_(read_only) {}

    std::string type_name() const override { return positional_ ? "_iLocIndexer" : "_LocIndexer"; }

    Value get_item(Interpreter& in, const Value& key) override {
        if (key.is_tuple() && key.as_list()->items.size() == 2) {
            const auto& parts = key.as_list()->items;
            Value rows = select_rows(in, parts[0]);
            return select_cols(in, rows, parts[1]);
        }
        return select_rows(in, key);
    }

    void set_item(const Value&, const Value&) override {
        if (frame_read_only_) throw ScriptError("TypeError", kReadOnly);
        throw ScriptError("NotImplementedError", "assignment through an indexer is not supported");
    }

private:
    std::shared_ptr<FrameObject> frame_;
    bool positional_;
    bool frame_read_only_;

    bool is_full_slice(const Value& key) const {
        if (!key.is_object()) return false;
        auto sl = std::dynamic_pointer_cast<SliceObject>(key.as_object());
        return sl && !sl->lower && !sl->upper && !sl->step;
    }

    Value select_rows(Interpreter& in, const Value& key) {
        const FrameData& d = frame_->data();
        if (is_full_slice(key)) return frame_->filter([&] {
            std::vector<size_t> all(d.rows());
            std::iota(all.begin(), all.end(), 0);
            return all;
        }());
        if (key.is_object()) {
            if (auto sl = std::dynamic_pointer_cast<SliceObject>(key.as_object())) {
                return frame_->filter(sl->positions(d.rows()));
            }
        }
        if (key.is_object() || key.is_list()) {
            std::vector<Value> vals = in.iterate(key);
            if (all_bools(vals)) return frame_->filter(frame_->mask_rows(key));
            std::vector<size_t> pos;
            for (const auto& v : vals) pos.push_back(position_of(v));
            return frame_->filter(pos);
        }
        return frame_->row(position_of(key));
    }

    Value select_cols(Interpreter& in, const Value& rows, const Value& key) {
        if (is_full_slice(key)) return rows;
        auto sub = rows.is_object() ? std::dynamic_pointer_cast<FrameObject>(rows.as_object()) : nullptr;
        if (!sub) {
            // single row selected: `rows` is a Series keyed by column name
            if (positional_) {
                auto s = std::dynamic_pointer_cast<SeriesObject>(rows.as_object());
                return s->values()[(size_t)normalize(to_index(key, "iloc"), s->len())];
            }
            return in.subscript(rows, key);
        }
        if (positional_) {
            const FrameData& d = sub->data();
            if (key.is_int()) return sub->column(d.names[(size_t)normalize(key.as_int(), d.names.size())]);
            std::vector<std::string> names;
            for (const auto& v : in.iterate(key)) names.push_back(d.names[(size_t)normalize(to_index(v, "iloc"), d.names.size())]);
            return sub->select_columns(names);
        }
        if (key.is_str()) return sub->column(key.as_str());
        return sub->select_columns(string_list(in, key, "loc"));
    }

    static int64_t normalize(int64_t i, size_t n) {
        if (i < 0) i += (int64_t)n;
        if (i < 0 || i >= (int64_t)n) throw ScriptError("IndexError", "single positional indexer is out-of-bounds");
        return i;
    }

    size_t position_of(const Value& key) const {
        const FrameData& d = frame_->data();
        if (positional_) return (size_t)normalize(to_index(key, "iloc"), d.rows());
        for (size_t i = 0; i < d.index.size(); i++)
            if (values_equal(d.index[i], key)) return i;
        throw ScriptError("KeyError", repr_value(key));
    }
};

} // namespace

bool is_missing(const Value& v) {
    return v.is_none() || (v.is_float() && std::isnan(v.as_float()));
}

// ---------------------------------------------------------------------------
// FrameData

int FrameData::find(const std::string& name) const {
    for (size_t i = 0; i < names.size(); i++)
        if (names[i] == name) return (int)i;
    return -1;
}

void FrameData::sync_charge() {
    uint64_t bytes = (uint64_t)rows() * (cols.size() + 1) * sizeof(Value);
    for (const auto& n : names) bytes += n.size() + sizeof(std::string);
    charge.set(bytes);
}

std::shared_ptr<FrameData> FrameData::take(const std::vector<size_t>& rows) const {
    charge_cells((uint64_t)rows.size() * (cols.size() + 1));
    auto out = std::make_shared<FrameData>();
    out->names = names;
    out->index_name = index_name;
    out->cols.resize(cols.size());
    for (size_t c = 0; c < cols.size(); c++) {
        out->cols[c].reserve(rows.size());
        for (size_t r : rows) out->cols[c].push_back(cols[c][r]);
    }
    out->index.reserve(rows.size());
    for (size_t r : rows) out->index.push_back(index[r]);
    return out;
}

std::shared_ptr<FrameData> frame_data_from_dataset(const Dataset& ds) {
    auto out = std::make_shared<FrameData>();
    const size_t n = ds.row_count();
    for (const auto& col : ds.columns) {
        bool numeric = true, integral = true, gaps = false;
        for (const auto& c : col.cells) {
            if (c.type == Cell::Type::String) numeric = false;
            else if (c.type == Cell::Type::Null) gaps = true;
            else if (c.number != std::floor(c.number) || std::fabs(c.number) > 9007199254740992.0) integral = false;
        }
        std::vector<Value> vals;
        vals.reserve(n);
        for (const auto& c : col.cells) {
            switch (c.type) {
                case Cell::Type::Null:
                    vals.push_back(numeric ? nan_value() : Value());
                    break;
                case Cell::Type::Number:
                    if (numeric && integral && !gaps) vals.push_back(Value::integer((int64_t)c.number));
                    else vals.push_back(Value::number(c.number));
                    break;
                case Cell::Type::String:
                    vals.push_back(Value::str(c.text));
                    break;
            }
        }
        out->names.push_back(col.name);
        out->cols.push_back(std::move(vals));
    }
    out->index.reserve(n);
    for (size_t i = 0; i < n; i++) out->index.push_back(Value::integer((int64_t)i));
    return out;
}

// ---------------------------------------------------------------------------
// reductions

Value reduce_values(const std::vector<Value>& values, const std::string& how, int ddof) {
    if (how == "size") return Value::integer((int64_t)values.size());
    std::vector<Value> present;
    present.reserve(values.size());
    for (const auto& v : values)
        if (!is_missing(v)) present.push_back(v);

    if (how == "count") return Value::integer((int64_t)present.size());
    if (how == "nunique") {
        std::unordered_set<std::string> seen;
        for (const auto& v : present) seen.insert(hash_key(v));
        return Value::integer((int64_t)seen.size());
    }
    if (how == "first") return present.empty() ? nan_value() : present.front();
    if (how == "last") return present.empty() ? nan_value() : present.back();
    if (how == "min" || how == "max") {
        if (present.empty()) return nan_value();
        Value best = present.front();
        for (const auto& v : present) {
            const int c = compare_values(v, best);
            if (how == "min" ? c < 0 : c > 0) best = v;
        }
        return best;
    }
    if (how == "sum") {
        Value acc = Value::integer(0);
        for (const auto& v : present) {
            if (!v.is_number()) throw ScriptError("TypeError", "could not compute sum of non-numeric value " + repr_value(v));
            acc = numeric_binary("+", acc, v.is_bool() ? Value::integer(v.as_int()) : v);
        }
        return acc;
    }
    std::vector<double> xs = numeric_of(present, how);
    const double n = (double)xs.size();
    if (how == "mean") {
        if (xs.empty()) return nan_value();
        return Value::number(std::accumulate(xs.begin(), xs.end(), 0.0) / n);
    }
    if (how == "median") {
        if (xs.empty()) return nan_value();
        std::sort(xs.begin(), xs.end());
        const size_t m = xs.size() / 2;
        return Value::number(xs.size() % 2 ? xs[m] : (xs[m - 1] + xs[m]) / 2.0);
    }
    if (how == "std" || how == "var") {
        if (n - ddof <= 0) return nan_value();
        const double mean = std::accumulate(xs.begin(), xs.end(), 0.0) / n;
        double ss = 0.0;
        for (double x : xs) ss += (x - mean) * (x - mean);
        const double var = ss / (n - ddof);
        return Value::number(how == "std" ? std::sqrt(var) : var);
    }
    throw ScriptError("ValueError", "unknown aggregation '" + how + "'");
}

// ---------------------------------------------------------------------------
// SeriesObject

SeriesObject::SeriesObject(Kind kind, std::vector<Value> values, std::vector<Value> labels, std::string name,
                           bool read_only)
    : kind_(kind), values_(std::move(values)), labels_(std::move(labels)), name_(std::move(name)), read_only_(read_only) {
    if (!labels_.empty() && labels_.size() != values_.size()) {
        throw ScriptError("ValueError", "Length of values does not match length of index");
    }
    sync_charge();
}

void SeriesObject::sync_charge() {
    charge_.set((uint64_t)(values_.size() + labels_.size()) * sizeof(Value) + name_.size());
}

Value SeriesObject::array(std::vector<Value> values) {
    charge_cells(values.size());
    return Value::object(std::make_shared<SeriesObject>(Kind::Array, std::move(values)));
}

Value SeriesObject::series(std::vector<Value> values, std::vector<Value> labels, std::string name) {
    charge_cells(values.size() + labels.size());
    return Value::object(std::make_shared<SeriesObject>(Kind::Series, std::move(values), std::move(labels), std::move(name)));
}

std::string SeriesObject::type_name() const {
    switch (kind_) {
        case Kind::Series: return "Series";
        case Kind::Index: return "Index";
        case Kind::Array: return "ndarray";
    }
    return "Series";
}

Value SeriesObject::label(size_t i) const {
    return labels_.empty() ? Value::integer((int64_t)i) : labels_[i];
}

std::vector<Value> SeriesObject::labels() const {
    std::vector<Value> out;
    out.reserve(values_.size());
    for (size_t i = 0; i < values_.size(); i++) out.push_back(label(i));
    return out;
}

Value SeriesObject::derive(std::vector<Value> values) const {
    charge_cells(values.size());
    const Kind k = kind_ == Kind::Index ? Kind::Array : kind_;
    auto s = std::make_shared<SeriesObject>(k, std::move(values), kind_ == Kind::Series ? labels_ : std::vector<Value>{},
                                            name_);
    s->index_name = index_name;
    return Value::object(s);
}

Value SeriesObject::select(const std::vector<size_t>& pos) const {
    charge_cells(pos.size() * 2);
    std::vector<Value> vals, labs;
    vals.reserve(pos.size());
    for (size_t p : pos) {
        vals.push_back(values_[p]);
        if (!labels_.empty()) labs.push_back(labels_[p]);
    }
    auto s = std::make_shared<SeriesObject>(kind_, std::move(vals), std::move(labs), name_);
    s->index_name = index_name;
    return Value::object(s);
}

Value SeriesObject::get_attr(const std::string& name) {
    if (name == "values") return array(values_);
    if (name == "index") return Value::object(std::make_shared<SeriesObject>(Kind::Index, labels()));
    if (name == "name") return name_.empty() ? Value() : Value::str(name_);
    if (name == "size") return Value::integer((int64_t)values_.size());
    if (name == "shape") return Value::tuple({Value::integer((int64_t)values_.size())});
    if (name == "dtype") return Value::str(dtype_of(values_));
    if (name == "empty") return Value::boolean(values_.empty());
    Value m = method(name);
    if (!m.is_none()) return m;
    throw ScriptError("AttributeError", "'" + type_name() + "' object has no attribute '" + name + "'");
}

void SeriesObject::set_attr(const std::string& name, const Value& v) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    if (name == "name" && v.is_str()) {
        name_ = v.as_str();
        return;
    }
    Object::set_attr(name, v);
}

Value SeriesObject::get_item(Interpreter& in, const Value& key) {
    if (key.is_object()) {
        if (auto sl = std::dynamic_pointer_cast<SliceObject>(key.as_object())) return select(sl->positions(values_.size()));
    }
    if (key.is_object() || key.is_list()) {
        std::vector<Value> keys = in.iterate(key);
        if (all_bools(keys) && !keys.empty()) {
            if (keys.size() != values_.size()) {
                throw ScriptError("IndexError", "boolean index did not match indexed array");
            }
            std::vector<size_t> pos;
            for (size_t i = 0; i < keys.size(); i++)
                if (keys[i].as_bool()) pos.push_back(i);
            return select(pos);
        }
        std::vector<size_t> pos;
        for (const auto& k : keys) {
            for (size_t i = 0; i < values_.size(); i++) {
                if (kind_ == Kind::Series ? values_equal(label(i), k) : (k.is_int() && (int64_t)i == k.as_int())) {
                    pos.push_back(i);
                    break;
                }
            }
        }
        return select(pos);
    }
    if (kind_ == Kind::Series) {
        for (size_t i = 0; i < values_.size(); i++)
            if (values_equal(label(i), key)) return values_[i];
        throw ScriptError("KeyError", repr_value(key));
    }
    int64_t i = to_index(key, type_name().c_str());
    if (i < 0) i += (int64_t)values_.size();
    if (i < 0 || i >= (int64_t)values_.size()) throw ScriptError("IndexError", "index out of bounds");
    return values_[(size_t)i];
}

void SeriesObject::set_item(const Value& key, const Value& v) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    if (kind_ == Kind::Index) throw ScriptError("TypeError", "Index does not support mutable operations");
    if (kind_ == Kind::Array) {
        int64_t i = to_index(key, "ndarray");
        if (i < 0) i += (int64_t)values_.size();
        if (i < 0 || i >= (int64_t)values_.size()) throw ScriptError("IndexError", "index out of bounds");
        values_[(size_t)i] = v;
        return;
    }
    for (size_t i = 0; i < values_.size(); i++) {
        if (values_equal(label(i), key)) {
            values_[i] = v;
            return;
        }
    }
    if (labels_.empty()) labels_ = labels();
    charge_cells(2);
    values_.push_back(v);
    labels_.push_back(key);
    sync_charge();
}

void SeriesObject::del_item(const Value& key) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    Object::del_item(key);
}

bool SeriesObject::binary_op(Interpreter& in, const std::string& op, const Value& other, bool reflected, Value* out) {
    std::vector<Value> rhs;
    bool scalar = false;
    if (other.is_object()) {
        auto s = std::dynamic_pointer_cast<SeriesObject>(other.as_object());
        if (!s) return false;
        rhs = s->values();
    } else if (other.is_sequence()) {
        rhs = other.as_list()->items;
    } else if (other.is_number() || other.is_str() || other.is_none()) {
        scalar = true;
    } else {
        return false;
    }
    if (!scalar && rhs.size() != values_.size()) {
        throw ScriptError("ValueError", "operands could not be broadcast together with shapes (" +
                                            std::to_string(values_.size()) + ",) (" + std::to_string(rhs.size()) + ",)");
    }
    std::vector<Value> res;
    res.reserve(values_.size());
    for (size_t i = 0; i < values_.size(); i++) {
        const Value& y = scalar ? other : rhs[i];
        res.push_back(reflected ? elementwise(in, op, y, values_[i]) : elementwise(in, op, values_[i], y));
    }
    *out = derive(std::move(res));
    return true;
}

bool SeriesObject::unary_op(Interpreter&, const std::string& op, Value* out) {
    std::vector<Value> res;
    res.reserve(values_.size());
    for (const auto& v : values_) {
        if (is_missing(v)) {
            res.push_back(v);
        } else if (op == "~") {
            if (v.is_bool()) res.push_back(Value::boolean(!v.as_bool()));
            else res.push_back(Value::integer(~to_index(v, "~")));
        } else if (op == "-") {
            res.push_back(numeric_binary("-", Value::integer(0), v.is_number() ? v : Value::number(to_double(v, "-"))));
        } else if (op == "+") {
            res.push_back(v);
        } else {
            return false;
        }
    }
    *out = derive(std::move(res));
    return true;
}

bool SeriesObject::contains(Interpreter&, const Value& v, bool* out) {
    *out = false;
    if (kind_ == Kind::Series) {
        for (size_t i = 0; i < values_.size(); i++)
            if (values_equal(label(i), v)) { *out = true; break; }
        return true;
    }
    for (const auto& x : values_)
        if (values_equal(x, v)) { *out = true; break; }
    return true;
}

std::string SeriesObject::repr() const {
    constexpr size_t kMaxRows = 20;
    if (kind_ == Kind::Array) {
        std::string s = "[";
        for (size_t i = 0; i < values_.size(); i++) {
            if (i) s += " ";
            if (values_.size() > kMaxRows && i == kMaxRows / 2) {
                s += "...";
                i = values_.size() - kMaxRows / 2 - 1;
                continue;
            }
            s += values_[i].is_str() ? repr_value(values_[i]) : cell_text(values_[i]);
        }
        return s + "]";
    }
    if (kind_ == Kind::Index) {
        std::string s = "Index([";
        for (size_t i = 0; i < values_.size(); i++) {
            if (i) s += ", ";
            s += repr_value(values_[i]);
        }
        return s + "], dtype='" + dtype_of(values_) + "')";
    }
    size_t width = 0;
    for (size_t i = 0; i < values_.size() && i < kMaxRows; i++) width = std::max(width, cell_text(label(i)).size());
    std::string s;
    for (size_t i = 0; i < values_.size(); i++) {
        if (values_.size() > kMaxRows && i == kMaxRows / 2) {
            s += "...\n";
            i = values_.size() - kMaxRows / 2 - 1;
            continue;
        }
        std::string l = cell_text(label(i));
        s += l + std::string(width - std::min(width, l.size()) + 4, ' ') + cell_text(values_[i]) + "\n";
    }
    if (!name_.empty()) s += "Name: " + name_ + ", ";
    s += std::string("dtype: ") + dtype_of(values_);
    return s;
}

bool SeriesObject::truthy() const {
    if (kind_ == Kind::Array && values_.size() <= 1) return !values_.empty() && is_truthy(values_[0]);
    throw ScriptError("ValueError", "The truth value of a " + type_name() +
                                        " is ambiguous. Use a.empty, a.bool(), a.item(), a.any() or a.all().");
}

Value SeriesObject::method(const std::string& name) {
    auto self = std::static_pointer_cast<SeriesObject>(shared_from_this());
    const int default_ddof = kind_ == Kind::Array ? 0 : 1;

    if (name == "sum" || name == "mean" || name == "median" || name == "min" || name == "max" || name == "count" ||
        name == "std" || name == "var" || name == "nunique") {
        return native(name, [self, name, default_ddof](Interpreter&, CallArgs& a) {
            int ddof = a.has_kw("ddof") ? (int)to_index(a.get(99, "ddof"), "ddof") : default_ddof;
            return reduce_values(self->values_, name, ddof);
        });
    }
    if (name == "quantile") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            const double q = to_double(a.get(0, "q", Value::number(0.5)), "quantile");
            if (q < 0.0 || q > 1.0) throw ScriptError("ValueError", "percentiles should all be in the interval [0, 1]");
            std::vector<double> xs = numeric_of(self->values_, "quantile");
            if (xs.empty()) return nan_value();
            std::sort(xs.begin(), xs.end());
            const double pos = q * (double)(xs.size() - 1);
            const size_t lo = (size_t)std::floor(pos);
            const size_t hi = std::min(lo + 1, xs.size() - 1);
            return Value::number(xs[lo] + (xs[hi] - xs[lo]) * (pos - (double)lo));
        });
    }
    if (name == "unique") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::unordered_set<std::string> seen;
            std::vector<Value> out;
            bool had_missing = false;
            for (const auto& v : self->values_) {
                if (is_missing(v)) {
                    if (!had_missing) out.push_back(v);
                    had_missing = true;
                    continue;
                }
                if (seen.insert(hash_key(v)).second) out.push_back(v);
            }
            return array(std::move(out));
        });
    }
    if (name == "tolist" || name == "to_list") {
        return native(name, [self](Interpreter&, CallArgs&) {
            charge_cells(self->values_.size());
            return Value::list(self->values_);
        });
    }
    if (name == "to_numpy") return native(name, [self](Interpreter&, CallArgs&) { return array(self->values_); });
    if (name == "copy") return native(name, [self](Interpreter&, CallArgs&) { return self->derive(self->values_); });
    if (name == "value_counts") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            a.check_kw("value_counts", {"ascending", "normalize", "dropna"});
            const bool ascending = is_truthy(a.get(99, "ascending", Value::boolean(false)));
            const bool normalize = is_truthy(a.get(99, "normalize", Value::boolean(false)));
            std::vector<Value> keys;
            std::vector<int64_t> counts;
            std::unordered_map<std::string, size_t> slot;
            for (const auto& v : self->values_) {
                if (is_missing(v)) continue;
                auto it = slot.emplace(hash_key(v), keys.size());
                if (it.second) {
                    keys.push_back(v);
                    counts.push_back(0);
                }
                counts[it.first->second]++;
            }
            std::vector<size_t> order(keys.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
                return ascending ? counts[x] < counts[y] : counts[x] > counts[y];
            });
            int64_t total = 0;
            for (auto c : counts) total += c;
            std::vector<Value> vals, labs;
            for (size_t i : order) {
                labs.push_back(keys[i]);
                vals.push_back(normalize ? Value::number((double)counts[i] / (double)total) : Value::integer(counts[i]));
            }
            auto s = std::make_shared<SeriesObject>(Kind::Series, std::move(vals), std::move(labs),
                                                    normalize ? "proportion" : "count");
            s->index_name = self->name_;
            return Value::object(s);
        });
    }
    if (name == "dropna") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::vector<size_t> pos;
            for (size_t i = 0; i < self->values_.size(); i++)
                if (!is_missing(self->values_[i])) pos.push_back(i);
            return self->select(pos);
        });
    }
    if (name == "head" || name == "tail") {
        const bool head = name == "head";
        return native(name, [self, head](Interpreter&, CallArgs& a) {
            int64_t n = to_index(a.get(0, "n", Value::integer(5)), "head");
            const size_t len = self->values_.size();
            size_t k = n < 0 ? (size_t)std::max<int64_t>(0, (int64_t)len + n) : std::min<size_t>((size_t)n, len);
            std::vector<size_t> pos(k);
            std::iota(pos.begin(), pos.end(), head ? 0 : len - k);
            return self->select(pos);
        });
    }
    if (name == "nlargest" || name == "nsmallest") {
        const bool largest = name == "nlargest";
        return native(name, [self, largest](Interpreter&, CallArgs& a) {
            const size_t n = (size_t)std::max<int64_t>(0, to_index(a.get(0, "n", Value::integer(5)), "n"));
            std::vector<size_t> pos;
            for (size_t i = 0; i < self->values_.size(); i++)
                if (!is_missing(self->values_[i])) pos.push_back(i);
            std::stable_sort(pos.begin(), pos.end(), [&](size_t x, size_t y) {
                return less_for_sort(self->values_[x], self->values_[y], !largest);
            });
            if (pos.size() > n) pos.resize(n);
            return self->select(pos);
        });
    }
    if (name == "sort_values") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            a.check_kw("sort_values", {"ascending", "na_position"});
            const bool ascending = is_truthy(a.get(0, "ascending", Value::boolean(true)));
            std::vector<size_t> pos(self->values_.size());
            std::iota(pos.begin(), pos.end(), 0);
            std::stable_sort(pos.begin(), pos.end(), [&](size_t x, size_t y) {
                return less_for_sort(self->values_[x], self->values_[y], ascending);
            });
            return self->select(pos);
        });
    }
    if (name == "round") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            const int nd = (int)to_index(a.get(0, "decimals", Value::integer(0)), "decimals");
            std::vector<Value> out;
            out.reserve(self->values_.size());
            for (const auto& v : self->values_) {
                if (v.is_float()) out.push_back(Value::number(round_half_even(v.as_float(), nd)));
                else out.push_back(v);
            }
            return self->derive(std::move(out));
        });
    }
    if (name == "abs") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::vector<Value> out;
            for (const auto& v : self->values_) {
                if (is_missing(v)) out.push_back(v);
                else if (v.is_float()) out.push_back(Value::number(std::fabs(v.as_float())));
                else if (v.is_number()) out.push_back(numeric_binary("*", v, Value::integer(v.as_int() < 0 ? -1 : 1)));
                else throw ScriptError("TypeError", "bad operand type for abs(): '" + std::string(v.type_name()) + "'");
            }
            return self->derive(std::move(out));
        });
    }
    if (name == "isna" || name == "isnull" || name == "notna" || name == "notnull") {
        const bool want_missing = name == "isna" || name == "isnull";
        return native(name, [self, want_missing](Interpreter&, CallArgs&) {
            std::vector<Value> out;
            for (const auto& v : self->values_) out.push_back(Value::boolean(is_missing(v) == want_missing));
            return self->derive(std::move(out));
        });
    }
    if (name == "isin") {
        return native(name, [self](Interpreter& in, CallArgs& a) {
            std::unordered_set<std::string> wanted;
            for (const auto& v : in.iterate(a.get(0, "values")))
                if (!is_missing(v)) wanted.insert(hash_key(v));
            std::vector<Value> out;
            for (const auto& v : self->values_)
                out.push_back(Value::boolean(!is_missing(v) && wanted.count(hash_key(v)) > 0));
            return self->derive(std::move(out));
        });
    }
    if (name == "between") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value lo = a.get(0, "left"), hi = a.get(1, "right");
            std::vector<Value> out;
            for (const auto& v : self->values_)
                out.push_back(Value::boolean(!is_missing(v) && compare_values(v, lo) >= 0 && compare_values(v, hi) <= 0));
            return self->derive(std::move(out));
        });
    }
    if (name == "fillna") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value fill = a.get(0, "value");
            std::vector<Value> out;
            for (const auto& v : self->values_) out.push_back(is_missing(v) ? fill : v);
            return self->derive(std::move(out));
        });
    }
    if (name == "clip") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value lo = a.get(0, "lower"), hi = a.get(1, "upper");
            std::vector<Value> out;
            for (const auto& v : self->values_) {
                Value x = v;
                if (!is_missing(x) && !lo.is_none() && compare_values(x, lo) < 0) x = lo;
                if (!is_missing(x) && !hi.is_none() && compare_values(x, hi) > 0) x = hi;
                out.push_back(x);
            }
            return self->derive(std::move(out));
        });
    }
    if (name == "cumsum") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::vector<Value> out;
            Value acc = Value::integer(0);
            for (const auto& v : self->values_) {
                if (is_missing(v)) {
                    out.push_back(v);
                    continue;
                }
                acc = numeric_binary("+", acc, v);
                out.push_back(acc);
            }
            return self->derive(std::move(out));
        });
    }
    if (name == "idxmax" || name == "idxmin" || name == "argmax" || name == "argmin") {
        const bool want_max = name == "idxmax" || name == "argmax";
        const bool positional = name[0] == 'a';
        return native(name, [self, want_max, positional, name](Interpreter&, CallArgs&) {
            size_t best = self->values_.size();
            for (size_t i = 0; i < self->values_.size(); i++) {
                if (is_missing(self->values_[i])) continue;
                if (best == self->values_.size()) { best = i; continue; }
                const int c = compare_values(self->values_[i], self->values_[best]);
                if (want_max ? c > 0 : c < 0) best = i;
            }
            if (best == self->values_.size()) throw ScriptError("ValueError", "attempt to get " + name + " of an empty sequence");
            return positional ? Value::integer((int64_t)best) : self->label(best);
        });
    }
    if (name == "any" || name == "all") {
        const bool any = name == "any";
        return native(name, [self, any](Interpreter&, CallArgs&) {
            for (bool b : bool_flags(self->values_))
                if (b == any) return Value::boolean(any);
            return Value::boolean(!any);
        });
    }
    if (name == "apply" || name == "map" || name == "astype") {
        return native(name, [self](Interpreter& in, CallArgs& a) {
            Value fn = a.get(0, "func");
            std::vector<Value> out;
            out.reserve(self->values_.size());
            for (const auto& v : self->values_) {
                if (fn.is_dict()) {
                    Value mapped;
                    out.push_back(!is_missing(v) && fn.as_dict()->get(v, &mapped) ? mapped : nan_value());
                } else {
                    out.push_back(in.call(fn, std::vector<Value>{v}));
                }
            }
            return self->derive(std::move(out));
        });
    }
    if (name == "item") {
        return native(name, [self](Interpreter&, CallArgs&) {
            if (self->values_.size() != 1) throw ScriptError("ValueError", "can only convert an array of size 1 to a Python scalar");
            return self->values_[0];
        });
    }
    if (name == "reset_index" && kind_ == Kind::Series) {
        return native(name, [self](Interpreter&, CallArgs& a) {
            const bool drop = is_truthy(a.get(99, "drop", Value::boolean(false)));
            auto d = std::make_shared<FrameData>();
            charge_cells(self->values_.size() * 3);
            if (!drop) {
                d->names.push_back(self->index_name.empty() ? "index" : self->index_name);
                d->cols.push_back(self->labels());
            }
            d->names.push_back(self->name_.empty() ? "0" : self->name_);
            d->cols.push_back(self->values_);
            for (size_t i = 0; i < self->values_.size(); i++) d->index.push_back(Value::integer((int64_t)i));
            if (drop) return self->derive(self->values_);
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    return Value();
}

// ---------------------------------------------------------------------------
// FrameObject

FrameObject::FrameObject(std::shared_ptr<FrameData> data, bool read_only) : data_(std::move(data)), read_only_(read_only) {
    data_->sync_charge();
}

Value FrameObject::column(const std::string& name) const {
    int c = data_->find(name);
    if (c < 0) throw ScriptError("KeyError", "'" + name + "'");
    charge_cells(data_->rows() * 2);
    auto s = std::make_shared<SeriesObject>(SeriesObject::Kind::Series, data_->cols[(size_t)c], data_->index, name,
                                            read_only_);
    s->index_name = data_->index_name;
    return Value::object(s);
}

Value FrameObject::row(size_t pos) const {
    std::vector<Value> vals, labs;
    for (size_t c = 0; c < data_->cols.size(); c++) {
        vals.push_back(data_->cols[c][pos]);
        labs.push_back(Value::str(data_->names[c]));
    }
    std::string name = data_->index[pos].is_str() ? data_->index[pos].as_str() : str_value(data_->index[pos]);
    return Value::object(std::make_shared<SeriesObject>(SeriesObject::Kind::Series, std::move(vals), std::move(labs),
                                                        name, read_only_));
}

Value FrameObject::filter(const std::vector<size_t>& rows) const {
    return Value::object(std::make_shared<FrameObject>(data_->take(rows), false));
}

Value FrameObject::select_columns(const std::vector<std::string>& names) const {
    charge_cells((uint64_t)names.size() * data_->rows());
    auto d = std::make_shared<FrameData>();
    d->index = data_->index;
    d->index_name = data_->index_name;
    for (const auto& n : names) {
        int c = data_->find(n);
        if (c < 0) throw ScriptError("KeyError", "\"['" + n + "'] not in index\"");
        d->names.push_back(n);
        d->cols.push_back(data_->cols[(size_t)c]);
    }
    return Value::object(std::make_shared<FrameObject>(d, false));
}

std::vector<size_t> FrameObject::mask_rows(const Value& mask) const {
    std::vector<Value> flags;
    if (mask.is_object()) {
        auto s = std::dynamic_pointer_cast<SeriesObject>(mask.as_object());
        if (!s) throw ScriptError("TypeError", "boolean mask expected");
        flags = s->values();
    } else if (mask.is_sequence()) {
        flags = mask.as_list()->items;
    } else {
        throw ScriptError("TypeError", "boolean mask expected");
    }
    if (flags.size() != data_->rows()) {
        throw ScriptError("ValueError", "Item wrong length " + std::to_string(flags.size()) + " instead of " +
                                            std::to_string(data_->rows()) + ".");
    }
    std::vector<size_t> rows;
    const auto b = bool_flags(flags);
    for (size_t i = 0; i < b.size(); i++)
        if (b[i]) rows.push_back(i);
    return rows;
}

Value FrameObject::get_attr(const std::string& name) {
    if (name == "columns") {
        std::vector<Value> names;
        for (const auto& n : data_->names) names.push_back(Value::str(n));
        return Value::object(std::make_shared<SeriesObject>(SeriesObject::Kind::Index, std::move(names)));
    }
    if (name == "index") return Value::object(std::make_shared<SeriesObject>(SeriesObject::Kind::Index, data_->index));
    if (name == "shape") return Value::tuple({Value::integer((int64_t)data_->rows()), Value::integer((int64_t)data_->names.size())});
    if (name == "size") return Value::integer((int64_t)(data_->rows() * data_->names.size()));
    if (name == "empty") return Value::boolean(data_->rows() == 0 || data_->names.empty());
    if (name == "loc" || name == "iloc") {
        auto self = std::static_pointer_cast<FrameObject>(shared_from_this());
        return Value::object(std::make_shared<Indexer>(self, name == "iloc", read_only_));
    }
    Value m = method(name);
    if (!m.is_none()) return m;
    if (data_->find(name) >= 0) return column(name);
    throw ScriptError("AttributeError", "'DataFrame' object has no attribute '" + name + "'");
}

void FrameObject::set_attr(const std::string& name, const Value& v) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    Object::set_attr(name, v);
}

Value FrameObject::get_item(Interpreter& in, const Value& key) {
    if (key.is_str()) return column(key.as_str());
    if (key.is_object()) {
        if (auto sl = std::dynamic_pointer_cast<SliceObject>(key.as_object())) return filter(sl->positions(data_->rows()));
    }
    if (key.is_object() || key.is_sequence()) {
        std::vector<Value> keys = in.iterate(key);
        if (!keys.empty() && all_bools(keys)) return filter(mask_rows(key));
        return select_columns(string_list(in, key, "DataFrame"));
    }
    throw ScriptError("KeyError", repr_value(key));
}

void FrameObject::set_item(const Value& key, const Value& v) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    if (!key.is_str()) throw ScriptError("TypeError", "column name must be a string");
    const size_t n = data_->rows();
    std::vector<Value> col;
    if (v.is_object() || v.is_sequence()) {
        if (v.is_object() && !std::dynamic_pointer_cast<SeriesObject>(v.as_object())) {
            throw ScriptError("TypeError", "cannot assign '" + v.as_object()->type_name() + "' to a column");
        }
        col = v.is_object() ? std::static_pointer_cast<SeriesObject>(v.as_object())->values() : v.as_list()->items;
        if (col.size() != n) {
            throw ScriptError("ValueError", "Length of values (" + std::to_string(col.size()) +
                                                ") does not match length of index (" + std::to_string(n) + ")");
        }
    } else {
        charge_cells(n);
        col.assign(n, v);
    }
    int c = data_->find(key.as_str());
    if (c >= 0) {
        data_->cols[(size_t)c] = std::move(col);
    } else {
        data_->names.push_back(key.as_str());
        data_->cols.push_back(std::move(col));
    }
    data_->sync_charge();
}

void FrameObject::del_item(const Value& key) {
    if (read_only_) throw ScriptError("TypeError", kReadOnly);
    int c = key.is_str() ? data_->find(key.as_str()) : -1;
    if (c < 0) throw ScriptError("KeyError", repr_value(key));
    data_->names.erase(data_->names.begin() + c);
    data_->cols.erase(data_->cols.begin() + c);
    data_->sync_charge();
}

std::vector<Value> FrameObject::iterate(Interpreter&) {
    std::vector<Value> out;
    for (const auto& n : data_->names) out.push_back(Value::str(n));
    return out;
}

bool FrameObject::contains(Interpreter&, const Value& v, bool* out) {
    *out = v.is_str() && data_->find(v.as_str()) >= 0;
    return true;
}

bool FrameObject::truthy() const {
    throw ScriptError("ValueError", "The truth value of a DataFrame is ambiguous. Use a.empty, a.bool(), a.item(), a.any() or a.all().");
}

std::string FrameObject::repr() const {
    constexpr size_t kMaxRows = 10;
    const size_t n = data_->rows();
    std::vector<size_t> shown;
    for (size_t i = 0; i < n; i++) {
        if (n > kMaxRows && i >= kMaxRows / 2 && i < n - kMaxRows / 2) continue;
        shown.push_back(i);
    }
    std::vector<std::vector<std::string>> grid;
    std::vector<std::string> header{""};
    for (const auto& name : data_->names) header.push_back(name);
    grid.push_back(header);
    for (size_t r : shown) {
        std::vector<std::string> line{cell_text(data_->index[r])};
        for (const auto& col : data_->cols) line.push_back(cell_text(col[r]));
        grid.push_back(std::move(line));
    }
    std::vector<size_t> widths(header.size(), 0);
    for (const auto& line : grid)
        for (size_t c = 0; c < line.size(); c++) widths[c] = std::max(widths[c], line[c].size());
    std::string s;
    for (size_t li = 0; li < grid.size(); li++) {
        if (li > 0 && n > kMaxRows && shown[li - 1] == n - kMaxRows / 2) s += "...\n";
        for (size_t c = 0; c < grid[li].size(); c++) {
            const std::string& cell = grid[li][c];
            if (c) s += "  ";
            s += c == 0 ? cell + std::string(widths[c] - cell.size(), ' ') : std::string(widths[c] - cell.size(), ' ') + cell;
        }
        s += "\n";
    }
    s += "\n[" + std::to_string(n) + " rows x " + std::to_string(data_->names.size()) + " columns]";
    return s;
}

Value FrameObject::method(const std::string& name) {
    auto self = std::static_pointer_cast<FrameObject>(shared_from_this());

    if (name == "head" || name == "tail") {
        const bool head = name == "head";
        return native(name, [self, head](Interpreter&, CallArgs& a) {
            int64_t n = to_index(a.get(0, "n", Value::integer(5)), "head");
            const size_t len = self->data_->rows();
            size_t k = n < 0 ? (size_t)std::max<int64_t>(0, (int64_t)len + n) : std::min<size_t>((size_t)n, len);
            std::vector<size_t> pos(k);
            std::iota(pos.begin(), pos.end(), head ? 0 : len - k);
            return self->filter(pos);
        });
    }
    if (name == "copy") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::vector<size_t> all(self->data_->rows());
            std::iota(all.begin(), all.end(), 0);
            return self->filter(all);
        });
    }
    if (name == "dropna") {
        return native(name, [self](Interpreter& in, CallArgs& a) {
            a.check_kw("dropna", {"subset", "how"});
            std::vector<size_t> cols;
            Value subset = a.get(99, "subset");
            if (subset.is_none()) {
                for (size_t c = 0; c < self->data_->cols.size(); c++) cols.push_back(c);
            } else {
                for (const auto& n : string_list(in, subset, "dropna")) {
                    int c = self->data_->find(n);
                    if (c < 0) throw ScriptError("KeyError", "'" + n + "'");
                    cols.push_back((size_t)c);
                }
            }
            Value how = a.get(99, "how", Value::str("any"));
            const bool all = how.is_str() && how.as_str() == "all";
            std::vector<size_t> rows;
            for (size_t r = 0; r < self->data_->rows(); r++) {
                size_t missing = 0;
                for (size_t c : cols)
                    if (is_missing(self->data_->cols[c][r])) missing++;
                if (all ? missing < cols.size() || cols.empty() : missing == 0) rows.push_back(r);
            }
            return self->filter(rows);
        });
    }
    if (name == "fillna") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value fill = a.get(0, "value");
            std::vector<size_t> all(self->data_->rows());
            std::iota(all.begin(), all.end(), 0);
            auto d = self->data_->take(all);
            for (auto& col : d->cols)
                for (auto& v : col)
                    if (is_missing(v)) v = fill;
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    if (name == "sort_values" || name == "nlargest" || name == "nsmallest") {
        return native(name, [self, name](Interpreter& in, CallArgs& a) {
            std::vector<std::string> by;
            std::vector<bool> asc;
            int64_t limit = -1;
            if (name == "sort_values") {
                a.check_kw("sort_values", {"by", "ascending", "na_position"});
                by = string_list(in, a.get(0, "by"), "sort_values");
                Value av = a.get(1, "ascending", Value::boolean(true));
                if (av.is_sequence()) {
                    for (const auto& x : av.as_list()->items) asc.push_back(is_truthy(x));
                } else {
                    asc.assign(by.size(), is_truthy(av));
                }
                if (asc.size() != by.size()) throw ScriptError("ValueError", "Length of ascending != length of by");
            } else {
                limit = std::max<int64_t>(0, to_index(a.get(0, "n"), name.c_str()));
                by = string_list(in, a.get(1, "columns"), name.c_str());
                asc.assign(by.size(), name == "nsmallest");
            }
            std::vector<size_t> keys;
            for (const auto& b : by) {
                int c = self->data_->find(b);
                if (c < 0) throw ScriptError("KeyError", "'" + b + "'");
                keys.push_back((size_t)c);
            }
            std::vector<size_t> rows(self->data_->rows());
            std::iota(rows.begin(), rows.end(), 0);
            if (limit >= 0) {
                rows.erase(std::remove_if(rows.begin(), rows.end(), [&](size_t r) {
                    return is_missing(self->data_->cols[keys[0]][r]);
                }), rows.end());
            }
            std::stable_sort(rows.begin(), rows.end(), [&](size_t x, size_t y) {
                for (size_t k = 0; k < keys.size(); k++) {
                    const Value& vx = self->data_->cols[keys[k]][x];
                    const Value& vy = self->data_->cols[keys[k]][y];
                    if (less_for_sort(vx, vy, asc[k])) return true;
                    if (less_for_sort(vy, vx, asc[k])) return false;
                }
                return false;
            });
            if (limit >= 0 && rows.size() > (size_t)limit) rows.resize((size_t)limit);
            return self->filter(rows);
        });
    }
    if (name == "groupby") {
        return native(name, [self](Interpreter& in, CallArgs& a) {
            std::vector<std::string> by = string_list(in, a.get(0, "by"), "groupby");
            if (by.size() != 1) throw ScriptError("NotImplementedError", "groupby supports exactly one key column");
            return Value::object(std::make_shared<GroupByObject>(self->data_, by[0]));
        });
    }
    if (name == "iterrows") {
        return native(name, [self](Interpreter&, CallArgs&) {
            std::vector<Value> out;
            charge_cells(self->data_->rows() * (self->data_->names.size() + 2));
            for (size_t r = 0; r < self->data_->rows(); r++) out.push_back(Value::tuple({self->data_->index[r], self->row(r)}));
            return Value::list(std::move(out));
        });
    }
    if (name == "reset_index") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            const bool drop = is_truthy(a.get(99, "drop", Value::boolean(false)));
            std::vector<size_t> all(self->data_->rows());
            std::iota(all.begin(), all.end(), 0);
            auto d = self->data_->take(all);
            if (!drop) {
                d->names.insert(d->names.begin(), d->index_name.empty() ? "index" : d->index_name);
                d->cols.insert(d->cols.begin(), d->index);
            }
            for (size_t i = 0; i < d->index.size(); i++) d->index[i] = Value::integer((int64_t)i);
            d->index_name.clear();
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    if (name == "set_index") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value k = a.get(0, "keys");
            if (!k.is_str()) throw ScriptError("TypeError", "set_index expects a column name");
            int c = self->data_->find(k.as_str());
            if (c < 0) throw ScriptError("KeyError", "'" + k.as_str() + "'");
            std::vector<size_t> all(self->data_->rows());
            std::iota(all.begin(), all.end(), 0);
            auto d = self->data_->take(all);
            d->index = d->cols[(size_t)c];
            d->index_name = k.as_str();
            d->names.erase(d->names.begin() + c);
            d->cols.erase(d->cols.begin() + c);
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    if (name == "rename" || name == "drop") {
        return native(name, [self, name](Interpreter& in, CallArgs& a) {
            a.check_kw(name.c_str(), {"columns"});
            Value spec = a.get(0, "columns");
            std::vector<size_t> all(self->data_->rows());
            std::iota(all.begin(), all.end(), 0);
            auto d = self->data_->take(all);
            if (name == "rename") {
                if (!spec.is_dict()) throw ScriptError("TypeError", "rename expects columns={old: new}");
                for (auto& n : d->names) {
                    Value repl;
                    if (spec.as_dict()->get(Value::str(n), &repl)) n = str_value(repl);
                }
            } else {
                for (const auto& n : string_list(in, spec, "drop")) {
                    int c = d->find(n);
                    if (c < 0) throw ScriptError("KeyError", "\"['" + n + "'] not found in axis\"");
                    d->names.erase(d->names.begin() + c);
                    d->cols.erase(d->cols.begin() + c);
                }
            }
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    if (name == "drop_duplicates") {
        return native(name, [self](Interpreter& in, CallArgs& a) {
            std::vector<size_t> cols;
            Value subset = a.get(0, "subset");
            if (subset.is_none()) {
                for (size_t c = 0; c < self->data_->cols.size(); c++) cols.push_back(c);
            } else {
                for (const auto& n : string_list(in, subset, "drop_duplicates")) {
                    int c = self->data_->find(n);
                    if (c < 0) throw ScriptError("KeyError", "'" + n + "'");
                    cols.push_back((size_t)c);
                }
            }
            std::unordered_set<std::string> seen;
            std::vector<size_t> rows;
            for (size_t r = 0; r < self->data_->rows(); r++) {
                std::string key;
                for (size_t c : cols) key += hash_key(is_missing(self->data_->cols[c][r]) ? Value() : self->data_->cols[c][r]) + "|";
                if (seen.insert(key).second) rows.push_back(r);
            }
            return self->filter(rows);
        });
    }
    if (name == "select_dtypes") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value inc = a.get(0, "include");
            const bool number = inc.is_str() && inc.as_str() == "number";
            std::vector<std::string> names;
            for (size_t c = 0; c < self->data_->cols.size(); c++)
                if (is_numeric_column(self->data_->cols[c]) == number) names.push_back(self->data_->names[c]);
            return self->select_columns(names);
        });
    }
    if (name == "sum" || name == "mean" || name == "median" || name == "min" || name == "max" || name == "count" ||
        name == "std" || name == "nunique") {
        return native(name, [self, name](Interpreter&, CallArgs&) {
            std::vector<Value> vals, labs;
            const bool numeric_only = name != "count" && name != "nunique" && name != "min" && name != "max";
            for (size_t c = 0; c < self->data_->cols.size(); c++) {
                if (numeric_only && !is_numeric_column(self->data_->cols[c])) continue;
                labs.push_back(Value::str(self->data_->names[c]));
                vals.push_back(reduce_values(self->data_->cols[c], name));
            }
            return SeriesObject::series(std::move(vals), std::move(labs), "");
        });
    }
    return Value();
}

// ---------------------------------------------------------------------------
// GroupByObject

GroupByObject::GroupByObject(std::shared_ptr<FrameData> data, std::string by, std::string column)
    : data_(std::move(data)), by_(std::move(by)), column_(std::move(column)) {
    int c = data_->find(by_);
    if (c < 0) throw ScriptError("KeyError", "'" + by_ + "'");
    if (!column_.empty() && data_->find(column_) < 0) throw ScriptError("KeyError", "Column not found: " + column_);
    const auto& keycol = data_->cols[(size_t)c];
    std::unordered_map<std::string, size_t> slot;
    std::vector<Value> keys;
    std::vector<std::vector<size_t>> groups;
    for (size_t r = 0; r < keycol.size(); r++) {
        if (is_missing(keycol[r])) continue;
        auto it = slot.emplace(hash_key(keycol[r]), keys.size());
        if (it.second) {
            keys.push_back(keycol[r]);
            groups.emplace_back();
        }
        groups[it.first->second].push_back(r);
    }
    std::vector<size_t> order(keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) { return compare_values(keys[x], keys[y]) < 0; });
    for (size_t i : order) {
        keys_.push_back(keys[i]);
        groups_.push_back(std::move(groups[i]));
    }
}

Value GroupByObject::get_attr(const std::string& name) {
    static const char* const kAggs[] = {"sum", "mean", "median", "min", "max", "count", "std", "var", "size",
                                        "nunique", "first", "last"};
    auto self = std::static_pointer_cast<GroupByObject>(shared_from_this());
    for (const char* agg : kAggs) {
        if (name == agg) {
            std::string how = agg;
            return native(name, [self, how](Interpreter&, CallArgs&) { return self->aggregate(how); });
        }
    }
    if (name == "agg" || name == "aggregate") {
        return native(name, [self](Interpreter&, CallArgs& a) {
            Value how = a.get(0, "func");
            if (how.is_str()) return self->aggregate(how.as_str());
            if (!how.is_dict() || !self->column_.empty()) throw ScriptError("TypeError", "agg expects a function name");
            auto d = std::make_shared<FrameData>();
            d->index = self->keys_;
            d->index_name = self->by_;
            const auto& spec = *how.as_dict();
            for (size_t i = 0; i < spec.size(); i++) {
                if (!spec.keys[i].is_str() || !spec.vals[i].is_str()) throw ScriptError("TypeError", "agg expects {column: function name}");
                int c = self->data_->find(spec.keys[i].as_str());
                if (c < 0) throw ScriptError("KeyError", "Column(s) ['" + spec.keys[i].as_str() + "'] do not exist");
                std::vector<Value> col;
                for (const auto& rows : self->groups_) {
                    std::vector<Value> vals;
                    for (size_t r : rows) vals.push_back(self->data_->cols[(size_t)c][r]);
                    col.push_back(reduce_values(vals, spec.vals[i].as_str()));
                }
                d->names.push_back(spec.keys[i].as_str());
                d->cols.push_back(std::move(col));
            }
            return Value::object(std::make_shared<FrameObject>(d, false));
        });
    }
    if (column_.empty() && data_->find(name) >= 0) {
        return Value::object(std::make_shared<GroupByObject>(data_, by_, name));
    }
    throw ScriptError("AttributeError", "'" + type_name() + "' object has no attribute '" + name + "'");
}

Value GroupByObject::get_item(Interpreter& in, const Value& key) {
    std::vector<std::string> cols = string_list(in, key, "groupby");
    if (cols.size() != 1) throw ScriptError("NotImplementedError", "select exactly one column from a groupby");
    return Value::object(std::make_shared<GroupByObject>(data_, by_, cols[0]));
}

std::vector<Value> GroupByObject::iterate(Interpreter&) {
    std::vector<Value> out;
    for (size_t g = 0; g < keys_.size(); g++) {
        Value part = Value::object(std::make_shared<FrameObject>(data_->take(groups_[g]), false));
        out.push_back(Value::tuple({keys_[g], part}));
    }
    return out;
}

Value GroupByObject::aggregate(const std::string& how) {
    charge_cells(keys_.size() * (data_->names.size() + 1));
    if (!column_.empty() || how == "size") {
        std::vector<Value> vals;
        const auto* col = column_.empty() ? nullptr : &data_->cols[(size_t)data_->find(column_)];
        for (const auto& rows : groups_) {
            if (!col) {
                vals.push_back(Value::integer((int64_t)rows.size()));
                continue;
            }
            std::vector<Value> part;
            part.reserve(rows.size());
            for (size_t r : rows) part.push_back((*col)[r]);
            vals.push_back(reduce_values(part, how));
        }
        auto s = std::make_shared<SeriesObject>(SeriesObject::Kind::Series, std::move(vals), keys_,
                                                column_.empty() ? "size" : column_);
        s->index_name = by_;
        return Value::object(s);
    }
    const bool numeric_only = how == "sum" || how == "mean" || how == "median" || how == "std" || how == "var";
    auto d = std::make_shared<FrameData>();
    d->index = keys_;
    d->index_name = by_;
    for (size_t c = 0; c < data_->cols.size(); c++) {
        if (data_->names[c] == by_) continue;
        if (numeric_only && !is_numeric_column(data_->cols[c])) continue;
        std::vector<Value> col;
        for (const auto& rows : groups_) {
            std::vector<Value> part;
            for (size_t r : rows) part.push_back(data_->cols[c][r]);
            col.push_back(reduce_values(part, how));
        }
        d->names.push_back(data_->names[c]);
        d->cols.push_back(std::move(col));
    }
    return Value::object(std::make_shared<FrameObject>(d, false));
}

} // namespace pitchbox::script
