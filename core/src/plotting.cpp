#include "pitchbox/plotting.h"

#include "pitchbox/frame.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <numeric>
#include <tuple>

namespace pitchbox::script {

using FigurePtr = PlotState::FigurePtr;
using AxesRef = PlotState::AxesRef;

// ---------------- PlotState ----------------

FigurePtr PlotState::new_figure(double width_in, double height_in) {
    if (open_figures().size() >= max_open_) {
        throw ScriptError("RuntimeError", "too many open figures (limit " + std::to_string(max_open_) + ")");
    }
    if (!(width_in > 0.0) || !(height_in > 0.0) || width_in > 40.0 || height_in > 40.0) {
        throw ScriptError("ValueError", "figure size must be positive and at most 40 inches");
    }
    auto f = std::make_shared<FigureEntry>();
    f->model.width_in = width_in;
    f->model.height_in = height_in;
    f->number = next_number_++;
    figures_.push_back(f);
    current_ = f;
    return f;
}

FigurePtr PlotState::current_figure() {
    if (!current_ || !current_->open) return new_figure(6.4, 4.8);
    return current_;
}

AxesRef PlotState::current_axes() {
    FigurePtr f = current_figure();
    const int n = (int)f->model.axes.size();
    if (f->current_axes < 0 || f->current_axes >= n || f->current_axes == f->overlay_axes) {
        f->current_axes = -1;
        for (int i = 0; i < n; i++) {
            if (i != f->overlay_axes) {
                f->current_axes = i;
                break;
            }
        }
        if (f->current_axes < 0) return add_axes(f, 0.0, 0.0, 1.0, 1.0);
    }
    return AxesRef{f, f->current_axes};
}

AxesRef PlotState::add_axes(const FigurePtr& fig, double left, double top, double width, double height) {
    budget_charge(sizeof(AxesModel));
    AxesModel ax;
    ax.left = left;
    ax.top = top;
    ax.width = width;
    ax.height = height;
    fig->model.axes.push_back(std::move(ax));
    AxesRef ref{fig, (int)fig->model.axes.size() - 1};
    make_current(ref);
    return ref;
}

void PlotState::make_current(const AxesRef& ref) {
    current_ = ref.fig;
    if (ref.index != ref.fig->overlay_axes) ref.fig->current_axes = ref.index;
}

void PlotState::close(const FigurePtr& fig) {
    fig->open = false;
    if (current_ != fig) return;
    current_ = nullptr;
    for (auto it = figures_.rbegin(); it != figures_.rend(); ++it) {
        if ((*it)->open) {
            current_ = *it;
            break;
        }
    }
}

void PlotState::close_all() {
    for (auto& f : figures_) f->open = false;
    current_ = nullptr;
}

std::vector<FigurePtr> PlotState::open_figures() const {
    std::vector<FigurePtr> out;
    for (const auto& f : figures_)
        if (f->open) out.push_back(f);
    return out;
}

namespace {

constexpr size_t kKw = static_cast<size_t>(-1);
constexpr const char* kAxesTransform = "Transform(axes)";
const double kNaN = std::numeric_limits<double>::quiet_NaN();

// ---------------- argument helpers ----------------

std::string kind_of(const Value& v) { return v.is_object() ? v.as_object()->type_name() : v.type_name(); }

double num_kw(const CallArgs& a, const char* name, double fallback) {
    Value v = a.get(kKw, name);
    return v.is_none() ? fallback : to_double(v, name);
}

std::string str_kw(const CallArgs& a, const char* name, const std::string& fallback) {
    Value v = a.get(kKw, name);
    if (v.is_none()) return fallback;
    if (!v.is_str()) throw ScriptError("TypeError", std::string(name) + " must be a string, not " + kind_of(v));
    return v.as_str();
}

// First keyword present among alternative spellings (linewidth / lw).
Value kw_any(const CallArgs& a, std::initializer_list<const char*> names) {
    for (const char* n : names)
        if (a.has_kw(n)) return a.get(kKw, n);
    return Value();
}

std::string text_of(const Value& v) { return v.is_str() ? v.as_str() : str_value(v); }

std::vector<double> doubles(Interpreter& in, const Value& v, const char* what) {
    std::vector<double> out;
    if (v.is_none()) {
        out.push_back(kNaN);
        return out;
    }
    if (v.is_number()) {
        out.push_back(v.as_float());
        return out;
    }
    if (v.is_str()) {
        throw ScriptError("TypeError", std::string(what) + ": could not convert string to float: " + repr_value(v));
    }
    for (const auto& it : in.iterate(v)) {
        if (is_missing(it)) out.push_back(kNaN);
        else if (it.is_number()) out.push_back(it.as_float());
        else throw ScriptError("TypeError", std::string(what) + ": could not convert " + repr_value(it) + " to float");
    }
    budget_check(out.size() * sizeof(double));
    return out;
}

std::pair<double, double> pair_of(Interpreter& in, const Value& v, const char* what) {
    auto xs = doubles(in, v, what);
    if (xs.size() != 2) throw ScriptError("ValueError", std::string(what) + " must be a pair of numbers");
    return {xs[0], xs[1]};
}

std::string tick_text(double v) {
    if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15) return std::to_string((long long)v);
    return float_repr(v);
}

// Numeric positions for an x/y argument. String categories map to 0, 1, ...
// in order of first appearance and become the axis tick labels.
std::vector<double> positions(Interpreter& in, const Value& v, const char* what, AxesModel& ax, bool x_axis) {
    std::vector<Value> items;
    if (v.is_str()) items.push_back(v);
    else if (!v.is_none() && !v.is_number()) items = in.iterate(v);
    bool any_str = false;
    for (const auto& it : items)
        if (it.is_str()) any_str = true;
    if (!any_str) return doubles(in, v, what);

    auto& ticks = x_axis ? ax.xticks : ax.yticks;
    (x_axis ? ax.xticks_set : ax.yticks_set) = true;
    std::vector<double> out;
    out.reserve(items.size());
    for (const auto& it : items) {
        const std::string key = text_of(it);
        double pos = -1.0;
        for (const auto& t : ticks)
            if (t.second == key) pos = t.first;
        if (pos < 0.0) {
            pos = (double)ticks.size();
            ticks.emplace_back(pos, key);
        }
        out.push_back(pos);
    }
    return out;
}

std::vector<double> broadcast(std::vector<double> v, size_t n, const char* what) {
    if (v.size() == n) return v;
    if (v.size() == 1) return std::vector<double>(n, v[0]);
    throw ScriptError("ValueError", std::string("shape mismatch: ") + what + " cannot be broadcast to a single shape");
}

bool is_rgb_tuple(const Value& v) {
    if (!v.is_tuple()) return false;
    const auto& items = v.as_list()->items;
    if (items.size() != 3 && items.size() != 4) return false;
    for (const auto& it : items)
        if (!it.is_number() || it.as_float() < 0.0 || it.as_float() > 1.0) return false;
    return true;
}

std::string color_of(const Value& v) {
    if (v.is_str()) {
        std::string out;
        if (parse_color(v.as_str(), &out)) return out;
    } else if (is_rgb_tuple(v)) {
        const auto& items = v.as_list()->items;
        auto c = [&](size_t i) { return (int)std::lround(items[i].as_float() * 255.0); };
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c(0), c(1), c(2));
        return buf;
    }
    throw ScriptError("ValueError", repr_value(v) + " is not a valid color value");
}

// One color, or one per element.
void fill_colors(Interpreter& in, const Value& v, Mark* m) {
    if (v.is_none()) return;
    if (v.is_str() || is_rgb_tuple(v)) {
        m->color = color_of(v);
        return;
    }
    for (const auto& it : in.iterate(v)) m->colors.push_back(color_of(it));
}

std::string cmap_name(const Value& v, const std::string& fallback) {
    if (v.is_none()) return fallback;
    std::string name;
    if (v.is_str()) name = v.as_str();
    else if (v.is_callable()) name = v.as_callable()->name();
    if (!colormap_known(name)) {
        throw ScriptError("ValueError", repr_value(v) +
                                            " is not a valid value for cmap; supported values are viridis, plasma, "
                                            "magma, inferno, cividis, hot, Reds, Blues, Greens, Oranges, Purples, "
                                            "Greys, YlOrRd, coolwarm, RdYlGn (and their _r variants)");
    }
    return name;
}

// Scatter `c`: a color, a list of colors, or numbers mapped through `cmap`.
void element_colors(Interpreter& in, const Value& v, size_t n, const CallArgs& a, Mark* m) {
    if (v.is_none()) return;
    if (v.is_str() || (is_rgb_tuple(v) && n != v.as_list()->items.size())) {
        m->color = color_of(v);
        return;
    }
    std::vector<Value> items = in.iterate(v);
    bool numeric = true;
    for (const auto& it : items)
        if (!it.is_number() && !is_missing(it)) numeric = false;
    if (!numeric) {
        for (const auto& it : items) m->colors.push_back(color_of(it));
        return;
    }
    if (items.size() != n) {
        throw ScriptError("ValueError", "'c' argument has " + std::to_string(items.size()) +
                                            " elements, which is inconsistent with 'x' and 'y' with size " +
                                            std::to_string(n));
    }
    const std::string cmap = cmap_name(a.get(kKw, "cmap"), "viridis");
    double lo = std::numeric_limits<double>::infinity(), hi = -lo;
    for (const auto& it : items) {
        if (is_missing(it)) continue;
        lo = std::min(lo, it.as_float());
        hi = std::max(hi, it.as_float());
    }
    lo = num_kw(a, "vmin", lo);
    hi = num_kw(a, "vmax", hi);
    for (const auto& it : items) {
        if (is_missing(it)) {
            m->colors.push_back("none");
            continue;
        }
        const double t = hi > lo ? (it.as_float() - lo) / (hi - lo) : 0.5;
        m->colors.push_back(colormap_color(cmap, t));
    }
}

double font_size(const Value& v, double fallback) {
    if (v.is_none()) return fallback;
    if (v.is_str()) {
        static const std::map<std::string, double> sizes = {
            {"xx-small", 5.79}, {"x-small", 6.94}, {"small", 8.33}, {"medium", 10.0},
            {"large", 12.0},    {"x-large", 14.4}, {"xx-large", 17.28}, {"larger", 12.0}, {"smaller", 8.33},
        };
        auto it = sizes.find(v.as_str());
        if (it == sizes.end()) throw ScriptError("ValueError", repr_value(v) + " is not a valid font size");
        return it->second;
    }
    const double d = to_double(v, "fontsize");
    if (!(d > 0.0) || d > 200.0) throw ScriptError("ValueError", "fontsize must be between 0 and 200");
    return d;
}

// alpha / label / zorder shared by every artist.
void common_style(const CallArgs& a, Mark* m) {
    Value alpha = a.get(kKw, "alpha");
    if (!alpha.is_none()) {
        m->alpha = to_double(alpha, "alpha");
        if (m->alpha < 0.0 || m->alpha > 1.0) throw ScriptError("ValueError", "alpha must be between 0 and 1");
    }
    Value label = a.get(kKw, "label");
    if (!label.is_none()) m->label = text_of(label);
    Value z = a.get(kKw, "zorder");
    if (!z.is_none()) m->zorder = (int)std::lround(to_double(z, "zorder"));
}

void line_style(const CallArgs& a, Mark* m) {
    Value c = kw_any(a, {"color", "c"});
    if (!c.is_none()) m->color = color_of(c);
    Value lw = kw_any(a, {"linewidth", "lw"});
    if (!lw.is_none()) m->linewidth = to_double(lw, "linewidth");
    Value ls = kw_any(a, {"linestyle", "ls"});
    if (!ls.is_none()) m->linestyle = text_of(ls);
    if (a.has_kw("marker")) m->marker = text_of(a.get(kKw, "marker"));
    common_style(a, m);
}

void text_style(const CallArgs& a, Mark* m);

// matplotlib format strings such as "r--", "o-", "C1:".
void apply_fmt(const std::string& fmt, Mark* m) {
    bool has_marker = false, has_line = false;
    for (size_t i = 0; i < fmt.size();) {
        const char c = fmt[i];
        if (fmt.compare(i, 2, "--") == 0 || fmt.compare(i, 2, "-.") == 0) {
            m->linestyle = fmt.substr(i, 2);
            has_line = true;
            i += 2;
        } else if (c == '-' || c == ':') {
            m->linestyle = std::string(1, c);
            has_line = true;
            i += 1;
        } else if (c == 'C' && i + 1 < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i + 1]))) {
            m->color = cycle_color(fmt[i + 1] - '0');
            i += 2;
        } else if (std::string("bgrcmykw").find(c) != std::string::npos) {
            parse_color(std::string(1, c), &m->color);
            i += 1;
        } else if (std::string(".o,s^v<>*xX+Ddph").find(c) != std::string::npos) {
            m->marker = std::string(1, c);
            has_marker = true;
            i += 1;
        } else {
            throw ScriptError("ValueError", "Unrecognized character " + std::string(1, c) + " in format string '" + fmt + "'");
        }
    }
    if (has_marker && !has_line) m->linestyle = "None";
}

void commit(AxesModel& ax, Mark m) {
    const uint64_t cells = m.x.size() + m.y.size() + m.x2.size() + m.y2.size() + m.sizes.size();
    budget_charge(cells * sizeof(double) + m.colors.size() * 16 + m.text.size() + sizeof(Mark));
    ax.marks.push_back(std::move(m));
}

std::string next_color(AxesModel& ax) { return cycle_color(ax.color_cycle++); }

// "{:.1f}"-style label formats used by mplsoccer and bar_label.
std::string brace_format(const std::string& fmt, double v) {
    const size_t open = fmt.find('{');
    const size_t close = open == std::string::npos ? std::string::npos : fmt.find('}', open);
    if (close == std::string::npos) return fmt;
    std::string inner = fmt.substr(open + 1, close - open - 1);
    const size_t colon = inner.find(':');
    const std::string spec = colon == std::string::npos ? "" : inner.substr(colon + 1);
    return fmt.substr(0, open) + format_value(Value::number(v), spec) + fmt.substr(close + 1);
}

// ---------------- artists ----------------

// Handle returned by plotting calls. Setters are accepted and ignored;
// bar rectangles also expose their geometry.
class ArtistObject : public Object {
public:
    explicit ArtistObject(std::string type) : type_(std::move(type)) {}
    ArtistObject(double x, double y, double w, double h, bool horizontal)
        : type_("Rectangle"), rect_(true), horizontal_(horizontal), x_(x), y_(y), w_(w), h_(h) {}

    std::string type_name() const override { return type_; }

    Value get_attr(const std::string& name) override {
        if (rect_) {
            if (name == "get_x") return getter(name, x_);
            if (name == "get_y") return getter(name, y_);
            if (name == "get_width") return getter(name, w_);
            if (name == "get_height") return getter(name, h_);
            if (name == "get_xy") {
                const double x = x_, y = y_;
                return native(name, [x, y](Interpreter&, CallArgs&) {
                    return Value::tuple({Value::number(x), Value::number(y)});
                });
            }
        }
        if (name.compare(0, 4, "set_") == 0 || name == "remove") {
            return native(name, [](Interpreter&, CallArgs&) { return Value(); });
        }
        return Object::get_attr(name);
    }

    bool rect() const { return rect_; }
    bool horizontal() const { return horizontal_; }
    double x() const { return x_; }
    double y() const { return y_; }
    double w() const { return w_; }
    double h() const { return h_; }

private:
    std::string type_;
    bool rect_{false};
    bool horizontal_{false};
    double x_{0}, y_{0}, w_{0}, h_{0};

    static Value getter(const std::string& name, double v) {
        return native(name, [v](Interpreter&, CallArgs&) { return Value::number(v); });
    }
};

Value artist(const std::string& type) { return Value::object(std::make_shared<ArtistObject>(type)); }

// ax.spines['top'].set_visible(False) and friends.
class SpinesObject : public Object {
public:
    std::string type_name() const override { return "Spines"; }
    Value get_item(Interpreter&, const Value&) override { return artist("Spine"); }
    Value get_attr(const std::string& name) override {
        if (name == "top" || name == "bottom" || name == "left" || name == "right") return artist("Spine");
        return Object::get_attr(name);
    }
};

Value axes_value(const std::shared_ptr<PlotState>& st, const AxesRef& ref);
Value figure_value(const std::shared_ptr<PlotState>& st, const FigurePtr& fig);
Value axes_call(const std::shared_ptr<PlotState>& st, const AxesRef& ref, const std::string& name, Interpreter& in,
                CallArgs& a);
bool axes_method_known(const std::string& name);

class AxesObject : public Object {
public:
    AxesObject(std::shared_ptr<PlotState> st, AxesRef ref) : st_(std::move(st)), ref_(std::move(ref)) {}

    std::string type_name() const override { return ref_.get().pitch ? "Axes (pitch)" : "Axes"; }

    Value get_attr(const std::string& name) override {
        if (name == "figure") return figure_value(st_, ref_.fig);
        if (name == "spines") return Value::object(std::make_shared<SpinesObject>());
        if (name == "xaxis" || name == "yaxis") return artist("Axis");
        if (name == "transAxes") return artist(kAxesTransform);
        if (name == "transData") return artist("Transform(data)");
        if (!axes_method_known(name)) return Object::get_attr(name);
        auto st = st_;
        AxesRef ref = ref_;
        return native(name, [st, ref, name](Interpreter& in, CallArgs& a) { return axes_call(st, ref, name, in, a); });
    }

    bool binary_op(Interpreter&, const std::string& op, const Value& other, bool, Value* out) override {
        if (op != "==" && op != "!=") return false;
        bool same = false;
        if (other.is_object()) {
            if (auto o = std::dynamic_pointer_cast<AxesObject>(other.as_object())) {
                same = o->ref_.fig == ref_.fig && o->ref_.index == ref_.index;
            }
        }
        *out = Value::boolean(op == "==" ? same : !same);
        return true;
    }

    std::string repr() const override { return "<Axes: index=" + std::to_string(ref_.index) + ">"; }

    const AxesRef& ref() const { return ref_; }

private:
    std::shared_ptr<PlotState> st_;
    AxesRef ref_;
};

AxesRef axes_ref_of(const Value& v) {
    if (v.is_object()) {
        if (auto ax = std::dynamic_pointer_cast<AxesObject>(v.as_object())) return ax->ref();
    }
    throw ScriptError("TypeError", "ax must be an Axes, not " + kind_of(v));
}

Value axes_value(const std::shared_ptr<PlotState>& st, const AxesRef& ref) {
    return Value::object(std::make_shared<AxesObject>(st, ref));
}

// numpy-like container of axes returned by subplots().
class AxesGrid : public Object {
public:
    AxesGrid(std::vector<Value> axes, size_t rows, size_t cols, bool two_d)
        : axes_(std::move(axes)), rows_(rows), cols_(cols), two_d_(two_d) {}

    std::string type_name() const override { return "ndarray"; }
    bool has_len() const override { return true; }
    size_t len() const override { return two_d_ ? rows_ : axes_.size(); }
    bool iterable() const override { return true; }

    std::vector<Value> iterate(Interpreter&) override {
        if (!two_d_) return axes_;
        std::vector<Value> out;
        for (size_t r = 0; r < rows_; r++) out.push_back(row(r));
        return out;
    }

    Value get_item(Interpreter&, const Value& key) override {
        if (key.is_tuple()) {
            const auto& parts = key.as_list()->items;
            if (!two_d_ || parts.size() != 2) throw ScriptError("IndexError", "too many indices for array");
            const size_t r = position(parts[0], rows_, 0);
            const size_t c = position(parts[1], cols_, 1);
            return axes_[r * cols_ + c];
        }
        const size_t i = position(key, len(), 0);
        return two_d_ ? row(i) : axes_[i];
    }

    Value get_attr(const std::string& name) override {
        if (name == "flatten" || name == "ravel") {
            auto axes = axes_;
            return native(name, [axes](Interpreter&, CallArgs&) {
                return Value::object(std::make_shared<AxesGrid>(axes, 1, axes.size(), false));
            });
        }
        if (name == "flat") return Value::object(std::make_shared<AxesGrid>(axes_, 1, axes_.size(), false));
        if (name == "shape") {
            if (!two_d_) return Value::tuple({Value::integer((int64_t)axes_.size())});
            return Value::tuple({Value::integer((int64_t)rows_), Value::integer((int64_t)cols_)});
        }
        if (name == "size") return Value::integer((int64_t)axes_.size());
        return Object::get_attr(name);
    }

    std::string repr() const override { return "array(<" + std::to_string(axes_.size()) + " Axes>)"; }

private:
    std::vector<Value> axes_;
    size_t rows_, cols_;
    bool two_d_;

    Value row(size_t r) const {
        std::vector<Value> items(axes_.begin() + (long)(r * cols_), axes_.begin() + (long)((r + 1) * cols_));
        return Value::object(std::make_shared<AxesGrid>(std::move(items), 1, cols_, false));
    }

    static size_t position(const Value& key, size_t n, int axis) {
        if (!key.is_int() && !key.is_bool()) throw ScriptError("IndexError", "only integers are valid indices");
        int64_t i = key.as_int();
        if (i < 0) i += (int64_t)n;
        if (i < 0 || i >= (int64_t)n) {
            throw ScriptError("IndexError", "index " + std::to_string(key.as_int()) + " is out of bounds for axis " +
                                                std::to_string(axis) + " with size " + std::to_string(n));
        }
        return (size_t)i;
    }
};

// Lays out an nrows x ncols grid on `fig`; a 1x1 grid squeezes to one Axes.
Value make_grid(const std::shared_ptr<PlotState>& st, const FigurePtr& fig, int64_t nrows, int64_t ncols, bool squeeze,
                const std::optional<PitchSpec>& pitch) {
    if (nrows < 1 || ncols < 1 || nrows * ncols > 64) {
        throw ScriptError("ValueError", "Number of rows and columns must be positive, at most 64 axes");
    }
    std::vector<Value> axes;
    std::vector<AxesRef> refs;
    for (int64_t r = 0; r < nrows; r++) {
        for (int64_t c = 0; c < ncols; c++) {
            AxesRef ref = st->add_axes(fig, (double)c / (double)ncols, (double)r / (double)nrows, 1.0 / (double)ncols,
                                       1.0 / (double)nrows);
            if (pitch) {
                ref.get().pitch = *pitch;
                ref.get().axis_off = true;
            }
            refs.push_back(ref);
            axes.push_back(axes_value(st, ref));
        }
    }
    st->make_current(refs.front());
    if (squeeze && nrows == 1 && ncols == 1) return axes.front();
    const bool two_d = !squeeze || (nrows > 1 && ncols > 1);
    return Value::object(std::make_shared<AxesGrid>(std::move(axes), (size_t)nrows, (size_t)ncols, two_d));
}

class FigureObject : public Object {
public:
    FigureObject(std::shared_ptr<PlotState> st, FigurePtr fig) : st_(std::move(st)), fig_(std::move(fig)) {}

    std::string type_name() const override { return "Figure"; }

    Value get_attr(const std::string& name) override {
        auto st = st_;
        auto fig = fig_;
        if (name == "axes") {
            std::vector<Value> out;
            for (size_t i = 0; i < fig_->model.axes.size(); i++) {
                if ((int)i != fig_->overlay_axes) out.push_back(axes_value(st_, AxesRef{fig_, (int)i}));
            }
            return Value::list(std::move(out));
        }
        if (name == "number") return Value::integer(fig_->number);
        if (name == "dpi") return Value::integer(kFigureDpi);
        if (name == "add_subplot") {
            return native(name, [st, fig](Interpreter& in, CallArgs& a) { return add_subplot(st, fig, in, a); });
        }
        if (name == "add_axes") {
            return native(name, [st, fig](Interpreter& in, CallArgs& a) {
                auto xs = doubles(in, a.get(0, "rect"), "add_axes");
                if (xs.size() != 4) throw ScriptError("ValueError", "add_axes expects [left, bottom, width, height]");
                return axes_value(st, st->add_axes(fig, xs[0], 1.0 - xs[1] - xs[3], xs[2], xs[3]));
            });
        }
        if (name == "subplots") {
            return native(name, [st, fig](Interpreter&, CallArgs& a) {
                return make_grid(st, fig, to_index(a.get(0, "nrows", Value::integer(1)), "nrows"),
                                 to_index(a.get(1, "ncols", Value::integer(1)), "ncols"),
                                 is_truthy(a.get(kKw, "squeeze", Value::boolean(true))), std::nullopt);
            });
        }
        if (name == "gca") {
            return native(name, [st, fig](Interpreter&, CallArgs&) {
                if (fig->current_axes >= 0) return axes_value(st, AxesRef{fig, fig->current_axes});
                return axes_value(st, st->add_axes(fig, 0.0, 0.0, 1.0, 1.0));
            });
        }
        if (name == "suptitle") {
            return native(name, [fig](Interpreter&, CallArgs& a) {
                fig->model.suptitle = text_of(a.get(0, "t"));
                return artist("Text");
            });
        }
        if (name == "text") {
            return native(name, [st, fig](Interpreter&, CallArgs& a) { return figure_text(st, fig, a); });
        }
        if (name == "set_facecolor") {
            return native(name, [fig](Interpreter&, CallArgs& a) {
                fig->model.facecolor = color_of(a.get(0, "color"));
                return Value();
            });
        }
        if (name == "set_size_inches") {
            return native(name, [fig](Interpreter& in, CallArgs& a) {
                std::pair<double, double> wh;
                if (a.size() >= 2) wh = {to_double(a.pos[0], "w"), to_double(a.pos[1], "h")};
                else wh = pair_of(in, a.get(0, "w"), "set_size_inches");
                set_size(fig, wh.first, wh.second);
                return Value();
            });
        }
        if (name == "set_figwidth" || name == "set_figheight") {
            const bool width = name == "set_figwidth";
            return native(name, [fig, width](Interpreter&, CallArgs& a) {
                const double v = to_double(a.get(0, "val"), "size");
                set_size(fig, width ? v : fig->model.width_in, width ? fig->model.height_in : v);
                return Value();
            });
        }
        if (name == "tight_layout" || name == "subplots_adjust" || name == "align_labels" ||
            name == "set_tight_layout" || name == "set_constrained_layout") {
            return native(name, [](Interpreter&, CallArgs&) { return Value(); });
        }
        if (name == "colorbar") return native(name, [](Interpreter&, CallArgs&) { return artist("Colorbar"); });
        return Object::get_attr(name);
    }

    std::string repr() const override {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "<Figure size %dx%d with %d Axes>",
                      (int)std::lround(fig_->model.width_in * kFigureDpi),
                      (int)std::lround(fig_->model.height_in * kFigureDpi), (int)fig_->model.axes.size());
        return buf;
    }

    const FigurePtr& fig() const { return fig_; }

    static Value add_subplot(const std::shared_ptr<PlotState>& st, const FigurePtr& fig, Interpreter&, CallArgs& a) {
        int64_t rows = 1, cols = 1, idx = 1;
        if (a.size() == 1) {
            const int64_t code = to_index(a.pos[0], "add_subplot");
            if (code < 111 || code > 999) throw ScriptError("ValueError", "Integer subplot specification must be a three-digit number");
            rows = code / 100;
            cols = (code / 10) % 10;
            idx = code % 10;
        } else if (a.size() >= 3) {
            rows = to_index(a.pos[0], "nrows");
            cols = to_index(a.pos[1], "ncols");
            idx = to_index(a.pos[2], "index");
        }
        if (rows < 1 || cols < 1 || idx < 1 || idx > rows * cols) {
            throw ScriptError("ValueError", "num must be an integer with 1 <= num <= " + std::to_string(rows * cols));
        }
        const double left = (double)((idx - 1) % cols) / (double)cols;
        const double top = (double)((idx - 1) / cols) / (double)rows;
        const double w = 1.0 / (double)cols, h = 1.0 / (double)rows;
        for (size_t i = 0; i < fig->model.axes.size(); i++) {
            const AxesModel& ax = fig->model.axes[i];
            if ((int)i != fig->overlay_axes && std::fabs(ax.left - left) < 1e-9 && std::fabs(ax.top - top) < 1e-9 &&
                std::fabs(ax.width - w) < 1e-9 && std::fabs(ax.height - h) < 1e-9) {
                AxesRef ref{fig, (int)i};
                st->make_current(ref);
                return axes_value(st, ref);
            }
        }
        AxesRef ref = st->add_axes(fig, left, top, w, h);
        if (a.has_kw("facecolor")) ref.get().facecolor = color_of(a.get(kKw, "facecolor"));
        return axes_value(st, ref);
    }

    // Text in figure fractions, kept on a hidden full-figure axes.
    static Value figure_text(const std::shared_ptr<PlotState>& st, const FigurePtr& fig, CallArgs& a) {
        if (fig->overlay_axes < 0) {
            const int keep = fig->current_axes;
            AxesRef ref = st->add_axes(fig, 0.0, 0.0, 1.0, 1.0);
            ref.get().axis_off = true;
            fig->overlay_axes = ref.index;
            fig->current_axes = keep;
        }
        Mark m;
        m.kind = Mark::Kind::Text;
        m.axes_coords = true;
        m.x = {to_double(a.get(0, "x"), "x")};
        m.y = {to_double(a.get(1, "y"), "y")};
        m.text = text_of(a.get(2, "s"));
        text_style(a, &m);
        commit(fig->model.axes.at((size_t)fig->overlay_axes), std::move(m));
        return artist("Text");
    }

    static void set_size(const FigurePtr& fig, double w, double h) {
        if (!(w > 0.0) || !(h > 0.0) || w > 40.0 || h > 40.0) {
            throw ScriptError("ValueError", "figure size must be positive and at most 40 inches");
        }
        fig->model.width_in = w;
        fig->model.height_in = h;
    }

private:
    std::shared_ptr<PlotState> st_;
    FigurePtr fig_;
};

Value figure_value(const std::shared_ptr<PlotState>& st, const FigurePtr& fig) {
    return Value::object(std::make_shared<FigureObject>(st, fig));
}

// ---------------- axes methods ----------------

Value set_limits(Interpreter& in, CallArgs& a, const char* lo_kw, const char* hi_kw, const char* lo_alt,
                 const char* hi_alt, std::optional<std::pair<double, double>>* lim) {
    Value lo = a.get(0, lo_kw), hi = a.get(1, hi_kw);
    if (lo.is_none()) lo = a.get(kKw, lo_alt);
    if (hi.is_none()) hi = a.get(kKw, hi_alt);
    if (!lo.is_none() && !lo.is_number() && hi.is_none()) {
        auto p = pair_of(in, lo, "limits");
        lo = Value::number(p.first);
        hi = Value::number(p.second);
    }
    if (!lo.is_none() || !hi.is_none()) {
        std::pair<double, double> cur = lim->value_or(std::make_pair(kNaN, kNaN));
        if (!lo.is_none()) cur.first = to_double(lo, lo_kw);
        if (!hi.is_none()) cur.second = to_double(hi, hi_kw);
        *lim = cur;
    }
    std::pair<double, double> cur = lim->value_or(std::make_pair(0.0, 1.0));
    return Value::tuple({Value::number(cur.first), Value::number(cur.second)});
}

void set_ticks(Interpreter& in, CallArgs& a, std::vector<std::pair<double, std::string>>* ticks, bool* set_flag) {
    Value pos = a.get(0, "ticks");
    Value labels = a.get(1, "labels");
    if (pos.is_none() && labels.is_none()) return;
    std::vector<double> xs = pos.is_none() ? std::vector<double>{} : doubles(in, pos, "ticks");
    std::vector<std::string> names;
    if (!labels.is_none()) {
        for (const auto& l : in.iterate(labels)) names.push_back(text_of(l));
        if (pos.is_none()) {
            for (size_t i = 0; i < names.size(); i++) xs.push_back((double)i);
        }
        if (names.size() != xs.size()) {
            throw ScriptError("ValueError", "The number of FixedLocator locations (" + std::to_string(xs.size()) +
                                                ") does not match the number of labels (" +
                                                std::to_string(names.size()) + ")");
        }
    }
    ticks->clear();
    for (size_t i = 0; i < xs.size(); i++) ticks->emplace_back(xs[i], names.empty() ? tick_text(xs[i]) : names[i]);
    *set_flag = true;
}

void set_tick_labels(Interpreter& in, CallArgs& a, std::vector<std::pair<double, std::string>>* ticks, bool* set_flag) {
    std::vector<std::string> names;
    for (const auto& l : in.iterate(a.get(0, "labels"))) names.push_back(text_of(l));
    if (!*set_flag || ticks->empty()) {
        ticks->clear();
        for (size_t i = 0; i < names.size(); i++) ticks->emplace_back((double)i, names[i]);
    } else {
        for (size_t i = 0; i < ticks->size() && i < names.size(); i++) (*ticks)[i].second = names[i];
    }
    *set_flag = true;
}

Value do_plot(Interpreter& in, CallArgs& a, AxesModel& ax) {
    std::vector<Value> out;
    size_t i = 0;
    while (i < a.pos.size()) {
        Value xs, ys = a.pos[i++];
        if (i < a.pos.size() && !a.pos[i].is_str()) {
            xs = ys;
            ys = a.pos[i++];
        }
        std::string fmt;
        if (i < a.pos.size() && a.pos[i].is_str()) fmt = a.pos[i++].as_str();

        Mark m;
        m.kind = Mark::Kind::Line;
        m.marker = "";
        m.y = doubles(in, ys, "plot");
        if (xs.is_none()) {
            m.x.resize(m.y.size());
            std::iota(m.x.begin(), m.x.end(), 0.0);
        } else {
            m.x = positions(in, xs, "plot", ax, true);
        }
        if (m.x.size() != m.y.size()) {
            throw ScriptError("ValueError", "x and y must have same first dimension, but have shapes (" +
                                                std::to_string(m.x.size()) + ",) and (" + std::to_string(m.y.size()) +
                                                ",)");
        }
        apply_fmt(fmt, &m);
        line_style(a, &m);
        if (m.color.empty()) m.color = next_color(ax);
        commit(ax, std::move(m));
        out.push_back(artist("Line2D"));
    }
    return Value::list(std::move(out));
}

Value do_scatter(Interpreter& in, CallArgs& a, AxesModel& ax) {
    Mark m;
    m.kind = Mark::Kind::Scatter;
    m.x = positions(in, a.get(0, "x"), "scatter", ax, true);
    m.y = doubles(in, a.get(1, "y"), "scatter");
    if (m.x.size() != m.y.size()) throw ScriptError("ValueError", "x and y must be the same size");
    Value s = a.get(2, "s");
    if (!s.is_none()) {
        m.sizes = doubles(in, s, "s");
        if (m.sizes.size() != 1 && m.sizes.size() != m.x.size()) {
            throw ScriptError("ValueError", "s must be a scalar, or float array-like with the same size as x and y");
        }
    }
    Value c = a.get(3, "c");
    if (c.is_none()) c = a.get(kKw, "color");
    element_colors(in, c, m.x.size(), a, &m);
    if (m.color.empty() && m.colors.empty()) m.color = next_color(ax);
    m.marker = str_kw(a, "marker", "o");
    Value edge = kw_any(a, {"edgecolors", "edgecolor", "ec"});
    if (!edge.is_none() && !(edge.is_str() && edge.as_str() == "face")) m.edgecolor = color_of(edge);
    Value lw = kw_any(a, {"linewidths", "linewidth", "lw"});
    m.linewidth = lw.is_none() ? 1.0 : to_double(lw, "linewidths");
    common_style(a, &m);
    commit(ax, std::move(m));
    return artist("PathCollection");
}

Value do_bar(Interpreter& in, CallArgs& a, AxesModel& ax, bool horizontal) {
    Mark m;
    m.kind = horizontal ? Mark::Kind::BarH : Mark::Kind::Bar;
    std::vector<double> pos = positions(in, a.get(0, horizontal ? "y" : "x"), horizontal ? "barh" : "bar", ax, !horizontal);
    std::vector<double> len = doubles(in, a.get(1, horizontal ? "width" : "height"), horizontal ? "barh" : "bar");
    const size_t n = std::max(pos.size(), len.size());
    pos = broadcast(std::move(pos), n, "positions and lengths");
    len = broadcast(std::move(len), n, "positions and lengths");
    std::vector<double> thick = broadcast(doubles(in, a.get(2, horizontal ? "height" : "width", Value::number(0.8)), "bar"),
                                          n, "bar thickness");
    std::vector<double> base = broadcast(doubles(in, a.get(3, horizontal ? "left" : "bottom", Value::number(0.0)), "bar"),
                                         n, "bar base");
    for (auto& b : base)
        if (std::isnan(b)) b = 0.0;
    if (str_kw(a, "align", "center") == "edge") {
        for (size_t i = 0; i < n; i++) pos[i] += thick[i] / 2;
    }
    Value tick_label = a.get(kKw, "tick_label");
    if (!tick_label.is_none()) {
        auto& ticks = horizontal ? ax.yticks : ax.xticks;
        ticks.clear();
        size_t i = 0;
        for (const auto& l : in.iterate(tick_label)) {
            if (i < n) ticks.emplace_back(pos[i++], text_of(l));
        }
        (horizontal ? ax.yticks_set : ax.xticks_set) = true;
    }
    fill_colors(in, a.get(kKw, "color"), &m);
    if (m.color.empty() && m.colors.empty()) m.color = next_color(ax);
    Value edge = kw_any(a, {"edgecolor", "ec"});
    if (!edge.is_none()) m.edgecolor = color_of(edge);
    Value lw = kw_any(a, {"linewidth", "lw"});
    m.linewidth = lw.is_none() ? 1.0 : to_double(lw, "linewidth");
    common_style(a, &m);

    std::vector<Value> artists;
    for (size_t i = 0; i < n; i++) {
        if (horizontal) {
            artists.push_back(Value::object(
                std::make_shared<ArtistObject>(base[i], pos[i] - thick[i] / 2, len[i], thick[i], true)));
        } else {
            artists.push_back(Value::object(
                std::make_shared<ArtistObject>(pos[i] - thick[i] / 2, base[i], thick[i], len[i], false)));
        }
    }
    if (horizontal) {
        m.y = pos;
        m.x = len;
        m.y2 = thick;
        m.x2 = base;
    } else {
        m.x = pos;
        m.y = len;
        m.x2 = thick;
        m.y2 = base;
    }
    commit(ax, std::move(m));
    return Value::list(std::move(artists));
}

Value do_hist(Interpreter& in, CallArgs& a, AxesModel& ax) {
    std::vector<double> xs;
    for (double v : doubles(in, a.get(0, "x"), "hist"))
        if (std::isfinite(v)) xs.push_back(v);
    Value bins = a.get(1, "bins", Value::integer(10));
    std::vector<double> edges;
    if (bins.is_int()) {
        const int64_t n = bins.as_int();
        if (n < 1 || n > 10000) throw ScriptError("ValueError", "`bins` must be positive, when an integer");
        double lo = 0.0, hi = 1.0;
        Value range = a.get(kKw, "range");
        if (!range.is_none()) {
            std::tie(lo, hi) = pair_of(in, range, "range");
        } else if (!xs.empty()) {
            lo = *std::min_element(xs.begin(), xs.end());
            hi = *std::max_element(xs.begin(), xs.end());
        }
        if (lo == hi) {
            lo -= 0.5;
            hi += 0.5;
        }
        for (int64_t i = 0; i <= n; i++) edges.push_back(lo + (hi - lo) * (double)i / (double)n);
    } else {
        edges = doubles(in, bins, "bins");
        if (edges.size() < 2 || !std::is_sorted(edges.begin(), edges.end())) {
            throw ScriptError("ValueError", "`bins` must increase monotonically, when an array");
        }
    }
    const size_t nb = edges.size() - 1;
    std::vector<double> counts(nb, 0.0);
    for (double v : xs) {
        if (v < edges.front() || v > edges.back()) continue;
        size_t idx = (size_t)(std::upper_bound(edges.begin(), edges.end(), v) - edges.begin());
        idx = idx == 0 ? 0 : idx - 1;
        if (idx >= nb) idx = nb - 1;
        counts[idx] += 1.0;
    }
    if (is_truthy(a.get(kKw, "density", Value::boolean(false))) && !xs.empty()) {
        double total = 0.0;
        for (double c : counts) total += c;
        for (size_t i = 0; i < nb; i++) counts[i] = total > 0 ? counts[i] / (total * (edges[i + 1] - edges[i])) : 0.0;
    }
    Mark m;
    m.kind = Mark::Kind::Bar;
    std::vector<Value> artists;
    for (size_t i = 0; i < nb; i++) {
        const double w = edges[i + 1] - edges[i];
        m.x.push_back(edges[i] + w / 2);
        m.y.push_back(counts[i]);
        m.x2.push_back(w);
        m.y2.push_back(0.0);
        artists.push_back(Value::object(std::make_shared<ArtistObject>(edges[i], 0.0, w, counts[i], false)));
    }
    fill_colors(in, a.get(kKw, "color"), &m);
    if (m.color.empty() && m.colors.empty()) m.color = next_color(ax);
    Value edge = kw_any(a, {"edgecolor", "ec"});
    if (!edge.is_none()) m.edgecolor = color_of(edge);
    m.linewidth = num_kw(a, "linewidth", 1.0);
    common_style(a, &m);
    commit(ax, std::move(m));

    std::vector<Value> cv, ev;
    for (double c : counts) cv.push_back(Value::number(c));
    for (double e : edges) ev.push_back(Value::number(e));
    return Value::tuple({SeriesObject::array(std::move(cv)), SeriesObject::array(std::move(ev)),
                         Value::list(std::move(artists))});
}

Value do_pie(Interpreter& in, CallArgs& a, AxesModel& ax) {
    std::vector<double> xs = doubles(in, a.get(0, "x"), "pie");
    double total = 0.0;
    for (double v : xs) {
        if (!(v >= 0.0)) throw ScriptError("ValueError", "Wedge sizes 'x' must be non negative values");
        total += v;
    }
    if (total <= 0.0) throw ScriptError("ValueError", "Wedge sizes 'x' must not all be zero");
    std::vector<std::string> labels;
    Value lv = a.get(kKw, "labels");
    if (!lv.is_none())
        for (const auto& l : in.iterate(lv)) labels.push_back(text_of(l));
    Mark colors;
    fill_colors(in, a.get(kKw, "colors"), &colors);
    const Value autopct = a.get(kKw, "autopct");
    const bool ccw = is_truthy(a.get(kKw, "counterclock", Value::boolean(true)));
    const double pct_dist = num_kw(a, "pctdistance", 0.6);
    const double label_dist = num_kw(a, "labeldistance", 1.1);
    double angle = num_kw(a, "startangle", 0.0);

    Mark wedges;
    wedges.kind = Mark::Kind::Wedge;
    wedges.linewidth = 0.0;
    std::vector<Value> wedge_artists, texts, autotexts;
    for (size_t i = 0; i < xs.size(); i++) {
        const double sweep = 360.0 * xs[i] / total;
        const double from = angle, to = ccw ? angle + sweep : angle - sweep;
        wedges.x.push_back(from);
        wedges.x2.push_back(to);
        wedges.colors.push_back(i < colors.colors.size() ? colors.colors[i]
                                                          : (colors.color.empty() ? next_color(ax) : colors.color));
        wedge_artists.push_back(artist("Wedge"));
        const double mid = (from + to) / 2 * 3.14159265358979323846 / 180.0;
        auto label_at = [&](const std::string& s, double r) {
            Mark t;
            t.kind = Mark::Kind::Text;
            t.x = {r * std::cos(mid)};
            t.y = {r * std::sin(mid)};
            t.text = s;
            t.ha = "center";
            t.va = "center";
            t.zorder = 3;
            t.fontsize = font_size(a.get(kKw, "fontsize"), 10.0);
            commit(ax, std::move(t));
        };
        if (i < labels.size()) {
            label_at(labels[i], label_dist);
            texts.push_back(artist("Text"));
        }
        if (!autopct.is_none()) {
            const double pct = 100.0 * xs[i] / total;
            std::string s;
            if (autopct.is_str()) s = percent_format(autopct.as_str(), Value::number(pct));
            else s = text_of(in.call(autopct, std::vector<Value>{Value::number(pct)}));
            label_at(s, pct_dist);
            autotexts.push_back(artist("Text"));
        }
        angle = to;
    }
    common_style(a, &wedges);
    commit(ax, std::move(wedges));
    ax.equal_aspect = true;
    ax.axis_off = true;
    if (autopct.is_none()) return Value::tuple({Value::list(std::move(wedge_artists)), Value::list(std::move(texts))});
    return Value::tuple({Value::list(std::move(wedge_artists)), Value::list(std::move(texts)),
                         Value::list(std::move(autotexts))});
}

void text_style(const CallArgs& a, Mark* m) {
    m->fontsize = font_size(kw_any(a, {"fontsize", "size"}), 10.0);
    Value c = kw_any(a, {"color", "c"});
    m->color = c.is_none() ? "#000000" : color_of(c);
    Value ha = kw_any(a, {"ha", "horizontalalignment"});
    if (!ha.is_none()) m->ha = text_of(ha);
    Value va = kw_any(a, {"va", "verticalalignment"});
    if (!va.is_none()) m->va = text_of(va);
    m->zorder = 3;
    common_style(a, m);
}

bool is_axes_transform(const Value& v) {
    return v.is_object() && v.as_object()->type_name() == kAxesTransform;
}

Value do_text(Interpreter&, CallArgs& a, AxesModel& ax) {
    Mark m;
    m.kind = Mark::Kind::Text;
    m.x = {to_double(a.get(0, "x"), "x")};
    m.y = {to_double(a.get(1, "y"), "y")};
    m.text = text_of(a.get(2, "s"));
    m.axes_coords = is_axes_transform(a.get(kKw, "transform"));
    text_style(a, &m);
    commit(ax, std::move(m));
    return artist("Text");
}

Value do_annotate(Interpreter& in, CallArgs& a, AxesModel& ax) {
    Value text = a.get(0, "text");
    if (text.is_none()) text = a.get(kKw, "s");
    auto xy = pair_of(in, a.get(1, "xy"), "xy");
    Value xytext = a.get(2, "xytext");
    const std::string coords = str_kw(a, "textcoords", "data");

    Mark t;
    t.kind = Mark::Kind::Text;
    t.text = text_of(text);
    t.x = {xy.first};
    t.y = {xy.second};
    text_style(a, &t);
    bool arrow_ok = false;
    std::pair<double, double> from = xy;
    if (!xytext.is_none()) {
        auto off = pair_of(in, xytext, "xytext");
        if (coords == "offset points" || coords == "offset pixels") {
            t.offset_x = off.first;
            t.offset_y = off.second;
        } else if (coords == "axes fraction") {
            t.axes_coords = true;
            t.x = {off.first};
            t.y = {off.second};
        } else {
            t.x = {off.first};
            t.y = {off.second};
            from = off;
            arrow_ok = true;
        }
    }
    Value props = a.get(kKw, "arrowprops");
    if (arrow_ok && props.is_dict()) {
        Mark ar;
        ar.kind = Mark::Kind::Arrow;
        ar.x = {from.first};
        ar.y = {from.second};
        ar.x2 = {xy.first};
        ar.y2 = {xy.second};
        Value c;
        if (!props.as_dict()->get(Value::str("color"), &c)) props.as_dict()->get(Value::str("facecolor"), &c);
        ar.color = c.is_none() ? "#000000" : color_of(c);
        Value lw;
        if (!props.as_dict()->get(Value::str("lw"), &lw)) props.as_dict()->get(Value::str("linewidth"), &lw);
        ar.linewidth = lw.is_none() ? 1.0 : to_double(lw, "linewidth");
        ar.zorder = t.zorder;
        commit(ax, std::move(ar));
    }
    commit(ax, std::move(t));
    return artist("Annotation");
}

Value do_refline(Interpreter&, CallArgs& a, AxesModel& ax, bool horizontal) {
    Mark m;
    m.kind = horizontal ? Mark::Kind::HLine : Mark::Kind::VLine;
    const double v = to_double(a.get(0, horizontal ? "y" : "x", Value::number(0.0)), horizontal ? "y" : "x");
    if (horizontal) m.y = {v};
    else m.x = {v};
    m.color = cycle_color(0);
    line_style(a, &m);
    commit(ax, std::move(m));
    return artist("Line2D");
}

Value do_legend(Interpreter& in, CallArgs& a, AxesModel& ax) {
    Value labels = a.pos.size() >= 2 ? a.pos[1] : a.get(kKw, "labels");
    if (labels.is_none() && a.pos.size() == 1) labels = a.pos[0];
    if (!labels.is_none()) {
        std::vector<std::string> names;
        for (const auto& l : in.iterate(labels))
            if (l.is_str()) names.push_back(l.as_str());
        size_t i = 0;
        for (auto& mk : ax.marks) {
            if (mk.kind == Mark::Kind::Text) continue;
            if (i < names.size()) mk.label = names[i++];
        }
    }
    ax.legend = true;
    return artist("Legend");
}

Value do_bar_label(Interpreter& in, CallArgs& a, AxesModel& ax) {
    std::vector<Value> bars = in.iterate(a.get(0, "container"));
    std::vector<std::string> labels;
    Value lv = a.get(kKw, "labels");
    if (!lv.is_none())
        for (const auto& l : in.iterate(lv)) labels.push_back(text_of(l));
    const std::string fmt = str_kw(a, "fmt", "%g");
    const double padding = num_kw(a, "padding", 0.0);
    std::vector<Value> out;
    for (size_t i = 0; i < bars.size(); i++) {
        auto bar = bars[i].is_object() ? std::dynamic_pointer_cast<ArtistObject>(bars[i].as_object()) : nullptr;
        if (!bar || !bar->rect()) throw ScriptError("TypeError", "bar_label expects the container returned by bar()");
        const double value = bar->horizontal() ? bar->w() : bar->h();
        Mark t;
        t.kind = Mark::Kind::Text;
        text_style(a, &t);
        if (i < labels.size()) t.text = labels[i];
        else if (fmt.find('{') != std::string::npos) t.text = brace_format(fmt, value);
        else t.text = percent_format(fmt, Value::number(value));
        if (bar->horizontal()) {
            t.x = {bar->x() + bar->w()};
            t.y = {bar->y() + bar->h() / 2};
            t.ha = value < 0 ? "right" : "left";
            t.va = "center";
            t.offset_x = value < 0 ? -padding : padding;
        } else {
            t.x = {bar->x() + bar->w() / 2};
            t.y = {bar->y() + bar->h()};
            t.ha = "center";
            t.va = value < 0 ? "top" : "bottom";
            t.offset_y = value < 0 ? -padding : padding;
        }
        commit(ax, std::move(t));
        out.push_back(artist("Text"));
    }
    return Value::list(std::move(out));
}

Value do_axis(Interpreter& in, CallArgs& a, AxesModel& ax) {
    Value arg = a.get(0, "arg");
    if (arg.is_bool()) {
        ax.axis_off = !arg.as_bool();
    } else if (arg.is_str()) {
        const std::string& s = arg.as_str();
        if (s == "off") ax.axis_off = true;
        else if (s == "on") ax.axis_off = false;
        else if (s == "equal" || s == "scaled" || s == "square" || s == "image") ax.equal_aspect = true;
        else if (s != "tight" && s != "auto" && s != "normal")
            throw ScriptError("ValueError", "Unrecognized string '" + s + "' to axis; try 'on' or 'off'");
    } else if (!arg.is_none()) {
        auto xs = doubles(in, arg, "axis");
        if (xs.size() != 4) throw ScriptError("TypeError", "the first argument to axis() must be an iterable of the form [xmin, xmax, ymin, ymax]");
        ax.xlim = std::make_pair(xs[0], xs[1]);
        ax.ylim = std::make_pair(xs[2], xs[3]);
    }
    return Value();
}

const std::vector<std::string>& axes_method_names() {
    static const std::vector<std::string> names = {
        "plot", "scatter", "bar", "barh", "hist", "pie", "text", "annotate", "axhline", "axvline", "legend", "grid",
        "bar_label", "set_title", "set_xlabel", "set_ylabel", "set_xlim", "set_ylim", "set_xticks", "set_yticks",
        "set_xticklabels", "set_yticklabels", "set_facecolor", "set_aspect", "axis", "set_axis_off", "set_axis_on",
        "invert_yaxis", "set", "get_figure", "get_title", "get_xlabel", "get_ylabel", "tick_params", "set_axisbelow",
        "margins", "minorticks_on", "minorticks_off", "autoscale", "locator_params", "label_outer", "cla", "clear",
    };
    return names;
}

bool axes_method_known(const std::string& name) {
    const auto& names = axes_method_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

Value axes_call(const std::shared_ptr<PlotState>& st, const AxesRef& ref, const std::string& name, Interpreter& in,
                CallArgs& a) {
    AxesModel& ax = ref.get();
    if (name == "plot") return do_plot(in, a, ax);
    if (name == "scatter") return do_scatter(in, a, ax);
    if (name == "bar") return do_bar(in, a, ax, false);
    if (name == "barh") return do_bar(in, a, ax, true);
    if (name == "hist") return do_hist(in, a, ax);
    if (name == "pie") return do_pie(in, a, ax);
    if (name == "text") return do_text(in, a, ax);
    if (name == "annotate") return do_annotate(in, a, ax);
    if (name == "axhline") return do_refline(in, a, ax, true);
    if (name == "axvline") return do_refline(in, a, ax, false);
    if (name == "legend") return do_legend(in, a, ax);
    if (name == "bar_label") return do_bar_label(in, a, ax);
    if (name == "grid") {
        Value b = a.get(0, "visible");
        if (b.is_none()) b = a.get(kKw, "b");
        ax.grid = b.is_none() ? true : is_truthy(b);
        return Value();
    }
    if (name == "set_title") {
        ax.title = text_of(a.get(0, "label"));
        return artist("Text");
    }
    if (name == "set_xlabel") {
        ax.xlabel = text_of(a.get(0, "xlabel"));
        return artist("Text");
    }
    if (name == "set_ylabel") {
        ax.ylabel = text_of(a.get(0, "ylabel"));
        return artist("Text");
    }
    if (name == "get_title") return Value::str(ax.title);
    if (name == "get_xlabel") return Value::str(ax.xlabel);
    if (name == "get_ylabel") return Value::str(ax.ylabel);
    if (name == "set_xlim") return set_limits(in, a, "left", "right", "xmin", "xmax", &ax.xlim);
    if (name == "set_ylim") return set_limits(in, a, "bottom", "top", "ymin", "ymax", &ax.ylim);
    if (name == "set_xticks") {
        set_ticks(in, a, &ax.xticks, &ax.xticks_set);
        return Value();
    }
    if (name == "set_yticks") {
        set_ticks(in, a, &ax.yticks, &ax.yticks_set);
        return Value();
    }
    if (name == "set_xticklabels") {
        set_tick_labels(in, a, &ax.xticks, &ax.xticks_set);
        return Value();
    }
    if (name == "set_yticklabels") {
        set_tick_labels(in, a, &ax.yticks, &ax.yticks_set);
        return Value();
    }
    if (name == "set_facecolor") {
        ax.facecolor = color_of(a.get(0, "color"));
        return Value();
    }
    if (name == "set_aspect") {
        Value v = a.get(0, "aspect");
        ax.equal_aspect = !(v.is_str() && v.as_str() == "auto");
        return Value();
    }
    if (name == "axis") return do_axis(in, a, ax);
    if (name == "set_axis_off" || name == "set_axis_on") {
        ax.axis_off = name == "set_axis_off";
        return Value();
    }
    if (name == "invert_yaxis") {
        ax.invert_y = !ax.invert_y;
        return Value();
    }
    if (name == "set") {
        for (const auto& kv : a.kw) {
            CallArgs one;
            one.pos.push_back(kv.second);
            if (kv.first == "title" || kv.first == "xlabel" || kv.first == "ylabel" || kv.first == "xlim" ||
                kv.first == "ylim" || kv.first == "facecolor" || kv.first == "aspect" || kv.first == "xticks" ||
                kv.first == "yticks" || kv.first == "xticklabels" || kv.first == "yticklabels") {
                axes_call(st, ref, "set_" + kv.first, in, one);
            } else {
                throw ScriptError("AttributeError", "Axes.set() got an unexpected keyword argument '" + kv.first + "'");
            }
        }
        return Value();
    }
    if (name == "get_figure") return figure_value(st, ref.fig);
    if (name == "cla" || name == "clear") {
        AxesModel fresh;
        fresh.left = ax.left;
        fresh.top = ax.top;
        fresh.width = ax.width;
        fresh.height = ax.height;
        ax = std::move(fresh);
        return Value();
    }
    // layout hints with no effect on the rendered chart
    return Value();
}

// ---------------- mplsoccer ----------------

PitchSpec pitch_spec_from(const CallArgs& a, bool vertical) {
    PitchSpec p;
    p.vertical = vertical;
    Value type = a.get(0, "pitch_type");
    p.pitch_type = type.is_none() ? "statsbomb" : text_of(type);
    if (p.pitch_type == "statsbomb") {
        p.length = 120.0;
        p.width = 80.0;
        p.invert_y = true;
    } else if (p.pitch_type == "opta") {
        p.length = 100.0;
        p.width = 100.0;
        p.invert_y = false;
    } else if (p.pitch_type == "wyscout") {
        p.length = 100.0;
        p.width = 100.0;
        p.invert_y = true;
    } else if (p.pitch_type == "uefa") {
        p.length = 105.0;
        p.width = 68.0;
        p.invert_y = false;
    } else if (p.pitch_type == "custom") {
        p.length = num_kw(a, "pitch_length", 105.0);
        p.width = num_kw(a, "pitch_width", 68.0);
        p.invert_y = false;
        if (!(p.length > 0.0) || !(p.width > 0.0) || p.length > 1000.0 || p.width > 1000.0) {
            throw ScriptError("ValueError", "pitch_length and pitch_width must be positive");
        }
    } else {
        throw ScriptError("ValueError", "pitch_type must be one of statsbomb, opta, wyscout, uefa, custom; got '" +
                                            p.pitch_type + "'");
    }
    Value pc = a.get(kKw, "pitch_color");
    if (!pc.is_none()) p.pitch_color = color_of(pc);
    Value lc = a.get(kKw, "line_color");
    if (!lc.is_none()) p.line_color = color_of(lc);
    Value lw = kw_any(a, {"linewidth", "line_width"});
    if (!lw.is_none()) p.linewidth = to_double(lw, "linewidth");
    p.half = is_truthy(a.get(kKw, "half", Value::boolean(false)));
    return p;
}

class PitchObject : public Object {
public:
    PitchObject(std::shared_ptr<PlotState> st, PitchSpec spec) : st_(std::move(st)), spec_(std::move(spec)) {}

    std::string type_name() const override { return spec_.vertical ? "VerticalPitch" : "Pitch"; }

    Value get_attr(const std::string& name) override {
        if (name == "pitch_type") return Value::str(spec_.pitch_type);
        if (name == "half") return Value::boolean(spec_.half);
        if (name == "pitch_length") return Value::number(spec_.length);
        if (name == "pitch_width") return Value::number(spec_.width);
        if (name == "pitch_color") return Value::str(spec_.pitch_color);
        if (name == "line_color") return Value::str(spec_.line_color);

        auto self = std::static_pointer_cast<PitchObject>(shared_from_this());
        if (name == "draw") return native(name, [self](Interpreter& in, CallArgs& a) { return self->draw(in, a); });
        if (name == "scatter" || name == "plot" || name == "annotate" || name == "text") {
            return native(name, [self, name](Interpreter& in, CallArgs& a) {
                CallArgs rest = without_ax(a);
                return axes_call(self->st_, self->target(a), name, in, rest);
            });
        }
        if (name == "arrows" || name == "lines") {
            const bool arrows = name == "arrows";
            return native(name, [self, arrows](Interpreter& in, CallArgs& a) { return self->segments(in, a, arrows); });
        }
        if (name == "kdeplot") return native(name, [self](Interpreter& in, CallArgs& a) { return self->kdeplot(in, a); });
        if (name == "bin_statistic") {
            return native(name, [self](Interpreter& in, CallArgs& a) { return self->bin_statistic(in, a); });
        }
        if (name == "heatmap") return native(name, [self](Interpreter& in, CallArgs& a) { return self->heatmap(in, a); });
        if (name == "label_heatmap") {
            return native(name, [self](Interpreter& in, CallArgs& a) { return self->label_heatmap(in, a); });
        }
        return Object::get_attr(name);
    }

    std::string repr() const override {
        return type_name() + "(pitch_type='" + spec_.pitch_type + "', half=" + (spec_.half ? "True" : "False") + ")";
    }

private:
    std::shared_ptr<PlotState> st_;
    PitchSpec spec_;

    static CallArgs without_ax(const CallArgs& a) {
        CallArgs out;
        out.pos = a.pos;
        for (const auto& kv : a.kw)
            if (kv.first != "ax") out.kw.push_back(kv);
        return out;
    }

    AxesRef target(const CallArgs& a) const {
        Value v = a.get(kKw, "ax");
        return v.is_none() ? st_->current_axes() : axes_ref_of(v);
    }

    Value draw(Interpreter& in, CallArgs& a) {
        Value ax = a.get(0, "ax");
        if (!ax.is_none()) {
            AxesRef ref = axes_ref_of(ax);
            ref.get().pitch = spec_;
            ref.get().axis_off = true;
            return Value();
        }
        double w = 6.4, h = 4.8;
        Value fs = a.get(kKw, "figsize");
        if (!fs.is_none()) std::tie(w, h) = pair_of(in, fs, "figsize");
        FigurePtr fig = st_->new_figure(w, h);
        Value axes = make_grid(st_, fig, to_index(a.get(kKw, "nrows", Value::integer(1)), "nrows"),
                               to_index(a.get(kKw, "ncols", Value::integer(1)), "ncols"), true, spec_);
        return Value::tuple({figure_value(st_, fig), axes});
    }

    Value segments(Interpreter& in, CallArgs& a, bool arrows) {
        AxesRef ref = target(a);
        Mark m;
        m.kind = arrows ? Mark::Kind::Arrow : Mark::Kind::Segment;
        m.x = doubles(in, a.get(0, "xstart"), "xstart");
        m.y = doubles(in, a.get(1, "ystart"), "ystart");
        m.x2 = doubles(in, a.get(2, "xend"), "xend");
        m.y2 = doubles(in, a.get(3, "yend"), "yend");
        if (m.y.size() != m.x.size() || m.x2.size() != m.x.size() || m.y2.size() != m.x.size()) {
            throw ScriptError("ValueError", "xstart, ystart, xend and yend must be the same size");
        }
        fill_colors(in, kw_any(a, {"color", "c"}), &m);
        AxesModel& ax = ref.get();
        if (m.color.empty() && m.colors.empty()) m.color = next_color(ax);
        Value lw = arrows ? kw_any(a, {"width", "linewidth", "lw"}) : kw_any(a, {"lw", "linewidth"});
        m.linewidth = lw.is_none() ? (arrows ? 2.0 : 1.5) : std::clamp(to_double(lw, "width"), 0.1, 20.0);
        Value ls = kw_any(a, {"linestyle", "ls"});
        if (!ls.is_none()) m.linestyle = text_of(ls);
        common_style(a, &m);
        commit(ax, std::move(m));
        return artist(arrows ? "Quiver" : "LineCollection");
    }

    void grid_edges(size_t nx, size_t ny, std::vector<double>* xg, std::vector<double>* yg) const {
        for (size_t i = 0; i <= nx; i++) xg->push_back(spec_.length * (double)i / (double)nx);
        for (size_t j = 0; j <= ny; j++) yg->push_back(spec_.width * (double)j / (double)ny);
    }

    // Bin index of v in [0, extent], or -1 outside.
    static int bin_of(double v, double extent, size_t n) {
        if (!std::isfinite(v) || v < 0.0 || v > extent) return -1;
        return (int)std::min(n - 1, (size_t)(v / extent * (double)n));
    }

    // Binned density estimate, smoothed and drawn as a filled grid.
    Value kdeplot(Interpreter& in, CallArgs& a) {
        AxesRef ref = target(a);
        std::vector<double> xs = doubles(in, a.get(0, "x"), "x");
        std::vector<double> ys = doubles(in, a.get(1, "y"), "y");
        if (xs.size() != ys.size()) throw ScriptError("ValueError", "x and y must be the same size");
        const size_t nx = 24, ny = 16;
        std::vector<double> grid(nx * ny, 0.0);
        for (size_t k = 0; k < xs.size(); k++) {
            const int i = bin_of(xs[k], spec_.length, nx), j = bin_of(ys[k], spec_.width, ny);
            if (i >= 0 && j >= 0) grid[(size_t)j * nx + (size_t)i] += 1.0;
        }
        const double bw = std::clamp(num_kw(a, "bw_adjust", 1.0), 0.25, 4.0);
        const int passes = std::max(1, (int)std::lround(3.0 * bw));
        for (int p = 0; p < passes; p++) {
            std::vector<double> tmp(grid.size(), 0.0);
            for (size_t j = 0; j < ny; j++) {
                for (size_t i = 0; i < nx; i++) {
                    double s = 2.0 * grid[j * nx + i], w = 2.0;
                    if (i > 0) { s += grid[j * nx + i - 1]; w += 1.0; }
                    if (i + 1 < nx) { s += grid[j * nx + i + 1]; w += 1.0; }
                    tmp[j * nx + i] = s / w;
                }
            }
            for (size_t j = 0; j < ny; j++) {
                for (size_t i = 0; i < nx; i++) {
                    double s = 2.0 * tmp[j * nx + i], w = 2.0;
                    if (j > 0) { s += tmp[(j - 1) * nx + i]; w += 1.0; }
                    if (j + 1 < ny) { s += tmp[(j + 1) * nx + i]; w += 1.0; }
                    grid[j * nx + i] = s / w;
                }
            }
        }
        const double peak = *std::max_element(grid.begin(), grid.end());
        const std::string cmap = cmap_name(a.get(kKw, "cmap"), "viridis");
        const double thresh = num_kw(a, "thresh", 0.05);
        std::vector<double> xg, yg;
        grid_edges(nx, ny, &xg, &yg);
        Mark m;
        m.kind = Mark::Kind::Rect;
        m.zorder = 1;
        if (peak > 0.0) {
            for (size_t j = 0; j < ny; j++) {
                for (size_t i = 0; i < nx; i++) {
                    const double t = grid[j * nx + i] / peak;
                    if (t < thresh) continue;
                    m.x.push_back(xg[i]);
                    m.y.push_back(yg[j]);
                    m.x2.push_back(xg[i + 1] - xg[i]);
                    m.y2.push_back(yg[j + 1] - yg[j]);
                    m.colors.push_back(colormap_color(cmap, t));
                }
            }
        }
        common_style(a, &m);
        commit(ref.get(), std::move(m));
        return artist("QuadContourSet");
    }

    Value bin_statistic(Interpreter& in, CallArgs& a) {
        std::vector<double> xs = doubles(in, a.get(0, "x"), "x");
        std::vector<double> ys = doubles(in, a.get(1, "y"), "y");
        if (xs.size() != ys.size()) throw ScriptError("ValueError", "x and y must be the same size");
        Value vals = a.get(2, "values");
        std::vector<double> values;
        if (!vals.is_none()) {
            values = doubles(in, vals, "values");
            if (values.size() != xs.size()) throw ScriptError("ValueError", "values must be the same size as x and y");
        }
        const std::string stat = str_kw(a, "statistic", "count");
        if (stat != "count" && stat != "sum" && stat != "mean") {
            throw ScriptError("ValueError", "statistic must be one of count, sum, mean; got '" + stat + "'");
        }
        if (stat != "count" && values.empty()) throw ScriptError("ValueError", "values are required for statistic '" + stat + "'");
        Value bins = a.get(3, "bins", Value::tuple({Value::integer(6), Value::integer(5)}));
        int64_t nx, ny;
        if (bins.is_int()) {
            nx = ny = bins.as_int();
        } else {
            auto b = pair_of(in, bins, "bins");
            nx = (int64_t)b.first;
            ny = (int64_t)b.second;
        }
        if (nx < 1 || ny < 1 || nx > 200 || ny > 200) throw ScriptError("ValueError", "bins must be between 1 and 200");

        std::vector<double> sum((size_t)(nx * ny), 0.0), count((size_t)(nx * ny), 0.0);
        for (size_t k = 0; k < xs.size(); k++) {
            const int i = bin_of(xs[k], spec_.length, (size_t)nx), j = bin_of(ys[k], spec_.width, (size_t)ny);
            if (i < 0 || j < 0) continue;
            if (!values.empty() && !std::isfinite(values[k])) continue;
            const size_t c = (size_t)j * (size_t)nx + (size_t)i;
            count[c] += 1.0;
            if (!values.empty()) sum[c] += values[k];
        }
        std::vector<double> cells((size_t)(nx * ny));
        double total = 0.0;
        for (size_t c = 0; c < cells.size(); c++) {
            if (stat == "count") cells[c] = count[c];
            else if (stat == "sum") cells[c] = sum[c];
            else cells[c] = count[c] > 0 ? sum[c] / count[c] : kNaN;
            if (std::isfinite(cells[c])) total += cells[c];
        }
        if (is_truthy(a.get(kKw, "normalize", Value::boolean(false))) && total != 0.0) {
            for (auto& c : cells) c /= total;
        }
        std::vector<double> xg, yg;
        grid_edges((size_t)nx, (size_t)ny, &xg, &yg);

        auto floats = [](const std::vector<double>& v) {
            std::vector<Value> out;
            for (double d : v) out.push_back(Value::number(d));
            return Value::list(std::move(out));
        };
        std::vector<Value> rows;
        for (int64_t j = 0; j < ny; j++) {
            rows.push_back(floats(std::vector<double>(cells.begin() + j * nx, cells.begin() + (j + 1) * nx)));
        }
        std::vector<double> cx, cy;
        for (int64_t i = 0; i < nx; i++) cx.push_back((xg[(size_t)i] + xg[(size_t)i + 1]) / 2);
        for (int64_t j = 0; j < ny; j++) cy.push_back((yg[(size_t)j] + yg[(size_t)j + 1]) / 2);
        auto d = std::make_shared<DictObj>();
        d->set(Value::str("statistic"), Value::list(std::move(rows)));
        d->set(Value::str("x_grid"), floats(xg));
        d->set(Value::str("y_grid"), floats(yg));
        d->set(Value::str("cx"), floats(cx));
        d->set(Value::str("cy"), floats(cy));
        return Value::dict_ref(d);
    }

    struct Binned {
        std::vector<std::vector<double>> rows;
        std::vector<double> xg, yg;
    };

    Binned read_stats(Interpreter& in, const Value& stats) {
        if (!stats.is_dict()) throw ScriptError("TypeError", "expected the dict returned by bin_statistic()");
        Value statistic, xg, yg;
        if (!stats.as_dict()->get(Value::str("statistic"), &statistic) || !stats.as_dict()->get(Value::str("x_grid"), &xg) ||
            !stats.as_dict()->get(Value::str("y_grid"), &yg)) {
            throw ScriptError("KeyError", "bin statistic needs 'statistic', 'x_grid' and 'y_grid'");
        }
        Binned b;
        b.xg = doubles(in, xg, "x_grid");
        b.yg = doubles(in, yg, "y_grid");
        for (const auto& row : in.iterate(statistic)) b.rows.push_back(doubles(in, row, "statistic"));
        bool ok = b.xg.size() >= 2 && b.rows.size() + 1 == b.yg.size();
        for (const auto& r : b.rows)
            if (r.size() + 1 != b.xg.size()) ok = false;
        if (!ok) throw ScriptError("ValueError", "bin statistic has an inconsistent shape");
        return b;
    }

    Value heatmap(Interpreter& in, CallArgs& a) {
        AxesRef ref = target(a);
        Binned b = read_stats(in, a.get(0, "stat"));
        double lo = std::numeric_limits<double>::infinity(), hi = -lo;
        for (const auto& r : b.rows) {
            for (double v : r) {
                if (!std::isfinite(v)) continue;
                lo = std::min(lo, v);
                hi = std::max(hi, v);
            }
        }
        lo = num_kw(a, "vmin", lo);
        hi = num_kw(a, "vmax", hi);
        const std::string cmap = cmap_name(a.get(kKw, "cmap"), "viridis");
        Mark m;
        m.kind = Mark::Kind::Rect;
        m.zorder = 1;
        for (size_t j = 0; j < b.rows.size(); j++) {
            for (size_t i = 0; i < b.rows[j].size(); i++) {
                const double v = b.rows[j][i];
                if (!std::isfinite(v)) continue;
                m.x.push_back(b.xg[i]);
                m.y.push_back(b.yg[j]);
                m.x2.push_back(b.xg[i + 1] - b.xg[i]);
                m.y2.push_back(b.yg[j + 1] - b.yg[j]);
                m.colors.push_back(colormap_color(cmap, hi > lo ? (v - lo) / (hi - lo) : 0.5));
            }
        }
        Value edge = kw_any(a, {"edgecolors", "edgecolor", "ec"});
        if (!edge.is_none()) m.edgecolor = color_of(edge);
        m.linewidth = num_kw(a, "linewidth", 1.0);
        common_style(a, &m);
        commit(ref.get(), std::move(m));
        return artist("QuadMesh");
    }

    Value label_heatmap(Interpreter& in, CallArgs& a) {
        AxesRef ref = target(a);
        Binned b = read_stats(in, a.get(0, "stat"));
        const std::string fmt = str_kw(a, "str_format", "{:.0f}");
        const bool exclude_zeros = is_truthy(a.get(kKw, "exclude_zeros", Value::boolean(false)));
        std::vector<Value> out;
        for (size_t j = 0; j < b.rows.size(); j++) {
            for (size_t i = 0; i < b.rows[j].size(); i++) {
                const double v = b.rows[j][i];
                if (!std::isfinite(v) || (exclude_zeros && v == 0.0)) continue;
                Mark t;
                t.kind = Mark::Kind::Text;
                t.x = {(b.xg[i] + b.xg[i + 1]) / 2};
                t.y = {(b.yg[j] + b.yg[j + 1]) / 2};
                t.ha = "center";
                t.va = "center";
                text_style(a, &t);
                t.text = brace_format(fmt, v);
                commit(ref.get(), std::move(t));
                out.push_back(artist("Text"));
            }
        }
        return Value::list(std::move(out));
    }
};

// Colormap callable: cmap(0.3), cmap(200) (lookup-table index) or cmap(values).
Value colormap_value(const std::string& name) {
    return native(name, [name](Interpreter& in, CallArgs& a) {
        auto one = [&](const Value& v) {
            if (v.is_int()) return Value::str(colormap_color(name, (double)v.as_int() / 255.0));
            return Value::str(colormap_color(name, to_double(v, "colormap")));
        };
        Value x = a.get(0, "X");
        if (x.is_number()) return one(x);
        std::vector<Value> out;
        for (const auto& v : in.iterate(x)) out.push_back(one(v));
        return Value::list(std::move(out));
    });
}

} // namespace

// ---------------- modules ----------------

Value make_pyplot_module(std::shared_ptr<PlotState> st) {
    auto m = std::make_shared<ModuleObject>("matplotlib.pyplot");

    static const std::pair<const char*, const char*> kForward[] = {
        {"plot", "plot"},         {"scatter", "scatter"},   {"bar", "bar"},           {"barh", "barh"},
        {"hist", "hist"},         {"pie", "pie"},           {"text", "text"},         {"annotate", "annotate"},
        {"axhline", "axhline"},   {"axvline", "axvline"},   {"legend", "legend"},     {"grid", "grid"},
        {"title", "set_title"},   {"xlabel", "set_xlabel"}, {"ylabel", "set_ylabel"}, {"xlim", "set_xlim"},
        {"ylim", "set_ylim"},     {"xticks", "set_xticks"}, {"yticks", "set_yticks"}, {"axis", "axis"},
        {"bar_label", "bar_label"}, {"tick_params", "tick_params"}, {"margins", "margins"}, {"cla", "cla"},
    };
    for (const auto& f : kForward) {
        const std::string target = f.second;
        m->define(f.first, native(f.first, [st, target](Interpreter& in, CallArgs& a) {
                      return axes_call(st, st->current_axes(), target, in, a);
                  }));
    }

    m->define("figure", native("figure", [st](Interpreter& in, CallArgs& a) {
                  double w = 6.4, h = 4.8;
                  Value fs = a.get(kKw, "figsize");
                  if (!fs.is_none()) std::tie(w, h) = pair_of(in, fs, "figsize");
                  FigurePtr fig = st->new_figure(w, h);
                  Value fc = a.get(kKw, "facecolor");
                  if (!fc.is_none()) fig->model.facecolor = color_of(fc);
                  return figure_value(st, fig);
              }));
    m->define("subplots", native("subplots", [st](Interpreter& in, CallArgs& a) {
                  double w = 6.4, h = 4.8;
                  Value fs = a.get(kKw, "figsize");
                  if (!fs.is_none()) std::tie(w, h) = pair_of(in, fs, "figsize");
                  FigurePtr fig = st->new_figure(w, h);
                  Value fc = a.get(kKw, "facecolor");
                  if (!fc.is_none()) fig->model.facecolor = color_of(fc);
                  Value axes = make_grid(st, fig, to_index(a.get(0, "nrows", Value::integer(1)), "nrows"),
                                         to_index(a.get(1, "ncols", Value::integer(1)), "ncols"),
                                         is_truthy(a.get(kKw, "squeeze", Value::boolean(true))), std::nullopt);
                  return Value::tuple({figure_value(st, fig), axes});
              }));
    m->define("subplot", native("subplot", [st](Interpreter& in, CallArgs& a) {
                  return FigureObject::add_subplot(st, st->current_figure(), in, a);
              }));
    m->define("gca", native("gca", [st](Interpreter&, CallArgs&) { return axes_value(st, st->current_axes()); }));
    m->define("gcf", native("gcf", [st](Interpreter&, CallArgs&) { return figure_value(st, st->current_figure()); }));
    m->define("suptitle", native("suptitle", [st](Interpreter&, CallArgs& a) {
                  st->current_figure()->model.suptitle = text_of(a.get(0, "t"));
                  return artist("Text");
              }));
    m->define("figtext", native("figtext", [st](Interpreter&, CallArgs& a) {
                  return FigureObject::figure_text(st, st->current_figure(), a);
              }));
    m->define("close", native("close", [st](Interpreter&, CallArgs& a) {
                  Value which = a.get(0, "fig");
                  if (which.is_none()) {
                      auto open = st->open_figures();
                      if (!open.empty()) st->close(st->current_figure());
                  } else if (which.is_str() && which.as_str() == "all") {
                      st->close_all();
                  } else if (which.is_object() && std::dynamic_pointer_cast<FigureObject>(which.as_object())) {
                      st->close(std::dynamic_pointer_cast<FigureObject>(which.as_object())->fig());
                  } else if (which.is_int()) {
                      for (const auto& f : st->open_figures())
                          if (f->number == which.as_int()) st->close(f);
                  } else {
                      throw ScriptError("TypeError", "close() argument must be a Figure, an int, 'all' or None");
                  }
                  return Value();
              }));
    m->define("clf", native("clf", [st](Interpreter&, CallArgs&) {
                  FigurePtr f = st->current_figure();
                  f->model.axes.clear();
                  f->model.suptitle.clear();
                  f->current_axes = -1;
                  f->overlay_axes = -1;
                  return Value();
              }));
    // rendering happens when the run finishes; these only shape the layout
    for (const char* noop : {"show", "tight_layout", "subplots_adjust", "draw", "ion", "ioff"}) {
        m->define(noop, native(noop, [](Interpreter&, CallArgs&) { return Value(); }));
    }
    m->define("colorbar", native("colorbar", [](Interpreter&, CallArgs&) { return artist("Colorbar"); }));
    m->define("get_cmap", native("get_cmap", [](Interpreter&, CallArgs& a) {
                  return colormap_value(cmap_name(a.get(0, "name"), "viridis"));
              }));

    auto cm = std::make_shared<ModuleObject>("matplotlib.cm");
    for (const char* name : {"viridis", "plasma", "magma", "inferno", "cividis", "hot", "Reds", "Blues", "Greens",
                             "Oranges", "Purples", "Greys", "YlOrRd", "coolwarm", "RdYlGn"}) {
        cm->define(name, colormap_value(name));
        cm->define(std::string(name) + "_r", colormap_value(std::string(name) + "_r"));
    }
    m->define("cm", Value::object(cm));

    auto style = std::make_shared<ModuleObject>("matplotlib.style");
    style->define("use", native("use", [](Interpreter&, CallArgs&) { return Value(); }));
    style->define("available", Value::list({Value::str("default"), Value::str("ggplot"), Value::str("seaborn-v0_8")}));
    m->define("style", Value::object(style));
    m->define("rcParams", Value::dict_ref(std::make_shared<DictObj>()));
    return Value::object(m);
}

Value make_mplsoccer_module(std::shared_ptr<PlotState> st) {
    auto m = std::make_shared<ModuleObject>("mplsoccer");
    for (const bool vertical : {false, true}) {
        const char* name = vertical ? "VerticalPitch" : "Pitch";
        m->define(name, native(name, [st, vertical](Interpreter&, CallArgs& a) {
                      return Value::object(std::make_shared<PitchObject>(st, pitch_spec_from(a, vertical)));
                  }));
    }
    return Value::object(m);
}

} // namespace pitchbox::script
