#include "pitchbox/figure.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <map>

namespace pitchbox {

namespace {

constexpr double kPi = 3.14159265358979323846;

const char* const kTab10[] = {"#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd",
                              "#8c564b", "#e377c2", "#7f7f7f", "#bcbd22", "#17becf"};

const std::map<std::string, std::string>& named_colors() {
    static const std::map<std::string, std::string> m = {
        {"b", "#0000ff"}, {"g", "#008000"}, {"r", "#ff0000"}, {"c", "#00bfbf"},
        {"m", "#bf00bf"}, {"y", "#bfbf00"}, {"k", "#000000"}, {"w", "#ffffff"},
        {"black", "#000000"}, {"white", "#ffffff"}, {"red", "#ff0000"}, {"green", "#008000"},
        {"blue", "#0000ff"}, {"yellow", "#ffff00"}, {"orange", "#ffa500"}, {"purple", "#800080"},
        {"pink", "#ffc0cb"}, {"brown", "#a52a2a"}, {"gray", "#808080"}, {"grey", "#808080"},
        {"cyan", "#00ffff"}, {"magenta", "#ff00ff"}, {"lime", "#00ff00"}, {"navy", "#000080"},
        {"teal", "#008080"}, {"olive", "#808000"}, {"maroon", "#800000"}, {"gold", "#ffd700"},
        {"silver", "#c0c0c0"}, {"darkgreen", "#006400"}, {"darkblue", "#00008b"}, {"darkred", "#8b0000"},
        {"lightblue", "#add8e6"}, {"lightgreen", "#90ee90"}, {"lightgray", "#d3d3d3"},
        {"lightgrey", "#d3d3d3"}, {"darkgray", "#a9a9a9"}, {"darkgrey", "#a9a9a9"},
        {"skyblue", "#87ceeb"}, {"royalblue", "#4169e1"}, {"crimson", "#dc143c"},
        {"forestgreen", "#228b22"}, {"tomato", "#ff6347"}, {"salmon", "#fa8072"}, {"coral", "#ff7f50"},
        {"indigo", "#4b0082"}, {"violet", "#ee82ee"}, {"turquoise", "#40e0d0"}, {"orchid", "#da70d6"},
        {"steelblue", "#4682b4"}, {"dodgerblue", "#1e90ff"}, {"firebrick", "#b22222"},
        {"seagreen", "#2e8b57"}, {"khaki", "#f0e68c"}, {"beige", "#f5f5dc"}, {"ivory", "#fffff0"},
        {"chocolate", "#d2691e"}, {"tan", "#d2b48c"}, {"plum", "#dda0dd"}, {"slategray", "#708090"},
        {"slategrey", "#708090"}, {"whitesmoke", "#f5f5f5"}, {"darkorange", "#ff8c00"},
        {"deepskyblue", "#00bfff"}, {"limegreen", "#32cd32"}, {"darkviolet", "#9400d3"},
        {"midnightblue", "#191970"}, {"goldenrod", "#daa520"}, {"lightcoral", "#f08080"},
        {"mediumseagreen", "#3cb371"}, {"hotpink", "#ff69b4"}, {"deeppink", "#ff1493"},
        {"grass", "#3f8f3f"}, {"darkslategray", "#2f4f4f"}, {"darkslategrey", "#2f4f4f"},
        {"tab:blue", kTab10[0]}, {"tab:orange", kTab10[1]}, {"tab:green", kTab10[2]},
        {"tab:red", kTab10[3]}, {"tab:purple", kTab10[4]}, {"tab:brown", kTab10[5]},
        {"tab:pink", kTab10[6]}, {"tab:gray", kTab10[7]}, {"tab:grey", kTab10[7]},
        {"tab:olive", kTab10[8]}, {"tab:cyan", kTab10[9]},
    };
    return m;
}

struct Rgb {
    double r, g, b;
};

const std::map<std::string, std::vector<Rgb>>& colormaps() {
    static const std::map<std::string, std::vector<Rgb>> m = {
        {"viridis", {{0.267, 0.005, 0.329}, {0.229, 0.322, 0.546}, {0.128, 0.567, 0.551}, {0.369, 0.789, 0.383}, {0.993, 0.906, 0.144}}},
        {"plasma", {{0.050, 0.030, 0.528}, {0.494, 0.012, 0.658}, {0.798, 0.280, 0.470}, {0.973, 0.585, 0.254}, {0.940, 0.975, 0.131}}},
        {"magma", {{0.001, 0.000, 0.014}, {0.316, 0.072, 0.485}, {0.716, 0.215, 0.475}, {0.987, 0.535, 0.382}, {0.987, 0.991, 0.750}}},
        {"inferno", {{0.001, 0.000, 0.014}, {0.341, 0.062, 0.429}, {0.735, 0.216, 0.330}, {0.978, 0.557, 0.035}, {0.988, 0.998, 0.645}}},
        {"cividis", {{0.000, 0.135, 0.305}, {0.263, 0.299, 0.424}, {0.488, 0.485, 0.471}, {0.741, 0.681, 0.429}, {0.995, 0.909, 0.217}}},
        {"hot", {{0.042, 0.0, 0.0}, {0.8, 0.0, 0.0}, {1.0, 0.6, 0.0}, {1.0, 1.0, 0.4}, {1.0, 1.0, 1.0}}},
        {"Reds", {{1.0, 0.961, 0.941}, {0.988, 0.733, 0.631}, {0.984, 0.416, 0.290}, {0.796, 0.094, 0.114}, {0.404, 0.0, 0.051}}},
        {"Blues", {{0.969, 0.984, 1.0}, {0.776, 0.859, 0.937}, {0.420, 0.682, 0.839}, {0.129, 0.443, 0.710}, {0.031, 0.188, 0.420}}},
        {"Greens", {{0.969, 0.988, 0.961}, {0.780, 0.914, 0.753}, {0.455, 0.769, 0.463}, {0.137, 0.545, 0.271}, {0.0, 0.267, 0.106}}},
        {"Oranges", {{1.0, 0.961, 0.922}, {0.992, 0.816, 0.635}, {0.992, 0.553, 0.235}, {0.851, 0.282, 0.004}, {0.498, 0.153, 0.016}}},
        {"Purples", {{0.988, 0.984, 0.992}, {0.855, 0.855, 0.922}, {0.620, 0.604, 0.784}, {0.416, 0.318, 0.639}, {0.247, 0.0, 0.490}}},
        {"Greys", {{1.0, 1.0, 1.0}, {0.851, 0.851, 0.851}, {0.588, 0.588, 0.588}, {0.322, 0.322, 0.322}, {0.0, 0.0, 0.0}}},
        {"YlOrRd", {{1.0, 1.0, 0.8}, {0.996, 0.851, 0.463}, {0.992, 0.553, 0.235}, {0.890, 0.102, 0.110}, {0.502, 0.0, 0.149}}},
        {"coolwarm", {{0.230, 0.299, 0.754}, {0.552, 0.690, 0.996}, {0.865, 0.865, 0.865}, {0.958, 0.603, 0.482}, {0.706, 0.016, 0.150}}},
        {"RdYlGn", {{0.647, 0.0, 0.149}, {0.992, 0.682, 0.380}, {1.0, 1.0, 0.749}, {0.651, 0.851, 0.416}, {0.0, 0.408, 0.216}}},
    };
    return m;
}

std::string hex_of(double r, double g, double b) {
    auto c = [](double v) { return (int)std::lround(std::clamp(v, 0.0, 1.0) * 255.0); };
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c(r), c(g), c(b));
    return buf;
}

std::string num(double v) {
    if (!std::isfinite(v)) v = 0.0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    std::string s(buf);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:
                // XML 1.0 forbids most control characters
                if (c < 0x20 && c != '\t' && c != '\n') out += ' ';
                else out.push_back((char)c);
        }
    }
    return out;
}

std::string color_or(const std::string& spec, const std::string& fallback) {
    std::string out;
    if (!spec.empty() && parse_color(spec, &out)) return out;
    return fallback;
}

double pt_to_px(double pt) { return pt * kFigureDpi / 72.0; }

// Data -> pixel mapping for one axes. `u` is the screen-horizontal data axis.
struct Mapper {
    double ulo{0}, uhi{1}, vlo{0}, vhi{1};
    double left{0}, top{0}, w{1}, h{1};
    bool swap{false};    // data y runs horizontally (vertical pitch)
    bool flip_u{false};  // u grows leftwards
    bool flip_v{false};  // v grows downwards

    void map(double x, double y, double* px, double* py) const {
        const double u = swap ? y : x;
        const double v = swap ? x : y;
        double fu = (u - ulo) / (uhi - ulo);
        double fv = (v - vlo) / (vhi - vlo);
        if (flip_u) fu = 1.0 - fu;
        if (!flip_v) fv = 1.0 - fv;
        *px = left + fu * w;
        *py = top + fv * h;
    }
    std::string point(double x, double y) const {
        double px, py;
        map(x, y, &px, &py);
        return num(px) + "," + num(py);
    }
};

class SvgWriter {
public:
    std::string out;

    void open(double w, double h) {
        out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out += "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" width=\"" + num(w) + "\" height=\"" + num(h) +
               "\" viewBox=\"0 0 " + num(w) + " " + num(h) + "\">\n";
    }
    void close() { out += "</svg>\n"; }

    void rect(double x, double y, double w, double h, const std::string& fill, const std::string& stroke = "none",
              double sw = 0.0, double alpha = 1.0) {
        out += "<rect x=\"" + num(x) + "\" y=\"" + num(y) + "\" width=\"" + num(std::max(0.0, w)) + "\" height=\"" +
               num(std::max(0.0, h)) + "\" fill=\"" + fill + "\"";
        stroke_attrs(stroke, sw, alpha);
        out += "/>\n";
    }
    void line(double x1, double y1, double x2, double y2, const std::string& stroke, double sw,
              const std::string& dash = "", double alpha = 1.0) {
        out += "<line x1=\"" + num(x1) + "\" y1=\"" + num(y1) + "\" x2=\"" + num(x2) + "\" y2=\"" + num(y2) +
               "\" stroke=\"" + stroke + "\" stroke-width=\"" + num(sw) + "\"";
        if (!dash.empty()) out += " stroke-dasharray=\"" + dash + "\"";
        if (alpha < 1.0) out += " stroke-opacity=\"" + num(alpha) + "\"";
        out += "/>\n";
    }
    void poly(const std::vector<std::string>& pts, bool closed, const std::string& fill, const std::string& stroke,
              double sw, const std::string& dash = "", double alpha = 1.0) {
        out += closed ? "<polygon points=\"" : "<polyline points=\"";
        for (size_t i = 0; i < pts.size(); i++) {
            if (i) out += " ";
            out += pts[i];
        }
        out += "\" fill=\"" + fill + "\" stroke=\"" + stroke + "\" stroke-width=\"" + num(sw) + "\"";
        if (!dash.empty()) out += " stroke-dasharray=\"" + dash + "\"";
        if (alpha < 1.0) out += " opacity=\"" + num(alpha) + "\"";
        out += " stroke-linejoin=\"round\"/>\n";
    }
    void circle(double cx, double cy, double r, const std::string& fill, const std::string& stroke, double sw,
                double alpha) {
        out += "<circle cx=\"" + num(cx) + "\" cy=\"" + num(cy) + "\" r=\"" + num(r) + "\" fill=\"" + fill + "\"";
        stroke_attrs(stroke, sw, 1.0);
        if (alpha < 1.0) out += " opacity=\"" + num(alpha) + "\"";
        out += "/>\n";
    }
    void text(double x, double y, const std::string& s, double size_px, const std::string& fill,
              const std::string& anchor = "start", const std::string& baseline = "", double rotate = 0.0,
              bool bold = false) {
        out += "<text x=\"" + num(x) + "\" y=\"" + num(y) + "\" font-family=\"DejaVu Sans, sans-serif\" font-size=\"" +
               num(size_px) + "\" fill=\"" + fill + "\" text-anchor=\"" + anchor + "\"";
        if (!baseline.empty()) out += " dominant-baseline=\"" + baseline + "\"";
        if (bold) out += " font-weight=\"bold\"";
        if (rotate != 0.0) out += " transform=\"rotate(" + num(rotate) + " " + num(x) + " " + num(y) + ")\"";
        out += ">" + xml_escape(s) + "</text>\n";
    }

private:
    void stroke_attrs(const std::string& stroke, double sw, double alpha) {
        if (stroke != "none" && sw > 0.0) out += " stroke=\"" + stroke + "\" stroke-width=\"" + num(sw) + "\"";
        if (alpha < 1.0) out += " fill-opacity=\"" + num(alpha) + "\"";
    }
};

std::string dash_for(const std::string& ls, double lw_px) {
    const double u = std::max(1.0, lw_px);
    if (ls == "--" || ls == "dashed") return num(3.7 * u) + "," + num(1.6 * u);
    if (ls == ":" || ls == "dotted") return num(1.0 * u) + "," + num(1.65 * u);
    if (ls == "-." || ls == "dashdot") return num(6.4 * u) + "," + num(1.6 * u) + "," + num(1.0 * u) + "," + num(1.6 * u);
    return "";
}

std::vector<std::string> ellipse_points(const Mapper& m, double cx, double cy, double rx, double ry, double a0,
                                        double a1, int steps) {
    std::vector<std::string> pts;
    for (int i = 0; i <= steps; i++) {
        const double a = (a0 + (a1 - a0) * i / steps) * kPi / 180.0;
        pts.push_back(m.point(cx + rx * std::cos(a), cy + ry * std::sin(a)));
    }
    return pts;
}

void draw_pitch(SvgWriter& svg, const Mapper& m, const PitchSpec& p) {
    const double L = p.length, W = p.width;
    const std::string lc = color_or(p.line_color, "#b0b0b0");
    const double lw = pt_to_px(p.linewidth) / 2.0;
    // real-world proportions on a 105 x 68 m pitch
    const double fx = L / 105.0, fy = W / 68.0;
    auto box = [&](double x0, double y0, double x1, double y1) {
        svg.poly({m.point(x0, y0), m.point(x1, y0), m.point(x1, y1), m.point(x0, y1)}, true, "none", lc, lw);
    };
    double px0, py0, px1, py1;
    m.map(0, 0, &px0, &py0);
    m.map(L, W, &px1, &py1);
    std::string fill = color_or(p.pitch_color, "#ffffff");
    if (fill != "none") {
        svg.poly({m.point(0, 0), m.point(L, 0), m.point(L, W), m.point(0, W)}, true, fill, "none", 0.0);
    }
    box(0, 0, L, W);
    svg.poly({m.point(L / 2, 0), m.point(L / 2, W)}, false, "none", lc, lw);
    svg.poly(ellipse_points(m, L / 2, W / 2, 9.15 * fx, 9.15 * fy, 0, 360, 64), true, "none", lc, lw);
    double cx, cy;
    m.map(L / 2, W / 2, &cx, &cy);
    svg.circle(cx, cy, lw * 1.5, lc, "none", 0.0, 1.0);

    const double pa_d = 16.5 * fx, pa_w = 40.32 * fy, sy_d = 5.5 * fx, sy_w = 18.32 * fy;
    const double spot = 11.0 * fx, goal_w = 7.32 * fy, goal_d = 2.0 * fx;
    for (int side = 0; side < 2; side++) {
        const double x_line = side == 0 ? 0.0 : L;
        const double dir = side == 0 ? 1.0 : -1.0;
        box(x_line, (W - pa_w) / 2, x_line + dir * pa_d, (W + pa_w) / 2);
        box(x_line, (W - sy_w) / 2, x_line + dir * sy_d, (W + sy_w) / 2);
        box(x_line, (W - goal_w) / 2, x_line - dir * goal_d, (W + goal_w) / 2);
        double sx, sy;
        m.map(x_line + dir * spot, W / 2, &sx, &sy);
        svg.circle(sx, sy, lw * 1.5, lc, "none", 0.0, 1.0);
        // arc of the penalty circle outside the area
        const double theta = std::acos((pa_d - spot) / (9.15 * fx)) * 180.0 / kPi;
        const double a0 = side == 0 ? -theta : 180.0 - theta;
        svg.poly(ellipse_points(m, x_line + dir * spot, W / 2, 9.15 * fx, 9.15 * fy, a0, a0 + 2 * theta, 24), false,
                 "none", lc, lw);
    }
}

struct Range {
    double lo{0}, hi{0};
    bool any{false};
    void add(double v) {
        if (!std::isfinite(v)) return;
        if (!any) { lo = hi = v; any = true; return; }
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    void finish(bool pad) {
        if (!any) { lo = 0; hi = 1; return; }
        if (lo == hi) {
            const double d = lo == 0 ? 0.5 : std::fabs(lo) * 0.05;
            lo -= d;
            hi += d;
            return;
        }
        if (pad) {
            const double d = (hi - lo) * 0.05;
            lo -= d;
            hi += d;
        }
    }
};

void data_ranges(const AxesModel& ax, Range* xr, Range* yr) {
    for (const auto& mk : ax.marks) {
        switch (mk.kind) {
            case Mark::Kind::Text:
                if (mk.axes_coords) break;
                for (double v : mk.x) xr->add(v);
                for (double v : mk.y) yr->add(v);
                break;
            case Mark::Kind::Line:
            case Mark::Kind::Scatter:
                for (double v : mk.x) xr->add(v);
                for (double v : mk.y) yr->add(v);
                break;
            case Mark::Kind::Bar:
                for (size_t i = 0; i < mk.x.size(); i++) {
                    const double w = i < mk.x2.size() ? mk.x2[i] : 0.8;
                    const double b = i < mk.y2.size() ? mk.y2[i] : 0.0;
                    xr->add(mk.x[i] - w / 2);
                    xr->add(mk.x[i] + w / 2);
                    yr->add(b);
                    yr->add(b + mk.y[i]);
                }
                break;
            case Mark::Kind::BarH:
                for (size_t i = 0; i < mk.y.size(); i++) {
                    const double h = i < mk.y2.size() ? mk.y2[i] : 0.8;
                    const double l = i < mk.x2.size() ? mk.x2[i] : 0.0;
                    yr->add(mk.y[i] - h / 2);
                    yr->add(mk.y[i] + h / 2);
                    xr->add(l);
                    xr->add(l + mk.x[i]);
                }
                break;
            case Mark::Kind::Rect:
                for (size_t i = 0; i < mk.x.size(); i++) {
                    xr->add(mk.x[i]);
                    yr->add(mk.y[i]);
                    if (i < mk.x2.size()) xr->add(mk.x[i] + mk.x2[i]);
                    if (i < mk.y2.size()) yr->add(mk.y[i] + mk.y2[i]);
                }
                break;
            case Mark::Kind::Arrow:
            case Mark::Kind::Segment:
                for (double v : mk.x) xr->add(v);
                for (double v : mk.y) yr->add(v);
                for (double v : mk.x2) xr->add(v);
                for (double v : mk.y2) yr->add(v);
                break;
            case Mark::Kind::HLine:
                for (double v : mk.y) yr->add(v);
                break;
            case Mark::Kind::VLine:
                for (double v : mk.x) xr->add(v);
                break;
            case Mark::Kind::Wedge:
                xr->add(-1.1);
                xr->add(1.1);
                yr->add(-1.1);
                yr->add(1.1);
                break;
        }
    }
}

std::string mark_fill(const Mark& mk, size_t i) {
    if (i < mk.colors.size()) return color_or(mk.colors[i], "#1f77b4");
    return color_or(mk.color, "#1f77b4");
}

void draw_marks(SvgWriter& svg, const Mapper& m, const AxesModel& ax) {
    std::vector<const Mark*> order;
    for (const auto& mk : ax.marks) order.push_back(&mk);
    std::stable_sort(order.begin(), order.end(), [](const Mark* a, const Mark* b) { return a->zorder < b->zorder; });

    for (const Mark* mp : order) {
        const Mark& mk = *mp;
        const double lw = pt_to_px(mk.linewidth);
        const std::string edge = color_or(mk.edgecolor, "none");
        switch (mk.kind) {
            case Mark::Kind::Line: {
                std::vector<std::string> pts;
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                    if (std::isfinite(mk.x[i]) && std::isfinite(mk.y[i])) pts.push_back(m.point(mk.x[i], mk.y[i]));
                }
                const std::string c = mark_fill(mk, mk.colors.size());
                if (mk.linestyle != "" && mk.linestyle != "None" && mk.linestyle != "none") {
                    svg.poly(pts, false, "none", c, lw, dash_for(mk.linestyle, lw), mk.alpha);
                }
                if (!mk.marker.empty() && mk.marker != "None" && mk.marker != "none") {
                    for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                        double px, py;
                        m.map(mk.x[i], mk.y[i], &px, &py);
                        svg.circle(px, py, pt_to_px(3.0), c, "none", 0.0, mk.alpha);
                    }
                }
                break;
            }
            case Mark::Kind::Scatter:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                    if (!std::isfinite(mk.x[i]) || !std::isfinite(mk.y[i])) continue;
                    double px, py;
                    m.map(mk.x[i], mk.y[i], &px, &py);
                    const double s = i < mk.sizes.size() ? mk.sizes[i] : (mk.sizes.empty() ? 36.0 : mk.sizes.back());
                    const double r = pt_to_px(std::sqrt(std::max(0.0, s)) / 2.0);
                    const std::string fill = mark_fill(mk, i);
                    if (mk.marker == "s") {
                        svg.rect(px - r, py - r, 2 * r, 2 * r, fill, edge, lw / 2, mk.alpha);
                    } else if (mk.marker == "^") {
                        svg.poly({num(px) + "," + num(py - r), num(px + r) + "," + num(py + r), num(px - r) + "," + num(py + r)},
                                 true, fill, edge, edge == "none" ? 0.0 : lw / 2, "", mk.alpha);
                    } else {
                        svg.circle(px, py, r, fill, edge, lw / 2, mk.alpha);
                    }
                }
                break;
            case Mark::Kind::Bar:
            case Mark::Kind::BarH:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                    double x0, y0, x1, y1;
                    if (mk.kind == Mark::Kind::Bar) {
                        const double w = i < mk.x2.size() ? mk.x2[i] : 0.8;
                        const double b = i < mk.y2.size() ? mk.y2[i] : 0.0;
                        m.map(mk.x[i] - w / 2, b, &x0, &y0);
                        m.map(mk.x[i] + w / 2, b + mk.y[i], &x1, &y1);
                    } else {
                        const double h = i < mk.y2.size() ? mk.y2[i] : 0.8;
                        const double l = i < mk.x2.size() ? mk.x2[i] : 0.0;
                        m.map(l, mk.y[i] - h / 2, &x0, &y0);
                        m.map(l + mk.x[i], mk.y[i] + h / 2, &x1, &y1);
                    }
                    svg.rect(std::min(x0, x1), std::min(y0, y1), std::fabs(x1 - x0), std::fabs(y1 - y0), mark_fill(mk, i),
                             edge, lw / 2, mk.alpha);
                }
                break;
            case Mark::Kind::Rect:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                    const double w = i < mk.x2.size() ? mk.x2[i] : 0.0;
                    const double h = i < mk.y2.size() ? mk.y2[i] : 0.0;
                    svg.poly({m.point(mk.x[i], mk.y[i]), m.point(mk.x[i] + w, mk.y[i]), m.point(mk.x[i] + w, mk.y[i] + h),
                              m.point(mk.x[i], mk.y[i] + h)},
                             true, mark_fill(mk, i), edge, edge == "none" ? 0.0 : lw / 2, "", mk.alpha);
                }
                break;
            case Mark::Kind::Text:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size(); i++) {
                    double px, py;
                    if (mk.axes_coords) {
                        px = m.left + mk.x[i] * m.w;
                        py = m.top + (1.0 - mk.y[i]) * m.h;
                    } else {
                        m.map(mk.x[i], mk.y[i], &px, &py);
                    }
                    px += pt_to_px(mk.offset_x);
                    py -= pt_to_px(mk.offset_y);
                    std::string anchor = mk.ha == "center" ? "middle" : (mk.ha == "right" ? "end" : "start");
                    std::string base = mk.va == "center" ? "central" : (mk.va == "top" ? "hanging" : "");
                    svg.text(px, py, mk.text, pt_to_px(mk.fontsize), color_or(mk.color, "#000000"), anchor, base);
                }
                break;
            case Mark::Kind::Arrow:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size() && i < mk.x2.size() && i < mk.y2.size(); i++) {
                    double ax0, ay0, ax1, ay1;
                    m.map(mk.x[i], mk.y[i], &ax0, &ay0);
                    m.map(mk.x2[i], mk.y2[i], &ax1, &ay1);
                    const std::string c = mark_fill(mk, i);
                    svg.line(ax0, ay0, ax1, ay1, c, lw, "", mk.alpha);
                    const double len = std::hypot(ax1 - ax0, ay1 - ay0);
                    if (len <= 0.0) continue;
                    const double ux = (ax1 - ax0) / len, uy = (ay1 - ay0) / len;
                    const double head = std::max(4.0, lw * 3.0);
                    svg.poly({num(ax1) + "," + num(ay1),
                              num(ax1 - ux * head - uy * head / 2) + "," + num(ay1 - uy * head + ux * head / 2),
                              num(ax1 - ux * head + uy * head / 2) + "," + num(ay1 - uy * head - ux * head / 2)},
                             true, c, "none", 0.0, "", mk.alpha);
                }
                break;
            case Mark::Kind::Segment:
                for (size_t i = 0; i < mk.x.size() && i < mk.y.size() && i < mk.x2.size() && i < mk.y2.size(); i++) {
                    double sx0, sy0, sx1, sy1;
                    m.map(mk.x[i], mk.y[i], &sx0, &sy0);
                    m.map(mk.x2[i], mk.y2[i], &sx1, &sy1);
                    svg.line(sx0, sy0, sx1, sy1, mark_fill(mk, i), lw, dash_for(mk.linestyle, lw), mk.alpha);
                }
                break;
            case Mark::Kind::HLine:
                for (double v : mk.y) {
                    double px0, py0, px1, py1;
                    m.map(m.swap ? v : m.ulo, m.swap ? m.ulo : v, &px0, &py0);
                    m.map(m.swap ? v : m.uhi, m.swap ? m.uhi : v, &px1, &py1);
                    svg.line(px0, py0, px1, py1, mark_fill(mk, 0), lw, dash_for(mk.linestyle, lw), mk.alpha);
                }
                break;
            case Mark::Kind::VLine:
                for (double v : mk.x) {
                    double px0, py0, px1, py1;
                    m.map(v, m.vlo, &px0, &py0);
                    m.map(v, m.vhi, &px1, &py1);
                    svg.line(px0, py0, px1, py1, mark_fill(mk, 0), lw, dash_for(mk.linestyle, lw), mk.alpha);
                }
                break;
            case Mark::Kind::Wedge:
                for (size_t i = 0; i < mk.x.size() && i < mk.x2.size(); i++) {
                    std::vector<std::string> pts{m.point(0, 0)};
                    auto arc = ellipse_points(m, 0, 0, 1, 1, mk.x[i], mk.x2[i], 48);
                    pts.insert(pts.end(), arc.begin(), arc.end());
                    svg.poly(pts, true, mark_fill(mk, i), color_or(mk.edgecolor, "#ffffff"), lw / 2, "", mk.alpha);
                }
                break;
        }
    }
}

void draw_legend(SvgWriter& svg, const AxesModel& ax, double right, double top) {
    std::vector<const Mark*> entries;
    for (const auto& mk : ax.marks)
        if (!mk.label.empty() && mk.label[0] != '_') entries.push_back(&mk);
    if (entries.empty()) return;
    const double fs = pt_to_px(9.0);
    const double row = fs * 1.5;
    size_t longest = 0;
    for (const Mark* e : entries) longest = std::max(longest, e->label.size());
    const double w = fs * 2.2 + (double)longest * fs * 0.6 + fs;
    const double h = row * (double)entries.size() + fs * 0.6;
    const double x = right - w - fs * 0.5, y = top + fs * 0.5;
    svg.rect(x, y, w, h, "#ffffff", "#cccccc", 1.0, 0.8);
    for (size_t i = 0; i < entries.size(); i++) {
        const double cy = y + fs * 0.3 + row * ((double)i + 0.5);
        const bool stroke = entries[i]->kind == Mark::Kind::Line || entries[i]->kind == Mark::Kind::Segment ||
                            entries[i]->kind == Mark::Kind::HLine || entries[i]->kind == Mark::Kind::VLine;
        const std::string c = mark_fill(*entries[i], entries[i]->kind == Mark::Kind::Line ? entries[i]->colors.size() : 0);
        if (stroke) svg.line(x + fs * 0.4, cy, x + fs * 1.8, cy, c, pt_to_px(1.5));
        else svg.rect(x + fs * 0.6, cy - fs * 0.35, fs * 0.9, fs * 0.7, c);
        svg.text(x + fs * 2.2, cy, entries[i]->label, fs, "#000000", "start", "central");
    }
}

void draw_axes(SvgWriter& svg, const AxesModel& ax, size_t idx, double fig_w, double fig_h) {
    const double sl = ax.left * fig_w, st = ax.top * fig_h, sw = ax.width * fig_w, sh = ax.height * fig_h;
    const double title_px = pt_to_px(12.0);
    const double tick_px = pt_to_px(9.0);
    const std::string clip_id = "ax" + std::to_string(idx);

    Mapper m;
    double pl, pt, pw, ph;

    if (ax.pitch) {
        const PitchSpec& p = *ax.pitch;
        const double pad = 4.0;
        const double fx = p.length / 105.0, fy = p.width / 68.0;
        // along-length (u or v) extent in metres and across extent
        const double x_lo = p.half ? p.length / 2 : 0.0;
        const double len_m = (p.length - x_lo) / fx + 2 * pad;
        const double wid_m = 68.0 + 2 * pad;
        const double avail_t = st + (ax.title.empty() ? 0.0 : title_px * 2.0);
        const double avail_h = sh - (avail_t - st);
        const double aspect = p.vertical ? wid_m / len_m : len_m / wid_m;  // screen w / h
        pw = sw;
        ph = pw / aspect;
        if (ph > avail_h) {
            ph = avail_h;
            pw = ph * aspect;
        }
        pl = sl + (sw - pw) / 2;
        pt = avail_t + (avail_h - ph) / 2;
        m.swap = p.vertical;
        m.ulo = p.vertical ? -pad * fy : x_lo - pad * fx;
        m.uhi = p.vertical ? p.width + pad * fy : p.length + pad * fx;
        m.vlo = p.vertical ? x_lo - pad * fx : -pad * fy;
        m.vhi = p.vertical ? p.length + pad * fx : p.width + pad * fy;
        if (p.vertical) m.flip_u = p.invert_y;
        else m.flip_v = p.invert_y;
        m.left = pl;
        m.top = pt;
        m.w = pw;
        m.h = ph;
        svg.rect(pl, pt, pw, ph, color_or(p.pitch_color, "#ffffff") == "none" ? color_or(ax.facecolor, "#ffffff")
                                                                              : color_or(p.pitch_color, "#ffffff"));
        svg.out += "<clipPath id=\"" + clip_id + "\"><rect x=\"" + num(pl) + "\" y=\"" + num(pt) + "\" width=\"" + num(pw) +
                   "\" height=\"" + num(ph) + "\"/></clipPath>\n";
        svg.out += "<g clip-path=\"url(#" + clip_id + ")\">\n";
        draw_pitch(svg, m, p);
        draw_marks(svg, m, ax);
        svg.out += "</g>\n";
        if (!ax.title.empty()) svg.text(sl + sw / 2, st + title_px * 1.3, ax.title, title_px, "#000000", "middle");
        if (ax.legend) draw_legend(svg, ax, pl + pw, pt);
        return;
    }

    const bool decorate = !ax.axis_off;
    pl = sl + (decorate ? std::max(sw * 0.14, tick_px * 5.0) : sw * 0.05);
    pt = st + (ax.title.empty() ? sh * 0.06 : title_px * 2.2);
    pw = sl + sw - sw * 0.04 - pl;
    ph = st + sh - (decorate ? std::max(sh * 0.13, tick_px * 3.5) : sh * 0.05) - pt;
    if (!ax.xlabel.empty() && decorate) ph -= tick_px * 1.5;

    Range xr, yr;
    data_ranges(ax, &xr, &yr);
    xr.finish(true);
    yr.finish(true);
    auto bound = [](const std::optional<std::pair<double, double>>& lim, bool upper, double fallback) {
        if (!lim) return fallback;
        const double v = upper ? lim->second : lim->first;
        return std::isfinite(v) ? v : fallback;
    };
    m.ulo = bound(ax.xlim, false, xr.lo);
    m.uhi = bound(ax.xlim, true, xr.hi);
    m.vlo = bound(ax.ylim, false, yr.lo);
    m.vhi = bound(ax.ylim, true, yr.hi);
    if (m.uhi == m.ulo) m.uhi = m.ulo + 1;
    if (m.vhi == m.vlo) m.vhi = m.vlo + 1;
    m.flip_v = ax.invert_y;
    if (ax.equal_aspect) {
        const double du = std::fabs(m.uhi - m.ulo), dv = std::fabs(m.vhi - m.vlo);
        const double scale = std::min(pw / du, ph / dv);
        const double nw = du * scale, nh = dv * scale;
        pl += (pw - nw) / 2;
        pt += (ph - nh) / 2;
        pw = nw;
        ph = nh;
    }
    m.left = pl;
    m.top = pt;
    m.w = pw;
    m.h = ph;

    if (decorate) svg.rect(pl, pt, pw, ph, color_or(ax.facecolor, "#ffffff"));

    auto xt = ax.xticks_set ? ax.xticks : nice_ticks(std::min(m.ulo, m.uhi), std::max(m.ulo, m.uhi));
    auto yt = ax.yticks_set ? ax.yticks : nice_ticks(std::min(m.vlo, m.vhi), std::max(m.vlo, m.vhi));

    if (decorate && ax.grid) {
        for (const auto& t : xt) {
            double px, py;
            m.map(t.first, m.vlo, &px, &py);
            svg.line(px, pt, px, pt + ph, "#b0b0b0", 0.8, "", 0.6);
        }
        for (const auto& t : yt) {
            double px, py;
            m.map(m.ulo, t.first, &px, &py);
            svg.line(pl, py, pl + pw, py, "#b0b0b0", 0.8, "", 0.6);
        }
    }

    svg.out += "<clipPath id=\"" + clip_id + "\"><rect x=\"" + num(pl) + "\" y=\"" + num(pt) + "\" width=\"" + num(pw) +
               "\" height=\"" + num(ph) + "\"/></clipPath>\n";
    svg.out += "<g clip-path=\"url(#" + clip_id + ")\">\n";
    draw_marks(svg, m, ax);
    svg.out += "</g>\n";

    if (decorate) {
        svg.rect(pl, pt, pw, ph, "none", "#000000", 1.0);
        const bool rotate_x = [&] {
            for (const auto& t : xt)
                if (t.second.size() > 6 && xt.size() > 4) return true;
            return false;
        }();
        for (const auto& t : xt) {
            double px, py;
            m.map(t.first, m.vlo, &px, &py);
            if (px < pl - 0.5 || px > pl + pw + 0.5) continue;
            svg.line(px, pt + ph, px, pt + ph + 5, "#000000", 1.0);
            if (rotate_x) svg.text(px, pt + ph + 8, t.second, tick_px, "#000000", "end", "hanging", -45.0);
            else svg.text(px, pt + ph + 8, t.second, tick_px, "#000000", "middle", "hanging");
        }
        for (const auto& t : yt) {
            double px, py;
            m.map(m.ulo, t.first, &px, &py);
            if (py < pt - 0.5 || py > pt + ph + 0.5) continue;
            svg.line(pl - 5, py, pl, py, "#000000", 1.0);
            svg.text(pl - 8, py, t.second, tick_px, "#000000", "end", "central");
        }
        if (!ax.xlabel.empty()) {
            svg.text(pl + pw / 2, st + sh - tick_px * 0.6, ax.xlabel, pt_to_px(10.0), "#000000", "middle");
        }
        if (!ax.ylabel.empty()) {
            const double x = sl + tick_px * 1.2;
            const double y = pt + ph / 2;
            svg.text(x, y, ax.ylabel, pt_to_px(10.0), "#000000", "middle", "", -90.0);
        }
    }
    if (!ax.title.empty()) svg.text(pl + pw / 2, pt - title_px * 0.6, ax.title, title_px, "#000000", "middle");
    if (ax.legend) draw_legend(svg, ax, pl + pw, pt);
}

} // namespace

bool parse_color(const std::string& spec, std::string* out) {
    std::string s;
    for (char c : spec)
        if (c != ' ') s.push_back(c);
    if (s.empty()) return false;
    if (s == "none" || s == "None" || s == "transparent") {
        *out = "none";
        return true;
    }
    if (s[0] == '#') {
        std::string hex = s.substr(1);
        for (char c : hex)
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        if (hex.size() == 3 || hex.size() == 4) {
            *out = std::string("#") + hex[0] + hex[0] + hex[1] + hex[1] + hex[2] + hex[2];
        } else if (hex.size() == 6 || hex.size() == 8) {
            *out = "#" + hex.substr(0, 6);
        } else {
            return false;
        }
        for (auto& c : *out) c = (char)std::tolower(static_cast<unsigned char>(c));
        return true;
    }
    if (s.size() == 2 && s[0] == 'C' && std::isdigit(static_cast<unsigned char>(s[1]))) {
        *out = kTab10[s[1] - '0'];
        return true;
    }
    // grayscale level "0.0".."1.0"
    if (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '.') {
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end && *end == '\0' && v >= 0.0 && v <= 1.0) {
            *out = hex_of(v, v, v);
            return true;
        }
        return false;
    }
    std::string lower;
    for (char c : s) lower.push_back((char)std::tolower(static_cast<unsigned char>(c)));
    if (lower.compare(0, 4, "xkcd") == 0) return false;
    auto it = named_colors().find(lower);
    if (it == named_colors().end()) return false;
    *out = it->second;
    return true;
}

std::string cycle_color(int i) {
    return kTab10[((i % 10) + 10) % 10];
}

bool colormap_known(const std::string& cmap) {
    std::string base = cmap;
    if (base.size() > 2 && base.compare(base.size() - 2, 2, "_r") == 0) base.resize(base.size() - 2);
    return colormaps().count(base) > 0;
}

std::string colormap_color(const std::string& cmap, double t) {
    std::string base = cmap;
    bool reversed = false;
    if (base.size() > 2 && base.compare(base.size() - 2, 2, "_r") == 0) {
        base.resize(base.size() - 2);
        reversed = true;
    }
    auto it = colormaps().find(base);
    const auto& stops = it == colormaps().end() ? colormaps().at("viridis") : it->second;
    if (!std::isfinite(t)) t = 0.0;
    t = std::clamp(t, 0.0, 1.0);
    if (reversed) t = 1.0 - t;
    const double pos = t * (double)(stops.size() - 1);
    const size_t i = std::min((size_t)pos, stops.size() - 2);
    const double f = pos - (double)i;
    const Rgb& a = stops[i];
    const Rgb& b = stops[i + 1];
    return hex_of(a.r + (b.r - a.r) * f, a.g + (b.g - a.g) * f, a.b + (b.b - a.b) * f);
}

std::vector<std::pair<double, std::string>> nice_ticks(double lo, double hi, int target) {
    std::vector<std::pair<double, std::string>> out;
    if (!std::isfinite(lo) || !std::isfinite(hi) || hi <= lo) return out;
    const double raw = (hi - lo) / std::max(1, target - 1);
    const double mag = std::pow(10.0, std::floor(std::log10(raw)));
    double step = mag;
    for (double f : {1.0, 2.0, 2.5, 5.0, 10.0}) {
        step = f * mag;
        if (step >= raw) break;
    }
    const int decimals = std::max(0, (int)-std::floor(std::log10(step) + 1e-9) + (std::fmod(step / mag, 1.0) != 0.0 ? 1 : 0));
    const double first = std::ceil(lo / step - 1e-9) * step;
    for (int i = 0; i < 50; i++) {
        const double v = first + i * step;
        if (v > hi + step * 1e-9) break;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, std::fabs(v) < step * 1e-9 ? 0.0 : v);
        out.emplace_back(v, buf);
    }
    return out;
}

std::string render_svg(const FigureModel& fig) {
    const double w = std::round(fig.width_in * kFigureDpi);
    const double h = std::round(fig.height_in * kFigureDpi);
    SvgWriter svg;
    svg.open(w, h);
    svg.rect(0, 0, w, h, color_or(fig.facecolor, "#ffffff"));
    for (size_t i = 0; i < fig.axes.size(); i++) draw_axes(svg, fig.axes[i], i, w, h);
    if (!fig.suptitle.empty()) svg.text(w / 2, pt_to_px(14.0), fig.suptitle, pt_to_px(14.0), "#000000", "middle", "", 0.0, true);
    svg.close();
    return svg.out;
}

} // namespace pitchbox
