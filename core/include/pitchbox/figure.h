#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pitchbox {

// Figure scale used for every rendered chart (pixels per inch).
constexpr int kFigureDpi = 150;

// One drawable element, in data coordinates of its axes.
struct Mark {
    enum class Kind { Line, Scatter, Bar, BarH, Text, Rect, Arrow, Segment, HLine, VLine, Wedge };

    Kind kind{Kind::Line};
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> x2;      // arrow/segment end points, bar widths, rect widths, wedge end angles
    std::vector<double> y2;      // arrow/segment end points, bar bottoms, rect heights
    std::vector<double> sizes;   // scatter marker area in pt^2
    std::vector<std::string> colors; // per-element fill, overrides `color`
    std::string color;
    std::string edgecolor;
    double linewidth{1.5};
    double alpha{1.0};
    double fontsize{10.0};
    std::string label;           // legend entry
    std::string text;            // Text marks
    std::string marker{"o"};
    std::string linestyle{"-"};
    std::string ha{"left"};
    std::string va{"baseline"};
    int zorder{2};
    bool axes_coords{false};     // Text placed in axes fractions instead of data units
    double offset_x{0.0};        // Text offset in points
    double offset_y{0.0};
};

// Football pitch drawn under the marks of an axes.
struct PitchSpec {
    std::string pitch_type{"statsbomb"};
    bool vertical{false};
    bool half{false};
    double length{120.0};
    double width{80.0};
    bool invert_y{true};  // statsbomb-style y grows downwards
    std::string pitch_color{"#ffffff"};
    std::string line_color{"#b0b0b0"};
    double linewidth{1.5};
};

struct AxesModel {
    // Slot inside the figure, as fractions of width/height from the top-left.
    double left{0.0}, top{0.0}, width{1.0}, height{1.0};

    std::string title;
    std::string xlabel;
    std::string ylabel;
    // Axis limits; a NaN bound is taken from the data.
    std::optional<std::pair<double, double>> xlim;
    std::optional<std::pair<double, double>> ylim;
    // Explicit ticks, used when the matching *_set flag is on (possibly empty).
    std::vector<std::pair<double, std::string>> xticks;
    std::vector<std::pair<double, std::string>> yticks;
    bool xticks_set{false};
    bool yticks_set{false};
    bool grid{false};
    bool legend{false};
    bool axis_off{false};
    bool invert_y{false};
    bool equal_aspect{false};
    std::string facecolor{"#ffffff"};
    std::optional<PitchSpec> pitch;
    std::vector<Mark> marks;
    int color_cycle{0};  // next default color index
};

struct FigureModel {
    double width_in{6.4};
    double height_in{4.8};
    std::string facecolor{"#ffffff"};
    std::string suptitle;
    std::vector<AxesModel> axes;
};

// Deterministic SVG rendering of a figure. Equal models render to equal bytes.
std::string render_svg(const FigureModel& fig);

// Normalizes a matplotlib color spec (name, "C3", "tab:red", #rgb, #rrggbb,
// #rrggbbaa, "none") to "#rrggbb" or "none". Unknown specs return false.
bool parse_color(const std::string& spec, std::string* out);

// Default color cycle entry `i` (tab10).
std::string cycle_color(int i);

// Sample a named colormap at t in [0, 1]. Unknown names fall back to viridis.
std::string colormap_color(const std::string& cmap, double t);
bool colormap_known(const std::string& cmap);

// Positions and labels of "nice" axis ticks covering [lo, hi].
std::vector<std::pair<double, std::string>> nice_ticks(double lo, double hi, int target = 6);

} // namespace pitchbox
