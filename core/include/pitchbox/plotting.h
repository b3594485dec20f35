#pragma once
#include "figure.h"
#include "interp.h"
#include "value.h"

#include <memory>
#include <string>
#include <vector>

namespace pitchbox::script {

// Figures recorded by one script run. plt.* calls target the current
// figure and axes; Pitch.draw and plt.subplots create new ones.
class PlotState {
public:
    struct FigureEntry {
        FigureModel model;
        int number{0};
        bool open{true};
        int current_axes{-1};
        int overlay_axes{-1};  // full-figure axes holding fig.text() marks
    };
    using FigurePtr = std::shared_ptr<FigureEntry>;

    // Stable handle to one axes; the model vector may grow underneath.
    struct AxesRef {
        FigurePtr fig;
        int index{0};
        AxesModel& get() const { return fig->model.axes.at((size_t)index); }
    };

    explicit PlotState(size_t max_open_figures = 16) : max_open_(max_open_figures) {}

    FigurePtr new_figure(double width_in, double height_in);
    // Current open figure, created on demand.
    FigurePtr current_figure();
    // Current axes of the current figure, created on demand.
    AxesRef current_axes();
    AxesRef add_axes(const FigurePtr& fig, double left, double top, double width, double height);
    void make_current(const AxesRef& ref);
    void close(const FigurePtr& fig);
    void close_all();

    std::vector<FigurePtr> open_figures() const;

private:
    size_t max_open_;
    std::vector<FigurePtr> figures_;
    FigurePtr current_;
    int next_number_{1};
};

// matplotlib.pyplot subset bound as `plt`.
Value make_pyplot_module(std::shared_ptr<PlotState> st);
// mplsoccer subset: Pitch and VerticalPitch.
Value make_mplsoccer_module(std::shared_ptr<PlotState> st);

} // namespace pitchbox::script
