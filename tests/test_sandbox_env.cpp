#include "pitchbox/capture.h"
#include "pitchbox/dataset.h"
#include "pitchbox/interp.h"
#include "pitchbox/parser.h"
#include "pitchbox/policy.h"
#include "pitchbox/sandbox_env.h"

#include "test_common.h"

#include <algorithm>
#include <memory>
#include <string>

using namespace pitchbox;

namespace {

const char* kEventsCsv =
    "player,team,type,x,y,xg\n"
    "Saka,Arsenal,Shot,102,38,0.12\n"
    "Saka,Arsenal,Pass,60,20,\n"
    "Odegaard,Arsenal,Shot,95,44,0.30\n"
    "Rice,Arsenal,Pass,50,40,\n"
    "Palmer,Chelsea,Shot,110,42,0.45\n";

DatasetHandle events() {
    auto ds = std::make_shared<Dataset>();
    std::string err;
    if (!dataset_from_csv(kEventsCsv, ds.get(), &err)) die("csv: " + err);
    return ds;
}

struct Run {
    std::shared_ptr<ScopeOutputs> out;
    std::string error_type;
    std::string error_msg;
};

Run run(const std::string& src, const DatasetHandle& ds, std::set<Capability> caps,
        std::set<std::string> bindings = default_allowed_bindings()) {
    script::Module m;
    script::SyntaxError se;
    if (!script::parse_module(src, &m, &se)) die("parse: " + se.message + "\n" + src);
    script::Interpreter in;
    ScopeRequest req;
    req.dataset = ds;
    req.capabilities = std::move(caps);
    req.allowed_bindings = std::move(bindings);
    req.modules = default_policy().module_bindings;
    Run r;
    r.out = std::make_shared<ScopeOutputs>();
    build_sandbox_scope(in, req, r.out);
    try {
        in.run(m);
    } catch (const script::ScriptError& e) {
        r.error_type = e.type();
        r.error_msg = e.what();
    }
    return r;
}

std::set<Capability> all_caps() {
    return {Capability::DatasetRead, Capability::Plot, Capability::TextOutput, Capability::Numeric};
}

void expect_output(const std::string& src, const std::string& want) {
    Run r = run(src, events(), all_caps());
    expect_true(r.error_type.empty(), "unexpected " + r.error_type + ": " + r.error_msg + "\n" + src);
    expect_eq_str(r.out->printed, want, "output of:\n" + src);
}

void test_frame_queries() {
    expect_output("print(len(df))\n", "5\n");
    expect_output("shots = df[df['type'] == 'Shot']\nprint(len(shots))\n", "3\n");
    expect_output("print(df['x'].max(), df['x'].min())\n", "110 50\n");
    expect_output("print(round(df['xg'].sum(), 2))\n", "0.87\n");
    expect_output("print(df['team'].nunique())\n", "2\n");
    expect_output("print(df['xg'].isna().sum())\n", "2\n");
    expect_output("counts = df['player'].value_counts()\nprint(counts['Saka'])\n", "2\n");
    expect_output("g = df.groupby('team')['xg'].sum()\nprint(round(g['Chelsea'], 2))\n", "0.45\n");
    expect_output("print(list(df.columns))\n", "['player', 'team', 'type', 'x', 'y', 'xg']\n");
}

void test_derived_frames_are_writable_copies() {
    expect_output(
        "shots = df[df['type'] == 'Shot'].copy()\n"
        "shots['dist'] = 120 - shots['x']\n"
        "print(shots['dist'].min())\n"
        "print('dist' in df.columns)\n",
        "10\nFalse\n");
}

void test_dataset_is_read_only() {
    DatasetHandle ds = events();
    const std::string before = ds->digest();
    Run r = run("df['x'] = 0\n", ds, all_caps());
    expect_true(r.error_type == "TypeError", "assignment into df refused: " + r.error_type);

    r = run("del df['x']\n", ds, all_caps());
    expect_true(r.error_type == "TypeError" && r.error_msg == "dataset is read-only", "column delete refused: " + r.error_msg);

    r = run("df.loc[0, 'x'] = 0\n", ds, all_caps());
    expect_true(!r.error_type.empty(), "loc assignment refused");
    expect_true(ds->digest() == before, "caller dataset unchanged");
}

void test_capabilities_gate_bindings() {
    // no DatasetRead: df is not bound
    Run r = run("print(len(df))\n", events(), {Capability::TextOutput});
    expect_true(r.error_type == "NameError", "df unbound without dataset_read: " + r.error_type);

    // no Plot: plt import does not resolve
    r = run("import matplotlib.pyplot as plt\n", events(), {Capability::TextOutput});
    expect_true(!r.error_type.empty(), "plt unavailable without plot");

    // capability granted but binding not allowed by config
    std::set<std::string> bindings = default_allowed_bindings();
    bindings.erase("np");
    r = run("import numpy as np\n", events(), all_caps(), bindings);
    expect_true(!r.error_type.empty(), "np unavailable when not in allowed bindings");

    r = run("x = 1\n", events(), all_caps());
    auto& bound = r.out->bound;
    expect_true(std::find(bound.begin(), bound.end(), "df") != bound.end(), "df bound");
    expect_true(std::find(bound.begin(), bound.end(), "plt") != bound.end(), "plt bound");
}

void test_figures_captured_as_svg() {
    Run r = run(
        "import matplotlib.pyplot as plt\n"
        "from mplsoccer import Pitch\n"
        "pitch = Pitch(pitch_type='statsbomb', pitch_color='#22312b', line_color='white')\n"
        "fig, ax = pitch.draw(figsize=(10, 7))\n"
        "shots = df[df['type'] == 'Shot']\n"
        "pitch.scatter(shots['x'], shots['y'], ax=ax, s=shots['xg'] * 500, c='red')\n"
        "ax.set_title('Shot map')\n"
        "fig2, ax2 = plt.subplots()\n"
        "ax2.bar([0, 1], [3, 5])\n"
        "print('done')\n",
        events(), all_caps());
    expect_true(r.error_type.empty(), "plot script ran: " + r.error_type + " " + r.error_msg);

    auto artifacts = capture_artifacts(*r.out);
    expect_eq_ll((long long)artifacts.size(), 3, "two figures plus text");
    expect_true(artifacts[0].kind == ArtifactKind::Figure, "figure first");
    expect_true(artifacts[0].media_type == kSvgMediaType, "svg media type");
    expect_true(artifacts[0].payload.find("<svg") != std::string::npos, "svg payload");
    expect_true(artifacts[0].payload.find("Shot map") != std::string::npos, "title rendered");
    expect_true(artifacts[1].kind == ArtifactKind::Figure, "second figure");
    expect_true(artifacts[2].kind == ArtifactKind::TextOutput && artifacts[2].payload == "done\n", "printed text last");

    // rendering is deterministic
    auto again = capture_artifacts(*r.out);
    expect_true(again[0].payload == artifacts[0].payload, "same model renders to same bytes");
}

void test_closed_figures_not_captured() {
    Run r = run(
        "import matplotlib.pyplot as plt\n"
        "fig, ax = plt.subplots()\n"
        "ax.plot([1, 2], [3, 4])\n"
        "plt.close(fig)\n",
        events(), all_caps());
    expect_true(r.error_type.empty(), "close ran: " + r.error_msg);
    expect_true(capture_artifacts(*r.out).empty(), "closed figure dropped");
}

void test_text_without_plot_capability() {
    Run r = run("print(df['x'].mean())\n", events(), {Capability::DatasetRead, Capability::TextOutput});
    expect_true(r.error_type.empty(), "text-only run: " + r.error_msg);
    auto artifacts = capture_artifacts(*r.out);
    expect_eq_ll((long long)artifacts.size(), 1, "one text artifact");
    expect_true(artifacts[0].payload == "83.4\n", "mean printed: " + artifacts[0].payload);
}

} // namespace

int main() {
    test_frame_queries();
    test_derived_frames_are_writable_copies();
    test_dataset_is_read_only();
    test_capabilities_gate_bindings();
    test_figures_captured_as_svg();
    test_closed_figures_not_captured();
    test_text_without_plot_capability();
    std::cerr << "test_sandbox_env: ALL PASSED\n";
    return 0;
}
