#include "test_common.h"

#include "pitchbox/code_repair.h"

#include <cmath>
#include <string>
#include <vector>

static void test_extract_after_marker() {
    const std::string response =
        "## ANALYSIS\n"
        "Arsenal dominated.\n"
        "```python\nprint('ignored, before the marker')\n```\n"
        "## SUGGESTED VISUALIZATIONS\n"
        "Shot map:\n"
        "```python\n\nfig, ax = pitch.draw()\n\n```\n"
        "Empty:\n"
        "```python\n   \n```\n"
        "Pass map:\n"
        "```python\nprint(len(df))\n```\n";
    auto blocks = pitchbox::extract_code_blocks(response);
    expect_eq_ll((long long)blocks.size(), 2, "two non-empty blocks after the marker");
    expect_true(blocks[0] == "fig, ax = pitch.draw()", "first block trimmed");
    expect_true(blocks[1] == "print(len(df))", "second block");

    std::string report = pitchbox::strip_code_blocks(response);
    expect_true(report.find("Arsenal dominated.") != std::string::npos, "prose kept");
    expect_true(report.find("```") == std::string::npos, "fences removed");
    expect_true(report.find("SUGGESTED") == std::string::npos, "visualization section dropped");
}

static void test_extract_without_marker() {
    auto blocks = pitchbox::extract_code_blocks("text\n```python\nx = 1\n```\nmore\n```python\ny = 2\n```\n");
    expect_eq_ll((long long)blocks.size(), 2, "every block without the marker");
    expect_true(pitchbox::extract_code_blocks("no code here").empty(), "no blocks");
    expect_true(pitchbox::extract_code_blocks("```python\nunclosed\n").empty(), "unclosed fence ignored");
}

static void test_similarity() {
    expect_true(pitchbox::similarity_ratio("abc", "abc") == 1.0, "identical");
    expect_true(pitchbox::similarity_ratio("", "") == 1.0, "both empty");
    expect_true(pitchbox::similarity_ratio("abc", "xyz") == 0.0, "disjoint");
    // difflib: SequenceMatcher(None, "abcd", "bcde").ratio() == 0.75
    expect_true(std::fabs(pitchbox::similarity_ratio("abcd", "bcde") - 0.75) < 1e-12, "partial overlap");

    std::vector<std::string> cols = {"player_name", "team_name", "x", "y"};
    auto m = pitchbox::closest_match("player", cols);
    expect_true(m && *m == "player_name", "closest match");
    expect_true(!pitchbox::closest_match("zzzz", cols), "no match under cutoff");
    // equal scores: the lexicographically greater name wins regardless of order
    auto tie = pitchbox::closest_match("team", {"team_b", "team_a"});
    expect_true(tie && *tie == "team_b", "tie keeps greater name");
    tie = pitchbox::closest_match("team", {"team_a", "team_b"});
    expect_true(tie && *tie == "team_b", "tie independent of order");
}

static void test_auto_repair() {
    std::vector<std::string> cols = {"player_name", "shot_xg", "x", "y"};
    const std::string src =
        "from mplsoccer import *\n"
        "pitch = mplsoccer()\n"
        "vals = df['shot_xgg'] * 2\n"
        "names = df[\"player_nam\"]\n"
        "again = df['shot_xgg']\n"
        "bad = df['qqqqqq']\n"
        "plt.plt.show()\n";
    auto r = pitchbox::auto_repair(src, cols);
    expect_true(r.source.find("from mplsoccer import Pitch") != std::string::npos, "star import fixed");
    expect_true(r.source.find("pitch = Pitch()") != std::string::npos, "constructor fixed");
    expect_true(r.source.find("plt.show()") != std::string::npos && r.source.find("plt.plt.") == std::string::npos,
                "doubled module fixed");
    expect_true(r.source.find("df['shot_xg'] * 2") != std::string::npos, "column fixed");
    expect_true(r.source.find("again = df['shot_xg']") != std::string::npos, "every reference fixed");
    expect_true(r.source.find("df['player_name']") != std::string::npos, "double-quoted reference fixed");
    expect_true(r.source.find("df['qqqqqq']") != std::string::npos, "unknown column left alone");

    int column_fixes = 0, warnings = 0;
    for (const auto& c : r.corrections) {
        if (c.rfind("Column fix:", 0) == 0) column_fixes++;
        if (c.rfind("Warning: Column 'qqqqqq'", 0) == 0) warnings++;
    }
    expect_eq_ll(column_fixes, 2, "one fix per misspelled column");
    expect_eq_ll(warnings, 1, "one warning for the unknown column");

    auto clean = pitchbox::auto_repair("print(df['x'])\n", cols);
    expect_true(clean.corrections.empty() && clean.source == "print(df['x'])\n", "clean code untouched");
}

int main() {
    test_extract_after_marker();
    test_extract_without_marker();
    test_similarity();
    test_auto_repair();
    std::cerr << "test_code_repair: ALL PASSED" << std::endl;
    return 0;
}
