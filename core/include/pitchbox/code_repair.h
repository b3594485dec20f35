#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pitchbox {

// Heading after which a model response carries its visualization code.
constexpr const char* kVisualizationMarker = "## SUGGESTED VISUALIZATIONS";

// Fenced ```python blocks of a model response, trimmed, blank ones dropped.
// Only blocks after kVisualizationMarker count; without the marker every
// block does.
std::vector<std::string> extract_code_blocks(const std::string& response);

// The written report: text before the marker with every fenced block removed.
std::string strip_code_blocks(const std::string& response);

struct RepairResult {
    std::string source;
    std::vector<std::string> corrections;  // one line per fix or warning
};

// Fixes common model mistakes (mplsoccer() -> Pitch(), plt.plt. -> plt., ...)
// and points unknown df['col'] references at the closest dataset column.
// The output is ordinary candidate code: it still has to pass analysis.
RepairResult auto_repair(const std::string& source, const std::vector<std::string>& columns);

// difflib.SequenceMatcher(None, a, b).ratio()
double similarity_ratio(const std::string& a, const std::string& b);

// Best candidate with ratio >= cutoff; ties go to the larger string.
std::optional<std::string> closest_match(const std::string& word, const std::vector<std::string>& candidates,
                                         double cutoff = 0.6);

} // namespace pitchbox
