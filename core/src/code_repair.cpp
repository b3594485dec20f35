#include "pitchbox/code_repair.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <utility>

namespace pitchbox {

namespace {

const char* const kFence = "```";
const char* const kPythonFence = "```python";

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

void replace_all(std::string* s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s->find(from, pos)) != std::string::npos) {
        s->replace(pos, from.size(), to);
        pos += to.size();
    }
}

// Longest common block of a[alo,ahi) and b[blo,bhi); earliest in a, then in b.
struct Block {
    size_t i, j, size;
};

Block longest_match(const std::string& a, size_t alo, size_t ahi, const std::string& b, size_t blo, size_t bhi) {
    Block best{alo, blo, 0};
    const size_t m = bhi - blo;
    // prev[j + 1]: length of the common run ending at a[i - 1], b[blo + j]
    std::vector<size_t> prev(m + 1, 0), cur(m + 1, 0);
    for (size_t i = alo; i < ahi; i++) {
        for (size_t j = 0; j < m; j++) {
            size_t k = (a[i] == b[blo + j]) ? prev[j] + 1 : 0;
            cur[j + 1] = k;
            if (k > best.size) best = Block{i + 1 - k, blo + j + 1 - k, k};
        }
        std::swap(prev, cur);
    }
    return best;
}

size_t matching_chars(const std::string& a, const std::string& b) {
    size_t total = 0;
    std::vector<std::pair<std::pair<size_t, size_t>, std::pair<size_t, size_t>>> todo;
    todo.push_back({{0, a.size()}, {0, b.size()}});
    while (!todo.empty()) {
        auto [ar, br] = todo.back();
        todo.pop_back();
        Block m = longest_match(a, ar.first, ar.second, b, br.first, br.second);
        if (m.size == 0) continue;
        total += m.size;
        if (ar.first < m.i && br.first < m.j) todo.push_back({{ar.first, m.i}, {br.first, m.j}});
        if (m.i + m.size < ar.second && m.j + m.size < br.second)
            todo.push_back({{m.i + m.size, ar.second}, {m.j + m.size, br.second}});
    }
    return total;
}

// df['col'] / df["col"] references, in order of first appearance.
struct ColumnRef {
    size_t pos, len;
    std::string name;
};

std::vector<ColumnRef> column_refs(const std::string& s) {
    std::vector<ColumnRef> out;
    size_t pos = 0;
    while ((pos = s.find("df[", pos)) != std::string::npos) {
        size_t q = pos + 3;
        if (q < s.size() && (s[q] == '\'' || s[q] == '"')) {
            // shortest match: the first quote followed by ']'
            size_t k = q + 1;
            for (; k + 1 < s.size(); k++) {
                if ((s[k] == '\'' || s[k] == '"') && s[k + 1] == ']') break;
                if (s[k] == '\n') { k = s.size(); break; }
            }
            if (k + 1 < s.size()) {
                out.push_back(ColumnRef{pos, k + 2 - pos, s.substr(q + 1, k - q - 1)});
                pos = k + 2;
                continue;
            }
        }
        pos += 3;
    }
    return out;
}

} // namespace

std::vector<std::string> extract_code_blocks(const std::string& response) {
    size_t start = response.find(kVisualizationMarker);
    if (start == std::string::npos) start = 0;

    std::vector<std::string> out;
    const size_t open_len = std::char_traits<char>::length(kPythonFence);
    size_t pos = start;
    while ((pos = response.find(kPythonFence, pos)) != std::string::npos) {
        size_t body = pos + open_len;
        size_t close = response.find(kFence, body);
        if (close == std::string::npos) break;
        std::string block = trim(response.substr(body, close - body));
        if (!block.empty()) out.push_back(std::move(block));
        pos = close + 3;
    }
    return out;
}

std::string strip_code_blocks(const std::string& response) {
    std::string report = response.substr(0, response.find(kVisualizationMarker));
    std::string out;
    size_t pos = 0;
    while (pos < report.size()) {
        size_t open = report.find(kFence, pos);
        if (open == std::string::npos) break;
        size_t close = report.find(kFence, open + 3);
        if (close == std::string::npos) break;
        out.append(report, pos, open - pos);
        pos = close + 3;
    }
    out.append(report, std::min(pos, report.size()), std::string::npos);
    return out;
}

double similarity_ratio(const std::string& a, const std::string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    return 2.0 * (double)matching_chars(a, b) / (double)total;
}

std::optional<std::string> closest_match(const std::string& word, const std::vector<std::string>& candidates,
                                         double cutoff) {
    std::optional<std::string> best;
    double best_score = -1;
    for (const auto& c : candidates) {
        double s = similarity_ratio(c, word);
        if (s < cutoff) continue;
        if (s > best_score || (s == best_score && best && c > *best)) {
            best_score = s;
            best = c;
        }
    }
    return best;
}

RepairResult auto_repair(const std::string& source, const std::vector<std::string>& columns) {
    static const std::pair<const char*, const char*> kReplacements[] = {
        {"mplsoccer()", "Pitch()"},
        {"mplsoccer.Pitch()", "Pitch()"},
        {"from mplsoccer import *", "from mplsoccer import Pitch"},
        {"plt.show()()", "plt.show()"},
        {"plt.plt.", "plt."},
        {"plt..", "plt."},
    };

    RepairResult r;
    r.source = source;
    for (const auto& [wrong, right] : kReplacements) {
        if (r.source.find(wrong) == std::string::npos) continue;
        replace_all(&r.source, wrong, right);
        r.corrections.push_back(std::string("Code fix: '") + wrong + "' -> '" + right + "'");
    }

    const std::set<std::string> known(columns.begin(), columns.end());
    std::set<std::string> seen;
    for (const auto& ref : column_refs(r.source)) {
        if (known.count(ref.name) || !seen.insert(ref.name).second) continue;
        auto match = closest_match(ref.name, columns);
        if (!match) {
            r.corrections.push_back("Warning: Column '" + ref.name + "' not found and no close match available");
            continue;
        }
        // rewrite every reference to this name, whatever its quotes
        std::string out;
        size_t pos = 0;
        for (const auto& other : column_refs(r.source)) {
            if (other.name != ref.name) continue;
            out.append(r.source, pos, other.pos - pos);
            out += "df['" + *match + "']";
            pos = other.pos + other.len;
        }
        out.append(r.source, pos, std::string::npos);
        r.source = std::move(out);
        r.corrections.push_back("Column fix: '" + ref.name + "' -> '" + *match + "'");
    }

    for (const auto& c : r.corrections) std::cerr << "[repair] " << c << "\n";
    return r;
}

} // namespace pitchbox
