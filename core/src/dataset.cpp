#include "pitchbox/dataset.h"
#include "pitchbox/hash.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pitchbox {

bool Cell::operator==(const Cell& o) const {
    if (type != o.type) return false;
    switch (type) {
        case Type::Null:   return true;
        case Type::Number: return number == o.number;
        case Type::String: return text == o.text;
    }
    return false;
}

const Column* Dataset::find(const std::string& name) const {
    for (const auto& c : columns) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

std::vector<std::string> Dataset::column_names() const {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

std::string Dataset::digest() const {
    hash::Sha256 h;
    char buf[40];
    for (const auto& c : columns) {
        h.update("C:" + c.name + "\n");
        for (const auto& cell : c.cells) {
            switch (cell.type) {
                case Cell::Type::Null:
                    h.update("N\n");
                    break;
                case Cell::Type::Number:
                    std::snprintf(buf, sizeof(buf), "D%.17g\n", cell.number);
                    h.update(buf);
                    break;
                case Cell::Type::String:
                    h.update("S" + std::to_string(cell.text.size()) + ":" + cell.text + "\n");
                    break;
            }
        }
    }
    auto d = h.finish();
    return hash::to_hex(d.data(), d.size());
}

static Cell classify_cell(const std::string& raw) {
    size_t b = 0, e = raw.size();
    while (b < e && (raw[b] == ' ' || raw[b] == '\t')) b++;
    while (e > b && (raw[e-1] == ' ' || raw[e-1] == '\t')) e--;
    if (b == e) return Cell::null();

    std::string s = raw.substr(b, e - b);
    const char* start = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(start, &end);
    if (end && *end == '\0' && errno == 0 && end != start) {
        // strtod accepts "nan"/"inf"; keep those as text
        char c0 = s[0];
        if ((c0 >= '0' && c0 <= '9') || c0 == '-' || c0 == '+' || c0 == '.') return Cell::num(v);
    }
    return Cell::str(s);
}

// Split one CSV record starting at pos. Handles quoted fields spanning lines.
static bool read_record(const std::string& text, size_t& pos, std::vector<std::string>* fields, std::string* err) {
    fields->clear();
    std::string cur;
    bool in_quotes = false;
    bool any = false;

    while (pos < text.size()) {
        char c = text[pos];
        any = true;
        if (in_quotes) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    cur.push_back('"');
                    pos += 2;
                    continue;
                }
                in_quotes = false;
                pos++;
                continue;
            }
            cur.push_back(c);
            pos++;
            continue;
        }
        if (c == '"') { in_quotes = true; pos++; continue; }
        if (c == ',') { fields->push_back(cur); cur.clear(); pos++; continue; }
        if (c == '\r') { pos++; continue; }
        if (c == '\n') { pos++; break; }
        cur.push_back(c);
        pos++;
    }
    if (in_quotes) {
        if (err) *err = "unterminated quoted field";
        return false;
    }
    if (any) fields->push_back(cur);
    return true;
}

bool dataset_from_csv(const std::string& text, Dataset* out, std::string* err) {
    if (!out) return false;
    *out = Dataset{};

    size_t pos = 0;
    std::vector<std::string> header;
    // skip leading blank lines
    while (pos < text.size() && (text[pos] == '\n' || text[pos] == '\r')) pos++;
    if (!read_record(text, pos, &header, err)) return false;
    if (header.empty()) {
        if (err) *err = "missing header row";
        return false;
    }
    // strip UTF-8 BOM
    if (header[0].size() >= 3 && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) header[0].erase(0, 3);

    for (const auto& h : header) {
        Column c;
        c.name = h;
        out->columns.push_back(std::move(c));
    }

    std::vector<std::string> fields;
    size_t line = 1;
    while (pos < text.size()) {
        line++;
        if (!read_record(text, pos, &fields, err)) return false;
        if (fields.empty() || (fields.size() == 1 && fields[0].empty())) continue;
        if (fields.size() != header.size()) {
            if (err) {
                std::ostringstream oss;
                oss << "row " << line << ": expected " << header.size() << " fields, got " << fields.size();
                *err = oss.str();
            }
            return false;
        }
        for (size_t i = 0; i < fields.size(); i++) {
            out->columns[i].cells.push_back(classify_cell(fields[i]));
        }
    }
    return true;
}

bool dataset_from_csv_file(const std::string& path, Dataset* out, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return dataset_from_csv(ss.str(), out, err);
}

} // namespace pitchbox
