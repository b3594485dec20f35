#pragma once
#include <memory>
#include <string>
#include <vector>

namespace pitchbox {

struct Cell {
    enum class Type { Null, Number, String };
    Type type{Type::Null};
    double number{0.0};
    std::string text;

    static Cell null() { return Cell{}; }
    static Cell num(double v) { Cell c; c.type = Type::Number; c.number = v; return c; }
    static Cell str(std::string s) { Cell c; c.type = Type::String; c.text = std::move(s); return c; }

    bool operator==(const Cell& o) const;
};

struct Column {
    std::string name;
    std::vector<Cell> cells;
};

// Column-major table supplied by the dataset provider.
struct Dataset {
    std::vector<Column> columns;

    size_t row_count() const { return columns.empty() ? 0 : columns.front().cells.size(); }
    const Column* find(const std::string& name) const;
    std::vector<std::string> column_names() const;

    // SHA-256 over a canonical rendering of every cell.
    std::string digest() const;
};

// Opaque, read-only handle passed around with submissions.
using DatasetHandle = std::shared_ptr<const Dataset>;

// Parse CSV text (RFC 4180 quoting). Cells that parse fully as a number
// become numbers, empty cells become null. Returns false and sets err on
// malformed input (unterminated quote, ragged rows, no header).
bool dataset_from_csv(const std::string& text, Dataset* out, std::string* err);
bool dataset_from_csv_file(const std::string& path, Dataset* out, std::string* err);

} // namespace pitchbox
