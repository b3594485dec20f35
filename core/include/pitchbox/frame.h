#pragma once
#include "dataset.h"
#include "interp.h"
#include "value.h"

#include <memory>
#include <string>
#include <vector>

namespace pitchbox::script {

// Materialized table behind a frame object. Cells are script values:
// numeric columns hold int (all integral, no gaps) or float (NaN for gaps),
// other columns hold str or None.
struct FrameData {
    std::vector<std::string> names;
    std::vector<std::vector<Value>> cols;
    std::vector<Value> index;  // row labels
    std::string index_name;
    BudgetCharge charge;

    size_t rows() const { return index.size(); }
    // Re-synchronize the budget charge after the table changed shape.
    void sync_charge();
    int find(const std::string& name) const;
    // Copy of the given rows, in order, for every column.
    std::shared_ptr<FrameData> take(const std::vector<size_t>& rows) const;
};

std::shared_ptr<FrameData> frame_data_from_dataset(const Dataset& ds);

bool is_missing(const Value& v);

// One-dimensional labeled values. Also stands in for numpy arrays and for
// the column index of a frame; `kind` selects the Python type it mimics.
class SeriesObject : public Object {
public:
    enum class Kind { Series, Index, Array };

    SeriesObject(Kind kind, std::vector<Value> values, std::vector<Value> labels = {}, std::string name = "",
                 bool read_only = false);

    static Value array(std::vector<Value> values);
    static Value series(std::vector<Value> values, std::vector<Value> labels, std::string name);

    std::string type_name() const override;
    Value get_attr(const std::string& name) override;
    void set_attr(const std::string& name, const Value& v) override;
    Value get_item(Interpreter& in, const Value& key) override;
    void set_item(const Value& key, const Value& v) override;
    void del_item(const Value& key) override;
    bool has_len() const override { return true; }
    size_t len() const override { return values_.size(); }
    bool iterable() const override { return true; }
    std::vector<Value> iterate(Interpreter&) override { return values_; }
    bool binary_op(Interpreter& in, const std::string& op, const Value& other, bool reflected, Value* out) override;
    bool unary_op(Interpreter& in, const std::string& op, Value* out) override;
    bool contains(Interpreter& in, const Value& v, bool* out) override;
    std::string repr() const override;
    bool truthy() const override;

    Kind kind() const { return kind_; }
    const std::vector<Value>& values() const { return values_; }
    // Row labels; positions when the object carries none.
    Value label(size_t i) const;
    std::vector<Value> labels() const;
    const std::string& name() const { return name_; }

    // Name of the label axis, carried into reset_index().
    std::string index_name;

private:
    Kind kind_;
    std::vector<Value> values_;
    std::vector<Value> labels_;
    std::string name_;
    bool read_only_;
    BudgetCharge charge_;

    void sync_charge();
    Value derive(std::vector<Value> values) const;
    Value select(const std::vector<size_t>& pos) const;
    Value method(const std::string& name);
};

// pandas-style DataFrame. The frame built from the submission's dataset is
// read-only; frames derived from it are independent copies.
class FrameObject : public Object {
public:
    FrameObject(std::shared_ptr<FrameData> data, bool read_only);

    std::string type_name() const override { return "DataFrame"; }
    Value get_attr(const std::string& name) override;
    void set_attr(const std::string& name, const Value& v) override;
    Value get_item(Interpreter& in, const Value& key) override;
    void set_item(const Value& key, const Value& v) override;
    void del_item(const Value& key) override;
    bool has_len() const override { return true; }
    size_t len() const override { return data_->rows(); }
    bool iterable() const override { return true; }
    std::vector<Value> iterate(Interpreter& in) override;
    bool contains(Interpreter& in, const Value& v, bool* out) override;
    std::string repr() const override;
    bool truthy() const override;

    const FrameData& data() const { return *data_; }
    Value column(const std::string& name) const;
    // Row at `pos` as a Series labeled by column name.
    Value row(size_t pos) const;
    Value filter(const std::vector<size_t>& rows) const;
    Value select_columns(const std::vector<std::string>& names) const;
    // Row positions selected by a boolean mask.
    std::vector<size_t> mask_rows(const Value& mask) const;

private:
    std::shared_ptr<FrameData> data_;
    bool read_only_;

    Value method(const std::string& name);
};

// Result of df.groupby(by), optionally narrowed to one column.
class GroupByObject : public Object {
public:
    GroupByObject(std::shared_ptr<FrameData> data, std::string by, std::string column = "");

    std::string type_name() const override { return column_.empty() ? "DataFrameGroupBy" : "SeriesGroupBy"; }
    Value get_attr(const std::string& name) override;
    Value get_item(Interpreter& in, const Value& key) override;
    bool iterable() const override { return true; }
    std::vector<Value> iterate(Interpreter& in) override;

private:
    std::shared_ptr<FrameData> data_;
    std::string by_;
    std::string column_;
    std::vector<Value> keys_;                 // sorted group keys
    std::vector<std::vector<size_t>> groups_; // row positions per key

    Value aggregate(const std::string& how);
};

// Reduction shared by Series methods, groupby and np.* helpers.
// `how` is one of sum, mean, median, min, max, count, std, var, size, nunique,
// first, last. Missing values are skipped.
Value reduce_values(const std::vector<Value>& values, const std::string& how, int ddof = 1);

} // namespace pitchbox::script
