#pragma once

// cordon/frame.hpp: Script-visible tables: Frame, Series and GroupBy.
//
// A FrameObject owns its Dataset outright. The frame bound as `dataset` is a
// deep copy made by the Isolation Guard; every derived frame or series is a
// further copy, so nothing a program does can reach the caller's data.
//
// Missing values: numeric cells are NaN with the mask bit set; text and
// boolean cells read back as None. Reductions skip missing cells.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cordon/dataset.hpp"
#include "cordon/value.hpp"

namespace cordon {

class SeriesObject : public Object {
 public:
  explicit SeriesObject(Column data, std::optional<Column> index = std::nullopt)
      : data(std::move(data)), index(std::move(index)) {}

  std::string type_name() const override { return "Series"; }
  std::string repr(int depth) const override;
  bool truthy() const override;
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  std::optional<jsonlite::Value> to_json(int depth) const override;

  std::size_t size() const { return data.size(); }
  Value at(std::size_t row) const;
  Value label(std::size_t row) const;

  // data.name is the series name ("" when unnamed).
  Column data;
  // Row labels produced by groupby/value_counts; positional when absent.
  std::optional<Column> index;
};

class FrameObject : public Object {
 public:
  explicit FrameObject(Dataset data) : data(std::move(data)) {}

  std::string type_name() const override { return "DataFrame"; }
  std::string repr(int depth) const override;
  bool truthy() const override;
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;
  std::optional<jsonlite::Value> to_json(int depth) const override;

  Dataset data;
};

class GroupByObject : public Object {
 public:
  std::string type_name() const override { return "DataFrameGroupBy"; }
  std::optional<Value> attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) override;

  Dataset data;
  std::vector<std::string> keys;
  // Columns to aggregate; empty means every non-key column.
  std::vector<std::string> selection;
  // groupby(k)["col"]: results are a Series indexed by the key.
  bool single_selection{false};
};

bool is_tabular(const Value& value);

Value tabular_binary_op(Interpreter& interp, const std::string& op, const Value& a, const Value& b);
Value tabular_compare_op(Interpreter& interp, const std::string& op, const Value& a, const Value& b);
Value tabular_unary_op(Interpreter& interp, const std::string& op, const Value& a);

Value frame_get_item(Interpreter& interp, const FrameObject& frame, const Value& key);
void frame_set_item(Interpreter& interp, FrameObject& frame, const Value& key, const Value& value);
void frame_delete_item(FrameObject& frame, const Value& key);
Value series_get_item(Interpreter& interp, const SeriesObject& series, const Value& key);
Value groupby_get_item(const GroupByObject& group, const Value& key);

// Infers a column from script values: all numbers -> numeric (None -> NaN),
// all bools -> boolean, otherwise text.
Column column_from_values(Interpreter& interp, const std::string& name, const std::vector<Value>& values);

// Values of a list, tuple, range or Series as doubles. Missing Series cells
// are skipped when skip_missing is set; non-numeric elements are a TypeError.
std::vector<double> numeric_values(Interpreter& interp, const Value& value, bool skip_missing = true);

// tabular module constructors.
Value make_frame(Interpreter& interp, const Value& source, const Value& columns);
Value make_series(Interpreter& interp, const Value& source, const std::string& name);
Value concat_tables(Interpreter& interp, const Value& items);
Value to_numeric(Interpreter& interp, const Value& value, const std::string& errors);

// Elementwise numeric transform over a scalar, list or Series.
Value map_numeric(Interpreter& interp, const Value& value, double (*fn)(double), const char* name);

// Reductions shared by Series methods, GroupBy and the numeric/statistics
// modules. Empty input yields NaN (0 for sum).
namespace stats {
double sum(const std::vector<double>& v);
double mean(const std::vector<double>& v);
double variance(const std::vector<double>& v, int ddof);
double stddev(const std::vector<double>& v, int ddof);
double min(const std::vector<double>& v);
double max(const std::vector<double>& v);
// Linear interpolation between closest ranks; q in [0, 1].
double quantile(std::vector<double> v, double q);
double median(std::vector<double> v);
}  // namespace stats

}  // namespace cordon
