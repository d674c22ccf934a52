#include "cordon/frame.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "cordon/interpreter.hpp"

namespace cordon {

using SeriesPtr = std::shared_ptr<SeriesObject>;
using FramePtr = std::shared_ptr<FrameObject>;
using GroupPtr = std::shared_ptr<GroupByObject>;

namespace {

constexpr std::size_t kPollMask = 1023;
constexpr std::size_t kReprRows = 10;

inline void poll(Interpreter& interp, std::size_t i) {
  if ((i & kPollMask) == 0) interp.check_interrupts();
}

double nan_value() { return std::numeric_limits<double>::quiet_NaN(); }

Value cell(const Column& c, std::size_t r) {
  if (c.type == ColumnType::numeric) return Value(c.is_missing(r) ? nan_value() : c.numbers()[r]);
  if (c.is_missing(r)) return Value();
  if (c.type == ColumnType::text) return Value(c.texts()[r]);
  return Value(c.flags()[r] != 0);
}

std::string cell_text(const Column& c, std::size_t r) {
  if (c.is_missing(r)) return "NaN";
  switch (c.type) {
    case ColumnType::numeric: return format_float(c.numbers()[r]);
    case ColumnType::text: return c.texts()[r];
    case ColumnType::boolean: return c.flags()[r] ? "True" : "False";
  }
  return "";
}

jsonlite::Value cell_json(const Column& c, std::size_t r) {
  if (c.is_missing(r)) return jsonlite::Value(nullptr);
  switch (c.type) {
    case ColumnType::numeric: return jsonlite::Value(c.numbers()[r]);
    case ColumnType::text: return jsonlite::Value(c.texts()[r]);
    case ColumnType::boolean: return jsonlite::Value(c.flags()[r] != 0);
  }
  return jsonlite::Value(nullptr);
}

std::string dtype_name(const Column& c) {
  switch (c.type) {
    case ColumnType::numeric: return "float64";
    case ColumnType::text: return "object";
    case ColumnType::boolean: return "bool";
  }
  return "object";
}

std::vector<std::size_t> all_rows(std::size_t n) {
  std::vector<std::size_t> rows(n);
  std::iota(rows.begin(), rows.end(), std::size_t{0});
  return rows;
}

// Non-missing cells of a numeric or boolean column as doubles.
std::vector<double> column_numbers(const Column& c, const std::vector<std::size_t>& rows) {
  if (c.type == ColumnType::text) {
    throw_type_error("cannot aggregate text column '" + c.name + "' numerically");
  }
  std::vector<double> out;
  out.reserve(rows.size());
  for (std::size_t r : rows) {
    if (c.is_missing(r)) continue;
    out.push_back(c.type == ColumnType::numeric ? c.numbers()[r] : (c.flags()[r] ? 1.0 : 0.0));
  }
  return out;
}

bool cell_less(const Column& c, std::size_t a, std::size_t b) {
  switch (c.type) {
    case ColumnType::numeric: return c.numbers()[a] < c.numbers()[b];
    case ColumnType::text: return c.texts()[a] < c.texts()[b];
    case ColumnType::boolean: return c.flags()[a] < c.flags()[b];
  }
  return false;
}

std::string cell_key(const Column& c, std::size_t r) { return hash_key(cell(c, r)); }

// Ordered row indices; missing cells sort last in either direction.
std::vector<std::size_t> sort_rows(const std::vector<const Column*>& by, const std::vector<bool>& ascending,
                                   std::size_t n) {
  std::vector<std::size_t> rows = all_rows(n);
  std::stable_sort(rows.begin(), rows.end(), [&](std::size_t a, std::size_t b) {
    for (std::size_t k = 0; k < by.size(); ++k) {
      const Column& c = *by[k];
      const bool ma = c.is_missing(a);
      const bool mb = c.is_missing(b);
      if (ma || mb) {
        if (ma && mb) continue;
        return mb;
      }
      if (cell_less(c, a, b)) return static_cast<bool>(ascending[k]);
      if (cell_less(c, b, a)) return !ascending[k];
    }
    return false;
  });
  return rows;
}

Value reduce_column(const Column& c, const std::string& how, const std::vector<std::size_t>& rows, int ddof = 1) {
  if (how == "count" || how == "size") {
    if (how == "size") return Value(static_cast<std::int64_t>(rows.size()));
    std::int64_t n = 0;
    for (std::size_t r : rows) {
      if (!c.is_missing(r)) ++n;
    }
    return Value(n);
  }
  if (how == "nunique") {
    std::unordered_set<std::string> seen;
    for (std::size_t r : rows) {
      if (!c.is_missing(r)) seen.insert(cell_key(c, r));
    }
    return Value(static_cast<std::int64_t>(seen.size()));
  }
  if (how == "first" || how == "last") {
    if (how == "first") {
      for (std::size_t r : rows) {
        if (!c.is_missing(r)) return cell(c, r);
      }
    } else {
      for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
        if (!c.is_missing(*it)) return cell(c, *it);
      }
    }
    return c.type == ColumnType::numeric ? Value(nan_value()) : Value();
  }
  if ((how == "min" || how == "max") && c.type == ColumnType::text) {
    const std::string* best = nullptr;
    for (std::size_t r : rows) {
      if (c.is_missing(r)) continue;
      const std::string& s = c.texts()[r];
      if (best == nullptr || (how == "min" ? s < *best : *best < s)) best = &s;
    }
    return best == nullptr ? Value(nan_value()) : Value(*best);
  }
  const std::vector<double> v = column_numbers(c, rows);
  if (how == "sum") {
    if (c.type == ColumnType::boolean) return Value(static_cast<std::int64_t>(stats::sum(v)));
    return Value(stats::sum(v));
  }
  if (how == "mean") return Value(stats::mean(v));
  if (how == "median") return Value(stats::median(v));
  if (how == "std") return Value(stats::stddev(v, ddof));
  if (how == "var") return Value(stats::variance(v, ddof));
  if (how == "min") return Value(stats::min(v));
  if (how == "max") return Value(stats::max(v));
  if (how == "prod") {
    double p = 1.0;
    for (double d : v) p *= d;
    return Value(p);
  }
  throw_value_error("unknown aggregation '" + how + "'");
}

bool is_reduction(const std::string& how) {
  static const std::set<std::string> kNames = {"sum", "mean", "median", "std", "var", "min", "max",
                                               "count", "nunique", "first", "last", "size", "prod"};
  return kNames.count(how) != 0;
}

Column text_column(std::string name, const std::vector<std::string>& values) {
  return Column::text(std::move(name), values);
}

// Column built from reduction results (numbers, strings or NaN).
Column column_of_results(Interpreter& interp, const std::string& name, const std::vector<Value>& values) {
  return column_from_values(interp, name, values);
}

std::string render_table(const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows,
                         const std::string& footer) {
  std::vector<std::size_t> widths(headers.size(), 0);
  for (std::size_t c = 0; c < headers.size(); ++c) widths[c] = headers[c].size();
  for (const auto& row : rows) {
    for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) widths[c] = std::max(widths[c], row[c].size());
  }
  auto line = [&](const std::vector<std::string>& cells) {
    std::string out;
    for (std::size_t c = 0; c < cells.size(); ++c) {
      if (c) out += "  ";
      out += std::string(widths[c] - cells[c].size(), ' ') + cells[c];
    }
    return out;
  };
  std::string out = line(headers);
  for (const auto& row : rows) out += "\n" + line(row);
  if (!footer.empty()) out += "\n" + footer;
  return out;
}

// Positions shown by repr: everything, or head and tail around "...".
std::vector<std::size_t> shown_rows(std::size_t n, bool& elided) {
  elided = n > 2 * kReprRows;
  std::vector<std::size_t> rows;
  if (!elided) return all_rows(n);
  for (std::size_t i = 0; i < kReprRows / 2; ++i) rows.push_back(i);
  for (std::size_t i = n - kReprRows / 2; i < n; ++i) rows.push_back(i);
  return rows;
}

SeriesPtr new_series(Column data, std::optional<Column> index = std::nullopt) {
  return std::make_shared<SeriesObject>(std::move(data), std::move(index));
}

FramePtr new_frame(Dataset data) { return std::make_shared<FrameObject>(std::move(data)); }

SeriesPtr series_take(const SeriesObject& s, const std::vector<std::size_t>& rows) {
  std::optional<Column> idx;
  if (s.index) idx = s.index->take(rows);
  return new_series(s.data.take(rows), std::move(idx));
}

std::vector<std::string> string_list(const Value& v, const char* what) {
  std::vector<std::string> out;
  if (v.is_str()) {
    out.push_back(v.as_str());
    return out;
  }
  const std::vector<Value>* items = nullptr;
  if (auto l = v.as<ListObject>()) items = &l->items;
  if (auto t = v.as<TupleObject>()) items = &t->items;
  if (items == nullptr) throw_type_error(std::string(what) + " must be a column name or a list of column names");
  for (const auto& item : *items) {
    if (!item.is_str()) throw_type_error(std::string(what) + " must contain column names (str)");
    out.push_back(item.as_str());
  }
  return out;
}

const Column& require_column(const Dataset& d, const std::string& name) {
  const Column* c = d.column(name);
  if (c == nullptr) throw ScriptError("KeyError", repr(Value(name)));
  return *c;
}

std::vector<bool> ascending_flags(const Value& v, std::size_t n) {
  if (v.is_bool()) return std::vector<bool>(n, v.as_bool());
  if (auto l = v.as<ListObject>()) {
    if (l->items.size() != n) throw_value_error("length of ascending must match length of by");
    std::vector<bool> out;
    for (const auto& item : l->items) out.push_back(truthy(item));
    return out;
  }
  return std::vector<bool>(n, truthy(v));
}

std::size_t count_arg(const ArgBinder& args, std::size_t idx, std::int64_t fallback) {
  const std::int64_t n = to_int(args.get_or(idx, Value(fallback)), "n must be an integer");
  return n < 0 ? 0 : static_cast<std::size_t>(n);
}

double round_half_even(double d, std::int64_t decimals) {
  if (!std::isfinite(d)) return d;
  const double scale = std::pow(10.0, static_cast<double>(decimals));
  const double scaled = d * scale;
  if (!std::isfinite(scaled)) return d;
  return std::nearbyint(scaled) / scale;
}

// Elementwise helpers for arithmetic between series and scalars.
struct Operand {
  const SeriesObject* series{nullptr};
  const Value* scalar{nullptr};

  bool missing(std::size_t i) const { return series != nullptr && series->data.is_missing(i); }
  bool is_text() const {
    return series != nullptr ? series->data.type == ColumnType::text : scalar->is_str();
  }
  bool is_bool() const {
    return series != nullptr ? series->data.type == ColumnType::boolean : scalar->is_bool();
  }
  double number(std::size_t i) const {
    if (series == nullptr) return to_double(*scalar, "unsupported operand");
    const Column& c = series->data;
    if (c.type == ColumnType::numeric) return c.numbers()[i];
    if (c.type == ColumnType::boolean) return c.flags()[i] ? 1.0 : 0.0;
    throw_type_error("unsupported operand type for text column '" + c.name + "'");
  }
  const std::string& text(std::size_t i) const {
    if (series == nullptr) return scalar->as_str();
    return series->data.texts()[i];
  }
  bool flag(std::size_t i) const {
    if (series == nullptr) return truthy(*scalar);
    const Column& c = series->data;
    if (c.type == ColumnType::boolean) return c.flags()[i] != 0;
    if (c.type == ColumnType::numeric) return c.numbers()[i] != 0.0;
    return !c.texts()[i].empty();
  }
};

struct OperandPair {
  Operand left;
  Operand right;
  std::size_t n{0};
  std::string name;
  std::optional<Column> index;
};

OperandPair bind_operands(const std::string& op, const Value& a, const Value& b) {
  if (a.as<FrameObject>() || b.as<FrameObject>() || a.as<GroupByObject>() || b.as<GroupByObject>()) {
    throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) + "'");
  }
  OperandPair p;
  auto sa = a.as<SeriesObject>();
  auto sb = b.as<SeriesObject>();
  auto scalar_ok = [&](const Value& v) {
    if (!v.is_number() && !v.is_str() && !v.is_none()) {
      throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) +
                       "'");
    }
  };
  if (sa) p.left.series = sa.get(); else { scalar_ok(a); p.left.scalar = &a; }
  if (sb) p.right.series = sb.get(); else { scalar_ok(b); p.right.scalar = &b; }
  if (sa && sb && sa->size() != sb->size()) {
    throw_value_error("Series lengths must match (" + std::to_string(sa->size()) + " vs " +
                      std::to_string(sb->size()) + ")");
  }
  p.n = sa ? sa->size() : sb->size();
  if (sa && sb) {
    p.name = sa->data.name == sb->data.name ? sa->data.name : "";
  } else {
    p.name = sa ? sa->data.name : sb->data.name;
  }
  if (sa && sa->index) p.index = sa->index;
  else if (sb && sb->index) p.index = sb->index;
  return p;
}

double floored_mod(double x, double y) {
  if (y == 0.0) return nan_value();
  double m = std::fmod(x, y);
  if (m != 0.0 && ((m < 0) != (y < 0))) m += y;
  return m;
}

// -- frame reductions -------------------------------------------------------

Value frame_reduce(Interpreter& interp, const FrameObject& f, const std::string& how, int ddof) {
  std::vector<const Column*> eligible;
  for (const auto& c : f.data.columns()) {
    if (how == "count" || how == "nunique" || c.type != ColumnType::text) eligible.push_back(&c);
  }
  if (eligible.empty()) throw_type_error("no numeric columns to compute " + how);
  const auto rows = all_rows(f.data.row_count());
  if (eligible.size() == 1) return reduce_column(*eligible.front(), how, rows, ddof);

  std::vector<std::string> labels;
  std::vector<Value> results;
  for (const Column* c : eligible) {
    interp.check_interrupts();
    labels.push_back(c->name);
    results.push_back(reduce_column(*c, how, rows, ddof));
  }
  return Value(new_series(column_of_results(interp, "", results), text_column("", labels)));
}

Value frame_describe(Interpreter& interp, const FrameObject& f) {
  static const std::vector<std::string> kStats = {"count", "mean", "std", "min", "25%", "50%", "75%", "max"};
  std::vector<Column> out;
  out.push_back(text_column("statistic", kStats));
  const auto rows = all_rows(f.data.row_count());
  for (const auto& c : f.data.columns()) {
    if (c.type == ColumnType::text) continue;
    interp.check_interrupts();
    const std::vector<double> v = column_numbers(c, rows);
    out.push_back(Column::numeric(c.name, {static_cast<double>(v.size()), stats::mean(v), stats::stddev(v, 1),
                                           stats::min(v), stats::quantile(v, 0.25), stats::quantile(v, 0.5),
                                           stats::quantile(v, 0.75), stats::max(v)}));
  }
  if (out.size() == 1) throw_type_error("describe() requires at least one numeric column");
  return Value(new_frame(Dataset(std::move(out))));
}

// -- groupby ----------------------------------------------------------------

struct Group {
  std::vector<Value> key;
  std::vector<std::size_t> rows;
};

std::vector<Group> build_groups(Interpreter& interp, const Dataset& d, const std::vector<std::string>& keys) {
  std::vector<const Column*> cols;
  for (const auto& k : keys) cols.push_back(&require_column(d, k));
  std::vector<Group> groups;
  std::unordered_map<std::string, std::size_t> lookup;
  for (std::size_t r = 0; r < d.row_count(); ++r) {
    poll(interp, r);
    bool missing = false;
    std::string composite;
    std::vector<Value> key;
    for (const Column* c : cols) {
      if (c->is_missing(r)) {
        missing = true;
        break;
      }
      key.push_back(cell(*c, r));
      composite += hash_key(key.back()) + "\x1f";
    }
    if (missing) continue;
    auto [it, inserted] = lookup.emplace(composite, groups.size());
    if (inserted) groups.push_back(Group{std::move(key), {}});
    groups[it->second].rows.push_back(r);
  }
  std::stable_sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
    for (std::size_t i = 0; i < a.key.size(); ++i) {
      if (values_equal(a.key[i], b.key[i])) continue;
      return less_than(a.key[i], b.key[i]);
    }
    return false;
  });
  return groups;
}

std::vector<std::string> aggregated_columns(const GroupByObject& g) {
  if (!g.selection.empty()) return g.selection;
  std::vector<std::string> out;
  for (const auto& c : g.data.columns()) {
    if (std::find(g.keys.begin(), g.keys.end(), c.name) == g.keys.end()) out.push_back(c.name);
  }
  return out;
}

std::vector<Column> key_columns(const GroupByObject& g, const std::vector<Group>& groups) {
  std::vector<std::size_t> firsts;
  for (const auto& grp : groups) firsts.push_back(grp.rows.front());
  std::vector<Column> out;
  for (const auto& k : g.keys) out.push_back(g.data.column(k)->take(firsts));
  return out;
}

// Shapes per-column aggregates as a Series (one key, one selected column)
// or a Frame with the key columns first.
Value shape_group_result(Interpreter& interp, const GroupByObject& g, const std::vector<Group>& groups,
                         std::vector<std::pair<std::string, std::vector<Value>>> results) {
  std::vector<Column> keys = key_columns(g, groups);
  if (g.single_selection && g.keys.size() == 1 && results.size() == 1) {
    return Value(new_series(column_of_results(interp, results[0].first, results[0].second), std::move(keys[0])));
  }
  std::vector<Column> cols = std::move(keys);
  for (auto& [name, values] : results) {
    if (std::any_of(cols.begin(), cols.end(), [&](const Column& c) { return c.name == name; })) continue;
    cols.push_back(column_of_results(interp, name, values));
  }
  return Value(new_frame(Dataset(std::move(cols))));
}

Value group_reduce(Interpreter& interp, const GroupByObject& g, const std::string& how) {
  const auto groups = build_groups(interp, g.data, g.keys);
  std::vector<std::pair<std::string, std::vector<Value>>> results;
  for (const auto& name : aggregated_columns(g)) {
    const Column& c = require_column(g.data, name);
    // Text columns drop out of numeric aggregations, as with numeric_only.
    if (c.type == ColumnType::text && how != "count" && how != "nunique" && how != "first" && how != "last" &&
        how != "min" && how != "max" && how != "size") {
      if (g.single_selection) throw_type_error("cannot compute " + how + " of text column '" + name + "'");
      continue;
    }
    std::vector<Value> values;
    for (const auto& grp : groups) {
      interp.check_interrupts();
      values.push_back(reduce_column(c, how, grp.rows));
    }
    results.emplace_back(name, std::move(values));
  }
  return shape_group_result(interp, g, groups, std::move(results));
}

Value group_size(Interpreter& interp, const GroupByObject& g) {
  const auto groups = build_groups(interp, g.data, g.keys);
  std::vector<Value> sizes;
  for (const auto& grp : groups) sizes.push_back(Value(static_cast<std::int64_t>(grp.rows.size())));
  std::vector<Column> keys = key_columns(g, groups);
  if (g.keys.size() == 1) return Value(new_series(column_of_results(interp, "size", sizes), std::move(keys[0])));
  keys.push_back(column_of_results(interp, "size", sizes));
  return Value(new_frame(Dataset(std::move(keys))));
}

Value group_agg(Interpreter& interp, const GroupByObject& g, const Value& spec) {
  if (spec.is_str()) {
    if (!is_reduction(spec.as_str())) throw_value_error("unknown aggregation '" + spec.as_str() + "'");
    if (spec.as_str() == "size") return group_size(interp, g);
    return group_reduce(interp, g, spec.as_str());
  }
  const auto groups = build_groups(interp, g.data, g.keys);
  std::vector<std::pair<std::string, std::vector<Value>>> results;
  auto apply = [&](const std::string& column, const Value& how) {
    const Column& c = require_column(g.data, column);
    std::vector<Value> values;
    for (const auto& grp : groups) {
      interp.check_interrupts();
      if (how.is_str()) {
        if (!is_reduction(how.as_str())) throw_value_error("unknown aggregation '" + how.as_str() + "'");
        values.push_back(reduce_column(c, how.as_str(), grp.rows));
      } else {
        values.push_back(interp.call1(how, Value(new_series(c.take(grp.rows)))));
      }
    }
    results.emplace_back(column, std::move(values));
  };
  if (auto d = spec.as<DictObject>()) {
    for (const auto& [k, v] : d->entries()) {
      if (!k.is_str()) throw_type_error("agg() dict keys must be column names");
      apply(k.as_str(), v);
    }
  } else if (spec.is_object()) {
    for (const auto& name : aggregated_columns(g)) apply(name, spec);
  } else {
    throw_type_error("agg() expects a function name, a callable or a dict");
  }
  return shape_group_result(interp, g, groups, std::move(results));
}

// -- series methods ---------------------------------------------------------

using SeriesMethod = Value (*)(Interpreter&, const SeriesPtr&, CallArgs&);

Value series_reduce(Interpreter& interp, const SeriesPtr& s, CallArgs& a, const std::string& how) {
  ArgBinder args("Series." + how, a, {"skipna", "ddof"});
  const bool skipna = truthy(args.get_or(0, Value(true)));
  const int ddof = static_cast<int>(to_int(args.get_or(1, Value(1)), "ddof must be an integer"));
  interp.check_interrupts();
  if (!skipna && how != "count") {
    for (std::size_t r = 0; r < s->size(); ++r) {
      if (s->data.is_missing(r)) return Value(nan_value());
    }
  }
  return reduce_column(s->data, how, all_rows(s->size()), ddof);
}

Value series_value_counts(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.value_counts", a, {"normalize", "ascending"});
  const bool normalize = truthy(args.get_or(0, Value(false)));
  const bool ascending = truthy(args.get_or(1, Value(false)));
  std::vector<std::size_t> firsts;
  std::vector<std::int64_t> counts;
  std::unordered_map<std::string, std::size_t> lookup;
  std::size_t total = 0;
  for (std::size_t r = 0; r < s->size(); ++r) {
    poll(interp, r);
    if (s->data.is_missing(r)) continue;
    ++total;
    auto [it, inserted] = lookup.emplace(cell_key(s->data, r), firsts.size());
    if (inserted) {
      firsts.push_back(r);
      counts.push_back(0);
    }
    ++counts[it->second];
  }
  std::vector<std::size_t> order = all_rows(firsts.size());
  std::stable_sort(order.begin(), order.end(), [&](std::size_t x, std::size_t y) {
    return ascending ? counts[x] < counts[y] : counts[x] > counts[y];
  });
  std::vector<std::size_t> label_rows;
  std::vector<double> values;
  for (std::size_t i : order) {
    label_rows.push_back(firsts[i]);
    values.push_back(normalize ? static_cast<double>(counts[i]) / static_cast<double>(total)
                               : static_cast<double>(counts[i]));
  }
  Column index = s->data.take(label_rows);
  return Value(new_series(Column::numeric(normalize ? "proportion" : "count", std::move(values)), std::move(index)));
}

Value series_unique_values(Interpreter& interp, const SeriesObject& s) {
  std::unordered_set<std::string> seen;
  std::vector<Value> out;
  for (std::size_t r = 0; r < s.size(); ++r) {
    poll(interp, r);
    if (seen.insert(cell_key(s.data, r)).second) out.push_back(s.at(r));
  }
  return Value(interp.new_list(std::move(out)));
}

Value series_head_tail(const SeriesPtr& s, CallArgs& a, bool head) {
  ArgBinder args(head ? "Series.head" : "Series.tail", a, {"n"});
  const std::size_t n = std::min(count_arg(args, 0, 5), s->size());
  std::vector<std::size_t> rows;
  const std::size_t start = head ? 0 : s->size() - n;
  for (std::size_t i = 0; i < n; ++i) rows.push_back(start + i);
  return Value(series_take(*s, rows));
}

Column numeric_like(const SeriesObject& s, const std::string& what) {
  if (s.data.type == ColumnType::text) throw_type_error(what + " requires a numeric Series");
  if (s.data.type == ColumnType::numeric) return s.data;
  std::vector<double> v(s.size());
  for (std::size_t r = 0; r < s.size(); ++r) v[r] = s.data.flags()[r] ? 1.0 : 0.0;
  Column c = Column::numeric(s.data.name, std::move(v));
  c.missing = s.data.missing;
  return c;
}

Value series_astype(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.astype", a, {"dtype"}, 1);
  const Value& t = args.get(0);
  std::string target;
  if (t.is_str()) target = t.as_str();
  else if (auto f = t.as<NativeFunction>()) target = f->name;
  else throw_type_error("astype() expects a type name");
  if (target == "float64" || target == "float32") target = "float";
  if (target == "int64" || target == "int32") target = "int";
  if (target == "object" || target == "string") target = "str";

  const Column& c = s->data;
  const std::size_t n = s->size();
  if (target == "str") {
    std::vector<std::string> out(n);
    for (std::size_t r = 0; r < n; ++r) out[r] = c.is_missing(r) ? "nan" : cell_text(c, r);
    return Value(new_series(Column::text(c.name, std::move(out)), s->index));
  }
  if (target == "bool") {
    std::vector<std::uint8_t> out(n);
    for (std::size_t r = 0; r < n; ++r) {
      if (c.type == ColumnType::numeric) out[r] = (c.is_missing(r) || c.numbers()[r] != 0.0) ? 1 : 0;
      else if (c.type == ColumnType::text) out[r] = (!c.is_missing(r) && !c.texts()[r].empty()) ? 1 : 0;
      else out[r] = c.flags()[r];
    }
    return Value(new_series(Column::boolean(c.name, std::move(out)), s->index));
  }
  if (target == "float" || target == "int") {
    std::vector<double> out(n, nan_value());
    for (std::size_t r = 0; r < n; ++r) {
      poll(interp, r);
      if (c.is_missing(r)) {
        if (target == "int") throw_value_error("cannot convert missing values to int");
        continue;
      }
      double d = 0.0;
      if (c.type == ColumnType::numeric) {
        d = c.numbers()[r];
      } else if (c.type == ColumnType::boolean) {
        d = c.flags()[r] ? 1.0 : 0.0;
      } else {
        const std::string& text = c.texts()[r];
        char* end = nullptr;
        d = std::strtod(text.c_str(), &end);
        if (text.empty() || end == nullptr || *end != '\0') {
          throw_value_error("could not convert string to float: " + repr(Value(text)));
        }
      }
      out[r] = target == "int" ? std::trunc(d) : d;
    }
    return Value(new_series(Column::numeric(c.name, std::move(out)), s->index));
  }
  throw_type_error("data type '" + target + "' not understood");
}

Value series_fillna(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.fillna", a, {"value"}, 1);
  const Value& fill = args.get(0);
  std::vector<Value> values;
  values.reserve(s->size());
  for (std::size_t r = 0; r < s->size(); ++r) {
    poll(interp, r);
    values.push_back(s->data.is_missing(r) ? fill : s->at(r));
  }
  return Value(new_series(column_from_values(interp, s->data.name, values), s->index));
}

Value series_isin(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.isin", a, {"values"}, 1);
  std::unordered_set<std::string> wanted;
  interp.for_each(args.get(0), [&](const Value& v) {
    wanted.insert(hash_key(v));
    return true;
  });
  std::vector<std::uint8_t> out(s->size(), 0);
  for (std::size_t r = 0; r < s->size(); ++r) {
    poll(interp, r);
    if (!s->data.is_missing(r)) out[r] = wanted.count(cell_key(s->data, r)) ? 1 : 0;
  }
  return Value(new_series(Column::boolean(s->data.name, std::move(out)), s->index));
}

Value series_between(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.between", a, {"left", "right", "inclusive"}, 2);
  const std::string inclusive = args.has(2) ? str(args.get(2)) : "both";
  if (inclusive != "both" && inclusive != "neither" && inclusive != "left" && inclusive != "right") {
    throw_value_error("inclusive must be 'both', 'neither', 'left' or 'right'");
  }
  const Value lo = interp.compare_op(inclusive == "both" || inclusive == "left" ? ">=" : ">", Value(s), args.get(0));
  const Value hi = interp.compare_op(inclusive == "both" || inclusive == "right" ? "<=" : "<", Value(s), args.get(1));
  return interp.binary_op("&", lo, hi);
}

Value series_apply(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.apply", a, {"func"}, 1);
  const Value fn = args.get(0);
  std::vector<Value> out;
  out.reserve(s->size());
  for (std::size_t r = 0; r < s->size(); ++r) {
    interp.check_interrupts();
    if (auto d = fn.as<DictObject>()) {
      const Value* hit = d->find(s->at(r));
      out.push_back(hit ? *hit : Value());
    } else {
      out.push_back(interp.call1(fn, s->at(r)));
    }
  }
  return Value(new_series(column_from_values(interp, s->data.name, out), s->index));
}

Value series_sort_values(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.sort_values", a, {"ascending"});
  interp.check_interrupts();
  const bool asc = truthy(args.get_or(0, Value(true)));
  return Value(series_take(*s, sort_rows({&s->data}, {asc}, s->size())));
}

Value series_idx(Interpreter& interp, const SeriesPtr& s, bool want_max) {
  interp.check_interrupts();
  if (s->data.type == ColumnType::text) throw_type_error("idxmax/idxmin require a numeric Series");
  const Column c = numeric_like(*s, "idxmax/idxmin");
  std::optional<std::size_t> best;
  for (std::size_t r = 0; r < s->size(); ++r) {
    if (c.is_missing(r)) continue;
    if (!best || (want_max ? c.numbers()[r] > c.numbers()[*best] : c.numbers()[r] < c.numbers()[*best])) best = r;
  }
  if (!best) throw_value_error("attempt to get argmax of an empty sequence");
  return s->label(*best);
}

Value series_reset_index(Interpreter& interp, const SeriesPtr& s, CallArgs& a) {
  ArgBinder args("Series.reset_index", a, {"drop", "name"});
  interp.check_interrupts();
  Column data = s->data;
  if (args.has(1)) data.name = str(args.get(1));
  if (data.name.empty()) data.name = s->index ? "count" : "0";
  if (truthy(args.get_or(0, Value(false)))) return Value(new_series(std::move(data)));
  std::vector<Column> cols;
  if (s->index) {
    Column idx = *s->index;
    if (idx.name.empty()) idx.name = "index";
    cols.push_back(std::move(idx));
  } else {
    std::vector<double> positions(s->size());
    for (std::size_t r = 0; r < s->size(); ++r) positions[r] = static_cast<double>(r);
    cols.push_back(Column::numeric("index", std::move(positions)));
  }
  if (cols.front().name == data.name) data.name = data.name + "_value";
  cols.push_back(std::move(data));
  return Value(new_frame(Dataset(std::move(cols))));
}

const std::map<std::string, SeriesMethod>& series_methods() {
  static const std::map<std::string, SeriesMethod> kMethods = {
      {"mean", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "mean"); }},
      {"sum", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "sum"); }},
      {"min", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "min"); }},
      {"max", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "max"); }},
      {"median", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "median"); }},
      {"std", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "std"); }},
      {"var", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "var"); }},
      {"count", [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "count"); }},
      {"nunique",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) { return series_reduce(in, s, a, "nunique"); }},
      {"unique",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.unique", a, {});
         return series_unique_values(in, *s);
       }},
      {"value_counts", series_value_counts},
      {"round",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder args("Series.round", a, {"decimals"});
         const std::int64_t decimals = to_int(args.get_or(0, Value(0)), "decimals must be an integer");
         Column c = numeric_like(*s, "round()");
         for (std::size_t r = 0; r < c.size(); ++r) {
           poll(in, r);
           c.numbers()[r] = round_half_even(c.numbers()[r], decimals);
         }
         return Value(new_series(std::move(c), s->index));
       }},
      {"abs",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.abs", a, {});
         Column c = numeric_like(*s, "abs()");
         for (std::size_t r = 0; r < c.size(); ++r) {
           poll(in, r);
           c.numbers()[r] = std::fabs(c.numbers()[r]);
         }
         return Value(new_series(std::move(c), s->index));
       }},
      {"astype", series_astype},
      {"tolist",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.tolist", a, {});
         std::vector<Value> out;
         for (std::size_t r = 0; r < s->size(); ++r) out.push_back(s->at(r));
         return Value(in.new_list(std::move(out)));
       }},
      {"to_list",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.to_list", a, {});
         std::vector<Value> out;
         for (std::size_t r = 0; r < s->size(); ++r) out.push_back(s->at(r));
         return Value(in.new_list(std::move(out)));
       }},
      {"isna",
       [](Interpreter&, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.isna", a, {});
         std::vector<std::uint8_t> out(s->size());
         for (std::size_t r = 0; r < s->size(); ++r) out[r] = s->data.is_missing(r) ? 1 : 0;
         return Value(new_series(Column::boolean(s->data.name, std::move(out)), s->index));
       }},
      {"notna",
       [](Interpreter&, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.notna", a, {});
         std::vector<std::uint8_t> out(s->size());
         for (std::size_t r = 0; r < s->size(); ++r) out[r] = s->data.is_missing(r) ? 0 : 1;
         return Value(new_series(Column::boolean(s->data.name, std::move(out)), s->index));
       }},
      {"fillna", series_fillna},
      {"dropna",
       [](Interpreter&, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.dropna", a, {});
         std::vector<std::size_t> rows;
         for (std::size_t r = 0; r < s->size(); ++r) {
           if (!s->data.is_missing(r)) rows.push_back(r);
         }
         return Value(series_take(*s, rows));
       }},
      {"cumsum",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.cumsum", a, {});
         Column c = numeric_like(*s, "cumsum()");
         double running = 0.0;
         for (std::size_t r = 0; r < c.size(); ++r) {
           poll(in, r);
           if (c.is_missing(r)) continue;
           running += c.numbers()[r];
           c.numbers()[r] = running;
         }
         return Value(new_series(std::move(c), s->index));
       }},
      {"head", [](Interpreter&, const SeriesPtr& s, CallArgs& a) { return series_head_tail(s, a, true); }},
      {"tail", [](Interpreter&, const SeriesPtr& s, CallArgs& a) { return series_head_tail(s, a, false); }},
      {"sort_values", series_sort_values},
      {"apply", series_apply},
      {"map", series_apply},
      {"between", series_between},
      {"isin", series_isin},
      {"idxmax",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.idxmax", a, {});
         return series_idx(in, s, true);
       }},
      {"idxmin",
       [](Interpreter& in, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.idxmin", a, {});
         return series_idx(in, s, false);
       }},
      {"reset_index", series_reset_index},
      {"copy",
       [](Interpreter&, const SeriesPtr& s, CallArgs& a) {
         ArgBinder("Series.copy", a, {});
         return Value(new_series(s->data, s->index));
       }},
  };
  return kMethods;
}

// -- frame methods ----------------------------------------------------------

using FrameMethod = Value (*)(Interpreter&, const FramePtr&, CallArgs&);

// Returns the new frame, or applies it in place and returns None.
Value frame_result(const FramePtr& self, Dataset data, bool inplace) {
  if (inplace) {
    self->data = std::move(data);
    return Value();
  }
  return Value(new_frame(std::move(data)));
}

Value frame_head_tail(const FramePtr& f, CallArgs& a, bool head) {
  ArgBinder args(head ? "DataFrame.head" : "DataFrame.tail", a, {"n"});
  const std::size_t total = f->data.row_count();
  const std::size_t n = std::min(count_arg(args, 0, 5), total);
  std::vector<std::size_t> rows;
  const std::size_t start = head ? 0 : total - n;
  for (std::size_t i = 0; i < n; ++i) rows.push_back(start + i);
  return Value(new_frame(f->data.take_rows(rows)));
}

Value frame_reduce_method(Interpreter& interp, const FramePtr& f, CallArgs& a, const std::string& how) {
  ArgBinder args("DataFrame." + how, a, {"numeric_only", "ddof"});
  const int ddof = static_cast<int>(to_int(args.get_or(1, Value(1)), "ddof must be an integer"));
  return frame_reduce(interp, *f, how, ddof);
}

Value frame_sort_values(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.sort_values", a, {"by", "ascending", "inplace"}, 1);
  interp.check_interrupts();
  const auto by = string_list(args.get(0), "by");
  std::vector<const Column*> cols;
  for (const auto& name : by) cols.push_back(&require_column(f->data, name));
  const auto asc = ascending_flags(args.get_or(1, Value(true)), by.size());
  const auto rows = sort_rows(cols, asc, f->data.row_count());
  return frame_result(f, f->data.take_rows(rows), truthy(args.get_or(2, Value(false))));
}

Value frame_extreme_rows(Interpreter& interp, const FramePtr& f, CallArgs& a, bool largest) {
  ArgBinder args(largest ? "DataFrame.nlargest" : "DataFrame.nsmallest", a, {"n", "columns"}, 2);
  interp.check_interrupts();
  const std::size_t n = count_arg(args, 0, 5);
  const auto by = string_list(args.get(1), "columns");
  std::vector<const Column*> cols;
  for (const auto& name : by) {
    const Column& c = require_column(f->data, name);
    if (c.type == ColumnType::text) throw_type_error("column '" + name + "' has dtype object, cannot use method");
    cols.push_back(&c);
  }
  auto rows = sort_rows(cols, std::vector<bool>(by.size(), !largest), f->data.row_count());
  std::vector<std::size_t> kept;
  for (std::size_t r : rows) {
    if (kept.size() >= n) break;
    bool missing = false;
    for (const Column* c : cols) missing = missing || c->is_missing(r);
    if (!missing) kept.push_back(r);
  }
  return Value(new_frame(f->data.take_rows(kept)));
}

Value frame_groupby(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.groupby", a, {"by", "as_index", "sort", "dropna"}, 1);
  interp.check_interrupts();
  auto g = std::make_shared<GroupByObject>();
  g->keys = string_list(args.get(0), "by");
  for (const auto& k : g->keys) require_column(f->data, k);
  g->data = f->data;
  return Value(g);
}

Value frame_dropna(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.dropna", a, {"subset", "how", "inplace"});
  interp.check_interrupts();
  std::vector<const Column*> cols;
  if (args.has(0) && !args.get(0).is_none()) {
    for (const auto& name : string_list(args.get(0), "subset")) cols.push_back(&require_column(f->data, name));
  } else {
    for (const auto& c : f->data.columns()) cols.push_back(&c);
  }
  const std::string how = args.has(1) ? str(args.get(1)) : "any";
  if (how != "any" && how != "all") throw_value_error("invalid how option: " + how);
  std::vector<std::size_t> rows;
  for (std::size_t r = 0; r < f->data.row_count(); ++r) {
    poll(interp, r);
    std::size_t missing = 0;
    for (const Column* c : cols) missing += c->is_missing(r) ? 1 : 0;
    const bool drop = how == "any" ? missing > 0 : (!cols.empty() && missing == cols.size());
    if (!drop) rows.push_back(r);
  }
  return frame_result(f, f->data.take_rows(rows), truthy(args.get_or(2, Value(false))));
}

Value frame_fillna(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.fillna", a, {"value", "inplace"}, 1);
  const Value& fill = args.get(0);
  auto per_column = fill.as<DictObject>();
  Dataset out;
  std::vector<Column> cols;
  for (const auto& c : f->data.columns()) {
    interp.check_interrupts();
    const Value* value = &fill;
    if (per_column) {
      value = per_column->find(Value(c.name));
      if (value == nullptr) {
        cols.push_back(c);
        continue;
      }
    }
    std::vector<Value> values;
    values.reserve(c.size());
    for (std::size_t r = 0; r < c.size(); ++r) values.push_back(c.is_missing(r) ? *value : cell(c, r));
    cols.push_back(column_from_values(interp, c.name, values));
  }
  return frame_result(f, Dataset(std::move(cols)), truthy(args.get_or(1, Value(false))));
}

Value frame_rename(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.rename", a, {"columns", "inplace"}, 1);
  interp.check_interrupts();
  auto mapping = args.get(0).as<DictObject>();
  if (!mapping) throw_type_error("rename() expects columns={old: new}");
  Dataset out = f->data;
  for (const auto& [from, to] : mapping->entries()) {
    if (!from.is_str() || !to.is_str()) throw_type_error("column names must be strings");
    try {
      out.rename_column(from.as_str(), to.as_str());
    } catch (const DatasetError& e) {
      throw_value_error(e.what());
    }
  }
  return frame_result(f, std::move(out), truthy(args.get_or(1, Value(false))));
}

Value frame_drop(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.drop", a, {"labels", "axis", "columns", "inplace"});
  interp.check_interrupts();
  std::vector<std::string> names;
  if (args.has(2)) {
    names = string_list(args.get(2), "columns");
  } else if (args.has(0)) {
    const Value axis = args.get_or(1, Value(0));
    if (!(axis.is_int() && axis.as_int() == 1) && !(axis.is_str() && axis.as_str() == "columns")) {
      throw_value_error("drop() supports columns only; pass columns=[...] or axis=1");
    }
    names = string_list(args.get(0), "labels");
  } else {
    throw_type_error("drop() needs labels or columns");
  }
  Dataset out = f->data;
  for (const auto& name : names) {
    if (!out.remove_column(name)) throw ScriptError("KeyError", "[" + repr(Value(name)) + "] not found in axis");
  }
  return frame_result(f, std::move(out), truthy(args.get_or(3, Value(false))));
}

Value frame_value_counts(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.value_counts", a, {"subset"});
  std::vector<std::string> names =
      args.has(0) ? string_list(args.get(0), "subset") : f->data.column_names();
  auto g = std::make_shared<GroupByObject>();
  g->keys = names;
  g->data = f->data;
  const auto groups = build_groups(interp, g->data, g->keys);
  std::vector<std::size_t> order = all_rows(groups.size());
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t x, std::size_t y) { return groups[x].rows.size() > groups[y].rows.size(); });
  std::vector<std::size_t> firsts;
  std::vector<double> counts;
  for (std::size_t i : order) {
    firsts.push_back(groups[i].rows.front());
    counts.push_back(static_cast<double>(groups[i].rows.size()));
  }
  std::vector<Column> cols;
  for (const auto& name : names) cols.push_back(require_column(f->data, name).take(firsts));
  cols.push_back(Column::numeric("count", std::move(counts)));
  return Value(new_frame(Dataset(std::move(cols))));
}

Value frame_records(Interpreter& interp, const FramePtr& f) {
  std::vector<Value> out;
  for (std::size_t r = 0; r < f->data.row_count(); ++r) {
    poll(interp, r);
    auto row = interp.new_dict();
    for (const auto& c : f->data.columns()) row->set(Value(c.name), cell(c, r));
    out.push_back(Value(row));
  }
  interp.check_size(out.size());
  return Value(interp.new_list(std::move(out)));
}

Value frame_to_dict(Interpreter& interp, const FramePtr& f, CallArgs& a) {
  ArgBinder args("DataFrame.to_dict", a, {"orient"});
  const std::string orient = args.has(0) ? str(args.get(0)) : "list";
  if (orient == "records") return frame_records(interp, f);
  if (orient != "list") throw_value_error("orient must be 'list' or 'records'");
  auto out = interp.new_dict();
  for (const auto& c : f->data.columns()) {
    std::vector<Value> values;
    for (std::size_t r = 0; r < c.size(); ++r) values.push_back(cell(c, r));
    out->set(Value(c.name), Value(interp.new_list(std::move(values))));
  }
  return Value(out);
}

const std::map<std::string, FrameMethod>& frame_methods() {
  static const std::map<std::string, FrameMethod> kMethods = {
      {"head", [](Interpreter&, const FramePtr& f, CallArgs& a) { return frame_head_tail(f, a, true); }},
      {"tail", [](Interpreter&, const FramePtr& f, CallArgs& a) { return frame_head_tail(f, a, false); }},
      {"mean", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "mean"); }},
      {"sum", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "sum"); }},
      {"min", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "min"); }},
      {"max", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "max"); }},
      {"median",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "median"); }},
      {"std", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "std"); }},
      {"var", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "var"); }},
      {"count",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "count"); }},
      {"nunique",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_reduce_method(in, f, a, "nunique"); }},
      {"describe",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) {
         ArgBinder("DataFrame.describe", a, {});
         return frame_describe(in, *f);
       }},
      {"sort_values", frame_sort_values},
      {"groupby", frame_groupby},
      {"nlargest", [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_extreme_rows(in, f, a, true); }},
      {"nsmallest",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) { return frame_extreme_rows(in, f, a, false); }},
      {"dropna", frame_dropna},
      {"fillna", frame_fillna},
      {"rename", frame_rename},
      {"drop", frame_drop},
      {"copy",
       [](Interpreter&, const FramePtr& f, CallArgs& a) {
         ArgBinder("DataFrame.copy", a, {"deep"});
         return Value(new_frame(f->data));
       }},
      // Frames carry no index of their own, so this only honours inplace.
      {"reset_index",
       [](Interpreter&, const FramePtr& f, CallArgs& a) {
         ArgBinder args("DataFrame.reset_index", a, {"drop", "inplace"});
         return frame_result(f, f->data, truthy(args.get_or(1, Value(false))));
       }},
      {"value_counts", frame_value_counts},
      {"to_records",
       [](Interpreter& in, const FramePtr& f, CallArgs& a) {
         ArgBinder("DataFrame.to_records", a, {});
         return frame_records(in, f);
       }},
      {"to_dict", frame_to_dict},
  };
  return kMethods;
}

// -- groupby methods --------------------------------------------------------

Value group_method(Interpreter& interp, const GroupPtr& g, CallArgs& a, const std::string& how) {
  ArgBinder("DataFrameGroupBy." + how, a, {"numeric_only"});
  if (how == "size") return group_size(interp, *g);
  return group_reduce(interp, *g, how);
}

}  // namespace

// ---------------------------------------------------------------------------
// stats
// ---------------------------------------------------------------------------

namespace stats {

double sum(const std::vector<double>& v) {
  double s = 0.0;
  for (double d : v) s += d;
  return s;
}

double mean(const std::vector<double>& v) { return v.empty() ? nan_value() : sum(v) / static_cast<double>(v.size()); }

double variance(const std::vector<double>& v, int ddof) {
  if (ddof < 0 || v.size() <= static_cast<std::size_t>(ddof)) return nan_value();
  const double m = mean(v);
  double acc = 0.0;
  for (double d : v) acc += (d - m) * (d - m);
  return acc / static_cast<double>(v.size() - static_cast<std::size_t>(ddof));
}

double stddev(const std::vector<double>& v, int ddof) { return std::sqrt(variance(v, ddof)); }

double min(const std::vector<double>& v) {
  if (v.empty()) return nan_value();
  return *std::min_element(v.begin(), v.end());
}

double max(const std::vector<double>& v) {
  if (v.empty()) return nan_value();
  return *std::max_element(v.begin(), v.end());
}

double quantile(std::vector<double> v, double q) {
  if (!(q >= 0.0 && q <= 1.0)) throw_value_error("quantiles must be in the range [0, 1]");
  if (v.empty()) return nan_value();
  std::sort(v.begin(), v.end());
  const double pos = q * static_cast<double>(v.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = static_cast<std::size_t>(std::ceil(pos));
  return v[lo] + (v[hi] - v[lo]) * (pos - static_cast<double>(lo));
}

double median(std::vector<double> v) { return quantile(std::move(v), 0.5); }

}  // namespace stats

// ---------------------------------------------------------------------------
// SeriesObject
// ---------------------------------------------------------------------------

Value SeriesObject::at(std::size_t row) const { return cell(data, row); }

Value SeriesObject::label(std::size_t row) const {
  if (index) return cell(*index, row);
  return Value(static_cast<std::int64_t>(row));
}

bool SeriesObject::truthy() const {
  throw_value_error("The truth value of a Series is ambiguous. Use a.empty, a.any() or a.all().");
}

std::string SeriesObject::repr(int) const {
  bool elided = false;
  const auto rows = shown_rows(size(), elided);
  std::vector<std::vector<std::string>> lines;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (elided && i == kReprRows / 2) lines.push_back({"...", "..."});
    const std::size_t r = rows[i];
    lines.push_back({index ? cell_text(*index, r) : std::to_string(r), cell_text(data, r)});
  }
  std::vector<std::size_t> widths = {0, 0};
  for (const auto& l : lines) {
    widths[0] = std::max(widths[0], l[0].size());
    widths[1] = std::max(widths[1], l[1].size());
  }
  std::string out;
  for (const auto& l : lines) {
    out += l[0] + std::string(widths[0] - l[0].size() + 4, ' ') + std::string(widths[1] - l[1].size(), ' ') + l[1] +
           "\n";
  }
  if (!data.name.empty()) out += "Name: " + data.name + ", ";
  out += (elided ? "Length: " + std::to_string(size()) + ", " : "") + "dtype: " + dtype_name(data);
  return out;
}

std::optional<jsonlite::Value> SeriesObject::to_json(int) const {
  jsonlite::Array columns;
  if (index) columns.emplace_back(index->name.empty() ? "index" : index->name);
  columns.emplace_back(data.name.empty() ? "value" : data.name);
  jsonlite::Array rows;
  rows.reserve(size());
  for (std::size_t r = 0; r < size(); ++r) {
    jsonlite::Array row;
    if (index) row.push_back(cell_json(*index, r));
    row.push_back(cell_json(data, r));
    rows.emplace_back(std::move(row));
  }
  jsonlite::Object o;
  o["columns"] = std::move(columns);
  o["rows"] = std::move(rows);
  return jsonlite::Value(std::move(o));
}

std::optional<Value> SeriesObject::attribute(Interpreter&, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<SeriesObject>(self);
  if (name == "name") return data.name.empty() ? Value() : Value(data.name);
  if (name == "size") return Value(static_cast<std::int64_t>(size()));
  if (name == "shape") return Value(make_tuple({Value(static_cast<std::int64_t>(size()))}));
  if (name == "empty") return Value(size() == 0);
  if (name == "dtype") return Value(dtype_name(data));
  const auto& methods = series_methods();
  auto it = methods.find(name);
  if (it != methods.end()) {
    SeriesMethod fn = it->second;
    return Value(make_native("Series." + name, [me, fn](Interpreter& in, CallArgs& a) { return fn(in, me, a); }));
  }
  if (name == "index" || name == "values") {
    return Value(make_native("Series." + name, [](Interpreter&, CallArgs&) -> Value {
      throw_type_error("use .tolist() or .reset_index() instead of attribute access");
    }));
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// FrameObject
// ---------------------------------------------------------------------------

bool FrameObject::truthy() const {
  throw_value_error("The truth value of a DataFrame is ambiguous. Use a.empty.");
}

std::string FrameObject::repr(int) const {
  if (data.col_count() == 0) return "Empty DataFrame\nColumns: []\nIndex: []";
  bool elided = false;
  const auto rows = shown_rows(data.row_count(), elided);
  std::vector<std::string> headers = {""};
  for (const auto& c : data.columns()) headers.push_back(c.name);
  std::vector<std::vector<std::string>> lines;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (elided && i == kReprRows / 2) lines.emplace_back(headers.size(), "...");
    std::vector<std::string> line = {std::to_string(rows[i])};
    for (const auto& c : data.columns()) line.push_back(cell_text(c, rows[i]));
    lines.push_back(std::move(line));
  }
  const std::string footer = elided ? "\n[" + std::to_string(data.row_count()) + " rows x " +
                                          std::to_string(data.col_count()) + " columns]"
                                    : "";
  return render_table(headers, lines, footer);
}

std::optional<jsonlite::Value> FrameObject::to_json(int) const {
  jsonlite::Array columns;
  for (const auto& c : data.columns()) columns.emplace_back(c.name);
  jsonlite::Array rows;
  rows.reserve(data.row_count());
  for (std::size_t r = 0; r < data.row_count(); ++r) {
    jsonlite::Array row;
    row.reserve(data.col_count());
    for (const auto& c : data.columns()) row.push_back(cell_json(c, r));
    rows.emplace_back(std::move(row));
  }
  jsonlite::Object o;
  o["columns"] = std::move(columns);
  o["rows"] = std::move(rows);
  return jsonlite::Value(std::move(o));
}

std::optional<Value> FrameObject::attribute(Interpreter& interp, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<FrameObject>(self);
  if (name == "columns") {
    std::vector<Value> names;
    for (const auto& c : data.columns()) names.push_back(Value(c.name));
    return Value(interp.new_list(std::move(names)));
  }
  if (name == "shape") {
    return Value(make_tuple({Value(static_cast<std::int64_t>(data.row_count())),
                             Value(static_cast<std::int64_t>(data.col_count()))}));
  }
  if (name == "empty") return Value(data.row_count() == 0 || data.col_count() == 0);
  if (name == "size") return Value(static_cast<std::int64_t>(data.row_count() * data.col_count()));
  if (name == "dtypes") {
    auto d = interp.new_dict();
    for (const auto& c : data.columns()) d->set(Value(c.name), Value(dtype_name(c)));
    return Value(d);
  }
  const auto& methods = frame_methods();
  auto it = methods.find(name);
  if (it != methods.end()) {
    FrameMethod fn = it->second;
    return Value(make_native("DataFrame." + name, [me, fn](Interpreter& in, CallArgs& a) { return fn(in, me, a); }));
  }
  // Column access as an attribute: frame.sales
  if (const Column* c = data.column(name)) return Value(new_series(*c));
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// GroupByObject
// ---------------------------------------------------------------------------

std::optional<Value> GroupByObject::attribute(Interpreter&, const ObjectPtr& self, const std::string& name) {
  auto me = std::static_pointer_cast<GroupByObject>(self);
  static const std::set<std::string> kReductions = {"sum", "mean", "min", "max", "count", "median",
                                                    "std", "var", "nunique", "first", "last", "size"};
  if (kReductions.count(name) != 0) {
    return Value(make_native("DataFrameGroupBy." + name,
                             [me, name](Interpreter& in, CallArgs& a) { return group_method(in, me, a, name); }));
  }
  if (name == "agg" || name == "aggregate") {
    return Value(make_native("DataFrameGroupBy." + name, [me, name](Interpreter& in, CallArgs& a) {
      ArgBinder args("DataFrameGroupBy." + name, a, {"func"}, 1);
      return group_agg(in, *me, args.get(0));
    }));
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Operators and item access
// ---------------------------------------------------------------------------

bool is_tabular(const Value& value) {
  return value.as<SeriesObject>() != nullptr || value.as<FrameObject>() != nullptr ||
         value.as<GroupByObject>() != nullptr;
}

Value tabular_binary_op(Interpreter& interp, const std::string& op, const Value& a, const Value& b) {
  OperandPair p = bind_operands(op, a, b);
  const std::size_t n = p.n;

  if (op == "&" || op == "|" || op == "^") {
    if (!p.left.is_bool() || !p.right.is_bool()) {
      throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) +
                       "'");
    }
    std::vector<std::uint8_t> out(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
      poll(interp, i);
      if (p.left.missing(i) || p.right.missing(i)) continue;
      const bool x = p.left.flag(i);
      const bool y = p.right.flag(i);
      out[i] = (op == "&" ? (x && y) : op == "|" ? (x || y) : (x != y)) ? 1 : 0;
    }
    return Value(new_series(Column::boolean(p.name, std::move(out)), std::move(p.index)));
  }

  if (p.left.is_text() || p.right.is_text()) {
    if (op != "+" || !p.left.is_text() || !p.right.is_text()) {
      throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) +
                       "'");
    }
    std::vector<std::string> out(n);
    MissingMask missing(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
      poll(interp, i);
      if (p.left.missing(i) || p.right.missing(i)) {
        missing[i] = 1;
        continue;
      }
      out[i] = p.left.text(i) + p.right.text(i);
      interp.check_size(out[i].size(), "string");
    }
    Column c = Column::text(p.name, std::move(out));
    c.missing = std::move(missing);
    return Value(new_series(std::move(c), std::move(p.index)));
  }

  std::vector<double> out(n, nan_value());
  for (std::size_t i = 0; i < n; ++i) {
    poll(interp, i);
    if (p.left.missing(i) || p.right.missing(i)) continue;
    const double x = p.left.number(i);
    const double y = p.right.number(i);
    double r;
    if (op == "+") r = x + y;
    else if (op == "-") r = x - y;
    else if (op == "*") r = x * y;
    else if (op == "/") r = x / y;
    else if (op == "//") r = y == 0.0 ? nan_value() : std::floor(x / y);
    else if (op == "%") r = floored_mod(x, y);
    else if (op == "**") r = std::pow(x, y);
    else throw_type_error("unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" + type_name(b) + "'");
    out[i] = r;
  }
  return Value(new_series(Column::numeric(p.name, std::move(out)), std::move(p.index)));
}

Value tabular_compare_op(Interpreter& interp, const std::string& op, const Value& a, const Value& b) {
  OperandPair p = bind_operands(op, a, b);
  const std::size_t n = p.n;
  const bool text = p.left.is_text() || p.right.is_text();
  if (text && !(p.left.is_text() && p.right.is_text())) {
    // Mixed text/number comparison: only equality is meaningful.
    if (op != "==" && op != "!=") {
      throw_type_error("'" + op + "' not supported between text and numeric values");
    }
    std::vector<std::uint8_t> out(n, op == "!=" ? 1 : 0);
    return Value(new_series(Column::boolean(p.name, std::move(out)), std::move(p.index)));
  }
  std::vector<std::uint8_t> out(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    poll(interp, i);
    if (p.left.missing(i) || p.right.missing(i)) {
      out[i] = op == "!=" ? 1 : 0;
      continue;
    }
    int cmp;
    if (text) {
      const int c = p.left.text(i).compare(p.right.text(i));
      cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
    } else {
      const double x = p.left.number(i);
      const double y = p.right.number(i);
      if (std::isnan(x) || std::isnan(y)) {
        out[i] = op == "!=" ? 1 : 0;
        continue;
      }
      cmp = x < y ? -1 : (x > y ? 1 : 0);
    }
    bool r = false;
    if (op == "==") r = cmp == 0;
    else if (op == "!=") r = cmp != 0;
    else if (op == "<") r = cmp < 0;
    else if (op == "<=") r = cmp <= 0;
    else if (op == ">") r = cmp > 0;
    else if (op == ">=") r = cmp >= 0;
    out[i] = r ? 1 : 0;
  }
  return Value(new_series(Column::boolean(p.name, std::move(out)), std::move(p.index)));
}

Value tabular_unary_op(Interpreter& interp, const std::string& op, const Value& a) {
  auto s = a.as<SeriesObject>();
  if (!s) throw_type_error("bad operand type for unary " + op + ": '" + type_name(a) + "'");
  if (op == "~") {
    if (s->data.type != ColumnType::boolean) throw_type_error("bad operand type for unary ~: non-boolean Series");
    Column c = s->data;
    for (std::size_t r = 0; r < c.size(); ++r) {
      poll(interp, r);
      c.flags()[r] = c.flags()[r] ? 0 : 1;
    }
    return Value(new_series(std::move(c), s->index));
  }
  if (op == "-" || op == "+") {
    Column c = numeric_like(*s, "unary " + op);
    if (op == "-") {
      for (std::size_t r = 0; r < c.size(); ++r) {
        poll(interp, r);
        c.numbers()[r] = -c.numbers()[r];
      }
    }
    return Value(new_series(std::move(c), s->index));
  }
  throw_type_error("bad operand type for unary " + op + ": 'Series'");
}

Value frame_get_item(Interpreter& interp, const FrameObject& frame, const Value& key) {
  const Dataset& d = frame.data;
  if (key.is_str()) return Value(new_series(require_column(d, key.as_str())));
  if (key.as<ListObject>() || key.as<TupleObject>()) {
    std::vector<Column> cols;
    for (const auto& name : string_list(key, "column selection")) cols.push_back(require_column(d, name));
    return Value(new_frame(Dataset(std::move(cols))));
  }
  if (auto mask = key.as<SeriesObject>()) {
    if (mask->data.type != ColumnType::boolean) throw ScriptError("KeyError", "row filter must be a boolean Series");
    if (mask->size() != d.row_count()) {
      throw_value_error("Item wrong length " + std::to_string(mask->size()) + " instead of " +
                        std::to_string(d.row_count()));
    }
    std::vector<std::size_t> rows;
    for (std::size_t r = 0; r < mask->size(); ++r) {
      poll(interp, r);
      if (!mask->data.is_missing(r) && mask->data.flags()[r]) rows.push_back(r);
    }
    return Value(new_frame(d.take_rows(rows)));
  }
  if (auto slice = key.as<SliceObject>()) {
    std::vector<std::size_t> rows;
    for (std::int64_t r : slice->resolve(static_cast<std::int64_t>(d.row_count()))) {
      rows.push_back(static_cast<std::size_t>(r));
    }
    return Value(new_frame(d.take_rows(rows)));
  }
  throw ScriptError("KeyError", repr(key));
}

void frame_set_item(Interpreter& interp, FrameObject& frame, const Value& key, const Value& value) {
  if (!key.is_str()) throw_type_error("column names must be strings");
  const std::string& name = key.as_str();
  const std::size_t rows = frame.data.row_count();
  Column column;
  if (auto s = value.as<SeriesObject>()) {
    column = s->data;
  } else if (value.as<ListObject>() || value.as<TupleObject>() || value.as<RangeObject>()) {
    column = column_from_values(interp, name, interp.to_vector(value));
  } else if (value.is_number() || value.is_str() || value.is_none()) {
    const std::size_t n = frame.data.col_count() == 0 ? 1 : rows;
    interp.check_size(n);
    column = column_from_values(interp, name, std::vector<Value>(n, value));
  } else {
    throw_type_error("cannot assign a value of type '" + type_name(value) + "' to a column");
  }
  column.name = name;
  try {
    frame.data.set_column(std::move(column));
  } catch (const DatasetError& e) {
    throw_value_error(std::string(e.what()).substr(std::string("Dataset Error: ").size()));
  }
}

void frame_delete_item(FrameObject& frame, const Value& key) {
  if (!key.is_str()) throw_type_error("column names must be strings");
  if (!frame.data.remove_column(key.as_str())) throw ScriptError("KeyError", repr(key));
}

Value series_get_item(Interpreter& interp, const SeriesObject& series, const Value& key) {
  if (auto mask = key.as<SeriesObject>()) {
    if (mask->data.type != ColumnType::boolean) throw ScriptError("KeyError", "filter must be a boolean Series");
    if (mask->size() != series.size()) throw_value_error("boolean index has wrong length");
    std::vector<std::size_t> rows;
    for (std::size_t r = 0; r < mask->size(); ++r) {
      poll(interp, r);
      if (!mask->data.is_missing(r) && mask->data.flags()[r]) rows.push_back(r);
    }
    return Value(series_take(series, rows));
  }
  if (auto slice = key.as<SliceObject>()) {
    std::vector<std::size_t> rows;
    for (std::int64_t r : slice->resolve(static_cast<std::int64_t>(series.size()))) {
      rows.push_back(static_cast<std::size_t>(r));
    }
    return Value(series_take(series, rows));
  }
  if (series.index) {
    const std::string wanted = hash_key(key);
    for (std::size_t r = 0; r < series.size(); ++r) {
      if (!series.index->is_missing(r) && cell_key(*series.index, r) == wanted) return series.at(r);
    }
    throw ScriptError("KeyError", repr(key));
  }
  if (key.is_int()) {
    std::int64_t i = key.as_int();
    if (i < 0 || static_cast<std::size_t>(i) >= series.size()) throw ScriptError("KeyError", repr(key));
    return series.at(static_cast<std::size_t>(i));
  }
  throw ScriptError("KeyError", repr(key));
}

Value groupby_get_item(const GroupByObject& group, const Value& key) {
  auto g = std::make_shared<GroupByObject>();
  g->data = group.data;
  g->keys = group.keys;
  g->single_selection = key.is_str();
  g->selection = string_list(key, "column selection");
  for (const auto& name : g->selection) require_column(g->data, name);
  return Value(g);
}

// ---------------------------------------------------------------------------
// Construction helpers
// ---------------------------------------------------------------------------

Column column_from_values(Interpreter& interp, const std::string& name, const std::vector<Value>& values) {
  interp.check_size(values.size());
  bool all_bool = true;
  bool all_numeric = true;
  bool any_value = false;
  for (const auto& v : values) {
    if (v.is_none()) continue;
    if (v.is_float() && std::isnan(v.as_float())) continue;
    any_value = true;
    if (!v.is_bool()) all_bool = false;
    if (!v.is_number()) all_numeric = false;
  }
  const std::size_t n = values.size();
  if (!any_value || (all_numeric && !all_bool)) {
    std::vector<double> out(n, nan_value());
    for (std::size_t i = 0; i < n; ++i) {
      poll(interp, i);
      if (!values[i].is_none()) out[i] = to_double(values[i], "");
    }
    return Column::numeric(name, std::move(out));
  }
  if (all_bool) {
    std::vector<std::uint8_t> out(n, 0);
    MissingMask missing(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
      if (values[i].is_bool()) out[i] = values[i].as_bool() ? 1 : 0;
      else missing[i] = 1;
    }
    Column c = Column::boolean(name, std::move(out));
    c.missing = std::move(missing);
    return c;
  }
  std::vector<std::string> out(n);
  MissingMask missing(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    poll(interp, i);
    const Value& v = values[i];
    if (v.is_none() || (v.is_float() && std::isnan(v.as_float()))) {
      missing[i] = 1;
      continue;
    }
    out[i] = str(v);
  }
  Column c = Column::text(name, std::move(out));
  c.missing = std::move(missing);
  return c;
}

std::vector<double> numeric_values(Interpreter& interp, const Value& value, bool skip_missing) {
  if (value.is_number()) return {to_double(value, "")};
  if (auto s = value.as<SeriesObject>()) {
    if (s->data.type == ColumnType::text) throw_type_error("could not convert string to float");
    if (skip_missing) return column_numbers(s->data, all_rows(s->size()));
    std::vector<double> out(s->size());
    for (std::size_t r = 0; r < s->size(); ++r) {
      out[r] = s->data.is_missing(r) ? nan_value()
                                     : (s->data.type == ColumnType::numeric ? s->data.numbers()[r]
                                                                            : (s->data.flags()[r] ? 1.0 : 0.0));
    }
    return out;
  }
  if (value.as<FrameObject>()) throw_type_error("expected a Series or list, got 'DataFrame'");
  std::vector<double> out;
  std::size_t i = 0;
  interp.for_each(value, [&](const Value& v) {
    poll(interp, i++);
    out.push_back(to_double(v, "expected numeric values"));
    return true;
  });
  return out;
}

Value make_frame(Interpreter& interp, const Value& source, const Value& columns) {
  interp.check_interrupts();
  if (source.is_none()) return Value(new_frame(Dataset()));
  if (auto f = source.as<FrameObject>()) return Value(new_frame(f->data));
  std::vector<Column> cols;
  try {
    if (auto d = source.as<DictObject>()) {
      std::size_t length = 0;
      bool have_length = false;
      for (const auto& [k, v] : d->entries()) {
        if (v.as<ListObject>() || v.as<TupleObject>() || v.as<SeriesObject>() || v.as<RangeObject>()) {
          const std::size_t n = interp.to_vector(v).size();
          if (have_length && n != length) throw_value_error("All arrays must be of the same length");
          length = n;
          have_length = true;
        }
      }
      if (!have_length) length = d->size() == 0 ? 0 : 1;
      for (const auto& [k, v] : d->entries()) {
        const std::string name = str(k);
        if (auto s = v.as<SeriesObject>()) {
          Column c = s->data;
          c.name = name;
          cols.push_back(std::move(c));
        } else if (v.as<ListObject>() || v.as<TupleObject>() || v.as<RangeObject>()) {
          cols.push_back(column_from_values(interp, name, interp.to_vector(v)));
        } else {
          cols.push_back(column_from_values(interp, name, std::vector<Value>(length, v)));
        }
      }
      return Value(new_frame(Dataset(std::move(cols))));
    }
    const std::vector<Value> rows = interp.to_vector(source);
    std::vector<std::string> names;
    if (!columns.is_none()) names = string_list(columns, "columns");
    if (!rows.empty() && rows.front().as<DictObject>()) {
      // Records: union of keys in first-seen order.
      std::vector<Value> key_order;
      std::set<std::string> seen;
      for (const auto& row : rows) {
        auto rd = row.as<DictObject>();
        if (!rd) throw_type_error("records must all be dicts");
        for (const auto& [k, v] : rd->entries()) {
          if (seen.insert(hash_key(k)).second) key_order.push_back(k);
        }
      }
      for (const auto& k : key_order) {
        std::vector<Value> values;
        values.reserve(rows.size());
        for (const auto& row : rows) {
          const Value* v = row.as<DictObject>()->find(k);
          values.push_back(v ? *v : Value());
        }
        cols.push_back(column_from_values(interp, str(k), values));
      }
      return Value(new_frame(Dataset(std::move(cols))));
    }
    // Rows as sequences.
    std::size_t width = names.size();
    std::vector<std::vector<Value>> cells;
    for (const auto& row : rows) {
      cells.push_back(interp.to_vector(row));
      if (names.empty() && cells.size() == 1) width = cells.back().size();
      if (cells.back().size() != width) throw_value_error("rows must all have " + std::to_string(width) + " values");
    }
    if (names.empty()) {
      for (std::size_t c = 0; c < width; ++c) names.push_back(std::to_string(c));
    }
    for (std::size_t c = 0; c < width; ++c) {
      std::vector<Value> values;
      for (const auto& row : cells) values.push_back(row[c]);
      cols.push_back(column_from_values(interp, names[c], values));
    }
    return Value(new_frame(Dataset(std::move(cols))));
  } catch (const DatasetError& e) {
    throw_value_error(std::string(e.what()).substr(std::string("Dataset Error: ").size()));
  }
}

Value make_series(Interpreter& interp, const Value& source, const std::string& name) {
  interp.check_interrupts();
  if (auto s = source.as<SeriesObject>()) {
    Column c = s->data;
    if (!name.empty()) c.name = name;
    return Value(new_series(std::move(c), s->index));
  }
  if (auto d = source.as<DictObject>()) {
    std::vector<Value> keys;
    std::vector<Value> values;
    for (const auto& [k, v] : d->entries()) {
      keys.push_back(k);
      values.push_back(v);
    }
    return Value(new_series(column_from_values(interp, name, values), column_from_values(interp, "", keys)));
  }
  if (source.is_number() || source.is_str() || source.is_none()) {
    return Value(new_series(column_from_values(interp, name, {source})));
  }
  return Value(new_series(column_from_values(interp, name, interp.to_vector(source))));
}

Value concat_tables(Interpreter& interp, const Value& items) {
  const std::vector<Value> parts = interp.to_vector(items);
  if (parts.empty()) throw_value_error("No objects to concatenate");
  if (parts.front().as<SeriesObject>()) {
    std::vector<Value> values;
    std::string name;
    for (std::size_t i = 0; i < parts.size(); ++i) {
      auto s = parts[i].as<SeriesObject>();
      if (!s) throw_type_error("cannot concatenate a Series with '" + type_name(parts[i]) + "'");
      if (i == 0) name = s->data.name;
      else if (s->data.name != name) name.clear();
      for (std::size_t r = 0; r < s->size(); ++r) values.push_back(s->at(r));
    }
    return Value(new_series(column_from_values(interp, name, values)));
  }
  std::vector<std::string> names;
  for (const auto& p : parts) {
    auto f = p.as<FrameObject>();
    if (!f) throw_type_error("cannot concatenate a DataFrame with '" + type_name(p) + "'");
    for (const auto& n : f->data.column_names()) {
      if (std::find(names.begin(), names.end(), n) == names.end()) names.push_back(n);
    }
  }
  std::vector<Column> cols;
  for (const auto& n : names) {
    std::vector<Value> values;
    for (const auto& p : parts) {
      const auto f = p.as<FrameObject>();
      const Column* c = f->data.column(n);
      for (std::size_t r = 0; r < f->data.row_count(); ++r) {
        poll(interp, values.size());
        values.push_back(c ? cell(*c, r) : Value());
      }
    }
    cols.push_back(column_from_values(interp, n, values));
  }
  return Value(new_frame(Dataset(std::move(cols))));
}

Value to_numeric(Interpreter& interp, const Value& value, const std::string& errors) {
  if (errors != "raise" && errors != "coerce") throw_value_error("errors must be 'raise' or 'coerce'");
  auto convert = [&](const Value& v) -> Value {
    if (v.is_none()) return Value(nan_value());
    if (v.is_number()) return Value(to_double(v, ""));
    if (v.is_str()) {
      const std::string& text = v.as_str();
      char* end = nullptr;
      const double d = std::strtod(text.c_str(), &end);
      if (!text.empty() && end != nullptr && *end == '\0') return Value(d);
      if (errors == "coerce") return Value(nan_value());
      throw_value_error("Unable to parse string " + repr(v));
    }
    if (errors == "coerce") return Value(nan_value());
    throw_type_error("Invalid object type for to_numeric: '" + type_name(v) + "'");
  };
  if (auto s = value.as<SeriesObject>()) {
    std::vector<double> out(s->size(), nan_value());
    for (std::size_t r = 0; r < s->size(); ++r) {
      poll(interp, r);
      if (!s->data.is_missing(r)) out[r] = convert(s->at(r)).as_float();
    }
    return Value(new_series(Column::numeric(s->data.name, std::move(out)), s->index));
  }
  if (value.as<ListObject>() || value.as<TupleObject>()) {
    std::vector<Value> out;
    for (const auto& v : interp.to_vector(value)) out.push_back(convert(v));
    return Value(interp.new_list(std::move(out)));
  }
  return convert(value);
}

Value map_numeric(Interpreter& interp, const Value& value, double (*fn)(double), const char* name) {
  if (value.is_number()) return Value(fn(to_double(value, std::string(name) + "() expects a number")));
  if (auto s = value.as<SeriesObject>()) {
    Column c = numeric_like(*s, std::string(name) + "()");
    for (std::size_t r = 0; r < c.size(); ++r) {
      poll(interp, r);
      if (!c.is_missing(r)) c.numbers()[r] = fn(c.numbers()[r]);
    }
    // Recompute the mask: a transform may produce NaN (log of a negative).
    for (std::size_t r = 0; r < c.size(); ++r) c.missing[r] = std::isnan(c.numbers()[r]) ? 1 : 0;
    return Value(new_series(std::move(c), s->index));
  }
  std::vector<Value> out;
  std::size_t i = 0;
  interp.for_each(value, [&](const Value& v) {
    poll(interp, i++);
    out.push_back(Value(fn(to_double(v, std::string(name) + "() expects numbers"))));
    return true;
  });
  return Value(interp.new_list(std::move(out)));
}

}  // namespace cordon
