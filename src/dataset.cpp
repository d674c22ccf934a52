#include "cordon/dataset.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <unordered_set>

#include "cordon/hash.hpp"

namespace cordon {

namespace {

std::string trim_unquoted(const std::string& value) {
  const size_t start = value.find_first_not_of(" \t");
  if (start == std::string::npos) return "";
  const size_t end = value.find_last_not_of(" \t");
  return value.substr(start, end - start + 1);
}

// RFC 4180 record splitter over an in-memory document. Quoted fields may
// contain delimiters, doubled quotes and newlines.
std::vector<std::vector<std::string>> split_records(const std::string& text, char delimiter) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool field_quoted = false;
  size_t i = 0;
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    i = 3;
  }

  auto push_field = [&]() {
    row.push_back(field_quoted ? field : trim_unquoted(field));
    field.clear();
    field_quoted = false;
  };
  auto push_row = [&]() {
    push_field();
    if (!(row.size() == 1 && row[0].empty())) records.push_back(std::move(row));
    row.clear();
  };

  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }
    if (c == '"' && trim_unquoted(field).empty()) {
      field.clear();
      in_quotes = true;
      field_quoted = true;
    } else if (c == delimiter) {
      push_field();
    } else if (c == '\n') {
      push_row();
    } else if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      push_row();
    } else {
      field += c;
    }
  }
  if (in_quotes) throw DatasetError("unterminated quoted field");
  if (!field.empty() || !row.empty()) push_row();
  return records;
}

bool parse_number(const std::string& v, double& out) {
  if (v.empty()) return false;
  const char* begin = v.c_str();
  char* end = nullptr;
  const double d = std::strtod(begin, &end);
  if (end == begin || *end != '\0') return false;
  out = d;
  return true;
}

bool parse_flag(const std::string& v, std::uint8_t& out) {
  if (v == "true" || v == "True" || v == "TRUE") { out = 1; return true; }
  if (v == "false" || v == "False" || v == "FALSE") { out = 0; return true; }
  return false;
}

}  // namespace

std::string to_string(ColumnType type) {
  switch (type) {
    case ColumnType::numeric: return "numeric";
    case ColumnType::text: return "text";
    case ColumnType::boolean: return "boolean";
  }
  return "text";
}

Column Column::numeric(std::string name, std::vector<double> values) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::numeric;
  c.missing.assign(values.size(), 0);
  for (size_t i = 0; i < values.size(); ++i) {
    if (std::isnan(values[i])) c.missing[i] = 1;
  }
  c.values = std::move(values);
  return c;
}

Column Column::text(std::string name, std::vector<std::string> values) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::text;
  c.missing.assign(values.size(), 0);
  c.values = std::move(values);
  return c;
}

Column Column::boolean(std::string name, std::vector<std::uint8_t> values) {
  Column c;
  c.name = std::move(name);
  c.type = ColumnType::boolean;
  c.missing.assign(values.size(), 0);
  c.values = std::move(values);
  return c;
}

std::size_t Column::size() const {
  return std::visit([](const auto& v) { return v.size(); }, values);
}

Column Column::take(const std::vector<std::size_t>& rows) const {
  Column out;
  out.name = name;
  out.type = type;
  out.missing.reserve(rows.size());
  for (size_t r : rows) out.missing.push_back(is_missing(r) ? 1 : 0);
  std::visit(
      [&](const auto& src) {
        std::decay_t<decltype(src)> picked;
        picked.reserve(rows.size());
        for (size_t r : rows) picked.push_back(src[r]);
        out.values = std::move(picked);
      },
      values);
  return out;
}

Dataset::Dataset(std::vector<Column> columns) {
  std::unordered_set<std::string> seen;
  for (auto& c : columns) {
    if (!seen.insert(c.name).second) throw DatasetError("duplicate column name '" + c.name + "'");
    if (c.missing.size() != c.size()) c.missing.resize(c.size(), 0);
  }
  if (!columns.empty()) {
    row_count_ = columns.front().size();
    for (const auto& c : columns) {
      if (c.size() != row_count_) {
        throw DatasetError("column '" + c.name + "' has " + std::to_string(c.size()) +
                           " rows, expected " + std::to_string(row_count_));
      }
    }
  }
  columns_ = std::move(columns);
}

int Dataset::find_column(const std::string& name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name) return static_cast<int>(i);
  }
  return -1;
}

const Column* Dataset::column(const std::string& name) const {
  const int idx = find_column(name);
  return idx < 0 ? nullptr : &columns_[static_cast<size_t>(idx)];
}

std::vector<std::string> Dataset::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto& c : columns_) names.push_back(c.name);
  return names;
}

void Dataset::set_column(Column column) {
  if (column.missing.size() != column.size()) column.missing.resize(column.size(), 0);
  if (!columns_.empty() && column.size() != row_count_) {
    throw DatasetError("length of values (" + std::to_string(column.size()) +
                       ") does not match length of index (" + std::to_string(row_count_) + ")");
  }
  if (columns_.empty()) row_count_ = column.size();
  const int idx = find_column(column.name);
  if (idx >= 0) {
    columns_[static_cast<size_t>(idx)] = std::move(column);
  } else {
    columns_.push_back(std::move(column));
  }
}

bool Dataset::remove_column(const std::string& name) {
  const int idx = find_column(name);
  if (idx < 0) return false;
  columns_.erase(columns_.begin() + idx);
  if (columns_.empty()) row_count_ = 0;
  return true;
}

void Dataset::rename_column(const std::string& from, const std::string& to) {
  const int idx = find_column(from);
  if (idx < 0 || from == to) return;
  if (find_column(to) >= 0) throw DatasetError("duplicate column name '" + to + "'");
  columns_[static_cast<size_t>(idx)].name = to;
}

Dataset Dataset::take_rows(const std::vector<std::size_t>& rows) const {
  for (size_t r : rows) {
    if (r >= row_count_) throw DatasetError("row index " + std::to_string(r) + " out of range");
  }
  std::vector<Column> picked;
  picked.reserve(columns_.size());
  for (const auto& c : columns_) picked.push_back(c.take(rows));
  Dataset out(std::move(picked));
  out.row_count_ = columns_.empty() ? 0 : rows.size();
  return out;
}

std::string Dataset::fingerprint() const {
  StreamHasher h("ds:");
  h.update_u64(columns_.size());
  h.update_u64(row_count_);
  for (const auto& c : columns_) {
    h.update_field(c.name);
    h.update_u64(static_cast<std::uint64_t>(c.type));
    h.update_u64(c.missing.size());
    h.update(std::string_view(reinterpret_cast<const char*>(c.missing.data()), c.missing.size()));
    std::visit(
        [&](const auto& vals) {
          using T = std::decay_t<decltype(vals)>;
          h.update_u64(vals.size());
          if constexpr (std::is_same_v<T, std::vector<double>>) {
            for (double d : vals) h.update_f64(d);
          } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            for (const auto& s : vals) h.update_field(s);
          } else {
            h.update(std::string_view(reinterpret_cast<const char*>(vals.data()), vals.size()));
          }
        },
        c.values);
  }
  return h.hex_digest();
}

Dataset parse_csv(const std::string& text, char delimiter) {
  auto records = split_records(text, delimiter);
  if (records.empty()) throw DatasetError("empty CSV document");

  const auto header = records.front();
  const size_t ncols = header.size();
  for (size_t r = 1; r < records.size(); ++r) {
    if (records[r].size() != ncols) {
      throw DatasetError("row " + std::to_string(r) + " has " + std::to_string(records[r].size()) +
                         " fields, expected " + std::to_string(ncols));
    }
  }

  std::vector<Column> columns;
  columns.reserve(ncols);
  const size_t nrows = records.size() - 1;
  for (size_t c = 0; c < ncols; ++c) {
    std::string name = header[c].empty() ? "column_" + std::to_string(c) : header[c];

    bool all_numeric = true;
    bool all_flags = true;
    bool any_value = false;
    for (size_t r = 1; r < records.size(); ++r) {
      const auto& cell = records[r][c];
      if (cell.empty()) continue;
      any_value = true;
      double d;
      std::uint8_t f;
      if (!parse_number(cell, d)) all_numeric = false;
      if (!parse_flag(cell, f)) all_flags = false;
    }

    MissingMask missing(nrows, 0);
    if (any_value && all_numeric) {
      std::vector<double> vals(nrows, std::numeric_limits<double>::quiet_NaN());
      for (size_t r = 0; r < nrows; ++r) {
        const auto& cell = records[r + 1][c];
        if (cell.empty() || !parse_number(cell, vals[r])) missing[r] = 1;
      }
      Column col = Column::numeric(std::move(name), std::move(vals));
      col.missing = std::move(missing);
      columns.push_back(std::move(col));
    } else if (any_value && all_flags) {
      std::vector<std::uint8_t> vals(nrows, 0);
      for (size_t r = 0; r < nrows; ++r) {
        const auto& cell = records[r + 1][c];
        if (cell.empty() || !parse_flag(cell, vals[r])) missing[r] = 1;
      }
      Column col = Column::boolean(std::move(name), std::move(vals));
      col.missing = std::move(missing);
      columns.push_back(std::move(col));
    } else {
      std::vector<std::string> vals(nrows);
      for (size_t r = 0; r < nrows; ++r) {
        vals[r] = records[r + 1][c];
        if (vals[r].empty()) missing[r] = 1;
      }
      Column col = Column::text(std::move(name), std::move(vals));
      col.missing = std::move(missing);
      columns.push_back(std::move(col));
    }
  }
  return Dataset(std::move(columns));
}

Dataset load_csv(const std::string& path, char delimiter) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw DatasetError("cannot open '" + path + "'");
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return parse_csv(buf.str(), delimiter);
}

}  // namespace cordon
