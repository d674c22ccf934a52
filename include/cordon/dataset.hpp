#pragma once

// cordon/dataset.hpp: Typed, column-major tabular data.
//
// A Dataset is the canonical input the caller hands to execute(). The engine
// never exposes the caller's instance to a candidate program: the Isolation
// Guard binds a deep copy (Dataset is a value type, copying it copies every
// column vector).
//
// MEMORY OWNERSHIP:
//   Columns own their storage. No views, no shared buffers, no raw pointers,
//   so a copy can never alias the original.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace cordon {

class DatasetError : public std::runtime_error {
 public:
  explicit DatasetError(const std::string& message) : std::runtime_error("Dataset Error: " + message) {}
};

enum class ColumnType { numeric, text, boolean };

std::string to_string(ColumnType type);

using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<std::uint8_t>>;
using MissingMask = std::vector<std::uint8_t>;

struct Column {
  std::string name;
  ColumnType type{ColumnType::text};
  ColumnStorage values{std::vector<std::string>{}};
  MissingMask missing;

  static Column numeric(std::string name, std::vector<double> values);
  static Column text(std::string name, std::vector<std::string> values);
  static Column boolean(std::string name, std::vector<std::uint8_t> values);

  std::size_t size() const;
  bool is_missing(std::size_t row) const { return row < missing.size() && missing[row] != 0; }

  const std::vector<double>& numbers() const { return std::get<std::vector<double>>(values); }
  std::vector<double>& numbers() { return std::get<std::vector<double>>(values); }
  const std::vector<std::string>& texts() const { return std::get<std::vector<std::string>>(values); }
  std::vector<std::string>& texts() { return std::get<std::vector<std::string>>(values); }
  const std::vector<std::uint8_t>& flags() const { return std::get<std::vector<std::uint8_t>>(values); }
  std::vector<std::uint8_t>& flags() { return std::get<std::vector<std::uint8_t>>(values); }

  // Rows picked by index, in the given order. Indices must be < size().
  Column take(const std::vector<std::size_t>& rows) const;
};

class Dataset {
 public:
  Dataset() = default;

  /**
   * @brief Builds a dataset from columns.
   * @throws DatasetError when column lengths differ or names repeat.
   */
  explicit Dataset(std::vector<Column> columns);

  std::size_t row_count() const noexcept { return row_count_; }
  std::size_t col_count() const noexcept { return columns_.size(); }

  const std::vector<Column>& columns() const noexcept { return columns_; }

  /**
   * @brief Returns index of named column or -1 when absent.
   */
  int find_column(const std::string& name) const;
  const Column* column(const std::string& name) const;
  std::vector<std::string> column_names() const;

  /**
   * @brief Replaces the named column, or appends it when absent.
   * @throws DatasetError when the length does not match row_count() of a
   *         non-empty dataset.
   */
  void set_column(Column column);
  bool remove_column(const std::string& name);
  void rename_column(const std::string& from, const std::string& to);

  Dataset take_rows(const std::vector<std::size_t>& rows) const;

  /**
   * @brief BLAKE3 digest of the canonical byte serialization.
   * @details Covers column order, names, types, missing masks and the exact
   *          IEEE 754 bit pattern of every numeric cell. Two datasets with the
   *          same fingerprint are bit-for-bit identical for every observable
   *          purpose.
   */
  std::string fingerprint() const;

 private:
  std::vector<Column> columns_;
  std::size_t row_count_ = 0;
};

/**
 * @brief Parses CSV text with a header row. Columns whose non-empty cells all
 *        parse as numbers become numeric; "true"/"false" columns become
 *        boolean; everything else is text. Empty cells are missing.
 * @throws DatasetError on ragged rows or an empty document.
 */
Dataset parse_csv(const std::string& text, char delimiter = ',');

/**
 * @brief Reads and parses a CSV file.
 * @throws DatasetError when the file cannot be read or parsed.
 */
Dataset load_csv(const std::string& path, char delimiter = ',');

}  // namespace cordon
