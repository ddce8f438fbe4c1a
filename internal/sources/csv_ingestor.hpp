#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::sources {

/*
  Column layout and parsing rules for delimited text input.

  Column indexes are 1-based; 0 means the column is not used. A timestamp
  comes either from one combined date+time column or from a date column
  with an optional time column, never both.
*/
struct ColumnFormatSpec {
  std::size_t date_time_field = 0;
  std::string date_time_format; // empty: ISO 8601

  std::size_t date_only_field = 0;
  std::string date_only_format; // empty: yyyy-MM-dd
  std::size_t time_only_field = 0;
  std::string time_only_format; // empty: H:mm[:ss]

  std::optional<util::Duration> default_time_of_day;

  std::size_t value_field      = 0;
  std::size_t grade_field      = 0;
  std::size_t qualifiers_field = 0;

  std::string comment;
  std::size_t skip_rows           = 0;
  bool        ignore_invalid_rows = false;

  char                       delimiter = ',';
  std::optional<std::string> nan_value;
  std::string                qualifier_delimiter = ",";

  std::chrono::minutes utc_offset{0};

  // "NG", "3X" or "PointZilla", case-insensitive.
  static ColumnFormatSpec Preset(std::string_view name);

  // Throws util::ConfigurationError.
  void Validate() const;
};

struct IngestResult {
  std::vector<model::Point> points;
  std::size_t               rows_parsed  = 0;
  std::size_t               rows_skipped = 0; // invalid rows ignored
};

// Splits one line on the delimiter. Double-quoted fields may contain the
// delimiter; "" inside quotes is a literal quote.
std::vector<std::string> SplitDelimitedLine(std::string_view line, char delimiter);

class CsvIngestor {
 public:
  explicit CsvIngestor(ColumnFormatSpec spec);

  /*
    Rows become points in file order. A malformed row throws
    util::RowParseError unless invalid rows are ignored.
  */
  IngestResult Ingest(std::string_view contents, std::string_view source_name = "") const;

  // Reads the whole file through arrow::io::ReadableFile.
  IngestResult IngestFile(const std::string& path) const;

  const ColumnFormatSpec& spec() const {
    return spec_;
  }

 private:
  model::Point ParseRow(const std::vector<std::string>& fields, std::size_t row_number) const;
  util::TimePoint ParseTimestamp(const std::vector<std::string>& fields, std::size_t row_number) const;

  ColumnFormatSpec spec_;
};

} // namespace pointzilla::sources
