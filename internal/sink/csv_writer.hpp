#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/point.hpp"

namespace pointzilla::sink {

/*
  Writes points in the layout read back by the "PointZilla" CSV preset:

    # comment header
    Time,Value,Grade,Qualifiers

  Fields are separated by the configured delimiter. Gaps have an empty value.
*/
class CsvWriter {
 public:
  explicit CsvWriter(std::string series_identifier, char delimiter = ',', std::string qualifier_delimiter = ",");

  std::string Format(const std::vector<model::Point>& points) const;

  // An existing directory gets a file name derived from the series identifier.
  std::string ResolvePath(const std::string& save_path) const;

  // Returns the path written. Throws std::runtime_error on IO failure.
  std::string Save(const std::string& save_path, const std::vector<model::Point>& points) const;

 private:
  std::string series_identifier_;
  char        delimiter_;
  std::string qualifier_delimiter_;
};

// Shortest text that parses back to the same double.
std::string FormatValue(double value);

// Quotes a field when it holds the delimiter, a quote or a line break.
std::string QuoteField(std::string_view field, char delimiter = ',');

} // namespace pointzilla::sink
