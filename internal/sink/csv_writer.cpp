#include "csv_writer.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/arrow_io.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::sink {

namespace {

std::string SafeFileName(std::string_view identifier) {
  std::string name;
  name.reserve(identifier.size());
  for (char c : identifier) {
    switch (c) {
      case '/':
      case '\\':
      case ':':
      case '*':
      case '?':
      case '"':
      case '<':
      case '>':
      case '|':
      case ' ':
      case '\t':
        name.push_back('_');
        break;
      default:
        name.push_back(c);
    }
  }
  return name.empty() ? std::string("Points") : name;
}

} // namespace

std::string FormatValue(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.15g", value);
  if (std::strtod(buffer, nullptr) != value) {
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  }
  return buffer;
}

std::string QuoteField(std::string_view field, char delimiter) {
  const char specials[] = {delimiter, '"', '\r', '\n', '\0'};
  if (field.find_first_of(specials) == std::string_view::npos) {
    return std::string(field);
  }

  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

CsvWriter::CsvWriter(std::string series_identifier, char delimiter, std::string qualifier_delimiter)
    : series_identifier_(std::move(series_identifier)), delimiter_(delimiter), qualifier_delimiter_(std::move(qualifier_delimiter)) {
}

std::string CsvWriter::Format(const std::vector<model::Point>& points) const {
  std::ostringstream out;

  out << "# " << (series_identifier_.empty() ? std::string("Points") : series_identifier_) << "\n";
  out << "# " << points.size() << " points";
  if (!points.empty()) {
    out << " from " << util::FormatInstant(points.front().time) << " to " << util::FormatInstant(points.back().time);
  }
  out << "\n";
  out << "# Time" << delimiter_ << "Value" << delimiter_ << "Grade" << delimiter_ << "Qualifiers\n";

  for (const auto& point : points) {
    out << util::FormatInstant(point.time) << delimiter_;
    if (point.IsGap()) {
      out << delimiter_ << delimiter_ << "\n";
      continue;
    }

    out << FormatValue(point.value) << delimiter_;
    if (point.grade_code) out << *point.grade_code;
    out << delimiter_;

    std::string qualifiers;
    for (std::size_t i = 0; i < point.qualifiers.size(); ++i) {
      if (i > 0) qualifiers += qualifier_delimiter_;
      qualifiers += point.qualifiers[i];
    }
    out << QuoteField(qualifiers, delimiter_) << "\n";
  }

  return out.str();
}

std::string CsvWriter::ResolvePath(const std::string& save_path) const {
  std::error_code ec;
  if (std::filesystem::is_directory(save_path, ec)) {
    return (std::filesystem::path(save_path) / (SafeFileName(series_identifier_) + ".csv")).string();
  }
  return save_path;
}

std::string CsvWriter::Save(const std::string& save_path, const std::vector<model::Point>& points) const {
  const auto path = ResolvePath(save_path);

  util::Unwrap(util::WriteFile(path, Format(points)));

  POINTZILLA_LOG_INFO("saved csv", {observability::StringField("path", path),
                                    observability::IntField("points", static_cast<std::int64_t>(points.size()))});
  return path;
}

} // namespace pointzilla::sink
