#include "csv_ingestor.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/arrow_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time_pattern.hpp"

namespace pointzilla::sources {

using util::RowParseError;

namespace {

constexpr const char* kDefaultDateFormat = "yyyy-MM-dd";

const std::string& FieldAt(const std::vector<std::string>& fields, std::size_t index, std::size_t row_number) {
  if (index == 0 || index > fields.size()) {
    throw RowParseError(row_number, "missing column " + std::to_string(index));
  }
  return fields[index - 1];
}

bool IsBlank(std::string_view line) {
  return util::Trim(line).empty();
}

std::optional<util::PatternFields> ParseTimeOfDay(std::string_view text, const std::string& format) {
  if (!format.empty()) {
    return util::ParseWithPattern(text, format);
  }
  for (const char* pattern : {"H:mm:ss", "H:mm:ss.FFFFFFFFF", "H:mm"}) {
    if (auto fields = util::ParseWithPattern(text, pattern)) {
      return fields;
    }
  }
  return std::nullopt;
}

} // namespace

// ------------------------------------------------------------
// ColumnFormatSpec
// ------------------------------------------------------------

ColumnFormatSpec ColumnFormatSpec::Preset(std::string_view name) {
  ColumnFormatSpec spec;

  if (name.empty() || util::EqualsIgnoreCase(name, "NG")) {
    spec.date_time_field     = 1;
    spec.value_field         = 3;
    spec.grade_field         = 5;
    spec.qualifiers_field    = 6;
    spec.comment             = "#";
    spec.ignore_invalid_rows = true;
    return spec;
  }

  if (util::EqualsIgnoreCase(name, "3X")) {
    spec.date_time_field     = 1;
    spec.date_time_format    = "MM/dd/yyyy HH:mm:ss";
    spec.value_field         = 2;
    spec.grade_field         = 3;
    spec.skip_rows           = 2;
    spec.ignore_invalid_rows = true;
    return spec;
  }

  if (util::EqualsIgnoreCase(name, "PointZilla")) {
    spec.date_time_field     = 1;
    spec.value_field         = 2;
    spec.grade_field         = 3;
    spec.qualifiers_field    = 4;
    spec.comment             = "#";
    spec.nan_value           = "";
    spec.ignore_invalid_rows = false;
    return spec;
  }

  throw util::ConfigurationError("'" + std::string(name) + "' is an unknown CSV format");
}

void ColumnFormatSpec::Validate() const {
  const bool combined = date_time_field > 0;
  const bool split    = date_only_field > 0 || time_only_field > 0;

  if (combined && split) {
    throw util::ConfigurationError("CSV date+time field can't be combined with date-only or time-only fields");
  }
  if (!combined && !split) {
    throw util::ConfigurationError("CSV needs a date+time field or a date-only field");
  }
  if (split && date_only_field == 0) {
    throw util::ConfigurationError("CSV time-only field requires a date-only field");
  }
  if (value_field == 0) {
    throw util::ConfigurationError("CSV value field must be set");
  }

  const std::pair<const std::string*, const char*> patterns[] = {
      {&date_time_format, "CsvDateTimeFormat"},
      {&date_only_format, "CsvDateOnlyFormat"},
      {&time_only_format, "CsvTimeOnlyFormat"},
  };
  for (const auto& [pattern, name] : patterns) {
    if (!pattern->empty() && !util::IsValidPattern(*pattern)) {
      throw util::ConfigurationError(std::string(name) + " '" + *pattern + "' is not a valid pattern");
    }
  }

  if (qualifier_delimiter.empty()) {
    throw util::ConfigurationError("CSV qualifier delimiter can't be empty");
  }
}

// ------------------------------------------------------------
// Line splitting
// ------------------------------------------------------------

std::vector<std::string> SplitDelimitedLine(std::string_view line, char delimiter) {
  std::vector<std::string> fields;
  std::string              current;
  bool                     in_quotes    = false;
  bool                     field_quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '"' && !field_quoted && util::Trim(current).empty()) {
      current.clear();
      in_quotes    = true;
      field_quoted = true;
      continue;
    }

    if (c == delimiter) {
      fields.push_back(std::move(current));
      current.clear();
      field_quoted = false;
      continue;
    }

    current.push_back(c);
  }

  fields.push_back(std::move(current));
  return fields;
}

// ------------------------------------------------------------
// CsvIngestor
// ------------------------------------------------------------

CsvIngestor::CsvIngestor(ColumnFormatSpec spec) : spec_(std::move(spec)) {
  spec_.Validate();
}

util::TimePoint CsvIngestor::ParseTimestamp(const std::vector<std::string>& fields, std::size_t row_number) const {
  if (spec_.date_time_field > 0) {
    const auto text = util::Trim(FieldAt(fields, spec_.date_time_field, row_number));

    if (spec_.date_time_format.empty()) {
      if (auto instant = util::ParseInstant(text, spec_.utc_offset)) {
        return *instant;
      }
      throw RowParseError(row_number, "can't parse '" + std::string(text) + "' as an ISO 8601 timestamp");
    }

    const auto parsed = util::ParseWithPattern(text, spec_.date_time_format);
    if (!parsed || !parsed->has_date) {
      throw RowParseError(row_number, "can't parse '" + std::string(text) + "' using '" + spec_.date_time_format + "'");
    }
    return util::FromCivil(parsed->civil, parsed->utc_offset.value_or(spec_.utc_offset));
  }

  const auto date_text   = util::Trim(FieldAt(fields, spec_.date_only_field, row_number));
  const auto date_format = spec_.date_only_format.empty() ? std::string(kDefaultDateFormat) : spec_.date_only_format;
  const auto date        = util::ParseWithPattern(date_text, date_format);
  if (!date || !date->has_date) {
    throw RowParseError(row_number, "can't parse '" + std::string(date_text) + "' as a date using '" + date_format + "'");
  }

  util::CivilTime civil = date->civil;
  civil.hour = civil.minute = civil.second = 0;
  civil.nanos = 0;

  util::Duration                      time_of_day = spec_.default_time_of_day.value_or(util::Duration::zero());
  std::optional<std::chrono::minutes> offset      = date->utc_offset;

  std::string_view time_text;
  if (spec_.time_only_field > 0) {
    time_text = util::Trim(FieldAt(fields, spec_.time_only_field, row_number));
  }
  if (!time_text.empty()) {
    const auto time = ParseTimeOfDay(time_text, spec_.time_only_format);
    if (!time || !time->has_time) {
      throw RowParseError(row_number, "can't parse '" + std::string(time_text) + "' as a time of day");
    }
    time_of_day = time->TimeOfDay();
    if (time->utc_offset) offset = time->utc_offset;
  }

  return util::FromCivil(civil, offset.value_or(spec_.utc_offset)) + time_of_day;
}

model::Point CsvIngestor::ParseRow(const std::vector<std::string>& fields, std::size_t row_number) const {
  const auto time       = ParseTimestamp(fields, row_number);
  const auto value_text = util::Trim(FieldAt(fields, spec_.value_field, row_number));

  if (spec_.nan_value && value_text == util::Trim(*spec_.nan_value)) {
    return model::Point::Gap(time);
  }

  const auto value = util::ParseDouble(value_text);
  if (!value) {
    throw RowParseError(row_number, "can't parse '" + std::string(value_text) + "' as a number");
  }
  if (std::isnan(*value)) {
    return model::Point::Gap(time);
  }

  auto point = model::Point::Value(time, *value);

  if (spec_.grade_field > 0) {
    const auto grade_text = util::Trim(FieldAt(fields, spec_.grade_field, row_number));
    if (!grade_text.empty()) {
      const auto grade = util::ParseInt32(grade_text);
      if (!grade) {
        throw RowParseError(row_number, "can't parse '" + std::string(grade_text) + "' as a grade code");
      }
      point.grade_code = *grade;
    }
  }

  if (spec_.qualifiers_field > 0) {
    const auto qualifier_text = util::Trim(FieldAt(fields, spec_.qualifiers_field, row_number));
    if (!qualifier_text.empty()) {
      std::vector<std::string> qualifiers;
      for (const auto& part : util::Split(qualifier_text, spec_.qualifier_delimiter)) {
        qualifiers.emplace_back(util::Trim(part));
      }
      point.qualifiers = model::NormalizeQualifiers(qualifiers);
    }
  }

  return point;
}

IngestResult CsvIngestor::Ingest(std::string_view contents, std::string_view source_name) const {
  IngestResult result;

  std::size_t row_number = 0;
  std::size_t start      = 0;
  while (start <= contents.size()) {
    auto end = contents.find('\n', start);
    if (end == std::string_view::npos) end = contents.size();

    auto line = contents.substr(start, end - start);
    start     = end + 1;
    ++row_number;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (row_number <= spec_.skip_rows) continue;
    if (IsBlank(line)) continue;
    if (!spec_.comment.empty() && util::StartsWith(util::Trim(line), spec_.comment)) continue;

    try {
      result.points.push_back(ParseRow(SplitDelimitedLine(line, spec_.delimiter), row_number));
      ++result.rows_parsed;
    } catch (const RowParseError& e) {
      if (!spec_.ignore_invalid_rows) {
        throw RowParseError(e.row_number(), std::string(source_name) + " row " + std::to_string(e.row_number()) + ": " + e.what());
      }
      ++result.rows_skipped;
      POINTZILLA_LOG_DEBUG("csv row skipped",
                           {observability::StringField("source", source_name),
                            observability::IntField("row", static_cast<std::int64_t>(e.row_number())),
                            observability::StringField("reason", e.what())});
    }
  }

  return result;
}

IngestResult CsvIngestor::IngestFile(const std::string& path) const {
  auto buffer = util::ReadFile(path);
  if (!buffer.ok()) {
    throw util::ConfigurationError("Can't read CSV file '" + path + "': " + buffer.status().ToString());
  }

  const auto& contents = *buffer;
  auto result = Ingest(std::string_view(reinterpret_cast<const char*>(contents->data()), static_cast<std::size_t>(contents->size())), path);

  POINTZILLA_LOG_INFO("csv file loaded",
                      {observability::StringField("path", path),
                       observability::IntField("points", static_cast<std::int64_t>(result.points.size())),
                       observability::IntField("skipped_rows", static_cast<std::int64_t>(result.rows_skipped))});
  return result;
}

} // namespace pointzilla::sources
