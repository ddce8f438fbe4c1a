#include "internal/sources/csv_ingestor.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using pointzilla::sources::ColumnFormatSpec;
using pointzilla::sources::CsvIngestor;
using pointzilla::util::FormatInstant;

void TestNgPresetReadsValueGradeAndQualifiers() {
  const CsvIngestor ingestor(ColumnFormatSpec::Preset("NG"));

  const auto result = ingestor.Ingest(
      "# exported points\n"
      "\n"
      "2020-01-01T00:00:00Z,x,1.5,y,20,\"A,B\"\n"
      "2020-01-01T00:15:00Z,x,2.5,y,,\n");

  assert(result.points.size() == 2);
  assert(result.rows_skipped == 0);

  const auto& first = result.points[0];
  assert(FormatInstant(first.time) == "2020-01-01T00:00:00Z");
  assert(first.value == 1.5);
  assert(first.grade_code && *first.grade_code == 20);
  assert((first.qualifiers == std::vector<std::string>{"A", "B"}));

  const auto& second = result.points[1];
  assert(second.value == 2.5);
  assert(!second.grade_code);
  assert(second.qualifiers.empty());
}

void TestInvalidRowsAreSkippedWhenIgnored() {
  auto spec                = ColumnFormatSpec::Preset("NG");
  spec.ignore_invalid_rows = true;

  const auto result = CsvIngestor(spec).Ingest(
      "2020-01-01T00:00:00Z,x,1\n"
      "not a date,x,2\n"
      "2020-01-01T00:02:00Z,x,three\n"
      "2020-01-01T00:03:00Z,x,4\n");

  assert(result.points.size() == 2);
  assert(result.rows_skipped == 2);
  assert(result.points[1].value == 4);
}

void TestMalformedRowFailsIngestion() {
  auto spec                = ColumnFormatSpec::Preset("NG");
  spec.ignore_invalid_rows = false;

  bool threw = false;
  try {
    (void)CsvIngestor(spec).Ingest(
        "2020-01-01T00:00:00Z,x,1\n"
        "2020-01-01T00:01:00Z,x,oops\n");
  } catch (const pointzilla::util::RowParseError& e) {
    threw = true;
    assert(e.row_number() == 2);
  }
  assert(threw);
}

void TestOutOfRangeDateIsRowError() {
  auto spec                = ColumnFormatSpec::Preset("NG");
  spec.ignore_invalid_rows = false;

  bool threw = false;
  try {
    (void)CsvIngestor(spec).Ingest(
        "2020-01-01T00:00:00Z,x,1\n"
        "2300-01-01T00:00:00Z,x,2\n");
  } catch (const pointzilla::util::RowParseError& e) {
    threw = true;
    assert(e.row_number() == 2);
  }
  assert(threw);

  auto three_x                = ColumnFormatSpec::Preset("3X");
  three_x.skip_rows           = 0;
  three_x.ignore_invalid_rows = true;
  const auto result = CsvIngestor(three_x).Ingest(
      "01/01/1600 00:00:00,1\n"
      "07/01/2013 11:59:59,2\n");
  assert(result.points.size() == 1);
  assert(result.rows_skipped == 1);
}

void Test3XPresetSkipsHeaderRowsAndUsesPattern() {
  const CsvIngestor ingestor(ColumnFormatSpec::Preset("3x"));

  const auto result = ingestor.Ingest(
      "Station 42\n"
      "Date,Value,Grade\n"
      "07/01/2013 11:59:59,3.25,10\n");

  assert(result.points.size() == 1);
  assert(FormatInstant(result.points[0].time) == "2013-07-01T11:59:59Z");
  assert(result.points[0].value == 3.25);
  assert(*result.points[0].grade_code == 10);
}

void TestDateAndTimeColumns() {
  ColumnFormatSpec spec;
  spec.date_only_field     = 1;
  spec.time_only_field     = 2;
  spec.value_field         = 3;
  spec.default_time_of_day = 8h;

  const auto result = CsvIngestor(spec).Ingest(
      "2020-01-02,13:30,5\n"
      "2020-01-03,,6\n"
      "2020-01-04,7:05:30,7\n");

  assert(result.points.size() == 3);
  assert(FormatInstant(result.points[0].time) == "2020-01-02T13:30:00Z");
  assert(FormatInstant(result.points[1].time) == "2020-01-03T08:00:00Z");
  assert(FormatInstant(result.points[2].time) == "2020-01-04T07:05:30Z");
}

void TestNanSentinelBecomesGap() {
  auto spec      = ColumnFormatSpec::Preset("NG");
  spec.nan_value = "-9999";

  const auto result = CsvIngestor(spec).Ingest("2020-01-01T00:00:00Z,x,-9999,y,20,A\n");
  assert(result.points.size() == 1);
  assert(result.points[0].IsGap());
  assert(!result.points[0].grade_code);
  assert(result.points[0].qualifiers.empty());
}

void TestUtcOffsetAppliesToNaiveTimestamps() {
  auto spec       = ColumnFormatSpec::Preset("NG");
  spec.utc_offset = 12h;

  const auto result = CsvIngestor(spec).Ingest(
      "2020-01-01T12:00:00,x,1\n"
      "2020-01-01T12:00:00Z,x,2\n");
  assert(FormatInstant(result.points[0].time) == "2020-01-01T00:00:00Z");
  assert(FormatInstant(result.points[1].time) == "2020-01-01T12:00:00Z");
}

void TestCustomDelimiterAndQualifierDelimiter() {
  auto spec                = ColumnFormatSpec::Preset("PointZilla");
  spec.delimiter           = ';';
  spec.qualifier_delimiter = "|";

  const auto result = CsvIngestor(spec).Ingest("2020-01-01T00:00:00Z;1;;ICE|EST|ICE\n");
  assert((result.points[0].qualifiers == std::vector<std::string>{"ICE", "EST"}));
}

void TestBothTimestampModesIsConfigurationError() {
  auto spec            = ColumnFormatSpec::Preset("NG");
  spec.date_only_field = 2;

  bool threw = false;
  try {
    spec.Validate();
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ColumnFormatSpec::Preset("XLSX");
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestQuotedFieldSplitting() {
  const auto fields = pointzilla::sources::SplitDelimitedLine("a,\"b,c\",\"d\"\"e\",", ',');
  assert(fields.size() == 4);
  assert(fields[0] == "a");
  assert(fields[1] == "b,c");
  assert(fields[2] == "d\"e");
  assert(fields[3].empty());
}

void TestIngestFileReadsFromDisk() {
  const auto dir = std::filesystem::temp_directory_path() / "pointzilla_csv_ingestor_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "points.csv";
  {
    std::ofstream out(path);
    out << "2020-01-01T00:00:00Z,x,1\r\n2020-01-01T00:01:00Z,x,2\r\n";
  }

  const auto result = CsvIngestor(ColumnFormatSpec::Preset("NG")).IngestFile(path.string());
  assert(result.points.size() == 2);
  assert(result.points[1].value == 2);

  bool threw = false;
  try {
    (void)CsvIngestor(ColumnFormatSpec::Preset("NG")).IngestFile((dir / "missing.csv").string());
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNgPresetReadsValueGradeAndQualifiers();
  TestInvalidRowsAreSkippedWhenIgnored();
  TestMalformedRowFailsIngestion();
  TestOutOfRangeDateIsRowError();
  Test3XPresetSkipsHeaderRowsAndUsesPattern();
  TestDateAndTimeColumns();
  TestNanSentinelBecomesGap();
  TestUtcOffsetAppliesToNaiveTimestamps();
  TestCustomDelimiterAndQualifierDelimiter();
  TestBothTimestampModesIsConfigurationError();
  TestQuotedFieldSplitting();
  TestIngestFileReadsFromDisk();

  std::cout << "pointzilla_unit_csv_ingestor: pass\n";
  return 0;
}
