#include "internal/sink/csv_writer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/sources/csv_ingestor.hpp"
#include "internal/util/time.hpp"

namespace {

using pointzilla::model::Point;
using pointzilla::sink::CsvWriter;

std::vector<Point> SamplePoints() {
  const auto start = *pointzilla::util::ParseInstant("2020-01-01T00:00:00Z");

  auto first       = Point::Value(start, 0.1);
  first.grade_code = 20;
  first.qualifiers = {"EST", "ICE"};

  auto third = Point::Value(start + std::chrono::minutes(2), -3.25);

  return {first, Point::Gap(start + std::chrono::minutes(1)), third};
}

void TestFormatLayout() {
  const auto text = CsvWriter("Stage.Working@A001002").Format(SamplePoints());

  const std::string expected =
      "# Stage.Working@A001002\n"
      "# 3 points from 2020-01-01T00:00:00Z to 2020-01-01T00:02:00Z\n"
      "# Time,Value,Grade,Qualifiers\n"
      "2020-01-01T00:00:00Z,0.1,20,\"EST,ICE\"\n"
      "2020-01-01T00:01:00Z,,,\n"
      "2020-01-01T00:02:00Z,-3.25,,\n";
  assert(text == expected);

  const auto empty = CsvWriter("").Format({});
  assert(empty == "# Points\n# 0 points\n# Time,Value,Grade,Qualifiers\n");
}

void TestOutputReadsBackWithPointZillaPreset() {
  const auto original = SamplePoints();
  const auto text     = CsvWriter("Stage.Working@A001002").Format(original);

  const auto result = pointzilla::sources::CsvIngestor(pointzilla::sources::ColumnFormatSpec::Preset("PointZilla")).Ingest(text);
  assert(result.points.size() == 3);
  assert(result.points[0].value == 0.1);
  assert(*result.points[0].grade_code == 20);
  assert(result.points[0].qualifiers == original[0].qualifiers);
  assert(result.points[1].IsGap());
  assert(result.points[2].time == original[2].time);
}

void TestConfiguredDelimiter() {
  const auto original = SamplePoints();
  const auto text     = CsvWriter("Stage.Working@A001002", ';', "|").Format(original);

  assert(text.find("# Time;Value;Grade;Qualifiers\n") != std::string::npos);
  assert(text.find("2020-01-01T00:00:00Z;0.1;20;EST|ICE\n") != std::string::npos);
  assert(text.find("2020-01-01T00:01:00Z;;;\n") != std::string::npos);
  assert(text.find("2020-01-01T00:02:00Z;-3.25;;\n") != std::string::npos);

  auto spec                = pointzilla::sources::ColumnFormatSpec::Preset("PointZilla");
  spec.delimiter           = ';';
  spec.qualifier_delimiter = "|";
  const auto result        = pointzilla::sources::CsvIngestor(spec).Ingest(text);
  assert(result.points.size() == 3);
  assert(*result.points[0].grade_code == 20);
  assert(result.points[0].qualifiers == original[0].qualifiers);
  assert(result.points[1].IsGap());
  assert(result.points[2].value == -3.25);

  // A qualifier list holding the delimiter is quoted.
  const auto semicolons = CsvWriter("", ';', ";").Format({original[0]});
  assert(semicolons.find("0.1;20;\"EST;ICE\"\n") != std::string::npos);
}

void TestValueFormatting() {
  assert(pointzilla::sink::FormatValue(1.0) == "1");
  assert(pointzilla::sink::FormatValue(0.1) == "0.1");
  assert(pointzilla::sink::FormatValue(1e-7) == "1e-07");
  assert(std::stod(pointzilla::sink::FormatValue(1.0 / 3.0)) == 1.0 / 3.0);

  assert(pointzilla::sink::QuoteField("plain") == "plain");
  assert(pointzilla::sink::QuoteField("a\"b") == "\"a\"\"b\"");
  assert(pointzilla::sink::QuoteField("a;b") == "a;b");
  assert(pointzilla::sink::QuoteField("a;b", ';') == "\"a;b\"");
}

void TestSaveIntoDirectoryUsesSeriesName() {
  const auto dir = std::filesystem::temp_directory_path() / "pointzilla_csv_writer_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  const CsvWriter writer("Stage.Working@A001002");
  const auto      path = writer.Save(dir.string(), SamplePoints());
  assert(std::filesystem::path(path).filename() == "Stage.Working@A001002.csv");

  std::ifstream     in(path);
  const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(contents == writer.Format(SamplePoints()));

  const auto odd = CsvWriter("Flow: a/b").ResolvePath(dir.string());
  assert(std::filesystem::path(odd).filename() == "Flow__a_b.csv");

  const auto explicit_path = (dir / "named.csv").string();
  assert(writer.ResolvePath(explicit_path) == explicit_path);
}

} // namespace

int main() {
  TestFormatLayout();
  TestOutputReadsBackWithPointZillaPreset();
  TestConfiguredDelimiter();
  TestValueFormatting();
  TestSaveIntoDirectoryUsesSeriesName();

  std::cout << "pointzilla_unit_csv_writer: pass\n";
  return 0;
}
