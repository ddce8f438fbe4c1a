#include "internal/config/option_parser.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace cfg = pointzilla::runtime::config;

using pointzilla::config::OptionParser;

std::filesystem::path WriteFile(const std::string& name, const std::string& contents) {
  const auto dir = std::filesystem::temp_directory_path() / "pointzilla_option_parser_tests";
  std::filesystem::create_directories(dir);

  const auto    path = dir / name;
  std::ofstream out(path);
  out << contents;
  return path;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const pointzilla::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestOptionsAndPositionals() {
  const OptionParser parser;
  const auto         parsed = parser.Parse({"-server=localhost:50051", "/Username=admin", "--BatchSize=100", "OverwriteAppend",
                                            "Stage.Working@A001002", "1.5", "gap", "-2", "-Qualifiers=EST, ICE", "-wait=FALSE"});

  const auto& config = parsed.config;
  assert(!parsed.show_help);
  assert(config.server().address() == "localhost:50051");
  assert(config.server().username() == "admin");
  assert(config.append().batch_size() == 100);
  assert(config.append().command() == cfg::COMMAND_TYPE_OVERWRITE_APPEND);
  assert(config.append().time_series() == "Stage.Working@A001002");
  assert(config.append().has_wait() && !config.append().wait());

  assert(config.generator().manual_points_size() == 3);
  assert(config.generator().manual_points(0).value() == 1.5);
  assert(config.generator().manual_points(1).gap());
  assert(config.generator().manual_points(2).value() == -2);

  assert(config.generator().qualifiers_size() == 2);
  assert(config.generator().qualifiers(1) == "ICE");
}

void TestUniqueIdAndCsvPositionals() {
  const auto csv = WriteFile("points.csv", "2020-01-01T00:00:00Z,x,1\n");

  const auto parsed =
      OptionParser().Parse({"0123456789abcdef0123456789ABCDEF", csv.string(), "-CsvFormat=3X", "-CsvNanValue=", "-WaveformType=squarewave"});
  assert(parsed.config.append().time_series() == "0123456789abcdef0123456789ABCDEF");
  assert(parsed.config.csv().files_size() == 1);
  assert(parsed.config.csv().files(0) == csv.string());
  assert(parsed.config.csv().format() == "3X");
  assert(parsed.config.csv().has_nan_value() && parsed.config.csv().nan_value().empty());
  assert(parsed.config.waveform().type() == cfg::WAVEFORM_TYPE_SQUARE_WAVE);

  const auto dashed = OptionParser().Parse({"01234567-89ab-cdef-0123-456789abcdef"});
  assert(dashed.config.append().time_series() == "01234567-89ab-cdef-0123-456789abcdef");
}

void TestTimeRangeAndDurations() {
  const auto parsed = OptionParser().Parse(
      {"-TimeRange=2020-01-01T00:00:00Z/2020-02-01T00:00:00Z", "-AppendTimeout=00:10:00", "-PointInterval=15m", "-StartTime=2021-06-01"});

  const auto& append = parsed.config.append();
  assert(append.time_range().start().seconds() == 1577836800);
  assert(append.time_range().end().seconds() == 1580515200);
  assert(append.append_timeout().seconds() == 600);
  assert(parsed.config.generator().point_interval().seconds() == 900);
  assert(parsed.config.generator().start_time().seconds() == 1622505600);

  const OptionParser parser;
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-TimeRange=2020-02-01T00:00:00Z/2020-01-01T00:00:00Z"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-TimeRange=2020-01-01T00:00:00Z"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-AppendTimeout=soon"}); }));
}

void TestMultiValueMappingOptions() {
  const auto parsed = OptionParser().Parse({"-MappedGrades=200,299:5", "-MappedGrades=:0", "-MappedQualifiers=A:B"});
  assert(parsed.config.transform().mapped_grades_size() == 2);
  assert(parsed.config.transform().mapped_grades(0) == "200,299:5");
  assert(parsed.config.transform().mapped_qualifiers(0) == "A:B");
}

void TestSeriesCreationOptions() {
  const auto parsed = OptionParser().Parse({"-CreateMode=reflected", "-Unit=m", "-UtcOffset=-08:00", "-GapTolerance=01:30:00",
                                            "-Publish=true", "-ExtendedAttributeValue=OWNER@TIMESERIES=Hydro",
                                            "-ExtendedAttributeValue=STATUS@TIMESERIES=Draft", "-ComputationIdentifier=Mean"});

  const auto& creation = parsed.config.creation();
  assert(creation.create_mode() == cfg::CREATE_MODE_REFLECTED);
  assert(creation.unit() == "m");
  assert(creation.utc_offset() == "-08:00");
  assert(creation.gap_tolerance().seconds() == 5400);
  assert(creation.publish());
  assert(creation.extended_attribute_values_size() == 2);
  assert(creation.extended_attribute_values(1) == "STATUS@TIMESERIES=Draft");
  assert(creation.computation_identifier() == "Mean");

  assert(OptionParser().Parse({}).config.creation().create_mode() == cfg::CREATE_MODE_NEVER);
  assert(ThrowsConfigurationError([] { (void)OptionParser().Parse({"-CreateMode=Calculated"}); }));
}

void TestConfigFileAppliesFirst() {
  const auto yaml = WriteFile("run.yaml",
                              "server:\n"
                              "  address: yaml-host:50051\n"
                              "  username: yaml-user\n"
                              "append:\n"
                              "  batch_size: 10\n");

  const auto parsed = OptionParser().Parse({"-Username=cli-user", "-Config=" + yaml.string()});
  assert(parsed.config.server().address() == "yaml-host:50051");
  assert(parsed.config.server().username() == "cli-user");
  assert(parsed.config.append().batch_size() == 10);
}

void TestOptionsFileExpansion() {
  const auto options = WriteFile("options.txt",
                                 "# shared settings\n"
                                 "\n"
                                 "  -Server=file-host  \n"
                                 "// another comment\n"
                                 "Append\n");

  const auto expanded = OptionParser::ExpandOptionFiles({"-Wait=false", "@" + options.string()});
  assert((expanded == std::vector<std::string>{"-Wait=false", "-Server=file-host", "Append"}));

  const auto parsed = OptionParser().Parse({"@" + options.string()});
  assert(parsed.config.server().address() == "file-host");
  assert(parsed.config.append().command() == cfg::COMMAND_TYPE_APPEND);

  assert(ThrowsConfigurationError([] { (void)OptionParser::ExpandOptionFiles({"@/nonexistent/pointzilla/options.txt"}); }));
}

void TestHelpAndErrors() {
  const OptionParser parser;
  assert(parser.Parse({"-Server=x", "/?"}).show_help);
  assert(parser.Parse({"--help"}).show_help);
  assert(parser.Parse({"-H"}).show_help);

  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-NoSuchOption=1"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"not-a-thing"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-Wait=maybe"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-BatchSize=many"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-Command=Upsert"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-CsvSkipRows=-1"}); }));

  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"nan"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"1", "inf"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-WaveformScalar=nan"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-StartTime=2300-01-01T00:00:00Z"}); }));
  assert(ThrowsConfigurationError([&] { (void)parser.Parse({"-PointInterval=99999999999d"}); }));
  assert(parser.Parse({"1.5", "GAP"}).config.generator().manual_points_size() == 2);

  const auto usage = parser.Usage("pointzilla");
  assert(usage.find("usage: pointzilla") != std::string::npos);
  assert(usage.find("-CsvQualifierDelimiter") != std::string::npos);
  assert(usage.find("CSV parsing options:") != std::string::npos);
}

} // namespace

int main() {
  TestOptionsAndPositionals();
  TestUniqueIdAndCsvPositionals();
  TestTimeRangeAndDurations();
  TestMultiValueMappingOptions();
  TestSeriesCreationOptions();
  TestConfigFileAppliesFirst();
  TestOptionsFileExpansion();
  TestHelpAndErrors();

  std::cout << "pointzilla_unit_option_parser: pass\n";
  return 0;
}
