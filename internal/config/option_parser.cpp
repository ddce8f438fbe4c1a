#include "option_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::config {

using pointzilla::runtime::config::CommandType;
using pointzilla::runtime::config::CreateMode;
using pointzilla::runtime::config::RunConfig;
using pointzilla::runtime::config::WaveformType;
using util::ConfigurationError;

namespace {

constexpr const char* kHelpGuidance = "See -help for details.";

const std::pair<const char*, CommandType> kCommands[] = {
    {"Auto", pointzilla::runtime::config::COMMAND_TYPE_AUTO},
    {"Append", pointzilla::runtime::config::COMMAND_TYPE_APPEND},
    {"OverwriteAppend", pointzilla::runtime::config::COMMAND_TYPE_OVERWRITE_APPEND},
    {"Reflected", pointzilla::runtime::config::COMMAND_TYPE_REFLECTED},
    {"DeleteAllPoints", pointzilla::runtime::config::COMMAND_TYPE_DELETE_ALL_POINTS},
};

const std::pair<const char*, WaveformType> kWaveforms[] = {
    {"SineWave", pointzilla::runtime::config::WAVEFORM_TYPE_SINE_WAVE},
    {"SquareWave", pointzilla::runtime::config::WAVEFORM_TYPE_SQUARE_WAVE},
    {"SawTooth", pointzilla::runtime::config::WAVEFORM_TYPE_SAW_TOOTH},
};

const std::pair<const char*, CreateMode> kCreateModes[] = {
    {"Never", pointzilla::runtime::config::CREATE_MODE_NEVER},
    {"Basic", pointzilla::runtime::config::CREATE_MODE_BASIC},
    {"Reflected", pointzilla::runtime::config::CREATE_MODE_REFLECTED},
};

template <typename Enum, std::size_t N>
std::string EnumOptions(const std::pair<const char*, Enum> (&names)[N]) {
  std::string text = "One of ";
  for (std::size_t i = 0; i < N; ++i) {
    if (i > 0) text += ", ";
    text += names[i].first;
  }
  return text + ".";
}

template <typename Enum, std::size_t N>
std::optional<Enum> LookupEnum(const std::pair<const char*, Enum> (&names)[N], std::string_view text) {
  for (const auto& [name, value] : names) {
    if (util::EqualsIgnoreCase(name, util::Trim(text))) return value;
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
Enum ParseEnum(const std::pair<const char*, Enum> (&names)[N], const std::string& text, const char* type_name) {
  if (auto value = LookupEnum(names, text)) return *value;
  throw ConfigurationError("'" + text + "' is not a valid " + type_name + " value. " + EnumOptions(names));
}

bool ParseBool(const std::string& text) {
  const auto value = util::Trim(text);
  if (util::EqualsIgnoreCase(value, "true")) return true;
  if (util::EqualsIgnoreCase(value, "false")) return false;
  throw ConfigurationError("'" + text + "' is not a valid boolean. Use true or false.");
}

std::int32_t ParseInt(const std::string& text) {
  if (auto value = util::ParseInt32(text)) return *value;
  throw ConfigurationError("'" + text + "' is not a valid integer");
}

std::int32_t ParseNonNegativeInt(const std::string& text) {
  const auto value = ParseInt(text);
  if (value < 0) throw ConfigurationError("'" + text + "' must not be negative");
  return value;
}

double ParseNumber(const std::string& text) {
  if (auto value = util::ParseDouble(text); value && std::isfinite(*value)) return *value;
  throw ConfigurationError("'" + text + "' is not a valid number");
}

google::protobuf::Timestamp ParseTimestamp(const std::string& text) {
  if (auto instant = util::ParseInstant(text)) return util::ToProto(*instant);
  throw ConfigurationError("'" + text + "' can't be parsed as an unambiguous date time");
}

google::protobuf::Duration ParseDurationValue(const std::string& text) {
  if (auto duration = util::ParseDuration(text)) return util::ToProto(*duration);
  throw ConfigurationError("'" + text + "' is not a valid duration. Use [d.]hh:mm:ss or a unit suffix like 90s");
}

void ParseTimeRange(const std::string& text, pointzilla::runtime::config::TimeRange* range) {
  std::vector<std::string> components;
  for (auto& part : util::Split(text, "/")) {
    if (!util::Trim(part).empty()) components.push_back(std::move(part));
  }

  if (components.size() != 2) {
    throw ConfigurationError("'" + text + "' is an invalid time range. Use 'StartInstant/EndInstant' (two ISO 8601 timestamps separated by '/')");
  }

  const auto start = util::ParseInstant(components[0]);
  const auto end   = util::ParseInstant(components[1]);
  if (!start || !end) {
    throw ConfigurationError("'" + text + "' contains a timestamp that can't be parsed");
  }
  if (*end < *start) {
    throw ConfigurationError("Invalid TimeRange: start " + util::FormatInstant(*start) + " must not be after end " +
                             util::FormatInstant(*end));
  }

  *range->mutable_start() = util::ToProto(*start);
  *range->mutable_end()   = util::ToProto(*end);
}

std::vector<std::string> ParseQualifierList(const std::string& text) {
  std::vector<std::string> qualifiers;
  for (const auto& part : util::Split(text, ",")) {
    const auto qualifier = util::Trim(part);
    if (!qualifier.empty()) qualifiers.emplace_back(qualifier);
  }
  return qualifiers;
}

bool IsUniqueId(std::string_view text) {
  std::size_t hex = 0;
  for (char c : text) {
    if (c == '-') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    ++hex;
  }
  return hex == 32 && (text.size() == 32 || text.size() == 36);
}

bool IsIdentifier(std::string_view text) {
  const auto at = text.find('@');
  return at != std::string_view::npos && at > 0 && at + 1 < text.size();
}

bool IsHelpKeyword(std::string_view arg) {
  for (const char* prefix : {"/", "-", "--"}) {
    if (!util::StartsWith(arg, prefix)) continue;
    const auto keyword = arg.substr(std::string_view(prefix).size());
    if (keyword == "?" || util::EqualsIgnoreCase(keyword, "h") || util::EqualsIgnoreCase(keyword, "help")) return true;
  }
  return false;
}

// "-key=value" or "/key=value"
bool SplitOption(const std::string& arg, std::string* key, std::string* value) {
  if (arg.size() < 2 || (arg[0] != '-' && arg[0] != '/')) return false;

  const auto equals = arg.find('=');
  if (equals == std::string::npos || equals == 1) return false;

  std::size_t key_start = 1;
  if (arg[0] == '-' && arg[1] == '-') key_start = 2;
  if (equals <= key_start) return false;

  *key   = arg.substr(key_start, equals - key_start);
  *value = arg.substr(equals + 1);
  return true;
}

} // namespace

// ------------------------------------------------------------
// Option table
// ------------------------------------------------------------

void OptionParser::AddSection(std::string title) {
  options_.push_back(Option{"", std::move(title), nullptr});
}

void OptionParser::Add(std::string key, std::string description, Setter setter) {
  options_.push_back(Option{std::move(key), std::move(description), std::move(setter)});
}

OptionParser::OptionParser() {
  Add("Config", "YAML run configuration, applied before all other options", nullptr);
  Add("LogLevel", "Logging level: trace, debug, info, warn, error", [](RunConfig& c, const std::string& v) { c.mutable_logging()->set_level(v); });

  AddSection("Server options:");
  Add("Server", "Time-series server address (host:port)", [](RunConfig& c, const std::string& v) { c.mutable_server()->set_address(v); });
  Add("Username", "Server username", [](RunConfig& c, const std::string& v) { c.mutable_server()->set_username(v); });
  Add("Password", "Server password", [](RunConfig& c, const std::string& v) { c.mutable_server()->set_password(v); });
  Add("SessionToken", "Existing session token, used instead of username/password",
      [](RunConfig& c, const std::string& v) { c.mutable_server()->set_session_token(v); });
  Add("UseTls", "Connect with TLS", [](RunConfig& c, const std::string& v) { c.mutable_server()->set_use_tls(ParseBool(v)); });
  Add("RpcTimeout", "Deadline for each server call [default: 60s]",
      [](RunConfig& c, const std::string& v) { *c.mutable_server()->mutable_rpc_timeout() = ParseDurationValue(v); });

  Add("Wait", "Wait for the append request to complete [default: true]",
      [](RunConfig& c, const std::string& v) { c.mutable_append()->set_wait(ParseBool(v)); });
  Add("AppendTimeout", "Timeout period for append completion [default: 00:05:00]",
      [](RunConfig& c, const std::string& v) { *c.mutable_append()->mutable_append_timeout() = ParseDurationValue(v); });
  Add("PollInterval", "Interval between append status checks [default: 1s]",
      [](RunConfig& c, const std::string& v) { *c.mutable_append()->mutable_poll_interval() = ParseDurationValue(v); });
  Add("BatchSize", "Maximum number of points to send in a single append request [default: 500000]",
      [](RunConfig& c, const std::string& v) { c.mutable_append()->set_batch_size(ParseInt(v)); });

  AddSection("Time-series options:");
  Add("TimeSeries", "Target time-series identifier or unique ID", [](RunConfig& c, const std::string& v) { c.mutable_append()->set_time_series(v); });
  Add("TimeRange", "Time-range for overwrite as StartInstant/EndInstant (defaults to start/end points)",
      [](RunConfig& c, const std::string& v) { ParseTimeRange(v, c.mutable_append()->mutable_time_range()); });
  Add("Command", "Append operation to perform. " + EnumOptions(kCommands),
      [](RunConfig& c, const std::string& v) { c.mutable_append()->set_command(ParseEnum(kCommands, v, "Command")); });
  Add("GradeCode", "Optional grade code for generated points",
      [](RunConfig& c, const std::string& v) { c.mutable_generator()->set_grade_code(ParseInt(v)); });
  Add("Qualifiers", "Optional comma-separated qualifier list for generated points", [](RunConfig& c, const std::string& v) {
    auto* qualifiers = c.mutable_generator()->mutable_qualifiers();
    qualifiers->Clear();
    for (auto& qualifier : ParseQualifierList(v)) *qualifiers->Add() = std::move(qualifier);
  });

  AddSection("Time-series creation options:");
  Add("CreateMode", "Create the target time-series when it does not exist. " + EnumOptions(kCreateModes) + " [default: Never]",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_create_mode(ParseEnum(kCreateModes, v, "CreateMode")); });
  Add("Unit", "Unit of the created time-series", [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_unit(v); });
  Add("InterpolationType", "Interpolation type of the created time-series [default: InstantaneousValues]",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_interpolation_type(v); });
  Add("UtcOffset", "UTC offset of the created time-series, e.g. -08:00 [default: UTC]",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_utc_offset(v); });
  Add("GapTolerance", "Gap tolerance of the created time-series. Omit for no gap detection",
      [](RunConfig& c, const std::string& v) { *c.mutable_creation()->mutable_gap_tolerance() = ParseDurationValue(v); });
  Add("Publish", "Publish the created time-series [default: false]",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_publish(ParseBool(v)); });
  Add("Description", "Description of the created time-series", [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_description(v); });
  Add("Comment", "Comment on the created time-series", [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_comment(v); });
  Add("Method", "Monitoring method of the created time-series", [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_method(v); });
  Add("ComputationIdentifier", "Computation identifier of the created time-series",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_computation_identifier(v); });
  Add("ComputationPeriodIdentifier", "Computation period identifier of the created time-series",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_computation_period_identifier(v); });
  Add("SubLocationIdentifier", "Sub-location identifier of the created time-series",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->set_sub_location_identifier(v); });
  Add("ExtendedAttributeValue", "Extended attribute of the created time-series in COLUMN_NAME@TABLE_NAME=value syntax. Can be set multiple times.",
      [](RunConfig& c, const std::string& v) { c.mutable_creation()->add_extended_attribute_values(v); });

  AddSection("Metadata options:");
  Add("IgnoreGrades", "Ignore any specified grade codes",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->set_ignore_grades(ParseBool(v)); });
  Add("IgnoreQualifiers", "Ignore any specified qualifiers",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->set_ignore_qualifiers(ParseBool(v)); });
  Add("MappedGrades", "Grade mapping in sourceValue:mappedValue syntax. Can be set multiple times.",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->add_mapped_grades(v); });
  Add("MappedQualifiers", "Qualifier mapping in sourceValue:mappedValue syntax. Can be set multiple times.",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->add_mapped_qualifiers(v); });

  AddSection("Copy points from another time-series:");
  Add("SourceTimeSeries", "Source time-series to copy. Prefix with [server2] or [server2:username2:password2] to copy from another server",
      [](RunConfig& c, const std::string& v) { c.mutable_source()->set_time_series(v); });
  Add("SourceQueryFrom", "Start time of extracted points in ISO 8601 format",
      [](RunConfig& c, const std::string& v) { *c.mutable_source()->mutable_query_from() = ParseTimestamp(v); });
  Add("SourceQueryTo", "End time of extracted points",
      [](RunConfig& c, const std::string& v) { *c.mutable_source()->mutable_query_to() = ParseTimestamp(v); });

  AddSection("Point-generator options:");
  Add("StartTime", "Start time of generated points, in ISO 8601 format [default: the current time]",
      [](RunConfig& c, const std::string& v) { *c.mutable_generator()->mutable_start_time() = ParseTimestamp(v); });
  Add("PointInterval", "Interval between generated points [default: 00:01:00]",
      [](RunConfig& c, const std::string& v) { *c.mutable_generator()->mutable_point_interval() = ParseDurationValue(v); });
  Add("NumberOfPoints", "Number of points to generate. If 0, use NumberOfPeriods",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_number_of_points(ParseNonNegativeInt(v)); });
  Add("NumberOfPeriods", "Number of waveform periods to generate [default: 1]",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_number_of_periods(ParseNumber(v)); });
  Add("WaveformType", "Waveform to generate. " + EnumOptions(kWaveforms),
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_type(ParseEnum(kWaveforms, v, "WaveformType")); });
  Add("WaveformOffset", "Offset the generated waveform by this constant",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_offset(ParseNumber(v)); });
  Add("WaveformPhase", "Phase within one waveform period",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_phase(ParseNumber(v)); });
  Add("WaveformScalar", "Scale the waveform by this amount [default: 1]",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_scalar(ParseNumber(v)); });
  Add("WaveformPeriod", "Waveform period before repeating [default: 1440]",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_period(ParseNumber(v)); });
  Add("WaveformTextX", "Select the X values of the vectorized text",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_text_x(v); });
  Add("WaveformTextY", "Select the Y values of the vectorized text",
      [](RunConfig& c, const std::string& v) { c.mutable_waveform()->set_text_y(v); });

  AddSection("CSV parsing options:");
  Add("Csv", "Parse the CSV file", [](RunConfig& c, const std::string& v) { c.mutable_csv()->add_files(v); });
  Add("CsvFormat", "Shortcut for known CSV formats. One of 'NG', '3X', or 'PointZilla'. [default: NG]",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_format(v); });
  Add("CsvDateTimeField", "CSV column index for combined date+time timestamps",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_date_time_field(ParseNonNegativeInt(v)); });
  Add("CsvDateTimeFormat", "Format of CSV date+time fields [default: ISO 8601]",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_date_time_format(v); });
  Add("CsvDateOnlyField", "CSV column index for date-only timestamps",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_date_only_field(ParseNonNegativeInt(v)); });
  Add("CsvDateOnlyFormat", "Format of CSV date-only fields", [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_date_only_format(v); });
  Add("CsvTimeOnlyField", "CSV column index for time-only timestamps",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_time_only_field(ParseNonNegativeInt(v)); });
  Add("CsvTimeOnlyFormat", "Format of CSV time-only fields", [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_time_only_format(v); });
  Add("CsvDefaultTimeOfDay", "Time of day value when no time field is used",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_default_time_of_day(v); });
  Add("CsvValueField", "CSV column index for values",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_value_field(ParseNonNegativeInt(v)); });
  Add("CsvGradeField", "CSV column index for grade codes",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_grade_field(ParseNonNegativeInt(v)); });
  Add("CsvQualifiersField", "CSV column index for qualifiers",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_qualifiers_field(ParseNonNegativeInt(v)); });
  Add("CsvComment", "CSV comment lines begin with this prefix", [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_comment(v); });
  Add("CsvSkipRows", "Number of CSV rows to skip before parsing",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_skip_rows(ParseNonNegativeInt(v)); });
  Add("CsvIgnoreInvalidRows", "Ignore CSV rows that can't be parsed",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_ignore_invalid_rows(ParseBool(v)); });
  Add("CsvRealign", "Realign imported points to the StartTime value",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->set_realign(ParseBool(v)); });
  Add("CsvRemoveDuplicatePoints", "Remove duplicate points before appending",
      [](RunConfig& c, const std::string& v) { c.mutable_transform()->set_remove_duplicate_points(ParseBool(v)); });
  Add("CsvDelimiter", "Delimiter between CSV fields [default: ,]", [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_delimiter(v); });
  Add("CsvNanValue", "Special value text used to represent NaN values", [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_nan_value(v); });
  Add("CsvQualifierDelimiter", "Delimiter between qualifiers within the qualifiers field [default: ,]",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_qualifier_delimiter(v); });
  Add("CsvUtcOffset", "UTC offset for CSV timestamps without one, e.g. +12:00 [default: UTC]",
      [](RunConfig& c, const std::string& v) { c.mutable_csv()->set_utc_offset(v); });

  AddSection("CSV saving options:");
  Add("SaveCsvPath", "When set, saves the extracted/generated points to a CSV file. If only a directory is specified, a file name is generated.",
      [](RunConfig& c, const std::string& v) { c.mutable_save()->set_save_csv_path(v); });
  Add("StopAfterSavingCsv", "When true, stop after saving a CSV file, before appending any points",
      [](RunConfig& c, const std::string& v) { c.mutable_save()->set_stop_after_saving_csv(ParseBool(v)); });
}

const OptionParser::Option* OptionParser::Find(std::string_view key) const {
  for (const auto& option : options_) {
    if (!option.key.empty() && util::EqualsIgnoreCase(option.key, key)) return &option;
  }
  return nullptr;
}

// ------------------------------------------------------------
// Parsing
// ------------------------------------------------------------

std::vector<std::string> OptionParser::ExpandOptionFiles(const std::vector<std::string>& args) {
  std::vector<std::string> resolved;

  for (const auto& arg : args) {
    if (!util::StartsWith(arg, "@")) {
      resolved.push_back(arg);
      continue;
    }

    const auto path = arg.substr(1);
    std::ifstream in(path);
    if (!in) {
      throw ConfigurationError("Options file '" + path + "' does not exist.");
    }

    std::string line;
    while (std::getline(in, line)) {
      const auto trimmed = util::Trim(line);
      if (trimmed.empty() || util::StartsWith(trimmed, "#") || util::StartsWith(trimmed, "//")) continue;
      resolved.emplace_back(trimmed);
    }
  }

  return resolved;
}

void OptionParser::ApplyPositional(RunConfig& config, const std::string& arg) const {
  if (auto command = LookupEnum(kCommands, arg)) {
    config.mutable_append()->set_command(*command);
    return;
  }

  if (auto value = util::ParseDouble(arg)) {
    if (!std::isfinite(*value)) {
      throw ConfigurationError("Manual point value '" + arg + "' must be a finite number. Use 'gap' for a gap point.");
    }
    config.mutable_generator()->add_manual_points()->set_value(*value);
    return;
  }

  if (util::EqualsIgnoreCase(arg, "gap")) {
    config.mutable_generator()->add_manual_points()->set_gap(true);
    return;
  }

  std::error_code ec;
  if (std::filesystem::is_regular_file(arg, ec)) {
    config.mutable_csv()->add_files(arg);
    return;
  }

  if (IsUniqueId(arg) || IsIdentifier(arg)) {
    config.mutable_append()->set_time_series(arg);
    return;
  }

  throw ConfigurationError("Unknown argument: " + arg + "\n\n" + kHelpGuidance);
}

ParsedCommandLine OptionParser::Parse(const std::vector<std::string>& args) const {
  ParsedCommandLine parsed;

  for (const auto& arg : args) {
    if (IsHelpKeyword(arg)) {
      parsed.show_help = true;
      return parsed;
    }
  }

  const auto resolved = ExpandOptionFiles(args);

  std::string key;
  std::string value;

  // YAML first, in argument order.
  for (const auto& arg : resolved) {
    if (SplitOption(arg, &key, &value) && util::EqualsIgnoreCase(key, "Config")) {
      parsed.config.MergeFrom(ConfigLoader::LoadFromYaml(value));
    }
  }

  for (const auto& arg : resolved) {
    if (IsHelpKeyword(arg)) {
      parsed.show_help = true;
      return parsed;
    }

    if (!SplitOption(arg, &key, &value)) {
      ApplyPositional(parsed.config, arg);
      continue;
    }

    const auto* option = Find(key);
    if (option == nullptr) {
      throw ConfigurationError("Unknown -option=value: " + arg + "\n\n" + kHelpGuidance);
    }
    if (option->setter) {
      option->setter(parsed.config, value);
    }
  }

  return parsed;
}

std::string OptionParser::Usage(std::string_view program) const {
  std::ostringstream out;
  out << "Append points to a time-series.\n\n"
      << "usage: " << program << " [-option=value] [@optionsFile] [command] [identifierOrGuid] [value] [csvFile] ...\n\n"
      << "Supported -option=value settings (/option=value works too):\n\n";

  std::size_t width = 0;
  for (const auto& option : options_) width = std::max(width, option.key.size());

  for (const auto& option : options_) {
    if (option.key.empty()) {
      out << "\n  " << option.description << "\n";
      continue;
    }
    out << "  -" << option.key << std::string(width - option.key.size() + 1, ' ') << option.description << "\n";
  }

  out << "\nUse the @optionsFile syntax to read more options from a file.\n\n"
      << "  Each line in the file is treated as a command line option.\n"
      << "  Blank lines and leading/trailing whitespace is ignored.\n"
      << "  Comment lines begin with a # or // marker.\n";
  return out.str();
}

} // namespace pointzilla::config
