#include "run_context.hpp"

#include <cmath>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace pointzilla::config {

namespace cfg = pointzilla::runtime::config;

using util::ConfigurationError;

namespace {

constexpr std::size_t kDefaultBatchSize     = 500000;
constexpr double      kDefaultPeriodSamples = 1440.0;

CommandType FromProto(cfg::CommandType command) {
  switch (command) {
    case cfg::COMMAND_TYPE_APPEND:
      return CommandType::kAppend;
    case cfg::COMMAND_TYPE_OVERWRITE_APPEND:
      return CommandType::kOverwriteAppend;
    case cfg::COMMAND_TYPE_REFLECTED:
      return CommandType::kReflected;
    case cfg::COMMAND_TYPE_DELETE_ALL_POINTS:
      return CommandType::kDeleteAllPoints;
    case cfg::COMMAND_TYPE_AUTO:
    default:
      return CommandType::kAuto;
  }
}

sources::WaveformShape FromProto(cfg::WaveformType type) {
  switch (type) {
    case cfg::WAVEFORM_TYPE_SQUARE_WAVE:
      return sources::WaveformShape::kSquareWave;
    case cfg::WAVEFORM_TYPE_SAW_TOOTH:
      return sources::WaveformShape::kSawTooth;
    case cfg::WAVEFORM_TYPE_SINE_WAVE:
    default:
      return sources::WaveformShape::kSineWave;
  }
}

util::TimePoint Instant(const google::protobuf::Timestamp& value, const char* name) {
  if (!util::IsRepresentable(value)) {
    throw ConfigurationError(std::string(name) + " must lie between " + util::FormatInstant(util::MinRepresentable()) + " and " +
                             util::FormatInstant(util::MaxRepresentable()));
  }
  return util::FromProto(value);
}

util::Duration Span(const google::protobuf::Duration& value, const char* name) {
  if (!util::IsRepresentable(value)) {
    throw ConfigurationError(std::string(name) + " is out of range");
  }
  return util::FromProto(value);
}

util::Duration PositiveDuration(bool has_value, const google::protobuf::Duration& value, util::Duration fallback, const char* name) {
  if (!has_value) return fallback;
  const auto duration = Span(value, name);
  if (duration <= util::Duration::zero()) {
    throw ConfigurationError(std::string(name) + " must be positive");
  }
  return duration;
}

std::size_t ColumnIndex(std::int32_t value, const char* name) {
  if (value < 0) {
    throw ConfigurationError(std::string(name) + " must not be negative");
  }
  return static_cast<std::size_t>(value);
}

char ParseDelimiter(const std::string& text) {
  if (text.empty()) return ',';
  if (text.size() == 1) return text.front();
  if (text == "\\t" || util::EqualsIgnoreCase(text, "tab")) return '\t';
  throw ConfigurationError("CSV delimiter '" + text + "' must be a single character");
}

std::optional<store::ServerEndpoint> BuildServer(const cfg::RunConfig& config) {
  const auto& server = config.server();
  if (util::Trim(server.address()).empty()) {
    return std::nullopt;
  }

  store::ServerEndpoint endpoint;
  endpoint.address       = std::string(util::Trim(server.address()));
  endpoint.username      = server.username();
  endpoint.password      = server.password();
  endpoint.session_token = server.session_token();
  endpoint.use_tls       = server.use_tls();
  endpoint.rpc_timeout   = PositiveDuration(server.has_rpc_timeout(), server.rpc_timeout(), std::chrono::seconds(60), "RpcTimeout");
  return endpoint;
}

append::AppendBatchPolicy BuildBatchPolicy(const cfg::AppendConfig& append) {
  append::AppendBatchPolicy policy;

  if (append.batch_size() < 0) {
    throw ConfigurationError("BatchSize must be positive");
  }
  policy.batch_size    = append.batch_size() == 0 ? kDefaultBatchSize : static_cast<std::size_t>(append.batch_size());
  policy.wait          = append.has_wait() ? append.wait() : true;
  policy.timeout       = PositiveDuration(append.has_append_timeout(), append.append_timeout(), std::chrono::minutes(5), "AppendTimeout");
  policy.poll_interval = PositiveDuration(append.has_poll_interval(), append.poll_interval(), std::chrono::seconds(1), "PollInterval");
  return policy;
}

std::optional<util::TimeRange> BuildTimeRange(const cfg::AppendConfig& append) {
  if (!append.has_time_range()) {
    return std::nullopt;
  }

  const auto& range = append.time_range();
  if (!range.has_start() || !range.has_end()) {
    throw ConfigurationError("TimeRange needs both a start and an end");
  }

  util::TimeRange out{Instant(range.start(), "TimeRange start"), Instant(range.end(), "TimeRange end")};
  if (out.end < out.start) {
    throw ConfigurationError("Invalid TimeRange: start " + util::FormatInstant(out.start) + " must not be after end " +
                             util::FormatInstant(out.end));
  }
  return out;
}

std::optional<sources::ManualPointSpec> BuildManualPoints(const cfg::GeneratorConfig& generator, util::TimePoint start,
                                                          util::Duration interval) {
  if (generator.manual_points_size() == 0) {
    return std::nullopt;
  }

  sources::ManualPointSpec spec;
  spec.start_time = start;
  spec.interval   = interval;
  for (const auto& literal : generator.manual_points()) {
    switch (literal.kind_case()) {
      case cfg::ManualPoint::kValue:
        if (!std::isfinite(literal.value())) {
          throw ConfigurationError("Manual point values must be finite numbers");
        }
        spec.literals.emplace_back(literal.value());
        break;
      case cfg::ManualPoint::kGap:
        spec.literals.emplace_back(std::nullopt);
        break;
      default:
        throw ConfigurationError("Manual point needs a value or gap");
    }
  }

  if (generator.has_grade_code()) {
    spec.grade_code = generator.grade_code();
  }
  spec.qualifiers.assign(generator.qualifiers().begin(), generator.qualifiers().end());
  return spec;
}

sources::WaveformSpec BuildWaveform(const cfg::WaveformConfig& waveform, const cfg::GeneratorConfig& generator, util::TimePoint start,
                                    util::Duration interval) {
  sources::WaveformSpec spec;
  spec.shape      = FromProto(waveform.type());
  spec.start_time = start;
  spec.interval   = interval;

  if (generator.has_grade_code()) {
    spec.grade_code = generator.grade_code();
  }
  spec.qualifiers.assign(generator.qualifiers().begin(), generator.qualifiers().end());

  if (waveform.number_of_points() < 0) {
    throw ConfigurationError("NumberOfPoints must not be negative");
  }
  spec.number_of_points = static_cast<std::size_t>(waveform.number_of_points());

  spec.number_of_periods = waveform.has_number_of_periods() ? waveform.number_of_periods() : 1.0;
  if (spec.number_of_periods < 0) {
    throw ConfigurationError("NumberOfPeriods must not be negative");
  }

  spec.samples_per_period = waveform.has_period() ? waveform.period() : kDefaultPeriodSamples;
  if (!(spec.samples_per_period > 0)) {
    throw ConfigurationError("WaveformPeriod must be positive");
  }

  spec.scalar = waveform.has_scalar() ? waveform.scalar() : 1.0;
  spec.offset = waveform.offset();
  spec.phase  = waveform.phase();

  if (!waveform.text_x().empty() && !waveform.text_y().empty()) {
    throw ConfigurationError("Only one of WaveformTextX and WaveformTextY can be set");
  }
  if (!waveform.text_x().empty() || !waveform.text_y().empty()) {
    spec.shape        = sources::WaveformShape::kText;
    spec.text         = waveform.text_x().empty() ? waveform.text_y() : waveform.text_x();
    spec.text_channel = waveform.text_x().empty() ? sources::TextChannel::kY : sources::TextChannel::kX;
  }

  return spec;
}

store::InterpolationType ParseInterpolationType(const std::string& text) {
  static const std::pair<const char*, store::InterpolationType> kNames[] = {
      {"InstantaneousValues", store::InterpolationType::kInstantaneousValues},
      {"PrecedingConstant", store::InterpolationType::kPrecedingConstant},
      {"PrecedingTotals", store::InterpolationType::kPrecedingTotals},
      {"InstantaneousTotals", store::InterpolationType::kInstantaneousTotals},
      {"DiscreteValues", store::InterpolationType::kDiscreteValues},
      {"SucceedingConstant", store::InterpolationType::kSucceedingConstant},
  };

  const auto name = util::Trim(text);
  if (name.empty()) return store::InterpolationType::kInstantaneousValues;
  for (const auto& [label, type] : kNames) {
    if (util::EqualsIgnoreCase(name, label)) return type;
  }
  throw ConfigurationError("'" + text + "' is not a known InterpolationType");
}

std::optional<store::SeriesCreation> BuildCreation(const cfg::CreationConfig& creation, const std::string& time_series) {
  if (creation.create_mode() == cfg::CREATE_MODE_NEVER) {
    return std::nullopt;
  }

  if (!time_series.empty() && time_series.find('@') == std::string::npos) {
    throw ConfigurationError("Can't create time-series '" + time_series + "': expected Parameter.Label@Location");
  }

  store::SeriesCreation out;
  out.type               = creation.create_mode() == cfg::CREATE_MODE_REFLECTED ? store::SeriesType::kReflected : store::SeriesType::kBasic;
  out.unit               = std::string(util::Trim(creation.unit()));
  out.interpolation_type = ParseInterpolationType(creation.interpolation_type());

  if (!creation.utc_offset().empty()) {
    const auto offset = util::ParseUtcOffset(creation.utc_offset());
    if (!offset) {
      throw ConfigurationError("'" + creation.utc_offset() + "' is not a valid UTC offset");
    }
    out.utc_offset = *offset;
  }

  if (creation.has_gap_tolerance()) {
    out.gap_tolerance = Span(creation.gap_tolerance(), "GapTolerance");
    if (*out.gap_tolerance < util::Duration::zero()) {
      throw ConfigurationError("GapTolerance must not be negative");
    }
  }

  out.publish                       = creation.publish();
  out.description                   = creation.description();
  out.comment                       = creation.comment();
  out.method                        = creation.method();
  out.computation_identifier        = creation.computation_identifier();
  out.computation_period_identifier = creation.computation_period_identifier();
  out.sub_location_identifier       = creation.sub_location_identifier();

  for (const auto& text : creation.extended_attribute_values()) {
    const auto equals = text.find('=');
    const auto at     = text.find('@');
    if (equals == std::string::npos || at == std::string::npos || at == 0 || at + 1 >= equals) {
      throw ConfigurationError("ExtendedAttributeValue '" + text + "' must be COLUMN_NAME@TABLE_NAME=value");
    }
    const std::string key(util::Trim(std::string_view(text).substr(0, equals)));
    out.extended_attributes[key] = text.substr(equals + 1);
  }

  return out;
}

sources::ColumnFormatSpec BuildCsvFormat(const cfg::CsvConfig& csv) {
  auto spec = sources::ColumnFormatSpec::Preset(csv.format());

  if (csv.has_date_time_field()) spec.date_time_field = ColumnIndex(csv.date_time_field(), "CsvDateTimeField");
  if (csv.has_date_time_format()) spec.date_time_format = csv.date_time_format();
  if (csv.has_date_only_field()) spec.date_only_field = ColumnIndex(csv.date_only_field(), "CsvDateOnlyField");
  if (csv.has_date_only_format()) spec.date_only_format = csv.date_only_format();
  if (csv.has_time_only_field()) spec.time_only_field = ColumnIndex(csv.time_only_field(), "CsvTimeOnlyField");
  if (csv.has_time_only_format()) spec.time_only_format = csv.time_only_format();
  if (csv.has_value_field()) spec.value_field = ColumnIndex(csv.value_field(), "CsvValueField");
  if (csv.has_grade_field()) spec.grade_field = ColumnIndex(csv.grade_field(), "CsvGradeField");
  if (csv.has_qualifiers_field()) spec.qualifiers_field = ColumnIndex(csv.qualifiers_field(), "CsvQualifiersField");
  if (csv.has_comment()) spec.comment = csv.comment();
  if (csv.has_skip_rows()) spec.skip_rows = ColumnIndex(csv.skip_rows(), "CsvSkipRows");
  if (csv.has_ignore_invalid_rows()) spec.ignore_invalid_rows = csv.ignore_invalid_rows();
  if (csv.has_delimiter()) spec.delimiter = ParseDelimiter(csv.delimiter());
  if (csv.has_nan_value()) spec.nan_value = csv.nan_value();
  if (csv.has_qualifier_delimiter()) spec.qualifier_delimiter = csv.qualifier_delimiter();

  // A date+time column set explicitly replaces a preset date/time pair, and vice versa.
  if (csv.has_date_time_field() && spec.date_time_field > 0 && !csv.has_date_only_field()) {
    spec.date_only_field = 0;
    spec.time_only_field = 0;
  }
  if (csv.has_date_only_field() && spec.date_only_field > 0 && !csv.has_date_time_field()) {
    spec.date_time_field = 0;
  }

  if (csv.has_default_time_of_day()) {
    const auto time_of_day = util::ParseDuration(csv.default_time_of_day());
    if (!time_of_day || *time_of_day < util::Duration::zero() || *time_of_day >= std::chrono::hours(24)) {
      throw ConfigurationError("CsvDefaultTimeOfDay '" + csv.default_time_of_day() + "' is not a valid time of day");
    }
    spec.default_time_of_day = *time_of_day;
  }

  if (!csv.utc_offset().empty()) {
    const auto offset = util::ParseUtcOffset(csv.utc_offset());
    if (!offset) {
      throw ConfigurationError("'" + csv.utc_offset() + "' is not a valid UTC offset");
    }
    spec.utc_offset = *offset;
  }

  spec.Validate();
  return spec;
}

} // namespace

std::string_view ToString(CommandType command) {
  switch (command) {
    case CommandType::kAppend:
      return "Append";
    case CommandType::kOverwriteAppend:
      return "OverwriteAppend";
    case CommandType::kReflected:
      return "Reflected";
    case CommandType::kDeleteAllPoints:
      return "DeleteAllPoints";
    case CommandType::kAuto:
    default:
      return "Auto";
  }
}

RunContext BuildRunContext(const cfg::RunConfig& config) {
  RunContext context;

  context.server       = BuildServer(config);
  context.time_series  = std::string(util::Trim(config.append().time_series()));
  context.command      = FromProto(config.append().command());
  context.time_range   = BuildTimeRange(config.append());
  context.batch_policy = BuildBatchPolicy(config.append());
  context.creation     = BuildCreation(config.creation(), context.time_series);

  const auto& generator = config.generator();
  context.start_time    = generator.has_start_time() ? Instant(generator.start_time(), "StartTime") : util::Now();
  if (generator.has_point_interval()) {
    context.point_interval = Span(generator.point_interval(), "PointInterval");
    if (context.point_interval < util::Duration::zero()) {
      throw ConfigurationError("PointInterval must not be negative");
    }
  }

  context.manual_points = BuildManualPoints(generator, context.start_time, context.point_interval);

  context.csv_files.assign(config.csv().files().begin(), config.csv().files().end());
  context.csv_format = BuildCsvFormat(config.csv());

  if (!util::Trim(config.source().time_series()).empty()) {
    auto source = sources::SourceCopySpec::Parse(config.source().time_series());
    if (config.source().has_query_from()) source.query_from = Instant(config.source().query_from(), "SourceQueryFrom");
    if (config.source().has_query_to()) source.query_to = Instant(config.source().query_to(), "SourceQueryTo");
    if (source.query_from && source.query_to && *source.query_to < *source.query_from) {
      throw ConfigurationError("SourceQueryFrom must not be after SourceQueryTo");
    }
    if (!source.server && !context.server) {
      throw ConfigurationError("A Server option is required to load the source time-series");
    }
    context.source = std::move(source);
  }

  const bool other_sources = context.manual_points || !context.csv_files.empty() || context.source;
  if (config.has_waveform() || !other_sources) {
    context.waveform = BuildWaveform(config.waveform(), generator, context.start_time, context.point_interval);
  }

  const auto& transform                     = config.transform();
  context.transform.ignore_grades           = transform.ignore_grades();
  context.transform.ignore_qualifiers       = transform.ignore_qualifiers();
  context.transform.remove_duplicate_points = transform.remove_duplicate_points();
  for (const auto& rule : transform.mapped_grades()) context.transform.grade_mapping.AddRule(rule);
  for (const auto& rule : transform.mapped_qualifiers()) context.transform.qualifier_mapping.AddRule(rule);
  if (transform.realign()) {
    context.transform.realign_to = context.start_time;
  }

  context.save_csv_path         = config.save().save_csv_path();
  context.stop_after_saving_csv = config.save().stop_after_saving_csv();
  if (!context.server && context.time_series.empty() && !context.save_csv_path.empty()) {
    context.stop_after_saving_csv = true;
  }
  if (context.stop_after_saving_csv && context.save_csv_path.empty()) {
    throw ConfigurationError("StopAfterSavingCsv needs a SaveCsvPath");
  }

  if (!context.stop_after_saving_csv) {
    if (!context.server) {
      throw ConfigurationError("A Server option is required");
    }
    if (context.time_series.empty()) {
      throw ConfigurationError("A TimeSeries option is required");
    }
  }

  return context;
}

} // namespace pointzilla::config
