#include "points_appender.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/sink/csv_writer.hpp"
#include "internal/sources/csv_ingestor.hpp"
#include "internal/sources/manual_points.hpp"
#include "internal/sources/source_copy.hpp"
#include "internal/sources/waveform_generator.hpp"
#include "internal/transform/point_pipeline.hpp"
#include "internal/util/errors.hpp"

namespace pointzilla::core {

using config::CommandType;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

void Concat(std::vector<model::Point>& points, std::vector<model::Point> more) {
  points.insert(points.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

} // namespace

store::SeriesDescriptor PointsAppender::ResolveOrCreate(store::TimeSeriesStore& store) const {
  try {
    return store.ResolveSeries(context_.time_series);
  } catch (const util::NotFound&) {
    if (!context_.creation) throw;
  }

  auto series = store.CreateSeries(context_.time_series, *context_.creation);
  POINTZILLA_LOG_INFO("time-series created", {StringField("time_series", series.identifier), StringField("unique_id", series.unique_id),
                                              StringField("unit", context_.creation->unit)});
  return series;
}

PointsAppender::PointsAppender(const config::RunContext& context, store::StoreFactory factory)
    : context_(context), factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("PointsAppender: store factory is required");
  }
}

CommandType PointsAppender::ResolveCommand(CommandType requested, store::SeriesType series_type, bool has_time_range) {
  if (requested != CommandType::kAuto) {
    return requested;
  }
  if (series_type == store::SeriesType::kReflected) {
    return CommandType::kReflected;
  }
  return has_time_range ? CommandType::kOverwriteAppend : CommandType::kAppend;
}

std::optional<util::TimeRange> PointsAppender::PointsRange(const std::vector<model::Point>& points) {
  if (points.empty()) {
    return std::nullopt;
  }

  const auto [min_it, max_it] =
      std::minmax_element(points.begin(), points.end(), [](const model::Point& a, const model::Point& b) { return a.time < b.time; });
  return util::TimeRange{min_it->time, max_it->time};
}

std::vector<model::Point> PointsAppender::CollectPoints() const {
  std::vector<model::Point> points;

  if (context_.manual_points) {
    Concat(points, sources::CollectManualPoints(*context_.manual_points));
  }

  if (context_.waveform) {
    const sources::WaveformGenerator generator(*context_.waveform);
    auto                             generated = generator.Generate();
    POINTZILLA_LOG_INFO("waveform generated", {IntField("points", static_cast<std::int64_t>(generated.size())),
                                               DoubleField("samples_per_period", generator.SamplesPerPeriod())});
    Concat(points, std::move(generated));
  }

  if (!context_.csv_files.empty()) {
    const sources::CsvIngestor ingestor(context_.csv_format);
    for (const auto& path : context_.csv_files) {
      Concat(points, ingestor.IngestFile(path).points);
    }
  }

  if (context_.source) {
    const sources::SourceCopyExtractor extractor(factory_, context_.server);
    Concat(points, extractor.Extract(*context_.source));
  }

  return transform::ApplyTransforms(std::move(points), context_.transform);
}

RunResult PointsAppender::Run() {
  RunResult result;
  result.command = context_.command;

  std::vector<model::Point> points;
  if (context_.command != CommandType::kDeleteAllPoints) {
    points                  = CollectPoints();
    result.points_generated = points.size();
    POINTZILLA_LOG_INFO("points collected", {IntField("points", static_cast<std::int64_t>(points.size()))});
  }

  if (!context_.save_csv_path.empty()) {
    const sink::CsvWriter writer(context_.time_series, context_.csv_format.delimiter, context_.csv_format.qualifier_delimiter);
    result.saved_csv_path = writer.Save(context_.save_csv_path, points);

    if (context_.stop_after_saving_csv) {
      return result;
    }
  }

  if (!context_.server) {
    throw util::ConfigurationError("A Server option is required");
  }

  auto       store  = factory_(*context_.server);
  const auto series = ResolveOrCreate(*store);

  result.command = ResolveCommand(context_.command, series.type, context_.time_range.has_value());

  POINTZILLA_LOG_INFO("target resolved", {StringField("time_series", series.identifier), StringField("unique_id", series.unique_id),
                                          StringField("command", config::ToString(result.command))});

  append::AppendBatcher batcher(store, context_.batch_policy);

  switch (result.command) {
    case CommandType::kDeleteAllPoints: {
      const auto range = context_.time_range.value_or(util::TimeRange{util::MinRepresentable(), util::MaxRepresentable()});
      result.append_outcome = batcher.DeleteRange(series.unique_id, range);
      break;
    }

    case CommandType::kOverwriteAppend:
    case CommandType::kReflected: {
      const auto range = context_.time_range ? context_.time_range : PointsRange(points);
      const auto mode  = result.command == CommandType::kReflected ? store::AppendMode::kReflected : store::AppendMode::kOverwrite;
      result.append_outcome = batcher.Append(series.unique_id, points, mode, range);
      break;
    }

    case CommandType::kAppend:
    case CommandType::kAuto:
    default:
      result.append_outcome = batcher.Append(series.unique_id, points, store::AppendMode::kAppend, std::nullopt);
      break;
  }

  result.points_delivered = result.append_outcome->points_submitted;
  return result;
}

} // namespace pointzilla::core
