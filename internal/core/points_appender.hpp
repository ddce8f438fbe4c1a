#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/append/append_batcher.hpp"
#include "internal/config/run_context.hpp"
#include "internal/model/point.hpp"
#include "internal/store/timeseries_store.hpp"

namespace pointzilla::core {

struct RunResult {
  config::CommandType command = config::CommandType::kAuto; // as executed

  std::size_t                          points_generated = 0;
  std::size_t                          points_delivered = 0;
  std::optional<append::AppendOutcome> append_outcome;
  std::optional<std::string>           saved_csv_path;
};

/*
  Pipeline entry point for one run.

  Collects and transforms points, writes the CSV sink, then resolves (or
  creates) the target series and delivers through the AppendBatcher.
*/
class PointsAppender {
 public:
  PointsAppender(const config::RunContext& context, store::StoreFactory factory);

  RunResult Run();

  // Sources in fixed order (manual, waveform, CSV files, source copy), transformed.
  std::vector<model::Point> CollectPoints() const;

  static config::CommandType ResolveCommand(config::CommandType requested, store::SeriesType series_type, bool has_time_range);

  // [min time, max time] of the points. Empty input has no range.
  static std::optional<util::TimeRange> PointsRange(const std::vector<model::Point>& points);

 private:
  // Creates the target on NotFound when the run configures creation.
  store::SeriesDescriptor ResolveOrCreate(store::TimeSeriesStore& store) const;

  const config::RunContext& context_;
  store::StoreFactory       factory_;
};

} // namespace pointzilla::core
