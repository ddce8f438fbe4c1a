#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/append/append_batcher.hpp"
#include "internal/sources/csv_ingestor.hpp"
#include "internal/sources/manual_points.hpp"
#include "internal/sources/source_copy.hpp"
#include "internal/sources/waveform_generator.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/transform/point_pipeline.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::config {

enum class CommandType {
  kAuto,
  kAppend,
  kOverwriteAppend,
  kReflected,
  kDeleteAllPoints,
};

std::string_view ToString(CommandType command);

/*
  Validated, immutable view of one run.

  Built once from RunConfig; components read from it and never modify it.
*/
struct RunContext {
  std::optional<store::ServerEndpoint> server;

  std::string                    time_series;
  CommandType                    command = CommandType::kAuto;
  std::optional<util::TimeRange> time_range;
  append::AppendBatchPolicy      batch_policy;

  // Set when a missing target series should be created.
  std::optional<store::SeriesCreation> creation;

  util::TimePoint start_time{};
  util::Duration  point_interval = std::chrono::minutes(1);

  // Sources, collected in this order.
  std::optional<sources::ManualPointSpec>  manual_points;
  std::optional<sources::WaveformSpec>     waveform;
  std::vector<std::string>                 csv_files;
  sources::ColumnFormatSpec                csv_format;
  std::optional<sources::SourceCopySpec>   source;

  transform::TransformOptions transform;

  std::string save_csv_path;
  bool        stop_after_saving_csv = false;
};

// Throws util::ConfigurationError before any IO or network.
RunContext BuildRunContext(const pointzilla::runtime::config::RunConfig& config);

} // namespace pointzilla::config
