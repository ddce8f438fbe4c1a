#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::store {

struct ServerEndpoint {
  std::string address;
  std::string username;
  std::string password;
  std::string session_token;
  bool        use_tls = false;

  util::Duration rpc_timeout = std::chrono::seconds(60);
};

enum class SeriesType {
  kBasic,
  kReflected,
  kCalculated,
};

struct SeriesDescriptor {
  std::string unique_id;
  std::string identifier;
  SeriesType  type = SeriesType::kBasic;
};

enum class InterpolationType {
  kInstantaneousValues,
  kPrecedingConstant,
  kPrecedingTotals,
  kInstantaneousTotals,
  kDiscreteValues,
  kSucceedingConstant,
};

// Attributes of a series created when the target does not exist.
struct SeriesCreation {
  SeriesType        type = SeriesType::kBasic;
  std::string       unit;
  InterpolationType interpolation_type = InterpolationType::kInstantaneousValues;
  util::Duration    utc_offset{0};

  std::optional<util::Duration> gap_tolerance;

  bool        publish = false;
  std::string description;
  std::string comment;
  std::string method;
  std::string computation_identifier;
  std::string computation_period_identifier;
  std::string sub_location_identifier;

  // "COLUMN_NAME@TABLE_NAME" to value.
  std::map<std::string, std::string> extended_attributes;
};

enum class AppendMode {
  kAppend,
  kOverwrite,
  kReflected,
};

constexpr std::string_view ToString(AppendMode mode) {
  switch (mode) {
    case AppendMode::kOverwrite:
      return "overwrite";
    case AppendMode::kReflected:
      return "reflected";
    case AppendMode::kAppend:
    default:
      return "append";
  }
}

enum class AppendState {
  kPending,
  kCompleted,
  kFailed,
};

struct AppendStatus {
  AppendState state           = AppendState::kPending;
  std::size_t points_appended = 0;
  std::size_t points_deleted  = 0;
  std::string message;
};

/*
  Remote time-series store.

  Failures are thrown: util::NotFound for unknown series, util::RemoteError
  for everything else.
*/
class TimeSeriesStore {
 public:
  virtual ~TimeSeriesStore() = default;

  // Accepts an identifier ("Parameter.Label@Location") or a unique id.
  virtual SeriesDescriptor ResolveSeries(const std::string& identifier_or_unique_id) = 0;

  // Creates the series named by identifier ("Parameter.Label@Location").
  virtual SeriesDescriptor CreateSeries(const std::string& identifier, const SeriesCreation& creation) = 0;

  // Returns the append request id used to poll for completion.
  virtual std::string AppendPoints(const std::string& unique_id, const std::vector<model::Point>& points, AppendMode mode,
                                   const std::optional<util::TimeRange>& overwrite_range) = 0;

  virtual AppendStatus GetAppendStatus(const std::string& append_request_id) = 0;

  // Unset bounds mean the full extent of the series.
  virtual std::vector<model::Point> GetSeriesPoints(const std::string& unique_id, const std::optional<util::TimePoint>& from,
                                                    const std::optional<util::TimePoint>& to) = 0;
};

using StoreFactory = std::function<std::shared_ptr<TimeSeriesStore>(const ServerEndpoint&)>;

} // namespace pointzilla::store
