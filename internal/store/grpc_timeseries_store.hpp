#pragma once

#include <memory>

#include "client/cpp/timeseries_client.h"
#include "internal/store/timeseries_store.hpp"

namespace pointzilla::store {

/*
  TimeSeriesStore over the TimeSeriesService gRPC client.
*/
class GrpcTimeSeriesStore final : public TimeSeriesStore {
 public:
  explicit GrpcTimeSeriesStore(std::shared_ptr<timeseries::client::TimeSeriesClient> client);

  SeriesDescriptor ResolveSeries(const std::string& identifier_or_unique_id) override;
  SeriesDescriptor CreateSeries(const std::string& identifier, const SeriesCreation& creation) override;

  std::string AppendPoints(const std::string& unique_id, const std::vector<model::Point>& points, AppendMode mode,
                           const std::optional<util::TimeRange>& overwrite_range) override;

  AppendStatus GetAppendStatus(const std::string& append_request_id) override;

  std::vector<model::Point> GetSeriesPoints(const std::string& unique_id, const std::optional<util::TimePoint>& from,
                                            const std::optional<util::TimePoint>& to) override;

 private:
  std::shared_ptr<timeseries::client::TimeSeriesClient> client_;
};

// Connects lazily per endpoint: one channel per created store.
StoreFactory MakeGrpcStoreFactory();

} // namespace pointzilla::store
