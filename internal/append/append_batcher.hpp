#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::append {

struct AppendBatchPolicy {
  std::size_t    batch_size    = 500000;
  bool           wait          = true;
  util::Duration timeout       = std::chrono::minutes(5);
  util::Duration poll_interval = std::chrono::seconds(1);
};

enum class AppendCompletion {
  kNotRequested,
  kCompleted,
  kTimedOut,
};

constexpr std::string_view ToString(AppendCompletion completion) {
  switch (completion) {
    case AppendCompletion::kCompleted:
      return "completed";
    case AppendCompletion::kTimedOut:
      return "timed_out";
    case AppendCompletion::kNotRequested:
    default:
      return "not_requested";
  }
}

struct AppendOutcome {
  std::size_t              points_submitted = 0;
  std::vector<std::string> append_request_ids;
  AppendCompletion         completion = AppendCompletion::kNotRequested;

  // As reported by the store once completed.
  std::size_t points_appended = 0;
  std::size_t points_deleted  = 0;
};

// Half-open index span [begin, end) into the point stream.
struct Batch {
  std::size_t                    begin = 0;
  std::size_t                    end   = 0;
  std::optional<util::TimeRange> overwrite_range;
};

/*
  Chunked, sequential delivery to a TimeSeriesStore.

  One request per batch. With an overwrite range the batch ranges tile it
  exactly: batches split only between distinct times, and points that are not
  in time order across a batch boundary are a util::ConfigurationError. A rejected batch stops submission and throws util::AppendRejected
  with the count accepted by earlier batches. The optional completion wait
  shares a single deadline across all append ids.
*/
class AppendBatcher {
 public:
  AppendBatcher(std::shared_ptr<store::TimeSeriesStore> store, AppendBatchPolicy policy);

  // Zero points makes no request.
  AppendOutcome Append(const std::string& unique_id, const std::vector<model::Point>& points, store::AppendMode mode,
                       const std::optional<util::TimeRange>& overwrite_range);

  // A single empty overwrite over the range.
  AppendOutcome DeleteRange(const std::string& unique_id, const util::TimeRange& range);

  static std::vector<Batch> PartitionBatches(const std::vector<model::Point>& points, std::size_t batch_size,
                                             const std::optional<util::TimeRange>& overwrite_range);

  const AppendBatchPolicy& policy() const {
    return policy_;
  }

 private:
  void WaitForCompletion(AppendOutcome& outcome);

  std::shared_ptr<store::TimeSeriesStore> store_;
  AppendBatchPolicy                       policy_;
};

} // namespace pointzilla::append
