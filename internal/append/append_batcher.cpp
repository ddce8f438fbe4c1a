#include "append_batcher.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pointzilla::append {

using observability::IntField;
using observability::StringField;

AppendBatcher::AppendBatcher(std::shared_ptr<store::TimeSeriesStore> store, AppendBatchPolicy policy)
    : store_(std::move(store)), policy_(policy) {
  if (!store_) {
    throw std::invalid_argument("AppendBatcher: store is required");
  }
  if (policy_.batch_size == 0) {
    throw util::ConfigurationError("Batch size must be positive");
  }
}

std::vector<Batch> AppendBatcher::PartitionBatches(const std::vector<model::Point>& points, std::size_t batch_size,
                                                   const std::optional<util::TimeRange>& overwrite_range) {
  std::vector<Batch> batches;
  if (points.empty() || batch_size == 0) {
    return batches;
  }

  for (std::size_t begin = 0; begin < points.size();) {
    Batch batch;
    batch.begin = begin;
    batch.end   = std::min(points.size(), begin + batch_size);

    // Overwrite boundaries fall between distinct times, so a run of equal times stays in one batch.
    if (overwrite_range) {
      while (batch.end < points.size() && points[batch.end].time == points[batch.end - 1].time) ++batch.end;
    }

    batches.push_back(batch);
    begin = batch.end;
  }

  if (overwrite_range) {
    for (std::size_t k = 0; k + 1 < batches.size(); ++k) {
      const auto last_time = std::max_element(points.begin() + static_cast<std::ptrdiff_t>(batches[k].begin),
                                              points.begin() + static_cast<std::ptrdiff_t>(batches[k].end),
                                              [](const model::Point& a, const model::Point& b) { return a.time < b.time; })
                                 ->time;
      const auto next_time = points[batches[k + 1].begin].time;
      const auto next_min  = std::min_element(points.begin() + static_cast<std::ptrdiff_t>(batches[k + 1].begin),
                                             points.begin() + static_cast<std::ptrdiff_t>(batches[k + 1].end),
                                             [](const model::Point& a, const model::Point& b) { return a.time < b.time; })
                                ->time;
      if (last_time >= next_time || next_min < next_time) {
        throw util::ConfigurationError("Points must be in time order to overwrite in batches of " + std::to_string(batch_size) +
                                       ": " + util::FormatInstant(next_time) + " follows " + util::FormatInstant(last_time));
      }
    }

    for (std::size_t k = 0; k < batches.size(); ++k) {
      const bool first = k == 0;
      const bool last  = k + 1 == batches.size();

      util::TimeRange range;
      range.start = first ? overwrite_range->start : points[batches[k].begin].time;
      range.end   = last ? overwrite_range->end : points[batches[k + 1].begin].time - std::chrono::nanoseconds(1);
      batches[k].overwrite_range = range;
    }
  }

  return batches;
}

AppendOutcome AppendBatcher::Append(const std::string& unique_id, const std::vector<model::Point>& points, store::AppendMode mode,
                                    const std::optional<util::TimeRange>& overwrite_range) {
  AppendOutcome outcome;
  if (points.empty()) {
    POINTZILLA_LOG_INFO("no points to append", {StringField("unique_id", unique_id)});
    return outcome;
  }

  const auto batches = PartitionBatches(points, policy_.batch_size, overwrite_range);

  for (std::size_t k = 0; k < batches.size(); ++k) {
    const auto&               batch = batches[k];
    std::vector<model::Point> chunk(points.begin() + static_cast<std::ptrdiff_t>(batch.begin),
                                    points.begin() + static_cast<std::ptrdiff_t>(batch.end));

    POINTZILLA_LOG_INFO("appending batch", {StringField("unique_id", unique_id), StringField("mode", store::ToString(mode)),
                                            IntField("batch", static_cast<std::int64_t>(k + 1)),
                                            IntField("batches", static_cast<std::int64_t>(batches.size())),
                                            IntField("points", static_cast<std::int64_t>(chunk.size()))});

    std::string append_request_id;
    try {
      append_request_id = store_->AppendPoints(unique_id, chunk, mode, batch.overwrite_range);
    } catch (const std::runtime_error& e) {
      POINTZILLA_LOG_ERROR("batch rejected", {IntField("batch", static_cast<std::int64_t>(k + 1)),
                                              IntField("accepted_points", static_cast<std::int64_t>(outcome.points_submitted)),
                                              StringField("error", e.what())});
      throw util::AppendRejected("Batch " + std::to_string(k + 1) + " of " + std::to_string(batches.size()) + " rejected: " + e.what(),
                                 outcome.points_submitted);
    }

    outcome.points_submitted += chunk.size();
    outcome.append_request_ids.push_back(std::move(append_request_id));
  }

  if (policy_.wait) {
    WaitForCompletion(outcome);
  }

  return outcome;
}

AppendOutcome AppendBatcher::DeleteRange(const std::string& unique_id, const util::TimeRange& range) {
  AppendOutcome outcome;

  POINTZILLA_LOG_INFO("deleting points", {StringField("unique_id", unique_id), StringField("from", util::FormatInstant(range.start)),
                                          StringField("to", util::FormatInstant(range.end))});

  try {
    outcome.append_request_ids.push_back(store_->AppendPoints(unique_id, {}, store::AppendMode::kOverwrite, range));
  } catch (const std::runtime_error& e) {
    throw util::AppendRejected(std::string("Delete rejected: ") + e.what(), 0);
  }

  if (policy_.wait) {
    WaitForCompletion(outcome);
  }

  return outcome;
}

void AppendBatcher::WaitForCompletion(AppendOutcome& outcome) {
  using SteadyClock = std::chrono::steady_clock;

  const auto deadline = SteadyClock::now() + policy_.timeout;

  for (const auto& append_request_id : outcome.append_request_ids) {
    while (true) {
      const auto status = store_->GetAppendStatus(append_request_id);

      if (status.state == store::AppendState::kCompleted) {
        outcome.points_appended += status.points_appended;
        outcome.points_deleted += status.points_deleted;
        break;
      }

      if (status.state == store::AppendState::kFailed) {
        throw util::RemoteError("Append " + append_request_id + " failed: " + status.message);
      }

      const auto now = SteadyClock::now();
      if (now >= deadline) {
        POINTZILLA_LOG_WARN("timed out waiting for append completion",
                            {StringField("append_request_id", append_request_id),
                             StringField("timeout", util::FormatDuration(policy_.timeout))});
        outcome.completion = AppendCompletion::kTimedOut;
        return;
      }

      const auto remaining = std::chrono::duration_cast<util::Duration>(deadline - now);
      std::this_thread::sleep_for(std::min(policy_.poll_interval, remaining));
    }
  }

  outcome.completion = AppendCompletion::kCompleted;
  POINTZILLA_LOG_INFO("append completed", {IntField("points_appended", static_cast<std::int64_t>(outcome.points_appended)),
                                           IntField("points_deleted", static_cast<std::int64_t>(outcome.points_deleted))});
}

} // namespace pointzilla::append
