#include "internal/append/append_batcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/unit/fake_timeseries_store.hpp"

namespace {

using namespace std::chrono_literals;

using pointzilla::append::AppendBatcher;
using pointzilla::append::AppendBatchPolicy;
using pointzilla::append::AppendCompletion;
using pointzilla::model::Point;
using pointzilla::store::AppendMode;
using pointzilla::store::AppendState;
using pointzilla::testing::FakeTimeSeriesStore;
using pointzilla::util::TimePoint;
using pointzilla::util::TimeRange;

TimePoint At(std::int64_t minutes) {
  return TimePoint{} + std::chrono::minutes(minutes);
}

std::vector<Point> MakePoints(std::size_t count) {
  std::vector<Point> points;
  for (std::size_t i = 0; i < count; ++i) {
    points.push_back(Point::Value(At(static_cast<std::int64_t>(i)), static_cast<double>(i)));
  }
  return points;
}

AppendBatchPolicy Policy(std::size_t batch_size, bool wait) {
  AppendBatchPolicy policy;
  policy.batch_size    = batch_size;
  policy.wait          = wait;
  policy.timeout       = 200ms;
  policy.poll_interval = 1ms;
  return policy;
}

void TestBatchesAreSubmittedInOrder() {
  auto          store = std::make_shared<FakeTimeSeriesStore>();
  AppendBatcher batcher(store, Policy(100, false));

  const auto outcome = batcher.Append("uid", MakePoints(250), AppendMode::kAppend, std::nullopt);

  assert(store->appends.size() == 3);
  assert(store->appends[0].points.size() == 100);
  assert(store->appends[1].points.size() == 100);
  assert(store->appends[2].points.size() == 50);
  assert(store->appends[1].points.front().value == 100);
  assert(store->appends[2].points.back().value == 249);
  assert(!store->appends[0].overwrite_range);

  assert(outcome.points_submitted == 250);
  assert(outcome.append_request_ids.size() == 3);
  assert(outcome.completion == AppendCompletion::kNotRequested);
  assert(store->status_calls == 0);
}

void TestRejectedBatchStopsSubmission() {
  auto store = std::make_shared<FakeTimeSeriesStore>();
  store->FailAppendCall(2);
  AppendBatcher batcher(store, Policy(100, true));

  bool threw = false;
  try {
    (void)batcher.Append("uid", MakePoints(250), AppendMode::kAppend, std::nullopt);
  } catch (const pointzilla::util::AppendRejected& e) {
    threw = true;
    assert(e.accepted_points() == 100);
  }
  assert(threw);
  assert(store->append_attempts == 2);
  assert(store->appends.size() == 1);
  assert(store->status_calls == 0);
}

void TestZeroPointsMakesNoRequest() {
  auto          store = std::make_shared<FakeTimeSeriesStore>();
  AppendBatcher batcher(store, Policy(100, true));

  const auto outcome = batcher.Append("uid", {}, AppendMode::kOverwrite, TimeRange{At(0), At(10)});
  assert(outcome.points_submitted == 0);
  assert(outcome.append_request_ids.empty());
  assert(store->append_attempts == 0);
}

void TestOverwriteRangesTileTheRequestedRange() {
  const auto points  = MakePoints(5);
  const auto range   = TimeRange{At(-10), At(100)};
  const auto batches = AppendBatcher::PartitionBatches(points, 2, range);

  assert(batches.size() == 3);
  assert(batches[0].overwrite_range->start == At(-10));
  assert(batches[0].overwrite_range->end == At(2) - 1ns);
  assert(batches[1].overwrite_range->start == At(2));
  assert(batches[1].overwrite_range->end == At(4) - 1ns);
  assert(batches[2].overwrite_range->start == At(4));
  assert(batches[2].overwrite_range->end == At(100));

  const auto single = AppendBatcher::PartitionBatches(points, 10, range);
  assert(single.size() == 1);
  assert(single[0].end == 5);
  assert(single[0].overwrite_range->start == At(-10));
  assert(single[0].overwrite_range->end == At(100));
}

void TestEqualTimesStayInOneOverwriteBatch() {
  std::vector<Point> points = {Point::Value(At(0), 1), Point::Gap(At(0)), Point::Value(At(1), 2)};
  const auto         range  = TimeRange{At(0), At(1)};

  const auto batches = AppendBatcher::PartitionBatches(points, 1, range);
  assert(batches.size() == 2);
  assert(batches[0].begin == 0 && batches[0].end == 2);
  assert(batches[1].begin == 2 && batches[1].end == 3);

  for (const auto& batch : batches) {
    assert(batch.overwrite_range->start <= batch.overwrite_range->end);
    for (std::size_t i = batch.begin; i < batch.end; ++i) {
      assert(points[i].time >= batch.overwrite_range->start);
      assert(points[i].time <= batch.overwrite_range->end);
    }
  }
  assert(batches[0].overwrite_range->end == At(1) - 1ns);
  assert(batches[1].overwrite_range->start == At(1));

  // Plain appends keep exact batch sizes.
  assert(AppendBatcher::PartitionBatches(points, 1, std::nullopt).size() == 3);

  auto       store = std::make_shared<FakeTimeSeriesStore>();
  const auto out   = AppendBatcher(store, Policy(1, false)).Append("uid", points, AppendMode::kOverwrite, range);
  assert(out.points_submitted == 3);
  assert(store->appends.size() == 2);
}

void TestOutOfOrderOverwriteBatchesAreRejected() {
  std::vector<Point> points = {Point::Value(At(5), 1), Point::Value(At(1), 2)};

  auto store = std::make_shared<FakeTimeSeriesStore>();
  bool threw = false;
  try {
    (void)AppendBatcher(store, Policy(1, false)).Append("uid", points, AppendMode::kOverwrite, TimeRange{At(0), At(10)});
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
  assert(store->appends.empty());

  // A single batch has no boundary to violate.
  assert(AppendBatcher::PartitionBatches(points, 10, TimeRange{At(0), At(10)}).size() == 1);
}

void TestWaitAccumulatesCompletedCounts() {
  auto store = std::make_shared<FakeTimeSeriesStore>();
  store->ScriptStatus(1, {AppendState::kPending, AppendState::kCompleted});
  AppendBatcher batcher(store, Policy(3, true));

  const auto outcome = batcher.Append("uid", MakePoints(5), AppendMode::kOverwrite, TimeRange{At(0), At(4)});
  assert(outcome.completion == AppendCompletion::kCompleted);
  assert(outcome.points_appended == 5);
  assert(store->status_calls == 3);
  assert(store->appends[0].mode == AppendMode::kOverwrite);
}

void TestWaitTimesOutWithoutThrowing() {
  auto store = std::make_shared<FakeTimeSeriesStore>();
  store->ScriptStatus(1, {AppendState::kPending});
  auto policy    = Policy(10, true);
  policy.timeout = 20ms;
  AppendBatcher batcher(store, policy);

  const auto outcome = batcher.Append("uid", MakePoints(4), AppendMode::kAppend, std::nullopt);
  assert(outcome.completion == AppendCompletion::kTimedOut);
  assert(outcome.points_submitted == 4);
  assert(store->status_calls >= 2);
}

void TestFailedAppendStatusIsRemoteError() {
  auto store = std::make_shared<FakeTimeSeriesStore>();
  store->ScriptStatus(1, {AppendState::kFailed});
  AppendBatcher batcher(store, Policy(10, true));

  bool threw = false;
  try {
    (void)batcher.Append("uid", MakePoints(4), AppendMode::kAppend, std::nullopt);
  } catch (const pointzilla::util::RemoteError&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteRangeSendsEmptyOverwrite() {
  auto          store = std::make_shared<FakeTimeSeriesStore>();
  AppendBatcher batcher(store, Policy(10, true));

  const auto outcome = batcher.DeleteRange("uid", TimeRange{At(0), At(60)});
  assert(store->appends.size() == 1);
  assert(store->appends[0].points.empty());
  assert(store->appends[0].mode == AppendMode::kOverwrite);
  assert(store->appends[0].overwrite_range->end == At(60));
  assert(outcome.completion == AppendCompletion::kCompleted);
}

void TestConstructionErrors() {
  bool threw = false;
  try {
    AppendBatcher batcher(nullptr, Policy(10, true));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    AppendBatcher batcher(std::make_shared<FakeTimeSeriesStore>(), Policy(0, true));
  } catch (const pointzilla::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBatchesAreSubmittedInOrder();
  TestRejectedBatchStopsSubmission();
  TestZeroPointsMakesNoRequest();
  TestOverwriteRangesTileTheRequestedRange();
  TestEqualTimesStayInOneOverwriteBatch();
  TestOutOfOrderOverwriteBatchesAreRejected();
  TestWaitAccumulatesCompletedCounts();
  TestWaitTimesOutWithoutThrowing();
  TestFailedAppendStatusIsRemoteError();
  TestDeleteRangeSendsEmptyOverwrite();
  TestConstructionErrors();

  std::cout << "pointzilla_unit_append_batcher: pass\n";
  return 0;
}
