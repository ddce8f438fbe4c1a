#include "internal/sources/manual_points.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;

using pointzilla::sources::CollectManualPoints;
using pointzilla::sources::ManualPointSpec;

void TestValuesAndGapsAdvanceTheClock() {
  ManualPointSpec spec;
  spec.start_time = pointzilla::util::TimePoint{} + 1h;
  spec.interval   = 15min;
  spec.literals   = {1.5, std::nullopt, -2.0};
  spec.grade_code = 30;
  spec.qualifiers = {"EST", "EST", "ICE"};

  const auto points = CollectManualPoints(spec);
  assert(points.size() == 3);

  assert(points[0].time == spec.start_time);
  assert(points[0].value == 1.5);
  assert(*points[0].grade_code == 30);
  assert((points[0].qualifiers == std::vector<std::string>{"EST", "ICE"}));

  assert(points[1].IsGap());
  assert(points[1].time == spec.start_time + 15min);
  assert(!points[1].grade_code);
  assert(points[1].qualifiers.empty());

  assert(points[2].time == spec.start_time + 30min);
  assert(points[2].value == -2.0);
}

void TestNoLiteralsYieldsNothing() {
  assert(CollectManualPoints(ManualPointSpec{}).empty());
}

} // namespace

int main() {
  TestValuesAndGapsAdvanceTheClock();
  TestNoLiteralsYieldsNothing();

  std::cout << "pointzilla_unit_manual_points: pass\n";
  return 0;
}
