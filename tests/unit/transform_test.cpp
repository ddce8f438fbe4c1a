#include "internal/transform/point_pipeline.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using pointzilla::model::Point;
using pointzilla::transform::GradeMapping;
using pointzilla::transform::QualifierMapping;
using pointzilla::transform::TransformOptions;
using pointzilla::util::TimePoint;

TimePoint At(std::int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

Point Graded(std::int64_t seconds, double value, std::int32_t grade) {
  auto point       = Point::Value(At(seconds), value);
  point.grade_code = grade;
  return point;
}

Point Qualified(std::int64_t seconds, std::vector<std::string> qualifiers) {
  auto point       = Point::Value(At(seconds), 1.0);
  point.qualifiers = std::move(qualifiers);
  return point;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn&& fn) {
  try {
    fn();
  } catch (const pointzilla::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestGradeRangeMapping() {
  GradeMapping mapping;
  assert(!mapping.Enabled());
  assert(*mapping.Map(7) == 7);

  mapping.AddRule("299,200:5");
  assert(mapping.Enabled());

  assert(*mapping.Map(250) == 5);
  assert(*mapping.Map(200) == 5);
  assert(*mapping.Map(299) == 5);
  assert(!mapping.Map(300));
  assert(!mapping.Map(199));
  assert(!mapping.Map(100));
  assert(!mapping.Map(std::nullopt));
}

void TestGradeDefaultAndRemoval() {
  GradeMapping mapping;
  mapping.AddRule("10:");
  mapping.AddRule(":-1");
  mapping.AddRule("20:30");

  assert(!mapping.Map(10));
  assert(*mapping.Map(20) == 30);
  assert(*mapping.Map(99) == -1);
  assert(*mapping.Map(std::nullopt) == -1);
}

void TestGradeRuleErrors() {
  GradeMapping mapping;
  assert(ThrowsConfigurationError([&] { mapping.AddRule("10"); }));
  assert(ThrowsConfigurationError([&] { mapping.AddRule("a:1"); }));
  assert(ThrowsConfigurationError([&] { mapping.AddRule("1:b"); }));
  assert(ThrowsConfigurationError([&] { mapping.AddRule("0,200000:1"); }));
}

void TestQualifierMapping() {
  QualifierMapping mapping;
  mapping.AddRule("A:B");

  assert((mapping.Map({"A", "C"}) == std::vector<std::string>{"B", "C"}));
  assert(mapping.Map({}).empty());

  mapping.AddRule("C:");
  mapping.AddRule(":EST, ICE");
  assert((mapping.Map({"A", "C"}) == std::vector<std::string>{"B"}));
  assert((mapping.Map({}) == std::vector<std::string>{"EST", "ICE"}));
  assert((mapping.Map({"A", "B"}) == std::vector<std::string>{"B"}));

  mapping.AddRule(":");
  assert(mapping.Map({}).empty());

  assert(ThrowsConfigurationError([&] { mapping.AddRule("no separator"); }));
}

void TestIgnoreFlagsRunBeforeMapping() {
  TransformOptions options;
  options.ignore_grades = true;
  options.grade_mapping.AddRule(":9");

  const auto out = pointzilla::transform::ApplyTransforms({Graded(0, 1, 50)}, options);
  assert(*out[0].grade_code == 9);
}

void TestGapsNeverReceiveMetadata() {
  TransformOptions options;
  options.grade_mapping.AddRule(":9");
  options.qualifier_mapping.AddRule(":EST");

  const auto out = pointzilla::transform::ApplyTransforms({Point::Gap(At(0)), Qualified(1, {})}, options);
  assert(out[0].IsGap());
  assert(!out[0].grade_code);
  assert(out[0].qualifiers.empty());
  assert(*out[1].grade_code == 9);
  assert((out[1].qualifiers == std::vector<std::string>{"EST"}));
}

void TestRealignPreservesSpacing() {
  TransformOptions options;
  options.realign_to = At(1000);

  const auto out =
      pointzilla::transform::ApplyTransforms({Point::Value(At(10), 1), Point::Value(At(25), 2), Point::Value(At(70), 3)}, options);
  assert(out[0].time == At(1000));
  assert(out[1].time == At(1015));
  assert(out[2].time == At(1060));
}

void TestRemoveDuplicatePointsKeepsFirst() {
  TransformOptions options;
  options.remove_duplicate_points = true;

  const auto out = pointzilla::transform::ApplyTransforms(
      {Point::Value(At(10), 1), Point::Value(At(10), 2), Point::Gap(At(15)), Point::Value(At(20), 3)}, options);
  assert(out.size() == 3);
  assert(out[0].value == 1);
  assert(out[1].IsGap());
  assert(out[2].time == At(20));
}

void TestDisabledPipelineIsIdentity() {
  const std::vector<Point> in = {Graded(0, 1, 5), Qualified(1, {"A"}), Point::Value(At(1), 3)};
  const auto               out = pointzilla::transform::ApplyTransforms(in, TransformOptions{});
  assert(out.size() == 3);
  assert(*out[0].grade_code == 5);
  assert((out[1].qualifiers == std::vector<std::string>{"A"}));
  assert(out[2].value == 3);
}

} // namespace

int main() {
  TestGradeRangeMapping();
  TestGradeDefaultAndRemoval();
  TestGradeRuleErrors();
  TestQualifierMapping();
  TestIgnoreFlagsRunBeforeMapping();
  TestGapsNeverReceiveMetadata();
  TestRealignPreservesSpacing();
  TestRemoveDuplicatePointsKeepsFirst();
  TestDisabledPipelineIsIdentity();

  std::cout << "pointzilla_unit_transform: pass\n";
  return 0;
}
