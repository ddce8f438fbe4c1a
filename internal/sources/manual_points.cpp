#include "manual_points.hpp"

namespace pointzilla::sources {

std::vector<model::Point> CollectManualPoints(const ManualPointSpec& spec) {
  std::vector<model::Point> points;
  points.reserve(spec.literals.size());

  const auto qualifiers = model::NormalizeQualifiers(spec.qualifiers);

  auto clock = spec.start_time;
  for (const auto& literal : spec.literals) {
    if (!literal) {
      points.push_back(model::Point::Gap(clock));
    } else {
      auto point       = model::Point::Value(clock, *literal);
      point.grade_code = spec.grade_code;
      point.qualifiers = qualifiers;
      points.push_back(std::move(point));
    }
    clock += spec.interval;
  }

  return points;
}

} // namespace pointzilla::sources
