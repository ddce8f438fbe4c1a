#include "point_pipeline.hpp"

#include <utility>

namespace pointzilla::transform {

void StripMetadata(std::vector<model::Point>& points, bool grades, bool qualifiers) {
  for (auto& point : points) {
    if (grades) point.grade_code.reset();
    if (qualifiers) point.qualifiers.clear();
  }
}

void MapGrades(std::vector<model::Point>& points, const GradeMapping& mapping) {
  if (!mapping.Enabled()) return;

  for (auto& point : points) {
    if (point.IsGap()) continue;
    point.grade_code = mapping.Map(point.grade_code);
  }
}

void MapQualifiers(std::vector<model::Point>& points, const QualifierMapping& mapping) {
  if (!mapping.Enabled()) return;

  for (auto& point : points) {
    if (point.IsGap()) continue;
    point.qualifiers = mapping.Map(point.qualifiers);
  }
}

void Realign(std::vector<model::Point>& points, util::TimePoint start) {
  if (points.empty()) return;

  const auto shift = start - points.front().time;
  for (auto& point : points) {
    point.time += shift;
  }
}

std::vector<model::Point> RemoveDuplicatePoints(std::vector<model::Point> points) {
  std::vector<model::Point> kept;
  kept.reserve(points.size());

  std::optional<util::TimePoint> last_value_time;
  for (auto& point : points) {
    if (!point.IsGap()) {
      if (last_value_time && *last_value_time == point.time) continue;
      last_value_time = point.time;
    }
    kept.push_back(std::move(point));
  }

  return kept;
}

std::vector<model::Point> ApplyTransforms(std::vector<model::Point> points, const TransformOptions& options) {
  StripMetadata(points, options.ignore_grades, options.ignore_qualifiers);
  MapGrades(points, options.grade_mapping);
  MapQualifiers(points, options.qualifier_mapping);

  if (options.realign_to) {
    Realign(points, *options.realign_to);
  }

  if (options.remove_duplicate_points) {
    points = RemoveDuplicatePoints(std::move(points));
  }

  return points;
}

} // namespace pointzilla::transform
