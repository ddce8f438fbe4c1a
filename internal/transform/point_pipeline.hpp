#pragma once

#include <optional>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/transform/grade_mapping.hpp"
#include "internal/transform/qualifier_mapping.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::transform {

struct TransformOptions {
  bool ignore_grades     = false;
  bool ignore_qualifiers = false;

  GradeMapping     grade_mapping;
  QualifierMapping qualifier_mapping;

  // Shift the first point to this instant, keeping the spacing.
  std::optional<util::TimePoint> realign_to;

  bool remove_duplicate_points = false;
};

/*
  Normalizes the concatenated source stream, in order:

    1. ignore flags
    2. grade mapping
    3. qualifier mapping
    4. realignment
    5. duplicate removal

  Gap points never receive grades or qualifiers. Order is preserved.
*/
std::vector<model::Point> ApplyTransforms(std::vector<model::Point> points, const TransformOptions& options);

void StripMetadata(std::vector<model::Point>& points, bool grades, bool qualifiers);
void MapGrades(std::vector<model::Point>& points, const GradeMapping& mapping);
void MapQualifiers(std::vector<model::Point>& points, const QualifierMapping& mapping);
void Realign(std::vector<model::Point>& points, util::TimePoint start);

// Drops a value point whose time equals the previous kept value point. Gaps pass.
std::vector<model::Point> RemoveDuplicatePoints(std::vector<model::Point> points);

} // namespace pointzilla::transform
