#include "point_codec.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace pointzilla::store {

void ToProto(const model::Point& point, pointzilla::timeseries::v1::Point* out) {
  *out->mutable_time() = util::ToProto(point.time);

  if (point.IsGap()) {
    out->set_type(pointzilla::timeseries::v1::POINT_TYPE_GAP);
    return;
  }

  out->set_type(pointzilla::timeseries::v1::POINT_TYPE_VALUE);
  out->set_value(point.value);
  if (point.grade_code) {
    out->set_grade_code(*point.grade_code);
  }
  for (const auto& qualifier : point.qualifiers) {
    out->add_qualifiers(qualifier);
  }
}

model::Point FromProto(const pointzilla::timeseries::v1::Point& point) {
  if (!util::IsRepresentable(point.time())) {
    throw util::RemoteError("Point time " + std::to_string(point.time().seconds()) + "s is out of range");
  }
  const auto time = util::FromProto(point.time());

  if (point.type() == pointzilla::timeseries::v1::POINT_TYPE_GAP) {
    return model::Point::Gap(time);
  }

  auto out = model::Point::Value(time, point.value());
  if (point.has_grade_code()) {
    out.grade_code = point.grade_code();
  }
  std::vector<std::string> qualifiers(point.qualifiers().begin(), point.qualifiers().end());
  out.qualifiers = model::NormalizeQualifiers(qualifiers);
  return out;
}

void ToProto(const util::TimeRange& range, pointzilla::timeseries::v1::TimeRange* out) {
  *out->mutable_start() = util::ToProto(range.start);
  *out->mutable_end()   = util::ToProto(range.end);
}

} // namespace pointzilla::store
