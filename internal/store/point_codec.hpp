#pragma once

#include <vector>

#include "internal/model/point.hpp"
#include "internal/util/time.hpp"
#include "pointzilla/timeseries/v1/point.pb.h"

namespace pointzilla::store {

void ToProto(const model::Point& point, pointzilla::timeseries::v1::Point* out);
model::Point FromProto(const pointzilla::timeseries::v1::Point& point);

void ToProto(const util::TimeRange& range, pointzilla::timeseries::v1::TimeRange* out);

template <typename RepeatedPoints>
std::vector<model::Point> PointsFromProto(const RepeatedPoints& points) {
  std::vector<model::Point> out;
  out.reserve(static_cast<std::size_t>(points.size()));
  for (const auto& point : points) {
    out.push_back(FromProto(point));
  }
  return out;
}

} // namespace pointzilla::store
