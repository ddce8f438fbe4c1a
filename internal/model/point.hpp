#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace pointzilla::model {

enum class PointKind : std::uint8_t {
  kValue = 0,
  kGap   = 1,
};

constexpr std::string_view ToString(PointKind kind) {
  switch (kind) {
    case PointKind::kGap:
      return "gap";
    case PointKind::kValue:
    default:
      return "value";
  }
}

/*
  One timestamped observation, or an explicit break in the record.

  Gap points carry no value, grade or qualifiers.
*/
struct Point {
  util::TimePoint time{};
  PointKind       kind  = PointKind::kValue;
  double          value = 0.0;

  std::optional<std::int32_t> grade_code;
  std::vector<std::string>    qualifiers;

  bool IsGap() const {
    return kind == PointKind::kGap;
  }

  static Point Value(util::TimePoint time, double value) {
    Point point;
    point.time  = time;
    point.value = value;
    return point;
  }

  static Point Gap(util::TimePoint time) {
    Point point;
    point.time  = time;
    point.kind  = PointKind::kGap;
    point.value = std::numeric_limits<double>::quiet_NaN();
    return point;
  }
};

// Appends unless already present. Keeps insertion order.
inline void AddQualifier(std::vector<std::string>& qualifiers, std::string qualifier) {
  for (const auto& existing : qualifiers) {
    if (existing == qualifier) return;
  }
  qualifiers.push_back(std::move(qualifier));
}

inline std::vector<std::string> NormalizeQualifiers(const std::vector<std::string>& qualifiers) {
  std::vector<std::string> out;
  out.reserve(qualifiers.size());
  for (const auto& qualifier : qualifiers) {
    if (!qualifier.empty()) AddQualifier(out, qualifier);
  }
  return out;
}

} // namespace pointzilla::model
