#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/point.hpp"
#include "internal/util/time.hpp"

namespace pointzilla::sources {

struct ManualPointSpec {
  util::TimePoint start_time{};
  util::Duration  interval = std::chrono::minutes(1);

  // Argument order. An empty entry is a gap marker.
  std::vector<std::optional<double>> literals;

  std::optional<std::int32_t> grade_code;
  std::vector<std::string>    qualifiers;
};

/*
  The clock starts at start_time and advances by interval after every
  literal, gaps included. Value points take the default grade and qualifiers.
*/
std::vector<model::Point> CollectManualPoints(const ManualPointSpec& spec);

} // namespace pointzilla::sources
