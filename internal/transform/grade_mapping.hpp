#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace pointzilla::transform {

/*
  Sparse grade remapping.

  Rules use "low,high:mapped", "source:mapped" or ":mapped" (the default for
  unlisted or absent grades). An empty mapped side means "no grade". Ranges
  are expanded eagerly; a later rule overwrites an earlier one.
*/
class GradeMapping {
 public:
  static constexpr std::int64_t kMaxRangeWidth = 100000;

  // Throws util::ConfigurationError on malformed rules.
  void AddRule(std::string_view rule);

  bool Enabled() const {
    return enabled_;
  }

  std::optional<std::int32_t> Map(const std::optional<std::int32_t>& grade) const;

 private:
  bool                                                          enabled_ = false;
  std::unordered_map<std::int32_t, std::optional<std::int32_t>> mapped_;
  std::optional<std::int32_t>                                   default_grade_;
};

} // namespace pointzilla::transform
