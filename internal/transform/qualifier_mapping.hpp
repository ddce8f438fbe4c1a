#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pointzilla::transform {

/*
  Sparse qualifier remapping.

  "source:mapped" renames a qualifier, "source:" removes it. ":A,B" sets the
  default list given to points without qualifiers; ":" clears it. Qualifiers
  without a rule are kept.
*/
class QualifierMapping {
 public:
  // Throws util::ConfigurationError on malformed rules.
  void AddRule(std::string_view rule);

  bool Enabled() const {
    return enabled_;
  }

  std::vector<std::string> Map(const std::vector<std::string>& qualifiers) const;

 private:
  bool                                                        enabled_ = false;
  std::unordered_map<std::string, std::optional<std::string>> mapped_;
  std::vector<std::string>                                    default_qualifiers_;
};

} // namespace pointzilla::transform
