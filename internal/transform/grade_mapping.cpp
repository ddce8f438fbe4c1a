#include "grade_mapping.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace pointzilla::transform {

namespace {

[[noreturn]] void ThrowSyntax(std::string_view rule) {
  throw util::ConfigurationError("'" + std::string(rule) + "' is not in sourceValue:mappedValue syntax");
}

} // namespace

void GradeMapping::AddRule(std::string_view rule) {
  const auto separator = rule.find(':');
  if (separator == std::string_view::npos) {
    ThrowSyntax(rule);
  }

  const auto source_text = util::Trim(rule.substr(0, separator));
  const auto mapped_text = util::Trim(rule.substr(separator + 1));

  std::optional<std::int32_t> mapped;
  if (!mapped_text.empty()) {
    mapped = util::ParseInt32(mapped_text);
    if (!mapped) ThrowSyntax(rule);
  }

  enabled_ = true;

  if (source_text.empty()) {
    default_grade_ = mapped;
    return;
  }

  const auto comma = source_text.find(',');
  auto       low   = util::ParseInt32(source_text.substr(0, comma));
  auto       high  = comma == std::string_view::npos ? low : util::ParseInt32(source_text.substr(comma + 1));
  if (!low || !high) {
    ThrowSyntax(rule);
  }
  if (*high < *low) {
    std::swap(low, high);
  }

  const std::int64_t width = static_cast<std::int64_t>(*high) - static_cast<std::int64_t>(*low);
  if (width > kMaxRangeWidth) {
    throw util::ConfigurationError("Grade range in '" + std::string(rule) + "' spans more than " + std::to_string(kMaxRangeWidth) + " values");
  }

  for (std::int64_t grade = *low; grade <= *high; ++grade) {
    mapped_[static_cast<std::int32_t>(grade)] = mapped;
  }
}

std::optional<std::int32_t> GradeMapping::Map(const std::optional<std::int32_t>& grade) const {
  if (!enabled_) {
    return grade;
  }
  if (grade) {
    const auto it = mapped_.find(*grade);
    if (it != mapped_.end()) {
      return it->second;
    }
  }
  return default_grade_;
}

} // namespace pointzilla::transform
