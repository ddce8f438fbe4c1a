#include "qualifier_mapping.hpp"

#include "internal/model/point.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace pointzilla::transform {

void QualifierMapping::AddRule(std::string_view rule) {
  const auto separator = rule.find(':');
  if (separator == std::string_view::npos) {
    throw util::ConfigurationError("'" + std::string(rule) + "' is not in sourceValue:mappedValue syntax");
  }

  const auto source_text = util::Trim(rule.substr(0, separator));
  const auto mapped_text = util::Trim(rule.substr(separator + 1));

  enabled_ = true;

  if (source_text.empty()) {
    std::vector<std::string> defaults;
    if (!mapped_text.empty()) {
      for (const auto& part : util::Split(mapped_text, ",")) {
        defaults.emplace_back(util::Trim(part));
      }
    }
    default_qualifiers_ = model::NormalizeQualifiers(defaults);
    return;
  }

  if (mapped_text.empty()) {
    mapped_[std::string(source_text)] = std::nullopt;
  } else {
    mapped_[std::string(source_text)] = std::string(mapped_text);
  }
}

std::vector<std::string> QualifierMapping::Map(const std::vector<std::string>& qualifiers) const {
  if (!enabled_) {
    return qualifiers;
  }
  if (qualifiers.empty()) {
    return default_qualifiers_;
  }

  std::vector<std::string> out;
  out.reserve(qualifiers.size());
  for (const auto& qualifier : qualifiers) {
    const auto it = mapped_.find(qualifier);
    if (it == mapped_.end()) {
      model::AddQualifier(out, qualifier);
    } else if (it->second) {
      model::AddQualifier(out, *it->second);
    }
  }
  return out;
}

} // namespace pointzilla::transform
