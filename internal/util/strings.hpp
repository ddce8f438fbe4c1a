#pragma once

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pointzilla::util {

inline std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

inline std::string ToLower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

inline bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Plain split, no quoting. Empty input yields one empty part.
inline std::vector<std::string> Split(std::string_view text, std::string_view delimiter) {
  std::vector<std::string> parts;
  if (delimiter.empty()) {
    parts.emplace_back(text);
    return parts;
  }

  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + delimiter.size();
  }
  return parts;
}

// Whole-string numeric parses. Surrounding whitespace is allowed.
inline std::optional<double> ParseDouble(std::string_view text) {
  const std::string value(Trim(text));
  if (value.empty()) return std::nullopt;

  char* end = nullptr;
  errno     = 0;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size() || errno == ERANGE) return std::nullopt;
  return parsed;
}

inline std::optional<std::int64_t> ParseInt64(std::string_view text) {
  const std::string value(Trim(text));
  if (value.empty()) return std::nullopt;

  char* end = nullptr;
  errno     = 0;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end != value.c_str() + value.size() || errno == ERANGE) return std::nullopt;
  return static_cast<std::int64_t>(parsed);
}

inline std::optional<std::int32_t> ParseInt32(std::string_view text) {
  const auto parsed = ParseInt64(text);
  if (!parsed || *parsed < std::numeric_limits<std::int32_t>::min() || *parsed > std::numeric_limits<std::int32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::int32_t>(*parsed);
}

} // namespace pointzilla::util
