#include "vector_text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace pointzilla::sources {

namespace {

constexpr double kGlyphAdvance = 6.0;

// Strokes as concatenated "xy" digit pairs.
const std::unordered_map<char, std::vector<const char*>>& Font() {
  static const std::unordered_map<char, std::vector<const char*>> kFont = {
      {'A', {"0004264440", "0343"}},
      {'B', {"00063645443303", "3342413000"}},
      {'C', {"4536160501103041"}},
      {'D', {"00063645413000"}},
      {'E', {"46060040", "0333"}},
      {'F', {"460600", "0333"}},
      {'G', {"45361605011030414323"}},
      {'H', {"0006", "4640", "0343"}},
      {'I', {"1636", "2620", "1030"}},
      {'J', {"4641301001"}},
      {'K', {"0006", "4602", "1340"}},
      {'L', {"060040"}},
      {'M', {"0006244640"}},
      {'N', {"00064046"}},
      {'O', {"103041453616050110"}},
      {'P', {"00063645443303"}},
      {'Q', {"103041453616050110", "2240"}},
      {'R', {"00063645443303", "3340"}},
      {'S', {"453616050413334241301001"}},
      {'T', {"0646", "2620"}},
      {'U', {"060110304146"}},
      {'V', {"062046"}},
      {'W', {"0600224046"}},
      {'X', {"0046", "0640"}},
      {'Y', {"0623", "4623", "2320"}},
      {'Z', {"06464000"}},
      {'0', {"103041453616050110", "0145"}},
      {'1', {"142620", "1030"}},
      {'2', {"05163645440040"}},
      {'3', {"05163645443313", "334241301001"}},
      {'4', {"30360242"}},
      {'5', {"460604344341301001"}},
      {'6', {"36160501103041423303"}},
      {'7', {"064620"}},
      {'8', {"133344453616050413", "1302011030414233"}},
      {'9', {"43130405163645413010"}},
      {'-', {"1333"}},
      {'.', {"2021"}},
      {':', {"2122", "2425"}},
      {'/', {"0046"}},
      {'+', {"2125", "0343"}},
      {' ', {}},
  };
  return kFont;
}

char Normalize(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

void AppendStroke(const char* stroke, double x_origin, std::vector<GlyphVertex>& path) {
  const std::string digits(stroke);

  bool   first = true;
  double last_x = 0;
  double last_y = 0;
  for (std::size_t i = 0; i + 1 < digits.size(); i += 2) {
    const double x = x_origin + (digits[i] - '0');
    const double y = digits[i + 1] - '0';

    if (first) {
      path.push_back({x, y});
      first = false;
    } else {
      const int steps = static_cast<int>(std::max(std::abs(x - last_x), std::abs(y - last_y)));
      for (int step = 1; step <= steps; ++step) {
        const double t = static_cast<double>(step) / steps;
        path.push_back({last_x + (x - last_x) * t, last_y + (y - last_y) * t});
      }
    }
    last_x = x;
    last_y = y;
  }
}

} // namespace

std::vector<GlyphVertex> VectorizeText(std::string_view text) {
  std::vector<GlyphVertex> path;

  double x_origin = 0;
  for (char c : text) {
    const auto it = Font().find(Normalize(c));
    if (it == Font().end()) {
      throw util::ConfigurationError("Character '" + std::string(1, c) + "' can't be vectorized");
    }
    for (const char* stroke : it->second) {
      AppendStroke(stroke, x_origin, path);
    }
    x_origin += kGlyphAdvance;
  }

  return path;
}

} // namespace pointzilla::sources
