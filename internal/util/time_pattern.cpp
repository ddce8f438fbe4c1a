#include "time_pattern.hpp"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace pointzilla::util {

namespace {

struct Token {
  char        kind  = '\0'; // '\0' for literal text
  int         count = 0;
  std::string literal;
};

bool IsTokenChar(char c) {
  switch (c) {
    case 'y':
    case 'M':
    case 'd':
    case 'H':
    case 'h':
    case 'm':
    case 's':
    case 'f':
    case 'F':
    case 't':
    case 'z':
      return true;
    default:
      return false;
  }
}

int MaxRun(char kind) {
  switch (kind) {
    case 'y':
      return 4;
    case 'f':
    case 'F':
      return 9;
    case 'z':
      return 3;
    default:
      return 2;
  }
}

std::optional<std::vector<Token>> Tokenize(std::string_view pattern) {
  std::vector<Token> tokens;

  auto append_literal = [&tokens](char c) {
    if (tokens.empty() || tokens.back().kind != '\0') {
      tokens.push_back(Token{});
    }
    tokens.back().literal.push_back(c);
  };

  for (std::size_t i = 0; i < pattern.size();) {
    const char c = pattern[i];

    if (c == '\'' || c == '"') {
      const auto close = pattern.find(c, i + 1);
      if (close == std::string_view::npos) return std::nullopt;
      for (std::size_t j = i + 1; j < close; ++j) append_literal(pattern[j]);
      i = close + 1;
      continue;
    }

    if (c == '\\') {
      if (i + 1 >= pattern.size()) return std::nullopt;
      append_literal(pattern[i + 1]);
      i += 2;
      continue;
    }

    if (!IsTokenChar(c)) {
      append_literal(c);
      ++i;
      continue;
    }

    std::size_t run = 1;
    while (i + run < pattern.size() && pattern[i + run] == c) ++run;

    if (static_cast<int>(run) > MaxRun(c) || (c == 'y' && run == 3) || (c == 'y' && run == 1)) {
      return std::nullopt;
    }

    Token token;
    token.kind  = c;
    token.count = static_cast<int>(run);
    tokens.push_back(std::move(token));
    i += run;
  }

  return tokens;
}

class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {
  }

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  // Reads between min_digits and max_digits digits.
  bool ReadNumber(int min_digits, int max_digits, int64_t* out, int* digits_read = nullptr) {
    int64_t value  = 0;
    int     digits = 0;
    while (digits < max_digits && !AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      value = value * 10 + (text_[pos_++] - '0');
      ++digits;
    }
    if (digits < min_digits) return false;
    *out = value;
    if (digits_read != nullptr) *digits_read = digits;
    return true;
  }

  bool ReadLiteral(std::string_view literal) {
    for (char c : literal) {
      if (AtEnd()) return false;
      const char actual = text_[pos_];
      if (std::isspace(static_cast<unsigned char>(c)) && std::isspace(static_cast<unsigned char>(actual))) {
        ++pos_;
        continue;
      }
      if (actual != c) return false;
      ++pos_;
    }
    return true;
  }

  bool ReadDesignator(int count, bool* pm) {
    if (AtEnd()) return false;
    const char first = static_cast<char>(std::toupper(static_cast<unsigned char>(text_[pos_])));
    if (first != 'A' && first != 'P') return false;
    ++pos_;
    if (count == 2) {
      if (AtEnd() || std::toupper(static_cast<unsigned char>(text_[pos_])) != 'M') return false;
      ++pos_;
    }
    *pm = first == 'P';
    return true;
  }

  bool ReadOffset(std::chrono::minutes* offset) {
    if (AtEnd()) return false;
    if (text_[pos_] == 'Z' || text_[pos_] == 'z') {
      ++pos_;
      *offset = std::chrono::minutes{0};
      return true;
    }

    int sign = 0;
    if (text_[pos_] == '+') {
      sign = 1;
    } else if (text_[pos_] == '-') {
      sign = -1;
    } else {
      return false;
    }
    ++pos_;

    int64_t hours   = 0;
    int64_t minutes = 0;
    if (!ReadNumber(1, 2, &hours)) return false;
    if (!AtEnd() && text_[pos_] == ':') {
      ++pos_;
      if (!ReadNumber(2, 2, &minutes)) return false;
    } else if (!AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      if (!ReadNumber(2, 2, &minutes)) return false;
    }
    if (hours > 23 || minutes > 59) return false;

    *offset = std::chrono::minutes{sign * (hours * 60 + minutes)};
    return true;
  }

 private:
  std::string_view text_;
  std::size_t      pos_ = 0;
};

} // namespace

Duration PatternFields::TimeOfDay() const {
  return std::chrono::duration_cast<Duration>(std::chrono::hours(civil.hour) + std::chrono::minutes(civil.minute) +
                                              std::chrono::seconds(civil.second) + std::chrono::nanoseconds(civil.nanos));
}

bool IsValidPattern(std::string_view pattern) {
  return !pattern.empty() && Tokenize(pattern).has_value();
}

std::optional<PatternFields> ParseWithPattern(std::string_view text, std::string_view pattern) {
  const auto tokens = Tokenize(pattern);
  if (!tokens) {
    return std::nullopt;
  }

  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  PatternFields fields;
  Reader        reader(text);

  std::optional<bool> pm;
  bool                twelve_hour = false;

  for (const auto& token : *tokens) {
    int64_t value = 0;

    switch (token.kind) {
      case '\0':
        if (!reader.ReadLiteral(token.literal)) return std::nullopt;
        break;

      case 'y':
        if (token.count == 4) {
          if (!reader.ReadNumber(4, 4, &value)) return std::nullopt;
          fields.civil.year = static_cast<int>(value);
        } else {
          if (!reader.ReadNumber(2, 2, &value)) return std::nullopt;
          fields.civil.year = static_cast<int>(value < 50 ? 2000 + value : 1900 + value);
        }
        fields.has_date = true;
        break;

      case 'M':
        if (!reader.ReadNumber(1, 2, &value)) return std::nullopt;
        fields.civil.month = static_cast<int>(value);
        fields.has_date    = true;
        break;

      case 'd':
        if (!reader.ReadNumber(1, 2, &value)) return std::nullopt;
        fields.civil.day = static_cast<int>(value);
        fields.has_date  = true;
        break;

      case 'H':
      case 'h':
        if (!reader.ReadNumber(1, 2, &value)) return std::nullopt;
        fields.civil.hour = static_cast<int>(value);
        fields.has_time   = true;
        twelve_hour       = token.kind == 'h';
        break;

      case 'm':
        if (!reader.ReadNumber(1, 2, &value)) return std::nullopt;
        fields.civil.minute = static_cast<int>(value);
        fields.has_time     = true;
        break;

      case 's':
        if (!reader.ReadNumber(1, 2, &value)) return std::nullopt;
        fields.civil.second = static_cast<int>(value);
        fields.has_time     = true;
        break;

      case 'f':
      case 'F': {
        int digits = 0;
        if (!reader.ReadNumber(token.kind == 'f' ? 1 : 0, token.count, &value, &digits)) return std::nullopt;
        for (int i = digits; i < 9; ++i) value *= 10;
        fields.civil.nanos = value;
        break;
      }

      case 't': {
        bool is_pm = false;
        if (!reader.ReadDesignator(token.count, &is_pm)) return std::nullopt;
        pm = is_pm;
        break;
      }

      case 'z': {
        std::chrono::minutes offset{0};
        if (!reader.ReadOffset(&offset)) return std::nullopt;
        fields.utc_offset = offset;
        break;
      }

      default:
        return std::nullopt;
    }
  }

  if (!reader.AtEnd()) {
    return std::nullopt;
  }

  if (twelve_hour) {
    if (fields.civil.hour < 1 || fields.civil.hour > 12) return std::nullopt;
    if (pm.has_value()) {
      fields.civil.hour = fields.civil.hour % 12 + (*pm ? 12 : 0);
    }
  } else if (pm.has_value() && *pm && fields.civil.hour < 12) {
    fields.civil.hour += 12;
  }

  if (fields.has_date && !IsValidDate(fields.civil.year, fields.civil.month, fields.civil.day)) {
    return std::nullopt;
  }
  if (fields.civil.hour > 23 || fields.civil.minute > 59 || fields.civil.second > 59) {
    return std::nullopt;
  }

  return fields;
}

} // namespace pointzilla::util
