#include "time.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "internal/util/strings.hpp"

namespace pointzilla::util {

namespace {

constexpr int64_t kNanosPerSecond = 1000000000LL;
constexpr int64_t kSecondsPerDay  = 86400;

// 1800-01-01T00:00:00Z and 2200-01-01T00:00:00Z, inside the nanosecond clock's range.
constexpr int64_t kMinTimestampSeconds = -5364662400LL;
constexpr int64_t kMaxTimestampSeconds = 7258118400LL;
constexpr int     kMinYear             = 1800;
constexpr int     kMaxYear             = 2199;

// About 285 years, the span a nanosecond duration can hold.
constexpr int64_t kMaxDurationSeconds = 9000000000LL;

int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int* year, int* month, int* day) {
  z += 719468;
  const int64_t  era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t  y   = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp  = (5 * doy + 2) / 153;
  const unsigned d   = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m   = mp < 10 ? mp + 3 : mp - 9;
  *year              = static_cast<int>(y + (m <= 2));
  *month             = static_cast<int>(m);
  *day               = static_cast<int>(d);
}

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

/*
  Minimal cursor over the text being parsed.
*/
class Scanner {
 public:
  explicit Scanner(std::string_view text) : text_(text) {
  }

  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  char Peek() const {
    return AtEnd() ? '\0' : text_[pos_];
  }

  bool Consume(char c) {
    if (Peek() != c) return false;
    ++pos_;
    return true;
  }

  // Reads exactly `digits` decimal digits.
  bool ReadFixed(int digits, int* out) {
    int value = 0;
    for (int i = 0; i < digits; ++i) {
      if (AtEnd() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) return false;
      value = value * 10 + (text_[pos_++] - '0');
    }
    *out = value;
    return true;
  }

  // Reads one or more digits as a fraction of a second, keeping nanosecond precision.
  bool ReadFraction(int64_t* nanos) {
    int64_t value  = 0;
    int     digits = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      if (digits < 9) {
        value = value * 10 + (text_[pos_] - '0');
        ++digits;
      }
      ++pos_;
    }
    if (digits == 0) return false;
    for (int i = digits; i < 9; ++i) value *= 10;
    *nanos = value;
    return true;
  }

 private:
  std::string_view text_;
  std::size_t      pos_ = 0;
};

bool ParseOffsetTail(Scanner& scanner, std::chrono::minutes* offset) {
  if (scanner.Consume('Z') || scanner.Consume('z')) {
    *offset = std::chrono::minutes{0};
    return true;
  }

  int sign = 0;
  if (scanner.Consume('+')) {
    sign = 1;
  } else if (scanner.Consume('-')) {
    sign = -1;
  } else {
    return false;
  }

  int hours   = 0;
  int minutes = 0;
  if (!scanner.ReadFixed(2, &hours)) return false;
  if (!scanner.AtEnd()) {
    scanner.Consume(':');
    if (!scanner.ReadFixed(2, &minutes)) return false;
  }
  if (hours > 23 || minutes > 59) return false;

  *offset = std::chrono::minutes{sign * (hours * 60 + minutes)};
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto nanos_total = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();

  google::protobuf::Timestamp ts;
  ts.set_seconds(FloorDiv(nanos_total, kNanosPerSecond));
  ts.set_nanos(static_cast<int32_t>(nanos_total - ts.seconds() * kNanosPerSecond));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < kMinTimestampSeconds) return MinRepresentable();
  if (ts.seconds() > kMaxTimestampSeconds) return MaxRepresentable();
  return TimePoint{} + std::chrono::duration_cast<Duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Duration ToProto(Duration d) {
  const auto nanos_total = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();

  google::protobuf::Duration out;
  out.set_seconds(nanos_total / kNanosPerSecond);
  out.set_nanos(static_cast<int32_t>(nanos_total % kNanosPerSecond));
  return out;
}

Duration FromProto(const google::protobuf::Duration& d) {
  const int64_t seconds = std::max(-kMaxDurationSeconds, std::min(kMaxDurationSeconds, d.seconds()));
  return std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds) + std::chrono::nanoseconds(d.nanos()));
}

TimePoint MinRepresentable() {
  return TimePoint{} + std::chrono::seconds(kMinTimestampSeconds);
}

TimePoint MaxRepresentable() {
  return TimePoint{} + std::chrono::seconds(kMaxTimestampSeconds);
}

bool IsRepresentable(const google::protobuf::Timestamp& ts) {
  return ts.seconds() >= kMinTimestampSeconds && ts.seconds() <= kMaxTimestampSeconds;
}

bool IsRepresentable(const google::protobuf::Duration& d) {
  return d.seconds() >= -kMaxDurationSeconds && d.seconds() <= kMaxDurationSeconds;
}

bool IsValidDate(int year, int month, int day) {
  static constexpr int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (year < kMinYear || year > kMaxYear || month < 1 || month > 12 || day < 1) {
    return false;
  }
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  const int  max  = (month == 2 && leap) ? 29 : kDaysInMonth[month - 1];
  return day <= max;
}

TimePoint FromCivil(const CivilTime& civil, std::chrono::minutes utc_offset) {
  const int64_t days    = DaysFromCivil(civil.year, static_cast<unsigned>(civil.month), static_cast<unsigned>(civil.day));
  const int64_t seconds = days * kSecondsPerDay + civil.hour * 3600 + civil.minute * 60 + civil.second;

  const auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(civil.nanos) - utc_offset;
  return TimePoint{} + std::chrono::duration_cast<Duration>(since_epoch);
}

CivilTime ToCivil(TimePoint tp) {
  const int64_t nanos_total = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
  const int64_t seconds     = FloorDiv(nanos_total, kNanosPerSecond);
  const int64_t days        = FloorDiv(seconds, kSecondsPerDay);
  const int64_t second_of_day = seconds - days * kSecondsPerDay;

  CivilTime civil;
  CivilFromDays(days, &civil.year, &civil.month, &civil.day);
  civil.hour   = static_cast<int>(second_of_day / 3600);
  civil.minute = static_cast<int>((second_of_day % 3600) / 60);
  civil.second = static_cast<int>(second_of_day % 60);
  civil.nanos  = nanos_total - seconds * kNanosPerSecond;
  return civil;
}

std::optional<TimePoint> ParseInstant(std::string_view text, std::chrono::minutes default_offset) {
  Scanner scanner(Trim(text));

  CivilTime civil;
  if (!scanner.ReadFixed(4, &civil.year) || !scanner.Consume('-') || !scanner.ReadFixed(2, &civil.month) || !scanner.Consume('-') ||
      !scanner.ReadFixed(2, &civil.day)) {
    return std::nullopt;
  }
  if (!IsValidDate(civil.year, civil.month, civil.day)) {
    return std::nullopt;
  }

  auto offset = default_offset;

  if (!scanner.AtEnd() && (scanner.Consume('T') || scanner.Consume('t') || scanner.Consume(' '))) {
    if (!scanner.ReadFixed(2, &civil.hour) || !scanner.Consume(':') || !scanner.ReadFixed(2, &civil.minute)) {
      return std::nullopt;
    }
    if (scanner.Consume(':')) {
      if (!scanner.ReadFixed(2, &civil.second)) return std::nullopt;
      if (scanner.Consume('.') || scanner.Consume(',')) {
        if (!scanner.ReadFraction(&civil.nanos)) return std::nullopt;
      }
    }
    if (civil.hour > 23 || civil.minute > 59 || civil.second > 59) {
      return std::nullopt;
    }
    if (!scanner.AtEnd() && !ParseOffsetTail(scanner, &offset)) {
      return std::nullopt;
    }
  }

  if (!scanner.AtEnd()) {
    return std::nullopt;
  }

  return FromCivil(civil, offset);
}

std::string FormatInstant(TimePoint tp) {
  const auto civil = ToCivil(tp);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d", civil.year, civil.month, civil.day, civil.hour, civil.minute,
                civil.second);
  std::string out(buffer);

  if (civil.nanos != 0) {
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), "%09lld", static_cast<long long>(civil.nanos));
    std::string digits(fraction);
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    out += '.';
    out += digits;
  }

  out += 'Z';
  return out;
}

std::optional<Duration> ParseDuration(std::string_view text) {
  text = Trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }

  std::chrono::nanoseconds total{0};

  if (text.find(':') == std::string_view::npos) {
    // Unit-suffixed form.
    std::size_t digits_end = 0;
    while (digits_end < text.size() && (std::isdigit(static_cast<unsigned char>(text[digits_end])) || text[digits_end] == '.')) {
      ++digits_end;
    }
    if (digits_end == 0) return std::nullopt;

    const std::string number(text.substr(0, digits_end));
    const auto        unit = text.substr(digits_end);

    char*        end   = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end == nullptr || *end != '\0') return std::nullopt;

    double scale = 0;
    if (unit == "ms") {
      scale = 1e6;
    } else if (unit == "s") {
      scale = 1e9;
    } else if (unit == "m") {
      scale = 60e9;
    } else if (unit == "h") {
      scale = 3600e9;
    } else if (unit == "d") {
      scale = 86400e9;
    } else {
      return std::nullopt;
    }
    const double nanos = value * scale;
    if (!(nanos <= static_cast<double>(kMaxDurationSeconds) * 1e9)) return std::nullopt;
    total = std::chrono::nanoseconds(static_cast<int64_t>(nanos));
  } else {
    // TimeSpan form: [d.]hh:mm[:ss[.fffffff]]
    Scanner scanner(text);

    int64_t days   = 0;
    auto    dot    = text.find('.');
    auto    colon  = text.find(':');
    if (dot != std::string_view::npos && dot < colon) {
      for (std::size_t i = 0; i < dot; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
        days = days * 10 + (text[i] - '0');
        if (days > kMaxDurationSeconds / kSecondsPerDay) return std::nullopt;
      }
      scanner = Scanner(text.substr(dot + 1));
    }

    int     hours = 0, minutes = 0, seconds = 0;
    int64_t nanos = 0;
    if (!scanner.ReadFixed(2, &hours) || !scanner.Consume(':') || !scanner.ReadFixed(2, &minutes)) {
      return std::nullopt;
    }
    if (scanner.Consume(':')) {
      if (!scanner.ReadFixed(2, &seconds)) return std::nullopt;
      if (scanner.Consume('.') && !scanner.ReadFraction(&nanos)) return std::nullopt;
    }
    if (!scanner.AtEnd() || hours > 23 || minutes > 59 || seconds > 59) {
      return std::nullopt;
    }

    total = std::chrono::hours(days * 24 + hours) + std::chrono::minutes(minutes) + std::chrono::seconds(seconds) +
            std::chrono::nanoseconds(nanos);
  }

  if (negative) total = -total;
  return std::chrono::duration_cast<Duration>(total);
}

std::string FormatDuration(Duration d) {
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();

  std::string out;
  if (nanos < 0) {
    out += '-';
    nanos = -nanos;
  }

  const int64_t total_seconds = nanos / kNanosPerSecond;
  const int64_t days          = total_seconds / kSecondsPerDay;
  const int64_t rem           = total_seconds % kSecondsPerDay;

  char buffer[64];
  if (days > 0) {
    std::snprintf(buffer, sizeof(buffer), "%lld.", static_cast<long long>(days));
    out += buffer;
  }
  std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", static_cast<long long>(rem / 3600), static_cast<long long>((rem % 3600) / 60),
                static_cast<long long>(rem % 60));
  out += buffer;

  const int64_t fraction = nanos % kNanosPerSecond;
  if (fraction != 0) {
    std::snprintf(buffer, sizeof(buffer), ".%09lld", static_cast<long long>(fraction));
    std::string digits(buffer);
    while (digits.back() == '0') digits.pop_back();
    out += digits;
  }
  return out;
}

std::optional<std::chrono::minutes> ParseUtcOffset(std::string_view text) {
  text = Trim(text);
  if (text.size() >= 3 && (text.substr(0, 3) == "UTC" || text.substr(0, 3) == "utc")) {
    text.remove_prefix(3);
  }
  if (text.empty()) {
    return std::chrono::minutes{0};
  }

  Scanner              scanner(text);
  std::chrono::minutes offset{0};
  if (!ParseOffsetTail(scanner, &offset) || !scanner.AtEnd()) {
    return std::nullopt;
  }
  return offset;
}

} // namespace pointzilla::util
