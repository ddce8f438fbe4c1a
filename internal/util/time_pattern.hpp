#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace pointzilla::util {

/*
  Fields recovered from text by a custom date/time pattern.

  A date-only pattern fills the date, a time-only pattern fills the time of day,
  and a combined pattern fills both. Fields the pattern does not mention keep
  their defaults (1970-01-01, midnight).
*/
struct PatternFields {
  CivilTime                           civil;
  bool                                has_date = false;
  bool                                has_time = false;
  std::optional<std::chrono::minutes> utc_offset;

  Duration TimeOfDay() const;
};

/*
  Pattern tokens:

    yyyy yy          year
    MM M             month
    dd d             day
    HH H hh h        hour (24h / 12h)
    mm m             minute
    ss s             second
    f..fffffffff     fractional second (F is accepted as well)
    tt               AM / PM designator
    zzz zz z         UTC offset ("+12:00", "+12")
    'text' "text"    literal text
    \c               literal character

  Any other character must match itself.
*/
std::optional<PatternFields> ParseWithPattern(std::string_view text, std::string_view pattern);

// True when every token in the pattern is understood.
bool IsValidPattern(std::string_view pattern);

} // namespace pointzilla::util
