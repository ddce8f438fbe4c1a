#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace pointzilla::util {

/*
  Time utilities: single place to control clock source and instant formats.

  All instants are UTC. Text without an explicit offset is interpreted with the
  caller-supplied default offset (UTC unless stated otherwise).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

struct TimeRange {
  TimePoint start;
  TimePoint end;
};

TimePoint Now();

// Out-of-range values clamp to the representable bounds; check IsRepresentable first.
google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(Duration d);
Duration                   FromProto(const google::protobuf::Duration& d);

// Bounds used for whole-record operations. Every parsed instant lies inside them.
TimePoint MinRepresentable();
TimePoint MaxRepresentable();

bool IsRepresentable(const google::protobuf::Timestamp& ts);
bool IsRepresentable(const google::protobuf::Duration& d);

/*
  Civil date/time <-> TimePoint, proleptic Gregorian, no leap seconds.
*/
struct CivilTime {
  int     year   = 1970;
  int     month  = 1;
  int     day    = 1;
  int     hour   = 0;
  int     minute = 0;
  int     second = 0;
  int64_t nanos  = 0;
};

TimePoint FromCivil(const CivilTime& civil, std::chrono::minutes utc_offset = std::chrono::minutes{0});
CivilTime ToCivil(TimePoint tp);

// Also false for years outside [MinRepresentable, MaxRepresentable).
bool IsValidDate(int year, int month, int day);

/*
  ISO 8601 / RFC 3339 style instants:

    2013-07-01
    2013-07-01T11:59:59Z
    2013-07-01 23:59:59.125+12:00
*/
std::optional<TimePoint> ParseInstant(std::string_view text, std::chrono::minutes default_offset = std::chrono::minutes{0});

// Round-trippable: "2013-07-01T11:59:59Z", fractional seconds trimmed.
std::string FormatInstant(TimePoint tp);

/*
  "[-][d.]hh:mm[:ss[.fffffff]]" or a number with a unit suffix: ms, s, m, h, d
  ("90s", "0.5s", "15m").
*/
std::optional<Duration> ParseDuration(std::string_view text);

std::string FormatDuration(Duration d);

// "+12:00", "-0700", "UTC+05:30", "Z", "UTC".
std::optional<std::chrono::minutes> ParseUtcOffset(std::string_view text);

} // namespace pointzilla::util
