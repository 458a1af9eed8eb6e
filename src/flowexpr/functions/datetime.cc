/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Datetimes travel as ISO 8601 strings, e.g. "2024-03-01T12:30:00" (naive)
// or "2024-03-01T12:30:00+02:00" (aware). Naive datetimes are read as UTC.
// Durations are plain numbers of seconds.

#include <cmath>
#include <string>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/civil_time.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "include/flowexpr/utils/status.h"
#include "re2/re2.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

// 1601-01-01 to 1970-01-01 in 100ns ticks.
constexpr int64_t kFiletimeEpochOffset = 116444736000000000LL;

const char* const kDayNames[] = {"Monday", "Tuesday",  "Wednesday", "Thursday",
                                 "Friday", "Saturday", "Sunday"};
const char* const kMonthNames[] = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

struct DateTime {
  absl::Time time;
  bool aware = false;
  absl::TimeZone zone = absl::UTCTimeZone();
};

const RE2& IsoPattern() {
  static const RE2* pattern = new RE2(
      R"(^(\d{4}-\d{2}-\d{2})(?:[T ](\d{2}:\d{2})(:\d{2}(?:\.\d{1,9})?)?)?)"
      R"((Z|[+-]\d{2}:?\d{2})?$)");
  return *pattern;
}

absl::Status InvalidDatetime(absl::string_view function, const Value& value) {
  return EvaluationError(absl::StrCat(
      function, "() invalid isoformat string or timestamp: ", Repr(value)));
}

absl::StatusOr<DateTime> ParseIso(const std::string& text,
                                  absl::string_view function,
                                  const Value& original) {
  std::string date;
  std::string clock;
  std::string seconds;
  std::string offset;
  if (!RE2::FullMatch(text, IsoPattern(), &date, &clock, &seconds, &offset)) {
    return InvalidDatetime(function, original);
  }
  std::string normalized = absl::StrCat(
      date, "T", clock.empty() ? "00:00" : clock,
      seconds.empty() ? ":00" : seconds);
  DateTime out;
  std::string error;
  if (!absl::ParseTime("%Y-%m-%dT%H:%M:%E*S", normalized, absl::UTCTimeZone(),
                       &out.time, &error)) {
    return InvalidDatetime(function, original);
  }
  if (!offset.empty()) {
    int seconds_east = 0;
    if (offset != "Z") {
      std::string digits;
      for (char c : offset.substr(1)) {
        if (c != ':') digits.push_back(c);
      }
      int hours = 0;
      int minutes = 0;
      if (!absl::SimpleAtoi(digits.substr(0, 2), &hours) ||
          !absl::SimpleAtoi(digits.substr(2, 2), &minutes)) {
        return InvalidDatetime(function, original);
      }
      seconds_east = (hours * 3600 + minutes * 60) * (offset[0] == '-' ? -1 : 1);
    }
    out.time -= absl::Seconds(seconds_east);
    out.aware = true;
    out.zone = absl::FixedTimeZone(seconds_east);
  }
  return out;
}

absl::StatusOr<DateTime> DateTimeArg(const Args& args, size_t index,
                                     absl::string_view function) {
  const Value& value = args[index];
  if (value.is_string()) {
    return ParseIso(value.as_string(), function, value);
  }
  if (value.is_numeric()) {
    DateTime out;
    out.time = absl::FromUnixMicros(
        static_cast<int64_t>(std::llround(value.as_double() * 1e6)));
    return out;
  }
  return ArgTypeError(function, index, "a datetime string or timestamp", value);
}

std::string FormatIso(const DateTime& dt) {
  absl::TimeZone::CivilInfo info = dt.zone.At(dt.time);
  std::string format = info.subsecond == absl::ZeroDuration()
                           ? "%Y-%m-%dT%H:%M:%S"
                           : "%Y-%m-%dT%H:%M:%E6S";
  if (dt.aware) {
    format.append("%Ez");
  }
  return absl::FormatTime(format, dt.time, dt.zone);
}

absl::StatusOr<absl::TimeZone> LoadZone(const Value& name,
                                        absl::string_view function) {
  if (!name.is_string()) {
    return ArgTypeError(function, 1, "str", name);
  }
  absl::TimeZone zone;
  if (!absl::LoadTimeZone(name.as_string(), &zone)) {
    return EvaluationError(
        absl::StrCat(function, "() unknown time zone ", Repr(name)));
  }
  return zone;
}

absl::StatusOr<Value> Now(const Args&, const CallContext&) {
  DateTime dt;
  dt.time = absl::Now();
  return Value(FormatIso(dt));
}

absl::StatusOr<Value> UtcNow(const Args&, const CallContext&) {
  DateTime dt;
  dt.time = absl::Now();
  dt.aware = true;
  return Value(FormatIso(dt));
}

absl::StatusOr<Value> Today(const Args&, const CallContext&) {
  return Value(absl::FormatTime("%Y-%m-%d", absl::Now(), absl::UTCTimeZone()));
}

// from_timestamp(x, unit="s"), unit "ms" for milliseconds.
absl::StatusOr<Value> FromTimestamp(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(double seconds, NumberArg(args, 0, "from_timestamp"));
  const Value& unit = OptionalArg(args, 1, Value("s"));
  if (unit.is_string() && unit.as_string() == "ms") {
    seconds /= 1000;
  }
  DateTime dt;
  dt.time = absl::FromUnixMicros(static_cast<int64_t>(std::llround(seconds * 1e6)));
  return Value(FormatIso(dt));
}

absl::StatusOr<Value> ToTimestamp(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "to_timestamp"));
  return Value(absl::ToDoubleSeconds(dt.time - absl::UnixEpoch()));
}

// to_datetime(x, timezone=None)
absl::StatusOr<Value> ToDatetime(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "to_datetime"));
  const Value& zone = OptionalArg(args, 1, Value());
  if (!zone.is_null()) {
    FLOWEXPR_ASSIGN_OR_RETURN(dt.zone, LoadZone(zone, "to_datetime"));
    dt.aware = true;
  }
  return Value(FormatIso(dt));
}

absl::StatusOr<Value> ToIsoformat(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "to_isoformat"));
  return Value(FormatIso(dt));
}

// strftime style format.
absl::StatusOr<Value> ToDatestring(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "to_datestring"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string format,
                            StringArg(args, 1, "to_datestring"));
  return Value(absl::FormatTime(format, dt.time, dt.zone));
}

// datetime(year, month, day, hour=0, minute=0, second=0)
absl::StatusOr<Value> MakeDatetime(const Args& args, const CallContext&) {
  int64_t fields[6] = {0, 0, 0, 0, 0, 0};
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(fields[i], IntArg(args, i, "datetime"));
  }
  absl::CivilSecond civil(fields[0], fields[1], fields[2], fields[3],
                          fields[4], fields[5]);
  if (civil.year() != fields[0] || civil.month() != fields[1] ||
      civil.day() != fields[2] || civil.hour() != fields[3] ||
      civil.minute() != fields[4] || civil.second() != fields[5]) {
    return EvaluationError(absl::StrCat(
        "datetime() fields out of range: ", fields[0], "-", fields[1], "-",
        fields[2], " ", fields[3], ":", fields[4], ":", fields[5]));
  }
  DateTime dt;
  dt.time = absl::FromCivil(civil, absl::UTCTimeZone());
  return Value(FormatIso(dt));
}

template <int64_t kSeconds>
absl::StatusOr<Value> SecondsIn(const Args& args, const CallContext&) {
  if (args[0].is_int()) {
    return Value(args[0].as_int() * kSeconds);
  }
  FLOWEXPR_ASSIGN_OR_RETURN(double amount, NumberArg(args, 0, "duration"));
  return Value(amount * kSeconds);
}

template <int64_t kSeconds>
absl::StatusOr<Value> Between(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime start, DateTimeArg(args, 0, "between"));
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime end, DateTimeArg(args, 1, "between"));
  return Value(absl::ToDoubleSeconds(end.time - start.time) / kSeconds);
}

absl::StatusOr<absl::CivilSecond> CivilArg(const Args& args,
                                           absl::string_view function) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, function));
  return absl::ToCivilSecond(dt.time, dt.zone);
}

absl::StatusOr<Value> GetSecond(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_second"));
  return Value(static_cast<int64_t>(civil.second()));
}

absl::StatusOr<Value> GetMinute(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_minute"));
  return Value(static_cast<int64_t>(civil.minute()));
}

absl::StatusOr<Value> GetHour(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_hour"));
  return Value(static_cast<int64_t>(civil.hour()));
}

absl::StatusOr<Value> GetDay(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_day"));
  return Value(static_cast<int64_t>(civil.day()));
}

absl::StatusOr<Value> GetYear(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_year"));
  return Value(static_cast<int64_t>(civil.year()));
}

// `format` is "number", "full" or "short".
absl::StatusOr<Value> NamedField(const Args& args, absl::string_view function,
                                 int64_t number, const char* name) {
  const Value& format = OptionalArg(args, 1, Value("number"));
  if (format == Value("number")) {
    return Value(number);
  }
  if (format == Value("full")) {
    return Value(name);
  }
  if (format == Value("short")) {
    return Value(std::string(name, 3));
  }
  return EvaluationError(absl::StrCat(
      function, "() format must be 'number', 'full', or 'short'"));
}

// Monday is 0.
absl::StatusOr<Value> GetDayOfWeek(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil,
                            CivilArg(args, "get_day_of_week"));
  int weekday = static_cast<int>(absl::GetWeekday(absl::CivilDay(civil)));
  return NamedField(args, "get_day_of_week", weekday, kDayNames[weekday]);
}

absl::StatusOr<Value> GetMonth(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(absl::CivilSecond civil, CivilArg(args, "get_month"));
  int month = civil.month();
  return NamedField(args, "get_month", month, kMonthNames[month - 1]);
}

absl::StatusOr<Value> SetTimezone(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "set_timezone"));
  FLOWEXPR_ASSIGN_OR_RETURN(dt.zone, LoadZone(args[1], "set_timezone"));
  dt.aware = true;
  return Value(FormatIso(dt));
}

// Keeps the wall clock time and drops the offset.
absl::StatusOr<Value> UnsetTimezone(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt, DateTimeArg(args, 0, "unset_timezone"));
  DateTime naive;
  naive.time = absl::FromCivil(absl::ToCivilSecond(dt.time, dt.zone),
                               absl::UTCTimeZone()) +
               dt.zone.At(dt.time).subsecond;
  return Value(FormatIso(naive));
}

// 100ns intervals since 1601-01-01 UTC.
absl::StatusOr<Value> WindowsFiletime(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(DateTime dt,
                            DateTimeArg(args, 0, "windows_filetime"));
  return Value(absl::ToUnixMicros(dt.time) * 10 + kFiletimeEpochOffset);
}

}  // namespace

absl::Status RegisterDatetimeFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"now", &Now, 0, 0, false},
      {"utcnow", &UtcNow, 0, 0, false},
      {"today", &Today, 0, 0, false},
      {"from_timestamp", &FromTimestamp, 1, 2, false},
      {"to_timestamp", &ToTimestamp, 1, 1, false},
      {"to_datetime", &ToDatetime, 1, 2, false},
      {"to_isoformat", &ToIsoformat, 1, 1, false},
      {"to_datestring", &ToDatestring, 2, 2, false},
      {"datetime", &MakeDatetime, 3, 6, false},
      {"seconds", &SecondsIn<1>, 1, 1, false},
      {"minutes", &SecondsIn<60>, 1, 1, false},
      {"hours", &SecondsIn<3600>, 1, 1, false},
      {"days", &SecondsIn<86400>, 1, 1, false},
      {"weeks", &SecondsIn<604800>, 1, 1, false},
      {"seconds_between", &Between<1>, 2, 2, false},
      {"minutes_between", &Between<60>, 2, 2, false},
      {"hours_between", &Between<3600>, 2, 2, false},
      {"days_between", &Between<86400>, 2, 2, false},
      {"weeks_between", &Between<604800>, 2, 2, false},
      {"get_second", &GetSecond, 1, 1, false},
      {"get_minute", &GetMinute, 1, 1, false},
      {"get_hour", &GetHour, 1, 1, false},
      {"get_day", &GetDay, 1, 1, false},
      {"get_day_of_week", &GetDayOfWeek, 1, 2, false},
      {"get_month", &GetMonth, 1, 2, false},
      {"get_year", &GetYear, 1, 1, false},
      {"set_timezone", &SetTimezone, 2, 2, false},
      {"unset_timezone", &UnsetTimezone, 1, 1, false},
      {"windows_filetime", &WindowsFiletime, 1, 1, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
