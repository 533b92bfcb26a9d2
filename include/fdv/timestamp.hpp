#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fdv {

// Naive (zone-less) timestamp: seconds since 1970-01-01 00:00:00.
//
// Logger exports carry wall-clock times without an offset, so all arithmetic
// is done on a plain proleptic Gregorian calendar (no DST, no leap seconds).
using Timestamp = int64_t;

struct CivilTime {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
};

// Timestamp layouts seen in logger exports, in detection priority order.
// Seconds are optional in every text layout except Compact.
enum class TimestampFormat {
  DayMonthYearSlash,   // 31/12/2023 23:45[:00]
  MonthDayYearSlash,   // 12/31/2023 23:45[:00]
  DayMonthYearDash,    // 31-12-2023 23:45[:00]
  Compact,             // 20231231234500
  Iso,                 // 2023-12-31 23:45[:00] or 2023-12-31T23:45[:00]
  YearMonthDaySlash,   // 2023/12/31 23:45[:00]
  ExcelSerial,         // 45291.98958 (days since 1899-12-30)
};

const char* timestamp_format_name(TimestampFormat fmt);

// All formats in detection priority order.
const std::vector<TimestampFormat>& known_timestamp_formats();

bool is_valid_civil(const CivilTime& c);

// Throws std::runtime_error for an invalid civil date/time.
Timestamp make_timestamp(const CivilTime& c);
Timestamp make_timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

CivilTime to_civil(Timestamp ts);

// Parse one cell in the given format. Surrounding whitespace is ignored.
bool parse_timestamp(const std::string& s, TimestampFormat fmt, Timestamp* out);

// Pick the format that parses the most samples (ties: earlier in priority
// order). Empty samples are ignored.
//
// Returns false if no format parses any sample.
bool detect_timestamp_format(const std::vector<std::string>& samples,
                             TimestampFormat* out_fmt,
                             size_t* out_parsed = nullptr);

// Parse the canonical text forms accepted from users:
//   YYYY-MM-DD HH:MM:SS, YYYY-MM-DDTHH:MM:SS (seconds optional).
bool parse_canonical_timestamp(const std::string& s, Timestamp* out);

// "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(Timestamp ts);

// "YYYYMMDDHHMM" (FDV constants and records)
std::string format_timestamp_compact(Timestamp ts);

// "YYYY-MM-DD"
std::string format_date_iso(Timestamp ts);

// "DD/MM/YYYY"
std::string format_date_dmy(Timestamp ts);

// Midnight of the day containing ts.
Timestamp floor_to_day(Timestamp ts);

constexpr int64_t kSecondsPerDay = 86400;

struct IsoWeek {
  int year{1970};
  int week{1};          // 1..53
  Timestamp monday{0};  // midnight starting the week
};

// ISO-8601 week (weeks start on Monday; week 1 holds the year's first Thursday).
IsoWeek iso_week(Timestamp ts);

} // namespace fdv
