#include "fdv/timestamp.hpp"

#include "fdv/utils.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace fdv {

namespace {

static bool is_leap_year(int y) {
  if (y % 4 != 0) return false;
  if (y % 100 != 0) return true;
  return (y % 400 == 0);
}

static int days_in_month(int y, int m) {
  static const int mdays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) return 0;
  if (m == 2) return mdays[1] + (is_leap_year(y) ? 1 : 0);
  return mdays[m - 1];
}

// Howard Hinnant's civil date algorithms (days relative to 1970-01-01).
static int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= (m <= 2) ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int* y, int* m, int* d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t yy = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned dd = doy - (153 * mp + 2) / 5 + 1;
  const unsigned mm = mp < 10 ? mp + 3 : mp - 9;
  *y = static_cast<int>(yy + (mm <= 2 ? 1 : 0));
  *m = static_cast<int>(mm);
  *d = static_cast<int>(dd);
}

static int64_t floor_div(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

// Parse an unsigned integer of 1..max_len digits.
static bool parse_uint_field(const std::string& s, size_t max_len, int* out) {
  if (s.empty() || s.size() > max_len || !all_digits(s)) return false;
  int v = 0;
  for (char c : s) v = v * 10 + (c - '0');
  *out = v;
  return true;
}

static bool split3(const std::string& s, char sep, std::string* a, std::string* b, std::string* c) {
  const size_t p1 = s.find(sep);
  if (p1 == std::string::npos) return false;
  const size_t p2 = s.find(sep, p1 + 1);
  if (p2 == std::string::npos) return false;
  if (s.find(sep, p2 + 1) != std::string::npos) return false;
  *a = s.substr(0, p1);
  *b = s.substr(p1 + 1, p2 - p1 - 1);
  *c = s.substr(p2 + 1);
  return true;
}

// "HH:MM" or "HH:MM:SS" with optional fractional seconds (truncated).
static bool parse_clock(const std::string& s, CivilTime* c) {
  const size_t p1 = s.find(':');
  if (p1 == std::string::npos) return false;
  const size_t p2 = s.find(':', p1 + 1);

  int h = 0;
  int mi = 0;
  int se = 0;
  if (!parse_uint_field(s.substr(0, p1), 2, &h)) return false;
  if (p2 == std::string::npos) {
    if (!parse_uint_field(s.substr(p1 + 1), 2, &mi)) return false;
  } else {
    if (!parse_uint_field(s.substr(p1 + 1, p2 - p1 - 1), 2, &mi)) return false;
    std::string sec = s.substr(p2 + 1);
    const size_t dot = sec.find('.');
    if (dot != std::string::npos) {
      if (!all_digits(sec.substr(dot + 1))) return false;
      sec = sec.substr(0, dot);
    }
    if (!parse_uint_field(sec, 2, &se)) return false;
  }
  c->hour = h;
  c->minute = mi;
  c->second = se;
  return true;
}

// Split "<date><sep><clock>" on the first space (or 'T' when allowed).
static bool split_date_clock(const std::string& s, bool allow_t, std::string* date, std::string* clock) {
  size_t pos = s.find(' ');
  if (pos == std::string::npos && allow_t) pos = s.find('T');
  if (pos == std::string::npos) return false;
  *date = s.substr(0, pos);
  *clock = trim(s.substr(pos + 1));
  return !date->empty() && !clock->empty();
}

static bool parse_text_format(const std::string& t, TimestampFormat fmt, Timestamp* out) {
  CivilTime c;
  std::string date;
  std::string clock;
  std::string a, b, d;

  switch (fmt) {
    case TimestampFormat::DayMonthYearSlash:
    case TimestampFormat::MonthDayYearSlash:
    case TimestampFormat::DayMonthYearDash: {
      if (!split_date_clock(t, false, &date, &clock)) return false;
      const char sep = (fmt == TimestampFormat::DayMonthYearDash) ? '-' : '/';
      if (!split3(date, sep, &a, &b, &d)) return false;
      int first = 0;
      int second = 0;
      if (!parse_uint_field(a, 2, &first) || !parse_uint_field(b, 2, &second)) return false;
      if (d.size() != 4 || !parse_uint_field(d, 4, &c.year)) return false;
      if (fmt == TimestampFormat::MonthDayYearSlash) {
        c.month = first;
        c.day = second;
      } else {
        c.day = first;
        c.month = second;
      }
      break;
    }
    case TimestampFormat::Iso:
    case TimestampFormat::YearMonthDaySlash: {
      const bool iso = (fmt == TimestampFormat::Iso);
      if (!split_date_clock(t, iso, &date, &clock)) return false;
      if (!split3(date, iso ? '-' : '/', &a, &b, &d)) return false;
      if (a.size() != 4 || !parse_uint_field(a, 4, &c.year)) return false;
      if (!parse_uint_field(b, 2, &c.month) || !parse_uint_field(d, 2, &c.day)) return false;
      break;
    }
    default:
      return false;
  }

  if (!parse_clock(clock, &c)) return false;
  if (!is_valid_civil(c)) return false;
  *out = make_timestamp(c);
  return true;
}

} // namespace

const char* timestamp_format_name(TimestampFormat fmt) {
  switch (fmt) {
    case TimestampFormat::DayMonthYearSlash: return "%d/%m/%Y %H:%M:%S";
    case TimestampFormat::MonthDayYearSlash: return "%m/%d/%Y %H:%M:%S";
    case TimestampFormat::DayMonthYearDash: return "%d-%m-%Y %H:%M:%S";
    case TimestampFormat::Compact: return "%Y%m%d%H%M%S";
    case TimestampFormat::Iso: return "%Y-%m-%d %H:%M:%S";
    case TimestampFormat::YearMonthDaySlash: return "%Y/%m/%d %H:%M:%S";
    case TimestampFormat::ExcelSerial: return "excel-serial";
  }
  return "unknown";
}

const std::vector<TimestampFormat>& known_timestamp_formats() {
  static const std::vector<TimestampFormat> kFormats = {
    TimestampFormat::DayMonthYearSlash,
    TimestampFormat::MonthDayYearSlash,
    TimestampFormat::DayMonthYearDash,
    TimestampFormat::Compact,
    TimestampFormat::Iso,
    TimestampFormat::YearMonthDaySlash,
    TimestampFormat::ExcelSerial,
  };
  return kFormats;
}

bool is_valid_civil(const CivilTime& c) {
  if (c.year < 1 || c.year > 9999) return false;
  if (c.month < 1 || c.month > 12) return false;
  if (c.day < 1 || c.day > days_in_month(c.year, c.month)) return false;
  if (c.hour < 0 || c.hour > 23) return false;
  if (c.minute < 0 || c.minute > 59) return false;
  if (c.second < 0 || c.second > 59) return false;
  return true;
}

Timestamp make_timestamp(const CivilTime& c) {
  if (!is_valid_civil(c)) {
    throw std::runtime_error("invalid calendar date/time");
  }
  const int64_t days = days_from_civil(c.year, static_cast<unsigned>(c.month),
                                       static_cast<unsigned>(c.day));
  return days * kSecondsPerDay + c.hour * 3600 + c.minute * 60 + c.second;
}

Timestamp make_timestamp(int year, int month, int day, int hour, int minute, int second) {
  CivilTime c;
  c.year = year;
  c.month = month;
  c.day = day;
  c.hour = hour;
  c.minute = minute;
  c.second = second;
  return make_timestamp(c);
}

CivilTime to_civil(Timestamp ts) {
  const int64_t days = floor_div(ts, kSecondsPerDay);
  const int64_t secs = ts - days * kSecondsPerDay;
  CivilTime c;
  civil_from_days(days, &c.year, &c.month, &c.day);
  c.hour = static_cast<int>(secs / 3600);
  c.minute = static_cast<int>((secs % 3600) / 60);
  c.second = static_cast<int>(secs % 60);
  return c;
}

bool parse_timestamp(const std::string& s, TimestampFormat fmt, Timestamp* out) {
  if (!out) return false;
  const std::string t = trim(s);
  if (t.empty()) return false;

  if (fmt == TimestampFormat::Compact) {
    if ((t.size() != 14 && t.size() != 12) || !all_digits(t)) return false;
    CivilTime c;
    c.year = std::stoi(t.substr(0, 4));
    c.month = std::stoi(t.substr(4, 2));
    c.day = std::stoi(t.substr(6, 2));
    c.hour = std::stoi(t.substr(8, 2));
    c.minute = std::stoi(t.substr(10, 2));
    c.second = (t.size() == 14) ? std::stoi(t.substr(12, 2)) : 0;
    if (!is_valid_civil(c)) return false;
    *out = make_timestamp(c);
    return true;
  }

  if (fmt == TimestampFormat::ExcelSerial) {
    for (char ch : t) {
      if (!((ch >= '0' && ch <= '9') || ch == '.')) return false;
    }
    double v = 0.0;
    if (!parse_number_cell(t, false, &v)) return false;
    // 1 = 1900-01-01 ... 2958465 = 9999-12-31
    if (!(v >= 1.0 && v < 2958466.0)) return false;
    const int64_t kEpochOffsetDays = 25569; // 1899-12-30 -> 1970-01-01
    *out = static_cast<Timestamp>(std::llround((v - static_cast<double>(kEpochOffsetDays)) *
                                               static_cast<double>(kSecondsPerDay)));
    return true;
  }

  return parse_text_format(t, fmt, out);
}

bool detect_timestamp_format(const std::vector<std::string>& samples,
                             TimestampFormat* out_fmt,
                             size_t* out_parsed) {
  size_t best_n = 0;
  TimestampFormat best = TimestampFormat::Iso;
  for (TimestampFormat fmt : known_timestamp_formats()) {
    size_t n = 0;
    Timestamp ts = 0;
    for (const auto& s : samples) {
      if (parse_timestamp(s, fmt, &ts)) ++n;
    }
    if (n > best_n) {
      best_n = n;
      best = fmt;
    }
  }
  if (best_n == 0) return false;
  if (out_fmt) *out_fmt = best;
  if (out_parsed) *out_parsed = best_n;
  return true;
}

bool parse_canonical_timestamp(const std::string& s, Timestamp* out) {
  return parse_timestamp(s, TimestampFormat::Iso, out);
}

std::string format_timestamp(Timestamp ts) {
  const CivilTime c = to_civil(ts);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                c.year, c.month, c.day, c.hour, c.minute, c.second);
  return std::string(buf);
}

std::string format_timestamp_compact(Timestamp ts) {
  const CivilTime c = to_civil(ts);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d",
                c.year, c.month, c.day, c.hour, c.minute);
  return std::string(buf);
}

std::string format_date_iso(Timestamp ts) {
  const CivilTime c = to_civil(ts);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
  return std::string(buf);
}

std::string format_date_dmy(Timestamp ts) {
  const CivilTime c = to_civil(ts);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", c.day, c.month, c.year);
  return std::string(buf);
}

Timestamp floor_to_day(Timestamp ts) {
  return floor_div(ts, kSecondsPerDay) * kSecondsPerDay;
}

IsoWeek iso_week(Timestamp ts) {
  const int64_t day = floor_div(ts, kSecondsPerDay);
  // 1970-01-01 was a Thursday.
  const int64_t weekday = ((day + 3) % 7 + 7) % 7;  // 0 = Monday
  const int64_t thursday = day - weekday + 3;
  const int year = to_civil(thursday * kSecondsPerDay).year;
  const int64_t jan1 = floor_div(make_timestamp(year, 1, 1), kSecondsPerDay);

  IsoWeek w;
  w.year = year;
  w.week = static_cast<int>((thursday - jan1) / 7 + 1);
  w.monday = (day - weekday) * kSecondsPerDay;
  return w;
}

} // namespace fdv
