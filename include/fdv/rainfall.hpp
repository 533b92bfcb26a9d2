#pragma once

#include "fdv/diagnostics.hpp"
#include "fdv/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fdv {

// Tipping-bucket redistribution limits.
constexpr double kRainTipThreshold = 1e-5;  // samples below this count as dry
constexpr size_t kRainMaxSpread = 4;        // dry samples a tip may spread over
constexpr double kRainSpreadCap = 6.0;      // mm spread over the dry run for large tips

// Spread each positive depth (mm) over the run of up to kRainMaxSpread dry
// samples immediately before it.
//
// For a run of n dry samples followed by a depth v:
//  - v > kRainSpreadCap (and n > 0): the run gets kRainSpreadCap / n each and
//    the sample keeps v - kRainSpreadCap;
//  - otherwise the run and the sample each get v / (n + 1).
//
// Processing is sequential: a sample already filled by an earlier spread is
// no longer dry. NaN values are treated as 0.
std::vector<double> redistribute_tips(const std::vector<double>& depths_mm);

struct RainfallReport {
  std::string output_path;
  std::string channel;
  size_t samples{0};      // grid points written
  size_t missing{0};      // grid points without a reading (written as 0)
  double total_mm{0.0};   // rainfall depth over the window: sum / readings per hour
};

// Rainfall channel by name, or the first one when name is empty.
// Throws ValidationError(NoRainfallData) when the file has no rainfall group
// and ValidationError(UnknownChannel) for an unknown name.
const ChannelDescriptor& select_rainfall_channel(const ClassifiedFile& file, const std::string& name);

// 3600 / interval_seconds. Throws ValidationError(InvalidArgument) for a
// non-positive interval.
double readings_per_hour(int64_t interval_seconds);

// Per-grid-point rainfall readings over [start, end] as logged; NaN where
// missing.
std::vector<double> rainfall_samples(const ClassifiedFile& file,
                                     const ChannelDescriptor& channel,
                                     Timestamp start,
                                     Timestamp end);

// Render the ".r" rainfall intensity artifact for the identity's window.
// Readings are written as logged after tip redistribution.
std::string render_rainfall(const ClassifiedFile& file,
                            const SiteIdentity& identity,
                            const std::string& channel,
                            RainfallReport* report = nullptr,
                            DiagnosticsChannel* diag = nullptr);

// Render and write atomically. IOError(WriteFailed) on failure.
RainfallReport extract_rainfall(const ClassifiedFile& file,
                                const SiteIdentity& identity,
                                const std::string& channel,
                                const std::string& output_path,
                                DiagnosticsChannel* diag = nullptr);

constexpr int64_t kDailyPeriodSeconds = 86400;
constexpr int64_t kWeeklyPeriodSeconds = 604800;

// Parse "daily", "weekly", "hourly" or a number of seconds.
// Throws ValidationError(InvalidArgument).
int64_t parse_period_seconds(const std::string& s);

struct PeriodTotal {
  size_t index{0};   // 1-based
  Timestamp start{0};
  Timestamp end{0};  // exclusive
  double total_mm{0.0};  // sum of readings / readings per hour
  size_t samples{0};     // non-missing readings in the period
};

// Rainfall depth in consecutive periods aligned to the file's
// start_timestamp, up to end_timestamp. Periods without readings are kept
// with a zero total. Throws ValidationError(InvalidArgument) for
// period_seconds <= 0.
std::vector<PeriodTotal> compute_period_totals(const ClassifiedFile& file,
                                               const std::string& channel,
                                               int64_t period_seconds);

// period,start,end,total_mm,samples ... Grand Total row last.
std::string render_totals_csv(const std::vector<PeriodTotal>& totals);

std::vector<PeriodTotal> totalize(const ClassifiedFile& file,
                                  const std::string& channel,
                                  int64_t period_seconds,
                                  const std::string& output_path,
                                  DiagnosticsChannel* diag = nullptr);

struct DailyRainfallTotal {
  Timestamp date{0};  // midnight
  double total_mm{0.0};
};

struct WeeklyRainfallTotal {
  int iso_year{0};
  int iso_week{0};
  Timestamp week_starting{0};  // first day of the week present in the data
  double total_mm{0.0};
};

struct RainfallTotals {
  std::vector<DailyRainfallTotal> daily;
  std::vector<WeeklyRainfallTotal> weekly;
};

// Calendar-day totals over the file's start/end window (sum of readings /
// readings per hour, missing readings count as 0), then ISO-week sums of
// the daily totals. Both lists are in date order.
RainfallTotals compute_rainfall_totals(const ClassifiedFile& file, const std::string& channel);

// "Daily Rainfall Totals" table, a blank line, then "Weekly Rainfall Totals".
std::string render_rainfall_totals_csv(const RainfallTotals& totals);

RainfallTotals write_rainfall_totals(const ClassifiedFile& file,
                                     const std::string& channel,
                                     const std::string& output_path,
                                     DiagnosticsChannel* diag = nullptr);

} // namespace fdv
