#include "fdv/rainfall.hpp"

#include "fdv/errors.hpp"
#include "fdv/fdv_writer.hpp"
#include "fdv/utils.hpp"

#include <cmath>
#include <optional>
#include <sstream>

namespace fdv {

namespace {

constexpr size_t kValuesPerLine = 5;
constexpr size_t kValueWidth = 15;
constexpr int kAntecedentDays = 31;  // 0_ANT_RAIN .. 30_ANT_RAIN
constexpr const char* kUnknownConstant = "-1.0 ";

static void write_rainfall_header(std::ostringstream& out, const ClassifiedFile& file,
                                  const SiteIdentity& identity) {
  out << header_line("**DATA_FORMAT:", "1,ASCII") << "\n";
  out << header_line("**IDENTIFIER:", "1," + to_upper(identity.site_name.substr(0, 15))) << "\n";
  out << header_line("**FIELD:", "1,INTENSITY") << "\n";
  out << header_line("**UNITS:", "1,MM/HR") << "\n";
  out << header_line("**FORMAT:", "2,F15.1,[5]") << "\n";
  out << header_line("**RECORD_LENGTH:", "I2,75") << "\n";

  // 35 constants: LOCATION, 31 antecedent rainfall values, START, END, INTERVAL.
  std::string line = "35,LOCATION,";
  std::string key = "**CONSTANTS:";
  for (int d = 0; d < kAntecedentDays; ++d) {
    line += std::to_string(d) + "_ANT_RAIN,";
    if (d % 4 == 2 || d == kAntecedentDays - 1) {
      out << header_line(key, line) << "\n";
      key = "*+";
      line.clear();
    }
  }
  out << header_line("*+", "START,END,INTERVAL") << "\n";

  out << header_line("**C_UNITS:", "35, ,MM,MM,MM,MM,MM,MM,MM,MM,MM,MM,") << "\n";
  out << header_line("**C_UNITS:", "MM,MM,MM,MM,MM,MM,MM,MM,MM,MM,MM,") << "\n";
  out << header_line("**C_UNITS:", "MM,MM,MM,MM,MM,MM,MM,MM,MM,MM,GMT,GMT,MIN") << "\n";
  out << header_line("**C_FORMAT:", "8,A20,F7.2/15F5.1/15F5.1/D10,2X,D10,I4") << "\n";
  out << header_line("*$SITE_ID:", identity.site_id) << "\n";
  out << header_line("*$SITE_NAME:", identity.site_name) << "\n";
  out << header_line("*$INTERVAL_SECONDS:", std::to_string(file.sample_interval_seconds)) << "\n";
  out << "*CSTART\n";

  // Unknown location and antecedent rainfall: each field is "-1.0 ".
  std::string location = "UNKNOWN";
  location.append(21 - location.size(), ' ');
  out << location << kUnknownConstant << "\n";
  for (int row = 0; row < 2; ++row) {
    for (int i = 0; i < 15; ++i) out << kUnknownConstant;
    out << "\n";
  }
  out << format_timestamp_compact(identity.start_timestamp) << " "
      << format_timestamp_compact(identity.end_timestamp) << "   "
      << (file.sample_interval_seconds / 60) << "\n";
  out << "*CEND\n";
}

} // namespace

std::vector<double> redistribute_tips(const std::vector<double>& depths_mm) {
  std::vector<double> out;
  out.reserve(depths_mm.size());

  for (double raw : depths_mm) {
    const double v = std::isnan(raw) ? 0.0 : raw;
    if (!(v > kRainTipThreshold)) {
      out.push_back(v);
      continue;
    }

    size_t dry = 0;
    while (dry < kRainMaxSpread && dry < out.size() &&
           out[out.size() - 1 - dry] < kRainTipThreshold) {
      ++dry;
    }
    const size_t first = out.size() - dry;

    if (dry > 0 && v > kRainSpreadCap) {
      const double share = kRainSpreadCap / static_cast<double>(dry);
      for (size_t i = first; i < out.size(); ++i) out[i] = share;
      out.push_back(v - kRainSpreadCap);
    } else {
      const double share = v / static_cast<double>(dry + 1);
      for (size_t i = first; i < out.size(); ++i) out[i] = share;
      out.push_back(share);
    }
  }
  return out;
}

const ChannelDescriptor& select_rainfall_channel(const ClassifiedFile& file, const std::string& name) {
  if (!file.has_group(MonitorGroup::Rainfall)) {
    throw ValidationError(ErrorCode::NoRainfallData, "No rainfall channel in " + file.source_path);
  }
  const std::string n = trim(name);
  if (n.empty()) return file.channels(MonitorGroup::Rainfall).front();
  const ChannelDescriptor* ch = file.find_channel(MonitorGroup::Rainfall, n);
  if (!ch) {
    throw ValidationError(ErrorCode::UnknownChannel, "Unknown Rainfall channel '" + n + "'");
  }
  return *ch;
}

double readings_per_hour(int64_t interval_seconds) {
  if (interval_seconds <= 0) {
    throw ValidationError(ErrorCode::InvalidArgument,
                          "Sample interval must be positive: " + std::to_string(interval_seconds));
  }
  return 3600.0 / static_cast<double>(interval_seconds);
}

std::vector<double> rainfall_samples(const ClassifiedFile& file,
                                     const ChannelDescriptor& channel,
                                     Timestamp start,
                                     Timestamp end) {
  const std::vector<double>& col = file.column(channel);
  std::vector<double> out;
  for (Timestamp t : window_grid(file, start, end)) {
    const std::optional<size_t> idx = file.grid_index(t);
    out.push_back(idx ? col[*idx] : std::nan(""));
  }
  return out;
}

std::string render_rainfall(const ClassifiedFile& file,
                            const SiteIdentity& identity,
                            const std::string& channel,
                            RainfallReport* report,
                            DiagnosticsChannel* diag) {
  const ChannelDescriptor& ch = select_rainfall_channel(file, channel);
  const std::vector<double> samples =
    rainfall_samples(file, ch, identity.start_timestamp, identity.end_timestamp);
  const double per_hour = readings_per_hour(file.sample_interval_seconds);

  RainfallReport rep;
  rep.channel = ch.name;
  rep.samples = samples.size();
  double sum = 0.0;
  for (double v : samples) {
    if (std::isnan(v)) {
      ++rep.missing;
    } else {
      sum += v;
    }
  }
  rep.total_mm = sum / per_hour;

  std::ostringstream out;
  write_rainfall_header(out, file, identity);

  const std::vector<double> spread = redistribute_tips(samples);
  for (size_t i = 0; i < spread.size(); ++i) {
    out << pad_left(format_fixed(spread[i], 1), kValueWidth);
    if ((i + 1) % kValuesPerLine == 0 || i + 1 == spread.size()) out << "\n";
  }
  out << "*END\n";

  std::ostringstream msg;
  msg << "Rainfall: " << rep.samples << " sample(s) from '" << rep.channel << "', total "
      << format_fixed(rep.total_mm, 1) << " mm";
  log_info(diag, msg.str());
  if (rep.missing > 0) {
    log_warn(diag, "Rainfall: " + std::to_string(rep.missing) + " missing sample(s) written as 0");
  }

  if (report) *report = rep;
  return out.str();
}

RainfallReport extract_rainfall(const ClassifiedFile& file,
                                const SiteIdentity& identity,
                                const std::string& channel,
                                const std::string& output_path,
                                DiagnosticsChannel* diag) {
  RainfallReport report;
  const std::string text = render_rainfall(file, identity, channel, &report, diag);
  if (!write_text_file_atomic(output_path, text)) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write rainfall file: " + output_path);
  }
  report.output_path = output_path;
  log_info(diag, "Wrote " + output_path);
  return report;
}

int64_t parse_period_seconds(const std::string& s) {
  const std::string t = to_lower(trim(s));
  if (t == "daily" || t == "day") return kDailyPeriodSeconds;
  if (t == "weekly" || t == "week") return kWeeklyPeriodSeconds;
  if (t == "hourly" || t == "hour") return 3600;
  int v = 0;
  try {
    v = to_int(t);
  } catch (const std::exception&) {
    throw ValidationError(ErrorCode::InvalidArgument, "Invalid totals period: '" + s + "'");
  }
  if (v <= 0) {
    throw ValidationError(ErrorCode::InvalidArgument, "Totals period must be positive: '" + s + "'");
  }
  return v;
}

std::vector<PeriodTotal> compute_period_totals(const ClassifiedFile& file,
                                               const std::string& channel,
                                               int64_t period_seconds) {
  if (period_seconds <= 0) {
    throw ValidationError(ErrorCode::InvalidArgument, "Totals period must be positive");
  }
  const ChannelDescriptor& ch = select_rainfall_channel(file, channel);
  const double per_hour = readings_per_hour(file.sample_interval_seconds);
  const Timestamp start = file.start_timestamp;
  const Timestamp end = file.end_timestamp;

  std::vector<PeriodTotal> totals;
  if (end < start) return totals;
  if (static_cast<uint64_t>((end - start) / period_seconds) + 1 > kMaxGridPoints) {
    throw ValidationError(ErrorCode::InvalidArgument,
                          "Totals period of " + std::to_string(period_seconds) + " s is too short for the window");
  }
  const size_t n_periods = static_cast<size_t>((end - start) / period_seconds) + 1;
  totals.resize(n_periods);
  for (size_t i = 0; i < n_periods; ++i) {
    totals[i].index = i + 1;
    totals[i].start = start + static_cast<int64_t>(i) * period_seconds;
    totals[i].end = totals[i].start + period_seconds;
  }

  const std::vector<Timestamp> grid = window_grid(file, start, end);
  const std::vector<double> samples = rainfall_samples(file, ch, start, end);
  for (size_t i = 0; i < grid.size(); ++i) {
    if (std::isnan(samples[i])) continue;
    PeriodTotal& p = totals[static_cast<size_t>((grid[i] - start) / period_seconds)];
    p.total_mm += samples[i];
    ++p.samples;
  }
  for (auto& p : totals) p.total_mm /= per_hour;
  return totals;
}

std::string render_totals_csv(const std::vector<PeriodTotal>& totals) {
  std::ostringstream out;
  out << "period,start,end,total_mm,samples\n";
  double grand = 0.0;
  size_t samples = 0;
  for (const auto& p : totals) {
    out << p.index << "," << format_timestamp(p.start) << "," << format_timestamp(p.end) << ","
        << format_fixed(p.total_mm, 2) << "," << p.samples << "\n";
    grand += p.total_mm;
    samples += p.samples;
  }
  out << "Grand Total,";
  if (!totals.empty()) {
    out << format_timestamp(totals.front().start) << "," << format_timestamp(totals.back().end);
  } else {
    out << ",";
  }
  out << "," << format_fixed(grand, 2) << "," << samples << "\n";
  return out.str();
}

std::vector<PeriodTotal> totalize(const ClassifiedFile& file,
                                  const std::string& channel,
                                  int64_t period_seconds,
                                  const std::string& output_path,
                                  DiagnosticsChannel* diag) {
  std::vector<PeriodTotal> totals = compute_period_totals(file, channel, period_seconds);
  if (!write_text_file_atomic(output_path, render_totals_csv(totals))) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write rainfall totals: " + output_path);
  }
  log_info(diag, "Wrote " + std::to_string(totals.size()) + " rainfall period total(s) to " + output_path);
  return totals;
}

RainfallTotals compute_rainfall_totals(const ClassifiedFile& file, const std::string& channel) {
  const ChannelDescriptor& ch = select_rainfall_channel(file, channel);
  const double per_hour = readings_per_hour(file.sample_interval_seconds);
  const std::vector<Timestamp> grid = window_grid(file, file.start_timestamp, file.end_timestamp);
  const std::vector<double> samples = rainfall_samples(file, ch, file.start_timestamp, file.end_timestamp);

  RainfallTotals totals;
  for (size_t i = 0; i < grid.size(); ++i) {
    const Timestamp day = floor_to_day(grid[i]);
    if (totals.daily.empty() || totals.daily.back().date != day) {
      totals.daily.push_back(DailyRainfallTotal{day, 0.0});
    }
    if (!std::isnan(samples[i])) totals.daily.back().total_mm += samples[i];
  }
  for (auto& d : totals.daily) d.total_mm /= per_hour;

  for (const auto& d : totals.daily) {
    const IsoWeek w = iso_week(d.date);
    if (totals.weekly.empty() || totals.weekly.back().iso_year != w.year ||
        totals.weekly.back().iso_week != w.week) {
      totals.weekly.push_back(WeeklyRainfallTotal{w.year, w.week, d.date, 0.0});
    }
    totals.weekly.back().total_mm += d.total_mm;
  }
  return totals;
}

std::string render_rainfall_totals_csv(const RainfallTotals& totals) {
  std::ostringstream out;
  out << "Daily Rainfall Totals\n";
  out << "Date,Daily Total (mm)\n";
  for (const auto& d : totals.daily) {
    out << format_date_iso(d.date) << "," << format_fixed(d.total_mm, 2) << "\n";
  }
  out << "\n";
  out << "Weekly Rainfall Totals\n";
  out << "Week Starting,ISO Week,Weekly Total (mm)\n";
  for (const auto& w : totals.weekly) {
    out << format_date_iso(w.week_starting) << "," << w.iso_year << "-W" << (w.iso_week < 10 ? "0" : "")
        << w.iso_week << "," << format_fixed(w.total_mm, 2) << "\n";
  }
  return out.str();
}

RainfallTotals write_rainfall_totals(const ClassifiedFile& file,
                                     const std::string& channel,
                                     const std::string& output_path,
                                     DiagnosticsChannel* diag) {
  RainfallTotals totals = compute_rainfall_totals(file, channel);
  if (!write_text_file_atomic(output_path, render_rainfall_totals_csv(totals))) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write rainfall totals: " + output_path);
  }
  std::ostringstream msg;
  msg << "Rainfall totals: " << totals.daily.size() << " day(s), " << totals.weekly.size()
      << " week(s) -> " << output_path;
  log_info(diag, msg.str());
  return totals;
}

} // namespace fdv
