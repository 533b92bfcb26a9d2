#include "fdv/interim_report.hpp"

#include "fdv/errors.hpp"
#include "fdv/fdv_writer.hpp"
#include "fdv/rainfall.hpp"
#include "fdv/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <sstream>

namespace fdv {

namespace {

constexpr int64_t kSecondsPerWeek = 7 * kSecondsPerDay;

enum class Aggregate {
  Mean,
  Max,
  Min,
  Sum,
};

// A metric reads one series (already in report units) and folds it.
struct Metric {
  std::string name;
  size_t series{0};
  Aggregate agg{Aggregate::Mean};
  double sum_scale{1.0};  // applied to Sum results
};

struct Accum {
  double sum{0.0};
  double min{std::numeric_limits<double>::infinity()};
  double max{-std::numeric_limits<double>::infinity()};
  size_t n{0};

  void add(double v) {
    if (std::isnan(v)) return;
    sum += v;
    min = std::min(min, v);
    max = std::max(max, v);
    ++n;
  }
};

// Per-series accumulators for one row.
struct Bucket {
  std::vector<Accum> acc;
  bool any{false};
};

static double fold(const Metric& m, const std::vector<Accum>& acc) {
  const Accum& a = acc[m.series];
  if (a.n == 0) return std::nan("");
  switch (m.agg) {
    case Aggregate::Mean: return a.sum / static_cast<double>(a.n);
    case Aggregate::Max: return a.max;
    case Aggregate::Min: return a.min;
    case Aggregate::Sum: return a.sum * m.sum_scale;
  }
  return std::nan("");
}

static std::vector<double> scaled_series(const ClassifiedFile& file, const ChannelDescriptor& ch,
                                         const std::vector<Timestamp>& grid, double scale) {
  const std::vector<double>& col = file.column(ch);
  std::vector<double> out;
  out.reserve(grid.size());
  for (Timestamp t : grid) {
    const std::optional<size_t> idx = file.grid_index(t);
    out.push_back(idx ? col[*idx] * scale : std::nan(""));
  }
  return out;
}

static std::string value_cell(double v) {
  return std::isnan(v) ? std::string() : format_fixed(v, 3);
}

} // namespace

InterimReport build_interim_report(const ClassifiedFile& file) {
  if (file.monitor_type == MonitorType::Unknown) {
    throw ValidationError(ErrorCode::UnsupportedMonitorType,
                          "Interim reports need a depth, velocity or rainfall monitor (" +
                          file.source_path + ")");
  }

  const std::vector<Timestamp> grid = window_grid(file, file.start_timestamp, file.end_timestamp);
  const double interval = static_cast<double>(file.sample_interval_seconds);

  std::vector<std::vector<double>> series;
  std::vector<Metric> metrics;
  auto add_triplet = [&](const std::string& first, Aggregate first_agg, double sum_scale,
                         const std::string& unit_label, const std::string& max_min_label) {
    const size_t s = series.size() - 1;
    metrics.push_back(Metric{first + unit_label, s, first_agg, sum_scale});
    metrics.push_back(Metric{"Max " + max_min_label, s, Aggregate::Max, 1.0});
    metrics.push_back(Metric{"Min " + max_min_label, s, Aggregate::Min, 1.0});
  };

  const MonitorType mt = file.monitor_type;
  if (mt == MonitorType::Depth || mt == MonitorType::Combination) {
    const ChannelDescriptor& ch = file.channels(MonitorGroup::Depth).front();
    const double scale = (ch.unit && *ch.unit == "mm") ? 0.001 : 1.0;
    series.push_back(scaled_series(file, ch, grid, scale));
    add_triplet("Average ", Aggregate::Mean, 1.0, "Level(m)", "Level(m)");
  }
  if (mt == MonitorType::Velocity || mt == MonitorType::Combination) {
    const ChannelDescriptor& ch = file.channels(MonitorGroup::Velocity).front();
    const double scale = (ch.unit && *ch.unit == "mm/s") ? 0.001 : 1.0;
    series.push_back(scaled_series(file, ch, grid, scale));
    add_triplet("Average ", Aggregate::Mean, 1.0, "Velocity(m/s)", "Velocity(m/s)");
  }
  if (file.has_group(MonitorGroup::Flow)) {
    const ChannelDescriptor& ch = file.channels(MonitorGroup::Flow).front();
    const double scale = (ch.unit && *ch.unit == "m3/s") ? 1000.0 : 1.0;
    series.push_back(scaled_series(file, ch, grid, scale));
    // l/s over one interval -> m3
    add_triplet("Total ", Aggregate::Sum, interval / 1000.0, "Flow(m3)", "Flow(l/s)");
  }
  if (mt == MonitorType::Rainfall) {
    const ChannelDescriptor& ch = select_rainfall_channel(file, "");
    series.push_back(rainfall_samples(file, ch, file.start_timestamp, file.end_timestamp));
    add_triplet("Total ", Aggregate::Sum, 1.0, "Rainfall(mm)", "Rainfall(mm)");
  }

  InterimReport report;
  report.monitor_type = mt;
  for (const auto& m : metrics) report.metric_names.push_back(m.name);

  // First grid point with any valid reading anchors the weeks.
  std::optional<Timestamp> first_valid;
  for (size_t i = 0; i < grid.size() && !first_valid; ++i) {
    for (const auto& s : series) {
      if (!std::isnan(s[i])) {
        first_valid = grid[i];
        break;
      }
    }
  }

  auto new_bucket = [&]() {
    Bucket b;
    b.acc.assign(series.size(), Accum());
    return b;
  };
  auto to_row = [&](const std::string& label, const std::string& range, const Bucket& b) {
    InterimRow row;
    row.label = label;
    row.date_range = range;
    for (const auto& m : metrics) row.values.push_back(fold(m, b.acc));
    return row;
  };

  Bucket total = new_bucket();
  if (first_valid) {
    const Timestamp week0 = floor_to_day(*first_valid);
    std::map<int64_t, Bucket> weeks;
    std::map<Timestamp, Bucket> days;
    for (size_t i = 0; i < grid.size(); ++i) {
      if (grid[i] < week0) continue;
      const int64_t w = (grid[i] - week0) / kSecondsPerWeek;
      const Timestamp day = floor_to_day(grid[i]);
      auto wit = weeks.find(w);
      if (wit == weeks.end()) wit = weeks.emplace(w, new_bucket()).first;
      auto dit = days.find(day);
      if (dit == days.end()) dit = days.emplace(day, new_bucket()).first;
      for (size_t s = 0; s < series.size(); ++s) {
        const double v = series[s][i];
        if (std::isnan(v)) continue;
        wit->second.acc[s].add(v);
        dit->second.acc[s].add(v);
        total.acc[s].add(v);
        wit->second.any = true;
        dit->second.any = true;
      }
    }

    size_t n = 0;
    for (const auto& kv : weeks) {
      if (!kv.second.any) continue;
      const Timestamp ws = week0 + kv.first * kSecondsPerWeek;
      const std::string range = format_date_iso(ws) + " - " + format_date_iso(ws + 6 * kSecondsPerDay);
      report.weekly.push_back(to_row("Interim " + std::to_string(++n), range, kv.second));
    }
    for (const auto& kv : days) {
      if (!kv.second.any) continue;
      report.daily.push_back(to_row(format_date_dmy(kv.first), "", kv.second));
    }
  }
  report.grand_total = to_row("Grand Total", "", total);
  return report;
}

std::string render_interim_report_csv(const InterimReport& report) {
  std::ostringstream out;
  out << "Interim Period,Date Range";
  for (const auto& n : report.metric_names) out << "," << n;
  out << "\n";
  auto write_row = [&](const InterimRow& r, bool with_range) {
    out << r.label;
    if (with_range) out << "," << r.date_range;
    for (double v : r.values) out << "," << value_cell(v);
    out << "\n";
  };
  for (const auto& r : report.weekly) write_row(r, true);
  write_row(report.grand_total, true);

  out << "\n";
  out << "Date";
  for (const auto& n : report.metric_names) out << "," << n;
  out << "\n";
  for (const auto& r : report.daily) write_row(r, false);
  return out.str();
}

InterimReport generate_interim_report(const ClassifiedFile& file,
                                      const std::string& output_path,
                                      DiagnosticsChannel* diag) {
  InterimReport report = build_interim_report(file);
  if (!write_text_file_atomic(output_path, render_interim_report_csv(report))) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write interim report: " + output_path);
  }
  std::ostringstream msg;
  msg << "Interim report (" << monitor_type_name(report.monitor_type) << "): "
      << report.weekly.size() << " week(s), " << report.daily.size() << " day(s) -> " << output_path;
  log_info(diag, msg.str());
  return report;
}

} // namespace fdv
