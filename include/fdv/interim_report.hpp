#pragma once

#include "fdv/diagnostics.hpp"
#include "fdv/types.hpp"

#include <string>
#include <vector>

namespace fdv {

// One row of an interim table: label, optional date range, one value per
// metric (NaN when no valid sample contributed).
struct InterimRow {
  std::string label;
  std::string date_range;
  std::vector<double> values;
};

// Weekly interim summaries plus a daily table for one classified file.
//
// Metrics depend on the monitor type:
//  - Depth / Combination: Average/Max/Min Level(m) of the first depth channel
//  - Velocity / Combination: Average/Max/Min Velocity(m/s)
//  - a Flow group (any type): Total Flow(m3), Max/Min Flow(l/s)
//  - Rainfall: Total/Max/Min Rainfall(mm)
//
// Weeks start at midnight of the first day with data in the session window
// and span 7 days; weeks without valid samples are omitted.
struct InterimReport {
  MonitorType monitor_type{MonitorType::Unknown};
  std::vector<std::string> metric_names;
  std::vector<InterimRow> weekly;
  InterimRow grand_total;
  std::vector<InterimRow> daily;
};

// Throws ValidationError(UnsupportedMonitorType) for MonitorType::Unknown.
InterimReport build_interim_report(const ClassifiedFile& file);

std::string render_interim_report_csv(const InterimReport& report);

// Build, render and write atomically (IOError(WriteFailed) on failure).
InterimReport generate_interim_report(const ClassifiedFile& file,
                                      const std::string& output_path,
                                      DiagnosticsChannel* diag = nullptr);

} // namespace fdv
