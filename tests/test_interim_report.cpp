#include "fdv/classifier.hpp"
#include "fdv/errors.hpp"
#include "fdv/interim_report.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace fdv;
using fdv_test::approx;

static ClassifiedFile load(const std::string& text, const std::string& path) {
  TableReaderOptions ropts;
  ropts.header_keywords = default_timestamp_keywords();
  return classify(parse_table(text, path, ropts));
}

// Nine days of 6-hourly depth readings; day d (1-based) reads d * 100 mm.
static ClassifiedFile nine_days() {
  std::ostringstream text;
  text << "Time,Depth (mm)\n";
  const Timestamp t0 = make_timestamp(2024, 1, 1);
  for (int d = 0; d < 9; ++d) {
    for (int h = 0; h < 24; h += 6) {
      text << format_timestamp(t0 + d * kSecondsPerDay + h * 3600) << "," << (d + 1) * 100 << "\n";
    }
  }
  return load(text.str(), "D9.csv");
}

int main() {
  try {
    // Depth monitor: weekly, grand total and daily rows.
    {
      const ClassifiedFile f = nine_days();
      const InterimReport r = build_interim_report(f);
      assert(r.monitor_type == MonitorType::Depth);
      assert(r.metric_names ==
             (std::vector<std::string>{"Average Level(m)", "Max Level(m)", "Min Level(m)"}));

      assert(r.weekly.size() == 2);
      assert(r.weekly[0].label == "Interim 1");
      assert(r.weekly[0].date_range == "2024-01-01 - 2024-01-07");
      assert(approx(r.weekly[0].values[0], 0.4));
      assert(approx(r.weekly[0].values[1], 0.7));
      assert(approx(r.weekly[0].values[2], 0.1));
      assert(r.weekly[1].date_range == "2024-01-08 - 2024-01-14");
      assert(approx(r.weekly[1].values[0], 0.85));

      // Grand total averages all samples.
      assert(approx(r.grand_total.values[0], 0.5));
      assert(approx(r.grand_total.values[1], 0.9));
      assert(approx(r.grand_total.values[2], 0.1));

      assert(r.daily.size() == 9);
      assert(r.daily[0].label == "01/01/2024");
      assert(approx(r.daily[8].values[0], 0.9));

      const std::string csv = render_interim_report_csv(r);
      std::vector<std::string> lines;
      {
        std::istringstream in(csv);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
      }
      assert(lines[0] == "Interim Period,Date Range,Average Level(m),Max Level(m),Min Level(m)");
      assert(lines[1] == "Interim 1,2024-01-01 - 2024-01-07,0.400,0.700,0.100");
      assert(lines[3] == "Grand Total,,0.500,0.900,0.100");
      assert(lines[4].empty());
      assert(lines[5] == "Date,Average Level(m),Max Level(m),Min Level(m)");
      assert(lines[6] == "01/01/2024,0.100,0.100,0.100");
      assert(lines.size() == 15);

      // The session window limits the report and re-anchors the weeks.
      ClassifiedFile windowed = f;
      windowed.start_timestamp = make_timestamp(2024, 1, 8, 12);
      const InterimReport w = build_interim_report(windowed);
      assert(w.weekly.size() == 1);
      assert(w.weekly[0].date_range == "2024-01-08 - 2024-01-14");
      assert(w.daily.size() == 2);
    }

    // Weeks without data are omitted; numbering stays consecutive.
    {
      const ClassifiedFile f = load("Time,Level\n2024-01-01 00:00,1\n2024-01-20 00:00,2\n", "L1.csv");
      const InterimReport r = build_interim_report(f);
      assert(r.weekly.size() == 2);
      assert(r.weekly[1].label == "Interim 2");
      assert(r.weekly[1].date_range == "2024-01-15 - 2024-01-21");
    }

    // Combination with a logger flow channel.
    {
      const ClassifiedFile f = load("Time,Depth (mm),Velocity (m/s),Flow (l/s)\n"
                                    "2024-02-01 00:00,100,0.5,10\n"
                                    "2024-02-01 00:01,200,,20\n",
                                    "C1.csv");
      const InterimReport r = build_interim_report(f);
      assert(r.monitor_type == MonitorType::Combination);
      assert(r.metric_names.size() == 9);
      assert(r.metric_names[3] == "Average Velocity(m/s)");
      assert(r.metric_names[6] == "Total Flow(m3)");
      assert(r.metric_names[7] == "Max Flow(l/s)");
      assert(approx(r.grand_total.values[0], 0.15));
      assert(approx(r.grand_total.values[3], 0.5));
      assert(approx(r.grand_total.values[6], 1.8));
      assert(approx(r.grand_total.values[8], 10.0));
    }

    // Rainfall totals and empty cells for metrics without data.
    {
      const ClassifiedFile f = load("Time,Rain (mm)\n2024-03-01 00:00,0.2\n2024-03-01 00:05,0.4\n", "R1.csv");
      const InterimReport r = build_interim_report(f);
      assert(r.metric_names[0] == "Total Rainfall(mm)");
      assert(approx(r.grand_total.values[0], 0.6));
      assert(approx(r.grand_total.values[1], 0.4));
      assert(approx(r.grand_total.values[2], 0.2));

      const ClassifiedFile v = load("Time,Velocity (m/s)\n2024-03-01 00:00,\n2024-03-01 00:05,\n", "V1.csv");
      const InterimReport e = build_interim_report(v);
      assert(e.weekly.empty());
      assert(e.daily.empty());
      assert(std::isnan(e.grand_total.values[0]));
      assert(render_interim_report_csv(e).find("Grand Total,,,,\n") != std::string::npos);
    }

    // Unsupported monitor type.
    {
      const ClassifiedFile f = load("Time,Temp\n2024-03-01 00:00,1\n2024-03-01 00:05,2\n", "T1.csv");
      bool threw = false;
      try {
        (void)build_interim_report(f);
      } catch (const ValidationError& e) {
        threw = (e.code() == ErrorCode::UnsupportedMonitorType);
      }
      assert(threw);
    }

    // Written file.
    {
      const std::string path = "test_interim_report_tmp.csv";
      DiagnosticsChannel diag;
      const InterimReport r = generate_interim_report(nine_days(), path, &diag);
      assert(r.weekly.size() == 2);
      assert(fdv_test::read_file(path).find("Interim 2,") != std::string::npos);
      assert(diag.size() == 1);
      fdv_test::remove_all(path);
    }

    std::cout << "test_interim_report: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_interim_report failed: " << e.what() << "\n";
    return 1;
  }
}
