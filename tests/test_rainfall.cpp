#include "fdv/classifier.hpp"
#include "fdv/errors.hpp"
#include "fdv/fdv_writer.hpp"
#include "fdv/rainfall.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <numeric>
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

static SiteIdentity identity_of(const ClassifiedFile& f) {
  SiteIdentity id;
  id.site_id = f.site_id;
  id.site_name = f.site_name;
  id.start_timestamp = f.start_timestamp;
  id.end_timestamp = f.end_timestamp;
  return id;
}

static bool same(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!approx(a[i], b[i], 1e-9)) return false;
  }
  return true;
}

template <class F>
static bool throws_code(F&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const Error& e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    // Tip redistribution.
    assert(same(redistribute_tips({0, 0, 0, 0.2}), {0.05, 0.05, 0.05, 0.05}));
    assert(same(redistribute_tips({0, 0, 0, 0, 0, 0, 0.5}), {0, 0, 0.1, 0.1, 0.1, 0.1, 0.1}));
    assert(same(redistribute_tips({0, 0, 10}), {3, 3, 4}));
    assert(same(redistribute_tips({0.2, 0.2}), {0.2, 0.2}));
    assert(same(redistribute_tips({12}), {12}));
    assert(same(redistribute_tips({0, 0.2, 0, 0.3}), {0.1, 0.1, 0.15, 0.15}));
    assert(same(redistribute_tips({std::nan(""), 0.4}), {0.2, 0.2}));
    {
      const std::vector<double> in = {0, 0, 0.4, 0, 9.0, 0, 0, 0, 0, 0, 0.2};
      const std::vector<double> out = redistribute_tips(in);
      assert(out.size() == in.size());
      assert(approx(std::accumulate(out.begin(), out.end(), 0.0),
                    std::accumulate(in.begin(), in.end(), 0.0), 1e-9));
    }

    // Period names.
    assert(parse_period_seconds("Daily") == kDailyPeriodSeconds);
    assert(parse_period_seconds("weekly") == kWeeklyPeriodSeconds);
    assert(parse_period_seconds("hourly") == 3600);
    assert(parse_period_seconds("900") == 900);
    assert(throws_code([]() { (void)parse_period_seconds("0"); }, ErrorCode::InvalidArgument));
    assert(throws_code([]() { (void)parse_period_seconds("fortnightly"); }, ErrorCode::InvalidArgument));

    // Intensity artifact.
    const ClassifiedFile f = load("Time,Rain (mm)\n"
                                  "2024-01-01 00:00,0\n"
                                  "2024-01-01 00:02,0\n"
                                  "2024-01-01 00:04,0.2\n"
                                  "2024-01-01 00:06,\n"
                                  "2024-01-01 00:08,0\n",
                                  "R4.csv");
    assert(f.monitor_type == MonitorType::Rainfall);
    {
      RainfallReport rep;
      const std::string out = render_rainfall(f, identity_of(f), "", &rep);
      assert(rep.channel == "Rain (mm)");
      assert(rep.samples == 5);
      assert(rep.missing == 1);
      assert(approx(rep.total_mm, 0.2 / 30.0));

      std::vector<std::string> lines;
      {
        std::istringstream in(out);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
      }
      assert(lines[0] == header_line("**DATA_FORMAT:", "1,ASCII"));
      assert(lines[2] == header_line("**FIELD:", "1,INTENSITY"));
      assert(lines[3] == header_line("**UNITS:", "1,MM/HR"));
      assert(lines[6] == header_line("**CONSTANTS:", "35,LOCATION,0_ANT_RAIN,1_ANT_RAIN,2_ANT_RAIN,"));
      size_t cstart = 0;
      while (cstart < lines.size() && lines[cstart] != "*CSTART") ++cstart;
      assert(cstart < lines.size());
      assert(lines[cstart + 1] == "UNKNOWN" + std::string(14, ' ') + "-1.0 ");
      std::string unknown_row;
      for (int i = 0; i < 15; ++i) unknown_row += "-1.0 ";
      assert(lines[cstart + 2] == unknown_row);
      assert(lines[cstart + 3] == unknown_row);
      assert(lines[cstart + 4] == "202401010000 202401010008   2");
      assert(lines[cstart + 5] == "*CEND");
      // 0.2 spread over the two dry readings before it; written unscaled.
      const std::string v1 = std::string(12, ' ') + "0.1";
      const std::string v0 = std::string(12, ' ') + "0.0";
      assert(lines[cstart + 6] == v1 + v1 + v1 + v0 + v0);
      assert(lines[cstart + 7] == "*END");
    }

    // Readings are written as logged whatever the channel unit.
    {
      const ClassifiedFile g = load("Time,Rain Intensity (mm/hr)\n"
                                    "2024-01-01 00:00,30\n"
                                    "2024-01-01 00:02,0\n",
                                    "R5.csv");
      const auto d = rainfall_samples(g, g.channels(MonitorGroup::Rainfall)[0], g.data_start, g.data_end);
      assert(same(d, {30.0, 0.0}));

      RainfallReport rep;
      const std::string out = render_rainfall(g, identity_of(g), "", &rep);
      assert(out.find(std::string(11, ' ') + "30.0" + std::string(12, ' ') + "0.0\n*END\n") !=
             std::string::npos);
      assert(approx(rep.total_mm, 1.0));
    }

    assert(approx(readings_per_hour(120), 30.0));
    assert(approx(readings_per_hour(3600), 1.0));
    assert(throws_code([]() { (void)readings_per_hour(0); }, ErrorCode::InvalidArgument));

    // Channel selection.
    {
      const ClassifiedFile depth = load("Time,Depth (mm)\n2024-01-01 00:00,1\n2024-01-01 00:02,2\n", "D1.csv");
      assert(throws_code([&]() { (void)select_rainfall_channel(depth, ""); }, ErrorCode::NoRainfallData));
      assert(throws_code([&]() { (void)select_rainfall_channel(f, "Other"); }, ErrorCode::UnknownChannel));
      assert(select_rainfall_channel(f, "Rain (mm)").name == "Rain (mm)");
    }

    // Daily totals over 36 hours of 1 mm/h with one missing hour.
    {
      std::ostringstream text;
      text << "Time,Rain (mm)\n";
      const Timestamp t0 = make_timestamp(2024, 1, 1);
      for (int h = 0; h <= 36; ++h) {
        text << format_timestamp(t0 + h * 3600) << "," << (h == 5 ? "" : "1") << "\n";
      }
      const ClassifiedFile r = load(text.str(), "R6.csv");
      const std::vector<PeriodTotal> totals = compute_period_totals(r, "", kDailyPeriodSeconds);
      assert(totals.size() == 2);
      assert(totals[0].index == 1);
      assert(totals[0].start == t0);
      assert(totals[0].end == t0 + kSecondsPerDay);
      assert(approx(totals[0].total_mm, 23.0));
      assert(totals[0].samples == 23);
      assert(approx(totals[1].total_mm, 13.0));
      assert(totals[1].samples == 13);

      const std::string csv = render_totals_csv(totals);
      assert(csv.find("period,start,end,total_mm,samples\n") == 0);
      assert(csv.find("1,2024-01-01 00:00:00,2024-01-02 00:00:00,23.00,23\n") != std::string::npos);
      assert(csv.find("Grand Total,2024-01-01 00:00:00,2024-01-03 00:00:00,36.00,36\n") !=
             std::string::npos);

      // Periods without readings are kept with a zero total.
      const std::vector<PeriodTotal> hourly = compute_period_totals(r, "", 3600);
      assert(hourly.size() == 37);
      assert(hourly[5].samples == 0);
      assert(approx(hourly[5].total_mm, 0.0));

      assert(throws_code([&]() { (void)compute_period_totals(r, "", 0); }, ErrorCode::InvalidArgument));
    }

    // Period totals divide by readings per hour.
    {
      const ClassifiedFile r = load("Time,Rain Intensity (mm/hr)\n"
                                    "2024-01-01 00:00,6\n"
                                    "2024-01-01 00:30,2\n"
                                    "2024-01-01 01:00,4\n",
                                    "R7.csv");
      const std::vector<PeriodTotal> hourly = compute_period_totals(r, "", 3600);
      assert(hourly.size() == 2);
      assert(approx(hourly[0].total_mm, 4.0));
      assert(approx(hourly[1].total_mm, 2.0));
    }

    // Daily and ISO-week totals.
    {
      std::ostringstream text;
      text << "Time,Rain (mm)\n";
      const Timestamp t0 = make_timestamp(2024, 1, 6);  // Saturday
      for (int i = 0; i < 120; ++i) {
        text << format_timestamp(t0 + i * 1800) << "," << (i == 3 ? "" : "2") << "\n";
      }
      const ClassifiedFile r = load(text.str(), "R8.csv");
      const RainfallTotals totals = compute_rainfall_totals(r, "");
      assert(totals.daily.size() == 3);
      assert(totals.daily[0].date == t0);
      assert(approx(totals.daily[0].total_mm, 47.0));
      assert(approx(totals.daily[1].total_mm, 48.0));
      assert(approx(totals.daily[2].total_mm, 24.0));

      assert(totals.weekly.size() == 2);
      assert(totals.weekly[0].iso_year == 2024 && totals.weekly[0].iso_week == 1);
      assert(totals.weekly[0].week_starting == t0);
      assert(approx(totals.weekly[0].total_mm, 95.0));
      assert(totals.weekly[1].iso_week == 2);
      assert(totals.weekly[1].week_starting == make_timestamp(2024, 1, 8));
      assert(approx(totals.weekly[1].total_mm, 24.0));

      const std::string csv = render_rainfall_totals_csv(totals);
      assert(csv.find("Daily Rainfall Totals\nDate,Daily Total (mm)\n2024-01-06,47.00\n") == 0);
      assert(csv.find("\n\nWeekly Rainfall Totals\nWeek Starting,ISO Week,Weekly Total (mm)\n"
                      "2024-01-06,2024-W01,95.00\n2024-01-08,2024-W02,24.00\n") != std::string::npos);

      const ClassifiedFile depth = load("Time,Depth (mm)\n2024-01-01 00:00,1\n2024-01-01 00:02,2\n", "D2.csv");
      assert(throws_code([&]() { (void)compute_rainfall_totals(depth, ""); }, ErrorCode::NoRainfallData));
    }

    // Files on disk.
    {
      const std::string dir = "test_rainfall_tmp";
      fdv_test::remove_all(dir);
      const RainfallReport rep = extract_rainfall(f, identity_of(f), "", dir + "/R4.r");
      assert(rep.output_path == dir + "/R4.r");
      assert(fdv_test::read_file(rep.output_path).find("*END") != std::string::npos);

      const auto totals = totalize(f, "", kDailyPeriodSeconds, dir + "/R4_totals.csv");
      assert(totals.size() == 1);
      assert(fdv_test::read_file(dir + "/R4_totals.csv").find("Grand Total") != std::string::npos);

      const RainfallTotals calendar = write_rainfall_totals(f, "", dir + "/R4_calendar.csv");
      assert(calendar.daily.size() == 1 && calendar.weekly.size() == 1);
      assert(fdv_test::read_file(dir + "/R4_calendar.csv").find("2024-01-01,0.01\n") != std::string::npos);
      fdv_test::remove_all(dir);
    }

    std::cout << "test_rainfall: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_rainfall failed: " << e.what() << "\n";
    return 1;
  }
}
