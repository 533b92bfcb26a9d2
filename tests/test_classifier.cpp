#include "fdv/classifier.hpp"
#include "fdv/errors.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace fdv;
using fdv_test::approx;

static ClassifiedFile classify_text(const std::string& text, const std::string& path,
                                    DiagnosticsChannel* diag = nullptr) {
  TableReaderOptions ropts;
  ropts.header_keywords = default_timestamp_keywords();
  return classify(parse_table(text, path, ropts), ClassifierOptions(), diag);
}

static bool same_values(const std::vector<std::vector<double>>& a, const std::vector<std::vector<double>>& b) {
  if (a.size() != b.size()) return false;
  for (size_t c = 0; c < a.size(); ++c) {
    if (a[c].size() != b[c].size()) return false;
    for (size_t i = 0; i < a[c].size(); ++i) {
      const bool na = std::isnan(a[c][i]);
      if (na != std::isnan(b[c][i])) return false;
      if (!na && a[c][i] != b[c][i]) return false;
    }
  }
  return true;
}

static bool same_classification(const ClassifiedFile& a, const ClassifiedFile& b) {
  return a.source_path == b.source_path && a.channel_groups == b.channel_groups &&
         a.unclassified == b.unclassified && a.monitor_type == b.monitor_type &&
         a.sample_interval_seconds == b.sample_interval_seconds && a.start_timestamp == b.start_timestamp &&
         a.end_timestamp == b.end_timestamp && a.data_start == b.data_start && a.data_end == b.data_end &&
         a.site_id == b.site_id && a.site_name == b.site_name && a.timestamp_column == b.timestamp_column &&
         a.timestamp_format == b.timestamp_format && a.timestamps == b.timestamps &&
         same_values(a.values, b.values) && a.rows_read == b.rows_read && a.rows_skipped == b.rows_skipped &&
         a.gaps_filled == b.gaps_filled;
}

static bool throws_code(const std::string& text, ErrorCode code) {
  try {
    (void)classify_text(text, "x.csv");
  } catch (const Error& e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    // Interval mode.
    assert(modal_interval_seconds({0, 60, 120, 300}, 0.5) == 60);
    assert(modal_interval_seconds({0, 60, 180}, 0.5) == 60);
    {
      bool threw = false;
      try {
        (void)modal_interval_seconds({0}, 0.5);
      } catch (const ClassificationError& e) {
        threw = (e.code() == ErrorCode::InconsistentInterval);
      }
      assert(threw);
    }

    // Combination monitor with a gap and an unclassified column.
    {
      DiagnosticsChannel diag;
      const std::string text =
        "Time,Depth (mm),Velocity (m/s),Temp\n"
        "01/01/2024 00:00,100,0.5,10\n"
        "01/01/2024 00:02,110,0.6,10\n"
        "01/01/2024 00:06,130,0.7,11\n"
        "01/01/2024 00:08,140,,11\n";
      const ClassifiedFile f = classify_text(text, "data/FM12.csv", &diag);
      assert(f.monitor_type == MonitorType::Combination);
      assert(f.sample_interval_seconds == 120);
      assert(f.n_samples() == 5);
      assert(f.gaps_filled == 1);
      assert(f.rows_read == 4);
      assert(f.rows_skipped == 0);
      assert(f.data_start == make_timestamp(2024, 1, 1, 0, 0));
      assert(f.end_timestamp == make_timestamp(2024, 1, 1, 0, 8));
      assert(f.timestamps[2] == make_timestamp(2024, 1, 1, 0, 4));
      assert(f.site_id == "FM12");
      assert(f.site_name == "FM12");
      assert(f.timestamp_column == "Time");

      assert(f.channel_names(MonitorGroup::Depth) == std::vector<std::string>{"Depth (mm)"});
      const ChannelDescriptor* depth = f.find_channel(MonitorGroup::Depth, "Depth (mm)");
      assert(depth != nullptr);
      assert(depth->unit && *depth->unit == "mm");
      const auto& dv = f.column(*depth);
      assert(approx(dv[0], 100.0));
      assert(approx(dv[1], 110.0));
      assert(std::isnan(dv[2]));
      assert(approx(dv[4], 140.0));

      const ChannelDescriptor* vel = f.find_channel("Velocity (m/s)");
      assert(vel != nullptr);
      assert(approx(f.column(*vel)[3], 0.7));
      assert(std::isnan(f.column(*vel)[4]));

      assert(f.unclassified.size() == 1);
      assert(f.unclassified[0].name == "Temp");
      assert(f.find_channel("Temp") == nullptr);

      assert(f.grid_index(make_timestamp(2024, 1, 1, 0, 6)) == std::optional<size_t>(3));
      assert(!f.grid_index(make_timestamp(2024, 1, 1, 0, 7)));
      assert(!f.grid_index(make_timestamp(2024, 1, 1, 0, 10)));

      bool saw_summary = false;
      for (const auto& ev : diag.drain()) {
        if (ev.message.find("Classified data/FM12.csv") != std::string::npos) saw_summary = true;
      }
      assert(saw_summary);
    }

    // Duplicates (last wins), a bad timestamp and decimal commas.
    {
      DiagnosticsChannel diag;
      const std::string text =
        "Time;Level\n"
        "2024-01-01 00:00;1,5\n"
        "2024-01-01 00:15;1,6\n"
        "2024-01-01 00:15;1,7\n"
        "bad;9\n"
        "2024-01-01 00:30;1,8\n";
      const ClassifiedFile f = classify_text(text, "logger_export.csv", &diag);
      assert(f.monitor_type == MonitorType::Depth);
      assert(f.sample_interval_seconds == 900);
      assert(f.n_samples() == 3);
      assert(f.rows_skipped == 2);
      const auto& v = f.column(f.channels(MonitorGroup::Depth)[0]);
      assert(approx(v[0], 1.5));
      assert(approx(v[1], 1.7));
      assert(approx(v[2], 1.8));
      assert(f.site_id == "Unknown");
      assert(f.site_name == "Unknown");

      size_t warnings = 0;
      for (const auto& ev : diag.drain()) {
        if (ev.level == LogLevel::Warn) ++warnings;
      }
      assert(warnings == 2);
    }

    // Structured headers carry the site id.
    {
      const std::string text =
        "Timestamp,4711_1|Depth|mm,4711_2|Velocity|m/s\n"
        "2024-03-01 10:00:00,50,0.2\n"
        "2024-03-01 10:05:00,55,0.3\n";
      const ClassifiedFile f = classify_text(text, "export.csv");
      assert(f.site_id == "4711");
      assert(f.site_name == "4711");
      assert(f.monitor_type == MonitorType::Combination);
      assert(f.channels(MonitorGroup::Velocity)[0].qualifier == std::optional<std::string>("4711"));
    }

    // Digits-only stem: id from the file name, name follows the id.
    {
      const std::string text = "Time,Rain (mm)\n2024-03-01 10:00,0\n2024-03-01 10:02,0.2\n";
      const ClassifiedFile f = classify_text(text, "1234.csv");
      assert(f.monitor_type == MonitorType::Rainfall);
      assert(f.site_id == "1234");
      assert(f.site_name == "1234");
    }

    // Excel serial timestamps.
    {
      const std::string text =
        "Date,Depth_mm\n45291,10\n45291.0104166667,11\n45291.0208333333,12\n";
      const ClassifiedFile f = classify_text(text, "S1.csv");
      assert(f.sample_interval_seconds == 900);
      assert(f.data_start == make_timestamp(2023, 12, 31));
      assert(f.timestamp_format == "excel-serial");
    }

    // Unknown monitor type when nothing classifies.
    {
      const std::string text = "Time,Temp\n2024-01-01 00:00,1\n2024-01-01 00:01,2\n";
      const ClassifiedFile f = classify_text(text, "T.csv");
      assert(f.monitor_type == MonitorType::Unknown);
    }

    // Failures.
    assert(throws_code("Time,Depth\n2024-01-01 00:00,1\n2024-01-01 00:01,1\n2024-01-01 00:03,1\n"
                       "2024-01-01 00:06,1\n2024-01-01 00:10,1\n",
                       ErrorCode::InconsistentInterval));
    assert(throws_code("Time,Level Velocity\n2024-01-01 00:00,1\n2024-01-01 00:01,1\n",
                       ErrorCode::AmbiguousColumns));
    assert(throws_code("Time,Depth (mm),Depth [mm]\n2024-01-01 00:00,1,1\n2024-01-01 00:01,1,1\n",
                       ErrorCode::AmbiguousColumns));
    assert(throws_code("Depth,Velocity\n1,2\n3,4\n", ErrorCode::EmptyOrMalformed));
    assert(throws_code("Time,Depth\nnot a time,1\nstill not,2\n", ErrorCode::EmptyOrMalformed));
    assert(throws_code("Time,Depth\n", ErrorCode::EmptyOrMalformed));

    // Classifying the same bytes twice gives the same result.
    {
      const std::string text =
        "Date/Time,FM3 Depth (mm),FM3 Velocity (m/s),FM4 Depth (m),Rain (mm),Battery\n"
        "2024-02-01 00:00,100,0.5,0.2,0,12.1\n"
        "2024-02-01 00:05,110,,0.21,0.2,12.1\n"
        "2024-02-01 00:15,130,0.7,,0,12.0\n"
        "2024-02-01 00:20,140,0.8,0.23,0.4,12.0\n";
      const ClassifiedFile a = classify_text(text, "logs/FM3.csv");
      const ClassifiedFile b = classify_text(text, "logs/FM3.csv");
      assert(same_classification(a, b));
      assert(a.channel_names(MonitorGroup::Depth) == b.channel_names(MonitorGroup::Depth));
      assert(a.gaps_filled == 1);

      const std::string path = "test_classifier_FM3.csv";
      fdv_test::write_file(path, text);
      const ClassifiedFile c = classify_file(path);
      const ClassifiedFile d = classify_file(path);
      assert(same_classification(c, d));
      assert(c.channel_groups == a.channel_groups);
      assert(same_values(c.values, a.values));
      fdv_test::remove_all(path);
    }

    // File entry point.
    {
      const std::string path = "test_classifier_S7.csv";
      fdv_test::write_file(path, "Time,Depth (mm)\n2024-01-01 00:00,1\n2024-01-01 00:02,2\n");
      const ClassifiedFile f = classify_file(path);
      assert(f.source_path == path);
      assert(f.n_samples() == 2);
      fdv_test::remove_all(path);
    }

    std::cout << "test_classifier: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_classifier failed: " << e.what() << "\n";
    return 1;
  }
}
