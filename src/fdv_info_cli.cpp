#include "fdv/classifier.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fdv;

namespace {

struct Args {
  std::string input_path;
  bool json{false};
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "fdv_info_cli\n\n"
    << "Classify a logger export and print its channels, sampling interval and site.\n\n"
    << "Usage:\n"
    << "  fdv_info_cli --input S12_export.csv\n"
    << "  fdv_info_cli --input S12_export.csv --json\n\n"
    << "Options:\n"
    << "  --input PATH             Delimited logger export (.csv/.txt/.tsv/.dat)\n"
    << "  --json                   Output JSON (useful for scripts)\n"
    << "  --verbose                Also echo info diagnostics to stderr\n"
    << "  --version                Print version and exit\n"
    << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "fdv_info_cli " << build_info().version << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--json") {
      a.json = true;
    } else if (arg == "--verbose") {
      a.verbose = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static size_t count_missing(const ClassifiedFile& f, const ChannelDescriptor& ch) {
  size_t n = 0;
  for (double v : f.column(ch)) {
    if (std::isnan(v)) ++n;
  }
  return n;
}

static const MonitorGroup kGroups[] = {
  MonitorGroup::Depth, MonitorGroup::Velocity, MonitorGroup::Rainfall, MonitorGroup::Flow,
};

static void print_text(const ClassifiedFile& f) {
  std::cout << "File:            " << f.source_path << "\n";
  std::cout << "Monitor type:    " << monitor_type_name(f.monitor_type) << "\n";
  std::cout << "Site id:         " << f.site_id << "\n";
  std::cout << "Site name:       " << f.site_name << "\n";
  std::cout << "Timestamp col:   " << f.timestamp_column << " (" << f.timestamp_format << ")\n";
  std::cout << "Start:           " << format_timestamp(f.start_timestamp) << "\n";
  std::cout << "End:             " << format_timestamp(f.end_timestamp) << "\n";
  std::cout << "Interval:        " << f.sample_interval_seconds << " s\n";
  std::cout << "Samples:         " << f.n_samples() << " (" << f.gaps_filled << " gap(s) filled, "
            << f.rows_skipped << " row(s) skipped)\n";

  for (MonitorGroup g : kGroups) {
    if (!f.has_group(g)) continue;
    std::cout << monitor_group_name(g) << ":\n";
    for (const auto& ch : f.channels(g)) {
      std::cout << "  " << ch.name;
      if (ch.unit) std::cout << " [" << *ch.unit << "]";
      std::cout << " missing=" << count_missing(f, ch) << "\n";
    }
  }
  if (!f.unclassified.empty()) {
    std::cout << "Unclassified:\n";
    for (const auto& ch : f.unclassified) std::cout << "  " << ch.name << "\n";
  }
}

static void print_json(const ClassifiedFile& f) {
  std::cout << "{\n";
  std::cout << "  \"file\": \"" << json_escape(f.source_path) << "\",\n";
  std::cout << "  \"monitor_type\": \"" << monitor_type_name(f.monitor_type) << "\",\n";
  std::cout << "  \"site_id\": \"" << json_escape(f.site_id) << "\",\n";
  std::cout << "  \"site_name\": \"" << json_escape(f.site_name) << "\",\n";
  std::cout << "  \"start\": \"" << format_timestamp(f.start_timestamp) << "\",\n";
  std::cout << "  \"end\": \"" << format_timestamp(f.end_timestamp) << "\",\n";
  std::cout << "  \"interval_seconds\": " << f.sample_interval_seconds << ",\n";
  std::cout << "  \"samples\": " << f.n_samples() << ",\n";
  std::cout << "  \"gaps_filled\": " << f.gaps_filled << ",\n";
  std::cout << "  \"channels\": {";
  bool first_group = true;
  for (MonitorGroup g : kGroups) {
    if (!f.has_group(g)) continue;
    std::cout << (first_group ? "\n" : ",\n") << "    \"" << monitor_group_name(g) << "\": [";
    first_group = false;
    const auto& chans = f.channels(g);
    for (size_t i = 0; i < chans.size(); ++i) {
      if (i > 0) std::cout << ", ";
      std::cout << "\"" << json_escape(chans[i].name) << "\"";
    }
    std::cout << "]";
  }
  std::cout << (first_group ? "},\n" : "\n  },\n");
  std::cout << "  \"unclassified\": [";
  for (size_t i = 0; i < f.unclassified.size(); ++i) {
    if (i > 0) std::cout << ", ";
    std::cout << "\"" << json_escape(f.unclassified[i].name) << "\"";
  }
  std::cout << "]\n}\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      return 1;
    }

    DiagnosticsOptions dopts;
    dopts.echo_to_stderr = true;
    dopts.echo_info = args.verbose;
    DiagnosticsChannel diag(dopts);

    const ClassifiedFile f = classify_file(args.input_path, ClassifierOptions(), &diag);
    if (args.json) {
      print_json(f);
    } else {
      print_text(f);
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fdv_info_cli error: " << e.what() << "\n";
    return 1;
  }
}
