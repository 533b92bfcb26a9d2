#include "fdv/classifier.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/interim_report.hpp"
#include "fdv/rainfall.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fdv;

namespace {

struct Args {
  std::string input_path;
  std::string interim_path;
  std::string totals_path;
  std::string calendar_path;
  std::string period{"daily"};
  std::string channel;
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "fdv_report_cli\n\n"
    << "Summarize a logger export: weekly/daily interim tables and rainfall period totals.\n\n"
    << "Usage:\n"
    << "  fdv_report_cli --input S12.csv --interim S12_interim.csv\n"
    << "  fdv_report_cli --input R4.csv --totals R4_weekly.csv --period weekly\n\n"
    << "Options:\n"
    << "  --input PATH             Delimited logger export\n"
    << "  --interim PATH           Write the interim report CSV\n"
    << "  --totals PATH            Write rainfall period totals CSV\n"
    << "  --calendar-totals PATH   Write daily and ISO-week rainfall totals CSV\n"
    << "  --period P               daily, weekly, hourly or seconds (default: daily)\n"
    << "  --channel NAME           Rainfall channel for the totals (default: first)\n"
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
      std::cout << "fdv_report_cli " << build_info().version << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--interim" && i + 1 < argc) {
      a.interim_path = argv[++i];
    } else if (arg == "--totals" && i + 1 < argc) {
      a.totals_path = argv[++i];
    } else if (arg == "--calendar-totals" && i + 1 < argc) {
      a.calendar_path = argv[++i];
    } else if (arg == "--period" && i + 1 < argc) {
      a.period = argv[++i];
    } else if (arg == "--channel" && i + 1 < argc) {
      a.channel = argv[++i];
    } else if (arg == "--verbose") {
      a.verbose = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    const bool no_output = args.interim_path.empty() && args.totals_path.empty() && args.calendar_path.empty();
    if (args.input_path.empty() || no_output) {
      print_help();
      return 1;
    }
    const int64_t period = parse_period_seconds(args.period);

    DiagnosticsOptions dopts;
    dopts.echo_to_stderr = true;
    dopts.echo_info = args.verbose;
    DiagnosticsChannel diag(dopts);

    const ClassifiedFile f = classify_file(args.input_path, ClassifierOptions(), &diag);

    if (!args.interim_path.empty()) {
      const InterimReport rep = generate_interim_report(f, args.interim_path, &diag);
      std::cout << "Wrote " << args.interim_path << " (" << rep.weekly.size() << " week(s), "
                << rep.daily.size() << " day(s))\n";
    }
    if (!args.totals_path.empty()) {
      const auto totals = totalize(f, args.channel, period, args.totals_path, &diag);
      double sum = 0.0;
      for (const auto& t : totals) sum += t.total_mm;
      std::cout << "Wrote " << args.totals_path << " (" << totals.size() << " period(s), total "
                << format_fixed(sum, 2) << " mm)\n";
    }
    if (!args.calendar_path.empty()) {
      const RainfallTotals totals = write_rainfall_totals(f, args.channel, args.calendar_path, &diag);
      std::cout << "Wrote " << args.calendar_path << " (" << totals.daily.size() << " day(s), "
                << totals.weekly.size() << " week(s))\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fdv_report_cli error: " << e.what() << "\n";
    return 1;
  }
}
