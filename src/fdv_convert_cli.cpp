#include "fdv/classifier.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/fdv_writer.hpp"
#include "fdv/geometry.hpp"
#include "fdv/rainfall.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/session.hpp"
#include "fdv/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fdv;

namespace {

struct Args {
  std::string input_path;
  std::string output_path;
  std::string depth;
  std::string velocity;
  std::string shape;
  std::string size;
  std::string rainfall;
  bool rainfall_requested{false};
  std::string site_id;
  std::string site_name;
  std::string start;
  std::string end;
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "fdv_convert_cli\n\n"
    << "Convert a logger export into an FDV flow file or a rainfall (.r) file.\n\n"
    << "Usage:\n"
    << "  fdv_convert_cli --input S12.csv --output S12.fdv --shape circular --size 600\n"
    << "  fdv_convert_cli --input S12.csv --output S12.fdv --shape egg1 --size 1000,1500 --velocity none\n"
    << "  fdv_convert_cli --input R4.csv --output R4.r --rainfall \"Rain (mm)\"\n\n"
    << "Options:\n"
    << "  --input PATH             Delimited logger export\n"
    << "  --output PATH            Output file\n"
    << "  --depth NAME             Depth channel (default: first depth channel)\n"
    << "  --velocity NAME          Velocity channel, or 'none' (default: first velocity channel)\n"
    << "  --shape NAME             Pipe shape (circular, rectangular, egg1, egg2, egg2a, twocircles)\n"
    << "  --size LIST              Pipe dimensions in mm, e.g. 1200 or 1000;1500\n"
    << "  --rainfall [NAME]        Write rainfall intensity instead (default: first rainfall channel)\n"
    << "  --site-id ID             Override the inferred site id\n"
    << "  --site-name NAME         Override the inferred site name\n"
    << "  --start TIME             Window start (YYYY-MM-DD HH:MM:SS)\n"
    << "  --end TIME               Window end (YYYY-MM-DD HH:MM:SS)\n"
    << "  --verbose                Also echo info diagnostics to stderr\n"
    << "  --version                Print version and exit\n"
    << "  -h, --help               Show this help\n";
}

static bool is_flag(const char* s) {
  return s[0] == '-' && s[1] == '-';
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "fdv_convert_cli " << build_info().version << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      a.output_path = argv[++i];
    } else if (arg == "--depth" && i + 1 < argc) {
      a.depth = argv[++i];
    } else if (arg == "--velocity" && i + 1 < argc) {
      a.velocity = argv[++i];
    } else if (arg == "--shape" && i + 1 < argc) {
      a.shape = argv[++i];
    } else if (arg == "--size" && i + 1 < argc) {
      a.size = argv[++i];
    } else if (arg == "--rainfall") {
      a.rainfall_requested = true;
      if (i + 1 < argc && !is_flag(argv[i + 1])) a.rainfall = argv[++i];
    } else if (arg == "--site-id" && i + 1 < argc) {
      a.site_id = argv[++i];
    } else if (arg == "--site-name" && i + 1 < argc) {
      a.site_name = argv[++i];
    } else if (arg == "--start" && i + 1 < argc) {
      a.start = argv[++i];
    } else if (arg == "--end" && i + 1 < argc) {
      a.end = argv[++i];
    } else if (arg == "--verbose") {
      a.verbose = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static void apply_overrides(const Args& args, Session* session) {
  if (!args.site_id.empty()) session->update_site_id(args.site_id);
  if (!args.site_name.empty()) session->update_site_name(args.site_name);
  if (!args.start.empty() || !args.end.empty()) {
    const SiteIdentity& cur = session->identity();
    const std::string s = args.start.empty() ? format_timestamp(cur.start_timestamp) : args.start;
    const std::string e = args.end.empty() ? format_timestamp(cur.end_timestamp) : args.end;
    session->update_timestamps(s, e);
  }
}

static std::string first_channel(const ClassifiedFile& f, MonitorGroup g) {
  const auto names = f.channel_names(g);
  return names.empty() ? std::string() : names.front();
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.input_path.empty() || args.output_path.empty()) {
      print_help();
      return 1;
    }

    DiagnosticsOptions dopts;
    dopts.echo_to_stderr = true;
    dopts.echo_info = args.verbose;
    DiagnosticsChannel diag(dopts);

    Session session(&diag);
    session.load(classify_file(args.input_path, ClassifierOptions(), &diag));
    apply_overrides(args, &session);

    const ClassifiedFile& f = session.file();
    const bool rainfall = args.rainfall_requested ||
                          (f.monitor_type == MonitorType::Rainfall && args.shape.empty());
    if (rainfall) {
      const RainfallReport rep =
        extract_rainfall(f, session.identity(), args.rainfall, args.output_path, &diag);
      std::cout << "Wrote " << rep.output_path << " (" << rep.channel << ", " << rep.samples
                << " samples, total " << format_fixed(rep.total_mm, 2) << " mm)\n";
      return 0;
    }

    if (args.shape.empty() || args.size.empty()) {
      throw std::runtime_error("--shape and --size are required for FDV output");
    }

    FdvEncodeRequest req;
    req.depth_channel = args.depth.empty() ? first_channel(f, MonitorGroup::Depth) : args.depth;
    if (req.depth_channel.empty()) {
      throw std::runtime_error("No depth channel found in " + args.input_path);
    }
    if (!args.velocity.empty()) {
      req.velocity_channel = args.velocity;
    } else {
      req.velocity_channel = first_channel(f, MonitorGroup::Velocity);
      if (req.velocity_channel.empty()) req.velocity_channel = "none";
    }
    req.geometry = make_geometry(args.shape, parse_dimension_list(args.size));

    const FdvEncodeReport rep = encode_fdv(f, session.identity(), req, args.output_path, &diag);
    std::cout << "Wrote " << rep.output_path << " (" << rep.records << " records, "
              << describe_geometry(rep.geometry) << ")\n";
    if (rep.has_velocity) {
      std::cout << "Missing: depth=" << rep.missing_depth << " velocity=" << rep.missing_velocity
                << " flow=" << rep.missing_flow << "\n";
    } else {
      std::cout << "Missing: depth=" << rep.missing_depth << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fdv_convert_cli error: " << e.what() << "\n";
    return 1;
  }
}
