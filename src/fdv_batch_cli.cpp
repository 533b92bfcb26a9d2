#include "fdv/batch.hpp"
#include "fdv/batch_manifest.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fdv;

namespace {

struct Args {
  std::string manifest_path;
  std::string outdir;
  size_t jobs{0};
  bool no_run_meta{false};
  std::string zip_name;
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "fdv_batch_cli\n\n"
    << "Convert every logger export listed in a manifest (filepath,pipeshape,pipesize).\n\n"
    << "Usage:\n"
    << "  fdv_batch_cli --manifest survey.csv --outdir out\n"
    << "  fdv_batch_cli --manifest survey.csv --outdir out --jobs 4\n"
    << "  fdv_batch_cli --manifest survey.csv --outdir out --zip processed_files.zip\n\n"
    << "Options:\n"
    << "  --manifest PATH          Batch manifest CSV\n"
    << "  --outdir DIR             Output directory (created if missing)\n"
    << "  --jobs N                 Worker threads (default: hardware concurrency)\n"
    << "  --no-run-meta            Do not write batch_run_meta.json\n"
    << "  --zip NAME               Also bundle the outputs into NAME inside --outdir\n"
    << "  --verbose                Also echo info diagnostics to stderr\n"
    << "  --version                Print version and exit\n"
    << "  -h, --help               Show this help\n\n"
    << "Exit status: 0 all succeeded, 1 error, 2 some items failed.\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "fdv_batch_cli " << build_info().version << "\n";
      std::exit(0);
    } else if (arg == "--manifest" && i + 1 < argc) {
      a.manifest_path = argv[++i];
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--jobs" && i + 1 < argc) {
      const int n = to_int(argv[++i]);
      if (n < 0) throw std::runtime_error("--jobs must be >= 0");
      a.jobs = static_cast<size_t>(n);
    } else if (arg == "--no-run-meta") {
      a.no_run_meta = true;
    } else if (arg == "--zip" && i + 1 < argc) {
      a.zip_name = argv[++i];
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
    if (args.manifest_path.empty() || args.outdir.empty()) {
      print_help();
      return 1;
    }

    DiagnosticsOptions dopts;
    dopts.echo_to_stderr = true;
    dopts.echo_info = args.verbose;
    DiagnosticsChannel diag(dopts);

    const std::vector<BatchItem> items = read_batch_manifest(args.manifest_path);
    if (items.empty()) {
      throw std::runtime_error("Batch manifest lists no files: " + args.manifest_path);
    }

    BatchOptions opts;
    opts.max_workers = args.jobs;
    opts.write_run_meta = !args.no_run_meta;
    opts.tool_name = "fdv_batch_cli";
    if (!args.zip_name.empty()) {
      opts.zip_outputs = true;
      opts.zip_name = args.zip_name;
    }

    const BatchSummary summary = run_batch(items, args.outdir, opts, nullptr, &diag);

    for (const auto& r : summary.items) {
      std::cout << batch_item_status_name(r.status) << "\t" << r.file_path;
      if (!r.output_path.empty()) std::cout << "\t-> " << r.output_path;
      if (r.error) std::cout << "\t" << describe_error(*r.error);
      std::cout << "\n";
    }
    std::cout << "Succeeded: " << summary.succeeded << ", failed: " << summary.failed
              << ", cancelled: " << summary.cancelled << "\n";
    if (!summary.run_meta_path.empty()) {
      std::cout << "Run metadata: " << summary.run_meta_path << "\n";
    }
    if (!summary.zip_path.empty()) {
      std::cout << "Bundle: " << summary.zip_path << "\n";
    }
    return summary.failed > 0 ? 2 : 0;
  } catch (const std::exception& e) {
    std::cerr << "fdv_batch_cli error: " << e.what() << "\n";
    return 1;
  }
}
