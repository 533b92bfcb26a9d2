#include "fdv/r3_solver.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fdv;

namespace {

struct Args {
  double width{0.0};
  double height{0.0};
  int egg_form{1};
  bool have_width{false};
  bool have_height{false};
};

static void print_help() {
  std::cout
    << "fdv_r3_cli\n\n"
    << "Solve the side-arc radius r3 of an egg-shaped sewer section.\n\n"
    << "Usage:\n"
    << "  fdv_r3_cli --width 1000 --height 1500\n"
    << "  fdv_r3_cli --width 1000 --height 1500 --egg-form 2\n\n"
    << "Options:\n"
    << "  --width W                Section width (mm)\n"
    << "  --height H               Section height (mm)\n"
    << "  --egg-form N             1 = egg type 1, 2 = egg type 2/2A (default: 1)\n"
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
      std::cout << "fdv_r3_cli " << build_info().version << "\n";
      std::exit(0);
    } else if (arg == "--width" && i + 1 < argc) {
      a.width = to_double(argv[++i]);
      a.have_width = true;
    } else if (arg == "--height" && i + 1 < argc) {
      a.height = to_double(argv[++i]);
      a.have_height = true;
    } else if (arg == "--egg-form" && i + 1 < argc) {
      a.egg_form = to_int(argv[++i]);
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
    if (!args.have_width || !args.have_height) {
      print_help();
      return 1;
    }

    const R3Result r = solve_r3_detailed(args.width, args.height, args.egg_form);
    if (!r.ok()) {
      std::cerr << "fdv_r3_cli error: " << r3_status_name(r.status) << " after " << r.iterations
                << " iteration(s)\n";
      std::cout << "-1\n";
      return 1;
    }
    std::cout << format_fixed(r.value, 5) << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "fdv_r3_cli error: " << e.what() << "\n";
    return 1;
  }
}
