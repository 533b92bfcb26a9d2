#pragma once

namespace fdv {

enum class R3Status {
  Converged,
  DomainError,   // square term went negative, or degenerate width/height
  NotConverged,  // iteration limit reached
};

const char* r3_status_name(R3Status s);

struct R3Result {
  double value{-1.0};  // r3 on success, -1 otherwise
  R3Status status{R3Status::NotConverged};
  int iterations{0};
  double last_diff{0.0};

  bool ok() const { return status == R3Status::Converged; }
};

constexpr int kR3MaxIterations = 1000;
constexpr double kR3Tolerance = 1e-5;

// Side radius r3 of an egg-shaped conduit by fixed-point iteration.
//
//   r2 = width / 2
//   r1 = (height - width) / 2   for egg_form == 1, else (height - width) / 4
//   h2 = height - r2
//   r3 = height
//   repeat up to 1000 times:
//     offset = r3 - r2
//     sq     = (r3 - r1)^2 - (h2 - r1)^2      (sq < 0: domain error)
//     diff   = offset - sqrt(sq)
//     r3    += diff / 10
//     |diff| < 1e-5: converged
//
// Non-positive or non-finite width/height is a domain error at iteration 1.
// Units are whatever the caller uses for width and height.
R3Result solve_r3_detailed(double width, double height, int egg_form);

// Same as solve_r3_detailed() but collapses every failure to -1.
double solve_r3(double width, double height, int egg_form);

} // namespace fdv
