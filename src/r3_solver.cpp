#include "fdv/r3_solver.hpp"

#include <cmath>

namespace fdv {

const char* r3_status_name(R3Status s) {
  switch (s) {
    case R3Status::Converged: return "converged";
    case R3Status::DomainError: return "domain error";
    case R3Status::NotConverged: return "did not converge";
  }
  return "unknown";
}

R3Result solve_r3_detailed(double width, double height, int egg_form) {
  R3Result res;

  if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0 || height <= 0.0) {
    res.status = R3Status::DomainError;
    res.iterations = 1;
    return res;
  }

  const double r2 = width / 2.0;
  const double r1 = (egg_form == 1) ? (height - width) / 2.0 : (height - width) / 4.0;
  const double h2 = height - r2;
  double r3 = height;

  for (int it = 1; it <= kR3MaxIterations; ++it) {
    res.iterations = it;
    const double offset = r3 - r2;
    const double square_term = (r3 - r1) * (r3 - r1) - (h2 - r1) * (h2 - r1);
    if (square_term < 0.0) {
      res.status = R3Status::DomainError;
      return res;
    }
    const double diff = offset - std::sqrt(square_term);
    res.last_diff = diff;
    r3 += diff / 10.0;
    if (std::fabs(diff) < kR3Tolerance) {
      res.status = R3Status::Converged;
      res.value = r3;
      return res;
    }
  }

  res.status = R3Status::NotConverged;
  return res;
}

double solve_r3(double width, double height, int egg_form) {
  return solve_r3_detailed(width, height, egg_form).value;
}

} // namespace fdv
