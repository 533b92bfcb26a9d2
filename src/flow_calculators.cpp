#include "fdv/flow_calculators.hpp"

#include "fdv/errors.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace fdv {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMmToM = 0.001;

// Area of a circle segment from its central angle.
static double segment_from_angle(double r, double theta) {
  return 0.5 * (theta - std::sin(theta)) * r * r;
}

static double arc_rise(double r, double w) {
  const double half = w / 2.0;
  return r - std::sqrt(std::max(0.0, r * r - half * half));
}

static double egg_area(double width_mm, double height_mm, const std::optional<double>& r3_mm,
                       int egg_form, double depth_m) {
  if (!r3_mm) {
    throw GeometryError(ErrorCode::InvalidDescriptor, "Egg section has no r3; resolve the geometry first");
  }
  const double w = width_mm * kMmToM;
  const double h = height_mm * kMmToM;
  const double r1 = (egg_form == 1) ? (h - w) / 2.0 : (h - w) / 4.0;
  return egg_wetted_area(r1, w / 2.0, *r3_mm * kMmToM, h, depth_m);
}

} // namespace

double circular_segment_area(double r, double h) {
  if (!(r > 0.0)) return 0.0;
  h = std::min(std::max(h, 0.0), 2.0 * r);
  return r * r * std::acos((r - h) / r) - (r - h) * std::sqrt(std::max(0.0, 2.0 * r * h - h * h));
}

double egg_wetted_area(double r1, double r2, double r3, double h, double d) {
  if (!(d > 0.0)) return 0.0;
  d = std::min(d, 0.9999 * h);

  const double offset = r3 - r2;
  const double h2 = h - r2;
  const double psi = std::atan((h2 - r1) / offset);
  const double h1 = h2 - r3 * std::sin(psi);

  if (d <= h1) {
    const double theta = 2.0 * std::acos((r1 - d) / r1);
    return segment_from_angle(r1, theta);
  }

  // Invert arc up to the tangent point with the side arcs.
  const double low = segment_from_angle(r1, 2.0 * std::acos((r1 - h1) / r1));
  const double area1 = 0.25 * r3 * r3 * (2.0 * psi - std::sin(2.0 * psi));
  const double inner_rect = std::sqrt(std::max(0.0, r1 * r1 - (r1 - h1) * (r1 - h1)));

  if (d <= h2) {
    const double z = h2 - d;
    const double phi = std::asin(std::min(1.0, z / r3));
    const double area2 = 0.25 * r3 * r3 * (2.0 * phi - std::sin(2.0 * phi));
    const double x1 = std::sqrt(std::max(0.0, r3 * r3 - z * z));
    const double p = x1 - offset - inner_rect;
    const double area3 = (d - h1) * inner_rect;
    const double area4 = p * (h2 - d);
    const double area5 = area1 - area2 - area4;
    return low + 2.0 * (area5 + area3);
  }

  // Crown arc above the widest point.
  const double mid = 2.0 * (area1 + (h2 - h1) * inner_rect);
  const double z = 2.0 * r2 - (d - h2 + r2);
  const double gamma = 2.0 * std::acos(std::max(-1.0, std::min(1.0, (r2 - z) / r2)));
  const double area9 = kPi * r2 * r2 - r2 * r2 * (gamma - std::sin(gamma)) / 2.0;
  const double area8 = kPi * r2 * r2 / 2.0;
  return low + mid + area9 - area8;
}

double wetted_area_m2(const GeometryDescriptor& resolved, double depth_m) {
  if (!(depth_m > 0.0)) return 0.0;

  switch (shape_of(resolved)) {
    case Shape::Circular: {
      const double r = std::get<Circular>(resolved).diameter * kMmToM / 2.0;
      return circular_segment_area(r, std::min(depth_m, 2.0 * r));
    }
    case Shape::Rectangular: {
      const auto& g = std::get<Rectangular>(resolved);
      return std::min(depth_m, g.height * kMmToM) * g.width * kMmToM;
    }
    case Shape::EggType1: {
      const auto& g = std::get<EggType1>(resolved);
      return egg_area(g.width, g.height, g.r3, 1, depth_m);
    }
    case Shape::EggType2: {
      const auto& g = std::get<EggType2>(resolved);
      return egg_area(g.width, g.height, g.r3, 2, depth_m);
    }
    case Shape::EggType2A: {
      const auto& g = std::get<EggType2A>(resolved);
      return egg_area(g.width, g.height, g.r3, 2, depth_m);
    }
    case Shape::TwoCircleAndRectangle: {
      const auto& g = std::get<TwoCircleAndRectangle>(resolved);
      const double w = g.width * kMmToM;
      const double H = g.height * kMmToM;
      const double rb = g.bottom_radius * kMmToM;
      const double rt = g.top_radius * kMmToM;
      const double hb = arc_rise(rb, w);
      const double ht = arc_rise(rt, w);
      const double d = std::min(depth_m, H);

      if (d <= hb) return circular_segment_area(rb, d);
      const double bottom = circular_segment_area(rb, hb);
      if (d <= H - ht) return bottom + (d - hb) * w;
      // Top cap: full cap minus the part still above the water line.
      const double box = (H - hb - ht) * w;
      return bottom + box + circular_segment_area(rt, ht) - circular_segment_area(rt, H - d);
    }
  }
  return 0.0;
}

double compute_flow_lps(const GeometryDescriptor& resolved, double depth_m, double velocity_mps) {
  if (std::isnan(depth_m) || std::isnan(velocity_mps)) return std::nan("");
  if (depth_m == 0.0 || velocity_mps == 0.0) return 0.0;
  const double q = wetted_area_m2(resolved, depth_m) * velocity_mps * 1000.0;
  return std::max(0.0, q);
}

} // namespace fdv
