#pragma once

#include "fdv/diagnostics.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fdv {

// Conduit cross-sections. All dimensions are millimetres.

struct Circular {
  double diameter{0.0};
};

struct Rectangular {
  double width{0.0};
  double height{0.0};
};

// Egg sections: r3 is the side-arc radius; when absent it is computed by the
// R3 solver (egg form 1 for EggType1, form 2 for EggType2/2A).
struct EggType1 {
  double width{0.0};
  double height{0.0};
  std::optional<double> r3;
};

struct EggType2 {
  double width{0.0};
  double height{0.0};
  std::optional<double> r3;
};

struct EggType2A {
  double width{0.0};
  double height{0.0};
  std::optional<double> r3;
};

// Vertical-sided box closed by a circular arc at the bottom and at the top.
// Each arc spans the full width, so its radius is at least width / 2
// (radius == width / 2 gives semicircles).
struct TwoCircleAndRectangle {
  double width{0.0};
  double height{0.0};
  double bottom_radius{0.0};
  double top_radius{0.0};
};

using GeometryDescriptor =
  std::variant<Circular, Rectangular, EggType1, EggType2, EggType2A, TwoCircleAndRectangle>;

enum class Shape {
  Circular,
  Rectangular,
  EggType1,
  EggType2,
  EggType2A,
  TwoCircleAndRectangle,
};

Shape shape_of(const GeometryDescriptor& g);

// Stable upper-case token written to FDV headers, e.g. "EGG_TYPE_2A".
const char* shape_name(Shape s);

// Accepts the tokens above and common spellings ("Circular", "Egg Type 1",
// "egg2a", "Two Circles and a Rectangle", ...), case-insensitively.
bool parse_shape(const std::string& s, Shape* out);

// Build a descriptor from the loosely-typed wire form.
//
// Expected dimension counts:
//   Circular                1  (diameter)
//   Rectangular             2  (width, height)
//   EggType1/2/2A           2 or 3  (width, height, r3)
//   TwoCircleAndRectangle   4  (width, height, bottom_radius, top_radius)
//
// Throws GeometryError(InvalidDescriptor) on a count mismatch, an unknown
// shape name, or a value that fails validate_geometry().
GeometryDescriptor make_geometry(Shape shape, const std::vector<double>& dims);
GeometryDescriptor make_geometry(const std::string& shape, const std::vector<double>& dims);

// Parse "1200", "1200;900", "1200 900" or "1200,900,1350" into numbers.
// Throws GeometryError(InvalidDescriptor) on a non-numeric entry.
std::vector<double> parse_dimension_list(const std::string& s);

// Dimensions in wire order (r3 included only when set).
std::vector<double> geometry_dimensions(const GeometryDescriptor& g);

// Per-shape checks: positive finite values, height > width for eggs,
// r3 > width / 2, arc radii >= width / 2 and arc rises fitting the height.
// Throws GeometryError(InvalidDescriptor).
void validate_geometry(const GeometryDescriptor& g);

// Validate and fill in a missing egg r3 via the solver.
// Throws GeometryError(SolverFailed) when the solver does not produce a value.
GeometryDescriptor resolve_geometry(const GeometryDescriptor& g, DiagnosticsChannel* diag = nullptr);

// Overall section height in mm (diameter for circular sections).
double geometry_height_mm(const GeometryDescriptor& g);

// "EGG_TYPE_1,1000.000,1500.000,1500.000"
std::string describe_geometry(const GeometryDescriptor& g);

} // namespace fdv
