#include "fdv/geometry.hpp"

#include "fdv/errors.hpp"
#include "fdv/r3_solver.hpp"
#include "fdv/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace fdv {

namespace {

static std::string shape_key(const std::string& s) {
  std::string k;
  for (unsigned char c : s) {
    if (std::isalnum(c) != 0) k.push_back(static_cast<char>(std::tolower(c)));
  }
  return k;
}

static bool positive(double v) {
  return std::isfinite(v) && v > 0.0;
}

static void require_positive(double v, const char* what, Shape s) {
  if (!positive(v)) {
    std::ostringstream oss;
    oss << shape_name(s) << ": " << what << " must be a positive number (got " << v << ")";
    throw GeometryError(ErrorCode::InvalidDescriptor, oss.str());
  }
}

// Rise of a circular arc of radius r spanning a chord of length w.
static double arc_rise(double r, double w) {
  const double half = w / 2.0;
  return r - std::sqrt(std::max(0.0, r * r - half * half));
}

template <class Egg>
static Egg make_egg(const std::vector<double>& dims) {
  Egg e;
  e.width = dims[0];
  e.height = dims[1];
  if (dims.size() == 3) e.r3 = dims[2];
  return e;
}

template <class Egg>
static void validate_egg(const Egg& e, Shape s) {
  require_positive(e.width, "width", s);
  require_positive(e.height, "height", s);
  if (!(e.height > e.width)) {
    throw GeometryError(ErrorCode::InvalidDescriptor,
                        std::string(shape_name(s)) + ": height must exceed width");
  }
  if (e.r3) {
    require_positive(*e.r3, "r3", s);
    if (!(*e.r3 > e.width / 2.0)) {
      throw GeometryError(ErrorCode::InvalidDescriptor,
                          std::string(shape_name(s)) + ": r3 must exceed half the width");
    }
  }
}

template <class Egg>
static Egg resolve_egg(Egg e, Shape s, int egg_form, DiagnosticsChannel* diag) {
  if (e.r3) return e;
  const R3Result r = solve_r3_detailed(e.width, e.height, egg_form);
  if (!r.ok()) {
    std::ostringstream oss;
    oss << shape_name(s) << ": r3 solver " << r3_status_name(r.status) << " for width "
        << e.width << " and height " << e.height << " after " << r.iterations << " iteration(s)";
    throw GeometryError(ErrorCode::SolverFailed, oss.str());
  }
  e.r3 = r.value;
  std::ostringstream oss;
  oss << shape_name(s) << ": solved r3 = " << format_fixed(r.value, 3) << " mm in "
      << r.iterations << " iteration(s)";
  log_info(diag, oss.str());
  // The solved value must still describe a valid section.
  validate_egg(e, s);
  return e;
}

} // namespace

Shape shape_of(const GeometryDescriptor& g) {
  return static_cast<Shape>(g.index());
}

const char* shape_name(Shape s) {
  switch (s) {
    case Shape::Circular: return "CIRCULAR";
    case Shape::Rectangular: return "RECTANGULAR";
    case Shape::EggType1: return "EGG_TYPE_1";
    case Shape::EggType2: return "EGG_TYPE_2";
    case Shape::EggType2A: return "EGG_TYPE_2A";
    case Shape::TwoCircleAndRectangle: return "TWO_CIRCLE_AND_RECTANGLE";
  }
  return "UNKNOWN";
}

bool parse_shape(const std::string& s, Shape* out) {
  const std::string k = shape_key(s);
  Shape r = Shape::Circular;
  if (k == "circular" || k == "circle" || k == "pipe") {
    r = Shape::Circular;
  } else if (k == "rectangular" || k == "rectangle" || k == "rect" || k == "box") {
    r = Shape::Rectangular;
  } else if (k == "eggtype1" || k == "egg1" || k == "egg") {
    r = Shape::EggType1;
  } else if (k == "eggtype2" || k == "egg2") {
    r = Shape::EggType2;
  } else if (k == "eggtype2a" || k == "egg2a") {
    r = Shape::EggType2A;
  } else if (k == "twocircles" || k == "twocircleandrectangle" || k == "twocirclesandrectangle" ||
             k == "twocirclesandarectangle" || k == "twocircleandarectangle") {
    r = Shape::TwoCircleAndRectangle;
  } else {
    return false;
  }
  if (out) *out = r;
  return true;
}

GeometryDescriptor make_geometry(Shape shape, const std::vector<double>& dims) {
  auto require_count = [&](size_t lo, size_t hi) {
    if (dims.size() < lo || dims.size() > hi) {
      std::ostringstream oss;
      oss << shape_name(shape) << " expects ";
      if (lo == hi) {
        oss << lo;
      } else {
        oss << lo << " or " << hi;
      }
      oss << " dimension(s), got " << dims.size();
      throw GeometryError(ErrorCode::InvalidDescriptor, oss.str());
    }
  };

  GeometryDescriptor g;
  switch (shape) {
    case Shape::Circular: {
      require_count(1, 1);
      g = Circular{dims[0]};
      break;
    }
    case Shape::Rectangular: {
      require_count(2, 2);
      g = Rectangular{dims[0], dims[1]};
      break;
    }
    case Shape::EggType1:
      require_count(2, 3);
      g = make_egg<EggType1>(dims);
      break;
    case Shape::EggType2:
      require_count(2, 3);
      g = make_egg<EggType2>(dims);
      break;
    case Shape::EggType2A:
      require_count(2, 3);
      g = make_egg<EggType2A>(dims);
      break;
    case Shape::TwoCircleAndRectangle: {
      require_count(4, 4);
      g = TwoCircleAndRectangle{dims[0], dims[1], dims[2], dims[3]};
      break;
    }
  }
  validate_geometry(g);
  return g;
}

GeometryDescriptor make_geometry(const std::string& shape, const std::vector<double>& dims) {
  Shape s = Shape::Circular;
  if (!parse_shape(shape, &s)) {
    throw GeometryError(ErrorCode::InvalidDescriptor, "Unknown pipe shape: '" + shape + "'");
  }
  return make_geometry(s, dims);
}

std::vector<double> parse_dimension_list(const std::string& s) {
  std::vector<double> out;
  std::string cur;
  auto flush = [&]() {
    const std::string t = trim(cur);
    cur.clear();
    if (t.empty()) return;
    double v = 0.0;
    if (!parse_number_cell(t, false, &v)) {
      throw GeometryError(ErrorCode::InvalidDescriptor, "Invalid pipe dimension: '" + t + "'");
    }
    out.push_back(v);
  };
  for (char c : s) {
    if (c == ';' || c == ',' || c == '|' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      flush();
    } else {
      cur.push_back(c);
    }
  }
  flush();
  return out;
}

std::vector<double> geometry_dimensions(const GeometryDescriptor& g) {
  switch (shape_of(g)) {
    case Shape::Circular:
      return {std::get<Circular>(g).diameter};
    case Shape::Rectangular: {
      const auto& r = std::get<Rectangular>(g);
      return {r.width, r.height};
    }
    case Shape::EggType1:
    case Shape::EggType2:
    case Shape::EggType2A: {
      return std::visit([](const auto& x) -> std::vector<double> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, EggType1> || std::is_same_v<T, EggType2> ||
                      std::is_same_v<T, EggType2A>) {
          std::vector<double> d = {x.width, x.height};
          if (x.r3) d.push_back(*x.r3);
          return d;
        } else {
          return {};
        }
      }, g);
    }
    case Shape::TwoCircleAndRectangle: {
      const auto& t = std::get<TwoCircleAndRectangle>(g);
      return {t.width, t.height, t.bottom_radius, t.top_radius};
    }
  }
  return {};
}

void validate_geometry(const GeometryDescriptor& g) {
  const Shape s = shape_of(g);
  switch (s) {
    case Shape::Circular:
      require_positive(std::get<Circular>(g).diameter, "diameter", s);
      break;
    case Shape::Rectangular: {
      const auto& r = std::get<Rectangular>(g);
      require_positive(r.width, "width", s);
      require_positive(r.height, "height", s);
      break;
    }
    case Shape::EggType1:
      validate_egg(std::get<EggType1>(g), s);
      break;
    case Shape::EggType2:
      validate_egg(std::get<EggType2>(g), s);
      break;
    case Shape::EggType2A:
      validate_egg(std::get<EggType2A>(g), s);
      break;
    case Shape::TwoCircleAndRectangle: {
      const auto& t = std::get<TwoCircleAndRectangle>(g);
      require_positive(t.width, "width", s);
      require_positive(t.height, "height", s);
      require_positive(t.bottom_radius, "bottom radius", s);
      require_positive(t.top_radius, "top radius", s);
      const double half = t.width / 2.0;
      if (t.bottom_radius < half || t.top_radius < half) {
        throw GeometryError(ErrorCode::InvalidDescriptor,
                            std::string(shape_name(s)) + ": arc radii must be at least half the width");
      }
      if (arc_rise(t.bottom_radius, t.width) + arc_rise(t.top_radius, t.width) > t.height) {
        throw GeometryError(ErrorCode::InvalidDescriptor,
                            std::string(shape_name(s)) + ": arcs do not fit within the height");
      }
      break;
    }
  }
}

GeometryDescriptor resolve_geometry(const GeometryDescriptor& g, DiagnosticsChannel* diag) {
  validate_geometry(g);
  switch (shape_of(g)) {
    case Shape::EggType1:
      return resolve_egg(std::get<EggType1>(g), Shape::EggType1, 1, diag);
    case Shape::EggType2:
      return resolve_egg(std::get<EggType2>(g), Shape::EggType2, 2, diag);
    case Shape::EggType2A:
      return resolve_egg(std::get<EggType2A>(g), Shape::EggType2A, 2, diag);
    default:
      return g;
  }
}

double geometry_height_mm(const GeometryDescriptor& g) {
  if (shape_of(g) == Shape::Circular) return std::get<Circular>(g).diameter;
  // Every other shape stores height second.
  return geometry_dimensions(g).at(1);
}

std::string describe_geometry(const GeometryDescriptor& g) {
  std::string out = shape_name(shape_of(g));
  for (double d : geometry_dimensions(g)) {
    out += ",";
    out += format_fixed(d, 3);
  }
  return out;
}

} // namespace fdv
