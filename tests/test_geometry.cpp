#include "fdv/errors.hpp"
#include "fdv/geometry.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace fdv;
using fdv_test::approx;

template <class F>
static bool throws_geometry(F&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const GeometryError& e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    // Shape names.
    {
      Shape s = Shape::Circular;
      assert(parse_shape("Rectangular", &s) && s == Shape::Rectangular);
      assert(parse_shape("Egg Type 1", &s) && s == Shape::EggType1);
      assert(parse_shape("EGG_TYPE_2", &s) && s == Shape::EggType2);
      assert(parse_shape("egg2a", &s) && s == Shape::EggType2A);
      assert(parse_shape("Two Circles and a Rectangle", &s) && s == Shape::TwoCircleAndRectangle);
      assert(parse_shape(shape_name(Shape::TwoCircleAndRectangle), &s) &&
             s == Shape::TwoCircleAndRectangle);
      assert(parse_shape("pipe", &s) && s == Shape::Circular);
      assert(!parse_shape("triangle", &s));
    }

    // Dimension lists.
    {
      const std::vector<double> d = parse_dimension_list("1000; 1500 , 1500");
      assert(d.size() == 3);
      assert(approx(d[0], 1000.0) && approx(d[2], 1500.0));
      assert(parse_dimension_list("600").size() == 1);
      assert(parse_dimension_list("  ").empty());
      assert(throws_geometry([]() { (void)parse_dimension_list("12a"); }, ErrorCode::InvalidDescriptor));
    }

    // Construction and counts.
    {
      const GeometryDescriptor c = make_geometry("circular", {600});
      assert(shape_of(c) == Shape::Circular);
      assert(approx(std::get<Circular>(c).diameter, 600.0));
      assert(describe_geometry(c) == "CIRCULAR,600.000");
      assert(approx(geometry_height_mm(c), 600.0));

      const GeometryDescriptor r = make_geometry(Shape::Rectangular, {1200, 900});
      assert(geometry_dimensions(r) == (std::vector<double>{1200, 900}));
      assert(approx(geometry_height_mm(r), 900.0));

      const GeometryDescriptor e = make_geometry("egg1", {1000, 1500});
      assert(!std::get<EggType1>(e).r3);
      assert(geometry_dimensions(e).size() == 2);

      const GeometryDescriptor e3 = make_geometry("egg2a", {1000, 1500, 1400});
      assert(std::get<EggType2A>(e3).r3 && approx(*std::get<EggType2A>(e3).r3, 1400.0));
      assert(describe_geometry(e3) == "EGG_TYPE_2A,1000.000,1500.000,1400.000");

      const GeometryDescriptor t = make_geometry("twocircles", {1000, 1500, 500, 600});
      assert(shape_of(t) == Shape::TwoCircleAndRectangle);
      assert(approx(std::get<TwoCircleAndRectangle>(t).top_radius, 600.0));
    }

    // Validation failures.
    assert(throws_geometry([]() { (void)make_geometry("circular", {600, 700}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("rectangular", {600}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("hexagon", {600}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("circular", {0}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("rectangular", {-1, 900}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("egg1", {1500, 1000}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("egg1", {1000, 1500, 400}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("twocircles", {1000, 1500, 400, 500}); },
                           ErrorCode::InvalidDescriptor));
    assert(throws_geometry([]() { (void)make_geometry("twocircles", {1000, 900, 500, 500}); },
                           ErrorCode::InvalidDescriptor));

    // Resolution fills in r3 from the solver.
    {
      DiagnosticsChannel diag;
      const GeometryDescriptor e1 = resolve_geometry(make_geometry("egg1", {1000, 1500}), &diag);
      assert(approx(*std::get<EggType1>(e1).r3, 1500.0, 1e-6));
      assert(diag.size() == 1);

      const GeometryDescriptor e2 = resolve_geometry(EggType2{1000, 1500, std::nullopt});
      assert(std::fabs(*std::get<EggType2>(e2).r3 - 1333.3333) < 1e-2);

      // A given r3 is kept as is.
      const GeometryDescriptor keep = resolve_geometry(EggType1{1000, 1500, 1450.0});
      assert(approx(*std::get<EggType1>(keep).r3, 1450.0));

      // Non-egg shapes pass through.
      const GeometryDescriptor c = resolve_geometry(Circular{300});
      assert(approx(std::get<Circular>(c).diameter, 300.0));
    }
    assert(throws_geometry([]() { (void)resolve_geometry(EggType1{600, 1000, std::nullopt}); },
                           ErrorCode::SolverFailed));
    assert(throws_geometry([]() { (void)resolve_geometry(Rectangular{0, 10}); },
                           ErrorCode::InvalidDescriptor));

    std::cout << "test_geometry: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_geometry failed: " << e.what() << "\n";
    return 1;
  }
}
