#pragma once

#include "fdv/geometry.hpp"

namespace fdv {

// Area (m^2) of the segment of a circle of radius r cut off by a chord at
// height h above the lowest point. h is clamped to [0, 2r].
double circular_segment_area(double r, double h);

// Wetted area of an egg section with invert radius r1, crown radius r2, side
// radius r3 and total height h (all metres) filled to depth d.
// Depth is clamped to [0, 0.9999 * h].
double egg_wetted_area(double r1, double r2, double r3, double h, double d);

// Wetted cross-section area (m^2) at the given depth (m).
//
// The geometry must be resolved (egg r3 present); see resolve_geometry().
// Depth beyond the section height gives the full section; negative depth
// gives 0. Throws GeometryError(InvalidDescriptor) for an unresolved egg.
double wetted_area_m2(const GeometryDescriptor& resolved, double depth_m);

// Flow in L/s = wetted area * velocity * 1000, clamped to >= 0.
//
// Zero depth or zero velocity gives 0. A NaN input gives NaN (missing flow).
double compute_flow_lps(const GeometryDescriptor& resolved, double depth_m, double velocity_mps);

} // namespace fdv
