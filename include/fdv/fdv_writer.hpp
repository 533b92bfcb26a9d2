#pragma once

#include "fdv/diagnostics.hpp"
#include "fdv/geometry.hpp"
#include "fdv/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fdv {

// What to write into an FDV artifact.
struct FdvEncodeRequest {
  // Name of a channel in the Depth group.
  std::string depth_channel;

  // Name of a channel in the Velocity group. Empty or "none" (any case)
  // writes a depth-only file without flow.
  std::string velocity_channel;

  GeometryDescriptor geometry;
};

struct FdvEncodeReport {
  std::string output_path;
  size_t records{0};
  size_t missing_depth{0};
  size_t missing_velocity{0};
  size_t missing_flow{0};
  bool has_velocity{false};
  GeometryDescriptor geometry;  // resolved (egg r3 filled in)
};

// True for "", "none", "NONE", ...
bool is_no_velocity(const std::string& channel);

// Token written for a missing reading.
inline const char* fdv_missing_token() { return "NaN"; }

// "**FIELD:" padded to the value column, followed by value.
std::string header_line(const std::string& key, const std::string& value);

// Grid timestamps (data_start + k * interval) falling inside [start, end].
// The grid is extended beyond the loaded data when the window is wider.
// Throws ValidationError(InvalidTimeRange) past kMaxGridPoints points.
std::vector<Timestamp> window_grid(const ClassifiedFile& file, Timestamp start, Timestamp end);

// Render the FDV artifact for the identity's [start, end] window.
//
// One record is written per grid timestamp inside the window; grid points
// outside the loaded data hold missing readings. Depth is converted to metres
// by the channel unit (mm -> /1000; m or unknown -> as is) and written back
// in millimetres. Velocity in mm/s is converted to m/s.
//
// Throws:
//  - ValidationError(UnknownChannel) for a channel not found in its group
//  - GeometryError(InvalidDescriptor / SolverFailed) from resolve_geometry()
//
// report (optional) receives the counts; its output_path is left empty.
std::string render_fdv(const ClassifiedFile& file,
                       const SiteIdentity& identity,
                       const FdvEncodeRequest& request,
                       FdvEncodeReport* report = nullptr,
                       DiagnosticsChannel* diag = nullptr);

// Render and write atomically to output_path.
// A failed write throws IOError(WriteFailed); no partial file remains.
FdvEncodeReport encode_fdv(const ClassifiedFile& file,
                           const SiteIdentity& identity,
                           const FdvEncodeRequest& request,
                           const std::string& output_path,
                           DiagnosticsChannel* diag = nullptr);

// Header fields read back from an FDV artifact.
struct FdvHeader {
  std::string identifier;
  std::string site_id;
  std::string site_name;
  Timestamp start{0};
  Timestamp end{0};
  int64_t interval_seconds{0};
  GeometryDescriptor geometry;
  std::vector<std::string> fields;  // e.g. {"FLOW", "DEPTH", "VELOCITY"}
};

// Throws FormatError(EmptyOrMalformed) when a required header line is
// missing or malformed.
FdvHeader parse_fdv_header(const std::string& text);

// Throws IOError(ReadFailed) when the file cannot be read.
FdvHeader read_fdv_header(const std::string& path);

} // namespace fdv
