#include "fdv/fdv_writer.hpp"

#include "fdv/errors.hpp"
#include "fdv/flow_calculators.hpp"
#include "fdv/utils.hpp"

#include <cmath>
#include <optional>
#include <sstream>

namespace fdv {

namespace {

constexpr size_t kValueColumn = 25;
constexpr size_t kMaxIdentifier = 15;

static std::string identifier_for(const std::string& site_name) {
  return to_upper(site_name.substr(0, kMaxIdentifier));
}

static std::string int_field(double v, size_t width) {
  if (std::isnan(v)) return pad_left(fdv_missing_token(), width);
  return pad_left(std::to_string(std::llround(v)), width);
}

static std::string fixed_field(double v, int decimals, size_t width) {
  if (std::isnan(v)) return pad_left(fdv_missing_token(), width);
  return pad_left(format_fixed(v, decimals), width);
}

static double depth_scale_to_m(const ChannelDescriptor& ch) {
  return (ch.unit && *ch.unit == "mm") ? 0.001 : 1.0;
}

static double velocity_scale_to_mps(const ChannelDescriptor& ch) {
  return (ch.unit && *ch.unit == "mm/s") ? 0.001 : 1.0;
}

static const ChannelDescriptor& require_channel(const ClassifiedFile& file, MonitorGroup g,
                                                const std::string& name) {
  const ChannelDescriptor* ch = file.find_channel(g, name);
  if (!ch) {
    std::string avail;
    for (const auto& n : file.channel_names(g)) {
      if (!avail.empty()) avail += ", ";
      avail += "'" + n + "'";
    }
    throw ValidationError(ErrorCode::UnknownChannel,
                          std::string("Unknown ") + monitor_group_name(g) + " channel '" + name +
                          "' (available: " + (avail.empty() ? std::string("none") : avail) + ")");
  }
  return *ch;
}

// Value after "KEY:" with the padding removed.
static std::string header_value(const std::string& line) {
  const size_t colon = line.find(':');
  if (colon == std::string::npos) return "";
  return trim(line.substr(colon + 1));
}

static std::vector<std::string> split_commas(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(trim(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(trim(cur));
  return out;
}

} // namespace

bool is_no_velocity(const std::string& channel) {
  const std::string t = to_lower(trim(channel));
  return t.empty() || t == "none";
}

std::string header_line(const std::string& key, const std::string& value) {
  std::string line = key;
  if (line.size() < kValueColumn) line.append(kValueColumn - line.size(), ' ');
  return line + value;
}

std::vector<Timestamp> window_grid(const ClassifiedFile& file, Timestamp start, Timestamp end) {
  std::vector<Timestamp> out;
  const int64_t step = file.sample_interval_seconds;
  if (step <= 0 || start > end) return out;

  // First grid point >= start; the grid may extend before data_start.
  // Integer division truncates toward zero, which is the ceiling for a
  // negative offset.
  int64_t k = (start - file.data_start) / step;
  if (file.data_start + k * step < start) ++k;
  const Timestamp first = file.data_start + k * step;
  if (first <= end && static_cast<uint64_t>((end - first) / step) + 1 > kMaxGridPoints) {
    throw ValidationError(ErrorCode::InvalidTimeRange,
                          "Time window " + format_timestamp(start) + " to " + format_timestamp(end) +
                            " is too long for a " + std::to_string(step) + " s sampling interval");
  }
  for (Timestamp t = file.data_start + k * step; t <= end; t += step) out.push_back(t);
  return out;
}

std::string render_fdv(const ClassifiedFile& file,
                       const SiteIdentity& identity,
                       const FdvEncodeRequest& request,
                       FdvEncodeReport* report,
                       DiagnosticsChannel* diag) {
  const ChannelDescriptor& depth_ch = require_channel(file, MonitorGroup::Depth, request.depth_channel);
  const bool has_velocity = !is_no_velocity(request.velocity_channel);
  const ChannelDescriptor* vel_ch = nullptr;
  if (has_velocity) vel_ch = &require_channel(file, MonitorGroup::Velocity, request.velocity_channel);

  const GeometryDescriptor geometry = resolve_geometry(request.geometry, diag);

  const std::vector<double>& depth = file.column(depth_ch);
  const std::vector<double>* velocity = vel_ch ? &file.column(*vel_ch) : nullptr;
  const double depth_scale = depth_scale_to_m(depth_ch);
  const double vel_scale = vel_ch ? velocity_scale_to_mps(*vel_ch) : 1.0;

  const std::vector<Timestamp> grid = window_grid(file, identity.start_timestamp, identity.end_timestamp);
  const double nan = std::nan("");

  std::ostringstream out;
  out << header_line("**DATA_FORMAT:", "1,ASCII") << "\n";
  out << header_line("**IDENTIFIER:", "1," + identifier_for(identity.site_name)) << "\n";
  if (has_velocity) {
    out << header_line("**FIELD:", "3,FLOW,DEPTH,VELOCITY") << "\n";
    out << header_line("**UNITS:", "3,L/S,MM,M/S") << "\n";
    out << header_line("**FORMAT:", "4,A12,I6,I6,F6.3") << "\n";
    out << header_line("**RECORD_LENGTH:", "I2,30") << "\n";
  } else {
    out << header_line("**FIELD:", "1,DEPTH") << "\n";
    out << header_line("**UNITS:", "1,MM") << "\n";
    out << header_line("**FORMAT:", "2,A12,I6") << "\n";
    out << header_line("**RECORD_LENGTH:", "I2,18") << "\n";
  }
  out << header_line("**CONSTANTS:", "6,HEIGHT,MIN_VEL,MANHOLE_NO,") << "\n";
  out << header_line("*+", "START,END,INTERVAL") << "\n";
  out << header_line("**C_UNITS:", "6,MM,M/S,,GMT,GMT,MIN") << "\n";
  out << header_line("**C_FORMAT:", "10,I5,1X,F5,1X,A20/D10,1X,D10,1X,I4") << "\n";
  out << header_line("*$SITE_ID:", identity.site_id) << "\n";
  out << header_line("*$SITE_NAME:", identity.site_name) << "\n";
  out << header_line("*$GEOMETRY:", describe_geometry(geometry)) << "\n";
  out << header_line("*$INTERVAL_SECONDS:", std::to_string(file.sample_interval_seconds)) << "\n";
  out << "*CSTART\n";
  out << int_field(geometry_height_mm(geometry), 5) << " " << fixed_field(0.0, 2, 5) << " "
      << identity.site_id << "\n";
  out << format_timestamp_compact(identity.start_timestamp) << " "
      << format_timestamp_compact(identity.end_timestamp) << " "
      << pad_left(std::to_string(file.sample_interval_seconds / 60), 4) << "\n";
  out << "*CEND\n";

  FdvEncodeReport rep;
  rep.has_velocity = has_velocity;
  rep.geometry = geometry;

  for (Timestamp t : grid) {
    const std::optional<size_t> idx = file.grid_index(t);
    const double d_m = idx ? depth[*idx] * depth_scale : nan;
    if (std::isnan(d_m)) ++rep.missing_depth;

    out << format_timestamp_compact(t);
    if (has_velocity) {
      const double v = idx ? (*velocity)[*idx] * vel_scale : nan;
      if (std::isnan(v)) ++rep.missing_velocity;
      const double q = compute_flow_lps(geometry, d_m, v);
      if (std::isnan(q)) ++rep.missing_flow;
      out << int_field(q, 6) << int_field(d_m * 1000.0, 6) << fixed_field(v, 3, 6);
    } else {
      out << int_field(d_m * 1000.0, 6);
    }
    out << "\n";
    ++rep.records;
  }
  out << "*END\n";

  std::ostringstream msg;
  msg << "FDV: " << rep.records << " record(s) for site " << identity.site_id << " ("
      << describe_geometry(geometry) << ")";
  log_info(diag, msg.str());
  if (rep.missing_depth > 0 || rep.missing_velocity > 0) {
    std::ostringstream w;
    w << "FDV: missing readings: depth " << rep.missing_depth;
    if (has_velocity) w << ", velocity " << rep.missing_velocity << ", flow " << rep.missing_flow;
    log_warn(diag, w.str());
  }

  if (report) *report = rep;
  return out.str();
}

FdvEncodeReport encode_fdv(const ClassifiedFile& file,
                           const SiteIdentity& identity,
                           const FdvEncodeRequest& request,
                           const std::string& output_path,
                           DiagnosticsChannel* diag) {
  FdvEncodeReport report;
  const std::string text = render_fdv(file, identity, request, &report, diag);
  if (!write_text_file_atomic(output_path, text)) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write FDV file: " + output_path);
  }
  report.output_path = output_path;
  log_info(diag, "Wrote " + output_path);
  return report;
}

FdvHeader parse_fdv_header(const std::string& text) {
  FdvHeader h;
  bool have_fields = false;
  bool have_geometry = false;
  bool have_interval = false;
  bool have_window = false;

  std::istringstream in(text);
  std::string line;
  bool in_constants = false;
  int constant_line = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (in_constants) {
      if (line == "*CEND") break;
      ++constant_line;
      if (constant_line == 2) {
        std::istringstream ls(line);
        std::string a, b;
        ls >> a >> b;
        if (!parse_timestamp(a, TimestampFormat::Compact, &h.start) ||
            !parse_timestamp(b, TimestampFormat::Compact, &h.end)) {
          throw FormatError(ErrorCode::EmptyOrMalformed, "Malformed FDV time window line: '" + line + "'");
        }
        have_window = true;
      }
      continue;
    }

    if (line == "*CSTART") {
      in_constants = true;
    } else if (starts_with(line, "**IDENTIFIER:")) {
      const std::string v = header_value(line);
      const size_t comma = v.find(',');
      h.identifier = comma == std::string::npos ? v : v.substr(comma + 1);
    } else if (starts_with(line, "**FIELD:")) {
      std::vector<std::string> parts = split_commas(header_value(line));
      if (parts.size() < 2) {
        throw FormatError(ErrorCode::EmptyOrMalformed, "Malformed FDV FIELD line: '" + line + "'");
      }
      h.fields.assign(parts.begin() + 1, parts.end());
      have_fields = true;
    } else if (starts_with(line, "*$SITE_ID:")) {
      h.site_id = header_value(line);
    } else if (starts_with(line, "*$SITE_NAME:")) {
      h.site_name = header_value(line);
    } else if (starts_with(line, "*$GEOMETRY:")) {
      std::vector<std::string> parts = split_commas(header_value(line));
      std::vector<double> dims;
      for (size_t i = 1; i < parts.size(); ++i) {
        double v = 0.0;
        if (!parse_number_cell(parts[i], false, &v)) {
          throw FormatError(ErrorCode::EmptyOrMalformed, "Malformed FDV GEOMETRY line: '" + line + "'");
        }
        dims.push_back(v);
      }
      try {
        h.geometry = make_geometry(parts.front(), dims);
      } catch (const GeometryError& e) {
        throw FormatError(ErrorCode::EmptyOrMalformed, std::string("Invalid FDV geometry: ") + e.what());
      }
      have_geometry = true;
    } else if (starts_with(line, "*$INTERVAL_SECONDS:")) {
      try {
        h.interval_seconds = to_int(header_value(line));
      } catch (const std::exception&) {
        throw FormatError(ErrorCode::EmptyOrMalformed, "Malformed FDV interval line: '" + line + "'");
      }
      have_interval = true;
    }
  }

  if (!have_fields || !have_geometry || !have_interval || !have_window) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Incomplete FDV header");
  }
  return h;
}

FdvHeader read_fdv_header(const std::string& path) {
  std::string text;
  if (!read_text_file(path, &text)) {
    throw IOError(ErrorCode::ReadFailed, "Failed to read FDV file: " + path);
  }
  return parse_fdv_header(text);
}

} // namespace fdv
