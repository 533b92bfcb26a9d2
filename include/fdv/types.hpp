#pragma once

#include "fdv/channel_rules.hpp"
#include "fdv/timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fdv {

// Placeholder used for site id/name values that could not be inferred.
inline const char* unknown_site() { return "Unknown"; }

enum class MonitorType {
  Depth,
  Velocity,
  Rainfall,
  Combination,  // depth and velocity
  Unknown,
};

const char* monitor_type_name(MonitorType t);

struct ChannelDescriptor {
  std::string name;                      // header text, unique within a file
  size_t column_index{0};                // column in the raw table
  std::optional<std::string> unit;       // normalized unit token
  std::optional<std::string> qualifier;  // logger/site qualifier

  bool operator==(const ChannelDescriptor& o) const {
    return name == o.name && column_index == o.column_index && unit == o.unit &&
           qualifier == o.qualifier;
  }
  bool operator!=(const ChannelDescriptor& o) const { return !(*this == o); }
};

struct SiteIdentity {
  std::string site_id{unknown_site()};
  std::string site_name{unknown_site()};
  Timestamp start_timestamp{0};
  Timestamp end_timestamp{0};
};

// Upper bound on any regular time axis built from a file (classification and
// output windows alike).
constexpr size_t kMaxGridPoints = 5000000;

// A logger export after classification.
//
// The samples are re-gridded onto a regular time axis:
//   timestamps[i] = data_start + i * sample_interval_seconds
// and values[column_index][i] holds the reading at that time (NaN = missing).
// values has one entry per raw column; the timestamp column's entry is empty.
//
// start_timestamp/end_timestamp and site_id/site_name mirror the owning
// Session's SiteIdentity; everything else is fixed once classified.
struct ClassifiedFile {
  std::string source_path;

  std::map<MonitorGroup, std::vector<ChannelDescriptor>> channel_groups;  // only non-empty groups
  std::vector<ChannelDescriptor> unclassified;
  MonitorType monitor_type{MonitorType::Unknown};

  Timestamp start_timestamp{0};
  Timestamp end_timestamp{0};
  int64_t sample_interval_seconds{0};
  std::string site_id{unknown_site()};
  std::string site_name{unknown_site()};

  std::string timestamp_column;
  std::string timestamp_format;
  Timestamp data_start{0};
  Timestamp data_end{0};
  std::vector<Timestamp> timestamps;
  std::vector<std::vector<double>> values;

  size_t rows_read{0};     // data rows in the input
  size_t rows_skipped{0};  // rows dropped (bad timestamp, duplicate, off-grid)
  size_t gaps_filled{0};   // grid points without a source row

  bool has_group(MonitorGroup g) const;

  // Channels of a group in column order (empty if the group is absent).
  const std::vector<ChannelDescriptor>& channels(MonitorGroup g) const;
  std::vector<std::string> channel_names(MonitorGroup g) const;

  // Look up a classified (not unclassified) channel by name. nullptr if absent.
  const ChannelDescriptor* find_channel(const std::string& name) const;
  const ChannelDescriptor* find_channel(MonitorGroup g, const std::string& name) const;

  const std::vector<double>& column(const ChannelDescriptor& ch) const;

  // Index of ts on the grid, if ts lies on it within [data_start, data_end].
  std::optional<size_t> grid_index(Timestamp ts) const;

  size_t n_samples() const { return timestamps.size(); }
};

} // namespace fdv
