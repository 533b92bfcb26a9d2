#include "fdv/types.hpp"

#include <stdexcept>

namespace fdv {

const char* monitor_type_name(MonitorType t) {
  switch (t) {
    case MonitorType::Depth: return "Depth";
    case MonitorType::Velocity: return "Velocity";
    case MonitorType::Rainfall: return "Rainfall";
    case MonitorType::Combination: return "Combination";
    case MonitorType::Unknown: return "Unknown";
  }
  return "Unknown";
}

bool ClassifiedFile::has_group(MonitorGroup g) const {
  const auto it = channel_groups.find(g);
  return it != channel_groups.end() && !it->second.empty();
}

const std::vector<ChannelDescriptor>& ClassifiedFile::channels(MonitorGroup g) const {
  static const std::vector<ChannelDescriptor> kEmpty;
  const auto it = channel_groups.find(g);
  return it == channel_groups.end() ? kEmpty : it->second;
}

std::vector<std::string> ClassifiedFile::channel_names(MonitorGroup g) const {
  std::vector<std::string> out;
  for (const auto& ch : channels(g)) out.push_back(ch.name);
  return out;
}

const ChannelDescriptor* ClassifiedFile::find_channel(const std::string& name) const {
  for (const auto& kv : channel_groups) {
    for (const auto& ch : kv.second) {
      if (ch.name == name) return &ch;
    }
  }
  return nullptr;
}

const ChannelDescriptor* ClassifiedFile::find_channel(MonitorGroup g, const std::string& name) const {
  for (const auto& ch : channels(g)) {
    if (ch.name == name) return &ch;
  }
  return nullptr;
}

const std::vector<double>& ClassifiedFile::column(const ChannelDescriptor& ch) const {
  if (ch.column_index >= values.size()) {
    throw std::runtime_error("Channel column out of range: " + ch.name);
  }
  return values[ch.column_index];
}

std::optional<size_t> ClassifiedFile::grid_index(Timestamp ts) const {
  if (sample_interval_seconds <= 0 || timestamps.empty()) return std::nullopt;
  if (ts < data_start || ts > data_end) return std::nullopt;
  const int64_t off = ts - data_start;
  if (off % sample_interval_seconds != 0) return std::nullopt;
  return static_cast<size_t>(off / sample_interval_seconds);
}

} // namespace fdv
