#pragma once

#include <string>
#include <vector>

namespace fdv {

// Monitor group a column belongs to. Flow covers logger-computed flow
// channels (the "other" known group).
enum class MonitorGroup {
  Depth,
  Velocity,
  Rainfall,
  Flow,
  Unclassified,
};

const char* monitor_group_name(MonitorGroup g);

// Metadata parsed from one header cell.
//
// Recognized header layouts:
//   "1234_1|Depth|mm"     structured logger export: qualifier "1234", channel "1"
//   "Depth (mm)"          bracketed unit, also "Velocity [m/s]"
//   "Depth_mm"            trailing unit token (separated by '_', '-' or space)
//   "Level"               label only
struct ColumnMetadata {
  std::string header;          // trimmed header text
  std::string label;           // header without unit/qualifier decoration
  std::string unit;            // normalized unit token, empty if none recognized
  std::string qualifier;       // logger/site qualifier (structured headers only)
  std::string channel_number;  // channel number (structured headers only)
};

ColumnMetadata parse_column_header(const std::string& header);

// Normalize a unit token to one of:
//   "mm", "m", "m/s", "mm/s", "l/s", "m3/s", "mm/hr"
// Returns an empty string for unrecognized units.
std::string normalize_unit(const std::string& unit);

// One row of the classification table.
//
// A rule matches a column when one of its keywords occurs in the column label.
// Keywords of four or more characters match as substrings; shorter keywords
// must equal a whole word of the label. A rule with a recognized but
// incompatible unit does not match at all.
struct ChannelRule {
  MonitorGroup group{MonitorGroup::Unclassified};
  std::vector<std::string> keywords;  // lowercase
  std::vector<std::string> units;     // normalized unit tokens
  int priority{0};                    // tie breaker between groups
};

// Default rule set used by the classifier.
const std::vector<ChannelRule>& default_channel_rules();

// Classification of a single column.
//
// score is 0 when no rule matched. When two different groups reach the same
// best score the column is ambiguous and rival names the second group.
struct ColumnClass {
  MonitorGroup group{MonitorGroup::Unclassified};
  int score{0};
  bool ambiguous{false};
  MonitorGroup rival{MonitorGroup::Unclassified};
};

// Score: a keyword hit gives 10, a compatible unit adds 10, and the rule
// priority is added on top.
ColumnClass classify_column(const ColumnMetadata& meta, const std::vector<ChannelRule>& rules);

inline ColumnClass classify_column(const ColumnMetadata& meta) {
  return classify_column(meta, default_channel_rules());
}

// Keywords identifying the timestamp column (lowercase).
const std::vector<std::string>& default_timestamp_keywords();

// True when the lowercase header contains one of the keywords.
bool is_timestamp_header(const std::string& header, const std::vector<std::string>& keywords);

} // namespace fdv
