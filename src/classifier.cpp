#include "fdv/classifier.hpp"

#include "fdv/errors.hpp"
#include "fdv/site_info.hpp"
#include "fdv/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fdv {

namespace {

constexpr size_t kNoRow = std::numeric_limits<size_t>::max();

struct StampedRow {
  Timestamp ts{0};
  size_t row{0};
};

static const std::string& cell_at(const std::vector<std::string>& row, size_t c) {
  static const std::string kEmpty;
  return c < row.size() ? row[c] : kEmpty;
}

static std::string make_unique_name(const std::string& base,
                                    std::unordered_set<std::string>* used) {
  if (used->insert(base).second) return base;
  for (size_t k = 2; k < 100000; ++k) {
    const std::string cand = base + "_" + std::to_string(k);
    if (used->insert(cand).second) return cand;
  }
  return base;
}

// Key under which two columns count as "the same channel".
static std::string channel_key(const ColumnMetadata& meta) {
  std::string label;
  bool space = false;
  for (unsigned char c : to_lower(meta.label)) {
    if (std::isalnum(c) != 0) {
      if (space && !label.empty()) label.push_back(' ');
      label.push_back(static_cast<char>(c));
      space = false;
    } else {
      space = true;
    }
  }
  return label + "|" + meta.unit + "|" + meta.qualifier + "|" + meta.channel_number;
}

static MonitorType derive_monitor_type(const ClassifiedFile& f) {
  const bool depth = f.has_group(MonitorGroup::Depth);
  const bool velocity = f.has_group(MonitorGroup::Velocity);
  if (depth && velocity) return MonitorType::Combination;
  if (depth) return MonitorType::Depth;
  if (velocity) return MonitorType::Velocity;
  if (f.has_group(MonitorGroup::Rainfall)) return MonitorType::Rainfall;
  return MonitorType::Unknown;
}

} // namespace

int64_t modal_interval_seconds(const std::vector<Timestamp>& sorted_unique, double min_fraction) {
  if (sorted_unique.size() < 2) {
    throw ClassificationError(ErrorCode::InconsistentInterval,
                              "At least two distinct timestamps are required to infer the sampling interval");
  }

  std::map<int64_t, size_t> counts;
  for (size_t i = 1; i < sorted_unique.size(); ++i) {
    ++counts[sorted_unique[i] - sorted_unique[i - 1]];
  }

  int64_t best = 0;
  size_t best_n = 0;
  for (const auto& kv : counts) {
    if (kv.second > best_n) {
      best = kv.first;
      best_n = kv.second;
    }
  }

  const size_t total = sorted_unique.size() - 1;
  if (best <= 0 || static_cast<double>(best_n) < min_fraction * static_cast<double>(total)) {
    std::ostringstream oss;
    oss << "No dominant sampling interval: the most common step (" << best << " s) covers "
        << best_n << " of " << total << " intervals";
    throw ClassificationError(ErrorCode::InconsistentInterval, oss.str());
  }
  return best;
}

ClassifiedFile classify(const RawTable& table, const ClassifierOptions& opts, DiagnosticsChannel* diag) {
  const std::string& src = table.source_path;
  if (table.headers.empty()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "No header row found in: " + src);
  }

  size_t ts_col = kNoRow;
  for (size_t c = 0; c < table.headers.size(); ++c) {
    if (is_timestamp_header(table.headers[c], opts.timestamp_keywords)) {
      ts_col = c;
      break;
    }
  }
  if (ts_col == kNoRow) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "No timestamp column found in: " + src);
  }
  if (table.rows.empty()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "No data rows found in: " + src);
  }

  // 1) Timestamp format.
  std::vector<std::string> samples;
  for (const auto& row : table.rows) {
    const std::string cell = trim(cell_at(row, ts_col));
    if (cell.empty()) continue;
    samples.push_back(cell);
    if (samples.size() >= opts.format_sample_rows) break;
  }
  TimestampFormat fmt = TimestampFormat::Iso;
  if (!detect_timestamp_format(samples, &fmt)) {
    throw FormatError(ErrorCode::EmptyOrMalformed,
                      "Unrecognized timestamp format in column '" + table.headers[ts_col] +
                      "' of " + src + (samples.empty() ? std::string(" (column is empty)")
                                                     : " (first value '" + samples.front() + "')"));
  }

  // 2) Parse, sort, de-duplicate.
  std::vector<StampedRow> stamped;
  stamped.reserve(table.rows.size());
  size_t bad_ts = 0;
  for (size_t r = 0; r < table.rows.size(); ++r) {
    Timestamp ts = 0;
    if (parse_timestamp(cell_at(table.rows[r], ts_col), fmt, &ts)) {
      stamped.push_back(StampedRow{ts, r});
    } else {
      ++bad_ts;
    }
  }
  if (bad_ts > 0) {
    log_warn(diag, "Skipped " + std::to_string(bad_ts) + " row(s) with unparseable timestamps in '" +
                   table.headers[ts_col] + "' (" + src + ")");
  }

  std::stable_sort(stamped.begin(), stamped.end(),
                   [](const StampedRow& a, const StampedRow& b) { return a.ts < b.ts; });

  std::vector<StampedRow> uniq;
  uniq.reserve(stamped.size());
  size_t duplicates = 0;
  for (const auto& s : stamped) {
    if (!uniq.empty() && uniq.back().ts == s.ts) {
      uniq.back() = s;  // last row in file order wins
      ++duplicates;
    } else {
      uniq.push_back(s);
    }
  }
  if (duplicates > 0) {
    log_warn(diag, "Dropped " + std::to_string(duplicates) +
                   " duplicate timestamp row(s); the last occurrence was kept (" + src + ")");
  }

  std::vector<Timestamp> times;
  times.reserve(uniq.size());
  for (const auto& s : uniq) times.push_back(s.ts);
  const int64_t interval = modal_interval_seconds(times, opts.min_mode_fraction);

  // 3) Regular grid.
  const Timestamp start = times.front();
  const int64_t n_steps = (times.back() - start) / interval;
  if (static_cast<uint64_t>(n_steps) + 1 > opts.max_grid_points) {
    throw ClassificationError(ErrorCode::InconsistentInterval,
                              "Time span of " + src + " is too long for a " +
                              std::to_string(interval) + " s sampling interval");
  }
  const size_t n = static_cast<size_t>(n_steps) + 1;

  std::vector<size_t> src_row(n, kNoRow);
  size_t off_grid = 0;
  for (const auto& s : uniq) {
    const int64_t off = s.ts - start;
    if (off % interval != 0) {
      ++off_grid;
      continue;
    }
    src_row[static_cast<size_t>(off / interval)] = s.row;
  }
  if (off_grid > 0) {
    log_warn(diag, "Dropped " + std::to_string(off_grid) + " row(s) not aligned to the " +
                   std::to_string(interval) + " s sampling grid (" + src + ")");
  }

  ClassifiedFile file;
  file.source_path = src;
  file.timestamp_column = table.headers[ts_col];
  file.timestamp_format = timestamp_format_name(fmt);
  file.sample_interval_seconds = interval;
  file.data_start = start;
  file.data_end = start + n_steps * interval;
  file.start_timestamp = file.data_start;
  file.end_timestamp = file.data_end;
  file.rows_read = table.rows.size();
  file.rows_skipped = bad_ts + duplicates + off_grid;
  file.timestamps.resize(n);
  for (size_t i = 0; i < n; ++i) {
    file.timestamps[i] = start + static_cast<int64_t>(i) * interval;
    if (src_row[i] == kNoRow) ++file.gaps_filled;
  }
  if (file.gaps_filled > 0) {
    log_info(diag, "Filled " + std::to_string(file.gaps_filled) +
                   " missing sample(s) on the regular time grid (" + src + ")");
  }

  // 4) Channels.
  const bool allow_decimal_comma = (table.delimiter != ',');
  file.values.assign(table.headers.size(), std::vector<double>());

  std::unordered_set<std::string> used_names;
  used_names.insert(file.timestamp_column);
  std::unordered_map<std::string, std::string> seen_keys;  // channel key -> first header

  for (size_t c = 0; c < table.headers.size(); ++c) {
    if (c == ts_col) continue;

    const std::string header =
      table.headers[c].empty() ? ("Column" + std::to_string(c + 1)) : table.headers[c];
    const ColumnMetadata meta = parse_column_header(header);
    const ColumnClass cls = classify_column(meta, opts.rules);

    if (cls.ambiguous) {
      throw ClassificationError(ErrorCode::AmbiguousColumns,
                                "Column '" + header + "' matches both " +
                                monitor_group_name(cls.group) + " and " +
                                monitor_group_name(cls.rival) + " equally (" + src + ")");
    }
    if (cls.group != MonitorGroup::Unclassified) {
      const std::string key = monitor_group_name(cls.group) + std::string("|") + channel_key(meta);
      const auto it = seen_keys.find(key);
      if (it != seen_keys.end()) {
        throw ClassificationError(ErrorCode::AmbiguousColumns,
                                  "Columns '" + it->second + "' and '" + header +
                                  "' both describe the same " + monitor_group_name(cls.group) +
                                  " channel (" + src + ")");
      }
      seen_keys.emplace(key, header);
    }

    ChannelDescriptor ch;
    ch.name = make_unique_name(header, &used_names);
    ch.column_index = c;
    if (!meta.unit.empty()) ch.unit = meta.unit;
    if (!meta.qualifier.empty()) ch.qualifier = meta.qualifier;

    std::vector<double>& v = file.values[c];
    v.assign(n, std::numeric_limits<double>::quiet_NaN());
    for (size_t i = 0; i < n; ++i) {
      if (src_row[i] == kNoRow) continue;
      double x = 0.0;
      if (parse_number_cell(cell_at(table.rows[src_row[i]], c), allow_decimal_comma, &x) && std::isfinite(x)) {
        v[i] = x;
      }
    }

    if (cls.group == MonitorGroup::Unclassified) {
      log_info(diag, "Column '" + ch.name + "' left unclassified (no matching channel rule)");
      file.unclassified.push_back(std::move(ch));
    } else {
      file.channel_groups[cls.group].push_back(std::move(ch));
    }
  }

  // 5) Monitor type and identity.
  file.monitor_type = derive_monitor_type(file);

  std::vector<ChannelDescriptor> all;
  for (const auto& kv : file.channel_groups) {
    all.insert(all.end(), kv.second.begin(), kv.second.end());
  }
  std::sort(all.begin(), all.end(), [](const ChannelDescriptor& a, const ChannelDescriptor& b) {
    return a.column_index < b.column_index;
  });
  const SiteInfo site = infer_site_info(src, all);
  file.site_id = site.site_id;
  file.site_name = site.site_name;

  std::ostringstream oss;
  oss << "Classified " << src << ": " << monitor_type_name(file.monitor_type) << " monitor, "
      << n << " samples at " << interval << " s, " << format_timestamp(file.data_start) << " to "
      << format_timestamp(file.data_end) << ", site " << file.site_id;
  log_info(diag, oss.str());

  return file;
}

ClassifiedFile classify_file(const std::string& path, const ClassifierOptions& opts, DiagnosticsChannel* diag) {
  TableReaderOptions ropts;
  ropts.header_keywords = opts.timestamp_keywords;
  const RawTable table = read_table(path, ropts);
  return classify(table, opts, diag);
}

} // namespace fdv
