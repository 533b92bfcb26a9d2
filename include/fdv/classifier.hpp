#pragma once

#include "fdv/channel_rules.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/table_reader.hpp"
#include "fdv/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fdv {

struct ClassifierOptions {
  // Header keywords marking the timestamp column (first match wins).
  std::vector<std::string> timestamp_keywords{default_timestamp_keywords()};

  // Column classification table.
  std::vector<ChannelRule> rules{default_channel_rules()};

  // Rows sampled to detect the timestamp format.
  size_t format_sample_rows{100};

  // The modal timestamp step must cover at least this share of all steps.
  double min_mode_fraction{0.5};

  // Upper bound on the re-gridded series length (guards against a single
  // stray timestamp years away from the rest of the data).
  size_t max_grid_points{kMaxGridPoints};
};

// Sampling interval (seconds) as the statistical mode of consecutive deltas
// of strictly increasing timestamps. Ties resolve to the smaller delta.
//
// Throws ClassificationError(InconsistentInterval) when fewer than two
// timestamps are given or the mode covers less than min_fraction of deltas.
int64_t modal_interval_seconds(const std::vector<Timestamp>& sorted_unique, double min_fraction);

// Classify a raw table.
//
// Steps:
//   1) locate the timestamp column and detect its format
//   2) sort, de-duplicate (last row wins) and infer the sampling interval
//   3) re-grid onto start + k*interval, filling gaps with NaN
//   4) assign every other column to a monitor group via the rule table
//   5) derive monitor type and site identity
//
// Deterministic for a given table. Skipped rows and unclassified columns are
// reported to diag (may be null).
//
// Throws FormatError(EmptyOrMalformed) and ClassificationError.
ClassifiedFile classify(const RawTable& table,
                        const ClassifierOptions& opts = ClassifierOptions(),
                        DiagnosticsChannel* diag = nullptr);

// read_table() + classify().
ClassifiedFile classify_file(const std::string& path,
                             const ClassifierOptions& opts = ClassifierOptions(),
                             DiagnosticsChannel* diag = nullptr);

} // namespace fdv
