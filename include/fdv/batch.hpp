#pragma once

#include "fdv/classifier.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/errors.hpp"
#include "fdv/geometry.hpp"
#include "fdv/types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fdv {

struct BatchItem {
  std::string file_path;
  // Required for depth/velocity files; ignored for rainfall files.
  std::optional<GeometryDescriptor> geometry;
};

enum class BatchItemStatus {
  Succeeded,
  Failed,
  Cancelled,
};

const char* batch_item_status_name(BatchItemStatus s);

struct BatchItemResult {
  std::string file_path;
  BatchItemStatus status{BatchItemStatus::Cancelled};
  std::optional<ErrorInfo> error;
  std::string output_path;
  std::string site_id;
  MonitorType monitor_type{MonitorType::Unknown};
};

struct BatchSummary {
  std::string output_dir;
  std::vector<BatchItemResult> items;  // input order
  size_t succeeded{0};
  size_t failed{0};
  size_t cancelled{0};
  std::string run_meta_path;  // empty when not written
  std::string zip_path;       // empty when not requested or not written
};

// Cooperative stop flag shared between the caller and batch workers.
// Items already running finish; items not yet started are reported Cancelled.
class CancellationToken {
public:
  void cancel() { flag_.store(true); }
  void reset() { flag_.store(false); }
  bool cancelled() const { return flag_.load(); }

private:
  std::atomic<bool> flag_{false};
};

struct BatchOptions {
  // 0 = std::thread::hardware_concurrency() (at least 1). Never more than
  // the number of items.
  size_t max_workers{0};

  // Write batch_run_meta.json into the output directory.
  bool write_run_meta{true};
  std::string tool_name{"fdv_batch"};

  // Bundle every written artifact into <output_dir>/<zip_name>.
  bool zip_outputs{false};
  std::string zip_name{"processed_files.zip"};

  ClassifierOptions classifier;

  // Called from a worker with the item index just before the item runs.
  std::function<void(size_t)> on_item_started;
};

// Collision-free output names within one output directory.
//
// reserve("S12", ".fdv") returns "<dir>/S12.fdv", then "<dir>/S12_2.fdv",
// "<dir>/S12_3.fdv", ... Names already present on disk are skipped as well.
// Thread-safe: one mutex serializes all reservations.
class OutputNameRegistry {
public:
  explicit OutputNameRegistry(std::string output_dir) : dir_(std::move(output_dir)) {}

  std::string reserve(const std::string& stem, const std::string& extension);

private:
  std::mutex mu_;
  std::string dir_;
  std::unordered_set<std::string> taken_;
};

// Create the directory if needed and check that a file can be written there.
// Throws IOError(OutputDirUnwritable).
void check_output_dir_writable(const std::string& dir);

// Classify one file and write its artifact (.r for rainfall monitors, .fdv
// otherwise). Never throws: failures are returned in the result.
BatchItemResult process_batch_item(const BatchItem& item,
                                   OutputNameRegistry* names,
                                   const BatchOptions& opts,
                                   DiagnosticsChannel* diag);

// Process all items on a bounded pool of worker threads.
//
// Throws IOError(OutputDirUnwritable) before any item runs when output_dir
// cannot be written. Per-item failures never abort the batch. A run meta or
// zip bundle that cannot be written is reported through diag and leaves its
// summary path empty.
BatchSummary run_batch(const std::vector<BatchItem>& items,
                       const std::string& output_dir,
                       const BatchOptions& opts = BatchOptions(),
                       const CancellationToken* cancel = nullptr,
                       DiagnosticsChannel* diag = nullptr);

} // namespace fdv
