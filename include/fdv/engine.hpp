#pragma once

#include "fdv/batch.hpp"
#include "fdv/classifier.hpp"
#include "fdv/diagnostics.hpp"
#include "fdv/errors.hpp"
#include "fdv/fdv_writer.hpp"
#include "fdv/geometry.hpp"
#include "fdv/r3_solver.hpp"
#include "fdv/rainfall.hpp"
#include "fdv/session.hpp"

#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fdv {

struct EngineOptions {
  DiagnosticsOptions diagnostics;
  ClassifierOptions classifier;
  BatchOptions batch;
};

// Command surface used by the presentation layer.
//
// The engine owns one Session and a shared DiagnosticsChannel. Every command
// returns a Result: library exceptions are converted here and also recorded
// as error events, so nothing throws across this boundary.
//
// Session commands are serialized by an internal mutex; batches run without
// it and only share the diagnostics channel.
class Engine {
public:
  explicit Engine(EngineOptions opts = EngineOptions());
  // Blocks until every batch started by run_batch_async() has finished.
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Classify a file and load it into the session.
  Result<ClassifiedFile> classify_file(const std::string& path);

  Result<SiteIdentity> update_site_id(const std::string& id);
  Result<SiteIdentity> update_site_name(const std::string& name);
  Result<SiteIdentity> update_timestamps(const std::string& start, const std::string& end);

  // Encode the loaded file. velocity_channel may be "none".
  Result<FdvEncodeReport> encode_fdv(const std::string& output_path,
                                     const std::string& depth_channel,
                                     const std::string& velocity_channel,
                                     const GeometryDescriptor& geometry);

  // Loosely-typed form: shape name plus a dimension list ("1200;900").
  Result<FdvEncodeReport> encode_fdv(const std::string& output_path,
                                     const std::string& depth_channel,
                                     const std::string& velocity_channel,
                                     const std::string& shape,
                                     const std::string& dimensions);

  Result<RainfallReport> extract_rainfall(const std::string& output_path,
                                          const std::string& rainfall_channel);

  // -1 on failure.
  double solve_r3(double width, double height, int egg_form) const;
  R3Result solve_r3_detailed(double width, double height, int egg_form) const;

  Result<BatchSummary> run_batch(const std::vector<BatchItem>& items, const std::string& output_dir);

  // Run a batch on its own thread. Progress is reported through the
  // diagnostics channel only. The batch uses this engine's options and
  // channel, so the engine outlives it: destruction waits for it to finish
  // (call cancel_batch() first to skip the remaining items).
  std::future<Result<BatchSummary>> run_batch_async(std::vector<BatchItem> items,
                                                    std::string output_dir);

  // Stop a running batch before its next item. Cleared when a batch starts.
  void cancel_batch();

  // Write reports for the loaded file; the value is the output path.
  Result<std::string> generate_interim_report(const std::string& output_path);
  // Daily and weekly totals of the first rainfall channel.
  Result<std::string> generate_rainfall_totals(const std::string& output_path);

  std::vector<LogEvent> drain_recent_logs() const;
  Subscription subscribe_logs();

  void reset_session();

  // Direct access for callers that need the loaded state (read-only).
  bool has_file() const;

  DiagnosticsChannel& diagnostics() { return *diag_; }

private:
  template <class T, class F>
  Result<T> guarded(const char* command, F&& fn);

  EngineOptions opts_;
  std::shared_ptr<DiagnosticsChannel> diag_;
  mutable std::mutex mu_;
  Session session_;
  std::shared_ptr<CancellationToken> cancel_;

  std::mutex batches_mu_;
  std::condition_variable batches_cv_;
  size_t batches_in_flight_{0};
};

} // namespace fdv
