#include "fdv/engine.hpp"

#include "fdv/interim_report.hpp"
#include "fdv/utils.hpp"

#include <utility>

namespace fdv {

Engine::Engine(EngineOptions opts)
  : opts_(std::move(opts)),
    diag_(std::make_shared<DiagnosticsChannel>(opts_.diagnostics)),
    session_(diag_.get()),
    cancel_(std::make_shared<CancellationToken>()) {}

Engine::~Engine() {
  std::unique_lock<std::mutex> lock(batches_mu_);
  batches_cv_.wait(lock, [this]() { return batches_in_flight_ == 0; });
}

template <class T, class F>
Result<T> Engine::guarded(const char* command, F&& fn) {
  ErrorInfo info;
  try {
    return Result<T>::success(fn());
  } catch (const Error& e) {
    info = to_error_info(e);
  } catch (const std::exception& e) {
    info = ErrorInfo{ErrorKind::Internal, ErrorCode::Internal, e.what()};
  }
  diag_->error(std::string(command) + ": " + describe_error(info));
  return Result<T>::failure(std::move(info));
}

Result<ClassifiedFile> Engine::classify_file(const std::string& path) {
  return guarded<ClassifiedFile>("classify_file", [&]() {
    ClassifiedFile f = fdv::classify_file(path, opts_.classifier, diag_.get());
    std::lock_guard<std::mutex> lock(mu_);
    session_.load(f);
    return f;
  });
}

Result<SiteIdentity> Engine::update_site_id(const std::string& id) {
  return guarded<SiteIdentity>("update_site_id", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    return session_.update_site_id(id);
  });
}

Result<SiteIdentity> Engine::update_site_name(const std::string& name) {
  return guarded<SiteIdentity>("update_site_name", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    return session_.update_site_name(name);
  });
}

Result<SiteIdentity> Engine::update_timestamps(const std::string& start, const std::string& end) {
  return guarded<SiteIdentity>("update_timestamps", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    return session_.update_timestamps(start, end);
  });
}

Result<FdvEncodeReport> Engine::encode_fdv(const std::string& output_path,
                                           const std::string& depth_channel,
                                           const std::string& velocity_channel,
                                           const GeometryDescriptor& geometry) {
  return guarded<FdvEncodeReport>("encode_fdv", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    FdvEncodeRequest req;
    req.depth_channel = depth_channel;
    req.velocity_channel = velocity_channel;
    req.geometry = geometry;
    return fdv::encode_fdv(session_.file(), session_.identity(), req, output_path, diag_.get());
  });
}

Result<FdvEncodeReport> Engine::encode_fdv(const std::string& output_path,
                                           const std::string& depth_channel,
                                           const std::string& velocity_channel,
                                           const std::string& shape,
                                           const std::string& dimensions) {
  GeometryDescriptor g;
  const Result<bool> parsed = guarded<bool>("encode_fdv", [&]() {
    g = make_geometry(shape, parse_dimension_list(dimensions));
    return true;
  });
  if (!parsed) return Result<FdvEncodeReport>::failure(parsed.error);
  return encode_fdv(output_path, depth_channel, velocity_channel, g);
}

Result<RainfallReport> Engine::extract_rainfall(const std::string& output_path,
                                                const std::string& rainfall_channel) {
  return guarded<RainfallReport>("extract_rainfall", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    return fdv::extract_rainfall(session_.file(), session_.identity(), rainfall_channel, output_path,
                                 diag_.get());
  });
}

double Engine::solve_r3(double width, double height, int egg_form) const {
  return fdv::solve_r3(width, height, egg_form);
}

R3Result Engine::solve_r3_detailed(double width, double height, int egg_form) const {
  return fdv::solve_r3_detailed(width, height, egg_form);
}

Result<BatchSummary> Engine::run_batch(const std::vector<BatchItem>& items, const std::string& output_dir) {
  cancel_->reset();
  return guarded<BatchSummary>("run_batch", [&]() {
    return fdv::run_batch(items, output_dir, opts_.batch, cancel_.get(), diag_.get());
  });
}

std::future<Result<BatchSummary>> Engine::run_batch_async(std::vector<BatchItem> items,
                                                          std::string output_dir) {
  cancel_->reset();
  {
    std::lock_guard<std::mutex> lock(batches_mu_);
    ++batches_in_flight_;
  }
  return std::async(std::launch::async,
                    [this, items = std::move(items), output_dir = std::move(output_dir)]() {
                      Result<BatchSummary> r = guarded<BatchSummary>("run_batch", [&]() {
                        return fdv::run_batch(items, output_dir, opts_.batch, cancel_.get(), diag_.get());
                      });
                      // Last use of this engine.
                      std::lock_guard<std::mutex> lock(batches_mu_);
                      --batches_in_flight_;
                      batches_cv_.notify_all();
                      return r;
                    });
}

void Engine::cancel_batch() {
  cancel_->cancel();
  diag_->warn("Batch cancellation requested");
}

Result<std::string> Engine::generate_interim_report(const std::string& output_path) {
  return guarded<std::string>("generate_interim_report", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    fdv::generate_interim_report(session_.file(), output_path, diag_.get());
    return output_path;
  });
}

Result<std::string> Engine::generate_rainfall_totals(const std::string& output_path) {
  return guarded<std::string>("generate_rainfall_totals", [&]() {
    std::lock_guard<std::mutex> lock(mu_);
    write_rainfall_totals(session_.file(), "", output_path, diag_.get());
    return output_path;
  });
}

std::vector<LogEvent> Engine::drain_recent_logs() const {
  return diag_->drain();
}

Subscription Engine::subscribe_logs() {
  return diag_->subscribe();
}

void Engine::reset_session() {
  std::lock_guard<std::mutex> lock(mu_);
  session_.reset();
}

bool Engine::has_file() const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_.has_file();
}

} // namespace fdv
