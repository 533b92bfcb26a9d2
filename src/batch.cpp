#include "fdv/batch.hpp"

#include "fdv/fdv_writer.hpp"
#include "fdv/rainfall.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"
#include "fdv/zip_archive.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fdv {

namespace {

static std::string join_path(const std::string& dir, const std::string& name) {
  return (std::filesystem::u8path(dir) / std::filesystem::u8path(name)).u8string();
}

static std::string file_name_of(const std::string& path) {
  return std::filesystem::u8path(path).filename().u8string();
}

static size_t worker_count(size_t requested, size_t n_items) {
  size_t n = requested;
  if (n == 0) n = static_cast<size_t>(std::thread::hardware_concurrency());
  if (n == 0) n = 1;
  return std::max<size_t>(1, std::min(n, n_items));
}

static SiteIdentity identity_of(const ClassifiedFile& f) {
  SiteIdentity id;
  id.site_id = f.site_id;
  id.site_name = f.site_name;
  id.start_timestamp = f.start_timestamp;
  id.end_timestamp = f.end_timestamp;
  return id;
}

} // namespace

const char* batch_item_status_name(BatchItemStatus s) {
  switch (s) {
    case BatchItemStatus::Succeeded: return "Succeeded";
    case BatchItemStatus::Failed: return "Failed";
    case BatchItemStatus::Cancelled: return "Cancelled";
  }
  return "Cancelled";
}

std::string OutputNameRegistry::reserve(const std::string& stem, const std::string& extension) {
  const std::string base = sanitize_file_stem(stem);
  std::lock_guard<std::mutex> lock(mu_);
  for (size_t k = 1;; ++k) {
    const std::string name = (k == 1 ? base : base + "_" + std::to_string(k)) + extension;
    const std::string path = join_path(dir_, name);
    if (taken_.count(path) != 0 || file_exists(path)) continue;
    taken_.insert(path);
    return path;
  }
}

void check_output_dir_writable(const std::string& dir) {
  if (trim(dir).empty()) {
    throw IOError(ErrorCode::OutputDirUnwritable, "Output directory is empty");
  }
  try {
    ensure_directory(dir);
  } catch (const std::exception& e) {
    throw IOError(ErrorCode::OutputDirUnwritable,
                  "Cannot create output directory " + dir + ": " + e.what());
  }

  const std::string scratch = join_path(dir, ".fdv_write_test." + random_hex_token(6));
  bool ok = false;
  {
    std::ofstream f(std::filesystem::u8path(scratch), std::ios::binary);
    ok = static_cast<bool>(f << "fdv");
  }
  std::error_code ec;
  std::filesystem::remove(std::filesystem::u8path(scratch), ec);
  if (!ok) {
    throw IOError(ErrorCode::OutputDirUnwritable, "Output directory is not writable: " + dir);
  }
}

BatchItemResult process_batch_item(const BatchItem& item,
                                   OutputNameRegistry* names,
                                   const BatchOptions& opts,
                                   DiagnosticsChannel* diag) {
  BatchItemResult r;
  r.file_path = item.file_path;
  log_info(diag, "Batch: started " + item.file_path);

  try {
    const ClassifiedFile file = classify_file(item.file_path, opts.classifier, diag);
    r.site_id = file.site_id;
    r.monitor_type = file.monitor_type;
    const SiteIdentity identity = identity_of(file);

    if (file.monitor_type == MonitorType::Rainfall) {
      const std::string out = names->reserve(file.site_id, ".r");
      extract_rainfall(file, identity, "", out, diag);
      r.output_path = out;
    } else {
      if (!file.has_group(MonitorGroup::Depth)) {
        throw ValidationError(ErrorCode::UnknownChannel, "No depth channel in " + item.file_path);
      }
      if (!item.geometry) {
        throw GeometryError(ErrorCode::InvalidDescriptor, "No pipe geometry given for " + item.file_path);
      }
      FdvEncodeRequest req;
      req.depth_channel = file.channels(MonitorGroup::Depth).front().name;
      req.velocity_channel = file.has_group(MonitorGroup::Velocity)
                               ? file.channels(MonitorGroup::Velocity).front().name
                               : std::string("none");
      req.geometry = *item.geometry;
      const std::string out = names->reserve(file.site_id, ".fdv");
      encode_fdv(file, identity, req, out, diag);
      r.output_path = out;
    }
    r.status = BatchItemStatus::Succeeded;
    log_info(diag, "Batch: succeeded " + item.file_path + " -> " + r.output_path);
  } catch (const Error& e) {
    r.status = BatchItemStatus::Failed;
    r.error = to_error_info(e);
    log_error(diag, "Batch: failed " + item.file_path + ": " + describe_error(*r.error));
  } catch (const std::exception& e) {
    r.status = BatchItemStatus::Failed;
    r.error = ErrorInfo{ErrorKind::Internal, ErrorCode::Internal, e.what()};
    log_error(diag, "Batch: failed " + item.file_path + ": " + describe_error(*r.error));
  }
  return r;
}

BatchSummary run_batch(const std::vector<BatchItem>& items,
                       const std::string& output_dir,
                       const BatchOptions& opts,
                       const CancellationToken* cancel,
                       DiagnosticsChannel* diag) {
  check_output_dir_writable(output_dir);

  BatchSummary summary;
  summary.output_dir = output_dir;
  summary.items.resize(items.size());
  for (size_t i = 0; i < items.size(); ++i) summary.items[i].file_path = items[i].file_path;

  OutputNameRegistry names(output_dir);
  std::atomic<size_t> next{0};
  const size_t n_workers = worker_count(opts.max_workers, items.size());

  {
    std::ostringstream oss;
    oss << "Batch: " << items.size() << " item(s) on " << (items.empty() ? 0 : n_workers)
        << " worker(s) -> " << output_dir;
    log_info(diag, oss.str());
  }

  auto worker = [&]() {
    for (;;) {
      const size_t i = next.fetch_add(1);
      if (i >= items.size()) return;
      // Unstarted items keep the default Cancelled status.
      if (cancel && cancel->cancelled()) continue;
      if (opts.on_item_started) opts.on_item_started(i);
      summary.items[i] = process_batch_item(items[i], &names, opts, diag);
    }
  };

  if (!items.empty()) {
    std::vector<std::thread> pool;
    pool.reserve(n_workers);
    for (size_t w = 0; w < n_workers; ++w) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
  }

  std::vector<RunMetaItem> meta;
  meta.reserve(summary.items.size());
  for (const auto& r : summary.items) {
    switch (r.status) {
      case BatchItemStatus::Succeeded: ++summary.succeeded; break;
      case BatchItemStatus::Failed: ++summary.failed; break;
      case BatchItemStatus::Cancelled: ++summary.cancelled; break;
    }
    RunMetaItem m;
    m.input_path = r.file_path;
    m.status = batch_item_status_name(r.status);
    if (!r.output_path.empty()) m.output = file_name_of(r.output_path);
    m.site_id = r.site_id;
    if (r.status != BatchItemStatus::Cancelled) m.monitor_type = monitor_type_name(r.monitor_type);
    if (r.error) m.error = describe_error(*r.error);
    meta.push_back(std::move(m));
  }

  {
    std::ostringstream oss;
    oss << "Batch: done (" << summary.succeeded << " succeeded, " << summary.failed << " failed, "
        << summary.cancelled << " cancelled)";
    if (summary.failed > 0) {
      log_warn(diag, oss.str());
    } else {
      log_info(diag, oss.str());
    }
  }

  if (opts.write_run_meta) {
    const std::string path = join_path(output_dir, "batch_run_meta.json");
    if (write_run_meta_json(path, opts.tool_name, output_dir, meta)) {
      summary.run_meta_path = path;
    } else {
      log_warn(diag, "Batch: failed to write " + path);
    }
  }

  if (opts.zip_outputs) {
    const std::string path = join_path(output_dir, opts.zip_name);
    const Timestamp now = static_cast<Timestamp>(std::time(nullptr));
    std::vector<ZipEntry> entries;
    for (const auto& r : summary.items) {
      if (r.status != BatchItemStatus::Succeeded || r.output_path.empty()) continue;
      ZipEntry e;
      e.name = file_name_of(r.output_path);
      e.modified = now;
      if (!read_text_file(r.output_path, &e.data)) {
        log_warn(diag, "Batch: cannot read " + r.output_path + " for " + opts.zip_name);
        continue;
      }
      entries.push_back(std::move(e));
    }
    try {
      write_zip_file(path, entries);
      summary.zip_path = path;
      log_info(diag, "Batch: zipped " + std::to_string(entries.size()) + " output(s) to " + path);
    } catch (const Error& e) {
      log_error(diag, "Batch: " + std::string(e.what()));
    }
  }
  return summary;
}

} // namespace fdv
