#include "fdv/session.hpp"

#include "fdv/errors.hpp"
#include "fdv/utils.hpp"

#include <utility>

namespace fdv {

void Session::load(ClassifiedFile file) {
  identity_ = SiteIdentity();
  identity_.site_id = file.site_id;
  identity_.site_name = file.site_name;
  identity_.start_timestamp = file.start_timestamp;
  identity_.end_timestamp = file.end_timestamp;
  file_ = std::move(file);
  log_info(diag_, "Loaded " + file_->source_path + " (site " + identity_.site_id + ")");
}

void Session::reset() {
  file_.reset();
  identity_ = SiteIdentity();
}

void Session::require_file() const {
  if (!file_) {
    throw ValidationError(ErrorCode::NoFileLoaded, "No file is loaded");
  }
}

const ClassifiedFile& Session::file() const {
  require_file();
  return *file_;
}

const SiteIdentity& Session::identity() const {
  require_file();
  return identity_;
}

const SiteIdentity& Session::update_site_id(const std::string& id) {
  require_file();
  const std::string v = trim(id);
  if (v.empty()) throw ValidationError(ErrorCode::EmptyField, "Site id must not be empty");
  identity_.site_id = v;
  file_->site_id = v;
  return identity_;
}

const SiteIdentity& Session::update_site_name(const std::string& name) {
  require_file();
  const std::string v = trim(name);
  if (v.empty()) throw ValidationError(ErrorCode::EmptyField, "Site name must not be empty");
  identity_.site_name = v;
  file_->site_name = v;
  return identity_;
}

const SiteIdentity& Session::update_timestamps(Timestamp start, Timestamp end) {
  require_file();
  if (start > end) {
    throw ValidationError(ErrorCode::InvalidTimeRange,
                          "Start " + format_timestamp(start) + " is after end " + format_timestamp(end));
  }
  const int64_t step = file_->sample_interval_seconds;
  if (step > 0 && static_cast<uint64_t>((end - start) / step) + 1 > kMaxGridPoints) {
    throw ValidationError(ErrorCode::InvalidTimeRange,
                          "Time window " + format_timestamp(start) + " to " + format_timestamp(end) +
                            " is too long for a " + std::to_string(step) + " s sampling interval");
  }
  if (start < file_->data_start || end > file_->data_end) {
    log_warn(diag_, "Time window " + format_timestamp(start) + " to " + format_timestamp(end) +
                    " extends beyond the loaded data (" + format_timestamp(file_->data_start) +
                    " to " + format_timestamp(file_->data_end) + ")");
  }
  identity_.start_timestamp = start;
  identity_.end_timestamp = end;
  file_->start_timestamp = start;
  file_->end_timestamp = end;
  return identity_;
}

const SiteIdentity& Session::update_timestamps(const std::string& start, const std::string& end) {
  require_file();
  Timestamp s = 0;
  Timestamp e = 0;
  if (!parse_canonical_timestamp(start, &s)) {
    throw ValidationError(ErrorCode::InvalidTimestamp, "Invalid start timestamp: '" + start + "'");
  }
  if (!parse_canonical_timestamp(end, &e)) {
    throw ValidationError(ErrorCode::InvalidTimestamp, "Invalid end timestamp: '" + end + "'");
  }
  return update_timestamps(s, e);
}

} // namespace fdv
