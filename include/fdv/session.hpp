#pragma once

#include "fdv/diagnostics.hpp"
#include "fdv/types.hpp"

#include <optional>
#include <string>

namespace fdv {

// Owner of the currently loaded file and its site identity.
//
// A Session holds at most one ClassifiedFile. The SiteIdentity is created from
// the file on load and afterwards changes only through the update_* methods,
// which keep the file's mirrored fields (site id/name, start/end) in sync.
//
// Not thread-safe; the owner serializes access.
class Session {
public:
  explicit Session(DiagnosticsChannel* diag = nullptr) : diag_(diag) {}

  // Replace all state with a freshly classified file.
  void load(ClassifiedFile file);

  // Discard the file and identity.
  void reset();

  bool has_file() const { return file_.has_value(); }

  // Throw ValidationError(NoFileLoaded) when nothing is loaded.
  const ClassifiedFile& file() const;
  const SiteIdentity& identity() const;

  // Non-empty (after trimming) value required: ValidationError(EmptyField).
  const SiteIdentity& update_site_id(const std::string& id);
  const SiteIdentity& update_site_name(const std::string& name);

  // Requires start <= end (ValidationError(InvalidTimeRange)). Bounds outside
  // the loaded data are stored anyway and reported as a warning.
  const SiteIdentity& update_timestamps(Timestamp start, Timestamp end);

  // Text form: "YYYY-MM-DD HH:MM:SS" (a 'T' separator and missing seconds are
  // accepted). Unparseable text: ValidationError(InvalidTimestamp).
  const SiteIdentity& update_timestamps(const std::string& start, const std::string& end);

private:
  void require_file() const;

  DiagnosticsChannel* diag_{nullptr};
  std::optional<ClassifiedFile> file_;
  SiteIdentity identity_;
};

} // namespace fdv
