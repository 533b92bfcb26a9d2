#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fdv {

// How this build of the library was made; recorded in run metadata and
// printed by the tools' --version.
struct BuildInfo {
  std::string version;       // project(VERSION) from CMake
  std::string build_type;    // Release / Debug (from NDEBUG)
  std::string compiler;      // e.g. "GCC 12.2.0"
  std::string cpp_standard;  // e.g. "c++17"
};

const BuildInfo& build_info();

// One processed input as recorded in batch_run_meta.json.
struct RunMetaItem {
  std::string input_path;
  std::string status;        // Succeeded / Failed / Cancelled
  std::string output;        // relative to OutputDir; empty when none
  std::string site_id;
  std::string monitor_type;
  std::string error;         // "Kind/Code: message"; empty on success
};

// Write a batch run summary (lightweight JSON emitter, no JSON dependency).
//
// Keys written (top-level):
//   - Tool
//   - FdvVersion
//   - BuildType
//   - Compiler
//   - CppStandard
//   - TimestampLocal
//   - TimestampUTC
//   - OutputDir
//   - Outputs (array of relative paths, de-duplicated, unsafe entries dropped)
//   - Succeeded / Failed / Cancelled (counts)
//   - Items (array of objects: Input, Status, Output, SiteId, MonitorType, Error)
//
// The file is written atomically. Returns false on write failure.
bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::vector<RunMetaItem>& items);

// Summary fields read back from a file written by write_run_meta_json.
//
// This is a minimal reader for files emitted by this project, not a general
// JSON parser. Missing keys stay empty / zero.
struct RunMetaSummary {
  std::string tool;
  std::string version;
  std::string build_type;
  std::string compiler;
  std::string cpp_standard;
  std::string timestamp_local;
  std::string timestamp_utc;
  std::string output_dir;
  std::vector<std::string> outputs;
  size_t succeeded{0};
  size_t failed{0};
  size_t cancelled{0};
};

RunMetaSummary read_run_meta_summary(const std::string& json_path);

// True for a relative path without "..", drive prefixes or a leading '/'.
// Backslashes are normalized to '/' in *out.
bool normalize_rel_path_safe(const std::string& raw, std::string* out);

} // namespace fdv
