#include "fdv/run_meta.hpp"

#include "fdv/utils.hpp"

#include <cctype>
#include <sstream>
#include <unordered_set>

namespace fdv {

namespace {

static std::string compiler_name() {
#if defined(__clang__)
  return "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__) + "." +
         std::to_string(__clang_patchlevel__);
#elif defined(__GNUC__)
  return "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__) + "." +
         std::to_string(__GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  return "MSVC " + std::to_string(_MSC_VER);
#else
  return "unknown";
#endif
}

static std::string standard_name(long long v) {
  if (v >= 202002L) return "c++20";
  if (v >= 201703L) return "c++17";
  return "c++14";
}

static void skip_ws(const std::string& s, size_t* i) {
  while (*i < s.size() && std::isspace(static_cast<unsigned char>(s[*i])) != 0) ++(*i);
}

// Parse a JSON string starting at s[*i] == '"'. Handles the escapes that
// json_escape() produces (\" \\ \/ \b \f \n \r \t and \u00XX).
static bool parse_json_string(const std::string& s, size_t* i, std::string* out) {
  if (*i >= s.size() || s[*i] != '"') return false;
  ++(*i);
  std::string r;
  while (*i < s.size()) {
    const char c = s[(*i)++];
    if (c == '"') {
      if (out) *out = r;
      return true;
    }
    if (c != '\\') {
      r.push_back(c);
      continue;
    }
    if (*i >= s.size()) return false;
    const char e = s[(*i)++];
    switch (e) {
      case 'b': r.push_back('\b'); break;
      case 'f': r.push_back('\f'); break;
      case 'n': r.push_back('\n'); break;
      case 'r': r.push_back('\r'); break;
      case 't': r.push_back('\t'); break;
      case 'u': {
        if (*i + 4 > s.size()) return false;
        unsigned cp = 0;
        for (size_t k = 0; k < 4; ++k) {
          const char h = s[*i + k];
          cp <<= 4;
          if (h >= '0' && h <= '9') {
            cp |= static_cast<unsigned>(h - '0');
          } else if (h >= 'a' && h <= 'f') {
            cp |= static_cast<unsigned>(10 + h - 'a');
          } else if (h >= 'A' && h <= 'F') {
            cp |= static_cast<unsigned>(10 + h - 'A');
          } else {
            return false;
          }
        }
        *i += 4;
        // Only control characters are escaped this way on output.
        r.push_back(cp < 0x80u ? static_cast<char>(cp) : '?');
        break;
      }
      default: r.push_back(e); break;
    }
  }
  return false;
}

// Value position of a member of the top-level object (depth 1 only; keys
// inside nested objects and string values are ignored).
static bool find_top_level_value(const std::string& s, const std::string& key, size_t* out_pos) {
  int depth = 0;
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"') {
      const size_t tok_start = i;
      std::string tok;
      if (!parse_json_string(s, &i, &tok)) {
        i = tok_start + 1;
        continue;
      }
      if (depth == 1 && tok == key) {
        size_t j = i;
        skip_ws(s, &j);
        if (j < s.size() && s[j] == ':') {
          ++j;
          skip_ws(s, &j);
          *out_pos = j;
          return true;
        }
      }
      continue;
    }
    if (c == '{' || c == '[') {
      ++depth;
    } else if ((c == '}' || c == ']') && depth > 0) {
      --depth;
    }
    ++i;
  }
  return false;
}

static std::string top_level_string(const std::string& s, const std::string& key) {
  size_t pos = 0;
  if (!find_top_level_value(s, key, &pos)) return std::string();
  std::string v;
  if (!parse_json_string(s, &pos, &v)) return std::string();
  return v;
}

static size_t top_level_count(const std::string& s, const std::string& key) {
  size_t pos = 0;
  if (!find_top_level_value(s, key, &pos)) return 0;
  size_t v = 0;
  while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) != 0) {
    v = v * 10 + static_cast<size_t>(s[pos] - '0');
    ++pos;
  }
  return v;
}

static std::vector<std::string> top_level_string_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  size_t i = 0;
  if (!find_top_level_value(s, key, &i)) return out;
  if (i >= s.size() || s[i] != '[') return out;
  ++i;
  while (i < s.size()) {
    skip_ws(s, &i);
    if (i >= s.size() || s[i] == ']') break;
    if (s[i] == ',') {
      ++i;
      continue;
    }
    if (s[i] != '"') {
      while (i < s.size() && s[i] != ',' && s[i] != ']') ++i;
      continue;
    }
    std::string v;
    if (!parse_json_string(s, &i, &v)) break;
    out.push_back(v);
  }
  return out;
}

static void write_string_or_null(std::ostringstream& out, const std::string& s) {
  if (s.empty()) {
    out << "null";
  } else {
    out << "\"" << json_escape(s) << "\"";
  }
}

} // namespace

const BuildInfo& build_info() {
  static const BuildInfo kInfo = []() {
    BuildInfo b;
    b.version = FDV_VERSION_STRING;
#ifdef NDEBUG
    b.build_type = "Release";
#else
    b.build_type = "Debug";
#endif
    b.compiler = compiler_name();
    b.cpp_standard = standard_name(static_cast<long long>(__cplusplus));
    return b;
  }();
  return kInfo;
}

bool normalize_rel_path_safe(const std::string& raw, std::string* out) {
  if (raw.empty() || raw.find('\0') != std::string::npos) return false;
  std::string p = raw;
  for (char& c : p) {
    if (c == '\\') c = '/';
  }
  if (p[0] == '/') return false;
  if (p.size() >= 2 && p[1] == ':') return false;

  std::string seg;
  std::istringstream ss(p);
  while (std::getline(ss, seg, '/')) {
    if (seg == "..") return false;
  }
  if (out) *out = p;
  return true;
}

bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::vector<RunMetaItem>& items) {
  size_t succeeded = 0;
  size_t failed = 0;
  size_t cancelled = 0;
  std::vector<std::string> outputs;
  std::unordered_set<std::string> seen;
  for (const auto& it : items) {
    if (it.status == "Succeeded") ++succeeded;
    else if (it.status == "Failed") ++failed;
    else if (it.status == "Cancelled") ++cancelled;

    std::string norm;
    if (!it.output.empty() && normalize_rel_path_safe(it.output, &norm) && seen.insert(norm).second) {
      outputs.push_back(norm);
    }
  }

  std::ostringstream out;
  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  const BuildInfo& build = build_info();
  out << "  \"FdvVersion\": \"" << json_escape(build.version) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build.build_type) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(build.compiler) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(build.cpp_standard) << "\",\n";
  out << "  \"TimestampLocal\": \"" << json_escape(now_string_local()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(outdir) << "\",\n";

  out << "  \"Outputs\": [";
  for (size_t i = 0; i < outputs.size(); ++i) {
    out << (i == 0 ? "\n" : ",\n") << "    \"" << json_escape(outputs[i]) << "\"";
  }
  out << (outputs.empty() ? "],\n" : "\n  ],\n");

  out << "  \"Succeeded\": " << succeeded << ",\n";
  out << "  \"Failed\": " << failed << ",\n";
  out << "  \"Cancelled\": " << cancelled << ",\n";

  out << "  \"Items\": [";
  for (size_t i = 0; i < items.size(); ++i) {
    const RunMetaItem& it = items[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"Input\": \"" << json_escape(it.input_path) << "\", ";
    out << "\"Status\": \"" << json_escape(it.status) << "\", ";
    out << "\"Output\": ";
    write_string_or_null(out, it.output);
    out << ", \"SiteId\": ";
    write_string_or_null(out, it.site_id);
    out << ", \"MonitorType\": ";
    write_string_or_null(out, it.monitor_type);
    out << ", \"Error\": ";
    write_string_or_null(out, it.error);
    out << "}";
  }
  out << (items.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";

  return write_text_file_atomic(json_path, out.str());
}

RunMetaSummary read_run_meta_summary(const std::string& json_path) {
  RunMetaSummary r;
  std::string s;
  if (!read_text_file(json_path, &s) || s.empty()) return r;

  r.tool = top_level_string(s, "Tool");
  r.version = top_level_string(s, "FdvVersion");
  r.build_type = top_level_string(s, "BuildType");
  r.compiler = top_level_string(s, "Compiler");
  r.cpp_standard = top_level_string(s, "CppStandard");
  r.timestamp_local = top_level_string(s, "TimestampLocal");
  r.timestamp_utc = top_level_string(s, "TimestampUTC");
  r.output_dir = top_level_string(s, "OutputDir");
  for (const auto& o : top_level_string_array(s, "Outputs")) {
    std::string norm;
    if (normalize_rel_path_safe(o, &norm)) r.outputs.push_back(norm);
  }
  r.succeeded = top_level_count(s, "Succeeded");
  r.failed = top_level_count(s, "Failed");
  r.cancelled = top_level_count(s, "Cancelled");
  return r;
}

} // namespace fdv
