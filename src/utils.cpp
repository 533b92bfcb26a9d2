#include "fdv/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fdv {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  if (s.size() >= 3) {
    const unsigned char b0 = static_cast<unsigned char>(s[0]);
    const unsigned char b1 = static_cast<unsigned char>(s[1]);
    const unsigned char b2 = static_cast<unsigned char>(s[2]);
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return s.substr(3);
    }
  }
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> out;
  std::string field;
  field.reserve(row.size());

  bool in_quotes = false;
  bool after_closing_quote = false;

  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];

    if (!in_quotes && c == '\r') continue;

    if (in_quotes) {
      if (c == '"') {
        if ((i + 1) < row.size() && row[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
          after_closing_quote = true;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (after_closing_quote) {
      // Tolerate whitespace between a closing quote and the delimiter.
      if (c == delim) {
        out.push_back(field);
        field.clear();
        after_closing_quote = false;
        continue;
      }
      if (is_space(c)) continue;
      after_closing_quote = false;
      field.push_back(c);
      continue;
    }

    if (c == delim) {
      out.push_back(field);
      field.clear();
      continue;
    }

    if (c == '"' && trim(field).empty()) {
      field.clear();
      in_quotes = true;
      continue;
    }

    field.push_back(c);
  }

  if (in_quotes) {
    throw std::runtime_error("split_csv_row: unterminated quoted field");
  }

  out.push_back(field);
  return out;
}

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

namespace {

static bool parse_classic(const std::string& x, double* out) {
  if (!out || x.empty()) return false;
  std::istringstream iss(x);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) return false;
  // Allow trailing whitespace, but reject any other trailing characters.
  iss >> std::ws;
  if (!iss.eof()) return false;
  *out = v;
  return true;
}

} // namespace

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    const int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  const std::string t = trim(s);
  double v = 0.0;
  if (parse_classic(t, &v)) return v;

  if (t.find('.') == std::string::npos) {
    const size_t cpos = t.find(',');
    if (cpos != std::string::npos && t.find(',', cpos + 1) == std::string::npos) {
      std::string tc = t;
      tc[cpos] = '.';
      if (parse_classic(tc, &v)) return v;
    }
  }
  throw std::runtime_error("Failed to parse double from '" + s + "'");
}

bool parse_number_cell(const std::string& s, bool allow_decimal_comma, double* out) {
  if (!out) return false;
  const std::string t = trim(s);
  if (t.empty()) return false;

  const std::string low = to_lower(t);
  if (low == "nan" || low == "na" || low == "n/a" || low == "null" || low == "none" ||
      low == "-" || low == "--") {
    return false;
  }

  double v = 0.0;
  if (parse_classic(t, &v)) {
    *out = v;
    return true;
  }
  if (!allow_decimal_comma) return false;

  const size_t last_comma = t.rfind(',');
  if (last_comma == std::string::npos) return false;
  std::string u = t;
  if (t.find('.') == std::string::npos) {
    // Simple decimal comma: 1,23 -> 1.23 (exactly one comma only).
    if (t.find(',') != last_comma) return false;
    u[last_comma] = '.';
  } else {
    // Thousands dot + decimal comma: 1.234,56 -> 1234.56
    const size_t last_dot = t.rfind('.');
    if (last_comma < last_dot) return false;
    u.erase(std::remove(u.begin(), u.end(), '.'), u.end());
    std::replace(u.begin(), u.end(), ',', '.');
  }
  if (!parse_classic(u, &v)) return false;
  *out = v;
  return true;
}

std::string format_fixed(double v, int decimals) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(decimals) << v;
  std::string s = oss.str();
  // Avoid "-0.00" for values that round to zero.
  if (!s.empty() && s[0] == '-' && s.find_first_not_of("-0.") == std::string::npos) {
    s.erase(0, 1);
  }
  return s;
}

std::string pad_left(const std::string& s, size_t width) {
  if (s.size() >= width) return s;
  return std::string(width - s.size(), ' ') + s;
}

std::string sanitize_file_stem(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : trim(s)) {
    if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('_');
    }
  }
  // Leading dots would produce hidden files or "." / ".." names.
  for (size_t i = 0; i < out.size() && out[i] == '.'; ++i) out[i] = '_';
  if (out.empty()) return "Unknown";
  return out;
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::u8path(path), ec);
}

void ensure_directory(const std::string& path) {
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

bool read_text_file(const std::string& path, std::string* out) {
  if (!out) return false;
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) return false;
  *out = oss.str();
  return true;
}

std::string random_hex_token(size_t n_bytes) {
  if (n_bytes == 0) n_bytes = 16;
  static const char* kHex = "0123456789abcdef";

  std::random_device rd;

  std::string out;
  out.reserve(n_bytes * 2);

  size_t produced = 0;
  while (produced < n_bytes) {
    const std::random_device::result_type r = rd();
    for (size_t k = 0; k < sizeof(r) && produced < n_bytes; ++k) {
      const unsigned char b = static_cast<unsigned char>((r >> (8 * k)) & 0xFFu);
      out.push_back(kHex[(b >> 4) & 0x0F]);
      out.push_back(kHex[b & 0x0F]);
      ++produced;
    }
  }
  return out;
}

namespace {

static std::filesystem::path make_tmp_path_same_dir(const std::filesystem::path& target) {
  const std::filesystem::path dir = target.has_parent_path() ? target.parent_path()
                                                             : std::filesystem::path();
  const std::string name = target.filename().u8string() + ".tmp." + random_hex_token(8);
  return dir.empty() ? std::filesystem::u8path(name)
                     : (dir / std::filesystem::u8path(name));
}

} // namespace

bool write_text_file_atomic(const std::string& path, const std::string& content) {
  const std::filesystem::path target = std::filesystem::u8path(path);

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
  }

  std::filesystem::path tmp = make_tmp_path_same_dir(target);
  for (int attempt = 0; attempt < 10; ++attempt) {
    if (!std::filesystem::exists(tmp, ec)) break;
    tmp = make_tmp_path_same_dir(target);
  }

  {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    if (!content.empty()) out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    out.close();
    if (!out) {
      std::error_code rm_ec;
      std::filesystem::remove(tmp, rm_ec);
      return false;
    }
  }

  ec.clear();
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(target, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
  }

  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

namespace {

static bool localtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && localtime_s(out, &t) == 0;
#else
  return out && localtime_r(&t, out) != nullptr;
#endif
}

static bool gmtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && gmtime_s(out, &t) == 0;
#else
  return out && gmtime_r(&t, out) != nullptr;
#endif
}

static long utc_offset_seconds(std::time_t t) {
  std::tm local_tm{};
  std::tm gm_tm{};
  if (!localtime_safe(t, &local_tm) || !gmtime_safe(t, &gm_tm)) return 0;

  // mktime() treats its input as local time, so converting both broken-down
  // forms yields the local offset for this instant (DST included).
  std::tm gm_as_local = gm_tm;
  gm_as_local.tm_isdst = -1;

  const std::time_t local_tt = std::mktime(&local_tm);
  const std::time_t gm_local_tt = std::mktime(&gm_as_local);
  if (local_tt == static_cast<std::time_t>(-1) || gm_local_tt == static_cast<std::time_t>(-1)) {
    return 0;
  }
  return static_cast<long>(std::difftime(local_tt, gm_local_tt));
}

static std::string format_utc_offset(long offset_seconds) {
  char sign = '+';
  if (offset_seconds < 0) {
    sign = '-';
    offset_seconds = -offset_seconds;
  }
  const long total_minutes = offset_seconds / 60;
  std::ostringstream oss;
  oss << sign << std::setw(2) << std::setfill('0') << (total_minutes / 60) << ":"
      << std::setw(2) << std::setfill('0') << (total_minutes % 60);
  return oss.str();
}

} // namespace

std::string now_string_local() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!localtime_safe(t, &tm)) return now_string_utc();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << format_utc_offset(utc_offset_seconds(t));
  return oss.str();
}

std::string now_string_utc() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!gmtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  for (unsigned char uc : s) {
    const char c = static_cast<char>(uc);
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (uc < 0x20) {
          oss << "\\u" << std::setw(4) << std::setfill('0') << static_cast<int>(uc);
          oss << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

} // namespace fdv
