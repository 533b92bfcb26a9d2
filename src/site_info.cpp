#include "fdv/site_info.hpp"

#include <cctype>
#include <filesystem>

namespace fdv {

namespace {

// [A-Za-z]+[0-9]+
static bool is_letters_then_digits(const std::string& s) {
  size_t i = 0;
  while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i])) != 0) ++i;
  if (i == 0 || i == s.size()) return false;
  for (size_t j = i; j < s.size(); ++j) {
    if (std::isdigit(static_cast<unsigned char>(s[j])) == 0) return false;
  }
  return true;
}

static bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (std::isdigit(c) == 0) return false;
  }
  return true;
}

} // namespace

SiteInfo infer_site_info(const std::string& source_path,
                         const std::vector<ChannelDescriptor>& channels) {
  SiteInfo info;
  const std::string stem = std::filesystem::u8path(source_path).stem().u8string();

  bool have_id = false;
  bool have_name = false;
  if (is_letters_then_digits(stem)) {
    info.site_id = stem;
    info.site_name = stem;
    have_id = true;
    have_name = true;
  } else if (is_digits(stem)) {
    info.site_id = stem;
    have_id = true;
  }

  if (!have_id) {
    for (const auto& ch : channels) {
      if (ch.qualifier && !ch.qualifier->empty()) {
        info.site_id = *ch.qualifier;
        have_id = true;
        break;
      }
    }
  }

  if (have_id && !have_name) info.site_name = info.site_id;
  return info;
}

} // namespace fdv
