#include "fdv/channel_rules.hpp"

#include "fdv/utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace fdv {

namespace {

static void replace_all_inplace(std::string* s, const std::string& from, const std::string& to) {
  if (!s || from.empty()) return;
  size_t pos = 0;
  while ((pos = s->find(from, pos)) != std::string::npos) {
    s->replace(pos, from.size(), to);
    pos += to.size();
  }
}

static std::string strip_trailing_separators(std::string s) {
  s = trim(s);
  while (!s.empty()) {
    const char c = s.back();
    if (c == '-' || c == '_' || c == '/' || c == ':') {
      s.pop_back();
      continue;
    }
    break;
  }
  return trim(s);
}

static bool extract_bracket_suffix(const std::string& s, char open, char close,
                                   std::string* base, std::string* inside) {
  const std::string t = trim(s);
  if (t.size() < 3 || t.back() != close) return false;

  const size_t pos_open = t.rfind(open);
  if (pos_open == std::string::npos || pos_open + 1 >= t.size()) return false;

  const std::string in = trim(t.substr(pos_open + 1, t.size() - pos_open - 2));
  const std::string b = trim(t.substr(0, pos_open));
  if (in.empty() || b.empty()) return false;

  *base = b;
  *inside = in;
  return true;
}

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (std::isdigit(c) == 0) return false;
  }
  return true;
}

static std::vector<std::string> split_words(const std::string& lower) {
  std::vector<std::string> words;
  std::string cur;
  for (unsigned char c : lower) {
    if (std::isalnum(c) != 0) {
      cur.push_back(static_cast<char>(c));
    } else if (!cur.empty()) {
      words.push_back(cur);
      cur.clear();
    }
  }
  if (!cur.empty()) words.push_back(cur);
  return words;
}

static bool keyword_matches(const std::string& keyword,
                            const std::string& label_lower,
                            const std::vector<std::string>& words) {
  if (keyword.size() >= 4) return label_lower.find(keyword) != std::string::npos;
  return std::find(words.begin(), words.end(), keyword) != words.end();
}

static std::string join(const std::vector<std::string>& parts, size_t b, size_t e, const char* sep) {
  std::string out;
  for (size_t i = b; i < e; ++i) {
    if (parts[i].empty()) continue;
    if (!out.empty()) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace

const char* monitor_group_name(MonitorGroup g) {
  switch (g) {
    case MonitorGroup::Depth: return "Depth";
    case MonitorGroup::Velocity: return "Velocity";
    case MonitorGroup::Rainfall: return "Rainfall";
    case MonitorGroup::Flow: return "Flow";
    case MonitorGroup::Unclassified: return "Unclassified";
  }
  return "Unclassified";
}

std::string normalize_unit(const std::string& unit) {
  std::string u = trim(unit);
  if (u.empty()) return "";

  replace_all_inplace(&u, u8"³", "3");  // superscript three
  u = to_lower(u);

  std::string t;
  t.reserve(u.size());
  for (unsigned char ch : u) {
    if (std::isspace(ch) == 0 && ch != '^') t.push_back(static_cast<char>(ch));
  }
  replace_all_inplace(&t, "/sec", "/s");
  replace_all_inplace(&t, "/hour", "/hr");

  if (t == "mm" || t == "millimetre" || t == "millimetres" || t == "millimeter" ||
      t == "millimeters") {
    return "mm";
  }
  if (t == "m" || t == "metre" || t == "metres" || t == "meter" || t == "meters") return "m";
  if (t == "m/s" || t == "mps" || t == "ms-1") return "m/s";
  if (t == "mm/s" || t == "mms-1") return "mm/s";
  if (t == "l/s" || t == "lps" || t == "ls-1" || t == "litres/s" || t == "liters/s") return "l/s";
  if (t == "m3/s" || t == "cumecs" || t == "m3s-1") return "m3/s";
  if (t == "mm/hr" || t == "mm/h" || t == "mmhr-1" || t == "mmh-1") return "mm/hr";
  return "";
}

ColumnMetadata parse_column_header(const std::string& header) {
  ColumnMetadata meta;
  const std::string t = trim(strip_utf8_bom(header));
  meta.header = t;
  meta.label = t;
  if (t.empty()) return meta;

  if (t.find('|') != std::string::npos) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : t) {
      if (c == '|') {
        parts.push_back(trim(cur));
        cur.clear();
      } else {
        cur.push_back(c);
      }
    }
    parts.push_back(trim(cur));

    size_t label_begin = 0;
    size_t label_end = parts.size();

    // Leading "<site>_<n>" qualifier.
    if (parts.size() >= 2) {
      const std::string& first = parts[0];
      const size_t us = first.rfind('_');
      if (us != std::string::npos && us > 0 && all_digits(first.substr(us + 1))) {
        meta.qualifier = first.substr(0, us);
        meta.channel_number = first.substr(us + 1);
        label_begin = 1;
      }
    }

    // Trailing unit part.
    if (label_end - label_begin >= 2) {
      const std::string u = normalize_unit(parts.back());
      if (!u.empty()) {
        meta.unit = u;
        --label_end;
      }
    }

    const std::string label = join(parts, label_begin, label_end, " ");
    if (!label.empty()) meta.label = label;
    return meta;
  }

  std::string base;
  std::string inside;
  if (extract_bracket_suffix(t, '(', ')', &base, &inside) ||
      extract_bracket_suffix(t, '[', ']', &base, &inside)) {
    const std::string u = normalize_unit(inside);
    if (!u.empty()) {
      meta.unit = u;
      meta.label = strip_trailing_separators(base);
      if (meta.label.empty()) meta.label = t;
    }
    return meta;
  }

  const size_t pos = t.find_last_of(" \t_-");
  if (pos != std::string::npos && pos > 0 && pos + 1 < t.size()) {
    const std::string u = normalize_unit(t.substr(pos + 1));
    const std::string b = strip_trailing_separators(t.substr(0, pos));
    if (!u.empty() && !b.empty()) {
      meta.unit = u;
      meta.label = b;
    }
  }
  return meta;
}

const std::vector<ChannelRule>& default_channel_rules() {
  static const std::vector<ChannelRule> kRules = {
    {MonitorGroup::Depth, {"depth", "level", "dep", "lvl"}, {"mm", "m"}, 0},
    {MonitorGroup::Velocity, {"velocity", "vel", "speed"}, {"m/s", "mm/s"}, 0},
    {MonitorGroup::Rainfall, {"rainfall", "rain", "precip", "intensity"}, {"mm", "mm/hr"}, 2},
    {MonitorGroup::Flow, {"flow", "discharge"}, {"l/s", "m3/s"}, 1},
  };
  return kRules;
}

ColumnClass classify_column(const ColumnMetadata& meta, const std::vector<ChannelRule>& rules) {
  const std::string label_lower = to_lower(meta.label);
  const std::vector<std::string> words = split_words(label_lower);

  std::map<MonitorGroup, int> best_by_group;
  for (const auto& rule : rules) {
    bool hit = false;
    for (const auto& kw : rule.keywords) {
      if (keyword_matches(kw, label_lower, words)) {
        hit = true;
        break;
      }
    }
    if (!hit) continue;

    int score = 10 + rule.priority;
    if (!meta.unit.empty()) {
      if (std::find(rule.units.begin(), rule.units.end(), meta.unit) == rule.units.end()) {
        continue;
      }
      score += 10;
    }
    int& slot = best_by_group[rule.group];
    slot = std::max(slot, score);
  }

  ColumnClass out;
  for (const auto& kv : best_by_group) {
    if (kv.second > out.score) {
      out.group = kv.first;
      out.score = kv.second;
      out.ambiguous = false;
      out.rival = MonitorGroup::Unclassified;
    } else if (kv.second == out.score && out.score > 0) {
      out.ambiguous = true;
      out.rival = kv.first;
    }
  }
  return out;
}

const std::vector<std::string>& default_timestamp_keywords() {
  static const std::vector<std::string> kKeywords = {
    "timestamp", "time stamp", "datetime", "date", "time",
  };
  return kKeywords;
}

bool is_timestamp_header(const std::string& header, const std::vector<std::string>& keywords) {
  const std::string low = to_lower(trim(header));
  for (const auto& kw : keywords) {
    if (!kw.empty() && low.find(kw) != std::string::npos) return true;
  }
  return false;
}

} // namespace fdv
