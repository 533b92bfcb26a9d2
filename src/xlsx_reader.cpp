#include "fdv/xlsx_reader.hpp"

#include "fdv/errors.hpp"
#include "fdv/utils.hpp"

#include <cctype>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace fdv {

namespace {

constexpr size_t kMaxColumns = 16384;  // XFD

struct XmlTag {
  std::string name;  // local name, namespace prefix dropped
  std::vector<std::pair<std::string, std::string>> attrs;
  bool closing{false};
  bool self_closing{false};
  size_t end{0};  // one past '>'
};

static std::string local_name(const std::string& qname) {
  const size_t colon = qname.find(':');
  return colon == std::string::npos ? qname : qname.substr(colon + 1);
}

// &lt; &gt; &amp; &quot; &apos; and numeric references.
static std::string xml_unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '&') {
      out.push_back(s[i]);
      continue;
    }
    const size_t semi = s.find(';', i);
    if (semi == std::string::npos) {
      out.push_back(s[i]);
      continue;
    }
    const std::string ent = s.substr(i + 1, semi - i - 1);
    if (ent == "lt") out.push_back('<');
    else if (ent == "gt") out.push_back('>');
    else if (ent == "amp") out.push_back('&');
    else if (ent == "quot") out.push_back('"');
    else if (ent == "apos") out.push_back('\'');
    else if (ent.size() > 1 && ent[0] == '#') {
      unsigned long cp = 0;
      try {
        cp = (ent[1] == 'x' || ent[1] == 'X') ? std::stoul(ent.substr(2), nullptr, 16)
                                              : std::stoul(ent.substr(1), nullptr, 10);
      } catch (const std::exception&) {
        out.append(s, i, semi - i + 1);
        i = semi;
        continue;
      }
      // UTF-8 encode.
      if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
      } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
    } else {
      out.append(s, i, semi - i + 1);
    }
    i = semi;
  }
  return out;
}

// Next element tag at or after *pos. Declarations, comments and processing
// instructions are skipped.
static bool next_tag(const std::string& xml, size_t* pos, XmlTag* tag) {
  while (true) {
    const size_t lt = xml.find('<', *pos);
    if (lt == std::string::npos || lt + 1 >= xml.size()) return false;

    if (xml.compare(lt, 4, "<!--") == 0) {
      const size_t e = xml.find("-->", lt + 4);
      if (e == std::string::npos) return false;
      *pos = e + 3;
      continue;
    }
    if (xml[lt + 1] == '?' || xml[lt + 1] == '!') {
      const size_t e = xml.find('>', lt + 2);
      if (e == std::string::npos) return false;
      *pos = e + 1;
      continue;
    }

    XmlTag t;
    size_t i = lt + 1;
    if (xml[i] == '/') {
      t.closing = true;
      ++i;
    }
    const size_t name_start = i;
    while (i < xml.size() && std::isspace(static_cast<unsigned char>(xml[i])) == 0 && xml[i] != '/' &&
           xml[i] != '>') {
      ++i;
    }
    t.name = local_name(xml.substr(name_start, i - name_start));

    while (i < xml.size()) {
      while (i < xml.size() && std::isspace(static_cast<unsigned char>(xml[i])) != 0) ++i;
      if (i >= xml.size()) return false;
      if (xml[i] == '>') {
        ++i;
        break;
      }
      if (xml[i] == '/') {
        t.self_closing = true;
        ++i;
        continue;
      }
      const size_t key_start = i;
      while (i < xml.size() && xml[i] != '=' && xml[i] != '>' &&
             std::isspace(static_cast<unsigned char>(xml[i])) == 0) {
        ++i;
      }
      std::string key = xml.substr(key_start, i - key_start);
      while (i < xml.size() && std::isspace(static_cast<unsigned char>(xml[i])) != 0) ++i;
      if (i >= xml.size() || xml[i] != '=') continue;
      ++i;
      while (i < xml.size() && std::isspace(static_cast<unsigned char>(xml[i])) != 0) ++i;
      if (i >= xml.size() || (xml[i] != '"' && xml[i] != '\'')) return false;
      const char quote = xml[i++];
      const size_t close = xml.find(quote, i);
      if (close == std::string::npos) return false;
      t.attrs.emplace_back(std::move(key), xml_unescape(xml.substr(i, close - i)));
      i = close + 1;
    }
    t.end = i;
    *pos = i;
    *tag = std::move(t);
    return true;
  }
}

// Attribute by exact name, or by local name when prefixed ("r:id" for "id").
static std::string attr(const XmlTag& tag, const std::string& name) {
  for (const auto& a : tag.attrs) {
    if (a.first == name) return a.second;
  }
  for (const auto& a : tag.attrs) {
    if (local_name(a.first) == name) return a.second;
  }
  return std::string();
}

// Character data from *pos up to the next tag.
static std::string text_until_tag(const std::string& xml, size_t pos) {
  const size_t lt = xml.find('<', pos);
  return xml_unescape(xml.substr(pos, (lt == std::string::npos ? xml.size() : lt) - pos));
}

static std::vector<std::string> read_shared_strings(const ZipReader& zip) {
  std::vector<std::string> out;
  if (!zip.contains("xl/sharedStrings.xml")) return out;
  const std::string xml = zip.read("xl/sharedStrings.xml");

  size_t pos = 0;
  XmlTag tag;
  bool in_si = false;
  int phonetic = 0;  // <rPh> runs are annotations, not cell text
  std::string cur;
  while (next_tag(xml, &pos, &tag)) {
    if (tag.name == "si") {
      if (!tag.closing) {
        in_si = true;
        cur.clear();
        if (tag.self_closing) {
          out.push_back(std::string());
          in_si = false;
        }
      } else {
        out.push_back(cur);
        in_si = false;
      }
    } else if (tag.name == "rPh" && !tag.self_closing) {
      phonetic += tag.closing ? -1 : 1;
    } else if (tag.name == "t" && !tag.closing && !tag.self_closing && in_si && phonetic == 0) {
      cur += text_until_tag(xml, pos);
    }
  }
  return out;
}

static std::string resolve_target(const std::string& target) {
  if (starts_with(target, "/")) return target.substr(1);
  if (starts_with(target, "xl/")) return target;
  return "xl/" + target;
}

// Part name of the first sheet listed in the workbook.
static std::string first_sheet_part(const ZipReader& zip, const std::string& source) {
  std::string rel_id;
  if (zip.contains("xl/workbook.xml")) {
    const std::string xml = zip.read("xl/workbook.xml");
    size_t pos = 0;
    XmlTag tag;
    while (next_tag(xml, &pos, &tag)) {
      if (tag.name == "sheet" && !tag.closing) {
        rel_id = attr(tag, "id");
        break;
      }
    }
  }
  if (!rel_id.empty() && zip.contains("xl/_rels/workbook.xml.rels")) {
    const std::string xml = zip.read("xl/_rels/workbook.xml.rels");
    size_t pos = 0;
    XmlTag tag;
    while (next_tag(xml, &pos, &tag)) {
      if (tag.name == "Relationship" && attr(tag, "Id") == rel_id) {
        const std::string part = resolve_target(attr(tag, "Target"));
        if (zip.contains(part)) return part;
        break;
      }
    }
  }
  if (zip.contains("xl/worksheets/sheet1.xml")) return "xl/worksheets/sheet1.xml";
  throw FormatError(ErrorCode::EmptyOrMalformed, "No worksheet found in workbook: " + source);
}

static std::string cell_text(const std::string& type,
                             const std::string& value,
                             const std::string& inline_text,
                             const std::vector<std::string>& shared,
                             const std::string& source) {
  if (type == "s") {
    const std::string v = trim(value);
    if (v.empty()) return std::string();
    size_t idx = 0;
    try {
      idx = static_cast<size_t>(std::stoul(v));
    } catch (const std::exception&) {
      throw FormatError(ErrorCode::EmptyOrMalformed, "Bad shared string index '" + v + "' in " + source);
    }
    if (idx >= shared.size()) {
      throw FormatError(ErrorCode::EmptyOrMalformed,
                        "Shared string index " + v + " out of range in " + source);
    }
    return shared[idx];
  }
  if (type == "inlineStr") return inline_text;
  if (type == "b") return trim(value) == "1" ? "TRUE" : "FALSE";
  if (type == "e") return std::string();
  return value;
}

} // namespace

bool xlsx_column_index(const std::string& ref, size_t* out) {
  size_t col = 0;
  size_t i = 0;
  while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i])) != 0) {
    col = col * 26 + static_cast<size_t>(std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    if (col > kMaxColumns) return false;
    ++i;
  }
  if (i == 0) return false;
  if (out) *out = col - 1;
  return true;
}

RawTable parse_xlsx_table(const ZipReader& workbook,
                          const std::string& source_path,
                          const TableReaderOptions& opts) {
  const std::vector<std::string> shared = read_shared_strings(workbook);
  const std::string xml = workbook.read(first_sheet_part(workbook, source_path));

  std::vector<CellRow> rows;
  size_t pos = 0;
  XmlTag tag;
  bool in_row = false;
  bool in_cell = false;
  size_t next_col = 0;
  size_t cell_col = 0;
  std::string cell_type;
  std::string cell_value;
  std::string cell_inline;

  auto store_cell = [&]() {
    const std::string text = cell_text(cell_type, cell_value, cell_inline, shared, source_path);
    std::vector<std::string>& cells = rows.back().cells;
    if (cells.size() <= cell_col) cells.resize(cell_col + 1);
    cells[cell_col] = text;
    next_col = cell_col + 1;
  };

  while (next_tag(xml, &pos, &tag)) {
    if (tag.name == "row") {
      if (tag.closing) {
        in_row = false;
        continue;
      }
      CellRow r;
      const std::string n = attr(tag, "r");
      r.number = rows.empty() ? 1 : rows.back().number + 1;
      if (!n.empty()) {
        try {
          r.number = static_cast<size_t>(std::stoul(n));
        } catch (const std::exception&) {
          throw FormatError(ErrorCode::EmptyOrMalformed, "Bad row number '" + n + "' in " + source_path);
        }
      }
      rows.push_back(std::move(r));
      next_col = 0;
      in_row = !tag.self_closing;
    } else if (tag.name == "c" && in_row) {
      if (tag.closing) {
        if (in_cell) store_cell();
        in_cell = false;
        continue;
      }
      const std::string ref = attr(tag, "r");
      cell_col = next_col;
      if (!ref.empty() && !xlsx_column_index(ref, &cell_col)) {
        throw FormatError(ErrorCode::EmptyOrMalformed, "Bad cell reference '" + ref + "' in " + source_path);
      }
      cell_type = attr(tag, "t");
      cell_value.clear();
      cell_inline.clear();
      in_cell = true;
      if (tag.self_closing) {
        store_cell();
        in_cell = false;
      }
    } else if (in_cell && !tag.closing && !tag.self_closing) {
      if (tag.name == "v") {
        cell_value = text_until_tag(xml, pos);
      } else if (tag.name == "t") {
        cell_inline += text_until_tag(xml, pos);
      }
    }
  }
  if (rows.empty()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Worksheet has no rows: " + source_path);
  }
  return table_from_cell_rows(rows, source_path, opts);
}

RawTable read_xlsx_table(const std::string& path, const TableReaderOptions& opts) {
  const ZipReader zip = ZipReader::open(path);
  return parse_xlsx_table(zip, path, opts);
}

} // namespace fdv
