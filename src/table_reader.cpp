#include "fdv/table_reader.hpp"

#include "fdv/errors.hpp"
#include "fdv/utils.hpp"
#include "fdv/xlsx_reader.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fdv {

namespace {

static bool is_comment_or_empty(const std::string& t) {
  if (t.empty()) return true;
  if (starts_with(t, "#")) return true;
  if (starts_with(t, "//")) return true;
  return false;
}

static bool has_keyword_cell(const std::vector<std::string>& cells,
                             const std::vector<std::string>& keywords) {
  for (const auto& c : cells) {
    const std::string low = to_lower(trim(c));
    for (const auto& kw : keywords) {
      if (!kw.empty() && low.find(kw) != std::string::npos) return true;
    }
  }
  return false;
}

static size_t count_non_empty(const std::vector<std::string>& cells) {
  size_t n = 0;
  for (const auto& c : cells) {
    if (!trim(c).empty()) ++n;
  }
  return n;
}

struct Line {
  size_t number{0};
  std::string text;
};

} // namespace

char detect_delimiter(const std::string& line) {
  const size_t n_comma = count_delim_outside_quotes(line, ',');
  const size_t n_semi = count_delim_outside_quotes(line, ';');
  const size_t n_tab = count_delim_outside_quotes(line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) {
    best = '\t';
  }
  return best;
}

bool is_xlsx_workbook(const std::string& path) {
  const std::string ext = to_lower(std::filesystem::u8path(path).extension().u8string());
  return ext == ".xlsx" || ext == ".xlsm";
}

bool is_unsupported_spreadsheet(const std::string& path) {
  const std::string ext = to_lower(std::filesystem::u8path(path).extension().u8string());
  return ext == ".xls" || ext == ".ods";
}

RawTable parse_table(const std::string& text,
                     const std::string& source_path,
                     const TableReaderOptions& opts) {
  RawTable table;
  table.source_path = source_path;

  std::vector<Line> lines;
  {
    std::istringstream in(strip_utf8_bom(text));
    std::string raw;
    size_t n = 0;
    while (std::getline(in, raw)) {
      ++n;
      if (!raw.empty() && raw.back() == '\r') raw.pop_back();
      const std::string t = trim(raw);
      if (is_comment_or_empty(t)) continue;
      lines.push_back(Line{n, raw});
    }
  }
  if (lines.empty()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Input is empty: " + source_path);
  }

  // Header: first line with a keyword cell, else the first multi-column line.
  const size_t scan = std::min(lines.size(), opts.max_header_scan_lines);
  size_t header_idx = lines.size();
  size_t fallback_idx = lines.size();
  for (size_t i = 0; i < scan; ++i) {
    const char d = detect_delimiter(lines[i].text);
    std::vector<std::string> cells;
    try {
      cells = split_csv_row(lines[i].text, d);
    } catch (const std::exception&) {
      continue;
    }
    if (count_non_empty(cells) < 2) continue;
    if (fallback_idx == lines.size()) fallback_idx = i;
    if (has_keyword_cell(cells, opts.header_keywords)) {
      header_idx = i;
      break;
    }
  }
  if (header_idx == lines.size()) header_idx = fallback_idx;
  if (header_idx == lines.size()) {
    throw FormatError(ErrorCode::EmptyOrMalformed,
                      "No header row with at least two columns found in: " + source_path);
  }

  table.delimiter = detect_delimiter(lines[header_idx].text);
  table.header_line = lines[header_idx].number;
  for (size_t i = 0; i < header_idx; ++i) table.preamble.push_back(trim(lines[i].text));

  for (const auto& h : split_csv_row(lines[header_idx].text, table.delimiter)) {
    table.headers.push_back(trim(h));
  }
  // Drop trailing empty header cells produced by a trailing delimiter.
  while (!table.headers.empty() && table.headers.back().empty()) table.headers.pop_back();

  for (size_t i = header_idx + 1; i < lines.size(); ++i) {
    std::vector<std::string> cells;
    try {
      cells = split_csv_row(lines[i].text, table.delimiter);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << source_path << ":" << lines[i].number << ": " << e.what();
      throw FormatError(ErrorCode::EmptyOrMalformed, oss.str());
    }
    cells.resize(table.headers.size());
    table.rows.push_back(std::move(cells));
  }
  return table;
}

RawTable table_from_cell_rows(const std::vector<CellRow>& rows,
                              const std::string& source_path,
                              const TableReaderOptions& opts) {
  std::vector<const CellRow*> kept;
  for (const auto& r : rows) {
    if (count_non_empty(r.cells) > 0) kept.push_back(&r);
  }
  if (kept.empty()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Input is empty: " + source_path);
  }

  const size_t scan = std::min(kept.size(), opts.max_header_scan_lines);
  size_t header_idx = kept.size();
  size_t fallback_idx = kept.size();
  for (size_t i = 0; i < scan; ++i) {
    if (count_non_empty(kept[i]->cells) < 2) continue;
    if (fallback_idx == kept.size()) fallback_idx = i;
    if (has_keyword_cell(kept[i]->cells, opts.header_keywords)) {
      header_idx = i;
      break;
    }
  }
  if (header_idx == kept.size()) header_idx = fallback_idx;
  if (header_idx == kept.size()) {
    throw FormatError(ErrorCode::EmptyOrMalformed,
                      "No header row with at least two columns found in: " + source_path);
  }

  RawTable table;
  table.source_path = source_path;
  table.delimiter = ',';
  table.header_line = kept[header_idx]->number;
  for (size_t i = 0; i < header_idx; ++i) {
    const std::vector<std::string>& cells = kept[i]->cells;
    size_t n = cells.size();
    while (n > 0 && trim(cells[n - 1]).empty()) --n;
    std::string line;
    for (size_t c = 0; c < n; ++c) line += (c == 0 ? "" : ",") + cells[c];
    table.preamble.push_back(trim(line));
  }
  for (const auto& h : kept[header_idx]->cells) table.headers.push_back(trim(h));
  while (!table.headers.empty() && table.headers.back().empty()) table.headers.pop_back();

  for (size_t i = header_idx + 1; i < kept.size(); ++i) {
    std::vector<std::string> cells = kept[i]->cells;
    cells.resize(table.headers.size());
    table.rows.push_back(std::move(cells));
  }
  return table;
}

RawTable read_table(const std::string& path, const TableReaderOptions& opts) {
  if (is_xlsx_workbook(path)) return read_xlsx_table(path, opts);
  if (is_unsupported_spreadsheet(path)) {
    throw FormatError(ErrorCode::UnsupportedFormat,
                      "Spreadsheet format not supported; save as .xlsx or CSV first: " + path);
  }
  std::string text;
  if (!read_text_file(path, &text)) {
    throw IOError(ErrorCode::ReadFailed, "Failed to open input file: " + path);
  }
  return parse_table(text, path, opts);
}

} // namespace fdv
