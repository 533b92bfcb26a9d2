#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fdv {

// A delimited logger export as read from disk, before any typing.
struct RawTable {
  std::string source_path;
  char delimiter{','};
  size_t header_line{0};                       // 1-based physical line of the header
  std::vector<std::string> headers;            // trimmed header cells
  std::vector<std::vector<std::string>> rows;  // data rows, padded to headers.size()
  std::vector<std::string> preamble;           // metadata lines before the header

  size_t n_columns() const { return headers.size(); }
  size_t n_rows() const { return rows.size(); }
};

struct TableReaderOptions {
  // Lowercase keywords that mark the header row (any cell containing one).
  // When no line contains a keyword the first multi-column line is used.
  std::vector<std::string> header_keywords;

  // Only this many leading lines are searched for the header.
  size_t max_header_scan_lines{200};
};

// Pick ',', ';' or TAB by counting delimiters outside quotes (ties prefer ',').
char detect_delimiter(const std::string& line);

// True for Office Open XML workbooks (.xlsx, .xlsm), read by read_xlsx_table().
bool is_xlsx_workbook(const std::string& path);

// True for binary spreadsheet formats this library cannot read (.xls, .ods).
bool is_unsupported_spreadsheet(const std::string& path);

// Parse delimited text already in memory.
//
// Blank lines and comment lines ('#' or '//') are skipped. Lines before the
// header are kept in preamble. Throws FormatError(EmptyOrMalformed) when no
// header row can be found or a row has an unterminated quote.
RawTable parse_table(const std::string& text,
                     const std::string& source_path,
                     const TableReaderOptions& opts);

// A row already split into cells (spreadsheet sources).
struct CellRow {
  size_t number{0};  // 1-based row number in the sheet
  std::vector<std::string> cells;
};

// Build a table from pre-split rows with the same header detection as
// parse_table(). Rows without any non-blank cell are skipped; preamble rows
// are kept as their cells joined by ','.
RawTable table_from_cell_rows(const std::vector<CellRow>& rows,
                              const std::string& source_path,
                              const TableReaderOptions& opts);

// Read and parse a file. Workbooks (.xlsx, .xlsm) go through
// read_xlsx_table(); everything else is read as delimited text.
//
// Throws FormatError(UnsupportedFormat) for .xls/.ods and
// IOError(ReadFailed) when the file cannot be opened.
RawTable read_table(const std::string& path, const TableReaderOptions& opts);

} // namespace fdv
