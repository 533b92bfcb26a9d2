#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fdv {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Spreadsheet exports written on Windows frequently start with one, which would
// otherwise become part of the first header cell.
std::string strip_utf8_bom(std::string s);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split a single delimited row into fields.
//
// Small, dependency-free RFC-4180 subset:
//  - fields may be quoted with double quotes
//  - delimiters inside quoted fields are preserved
//  - escaped quotes inside quoted fields are written as "" and are unescaped
//  - a stray '\r' outside quotes (CRLF files read with getline) is dropped
//
// Multi-line quoted fields are not supported. Throws std::runtime_error on an
// unterminated quoted field.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

// Count occurrences of delim outside double-quoted sections.
size_t count_delim_outside_quotes(const std::string& s, char delim);

// Strict numeric parsing helpers.
//
// These trim surrounding whitespace and then require that the entire remaining
// string is a valid number. Parsing always uses the classic "C" locale so that
// '.' is the decimal separator regardless of the global locale.
//
// to_double() also accepts a single decimal comma ("0,5") when no '.' is
// present. Both throw std::runtime_error on failure.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Parse a numeric data cell from a logger export.
//
// Returns false for empty cells, missing-value tokens (NaN, NA, null, none,
// "-") and anything that does not parse. When allow_decimal_comma is true the
// European forms "1,25" and "1.234,5" are accepted as well.
bool parse_number_cell(const std::string& s, bool allow_decimal_comma, double* out);

// Format a double with a fixed number of decimals using the classic locale.
std::string format_fixed(double v, int decimals);

// Right-align s in a field of the given width (longer strings are kept whole).
std::string pad_left(const std::string& s, size_t width);

// Replace characters that are unsafe in file names with '_'.
//
// Letters, digits, '-', '_' and '.' are kept; everything else (path
// separators, whitespace, quotes, ...) is replaced. An empty result becomes
// "Unknown".
std::string sanitize_file_stem(const std::string& s);

bool file_exists(const std::string& path);
void ensure_directory(const std::string& path);

// Read an entire file into memory. Returns false when it cannot be opened.
bool read_text_file(const std::string& path, std::string* out);

// Random lowercase hex token of 2*n_bytes characters (used for temp names).
std::string random_hex_token(size_t n_bytes);

// Atomically write a text file by writing to a temporary file in the same
// directory and renaming it into place.
//
// Notes:
// - The temporary file is named "<name>.tmp.<hex>" and lives in the
//   destination directory so that the rename stays on one filesystem.
// - On failure the temporary file is removed and the destination is left
//   untouched; returns false.
// - Missing parent directories are created (best-effort).
bool write_text_file_atomic(const std::string& path, const std::string& content);

// Return a human-readable local timestamp string, e.g.
//   2026-01-15T13:37:42-05:00
std::string now_string_local();

// Return a human-readable UTC timestamp string, e.g.
//   2026-01-15T18:37:42Z
std::string now_string_utc();

// Escape a string for safe inclusion in JSON string values.
std::string json_escape(const std::string& s);

} // namespace fdv
