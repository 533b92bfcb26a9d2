#pragma once

#include "fdv/table_reader.hpp"
#include "fdv/zip_archive.hpp"

#include <cstddef>
#include <string>

namespace fdv {

// Zero-based column of an A1-style cell reference ("B7" -> 1, "AA1" -> 26).
// Returns false when ref does not start with column letters.
bool xlsx_column_index(const std::string& ref, size_t* out);

// First worksheet of an Office Open XML workbook as a RawTable.
//
// Cells are taken as stored: shared and inline strings as text, numbers as
// written in the sheet (dates therefore arrive as Excel serial numbers),
// booleans as TRUE/FALSE and error cells as blanks. Header detection is the
// same as for delimited text.
//
// This reads the small subset of SpreadsheetML that logger exports use; it
// is not a general XML parser. Throws FormatError(EmptyOrMalformed) for a
// workbook without a readable worksheet.
RawTable parse_xlsx_table(const ZipReader& workbook,
                          const std::string& source_path,
                          const TableReaderOptions& opts);

// IOError(ReadFailed) when the file cannot be read.
RawTable read_xlsx_table(const std::string& path, const TableReaderOptions& opts);

} // namespace fdv
