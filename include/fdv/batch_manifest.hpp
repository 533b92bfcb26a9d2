#pragma once

#include "fdv/batch.hpp"

#include <string>
#include <vector>

namespace fdv {

// Read a batch manifest: a delimited file with the columns
//
//   filepath,pipeshape,pipesize
//
// pipesize holds one number or a list separated by ';', spaces or ','
// (quote the cell when it contains commas). pipeshape/pipesize may be empty
// for rainfall loggers. Relative file paths resolve against the manifest's
// directory.
//
// Throws FormatError(EmptyOrMalformed) for a missing filepath column,
// GeometryError(InvalidDescriptor) for a bad shape/size (the message names
// the manifest line) and IOError(ReadFailed) when the file cannot be read.
std::vector<BatchItem> read_batch_manifest(const std::string& path);

// Same as above for text already in memory; base_dir resolves relative paths.
std::vector<BatchItem> parse_batch_manifest(const std::string& text, const std::string& base_dir);

} // namespace fdv
