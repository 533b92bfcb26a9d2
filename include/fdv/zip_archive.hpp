#pragma once

#include "fdv/timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fdv {

// Earliest time a zip entry can carry (MS-DOS date epoch).
constexpr Timestamp kZipEpoch = 315532800;  // 1980-01-01 00:00:00

struct ZipEntry {
  std::string name;  // '/'-separated path inside the archive
  std::string data;
  Timestamp modified{kZipEpoch};
};

// Builds a PKZIP archive in memory (no zip64, no encryption).
//
// Entries are deflated with zlib unless deflate is false or compression does
// not shrink them, in which case they are stored. Names are flagged UTF-8.
class ZipWriter {
public:
  // Throws ValidationError(InvalidArgument) for an empty or duplicate name,
  // or for data too large for a 32-bit archive.
  void add(const std::string& name, const std::string& data, Timestamp modified = kZipEpoch,
           bool deflate = true);
  void add(const ZipEntry& entry) { add(entry.name, entry.data, entry.modified); }

  size_t size() const { return central_.size(); }

  // Archive bytes. The writer accepts no entries afterwards.
  std::string finish();

private:
  struct CentralRecord {
    std::string name;
    uint16_t method{0};
    uint16_t dos_time{0};
    uint16_t dos_date{0};
    uint32_t crc{0};
    uint32_t compressed_size{0};
    uint32_t size{0};
    uint32_t offset{0};
  };

  std::string out_;
  std::vector<CentralRecord> central_;
  bool finished_{false};
};

// Read-only view of a PKZIP archive held in memory.
//
// Supports stored and deflated entries. Throws FormatError(EmptyOrMalformed)
// when the central directory is missing or damaged and
// FormatError(UnsupportedFormat) for zip64 or encrypted entries.
class ZipReader {
public:
  ZipReader(std::string bytes, std::string source);

  // IOError(ReadFailed) when the file cannot be read.
  static ZipReader open(const std::string& path);

  std::vector<std::string> names() const;
  bool contains(const std::string& name) const;

  // Uncompressed entry data, checked against its CRC-32.
  // FormatError(EmptyOrMalformed) for a missing or corrupt entry.
  std::string read(const std::string& name) const;

private:
  struct Record {
    uint16_t flags{0};
    uint16_t method{0};
    uint32_t crc{0};
    uint32_t compressed_size{0};
    uint32_t size{0};
    uint32_t offset{0};
  };

  std::string bytes_;
  std::string source_;
  std::vector<std::string> order_;
  std::map<std::string, Record> records_;
};

// Write the entries as one archive, atomically.
// Throws IOError(WriteFailed) on failure.
void write_zip_file(const std::string& path, const std::vector<ZipEntry>& entries);

} // namespace fdv
