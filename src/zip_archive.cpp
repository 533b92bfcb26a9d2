#include "fdv/zip_archive.hpp"

#include "fdv/errors.hpp"
#include "fdv/utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace fdv {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralSig = 0x06054b50;
constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralSize = 22;

static void put_u16(std::string* out, uint16_t v) {
  out->push_back(static_cast<char>(v & 0xff));
  out->push_back(static_cast<char>((v >> 8) & 0xff));
}

static void put_u32(std::string* out, uint32_t v) {
  put_u16(out, static_cast<uint16_t>(v & 0xffff));
  put_u16(out, static_cast<uint16_t>((v >> 16) & 0xffff));
}

static uint16_t get_u16(const std::string& s, size_t pos) {
  return static_cast<uint16_t>(static_cast<unsigned char>(s[pos]) |
                               (static_cast<unsigned char>(s[pos + 1]) << 8));
}

static uint32_t get_u32(const std::string& s, size_t pos) {
  return static_cast<uint32_t>(get_u16(s, pos)) | (static_cast<uint32_t>(get_u16(s, pos + 2)) << 16);
}

static uint32_t crc32_of(const std::string& data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  size_t pos = 0;
  while (pos < data.size()) {
    const size_t n = std::min<size_t>(data.size() - pos, std::numeric_limits<uInt>::max());
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data() + pos), static_cast<uInt>(n));
    pos += n;
  }
  return static_cast<uint32_t>(crc);
}

// Raw deflate stream (no zlib header), as stored in zip entries.
static std::string deflate_raw(const std::string& data) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("zlib deflateInit2 failed");
  }
  std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());
  const int rc = deflate(&zs, Z_FINISH);
  const uLong produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error("zlib deflate failed (" + std::to_string(rc) + ")");
  }
  out.resize(produced);
  return out;
}

static bool inflate_raw(const char* data, size_t n, size_t expected, std::string* out) {
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) return false;
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  zs.avail_in = static_cast<uInt>(n);
  // One spare byte so an overlong stream shows up as Z_OK instead of Z_STREAM_END.
  std::string buf(expected + 1, '\0');
  zs.next_out = reinterpret_cast<Bytef*>(&buf[0]);
  zs.avail_out = static_cast<uInt>(buf.size());
  const int rc = inflate(&zs, Z_FINISH);
  const uLong produced = zs.total_out;
  inflateEnd(&zs);
  if (rc != Z_STREAM_END || produced != expected) return false;
  out->assign(buf.data(), expected);
  return true;
}

static void dos_date_time(Timestamp ts, uint16_t* date, uint16_t* time) {
  const CivilTime c = to_civil(std::max(ts, kZipEpoch));
  const int year = std::min(c.year, 2107);
  *date = static_cast<uint16_t>(((year - 1980) << 9) | (c.month << 5) | c.day);
  *time = static_cast<uint16_t>((c.hour << 11) | (c.minute << 5) | (c.second / 2));
}

} // namespace

void ZipWriter::add(const std::string& name, const std::string& data, Timestamp modified, bool deflate) {
  if (finished_) {
    throw std::runtime_error("ZipWriter::add called after finish()");
  }
  if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
    throw ValidationError(ErrorCode::InvalidArgument, "Invalid zip entry name: '" + name + "'");
  }
  for (const auto& c : central_) {
    if (c.name == name) {
      throw ValidationError(ErrorCode::InvalidArgument, "Duplicate zip entry: " + name);
    }
  }
  const uint64_t limit = std::numeric_limits<uint32_t>::max();
  if (data.size() >= limit || out_.size() + data.size() >= limit) {
    throw ValidationError(ErrorCode::InvalidArgument, "Zip entry too large: " + name);
  }

  CentralRecord rec;
  rec.name = name;
  rec.crc = crc32_of(data);
  rec.size = static_cast<uint32_t>(data.size());
  rec.offset = static_cast<uint32_t>(out_.size());
  dos_date_time(modified, &rec.dos_date, &rec.dos_time);

  std::string packed;
  if (deflate && !data.empty()) packed = deflate_raw(data);
  const bool stored = packed.empty() || packed.size() >= data.size();
  rec.method = stored ? kMethodStored : kMethodDeflated;
  const std::string& payload = stored ? data : packed;
  rec.compressed_size = static_cast<uint32_t>(payload.size());

  put_u32(&out_, kLocalHeaderSig);
  put_u16(&out_, kVersionNeeded);
  put_u16(&out_, kFlagUtf8);
  put_u16(&out_, rec.method);
  put_u16(&out_, rec.dos_time);
  put_u16(&out_, rec.dos_date);
  put_u32(&out_, rec.crc);
  put_u32(&out_, rec.compressed_size);
  put_u32(&out_, rec.size);
  put_u16(&out_, static_cast<uint16_t>(name.size()));
  put_u16(&out_, 0);  // extra field
  out_ += name;
  out_ += payload;

  central_.push_back(std::move(rec));
}

std::string ZipWriter::finish() {
  if (finished_) {
    throw std::runtime_error("ZipWriter::finish called twice");
  }
  if (central_.size() > std::numeric_limits<uint16_t>::max()) {
    throw ValidationError(ErrorCode::InvalidArgument, "Too many zip entries");
  }
  finished_ = true;

  const uint32_t cd_offset = static_cast<uint32_t>(out_.size());
  for (const auto& rec : central_) {
    put_u32(&out_, kCentralHeaderSig);
    put_u16(&out_, kVersionNeeded);  // made by
    put_u16(&out_, kVersionNeeded);
    put_u16(&out_, kFlagUtf8);
    put_u16(&out_, rec.method);
    put_u16(&out_, rec.dos_time);
    put_u16(&out_, rec.dos_date);
    put_u32(&out_, rec.crc);
    put_u32(&out_, rec.compressed_size);
    put_u32(&out_, rec.size);
    put_u16(&out_, static_cast<uint16_t>(rec.name.size()));
    put_u16(&out_, 0);  // extra field
    put_u16(&out_, 0);  // comment
    put_u16(&out_, 0);  // disk number
    put_u16(&out_, 0);  // internal attributes
    put_u32(&out_, 0);  // external attributes
    put_u32(&out_, rec.offset);
    out_ += rec.name;
  }
  const uint32_t cd_size = static_cast<uint32_t>(out_.size()) - cd_offset;
  const uint16_t n = static_cast<uint16_t>(central_.size());

  put_u32(&out_, kEndOfCentralSig);
  put_u16(&out_, 0);
  put_u16(&out_, 0);
  put_u16(&out_, n);
  put_u16(&out_, n);
  put_u32(&out_, cd_size);
  put_u32(&out_, cd_offset);
  put_u16(&out_, 0);  // comment

  return std::move(out_);
}

ZipReader::ZipReader(std::string bytes, std::string source)
  : bytes_(std::move(bytes)), source_(std::move(source)) {
  const std::string& s = bytes_;
  if (s.size() < kEndOfCentralSize) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Not a zip archive: " + source_);
  }

  // The end record sits in the last 22 bytes plus an optional comment.
  size_t eocd = std::string::npos;
  const size_t lowest = s.size() > kEndOfCentralSize + 0xffff ? s.size() - kEndOfCentralSize - 0xffff : 0;
  for (size_t pos = s.size() - kEndOfCentralSize + 1; pos-- > lowest;) {
    if (get_u32(s, pos) == kEndOfCentralSig) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Not a zip archive: " + source_);
  }

  const uint16_t n_entries = get_u16(s, eocd + 10);
  const uint32_t cd_size = get_u32(s, eocd + 12);
  const uint32_t cd_offset = get_u32(s, eocd + 16);
  if (cd_offset == 0xffffffffu || n_entries == 0xffff) {
    throw FormatError(ErrorCode::UnsupportedFormat, "Zip64 archives are not supported: " + source_);
  }
  if (static_cast<uint64_t>(cd_offset) + cd_size > eocd) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Damaged zip central directory: " + source_);
  }

  size_t pos = cd_offset;
  for (uint16_t i = 0; i < n_entries; ++i) {
    if (pos + kCentralHeaderSize > eocd || get_u32(s, pos) != kCentralHeaderSig) {
      throw FormatError(ErrorCode::EmptyOrMalformed, "Damaged zip central directory: " + source_);
    }
    Record rec;
    rec.flags = get_u16(s, pos + 8);
    rec.method = get_u16(s, pos + 10);
    rec.crc = get_u32(s, pos + 16);
    rec.compressed_size = get_u32(s, pos + 20);
    rec.size = get_u32(s, pos + 24);
    const size_t name_len = get_u16(s, pos + 28);
    const size_t extra_len = get_u16(s, pos + 30);
    const size_t comment_len = get_u16(s, pos + 32);
    rec.offset = get_u32(s, pos + 42);
    if (pos + kCentralHeaderSize + name_len > eocd) {
      throw FormatError(ErrorCode::EmptyOrMalformed, "Damaged zip central directory: " + source_);
    }
    std::string name = s.substr(pos + kCentralHeaderSize, name_len);
    pos += kCentralHeaderSize + name_len + extra_len + comment_len;

    if (records_.emplace(name, rec).second) order_.push_back(std::move(name));
  }
}

ZipReader ZipReader::open(const std::string& path) {
  std::string bytes;
  if (!read_text_file(path, &bytes)) {
    throw IOError(ErrorCode::ReadFailed, "Failed to open input file: " + path);
  }
  return ZipReader(std::move(bytes), path);
}

std::vector<std::string> ZipReader::names() const {
  return order_;
}

bool ZipReader::contains(const std::string& name) const {
  return records_.count(name) != 0;
}

std::string ZipReader::read(const std::string& name) const {
  const auto it = records_.find(name);
  if (it == records_.end()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Missing zip entry '" + name + "' in " + source_);
  }
  const Record& rec = it->second;
  if ((rec.flags & kFlagEncrypted) != 0) {
    throw FormatError(ErrorCode::UnsupportedFormat, "Encrypted zip entry '" + name + "' in " + source_);
  }
  if (rec.size == 0xffffffffu || rec.compressed_size == 0xffffffffu) {
    throw FormatError(ErrorCode::UnsupportedFormat, "Zip64 entry '" + name + "' in " + source_);
  }

  const std::string& s = bytes_;
  const size_t off = rec.offset;
  if (off + kLocalHeaderSize > s.size() || get_u32(s, off) != kLocalHeaderSig) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Damaged zip entry '" + name + "' in " + source_);
  }
  const size_t data_start = off + kLocalHeaderSize + get_u16(s, off + 26) + get_u16(s, off + 28);
  if (data_start + rec.compressed_size > s.size()) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Truncated zip entry '" + name + "' in " + source_);
  }

  std::string out;
  if (rec.method == kMethodStored) {
    out = s.substr(data_start, rec.compressed_size);
  } else if (rec.method == kMethodDeflated) {
    if (!inflate_raw(s.data() + data_start, rec.compressed_size, rec.size, &out)) {
      throw FormatError(ErrorCode::EmptyOrMalformed, "Corrupt zip entry '" + name + "' in " + source_);
    }
  } else {
    throw FormatError(ErrorCode::UnsupportedFormat,
                      "Zip compression method " + std::to_string(rec.method) + " for '" + name + "' in " +
                        source_);
  }
  if (out.size() != rec.size || crc32_of(out) != rec.crc) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "CRC mismatch for zip entry '" + name + "' in " + source_);
  }
  return out;
}

void write_zip_file(const std::string& path, const std::vector<ZipEntry>& entries) {
  ZipWriter zip;
  for (const auto& e : entries) zip.add(e);
  if (!write_text_file_atomic(path, zip.finish())) {
    throw IOError(ErrorCode::WriteFailed, "Failed to write zip archive: " + path);
  }
}

} // namespace fdv
