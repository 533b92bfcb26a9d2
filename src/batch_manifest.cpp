#include "fdv/batch_manifest.hpp"

#include "fdv/errors.hpp"
#include "fdv/table_reader.hpp"
#include "fdv/utils.hpp"

#include <cctype>
#include <filesystem>

namespace fdv {

namespace {

constexpr size_t kNoColumn = static_cast<size_t>(-1);

static std::string column_key(const std::string& header) {
  std::string k;
  for (unsigned char c : to_lower(header)) {
    if (std::isalnum(c) != 0) k.push_back(static_cast<char>(c));
  }
  return k;
}

static size_t find_column(const RawTable& t, const std::vector<std::string>& names) {
  for (size_t c = 0; c < t.headers.size(); ++c) {
    const std::string k = column_key(t.headers[c]);
    for (const auto& n : names) {
      if (k == n) return c;
    }
  }
  return kNoColumn;
}

static std::string resolve_path(const std::string& p, const std::string& base_dir) {
  const std::filesystem::path fp = std::filesystem::u8path(p);
  if (fp.is_absolute() || base_dir.empty()) return p;
  return (std::filesystem::u8path(base_dir) / fp).lexically_normal().u8string();
}

} // namespace

std::vector<BatchItem> parse_batch_manifest(const std::string& text, const std::string& base_dir) {
  TableReaderOptions ropts;
  ropts.header_keywords = {"filepath", "file_path", "file path"};
  const RawTable t = parse_table(text, "batch manifest", ropts);

  const size_t c_path = find_column(t, {"filepath", "file", "path"});
  const size_t c_shape = find_column(t, {"pipeshape", "shape"});
  const size_t c_size = find_column(t, {"pipesize", "size", "dimensions"});
  if (c_path == kNoColumn) {
    throw FormatError(ErrorCode::EmptyOrMalformed, "Batch manifest has no 'filepath' column");
  }

  std::vector<BatchItem> items;
  for (size_t r = 0; r < t.rows.size(); ++r) {
    const auto& row = t.rows[r];
    const std::string path = trim(row[c_path]);
    if (path.empty()) continue;

    BatchItem item;
    item.file_path = resolve_path(path, base_dir);

    const std::string shape = c_shape == kNoColumn ? std::string() : trim(row[c_shape]);
    const std::string size = c_size == kNoColumn ? std::string() : trim(row[c_size]);
    if (!shape.empty() || !size.empty()) {
      try {
        item.geometry = make_geometry(shape, parse_dimension_list(size));
      } catch (const GeometryError& e) {
        throw GeometryError(e.code(), "Batch manifest row " + std::to_string(r + 1) + " (" + path +
                                      "): " + e.what());
      }
    }
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<BatchItem> read_batch_manifest(const std::string& path) {
  std::string text;
  if (!read_text_file(path, &text)) {
    throw IOError(ErrorCode::ReadFailed, "Failed to read batch manifest: " + path);
  }
  const std::string dir = std::filesystem::u8path(path).parent_path().u8string();
  return parse_batch_manifest(text, dir);
}

} // namespace fdv
