#include "fdv/batch_manifest.hpp"
#include "fdv/errors.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace fdv;
using fdv_test::approx;

template <class F>
static bool throws_code(F&& fn, ErrorCode code) {
  try {
    fn();
  } catch (const Error& e) {
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    // Columns, quoting and relative paths.
    {
      const std::string text =
        "FilePath,Pipe Shape,Pipe Size\n"
        "S1.csv,Circular,600\n"
        "sub/S2.csv,Egg Type 1,\"1000,1500\"\n"
        "R1.csv,,\n"
        ",,\n"
        "/data/S3.csv,Rectangular,1200;900\n";
      const std::vector<BatchItem> items = parse_batch_manifest(text, "base");
      assert(items.size() == 4);

      assert(std::filesystem::u8path(items[0].file_path) == std::filesystem::u8path("base/S1.csv"));
      assert(items[0].geometry && shape_of(*items[0].geometry) == Shape::Circular);
      assert(approx(std::get<Circular>(*items[0].geometry).diameter, 600.0));

      assert(std::filesystem::u8path(items[1].file_path) == std::filesystem::u8path("base/sub/S2.csv"));
      const EggType1 egg = std::get<EggType1>(*items[1].geometry);
      assert(approx(egg.width, 1000.0) && approx(egg.height, 1500.0));
      assert(!egg.r3);

      // Rainfall rows carry no geometry.
      assert(!items[2].geometry);

      assert(items[3].file_path == "/data/S3.csv");
      assert(geometry_dimensions(*items[3].geometry) == (std::vector<double>{1200, 900}));
    }

    // Without a base directory paths are kept as written.
    {
      const auto items = parse_batch_manifest("filepath,pipeshape,pipesize\nx.csv,circular,300\n", "");
      assert(items.size() == 1);
      assert(items[0].file_path == "x.csv");
    }

    // Bad rows name the manifest row and the file.
    {
      bool threw = false;
      try {
        (void)parse_batch_manifest("filepath,pipeshape,pipesize\n"
                                   "a.csv,circular,300\n"
                                   "b.csv,hexagon,300\n",
                                   "");
      } catch (const GeometryError& e) {
        threw = (e.code() == ErrorCode::InvalidDescriptor);
        const std::string msg = e.what();
        assert(msg.find("row 2") != std::string::npos);
        assert(msg.find("b.csv") != std::string::npos);
      }
      assert(threw);
    }
    assert(throws_code([]() { (void)parse_batch_manifest("filepath,pipeshape,pipesize\na.csv,circular,\n", ""); },
                       ErrorCode::InvalidDescriptor));
    assert(throws_code([]() { (void)parse_batch_manifest("name,pipeshape\na.csv,circular\n", ""); },
                       ErrorCode::EmptyOrMalformed));

    // From disk.
    {
      const std::string dir = "test_batch_manifest_tmp";
      fdv_test::remove_all(dir);
      fdv_test::write_file(dir + "/manifest.csv", "filepath,pipeshape,pipesize\nS9.csv,circular,450\n");
      const auto items = read_batch_manifest(dir + "/manifest.csv");
      assert(items.size() == 1);
      assert(std::filesystem::u8path(items[0].file_path) == std::filesystem::u8path(dir + "/S9.csv"));

      assert(throws_code([&]() { (void)read_batch_manifest(dir + "/missing.csv"); }, ErrorCode::ReadFailed));
      fdv_test::remove_all(dir);
    }

    std::cout << "test_batch_manifest: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_batch_manifest failed: " << e.what() << "\n";
    return 1;
  }
}
