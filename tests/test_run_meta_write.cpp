#include "fdv/run_meta.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace fdv;

int main() {
  try {
    const std::string path = "test_run_meta_write_tmp.json";
    const std::string tmp_prefix = path + ".tmp.";

    // Cleanup any leftovers from an interrupted run.
    {
      std::error_code ec;
      for (const auto& e : std::filesystem::directory_iterator(".", ec)) {
        if (ec) break;
        const std::string name = e.path().filename().u8string();
        if (name == path || name.rfind(tmp_prefix, 0) == 0) {
          std::filesystem::remove(e.path(), ec);
          ec.clear();
        }
      }
    }

    std::vector<RunMetaItem> items(5);
    items[0] = RunMetaItem{"in/S1.csv", "Succeeded", "S1.fdv", "S1", "Depth", ""};
    items[1] = RunMetaItem{"in/R\"2.csv", "Succeeded", "R\"2.r", "R\"2", "Rainfall", ""};
    items[2] = RunMetaItem{"in/S1b.csv", "Succeeded", "S1.fdv", "S1", "Depth", ""};
    items[3] = RunMetaItem{"in/bad.csv", "Failed", "", "", "Unknown",
                           "Format/EmptyOrMalformed: No header row\nfound"};
    items[4] = RunMetaItem{"in/late.csv", "Cancelled", "../escape.fdv", "", "", ""};

    const bool ok = write_run_meta_json(path, "fdv_test_tool", "out\tdir", items);
    assert(ok);

    const RunMetaSummary s = read_run_meta_summary(path);
    assert(s.tool == "fdv_test_tool");
    assert(s.output_dir == "out\tdir");
    assert(s.version == build_info().version);
    assert(!s.version.empty());
    assert(s.build_type == build_info().build_type);
    assert(s.compiler == build_info().compiler);
    assert(s.cpp_standard == "c++17");
    assert(!s.timestamp_local.empty());
    assert(!s.timestamp_utc.empty());
    assert(s.timestamp_utc.back() == 'Z');

    // Duplicates and unsafe outputs are dropped; order is kept.
    assert(s.outputs == (std::vector<std::string>{"S1.fdv", "R\"2.r"}));
    assert(s.succeeded == 3);
    assert(s.failed == 1);
    assert(s.cancelled == 1);

    // Item fields do not leak into the top-level lookup.
    const std::string text = fdv_test::read_file(path);
    assert(text.find("\"Error\": \"Format/EmptyOrMalformed: No header row\\nfound\"") != std::string::npos);
    assert(text.find("\"Output\": null") != std::string::npos);

    // Empty item list.
    assert(write_run_meta_json(path, "fdv_test_tool", "outdir", {}));
    const RunMetaSummary e = read_run_meta_summary(path);
    assert(e.outputs.empty());
    assert(e.succeeded == 0 && e.failed == 0 && e.cancelled == 0);
    assert(e.output_dir == "outdir");

    // Missing file reads as an empty summary.
    std::filesystem::remove(path);
    const RunMetaSummary none = read_run_meta_summary(path);
    assert(none.tool.empty());
    assert(none.outputs.empty());

    // Relative path checks.
    {
      std::string out;
      assert(normalize_rel_path_safe("a\\b\\c.fdv", &out) && out == "a/b/c.fdv");
      assert(normalize_rel_path_safe("./x.r", &out) && out == "./x.r");
      assert(!normalize_rel_path_safe("", &out));
      assert(!normalize_rel_path_safe("/abs.fdv", &out));
      assert(!normalize_rel_path_safe("C:\\x.fdv", &out));
      assert(!normalize_rel_path_safe("a/../b.fdv", &out));
      assert(!normalize_rel_path_safe("..", &out));
    }

    std::cout << "test_run_meta_write: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_run_meta_write failed: " << e.what() << "\n";
    return 1;
  }
}
