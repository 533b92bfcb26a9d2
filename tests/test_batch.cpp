#include "fdv/batch.hpp"
#include "fdv/errors.hpp"
#include "fdv/run_meta.hpp"
#include "fdv/utils.hpp"
#include "fdv/zip_archive.hpp"

#include "test_support.hpp"

#include <atomic>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace fdv;

static std::string in_dir(const std::string& dir, const std::string& name) {
  return (std::filesystem::u8path(dir) / std::filesystem::u8path(name)).u8string();
}

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
    const std::string root = "test_batch_tmp";
    fdv_test::remove_all(root);
    const std::string in = root + "/in";
    const std::string out = root + "/out";

    const std::string depth_vel =
      "Time,Depth (mm),Velocity (m/s)\n"
      "2024-01-01 00:00,100,0.5\n"
      "2024-01-01 00:02,120,0.6\n"
      "2024-01-01 00:04,140,0.7\n";
    fdv_test::write_file(in + "/FM1.csv", depth_vel);
    fdv_test::write_file(in + "/b/FM1.csv", depth_vel);
    fdv_test::write_file(in + "/RG1.csv", "Time,Rain (mm)\n2024-01-01 00:00,0\n2024-01-01 00:05,0.2\n");
    fdv_test::write_file(in + "/D2.csv", "Time,Depth (mm)\n2024-01-01 00:00,10\n2024-01-01 00:02,11\n");
    fdv_test::write_file(in + "/T3.csv", "Time,Temp\n2024-01-01 00:00,10\n2024-01-01 00:02,11\n");

    // Output names.
    {
      const std::string dir = root + "/names";
      check_output_dir_writable(dir);
      fdv_test::write_file(in_dir(dir, "S12_2.fdv"), "x");
      OutputNameRegistry reg(dir);
      assert(reg.reserve("S12", ".fdv") == in_dir(dir, "S12.fdv"));
      assert(reg.reserve("S12", ".fdv") == in_dir(dir, "S12_3.fdv"));
      assert(reg.reserve("S12", ".r") == in_dir(dir, "S12.r"));
      assert(reg.reserve("S12", ".fdv") == in_dir(dir, "S12_4.fdv"));
    }

    // Unwritable output directories.
    fdv_test::write_file(root + "/blocker", "x");
    assert(throws_code([&]() { check_output_dir_writable(root + "/blocker"); }, ErrorCode::OutputDirUnwritable));
    assert(throws_code([&]() { check_output_dir_writable(root + "/blocker/sub"); }, ErrorCode::OutputDirUnwritable));
    assert(throws_code([]() { check_output_dir_writable(" "); }, ErrorCode::OutputDirUnwritable));
    assert(throws_code([&]() { (void)run_batch({BatchItem{in + "/FM1.csv", Circular{600}}}, root + "/blocker"); },
                       ErrorCode::OutputDirUnwritable));

    std::vector<BatchItem> items;
    items.push_back(BatchItem{in + "/FM1.csv", GeometryDescriptor(Circular{600})});
    items.push_back(BatchItem{in + "/RG1.csv", std::nullopt});
    items.push_back(BatchItem{in + "/missing.csv", GeometryDescriptor(Circular{600})});
    items.push_back(BatchItem{in + "/D2.csv", std::nullopt});
    items.push_back(BatchItem{in + "/b/FM1.csv", GeometryDescriptor(EggType1{1000, 1500, std::nullopt})});
    items.push_back(BatchItem{in + "/T3.csv", GeometryDescriptor(Circular{600})});

    // Mixed batch on one worker: per-item failures never stop the rest.
    {
      DiagnosticsChannel diag;
      BatchOptions opts;
      opts.max_workers = 1;
      opts.tool_name = "test_batch";
      std::vector<size_t> started;
      opts.on_item_started = [&](size_t i) { started.push_back(i); };

      const BatchSummary s = run_batch(items, out, opts, nullptr, &diag);
      assert(s.items.size() == items.size());
      assert(started == (std::vector<size_t>{0, 1, 2, 3, 4, 5}));
      assert(s.succeeded == 3);
      assert(s.failed == 3);
      assert(s.cancelled == 0);

      assert(s.items[0].status == BatchItemStatus::Succeeded);
      assert(s.items[0].output_path == in_dir(out, "FM1.fdv"));
      assert(s.items[0].site_id == "FM1");
      assert(s.items[0].monitor_type == MonitorType::Combination);
      assert(file_exists(s.items[0].output_path));

      assert(s.items[1].status == BatchItemStatus::Succeeded);
      assert(s.items[1].output_path == in_dir(out, "RG1.r"));
      assert(s.items[1].monitor_type == MonitorType::Rainfall);

      assert(s.items[2].status == BatchItemStatus::Failed);
      assert(s.items[2].error && s.items[2].error->kind == ErrorKind::IO);
      assert(s.items[2].error->code == ErrorCode::ReadFailed);
      assert(s.items[2].output_path.empty());

      assert(s.items[3].status == BatchItemStatus::Failed);
      assert(s.items[3].error->code == ErrorCode::InvalidDescriptor);
      assert(s.items[3].site_id == "D2");

      // Same site id as item 0.
      assert(s.items[4].status == BatchItemStatus::Succeeded);
      assert(s.items[4].output_path == in_dir(out, "FM1_2.fdv"));

      assert(s.items[5].error->code == ErrorCode::UnknownChannel);

      assert(s.run_meta_path == in_dir(out, "batch_run_meta.json"));
      const RunMetaSummary meta = read_run_meta_summary(s.run_meta_path);
      assert(meta.tool == "test_batch");
      assert(meta.outputs == (std::vector<std::string>{"FM1.fdv", "RG1.r", "FM1_2.fdv"}));
      assert(meta.succeeded == 3 && meta.failed == 3);

      size_t errors = 0;
      for (const auto& ev : diag.drain()) {
        if (ev.level == LogLevel::Error) ++errors;
      }
      assert(errors == 3);
    }

    // Several workers over the same directory keep every output distinct.
    {
      BatchOptions opts;
      opts.max_workers = 4;
      opts.write_run_meta = false;
      std::atomic<size_t> started{0};
      opts.on_item_started = [&](size_t) { started.fetch_add(1); };

      const BatchSummary s = run_batch(items, out, opts);
      assert(started.load() == items.size());
      assert(s.succeeded == 3);
      assert(s.run_meta_path.empty());
      std::set<std::string> outputs;
      for (const auto& r : s.items) {
        if (r.status == BatchItemStatus::Succeeded) outputs.insert(r.output_path);
      }
      assert(outputs.size() == 3);
      assert(outputs.count(in_dir(out, "FM1.fdv")) == 0);
      assert(outputs.count(in_dir(out, "RG1_2.r")) == 1);
    }

    // Written outputs bundled into one archive.
    {
      const std::string out2 = root + "/zipped";
      BatchOptions opts;
      opts.max_workers = 2;
      opts.zip_outputs = true;
      const BatchSummary s = run_batch(items, out2, opts);
      assert(s.succeeded == 3);
      assert(s.zip_path == in_dir(out2, "processed_files.zip"));

      const ZipReader zip = ZipReader::open(s.zip_path);
      const std::vector<std::string> listed = zip.names();
      const std::set<std::string> names(listed.begin(), listed.end());
      assert(listed.size() == 3);
      assert(names == (std::set<std::string>{"FM1.fdv", "RG1.r", "FM1_2.fdv"}));
      for (const auto& r : s.items) {
        if (r.status != BatchItemStatus::Succeeded) continue;
        const std::string name = std::filesystem::u8path(r.output_path).filename().u8string();
        assert(zip.read(name) == fdv_test::read_file(r.output_path));
      }

      opts.zip_name = "bundle.zip";
      const BatchSummary only_failures = run_batch({items[2], items[3]}, root + "/zipped_none", opts);
      assert(only_failures.succeeded == 0);
      assert(only_failures.zip_path == in_dir(root + "/zipped_none", "bundle.zip"));
      assert(ZipReader::open(only_failures.zip_path).names().empty());

      opts.zip_outputs = false;
      assert(run_batch({items[0]}, root + "/unzipped", opts).zip_path.empty());
    }

    // A cancelled token leaves every item unstarted.
    {
      CancellationToken token;
      token.cancel();
      BatchOptions opts;
      bool any_started = false;
      opts.on_item_started = [&](size_t) { any_started = true; };
      const BatchSummary s = run_batch(items, root + "/cancelled", opts, &token);
      assert(!any_started);
      assert(s.cancelled == items.size());
      assert(s.succeeded == 0 && s.failed == 0);
      for (const auto& r : s.items) {
        assert(r.status == BatchItemStatus::Cancelled);
        assert(!r.error);
      }
      assert(read_run_meta_summary(s.run_meta_path).cancelled == items.size());

      token.reset();
      assert(!token.cancelled());
    }

    // Empty batch.
    {
      const BatchSummary s = run_batch({}, root + "/empty");
      assert(s.items.empty());
      assert(file_exists(s.run_meta_path));
    }

    assert(std::string(batch_item_status_name(BatchItemStatus::Failed)) == "Failed");

    fdv_test::remove_all(root);
    std::cout << "test_batch: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_batch failed: " << e.what() << "\n";
    return 1;
  }
}
