#include "checkpoint_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "progress_monitor.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace diskmigrate::test;

namespace {

CheckpointRecord make_record(std::uint64_t offset, std::uint64_t total = 10000, std::uint64_t block = 100) {
  CheckpointRecord record;
  record.source_id = "sda";
  record.dest_id = "sdb";
  record.host = "backup01";
  record.byte_offset = offset;
  record.total_bytes = total;
  record.block_size = block;
  return record;
}

std::vector<std::string> directory_entries(const std::filesystem::path& dir) {
  std::vector<std::string> names;
  for(const auto& entry : std::filesystem::directory_iterator(dir)) {
    names.push_back(entry.path().filename().string());
  }
  return names;
}

bool test_save_load_clear(TestContext& ctx) {
  Expect expect;
  TempWorkspace ws("checkpoint");
  auto logger = std::make_shared<Logger>("checkpoint");
  ctx.logs.attach(logger);
  CheckpointStore store(ws / "state", logger);

  expect(!store.load("sda", "sdb", "backup01"), "nothing stored yet");

  store.save(make_record(4200));
  auto loaded = store.load("sda", "sdb", "backup01");
  expect(loaded.has_value(), "record loads back");
  if(loaded) {
    expect(loaded->byte_offset == 4200, "offset");
    expect(loaded->total_bytes == 10000, "total size");
    expect(loaded->block_size == 100, "block size");
    expect(loaded->saved_at_epoch > 0, "timestamp filled in");
  }

  store.save(make_record(5000));
  expect(store.load("sda", "sdb", "backup01")->byte_offset == 5000, "latest save wins");

  auto names = directory_entries(ws / "state");
  expect(names.size() == 1 && names[0] == CheckpointStore::kRecordFileName, "no temp file left behind");

  store.clear("sda", "sdb", "backup01");
  expect(!std::filesystem::exists(store.record_path()), "record removed");
  expect(!store.load("sda", "sdb", "backup01"), "nothing after clear");
  store.clear("sda", "sdb", "backup01");
  return expect.ok();
}

bool test_mismatch_on_each_field(TestContext&) {
  Expect expect;
  TempWorkspace ws("mismatch");
  CheckpointStore store(ws.root());
  store.save(make_record(100));

  expect(throws<StateMismatchError>([&]{ store.load("sdc", "sdb", "backup01"); }), "different source");
  expect(throws<StateMismatchError>([&]{ store.load("sda", "sdc", "backup01"); }), "different destination");
  expect(throws<StateMismatchError>([&]{ store.load("sda", "sdb", "backup02"); }), "different host");

  store.clear("sda", "sdb", "backup02");
  expect(std::filesystem::exists(store.record_path()), "clear leaves another transfer's record");
  return expect.ok();
}

bool test_invalid_records_rejected(TestContext&) {
  Expect expect;
  TempWorkspace ws("invalid");
  CheckpointStore store(ws.root());

  expect(throws<ConfigurationError>([&]{ store.save(make_record(20000)); }), "offset past total");
  expect(throws<MisalignedOffsetError>([&]{ store.save(make_record(150)); }), "misaligned offset");
  expect(!std::filesystem::exists(store.record_path()), "nothing written for a bad record");

  write_file(store.record_path(), "{ this is not json");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "corrupt file");

  write_file(store.record_path(), R"({"source":"sda","destination":"sdb","host":"backup01","offset":5})");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "missing total_size");

  write_file(store.record_path(),
             R"({"source":"sda","destination":"sdb","host":"backup01","offset":500,"total_size":100})");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "stored offset past total");

  write_file(store.record_path(),
             R"({"source":"sda","destination":"sdb","host":"backup01","offset":-100,"total_size":10000})");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "negative offset");

  write_file(store.record_path(),
             R"({"source":"sda","destination":"sdb","host":"backup01","offset":0,"total_size":-1})");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "negative total size");

  write_file(store.record_path(),
             R"({"source":"sda","destination":"sdb","host":"backup01","offset":100.5,"total_size":10000})");
  expect(throws<ConfigurationError>([&]{ store.load("sda", "sdb", "backup01"); }), "fractional offset");
  return expect.ok();
}

bool test_transfer_lock(TestContext&) {
  Expect expect;
  TempWorkspace ws("lock");
  {
    TransferLock first(ws.root(), "sda", "sdb", "backup01");
    expect(std::filesystem::exists(first.path()), "lock file created");
    expect(throws<ConfigurationError>([&]{
      TransferLock second(ws.root(), "sda", "sdb", "backup01");
    }), "second holder refused");
    TransferLock other(ws.root(), "sdc", "sdb", "backup01");
  }
  TransferLock again(ws.root(), "sda", "sdb", "backup01");
  return expect.ok();
}

bool test_monitor_skips_without_progress(TestContext&) {
  Expect expect;
  TempWorkspace ws("monitor_idle");
  CheckpointStore store(ws.root());
  ProgressMonitor monitor(store, make_record(0), std::chrono::milliseconds(10));
  expect(!monitor.tick(), "no tick before the first observation");
  monitor.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  monitor.stop();
  expect(monitor.save_count() == 0, "idle monitor never saves");
  expect(!std::filesystem::exists(store.record_path()), "no record written");
  return expect.ok();
}

bool test_monitor_saves_aligned_offsets(TestContext&) {
  Expect expect;
  TempWorkspace ws("monitor_aligned");
  CheckpointStore store(ws.root());
  ProgressMonitor monitor(store, make_record(0), std::chrono::seconds(60));

  monitor.observe(1234);
  expect(monitor.tick(), "first progress is saved");
  expect(store.load("sda", "sdb", "backup01")->byte_offset == 1200, "offset aligned down to the block");
  expect(!monitor.tick(), "same progress is not saved twice");

  monitor.observe(1299);
  expect(!monitor.tick(), "progress inside the same block is not saved");
  monitor.observe(1300);
  expect(monitor.tick(), "next block boundary is saved");
  expect(monitor.last_saved_offset() == 1300, "last saved offset");

  monitor.observe(50000);
  expect(monitor.tick(), "progress past the end");
  expect(store.load("sda", "sdb", "backup01")->byte_offset == 10000, "clamped to the total size");
  expect(monitor.save_count() == 3, "three saves");
  return expect.ok();
}

bool test_monitor_counts_from_resume_offset(TestContext&) {
  Expect expect;
  TempWorkspace ws("monitor_resume");
  CheckpointStore store(ws.root());
  ProgressMonitor monitor(store, make_record(500), std::chrono::seconds(60));
  monitor.observe(0);
  expect(!monitor.tick(), "the resume offset itself is not saved again");
  monitor.observe(250);
  expect(monitor.tick(), "progress past the resume offset");
  expect(store.load("sda", "sdb", "backup01")->byte_offset == 700, "resume offset plus aligned progress");
  return expect.ok();
}

bool test_monitor_background_ticks_stop_cleanly(TestContext&) {
  Expect expect;
  TempWorkspace ws("monitor_thread");
  CheckpointStore store(ws.root());
  ProgressMonitor monitor(store, make_record(0), std::chrono::milliseconds(20));
  monitor.start();
  monitor.observe(5000);
  expect(wait_for_condition([&]{ return monitor.save_count() >= 1; }, std::chrono::seconds(2)),
         "timer saves the observed progress");
  monitor.stop();
  auto saved = store.load("sda", "sdb", "backup01");
  expect(saved && saved->byte_offset == 5000, "record at the observed offset");

  auto count = monitor.save_count();
  monitor.observe(9000);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  expect(monitor.save_count() == count, "no save after stop()");
  expect(store.load("sda", "sdb", "backup01")->byte_offset == 5000, "record unchanged after stop()");
  monitor.stop();
  return expect.ok();
}

bool test_monitor_survives_save_failure(TestContext& ctx) {
  Expect expect;
  TempWorkspace ws("monitor_failure");
  auto blocker = ws / "not_a_dir";
  write_file(blocker, "x");
  auto logger = std::make_shared<Logger>("monitor");
  ctx.logs.attach(logger);
  CheckpointStore store(blocker / "state", logger);
  ProgressMonitor monitor(store, make_record(0), std::chrono::seconds(60), logger);
  monitor.observe(1000);
  expect(!monitor.tick(), "failed save reports false");
  expect(monitor.save_count() == 0, "failed save is not counted");
  expect(ctx.logs.contains("Checkpoint save at offset 1000 failed"), "failure logged as a warning");
  return expect.ok();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"save_load_clear", test_save_load_clear},
    {"mismatch_on_each_field", test_mismatch_on_each_field},
    {"invalid_records_rejected", test_invalid_records_rejected},
    {"transfer_lock", test_transfer_lock},
    {"monitor_skips_without_progress", test_monitor_skips_without_progress},
    {"monitor_saves_aligned_offsets", test_monitor_saves_aligned_offsets},
    {"monitor_counts_from_resume_offset", test_monitor_counts_from_resume_offset},
    {"monitor_background_ticks_stop_cleanly", test_monitor_background_ticks_stop_cleanly},
    {"monitor_survives_save_failure", test_monitor_survives_save_failure}
  };
  return run_test_cases("checkpoint", tests, argc, argv);
}
