#include "agent.hpp"
#include "capacity_validator.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "extent.hpp"
#include "key_source.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_config.hpp"
#include "transforms.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace diskmigrate::test;

namespace {

// Deterministic keys so stream contents do not vary between runs.
class FixedKeySource : public KeySource {
public:
  KeyMaterial generate() override {
    ++calls;
    KeyMaterial material;
    material.key.fill(static_cast<unsigned char>(0x10 + calls));
    material.iv.fill(0x5a);
    return material;
  }
  int calls = 0;
};

TransferConfiguration sample_config() {
  TransferConfiguration config;
  config.source_id = "sda";
  config.dest_id = "sdb";
  config.host = "backup01";
  config.block_size = 64 * 1024;
  return config;
}

std::string run_stages(const StageList& stages, const KeyRing& keys, const std::string& input,
                       std::size_t chunk = 4096) {
  std::string out;
  auto runner = PipelineRunner::from_stages(stages, keys, [&](const char* data, std::size_t size){
    out.append(data, size);
  });
  for(std::size_t pos = 0; pos < input.size(); pos += chunk) {
    runner.push(input.data() + pos, std::min(chunk, input.size() - pos));
  }
  runner.finish();
  return out;
}

bool test_capacity_rejects_smaller_destination(TestContext&) {
  Expect expect;
  bool thrown = false;
  try {
    CapacityValidator::validate(Extent{"sda", 1000}, Extent{"sdb", 999});
  } catch(const InsufficientCapacityError& e) {
    thrown = true;
    expect(e.source_bytes() == 1000, "source bytes carried");
    expect(e.dest_bytes() == 999, "dest bytes carried");
    std::string message = e.what();
    expect(message.find("1000") != std::string::npos && message.find("999") != std::string::npos,
           "message names both sizes");
  }
  expect(thrown, "InsufficientCapacityError for 1000 -> 999");
  return expect.ok();
}

bool test_capacity_accepts_equal_and_larger(TestContext&) {
  CapacityValidator::validate(Extent{"sda", 1000}, Extent{"sdb", 1000});
  CapacityValidator::validate(Extent{"sda", 1000}, Extent{"sdb", 4096});
  CapacityValidator::validate(Extent{"sda", 0}, Extent{"sdb", 0});
  return true;
}

bool test_iec_sizes(TestContext&) {
  Expect expect;
  expect(parse_iec_size("4096") == std::uint64_t{4096}, "plain bytes");
  expect(parse_iec_size("64K") == std::uint64_t{65536}, "64K");
  expect(parse_iec_size("10M") == std::uint64_t{10 * 1024 * 1024}, "10M");
  expect(parse_iec_size("1G") == std::uint64_t{1} << 30, "1G");
  expect(parse_iec_size("1Ki") == std::uint64_t{1024}, "1Ki");
  expect(parse_iec_size("2KB") == std::uint64_t{2048}, "2KB");
  expect(!parse_iec_size(""), "empty");
  expect(!parse_iec_size("12Q"), "unknown suffix");
  expect(!parse_iec_size("K"), "no digits");
  expect(!parse_iec_size("99999999999999999999"), "overflow");
  expect(align_down(1234, 100) == 1200, "align_down");
  expect(align_down(1200, 100) == 1200, "align_down on a boundary");
  return expect.ok();
}

bool test_settings_precedence(TestContext&) {
  Expect expect;
  TempWorkspace ws("precedence");
  auto file = ws / "config.json";
  write_file(file, R"({"block_size": "128K", "transfer_port": 9100, "compress": true, "nonsense": 1})");

  SettingsManager settings;
  settings.set_settings_path(file);
  expect(settings.load(), "config file loads");

  SettingsManager flags;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>{"migrate", "--transfer_port", "9200", "-H", "backup01",
                                        "--source=sda", "-d", "sdb"}, flags);
  settings.overlay(flags);

  auto config = TransferConfiguration::from_settings(settings);
  expect(config.block_size == 128 * 1024, "block size from the file");
  expect(config.transfer_port == 9200, "flag beats file");
  expect(config.ssh_port == 22, "default when nobody sets it");
  expect(config.compress, "file value survives the overlay");
  expect(config.host == "backup01" && config.source_id == "sda" && config.dest_id == "sdb",
         "triple from flags");
  expect(config.describe() == "sda -> backup01:sdb", "describe()");
  config.require_migration_fields();
  return expect.ok();
}

bool test_password_is_never_saved(TestContext&) {
  Expect expect;
  TempWorkspace ws("saved_settings");
  auto file = ws / "config.json";

  SettingsManager settings;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>{"-H", "backup01", "--password", "hunter2", "--save"}, settings);
  settings.set_settings_path(file);
  expect(settings.save(), "settings saved");

  auto saved = nlohmann::json::parse(read_file(file));
  expect(saved.value("host", "") == "backup01", "host is kept");
  expect(!saved.contains("password"), "password left out of the file");
  expect(read_file(file).find("hunter2") == std::string::npos, "password text nowhere in the file");

  SettingsManager reloaded;
  reloaded.set_settings_path(file);
  expect(reloaded.load(), "saved file loads");
  expect(reloaded.get<std::string>("password").empty(), "no password after reload");
  return expect.ok();
}

bool test_configuration_errors(TestContext&) {
  Expect expect;
  CommandLineParser parser;

  SettingsManager unknown;
  expect(throws<ConfigurationError>([&]{
    parser.parse(std::vector<std::string>{"--bogus=1"}, unknown);
  }), "unknown option");

  SettingsManager bad_size;
  expect(throws<ConfigurationError>([&]{
    parser.parse(std::vector<std::string>{"--block_size=12Q"}, bad_size);
  }), "unparseable size");

  SettingsManager zero_block;
  parser.parse(std::vector<std::string>{"--block_size=0"}, zero_block);
  expect(throws<ConfigurationError>([&]{
    TransferConfiguration::from_settings(zero_block);
  }), "zero block size");

  SettingsManager bad_port;
  parser.parse(std::vector<std::string>{"--transfer_port=70000"}, bad_port);
  expect(throws<ConfigurationError>([&]{
    TransferConfiguration::from_settings(bad_port);
  }), "port out of range");

  SettingsManager no_host;
  parser.parse(std::vector<std::string>{"--source=sda", "--dest=sdb"}, no_host);
  auto config = TransferConfiguration::from_settings(no_host);
  expect(throws<ConfigurationError>([&]{ config.require_migration_fields(); }), "host is required");

  SettingsManager snapshot;
  parser.parse(std::vector<std::string>{"-s", "sda", "-d", "sdb", "-H", "h", "--snapshot"}, snapshot);
  auto snap = TransferConfiguration::from_settings(snapshot);
  expect(snap.snapshot, "snapshot flag parsed");
  expect(throws<ConfigurationError>([&]{ snap.require_migration_fields(); }), "snapshot is refused");
  return expect.ok();
}

bool test_builder_order_and_mirror(TestContext&) {
  Expect expect;
  auto config = sample_config();
  config.compress = true;
  config.encrypt = true;
  config.rate_limit = 10 * 1024 * 1024;

  KeyRing keys;
  FixedKeySource source;
  PipelineBuilder builder(keys, source);
  auto pair = builder.build(config);

  expect(describe_stages(pair.sender) == "raw_read -> compress -> encrypt -> rate_limit", "sender order");
  expect(describe_stages(pair.receiver) == "decrypt -> decompress -> raw_write", "receiver order");
  expect(mirror(pair.sender) == pair.receiver, "receiver mirrors sender");

  auto again = builder.build(config);
  expect(again.sender == pair.sender && again.receiver == pair.receiver, "same config, same pipelines");
  expect(source.calls == 1, "key generated once per transfer");

  auto reference = PipelineBuilder::key_reference(config);
  expect(reference == key_reference_for("sda", "sdb", "backup01"), "derived key reference");
  expect(keys.contains(reference), "key stored in the ring");
  auto encrypt = std::get_if<EncryptStage>(&pair.sender[2]);
  expect(encrypt && encrypt->key_ref == reference, "encrypt stage carries the reference");

  auto wire = stages_to_json(pair.sender).dump();
  expect(wire.find(keys.at(reference).to_hex().substr(0, 32)) == std::string::npos,
         "key bytes never appear in a stage description");

  auto plain = sample_config();
  auto minimal = builder.build(plain);
  expect(describe_stages(minimal.sender) == "raw_read", "raw only sender");
  expect(describe_stages(minimal.receiver) == "raw_write", "raw only receiver");

  expect(throws<PipelineError>([]{
    mirror(StageList{RawStage{RawStage::Direction::Read, 512}, DecompressStage{}});
  }), "receive-only stage in a sender list");
  return expect.ok();
}

bool test_stream_header_parsing(TestContext&) {
  Expect expect;
  StreamHeader header;
  header.stages = {RawStage{RawStage::Direction::Read, 4096}, CompressStage{}, EncryptStage{"xfer-1"}};
  header.offset = 8192;
  header.length = 1 << 20;
  header.block_size = 4096;
  auto parsed = parse_stream_header(make_stream_header(header).dump());
  expect(parsed.stages == header.stages, "stages survive the wire");
  expect(parsed.offset == 8192 && parsed.length == (1u << 20) && parsed.block_size == 4096, "numbers survive");

  expect(throws<PipelineError>([]{ parse_stream_header("not json"); }), "garbage header");
  expect(throws<PipelineError>([]{
    parse_stream_header(R"({"type":"stream_header","version":1,"stages":[{"stage":"shuffle"}],"offset":0,"length":0,"block_size":1})");
  }), "unknown stage");

  auto ready = parse_agent_line(make_ready_line(9000));
  expect(ready.kind == AgentLine::Kind::Ready && ready.payload == "9000", "READY line");
  auto done = parse_agent_line(make_done_line(42));
  expect(done.kind == AgentLine::Kind::Done && done.payload == "42", "DONE line");
  auto error = parse_agent_line(make_error_line("disk on fire"));
  expect(error.kind == AgentLine::Kind::Error && error.payload == "disk on fire", "ERROR line");
  auto value = parse_agent_line("1048576");
  expect(value.kind == AgentLine::Kind::Value && value.payload == "1048576", "plain value line");

  auto progress = parse_stream_reply(make_stream_progress(65536).dump());
  expect(progress.kind == StreamReply::Kind::Progress && progress.bytes_written == 65536, "progress reply");
  auto ack = parse_stream_reply(make_stream_ack(70000).dump());
  expect(ack.kind == StreamReply::Kind::Ack && ack.bytes_written == 70000, "ack reply");
  auto refused = parse_stream_reply(make_stream_error("stage mismatch").dump());
  expect(refused.kind == StreamReply::Kind::Error && refused.message == "stage mismatch", "error reply");
  expect(throws<TransportError>([]{
    parse_stream_reply(R"({"type":"stream_progress","bytes_written":-5})");
  }), "negative byte count");
  expect(throws<TransportError>([]{ parse_stream_reply("garbage"); }), "not JSON");
  return expect.ok();
}

bool test_compress_encrypt_round_trip(TestContext&) {
  Expect expect;
  auto config = sample_config();
  config.compress = true;
  config.encrypt = true;
  KeyRing keys;
  FixedKeySource source;
  auto pair = PipelineBuilder(keys, source).build(config);

  auto input = pattern_bytes(300 * 1000, 7);
  auto wire = run_stages(pair.sender, keys, input, 64 * 1024);
  expect(wire != input, "stream is transformed");
  expect(wire.size() % 16 == 0, "ciphertext is whole AES blocks");

  auto output = run_stages(pair.receiver, keys, wire, 1500);
  expect(output == input, "receiver restores the source bytes");

  auto compressed_only = run_stages({CompressStage{}}, keys, input);
  expect(compressed_only.size() < input.size(), "pattern data compresses");
  return expect.ok();
}

bool test_wrong_decode_order_fails(TestContext&) {
  Expect expect;
  KeyRing keys;
  FixedKeySource source;
  keys.store("k", source.generate());

  auto input = pattern_bytes(50 * 1000, 3);
  auto wire = run_stages({CompressStage{}, EncryptStage{"k"}}, keys, input);

  expect(throws<PipelineError>([&]{
    run_stages({DecompressStage{}, DecryptStage{"k"}}, keys, wire);
  }), "decompress before decrypt is detected");

  expect(throws<PipelineError>([&]{
    run_stages({DecryptStage{"missing"}}, keys, wire);
  }), "unknown key reference");
  return expect.ok();
}

bool test_truncated_streams_fail(TestContext&) {
  Expect expect;
  KeyRing keys;
  FixedKeySource source;
  keys.store("k", source.generate());
  auto input = pattern_bytes(100 * 1000, 11);

  auto gz = run_stages({CompressStage{}}, keys, input);
  expect(throws<PipelineError>([&]{
    run_stages({DecompressStage{}}, keys, gz.substr(0, gz.size() / 2));
  }), "truncated gzip");

  expect(throws<PipelineError>([&]{
    run_stages({DecompressStage{}}, keys, gz + "trailing");
  }), "bytes after the gzip member");

  auto sealed = run_stages({EncryptStage{"k"}}, keys, input);
  expect(throws<PipelineError>([&]{
    run_stages({DecryptStage{"k"}}, keys, sealed.substr(0, sealed.size() - 5));
  }), "ciphertext cut mid-block");
  return expect.ok();
}

bool test_rate_limiter_caps_throughput(TestContext&) {
  Expect expect;
  RateLimiter limiter(200000);
  std::string chunk(10000, 'x');
  std::string out;
  auto started = std::chrono::steady_clock::now();
  for(int i = 0; i < 10; ++i) {
    limiter.update(chunk.data(), chunk.size(), out);
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  expect(out.size() == 100000, "data passes through unchanged");
  // a tenth of a second of burst, the rest paced at 200000 B/s
  expect(elapsed >= std::chrono::milliseconds(350), "100000 bytes at 200000 B/s take about 0.4 s");
  expect(elapsed < std::chrono::seconds(5), "limiter does not stall");
  expect(throws<ConfigurationError>([]{ RateLimiter zero(0); }), "zero rate refused");
  return expect.ok();
}

bool test_positioned_write_keeps_other_bytes(TestContext&) {
  Expect expect;
  TempWorkspace ws("extent");
  auto path = (ws / "disk.img").string();
  write_file(path, std::string(1000, 'A'));

  {
    auto file = ExtentFile::open_for_write(path, 500);
    std::string block(100, 'B');
    file.write_all(block.data(), block.size());
    file.sync();
    expect(file.position() == 600, "position advances");
  }
  auto contents = read_file(path);
  expect(contents.size() == 1000, "extent not truncated");
  expect(contents.substr(0, 500) == std::string(500, 'A'), "prefix untouched");
  expect(contents.substr(500, 100) == std::string(100, 'B'), "window written");
  expect(contents.substr(600) == std::string(400, 'A'), "suffix untouched");
  expect(extent_size(path) == 1000, "extent_size of an image file");

  auto reader = ExtentFile::open_for_read(path, 950);
  std::string tail(100, '\0');
  expect(reader.read_full(&tail[0], tail.size()) == 50, "short read at end of extent");

  expect(resolve_extent_path("sda") == "/dev/sda", "bare disk name");
  expect(resolve_extent_path("/tmp/x.img") == "/tmp/x.img", "path kept");
  expect(throws<ExtentIoError>([&]{ ExtentFile::open_for_write((ws / "missing.img").string(), 0); }),
         "writer never creates");
  return expect.ok();
}

bool test_agent_command_quoting(TestContext&) {
  Expect expect;
  auto command = agent_command("/opt/disk migrate/bin", "receive", {
    {"dest", "/srv/it's here.img"},
    {"offset", "0"}
  });
  auto words = split_command_line(command);
  expect(words.size() == 5, "binary, mode, two options and --log_file");
  if(words.size() == 5) {
    expect(words[0] == "/opt/disk migrate/bin", "binary with a space");
    expect(words[1] == "receive", "mode");
    expect(words[2] == "--dest=/srv/it's here.img", "quote inside a value");
    expect(words[4] == "--log_file=none", "agents do not open a log file");
  }

  SettingsManager settings;
  CommandLineParser parser;
  parser.parse(std::vector<std::string>(words.begin() + 1, words.end()), settings);
  expect(settings.get<std::string>("mode") == "receive", "mode parsed back");
  expect(settings.get<std::string>("dest") == "/srv/it's here.img", "dest parsed back");
  expect(is_agent_mode("digest") && !is_agent_mode("migrate"), "agent modes");
  return expect.ok();
}

bool test_probe_agent(TestContext&) {
  Expect expect;
  SettingsManager settings;
  std::string error;
  settings.set_from_string("mode", "probe", error);
  std::istringstream control;
  std::vector<std::string> lines;
  int rc = run_agent_mode(settings, control, [&](const std::string& line){ lines.push_back(line); });
  expect(rc == 0 && lines.size() == 1 && lines[0] == "ok", "probe answers ok");

  SettingsManager size;
  size.set_from_string("mode", "size", error);
  lines.clear();
  rc = run_agent_mode(size, control, [&](const std::string& line){ lines.push_back(line); });
  expect(rc == 1, "size without a path is a configuration error");
  expect(!lines.empty() && parse_agent_line(lines.back()).kind == AgentLine::Kind::Error, "ERROR line");
  return expect.ok();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"capacity_rejects_smaller_destination", test_capacity_rejects_smaller_destination},
    {"capacity_accepts_equal_and_larger", test_capacity_accepts_equal_and_larger},
    {"iec_sizes", test_iec_sizes},
    {"settings_precedence", test_settings_precedence},
    {"password_is_never_saved", test_password_is_never_saved},
    {"configuration_errors", test_configuration_errors},
    {"builder_order_and_mirror", test_builder_order_and_mirror},
    {"stream_header_parsing", test_stream_header_parsing},
    {"compress_encrypt_round_trip", test_compress_encrypt_round_trip},
    {"wrong_decode_order_fails", test_wrong_decode_order_fails},
    {"truncated_streams_fail", test_truncated_streams_fail},
    {"rate_limiter_caps_throughput", test_rate_limiter_caps_throughput},
    {"positioned_write_keeps_other_bytes", test_positioned_write_keeps_other_bytes},
    {"agent_command_quoting", test_agent_command_quoting},
    {"probe_agent", test_probe_agent}
  };
  return run_test_cases("pipeline", tests, argc, argv);
}
