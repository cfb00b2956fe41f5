#include "agent.hpp"

#include <array>

#include "errors.hpp"
#include "extent.hpp"
#include "key_source.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "protocol.hpp"
#include "receiver.hpp"
#include "settings_manager.hpp"
#include "transfer_config.hpp"
#include "utils.hpp"
#include "validator.hpp"

namespace {

constexpr std::array<const char*, 5> kAgentModes = {"receive", "size", "digest", "backup", "probe"};

std::uint64_t size_setting(const SettingsManager& settings, const std::string& key, bool required) {
  auto text = settings.get<std::string>(key);
  if(text.empty()) {
    if(required) throw ConfigurationError("--" + key + " is required");
    return 0;
  }
  auto value = parse_iec_size(text);
  if(!value) throw ConfigurationError("Invalid " + key + " '" + text + "'");
  return *value;
}

std::string path_setting(const SettingsManager& settings) {
  auto path = settings.get<std::string>("path");
  if(path.empty()) path = settings.get<std::string>("dest");
  if(path.empty()) throw ConfigurationError("--path is required");
  return resolve_extent_path(path);
}

void load_key(std::istream& control, const std::string& key_id, KeyRing& keys) {
  if(key_id.empty()) {
    throw ConfigurationError("an encrypted receive needs --key_id");
  }
  std::string line;
  if(!std::getline(control, line)) {
    throw PipelineError("no key material on stdin");
  }
  auto material = KeyMaterial::from_hex(SettingsManager::trim_copy(line));
  if(!material) {
    throw PipelineError("malformed key material on stdin");
  }
  keys.store(key_id, *material);
}

int run_receive(const SettingsManager& settings,
                std::istream& control,
                const AgentEmit& emit,
                const std::shared_ptr<Logger>& logger) {
  auto config = TransferConfiguration::from_settings(settings);
  auto dest_path = path_setting(settings);
  auto offset = size_setting(settings, "offset", false);
  auto length = size_setting(settings, "length", true);

  auto capacity = extent_size(dest_path);
  if(offset + length > capacity) {
    throw InsufficientCapacityError(offset + length, capacity);
  }

  KeyRing keys;
  if(config.encrypt) {
    load_key(control, config.key_id, keys);
  }
  OpenSslKeySource key_source;
  PipelineBuilder builder(keys, key_source);
  auto pipelines = builder.build(config);

  ReceiverOptions options;
  options.listen_ip = config.listen_ip;
  options.port = config.transfer_port;
  options.dest_path = dest_path;
  options.offset = offset;
  options.length = length;
  options.stages = pipelines.receiver;
  options.accept_timeout = config.accept_timeout;
  options.progress_interval = config.progress_interval;

  ExtentReceiver receiver(options, keys, logger);
  auto port = receiver.bind();
  emit(make_ready_line(port));
  auto written = receiver.run();
  emit(make_done_line(written));
  return 0;
}

int dispatch(const std::string& mode,
             const SettingsManager& settings,
             std::istream& control,
             const AgentEmit& emit,
             const std::shared_ptr<Logger>& logger) {
  if(mode == "probe") {
    emit("ok");
    return 0;
  }
  if(mode == "size") {
    emit(std::to_string(extent_size(path_setting(settings))));
    return 0;
  }
  if(mode == "digest") {
    auto path = path_setting(settings);
    auto offset = size_setting(settings, "offset", false);
    auto length = size_setting(settings, "length", true);
    emit(sha256_extent_window(path, offset, length));
    return 0;
  }
  if(mode == "backup") {
    auto image = backup_extent_head(path_setting(settings), settings.get<std::string>("backup_dir"));
    emit(image.string());
    return 0;
  }
  if(mode == "receive") {
    return run_receive(settings, control, emit, logger);
  }
  throw ConfigurationError("unknown agent mode '" + mode + "'");
}

} // namespace

bool is_agent_mode(const std::string& mode) {
  for(const char* candidate : kAgentModes) {
    if(mode == candidate) return true;
  }
  return false;
}

std::string agent_command(const std::string& binary, const std::string& mode, const AgentOptions& options) {
  std::vector<std::string> argv{binary, mode};
  for(const auto& option : options) {
    argv.push_back("--" + option.first + "=" + option.second);
  }
  argv.push_back("--log_file=none");
  return join_command(argv);
}

int run_agent_mode(const SettingsManager& settings,
                   std::istream& control,
                   const AgentEmit& emit,
                   std::shared_ptr<Logger> logger) {
  auto mode = settings.get<std::string>("mode");
  try {
    return dispatch(mode, settings, control, emit, logger);
  } catch(const ConfigurationError& e) {
    log_error(logger.get(), "{} agent: {}", mode, e.what());
    emit(make_error_line(e.what()));
    return 1;
  } catch(const MigrationError& e) {
    log_error(logger.get(), "{} agent: {}", mode, e.what());
    emit(make_error_line(e.what()));
    return 2;
  }
}
