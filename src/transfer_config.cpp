#include "transfer_config.hpp"

#include "errors.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::optional<std::uint64_t> optional_size(const SettingsManager& settings, const std::string& key) {
  auto text = settings.get<std::string>(key);
  if(text.empty()) return std::nullopt;
  auto parsed = parse_iec_size(text);
  if(!parsed) {
    throw ConfigurationError("Invalid " + key + " '" + text + "'");
  }
  return parsed;
}

std::uint64_t required_size(const SettingsManager& settings, const std::string& key) {
  auto value = optional_size(settings, key);
  if(!value || *value == 0) {
    throw ConfigurationError(key + " must be a positive size");
  }
  return *value;
}

std::uint16_t port_setting(const SettingsManager& settings, const std::string& key, bool allow_zero) {
  int value = settings.get<int>(key);
  if(value < (allow_zero ? 0 : 1) || value > 65535) {
    throw ConfigurationError("Invalid " + key + " '" + std::to_string(value) + "'");
  }
  return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds interval_setting(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value <= 0) {
    throw ConfigurationError(key + " must be positive (got " + std::to_string(value) + ")");
  }
  return std::chrono::milliseconds(value);
}

} // namespace

std::string TransferConfiguration::describe() const {
  return source_id + " -> " + host + ":" + dest_id;
}

TransferConfiguration TransferConfiguration::from_settings(const SettingsManager& settings) {
  TransferConfiguration config;
  config.source_id = settings.get<std::string>("source");
  config.dest_id = settings.get<std::string>("dest");
  config.host = settings.get<std::string>("host");
  config.user = settings.get<std::string>("user");
  config.password = settings.get<std::string>("password");
  config.ssh_port = port_setting(settings, "ssh_port", false);
  config.transfer_port = port_setting(settings, "transfer_port", true);
  config.listen_ip = settings.get<std::string>("listen_ip");

  config.block_size = required_size(settings, "block_size");
  config.compress = settings.get<bool>("compress");
  config.encrypt = settings.get<bool>("encrypt");
  config.key_id = settings.get<std::string>("key_id");
  config.rate_limit = optional_size(settings, "limit");
  if(config.rate_limit && *config.rate_limit == 0) {
    throw ConfigurationError("limit must be greater than zero");
  }

  config.validate = settings.get<bool>("validate");
  config.sample_size = required_size(settings, "sample_size");
  config.sample_block = required_size(settings, "sample_block");

  config.resume = settings.get<bool>("continue");
  config.offset_override = optional_size(settings, "offset");
  config.dry_run = settings.get<bool>("dry_run");
  config.assume_yes = settings.get<bool>("yes");
  config.snapshot = settings.get<bool>("snapshot");

  config.checkpoint_interval = interval_setting(settings, "checkpoint_interval_ms");
  config.listener_timeout = interval_setting(settings, "listener_timeout_ms");
  config.accept_timeout = interval_setting(settings, "accept_timeout_ms");
  config.progress_interval = required_size(settings, "progress_interval");

  config.notify_email = settings.get<std::string>("notify");
  auto state_dir = settings.get<std::string>("state_dir");
  config.state_dir = state_dir.empty() ? SettingsManager::default_config_dir()
                                       : std::filesystem::path(state_dir);
  config.backup_metadata = settings.get<bool>("backup_metadata");
  config.backup_dir = settings.get<std::string>("backup_dir");
  config.remote_binary = settings.get<std::string>("remote_binary");
  if(config.remote_binary.empty()) {
    throw ConfigurationError("remote_binary must not be empty");
  }
  return config;
}

void TransferConfiguration::require_migration_fields() const {
  if(source_id.empty()) throw ConfigurationError("No source disk given (--source)");
  if(dest_id.empty()) throw ConfigurationError("No destination disk given (--dest)");
  if(host.empty()) throw ConfigurationError("No destination host given (--host)");
  if(snapshot) {
    throw ConfigurationError("--snapshot needs an LVM snapshot created outside this tool; "
                             "pass the snapshot device as --source instead");
  }
}
