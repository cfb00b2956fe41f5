#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

class SettingsManager;

// One transfer attempt, merged once from defaults < config file < flags and
// read-only afterwards.
struct TransferConfiguration {
  std::string source_id;
  std::string dest_id;
  std::string host;
  std::string user;
  std::string password;
  std::uint16_t ssh_port = 22;
  std::uint16_t transfer_port = 9000;
  std::string listen_ip = "0.0.0.0";

  std::uint64_t block_size = 64 * 1024;
  bool compress = false;
  bool encrypt = false;
  // Empty means derived from the (source, dest, host) triple.
  std::string key_id;
  std::optional<std::uint64_t> rate_limit;

  bool validate = false;
  std::uint64_t sample_size = 1ull << 30;
  std::uint64_t sample_block = 1ull << 20;

  bool resume = false;
  std::optional<std::uint64_t> offset_override;
  bool dry_run = false;
  bool assume_yes = false;
  bool snapshot = false;

  std::chrono::milliseconds checkpoint_interval{30000};
  std::chrono::milliseconds listener_timeout{30000};
  std::chrono::milliseconds accept_timeout{300000};
  // The receiver confirms durable progress after every this many bytes.
  std::uint64_t progress_interval = 8ull << 20;

  std::string notify_email;
  std::filesystem::path state_dir;
  bool backup_metadata = true;
  std::filesystem::path backup_dir = "/tmp/disk-migration-backup";
  std::string remote_binary = "disk-migrate";

  // "sda -> host:sdb", used in logs and notifications.
  std::string describe() const;

  // Parses sizes and ranges; throws ConfigurationError on bad values.
  static TransferConfiguration from_settings(const SettingsManager& settings);

  // Source, destination and host must be present for the migrate mode.
  void require_migration_fields() const;
};
