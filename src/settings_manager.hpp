#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// "size" settings hold IEC strings ("64K", "1G"); an empty string means unset.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","mode"},                  {"aliases", {"command"}},                 {"type","string"}, {"default","migrate"},   {"description","migrate | receive | size | digest | backup | probe"}, {"persistent", false}},
  {{"key","source"},                {"aliases", {"s","src"}},                 {"type","string"}, {"default",""},          {"description","Source disk (sda) or path"}, {"persistent", true}},
  {{"key","dest"},                  {"aliases", {"d","destination"}},         {"type","string"}, {"default",""},          {"description","Destination disk or path on the remote host"}, {"persistent", true}},
  {{"key","host"},                  {"aliases", {"H","dest_host"}},           {"type","string"}, {"default",""},          {"description","Destination host"}, {"persistent", true}},
  {{"key","user"},                  {"aliases", {"u","dest_user"}},           {"type","string"}, {"default",""},          {"description","SSH username (empty = ssh default)"}, {"persistent", true}},
  {{"key","password"},              {"aliases", {"dest_pass"}},               {"type","string"}, {"default",""},          {"description","SSH password, used through sshpass (never saved)"}, {"persistent", false}},
  {{"key","ssh_port"},              {"aliases", {"p","port"}},                {"type","int"},    {"default",22},          {"description","SSH port"}, {"persistent", true}},
  {{"key","transfer_port"},         {"aliases", {"t","transfer-port"}},       {"type","int"},    {"default",9000},        {"description","Data transfer port"}, {"persistent", true}},
  {{"key","listen_ip"},             {"aliases", {"li"}},                      {"type","string"}, {"default","0.0.0.0"},   {"description","Interface the receiver binds"}, {"persistent", true}},
  {{"key","block_size"},            {"aliases", {"b","block-size"}},          {"type","size"},   {"default","64K"},       {"description","Block granularity for reads, writes and offsets"}, {"persistent", true}},
  {{"key","limit"},                 {"aliases", {"l","bandwidth_limit"}},     {"type","size"},   {"default",""},          {"description","Bandwidth limit in bytes/sec (e.g. 10M)"}, {"persistent", true}},
  {{"key","compress"},              {"aliases", {"compression"}},             {"type","bool"},   {"default",false},       {"description","Gzip the stream in transit"}, {"persistent", true}},
  {{"key","validate"},              {"aliases", {}},                          {"type","bool"},   {"default",false},       {"description","Verify sampled checksums after transfer"}, {"persistent", true}},
  {{"key","encrypt"},               {"aliases", {"encrypt_transfer"}},        {"type","bool"},   {"default",false},       {"description","AES-256-CBC encrypt the stream with an ephemeral key"}, {"persistent", true}},
  {{"key","dry_run"},               {"aliases", {"dry-run","n"}},             {"type","bool"},   {"default",false},       {"description","Run every check without transferring"}, {"persistent", false}},
  {{"key","snapshot"},              {"aliases", {"use_lvm_snapshot"}},        {"type","bool"},   {"default",false},       {"description","LVM snapshot (not handled by this tool)"}, {"persistent", false}},
  {{"key","continue"},              {"aliases", {"resume"}},                  {"type","bool"},   {"default",false},       {"description","Resume from the saved checkpoint"}, {"persistent", false}},
  {{"key","offset"},                {"aliases", {"transfer_offset"}},         {"type","size"},   {"default",""},          {"description","Explicit starting offset in bytes"}, {"persistent", false}},
  {{"key","length"},                {"aliases", {}},                          {"type","size"},   {"default",""},          {"description","Byte count for receive/digest agents"}, {"persistent", false}},
  {{"key","path"},                  {"aliases", {}},                          {"type","string"}, {"default",""},          {"description","Extent path for size/digest/backup agents"}, {"persistent", false}},
  {{"key","key_id"},                {"aliases", {}},                          {"type","string"}, {"default",""},          {"description","Key reference for an encrypted receive"}, {"persistent", false}},
  {{"key","notify"},                {"aliases", {"notification_email"}},      {"type","string"}, {"default",""},          {"description","Email to notify on completion"}, {"persistent", true}},
  {{"key","config"},                {"aliases", {"c"}},                       {"type","string"}, {"default",""},          {"description","Config file to load"}, {"persistent", false}},
  {{"key","yes"},                   {"aliases", {"y","assume_yes"}},          {"type","bool"},   {"default",false},       {"description","Do not ask for confirmation"}, {"persistent", false}},
  {{"key","verbose"},               {"aliases", {"v"}},                       {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},              {"aliases", {}},                          {"type","string"}, {"default","auto"},      {"description","Log file (auto = /var/log/disk-migration-<time>.log, none = off)"}, {"persistent", true}},
  {{"key","state_dir"},             {"aliases", {}},                          {"type","string"}, {"default",""},          {"description","Checkpoint directory (empty = ~/.config/disk-migration)"}, {"persistent", true}},
  {{"key","checkpoint_interval_ms"},{"aliases", {"cim"}},                     {"type","int"},    {"default",30000},       {"description","Milliseconds between checkpoint saves"}, {"persistent", true}},
  {{"key","listener_timeout_ms"},   {"aliases", {"ltm"}},                     {"type","int"},    {"default",30000},       {"description","Milliseconds to wait for the remote listener"}, {"persistent", true}},
  {{"key","accept_timeout_ms"},     {"aliases", {"atm"}},                     {"type","int"},    {"default",300000},      {"description","Milliseconds the receiver waits for the sender"}, {"persistent", true}},
  {{"key","progress_interval"},     {"aliases", {"pi"}},                      {"type","size"},   {"default","8M"},        {"description","Bytes the receiver writes and syncs between progress reports"}, {"persistent", true}},
  {{"key","sample_size"},           {"aliases", {}},                          {"type","size"},   {"default","1G"},        {"description","Bytes per validation window"}, {"persistent", true}},
  {{"key","sample_block"},          {"aliases", {}},                          {"type","size"},   {"default","1M"},        {"description","Alignment of the middle validation window"}, {"persistent", true}},
  {{"key","backup_metadata"},       {"aliases", {"backup"}},                  {"type","bool"},   {"default",true},        {"description","Save the first MiB of both disks before writing"}, {"persistent", true}},
  {{"key","backup_dir"},            {"aliases", {}},                          {"type","string"}, {"default","/tmp/disk-migration-backup"}, {"description","Where metadata backups go"}, {"persistent", true}},
  {{"key","remote_binary"},         {"aliases", {}},                          {"type","string"}, {"default","disk-migrate"}, {"description","Agent binary on the destination host"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},                   {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},                 {"type","bool"},   {"default",false},       {"description","Persist current settings to the config file"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);
  // Writes the persistent defaults, unless the file already exists.
  bool write_default_file(const std::filesystem::path& path) const;

  // Copies every key that was explicitly set on `overrides` (by flag or
  // set_from_*), so flags win over whatever the config file said.
  void overlay(const SettingsManager& overrides);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  static std::filesystem::path default_config_dir();

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::vector<std::string> exact_aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  bool merge_from_json(const nlohmann::json& doc, const std::filesystem::path& origin);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::set<std::string> explicit_keys_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      spec.exact_aliases = spec.aliases;
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  explicit_keys_.clear();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  // -H (host) and -h (help) differ only by case
  for(const auto& spec : setting_specs_) {
    if(std::find(spec.exact_aliases.begin(), spec.exact_aliases.end(), token) != spec.exact_aliases.end()) {
      return &spec;
    }
  }
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::default_config_dir() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home)
                                               : std::filesystem::current_path();
  return base / ".config" / "disk-migration";
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return default_config_dir() / "config.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    return merge_from_json(doc, path);
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline bool SettingsManager::write_default_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(std::filesystem::exists(path, ec)) return false;
  SettingsManager defaults;
  if(!defaults.save_to_file(path)) return false;
  log_info(nullptr, "Created default configuration file at {}", path.string());
  return true;
}

inline bool SettingsManager::merge_from_json(const nlohmann::json& doc,
                                             const std::filesystem::path& origin) {
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: top level is not an object", origin.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      log_warn(nullptr, "Ignoring unknown setting '{}' in {}", item.key(), origin.string());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline void SettingsManager::overlay(const SettingsManager& overrides) {
  for(const auto& key : overrides.explicit_keys_) {
    if(!overrides.has(key)) continue;
    settings_[key] = overrides.settings_.at(key);
    explicit_keys_.insert(key);
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
    } else if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
    } else {
      error = "expected boolean";
      return false;
    }
  } else if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    settings_[spec.key] = value.get<int>();
  } else if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    settings_[spec.key] = value.get<std::string>();
  } else if(spec.type == "size") {
    std::string text;
    if(value.is_number_unsigned() || value.is_number_integer()) {
      if(value.is_number_integer() && value.get<long long>() < 0) {
        error = "size must not be negative";
        return false;
      }
      text = std::to_string(value.get<std::uint64_t>());
    } else if(value.is_string()) {
      text = trim_copy(value.get<std::string>());
    } else {
      error = "expected size such as 64K or 1G";
      return false;
    }
    if(!text.empty() && !parse_iec_size(text)) {
      error = "cannot parse size '" + text + "'";
      return false;
    }
    settings_[spec.key] = text;
  } else {
    error = "unknown type";
    return false;
  }
  explicit_keys_.insert(spec.key);
  return true;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "size") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
