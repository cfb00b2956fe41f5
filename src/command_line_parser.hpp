#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Settings that only the destination agents read; usage() lists them apart.
inline const std::vector<std::string> AGENT_ONLY_SETTINGS = {"path", "length", "key_id"};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "disk-migrate",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","mode"}}
                    }));

  // Throws ConfigurationError on an unknown option or a bad value.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;

  // Consumes the option at args[i] (and its value, advancing i). Returns
  // false for a short token that names no setting.
  bool apply_option(const std::vector<std::string>& args,
                    std::size_t& i,
                    bool long_form,
                    SettingsManager& settings) const;
  void print_option(const nlohmann::json& entry) const;

  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
