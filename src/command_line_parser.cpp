#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  SettingsManager probe(settings_spec_);
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec positional{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()};
    if(!probe.resolve_key(positional.key)) {
      throw std::runtime_error("positional argument " + std::to_string(positional.index) +
                               " names unknown setting '" + positional.key + "'");
    }
    result.push_back(std::move(positional));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.size() < 2 || candidate[0] != '-') return false;
  return candidate[1] == '-' || std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const std::vector<std::string> literals = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return std::find(literals.begin(), literals.end(), lowered) != literals.end();
}

bool CommandLineParser::apply_option(const std::vector<std::string>& args,
                                     std::size_t& i,
                                     bool long_form,
                                     SettingsManager& settings) const {
  std::string name = args[i].substr(long_form ? 2 : 1);
  std::optional<std::string> value;
  if(long_form) {
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      value = name.substr(eq + 1);
      name.erase(eq);
    }
  }

  auto key = settings.resolve_key(name);
  if(!key) {
    if(long_form) throw ConfigurationError("Unknown option --" + name);
    return false;
  }

  if(!value) {
    const bool has_next = i + 1 < args.size();
    if(settings.is_bool_setting(*key)) {
      // "--compress" alone means true; "--compress false" takes the literal
      if(has_next && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else if(has_next) {
      value = args[++i];
    } else {
      throw ConfigurationError("Missing value for option '" + name + "'");
    }
  }

  std::string error;
  if(!settings.set_from_string(*key, *value, error)) {
    throw ConfigurationError("Invalid value for option '" + name + "': " + error);
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token.rfind("--", 0) == 0) {
      apply_option(args, i, true, settings);
      continue;
    }
    if(token.size() > 1 && token[0] == '-') {
      if(!apply_option(args, i, false, settings)) {
        throw ConfigurationError("Unknown option " + token);
      }
      continue;
    }

    if(next_positional >= positional_specs_.size()) {
      throw ConfigurationError("Unexpected argument '" + token + "'");
    }
    const auto& positional = positional_specs_[next_positional++];
    std::string error;
    if(!settings.set_from_string(positional.key, token, error)) {
      throw ConfigurationError("Invalid value for " + positional.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::print_option(const nlohmann::json& entry) const {
  auto key = entry.at("key").get<std::string>();
  auto type = entry.at("type").get<std::string>();
  std::string hint = (type == "bool") ? "" : "<" + type + ">";

  std::ostringstream names;
  names << "--" << key;
  if(entry.contains("aliases")) {
    for(const auto& alias : entry.at("aliases").get<std::vector<std::string>>()) {
      names << ", " << (alias.size() == 1 ? "-" : "--") << alias;
    }
  }

  const auto& fallback = entry.at("default");
  std::string shown;
  if(fallback.is_boolean()) {
    shown = fallback.get<bool>() ? "on" : "off";
  } else if(fallback.is_string()) {
    shown = fallback.get<std::string>();
  } else {
    shown = fallback.dump();
  }
  print_out(nullptr, "  {:<44} {:<9} {}{}", names.str(), hint, entry.value("description", ""),
            shown.empty() ? std::string() : " [" + shown + "]");
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - clone a disk to a remote host, resumable", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [migrate] -s <disk> -d <disk> -H <host> [options]", process_name_);
  print_out(nullptr, "  {} receive|size|digest|backup|probe [options]   (run on the destination)", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Examples:");
  print_out(nullptr, "  {} -s sda -d sdb -H remote.host -u admin --validate", process_name_);
  print_out(nullptr, "  {} -s sda -d sdb -H remote.host --compress --encrypt --continue", process_name_);
  print_out(nullptr, "");

  auto agent_only = [](const nlohmann::json& entry){
    auto key = entry.at("key").get<std::string>();
    return std::find(AGENT_ONLY_SETTINGS.begin(), AGENT_ONLY_SETTINGS.end(), key) != AGENT_ONLY_SETTINGS.end();
  };
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    if(!agent_only(entry)) print_option(entry);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Agent options:");
  for(const auto& entry : settings_spec_) {
    if(agent_only(entry)) print_option(entry);
  }
  print_out(nullptr, "");
}
