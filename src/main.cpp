#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>

#include "agent.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "key_source.hpp"
#include "log.hpp"
#include "notifier.hpp"
#include "prompt.hpp"
#include "remote_executor.hpp"
#include "settings_manager.hpp"
#include "transfer_config.hpp"
#include "transfer_coordinator.hpp"

namespace {

std::string resolve_log_file(const std::string& setting) {
  if(setting == "none") return {};
  if(setting != "auto") return setting;
  auto path = default_log_file_path();
  auto dir = std::filesystem::path(path).parent_path();
  if(::access(dir.c_str(), W_OK) != 0) return {};
  return path;
}

std::string process_name(int argc, char** argv) {
  if(argc > 0 && argv && argv[0]) {
    return std::filesystem::path(argv[0]).filename().string();
  }
  return "disk-migrate";
}

} // namespace

int main(int argc, char** argv){
  std::signal(SIGPIPE, SIG_IGN);
  try {
    CommandLineParser parser(process_name(argc, argv));
    SettingsManager flags;
    try {
      parser.parse(argc, argv, flags);
    } catch(const ConfigurationError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(flags.help_requested()) {
      parser.usage();
      return 0;
    }

    const auto mode = flags.get<std::string>("mode");
    const bool agent = is_agent_mode(mode);

    // Agents run with defaults plus the flags the coordinator passed; the
    // destination's own config file never changes what they do.
    SettingsManager settings;
    if(!agent) {
      auto config_path = flags.get<std::string>("config");
      if(!config_path.empty()) {
        settings.set_settings_path(config_path);
        if(!settings.load()) {
          init(false);
          print_err(nullptr, "Cannot load configuration file {}", config_path);
          return 1;
        }
      } else {
        settings.write_default_file(settings.settings_path());
        settings.load();
      }
    }
    settings.overlay(flags);

    init(settings.get<bool>("verbose"), resolve_log_file(settings.get<std::string>("log_file")), agent);

    if(agent) {
      auto logger = std::make_shared<Logger>(mode + "-agent");
      return run_agent_mode(settings, std::cin, [](const std::string& line){
        std::cout << line << std::endl;
      }, logger);
    }

    auto logger = std::make_shared<Logger>("migrate");
    if(mode != "migrate") {
      logger->error("Unknown mode '{}'", mode);
      parser.usage();
      return 1;
    }
    if(settings.get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    TransferConfiguration config;
    try {
      config = TransferConfiguration::from_settings(settings);
      config.require_migration_fields();
    } catch(const ConfigurationError& e) {
      logger->error("{}", e.what());
      return 1;
    }

    std::unique_ptr<SshRemoteExecutor> executor;
    try {
      SshOptions ssh;
      ssh.user = config.user;
      ssh.port = config.ssh_port;
      ssh.password = config.password;
      executor = std::make_unique<SshRemoteExecutor>(ssh, logger);
    } catch(const DependencyError& e) {
      logger->error("{}", e.what());
      return 1;
    }

    ReadlineConfirmer confirmer;
    MailNotifier notifier(config.notify_email, logger);
    OpenSslKeySource key_source;
    TransferCoordinator coordinator(config, *executor, confirmer, notifier, key_source, logger);
    auto outcome = coordinator.run();
    return outcome.exit_code();
  } catch(std::exception& e) {
    init(false);
    Logger logger("disk-migrate");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
