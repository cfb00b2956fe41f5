#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class Logger;
class SettingsManager;

// Destination-side entry points of the binary. Each mode writes its result
// as lines through `emit` (stdout in production):
//   receive  READY <port>, then DONE <bytes>
//   size     <bytes>
//   digest   <sha256 hex>
//   backup   <image path>
//   probe    ok
// and ERROR <message> with a non-zero return on failure.

using AgentEmit = std::function<void(const std::string& line)>;
using AgentOptions = std::vector<std::pair<std::string, std::string>>;

bool is_agent_mode(const std::string& mode);

// Shell command line that runs `binary <mode> --key=value...` remotely.
std::string agent_command(const std::string& binary, const std::string& mode, const AgentOptions& options);

// `control` is the agent's stdin; an encrypted receive reads its key there.
int run_agent_mode(const SettingsManager& settings,
                   std::istream& control,
                   const AgentEmit& emit,
                   std::shared_ptr<Logger> logger = nullptr);
