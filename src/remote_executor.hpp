#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "process.hpp"

class Logger;

struct CommandResult {
  std::string stdout_text;
  int exit_code = 0;

  // First stdout line without its newline.
  std::string first_line() const;
};

// A long-running command on the destination host (the receive agent).
class RemoteProcess {
public:
  virtual ~RemoteProcess() = default;
  virtual void write_stdin(const std::string& data) = 0;
  virtual void close_stdin() = 0;
  virtual LineRead read_line(std::chrono::milliseconds timeout) = 0;
  virtual int wait() = 0;
  virtual void terminate() = 0;
};

class RemoteExecutor {
public:
  virtual ~RemoteExecutor() = default;

  // Runs `command` (a shell command line) on `host` to completion.
  virtual CommandResult execute(const std::string& host, const std::string& command) = 0;
  virtual std::unique_ptr<RemoteProcess> start(const std::string& host, const std::string& command) = 0;
};

struct SshOptions {
  std::string user;
  std::uint16_t port = 22;
  // When non-empty ssh runs under `sshpass -e`; the password travels in the
  // SSHPASS environment variable, never on a command line.
  std::string password;
  int connect_timeout_seconds = 10;
};

class SshRemoteExecutor : public RemoteExecutor {
public:
  // Throws DependencyError when ssh (or sshpass, with a password) is missing.
  SshRemoteExecutor(SshOptions options, std::shared_ptr<Logger> logger = nullptr);

  CommandResult execute(const std::string& host, const std::string& command) override;
  std::unique_ptr<RemoteProcess> start(const std::string& host, const std::string& command) override;

  // The argv that runs `command` on `host`, without the environment.
  std::vector<std::string> ssh_argv(const std::string& host, const std::string& command) const;

private:
  std::unique_ptr<ChildProcess> launch(const std::string& host, const std::string& command);

  SshOptions options_;
  std::shared_ptr<Logger> logger_;
};
