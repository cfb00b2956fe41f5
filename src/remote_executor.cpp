#include "remote_executor.hpp"

#include "errors.hpp"
#include "log.hpp"

namespace {

class SshRemoteProcess : public RemoteProcess {
public:
  explicit SshRemoteProcess(std::unique_ptr<ChildProcess> child) : child_(std::move(child)) {}

  void write_stdin(const std::string& data) override { child_->write_stdin(data); }
  void close_stdin() override { child_->close_stdin(); }
  LineRead read_line(std::chrono::milliseconds timeout) override { return child_->read_line(timeout); }
  int wait() override { return child_->wait(); }
  void terminate() override { child_->terminate(); }

private:
  std::unique_ptr<ChildProcess> child_;
};

} // namespace

std::string CommandResult::first_line() const {
  auto end = stdout_text.find('\n');
  std::string line = stdout_text.substr(0, end);
  while(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

SshRemoteExecutor::SshRemoteExecutor(SshOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), logger_(std::move(logger)) {
  if(!executable_in_path("ssh")) {
    throw DependencyError("ssh is not installed (install openssh-client)");
  }
  if(!options_.password.empty() && !executable_in_path("sshpass")) {
    throw DependencyError("a password was given but sshpass is not installed");
  }
}

std::vector<std::string> SshRemoteExecutor::ssh_argv(const std::string& host, const std::string& command) const {
  std::vector<std::string> argv;
  if(!options_.password.empty()) {
    argv.insert(argv.end(), {"sshpass", "-e"});
  }
  argv.insert(argv.end(), {
    "ssh",
    "-o", "StrictHostKeyChecking=accept-new",
    "-o", "ConnectTimeout=" + std::to_string(options_.connect_timeout_seconds),
    "-p", std::to_string(options_.port)
  });
  if(options_.password.empty()) {
    argv.insert(argv.end(), {"-o", "BatchMode=yes"});
  }
  argv.push_back(options_.user.empty() ? host : options_.user + "@" + host);
  argv.push_back(command);
  return argv;
}

std::unique_ptr<ChildProcess> SshRemoteExecutor::launch(const std::string& host, const std::string& command) {
  std::vector<std::string> env;
  if(!options_.password.empty()) {
    env.push_back("SSHPASS=" + options_.password);
  }
  log_debug(logger_.get(), "ssh {}: {}", host, command);
  return ChildProcess::spawn(ssh_argv(host, command), env);
}

CommandResult SshRemoteExecutor::execute(const std::string& host, const std::string& command) {
  auto child = launch(host, command);
  child->close_stdin();
  CommandResult result;
  result.stdout_text = child->read_all();
  result.exit_code = child->wait();
  if(result.exit_code == 255) {
    throw TransportError("ssh to " + host + " failed (exit 255)");
  }
  return result;
}

std::unique_ptr<RemoteProcess> SshRemoteExecutor::start(const std::string& host, const std::string& command) {
  return std::make_unique<SshRemoteProcess>(launch(host, command));
}
