#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct LineRead {
  enum class Status { Line, Timeout, Closed };
  Status status = Status::Closed;
  std::string line;
};

// A child with piped stdin and stdout; stderr is inherited so ssh and agent
// diagnostics reach the operator's terminal.
class ChildProcess {
public:
  // argv[0] is looked up in PATH. `extra_env` entries are NAME=value and are
  // added to the inherited environment of the child only.
  static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                             const std::vector<std::string>& extra_env = {});
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  void write_stdin(const std::string& data);
  void close_stdin();

  LineRead read_line(std::chrono::milliseconds timeout);
  // Everything left on stdout, until the child closes it.
  std::string read_all();

  // Exit status; 128+signal when killed. Idempotent.
  int wait();
  void terminate();

  pid_t pid() const { return pid_; }

private:
  ChildProcess(pid_t pid, int stdin_fd, int stdout_fd);
  bool fill_buffer(int timeout_ms);

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  std::string buffer_;
  bool eof_ = false;
  std::optional<int> exit_status_;
};

// True when `name` resolves to an executable through PATH.
bool executable_in_path(const std::string& name);
