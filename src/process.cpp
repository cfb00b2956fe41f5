#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include "errors.hpp"

extern char** environ;

namespace {

void close_quietly(int& fd) {
  if(fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  const std::vector<std::string>& extra_env) {
  if(argv.empty()) {
    throw DependencyError("empty command line");
  }
  int in_pipe[2];
  int out_pipe[2];
  if(::pipe2(in_pipe, O_CLOEXEC) != 0) {
    throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
  }
  if(::pipe2(out_pipe, O_CLOEXEC) != 0) {
    int saved = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    throw TransportError(std::string("pipe failed: ") + std::strerror(saved));
  }

  // Built before fork; the child must not allocate.
  std::vector<std::string> args = argv;
  std::vector<char*> c_argv;
  for(auto& arg : args) c_argv.push_back(arg.data());
  c_argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  for(char** entry = environ; entry && *entry; ++entry) env_strings.emplace_back(*entry);
  for(const auto& extra : extra_env) env_strings.push_back(extra);
  std::vector<char*> c_env;
  for(auto& entry : env_strings) c_env.push_back(entry.data());
  c_env.push_back(nullptr);

  pid_t pid = ::fork();
  if(pid < 0) {
    int saved = errno;
    ::close(in_pipe[0]); ::close(in_pipe[1]);
    ::close(out_pipe[0]); ::close(out_pipe[1]);
    throw TransportError(std::string("fork failed: ") + std::strerror(saved));
  }
  if(pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::execvpe(c_argv[0], c_argv.data(), c_env.data());
    const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  return std::unique_ptr<ChildProcess>(new ChildProcess(pid, in_pipe[1], out_pipe[0]));
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd)
  : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

ChildProcess::~ChildProcess() {
  close_quietly(stdin_fd_);
  if(!exit_status_) {
    terminate();
  }
  close_quietly(stdout_fd_);
}

void ChildProcess::write_stdin(const std::string& data) {
  if(stdin_fd_ < 0) {
    throw TransportError("child stdin is already closed");
  }
  std::size_t done = 0;
  while(done < data.size()) {
    ssize_t rc = ::write(stdin_fd_, data.data() + done, data.size() - done);
    if(rc < 0) {
      if(errno == EINTR) continue;
      throw TransportError(std::string("writing to child stdin failed: ") + std::strerror(errno));
    }
    done += static_cast<std::size_t>(rc);
  }
}

void ChildProcess::close_stdin() {
  close_quietly(stdin_fd_);
}

bool ChildProcess::fill_buffer(int timeout_ms) {
  if(eof_) return false;
  pollfd pfd{stdout_fd_, POLLIN, 0};
  int rc = 0;
  do {
    rc = ::poll(&pfd, 1, timeout_ms);
  } while(rc < 0 && errno == EINTR);
  if(rc < 0) {
    throw TransportError(std::string("poll failed: ") + std::strerror(errno));
  }
  if(rc == 0) return false;

  char chunk[4096];
  ssize_t got = 0;
  do {
    got = ::read(stdout_fd_, chunk, sizeof(chunk));
  } while(got < 0 && errno == EINTR);
  if(got < 0) {
    throw TransportError(std::string("reading child stdout failed: ") + std::strerror(errno));
  }
  if(got == 0) {
    eof_ = true;
    return false;
  }
  buffer_.append(chunk, static_cast<std::size_t>(got));
  return true;
}

LineRead ChildProcess::read_line(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for(;;) {
    auto newline = buffer_.find('\n');
    if(newline != std::string::npos) {
      LineRead result{LineRead::Status::Line, buffer_.substr(0, newline)};
      buffer_.erase(0, newline + 1);
      return result;
    }
    if(eof_) {
      if(!buffer_.empty()) {
        LineRead result{LineRead::Status::Line, buffer_};
        buffer_.clear();
        return result;
      }
      return LineRead{LineRead::Status::Closed, {}};
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if(remaining.count() <= 0) {
      return LineRead{LineRead::Status::Timeout, {}};
    }
    fill_buffer(static_cast<int>(remaining.count()));
  }
}

std::string ChildProcess::read_all() {
  while(!eof_) fill_buffer(-1);
  std::string out;
  out.swap(buffer_);
  return out;
}

int ChildProcess::wait() {
  if(exit_status_) return *exit_status_;
  int status = 0;
  pid_t rc = 0;
  do {
    rc = ::waitpid(pid_, &status, 0);
  } while(rc < 0 && errno == EINTR);
  if(rc < 0) {
    exit_status_ = 127;
  } else if(WIFEXITED(status)) {
    exit_status_ = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    exit_status_ = 128 + WTERMSIG(status);
  } else {
    exit_status_ = 1;
  }
  return *exit_status_;
}

void ChildProcess::terminate() {
  if(exit_status_ || pid_ <= 0) return;
  ::kill(pid_, SIGTERM);
  wait();
}

bool executable_in_path(const std::string& name) {
  if(name.empty()) return false;
  if(name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }
  const char* path = std::getenv("PATH");
  std::istringstream dirs(path ? path : "/usr/bin:/bin");
  std::string dir;
  while(std::getline(dirs, dir, ':')) {
    if(dir.empty()) dir = ".";
    auto candidate = std::filesystem::path(dir) / name;
    if(::access(candidate.c_str(), X_OK) == 0) return true;
  }
  return false;
}
