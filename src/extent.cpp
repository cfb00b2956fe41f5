#include "extent.hpp"

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <vector>

#include "errors.hpp"

namespace {

[[noreturn]] void throw_errno(const std::string& what, const std::string& path) {
  std::ostringstream oss;
  oss << what << " '" << path << "': " << std::strerror(errno);
  throw ExtentIoError(oss.str());
}

std::string timestamp_suffix() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
  return stamp;
}

} // namespace

std::string resolve_extent_path(const std::string& identifier) {
  if(identifier.empty()) {
    throw ConfigurationError("extent identifier is empty");
  }
  if(identifier.find('/') != std::string::npos) return identifier;
  return "/dev/" + identifier;
}

std::uint64_t extent_size(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0) {
    throw_errno("failed to open extent", path);
  }
  struct stat st{};
  if(::fstat(fd, &st) != 0) {
    int saved = errno;
    ::close(fd);
    errno = saved;
    throw_errno("failed to stat extent", path);
  }
  std::uint64_t size = 0;
  if(S_ISBLK(st.st_mode)) {
    if(::ioctl(fd, BLKGETSIZE64, &size) != 0) {
      int saved = errno;
      ::close(fd);
      errno = saved;
      throw_errno("BLKGETSIZE64 failed for", path);
    }
  } else if(S_ISREG(st.st_mode)) {
    size = static_cast<std::uint64_t>(st.st_size);
  } else {
    ::close(fd);
    throw ExtentIoError("'" + path + "' is neither a block device nor a regular file");
  }
  ::close(fd);
  return size;
}

Extent measure_extent(const std::string& identifier) {
  Extent extent;
  extent.identifier = identifier;
  extent.byte_length = extent_size(resolve_extent_path(identifier));
  return extent;
}

ExtentFile::ExtentFile(int fd, std::string path, std::uint64_t offset)
  : fd_(fd), path_(std::move(path)), position_(offset) {}

ExtentFile ExtentFile::open_for_read(const std::string& path, std::uint64_t offset) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0) {
    throw_errno("failed to open source extent", path);
  }
  return ExtentFile(fd, path, offset);
}

ExtentFile ExtentFile::open_for_write(const std::string& path, std::uint64_t offset) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if(fd < 0) {
    throw_errno("failed to open destination extent", path);
  }
  return ExtentFile(fd, path, offset);
}

ExtentFile::ExtentFile(ExtentFile&& other) noexcept
  : fd_(other.fd_), path_(std::move(other.path_)), position_(other.position_) {
  other.fd_ = -1;
}

ExtentFile& ExtentFile::operator=(ExtentFile&& other) noexcept {
  if(this != &other) {
    close_fd();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    position_ = other.position_;
    other.fd_ = -1;
  }
  return *this;
}

ExtentFile::~ExtentFile() {
  close_fd();
}

void ExtentFile::close_fd() noexcept {
  if(fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::size_t ExtentFile::read_full(char* data, std::size_t size) {
  std::size_t done = 0;
  while(done < size) {
    ssize_t rc = ::pread(fd_, data + done, size - done, static_cast<off_t>(position_));
    if(rc < 0) {
      if(errno == EINTR) continue;
      throw_errno("read failed on", path_);
    }
    if(rc == 0) break;
    done += static_cast<std::size_t>(rc);
    position_ += static_cast<std::uint64_t>(rc);
  }
  return done;
}

void ExtentFile::write_all(const char* data, std::size_t size) {
  std::size_t done = 0;
  while(done < size) {
    ssize_t rc = ::pwrite(fd_, data + done, size - done, static_cast<off_t>(position_));
    if(rc < 0) {
      if(errno == EINTR) continue;
      throw_errno("write failed on", path_);
    }
    if(rc == 0) {
      throw ExtentIoError("no space left writing '" + path_ + "' at offset " + std::to_string(position_));
    }
    done += static_cast<std::size_t>(rc);
    position_ += static_cast<std::uint64_t>(rc);
  }
}

void ExtentFile::sync() {
  if(::fdatasync(fd_) != 0 && errno != EINVAL) {
    throw_errno("fdatasync failed on", path_);
  }
}

std::filesystem::path backup_extent_head(const std::string& path,
                                         const std::filesystem::path& dir,
                                         std::uint64_t bytes) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if(ec) {
    throw ExtentIoError("cannot create backup directory '" + dir.string() + "': " + ec.message());
  }
  auto source = ExtentFile::open_for_read(path, 0);
  std::vector<char> head(static_cast<std::size_t>(bytes));
  head.resize(source.read_full(head.data(), head.size()));

  auto target = dir / (std::filesystem::path(path).filename().string() + "-mbr-" + timestamp_suffix() + ".img");
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  out.write(head.data(), static_cast<std::streamsize>(head.size()));
  if(!out) {
    throw ExtentIoError("failed to write backup image '" + target.string() + "'");
  }
  return target;
}
