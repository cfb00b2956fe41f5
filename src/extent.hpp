#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

struct Extent {
  std::string identifier;
  std::uint64_t byte_length = 0;
};

// "sda" -> "/dev/sda"; anything containing a '/' is taken as a path.
std::string resolve_extent_path(const std::string& identifier);

// BLKGETSIZE64 for block devices, st_size for regular files.
std::uint64_t extent_size(const std::string& path);

Extent measure_extent(const std::string& identifier);

// Positioned access to a block device or image file. Writers never truncate
// and never create: bytes outside the written range are left untouched.
class ExtentFile {
public:
  static ExtentFile open_for_read(const std::string& path, std::uint64_t offset);
  static ExtentFile open_for_write(const std::string& path, std::uint64_t offset);

  ExtentFile(ExtentFile&& other) noexcept;
  ExtentFile& operator=(ExtentFile&& other) noexcept;
  ExtentFile(const ExtentFile&) = delete;
  ExtentFile& operator=(const ExtentFile&) = delete;
  ~ExtentFile();

  // Reads until `size` bytes or end of extent; returns the count read.
  std::size_t read_full(char* data, std::size_t size);
  void write_all(const char* data, std::size_t size);
  void sync();

  std::uint64_t position() const { return position_; }
  const std::string& path() const { return path_; }

private:
  ExtentFile(int fd, std::string path, std::uint64_t offset);
  void close_fd() noexcept;

  int fd_ = -1;
  std::string path_;
  std::uint64_t position_ = 0;
};

constexpr std::uint64_t kMetadataBackupBytes = 1024 * 1024;

// Copies the first `bytes` of `path` (MBR/GPT and partition table) into
// `<dir>/<basename>-mbr-<timestamp>.img` and returns the image path.
std::filesystem::path backup_extent_head(const std::string& path,
                                         const std::filesystem::path& dir,
                                         std::uint64_t bytes = kMetadataBackupBytes);
