#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class MigrationError : public std::runtime_error {
public:
  explicit MigrationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Wrong or inconsistent parameters. Never retried.
class ConfigurationError : public MigrationError {
public:
  explicit ConfigurationError(const std::string& msg) : MigrationError(msg) {}
};

class InsufficientCapacityError : public ConfigurationError {
public:
  InsufficientCapacityError(std::uint64_t source_bytes, std::uint64_t dest_bytes)
    : ConfigurationError("Source size (" + std::to_string(source_bytes) +
                         " bytes) is larger than destination size (" +
                         std::to_string(dest_bytes) + " bytes)"),
      source_bytes_(source_bytes), dest_bytes_(dest_bytes) {}

  std::uint64_t source_bytes() const { return source_bytes_; }
  std::uint64_t dest_bytes() const { return dest_bytes_; }

private:
  std::uint64_t source_bytes_;
  std::uint64_t dest_bytes_;
};

class MisalignedOffsetError : public ConfigurationError {
public:
  MisalignedOffsetError(std::uint64_t offset, std::uint64_t block_size)
    : ConfigurationError("Offset " + std::to_string(offset) +
                         " is not a multiple of block size " + std::to_string(block_size)),
      offset_(offset), block_size_(block_size) {}

  std::uint64_t offset() const { return offset_; }
  std::uint64_t block_size() const { return block_size_; }

private:
  std::uint64_t offset_;
  std::uint64_t block_size_;
};

// A stored checkpoint belongs to a different (source, destination, host).
class StateMismatchError : public ConfigurationError {
public:
  explicit StateMismatchError(const std::string& msg) : ConfigurationError(msg) {}
};

// Listener unreachable, connection dropped, short stream.
class TransportError : public MigrationError {
public:
  explicit TransportError(const std::string& msg) : MigrationError(msg) {}
};

class ExtentIoError : public MigrationError {
public:
  explicit ExtentIoError(const std::string& msg) : MigrationError(msg) {}
};

// Undecodable stream: bad gzip data, failed decrypt, stage mismatch.
class PipelineError : public MigrationError {
public:
  explicit PipelineError(const std::string& msg) : MigrationError(msg) {}
};

class DependencyError : public MigrationError {
public:
  explicit DependencyError(const std::string& msg) : MigrationError(msg) {}
};
