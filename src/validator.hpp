#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class Logger;
class RemoteExecutor;

enum class SamplePosition { Start, Middle, End };

const char* sample_position_name(SamplePosition position);

struct ValidationSample {
  SamplePosition position = SamplePosition::Start;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::string source_digest;
  std::string dest_digest;
  // Set when either side could not be digested.
  std::string error;

  bool matches() const {
    return error.empty() && !source_digest.empty() && source_digest == dest_digest;
  }
};

struct ValidationReport {
  std::vector<ValidationSample> samples;

  bool passed() const;
  std::vector<SamplePosition> failures() const;
  // "start ok, middle MISMATCH, end ok"
  std::string summary() const;
};

// Start, middle and end windows of min(sample_size, total_bytes) bytes. The
// middle one is aligned down to sample_block. Windows overlap on extents
// smaller than two samples; an empty extent yields no windows.
std::vector<ValidationSample> plan_validation_windows(std::uint64_t total_bytes,
                                                      std::uint64_t sample_size,
                                                      std::uint64_t sample_block);

// Hex SHA-256 of [offset, offset + length) of an extent.
std::string sha256_extent_window(const std::string& path, std::uint64_t offset, std::uint64_t length);

class DigestSource {
public:
  virtual ~DigestSource() = default;
  virtual std::string digest(std::uint64_t offset, std::uint64_t length) = 0;
};

class LocalDigestSource : public DigestSource {
public:
  explicit LocalDigestSource(std::string path) : path_(std::move(path)) {}
  std::string digest(std::uint64_t offset, std::uint64_t length) override;

private:
  std::string path_;
};

// Runs the `digest` agent on the destination host.
class RemoteDigestSource : public DigestSource {
public:
  RemoteDigestSource(RemoteExecutor& executor, std::string host, std::string remote_binary, std::string path);
  std::string digest(std::uint64_t offset, std::uint64_t length) override;

private:
  RemoteExecutor& executor_;
  std::string host_;
  std::string remote_binary_;
  std::string path_;
};

class Validator {
public:
  Validator(DigestSource& source,
            DigestSource& dest,
            std::uint64_t sample_size,
            std::uint64_t sample_block,
            std::shared_ptr<Logger> logger = nullptr);

  // Always checks every window; a digest failure marks that window failed
  // and the remaining windows are still compared.
  ValidationReport validate(std::uint64_t total_bytes);

private:
  DigestSource& source_;
  DigestSource& dest_;
  std::uint64_t sample_size_;
  std::uint64_t sample_block_;
  std::shared_ptr<Logger> logger_;
};
