#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

class Logger;

struct CheckpointRecord {
  std::string source_id;
  std::string dest_id;
  std::string host;
  std::uint64_t byte_offset = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t block_size = 0;
  std::int64_t saved_at_epoch = 0;
};

// One checkpoint slot, <state_dir>/transfer_state.json. Writes go through a
// temp file and rename(), so readers see either the old or the new record.
class CheckpointStore {
public:
  static constexpr const char* kRecordFileName = "transfer_state.json";

  explicit CheckpointStore(std::filesystem::path state_dir, std::shared_ptr<Logger> logger = nullptr);

  // Throws ConfigurationError for a record that breaks its own invariants
  // and MigrationError when the file cannot be written.
  void save(const CheckpointRecord& record);

  // nullopt when nothing is stored. StateMismatchError when the stored record
  // belongs to another (source, dest, host); ConfigurationError when corrupt.
  std::optional<CheckpointRecord> load(const std::string& source_id,
                                       const std::string& dest_id,
                                       const std::string& host) const;

  // Removes the record only if it belongs to this triple.
  void clear(const std::string& source_id, const std::string& dest_id, const std::string& host);

  std::filesystem::path record_path() const { return state_dir_ / kRecordFileName; }
  const std::filesystem::path& state_dir() const { return state_dir_; }

private:
  std::optional<CheckpointRecord> read_any() const;

  std::filesystem::path state_dir_;
  std::shared_ptr<Logger> logger_;
};

// Exclusive flock on <state_dir>/<digest of triple>.lock for the lifetime of
// the object. A second holder for the same triple gets ConfigurationError.
class TransferLock {
public:
  TransferLock(const std::filesystem::path& state_dir,
               const std::string& source_id,
               const std::string& dest_id,
               const std::string& host);
  ~TransferLock();

  TransferLock(const TransferLock&) = delete;
  TransferLock& operator=(const TransferLock&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_ = -1;
};
