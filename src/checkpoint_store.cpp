#include "checkpoint_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

void ensure_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if(ec) {
    throw MigrationError("cannot create state directory '" + dir.string() + "': " + ec.message());
  }
}

void write_file_durably(const std::filesystem::path& path, const std::string& contents) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if(fd < 0) {
    throw MigrationError("cannot open '" + path.string() + "': " + std::strerror(errno));
  }
  std::size_t done = 0;
  while(done < contents.size()) {
    ssize_t rc = ::write(fd, contents.data() + done, contents.size() - done);
    if(rc < 0) {
      if(errno == EINTR) continue;
      int saved = errno;
      ::close(fd);
      throw MigrationError("cannot write '" + path.string() + "': " + std::strerror(saved));
    }
    done += static_cast<std::size_t>(rc);
  }
  if(::fsync(fd) != 0) {
    int saved = errno;
    ::close(fd);
    throw MigrationError("cannot fsync '" + path.string() + "': " + std::strerror(saved));
  }
  ::close(fd);
}

template<typename T>
T required_field(const nlohmann::json& doc, const char* field, const std::filesystem::path& origin) {
  if(!doc.contains(field)) {
    throw ConfigurationError("checkpoint '" + origin.string() + "' has no '" + field + "'");
  }
  try {
    return doc.at(field).get<T>();
  } catch(const nlohmann::json::exception& e) {
    throw ConfigurationError("checkpoint '" + origin.string() + "' has a bad '" + field + "': " + e.what());
  }
}

// get<std::uint64_t>() would wrap a negative number instead of rejecting it.
std::uint64_t required_u64(const nlohmann::json& doc, const char* field, const std::filesystem::path& origin) {
  if(!doc.contains(field)) {
    throw ConfigurationError("checkpoint '" + origin.string() + "' has no '" + field + "'");
  }
  if(!doc.at(field).is_number_unsigned()) {
    throw ConfigurationError("checkpoint '" + origin.string() + "' has a bad '" + field +
                             "': expected a non-negative integer, got " + doc.at(field).dump());
  }
  return doc.at(field).get<std::uint64_t>();
}

std::int64_t now_epoch() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

CheckpointStore::CheckpointStore(std::filesystem::path state_dir, std::shared_ptr<Logger> logger)
  : state_dir_(std::move(state_dir)), logger_(std::move(logger)) {}

void CheckpointStore::save(const CheckpointRecord& record) {
  if(record.byte_offset > record.total_bytes) {
    throw ConfigurationError("checkpoint offset " + std::to_string(record.byte_offset) +
                             " exceeds total size " + std::to_string(record.total_bytes));
  }
  if(record.block_size == 0 || record.byte_offset % record.block_size != 0) {
    throw MisalignedOffsetError(record.byte_offset, record.block_size);
  }
  ensure_dir(state_dir_);

  nlohmann::json doc;
  doc["source"] = record.source_id;
  doc["destination"] = record.dest_id;
  doc["host"] = record.host;
  doc["offset"] = record.byte_offset;
  doc["total_size"] = record.total_bytes;
  doc["block_size"] = record.block_size;
  doc["timestamp"] = record.saved_at_epoch != 0 ? record.saved_at_epoch : now_epoch();

  auto target = record_path();
  auto temp = target;
  temp += ".tmp." + std::to_string(::getpid());
  write_file_durably(temp, doc.dump(2) + "\n");
  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if(ec) {
    std::filesystem::remove(temp, ec);
    throw MigrationError("cannot replace checkpoint '" + target.string() + "'");
  }
  log_debug(logger_.get(), "Checkpoint saved: offset {} of {}", record.byte_offset, record.total_bytes);
}

std::optional<CheckpointRecord> CheckpointStore::read_any() const {
  auto path = record_path();
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return std::nullopt;

  std::ifstream in(path);
  if(!in) {
    throw ConfigurationError("cannot read checkpoint '" + path.string() + "'");
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw ConfigurationError("checkpoint '" + path.string() + "' is corrupt: " + e.what());
  }
  if(!doc.is_object()) {
    throw ConfigurationError("checkpoint '" + path.string() + "' is not a JSON object");
  }

  CheckpointRecord record;
  record.source_id = required_field<std::string>(doc, "source", path);
  record.dest_id = required_field<std::string>(doc, "destination", path);
  record.host = required_field<std::string>(doc, "host", path);
  record.byte_offset = required_u64(doc, "offset", path);
  record.total_bytes = required_u64(doc, "total_size", path);
  record.block_size = doc.contains("block_size") ? required_u64(doc, "block_size", path) : 0;
  record.saved_at_epoch = doc.contains("timestamp") ? required_field<std::int64_t>(doc, "timestamp", path) : 0;

  if(record.byte_offset > record.total_bytes) {
    throw ConfigurationError("checkpoint offset " + std::to_string(record.byte_offset) +
                             " exceeds its total size " + std::to_string(record.total_bytes));
  }
  return record;
}

std::optional<CheckpointRecord> CheckpointStore::load(const std::string& source_id,
                                                      const std::string& dest_id,
                                                      const std::string& host) const {
  auto record = read_any();
  if(!record) return std::nullopt;

  std::ostringstream mismatch;
  if(record->source_id != source_id) {
    mismatch << " source '" << record->source_id << "' != '" << source_id << "'";
  }
  if(record->dest_id != dest_id) {
    mismatch << " destination '" << record->dest_id << "' != '" << dest_id << "'";
  }
  if(record->host != host) {
    mismatch << " host '" << record->host << "' != '" << host << "'";
  }
  if(!mismatch.str().empty()) {
    throw StateMismatchError("saved checkpoint belongs to another transfer:" + mismatch.str());
  }
  log_info(logger_.get(), "Loaded checkpoint: offset {} of {} bytes", record->byte_offset, record->total_bytes);
  return record;
}

void CheckpointStore::clear(const std::string& source_id, const std::string& dest_id, const std::string& host) {
  std::optional<CheckpointRecord> record;
  try {
    record = read_any();
  } catch(const ConfigurationError& e) {
    log_warn(logger_.get(), "Leaving unreadable checkpoint in place: {}", e.what());
    return;
  }
  if(!record) return;
  if(record->source_id != source_id || record->dest_id != dest_id || record->host != host) {
    log_debug(logger_.get(), "Checkpoint belongs to {} -> {}:{}, not clearing",
              record->source_id, record->host, record->dest_id);
    return;
  }
  std::error_code ec;
  std::filesystem::remove(record_path(), ec);
  if(ec) {
    throw MigrationError("cannot remove checkpoint '" + record_path().string() + "': " + ec.message());
  }
  log_debug(logger_.get(), "Checkpoint cleared");
}

TransferLock::TransferLock(const std::filesystem::path& state_dir,
                           const std::string& source_id,
                           const std::string& dest_id,
                           const std::string& host) {
  ensure_dir(state_dir);
  path_ = state_dir / (sha256_hex(source_id + '\n' + dest_id + '\n' + host).substr(0, 16) + ".lock");
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if(fd_ < 0) {
    throw ConfigurationError("cannot open lock file '" + path_.string() + "': " + std::strerror(errno));
  }
  if(::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    int saved = errno;
    ::close(fd_);
    fd_ = -1;
    if(saved == EWOULDBLOCK) {
      throw ConfigurationError("transfer already in progress for " + source_id + " -> " + host + ":" + dest_id);
    }
    throw ConfigurationError("cannot lock '" + path_.string() + "': " + std::strerror(saved));
  }
}

TransferLock::~TransferLock() {
  if(fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}
