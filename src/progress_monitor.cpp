#include "progress_monitor.hpp"

#include <algorithm>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

ProgressMonitor::ProgressMonitor(CheckpointStore& store,
                                 CheckpointRecord base,
                                 std::chrono::milliseconds interval,
                                 std::shared_ptr<Logger> logger)
  : store_(store),
    base_(std::move(base)),
    interval_(interval),
    logger_(std::move(logger)),
    timer_(io_),
    last_saved_(base_.byte_offset) {
  if(interval_.count() <= 0) {
    interval_ = std::chrono::milliseconds(30000);
  }
}

ProgressMonitor::~ProgressMonitor() {
  stop();
}

void ProgressMonitor::start() {
  if(started_) return;
  started_ = true;
  schedule_tick();
  thread_ = std::thread([this](){
    io_.run();
  });
}

void ProgressMonitor::schedule_tick() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const asio::error_code& ec){
    if(ec || stopping_) return;
    tick();
    schedule_tick();
  });
}

void ProgressMonitor::stop() {
  stopping_ = true;
  if(!started_) return;
  started_ = false;
  asio::post(io_, [this](){
    timer_.cancel();
  });
  if(thread_.joinable()) {
    thread_.join();
  }
}

void ProgressMonitor::observe(std::uint64_t confirmed) {
  std::lock_guard<std::mutex> lock(mutex_);
  observed_ = true;
  confirmed_ = confirmed;
}

bool ProgressMonitor::tick() {
  std::lock_guard<std::mutex> tick_lock(tick_mutex_);
  std::uint64_t confirmed = 0;
  std::uint64_t last_saved = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!observed_) return false;
    confirmed = confirmed_;
    last_saved = last_saved_;
  }

  std::uint64_t position = std::min(base_.byte_offset + confirmed, base_.total_bytes);
  std::uint64_t candidate = align_down(position, base_.block_size);
  if(candidate <= last_saved) return false;

  CheckpointRecord record = base_;
  record.byte_offset = candidate;
  record.saved_at_epoch = 0;
  try {
    store_.save(record);
  } catch(const MigrationError& e) {
    log_warn(logger_.get(), "Checkpoint save at offset {} failed: {}", candidate, e.what());
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_saved_ = candidate;
  }
  ++saves_;
  log_debug(logger_.get(), "Checkpoint at {} of {} bytes", candidate, base_.total_bytes);
  return true;
}

std::uint64_t ProgressMonitor::last_saved_offset() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_saved_;
}
