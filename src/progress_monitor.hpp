#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "checkpoint_store.hpp"

class Logger;

// Periodically turns the receiver's confirmed progress into a checkpoint. Runs its own
// io_context thread so a slow disk write never stalls the data path.
class ProgressMonitor {
public:
  // `base` names the transfer and its total size; its byte_offset is the
  // offset this attempt resumed from.
  ProgressMonitor(CheckpointStore& store,
                  CheckpointRecord base,
                  std::chrono::milliseconds interval,
                  std::shared_ptr<Logger> logger = nullptr);
  ~ProgressMonitor();

  ProgressMonitor(const ProgressMonitor&) = delete;
  ProgressMonitor& operator=(const ProgressMonitor&) = delete;

  void start();
  // Cancels the timer and joins the thread. No save happens after return.
  void stop();

  // Bytes the destination confirmed since the resume offset. Thread-safe.
  void observe(std::uint64_t confirmed);

  // One checkpoint attempt. Returns true when a record was written; skips
  // silently when nothing was observed or the offset would not advance.
  bool tick();

  std::uint64_t last_saved_offset() const;
  std::size_t save_count() const { return saves_.load(); }

private:
  void schedule_tick();

  CheckpointStore& store_;
  CheckpointRecord base_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  asio::steady_timer timer_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  bool started_ = false;

  std::mutex tick_mutex_;
  mutable std::mutex mutex_;
  bool observed_ = false;
  std::uint64_t confirmed_ = 0;
  std::uint64_t last_saved_ = 0;
  std::atomic<std::size_t> saves_{0};
};
