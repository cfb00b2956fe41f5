#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "pipeline.hpp"

class ExtentFile;
class KeyRing;
class Logger;
struct StreamHeader;

struct ReceiverOptions {
  std::string listen_ip = "0.0.0.0";
  std::uint16_t port = 0;          // 0 picks an ephemeral port
  std::string dest_path;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;        // source bytes expected from offset
  StageList stages;                // receiver order, as built locally
  std::chrono::milliseconds accept_timeout{300000};
  // Sync and report progress to the sender after this many written bytes.
  std::uint64_t progress_interval = 8ull << 20;
};

// Destination end of the data channel. bind() must succeed before the agent
// reports READY; run() then accepts exactly one sender and writes its
// decoded payload at `offset` without truncating the extent. Every
// stream_progress line it sends counts bytes already synced to disk, so the
// sender may checkpoint them.
class ExtentReceiver {
public:
  ExtentReceiver(ReceiverOptions options, const KeyRing& keys, std::shared_ptr<Logger> logger);
  ~ExtentReceiver();

  // Returns the bound port. Throws TransportError if the port is taken.
  std::uint16_t bind();

  // Returns the bytes written. Throws TransportError on accept timeout or a
  // short stream, PipelineError on header/stage mismatch or undecodable
  // data, ExtentIoError on write failure.
  std::uint64_t run();

  std::uint16_t port() const { return bound_port_; }

private:
  using tcp = asio::ip::tcp;

  void accept_with_timeout();
  void verify_header(const StreamHeader& header) const;
  void reject(const std::string& message);
  void report_progress(ExtentFile& dest, std::uint64_t written);

  ReceiverOptions options_;
  const KeyRing& keys_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  tcp::acceptor acceptor_;
  tcp::socket socket_;
  std::uint16_t bound_port_ = 0;
};
