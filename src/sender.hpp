#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "pipeline.hpp"

class KeyRing;
class Logger;

struct SenderOptions {
  std::string host;
  std::uint16_t port = 0;
  std::string source_path;
  std::uint64_t offset = 0;
  // Source bytes to send, starting at offset.
  std::uint64_t length = 0;
  StageList stages;
};

struct SenderResult {
  std::uint64_t bytes_consumed = 0;   // source bytes read and pushed
  std::uint64_t bytes_on_wire = 0;    // after compression/encryption
  std::uint64_t bytes_acknowledged = 0; // synced at the destination
};

// Reads the source from `offset`, runs the sender pipeline and streams it to
// the receive agent. Blocking; meant to run on the coordinator thread.
class ExtentSender {
public:
  // Called with the bytes the receiver reports as written and synced,
  // relative to offset. Bytes still in zlib or the socket are not counted.
  using ProgressCallback = std::function<void(std::uint64_t acknowledged)>;

  ExtentSender(SenderOptions options, const KeyRing& keys, std::shared_ptr<Logger> logger);

  // Throws TransportError on connection problems or a missing/negative ack,
  // ExtentIoError on source read errors.
  SenderResult run(const ProgressCallback& progress = {});

private:
  SenderOptions options_;
  const KeyRing& keys_;
  std::shared_ptr<Logger> logger_;
};
