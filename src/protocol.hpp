#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "pipeline.hpp"

using json = nlohmann::json;

// protocol.hpp
inline constexpr int kStreamProtocolVersion = 1;

// First line on the data socket, sender -> receiver.
struct StreamHeader {
  int version = kStreamProtocolVersion;
  StageList stages;            // sender order
  std::uint64_t offset = 0;    // first source byte in the payload
  std::uint64_t length = 0;    // source bytes in the payload
  std::uint64_t block_size = 0;
};

json make_stream_header(const StreamHeader& header);
// Throws PipelineError on anything that is not a well-formed header.
StreamHeader parse_stream_header(const std::string& line);

// Receiver -> sender lines. stream_progress reports bytes already synced to
// the destination; stream_ack or stream_error is the last line.
json make_stream_progress(std::uint64_t bytes_written);
json make_stream_ack(std::uint64_t bytes_written);
json make_stream_error(const std::string& message);

struct StreamReply {
  enum class Kind { Progress, Ack, Error };
  Kind kind = Kind::Error;
  std::uint64_t bytes_written = 0;
  std::string message;
};

// Throws TransportError on anything the receiver would never send.
StreamReply parse_stream_reply(const std::string& line);

// Agent stdout lines.
struct AgentLine {
  enum class Kind { Ready, Done, Error, Value };
  Kind kind = Kind::Value;
  std::string payload;
};

std::string make_ready_line(std::uint16_t port);
std::string make_done_line(std::uint64_t bytes);
std::string make_error_line(const std::string& message);
AgentLine parse_agent_line(const std::string& line);
