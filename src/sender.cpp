#include "sender.hpp"

#include <asio.hpp>

#include <algorithm>
#include <optional>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "extent.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transforms.hpp"

namespace {

using tcp = asio::ip::tcp;

std::uint64_t raw_block_size(const StageList& stages) {
  for(const auto& stage : stages) {
    if(auto* raw = std::get_if<RawStage>(&stage)) return raw->block_size;
  }
  throw PipelineError("sender pipeline has no raw_read stage");
}

// Lines the receiver sends back while the payload is still going out.
class ReplyReader {
public:
  explicit ReplyReader(tcp::socket& socket) : socket_(socket) {}

  // Returns a complete line if one has arrived, without blocking.
  std::optional<std::string> poll() {
    if(auto line = take_line()) return line;
    std::size_t ready = socket_.available();
    if(ready == 0) return std::nullopt;
    auto got = socket_.read_some(buffer_.prepare(ready));
    buffer_.commit(got);
    return take_line();
  }

  std::string next() {
    if(auto line = take_line()) return *line;
    asio::error_code ec;
    asio::read_until(socket_, buffer_, '\n', ec);
    if(auto line = take_line()) return *line;
    throw TransportError("receiver closed the connection without acknowledging" +
                         (ec ? ": " + ec.message() : std::string()));
  }

private:
  std::optional<std::string> take_line() {
    auto data = buffer_.data();
    auto begin = asio::buffers_begin(data);
    auto end = asio::buffers_end(data);
    auto newline = std::find(begin, end, '\n');
    if(newline == end) return std::nullopt;
    std::string line(begin, newline);
    buffer_.consume(line.size() + 1);
    return line;
  }

  tcp::socket& socket_;
  asio::streambuf buffer_;
};

} // namespace

ExtentSender::ExtentSender(SenderOptions options, const KeyRing& keys, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), keys_(keys), logger_(std::move(logger)) {}

SenderResult ExtentSender::run(const ProgressCallback& progress) {
  SenderResult result;
  const std::uint64_t block_size = raw_block_size(options_.stages);
  auto source = ExtentFile::open_for_read(options_.source_path, options_.offset);

  asio::io_context io;
  tcp::socket socket(io);
  try {
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port));
    asio::connect(socket, endpoints);
    socket.set_option(tcp::no_delay(true));
  } catch(const asio::system_error& e) {
    throw TransportError("cannot connect to " + options_.host + ":" +
                         std::to_string(options_.port) + ": " + e.what());
  }
  log_info(logger_.get(), "Connected to {}:{}, streaming {} bytes from offset {} ({})",
           options_.host, options_.port, options_.length, options_.offset,
           describe_stages(options_.stages));

  try {
    StreamHeader header;
    header.stages = options_.stages;
    header.offset = options_.offset;
    header.length = options_.length;
    header.block_size = block_size;
    asio::write(socket, asio::buffer(make_stream_header(header).dump() + "\n"));

    auto runner = PipelineRunner::from_stages(options_.stages, keys_,
      [&](const char* data, std::size_t size){
        asio::write(socket, asio::buffer(data, size));
        result.bytes_on_wire += size;
      });

    ReplyReader replies(socket);
    bool acked = false;
    auto handle = [&](const std::string& line){
      auto reply = parse_stream_reply(line);
      if(reply.kind == StreamReply::Kind::Error) {
        throw TransportError("receiver rejected the stream: " + reply.message);
      }
      if(reply.bytes_written > options_.length) {
        throw TransportError("receiver claims " + std::to_string(reply.bytes_written) +
                             " bytes of a " + std::to_string(options_.length) + " byte stream");
      }
      if(reply.bytes_written > result.bytes_acknowledged) {
        result.bytes_acknowledged = reply.bytes_written;
        if(progress) progress(result.bytes_acknowledged);
      }
      acked = reply.kind == StreamReply::Kind::Ack;
    };

    std::vector<char> block(static_cast<std::size_t>(block_size));
    while(result.bytes_consumed < options_.length) {
      auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block_size, options_.length - result.bytes_consumed));
      auto got = source.read_full(block.data(), want);
      if(got < want) {
        throw ExtentIoError("source '" + options_.source_path + "' ended early at offset " +
                            std::to_string(source.position()));
      }
      runner.push(block.data(), got);
      result.bytes_consumed += got;
      while(auto line = replies.poll()) handle(*line);
    }
    runner.finish();
    socket.shutdown(tcp::socket::shutdown_send);

    while(!acked) handle(replies.next());
    if(result.bytes_acknowledged != options_.length) {
      throw TransportError("receiver wrote " + std::to_string(result.bytes_acknowledged) +
                           " of " + std::to_string(options_.length) + " bytes");
    }
  } catch(const asio::system_error& e) {
    throw TransportError("connection to " + options_.host + " failed after " +
                         std::to_string(result.bytes_consumed) + " bytes: " + e.what());
  }

  log_debug(logger_.get(), "Sender done: {} source bytes, {} bytes on the wire",
            result.bytes_consumed, result.bytes_on_wire);
  return result;
}
