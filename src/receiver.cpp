#include "receiver.hpp"

#include <algorithm>
#include <array>
#include <istream>
#include <variant>

#include "errors.hpp"
#include "extent.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transforms.hpp"

ExtentReceiver::ExtentReceiver(ReceiverOptions options, const KeyRing& keys, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    keys_(keys),
    logger_(std::move(logger)),
    acceptor_(io_),
    socket_(io_) {}

ExtentReceiver::~ExtentReceiver() {
  asio::error_code ec;
  socket_.close(ec);
  acceptor_.close(ec);
}

std::uint16_t ExtentReceiver::bind() {
  try {
    auto address = asio::ip::make_address(options_.listen_ip);
    tcp::endpoint endpoint(address, options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(1);
  } catch(const asio::system_error& e) {
    throw TransportError("cannot listen on " + options_.listen_ip + ":" +
                         std::to_string(options_.port) + ": " + e.what());
  }
  bound_port_ = acceptor_.local_endpoint().port();
  log_debug(logger_.get(), "Receiver listening on {}:{}", options_.listen_ip, bound_port_);
  return bound_port_;
}

void ExtentReceiver::accept_with_timeout() {
  asio::steady_timer timer(io_);
  bool accepted = false;
  asio::error_code accept_error;

  acceptor_.async_accept(socket_, [&](const asio::error_code& ec){
    accept_error = ec;
    accepted = !ec;
    timer.cancel();
  });
  timer.expires_after(options_.accept_timeout);
  timer.async_wait([&](const asio::error_code& ec){
    if(ec) return;
    asio::error_code ignored;
    acceptor_.close(ignored);
  });
  io_.run();
  io_.restart();

  if(!accepted) {
    if(accept_error == asio::error::operation_aborted || !acceptor_.is_open()) {
      throw TransportError("no sender connected within " +
                           std::to_string(options_.accept_timeout.count()) + " ms");
    }
    throw TransportError("accept failed: " + accept_error.message());
  }
  asio::error_code ignored;
  acceptor_.close(ignored);
  log_info(logger_.get(), "Sender connected from {}",
           socket_.remote_endpoint(ignored).address().to_string());
}

void ExtentReceiver::verify_header(const StreamHeader& header) const {
  if(header.version != kStreamProtocolVersion) {
    throw PipelineError("stream protocol version " + std::to_string(header.version) +
                        " is not supported (expected " + std::to_string(kStreamProtocolVersion) + ")");
  }
  auto mirrored = mirror(header.stages);
  if(mirrored != options_.stages) {
    throw PipelineError("sender stages [" + describe_stages(header.stages) +
                        "] do not mirror receiver stages [" + describe_stages(options_.stages) + "]");
  }
  if(header.offset != options_.offset) {
    throw PipelineError("sender starts at offset " + std::to_string(header.offset) +
                        ", receiver expects " + std::to_string(options_.offset));
  }
  if(header.length != options_.length) {
    throw PipelineError("sender announces " + std::to_string(header.length) +
                        " bytes, receiver expects " + std::to_string(options_.length));
  }
}

void ExtentReceiver::reject(const std::string& message) {
  asio::error_code ec;
  asio::write(socket_, asio::buffer(make_stream_error(message).dump() + "\n"), ec);
  socket_.close(ec);
}

void ExtentReceiver::report_progress(ExtentFile& dest, std::uint64_t written) {
  dest.sync();
  asio::write(socket_, asio::buffer(make_stream_progress(written).dump() + "\n"));
  log_debug(logger_.get(), "Synced {} of {} bytes", written, options_.length);
}

std::uint64_t ExtentReceiver::run() {
  if(!acceptor_.is_open()) bind();
  accept_with_timeout();

  std::uint64_t written = 0;
  try {
    asio::streambuf buffer;
    asio::read_until(socket_, buffer, '\n');
    std::string line;
    {
      std::istream is(&buffer);
      std::getline(is, line);
    }
    auto header = parse_stream_header(line);
    verify_header(header);

    auto dest = ExtentFile::open_for_write(options_.dest_path, options_.offset);
    auto runner = PipelineRunner::from_stages(options_.stages, keys_,
      [&](const char* data, std::size_t size){
        if(written + size > options_.length) {
          throw PipelineError("sender delivered more than the announced " +
                              std::to_string(options_.length) + " bytes");
        }
        dest.write_all(data, size);
        written += size;
      });

    // bytes that arrived together with the header line
    if(buffer.size() > 0) {
      std::string leftover(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
      buffer.consume(buffer.size());
      runner.push(leftover);
    }

    const std::uint64_t interval = std::max<std::uint64_t>(options_.progress_interval, 1);
    std::uint64_t reported = 0;
    std::array<char, 64 * 1024> chunk{};
    for(;;) {
      asio::error_code ec;
      auto got = socket_.read_some(asio::buffer(chunk), ec);
      if(got > 0) runner.push(chunk.data(), got);
      if(written - reported >= interval) {
        report_progress(dest, written);
        reported = written;
      }
      if(ec == asio::error::eof) break;
      if(ec) {
        throw TransportError("connection lost after " + std::to_string(written) +
                             " bytes: " + ec.message());
      }
    }
    runner.finish();
    if(written != options_.length) {
      throw TransportError("short stream: wrote " + std::to_string(written) + " of " +
                           std::to_string(options_.length) + " bytes");
    }
    dest.sync();

    asio::error_code ec;
    asio::write(socket_, asio::buffer(make_stream_ack(written).dump() + "\n"), ec);
    if(ec) {
      log_warn(logger_.get(), "Could not acknowledge to sender: {}", ec.message());
    }
  } catch(const MigrationError& e) {
    reject(e.what());
    throw;
  } catch(const asio::system_error& e) {
    reject(e.what());
    throw TransportError(std::string("data channel failed: ") + e.what());
  }
  asio::error_code ec;
  socket_.close(ec);
  log_info(logger_.get(), "Received {} bytes into {} at offset {}", written, options_.dest_path, options_.offset);
  return written;
}
