#include "validator.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

#include "agent.hpp"
#include "errors.hpp"
#include "extent.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "remote_executor.hpp"
#include "utils.hpp"

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

const char* sample_position_name(SamplePosition position) {
  switch(position) {
    case SamplePosition::Start: return "start";
    case SamplePosition::Middle: return "middle";
    case SamplePosition::End: return "end";
  }
  return "unknown";
}

bool ValidationReport::passed() const {
  return failures().empty();
}

std::vector<SamplePosition> ValidationReport::failures() const {
  std::vector<SamplePosition> failed;
  for(const auto& sample : samples) {
    if(!sample.matches()) failed.push_back(sample.position);
  }
  return failed;
}

std::string ValidationReport::summary() const {
  if(samples.empty()) return "nothing to compare";
  std::string out;
  for(const auto& sample : samples) {
    if(!out.empty()) out += ", ";
    out += sample_position_name(sample.position);
    if(sample.matches()) {
      out += " ok";
    } else if(!sample.error.empty()) {
      out += " ERROR (" + sample.error + ")";
    } else {
      out += " MISMATCH";
    }
  }
  return out;
}

std::vector<ValidationSample> plan_validation_windows(std::uint64_t total_bytes,
                                                      std::uint64_t sample_size,
                                                      std::uint64_t sample_block) {
  std::vector<ValidationSample> windows;
  if(total_bytes == 0 || sample_size == 0) return windows;

  std::uint64_t length = std::min(sample_size, total_bytes);
  std::uint64_t last_start = total_bytes - length;
  std::uint64_t middle = std::min(align_down(total_bytes / 2, sample_block), last_start);

  windows.push_back(ValidationSample{SamplePosition::Start, 0, length, {}, {}, {}});
  windows.push_back(ValidationSample{SamplePosition::Middle, middle, length, {}, {}, {}});
  windows.push_back(ValidationSample{SamplePosition::End, last_start, length, {}, {}, {}});
  return windows;
}

std::string sha256_extent_window(const std::string& path, std::uint64_t offset, std::uint64_t length) {
  auto file = ExtentFile::open_for_read(path, offset);
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw PipelineError("EVP_DigestInit_ex(sha256) failed");
  }

  std::vector<char> buffer(1024 * 1024);
  std::uint64_t remaining = length;
  while(remaining > 0) {
    auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
    auto got = file.read_full(buffer.data(), want);
    if(got < want) {
      throw ExtentIoError("'" + path + "' ends before offset " + std::to_string(offset + length));
    }
    if(EVP_DigestUpdate(ctx.get(), buffer.data(), got) != 1) {
      throw PipelineError("EVP_DigestUpdate failed");
    }
    remaining -= got;
  }

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw PipelineError("EVP_DigestFinal_ex failed");
  }
  digest.resize(digest_len);
  return hex_from_bytes(digest);
}

std::string LocalDigestSource::digest(std::uint64_t offset, std::uint64_t length) {
  return sha256_extent_window(path_, offset, length);
}

RemoteDigestSource::RemoteDigestSource(RemoteExecutor& executor,
                                       std::string host,
                                       std::string remote_binary,
                                       std::string path)
  : executor_(executor),
    host_(std::move(host)),
    remote_binary_(std::move(remote_binary)),
    path_(std::move(path)) {}

std::string RemoteDigestSource::digest(std::uint64_t offset, std::uint64_t length) {
  auto command = agent_command(remote_binary_, "digest", {
    {"path", path_},
    {"offset", std::to_string(offset)},
    {"length", std::to_string(length)}
  });
  auto result = executor_.execute(host_, command);
  auto line = parse_agent_line(result.first_line());
  if(result.exit_code != 0 || line.kind == AgentLine::Kind::Error) {
    throw TransportError("remote digest failed (exit " + std::to_string(result.exit_code) + "): " +
                         (line.payload.empty() ? std::string("no output") : line.payload));
  }
  if(line.payload.size() != 64) {
    throw TransportError("remote digest returned '" + line.payload + "'");
  }
  return line.payload;
}

Validator::Validator(DigestSource& source,
                     DigestSource& dest,
                     std::uint64_t sample_size,
                     std::uint64_t sample_block,
                     std::shared_ptr<Logger> logger)
  : source_(source),
    dest_(dest),
    sample_size_(sample_size),
    sample_block_(sample_block),
    logger_(std::move(logger)) {}

ValidationReport Validator::validate(std::uint64_t total_bytes) {
  ValidationReport report;
  report.samples = plan_validation_windows(total_bytes, sample_size_, sample_block_);
  for(auto& sample : report.samples) {
    const char* name = sample_position_name(sample.position);
    log_info(logger_.get(), "Validating {} window: {} bytes at offset {}", name, sample.length, sample.offset);
    try {
      sample.source_digest = source_.digest(sample.offset, sample.length);
    } catch(const MigrationError& e) {
      sample.error = std::string("source: ") + e.what();
    }
    try {
      sample.dest_digest = dest_.digest(sample.offset, sample.length);
    } catch(const MigrationError& e) {
      if(!sample.error.empty()) sample.error += "; ";
      sample.error += std::string("destination: ") + e.what();
    }
    if(sample.matches()) {
      log_debug(logger_.get(), "{} window ok ({})", name, sample.source_digest);
    } else if(sample.error.empty()) {
      log_error(logger_.get(), "{} window differs: source {} destination {}", name,
                sample.source_digest, sample.dest_digest);
    } else {
      log_error(logger_.get(), "{} window could not be compared: {}", name, sample.error);
    }
  }
  return report;
}
