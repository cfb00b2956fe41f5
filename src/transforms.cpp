#include "transforms.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <thread>
#include <variant>

#include "errors.hpp"
#include "key_source.hpp"

namespace {

constexpr std::size_t kChunkBytes = 64 * 1024;
constexpr int kGzipWindowBits = 15 + 16;

Bytef* zlib_input(const char* data) {
  return const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
}

std::string zlib_message(const z_stream& stream, int rc) {
  if(stream.msg) return stream.msg;
  return "zlib error " + std::to_string(rc);
}

} // namespace

// ---- gzip -----------------------------------------------------------------

GzipCompressor::GzipCompressor(int level) {
  int rc = deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if(rc != Z_OK) {
    throw PipelineError("deflateInit2 failed: " + zlib_message(stream_, rc));
  }
}

GzipCompressor::~GzipCompressor() {
  deflateEnd(&stream_);
}

void GzipCompressor::update(const char* data, std::size_t size, std::string& out) {
  if(size == 0) return;
  std::array<char, kChunkBytes> buffer{};
  stream_.next_in = zlib_input(data);
  stream_.avail_in = static_cast<uInt>(size);
  do {
    stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream_.avail_out = static_cast<uInt>(buffer.size());
    int rc = deflate(&stream_, Z_NO_FLUSH);
    if(rc != Z_OK && rc != Z_BUF_ERROR) {
      throw PipelineError("gzip compression failed: " + zlib_message(stream_, rc));
    }
    out.append(buffer.data(), buffer.size() - stream_.avail_out);
  } while(stream_.avail_out == 0 || stream_.avail_in > 0);
}

void GzipCompressor::finish(std::string& out) {
  std::array<char, kChunkBytes> buffer{};
  stream_.next_in = nullptr;
  stream_.avail_in = 0;
  int rc = Z_OK;
  do {
    stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream_.avail_out = static_cast<uInt>(buffer.size());
    rc = deflate(&stream_, Z_FINISH);
    if(rc == Z_STREAM_ERROR) {
      throw PipelineError("gzip compression failed: " + zlib_message(stream_, rc));
    }
    out.append(buffer.data(), buffer.size() - stream_.avail_out);
  } while(rc != Z_STREAM_END);
}

GzipDecompressor::GzipDecompressor() {
  int rc = inflateInit2(&stream_, kGzipWindowBits);
  if(rc != Z_OK) {
    throw PipelineError("inflateInit2 failed: " + zlib_message(stream_, rc));
  }
}

GzipDecompressor::~GzipDecompressor() {
  inflateEnd(&stream_);
}

void GzipDecompressor::update(const char* data, std::size_t size, std::string& out) {
  if(size == 0) return;
  if(ended_) {
    throw PipelineError("unexpected data after end of gzip stream");
  }
  std::array<char, kChunkBytes> buffer{};
  stream_.next_in = zlib_input(data);
  stream_.avail_in = static_cast<uInt>(size);
  while(!ended_) {
    stream_.next_out = reinterpret_cast<Bytef*>(buffer.data());
    stream_.avail_out = static_cast<uInt>(buffer.size());
    int rc = inflate(&stream_, Z_NO_FLUSH);
    if(rc == Z_STREAM_END) {
      ended_ = true;
    } else if(rc == Z_BUF_ERROR) {
      break;
    } else if(rc != Z_OK) {
      throw PipelineError("gzip stream is corrupt: " + zlib_message(stream_, rc));
    }
    out.append(buffer.data(), buffer.size() - stream_.avail_out);
    if(stream_.avail_in == 0 && stream_.avail_out != 0) break;
  }
  if(ended_ && stream_.avail_in > 0) {
    throw PipelineError("unexpected data after end of gzip stream");
  }
}

void GzipDecompressor::finish(std::string&) {
  if(!ended_) {
    throw PipelineError("gzip stream is truncated");
  }
}

// ---- AES ------------------------------------------------------------------

AesCipher::AesCipher(Mode mode, const KeyMaterial& material)
  : mode_(mode), ctx_(EVP_CIPHER_CTX_new()) {
  if(!ctx_) {
    throw PipelineError("EVP_CIPHER_CTX_new failed");
  }
  int rc = mode_ == Mode::Encrypt
    ? EVP_EncryptInit_ex(ctx_, EVP_aes_256_cbc(), nullptr, material.key.data(), material.iv.data())
    : EVP_DecryptInit_ex(ctx_, EVP_aes_256_cbc(), nullptr, material.key.data(), material.iv.data());
  if(rc != 1) {
    EVP_CIPHER_CTX_free(ctx_);
    ctx_ = nullptr;
    throw PipelineError("AES-256-CBC initialisation failed");
  }
}

AesCipher::~AesCipher() {
  if(ctx_) EVP_CIPHER_CTX_free(ctx_);
}

void AesCipher::update(const char* data, std::size_t size, std::string& out) {
  std::size_t offset = 0;
  std::vector<unsigned char> buffer;
  while(offset < size) {
    int chunk = static_cast<int>(std::min(kChunkBytes, size - offset));
    buffer.resize(static_cast<std::size_t>(chunk) + EVP_MAX_BLOCK_LENGTH);
    int produced = 0;
    auto input = reinterpret_cast<const unsigned char*>(data + offset);
    int rc = mode_ == Mode::Encrypt
      ? EVP_EncryptUpdate(ctx_, buffer.data(), &produced, input, chunk)
      : EVP_DecryptUpdate(ctx_, buffer.data(), &produced, input, chunk);
    if(rc != 1) {
      throw PipelineError(mode_ == Mode::Encrypt ? "encryption failed" : "decryption failed");
    }
    out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(produced));
    offset += static_cast<std::size_t>(chunk);
  }
}

void AesCipher::finish(std::string& out) {
  std::array<unsigned char, EVP_MAX_BLOCK_LENGTH> buffer{};
  int produced = 0;
  if(mode_ == Mode::Encrypt) {
    if(EVP_EncryptFinal_ex(ctx_, buffer.data(), &produced) != 1) {
      throw PipelineError("encryption failed on the final block");
    }
  } else if(EVP_DecryptFinal_ex(ctx_, buffer.data(), &produced) != 1) {
    throw PipelineError("decryption failed: bad padding, wrong key or truncated stream");
  }
  out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(produced));
}

// ---- rate limit -----------------------------------------------------------

RateLimiter::RateLimiter(std::uint64_t bytes_per_second)
  : rate_(bytes_per_second),
    capacity_(static_cast<double>(bytes_per_second) / 10.0),
    tokens_(capacity_),
    last_refill_(Clock::now()) {
  if(rate_ == 0) {
    throw ConfigurationError("rate limit must be greater than zero");
  }
}

void RateLimiter::acquire(std::size_t bytes) {
  auto now = Clock::now();
  std::chrono::duration<double> elapsed = now - last_refill_;
  last_refill_ = now;
  tokens_ = std::min(capacity_, tokens_ + elapsed.count() * static_cast<double>(rate_));
  tokens_ -= static_cast<double>(bytes);
  if(tokens_ < 0) {
    std::this_thread::sleep_for(std::chrono::duration<double>(-tokens_ / static_cast<double>(rate_)));
  }
}

void RateLimiter::update(const char* data, std::size_t size, std::string& out) {
  acquire(size);
  out.append(data, size);
}

// ---- runner ---------------------------------------------------------------

PipelineRunner::PipelineRunner(std::vector<std::unique_ptr<StreamTransform>> transforms, Sink sink)
  : transforms_(std::move(transforms)), sink_(std::move(sink)) {}

PipelineRunner PipelineRunner::from_stages(const StageList& stages, const KeyRing& keys, Sink sink) {
  std::vector<std::unique_ptr<StreamTransform>> transforms;
  for(const auto& stage : stages) {
    if(auto* compress = std::get_if<CompressStage>(&stage)) {
      transforms.push_back(std::make_unique<GzipCompressor>(compress->level));
    } else if(std::holds_alternative<DecompressStage>(stage)) {
      transforms.push_back(std::make_unique<GzipDecompressor>());
    } else if(auto* encrypt = std::get_if<EncryptStage>(&stage)) {
      transforms.push_back(std::make_unique<AesCipher>(AesCipher::Mode::Encrypt, keys.at(encrypt->key_ref)));
    } else if(auto* decrypt = std::get_if<DecryptStage>(&stage)) {
      transforms.push_back(std::make_unique<AesCipher>(AesCipher::Mode::Decrypt, keys.at(decrypt->key_ref)));
    } else if(auto* limit = std::get_if<RateLimitStage>(&stage)) {
      transforms.push_back(std::make_unique<RateLimiter>(limit->bytes_per_second));
    }
  }
  return PipelineRunner(std::move(transforms), std::move(sink));
}

void PipelineRunner::feed(std::size_t index, const char* data, std::size_t size) {
  if(size == 0) return;
  if(index == transforms_.size()) {
    sink_(data, size);
    bytes_out_ += size;
    return;
  }
  std::string out;
  transforms_[index]->update(data, size, out);
  feed(index + 1, out.data(), out.size());
}

void PipelineRunner::push(const char* data, std::size_t size) {
  if(finished_) {
    throw PipelineError("pipeline already finished");
  }
  bytes_in_ += size;
  feed(0, data, size);
}

void PipelineRunner::finish() {
  if(finished_) return;
  finished_ = true;
  for(std::size_t i = 0; i < transforms_.size(); ++i) {
    std::string out;
    transforms_[i]->finish(out);
    feed(i + 1, out.data(), out.size());
  }
}
