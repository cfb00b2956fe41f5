#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <zlib.h>

#include "pipeline.hpp"

struct KeyMaterial;
class KeyRing;

// One streaming step of a pipeline. update() may buffer; finish() flushes
// whatever is left and validates that the stream ended cleanly.
class StreamTransform {
public:
  virtual ~StreamTransform() = default;
  virtual void update(const char* data, std::size_t size, std::string& out) = 0;
  virtual void finish(std::string& out) = 0;
};

// gzip framing (RFC 1952), same bytes as `gzip -c`.
class GzipCompressor : public StreamTransform {
public:
  explicit GzipCompressor(int level = kDefaultCompressionLevel);
  ~GzipCompressor() override;
  GzipCompressor(const GzipCompressor&) = delete;
  GzipCompressor& operator=(const GzipCompressor&) = delete;

  void update(const char* data, std::size_t size, std::string& out) override;
  void finish(std::string& out) override;

private:
  z_stream stream_{};
};

// Throws PipelineError on corrupt input, on a stream that ends early, and on
// bytes trailing the gzip member.
class GzipDecompressor : public StreamTransform {
public:
  GzipDecompressor();
  ~GzipDecompressor() override;
  GzipDecompressor(const GzipDecompressor&) = delete;
  GzipDecompressor& operator=(const GzipDecompressor&) = delete;

  void update(const char* data, std::size_t size, std::string& out) override;
  void finish(std::string& out) override;

private:
  z_stream stream_{};
  bool ended_ = false;
};

// AES-256-CBC with PKCS#7 padding.
class AesCipher : public StreamTransform {
public:
  enum class Mode { Encrypt, Decrypt };

  AesCipher(Mode mode, const KeyMaterial& material);
  ~AesCipher() override;
  AesCipher(const AesCipher&) = delete;
  AesCipher& operator=(const AesCipher&) = delete;

  void update(const char* data, std::size_t size, std::string& out) override;
  // In Decrypt mode a bad final block (wrong key, wrong stage order,
  // truncated stream) throws PipelineError.
  void finish(std::string& out) override;

private:
  Mode mode_;
  EVP_CIPHER_CTX* ctx_ = nullptr;
};

// Token bucket. Passes data through unchanged, sleeping whenever the caller
// runs ahead of bytes_per_second. Bursts are capped at a tenth of a second.
class RateLimiter : public StreamTransform {
public:
  using Clock = std::chrono::steady_clock;

  explicit RateLimiter(std::uint64_t bytes_per_second);

  void acquire(std::size_t bytes);

  void update(const char* data, std::size_t size, std::string& out) override;
  void finish(std::string&) override {}

  std::uint64_t bytes_per_second() const { return rate_; }

private:
  std::uint64_t rate_;
  double capacity_;
  double tokens_;
  Clock::time_point last_refill_;
};

// Chains the non-raw stages of a list and delivers the result to `sink`.
// The raw endpoints (source reader, destination writer) sit outside it.
class PipelineRunner {
public:
  using Sink = std::function<void(const char* data, std::size_t size)>;

  PipelineRunner(std::vector<std::unique_ptr<StreamTransform>> transforms, Sink sink);

  // Throws PipelineError when a Decrypt/Encrypt stage names a key the ring
  // does not hold.
  static PipelineRunner from_stages(const StageList& stages, const KeyRing& keys, Sink sink);

  void push(const char* data, std::size_t size);
  void push(const std::string& data) { push(data.data(), data.size()); }
  void finish();

  std::uint64_t bytes_in() const { return bytes_in_; }
  std::uint64_t bytes_out() const { return bytes_out_; }
  std::size_t size() const { return transforms_.size(); }

private:
  void feed(std::size_t index, const char* data, std::size_t size);

  std::vector<std::unique_ptr<StreamTransform>> transforms_;
  Sink sink_;
  std::uint64_t bytes_in_ = 0;
  std::uint64_t bytes_out_ = 0;
  bool finished_ = false;
};
