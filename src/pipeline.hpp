#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

class KeyRing;
class KeySource;
struct TransferConfiguration;

struct RawStage {
  enum class Direction { Read, Write };
  Direction direction = Direction::Read;
  std::uint64_t block_size = 0;

  bool operator==(const RawStage& other) const {
    return direction == other.direction && block_size == other.block_size;
  }
};

// gzip's own default (what `gzip -c` uses).
constexpr int kDefaultCompressionLevel = 6;

struct CompressStage {
  int level = kDefaultCompressionLevel;
  bool operator==(const CompressStage& other) const { return level == other.level; }
};

struct DecompressStage {
  bool operator==(const DecompressStage&) const { return true; }
};

// Carries a key reference, never key bytes.
struct EncryptStage {
  std::string key_ref;
  bool operator==(const EncryptStage& other) const { return key_ref == other.key_ref; }
};

struct DecryptStage {
  std::string key_ref;
  bool operator==(const DecryptStage& other) const { return key_ref == other.key_ref; }
};

struct RateLimitStage {
  std::uint64_t bytes_per_second = 0;
  bool operator==(const RateLimitStage& other) const {
    return bytes_per_second == other.bytes_per_second;
  }
};

using PipelineStage = std::variant<RawStage,
                                   CompressStage,
                                   DecompressStage,
                                   EncryptStage,
                                   DecryptStage,
                                   RateLimitStage>;

using StageList = std::vector<PipelineStage>;

struct PipelinePair {
  StageList sender;
  StageList receiver;
};

// "raw_read", "compress", "encrypt", "rate_limit", "decrypt", "decompress", "raw_write"
std::string stage_name(const PipelineStage& stage);
// "raw_read -> compress -> encrypt"
std::string describe_stages(const StageList& stages);

nlohmann::json stage_to_json(const PipelineStage& stage);
// Throws PipelineError on an unknown or malformed stage.
PipelineStage stage_from_json(const nlohmann::json& doc);
nlohmann::json stages_to_json(const StageList& stages);
StageList stages_from_json(const nlohmann::json& doc);

// Receiver list for a sender list: reversed, each stage inverted, RateLimit
// dropped. Throws PipelineError if `sender` holds a receive-only stage.
StageList mirror(const StageList& sender);

class PipelineBuilder {
public:
  PipelineBuilder(KeyRing& keys, KeySource& key_source);

  // Sender order: Raw(read) -> Compress -> Encrypt -> RateLimit.
  // Touches neither the network nor the extents. When encryption is on and
  // the ring has no key for this transfer, one is generated and stored.
  PipelinePair build(const TransferConfiguration& config);

  static std::string key_reference(const TransferConfiguration& config);

private:
  KeyRing& keys_;
  KeySource& key_source_;
};
