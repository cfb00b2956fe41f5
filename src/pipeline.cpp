#include "pipeline.hpp"

#include "errors.hpp"
#include "key_source.hpp"
#include "transfer_config.hpp"

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::uint64_t required_u64(const nlohmann::json& doc, const char* field) {
  if(!doc.contains(field) || !doc.at(field).is_number_unsigned()) {
    throw PipelineError(std::string("stage is missing unsigned field '") + field + "'");
  }
  return doc.at(field).get<std::uint64_t>();
}

std::string required_string(const nlohmann::json& doc, const char* field) {
  if(!doc.contains(field) || !doc.at(field).is_string()) {
    throw PipelineError(std::string("stage is missing string field '") + field + "'");
  }
  return doc.at(field).get<std::string>();
}

} // namespace

std::string stage_name(const PipelineStage& stage) {
  return std::visit(overloaded{
    [](const RawStage& s) -> std::string {
      return s.direction == RawStage::Direction::Read ? "raw_read" : "raw_write";
    },
    [](const CompressStage&) -> std::string { return "compress"; },
    [](const DecompressStage&) -> std::string { return "decompress"; },
    [](const EncryptStage&) -> std::string { return "encrypt"; },
    [](const DecryptStage&) -> std::string { return "decrypt"; },
    [](const RateLimitStage&) -> std::string { return "rate_limit"; }
  }, stage);
}

std::string describe_stages(const StageList& stages) {
  std::string out;
  for(const auto& stage : stages) {
    if(!out.empty()) out += " -> ";
    out += stage_name(stage);
  }
  return out;
}

nlohmann::json stage_to_json(const PipelineStage& stage) {
  nlohmann::json doc;
  doc["stage"] = stage_name(stage);
  std::visit(overloaded{
    [&](const RawStage& s) { doc["block_size"] = s.block_size; },
    [&](const CompressStage& s) { doc["level"] = s.level; },
    [&](const DecompressStage&) {},
    [&](const EncryptStage& s) { doc["key_id"] = s.key_ref; },
    [&](const DecryptStage& s) { doc["key_id"] = s.key_ref; },
    [&](const RateLimitStage& s) { doc["bytes_per_second"] = s.bytes_per_second; }
  }, stage);
  return doc;
}

PipelineStage stage_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw PipelineError("stage entry is not an object");
  }
  auto name = required_string(doc, "stage");
  if(name == "raw_read" || name == "raw_write") {
    RawStage raw;
    raw.direction = name == "raw_read" ? RawStage::Direction::Read : RawStage::Direction::Write;
    raw.block_size = required_u64(doc, "block_size");
    return raw;
  }
  if(name == "compress") {
    if(!doc.contains("level") || !doc.at("level").is_number_integer()) {
      throw PipelineError("compress stage is missing its level");
    }
    return CompressStage{doc.at("level").get<int>()};
  }
  if(name == "decompress") return DecompressStage{};
  if(name == "encrypt") return EncryptStage{required_string(doc, "key_id")};
  if(name == "decrypt") return DecryptStage{required_string(doc, "key_id")};
  if(name == "rate_limit") return RateLimitStage{required_u64(doc, "bytes_per_second")};
  throw PipelineError("unknown pipeline stage '" + name + "'");
}

nlohmann::json stages_to_json(const StageList& stages) {
  auto doc = nlohmann::json::array();
  for(const auto& stage : stages) doc.push_back(stage_to_json(stage));
  return doc;
}

StageList stages_from_json(const nlohmann::json& doc) {
  if(!doc.is_array()) {
    throw PipelineError("stage list is not an array");
  }
  StageList stages;
  for(const auto& entry : doc) stages.push_back(stage_from_json(entry));
  return stages;
}

StageList mirror(const StageList& sender) {
  StageList receiver;
  for(auto it = sender.rbegin(); it != sender.rend(); ++it) {
    std::visit(overloaded{
      [&](const RawStage& s) {
        if(s.direction != RawStage::Direction::Read) {
          throw PipelineError("raw_write cannot appear in a sender pipeline");
        }
        receiver.push_back(RawStage{RawStage::Direction::Write, s.block_size});
      },
      [&](const CompressStage&) { receiver.push_back(DecompressStage{}); },
      [&](const EncryptStage& s) { receiver.push_back(DecryptStage{s.key_ref}); },
      [&](const RateLimitStage&) {},
      [&](const DecompressStage&) {
        throw PipelineError("decompress cannot appear in a sender pipeline");
      },
      [&](const DecryptStage&) {
        throw PipelineError("decrypt cannot appear in a sender pipeline");
      }
    }, *it);
  }
  return receiver;
}

PipelineBuilder::PipelineBuilder(KeyRing& keys, KeySource& key_source)
  : keys_(keys), key_source_(key_source) {}

std::string PipelineBuilder::key_reference(const TransferConfiguration& config) {
  if(!config.key_id.empty()) return config.key_id;
  return key_reference_for(config.source_id, config.dest_id, config.host);
}

PipelinePair PipelineBuilder::build(const TransferConfiguration& config) {
  if(config.block_size == 0) {
    throw ConfigurationError("block size must be greater than zero");
  }
  PipelinePair pair;
  pair.sender.push_back(RawStage{RawStage::Direction::Read, config.block_size});
  if(config.compress) {
    pair.sender.push_back(CompressStage{kDefaultCompressionLevel});
  }
  if(config.encrypt) {
    auto reference = key_reference(config);
    if(!keys_.contains(reference)) {
      keys_.store(reference, key_source_.generate());
    }
    pair.sender.push_back(EncryptStage{reference});
  }
  if(config.rate_limit) {
    pair.sender.push_back(RateLimitStage{*config.rate_limit});
  }
  pair.receiver = mirror(pair.sender);
  return pair;
}
