#include "key_source.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

std::string KeyMaterial::to_hex() const {
  std::vector<unsigned char> bytes(key.begin(), key.end());
  bytes.insert(bytes.end(), iv.begin(), iv.end());
  return hex_from_bytes(bytes);
}

std::optional<KeyMaterial> KeyMaterial::from_hex(const std::string& hex) {
  auto bytes = bytes_from_hex(hex);
  if(!bytes) return std::nullopt;
  KeyMaterial material;
  if(bytes->size() != material.key.size() + material.iv.size()) return std::nullopt;
  std::copy_n(bytes->begin(), material.key.size(), material.key.begin());
  std::copy_n(bytes->begin() + static_cast<std::ptrdiff_t>(material.key.size()),
              material.iv.size(), material.iv.begin());
  return material;
}

KeyMaterial OpenSslKeySource::generate() {
  KeyMaterial material;
  if(RAND_bytes(material.key.data(), static_cast<int>(material.key.size())) != 1 ||
     RAND_bytes(material.iv.data(), static_cast<int>(material.iv.size())) != 1) {
    throw PipelineError("RAND_bytes failed to produce key material");
  }
  return material;
}

void KeyRing::store(const std::string& reference, const KeyMaterial& material) {
  keys_[reference] = material;
}

bool KeyRing::contains(const std::string& reference) const {
  return keys_.count(reference) > 0;
}

const KeyMaterial& KeyRing::at(const std::string& reference) const {
  auto it = keys_.find(reference);
  if(it == keys_.end()) {
    throw PipelineError("no key material for reference '" + reference + "'");
  }
  return it->second;
}

void KeyRing::erase(const std::string& reference) {
  keys_.erase(reference);
}

std::string key_reference_for(const std::string& source_id,
                              const std::string& dest_id,
                              const std::string& host) {
  return "xfer-" + sha256_hex(source_id + '\n' + dest_id + '\n' + host).substr(0, 16);
}
