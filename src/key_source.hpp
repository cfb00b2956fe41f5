#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

// AES-256-CBC key and IV for one transfer.
struct KeyMaterial {
  std::array<unsigned char, 32> key{};
  std::array<unsigned char, 16> iv{};

  // key followed by iv, lowercase hex (96 characters).
  std::string to_hex() const;
  static std::optional<KeyMaterial> from_hex(const std::string& hex);
};

class KeySource {
public:
  virtual ~KeySource() = default;
  virtual KeyMaterial generate() = 0;
};

// Fresh key and IV from RAND_bytes on every call.
class OpenSslKeySource : public KeySource {
public:
  KeyMaterial generate() override;
};

// Maps key references (what pipeline stages carry) to key bytes. Lives only
// in memory; nothing here is ever written to disk or logged.
class KeyRing {
public:
  void store(const std::string& reference, const KeyMaterial& material);
  bool contains(const std::string& reference) const;
  // Throws PipelineError when the reference is unknown.
  const KeyMaterial& at(const std::string& reference) const;
  void erase(const std::string& reference);

private:
  std::map<std::string, KeyMaterial> keys_;
};

// Stable reference for a (source, destination, host) triple.
std::string key_reference_for(const std::string& source_id,
                              const std::string& dest_id,
                              const std::string& host);
