#pragma once

#include <string>
#include <utility>

#include "sam3/bytes.hpp"

namespace sam3 {

// Public I2P destination in the I2P base64 alphabet.
class Address {
 public:
  Address() = default;
  explicit Address(std::string base64) : base64_(std::move(base64)) {}

  const std::string& base64() const { return base64_; }
  bool empty() const { return base64_.empty(); }

  // Binary destination. Throws std::invalid_argument on malformed base64.
  ByteVec toBytes() const;
  // "<52 chars>.b32.i2p", the base32 of the SHA-256 of the binary destination.
  std::string base32() const;

  bool operator==(const Address& other) const { return base64_ == other.base64_; }
  bool operator!=(const Address& other) const { return !(*this == other); }

 private:
  std::string base64_;
};

// A destination together with its private key material. The private blob handed
// out by the bridge already begins with the public destination, so it is the
// lossless serialization used as DESTINATION= when creating sessions.
class Keys {
 public:
  Keys() = default;
  Keys(Address pub, std::string priv) : addr_(std::move(pub)), priv_(std::move(priv)) {}

  const Address& addr() const { return addr_; }
  const std::string& privateKey() const { return priv_; }
  const std::string& toString() const { return priv_; }

  bool operator==(const Keys& other) const {
    return addr_ == other.addr_ && priv_ == other.priv_;
  }

 private:
  Address addr_;
  std::string priv_;
};

// Key file: public destination on the first line, private blob on the second.
Keys loadKeys(const std::string& path);
void storeKeys(const Keys& keys, const std::string& path);

}  // namespace sam3
