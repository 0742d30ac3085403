#include "sam3/keys.hpp"

#include <fstream>
#include <stdexcept>

#include "sam3/crypto_utils.hpp"

namespace sam3 {
namespace {

std::string stripCr(std::string s) {
  if (!s.empty() && s.back() == '\r') s.pop_back();
  return s;
}

}  // namespace

ByteVec Address::toBytes() const { return i2pBase64Decode(base64_); }

std::string Address::base32() const {
  const ByteVec raw = toBytes();
  const auto digest = sha256(raw.data(), raw.size());
  return base32Encode(digest.data(), digest.size()) + ".b32.i2p";
}

Keys loadKeys(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("unable to open key file: " + path);
  std::string pub;
  std::string priv;
  if (!std::getline(in, pub) || !std::getline(in, priv)) {
    throw std::runtime_error("key file is truncated: " + path);
  }
  pub = stripCr(std::move(pub));
  priv = stripCr(std::move(priv));
  if (pub.empty() || priv.empty()) throw std::runtime_error("key file is truncated: " + path);
  return Keys(Address(pub), priv);
}

void storeKeys(const Keys& keys, const std::string& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("unable to write key file: " + path);
  out << keys.addr().base64() << "\n" << keys.privateKey() << "\n";
  out.flush();
  if (!out) throw std::runtime_error("unable to write key file: " + path);
}

}  // namespace sam3
