#include "curve25519.hh"

#include <algorithm>

extern "C" int curve25519_donna(uint8_t *mypublic, const uint8_t *secret,
                                const uint8_t *basepoint);

namespace dhprobe::curve25519 {

static const U8 kBasePoint[32] = {9};

Private Private::From32Bytes(Span<const U8, 32> bytes) {
  Private ret;
  std::copy(bytes.begin(), bytes.end(), ret.bytes.begin());
  return ret;
}

Private Private::FromEntropy(entropy::Source &source, Status &status) {
  Private ret = {};
  source.Fill(ret.bytes, status);
  if (!status.Ok()) {
    status() += "Couldn't generate curve25519 private key";
  }
  return ret;
}

Public Public::FromPrivate(const Private &private_key) {
  Public ret;
  curve25519_donna(ret.bytes.data(), private_key.bytes.data(), kBasePoint);
  return ret;
}

bool Public::operator==(const Public &other) const {
  return bytes == other.bytes;
}

Shared Shared::FromPrivateAndPublic(const Private &private_key,
                                    const Public &public_key) {
  Shared ret;
  curve25519_donna(ret.bytes.data(), private_key.bytes.data(),
                   public_key.bytes.data());
  return ret;
}

bool Shared::operator==(const Shared &other) const {
  return bytes == other.bytes;
}

Public Donna::DerivePublic(const Private &private_key) {
  return Public::FromPrivate(private_key);
}

Shared Donna::DiffieHellman(const Private &private_key, const Public &peer) {
  return Shared::FromPrivateAndPublic(private_key, peer);
}

} // namespace dhprobe::curve25519
