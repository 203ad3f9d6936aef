#include "key_pair.hh"

namespace dhprobe {

KeyPair KeyPairGenerator::Generate(Status &status) {
  KeyPair ret = {};
  ret.secret = curve25519::Private::FromEntropy(entropy, status);
  if (!status.Ok()) {
    return ret;
  }
  ret.public_key = curve.DerivePublic(ret.secret);
  return ret;
}

} // namespace dhprobe
