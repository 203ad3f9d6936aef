#pragma once

#include "curve25519.hh"
#include "entropy.hh"
#include "status.hh"

namespace dhprobe {

struct KeyPair {
  curve25519::Private secret;
  curve25519::Public public_key;
};

// Draws 32 fresh bytes per key pair. Entropy failures are reported through
// `status` and never retried.
struct KeyPairGenerator {
  entropy::Source &entropy;
  curve25519::Curve &curve;

  KeyPair Generate(Status &);
};

} // namespace dhprobe
