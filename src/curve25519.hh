#pragma once

#include "arr.hh"
#include "entropy.hh"
#include "int.hh"
#include "span.hh"
#include "status.hh"

// Establishing shared secrets according to https://cr.yp.to/ecdh.html.
//
// This is a C++ wrapper around the curve25519-donna C library (public-domain).
namespace dhprobe::curve25519 {

struct Private {
  Arr<U8, 32> bytes;

  static Private From32Bytes(Span<const U8, 32> bytes);
  static Private FromEntropy(entropy::Source &, Status &);
};

struct Public {
  Arr<U8, 32> bytes;

  static Public FromPrivate(const Private &);

  bool operator==(const Public &) const;
};

struct Shared {
  Arr<U8, 32> bytes;

  static Shared FromPrivateAndPublic(const Private &, const Public &);

  bool operator==(const Shared &) const;
};

// Key exchange primitive as seen by the diagnostic.
//
// `Donna` is the real thing. Tests plug in broken curves to exercise the
// classification.
struct Curve {
  virtual ~Curve() = default;

  virtual Public DerivePublic(const Private &) = 0;
  virtual Shared DiffieHellman(const Private &, const Public &peer) = 0;
};

struct Donna : Curve {
  Public DerivePublic(const Private &) override;
  Shared DiffieHellman(const Private &, const Public &peer) override;
};

} // namespace dhprobe::curve25519
