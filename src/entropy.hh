#pragma once

#include "fd.hh"
#include "int.hh"
#include "span.hh"
#include "status.hh"
#include "str.hh"

namespace dhprobe::entropy {

// Source of cryptographically secure random bytes.
//
// Every call must produce fresh bytes.
struct Source {
  virtual ~Source() = default;

  virtual void Fill(Span<U8, 32> out, Status &) = 0;
};

// Reads from the kernel CSPRNG.
struct DevUrandom : Source {
  struct Config {
    Str path = "/dev/urandom";
  };

  FD fd;

  void Open(Config, Status &);
  void Fill(Span<U8, 32> out, Status &) override;
};

} // namespace dhprobe::entropy
