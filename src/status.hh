#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace dhprobe {

// Chain of error messages. Empty chain means success.
//
// Functions that can fail take `Status &` as their last argument. Callers add
// context on the way up:
//
//   status() += "Couldn't read entropy";
struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Str message;
  };

  std::unique_ptr<Entry> entry;

  int errsv; // Saved errno value

  Status();

  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  bool Ok() const;
  Str ToString() const;
  void Reset();
};

inline bool OK(const Status &status) { return status.Ok(); }
inline Str ErrorMessage(const Status &status) { return status.ToString(); }

} // namespace dhprobe
