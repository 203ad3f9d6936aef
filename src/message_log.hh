#pragma once

#include "arr.hh"
#include "int.hh"
#include "str.hh"

namespace dhprobe {

// Transcript shown on the screen.
//
// Fixed-capacity ring: appending to a full log evicts the oldest entry. Index 0
// is always the oldest entry.
struct MessageLog {
  static constexpr Size kCapacity = 20;
  // Longer entries are truncated (at a UTF-8 character boundary).
  static constexpr Size kMaxEntryBytes = 512;

  Arr<Str, kCapacity> entries;
  Size head = 0; // index of the oldest entry in `entries`
  Size count = 0;

  void Append(StrView text);
  void Clear();

  Size size() const { return count; }
  bool empty() const { return count == 0; }

  const Str &operator[](Size i) const {
    return entries[(head + i) % kCapacity];
  }

  struct NewestFirst {
    const MessageLog &log;

    struct Iterator {
      const MessageLog *log;
      Size i;

      const Str &operator*() const { return (*log)[log->count - 1 - i]; }
      Iterator &operator++() {
        ++i;
        return *this;
      }
      bool operator==(const Iterator &) const = default;
    };

    Iterator begin() const { return {&log, 0}; }
    Iterator end() const { return {&log, log.count}; }
  };

  NewestFirst IterateNewestFirst() const { return {*this}; }
};

} // namespace dhprobe
