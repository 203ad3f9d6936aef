#pragma once

#include "int.hh"
#include "span.hh"
#include "status.hh"

namespace dhprobe {

// Wrapper around a file descriptor.
struct FD {
  int fd;

  FD();
  FD(int fd);
  FD(const FD &) = delete;
  FD(FD &&other);
  ~FD();

  operator int() const { return fd; }

  FD &operator=(const FD &) = delete;
  FD &operator=(FD &&other);

  static FD Open(const char *path, int flags, Status &);

  void Close();

  // Keeps reading until `buffer` is full. Hitting EOF early is an error.
  void ReadFull(Span<U8> buffer, Status &);
};

} // namespace dhprobe
