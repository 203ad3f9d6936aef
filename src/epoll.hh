#pragma once

#include "fd.hh"
#include "status.hh"

// Single-threaded event loop.
namespace dhprobe::epoll {

struct Listener {
  FD fd;
  bool registered = false;

  virtual ~Listener() = default;

  // Called when `fd` becomes readable (or hangs up).
  virtual void NotifyRead(Status &) = 0;

  virtual const char *Name() const = 0;
};

void Init();

void Add(Listener *, Status &);
void Del(Listener *, Status &);

// Blocks until no listeners are left or one of them fails.
void Loop(Status &);

} // namespace dhprobe::epoll
