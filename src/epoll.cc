#include "epoll.hh"

#include <cerrno>
#include <cstring>
#include <sys/epoll.h>

#include "format.hh"
#include "int.hh"

namespace dhprobe::epoll {

static FD epoll_fd;
static Size listener_count = 0;

void Init() { epoll_fd = FD(epoll_create1(EPOLL_CLOEXEC)); }

void Add(Listener *listener, Status &status) {
  epoll_event ev = {};
  ev.events = EPOLLIN;
  ev.data.ptr = listener;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, listener->fd, &ev) == -1) {
    status() += f("Couldn't add %s to epoll: %s", listener->Name(),
                  strerror(errno));
    return;
  }
  listener->registered = true;
  ++listener_count;
}

void Del(Listener *listener, Status &status) {
  if (!listener->registered) {
    return;
  }
  listener->registered = false;
  --listener_count;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_DEL, listener->fd, nullptr) == -1) {
    status() += f("Couldn't remove %s from epoll: %s", listener->Name(),
                  strerror(errno));
  }
}

void Loop(Status &status) {
  epoll_event events[8];
  while (listener_count > 0) {
    int n = epoll_wait(epoll_fd, events, 8, -1);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      status() += f("epoll_wait(): %s", strerror(errno));
      return;
    }
    for (int i = 0; i < n; ++i) {
      auto *listener = static_cast<Listener *>(events[i].data.ptr);
      // Might have been removed by an earlier event of this batch.
      if (!listener->registered) {
        continue;
      }
      listener->NotifyRead(status);
      if (!status.Ok()) {
        status() += f("%s failed", listener->Name());
        return;
      }
    }
  }
}

} // namespace dhprobe::epoll
