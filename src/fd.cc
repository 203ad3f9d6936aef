#include "fd.hh"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "format.hh"

namespace dhprobe {

FD::FD() : fd(-1) {}

FD::FD(int fd) : fd(fd) {}

FD::FD(FD &&other) : fd(other.fd) { other.fd = -1; }

FD::~FD() { Close(); }

FD &FD::operator=(FD &&other) {
  if (this != &other) {
    Close();
    fd = other.fd;
    other.fd = -1;
  }
  return *this;
}

FD FD::Open(const char *path, int flags, Status &status) {
  int fd = open(path, flags | O_CLOEXEC);
  if (fd == -1) {
    status() += f("open(%s): %s", path, strerror(errno));
  }
  return FD(fd);
}

void FD::Close() {
  if (fd != -1) {
    close(fd);
    fd = -1;
  }
}

void FD::ReadFull(Span<U8> buffer, Status &status) {
  Size done = 0;
  while (done < buffer.size()) {
    ssize_t n = read(fd, buffer.data() + done, buffer.size() - done);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      status() += f("read(): %s", strerror(errno));
      return;
    }
    if (n == 0) {
      status() += f("Unexpected EOF after %zu of %zu bytes", done,
                    buffer.size());
      return;
    }
    done += n;
  }
}

} // namespace dhprobe
