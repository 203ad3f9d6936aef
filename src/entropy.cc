#include "entropy.hh"

#include <fcntl.h>

namespace dhprobe::entropy {

void DevUrandom::Open(Config config, Status &status) {
  fd = FD::Open(config.path.c_str(), O_RDONLY, status);
  if (!status.Ok()) {
    status() += "Entropy source unavailable";
  }
}

void DevUrandom::Fill(Span<U8, 32> out, Status &status) {
  if (fd == -1) {
    status() += "Entropy source is not open";
    return;
  }
  fd.ReadFull(out, status);
  if (!status.Ok()) {
    status() += "Couldn't read entropy";
  }
}

} // namespace dhprobe::entropy
