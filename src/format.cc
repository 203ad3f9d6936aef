#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace dhprobe {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args_copy;
  va_copy(args_copy, args);
  int n = vsnprintf(nullptr, 0, fmt, args_copy);
  va_end(args_copy);
  Str ret;
  if (n > 0) {
    ret.resize(n);
    vsnprintf(ret.data(), n + 1, fmt, args);
  }
  va_end(args);
  return ret;
}

} // namespace dhprobe
