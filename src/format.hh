#pragma once

#include "str.hh"

namespace dhprobe {

// printf-style formatting into a Str.
Str f(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace dhprobe
