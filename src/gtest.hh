#pragma once

#include <gtest/gtest.h>
#include <ostream>

#include "status.hh"

namespace dhprobe {

inline void PrintTo(const Status &status, std::ostream *os) {
  *os << (status.Ok() ? "OK" : status.ToString());
}

} // namespace dhprobe
