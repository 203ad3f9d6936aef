#pragma once

#include <array>

#include "int.hh"

namespace dhprobe {

template <typename T, Size N> using Arr = std::array<T, N>;

} // namespace dhprobe
