#pragma once

#include <span>

#include "int.hh"

namespace dhprobe {

template <typename T = char, Size Extent = std::dynamic_extent>
using Span = std::span<T, Extent>;

} // namespace dhprobe
