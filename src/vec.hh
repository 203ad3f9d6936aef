#pragma once

#include <vector>

namespace dhprobe {

template <typename T> using Vec = std::vector<T>;

} // namespace dhprobe
