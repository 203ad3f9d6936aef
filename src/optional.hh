#pragma once

#include <optional>

namespace dhprobe {

template <typename T> using Optional = std::optional<T>;

} // namespace dhprobe
