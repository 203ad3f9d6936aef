#pragma once

#include <string>
#include <string_view>

namespace dhprobe {

using Str = std::string;
using StrView = std::string_view;

using namespace std::string_literals;
using namespace std::string_view_literals;

} // namespace dhprobe
