#pragma once

#include <cstddef>
#include <cstdint>

namespace dhprobe {

using U8 = uint8_t;
using U16 = uint16_t;
using U32 = uint32_t;
using U64 = uint64_t;

using I8 = int8_t;
using I16 = int16_t;
using I32 = int32_t;
using I64 = int64_t;

using Size = size_t;

} // namespace dhprobe
