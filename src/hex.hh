#pragma once

#include "arr.hh"
#include "int.hh"
#include "span.hh"
#include "str.hh"

namespace dhprobe {

void HexToBytesUnchecked(StrView hex, U8 *out_bytes);

// "deadbeef"
Str BytesToHex(Span<const U8> bytes);

// "de ad be ef " - every byte is followed by a single space.
//
// When `wrap` is non-zero, a newline is inserted before every `wrap`-th byte
// (except the first one).
Str BytesToSpacedHex(Span<const U8> bytes, Size wrap = 0);

template <Size N> Arr<U8, (N - 1) / 2> HexArr(const char (&str)[N]) {
  Arr<U8, (N - 1) / 2> arr;
  HexToBytesUnchecked(StrView(str, N - 1), arr.data());
  return arr;
}

} // namespace dhprobe
