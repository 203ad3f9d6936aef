#include "hex.hh"

namespace dhprobe {

static constexpr char kHexDigits[] = "0123456789abcdef";

static U8 HexDigitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return 0;
}

void HexToBytesUnchecked(StrView hex, U8 *out_bytes) {
  for (Size i = 0; i + 1 < hex.size(); i += 2) {
    out_bytes[i / 2] = HexDigitValue(hex[i]) << 4 | HexDigitValue(hex[i + 1]);
  }
}

Str BytesToHex(Span<const U8> bytes) {
  Str ret;
  ret.reserve(bytes.size() * 2);
  for (U8 b : bytes) {
    ret += kHexDigits[b >> 4];
    ret += kHexDigits[b & 0xf];
  }
  return ret;
}

Str BytesToSpacedHex(Span<const U8> bytes, Size wrap) {
  Str ret;
  ret.reserve(bytes.size() * 3 + (wrap ? bytes.size() / wrap : 0));
  for (Size i = 0; i < bytes.size(); ++i) {
    if (wrap && i > 0 && i % wrap == 0) {
      ret += '\n';
    }
    ret += kHexDigits[bytes[i] >> 4];
    ret += kHexDigits[bytes[i] & 0xf];
    ret += ' ';
  }
  return ret;
}

} // namespace dhprobe
