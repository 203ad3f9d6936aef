#include "message_log.hh"

namespace dhprobe {

static StrView TruncateUtf8(StrView text, Size max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  Size cut = max_bytes;
  while (cut > 0 && (static_cast<U8>(text[cut]) & 0xc0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

void MessageLog::Append(StrView text) {
  if (count == kCapacity) {
    head = (head + 1) % kCapacity;
    --count;
  }
  entries[(head + count) % kCapacity] = TruncateUtf8(text, kMaxEntryBytes);
  ++count;
}

void MessageLog::Clear() {
  for (auto &entry : entries) {
    entry.clear();
  }
  head = 0;
  count = 0;
}

} // namespace dhprobe
