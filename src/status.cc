#include "status.hh"

#include <cerrno>

namespace dhprobe {

Status::Status() : errsv(0) {}

Str &Status::operator()(const std::source_location location_arg) {
  errsv = errno;
  entry.reset(new Entry{
      .next = std::move(entry),
      .location = location_arg,
      .message = "",
  });
  return entry->message;
}

bool Status::Ok() const { return entry == nullptr; }

Str Status::ToString() const {
  Str ret;
  for (Entry *it = entry.get(); it; it = it->next.get()) {
    if (it->message.empty()) {
      continue;
    }
    if (!ret.empty()) {
      ret += ". ";
    }
    ret += it->message;
  }
  return ret;
}

void Status::Reset() {
  entry.reset();
  errsv = 0;
}

} // namespace dhprobe
