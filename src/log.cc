#include "log.hh"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include "format.hh"
#include "vec.hh"

namespace dhprobe {

namespace {

void WriteEntry(FILE *out, const LogEntry &e) {
  Str line = FormatLogLine(e);
  fprintf(out, "%s\n", line.c_str());
  fflush(out);
}

struct Listeners {
  Vec<std::pair<int, LogListener>> list;
  int next_id = 1;
  int default_id = 0;
  FILE *file = nullptr;

  Listeners() {
    list.emplace_back(default_id,
                      [](const LogEntry &e) { WriteEntry(stderr, e); });
  }

  ~Listeners() {
    if (file) {
      fclose(file);
    }
  }
};

Listeners &GetListeners() {
  static Listeners listeners;
  return listeners;
}

} // namespace

const char *LogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Error:
    return "ERROR";
  }
  return "?";
}

Str FormatLogLine(const LogEntry &e) {
  const char *file = e.location.file_name();
  if (const char *slash = strrchr(file, '/')) {
    file = slash + 1;
  }
  return f("%-5s %s:%u ", LogLevelName(e.level), file,
           (unsigned)e.location.line()) +
         e.buffer;
}

LogEntry::LogEntry(LogLevel level, const std::source_location location)
    : level(level), location(location) {}

LogEntry::~LogEntry() {
  // Copy so that listeners may unregister themselves.
  auto list = GetListeners().list;
  for (auto &[id, listener] : list) {
    listener(*this);
  }
}

int AddLogListener(LogListener listener) {
  auto &listeners = GetListeners();
  int id = listeners.next_id++;
  listeners.list.emplace_back(id, std::move(listener));
  return id;
}

void RemoveLogListener(int id) {
  auto &list = GetListeners().list;
  std::erase_if(list, [id](auto &entry) { return entry.first == id; });
}

void LogToFile(const char *path, Status &status) {
  auto &listeners = GetListeners();
  FILE *file = fopen(path, "a");
  if (file == nullptr) {
    status() += f("Couldn't open log file %s: %s", path, strerror(errno));
    return;
  }
  if (listeners.file) {
    fclose(listeners.file);
  }
  listeners.file = file;
  RemoveLogListener(listeners.default_id);
  listeners.default_id = AddLogListener(
      [file](const LogEntry &e) { WriteEntry(file, e); });
}

} // namespace dhprobe
