#pragma once

#include <concepts>
#include <functional>
#include <source_location>

#include "status.hh"
#include "str.hh"

// Stream-style logging:
//
//   LOG << "Computing ECDH for " << name;
//   ERROR << status;
//
// The entry is delivered to the listeners when the statement ends.
namespace dhprobe {

enum class LogLevel { Info, Error };

const char *LogLevelName(LogLevel);

struct LogEntry {
  LogLevel level;
  std::source_location location;
  Str buffer;

  LogEntry(LogLevel level, const std::source_location location =
                               std::source_location::current());
  LogEntry(const LogEntry &) = delete;
  ~LogEntry();

  LogEntry &operator<<(StrView s) {
    buffer += s;
    return *this;
  }
  LogEntry &operator<<(const char *s) { return *this << StrView(s); }
  LogEntry &operator<<(const Str &s) { return *this << StrView(s); }
  LogEntry &operator<<(char c) {
    buffer += c;
    return *this;
  }
  LogEntry &operator<<(std::integral auto x) {
    buffer += std::to_string(x);
    return *this;
  }
  LogEntry &operator<<(const Status &status) {
    buffer += status.ToString();
    return *this;
  }
};

// "INFO  diagnostic.cc:57 Our public key: ..."
Str FormatLogLine(const LogEntry &);

using LogListener = std::function<void(const LogEntry &)>;

// Returns an id that can be passed to `RemoveLogListener`.
int AddLogListener(LogListener);
void RemoveLogListener(int id);

// Replace the stderr listener with one that appends to the given file.
void LogToFile(const char *path, Status &);

} // namespace dhprobe

#define LOG ::dhprobe::LogEntry(::dhprobe::LogLevel::Info)
#define ERROR ::dhprobe::LogEntry(::dhprobe::LogLevel::Error)
