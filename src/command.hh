#pragma once

#include "diagnostic.hh"
#include "message_log.hh"
#include "str.hh"

namespace dhprobe {

enum class Command { Run, Clear, Help };

// Strips whitespace (ASCII and Unicode, UTF-8 encoded) from both ends.
StrView Trim(StrView);

// Exact, case-sensitive match on the trimmed input. Anything unrecognized is
// `Command::Help`.
Command ParseCommand(StrView raw_input);

struct CommandDispatcher {
  MessageLog &log;
  DiagnosticEngine &engine;

  // Echoes the input to the log and executes the command.
  Command Dispatch(StrView raw_input);
};

} // namespace dhprobe
