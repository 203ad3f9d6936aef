#include "command.hh"

#include "log.hh"

namespace dhprobe {

static constexpr StrView kAsciiWhitespace = " \t\n\r\f\v";

// UTF-8 encodings of the non-ASCII White_Space characters.
static constexpr StrView kUnicodeWhitespace[] = {
    "\xc2\x85",     // U+0085
    "\xc2\xa0",     // U+00A0
    "\xe1\x9a\x80", // U+1680
    "\xe2\x80\x80", "\xe2\x80\x81", "\xe2\x80\x82", "\xe2\x80\x83",
    "\xe2\x80\x84", "\xe2\x80\x85", "\xe2\x80\x86", "\xe2\x80\x87",
    "\xe2\x80\x88", "\xe2\x80\x89", "\xe2\x80\x8a", // U+2000..U+200A
    "\xe2\x80\xa8", "\xe2\x80\xa9", // U+2028, U+2029
    "\xe2\x80\xaf",                 // U+202F
    "\xe2\x81\x9f",                 // U+205F
    "\xe3\x80\x80",                 // U+3000
};

// Length of the whitespace character at the start of `s` or 0.
static Size LeadingSpace(StrView s) {
  if (!s.empty() && kAsciiWhitespace.find(s.front()) != StrView::npos) {
    return 1;
  }
  for (StrView space : kUnicodeWhitespace) {
    if (s.starts_with(space)) {
      return space.size();
    }
  }
  return 0;
}

// Length of the whitespace character at the end of `s` or 0.
static Size TrailingSpace(StrView s) {
  if (!s.empty() && kAsciiWhitespace.find(s.back()) != StrView::npos) {
    return 1;
  }
  for (StrView space : kUnicodeWhitespace) {
    if (s.ends_with(space)) {
      return space.size();
    }
  }
  return 0;
}

StrView Trim(StrView s) {
  while (Size n = LeadingSpace(s)) {
    s.remove_prefix(n);
  }
  while (Size n = TrailingSpace(s)) {
    s.remove_suffix(n);
  }
  return s;
}

Command ParseCommand(StrView raw_input) {
  StrView trimmed = Trim(raw_input);
  if (trimmed == "run") {
    return Command::Run;
  }
  if (trimmed == "clear") {
    return Command::Clear;
  }
  return Command::Help;
}

Command CommandDispatcher::Dispatch(StrView raw_input) {
  log.Append(">" + Str(raw_input));

  Command command = ParseCommand(raw_input);
  switch (command) {
  case Command::Run: {
    Status status;
    engine.Run(log, status);
    if (!status.Ok()) {
      ERROR << status;
      log.Append("Test aborted: " + status.ToString());
    }
    break;
  }
  case Command::Clear:
    log.Clear();
    log.Append("Screen cleared");
    break;
  case Command::Help:
    log.Append("Type 'run' to test ECDH");
    break;
  }
  return command;
}

} // namespace dhprobe
