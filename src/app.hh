#pragma once

#include "canvas.hh"
#include "command.hh"
#include "curve25519.hh"
#include "diagnostic.hh"
#include "entropy.hh"
#include "layout.hh"
#include "message_log.hh"
#include "status.hh"
#include "str.hh"

namespace dhprobe::app {

struct Config {
  Str log_path = "ecdh-probe.log";
  layout::Config layout;
  entropy::DevUrandom::Config entropy;
};

enum class Op {
  Redraw,
  Line,        // `Event::line` holds the text
  ChangeFocus, // `Event::focused` holds the new state
  Quit,
};

struct Event {
  Op op;
  Str line;
  bool focused = false;
};

// Session state, owned by the event loop.
struct App {
  layout::Config layout_config;
  MessageLog log;
  DiagnosticEngine engine;
  CommandDispatcher dispatcher;
  bool running = true;

  App(entropy::Source &, curve25519::Curve &, layout::Config = {});
  App(const App &) = delete;

  // Shows the banner and draws the first frame. Failure here is fatal.
  void Start(Canvas &, Status &);

  // Draw errors are logged. They never stop the session.
  void Handle(const Event &, Canvas &);

  void Redraw(Canvas &, Status &);
};

} // namespace dhprobe::app
