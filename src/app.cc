#include "app.hh"

#include "log.hh"

namespace dhprobe::app {

App::App(entropy::Source &entropy, curve25519::Curve &curve,
         layout::Config layout_config)
    : layout_config(layout_config), engine{.entropy = entropy, .curve = curve},
      dispatcher{.log = log, .engine = engine} {}

void App::Start(Canvas &canvas, Status &status) {
  log.Append("ECDH Test App v0.1.0");
  log.Append("Type 'help' for commands");
  Redraw(canvas, status);
  if (!status.Ok()) {
    status() += "Couldn't do initial redraw";
    return;
  }
  LOG << "ECDH Test App ready, entering main loop";
}

void App::Handle(const Event &event, Canvas &canvas) {
  Status status;
  switch (event.op) {
  case Op::Redraw:
    Redraw(canvas, status);
    break;
  case Op::Line:
    LOG << "Received input: " << event.line;
    dispatcher.Dispatch(event.line);
    Redraw(canvas, status);
    break;
  case Op::ChangeFocus:
    LOG << (event.focused ? "Focus gained" : "Focus lost");
    break;
  case Op::Quit:
    LOG << "Quit requested, exiting";
    running = false;
    break;
  }
  if (!status.Ok()) {
    ERROR << status;
  }
}

void App::Redraw(Canvas &canvas, Status &status) {
  layout::Viewport viewport = canvas.Bounds();
  canvas.FillRect({.top_left = {0, 0},
                   .bottom_right = {viewport.width, viewport.height}},
                  Fill::Light, status);
  if (!status.Ok()) {
    status() += "Couldn't clear canvas";
    return;
  }
  for (auto &line : layout::Layout(viewport, log, layout_config)) {
    Status text_status;
    canvas.PostText(line.box, line.text, GlyphStyle::Small, text_status);
    if (!text_status.Ok()) {
      ERROR << "Couldn't draw \"" << line.text << "\": " << text_status;
    }
  }
  canvas.Flush(status);
}

} // namespace dhprobe::app
