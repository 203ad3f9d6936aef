#pragma once

#include <functional>

#include "app.hh"
#include "canvas.hh"
#include "epoll.hh"
#include "optional.hh"
#include "str.hh"

struct screen; // ncurses SCREEN

// ncurses front-end of the interactive tool.
//
// The last terminal row holds the input line; everything above it is the
// canvas. One character cell is `kCellWidth` x `kCellHeight` layout units.
namespace dhprobe::terminal {

constexpr int kCellWidth = 8;
constexpr int kCellHeight = 16;

using EventCallback = std::function<void(const app::Event &)>;

// Key codes as returned by ncurses `getch()`.
extern const int kKeyEnter;
extern const int kKeyBackspace;
extern const int kKeyResize;
extern const int kKeyFocusIn;  // xterm focus report (CSI I)
extern const int kKeyFocusOut; // xterm focus report (CSI O)
constexpr int kCtrlD = 4;

// Input line being edited. Keys go in, events come out.
struct LineEditor {
  Str input;

  Optional<app::Event> Key(int ch);
};

// Event for a signal received through `Signals`.
Optional<app::Event> SignalEvent(int signo);

// Canvas + keyboard input on stdin.
struct Terminal : Canvas, epoll::Listener {
  EventCallback on_event;
  LineEditor editor;
  screen *scr = nullptr;

  ~Terminal();

  void Open(Status &);
  void Close();

  // Matches the terminal to its current size (after SIGWINCH).
  void Resize();

  layout::Viewport Bounds() override;
  void FillRect(layout::Rect, Fill, Status &) override;
  void PostText(layout::Rect box, StrView text, GlyphStyle,
                Status &) override;
  void Flush(Status &) override;

  void NotifyRead(Status &) override;
  const char *Name() const override { return "Terminal"; }

  void DrawInputLine();
};

// Delivers SIGWINCH as `Op::Redraw` and SIGINT / SIGTERM as `Op::Quit`.
//
// `Open` blocks those signals, so it should run before ncurses is started.
struct Signals : epoll::Listener {
  EventCallback on_event;
  Terminal *terminal = nullptr;

  void Open(Status &);

  void NotifyRead(Status &) override;
  const char *Name() const override { return "Signals"; }
};

} // namespace dhprobe::terminal
