#include "terminal.hh"

#include <algorithm>
#include <cerrno>
#include <clocale>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include "format.hh"
#include "log.hh"

#define NCURSES_NOMACROS
#include <ncurses.h>

namespace dhprobe::terminal {

const int kKeyEnter = KEY_ENTER;
const int kKeyBackspace = KEY_BACKSPACE;
const int kKeyResize = KEY_RESIZE;
// Codes assigned with `define_key` in `Terminal::Open`.
const int kKeyFocusIn = KEY_MAX + 1;
const int kKeyFocusOut = KEY_MAX + 2;

static constexpr StrView kPrompt = "> ";

static int RowOf(int y) { return (y + kCellHeight / 2) / kCellHeight; }
static int ColOf(int x) { return (x + kCellWidth / 2) / kCellWidth; }

Terminal::~Terminal() { Close(); }

void Terminal::Open(Status &status) {
  setlocale(LC_ALL, "");
  scr = newterm(nullptr, stdout, stdin);
  if (scr == nullptr) {
    status() += "Couldn't initialize the terminal. Is TERM set?";
    return;
  }
  cbreak();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);
  set_escdelay(25);
  define_key("\x1b[I", kKeyFocusIn);
  define_key("\x1b[O", kKeyFocusOut);
  fputs("\x1b[?1004h", stdout); // enable focus reports
  fflush(stdout);

  fd = FD(dup(STDIN_FILENO));
  if (fd == -1) {
    status() += f("dup(stdin): %s", strerror(errno));
  }
}

void Terminal::Close() {
  if (scr == nullptr) {
    return;
  }
  fputs("\x1b[?1004l", stdout);
  fflush(stdout);
  endwin();
  delscreen(scr);
  scr = nullptr;
}

void Terminal::Resize() {
  winsize ws;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
    resize_term(ws.ws_row, ws.ws_col);
  }
}

layout::Viewport Terminal::Bounds() {
  return {.width = COLS * kCellWidth,
          .height = std::max(LINES - 1, 0) * kCellHeight};
}

void Terminal::FillRect(layout::Rect rect, Fill, Status &status) {
  int top = RowOf(rect.top_left.y);
  int bottom = RowOf(rect.bottom_right.y);
  int left = ColOf(rect.top_left.x);
  int right = ColOf(rect.bottom_right.x);
  if (right <= left) {
    return;
  }
  for (int row = top; row < bottom; ++row) {
    if (mvhline(row, left, ' ', right - left) == ERR) {
      status() += f("Couldn't fill terminal row %d", row);
      break;
    }
  }
}

void Terminal::PostText(layout::Rect box, StrView text, GlyphStyle,
                        Status &status) {
  int row = RowOf(box.top_left.y);
  int col = ColOf(box.top_left.x);
  int width = ColOf(box.bottom_right.x) - col;
  if (width <= 0) {
    return;
  }
  StrView first_line = text.substr(0, text.find('\n'));
  int n = std::min<int>(width, first_line.size());
  int rc = mvaddnstr(row, col, first_line.data(), n);
  if (rc == ERR) {
    status() += f("Couldn't draw text at terminal row %d", row);
  }
}

void Terminal::DrawInputLine() {
  int row = LINES - 1;
  if (row < 0) {
    return;
  }
  int room = std::max(COLS - (int)kPrompt.size() - 1, 0);
  StrView shown = editor.input;
  if ((int)shown.size() > room) {
    shown = shown.substr(shown.size() - room);
  }
  mvaddnstr(row, 0, kPrompt.data(), kPrompt.size());
  addnstr(shown.data(), shown.size());
  clrtoeol();
}

void Terminal::Flush(Status &status) {
  DrawInputLine();
  if (refresh() == ERR) {
    status() += "Couldn't refresh the terminal";
  }
}

void Terminal::NotifyRead(Status &status) {
  pollfd p = {.fd = fd, .events = POLLIN, .revents = 0};
  if (poll(&p, 1, 0) == 1 && (p.revents & (POLLHUP | POLLERR))) {
    LOG << "Terminal hung up";
    on_event({.op = app::Op::Quit});
    return;
  }
  while (registered) {
    int ch = getch();
    if (ch == ERR) {
      break;
    }
    if (auto event = editor.Key(ch)) {
      on_event(*event);
    } else {
      DrawInputLine();
      refresh();
    }
  }
}

Optional<app::Event> LineEditor::Key(int ch) {
  if (ch == '\r' || ch == '\n' || ch == kKeyEnter) {
    app::Event event = {.op = app::Op::Line, .line = input};
    input = "";
    return event;
  }
  if (ch == kKeyBackspace || ch == 127 || ch == 8) {
    // Drop a whole UTF-8 sequence.
    while (!input.empty() && (input.back() & 0xc0) == 0x80) {
      input.pop_back();
    }
    if (!input.empty()) {
      input.pop_back();
    }
    return std::nullopt;
  }
  if (ch == kCtrlD) {
    if (input.empty()) {
      return app::Event{.op = app::Op::Quit};
    }
    return std::nullopt;
  }
  if (ch == kKeyFocusIn || ch == kKeyFocusOut) {
    return app::Event{.op = app::Op::ChangeFocus, .focused = ch == kKeyFocusIn};
  }
  if (ch == kKeyResize) {
    return app::Event{.op = app::Op::Redraw};
  }
  if (ch >= ' ' && ch < 256) {
    input += static_cast<char>(ch);
  }
  return std::nullopt;
}

Optional<app::Event> SignalEvent(int signo) {
  switch (signo) {
  case SIGWINCH:
    return app::Event{.op = app::Op::Redraw};
  case SIGINT:
  case SIGTERM:
    return app::Event{.op = app::Op::Quit};
  }
  return std::nullopt;
}

void Signals::Open(Status &status) {
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGWINCH);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  if (sigprocmask(SIG_BLOCK, &mask, nullptr) == -1) {
    status() += f("sigprocmask(): %s", strerror(errno));
    return;
  }
  fd = FD(signalfd(-1, &mask, SFD_CLOEXEC | SFD_NONBLOCK));
  if (fd == -1) {
    status() += f("signalfd(): %s", strerror(errno));
  }
}

void Signals::NotifyRead(Status &status) {
  signalfd_siginfo info;
  ssize_t n = read(fd, &info, sizeof(info));
  if (n == -1 && (errno == EAGAIN || errno == EINTR)) {
    return;
  }
  if (n != sizeof(info)) {
    status() += f("read(signalfd): %s", strerror(errno));
    return;
  }
  auto event = SignalEvent(info.ssi_signo);
  if (!event) {
    return;
  }
  if (event->op == app::Op::Redraw && terminal) {
    terminal->Resize();
  }
  if (event->op == app::Op::Quit) {
    LOG << "Received " << strsignal(info.ssi_signo);
  }
  on_event(*event);
}

} // namespace dhprobe::terminal
