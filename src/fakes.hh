#pragma once

// Fakes shared by the tests.

#include <algorithm>
#include <numeric>
#include <source_location>

#include "canvas.hh"
#include "curve25519.hh"
#include "entropy.hh"
#include "log.hh"
#include "str.hh"
#include "vec.hh"

namespace dhprobe::fakes {

// Produces 00 01 02 .. 1f, then 20 21 .. 3f, and so on.
struct CountingEntropy : entropy::Source {
  U8 next = 0;
  int calls = 0;

  void Fill(Span<U8, 32> out, Status &) override {
    std::iota(out.begin(), out.end(), next);
    next += 32;
    ++calls;
  }
};

// Works `successful_calls` times, then fails.
struct FailingEntropy : CountingEntropy {
  int successful_calls = 0;

  void Fill(Span<U8, 32> out, Status &status) override {
    if (calls >= successful_calls) {
      ++calls;
      status() += "Entropy pool exhausted";
      return;
    }
    CountingEntropy::Fill(out, status);
  }
};

// Returns the peer public key as the shared secret.
struct PeerEchoCurve : curve25519::Donna {
  curve25519::Shared DiffieHellman(const curve25519::Private &,
                                   const curve25519::Public &peer) override {
    return {peer.bytes};
  }
};

// Returns our own public key as the shared secret.
struct OwnEchoCurve : curve25519::Donna {
  curve25519::Shared DiffieHellman(const curve25519::Private &secret,
                                   const curve25519::Public &) override {
    return {DerivePublic(secret).bytes};
  }
};

struct LogCapture {
  struct Line {
    LogLevel level;
    Str text;
    std::source_location location;
    Str formatted; // as written to the log file
  };
  Vec<Line> lines;
  int id;

  LogCapture() {
    id = AddLogListener([this](const LogEntry &e) {
      lines.push_back({e.level, e.buffer, e.location, FormatLogLine(e)});
    });
  }
  ~LogCapture() { RemoveLogListener(id); }

  bool Contains(StrView text) const {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const Line &line) { return line.text == text; });
  }
};

// Records the draw calls. Individual calls can be made to fail.
struct RecordingCanvas : Canvas {
  struct Text {
    layout::Rect box;
    Str text;
    GlyphStyle style;
  };

  layout::Viewport viewport = {.width = 320, .height = 100};
  Vec<layout::Rect> fills;
  Vec<Text> texts;
  int flushes = 0;
  bool fail_fill = false;
  bool fail_flush = false;
  Str fail_text; // PostText fails for this text

  layout::Viewport Bounds() override { return viewport; }

  void FillRect(layout::Rect rect, Fill, Status &status) override {
    if (fail_fill) {
      status() += "Canvas is gone";
      return;
    }
    fills.push_back(rect);
  }

  void PostText(layout::Rect box, StrView text, GlyphStyle style,
                Status &status) override {
    if (!fail_text.empty() && text == fail_text) {
      status() += "Glyph cache full";
      return;
    }
    texts.push_back({box, Str(text), style});
  }

  void Flush(Status &status) override {
    if (fail_flush) {
      status() += "Flush failed";
      return;
    }
    ++flushes;
  }

  void Reset() {
    fills.clear();
    texts.clear();
    flushes = 0;
  }
};

} // namespace dhprobe::fakes
