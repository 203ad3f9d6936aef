#pragma once

#include "message_log.hh"
#include "str.hh"
#include "vec.hh"

// Bottom-anchored transcript layout. The newest entry sits at the bottom of
// the viewport; entries that don't fit at the top are dropped.
namespace dhprobe::layout {

struct Config {
  int margin = 4;
  int line_height = 16;
};

struct Point {
  int x;
  int y;

  bool operator==(const Point &) const = default;
};

struct Rect {
  Point top_left;
  Point bottom_right;

  bool operator==(const Rect &) const = default;
};

struct Viewport {
  int width;
  int height;
};

struct Line {
  StrView text; // points into the MessageLog
  Rect box;
};

// Lines are ordered newest first (bottom to top). No box ever has a negative
// top coordinate.
Vec<Line> Layout(Viewport, const MessageLog &, const Config & = {});

} // namespace dhprobe::layout
