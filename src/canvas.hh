#pragma once

#include "layout.hh"
#include "status.hh"
#include "str.hh"

namespace dhprobe {

enum class Fill { Light };

enum class GlyphStyle { Small };

// Drawing surface. Coordinates are layout units.
struct Canvas {
  virtual ~Canvas() = default;

  virtual layout::Viewport Bounds() = 0;

  virtual void FillRect(layout::Rect, Fill, Status &) = 0;

  // Draws `text` clipped to `box`.
  virtual void PostText(layout::Rect box, StrView text, GlyphStyle,
                        Status &) = 0;

  // Makes everything drawn so far visible.
  virtual void Flush(Status &) = 0;
};

} // namespace dhprobe
