#include "layout.hh"

namespace dhprobe::layout {

Vec<Line> Layout(Viewport viewport, const MessageLog &log,
                 const Config &config) {
  Vec<Line> lines;
  int y = viewport.height - config.margin;
  for (const Str &entry : log.IterateNewestFirst()) {
    if (y - config.line_height < 0) {
      break;
    }
    lines.push_back(Line{
        .text = entry,
        .box = {.top_left = {config.margin, y - config.line_height},
                .bottom_right = {viewport.width - config.margin, y}},
    });
    y -= config.line_height;
  }
  return lines;
}

} // namespace dhprobe::layout
