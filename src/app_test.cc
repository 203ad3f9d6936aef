#include "app.hh"

#include "fakes.hh"
#include "gtest.hh"

using namespace dhprobe;
using namespace dhprobe::fakes;

struct AppTest : ::testing::Test {
  CountingEntropy entropy;
  curve25519::Donna curve;
  RecordingCanvas canvas;
  app::App app{entropy, curve};
};

TEST_F(AppTest, StartShowsBanner) {
  Status status;
  app.Start(canvas, status);
  ASSERT_TRUE(status.Ok()) << status.ToString();
  EXPECT_EQ(canvas.flushes, 1);
  ASSERT_EQ(canvas.fills.size(), 1u);
  EXPECT_EQ(canvas.fills[0],
            (layout::Rect{.top_left = {0, 0}, .bottom_right = {320, 100}}));
  ASSERT_EQ(canvas.texts.size(), 2u);
  EXPECT_EQ(canvas.texts[0].text, "Type 'help' for commands");
  EXPECT_EQ(canvas.texts[0].box.bottom_right.y, 96);
  EXPECT_EQ(canvas.texts[0].style, GlyphStyle::Small);
  EXPECT_EQ(canvas.texts[1].text, "ECDH Test App v0.1.0");
}

TEST_F(AppTest, StartFailsWithoutCanvas) {
  canvas.fail_fill = true;
  Status status;
  app.Start(canvas, status);
  EXPECT_FALSE(status.Ok());
}

TEST_F(AppTest, LineRunsCommandAndRedraws) {
  Status status;
  app.Start(canvas, status);
  canvas.Reset();

  app.Handle({.op = app::Op::Line, .line = "run"}, canvas);
  EXPECT_EQ(entropy.calls, 2);
  EXPECT_EQ(canvas.flushes, 1);
  // Viewport of 100 units fits 6 lines.
  ASSERT_EQ(canvas.texts.size(), 6u);
  EXPECT_EQ(canvas.texts[0].text, "=== TEST COMPLETE ===");
  EXPECT_EQ(canvas.texts[1].text, "OK: shared != any pubkey");
}

TEST_F(AppTest, RedrawFollowsViewport) {
  Status status;
  app.Start(canvas, status);
  app.Handle({.op = app::Op::Line, .line = "run"}, canvas);
  canvas.Reset();

  canvas.viewport = {.width = 640, .height = 1000};
  app.Handle({.op = app::Op::Redraw}, canvas);
  EXPECT_EQ(canvas.texts.size(), app.log.size());
  EXPECT_EQ(canvas.texts.back().text, "ECDH Test App v0.1.0");
  EXPECT_EQ(canvas.texts.front().box.bottom_right.x, 636);
}

TEST_F(AppTest, DrawErrorsAreNotFatal) {
  Status status;
  app.Start(canvas, status);
  canvas.Reset();
  canvas.fail_text = "Type 'help' for commands";
  LogCapture capture;

  app.Handle({.op = app::Op::Redraw}, canvas);
  EXPECT_EQ(canvas.texts.size(), 1u);
  EXPECT_EQ(canvas.flushes, 1);
  ASSERT_FALSE(capture.lines.empty());
  EXPECT_EQ(capture.lines[0].level, LogLevel::Error);

  canvas.fail_text = "";
  canvas.fail_flush = true;
  app.Handle({.op = app::Op::Line, .line = "clear"}, canvas);
  EXPECT_TRUE(app.running);
  EXPECT_EQ(app.log[0], "Screen cleared");
}

TEST_F(AppTest, FocusAndQuit) {
  Status status;
  app.Start(canvas, status);
  canvas.Reset();

  app.Handle({.op = app::Op::ChangeFocus, .focused = true}, canvas);
  EXPECT_TRUE(app.running);
  EXPECT_EQ(canvas.flushes, 0);

  app.Handle({.op = app::Op::Quit}, canvas);
  EXPECT_FALSE(app.running);
}
