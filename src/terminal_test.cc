#include "terminal.hh"

#include <csignal>

#include "gtest.hh"

using namespace dhprobe;
using namespace dhprobe::terminal;

static void Type(LineEditor &editor, StrView text) {
  for (char c : text) {
    EXPECT_FALSE(editor.Key(static_cast<unsigned char>(c)).has_value());
  }
}

TEST(LineEditorTest, EnterEmitsLine) {
  LineEditor editor;
  Type(editor, " run");
  auto event = editor.Key('\r');
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->op, app::Op::Line);
  EXPECT_EQ(event->line, " run");
  EXPECT_EQ(editor.input, "");

  event = editor.Key(kKeyEnter);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->op, app::Op::Line);
  EXPECT_EQ(event->line, "");
}

TEST(LineEditorTest, BackspaceRemovesWholeCharacter) {
  LineEditor editor;
  Type(editor, "r\xc3\xa9");
  EXPECT_FALSE(editor.Key(kKeyBackspace).has_value());
  EXPECT_EQ(editor.input, "r");
  EXPECT_FALSE(editor.Key(127).has_value());
  EXPECT_EQ(editor.input, "");
  EXPECT_FALSE(editor.Key(8).has_value());
  EXPECT_EQ(editor.input, "");

  Type(editor, "\xe3\x80\x80x");
  editor.Key(kKeyBackspace);
  editor.Key(kKeyBackspace);
  EXPECT_EQ(editor.input, "");
}

TEST(LineEditorTest, CtrlDQuitsOnlyOnEmptyLine) {
  LineEditor editor;
  Type(editor, "ru");
  EXPECT_FALSE(editor.Key(kCtrlD).has_value());
  EXPECT_EQ(editor.input, "ru");

  editor.Key(kKeyBackspace);
  editor.Key(kKeyBackspace);
  auto event = editor.Key(kCtrlD);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->op, app::Op::Quit);
}

TEST(LineEditorTest, FocusReports) {
  LineEditor editor;
  auto in = editor.Key(kKeyFocusIn);
  ASSERT_TRUE(in.has_value());
  EXPECT_EQ(in->op, app::Op::ChangeFocus);
  EXPECT_TRUE(in->focused);

  auto out = editor.Key(kKeyFocusOut);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->op, app::Op::ChangeFocus);
  EXPECT_FALSE(out->focused);
}

TEST(LineEditorTest, ResizeAndControlKeys) {
  LineEditor editor;
  auto event = editor.Key(kKeyResize);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->op, app::Op::Redraw);

  // Other control characters are ignored.
  EXPECT_FALSE(editor.Key(1).has_value());
  EXPECT_FALSE(editor.Key('\t').has_value());
  EXPECT_EQ(editor.input, "");
}

TEST(SignalEventTest, Mapping) {
  auto winch = SignalEvent(SIGWINCH);
  ASSERT_TRUE(winch.has_value());
  EXPECT_EQ(winch->op, app::Op::Redraw);

  auto sigint = SignalEvent(SIGINT);
  ASSERT_TRUE(sigint.has_value());
  EXPECT_EQ(sigint->op, app::Op::Quit);

  auto sigterm = SignalEvent(SIGTERM);
  ASSERT_TRUE(sigterm.has_value());
  EXPECT_EQ(sigterm->op, app::Op::Quit);

  EXPECT_FALSE(SignalEvent(SIGUSR1).has_value());
}
