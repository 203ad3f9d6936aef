#include "message_log.hh"

#include "format.hh"
#include "gtest.hh"
#include "vec.hh"

using namespace dhprobe;

static Vec<Str> Entries(const MessageLog &log) {
  Vec<Str> ret;
  for (Size i = 0; i < log.size(); ++i) {
    ret.push_back(log[i]);
  }
  return ret;
}

TEST(MessageLogTest, LengthFollowsAppendsUpToCapacity) {
  for (int count = 0; count <= 45; ++count) {
    MessageLog log;
    for (int i = 0; i < count; ++i) {
      log.Append(f("msg%d", i));
    }
    if (count <= 20) {
      EXPECT_EQ(log.size(), (Size)count);
      if (count > 0) {
        EXPECT_EQ(log[0], "msg0");
      }
    } else {
      EXPECT_EQ(log.size(), 20u);
      // (count - 19)th appended entry, counting from 1
      EXPECT_EQ(log[0], f("msg%d", count - 20));
      EXPECT_EQ(log[19], f("msg%d", count - 1));
    }
  }
}

TEST(MessageLogTest, EvictsOldest) {
  MessageLog log;
  for (int i = 0; i <= 20; ++i) {
    log.Append(f("msg%d", i));
  }
  Vec<Str> expected;
  for (int i = 1; i <= 20; ++i) {
    expected.push_back(f("msg%d", i));
  }
  EXPECT_EQ(Entries(log), expected);
}

TEST(MessageLogTest, Clear) {
  MessageLog log;
  log.Clear();
  EXPECT_TRUE(log.empty());

  for (int i = 0; i < 27; ++i) {
    log.Append("x");
  }
  log.Clear();
  EXPECT_EQ(log.size(), 0u);

  // Still holds a full 20 entries afterwards.
  for (int i = 0; i < 25; ++i) {
    log.Append(f("after%d", i));
  }
  EXPECT_EQ(log.size(), 20u);
  EXPECT_EQ(log[0], "after5");
}

TEST(MessageLogTest, NewestFirst) {
  MessageLog log;
  for (int i = 0; i < 23; ++i) {
    log.Append(f("msg%d", i));
  }
  Vec<Str> seen;
  for (const Str &entry : log.IterateNewestFirst()) {
    seen.push_back(entry);
  }
  ASSERT_EQ(seen.size(), 20u);
  EXPECT_EQ(seen.front(), "msg22");
  EXPECT_EQ(seen.back(), "msg3");

  // Restartable and non-mutating.
  Vec<Str> again;
  for (const Str &entry : log.IterateNewestFirst()) {
    again.push_back(entry);
  }
  EXPECT_EQ(seen, again);
  EXPECT_EQ(log.size(), 20u);
}

TEST(MessageLogTest, NewestFirstOfEmptyLog) {
  MessageLog log;
  auto view = log.IterateNewestFirst();
  EXPECT_TRUE(view.begin() == view.end());
}

TEST(MessageLogTest, LongEntriesAreTruncated) {
  MessageLog log;
  log.Append(Str(600, 'a'));
  log.Append("after");
  EXPECT_EQ(log[0], Str(512, 'a'));
  EXPECT_EQ(log[1], "after");
}

TEST(MessageLogTest, TruncationKeepsUtf8Intact) {
  MessageLog log;
  // 511 ASCII bytes followed by a 2-byte character straddling the limit.
  log.Append(Str(511, 'a') + "\xc3\xa9" + "tail");
  EXPECT_EQ(log[0], Str(511, 'a'));

  log.Append(Str(510, 'a') + "\xc3\xa9" + "tail");
  EXPECT_EQ(log[1], Str(510, 'a') + "\xc3\xa9");
}
