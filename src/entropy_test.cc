#include "entropy.hh"

#include <cerrno>

#include "arr.hh"
#include "gtest.hh"

using namespace dhprobe;

TEST(EntropyTest, DevUrandomProducesFreshBytes) {
  entropy::DevUrandom urandom;
  Status status;
  urandom.Open({}, status);
  ASSERT_TRUE(status.Ok()) << status.ToString();

  Arr<U8, 32> a = {}, b = {};
  urandom.Fill(a, status);
  urandom.Fill(b, status);
  ASSERT_TRUE(status.Ok()) << status.ToString();
  EXPECT_NE(a, b);
}

TEST(EntropyTest, MissingDevice) {
  entropy::DevUrandom source;
  Status status;
  source.Open({.path = "/nonexistent/urandom"}, status);
  EXPECT_FALSE(status.Ok());
  EXPECT_EQ(status.errsv, ENOENT);

  status.Reset();
  Arr<U8, 32> out = {};
  source.Fill(out, status);
  EXPECT_FALSE(status.Ok());
}

TEST(EntropyTest, ShortReadIsAnError) {
  entropy::DevUrandom source;
  Status status;
  source.Open({.path = "/dev/null"}, status);
  ASSERT_TRUE(status.Ok()) << status.ToString();

  Arr<U8, 32> out = {};
  source.Fill(out, status);
  EXPECT_FALSE(status.Ok());
}
