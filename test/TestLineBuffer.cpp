#include "terminal/line_buffer.hpp"

#include <gtest/gtest.h>

TEST(LineBuffer, SplitsAcrossPartialReads) {
  LineBuffer b;
  EXPECT_TRUE(b.Feed("hel").empty());
  EXPECT_TRUE(b.HasPartial());
  auto lines = b.Feed("lo\nwor");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "hello");
  lines = b.Feed("ld\n\n");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "world");
  EXPECT_EQ(lines[1], "");
  EXPECT_FALSE(b.HasPartial());
}

TEST(LineBuffer, DropsCarriageReturns) {
  LineBuffer b;
  auto lines = b.Feed("a\r\nb\r");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "a");
  lines = b.Feed("\n");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "b");
}

TEST(LineBuffer, FlushReturnsTrailingPartial) {
  LineBuffer b;
  b.Feed("done\n$ ");
  auto tail = b.Flush();
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(*tail, "$ ");
  EXPECT_FALSE(b.Flush().has_value());
}

TEST(LineBuffer, ClearDropsPartial) {
  LineBuffer b;
  b.Feed("stale output");
  b.Clear();
  auto lines = b.Feed("fresh\n");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "fresh");
}
