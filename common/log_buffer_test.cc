// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/log_buffer.h"
#include <gtest/gtest.h>

TEST(LogBufferTest, Empty) {
  warden::LogBuffer buffer(4);
  EXPECT_EQ(0, buffer.Size());
  EXPECT_EQ(4, buffer.Capacity());
  EXPECT_TRUE(buffer.Tail(10).empty());
}

TEST(LogBufferTest, TailIsOldestFirst) {
  warden::LogBuffer buffer(4);
  buffer.Append("a");
  buffer.Append("b");
  buffer.Append("c");

  std::vector<std::string> tail = buffer.Tail(2);
  ASSERT_EQ(2, tail.size());
  EXPECT_EQ("b", tail[0]);
  EXPECT_EQ("c", tail[1]);

  tail = buffer.Tail(100);
  ASSERT_EQ(3, tail.size());
  EXPECT_EQ("a", tail[0]);
  EXPECT_EQ(0, buffer.Tail(0).size());
}

TEST(LogBufferTest, Wraps) {
  warden::LogBuffer buffer(3);
  for (int i = 0; i < 10; i++) {
    buffer.Append(std::to_string(i));
  }
  EXPECT_EQ(3, buffer.Size());
  EXPECT_EQ(7, buffer.Dropped());
  std::vector<std::string> tail = buffer.Tail(3);
  ASSERT_EQ(3, tail.size());
  EXPECT_EQ("7", tail[0]);
  EXPECT_EQ("8", tail[1]);
  EXPECT_EQ("9", tail[2]);

  // A shorter tail is a suffix of a longer one.
  std::vector<std::string> shorter = buffer.Tail(2);
  EXPECT_EQ(std::vector<std::string>(tail.begin() + 1, tail.end()), shorter);
}

TEST(LogBufferTest, Clear) {
  warden::LogBuffer buffer(3);
  buffer.Append("x");
  buffer.Append("y");
  buffer.Clear();
  EXPECT_EQ(0, buffer.Size());
  buffer.Append("z");
  std::vector<std::string> tail = buffer.Tail(5);
  ASSERT_EQ(1, tail.size());
  EXPECT_EQ("z", tail[0]);
}
