// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/event.h"
#include "common/server_status.h"
#include <gtest/gtest.h>

using ServerEvent = warden::ServerEvent;
using EventType = warden::EventType;
using ServerState = warden::ServerState;

TEST(EventTest, Masks) {
  ServerEvent chat = {.server_id = "s1",
                      .type = EventType::kChat,
                      .timestamp = 1,
                      .event = warden::ChatMessage{.name = "Steve",
                                                   .text = "hi"}};
  EXPECT_TRUE(chat.IsMaskedIn(warden::kAllEvents));
  EXPECT_TRUE(chat.IsMaskedIn(warden::kChatEvents));
  EXPECT_FALSE(chat.IsMaskedIn(warden::kPlayerEvents | warden::kStatusEvents));
  EXPECT_FALSE(chat.IsMaskedIn(warden::kNoEvents));

  ServerEvent death = {.server_id = "s1",
                       .type = EventType::kDeath,
                       .timestamp = 2,
                       .event = warden::Death{.name = "Alex",
                                              .message = "Alex fell"}};
  EXPECT_TRUE(death.IsMaskedIn(warden::kGameplayEvents));
  EXPECT_FALSE(death.IsMaskedIn(warden::kChatEvents));
}

TEST(EventTest, StatusChangeProto) {
  ServerEvent event = {
      .server_id = "abc",
      .type = EventType::kStatusChanged,
      .timestamp = 1234,
      .event = warden::StatusChange{.old_state = ServerState::kStarting,
                                    .new_state = ServerState::kRunning,
                                    .pid = 99}};
  warden::proto::ServerEvent proto;
  event.ToProto(&proto);
  EXPECT_EQ("abc", proto.server_id());
  EXPECT_EQ(1234, proto.timestamp());
  ASSERT_TRUE(proto.has_status_changed());
  EXPECT_EQ(warden::proto::STARTING, proto.status_changed().old_state());
  EXPECT_EQ(warden::proto::RUNNING, proto.status_changed().new_state());
  EXPECT_EQ(99, proto.status_changed().pid());
}

TEST(EventTest, JoinAndLeaveAreDistinct) {
  ServerEvent leave = {.server_id = "x",
                       .type = EventType::kPlayerLeave,
                       .timestamp = 1,
                       .event = warden::PlayerPresence{.name = "Steve"}};
  warden::proto::ServerEvent proto;
  leave.ToProto(&proto);
  EXPECT_FALSE(proto.has_player_join());
  ASSERT_TRUE(proto.has_player_leave());
  EXPECT_EQ("Steve", proto.player_leave().name());
}

TEST(EventTest, CrashProto) {
  ServerEvent crash = {.server_id = "x",
                       .type = EventType::kCrashed,
                       .timestamp = 1,
                       .event = warden::Crash{.reason = "killed by signal 9",
                                              .exited = false,
                                              .exit_status = 0,
                                              .signal = 9}};
  warden::proto::ServerEvent proto;
  crash.ToProto(&proto);
  ASSERT_TRUE(proto.has_crashed());
  EXPECT_EQ("killed by signal 9", proto.crashed().reason());
  EXPECT_EQ(9, proto.crashed().signal());
}

TEST(ServerStatusTest, Proto) {
  warden::ServerStatusSnapshot s = {.id = "id1",
                                    .name = "lobby",
                                    .state = ServerState::kRunning,
                                    .pid = 100,
                                    .uptime_secs = 60,
                                    .player_count = 2,
                                    .players = {"Alex", "Steve"},
                                    .cpu_percent = 12.5,
                                    .resident_bytes = 4096,
                                    .tps = 19.9};
  warden::proto::ServerStatus proto;
  s.ToProto(&proto);
  EXPECT_EQ("lobby", proto.name());
  EXPECT_EQ(warden::proto::RUNNING, proto.state());
  ASSERT_EQ(2, proto.players_size());
  EXPECT_EQ("Steve", proto.players(1));
  EXPECT_EQ(4096, proto.resident_bytes());
}
