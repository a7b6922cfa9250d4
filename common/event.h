// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "common/states.h"
#include <cstdint>
#include <string>
#include <variant>

#include "proto/server.pb.h"

namespace warden {

// Event masks.  These control what type of events a subscriber
// wants to see.
constexpr int kNoEvents = 0;
constexpr int kAllEvents = -1;
constexpr int kStatusEvents = 1;
constexpr int kPlayerEvents = 2;
constexpr int kChatEvents = 4;
constexpr int kGameplayEvents = 8; // Advancements and deaths.
constexpr int kCrashEvents = 16;
constexpr int kLogLineEvents = 32;

enum class EventType {
  kStatusChanged,
  kPlayerJoin,
  kPlayerLeave,
  kChat,
  kAdvancement,
  kDeath,
  kCrashed,
  kLogLine,
};

const char *EventTypeName(EventType type);

struct StatusChange {
  ServerState old_state;
  ServerState new_state;
  int pid;
};

// Used for both join and leave.
struct PlayerPresence {
  std::string name;
  std::string uuid;
  int player_count;
};

struct ChatMessage {
  std::string name;
  std::string text;
};

struct Advancement {
  std::string name;
  std::string advancement;
};

struct Death {
  std::string name;
  std::string message;
};

struct Crash {
  std::string reason;
  bool exited;     // False if killed by a signal or never spawned.
  int exit_status;
  int signal;
};

struct LogLine {
  std::string line;
  bool is_stderr;
};

struct ServerEvent {
  std::string server_id;
  EventType type;
  uint64_t timestamp; // Nanoseconds.
  std::variant<StatusChange, PlayerPresence, ChatMessage, Advancement, Death,
               Crash, LogLine>
      event;

  void ToProto(proto::ServerEvent *dest) const;

  bool IsMaskedIn(int mask) const {
    switch (type) {
    case EventType::kStatusChanged:
      return (mask & kStatusEvents) != 0;
    case EventType::kPlayerJoin:
    case EventType::kPlayerLeave:
      return (mask & kPlayerEvents) != 0;
    case EventType::kChat:
      return (mask & kChatEvents) != 0;
    case EventType::kAdvancement:
    case EventType::kDeath:
      return (mask & kGameplayEvents) != 0;
    case EventType::kCrashed:
      return (mask & kCrashEvents) != 0;
    case EventType::kLogLine:
      return (mask & kLogLineEvents) != 0;
    }
    return false;
  }
};

} // namespace warden
