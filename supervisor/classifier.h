// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <iostream>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace warden {

// What a single console line means.
struct Classification {
  enum class Kind {
    kReady,
    kPlayerJoin,
    kPlayerLeave,
    kPlayerUuid,
    kTps,
    kChat,
    kAdvancement,
    kDeath,
    kCrashReport,
  };

  Kind kind;
  std::string name;   // Player name, if any.
  std::string detail; // Chat text, uuid, advancement or death message.
  double tps = 0;
};

const char *ClassificationKindName(Classification::Kind kind);

std::ostream &operator<<(std::ostream &os, const Classification &c);

// Turns console lines into classifications.  The rules are tried in a
// fixed order and the first match wins:
//
// 1. chat: <name> text
// 2. readiness markers
// 3. name joined the game
// 4. name left the game
// 5. UUID of player name is uuid
// 6. TPS from last 1m, 5m, 15m: a, b, c
// 7. name has made the advancement [x] (also challenges and goals)
// 8. death messages
// 9. ---- Minecraft Crash Report ----
//
// Each rule matches the content after any vendor prefix such as
// "[12:00:00] [Server thread/INFO]: " so the same table works for all
// server flavors.
class Classifier {
public:
  // Fails if a readiness pattern is not a valid regular expression.
  static absl::StatusOr<std::shared_ptr<const Classifier>>
  Create(const std::vector<std::string> &readiness_patterns);

  std::optional<Classification> Classify(const std::string &line) const;

private:
  Classifier() = default;

  std::vector<std::regex> readiness_;
};

} // namespace warden
