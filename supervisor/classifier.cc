// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/classifier.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"

namespace warden {

namespace {
// Start of the message, either the start of the line or the end of a
// vendor prefix.
#define MESSAGE_START R"((?:^|\]:?\s*|:\s+))"

const std::regex &ChatPattern() {
  static const std::regex re(MESSAGE_START R"(<([A-Za-z0-9_]+)>\s*(.*)$)");
  return re;
}

const std::regex &JoinPattern() {
  static const std::regex re(MESSAGE_START
                             R"(([A-Za-z0-9_]+) joined the game\s*$)");
  return re;
}

const std::regex &LeavePattern() {
  static const std::regex re(MESSAGE_START
                             R"(([A-Za-z0-9_]+) left the game\s*$)");
  return re;
}

const std::regex &UuidPattern() {
  static const std::regex re(
      R"(UUID of player ([A-Za-z0-9_]+) is ([0-9a-fA-F-]+))");
  return re;
}

const std::regex &TpsPattern() {
  static const std::regex re(
      R"(TPS from last 1m, 5m, 15m:\s*\*?([0-9.,]+))");
  return re;
}

const std::regex &AdvancementPattern() {
  static const std::regex re(
      MESSAGE_START
      R"(([A-Za-z0-9_]+) has (?:made the advancement|completed the challenge|reached the goal) \[(.+)\]\s*$)");
  return re;
}

const std::regex &DeathPattern() {
  static const std::regex re(
      MESSAGE_START
      R"((([A-Za-z0-9_]+) (?:was |fell |drowned|burned|starved|suffocated|hit the ground|went up in flames|blew up|tried to swim|experienced kinetic energy|died|withered away|froze to death|discovered the floor was lava|walked into).*)$)");
  return re;
}

const std::regex &CrashReportPattern() {
  static const std::regex re(R"(---- Minecraft Crash Report ----)");
  return re;
}

#undef MESSAGE_START
} // namespace

const char *ClassificationKindName(Classification::Kind kind) {
  switch (kind) {
  case Classification::Kind::kReady:
    return "ready";
  case Classification::Kind::kPlayerJoin:
    return "player_join";
  case Classification::Kind::kPlayerLeave:
    return "player_leave";
  case Classification::Kind::kPlayerUuid:
    return "player_uuid";
  case Classification::Kind::kTps:
    return "tps";
  case Classification::Kind::kChat:
    return "chat";
  case Classification::Kind::kAdvancement:
    return "advancement";
  case Classification::Kind::kDeath:
    return "death";
  case Classification::Kind::kCrashReport:
    return "crash_report";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, const Classification &c) {
  os << ClassificationKindName(c.kind);
  if (!c.name.empty()) {
    os << " name: " << c.name;
  }
  if (!c.detail.empty()) {
    os << " detail: " << c.detail;
  }
  if (c.kind == Classification::Kind::kTps) {
    os << " tps: " << c.tps;
  }
  return os;
}

absl::StatusOr<std::shared_ptr<const Classifier>>
Classifier::Create(const std::vector<std::string> &readiness_patterns) {
  // Private constructor so no make_shared.
  std::shared_ptr<Classifier> classifier(new Classifier());
  for (auto &pattern : readiness_patterns) {
    try {
      classifier->readiness_.emplace_back(pattern);
    } catch (const std::regex_error &e) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid readiness pattern '%s': %s", pattern, e.what()));
    }
  }
  return classifier;
}

std::optional<Classification>
Classifier::Classify(const std::string &line) const {
  std::smatch m;
  if (std::regex_search(line, m, ChatPattern())) {
    return Classification{.kind = Classification::Kind::kChat,
                          .name = m[1].str(),
                          .detail = m[2].str()};
  }

  for (auto &re : readiness_) {
    if (std::regex_search(line, re)) {
      return Classification{.kind = Classification::Kind::kReady};
    }
  }

  if (std::regex_search(line, m, JoinPattern())) {
    return Classification{.kind = Classification::Kind::kPlayerJoin,
                          .name = m[1].str()};
  }
  if (std::regex_search(line, m, LeavePattern())) {
    return Classification{.kind = Classification::Kind::kPlayerLeave,
                          .name = m[1].str()};
  }
  if (std::regex_search(line, m, UuidPattern())) {
    return Classification{.kind = Classification::Kind::kPlayerUuid,
                          .name = m[1].str(),
                          .detail = m[2].str()};
  }
  if (std::regex_search(line, m, TpsPattern())) {
    // Some locales print a comma as the decimal separator.
    std::string value = absl::StrReplaceAll(m[1].str(), {{",", "."}});
    while (!value.empty() && value.back() == '.') {
      value.pop_back();
    }
    double tps;
    if (absl::SimpleAtod(value, &tps)) {
      return Classification{.kind = Classification::Kind::kTps, .tps = tps};
    }
    return std::nullopt;
  }
  if (std::regex_search(line, m, AdvancementPattern())) {
    return Classification{.kind = Classification::Kind::kAdvancement,
                          .name = m[1].str(),
                          .detail = m[2].str()};
  }
  if (std::regex_search(line, m, DeathPattern())) {
    return Classification{.kind = Classification::Kind::kDeath,
                          .name = m[2].str(),
                          .detail = m[1].str()};
  }
  if (std::regex_search(line, CrashReportPattern())) {
    return Classification{.kind = Classification::Kind::kCrashReport};
  }
  return std::nullopt;
}

} // namespace warden
