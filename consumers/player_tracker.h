// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "consumers/consumer.h"

#include <optional>
#include <string>
#include <vector>

namespace warden {

struct PlayerRecord {
  std::string key;  // uuid, or the name if the uuid isn't known.
  std::string uuid;
  std::string name;
  std::string server_id; // Last server seen on.
  uint64_t first_seen = 0;
  uint64_t last_seen = 0;
  bool online = false;
  uint64_t session_start = 0;
  uint64_t play_time_ns = 0; // Completed sessions only.
  int sessions = 0;
};

// Keeps a record of every player identity seen on any server.
class PlayerTracker : public Consumer {
public:
  explicit PlayerTracker(toolbelt::Logger &logger)
      : Consumer("player_tracker", kPlayerEvents | kStatusEvents | kCrashEvents,
                 logger) {}

  void HandleEvent(const ServerEvent &event) override;

  // Lookup by uuid or name.
  std::optional<PlayerRecord> Find(const std::string &uuid_or_name) const;

  // Online players, optionally for one server, ordered by name.
  std::vector<PlayerRecord> Online(const std::string &server_id = "") const;

  std::vector<PlayerRecord> All() const;

  size_t Size() const { return records_.size(); }

private:
  void Join(const ServerEvent &event, const PlayerPresence &p);
  void Leave(const ServerEvent &event, const PlayerPresence &p);
  void ServerDown(const std::string &server_id, uint64_t timestamp);
  void EndSession(PlayerRecord &record, uint64_t timestamp);
  PlayerRecord *Lookup(const std::string &uuid, const std::string &name);

  absl::flat_hash_map<std::string, PlayerRecord> records_;
  // Player name to record key.
  absl::flat_hash_map<std::string, std::string> names_;
};

} // namespace warden
