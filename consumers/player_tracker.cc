// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "consumers/player_tracker.h"

#include <algorithm>

namespace warden {

void PlayerTracker::HandleEvent(const ServerEvent &event) {
  switch (event.type) {
  case EventType::kPlayerJoin:
    Join(event, std::get<PlayerPresence>(event.event));
    break;
  case EventType::kPlayerLeave:
    Leave(event, std::get<PlayerPresence>(event.event));
    break;
  case EventType::kStatusChanged: {
    const StatusChange &s = std::get<StatusChange>(event.event);
    if (s.new_state == ServerState::kStopped ||
        s.new_state == ServerState::kCrashed) {
      ServerDown(event.server_id, event.timestamp);
    }
    break;
  }
  case EventType::kCrashed:
    ServerDown(event.server_id, event.timestamp);
    break;
  default:
    break;
  }
}

PlayerRecord *PlayerTracker::Lookup(const std::string &uuid,
                                    const std::string &name) {
  if (!uuid.empty()) {
    if (auto it = records_.find(uuid); it != records_.end()) {
      return &it->second;
    }
  }
  if (auto it = names_.find(name); it != names_.end()) {
    if (auto rit = records_.find(it->second); rit != records_.end()) {
      return &rit->second;
    }
  }
  return nullptr;
}

void PlayerTracker::Join(const ServerEvent &event, const PlayerPresence &p) {
  PlayerRecord *record = Lookup(p.uuid, p.name);
  if (record != nullptr && !p.uuid.empty() && record->uuid.empty()) {
    // First time we've seen the uuid for a player known by name.  Rekey.
    PlayerRecord updated = std::move(*record);
    records_.erase(updated.key);
    updated.key = p.uuid;
    updated.uuid = p.uuid;
    record = &(records_[updated.key] = std::move(updated));
  }
  if (record == nullptr) {
    std::string key = p.uuid.empty() ? p.name : p.uuid;
    PlayerRecord r = {.key = key,
                      .uuid = p.uuid,
                      .name = p.name,
                      .first_seen = event.timestamp};
    record = &(records_[key] = std::move(r));
    logger_.Log(toolbelt::LogLevel::kDebug, "New player %s (%s)",
                p.name.c_str(), key.c_str());
  }
  if (record->online) {
    // Missed the leave.
    EndSession(*record, event.timestamp);
  }
  record->name = p.name;
  record->server_id = event.server_id;
  record->online = true;
  record->session_start = event.timestamp;
  record->last_seen = event.timestamp;
  record->sessions++;
  names_[p.name] = record->key;
}

void PlayerTracker::Leave(const ServerEvent &event, const PlayerPresence &p) {
  PlayerRecord *record = Lookup(p.uuid, p.name);
  if (record == nullptr) {
    return;
  }
  EndSession(*record, event.timestamp);
}

void PlayerTracker::EndSession(PlayerRecord &record, uint64_t timestamp) {
  if (!record.online) {
    return;
  }
  if (timestamp > record.session_start) {
    record.play_time_ns += timestamp - record.session_start;
  }
  record.online = false;
  record.last_seen = timestamp;
}

void PlayerTracker::ServerDown(const std::string &server_id,
                               uint64_t timestamp) {
  for (auto & [ key, record ] : records_) {
    if (record.online && record.server_id == server_id) {
      EndSession(record, timestamp);
    }
  }
}

std::optional<PlayerRecord>
PlayerTracker::Find(const std::string &uuid_or_name) const {
  if (auto it = records_.find(uuid_or_name); it != records_.end()) {
    return it->second;
  }
  if (auto it = names_.find(uuid_or_name); it != names_.end()) {
    if (auto rit = records_.find(it->second); rit != records_.end()) {
      return rit->second;
    }
  }
  return std::nullopt;
}

std::vector<PlayerRecord>
PlayerTracker::Online(const std::string &server_id) const {
  std::vector<PlayerRecord> result;
  for (auto & [ key, record ] : records_) {
    if (record.online &&
        (server_id.empty() || record.server_id == server_id)) {
      result.push_back(record);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const PlayerRecord &a, const PlayerRecord &b) {
              return a.name < b.name;
            });
  return result;
}

std::vector<PlayerRecord> PlayerTracker::All() const {
  std::vector<PlayerRecord> result;
  for (auto & [ key, record ] : records_) {
    result.push_back(record);
  }
  std::sort(result.begin(), result.end(),
            [](const PlayerRecord &a, const PlayerRecord &b) {
              return a.name < b.name;
            });
  return result;
}

} // namespace warden
