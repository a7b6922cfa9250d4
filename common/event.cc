// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/event.h"

namespace warden {

const char *EventTypeName(EventType type) {
  switch (type) {
  case EventType::kStatusChanged:
    return "status_changed";
  case EventType::kPlayerJoin:
    return "player_join";
  case EventType::kPlayerLeave:
    return "player_leave";
  case EventType::kChat:
    return "chat";
  case EventType::kAdvancement:
    return "advancement";
  case EventType::kDeath:
    return "death";
  case EventType::kCrashed:
    return "crashed";
  case EventType::kLogLine:
    return "log_line";
  }
  return "unknown";
}

static void PresenceToProto(const PlayerPresence &p,
                            proto::PlayerPresence *dest) {
  dest->set_name(p.name);
  dest->set_uuid(p.uuid);
  dest->set_player_count(p.player_count);
}

void ServerEvent::ToProto(proto::ServerEvent *dest) const {
  dest->set_server_id(server_id);
  dest->set_timestamp(timestamp);
  switch (type) {
  case EventType::kStatusChanged: {
    const StatusChange &s = std::get<StatusChange>(event);
    auto *sc = dest->mutable_status_changed();
    sc->set_old_state(ServerStateToProto(s.old_state));
    sc->set_new_state(ServerStateToProto(s.new_state));
    sc->set_pid(s.pid);
    break;
  }
  case EventType::kPlayerJoin:
    PresenceToProto(std::get<PlayerPresence>(event),
                    dest->mutable_player_join());
    break;
  case EventType::kPlayerLeave:
    PresenceToProto(std::get<PlayerPresence>(event),
                    dest->mutable_player_leave());
    break;
  case EventType::kChat: {
    const ChatMessage &chat = std::get<ChatMessage>(event);
    dest->mutable_chat()->set_name(chat.name);
    dest->mutable_chat()->set_text(chat.text);
    break;
  }
  case EventType::kAdvancement: {
    const Advancement &adv = std::get<Advancement>(event);
    dest->mutable_advancement()->set_name(adv.name);
    dest->mutable_advancement()->set_advancement(adv.advancement);
    break;
  }
  case EventType::kDeath: {
    const Death &death = std::get<Death>(event);
    dest->mutable_death()->set_name(death.name);
    dest->mutable_death()->set_message(death.message);
    break;
  }
  case EventType::kCrashed: {
    const Crash &crash = std::get<Crash>(event);
    auto *c = dest->mutable_crashed();
    c->set_reason(crash.reason);
    c->set_exited(crash.exited);
    c->set_exit_status(crash.exit_status);
    c->set_signal(crash.signal);
    break;
  }
  case EventType::kLogLine: {
    const LogLine &log = std::get<LogLine>(event);
    dest->mutable_log_line()->set_line(log.line);
    dest->mutable_log_line()->set_is_stderr(log.is_stderr);
    break;
  }
  }
}

} // namespace warden
