// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "consumers/chat_relay.h"
#include "absl/strings/str_format.h"

namespace warden {

const char *RelayMessageKindName(RelayMessage::Kind kind) {
  switch (kind) {
  case RelayMessage::Kind::kChat:
    return "chat";
  case RelayMessage::Kind::kPresence:
    return "presence";
  case RelayMessage::Kind::kAdvancement:
    return "advancement";
  case RelayMessage::Kind::kDeath:
    return "death";
  case RelayMessage::Kind::kStatus:
    return "status";
  }
  return "unknown";
}

absl::Status LoggingRelaySink::Send(const RelayMessage &msg) {
  logger_.Log(toolbelt::LogLevel::kInfo, "relay %s [%s] %s",
              RelayMessageKindName(msg.kind), msg.username.c_str(),
              msg.content.c_str());
  return absl::OkStatus();
}

void ChatRelay::Enable(const std::string &server_id,
                       const std::string &server_name, RelaySettings settings) {
  servers_[server_id] = Server{.name = server_name, .settings = settings};
}

void ChatRelay::Disable(const std::string &server_id) {
  servers_.erase(server_id);
}

std::optional<RelaySettings>
ChatRelay::Settings(const std::string &server_id) const {
  auto it = servers_.find(server_id);
  if (it == servers_.end()) {
    return std::nullopt;
  }
  return it->second.settings;
}

std::optional<RelayMessage> ChatRelay::Format(const ServerEvent &event,
                                              const std::string &server_name,
                                              const RelaySettings &settings) {
  RelayMessage msg = {.server_id = event.server_id, .username = server_name};
  switch (event.type) {
  case EventType::kChat: {
    if (!settings.chat) {
      return std::nullopt;
    }
    const ChatMessage &chat = std::get<ChatMessage>(event.event);
    msg.kind = RelayMessage::Kind::kChat;
    msg.username = absl::StrFormat("%s (%s)", chat.name, server_name);
    msg.content = chat.text;
    return msg;
  }
  case EventType::kPlayerJoin:
  case EventType::kPlayerLeave: {
    if (!settings.events) {
      return std::nullopt;
    }
    const PlayerPresence &p = std::get<PlayerPresence>(event.event);
    msg.kind = RelayMessage::Kind::kPresence;
    msg.content = absl::StrFormat(
        "**%s** %s the server", p.name,
        event.type == EventType::kPlayerJoin ? "joined" : "left");
    return msg;
  }
  case EventType::kAdvancement: {
    if (!settings.events) {
      return std::nullopt;
    }
    const Advancement &a = std::get<Advancement>(event.event);
    msg.kind = RelayMessage::Kind::kAdvancement;
    msg.content = absl::StrFormat("**%s** earned **[%s]**", a.name,
                                  a.advancement);
    return msg;
  }
  case EventType::kDeath: {
    if (!settings.events) {
      return std::nullopt;
    }
    msg.kind = RelayMessage::Kind::kDeath;
    msg.content = std::get<Death>(event.event).message;
    return msg;
  }
  case EventType::kStatusChanged: {
    if (!settings.events) {
      return std::nullopt;
    }
    const StatusChange &s = std::get<StatusChange>(event.event);
    msg.kind = RelayMessage::Kind::kStatus;
    msg.content = absl::StrFormat("**%s** is now **%s**", server_name,
                                  ServerStateName(s.new_state));
    return msg;
  }
  default:
    return std::nullopt;
  }
}

void ChatRelay::HandleEvent(const ServerEvent &event) {
  auto it = servers_.find(event.server_id);
  if (it == servers_.end()) {
    return;
  }
  std::optional<RelayMessage> msg =
      Format(event, it->second.name, it->second.settings);
  if (!msg.has_value()) {
    return;
  }
  if (absl::Status status = sink_->Send(*msg); !status.ok()) {
    num_failed_++;
    logger_.Log(toolbelt::LogLevel::kError,
                "Failed to relay %s message for %s: %s",
                RelayMessageKindName(msg->kind), it->second.name.c_str(),
                status.ToString().c_str());
    return;
  }
  num_sent_++;
}

} // namespace warden
