// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_map.h"
#include "consumers/consumer.h"

#include <memory>
#include <optional>
#include <string>

namespace warden {

struct RelayMessage {
  enum class Kind {
    kChat,
    kPresence,
    kAdvancement,
    kDeath,
    kStatus,
  };
  Kind kind;
  std::string server_id;
  std::string username; // Sender shown by the receiving side.
  std::string content;
};

const char *RelayMessageKindName(RelayMessage::Kind kind);

// Transport for relayed messages.
class RelaySink {
public:
  virtual ~RelaySink() = default;
  virtual absl::Status Send(const RelayMessage &msg) = 0;
};

// Writes relayed messages to the log.
class LoggingRelaySink : public RelaySink {
public:
  explicit LoggingRelaySink(toolbelt::Logger &logger) : logger_(logger) {}

  absl::Status Send(const RelayMessage &msg) override;

private:
  toolbelt::Logger &logger_;
};

struct RelaySettings {
  bool chat = true;   // Relay player chat.
  bool events = true; // Relay joins, leaves, advancements, deaths and status.
};

// Relays in-game chat and gameplay events for enabled servers.
class ChatRelay : public Consumer {
public:
  ChatRelay(toolbelt::Logger &logger, std::unique_ptr<RelaySink> sink)
      : Consumer("chat_relay",
                 kChatEvents | kPlayerEvents | kGameplayEvents | kStatusEvents,
                 logger),
        sink_(std::move(sink)) {}

  void Enable(const std::string &server_id, const std::string &server_name,
              RelaySettings settings = {});
  void Disable(const std::string &server_id);
  bool IsEnabled(const std::string &server_id) const {
    return servers_.contains(server_id);
  }
  std::optional<RelaySettings> Settings(const std::string &server_id) const;

  void HandleEvent(const ServerEvent &event) override;

  // Builds the message for an event, if the settings allow it to be relayed.
  static std::optional<RelayMessage> Format(const ServerEvent &event,
                                            const std::string &server_name,
                                            const RelaySettings &settings);

  uint64_t NumSent() const { return num_sent_; }
  uint64_t NumFailed() const { return num_failed_; }

private:
  struct Server {
    std::string name;
    RelaySettings settings;
  };
  std::unique_ptr<RelaySink> sink_;
  absl::flat_hash_map<std::string, Server> servers_;
  uint64_t num_sent_ = 0;
  uint64_t num_failed_ = 0;
};

} // namespace warden
