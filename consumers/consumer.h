// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "common/event.h"
#include "common/event_bus.h"
#include "toolbelt/logging.h"

#include <memory>
#include <string>

#include "coroutine.h"

namespace warden {

class Supervisor;

// Something that reads the supervisor's event stream in its own
// coroutine.
class Consumer {
public:
  Consumer(std::string name, int event_mask, toolbelt::Logger &logger)
      : name_(std::move(name)), event_mask_(event_mask), logger_(logger) {}
  virtual ~Consumer() = default;

  // Subscribe to the supervisor's events and start a coroutine to
  // process them.
  absl::Status Attach(Supervisor &supervisor);

  // Process events until the subscription is closed.
  void Run(co::Coroutine *c);

  virtual void HandleEvent(const ServerEvent &event) = 0;

  const std::string &Name() const { return name_; }

  uint64_t DroppedEvents() const {
    return subscription_ == nullptr ? 0 : subscription_->Dropped();
  }

protected:
  std::string name_;
  int event_mask_;
  toolbelt::Logger &logger_;
  std::shared_ptr<Subscription> subscription_;
};

} // namespace warden
