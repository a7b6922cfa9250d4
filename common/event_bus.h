// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/event.h"
#include "toolbelt/triggerfd.h"
#include <list>
#include <memory>
#include <string>
#include <vector>

#include "coroutine.h"

namespace warden {

constexpr size_t kDefaultEventQueueCapacity = 1024;

// A subscriber's view of the event stream.  Each subscription has its
// own bounded queue.  When the queue is full the oldest event is dropped
// so a slow reader only loses its own events.
class Subscription {
public:
  Subscription(std::string name, int event_mask, size_t capacity);

  absl::Status Open() { return event_trigger_.Open(); }

  const std::string &Name() const { return name_; }

  bool WantsEvent(const ServerEvent &event) const {
    return !closed_ && event.IsMaskedIn(event_mask_);
  }

  // Never blocks.
  void Push(std::shared_ptr<const ServerEvent> event);

  // Returns nullptr if there is nothing queued.
  std::shared_ptr<const ServerEvent> TryPop();

  // Wait for the next event.  A timeout of 0 means wait forever.  Returns
  // a DeadlineExceeded error on timeout and Unavailable once the
  // subscription has been closed and drained.
  absl::StatusOr<std::shared_ptr<const ServerEvent>>
  WaitForEvent(co::Coroutine *c, uint64_t timeout_ns = 0);

  void Close();
  bool IsClosed() const { return closed_; }

  size_t Pending() const { return events_.size(); }
  size_t Capacity() const { return capacity_; }
  uint64_t Dropped() const { return dropped_; }

private:
  std::string name_;
  int event_mask_;
  size_t capacity_;
  std::list<std::shared_ptr<const ServerEvent>> events_;
  toolbelt::TriggerFd event_trigger_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
};

// Delivers every published event to all interested subscriptions.
class EventBus {
public:
  EventBus() = default;
  ~EventBus() { CloseAll(); }

  absl::StatusOr<std::shared_ptr<Subscription>>
  Subscribe(const std::string &name, int event_mask = kAllEvents,
            size_t capacity = kDefaultEventQueueCapacity);

  void Unsubscribe(const std::shared_ptr<Subscription> &sub);

  void Publish(std::shared_ptr<const ServerEvent> event);

  // Closes every subscription.  Waiting readers see Unavailable once
  // their queues are empty.
  void CloseAll();

  size_t NumSubscribers() const { return subscriptions_.size(); }

  uint64_t NumPublished() const { return num_published_; }

private:
  std::vector<std::shared_ptr<Subscription>> subscriptions_;
  uint64_t num_published_ = 0;
};

} // namespace warden
