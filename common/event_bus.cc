// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/event_bus.h"
#include "absl/strings/str_format.h"

#include <algorithm>

namespace warden {

Subscription::Subscription(std::string name, int event_mask, size_t capacity)
    : name_(std::move(name)), event_mask_(event_mask),
      capacity_(std::max<size_t>(capacity, 1)) {}

void Subscription::Push(std::shared_ptr<const ServerEvent> event) {
  if (closed_) {
    return;
  }
  while (events_.size() >= capacity_) {
    events_.pop_front();
    dropped_++;
  }
  events_.push_back(std::move(event));
  event_trigger_.Trigger();
}

std::shared_ptr<const ServerEvent> Subscription::TryPop() {
  if (events_.empty()) {
    return nullptr;
  }
  std::shared_ptr<const ServerEvent> event = std::move(events_.front());
  events_.pop_front();
  return event;
}

absl::StatusOr<std::shared_ptr<const ServerEvent>>
Subscription::WaitForEvent(co::Coroutine *c, uint64_t timeout_ns) {
  for (;;) {
    if (std::shared_ptr<const ServerEvent> event = TryPop(); event != nullptr) {
      return event;
    }
    if (closed_) {
      return absl::UnavailableError(
          absl::StrFormat("Subscription %s is closed", name_));
    }
    // The queue is empty so it's safe to clear the trigger before
    // waiting.  Anything pushed after this will set it again.
    event_trigger_.Clear();
    int fd = c->Wait(event_trigger_.GetPollFd().Fd(), POLLIN, timeout_ns);
    if (fd == -1) {
      return absl::DeadlineExceededError(
          absl::StrFormat("Timeout waiting for event on %s", name_));
    }
  }
}

void Subscription::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  // Wake up any waiter so that it sees the close.
  event_trigger_.Trigger();
}

absl::StatusOr<std::shared_ptr<Subscription>>
EventBus::Subscribe(const std::string &name, int event_mask,
                    size_t capacity) {
  auto sub = std::make_shared<Subscription>(name, event_mask, capacity);
  if (absl::Status status = sub->Open(); !status.ok()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to open event trigger for %s: %s", name, status.ToString()));
  }
  subscriptions_.push_back(sub);
  return sub;
}

void EventBus::Unsubscribe(const std::shared_ptr<Subscription> &sub) {
  for (auto it = subscriptions_.begin(); it != subscriptions_.end(); it++) {
    if (*it == sub) {
      sub->Close();
      subscriptions_.erase(it);
      break;
    }
  }
}

void EventBus::Publish(std::shared_ptr<const ServerEvent> event) {
  num_published_++;
  for (auto &sub : subscriptions_) {
    if (sub->WantsEvent(*event)) {
      sub->Push(event);
    }
  }
}

void EventBus::CloseAll() {
  for (auto &sub : subscriptions_) {
    sub->Close();
  }
  subscriptions_.clear();
}

} // namespace warden
