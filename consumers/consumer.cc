// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "consumers/consumer.h"
#include "absl/strings/str_format.h"
#include "supervisor/supervisor.h"

namespace warden {

absl::Status Consumer::Attach(Supervisor &supervisor) {
  absl::StatusOr<std::shared_ptr<Subscription>> sub =
      supervisor.Subscribe(name_, event_mask_);
  if (!sub.ok()) {
    return sub.status();
  }
  subscription_ = std::move(*sub);
  supervisor.AddCoroutine(std::make_unique<co::Coroutine>(
      supervisor.Scheduler(), [this](co::Coroutine *c) { Run(c); },
      absl::StrFormat("consumer.%s", name_)));
  return absl::OkStatus();
}

void Consumer::Run(co::Coroutine *c) {
  if (subscription_ == nullptr) {
    return;
  }
  for (;;) {
    absl::StatusOr<std::shared_ptr<const ServerEvent>> event =
        subscription_->WaitForEvent(c);
    if (!event.ok()) {
      if (!absl::IsUnavailable(event.status())) {
        logger_.Log(toolbelt::LogLevel::kError, "%s: %s", name_.c_str(),
                    event.status().ToString().c_str());
      }
      return;
    }
    HandleEvent(**event);
  }
}

} // namespace warden
