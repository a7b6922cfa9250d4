// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/alarm.h"

namespace warden {

void Alarm::ToProto(proto::Alarm *dest) const {
  dest->set_id(id);
  dest->set_server_id(server_id);
  dest->set_server_name(server_name);
  dest->set_details(details);
  dest->set_value(value);
  dest->set_threshold(threshold);
  dest->set_timestamp(timestamp);
  switch (type) {
  case Type::kCpu:
    dest->set_type(proto::Alarm::CPU);
    break;
  case Type::kMemory:
    dest->set_type(proto::Alarm::MEMORY);
    break;
  case Type::kTps:
    dest->set_type(proto::Alarm::TPS);
    break;
  case Type::kCrash:
    dest->set_type(proto::Alarm::CRASH);
    break;
  case Type::kUnknown:
    dest->set_type(proto::Alarm::UNKNOWN_TYPE);
    break;
  }

  switch (severity) {
  case Severity::kWarning:
    dest->set_severity(proto::Alarm::WARNING);
    break;
  case Severity::kCritical:
    dest->set_severity(proto::Alarm::CRITICAL);
    break;
  case Severity::kUnknown:
    dest->set_severity(proto::Alarm::UNKNOWN_SEVERITY);
    break;
  }

  switch (status) {
  case Status::kRaised:
    dest->set_status(proto::Alarm::RAISED);
    break;
  case Status::kCleared:
    dest->set_status(proto::Alarm::CLEARED);
    break;
  case Status::kUnknown:
    dest->set_status(proto::Alarm::UNKNOWN_STATUS);
    break;
  }
}

} // namespace warden
