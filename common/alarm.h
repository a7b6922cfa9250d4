// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "proto/alarm.pb.h"
#include <cstdint>
#include <iostream>
#include <string>

namespace warden {

struct Alarm {
  enum class Type {
    kUnknown,
    kCpu,
    kMemory,
    kTps,
    kCrash,
  };

  enum class Severity {
    kUnknown,
    kWarning,
    kCritical,
  };

  enum class Status {
    kUnknown,
    kRaised,
    kCleared,
  };

  std::string id; // Unique per server and type.
  std::string server_id;
  std::string server_name;
  Type type = Type::kUnknown;
  Severity severity = Severity::kUnknown;
  Status status = Status::kUnknown;
  double value = 0;
  double threshold = 0;
  std::string details;
  uint64_t timestamp = 0;

  void ToProto(proto::Alarm *dest) const;
};

inline const char *TypeName(Alarm::Type type) {
  switch (type) {
  case Alarm::Type::kCpu:
    return "cpu";
  case Alarm::Type::kMemory:
    return "memory";
  case Alarm::Type::kTps:
    return "tps";
  case Alarm::Type::kCrash:
    return "crash";
  default:
    return "unknown";
  }
}

inline const char *SeverityName(Alarm::Severity s) {
  switch (s) {
  case Alarm::Severity::kWarning:
    return "warning";
  case Alarm::Severity::kCritical:
    return "critical";
  default:
    return "unknown";
  }
}

inline const char *StatusName(Alarm::Status s) {
  switch (s) {
  case Alarm::Status::kRaised:
    return "raised";
  case Alarm::Status::kCleared:
    return "cleared";
  default:
    return "unknown";
  }
}

inline std::ostream &operator<<(std::ostream &os, const Alarm &alarm) {
  os << "id: " << alarm.id << " server: " << alarm.server_name
     << " status: " << StatusName(alarm.status)
     << " type: " << TypeName(alarm.type)
     << " severity: " << SeverityName(alarm.severity)
     << " value: " << alarm.value << " threshold: " << alarm.threshold
     << " details: " << alarm.details;
  return os;
}

} // namespace warden
