// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include <google/protobuf/message.h>

#include <string>

namespace warden {

// Writes msg in protobuf text format.  The text goes to <filename>.tmp
// first and is renamed over filename so readers never see a partial
// file.  The temporary file is removed on failure.
absl::Status WriteTextProtoFile(const std::string &filename,
                                const google::protobuf::Message &msg);

} // namespace warden
