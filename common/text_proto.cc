// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/text_proto.h"
#include "absl/strings/str_format.h"
#include "toolbelt/fd.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <google/protobuf/text_format.h>
#include <unistd.h>

namespace warden {

absl::Status WriteTextProtoFile(const std::string &filename,
                                const google::protobuf::Message &msg) {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(msg, &text)) {
    return absl::InternalError(absl::StrFormat(
        "Failed to serialize %s for %s", msg.GetTypeName(), filename));
  }

  std::string tmpfile = absl::StrFormat("%s.tmp", filename);
  {
    toolbelt::FileDescriptor fd(
        open(tmpfile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!fd.Valid()) {
      return absl::InternalError(absl::StrFormat(
          "Failed to open %s: %s", tmpfile, strerror(errno)));
    }
    const char *buf = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
      ssize_t n = ::write(fd.Fd(), buf, remaining);
      if (n <= 0) {
        if (n == -1 && errno == EINTR) {
          continue;
        }
        absl::Status status = absl::InternalError(absl::StrFormat(
            "Failed to write %s: %s", tmpfile, strerror(errno)));
        unlink(tmpfile.c_str());
        return status;
      }
      remaining -= n;
      buf += n;
    }
  }
  if (rename(tmpfile.c_str(), filename.c_str()) == -1) {
    absl::Status status = absl::InternalError(
        absl::StrFormat("Failed to rename %s to %s: %s", tmpfile, filename,
                        strerror(errno)));
    unlink(tmpfile.c_str());
    return status;
  }
  return absl::OkStatus();
}

} // namespace warden
