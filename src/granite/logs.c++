// Granite
// Copyright (c) 2015 Sandstorm Development Group, Inc.
// All Rights Reserved
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "logs.h"
#include <kj/debug.h>
#include <sandstorm/util.h>
#include <fcntl.h>
#include <time.h>
#include <string.h>
#include <unistd.h>

namespace granite {

static constexpr size_t MAX_LOG_FILE_SIZE = 1 << 20;
static constexpr size_t MAX_LINE = 8192;

void LogFiles::write(kj::ArrayPtr<const char> line) {
  char timestampBuf[128];
  time_t now = time(nullptr);
  struct tm utc;
  KJ_ASSERT(gmtime_r(&now, &utc) != nullptr);
  size_t n = strftime(timestampBuf, sizeof(timestampBuf), "%Y-%m-%d_%H-%M-%S", &utc);
  kj::StringPtr timestamp(timestampBuf, n);

  size_t bytesToAdd = timestamp.size() + 1 + line.size();

  int fd;
  kj::AutoCloseFd finishedFd;
  KJ_IF_MAYBE(file, currentFile) {
    fd = file->fd;
    file->size += bytesToAdd;
    if (file->size > MAX_LOG_FILE_SIZE) {
      finishedFd = kj::mv(file->fd);
      currentFile = nullptr;
    }
  } else {
    // Two files started within the same second share a name, so the second appends.
    auto newFd = sandstorm::raiiOpenAt(logDirFd, timestamp, O_WRONLY | O_CREAT | O_APPEND, 0600);
    fd = newFd;
    currentFile = LogFile { kj::mv(newFd), bytesToAdd };
  }

  kj::ArrayPtr<const byte> pieces[3] = {
    timestamp.asBytes(), kj::StringPtr(" ").asBytes(), line.asBytes()
  };
  kj::FdOutputStream(fd).write(pieces);
}

void rotateLogs(int input, int logDirFd) {
  LogFiles files(logDirFd);
  char buffer[16384];
  size_t leftover = 0;

  for (;;) {
    ssize_t amount;
    KJ_SYSCALL(amount = read(input, buffer + leftover, sizeof(buffer) - leftover - 1));

    if (amount == 0) {
      if (leftover > 0) {
        buffer[leftover] = '\n';
        files.write(kj::arrayPtr(buffer, leftover + 1));
      }
      return;
    }

    size_t end = leftover + amount;
    size_t lineStart = 0;
    for (size_t i = 0; i < end; i++) {
      if (buffer[i] == '\n') {
        files.write(kj::arrayPtr(buffer + lineStart, i + 1 - lineStart));
        lineStart = i + 1;
      } else if (i - lineStart >= MAX_LINE) {
        // Split overlong lines, marking the continuation with "...".
        char c = buffer[i];
        buffer[i] = '\n';
        files.write(kj::arrayPtr(buffer + lineStart, i + 1 - lineStart));
        buffer[i] = c;
        buffer[i-1] = '.';
        buffer[i-2] = '.';
        buffer[i-3] = '.';
        lineStart = i - 3;
      }
    }

    leftover = end - lineStart;
    memmove(buffer, buffer + lineStart, leftover);
  }
}

}  // namespace granite
