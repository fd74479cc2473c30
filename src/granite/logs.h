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


#ifndef GRANITE_LOGS_H_
#define GRANITE_LOGS_H_

#include <kj/io.h>
#include <kj/string.h>

namespace granite {

class LogFiles {
  // Timestamped lines appended to files in a log directory. Each file is named after the time
  // it was started and is closed once it passes 1MB.

public:
  explicit LogFiles(int logDirFd): logDirFd(logDirFd) {}
  KJ_DISALLOW_COPY(LogFiles);

  void write(kj::ArrayPtr<const char> line);
  // `line` should end with a newline.

private:
  struct LogFile {
    kj::AutoCloseFd fd;
    size_t size;
  };

  int logDirFd;
  kj::Maybe<LogFile> currentFile;
};

void rotateLogs(int input, int logDirFd);
// Read logs on `input` until EOF and write them to files in `logDirFd`, rotated to avoid any
// file becoming overly large.

}  // namespace granite

#endif // GRANITE_LOGS_H_
