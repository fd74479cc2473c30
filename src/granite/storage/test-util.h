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


#ifndef GRANITE_STORAGE_TEST_UTIL_H_
#define GRANITE_STORAGE_TEST_UTIL_H_

#include "local-disk.h"
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <sandstorm/util.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

namespace granite {
namespace storage {

struct TestTempdir {
  // A fresh directory under /tmp. Left behind on exit so the files can be inspected; the next
  // run deletes it.

  kj::String path;

  explicit TestTempdir(kj::StringPtr name)
      : path(kj::str("/tmp/granite-", name)) {
    if (access(path.cStr(), F_OK) >= 0) {
      sandstorm::recursivelyDelete(path);
    }
    KJ_SYSCALL(mkdir(path.cStr(), 0777));
  }

  kj::String subdir(kj::StringPtr name) {
    auto result = kj::str(path, '/', name);
    KJ_SYSCALL(mkdir(result.cStr(), 0777));
    return result;
  }
};

inline kj::Own<LocalDisk> newTestDisk(kj::StringPtr path, uint diskIndex = 0,
                                      uint setDriveCount = 1) {
  LocalDisk::Placement placement;
  placement.diskIndex = diskIndex;
  placement.setDriveCount = setDriveCount;
  return kj::heap<LocalDisk>(kj::str("127.0.0.1:9000", path), path, placement);
}

inline kj::Array<byte> testData(size_t size, uint seed = 1) {
  // Deterministic pseudo-random bytes.
  auto result = kj::heapArray<byte>(size);
  uint32_t state = seed * 2654435761u + 1;
  for (auto& b: result) {
    state = state * 1103515245u + 12345u;
    b = state >> 16;
  }
  return result;
}

class MemoryInputStream final: public kj::AsyncInputStream {
public:
  explicit MemoryInputStream(kj::ArrayPtr<const byte> data): remaining(data) {}

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    size_t n = kj::min(maxBytes, remaining.size());
    memcpy(buffer, remaining.begin(), n);
    remaining = remaining.slice(n, remaining.size());
    return n;
  }

private:
  kj::ArrayPtr<const byte> remaining;
};

class MemoryOutputStream final: public kj::AsyncOutputStream {
public:
  kj::Vector<byte> data;

  kj::Promise<void> write(const void* buffer, size_t size) override {
    auto bytes = reinterpret_cast<const byte*>(buffer);
    data.addAll(bytes, bytes + size);
    return kj::READY_NOW;
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const byte>> pieces) override {
    for (auto piece: pieces) {
      data.addAll(piece.begin(), piece.end());
    }
    return kj::READY_NOW;
  }
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_TEST_UTIL_H_
