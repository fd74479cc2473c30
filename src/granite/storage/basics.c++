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

#include "basics.h"
#include <kj/debug.h>

namespace granite {
namespace storage {

kj::String pathJoin(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() == 0) return kj::heapString(b);
  if (b.size() == 0) return kj::heapString(a);
  if (a.endsWith("/")) return kj::str(a, b);
  return kj::str(a, '/', b);
}

kj::String pathJoin(kj::StringPtr a, kj::StringPtr b, kj::StringPtr c) {
  return pathJoin(pathJoin(a, b), c);
}

kj::String partFileName(uint partNumber) {
  return kj::str("part.", partNumber);
}

void checkVolumeName(kj::StringPtr volume) {
  if (volume.size() == 0 || volume.size() > 255 || volume == "." || volume == ".." ||
      volume.findFirst('/') != nullptr) {
    GRANITE_FAIL(INVALID_ARGUMENT, "invalid volume name: ", volume);
  }
}

void checkPathName(kj::StringPtr path) {
  if (path.size() > 4096 || path.startsWith("/")) {
    GRANITE_FAIL(INVALID_ARGUMENT, "invalid path: ", path);
  }

  // No component may be "." or "..".
  size_t start = 0;
  for (size_t i = 0; i <= path.size(); i++) {
    if (i == path.size() || path[i] == '/') {
      auto component = path.slice(start, i);
      if ((component.size() == 1 && component[0] == '.') ||
          (component.size() == 2 && component[0] == '.' && component[1] == '.')) {
        GRANITE_FAIL(INVALID_ARGUMENT, "invalid path: ", path);
      }
      if (component.size() > 255) {
        GRANITE_FAIL(FILE_NAME_TOO_LONG, path);
      }
      start = i + 1;
    }
  }
}

}  // namespace storage
}  // namespace granite
