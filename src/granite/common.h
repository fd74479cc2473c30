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

#ifndef GRANITE_COMMON_H_
#define GRANITE_COMMON_H_

#include <kj/common.h>
#include <kj/string.h>
#include <inttypes.h>

namespace granite {

#define GRANITE_VERSION "0.1.0"

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.  Requires C++14.

using kj::uint;
using kj::byte;

void initCrypto();
// Initialize libsodium. Call once at startup before any random ids are generated.

kj::String newUuid();
// A random RFC 4122 version 4 UUID in its canonical 36-character text form.

kj::String hexEncode(kj::ArrayPtr<const byte> bytes);

int64_t nowNanos();
// Wall-clock time in nanoseconds since the Unix epoch.

uint64_t hashKey(kj::StringPtr key);
// Stable 64-bit hash of `key`, identical on every node. Used for placement decisions.

struct Endpoint {
  // A disk endpoint, written "host:port/absolute/path".

  kj::String node;
  // "host:port" of the node that owns the disk.

  kj::String path;

  static Endpoint parse(kj::StringPtr text);
  kj::String toString() const;
};

}  // namespace granite

#endif // GRANITE_COMMON_H_
