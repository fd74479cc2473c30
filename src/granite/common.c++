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

#include "common.h"
#include <kj/debug.h>
#include <sodium/core.h>
#include <sodium/randombytes.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/utils.h>
#include <time.h>

namespace granite {

void initCrypto() {
  KJ_ASSERT(sodium_init() >= 0, "libsodium failed to initialize");
}

kj::String newUuid() {
  byte bytes[16];
  randombytes_buf(bytes, sizeof(bytes));
  bytes[6] = (bytes[6] & 0x0f) | 0x40;
  bytes[8] = (bytes[8] & 0x3f) | 0x80;

  static const char HEX[] = "0123456789abcdef";
  char text[36];
  uint pos = 0;
  for (uint i = 0; i < sizeof(bytes); i++) {
    if (i == 4 || i == 6 || i == 8 || i == 10) text[pos++] = '-';
    text[pos++] = HEX[bytes[i] >> 4];
    text[pos++] = HEX[bytes[i] & 0x0f];
  }
  return kj::heapString(text, sizeof(text));
}

kj::String hexEncode(kj::ArrayPtr<const byte> bytes) {
  auto result = kj::heapString(bytes.size() * 2);
  sodium_bin2hex(result.begin(), result.size() + 1, bytes.begin(), bytes.size());
  return result;
}

int64_t nowNanos() {
  struct timespec ts;
  KJ_SYSCALL(clock_gettime(CLOCK_REALTIME, &ts));
  return static_cast<int64_t>(ts.tv_sec) * 1000000000ll + ts.tv_nsec;
}

uint64_t hashKey(kj::StringPtr key) {
  uint64_t result;
  crypto_generichash_blake2b(reinterpret_cast<byte*>(&result), sizeof(result),
                             key.asBytes().begin(), key.size(), nullptr, 0);
  return result;
}

Endpoint Endpoint::parse(kj::StringPtr text) {
  KJ_IF_MAYBE(slash, text.findFirst('/')) {
    KJ_REQUIRE(*slash > 0, "disk endpoint has no node address", text);
    return { kj::heapString(text.slice(0, *slash)), kj::heapString(text.slice(*slash)) };
  } else {
    KJ_FAIL_REQUIRE("disk endpoint has no path", text);
  }
}

kj::String Endpoint::toString() const {
  return kj::str(node, path);
}

}  // namespace granite
