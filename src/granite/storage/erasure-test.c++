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


#include "erasure.h"
#include "test-util.h"
#include <kj/test.h>
#include <string.h>

namespace granite {
namespace storage {
namespace {

kj::Array<kj::Maybe<kj::Array<byte>>> keepShards(
    const kj::Array<kj::Array<byte>>& shards, uint32_t mask) {
  // Copies the shards whose bit is set in `mask`.
  auto result = kj::heapArrayBuilder<kj::Maybe<kj::Array<byte>>>(shards.size());
  for (uint i = 0; i < shards.size(); i++) {
    if (mask & (1u << i)) {
      result.add(kj::heapArray<byte>(shards[i].asPtr()));
    } else {
      result.add(nullptr);
    }
  }
  return result.finish();
}

kj::Array<byte> joinData(const Erasure& erasure,
                         kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards, size_t length) {
  auto result = kj::heapArray<byte>(length);
  size_t pos = 0;
  for (uint i = 0; i < erasure.getDataBlocks() && pos < length; i++) {
    auto& shard = KJ_ASSERT_NONNULL(shards[i]);
    size_t n = kj::min(shard.size(), length - pos);
    memcpy(result.begin() + pos, shard.begin(), n);
    pos += n;
  }
  return result;
}

uint popcount(uint32_t mask) {
  uint n = 0;
  for (; mask != 0; mask &= mask - 1) ++n;
  return n;
}

KJ_TEST("shard size math") {
  Erasure erasure(4, 2, 1 << 20);
  KJ_EXPECT(erasure.shardSize() == 262144);
  KJ_EXPECT(erasure.shardFileSize(0) == 0);
  KJ_EXPECT(erasure.shardFileSize(1 << 20) == 262144);
  // Two full blocks and a 10-byte tail, split 3/3/3/1 over the data shards.
  KJ_EXPECT(erasure.shardFileSize((2 << 20) + 10) == 2 * 262144 + 3);
  // A range inside the second block needs the first two blocks of every shard.
  KJ_EXPECT(erasure.shardFileOffset((1 << 20) + 5, 100, 3 << 20) == 2 * 262144);
  // The last block is bounded by the shard file size.
  KJ_EXPECT(erasure.shardFileOffset((2 << 20), 10, (2 << 20) + 10) == 2 * 262144 + 3);

  Erasure odd(3, 1, 1000);
  KJ_EXPECT(odd.shardSize() == 334);
}

KJ_TEST("any dataBlocks shards decode the block") {
  Erasure erasure(4, 2, 4096);
  auto data = testData(4000);
  auto shards = erasure.encodeData(data);
  KJ_ASSERT(shards.size() == 6);
  for (auto& shard: shards) {
    KJ_EXPECT(shard.size() == 1000);
  }

  // The code is systematic.
  KJ_EXPECT(shards[0].asPtr() == data.slice(0, 1000));

  uint tried = 0;
  for (uint32_t mask = 0; mask < (1u << 6); mask++) {
    if (popcount(mask) < 4) continue;
    ++tried;

    auto partial = keepShards(shards, mask);
    erasure.decodeDataBlocks(partial);
    KJ_EXPECT(joinData(erasure, partial, data.size()).asPtr() == data.asPtr(), mask);

    auto full = keepShards(shards, mask);
    erasure.decodeDataAndParityBlocks(full);
    for (uint i = 0; i < 6; i++) {
      KJ_EXPECT(KJ_ASSERT_NONNULL(full[i]).asPtr() == shards[i].asPtr(), mask, i);
    }
  }
  KJ_EXPECT(tried == 22);
}

KJ_TEST("fewer than dataBlocks shards fail") {
  Erasure erasure(4, 2, 4096);
  auto shards = erasure.encodeData(testData(4096));

  for (uint32_t mask = 0; mask < (1u << 6); mask++) {
    if (popcount(mask) >= 4) continue;
    auto partial = keepShards(shards, mask);
    KJ_EXPECT_THROW_MESSAGE("INSUFFICIENT_SHARDS", erasure.decodeDataBlocks(partial));
  }
}

KJ_TEST("short last block") {
  Erasure erasure(4, 2, 4096);
  auto data = testData(10);
  auto shards = erasure.encodeData(data);
  for (auto& shard: shards) {
    KJ_EXPECT(shard.size() == 3);
  }

  // Lose two data shards, including the zero-padded one.
  auto partial = keepShards(shards, 0x36);
  erasure.decodeDataBlocks(partial);
  KJ_EXPECT(joinData(erasure, partial, data.size()).asPtr() == data.asPtr());
}

KJ_TEST("no parity") {
  Erasure erasure(2, 0, 100);
  auto data = testData(100);
  auto shards = erasure.encodeData(data);
  KJ_ASSERT(shards.size() == 2);

  auto partial = keepShards(shards, 0x3);
  erasure.decodeDataBlocks(partial);
  KJ_EXPECT(joinData(erasure, partial, data.size()).asPtr() == data.asPtr());

  auto missing = keepShards(shards, 0x1);
  KJ_EXPECT_THROW_MESSAGE("INSUFFICIENT_SHARDS", erasure.decodeDataBlocks(missing));
}

}  // namespace
}  // namespace storage
}  // namespace granite
