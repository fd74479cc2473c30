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
#include <kj/debug.h>
#include <kj/vector.h>
#include <isa-l.h>
#include <string.h>

namespace granite {
namespace storage {

Erasure::Erasure(uint dataBlocks, uint parityBlocks, uint64_t blockSize)
    : dataBlocks(dataBlocks), parityBlocks(parityBlocks), blockSize(blockSize) {
  uint total = dataBlocks + parityBlocks;
  if (dataBlocks == 0 || total > 256 || blockSize == 0) {
    GRANITE_FAIL(INVALID_ARGUMENT, "invalid erasure layout ", dataBlocks, "+", parityBlocks,
                 " with block size ", blockSize);
  }

  encodeMatrix = kj::heapArray<byte>(total * dataBlocks);
  gf_gen_cauchy1_matrix(encodeMatrix.begin(), total, dataBlocks);

  encodeTables = kj::heapArray<byte>(dataBlocks * kj::max(parityBlocks, 1u) * 32);
  if (parityBlocks > 0) {
    ec_init_tables(dataBlocks, parityBlocks, encodeMatrix.begin() + dataBlocks * dataBlocks,
                   encodeTables.begin());
  }
}

uint64_t Erasure::shardSize() const {
  return (blockSize + dataBlocks - 1) / dataBlocks;
}

uint64_t Erasure::shardFileSize(int64_t totalLength) const {
  if (totalLength <= 0) return 0;
  uint64_t length = totalLength;
  uint64_t numBlocks = length / blockSize;
  uint64_t lastBlockSize = length % blockSize;
  uint64_t lastShardSize = (lastBlockSize + dataBlocks - 1) / dataBlocks;
  return numBlocks * shardSize() + lastShardSize;
}

uint64_t Erasure::shardFileOffset(uint64_t startOffset, uint64_t length,
                                  uint64_t totalLength) const {
  uint64_t fileSize = shardFileSize(totalLength);
  uint64_t endBlock = (startOffset + length) / blockSize;
  uint64_t tillOffset = endBlock * shardSize() + shardSize();
  return kj::min(tillOffset, fileSize);
}

void Erasure::computeParity(kj::ArrayPtr<byte* const> data, kj::ArrayPtr<byte* const> parity,
                            size_t length) const {
  if (parityBlocks == 0 || length == 0) return;
  ec_encode_data(length, dataBlocks, parityBlocks, const_cast<byte*>(encodeTables.begin()),
                 const_cast<byte**>(data.begin()), const_cast<byte**>(parity.begin()));
}

kj::Array<kj::Array<byte>> Erasure::encodeData(kj::ArrayPtr<const byte> block) const {
  KJ_REQUIRE(block.size() <= blockSize, "block too large", block.size(), blockSize);

  uint total = getTotalBlocks();
  size_t perShard = (block.size() + dataBlocks - 1) / dataBlocks;

  auto shards = kj::heapArrayBuilder<kj::Array<byte>>(total);
  auto pointers = kj::heapArray<byte*>(total);
  for (uint i = 0; i < total; i++) {
    auto shard = kj::heapArray<byte>(perShard);
    memset(shard.begin(), 0, shard.size());
    if (i < dataBlocks) {
      size_t start = kj::min(i * perShard, block.size());
      size_t end = kj::min(start + perShard, block.size());
      memcpy(shard.begin(), block.begin() + start, end - start);
    }
    pointers[i] = shard.begin();
    shards.add(kj::mv(shard));
  }

  computeParity(pointers.slice(0, dataBlocks), pointers.slice(dataBlocks, total), perShard);
  return shards.finish();
}

void Erasure::decodeDataBlocks(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards) const {
  uint total = getTotalBlocks();
  KJ_REQUIRE(shards.size() == total, "wrong shard count", shards.size(), total);

  kj::Vector<uint> present;
  size_t length = 0;
  for (uint i = 0; i < total; i++) {
    KJ_IF_MAYBE(s, shards[i]) {
      if (present.size() == 0) {
        length = s->size();
      } else {
        KJ_REQUIRE(s->size() == length, "shards of one block differ in size");
      }
      present.add(i);
    }
  }

  if (present.size() < dataBlocks) {
    GRANITE_FAIL(INSUFFICIENT_SHARDS, present.size(), " of ", total, " shards available, ",
                 dataBlocks, " needed");
  }

  kj::Vector<uint> missing;
  for (uint i = 0; i < dataBlocks; i++) {
    if (shards[i] == nullptr) missing.add(i);
  }
  if (missing.size() == 0) return;

  // Invert the rows of the generator matrix belonging to the first dataBlocks present shards.
  // Row i of the inverse recovers data shard i from those shards.
  auto submatrix = kj::heapArray<byte>(dataBlocks * dataBlocks);
  auto inverse = kj::heapArray<byte>(dataBlocks * dataBlocks);
  auto sources = kj::heapArray<byte*>(dataBlocks);
  for (uint r = 0; r < dataBlocks; r++) {
    uint row = present[r];
    memcpy(submatrix.begin() + r * dataBlocks, encodeMatrix.begin() + row * dataBlocks,
           dataBlocks);
    sources[r] = KJ_ASSERT_NONNULL(shards[row]).begin();
  }
  if (gf_invert_matrix(submatrix.begin(), inverse.begin(), dataBlocks) < 0) {
    GRANITE_FAIL(UNEXPECTED, "erasure decode matrix is singular");
  }

  auto decodeMatrix = kj::heapArray<byte>(missing.size() * dataBlocks);
  auto outputs = kj::heapArray<byte*>(missing.size());
  auto recovered = kj::heapArrayBuilder<kj::Array<byte>>(missing.size());
  for (uint m = 0; m < missing.size(); m++) {
    memcpy(decodeMatrix.begin() + m * dataBlocks, inverse.begin() + missing[m] * dataBlocks,
           dataBlocks);
    auto out = kj::heapArray<byte>(length);
    outputs[m] = out.begin();
    recovered.add(kj::mv(out));
  }

  if (length > 0) {
    auto tables = kj::heapArray<byte>(dataBlocks * missing.size() * 32);
    ec_init_tables(dataBlocks, missing.size(), decodeMatrix.begin(), tables.begin());
    ec_encode_data(length, dataBlocks, missing.size(), tables.begin(),
                   sources.begin(), outputs.begin());
  }

  auto results = recovered.finish();
  for (uint m = 0; m < missing.size(); m++) {
    shards[missing[m]] = kj::mv(results[m]);
  }
}

void Erasure::decodeDataAndParityBlocks(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards) const {
  decodeDataBlocks(shards);

  uint total = getTotalBlocks();
  bool parityMissing = false;
  for (uint i = dataBlocks; i < total; i++) {
    if (shards[i] == nullptr) parityMissing = true;
  }
  if (!parityMissing) return;

  size_t length = KJ_ASSERT_NONNULL(shards[0]).size();
  auto data = kj::heapArray<byte*>(dataBlocks);
  for (uint i = 0; i < dataBlocks; i++) {
    data[i] = KJ_ASSERT_NONNULL(shards[i]).begin();
  }

  auto parity = kj::heapArrayBuilder<kj::Array<byte>>(parityBlocks);
  auto pointers = kj::heapArray<byte*>(parityBlocks);
  for (uint i = 0; i < parityBlocks; i++) {
    auto p = kj::heapArray<byte>(length);
    pointers[i] = p.begin();
    parity.add(kj::mv(p));
  }
  computeParity(data, pointers, length);

  auto computed = parity.finish();
  for (uint i = 0; i < parityBlocks; i++) {
    if (shards[dataBlocks + i] == nullptr) {
      shards[dataBlocks + i] = kj::mv(computed[i]);
    }
  }
}

}  // namespace storage
}  // namespace granite
