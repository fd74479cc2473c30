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

#ifndef GRANITE_STORAGE_ERASURE_H_
#define GRANITE_STORAGE_ERASURE_H_

#include "basics.h"

namespace granite {
namespace storage {

class Erasure {
  // Systematic Reed-Solomon code over GF(2^8) with a Cauchy generator matrix. Objects are coded
  // one block (blockSize bytes of object data) at a time; each block becomes dataBlocks +
  // parityBlocks shards of shardSize() bytes, the last block of an object possibly less.

public:
  Erasure(uint dataBlocks, uint parityBlocks, uint64_t blockSize);
  KJ_DISALLOW_COPY(Erasure);

  uint getDataBlocks() const { return dataBlocks; }
  uint getParityBlocks() const { return parityBlocks; }
  uint getTotalBlocks() const { return dataBlocks + parityBlocks; }
  uint64_t getBlockSize() const { return blockSize; }

  uint64_t shardSize() const;
  // Shard bytes per full block.

  uint64_t shardFileSize(int64_t totalLength) const;
  // Shard payload bytes for an object of `totalLength` bytes.

  uint64_t shardFileOffset(uint64_t startOffset, uint64_t length, uint64_t totalLength) const;
  // Payload bytes of each shard that must be read to serve [startOffset, startOffset + length).

  kj::Array<kj::Array<byte>> encodeData(kj::ArrayPtr<const byte> block) const;
  // Split one block into dataBlocks shards (the last zero-padded) and compute the parity
  // shards. Returns getTotalBlocks() shards of equal size.

  void decodeDataBlocks(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards) const;
  // `shards` has one slot per shard index; null slots are missing. Reconstructs the missing
  // data shards. Fails with INSUFFICIENT_SHARDS if fewer than dataBlocks are present.

  void decodeDataAndParityBlocks(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards) const;
  // Like decodeDataBlocks() but also reconstructs missing parity shards.

private:
  uint dataBlocks;
  uint parityBlocks;
  uint64_t blockSize;

  kj::Array<byte> encodeMatrix;
  // (dataBlocks + parityBlocks) x dataBlocks. The top square is the identity.

  kj::Array<byte> encodeTables;
  // Expanded multiplication tables of the parity rows.

  void computeParity(kj::ArrayPtr<byte* const> data, kj::ArrayPtr<byte* const> parity,
                     size_t length) const;
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_ERASURE_H_
