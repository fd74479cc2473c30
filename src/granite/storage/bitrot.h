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

#ifndef GRANITE_STORAGE_BITROT_H_
#define GRANITE_STORAGE_BITROT_H_

#include "disk.h"

namespace granite {
namespace storage {

// A shard file is a sequence of blocks, each preceded by the hash of its content:
//
//   [hash(block 0)][block 0][hash(block 1)][block 1] ...
//
// Every block except the last is exactly `shardSize` bytes. Blocks are verified independently,
// so a reader can start at any block boundary.

size_t hashSize(BitrotAlgorithm algorithm);

kj::Array<byte> computeHash(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> data);
void computeHash(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> data,
                 kj::ArrayPtr<byte> out);

bool verifyBlock(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> expectedHash,
                 kj::ArrayPtr<const byte> data);

uint64_t bitrotShardFileSize(uint64_t size, uint64_t shardSize, BitrotAlgorithm algorithm);
// Size on disk of a shard file holding `size` payload bytes.

uint64_t bitrotShardFileOffset(uint64_t offset, uint64_t shardSize, BitrotAlgorithm algorithm);
// Position in the shard file of the block holding payload offset `offset`.

class BitrotWriter {
  // Writes one shard file, hashing each block on the way out.

public:
  BitrotWriter(kj::Own<FileWriter> inner, BitrotAlgorithm algorithm, uint64_t shardSize)
      : inner(kj::mv(inner)), algorithm(algorithm), shardSize(shardSize) {}
  KJ_DISALLOW_COPY(BitrotWriter);

  kj::Promise<void> write(kj::ArrayPtr<const byte> block);
  // `block` is at most shardSize bytes, and only the last block may be shorter. The caller may
  // reuse `block` as soon as write() returns.

  kj::Promise<void> close();

private:
  kj::Own<FileWriter> inner;
  BitrotAlgorithm algorithm;
  uint64_t shardSize;
  bool sawShortBlock = false;
};

class BitrotReader {
  // Reads one shard file, verifying each block. Opens the underlying stream lazily at the first
  // block requested and reopens it on non-sequential access.

public:
  BitrotReader(Disk& disk, kj::String volume, kj::String path, uint64_t tillOffset,
               BitrotAlgorithm algorithm, uint64_t shardSize);
  // `tillOffset` is the payload length of the whole shard.
  KJ_DISALLOW_COPY(BitrotReader);

  kj::Promise<void> readAt(uint64_t offset, kj::ArrayPtr<byte> buffer);
  // Reads one block's payload. `offset` is a multiple of shardSize and `buffer` is the whole
  // block (shardSize, or less for the last block). Fails with CORRUPT_SHARD naming `offset` if
  // the block does not match its hash.

  Disk& getDisk() { return disk; }

private:
  Disk& disk;
  kj::String volume;
  kj::String path;
  uint64_t tillOffset;
  BitrotAlgorithm algorithm;
  uint64_t shardSize;

  kj::Maybe<kj::Own<FileReader>> stream;
  uint64_t nextOffset = 0;
  kj::Array<byte> hashBuffer;
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_BITROT_H_
