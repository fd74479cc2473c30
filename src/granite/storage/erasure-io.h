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

#ifndef GRANITE_STORAGE_ERASURE_IO_H_
#define GRANITE_STORAGE_ERASURE_IO_H_

#include "erasure.h"
#include "bitrot.h"
#include <kj/async-io.h>

namespace granite {
namespace storage {

class ErasureEncoder {
  // Streams an object through the erasure code into one BitrotWriter per shard index. A writer
  // that fails is dropped for the rest of the object and its error is kept for the caller.
  //
  // Each block moves on once `writeQuorum` writers have taken it. Slower writers keep their own
  // queue of blocks, and closing waits for them to catch up.

public:
  ErasureEncoder(const Erasure& erasure, kj::Array<kj::Maybe<kj::Own<BitrotWriter>>> writers,
                 uint writeQuorum);
  // `writers[i]` receives shard i; null entries are disks that are already known to be down.

  kj::Promise<uint64_t> encode(kj::AsyncInputStream& input, int64_t size);
  // Reads `size` bytes (or until EOF if `size` is negative), writes all shards and closes the
  // writers. Fails with ERASURE_WRITE_QUORUM (or the error most writers agree on) once fewer
  // than `writeQuorum` writers remain, and with LESS_DATA if the input ends early. Returns the
  // number of bytes encoded.

  kj::ArrayPtr<const kj::Maybe<kj::Exception>> getErrors() { return errors; }
  // Per shard index: why that writer was dropped.

private:
  const Erasure& erasure;
  kj::Array<kj::Maybe<kj::Own<BitrotWriter>>> writers;
  kj::Array<kj::Maybe<kj::Exception>> errors;
  kj::Array<kj::Maybe<kj::Promise<void>>> queued;
  // Per shard index: the writes that writer has not finished yet.
  uint writeQuorum;
  kj::Array<byte> blockBuffer;
  uint64_t total = 0;

  kj::Promise<void> encodeLoop(kj::AsyncInputStream& input, int64_t size);
  kj::Promise<void> writeShards(kj::Array<kj::Array<byte>> shards);
  kj::Promise<void> closeAll();
  void dropWriter(uint index, kj::Exception&& error);
  void checkQuorum();
  uint liveWriters();
};

class ErasureDecoder {
  // Reads a byte range of an object back from its shards. Data shards are read first; each
  // failed or corrupt shard is replaced by the next unused one, and the block is reconstructed
  // once dataBlocks shards verified.

public:
  ErasureDecoder(const Erasure& erasure, kj::Array<kj::Maybe<kj::Own<BitrotReader>>> readers);
  // `readers[i]` reads shard i; null entries are shards known to be unavailable.

  kj::Promise<void> decode(kj::AsyncOutputStream& output, uint64_t offset, uint64_t length,
                           uint64_t totalLength);
  // Fails with INSUFFICIENT_SHARDS if some block has fewer than dataBlocks readable shards.

  kj::Promise<kj::Array<kj::Maybe<kj::Array<byte>>>> readBlock(uint64_t block,
                                                               uint64_t totalLength);
  // All shards of one block, reconstructed where they could not be read.

  kj::ArrayPtr<const kj::Maybe<kj::Exception>> getErrors() { return errors; }
  // Per shard index: why that shard was given up on. Used to queue heals.

  bool hasErrors();

private:
  const Erasure& erasure;
  kj::Array<kj::Maybe<kj::Own<BitrotReader>>> readers;
  kj::Array<kj::Maybe<kj::Exception>> errors;

  kj::Promise<void> readShards(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards,
                               uint64_t shardOffset, uint64_t shardLength);
};

kj::Promise<void> erasureHeal(const Erasure& erasure, ErasureDecoder& decoder,
                              kj::ArrayPtr<kj::Maybe<kj::Own<BitrotWriter>>> writers,
                              uint64_t totalLength);
// Rebuild every block and write the shards whose writer is non-null. Used to repair the shards
// of stale or corrupt disks from the healthy ones.

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_ERASURE_IO_H_
