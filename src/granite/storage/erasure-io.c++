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

#include "erasure-io.h"
#include <granite/quorum.h>
#include <kj/debug.h>
#include <string.h>

namespace granite {
namespace storage {

ErasureEncoder::ErasureEncoder(const Erasure& erasure,
                               kj::Array<kj::Maybe<kj::Own<BitrotWriter>>> writers,
                               uint writeQuorum)
    : erasure(erasure), writers(kj::mv(writers)),
      errors(kj::heapArray<kj::Maybe<kj::Exception>>(erasure.getTotalBlocks())),
      queued(kj::heapArray<kj::Maybe<kj::Promise<void>>>(erasure.getTotalBlocks())),
      writeQuorum(writeQuorum) {
  KJ_REQUIRE(this->writers.size() == erasure.getTotalBlocks());
  for (uint i = 0; i < this->writers.size(); i++) {
    if (this->writers[i] == nullptr) {
      errors[i] = GRANITE_ERROR(DISK_OFFLINE, "no writer for shard ", i + 1);
    }
  }
}

uint ErasureEncoder::liveWriters() {
  uint count = 0;
  for (auto& writer: writers) {
    if (writer != nullptr) ++count;
  }
  return count;
}

void ErasureEncoder::dropWriter(uint index, kj::Exception&& error) {
  if (writers[index] == nullptr) return;
  KJ_LOG(WARNING, "dropping shard writer", index + 1, error.getDescription());
  errors[index] = kj::mv(error);
  queued[index] = nullptr;
  writers[index] = nullptr;
}

void ErasureEncoder::checkQuorum() {
  if (liveWriters() >= writeQuorum) return;

  KJ_IF_MAYBE(e, reduceErrors(errors, nullptr, writeQuorum, ErrorCode::ERASURE_WRITE_QUORUM)) {
    kj::throwFatalException(kj::mv(*e));
  }
  GRANITE_FAIL(ERASURE_WRITE_QUORUM, liveWriters(), " writers left, ", writeQuorum, " needed");
}

kj::Promise<uint64_t> ErasureEncoder::encode(kj::AsyncInputStream& input, int64_t size) {
  blockBuffer = kj::heapArray<byte>(erasure.getBlockSize());
  return kj::evalNow([this,&input,size]() {
    checkQuorum();
    return encodeLoop(input, size);
  }).then([this]() {
    return closeAll();
  }).then([this]() {
    return total;
  });
}

kj::Promise<void> ErasureEncoder::encodeLoop(kj::AsyncInputStream& input, int64_t size) {
  size_t want = erasure.getBlockSize();
  if (size >= 0) {
    want = kj::min<uint64_t>(want, size - total);
    if (want == 0) return kj::READY_NOW;
  }

  return input.tryRead(blockBuffer.begin(), want, want)
      .then([this,&input,size,want](size_t n) -> kj::Promise<void> {
    if (n < want && size >= 0) {
      return GRANITE_ERROR(LESS_DATA, "input ended after ", total + n, " of ", size, " bytes");
    }
    if (n == 0) return kj::READY_NOW;

    total += n;
    auto promise = writeShards(erasure.encodeData(blockBuffer.slice(0, n)));
    if (n < want) {
      // End of an input of unknown size.
      return kj::mv(promise);
    }
    return promise.then([this,&input,size]() {
      return encodeLoop(input, size);
    });
  });
}

namespace {

kj::Promise<void> takeQueue(kj::Maybe<kj::Promise<void>>& slot) {
  KJ_IF_MAYBE(promise, slot) {
    auto result = kj::mv(*promise);
    slot = nullptr;
    return kj::mv(result);
  }
  return kj::READY_NOW;
}

}  // namespace

kj::Promise<void> ErasureEncoder::writeShards(kj::Array<kj::Array<byte>> shards) {
  kj::Vector<uint> indexes;
  kj::Vector<kj::Promise<void>> promises;
  for (uint i = 0; i < writers.size(); i++) {
    KJ_IF_MAYBE(writer, writers[i]) {
      auto& w = **writer;
      auto written = takeQueue(queued[i])
          .then([&w,shard=kj::mv(shards[i])]() { return w.write(shard); })
          .fork();
      queued[i] = written.addBranch();
      indexes.add(i);
      promises.add(written.addBranch());
    }
  }

  auto indexArray = indexes.releaseAsArray();
  return collectQuorum(promises.releaseAsArray(), writeQuorum, QuorumMode::CANCEL_REST)
      .then([this,KJ_MVCAP(indexArray)](QuorumOutcome&& outcome) {
    for (uint j = 0; j < indexArray.size(); j++) {
      KJ_IF_MAYBE(e, outcome.errors[j]) {
        dropWriter(indexArray[j], kj::mv(*e));
      }
    }
    checkQuorum();
  });
}

kj::Promise<void> ErasureEncoder::closeAll() {
  kj::Vector<uint> indexes;
  kj::Vector<kj::Promise<void>> promises;
  for (uint i = 0; i < writers.size(); i++) {
    KJ_IF_MAYBE(writer, writers[i]) {
      auto& w = **writer;
      indexes.add(i);
      promises.add(takeQueue(queued[i]).then([&w]() { return w.close(); }));
    }
  }

  auto indexArray = indexes.releaseAsArray();
  return collectQuorum(promises.releaseAsArray(), writeQuorum)
      .then([this,KJ_MVCAP(indexArray)](QuorumOutcome&& outcome) {
    for (uint j = 0; j < indexArray.size(); j++) {
      KJ_IF_MAYBE(e, outcome.errors[j]) {
        dropWriter(indexArray[j], kj::mv(*e));
      }
    }
    checkQuorum();
  });
}

// =======================================================================================

ErasureDecoder::ErasureDecoder(const Erasure& erasure,
                               kj::Array<kj::Maybe<kj::Own<BitrotReader>>> readers)
    : erasure(erasure), readers(kj::mv(readers)),
      errors(kj::heapArray<kj::Maybe<kj::Exception>>(erasure.getTotalBlocks())) {
  KJ_REQUIRE(this->readers.size() == erasure.getTotalBlocks());
  for (uint i = 0; i < this->readers.size(); i++) {
    if (this->readers[i] == nullptr) {
      errors[i] = GRANITE_ERROR(DISK_OFFLINE, "no reader for shard ", i + 1);
    }
  }
}

bool ErasureDecoder::hasErrors() {
  for (auto& error: errors) {
    if (error != nullptr) return true;
  }
  return false;
}

kj::Promise<void> ErasureDecoder::readShards(kj::ArrayPtr<kj::Maybe<kj::Array<byte>>> shards,
                                             uint64_t shardOffset, uint64_t shardLength) {
  uint have = 0;
  for (auto& shard: shards) {
    if (shard != nullptr) ++have;
  }
  uint need = erasure.getDataBlocks();
  if (have >= need) return kj::READY_NOW;

  // Start just enough reads to complete the block if they all succeed, lowest index first so
  // that the data shards are preferred and no reconstruction is needed when they are healthy.
  kj::Vector<uint> picked;
  for (uint i = 0; i < readers.size() && have + picked.size() < need; i++) {
    if (shards[i] == nullptr && readers[i] != nullptr) picked.add(i);
  }

  if (have + picked.size() < need) {
    kj::String firstError;
    for (auto& error: errors) {
      KJ_IF_MAYBE(e, error) {
        firstError = kj::str(e->getDescription());
        break;
      }
    }
    return GRANITE_ERROR(INSUFFICIENT_SHARDS, have, " of ", need, " shards readable: ",
                         firstError);
  }

  auto promises = kj::heapArrayBuilder<kj::Promise<kj::Array<byte>>>(picked.size());
  for (auto i: picked) {
    auto buffer = kj::heapArray<byte>(shardLength);
    auto ptr = buffer.asPtr();
    auto& reader = *KJ_ASSERT_NONNULL(readers[i]);
    promises.add(reader.readAt(shardOffset, ptr).then([KJ_MVCAP(buffer)]() mutable {
      return kj::mv(buffer);
    }));
  }

  auto pickedArray = picked.releaseAsArray();
  return collectValues(promises.finish(), pickedArray.size())
      .then([this,shards,KJ_MVCAP(pickedArray),shardOffset,shardLength](
          QuorumValues<kj::Array<byte>>&& results) {
    for (uint j = 0; j < pickedArray.size(); j++) {
      uint i = pickedArray[j];
      KJ_IF_MAYBE(value, results.values[j]) {
        shards[i] = kj::mv(*value);
      } else KJ_IF_MAYBE(e, results.outcome.errors[j]) {
        KJ_LOG(WARNING, "shard unreadable", i + 1, e->getDescription());
        errors[i] = kj::mv(*e);
        readers[i] = nullptr;
      }
    }
    return readShards(shards, shardOffset, shardLength);
  });
}

kj::Promise<kj::Array<kj::Maybe<kj::Array<byte>>>> ErasureDecoder::readBlock(
    uint64_t block, uint64_t totalLength) {
  uint64_t blockOffset = block * erasure.getBlockSize();
  KJ_REQUIRE(blockOffset < totalLength, "block out of range", block, totalLength);
  uint64_t blockLength = kj::min(erasure.getBlockSize(), totalLength - blockOffset);
  uint64_t shardLength = (blockLength + erasure.getDataBlocks() - 1) / erasure.getDataBlocks();
  uint64_t shardOffset = block * erasure.shardSize();

  auto shards = kj::heapArray<kj::Maybe<kj::Array<byte>>>(erasure.getTotalBlocks());
  auto promise = readShards(shards, shardOffset, shardLength);
  return promise.then([this,KJ_MVCAP(shards)]() mutable {
    erasure.decodeDataBlocks(shards);
    return kj::mv(shards);
  });
}

kj::Promise<void> ErasureDecoder::decode(kj::AsyncOutputStream& output, uint64_t offset,
                                         uint64_t length, uint64_t totalLength) {
  if (length == 0) return kj::READY_NOW;
  KJ_REQUIRE(offset + length <= totalLength, "range out of bounds", offset, length, totalLength);

  uint64_t blockSize = erasure.getBlockSize();
  uint64_t block = offset / blockSize;
  uint64_t blockOffset = block * blockSize;
  uint64_t blockLength = kj::min(blockSize, totalLength - blockOffset);

  return readBlock(block, totalLength)
      .then([this,&output,offset,length,totalLength,blockOffset,blockLength](
          kj::Array<kj::Maybe<kj::Array<byte>>>&& shards) {
    auto data = kj::heapArray<byte>(blockLength);
    uint64_t pos = 0;
    for (uint i = 0; i < erasure.getDataBlocks() && pos < blockLength; i++) {
      auto& shard = KJ_ASSERT_NONNULL(shards[i]);
      size_t n = kj::min<uint64_t>(shard.size(), blockLength - pos);
      memcpy(data.begin() + pos, shard.begin(), n);
      pos += n;
    }

    uint64_t start = offset - blockOffset;
    uint64_t end = kj::min(offset + length - blockOffset, blockLength);
    auto promise = output.write(data.begin() + start, end - start);
    uint64_t written = end - start;
    return promise.attach(kj::mv(data))
        .then([this,&output,offset,length,totalLength,written]() {
      return decode(output, offset + written, length - written, totalLength);
    });
  });
}

// =======================================================================================

namespace {

kj::Promise<void> healBlocks(const Erasure& erasure, ErasureDecoder& decoder,
                             kj::ArrayPtr<kj::Maybe<kj::Own<BitrotWriter>>> writers,
                             uint64_t block, uint64_t totalLength) {
  if (block * erasure.getBlockSize() >= totalLength) return kj::READY_NOW;

  return decoder.readBlock(block, totalLength)
      .then([&erasure,&decoder,writers,block,totalLength](
          kj::Array<kj::Maybe<kj::Array<byte>>>&& shards) {
    erasure.decodeDataAndParityBlocks(shards);

    kj::Vector<kj::Promise<void>> promises;
    for (uint i = 0; i < writers.size(); i++) {
      KJ_IF_MAYBE(writer, writers[i]) {
        promises.add((*writer)->write(KJ_ASSERT_NONNULL(shards[i])));
      }
    }
    return kj::joinPromises(promises.releaseAsArray()).attach(kj::mv(shards))
        .then([&erasure,&decoder,writers,block,totalLength]() {
      return healBlocks(erasure, decoder, writers, block + 1, totalLength);
    });
  });
}

}  // namespace

kj::Promise<void> erasureHeal(const Erasure& erasure, ErasureDecoder& decoder,
                              kj::ArrayPtr<kj::Maybe<kj::Own<BitrotWriter>>> writers,
                              uint64_t totalLength) {
  return healBlocks(erasure, decoder, writers, 0, totalLength).then([writers]() {
    kj::Vector<kj::Promise<void>> promises;
    for (auto& writer: writers) {
      KJ_IF_MAYBE(w, writer) {
        promises.add((*w)->close());
      }
    }
    return kj::joinPromises(promises.releaseAsArray());
  });
}

}  // namespace storage
}  // namespace granite
