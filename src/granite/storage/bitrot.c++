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

#include "bitrot.h"
#include <kj/debug.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/crypto_hash_sha256.h>
#include <sodium/utils.h>
#include <string.h>

namespace granite {
namespace storage {

size_t hashSize(BitrotAlgorithm algorithm) {
  switch (algorithm) {
    case BitrotAlgorithm::BLAKE2B256: return 32;
    case BitrotAlgorithm::BLAKE2B512: return 64;
    case BitrotAlgorithm::SHA256: return crypto_hash_sha256_BYTES;
  }
  KJ_FAIL_REQUIRE("unknown bitrot algorithm", static_cast<uint>(algorithm));
}

void computeHash(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> data,
                 kj::ArrayPtr<byte> out) {
  KJ_REQUIRE(out.size() == hashSize(algorithm));
  switch (algorithm) {
    case BitrotAlgorithm::BLAKE2B256:
    case BitrotAlgorithm::BLAKE2B512:
      crypto_generichash_blake2b(out.begin(), out.size(), data.begin(), data.size(), nullptr, 0);
      return;
    case BitrotAlgorithm::SHA256:
      crypto_hash_sha256(out.begin(), data.begin(), data.size());
      return;
  }
}

kj::Array<byte> computeHash(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> data) {
  auto result = kj::heapArray<byte>(hashSize(algorithm));
  computeHash(algorithm, data, result);
  return result;
}

bool verifyBlock(BitrotAlgorithm algorithm, kj::ArrayPtr<const byte> expectedHash,
                 kj::ArrayPtr<const byte> data) {
  if (expectedHash.size() != hashSize(algorithm)) return false;
  auto actual = computeHash(algorithm, data);
  return sodium_memcmp(actual.begin(), expectedHash.begin(), actual.size()) == 0;
}

uint64_t bitrotShardFileSize(uint64_t size, uint64_t shardSize, BitrotAlgorithm algorithm) {
  if (size == 0) return 0;
  uint64_t blocks = (size + shardSize - 1) / shardSize;
  return blocks * hashSize(algorithm) + size;
}

uint64_t bitrotShardFileOffset(uint64_t offset, uint64_t shardSize, BitrotAlgorithm algorithm) {
  return (offset / shardSize) * (hashSize(algorithm) + shardSize);
}

// =======================================================================================

kj::Promise<void> BitrotWriter::write(kj::ArrayPtr<const byte> block) {
  KJ_REQUIRE(block.size() > 0 && block.size() <= shardSize, "bad block size", block.size());
  KJ_REQUIRE(!sawShortBlock, "only the last block of a shard may be short");
  if (block.size() < shardSize) sawShortBlock = true;

  size_t hsize = hashSize(algorithm);
  auto buffer = kj::heapArray<byte>(hsize + block.size());
  computeHash(algorithm, block, buffer.slice(0, hsize));
  memcpy(buffer.begin() + hsize, block.begin(), block.size());

  return inner->write(buffer).attach(kj::mv(buffer));
}

kj::Promise<void> BitrotWriter::close() {
  return inner->close();
}

// =======================================================================================

BitrotReader::BitrotReader(Disk& disk, kj::String volume, kj::String path, uint64_t tillOffset,
                           BitrotAlgorithm algorithm, uint64_t shardSize)
    : disk(disk), volume(kj::mv(volume)), path(kj::mv(path)), tillOffset(tillOffset),
      algorithm(algorithm), shardSize(shardSize),
      hashBuffer(kj::heapArray<byte>(hashSize(algorithm))) {}

kj::Promise<void> BitrotReader::readAt(uint64_t offset, kj::ArrayPtr<byte> buffer) {
  KJ_REQUIRE(offset % shardSize == 0, "unaligned shard read", offset);

  kj::Promise<void> ready = nullptr;
  if (stream == nullptr || offset != nextOffset) {
    stream = nullptr;
    uint64_t streamOffset = bitrotShardFileOffset(offset, shardSize, algorithm);
    uint64_t streamEnd = bitrotShardFileSize(tillOffset, shardSize, algorithm);
    KJ_REQUIRE(streamOffset < streamEnd, "read past end of shard", offset, tillOffset);
    ready = disk.readFileStream(volume, path, streamOffset, streamEnd - streamOffset)
        .then([this](kj::Own<FileReader>&& reader) {
      stream = kj::mv(reader);
    });
  } else {
    ready = kj::READY_NOW;
  }

  return ready.then([this]() {
    auto& reader = *KJ_ASSERT_NONNULL(stream);
    return readExactly(reader, hashBuffer);
  }).then([this,buffer]() {
    auto& reader = *KJ_ASSERT_NONNULL(stream);
    return readExactly(reader, buffer);
  }).then([this,offset,buffer]() -> kj::Promise<void> {
    if (!verifyBlock(algorithm, hashBuffer, buffer)) {
      stream = nullptr;
      GRANITE_FAIL(CORRUPT_SHARD, disk.getEndpoint(), " ", volume, "/", path,
                   ": bitrot detected in block at offset ", offset);
    }
    nextOffset = offset + buffer.size();
    return kj::READY_NOW;
  }, [this](kj::Exception&& e) -> kj::Promise<void> {
    // The stream position is unknown after a failure.
    stream = nullptr;
    if (isError(e, ErrorCode::LESS_DATA)) {
      // A truncated shard is as unusable as a corrupt one.
      return GRANITE_ERROR(CORRUPT_SHARD, disk.getEndpoint(), " ", volume, "/", path,
                           ": shard is truncated");
    }
    return kj::mv(e);
  });
}

}  // namespace storage
}  // namespace granite
