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
#include "test-util.h"
#include <kj/test.h>
#include <kj/async.h>

namespace granite {
namespace storage {
namespace {

KJ_TEST("hash sizes") {
  initCrypto();
  KJ_EXPECT(hashSize(BitrotAlgorithm::BLAKE2B256) == 32);
  KJ_EXPECT(hashSize(BitrotAlgorithm::BLAKE2B512) == 64);
  KJ_EXPECT(hashSize(BitrotAlgorithm::SHA256) == 32);

  auto data = testData(1000);
  for (auto algorithm: { BitrotAlgorithm::BLAKE2B256, BitrotAlgorithm::BLAKE2B512,
                         BitrotAlgorithm::SHA256 }) {
    auto hash = computeHash(algorithm, data);
    KJ_EXPECT(hash.size() == hashSize(algorithm));
    KJ_EXPECT(verifyBlock(algorithm, hash, data));
    data[500] ^= 1;
    KJ_EXPECT(!verifyBlock(algorithm, hash, data));
    data[500] ^= 1;
  }
}

KJ_TEST("shard file size math") {
  // Three full blocks of 16 bytes and one of 5, each preceded by a 32-byte hash.
  KJ_EXPECT(bitrotShardFileSize(53, 16, BitrotAlgorithm::BLAKE2B256) == 53 + 4 * 32);
  KJ_EXPECT(bitrotShardFileSize(48, 16, BitrotAlgorithm::BLAKE2B256) == 48 + 3 * 32);
  KJ_EXPECT(bitrotShardFileSize(0, 16, BitrotAlgorithm::BLAKE2B256) == 0);
  KJ_EXPECT(bitrotShardFileOffset(32, 16, BitrotAlgorithm::BLAKE2B512) == 2 * (16 + 64));
}

KJ_TEST("bitrot writer and reader") {
  initCrypto();
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestTempdir tmp("bitrot-test");
  auto disk = newTestDisk(tmp.subdir("disk"));
  disk->makeVolume("bucket").wait(waitScope);

  const uint64_t shardSize = 64;
  auto data = testData(shardSize * 3 + 10);

  {
    auto file = disk->createFile("bucket", "obj/part.1", -1).wait(waitScope);
    BitrotWriter writer(kj::mv(file), BitrotAlgorithm::BLAKE2B256, shardSize);
    for (uint64_t offset = 0; offset < data.size(); offset += shardSize) {
      auto end = kj::min(offset + shardSize, data.size());
      writer.write(data.slice(offset, end)).wait(waitScope);
    }
    writer.close().wait(waitScope);
  }

  struct stat stats;
  auto filePath = kj::str(tmp.path, "/disk/bucket/obj/part.1");
  KJ_SYSCALL(stat(filePath.cStr(), &stats));
  KJ_EXPECT(static_cast<uint64_t>(stats.st_size) ==
            bitrotShardFileSize(data.size(), shardSize, BitrotAlgorithm::BLAKE2B256));

  BitrotReader reader(*disk, kj::str("bucket"), kj::str("obj/part.1"), data.size(),
                      BitrotAlgorithm::BLAKE2B256, shardSize);
  auto buffer = kj::heapArray<byte>(shardSize);

  // Sequential reads.
  for (uint64_t offset = 0; offset < data.size(); offset += shardSize) {
    auto length = kj::min(shardSize, data.size() - offset);
    reader.readAt(offset, buffer.slice(0, length)).wait(waitScope);
    KJ_EXPECT(buffer.slice(0, length) == data.slice(offset, offset + length));
  }

  // A random access reopens the stream.
  reader.readAt(shardSize, buffer).wait(waitScope);
  KJ_EXPECT(buffer.asPtr() == data.slice(shardSize, shardSize * 2));

  // Flip one payload byte of the third block.
  {
    auto fd = sandstorm::raiiOpen(filePath, O_RDWR | O_CLOEXEC);
    off_t pos = bitrotShardFileOffset(shardSize * 2, shardSize, BitrotAlgorithm::BLAKE2B256) +
                hashSize(BitrotAlgorithm::BLAKE2B256) + 7;
    byte b;
    KJ_SYSCALL(pread(fd, &b, 1, pos));
    b ^= 0x80;
    KJ_SYSCALL(pwrite(fd, &b, 1, pos));
  }

  KJ_EXPECT_THROW_MESSAGE("CORRUPT_SHARD",
      reader.readAt(shardSize * 2, buffer).wait(waitScope));

  // Other blocks still verify.
  reader.readAt(0, buffer).wait(waitScope);
  KJ_EXPECT(buffer.asPtr() == data.slice(0, shardSize));
}

KJ_TEST("bitrot writer rejects a short block before the last") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestTempdir tmp("bitrot-short-test");
  auto disk = newTestDisk(tmp.subdir("disk"));
  disk->makeVolume("bucket").wait(waitScope);

  auto data = testData(100);
  auto file = disk->createFile("bucket", "shard", -1).wait(waitScope);
  BitrotWriter writer(kj::mv(file), BitrotAlgorithm::SHA256, 64);
  writer.write(data.slice(0, 30)).wait(waitScope);
  KJ_EXPECT_THROW_MESSAGE("only the last block", writer.write(data.slice(30, 60)));
}

}  // namespace
}  // namespace storage
}  // namespace granite
