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
#include "test-util.h"
#include <kj/test.h>

namespace granite {
namespace storage {
namespace {

const BitrotAlgorithm ALGORITHM = BitrotAlgorithm::BLAKE2B256;

class MemoryFileWriter final: public FileWriter {
  // Keeps what is written. Writes complete once `gate` resolves, or immediately without one.

public:
  kj::Vector<byte> data;
  uint writes = 0;
  bool closed = false;
  kj::Maybe<kj::ForkedPromise<void>> gate;

  kj::Promise<void> write(kj::ArrayPtr<const byte> bytes) override {
    ++writes;
    data.addAll(bytes.begin(), bytes.end());
    KJ_IF_MAYBE(g, gate) {
      return g->addBranch();
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> close() override {
    closed = true;
    return kj::READY_NOW;
  }
};

struct IoFixture {
  explicit IoFixture(kj::StringPtr name)
      : waitScope(loop), tmp(name), disk(newTestDisk(tmp.subdir("disk"))),
        erasure(4, 2, 1024) {
    initCrypto();
    disk->makeVolume("bucket").wait(waitScope);
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  TestTempdir tmp;
  kj::Own<LocalDisk> disk;
  Erasure erasure;

  kj::String shardPath(uint i) {
    return kj::str("obj/shard.", i);
  }

  void writeShards(kj::ArrayPtr<const byte> data) {
    auto writers = kj::heapArrayBuilder<kj::Maybe<kj::Own<BitrotWriter>>>(6);
    for (uint i = 0; i < 6; i++) {
      auto file = disk->createFile("bucket", shardPath(i), -1).wait(waitScope);
      writers.add(kj::heap<BitrotWriter>(kj::mv(file), ALGORITHM, erasure.shardSize()));
    }
    ErasureEncoder encoder(erasure, writers.finish(), 5);
    MemoryInputStream input(data);
    KJ_EXPECT(encoder.encode(input, data.size()).wait(waitScope) == data.size());
  }

  kj::Array<kj::Maybe<kj::Own<BitrotReader>>> openReaders(uint64_t size) {
    auto readers = kj::heapArrayBuilder<kj::Maybe<kj::Own<BitrotReader>>>(6);
    for (uint i = 0; i < 6; i++) {
      readers.add(kj::heap<BitrotReader>(*disk, kj::str("bucket"), shardPath(i),
                                         erasure.shardFileSize(size), ALGORITHM,
                                         erasure.shardSize()));
    }
    return readers.finish();
  }

  void corrupt(uint shard, uint64_t block) {
    auto path = kj::str(tmp.path, "/disk/bucket/", shardPath(shard));
    auto fd = sandstorm::raiiOpen(path, O_RDWR | O_CLOEXEC);
    off_t pos = bitrotShardFileOffset(block * erasure.shardSize(), erasure.shardSize(),
                                      ALGORITHM) + hashSize(ALGORITHM) + 3;
    byte b;
    KJ_SYSCALL(pread(fd, &b, 1, pos));
    b ^= 0x01;
    KJ_SYSCALL(pwrite(fd, &b, 1, pos));
  }
};

KJ_TEST("corrupt blocks are rebuilt from the other shards") {
  IoFixture env("erasure-io-corrupt-test");
  auto data = testData(3 * 1024 + 100);
  env.writeShards(data);

  // A data shard and a parity shard each lose one block.
  env.corrupt(0, 1);
  env.corrupt(5, 3);

  ErasureDecoder decoder(env.erasure, env.openReaders(data.size()));
  MemoryOutputStream output;
  decoder.decode(output, 0, data.size(), data.size()).wait(env.waitScope);
  KJ_EXPECT(output.data.asPtr() == data.asPtr());

  KJ_EXPECT(decoder.hasErrors());
  auto errors = decoder.getErrors();
  KJ_EXPECT(isError(KJ_ASSERT_NONNULL(errors[0]), ErrorCode::CORRUPT_SHARD));
  for (uint i = 1; i < 5; i++) {
    KJ_EXPECT(errors[i] == nullptr, i);
  }

  // A range that starts inside the damaged block.
  ErasureDecoder ranged(env.erasure, env.openReaders(data.size()));
  MemoryOutputStream part;
  ranged.decode(part, 1500, 1000, data.size()).wait(env.waitScope);
  KJ_EXPECT(part.data.asPtr() == data.slice(1500, 2500));
}

KJ_TEST("too many corrupt shards fail the read") {
  IoFixture env("erasure-io-insufficient-test");
  auto data = testData(2048);
  env.writeShards(data);

  env.corrupt(0, 0);
  env.corrupt(2, 0);
  env.corrupt(4, 0);

  ErasureDecoder decoder(env.erasure, env.openReaders(data.size()));
  MemoryOutputStream output;
  KJ_EXPECT_THROW_MESSAGE("INSUFFICIENT_SHARDS",
      decoder.decode(output, 0, data.size(), data.size()).wait(env.waitScope));
}

KJ_TEST("a slow shard writer does not hold up the blocks") {
  IoFixture env("erasure-io-slow-test");
  Erasure& erasure = env.erasure;
  auto data = testData(4 * 1024);

  auto gate = kj::newPromiseAndFulfiller<void>();
  auto files = kj::heapArrayBuilder<MemoryFileWriter*>(6);
  auto writers = kj::heapArrayBuilder<kj::Maybe<kj::Own<BitrotWriter>>>(6);
  for (uint i = 0; i < 6; i++) {
    auto file = kj::heap<MemoryFileWriter>();
    if (i == 5) file->gate = gate.promise.fork();
    files.add(file.get());
    writers.add(kj::heap<BitrotWriter>(kj::mv(file), ALGORITHM, erasure.shardSize()));
  }
  auto fileArray = files.finish();

  ErasureEncoder encoder(erasure, writers.finish(), 5);
  MemoryInputStream input(data);
  auto promise = encoder.encode(input, data.size());
  for (uint i = 0; i < 50; i++) {
    kj::evalLater([]() {}).wait(env.waitScope);
  }

  // Every block reached the five fast writers while the slow one still holds the first.
  for (uint i = 0; i < 5; i++) {
    KJ_EXPECT(fileArray[i]->writes == 4, i);
  }
  KJ_EXPECT(fileArray[5]->writes == 1);
  KJ_EXPECT(!fileArray[5]->closed);

  gate.fulfiller->fulfill();
  KJ_EXPECT(promise.wait(env.waitScope) == data.size());

  // The slow writer caught up before closing.
  KJ_EXPECT(fileArray[5]->writes == 4);
  KJ_EXPECT(fileArray[5]->closed);
  KJ_EXPECT(fileArray[5]->data.size() == fileArray[4]->data.size());
  for (auto& error: encoder.getErrors()) {
    KJ_EXPECT(error == nullptr);
  }
}

}  // namespace
}  // namespace storage
}  // namespace granite
