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

#include "erasure-set.h"
#include "test-util.h"
#include <kj/test.h>

namespace granite {
namespace storage {
namespace {

kj::Array<kj::Own<Locker>> singleLocker(Locker& locker) {
  auto result = kj::heapArrayBuilder<kj::Own<Locker>>(1);
  result.add(kj::Own<Locker>(&locker, kj::NullDisposer::instance));
  return result.finish();
}

struct SetFixture {
  // One 4+2 erasure set over six local disks, locked by an in-process lock table.

  explicit SetFixture(kj::StringPtr name)
      : waitScope(loop), timer(kj::origin<kj::TimePoint>()), tmp(name),
        locker(kj::heapString("local"), timer, 60 * kj::SECONDS),
        locks(singleLocker(locker), timer, LockPolicy(), kj::heapString("test-node")) {
    initCrypto();
    auto disks = kj::heapArrayBuilder<kj::Own<Disk>>(6);
    for (uint i = 0; i < 6; i++) {
      auto path = tmp.subdir(kj::str("disk", i));
      disks.add(newTestDisk(path, i, 6));
      diskPaths.add(kj::mv(path));
    }
    set = kj::heap<ErasureSet>(0, disks.finish(), ErasureSetOptions(), locks, timer,
                               HealPolicy());
    set->makeBucket("bucket").wait(waitScope);
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  TestTempdir tmp;
  LocalLocker locker;
  NsLockMap locks;
  kj::Vector<kj::String> diskPaths;
  kj::Own<ErasureSet> set;

  FileInfo put(kj::StringPtr object, kj::ArrayPtr<const byte> data,
               PutOptions options = PutOptions()) {
    MemoryInputStream input(data);
    return set->putObject("bucket", object, input, data.size(), kj::mv(options))
        .wait(waitScope);
  }

  kj::Array<byte> get(kj::StringPtr object, kj::StringPtr versionId = nullptr,
                      int64_t offset = 0, int64_t length = -1) {
    MemoryOutputStream output;
    set->getObject("bucket", object, versionId, offset, length, output).wait(waitScope);
    return output.data.releaseAsArray();
  }

  void dropShards(uint disk, kj::StringPtr object, kj::StringPtr dataDir) {
    sandstorm::recursivelyDelete(kj::str(diskPaths[disk], "/bucket/", object, '/', dataDir));
  }

  void wipeDisk(uint disk) {
    sandstorm::recursivelyDelete(diskPaths[disk]);
  }

  void settle() {
    // Lets background cleanups run.
    for (uint i = 0; i < 20; i++) {
      kj::evalLater([]() {}).wait(waitScope);
    }
  }

  size_t stagingEntries(uint disk) {
    return sandstorm::listDirectory(kj::str(diskPaths[disk], '/', SYSTEM_VOLUME, '/', TMP_DIR))
        .size();
  }
};

PutOptions versioned() {
  PutOptions options;
  options.versioned = true;
  return options;
}

KJ_TEST("erasure set survives the loss of parity disks") {
  SetFixture env("erasure-set-loss-test");
  auto data = testData(10 << 20);

  auto fi = env.put("big", data);
  KJ_EXPECT(fi.size == data.size());
  KJ_EXPECT(!fi.isInline());
  KJ_EXPECT(fi.dataDir.size() > 0);
  KJ_EXPECT(env.get("big").asPtr() == data.asPtr());

  auto range = env.get("big", nullptr, 3000000, 5000);
  KJ_EXPECT(range.asPtr() == data.slice(3000000, 3005000));

  env.wipeDisk(0);
  env.wipeDisk(1);
  KJ_EXPECT(env.get("big").asPtr() == data.asPtr());
  KJ_EXPECT(env.set->getHealQueue().contains("bucket", "big", ""));

  // A third missing shard leaves only three of the four needed.
  env.dropShards(2, "big", fi.dataDir);
  KJ_EXPECT_THROW_MESSAGE("INSUFFICIENT_SHARDS", env.get("big"));
}

KJ_TEST("erasure set rolls back a write that misses its commit quorum") {
  SetFixture env("erasure-set-rollback-test");
  auto zeroth = testData(1 << 20, 1);
  auto first = testData(1 << 20, 2);
  auto second = testData(1 << 20, 3);

  env.put("obj", zeroth);
  env.put("obj", first);
  env.settle();
  KJ_EXPECT(env.get("obj").asPtr() == first.asPtr());
  for (uint i = 0; i < 6; i++) {
    // Only the trash directory is left.
    KJ_EXPECT(env.stagingEntries(i) == 1, i);
  }

  // Two disks lose the bucket, so four commits succeed where five are needed.
  sandstorm::recursivelyDelete(kj::str(env.diskPaths[4], "/bucket"));
  sandstorm::recursivelyDelete(kj::str(env.diskPaths[5], "/bucket"));
  KJ_EXPECT_THROW_MESSAGE("ERASURE_WRITE_QUORUM", env.put("obj", second));
  env.settle();
  KJ_EXPECT(env.get("obj").asPtr() == first.asPtr());

  KJ_EXPECT_THROW_MESSAGE("ERASURE_WRITE_QUORUM", env.put("fresh", second));
  env.settle();
  KJ_EXPECT_THROW_MESSAGE("NOT_FOUND", env.get("fresh"));

  for (uint i = 0; i < 6; i++) {
    KJ_EXPECT(env.stagingEntries(i) == 1, i);
  }
}

KJ_TEST("erasure set rejects bad requests") {
  SetFixture env("erasure-set-args-test");

  KJ_EXPECT_THROW_MESSAGE("INVALID_ARGUMENT", env.put("", testData(10)));
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", env.get("missing"));

  env.put("small", testData(100));
  KJ_EXPECT_THROW_MESSAGE("INVALID_ARGUMENT", env.get("small", nullptr, 50, 100));
  KJ_EXPECT(env.get("small", nullptr, 100, 0).size() == 0);
}

KJ_TEST("erasure set stores small objects inline") {
  SetFixture env("erasure-set-inline-test");
  auto data = testData(1000);

  auto fi = env.put("tiny", data);
  KJ_EXPECT(fi.dataDir.size() == 0);
  KJ_EXPECT(env.get("tiny").asPtr() == data.asPtr());
  KJ_EXPECT(env.get("tiny", nullptr, 10, 20).asPtr() == data.slice(10, 30));

  // Every disk holds the whole object.
  env.wipeDisk(0);
  env.wipeDisk(5);
  KJ_EXPECT(env.get("tiny").asPtr() == data.asPtr());

  auto empty = env.put("empty", nullptr);
  KJ_EXPECT(empty.size == 0);
  KJ_EXPECT(env.get("empty").size() == 0);
}

KJ_TEST("erasure set keeps object versions") {
  SetFixture env("erasure-set-version-test");
  auto& set = *env.set;
  auto& ws = env.waitScope;
  auto first = testData(1000, 1);
  auto second = testData(300000, 2);

  auto v1 = env.put("doc", first, versioned());
  auto v2 = env.put("doc", second, versioned());
  KJ_EXPECT(v1.versionId.size() > 0);
  KJ_EXPECT(v1.versionId != v2.versionId);

  auto versions = set.listObjectVersions("bucket", "doc").wait(ws);
  KJ_ASSERT(versions.size() == 2);
  KJ_EXPECT(versions[0].versionId == v2.versionId);
  KJ_EXPECT(versions[1].versionId == v1.versionId);

  KJ_EXPECT(env.get("doc").asPtr() == second.asPtr());
  KJ_EXPECT(env.get("doc", v1.versionId).asPtr() == first.asPtr());

  auto marker = set.deleteObject("bucket", "doc", nullptr, true).wait(ws);
  KJ_EXPECT(marker.deleted);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", set.getObjectInfo("bucket", "doc", nullptr).wait(ws));
  KJ_EXPECT_THROW_MESSAGE("METHOD_NOT_ALLOWED", env.get("doc", marker.versionId));
  KJ_EXPECT(env.get("doc", v1.versionId).asPtr() == first.asPtr());
  KJ_EXPECT(set.listObjectVersions("bucket", "doc").wait(ws).size() == 3);

  // Removing the marker brings the previous version back.
  set.deleteObject("bucket", "doc", marker.versionId, true).wait(ws);
  KJ_EXPECT(set.getObjectInfo("bucket", "doc", nullptr).wait(ws).versionId == v2.versionId);

  set.deleteObject("bucket", "doc", v2.versionId, true).wait(ws);
  KJ_EXPECT(env.get("doc").asPtr() == first.asPtr());

  // Unversioned writes replace the null version only.
  env.put("doc", second);
  env.put("doc", first);
  versions = set.listObjectVersions("bucket", "doc").wait(ws);
  KJ_ASSERT(versions.size() == 2);
  KJ_EXPECT(versions[0].versionId == "");
  KJ_EXPECT(env.get("doc").asPtr() == first.asPtr());
}

KJ_TEST("erasure set lists objects and buckets") {
  SetFixture env("erasure-set-list-test");
  auto& set = *env.set;
  auto& ws = env.waitScope;

  env.put("a/one", testData(10));
  env.put("a/two", testData(20));
  env.put("b", testData(30));
  env.put("c", testData(40));
  set.deleteObject("bucket", "c", nullptr, true).wait(ws);

  {
    auto result = set.listObjects("bucket", "", false).wait(ws);
    KJ_ASSERT(result.objects.size() == 1);
    KJ_EXPECT(result.objects[0].name == "b");
    KJ_EXPECT(result.objects[0].size == 30);
    KJ_ASSERT(result.prefixes.size() == 1);
    KJ_EXPECT(result.prefixes[0] == "a/");
  }

  {
    auto result = set.listObjects("bucket", "a/", true).wait(ws);
    KJ_ASSERT(result.objects.size() == 2);
    KJ_EXPECT(result.objects[0].name == "a/one");
    KJ_EXPECT(result.objects[1].name == "a/two");
  }

  {
    auto result = set.listObjects("bucket", "a/t", true).wait(ws);
    KJ_ASSERT(result.objects.size() == 1);
    KJ_EXPECT(result.objects[0].name == "a/two");
  }

  KJ_EXPECT(set.listObjects("bucket", "", true, 2).wait(ws).objects.size() == 2);

  set.makeBucket("other").wait(ws);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_EXISTS", set.makeBucket("other").wait(ws));
  auto buckets = set.listBuckets().wait(ws);
  KJ_ASSERT(buckets.size() == 2);
  KJ_EXPECT(buckets[0].name == "bucket");
  KJ_EXPECT(buckets[1].name == "other");
  KJ_EXPECT(set.getBucketInfo("other").wait(ws).name == "other");

  KJ_EXPECT_THROW_MESSAGE("NOT_EMPTY", set.deleteBucket("bucket", false).wait(ws));
  set.deleteBucket("other", false).wait(ws);
  KJ_EXPECT(set.listBuckets().wait(ws).size() == 1);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_FOUND", set.getBucketInfo("other").wait(ws));
}

KJ_TEST("erasure set updates user metadata") {
  SetFixture env("erasure-set-metadata-test");
  auto& set = *env.set;
  auto& ws = env.waitScope;

  PutOptions options;
  options.userDefined.insert(std::make_pair(kj::heapString("color"), kj::heapString("red")));
  env.put("thing", testData(500000), kj::mv(options));

  auto info = set.getObjectInfo("bucket", "thing", nullptr).wait(ws);
  KJ_ASSERT(info.metadata.size() == 1);
  KJ_EXPECT(info.metadata.begin()->second == "red");

  std::map<kj::String, kj::String> updated;
  updated.insert(std::make_pair(kj::heapString("color"), kj::heapString("blue")));
  updated.insert(std::make_pair(kj::heapString("shape"), kj::heapString("round")));
  set.putObjectMetadata("bucket", "thing", nullptr, kj::mv(updated)).wait(ws);

  info = set.getObjectInfo("bucket", "thing", nullptr).wait(ws);
  KJ_ASSERT(info.metadata.size() == 2);
  KJ_EXPECT(info.metadata.begin()->second == "blue");
  KJ_EXPECT(env.get("thing").asPtr() == testData(500000).asPtr());
}

KJ_TEST("erasure set heals lost shards and buckets") {
  SetFixture env("erasure-set-heal-test");
  auto& set = *env.set;
  auto& ws = env.waitScope;
  auto data = testData(3 << 20, 7);

  auto fi = env.put("heal-me", data);
  env.dropShards(0, "heal-me", fi.dataDir);
  env.dropShards(1, "heal-me", fi.dataDir);
  set.healObject("bucket", "heal-me", "").wait(ws);

  // Only the rebuilt shards are left to read from together with the untouched parity.
  env.dropShards(2, "heal-me", fi.dataDir);
  env.dropShards(3, "heal-me", fi.dataDir);
  KJ_EXPECT(env.get("heal-me").asPtr() == data.asPtr());

  set.makeBucket("spare").wait(ws);
  KJ_SYSCALL(rmdir(kj::str(env.diskPaths[4], "/spare").cStr()));
  KJ_EXPECT(set.healBucket("spare").wait(ws) == 1);
  KJ_EXPECT(set.healBucket("spare").wait(ws) == 0);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_FOUND", set.healBucket("nothing").wait(ws));
}

}  // namespace
}  // namespace storage
}  // namespace granite
