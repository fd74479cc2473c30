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

#include "metadata-store.h"
#include "test-util.h"
#include <kj/test.h>

namespace granite {
namespace storage {
namespace {

FileInfo version(kj::StringPtr versionId, int64_t modTime) {
  FileInfo fi;
  fi.versionId = kj::heapString(versionId);
  fi.modTime = modTime;
  fi.size = 10;
  fi.erasure.dataBlocks = 2;
  fi.erasure.parityBlocks = 2;
  fi.erasure.blockSize = 1 << 20;
  fi.erasure.distribution = kj::heapArray<uint8_t>({1, 2, 3, 4});
  fi.fresh = true;
  return fi;
}

struct StoreFixture {
  // A 2+2 layout: two agreeing disks are a read quorum.

  explicit StoreFixture(kj::StringPtr name)
      : waitScope(loop), tmp(name) {
    auto builder = kj::heapArrayBuilder<kj::Own<Disk>>(4);
    for (uint i = 0; i < 4; i++) {
      auto disk = newTestDisk(tmp.subdir(kj::str("disk", i)), i, 4);
      disk->makeVolume("bucket").wait(waitScope);
      builder.add(kj::mv(disk));
    }
    disks = builder.finish();
    store = kj::heap<MetadataStore>(disks, 2, 3,
        [](kj::StringPtr, kj::StringPtr, kj::StringPtr) {});
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  TestTempdir tmp;
  kj::Array<kj::Own<Disk>> disks;
  kj::Own<MetadataStore> store;

  void write(uint disk, const FileInfo& fi) {
    disks[disk]->writeMetadata("bucket", "obj", copyForDisk(fi, disk)).wait(waitScope);
  }
};

KJ_TEST("the version most disks agree on wins") {
  StoreFixture env("metadata-store-majority-test");
  auto older = version("v1", 1000);
  auto newer = version("v2", 2000);
  env.write(0, older);
  env.write(1, older);
  env.write(2, older);
  env.write(3, newer);

  auto resolved = env.store->getVersion("bucket", "obj", nullptr, false).wait(env.waitScope);
  KJ_EXPECT(resolved.info.versionId == "v1");
  KJ_EXPECT(resolved.currentCount() == 3);
  KJ_EXPECT(!resolved.current[3]);
}

KJ_TEST("two versions that both have a quorum are a mismatch") {
  StoreFixture env("metadata-store-split-test");
  auto older = version("v1", 1000);
  auto newer = version("v2", 2000);
  env.write(0, older);
  env.write(1, older);
  env.write(2, newer);
  env.write(3, newer);

  // Being newer does not settle it.
  KJ_EXPECT_THROW_MESSAGE("(METADATA_QUORUM_MISMATCH): bucket/obj: versions",
      env.store->getVersion("bucket", "obj", nullptr, false).wait(env.waitScope));
  KJ_EXPECT_THROW_MESSAGE("both have 2 disks",
      env.store->getVersion("bucket", "obj", nullptr, false).wait(env.waitScope));

  // Asking for a version by id only involves the disks that have it.
  auto resolved = env.store->getVersion("bucket", "obj", "v2", false).wait(env.waitScope);
  KJ_EXPECT(resolved.currentCount() == 2);
}

KJ_TEST("findQuorumVersion counts each version once") {
  auto copies = kj::heapArrayBuilder<kj::Maybe<FileInfo>>(5);
  copies.add(version("a", 1));
  copies.add(nullptr);
  copies.add(version("b", 2));
  copies.add(version("a", 1));
  copies.add(version("a", 1));
  auto array = copies.finish();

  KJ_EXPECT(KJ_ASSERT_NONNULL(findQuorumVersion(array, 3, "bucket", "obj")) == 0);
  KJ_EXPECT(findQuorumVersion(array, 4, "bucket", "obj") == nullptr);
  KJ_EXPECT_THROW_MESSAGE("METADATA_QUORUM_MISMATCH",
      findQuorumVersion(array, 1, "bucket", "obj"));
}

}  // namespace
}  // namespace storage
}  // namespace granite
