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


#include "file-meta.h"
#include <kj/test.h>
#include <string.h>

namespace granite {
namespace storage {
namespace {

FileInfo makeVersion(kj::StringPtr versionId, int64_t modTime, kj::StringPtr dataDir,
                     int64_t size = 100) {
  FileInfo fi;
  fi.versionId = kj::heapString(versionId);
  fi.modTime = modTime;
  fi.dataDir = kj::heapString(dataDir);
  fi.size = size;
  fi.erasure.dataBlocks = 4;
  fi.erasure.parityBlocks = 2;
  fi.erasure.blockSize = 1 << 20;
  fi.erasure.index = 3;
  fi.erasure.distribution = kj::heapArray<uint8_t>({3, 4, 5, 6, 1, 2});
  ChecksumInfo checksum;
  checksum.partNumber = 1;
  checksum.hash = kj::heapArray<byte>(32);
  memset(checksum.hash.begin(), 0xab, checksum.hash.size());
  fi.erasure.checksums.add(kj::mv(checksum));
  PartInfo part;
  part.number = 1;
  part.size = size;
  part.actualSize = size;
  fi.parts.add(kj::mv(part));
  return fi;
}

KJ_TEST("versions are kept newest first") {
  FileMeta meta;
  meta.addVersion(makeVersion("v1", 1000, "d1"));
  meta.addVersion(makeVersion("v3", 3000, "d3"));
  meta.addVersion(makeVersion("v2", 2000, "d2"));
  KJ_EXPECT(meta.size() == 3);

  auto latest = meta.findVersion("bucket", "obj", "", false);
  KJ_EXPECT(latest.versionId == "v3");
  KJ_EXPECT(latest.isLatest);
  KJ_EXPECT(latest.numVersions == 3);
  KJ_EXPECT(latest.volume == "bucket");
  KJ_EXPECT(latest.name == "obj");
  KJ_EXPECT(meta.findVersion("bucket", "obj", LATEST_VERSION, false).versionId == "v3");

  auto v2 = meta.findVersion("bucket", "obj", "v2", false);
  KJ_EXPECT(!v2.isLatest);
  KJ_EXPECT(v2.successorModTime == 3000);

  auto all = meta.listVersions("bucket", "obj");
  KJ_ASSERT(all.size() == 3);
  KJ_EXPECT(all[0].versionId == "v3");
  KJ_EXPECT(all[1].versionId == "v2");
  KJ_EXPECT(all[2].versionId == "v1");

  KJ_EXPECT_THROW_MESSAGE("FILE_VERSION_NOT_FOUND",
      meta.findVersion("bucket", "obj", "v9", false));
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", FileMeta().findVersion("bucket", "obj", "", false));
}

KJ_TEST("null version and replacement") {
  FileMeta meta;
  meta.addVersion(makeVersion("", 1000, "d1"));
  meta.addVersion(makeVersion("", 2000, "d2", 55));
  KJ_EXPECT(meta.size() == 1);

  auto fi = meta.findVersion("b", "o", NULL_VERSION, false);
  KJ_EXPECT(fi.size == 55);
  KJ_EXPECT(fi.dataDir == "d2");

  // "null" names the same version as the empty id.
  meta.addVersion(makeVersion(NULL_VERSION, 3000, "d3", 77));
  KJ_EXPECT(meta.size() == 1);
  auto replaced = meta.findVersion("b", "o", "", false);
  KJ_EXPECT(replaced.versionId == "");
  KJ_EXPECT(replaced.dataDir == "d3");
  KJ_EXPECT(KJ_ASSERT_NONNULL(meta.findById("")).size == 77);
}

KJ_TEST("delete markers and permanent deletes") {
  FileMeta meta;
  meta.addVersion(makeVersion("v1", 1000, "shared"));
  meta.addVersion(makeVersion("v2", 2000, "shared"));
  meta.addVersion(makeVersion("v3", 3000, "own"));

  FileInfo marker;
  marker.versionId = kj::str("m1");
  marker.modTime = 4000;
  marker.deleted = true;
  KJ_EXPECT(meta.deleteVersion(marker) == nullptr);
  KJ_EXPECT(meta.size() == 4);
  auto latest = meta.findVersion("b", "o", "", false);
  KJ_EXPECT(latest.deleted);
  KJ_EXPECT(latest.versionId == "m1");

  // Removing a version whose data directory is still used by another returns nothing to purge.
  KJ_EXPECT(meta.deleteVersion(makeVersion("v1", 1000, "shared")) == nullptr);

  KJ_IF_MAYBE(dataDir, meta.deleteVersion(makeVersion("v3", 3000, "own"))) {
    KJ_EXPECT(*dataDir == "own");
  } else {
    KJ_FAIL_EXPECT("expected the data directory of v3");
  }

  KJ_IF_MAYBE(dataDir, meta.deleteVersion(makeVersion("v2", 2000, "shared"))) {
    KJ_EXPECT(*dataDir == "shared");
  } else {
    KJ_FAIL_EXPECT("expected the data directory of v2");
  }

  KJ_EXPECT(meta.size() == 1);
  KJ_EXPECT_THROW_MESSAGE("FILE_VERSION_NOT_FOUND",
      meta.deleteVersion(makeVersion("v2", 2000, "shared")));
}

KJ_TEST("metadata updates replace user metadata") {
  FileMeta meta;
  auto fi = makeVersion("v1", 1000, "d1");
  fi.setMetadata("content-type", "text/plain");
  fi.setMetadata("x-tag", "a");
  meta.addVersion(fi.clone());

  auto update = makeVersion("v1", 1000, "d1");
  update.setMetadata("x-tag", "b");
  meta.updateVersion(update);

  auto result = meta.findVersion("b", "o", "v1", false);
  KJ_EXPECT(result.getMetadata("content-type") == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.getMetadata("x-tag")) == "b");
}

KJ_TEST("serialized chains") {
  FileMeta meta;
  auto inlined = makeVersion("v2", 2000, "");
  inlined.data = kj::heapArray<byte>({1, 2, 3});
  meta.addVersion(makeVersion("v1", 1000, "d1"));
  meta.addVersion(kj::mv(inlined));

  auto parsed = FileMeta::parse(meta.serialize());
  KJ_EXPECT(parsed.signature() == meta.signature());

  auto latest = parsed.findVersion("b", "o", "", true);
  KJ_EXPECT(latest.isInline());
  KJ_EXPECT(KJ_ASSERT_NONNULL(latest.data).asPtr() == kj::heapArray<byte>({1, 2, 3}).asPtr());
  KJ_EXPECT(latest.erasure.distribution.asPtr() ==
            kj::heapArray<uint8_t>({3, 4, 5, 6, 1, 2}).asPtr());
  KJ_ASSERT(latest.erasure.checksums.size() == 1);
  KJ_EXPECT(latest.erasure.checksums[0].hash.size() == 32);

  // Reading without data drops the payload but keeps the version.
  KJ_EXPECT(!parsed.findVersion("b", "o", "", false).isInline());

  auto withoutData = FileMeta::parse(meta.serialize(false));
  KJ_EXPECT(withoutData.size() == 2);
  KJ_EXPECT(!withoutData.findVersion("b", "o", "v2", true).isInline());

  // Another chain with the same versions has the same signature; a different one does not.
  FileMeta other;
  other.addVersion(makeVersion("v1", 1000, "d1"));
  KJ_EXPECT(other.signature() != meta.signature());

  auto bytes = meta.serialize();
  for (auto& b: bytes.slice(0, 16)) b = 0xff;
  KJ_EXPECT_THROW_MESSAGE("CORRUPT_SHARD", FileMeta::parse(bytes));
}

KJ_TEST("FileInfo comparison and encoding") {
  auto a = makeVersion("v1", 1000, "d1");
  auto b = FileInfo::decode(a.encode());
  KJ_EXPECT(a.sameVersion(b));
  KJ_EXPECT(b.parts.size() == 1);
  KJ_EXPECT(b.erasure.index == 3);

  b.erasure.distribution[0] = 1;
  KJ_EXPECT(!a.sameVersion(b));

  auto c = makeVersion("v1", 1001, "d1");
  KJ_EXPECT(!a.sameVersion(c));
}

}  // namespace
}  // namespace storage
}  // namespace granite
