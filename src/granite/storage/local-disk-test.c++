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


#include "local-disk.h"
#include "bitrot.h"
#include "test-util.h"
#include <kj/test.h>
#include <signal.h>
#include <sys/resource.h>

namespace granite {
namespace storage {
namespace {

struct DiskFixture {
  DiskFixture(kj::StringPtr name)
      : waitScope(loop), tmp(name), diskPath(tmp.subdir("disk")), disk(newTestDisk(diskPath)) {
    initCrypto();
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  TestTempdir tmp;
  kj::String diskPath;
  kj::Own<LocalDisk> disk;

  void writeFile(kj::StringPtr volume, kj::StringPtr path, kj::ArrayPtr<const byte> data) {
    auto file = disk->createFile(volume, path, data.size()).wait(waitScope);
    file->write(data).wait(waitScope);
    file->close().wait(waitScope);
  }
};

class CollectingSink final: public WalkSink {
public:
  kj::Vector<kj::String> names;

  kj::Promise<void> push(MetaCacheEntry&& entry) override {
    names.add(kj::mv(entry.name));
    return kj::READY_NOW;
  }
};

class CountingUsageSink final: public UsageSink {
public:
  uint updates = 0;
  void update(const DataUsage& usage) override { ++updates; }
};

FileInfo objectVersion(kj::StringPtr versionId, int64_t modTime, kj::StringPtr dataDir,
                       int64_t size) {
  FileInfo fi;
  fi.versionId = kj::heapString(versionId);
  fi.modTime = modTime;
  fi.dataDir = kj::heapString(dataDir);
  fi.size = size;
  fi.erasure.dataBlocks = 1;
  fi.erasure.parityBlocks = 0;
  fi.erasure.blockSize = 64;
  fi.erasure.index = 1;
  fi.erasure.distribution = kj::heapArray<uint8_t>({1});
  PartInfo part;
  part.number = 1;
  part.size = size;
  part.actualSize = size;
  fi.parts.add(kj::mv(part));
  return fi;
}

KJ_TEST("disk format is checked on open") {
  DiskFixture env("local-disk-format-test");
  auto id = env.disk->getDiskId().wait(env.waitScope);
  KJ_EXPECT(id.size() == 36);

  env.disk = nullptr;
  env.disk = newTestDisk(env.diskPath);
  KJ_EXPECT(env.disk->getDiskId().wait(env.waitScope) == id);

  KJ_EXPECT_THROW_MESSAGE("INCONSISTENT_DISK", newTestDisk(env.diskPath, 3, 4));
  KJ_EXPECT_THROW_MESSAGE("DISK_NOT_FOUND", newTestDisk(kj::str(env.tmp.path, "/missing")));

  auto info = env.disk->diskInfo(false).wait(env.waitScope);
  KJ_EXPECT(info.id == id);
  KJ_EXPECT(info.total > 0);
  KJ_EXPECT(info.mountPath == env.diskPath);
  KJ_EXPECT(!info.healing);
}

KJ_TEST("volumes") {
  DiskFixture env("local-disk-volume-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;

  disk.makeVolume("alpha").wait(ws);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_EXISTS", disk.makeVolume("alpha").wait(ws));
  KJ_EXPECT_THROW_MESSAGE("VOLUME_EXISTS", disk.makeVolume(SYSTEM_VOLUME).wait(ws));

  kj::StringPtr more[] = { "alpha", "beta" };
  disk.makeVolumes(more).wait(ws);

  auto volumes = disk.listVolumes().wait(ws);
  KJ_ASSERT(volumes.size() == 2);
  KJ_EXPECT(volumes[0].name == "alpha");
  KJ_EXPECT(volumes[1].name == "beta");
  KJ_EXPECT(volumes[0].created > 0);

  KJ_EXPECT(disk.statVolume("beta").wait(ws).name == "beta");
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_FOUND", disk.statVolume("gamma").wait(ws));

  disk.writeAll("beta", "x/y", kj::StringPtr("hello").asBytes()).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_EMPTY", disk.deleteVolume("beta", false).wait(ws));
  disk.deleteVolume("beta", true).wait(ws);
  disk.deleteVolume("alpha", false).wait(ws);
  KJ_EXPECT(disk.listVolumes().wait(ws).size() == 0);
  KJ_EXPECT_THROW_MESSAGE("METHOD_NOT_ALLOWED", disk.deleteVolume(SYSTEM_VOLUME, true).wait(ws));
}

KJ_TEST("files") {
  DiskFixture env("local-disk-file-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;
  disk.makeVolume("bucket").wait(ws);

  auto data = testData(1000);
  disk.writeAll("bucket", "a/b/c", data).wait(ws);
  KJ_EXPECT(disk.readAll("bucket", "a/b/c").wait(ws).asPtr() == data.asPtr());
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", disk.readAll("bucket", "a/b/d").wait(ws));
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_FOUND", disk.readAll("nope", "a/b/c").wait(ws));
  KJ_EXPECT_THROW_MESSAGE("IS_NOT_REGULAR", disk.readAll("bucket", "a/b").wait(ws));

  auto listing = disk.listDir("bucket", "a", -1).wait(ws);
  KJ_ASSERT(listing.size() == 1);
  KJ_EXPECT(listing[0] == "b/");

  // Ranged reads.
  {
    auto reader = disk.readFileStream("bucket", "a/b/c", 100, 50).wait(ws);
    auto buffer = kj::heapArray<byte>(80);
    KJ_EXPECT(reader->read(buffer).wait(ws) == 50);
    KJ_EXPECT(buffer.slice(0, 50) == data.slice(100, 150));
    KJ_EXPECT(reader->read(buffer).wait(ws) == 0);
  }
  KJ_EXPECT_THROW_MESSAGE("LESS_DATA", disk.readFileStream("bucket", "a/b/c", 990, 20).wait(ws));

  // Writers created with a known size enforce it.
  {
    auto file = disk.createFile("bucket", "sized", 10).wait(ws);
    KJ_EXPECT_THROW_MESSAGE("MORE_DATA", file->write(data.slice(0, 11)).wait(ws));
    file->write(data.slice(0, 4)).wait(ws);
    KJ_EXPECT_THROW_MESSAGE("LESS_DATA", file->close().wait(ws));
  }

  // Appends.
  {
    auto file = disk.appendFile("bucket", "a/b/c").wait(ws);
    file->write(data.slice(0, 10)).wait(ws);
    file->close().wait(ws);
    KJ_EXPECT(disk.readAll("bucket", "a/b/c").wait(ws).size() == 1010);
  }

  disk.renameFile("bucket", "a/b/c", "bucket", "moved/c").wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", disk.readAll("bucket", "a/b/c").wait(ws));
  // The emptied parents went away with it.
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", disk.listDir("bucket", "a", -1).wait(ws));

  disk.renamePart("bucket", "moved/c", "bucket", "parts/part.1",
                  kj::StringPtr("meta").asBytes()).wait(ws);
  {
    auto meta = disk.readAll("bucket", "parts/part.1.meta").wait(ws);
    KJ_EXPECT(kj::heapString(reinterpret_cast<const char*>(meta.begin()), meta.size()) == "meta");
  }

  DeleteOptions options;
  disk.deleteFile("bucket", "parts/part.1", options).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND",
      disk.deleteFile("bucket", "parts/part.1", options).wait(ws));

  kj::StringPtr paths[] = { "parts/part.1.meta", "never/existed" };
  disk.deletePaths("bucket", paths).wait(ws);
  KJ_EXPECT(disk.listDir("bucket", "", -1).wait(ws).size() == 1);  // "sized"
}

KJ_TEST("metadata and renameData") {
  DiskFixture env("local-disk-meta-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;
  disk.makeVolume("bucket").wait(ws);

  // Stage a version the way the object layer does, then commit it.
  auto payload = testData(100);
  auto stage = [&](kj::StringPtr tmpPath, kj::StringPtr dataDir) {
    auto file = disk.createFile(SYSTEM_VOLUME, kj::str(tmpPath, '/', dataDir, "/part.1"), -1)
        .wait(ws);
    BitrotWriter writer(kj::mv(file), BitrotAlgorithm::BLAKE2B256, 64);
    writer.write(payload.slice(0, 64)).wait(ws);
    writer.write(payload.slice(64, 100)).wait(ws);
    writer.close().wait(ws);
  };

  stage("tmp/t1", "dd1");
  auto v1 = objectVersion("", 1000, "dd1", 100);
  KJ_EXPECT(disk.renameData(SYSTEM_VOLUME, "tmp/t1", v1, "bucket", "dir/obj").wait(ws) ==
            nullptr);

  auto read = disk.readVersion("bucket", "dir/obj", "", ReadOptions()).wait(ws);
  KJ_EXPECT(read.sameVersion(v1));
  KJ_EXPECT(read.isLatest);

  auto checks = disk.checkParts("bucket", "dir/obj", read).wait(ws);
  KJ_ASSERT(checks.size() == 1);
  KJ_EXPECT(checks[0] == CHECK_PART_SUCCESS);
  KJ_EXPECT(disk.verifyFile("bucket", "dir/obj", read).wait(ws)[0] == CHECK_PART_SUCCESS);
  KJ_EXPECT(disk.checkParts("nope", "dir/obj", read).wait(ws)[0] ==
            CHECK_PART_VOLUME_NOT_FOUND);

  // Overwriting the null version hands back the replaced data directory.
  stage("tmp/t2", "dd2");
  auto v2 = objectVersion("", 2000, "dd2", 100);
  KJ_IF_MAYBE(old, disk.renameData(SYSTEM_VOLUME, "tmp/t2", v2, "bucket", "dir/obj").wait(ws)) {
    KJ_EXPECT(*old == "dd1");
  } else {
    KJ_FAIL_EXPECT("replaced data directory not reported");
  }
  KJ_EXPECT(disk.checkParts("bucket", "dir/obj", v1).wait(ws)[0] == CHECK_PART_FILE_NOT_FOUND);

  // Inline versions carry their data in the metadata.
  auto inlined = objectVersion("v3", 3000, "", 3);
  inlined.data = kj::heapArray<byte>({7, 8, 9});
  disk.writeMetadata("bucket", "dir/obj", inlined).wait(ws);
  ReadOptions withData;
  withData.readData = true;
  auto latest = disk.readVersion("bucket", "dir/obj", "", withData).wait(ws);
  KJ_EXPECT(latest.versionId == "v3");
  KJ_EXPECT(latest.numVersions == 2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(latest.data).size() == 3);
  KJ_EXPECT(!disk.readVersion("bucket", "dir/obj", "", ReadOptions()).wait(ws).isInline());

  auto raw = disk.readXl("bucket", "dir/obj", false).wait(ws);
  KJ_EXPECT(FileMeta::parse(raw).size() == 2);

  // Tags.
  auto tagged = objectVersion("v3", 3000, "", 3);
  tagged.setMetadata("x-tag", "blue");
  disk.updateMetadata("bucket", "dir/obj", tagged, UpdateMetadataOptions()).wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(
      disk.readVersion("bucket", "dir/obj", "v3", ReadOptions()).wait(ws)
          .getMetadata("x-tag")) == "blue");

  // Delete marker, then permanent delete of every version.
  FileInfo marker;
  marker.versionId = kj::str("m4");
  marker.modTime = 4000;
  marker.deleted = true;
  disk.deleteVersion("bucket", "dir/obj", marker, false, DeleteOptions()).wait(ws);
  KJ_EXPECT(disk.readVersion("bucket", "dir/obj", "", ReadOptions()).wait(ws).deleted);

  for (auto id: { "m4", "v3", "null" }) {
    FileInfo fi;
    fi.versionId = kj::heapString(id);
    disk.deleteVersion("bucket", "dir/obj", fi, false, DeleteOptions()).wait(ws);
  }
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND",
      disk.readVersion("bucket", "dir/obj", "", ReadOptions()).wait(ws));
  KJ_EXPECT(disk.listDir("bucket", "", -1).wait(ws).size() == 0);
}

void stageVersion(DiskFixture& env, kj::StringPtr tmpPath, kj::StringPtr dataDir,
                  kj::ArrayPtr<const byte> payload) {
  auto file = env.disk->createFile(SYSTEM_VOLUME, kj::str(tmpPath, '/', dataDir, "/part.1"), -1)
      .wait(env.waitScope);
  BitrotWriter writer(kj::mv(file), BitrotAlgorithm::BLAKE2B256, 64);
  for (size_t pos = 0; pos < payload.size(); pos += 64) {
    writer.write(payload.slice(pos, kj::min(pos + 64, payload.size()))).wait(env.waitScope);
  }
  writer.close().wait(env.waitScope);
}

KJ_TEST("renameData can be undone") {
  DiskFixture env("local-disk-undo-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;
  disk.makeVolume("bucket").wait(ws);
  auto payload = testData(100);

  stageVersion(env, "tmp/u1", "dd1", payload);
  auto v1 = objectVersion("", 1000, "dd1", 100);
  KJ_EXPECT(disk.renameData(SYSTEM_VOLUME, "tmp/u1", v1, "bucket", "obj").wait(ws) == nullptr);

  stageVersion(env, "tmp/u2", "dd2", payload);
  auto v2 = objectVersion("", 2000, "dd2", 100);
  auto old = disk.renameData(SYSTEM_VOLUME, "tmp/u2", v2, "bucket", "obj").wait(ws);
  KJ_EXPECT(KJ_ASSERT_NONNULL(old) == "dd1");
  KJ_EXPECT(disk.readVersion("bucket", "obj", "", ReadOptions()).wait(ws).dataDir == "dd2");

  DeleteOptions undo;
  undo.undoWrite = true;
  undo.oldDataDir = kj::str("dd1");
  undo.stagingPath = kj::str("tmp/u2");
  disk.deleteVersion("bucket", "obj", v2, false, undo).wait(ws);

  auto restored = disk.readVersion("bucket", "obj", "", ReadOptions()).wait(ws);
  KJ_EXPECT(restored.sameVersion(v1));
  KJ_EXPECT(disk.checkParts("bucket", "obj", restored).wait(ws)[0] == CHECK_PART_SUCCESS);
  KJ_EXPECT(disk.checkParts("bucket", "obj", v2).wait(ws)[0] == CHECK_PART_FILE_NOT_FOUND);

  // Undoing the commit that created an object removes the object.
  stageVersion(env, "tmp/u3", "dd3", payload);
  auto v3 = objectVersion("", 3000, "dd3", 100);
  KJ_EXPECT(disk.renameData(SYSTEM_VOLUME, "tmp/u3", v3, "bucket", "fresh").wait(ws) == nullptr);
  DeleteOptions undoFresh;
  undoFresh.undoWrite = true;
  undoFresh.stagingPath = kj::str("tmp/u3");
  disk.deleteVersion("bucket", "fresh", v3, false, undoFresh).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND",
      disk.readVersion("bucket", "fresh", "", ReadOptions()).wait(ws));
}

KJ_TEST("failed atomic writes leave no temporary file") {
  DiskFixture env("local-disk-atomic-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;
  disk.makeVolume("bucket").wait(ws);

  auto tmpDir = kj::str(env.diskPath, '/', SYSTEM_VOLUME, '/', TMP_DIR);
  auto before = sandstorm::listDirectory(tmpDir).size();

  // Writes past RLIMIT_FSIZE fail with EFBIG instead of raising SIGXFSZ.
  signal(SIGXFSZ, SIG_IGN);
  struct rlimit saved;
  KJ_SYSCALL(getrlimit(RLIMIT_FSIZE, &saved));
  struct rlimit limited = saved;
  limited.rlim_cur = 4096;
  KJ_SYSCALL(setrlimit(RLIMIT_FSIZE, &limited));

  bool failed = disk.writeAll("bucket", "big", testData(16384))
      .then([]() { return false; }, [](kj::Exception&&) { return true; }).wait(ws);
  KJ_SYSCALL(setrlimit(RLIMIT_FSIZE, &saved));

  KJ_EXPECT(failed);
  KJ_EXPECT(sandstorm::listDirectory(tmpDir).size() == before);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", disk.readAll("bucket", "big").wait(ws));
}

KJ_TEST("walkDir and usage") {
  DiskFixture env("local-disk-walk-test");
  auto& disk = *env.disk;
  auto& ws = env.waitScope;
  disk.makeVolume("bucket").wait(ws);

  for (auto name: { "a", "b/c", "b/d", "b/e/f", "g" }) {
    disk.writeMetadata("bucket", name, objectVersion("", 1000, "", 10)).wait(ws);
  }

  {
    CollectingSink sink;
    WalkDirOptions options;
    options.bucket = kj::str("bucket");
    options.recursive = true;
    disk.walkDir(options, sink).wait(ws);
    KJ_ASSERT(sink.names.size() == 5);
    KJ_EXPECT(sink.names[0] == "a");
    KJ_EXPECT(sink.names[1] == "b/c");
    KJ_EXPECT(sink.names[3] == "b/e/f");
    KJ_EXPECT(sink.names[4] == "g");
  }

  {
    CollectingSink sink;
    WalkDirOptions options;
    options.bucket = kj::str("bucket");
    disk.walkDir(options, sink).wait(ws);
    KJ_ASSERT(sink.names.size() == 3);
    KJ_EXPECT(sink.names[1] == "b/");
  }

  {
    CollectingSink sink;
    WalkDirOptions options;
    options.bucket = kj::str("bucket");
    options.baseDir = kj::str("b/");
    options.recursive = true;
    options.forwardTo = kj::str("b/d");
    options.limit = 1;
    disk.walkDir(options, sink).wait(ws);
    KJ_ASSERT(sink.names.size() == 1);
    KJ_EXPECT(sink.names[0] == "b/d");
  }

  {
    CollectingSink sink;
    WalkDirOptions options;
    options.bucket = kj::str("bucket");
    options.baseDir = kj::str("zzz/");
    options.reportNotFound = true;
    KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", disk.walkDir(options, sink).wait(ws));
  }

  CountingUsageSink updates;
  auto usage = disk.nsScanner(DataUsage(), updates).wait(ws);
  KJ_EXPECT(updates.updates == 1);
  auto& bucket = KJ_ASSERT_NONNULL(usage.find("bucket"));
  KJ_EXPECT(bucket.objects == 5);
  KJ_EXPECT(bucket.size == 50);

  ReadMultipleRequest request;
  request.bucket = kj::str("bucket");
  request.prefix = kj::str("b");
  auto files = kj::heapArrayBuilder<kj::String>(3);
  files.add(kj::str("c"));
  files.add(kj::str("missing"));
  files.add(kj::str("d"));
  request.files = files.finish();
  request.metadataOnly = true;
  auto results = disk.readMultiple(request).wait(ws);
  KJ_ASSERT(results.size() == 3);
  KJ_EXPECT(results[0].exists);
  KJ_EXPECT(FileMeta::parse(results[0].data).size() == 1);
  KJ_EXPECT(!results[1].exists);

  request.abortOn404 = true;
  KJ_EXPECT(disk.readMultiple(request).wait(ws).size() == 2);
}

}  // namespace
}  // namespace storage
}  // namespace granite
