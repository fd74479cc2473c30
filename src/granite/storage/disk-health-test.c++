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


#include "disk-health.h"
#include <kj/debug.h>
#include <kj/test.h>

namespace granite {
namespace storage {
namespace {

class ScriptedDisk final: public Disk {
  // Answers diskInfo() and statVolume() with `failure` if set, and with success otherwise.
  // Nothing else is scripted.

public:
  kj::Maybe<ErrorCode> failure;
  uint calls = 0;

  kj::StringPtr getEndpoint() override { return "127.0.0.1:9000/scripted"; }
  bool isLocal() override { return false; }
  bool isOnline() override { return true; }

  kj::Promise<kj::String> getDiskId() override { return unscripted(); }

  kj::Promise<DiskInfo> diskInfo(bool metrics) override {
    ++calls;
    KJ_IF_MAYBE(code, failure) {
      return makeError(*code, __FILE__, __LINE__, kj::str("scripted"));
    }
    DiskInfo info;
    info.endpoint = kj::heapString(getEndpoint());
    return kj::mv(info);
  }

  kj::Promise<void> makeVolume(kj::StringPtr volume) override { return unscripted(); }
  kj::Promise<void> makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) override {
    return unscripted();
  }
  kj::Promise<kj::Array<VolumeInfo>> listVolumes() override { return unscripted(); }

  kj::Promise<VolumeInfo> statVolume(kj::StringPtr volume) override {
    ++calls;
    KJ_IF_MAYBE(code, failure) {
      return makeError(*code, __FILE__, __LINE__, kj::str("scripted"));
    }
    VolumeInfo info;
    info.name = kj::heapString(volume);
    return kj::mv(info);
  }

  kj::Promise<void> deleteVolume(kj::StringPtr volume, bool force) override {
    return unscripted();
  }
  kj::Promise<kj::Array<kj::String>> listDir(
      kj::StringPtr volume, kj::StringPtr dirPath, int count) override {
    return unscripted();
  }
  kj::Promise<void> walkDir(const WalkDirOptions& options, WalkSink& sink) override {
    return unscripted();
  }
  kj::Promise<kj::Array<byte>> readAll(kj::StringPtr volume, kj::StringPtr path) override {
    return unscripted();
  }
  kj::Promise<void> writeAll(kj::StringPtr volume, kj::StringPtr path,
                             kj::ArrayPtr<const byte> data) override {
    return unscripted();
  }
  kj::Promise<kj::Own<FileWriter>> createFile(
      kj::StringPtr volume, kj::StringPtr path, int64_t size) override {
    return unscripted();
  }
  kj::Promise<kj::Own<FileWriter>> appendFile(kj::StringPtr volume,
                                              kj::StringPtr path) override {
    return unscripted();
  }
  kj::Promise<kj::Own<FileReader>> readFileStream(
      kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) override {
    return unscripted();
  }
  kj::Promise<void> renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath) override {
    return unscripted();
  }
  kj::Promise<void> renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath,
                               kj::ArrayPtr<const byte> meta) override {
    return unscripted();
  }
  kj::Promise<void> deleteFile(kj::StringPtr volume, kj::StringPtr path,
                               const DeleteOptions& options) override {
    return unscripted();
  }
  kj::Promise<void> deletePaths(kj::StringPtr volume,
                                kj::ArrayPtr<const kj::StringPtr> paths) override {
    return unscripted();
  }
  kj::Promise<kj::Array<uint32_t>> verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                              const FileInfo& fi) override {
    return unscripted();
  }
  kj::Promise<kj::Array<uint32_t>> checkParts(kj::StringPtr volume, kj::StringPtr path,
                                              const FileInfo& fi) override {
    return unscripted();
  }
  kj::Promise<void> writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                  const FileInfo& fi) override {
    return unscripted();
  }
  kj::Promise<void> updateMetadata(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                                   const UpdateMetadataOptions& options) override {
    return unscripted();
  }
  kj::Promise<FileInfo> readVersion(kj::StringPtr volume, kj::StringPtr path,
                                    kj::StringPtr versionId,
                                    const ReadOptions& options) override {
    return unscripted();
  }
  kj::Promise<kj::Array<byte>> readXl(kj::StringPtr volume, kj::StringPtr path,
                                      bool readData) override {
    return unscripted();
  }
  kj::Promise<kj::Maybe<kj::String>> renameData(
      kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
      kj::StringPtr dstVolume, kj::StringPtr dstPath) override {
    return unscripted();
  }
  kj::Promise<void> deleteVersion(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                                  bool forceDelMarker, const DeleteOptions& options) override {
    return unscripted();
  }
  kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> deleteVersions(
      kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
      const DeleteOptions& options) override {
    return unscripted();
  }
  kj::Promise<kj::Array<ReadMultipleResult>> readMultiple(
      const ReadMultipleRequest& request) override {
    return unscripted();
  }
  kj::Promise<DataUsage> nsScanner(DataUsage&& cache, UsageSink& updates) override {
    return unscripted();
  }

private:
  static kj::Exception unscripted() {
    return KJ_EXCEPTION(UNIMPLEMENTED, "not scripted");
  }
};

struct HealthFixture {
  HealthFixture()
      : waitScope(loop), timer(kj::origin<kj::TimePoint>()) {
    auto scripted = kj::heap<ScriptedDisk>();
    inner = scripted.get();
    HealthPolicy policy;
    policy.maxTransientFailures = 3;
    policy.failureWindow = 30 * kj::SECONDS;
    policy.checkInterval = 5 * kj::SECONDS;
    disk = kj::heap<HealthCheckedDisk>(kj::mv(scripted), timer, policy);
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  ScriptedDisk* inner;
  kj::Own<HealthCheckedDisk> disk;

  void advance(kj::Duration delay) {
    timer.advanceTo(timer.now() + delay);
    for (uint i = 0; i < 10; i++) {
      kj::evalLater([]() {}).wait(waitScope);
    }
  }

  void failOnce() {
    KJ_EXPECT_THROW_MESSAGE("scripted", disk->statVolume("bucket").wait(waitScope));
  }
};

KJ_TEST("a disk whose node stopped answering goes offline and comes back") {
  HealthFixture env;
  auto& ws = env.waitScope;

  // A remote disk that ran out of retries reports DISK_OFFLINE.
  env.inner->failure = ErrorCode::DISK_OFFLINE;
  for (uint i = 0; i < 3; i++) {
    KJ_EXPECT(env.disk->isOnline(), i);
    KJ_EXPECT_THROW_MESSAGE("DISK_OFFLINE", env.disk->statVolume("bucket").wait(ws));
  }
  KJ_EXPECT(!env.disk->isOnline());
  KJ_EXPECT(env.inner->calls == 3);

  // Calls fail fast while offline.
  KJ_EXPECT_THROW_MESSAGE("DISK_OFFLINE", env.disk->statVolume("bucket").wait(ws));
  KJ_EXPECT(env.inner->calls == 3);

  // A health check that still fails keeps the disk offline.
  env.advance(5 * kj::SECONDS);
  KJ_EXPECT(env.inner->calls == 4);
  KJ_EXPECT(!env.disk->isOnline());

  env.inner->failure = nullptr;
  env.advance(5 * kj::SECONDS);
  KJ_EXPECT(env.inner->calls == 5);
  KJ_EXPECT(env.disk->isOnline());
  KJ_EXPECT(env.disk->statVolume("bucket").wait(ws).name == "bucket");
}

KJ_TEST("transient and faulty errors count toward going offline") {
  HealthFixture env;
  env.inner->failure = ErrorCode::TRANSIENT_DISK_ERROR;
  env.failOnce();
  env.failOnce();
  env.inner->failure = ErrorCode::FAULTY_DISK;
  env.failOnce();
  KJ_EXPECT(!env.disk->isOnline());
}

KJ_TEST("failures that say nothing about the disk are not counted") {
  HealthFixture env;
  auto& ws = env.waitScope;

  env.inner->failure = ErrorCode::VOLUME_NOT_FOUND;
  for (uint i = 0; i < 5; i++) {
    env.failOnce();
  }
  KJ_EXPECT(env.disk->isOnline());

  // A success clears the count.
  env.inner->failure = ErrorCode::TRANSIENT_DISK_ERROR;
  env.failOnce();
  env.failOnce();
  env.inner->failure = nullptr;
  env.disk->statVolume("bucket").wait(ws);
  env.inner->failure = ErrorCode::TRANSIENT_DISK_ERROR;
  env.failOnce();
  env.failOnce();
  KJ_EXPECT(env.disk->isOnline());

  // So do failures that fell out of the window.
  env.advance(31 * kj::SECONDS);
  env.failOnce();
  env.failOnce();
  KJ_EXPECT(env.disk->isOnline());
  env.failOnce();
  KJ_EXPECT(!env.disk->isOnline());
}

}  // namespace
}  // namespace storage
}  // namespace granite
