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

#ifndef GRANITE_STORAGE_DISK_HEALTH_H_
#define GRANITE_STORAGE_DISK_HEALTH_H_

#include "disk.h"
#include <granite/config.capnp.h>
#include <kj/timer.h>

namespace granite {
namespace storage {

struct HealthPolicy {
  kj::Duration callTimeout = 30 * kj::SECONDS;
  uint maxTransientFailures = 3;
  kj::Duration failureWindow = 30 * kj::SECONDS;
  kj::Duration checkInterval = 5 * kj::SECONDS;

  static HealthPolicy fromConfig(DiskHealthConfig::Reader config);
};

class HealthCheckedDisk final: public Disk, private kj::TaskSet::ErrorHandler {
  // Wraps a disk, timing out its calls and counting transient failures. Once
  // `maxTransientFailures` of them fall within `failureWindow` the disk goes offline: every call
  // fails immediately with DISK_OFFLINE and the disk is left out of quorums. A health check calls
  // diskInfo() every `checkInterval` and puts the disk back online when it succeeds.
  //
  // Streams opened through this disk are timed out and counted too. Walks and namespace scans
  // are counted but not timed out, since they run as long as the disk has entries.

public:
  HealthCheckedDisk(kj::Own<Disk> inner, kj::Timer& timer, HealthPolicy policy);
  ~HealthCheckedDisk() noexcept(false);

  Disk& getInner() { return *inner; }

  kj::StringPtr getEndpoint() override { return inner->getEndpoint(); }
  bool isLocal() override { return inner->isLocal(); }
  bool isOnline() override { return online; }
  kj::Promise<kj::String> getDiskId() override;
  kj::Promise<DiskInfo> diskInfo(bool metrics) override;

  kj::Promise<void> makeVolume(kj::StringPtr volume) override;
  kj::Promise<void> makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) override;
  kj::Promise<kj::Array<VolumeInfo>> listVolumes() override;
  kj::Promise<VolumeInfo> statVolume(kj::StringPtr volume) override;
  kj::Promise<void> deleteVolume(kj::StringPtr volume, bool force) override;

  kj::Promise<kj::Array<kj::String>> listDir(
      kj::StringPtr volume, kj::StringPtr dirPath, int count) override;
  kj::Promise<void> walkDir(const WalkDirOptions& options, WalkSink& sink) override;
  kj::Promise<kj::Array<byte>> readAll(kj::StringPtr volume, kj::StringPtr path) override;
  kj::Promise<void> writeAll(kj::StringPtr volume, kj::StringPtr path,
                             kj::ArrayPtr<const byte> data) override;
  kj::Promise<kj::Own<FileWriter>> createFile(
      kj::StringPtr volume, kj::StringPtr path, int64_t size) override;
  kj::Promise<kj::Own<FileWriter>> appendFile(kj::StringPtr volume, kj::StringPtr path) override;
  kj::Promise<kj::Own<FileReader>> readFileStream(
      kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) override;
  kj::Promise<void> renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath) override;
  kj::Promise<void> renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath,
                               kj::ArrayPtr<const byte> meta) override;
  kj::Promise<void> deleteFile(kj::StringPtr volume, kj::StringPtr path,
                               const DeleteOptions& options) override;
  kj::Promise<void> deletePaths(kj::StringPtr volume,
                                kj::ArrayPtr<const kj::StringPtr> paths) override;
  kj::Promise<kj::Array<uint32_t>> verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                              const FileInfo& fi) override;
  kj::Promise<kj::Array<uint32_t>> checkParts(kj::StringPtr volume, kj::StringPtr path,
                                              const FileInfo& fi) override;

  kj::Promise<void> writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                  const FileInfo& fi) override;
  kj::Promise<void> updateMetadata(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                                   const UpdateMetadataOptions& options) override;
  kj::Promise<FileInfo> readVersion(kj::StringPtr volume, kj::StringPtr path,
                                    kj::StringPtr versionId,
                                    const ReadOptions& options) override;
  kj::Promise<kj::Array<byte>> readXl(kj::StringPtr volume, kj::StringPtr path,
                                      bool readData) override;
  kj::Promise<kj::Maybe<kj::String>> renameData(
      kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
      kj::StringPtr dstVolume, kj::StringPtr dstPath) override;
  kj::Promise<void> deleteVersion(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                                  bool forceDelMarker, const DeleteOptions& options) override;
  kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> deleteVersions(
      kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
      const DeleteOptions& options) override;
  kj::Promise<kj::Array<ReadMultipleResult>> readMultiple(
      const ReadMultipleRequest& request) override;
  kj::Promise<DataUsage> nsScanner(DataUsage&& cache, UsageSink& updates) override;

private:
  class TrackedWriter;
  class TrackedReader;
  template <typename T> friend struct Tracker;

  kj::Own<Disk> inner;
  kj::Timer& timer;
  HealthPolicy policy;
  bool online = true;
  kj::Vector<kj::TimePoint> recentFailures;
  kj::TaskSet tasks;

  template <typename Func>
  auto call(Func&& func) -> decltype(func());
  // Runs func() unless the disk is offline, with the call timeout applied.

  template <typename Func>
  auto untimed(Func&& func) -> decltype(func());

  void succeeded();
  void failed(const kj::Exception& exception);
  void goOffline();
  kj::Promise<void> checkLoop();

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_DISK_HEALTH_H_
