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

#ifndef GRANITE_STORAGE_LOCAL_DISK_H_
#define GRANITE_STORAGE_LOCAL_DISK_H_

#include "disk.h"
#include <kj/io.h>

namespace granite {
namespace storage {

class LocalDisk final: public Disk, private kj::TaskSet::ErrorHandler {
  // A disk that is a directory on this machine. Each volume is a top-level directory; each
  // object is a directory holding its metadata file and one subdirectory per data directory.
  //
  // File I/O is synchronous, as in the rest of the storage layer; promises returned by this
  // class are already resolved.

public:
  struct Placement {
    uint setIndex = 0;
    uint diskIndex = 0;
    uint setDriveCount = 0;
  };

  LocalDisk(kj::String endpoint, kj::StringPtr path, Placement placement);
  // Opens the disk, formatting it if it has never been used. Fails with INCONSISTENT_DISK if
  // the disk was formatted for a different position in the cluster. Clears staging files left
  // by a previous run.

  ~LocalDisk() noexcept(false);

  void purgeTrash();
  // Delete everything in the trash directory.

  kj::StringPtr getEndpoint() override { return endpoint; }
  bool isLocal() override { return true; }
  bool isOnline() override { return true; }
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
  class FileWriterImpl;
  class FileReaderImpl;
  struct WalkState;

  kj::String endpoint;
  kj::String path;
  kj::AutoCloseFd rootFd;
  kj::String diskId;
  kj::TaskSet tasks;

  void taskFailed(kj::Exception&& exception) override;

  void format(Placement placement);
  void requireVolume(kj::StringPtr volume);
  void makeParents(kj::StringPtr relPath);
  void removeEmptyParents(kj::StringPtr volume, kj::StringPtr relPath);
  void moveToTrash(kj::StringPtr relPath);
  void writeAtomically(kj::StringPtr relPath, kj::ArrayPtr<const byte> data, bool sync = true);

  kj::Maybe<FileMeta> readMeta(kj::StringPtr volume, kj::StringPtr path);
  void writeMeta(kj::StringPtr volume, kj::StringPtr path, const FileMeta& meta,
                 bool sync = true);
  void undoRenameData(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                      const DeleteOptions& options);
  void deleteVersionNow(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                        bool forceDelMarker);

  uint32_t checkPart(kj::StringPtr relPath, uint64_t expectedSize, bool verify,
                     BitrotAlgorithm algorithm, uint64_t shardSize);

  kj::Promise<void> walkInto(WalkState& state, kj::String dir);
  void scanBucket(kj::StringPtr volume, kj::StringPtr dir, BucketUsage& usage);
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_LOCAL_DISK_H_
