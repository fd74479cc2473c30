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

#ifndef GRANITE_STORAGE_DISK_H_
#define GRANITE_STORAGE_DISK_H_

#include "file-meta.h"
#include <kj/async.h>

namespace granite {
namespace storage {

// =======================================================================================
// Structured arguments and results
//
// Each has a wire form in storage.capnp. fromReader()/copyTo() convert between the two; the
// RPC layer ships them as flat messages (see encode()/decode()).

struct VolumeInfo {
  kj::String name;
  int64_t created = 0;

  static VolumeInfo fromReader(wire::VolumeInfo::Reader reader);
  void copyTo(wire::VolumeInfo::Builder builder) const;
};

struct DiskInfo {
  uint64_t total = 0;
  uint64_t free = 0;
  uint64_t used = 0;
  uint64_t usedInodes = 0;
  uint64_t freeInodes = 0;
  bool rootDisk = false;
  bool healing = false;
  kj::String endpoint;
  kj::String mountPath;
  kj::String id;

  static DiskInfo fromReader(wire::DiskInfo::Reader reader);
  void copyTo(wire::DiskInfo::Builder builder) const;
};

struct DeleteOptions {
  bool recursive = false;
  bool immediate = false;
  // Remove now rather than moving into the trash directory.
  bool undoWrite = false;
  kj::String oldDataDir;
  kj::String stagingPath;
  // With undoWrite, deleteVersion() reverts a renameData() from `stagingPath` instead of
  // deleting anything.

  static DeleteOptions fromReader(wire::DeleteOptions::Reader reader);
  void copyTo(wire::DeleteOptions::Builder builder) const;
};

struct ReadOptions {
  bool readData = false;
  bool healing = false;

  static ReadOptions fromReader(wire::ReadOptions::Reader reader);
  void copyTo(wire::ReadOptions::Builder builder) const;
};

struct UpdateMetadataOptions {
  bool noPersistence = false;

  static UpdateMetadataOptions fromReader(wire::UpdateMetadataOptions::Reader reader);
  void copyTo(wire::UpdateMetadataOptions::Builder builder) const;
};

struct WalkDirOptions {
  kj::String bucket;
  kj::String baseDir;
  // Directory to walk, relative to the bucket. Empty or ending in '/'.

  bool recursive = false;
  bool reportNotFound = false;
  // Fail with FILE_NOT_FOUND if baseDir does not exist, instead of walking nothing.

  kj::String filterPrefix;
  // Only entries whose name (relative to baseDir) starts with this.

  kj::String forwardTo;
  // Skip entries whose name sorts before this.

  int limit = 0;
  // Maximum number of objects reported. Zero means unlimited.

  static WalkDirOptions fromReader(wire::WalkDirOptions::Reader reader);
  void copyTo(wire::WalkDirOptions::Builder builder) const;
};

struct MetaCacheEntry {
  kj::String name;
  // Relative to the bucket. Directories end in '/'.

  kj::Array<byte> metadata;
  // Raw FileMeta. Empty for directories.

  bool isDir() const { return name.endsWith("/"); }

  static MetaCacheEntry fromReader(wire::MetaCacheEntry::Reader reader);
  void copyTo(wire::MetaCacheEntry::Builder builder) const;
};

struct ReadMultipleRequest {
  kj::String bucket;
  kj::String prefix;
  kj::Array<kj::String> files;
  int64_t maxSize = 0;
  // Files larger than this are reported with an error. Zero means unlimited.
  bool metadataOnly = false;
  // Files are object directories; read their metadata without inline data.
  bool abortOn404 = false;
  uint maxResults = 0;

  static ReadMultipleRequest fromReader(wire::ReadMultipleRequest::Reader reader);
  void copyTo(wire::ReadMultipleRequest::Builder builder) const;
};

struct ReadMultipleResult {
  kj::String bucket;
  kj::String prefix;
  kj::String file;
  bool exists = false;
  kj::String error;
  kj::Array<byte> data;
  int64_t modTime = 0;

  static ReadMultipleResult fromReader(wire::ReadMultipleResult::Reader reader);
  void copyTo(wire::ReadMultipleResult::Builder builder) const;
};

struct FileInfoVersions {
  kj::String volume;
  kj::String name;
  kj::Array<FileInfo> versions;

  static FileInfoVersions fromReader(wire::FileInfoVersions::Reader reader);
  void copyTo(wire::FileInfoVersions::Builder builder) const;
};

struct BucketUsage {
  kj::String name;
  uint64_t objects = 0;
  uint64_t versions = 0;
  uint64_t deleteMarkers = 0;
  uint64_t size = 0;
};

struct DataUsage {
  int64_t lastUpdate = 0;
  kj::Vector<BucketUsage> buckets;

  kj::Maybe<BucketUsage&> find(kj::StringPtr bucket);

  static DataUsage fromReader(wire::DataUsageCache::Reader reader);
  void copyTo(wire::DataUsageCache::Builder builder) const;
};

template <typename Wire, typename T>
kj::Array<byte> encode(const T& value) {
  return buildMessage<Wire>([&](typename Wire::Builder builder) { value.copyTo(builder); });
}

template <typename Wire, typename T>
T decode(kj::ArrayPtr<const byte> bytes) {
  MessageBlob<Wire> blob(bytes);
  return T::fromReader(blob.get());
}

// =======================================================================================
// Streams

class FileWriter {
  // Sequential writer of one file being created or appended to.

public:
  virtual ~FileWriter() noexcept(false) {}

  virtual kj::Promise<void> write(kj::ArrayPtr<const byte> data) = 0;
  // `data` must remain valid until the returned promise resolves.

  virtual kj::Promise<void> close() = 0;
  // Makes the written data durable. A writer destroyed without close() abandons the file. For
  // files created with a known size, fails with LESS_DATA if fewer bytes were written.
};

class FileReader {
  // Sequential reader of a byte range.

public:
  virtual ~FileReader() noexcept(false) {}

  virtual kj::Promise<size_t> read(kj::ArrayPtr<byte> buffer) = 0;
  // Fills `buffer` unless the range ends first. Returns zero at the end of the range.
};

kj::Promise<void> readExactly(FileReader& reader, kj::ArrayPtr<byte> buffer);
// Fails with LESS_DATA if the range ends before `buffer` is full.

class WalkSink {
public:
  virtual kj::Promise<void> push(MetaCacheEntry&& entry) = 0;
  // The walk does not continue until the returned promise resolves. A rejection stops it.
};

class UsageSink {
public:
  virtual void update(const DataUsage& usage) = 0;
};

// =======================================================================================

class Disk {
  // One storage volume. Every method is addressed by (volume, path) and fails with an
  // ErrorCode-tagged exception. LocalDisk accesses a directory directly; RemoteDisk forwards
  // to the node that owns the disk; HealthCheckedDisk wraps either.

public:
  virtual ~Disk() noexcept(false) {}

  virtual kj::StringPtr getEndpoint() = 0;
  virtual bool isLocal() = 0;
  virtual bool isOnline() = 0;

  virtual kj::Promise<kj::String> getDiskId() = 0;

  virtual kj::Promise<DiskInfo> diskInfo(bool metrics) = 0;

  // ---------------------------------------------------------------------------
  // volumes

  virtual kj::Promise<void> makeVolume(kj::StringPtr volume) = 0;
  virtual kj::Promise<void> makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) = 0;
  // Volumes that already exist are not an error.

  virtual kj::Promise<kj::Array<VolumeInfo>> listVolumes() = 0;
  // Excludes the system volume.

  virtual kj::Promise<VolumeInfo> statVolume(kj::StringPtr volume) = 0;
  virtual kj::Promise<void> deleteVolume(kj::StringPtr volume, bool force) = 0;
  // Fails with VOLUME_NOT_EMPTY unless `force` or the volume is empty.

  // ---------------------------------------------------------------------------
  // files

  virtual kj::Promise<kj::Array<kj::String>> listDir(
      kj::StringPtr volume, kj::StringPtr dirPath, int count) = 0;
  // Names in the directory, sorted; subdirectories end in '/'. `count` <= 0 means all.

  virtual kj::Promise<void> walkDir(const WalkDirOptions& options, WalkSink& sink) = 0;
  // Pushes every object (directory holding a metadata file) under the base directory in
  // lexical order. Non-recursive walks push subdirectories as "prefix/" entries instead of
  // descending.

  virtual kj::Promise<kj::Array<byte>> readAll(kj::StringPtr volume, kj::StringPtr path) = 0;
  virtual kj::Promise<void> writeAll(kj::StringPtr volume, kj::StringPtr path,
                                     kj::ArrayPtr<const byte> data) = 0;
  // Atomic: readers see the old content or the new content, never a mix.

  virtual kj::Promise<kj::Own<FileWriter>> createFile(
      kj::StringPtr volume, kj::StringPtr path, int64_t size) = 0;
  // `size` < 0 means unknown. With a known size, writing more fails with MORE_DATA.

  virtual kj::Promise<kj::Own<FileWriter>> appendFile(
      kj::StringPtr volume, kj::StringPtr path) = 0;

  virtual kj::Promise<kj::Own<FileReader>> readFileStream(
      kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) = 0;

  virtual kj::Promise<void> renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                       kj::StringPtr dstVolume, kj::StringPtr dstPath) = 0;
  virtual kj::Promise<void> renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                       kj::StringPtr dstVolume, kj::StringPtr dstPath,
                                       kj::ArrayPtr<const byte> meta) = 0;
  // Moves a part file and writes `meta` beside it as "<dstPath>.meta".

  virtual kj::Promise<void> deleteFile(kj::StringPtr volume, kj::StringPtr path,
                                       const DeleteOptions& options) = 0;
  virtual kj::Promise<void> deletePaths(kj::StringPtr volume,
                                        kj::ArrayPtr<const kj::StringPtr> paths) = 0;
  // Best effort; missing paths are not an error.

  virtual kj::Promise<kj::Array<uint32_t>> verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                                      const FileInfo& fi) = 0;
  // Reads and bitrot-verifies every part. One CheckPart code per part.
  virtual kj::Promise<kj::Array<uint32_t>> checkParts(kj::StringPtr volume, kj::StringPtr path,
                                                      const FileInfo& fi) = 0;
  // Checks presence and size of every part. One CheckPart code per part.

  // ---------------------------------------------------------------------------
  // metadata

  virtual kj::Promise<void> writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                          const FileInfo& fi) = 0;
  // Adds (or replaces) the version. With `fi.fresh`, starts a new chain holding only `fi`.

  virtual kj::Promise<void> updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                           const FileInfo& fi,
                                           const UpdateMetadataOptions& options) = 0;
  virtual kj::Promise<FileInfo> readVersion(kj::StringPtr volume, kj::StringPtr path,
                                            kj::StringPtr versionId,
                                            const ReadOptions& options) = 0;
  virtual kj::Promise<kj::Array<byte>> readXl(kj::StringPtr volume, kj::StringPtr path,
                                              bool readData) = 0;
  // The raw serialized FileMeta.

  virtual kj::Promise<kj::Maybe<kj::String>> renameData(
      kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
      kj::StringPtr dstVolume, kj::StringPtr dstPath) = 0;
  // Commit point of a write: moves the staged data directory `srcPath/<fi.dataDir>` under
  // dstPath and adds `fi` to dstPath's metadata. Returns the data directory of a replaced
  // version that nothing refers to any more.
  //
  // If dstPath had metadata, its previous chain and the replaced data directory are moved into
  // srcPath, which is then left for the caller to delete once the write reached its quorum.
  // Until then, deleteVersion() with `undoWrite` reverts the commit.

  virtual kj::Promise<void> deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                          const FileInfo& fi, bool forceDelMarker,
                                          const DeleteOptions& options) = 0;
  virtual kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> deleteVersions(
      kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
      const DeleteOptions& options) = 0;
  // One result per entry of `versions`; an entry fails if any of its versions does.

  virtual kj::Promise<kj::Array<ReadMultipleResult>> readMultiple(
      const ReadMultipleRequest& request) = 0;

  virtual kj::Promise<DataUsage> nsScanner(DataUsage&& cache, UsageSink& updates) = 0;
  // Recomputes per-bucket usage, calling updates.update() after each bucket.
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_DISK_H_
