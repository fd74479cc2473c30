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

#ifndef GRANITE_STORAGE_ERASURE_SET_H_
#define GRANITE_STORAGE_ERASURE_SET_H_

#include "metadata-store.h"
#include "erasure-io.h"
#include "heal.h"
#include <granite/ns-lock.h>
#include <granite/config.capnp.h>
#include <kj/async-io.h>

namespace granite {
namespace storage {

struct ErasureSetOptions {
  uint dataBlocks = 4;
  uint parityBlocks = 2;
  uint writeQuorum = 0;
  // Zero means dataBlocks + 1 (at most the number of disks).

  uint64_t blockSize = 1 << 20;
  uint64_t inlineThreshold = 128 << 10;
  // Objects of at most this many bytes are stored inside their metadata.

  BitrotAlgorithm algorithm = BitrotAlgorithm::BLAKE2B256;

  static ErasureSetOptions fromConfig(ErasureConfig::Reader config);
};

struct PutOptions {
  bool versioned = false;
  // Give the object a fresh version id. Otherwise the null version is replaced.

  kj::String versionId;
  // Explicit version id, e.g. when replicating. Overrides `versioned`.

  std::map<kj::String, kj::String> userDefined;
};

struct ListObjectsResult {
  kj::Vector<FileInfo> objects;
  // Latest version of each object, without inline data. Objects whose latest version is a
  // delete marker are left out.

  kj::Vector<kj::String> prefixes;
  // Common prefixes of non-recursive listings, ending in '/'.
};

class ErasureSet final: public Healer, private kj::TaskSet::ErrorHandler {
  // One group of dataBlocks + parityBlocks disks and the objects stored on it. Buckets are
  // volumes present on every disk. Objects are either inline (stored inside the metadata) or
  // erasure coded, disk i holding shard `distribution[i]` of each block. The distribution is a
  // rotation chosen by the object name's hash so parity is spread over all disks.
  //
  // Writes are staged under the system volume's tmp directory and committed by renameData(),
  // which is atomic per disk. Anything that finds a disk behind is queued for healing.

public:
  ErasureSet(uint setIndex, kj::Array<kj::Own<Disk>> disks, ErasureSetOptions options,
             NsLockMap& locks, kj::Timer& timer, HealPolicy healPolicy);
  ~ErasureSet() noexcept(false);
  KJ_DISALLOW_COPY(ErasureSet);

  uint getSetIndex() { return setIndex; }
  kj::ArrayPtr<const kj::Own<Disk>> getDisks() { return disks; }
  uint getReadQuorum() { return options.dataBlocks; }
  uint getWriteQuorum() { return writeQuorum; }
  HealQueue& getHealQueue() { return healQueue; }

  kj::Array<uint8_t> distributionFor(kj::StringPtr object);

  // ---------------------------------------------------------------------------
  // buckets

  kj::Promise<void> makeBucket(kj::StringPtr bucket);
  kj::Promise<VolumeInfo> getBucketInfo(kj::StringPtr bucket);
  kj::Promise<kj::Array<VolumeInfo>> listBuckets();
  kj::Promise<void> deleteBucket(kj::StringPtr bucket, bool force);
  kj::Promise<uint> healBucket(kj::StringPtr bucket);
  // Creates the bucket on disks that miss it. Returns the number of disks fixed.

  // ---------------------------------------------------------------------------
  // objects

  kj::Promise<FileInfo> putObject(kj::StringPtr bucket, kj::StringPtr object,
                                  kj::AsyncInputStream& input, int64_t size, PutOptions options);
  // `size` < 0 means unknown: the input is read to EOF. Returns the stored version without
  // inline data.

  kj::Promise<FileInfo> getObject(kj::StringPtr bucket, kj::StringPtr object,
                                  kj::StringPtr versionId, int64_t offset, int64_t length,
                                  kj::AsyncOutputStream& output);
  // Writes [offset, offset + length) of the version to `output`. `length` < 0 means to the end.

  kj::Promise<FileInfo> getObjectInfo(kj::StringPtr bucket, kj::StringPtr object,
                                      kj::StringPtr versionId);

  kj::Promise<FileInfo> deleteObject(kj::StringPtr bucket, kj::StringPtr object,
                                     kj::StringPtr versionId, bool versioned);
  // With `versioned` and no version id, adds a delete marker. Otherwise removes the version
  // (the newest if `versionId` is empty) for good.

  kj::Promise<kj::Array<FileInfo>> listObjectVersions(kj::StringPtr bucket,
                                                      kj::StringPtr object);

  kj::Promise<ListObjectsResult> listObjects(kj::StringPtr bucket, kj::StringPtr prefix,
                                             bool recursive, int limit = 0);

  kj::Promise<void> putObjectMetadata(kj::StringPtr bucket, kj::StringPtr object,
                                      kj::StringPtr versionId,
                                      std::map<kj::String, kj::String> metadata);

  kj::Promise<void> healObject(kj::StringPtr bucket, kj::StringPtr object,
                               kj::StringPtr versionId) override;

private:
  uint setIndex;
  kj::Array<kj::Own<Disk>> disks;
  ErasureSetOptions options;
  uint writeQuorum;
  NsLockMap& locks;
  kj::Timer& timer;
  MetadataStore metadata;
  kj::TaskSet tasks;
  HealQueue healQueue;

  template <typename T>
  kj::Promise<T> whileHolding(kj::Own<NsLock> lock, kj::Promise<T> promise);
  // Runs `promise` under `lock`, failing with LOCK_NOT_HELD if the lock is lost meanwhile.

  kj::Promise<FileInfo> putInline(kj::StringPtr bucket, kj::StringPtr object,
                                  kj::AsyncInputStream& input, kj::Own<FileInfo> fi);
  kj::Promise<FileInfo> putErasure(kj::StringPtr bucket, kj::StringPtr object,
                                   kj::AsyncInputStream& input, kj::Own<FileInfo> fi);
  kj::Promise<void> readErasure(kj::StringPtr bucket, kj::StringPtr object,
                                ResolvedVersion& resolved, uint64_t offset, uint64_t length,
                                kj::AsyncOutputStream& output);
  kj::Promise<void> healVersion(kj::StringPtr bucket, kj::StringPtr object,
                                kj::Own<FileInfo> latest, kj::Array<bool> outdated);

  kj::Array<kj::Maybe<kj::Own<BitrotWriter>>> openShardWriters(
      const FileInfo& fi, const Erasure& erasure,
      kj::ArrayPtr<kj::Maybe<kj::Own<FileWriter>>> files);
  // Wraps the staged file of each disk in a writer for the shard that disk holds.

  struct PendingCommit;
  kj::Promise<void> undoCommit(PendingCommit& commit, uint disk);
  // Reverts one disk's renameData() of a write that missed its quorum.

  void queueHeal(kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId);
  void cleanupStaging(kj::StringPtr tmpPath);
  void cleanupStaging(kj::StringPtr tmpPath, uint disk);

  void taskFailed(kj::Exception&& exception) override;
};

ErasureSet& setForObject(kj::ArrayPtr<const kj::Own<ErasureSet>> sets, kj::StringPtr object);
// The set an object is placed on, chosen by the object name's hash.

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_ERASURE_SET_H_
