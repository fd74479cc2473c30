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

#ifndef GRANITE_STORAGE_METADATA_STORE_H_
#define GRANITE_STORAGE_METADATA_STORE_H_

#include "disk.h"
#include <granite/quorum.h>
#include <kj/function.h>

namespace granite {
namespace storage {

struct ResolvedVersion {
  // A version as agreed by a quorum of the disks of an erasure set.

  FileInfo info;
  // The agreed copy. `erasure.index` is that of the first agreeing disk.

  kj::Array<bool> current;
  // Per disk: whether it holds the agreed version. Disks that do not are stale and are skipped
  // when reading shards.

  kj::Array<kj::Maybe<kj::Exception>> errors;
  // Per disk: why its copy could not be read. Null for disks that answered.

  uint currentCount() const;
};

class MetadataStore {
  // Versioned object metadata replicated on every disk of one erasure set. Each disk keeps the
  // whole version chain of an object in one metadata file; mutations are applied to every disk
  // and succeed once `writeQuorum` disks have applied them. Reads are authoritative only when
  // at least `readQuorum` (dataBlocks) disks agree; anything less is
  // METADATA_QUORUM_MISMATCH, never a guess.
  //
  // The caller holds the object's lock around every mutation.

public:
  typedef kj::Function<void(kj::StringPtr volume, kj::StringPtr path,
                            kj::StringPtr versionId)> PartialWriteCallback;
  // Called when a mutation reached its quorum but failed on some disks.

  MetadataStore(kj::ArrayPtr<const kj::Own<Disk>> disks, uint readQuorum, uint writeQuorum,
                PartialWriteCallback onPartialWrite);

  kj::Promise<ResolvedVersion> getVersion(kj::StringPtr volume, kj::StringPtr path,
                                          kj::StringPtr versionId, bool readData);
  // `versionId` empty or "latest" selects the newest version.

  kj::Promise<kj::Array<FileInfo>> listVersions(kj::StringPtr volume, kj::StringPtr path);
  // Newest first.

  kj::Promise<void> createVersion(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi);
  // Adds a version whose data (if any) is inline. Each disk's copy gets its shard index from
  // `fi.erasure.distribution`.

  kj::Promise<FileInfo> deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                      kj::StringPtr versionId, bool permanent);
  // Soft delete (`permanent` false) adds a delete marker with a fresh version id and returns
  // it. Permanent delete removes exactly the named version (the newest if `versionId` is empty)
  // and returns what was removed.

  kj::Promise<void> updateMetadata(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi);
  // Replaces the user metadata of version `fi.versionId`.

  kj::Promise<kj::Array<kj::Maybe<FileInfo>>> readAllCopies(
      kj::StringPtr volume, kj::StringPtr path, kj::StringPtr versionId, bool readData);
  // Every disk's copy of the version, for healing.

  uint getReadQuorum() const { return readQuorum; }
  uint getWriteQuorum() const { return writeQuorum; }

private:
  kj::ArrayPtr<const kj::Own<Disk>> disks;
  uint readQuorum;
  uint writeQuorum;
  PartialWriteCallback onPartialWrite;

  template <typename Func>
  kj::Promise<void> applyEverywhere(kj::StringPtr volume, kj::StringPtr path,
                                    kj::StringPtr versionId, Func&& perDisk,
                                    kj::ArrayPtr<const ErrorCode> alreadyDone = nullptr);

  kj::Exception noQuorum(kj::ArrayPtr<const kj::Maybe<kj::Exception>> errors, uint answered,
                         kj::StringPtr volume, kj::StringPtr path);
};

FileInfo copyForDisk(const FileInfo& fi, uint diskIndex);
// `fi` with `erasure.index` set to the shard placed on disk `diskIndex`.

kj::Maybe<uint> findQuorumVersion(kj::ArrayPtr<const kj::Maybe<FileInfo>> copies, uint quorum,
                                  kj::StringPtr volume, kj::StringPtr path);
// Index of a copy whose version at least `quorum` copies share, or null if no version has that
// many. Throws METADATA_QUORUM_MISMATCH if two different versions both have a quorum.

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_METADATA_STORE_H_
