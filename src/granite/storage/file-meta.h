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

#ifndef GRANITE_STORAGE_FILE_META_H_
#define GRANITE_STORAGE_FILE_META_H_

#include "basics.h"
#include <kj/vector.h>
#include <map>

namespace granite {
namespace storage {

struct ChecksumInfo {
  uint partNumber = 0;
  BitrotAlgorithm algorithm = BitrotAlgorithm::BLAKE2B256;
  kj::Array<byte> hash;
};

struct ErasureInfo {
  uint dataBlocks = 0;
  uint parityBlocks = 0;
  uint blockSize = 0;

  uint index = 0;
  // 1-based shard index stored on the disk holding this copy. Zero if not sharded.

  kj::Array<uint8_t> distribution;
  // distribution[diskIndex] = 1-based shard index placed on that disk of the erasure set.

  kj::Vector<ChecksumInfo> checksums;

  uint64_t shardSize() const;
  // Bytes of each shard per erasure block.

  uint64_t shardFileSize(int64_t totalLength) const;
  // Shard payload bytes (without bitrot hashes) for an object part of `totalLength` bytes.

  BitrotAlgorithm algorithmFor(uint partNumber) const;

  ErasureInfo clone() const;
};

struct PartInfo {
  uint number = 0;
  int64_t size = 0;
  int64_t actualSize = 0;
  int64_t modTime = 0;
  kj::String etag;
};

struct FileInfo {
  // One version of one object, plus where it lives.

  kj::String volume;
  kj::String name;

  kj::String versionId;
  // Empty for the null version.

  bool isLatest = false;
  bool deleted = false;
  // Delete marker.

  bool fresh = false;
  // Written by a caller that expects no existing metadata.

  kj::String dataDir;
  // Directory holding this version's shard files. Empty for inline and zero-length objects.

  int64_t modTime = 0;
  int64_t size = 0;
  int64_t successorModTime = 0;
  uint32_t mode = 0;
  uint32_t numVersions = 0;

  std::map<kj::String, kj::String> metadata;
  // User metadata, tags, legal hold and so on.

  ErasureInfo erasure;
  kj::Vector<PartInfo> parts;

  kj::Maybe<kj::Array<byte>> data;
  // Inline payload.

  FileInfo() = default;
  FileInfo(FileInfo&&) = default;
  FileInfo& operator=(FileInfo&&) = default;
  explicit FileInfo(StoredFileInfo::Reader reader);
  FileInfo(StoredVersion::Reader version, kj::StringPtr volume, kj::StringPtr name);

  FileInfo clone() const;

  void copyTo(StoredFileInfo::Builder builder) const;
  void copyVersionTo(StoredVersion::Builder builder, bool includeData = true) const;

  kj::Array<byte> encode() const;
  static FileInfo decode(kj::ArrayPtr<const byte> bytes);

  bool isInline() const { return data != nullptr; }

  kj::Maybe<kj::StringPtr> getMetadata(kj::StringPtr key) const;
  void setMetadata(kj::StringPtr key, kj::StringPtr value);

  bool sameVersion(const FileInfo& other) const;
  // Same version id, modification time, data directory, size and erasure layout. Two disks
  // whose copies are sameVersion() agree on this version.
};

class FileMeta {
  // The version chain of one object path on one disk, newest first. Serialized as a
  // StoredFileMeta and always rewritten as a whole.

public:
  FileMeta() = default;
  FileMeta(FileMeta&&) = default;
  FileMeta& operator=(FileMeta&&) = default;

  static FileMeta parse(kj::ArrayPtr<const byte> bytes);
  // Throws CORRUPT_SHARD if `bytes` is not a valid chain.

  kj::Array<byte> serialize(bool includeInlineData = true) const;

  size_t size() const { return versions.size(); }
  bool empty() const { return versions.size() == 0; }

  void addVersion(FileInfo&& version);
  // Insert a new version, or replace the version with the same id. Keeps the chain sorted.

  kj::Maybe<kj::String> deleteVersion(const FileInfo& version);
  // If `version.deleted`, adds it as a delete marker. Otherwise removes the version with the
  // same id (FILE_VERSION_NOT_FOUND if absent). Returns the removed version's data directory
  // if no remaining version shares it.

  void updateVersion(const FileInfo& version);
  // Replace the user metadata of the version with the same id.

  FileInfo findVersion(kj::StringPtr volume, kj::StringPtr name, kj::StringPtr versionId,
                       bool includeData) const;
  // `versionId` empty or "latest" selects the newest version, "null" the null version. Throws
  // FILE_NOT_FOUND if the chain is empty and FILE_VERSION_NOT_FOUND if the id is unknown.

  kj::Array<FileInfo> listVersions(kj::StringPtr volume, kj::StringPtr name) const;

  kj::Maybe<const FileInfo&> findById(kj::StringPtr versionId) const;
  bool sharesDataDir(kj::StringPtr dataDir) const;

  uint64_t signature() const;
  // Hash over the identity of every version in the chain. Disks with equal signatures hold the
  // same chain.

private:
  kj::Vector<FileInfo> versions;

  void sort();
  FileInfo describe(uint i, kj::StringPtr volume, kj::StringPtr name, bool includeData) const;
};

constexpr const char LATEST_VERSION[] = "latest";
constexpr const char NULL_VERSION[] = "null";

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_FILE_META_H_
