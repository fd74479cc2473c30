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
#include <kj/debug.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <algorithm>

namespace granite {
namespace storage {

namespace {

kj::StringPtr normalizeVersionId(kj::StringPtr versionId) {
  return versionId == NULL_VERSION ? kj::StringPtr("") : versionId;
}

}  // namespace

uint64_t ErasureInfo::shardSize() const {
  KJ_REQUIRE(dataBlocks > 0, "erasure layout has no data blocks");
  return (static_cast<uint64_t>(blockSize) + dataBlocks - 1) / dataBlocks;
}

uint64_t ErasureInfo::shardFileSize(int64_t totalLength) const {
  if (totalLength <= 0) return 0;
  uint64_t length = totalLength;
  uint64_t fullBlocks = length / blockSize;
  uint64_t lastBlock = length % blockSize;
  return fullBlocks * shardSize() + (lastBlock + dataBlocks - 1) / dataBlocks;
}

BitrotAlgorithm ErasureInfo::algorithmFor(uint partNumber) const {
  for (auto& checksum: checksums) {
    if (checksum.partNumber == partNumber) return checksum.algorithm;
  }
  return BitrotAlgorithm::BLAKE2B256;
}

ErasureInfo ErasureInfo::clone() const {
  ErasureInfo result;
  result.dataBlocks = dataBlocks;
  result.parityBlocks = parityBlocks;
  result.blockSize = blockSize;
  result.index = index;
  result.distribution = kj::heapArray<uint8_t>(distribution.asPtr());
  for (auto& checksum: checksums) {
    result.checksums.add(ChecksumInfo {
      checksum.partNumber, checksum.algorithm, kj::heapArray<byte>(checksum.hash.asPtr()) });
  }
  return result;
}

// =======================================================================================

FileInfo::FileInfo(StoredFileInfo::Reader reader)
    : FileInfo(reader.getVersion(), reader.getVolume(), reader.getName()) {
  isLatest = reader.getIsLatest();
  numVersions = reader.getNumVersions();
  successorModTime = reader.getSuccessorModTime();
  fresh = reader.getFresh();
}

FileInfo::FileInfo(StoredVersion::Reader version, kj::StringPtr volume, kj::StringPtr name)
    : volume(kj::heapString(volume)), name(kj::heapString(name)),
      versionId(kj::heapString(version.getVersionId())),
      deleted(version.getDeleted()),
      dataDir(kj::heapString(version.getDataDir())),
      modTime(version.getModTime()),
      size(version.getSize()),
      mode(version.getMode()) {
  for (auto kv: version.getMetadata()) {
    metadata.insert(std::make_pair(kj::heapString(kv.getKey()), kj::heapString(kv.getValue())));
  }

  auto storedErasure = version.getErasure();
  erasure.dataBlocks = storedErasure.getDataBlocks();
  erasure.parityBlocks = storedErasure.getParityBlocks();
  erasure.blockSize = storedErasure.getBlockSize();
  erasure.index = storedErasure.getIndex();
  erasure.distribution = KJ_MAP(d, storedErasure.getDistribution()) -> uint8_t { return d; };
  for (auto checksum: storedErasure.getChecksums()) {
    erasure.checksums.add(ChecksumInfo {
      checksum.getPartNumber(), checksum.getAlgorithm(), kj::heapArray(checksum.getHash()) });
  }

  for (auto part: version.getParts()) {
    parts.add(PartInfo {
      part.getNumber(), part.getSize(), part.getActualSize(), part.getModTime(),
      kj::heapString(part.getEtag()) });
  }

  if (version.getInlined()) {
    data = kj::heapArray(version.getInlineData());
  }
}

FileInfo FileInfo::clone() const {
  FileInfo result;
  result.volume = kj::heapString(volume);
  result.name = kj::heapString(name);
  result.versionId = kj::heapString(versionId);
  result.isLatest = isLatest;
  result.deleted = deleted;
  result.fresh = fresh;
  result.dataDir = kj::heapString(dataDir);
  result.modTime = modTime;
  result.size = size;
  result.successorModTime = successorModTime;
  result.mode = mode;
  result.numVersions = numVersions;
  for (auto& entry: metadata) {
    result.metadata.insert(std::make_pair(kj::heapString(entry.first),
                                          kj::heapString(entry.second)));
  }
  result.erasure = erasure.clone();
  for (auto& part: parts) {
    result.parts.add(PartInfo {
      part.number, part.size, part.actualSize, part.modTime, kj::heapString(part.etag) });
  }
  KJ_IF_MAYBE(d, data) {
    result.data = kj::heapArray<byte>(d->asPtr());
  }
  return result;
}

void FileInfo::copyTo(StoredFileInfo::Builder builder) const {
  builder.setVolume(volume);
  builder.setName(name);
  copyVersionTo(builder.initVersion());
  builder.setIsLatest(isLatest);
  builder.setNumVersions(numVersions);
  builder.setSuccessorModTime(successorModTime);
  builder.setFresh(fresh);
}

void FileInfo::copyVersionTo(StoredVersion::Builder builder, bool includeData) const {
  builder.setVersionId(versionId);
  builder.setModTime(modTime);
  builder.setDeleted(deleted);
  builder.setDataDir(dataDir);
  builder.setSize(size);
  builder.setMode(mode);

  auto list = builder.initMetadata(metadata.size());
  uint i = 0;
  for (auto& entry: metadata) {
    list[i].setKey(entry.first);
    list[i].setValue(entry.second);
    ++i;
  }

  auto storedErasure = builder.initErasure();
  storedErasure.setDataBlocks(erasure.dataBlocks);
  storedErasure.setParityBlocks(erasure.parityBlocks);
  storedErasure.setBlockSize(erasure.blockSize);
  storedErasure.setIndex(erasure.index);
  auto distribution = storedErasure.initDistribution(erasure.distribution.size());
  for (uint j = 0; j < erasure.distribution.size(); j++) {
    distribution.set(j, erasure.distribution[j]);
  }
  auto checksums = storedErasure.initChecksums(erasure.checksums.size());
  for (uint j = 0; j < erasure.checksums.size(); j++) {
    checksums[j].setPartNumber(erasure.checksums[j].partNumber);
    checksums[j].setAlgorithm(erasure.checksums[j].algorithm);
    if (erasure.checksums[j].hash.size() > 0) {
      checksums[j].setHash(erasure.checksums[j].hash);
    }
  }

  auto storedParts = builder.initParts(parts.size());
  for (uint j = 0; j < parts.size(); j++) {
    storedParts[j].setNumber(parts[j].number);
    storedParts[j].setSize(parts[j].size);
    storedParts[j].setActualSize(parts[j].actualSize);
    storedParts[j].setModTime(parts[j].modTime);
    storedParts[j].setEtag(parts[j].etag);
  }

  KJ_IF_MAYBE(d, data) {
    builder.setInlined(true);
    if (includeData) {
      builder.setInlineData(*d);
    }
  }
}

kj::Array<byte> FileInfo::encode() const {
  return buildMessage<StoredFileInfo>([this](StoredFileInfo::Builder builder) {
    copyTo(builder);
  });
}

FileInfo FileInfo::decode(kj::ArrayPtr<const byte> bytes) {
  MessageBlob<StoredFileInfo> blob(bytes);
  return FileInfo(blob.get());
}

kj::Maybe<kj::StringPtr> FileInfo::getMetadata(kj::StringPtr key) const {
  auto iter = metadata.find(kj::heapString(key));
  if (iter == metadata.end()) return nullptr;
  return kj::StringPtr(iter->second);
}

void FileInfo::setMetadata(kj::StringPtr key, kj::StringPtr value) {
  auto iter = metadata.find(kj::heapString(key));
  if (iter == metadata.end()) {
    metadata.insert(std::make_pair(kj::heapString(key), kj::heapString(value)));
  } else {
    iter->second = kj::heapString(value);
  }
}

bool FileInfo::sameVersion(const FileInfo& other) const {
  return versionId == other.versionId &&
         modTime == other.modTime &&
         deleted == other.deleted &&
         dataDir == other.dataDir &&
         size == other.size &&
         erasure.dataBlocks == other.erasure.dataBlocks &&
         erasure.parityBlocks == other.erasure.parityBlocks &&
         erasure.blockSize == other.erasure.blockSize &&
         erasure.distribution.asPtr() == other.erasure.distribution.asPtr();
}

// =======================================================================================

FileMeta FileMeta::parse(kj::ArrayPtr<const byte> bytes) {
  FileMeta result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    MessageBlob<StoredFileMeta> blob(bytes);
    for (auto version: blob.get().getVersions()) {
      result.versions.add(FileInfo(version, nullptr, nullptr));
    }
  })) {
    GRANITE_FAIL(CORRUPT_SHARD, "unreadable object metadata: ", exception->getDescription());
  }
  result.sort();
  return result;
}

kj::Array<byte> FileMeta::serialize(bool includeInlineData) const {
  return buildMessage<StoredFileMeta>([&](StoredFileMeta::Builder builder) {
    auto list = builder.initVersions(versions.size());
    for (uint i = 0; i < versions.size(); i++) {
      versions[i].copyVersionTo(list[i], includeInlineData);
    }
  });
}

void FileMeta::addVersion(FileInfo&& version) {
  if (version.versionId == NULL_VERSION) {
    version.versionId = kj::heapString("");
  }

  for (auto& existing: versions) {
    if (existing.versionId == version.versionId) {
      existing = kj::mv(version);
      sort();
      return;
    }
  }

  if (versions.size() >= MAX_VERSIONS) {
    GRANITE_FAIL(MAX_VERSIONS_EXCEEDED, version.name);
  }

  versions.add(kj::mv(version));
  sort();
}

kj::Maybe<kj::String> FileMeta::deleteVersion(const FileInfo& version) {
  if (version.deleted) {
    addVersion(version.clone());
    return nullptr;
  }

  kj::StringPtr id = normalizeVersionId(version.versionId);
  for (uint i = 0; i < versions.size(); i++) {
    if (versions[i].versionId == id) {
      kj::String dataDir = kj::mv(versions[i].dataDir);
      for (uint j = i + 1; j < versions.size(); j++) {
        versions[j - 1] = kj::mv(versions[j]);
      }
      versions.removeLast();

      if (dataDir.size() > 0 && !sharesDataDir(dataDir)) {
        return kj::mv(dataDir);
      }
      return nullptr;
    }
  }

  GRANITE_FAIL(FILE_VERSION_NOT_FOUND, version.name, " version ", version.versionId);
}

void FileMeta::updateVersion(const FileInfo& version) {
  kj::StringPtr id = normalizeVersionId(version.versionId);
  for (auto& existing: versions) {
    if (existing.versionId == id) {
      existing.metadata.clear();
      for (auto& entry: version.metadata) {
        existing.metadata.insert(std::make_pair(kj::heapString(entry.first),
                                                kj::heapString(entry.second)));
      }
      return;
    }
  }

  GRANITE_FAIL(FILE_VERSION_NOT_FOUND, version.name, " version ", version.versionId);
}

FileInfo FileMeta::findVersion(kj::StringPtr volume, kj::StringPtr name,
                               kj::StringPtr versionId, bool includeData) const {
  if (versions.size() == 0) {
    GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", name);
  }

  if (versionId.size() == 0 || versionId == LATEST_VERSION) {
    return describe(0, volume, name, includeData);
  }

  kj::StringPtr id = normalizeVersionId(versionId);
  for (uint i = 0; i < versions.size(); i++) {
    if (versions[i].versionId == id) {
      return describe(i, volume, name, includeData);
    }
  }

  GRANITE_FAIL(FILE_VERSION_NOT_FOUND, volume, "/", name, " version ", versionId);
}

kj::Array<FileInfo> FileMeta::listVersions(kj::StringPtr volume, kj::StringPtr name) const {
  auto builder = kj::heapArrayBuilder<FileInfo>(versions.size());
  for (uint i = 0; i < versions.size(); i++) {
    builder.add(describe(i, volume, name, false));
  }
  return builder.finish();
}

kj::Maybe<const FileInfo&> FileMeta::findById(kj::StringPtr versionId) const {
  kj::StringPtr id = normalizeVersionId(versionId);
  for (auto& version: versions) {
    if (version.versionId == id) return version;
  }
  return nullptr;
}

bool FileMeta::sharesDataDir(kj::StringPtr dataDir) const {
  for (auto& version: versions) {
    if (version.dataDir == dataDir) return true;
  }
  return false;
}

uint64_t FileMeta::signature() const {
  kj::Vector<byte> buffer;
  auto append = [&](const void* data, size_t size) {
    buffer.addAll(reinterpret_cast<const byte*>(data), reinterpret_cast<const byte*>(data) + size);
  };

  for (auto& version: versions) {
    append(version.versionId.cStr(), version.versionId.size() + 1);
    append(version.dataDir.cStr(), version.dataDir.size() + 1);
    append(&version.modTime, sizeof(version.modTime));
    append(&version.size, sizeof(version.size));
    byte deleted = version.deleted;
    append(&deleted, 1);
  }

  uint64_t result;
  crypto_generichash_blake2b(reinterpret_cast<byte*>(&result), sizeof(result),
                             buffer.begin(), buffer.size(), nullptr, 0);
  return result;
}

void FileMeta::sort() {
  std::sort(versions.begin(), versions.end(), [](const FileInfo& a, const FileInfo& b) {
    if (a.modTime != b.modTime) return a.modTime > b.modTime;
    return a.versionId > b.versionId;
  });
}

FileInfo FileMeta::describe(uint i, kj::StringPtr volume, kj::StringPtr name,
                            bool includeData) const {
  auto result = versions[i].clone();
  result.volume = kj::heapString(volume);
  result.name = kj::heapString(name);
  result.isLatest = i == 0;
  result.numVersions = versions.size();
  result.successorModTime = i == 0 ? 0 : versions[i - 1].modTime;
  if (!includeData) {
    result.data = nullptr;
  }
  return result;
}

}  // namespace storage
}  // namespace granite
