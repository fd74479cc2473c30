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

#include "disk.h"
#include <kj/debug.h>

namespace granite {
namespace storage {

VolumeInfo VolumeInfo::fromReader(wire::VolumeInfo::Reader reader) {
  return { kj::heapString(reader.getName()), reader.getCreated() };
}

void VolumeInfo::copyTo(wire::VolumeInfo::Builder builder) const {
  builder.setName(name);
  builder.setCreated(created);
}

DiskInfo DiskInfo::fromReader(wire::DiskInfo::Reader reader) {
  DiskInfo result;
  result.total = reader.getTotal();
  result.free = reader.getFree();
  result.used = reader.getUsed();
  result.usedInodes = reader.getUsedInodes();
  result.freeInodes = reader.getFreeInodes();
  result.rootDisk = reader.getRootDisk();
  result.healing = reader.getHealing();
  result.endpoint = kj::heapString(reader.getEndpoint());
  result.mountPath = kj::heapString(reader.getMountPath());
  result.id = kj::heapString(reader.getId());
  return result;
}

void DiskInfo::copyTo(wire::DiskInfo::Builder builder) const {
  builder.setTotal(total);
  builder.setFree(free);
  builder.setUsed(used);
  builder.setUsedInodes(usedInodes);
  builder.setFreeInodes(freeInodes);
  builder.setRootDisk(rootDisk);
  builder.setHealing(healing);
  builder.setEndpoint(endpoint);
  builder.setMountPath(mountPath);
  builder.setId(id);
}

DeleteOptions DeleteOptions::fromReader(wire::DeleteOptions::Reader reader) {
  DeleteOptions result;
  result.recursive = reader.getRecursive();
  result.immediate = reader.getImmediate();
  result.undoWrite = reader.getUndoWrite();
  result.oldDataDir = kj::heapString(reader.getOldDataDir());
  result.stagingPath = kj::heapString(reader.getStagingPath());
  return result;
}

void DeleteOptions::copyTo(wire::DeleteOptions::Builder builder) const {
  builder.setRecursive(recursive);
  builder.setImmediate(immediate);
  builder.setUndoWrite(undoWrite);
  builder.setOldDataDir(oldDataDir);
  builder.setStagingPath(stagingPath);
}

ReadOptions ReadOptions::fromReader(wire::ReadOptions::Reader reader) {
  ReadOptions result;
  result.readData = reader.getReadData();
  result.healing = reader.getHealing();
  return result;
}

void ReadOptions::copyTo(wire::ReadOptions::Builder builder) const {
  builder.setReadData(readData);
  builder.setHealing(healing);
}

UpdateMetadataOptions UpdateMetadataOptions::fromReader(
    wire::UpdateMetadataOptions::Reader reader) {
  UpdateMetadataOptions result;
  result.noPersistence = reader.getNoPersistence();
  return result;
}

void UpdateMetadataOptions::copyTo(wire::UpdateMetadataOptions::Builder builder) const {
  builder.setNoPersistence(noPersistence);
}

WalkDirOptions WalkDirOptions::fromReader(wire::WalkDirOptions::Reader reader) {
  WalkDirOptions result;
  result.bucket = kj::heapString(reader.getBucket());
  result.baseDir = kj::heapString(reader.getBaseDir());
  result.recursive = reader.getRecursive();
  result.reportNotFound = reader.getReportNotFound();
  result.filterPrefix = kj::heapString(reader.getFilterPrefix());
  result.forwardTo = kj::heapString(reader.getForwardTo());
  result.limit = reader.getLimit();
  return result;
}

void WalkDirOptions::copyTo(wire::WalkDirOptions::Builder builder) const {
  builder.setBucket(bucket);
  builder.setBaseDir(baseDir);
  builder.setRecursive(recursive);
  builder.setReportNotFound(reportNotFound);
  builder.setFilterPrefix(filterPrefix);
  builder.setForwardTo(forwardTo);
  builder.setLimit(limit);
}

MetaCacheEntry MetaCacheEntry::fromReader(wire::MetaCacheEntry::Reader reader) {
  return { kj::heapString(reader.getName()), kj::heapArray(reader.getMetadata()) };
}

void MetaCacheEntry::copyTo(wire::MetaCacheEntry::Builder builder) const {
  builder.setName(name);
  if (metadata.size() > 0) builder.setMetadata(metadata);
}

ReadMultipleRequest ReadMultipleRequest::fromReader(wire::ReadMultipleRequest::Reader reader) {
  ReadMultipleRequest result;
  result.bucket = kj::heapString(reader.getBucket());
  result.prefix = kj::heapString(reader.getPrefix());
  result.files = KJ_MAP(f, reader.getFiles()) { return kj::heapString(f); };
  result.maxSize = reader.getMaxSize();
  result.metadataOnly = reader.getMetadataOnly();
  result.abortOn404 = reader.getAbortOn404();
  result.maxResults = reader.getMaxResults();
  return result;
}

void ReadMultipleRequest::copyTo(wire::ReadMultipleRequest::Builder builder) const {
  builder.setBucket(bucket);
  builder.setPrefix(prefix);
  auto list = builder.initFiles(files.size());
  for (uint i = 0; i < files.size(); i++) {
    list.set(i, files[i]);
  }
  builder.setMaxSize(maxSize);
  builder.setMetadataOnly(metadataOnly);
  builder.setAbortOn404(abortOn404);
  builder.setMaxResults(maxResults);
}

ReadMultipleResult ReadMultipleResult::fromReader(wire::ReadMultipleResult::Reader reader) {
  ReadMultipleResult result;
  result.bucket = kj::heapString(reader.getBucket());
  result.prefix = kj::heapString(reader.getPrefix());
  result.file = kj::heapString(reader.getFile());
  result.exists = reader.getExists();
  result.error = kj::heapString(reader.getError());
  result.data = kj::heapArray(reader.getData());
  result.modTime = reader.getModTime();
  return result;
}

void ReadMultipleResult::copyTo(wire::ReadMultipleResult::Builder builder) const {
  builder.setBucket(bucket);
  builder.setPrefix(prefix);
  builder.setFile(file);
  builder.setExists(exists);
  builder.setError(error);
  if (data.size() > 0) builder.setData(data);
  builder.setModTime(modTime);
}

FileInfoVersions FileInfoVersions::fromReader(wire::FileInfoVersions::Reader reader) {
  FileInfoVersions result;
  result.volume = kj::heapString(reader.getVolume());
  result.name = kj::heapString(reader.getName());
  result.versions = KJ_MAP(v, reader.getVersions()) { return FileInfo(v); };
  return result;
}

void FileInfoVersions::copyTo(wire::FileInfoVersions::Builder builder) const {
  builder.setVolume(volume);
  builder.setName(name);
  auto list = builder.initVersions(versions.size());
  for (uint i = 0; i < versions.size(); i++) {
    versions[i].copyTo(list[i]);
  }
}

kj::Maybe<BucketUsage&> DataUsage::find(kj::StringPtr bucket) {
  for (auto& usage: buckets) {
    if (usage.name == bucket) return usage;
  }
  return nullptr;
}

DataUsage DataUsage::fromReader(wire::DataUsageCache::Reader reader) {
  DataUsage result;
  result.lastUpdate = reader.getLastUpdate();
  for (auto bucket: reader.getBuckets()) {
    BucketUsage usage;
    usage.name = kj::heapString(bucket.getName());
    usage.objects = bucket.getObjects();
    usage.versions = bucket.getVersions();
    usage.deleteMarkers = bucket.getDeleteMarkers();
    usage.size = bucket.getSize();
    result.buckets.add(kj::mv(usage));
  }
  return result;
}

void DataUsage::copyTo(wire::DataUsageCache::Builder builder) const {
  builder.setLastUpdate(lastUpdate);
  auto list = builder.initBuckets(buckets.size());
  for (uint i = 0; i < buckets.size(); i++) {
    list[i].setName(buckets[i].name);
    list[i].setObjects(buckets[i].objects);
    list[i].setVersions(buckets[i].versions);
    list[i].setDeleteMarkers(buckets[i].deleteMarkers);
    list[i].setSize(buckets[i].size);
  }
}

kj::Promise<void> readExactly(FileReader& reader, kj::ArrayPtr<byte> buffer) {
  if (buffer.size() == 0) return kj::READY_NOW;
  return reader.read(buffer).then([&reader,buffer](size_t n) -> kj::Promise<void> {
    if (n == 0) {
      return GRANITE_ERROR(LESS_DATA, "stream ended ", buffer.size(), " bytes early");
    }
    return readExactly(reader, buffer.slice(n, buffer.size()));
  });
}

}  // namespace storage
}  // namespace granite
