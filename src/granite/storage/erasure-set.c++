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

#include "erasure-set.h"
#include <kj/debug.h>
#include <utility>

namespace granite {
namespace storage {

ErasureSetOptions ErasureSetOptions::fromConfig(ErasureConfig::Reader config) {
  ErasureSetOptions result;
  result.dataBlocks = config.getDataBlocks();
  result.parityBlocks = config.getParityBlocks();
  result.writeQuorum = config.getWriteQuorum();
  result.blockSize = config.getBlockSize();
  result.inlineThreshold = config.getInlineThreshold();
  result.algorithm = config.getBitrotAlgorithm();
  return result;
}

ErasureSet& setForObject(kj::ArrayPtr<const kj::Own<ErasureSet>> sets, kj::StringPtr object) {
  KJ_REQUIRE(sets.size() > 0, "no erasure sets");
  // The low bits pick the rotation within the set.
  return *sets[(hashKey(object) >> 32) % sets.size()];
}

namespace {

struct ObjectName {
  // Arguments of one object operation, kept alive for the whole operation.

  kj::String bucket;
  kj::String object;
  kj::String versionId;
};

kj::Own<ObjectName> nameOf(kj::StringPtr bucket, kj::StringPtr object,
                           kj::StringPtr versionId = nullptr) {
  return kj::heap<ObjectName>(ObjectName {
    kj::heapString(bucket), kj::heapString(object), kj::heapString(versionId)
  });
}

class CollectingSink final: public WalkSink {
public:
  kj::Vector<MetaCacheEntry> entries;

  kj::Promise<void> push(MetaCacheEntry&& entry) override {
    entries.add(kj::mv(entry));
    return kj::READY_NOW;
  }
};

kj::Promise<void> ignoreCode(kj::Promise<void> promise, ErrorCode code) {
  return promise.catch_([code](kj::Exception&& e) -> kj::Promise<void> {
    if (isError(e, code)) return kj::READY_NOW;
    return kj::mv(e);
  });
}

uint64_t shardFileLength(const Erasure& erasure, int64_t size, BitrotAlgorithm algorithm) {
  return bitrotShardFileSize(erasure.shardFileSize(size), erasure.shardSize(), algorithm);
}

}  // namespace

// =======================================================================================

ErasureSet::ErasureSet(uint setIndex, kj::Array<kj::Own<Disk>> disksParam,
                       ErasureSetOptions options, NsLockMap& locks, kj::Timer& timer,
                       HealPolicy healPolicy)
    : setIndex(setIndex), disks(kj::mv(disksParam)), options(options),
      writeQuorum(options.writeQuorum != 0 ? options.writeQuorum
                                           : kj::min(options.dataBlocks + 1,
                                                     uint(disks.size()))),
      locks(locks), timer(timer),
      metadata(disks, options.dataBlocks, writeQuorum,
               [this](kj::StringPtr volume, kj::StringPtr path, kj::StringPtr versionId) {
        queueHeal(volume, path, versionId);
      }),
      tasks(*this), healQueue(timer, healPolicy) {
  KJ_REQUIRE(disks.size() == options.dataBlocks + options.parityBlocks,
             "erasure set size does not match the erasure layout",
             disks.size(), options.dataBlocks, options.parityBlocks);
  KJ_REQUIRE(disks.size() <= 255, "too many disks in one erasure set", disks.size());
  KJ_REQUIRE(writeQuorum >= options.dataBlocks && writeQuorum <= disks.size(),
             "write quorum out of range", writeQuorum);
}

ErasureSet::~ErasureSet() noexcept(false) {}

void ErasureSet::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "erasure set background task failed", setIndex, exception);
}

kj::Array<uint8_t> ErasureSet::distributionFor(kj::StringPtr object) {
  uint n = disks.size();
  uint start = hashKey(object) % n;
  auto result = kj::heapArray<uint8_t>(n);
  for (uint i = 0; i < n; i++) {
    result[i] = 1 + (start + i) % n;
  }
  return result;
}

void ErasureSet::queueHeal(kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId) {
  healQueue.add(*this, bucket, object, versionId);
}

void ErasureSet::cleanupStaging(kj::StringPtr tmpPath) {
  for (uint i = 0; i < disks.size(); i++) {
    cleanupStaging(tmpPath, i);
  }
}

void ErasureSet::cleanupStaging(kj::StringPtr tmpPath, uint disk) {
  if (!disks[disk]->isOnline()) return;
  DeleteOptions options;
  options.recursive = true;
  tasks.add(ignoreCode(disks[disk]->deleteFile(SYSTEM_VOLUME, tmpPath, options),
                       ErrorCode::FILE_NOT_FOUND));
}

struct ErasureSet::PendingCommit: public kj::Refcounted {
  // One write between renameData() and the outcome of its quorum.

  kj::String bucket;
  kj::String object;
  kj::String tmpPath;
  kj::Array<FileInfo> copies;
  kj::Array<kj::Maybe<kj::String>> oldDataDirs;
  bool failed = false;
};

kj::Promise<void> ErasureSet::undoCommit(PendingCommit& commit, uint disk) {
  auto options = kj::heap<DeleteOptions>();
  options->undoWrite = true;
  options->stagingPath = kj::heapString(commit.tmpPath);
  KJ_IF_MAYBE(old, commit.oldDataDirs[disk]) {
    options->oldDataDir = kj::heapString(*old);
  }

  auto promise = disks[disk]->deleteVersion(commit.bucket, commit.object, commit.copies[disk],
                                            false, *options);
  return promise.then([this,&commit,disk]() {
    cleanupStaging(commit.tmpPath, disk);
  }, [this,&commit,disk](kj::Exception&& e) {
    KJ_LOG(ERROR, "couldn't undo failed write", disks[disk]->getEndpoint(), commit.bucket,
           commit.object, e);
    queueHeal(commit.bucket, commit.object, commit.copies[disk].versionId);
  }).attach(kj::mv(options), kj::addRef(commit));
}

template <typename T>
kj::Promise<T> ErasureSet::whileHolding(kj::Own<NsLock> lock, kj::Promise<T> promise) {
  auto lost = lock->whenLost().then([]() -> kj::Promise<T> {
    return GRANITE_ERROR(LOCK_NOT_HELD, "object lock lost before the operation finished");
  });
  return promise.exclusiveJoin(kj::mv(lost)).attach(kj::mv(lock));
}

// =======================================================================================
// buckets

kj::Promise<void> ErasureSet::makeBucket(kj::StringPtr bucket) {
  return kj::evalNow([&]() {
    checkVolumeName(bucket);
    auto calls = KJ_MAP(disk, disks) { return disk->makeVolume(bucket); };
    return collectQuorum(kj::mv(calls), writeQuorum);
  }).then([](QuorumOutcome&& outcome) {
    KJ_IF_MAYBE(e, outcome.reduce(ErrorCode::ERASURE_WRITE_QUORUM)) {
      kj::throwFatalException(kj::mv(*e));
    }
  });
}

kj::Promise<VolumeInfo> ErasureSet::getBucketInfo(kj::StringPtr bucket) {
  auto calls = KJ_MAP(disk, disks) { return disk->statVolume(bucket); };
  return collectValues(kj::mv(calls), options.dataBlocks)
      .then([](QuorumValues<VolumeInfo>&& result) {
    KJ_IF_MAYBE(e, result.outcome.reduce(ErrorCode::METADATA_QUORUM_MISMATCH)) {
      kj::throwFatalException(kj::mv(*e));
    }
    for (auto& value: result.values) {
      KJ_IF_MAYBE(info, value) {
        return kj::mv(*info);
      }
    }
    KJ_UNREACHABLE;
  });
}

kj::Promise<kj::Array<VolumeInfo>> ErasureSet::listBuckets() {
  auto calls = KJ_MAP(disk, disks) { return disk->listVolumes(); };
  return collectValues(kj::mv(calls), options.dataBlocks)
      .then([this](QuorumValues<kj::Array<VolumeInfo>>&& result) {
    KJ_IF_MAYBE(e, result.outcome.reduce(ErrorCode::METADATA_QUORUM_MISMATCH)) {
      kj::throwFatalException(kj::mv(*e));
    }

    // name -> (disks reporting it, earliest creation time)
    std::map<kj::StringPtr, std::pair<uint, int64_t>> counts;
    for (auto& value: result.values) {
      KJ_IF_MAYBE(volumes, value) {
        for (auto& volume: *volumes) {
          auto& slot = counts[volume.name];
          if (slot.first++ == 0 || volume.created < slot.second) slot.second = volume.created;
        }
      }
    }

    kj::Vector<VolumeInfo> buckets;
    for (auto& slot: counts) {
      if (slot.second.first >= options.dataBlocks) {
        VolumeInfo info;
        info.name = kj::heapString(slot.first);
        info.created = slot.second.second;
        buckets.add(kj::mv(info));
      }
    }
    return buckets.releaseAsArray();
  });
}

kj::Promise<void> ErasureSet::deleteBucket(kj::StringPtr bucket, bool force) {
  auto calls = KJ_MAP(disk, disks) { return disk->deleteVolume(bucket, force); };
  return collectQuorum(kj::mv(calls), writeQuorum)
      .then([bucket=kj::heapString(bucket)](QuorumOutcome&& outcome) {
    KJ_IF_MAYBE(e, outcome.reduce(ErrorCode::ERASURE_WRITE_QUORUM)) {
      if (outcome.successCount > 0) {
        KJ_LOG(WARNING, "bucket deleted from some disks only", bucket, outcome.successCount);
      }
      kj::throwFatalException(kj::mv(*e));
    }
  });
}

kj::Promise<uint> ErasureSet::healBucket(kj::StringPtr bucket) {
  auto calls = KJ_MAP(disk, disks) { return disk->statVolume(bucket); };
  return collectValues(kj::mv(calls), 1)
      .then([this,bucket=kj::heapString(bucket)](QuorumValues<VolumeInfo>&& result)
          -> kj::Promise<uint> {
    if (result.outcome.successCount == 0) {
      return GRANITE_ERROR(VOLUME_NOT_FOUND, bucket);
    }

    kj::Vector<kj::Promise<void>> fixes;
    for (uint i = 0; i < disks.size(); i++) {
      KJ_IF_MAYBE(e, result.outcome.errors[i]) {
        if (isError(*e, ErrorCode::VOLUME_NOT_FOUND)) {
          fixes.add(disks[i]->makeVolume(bucket));
        }
      }
    }
    if (fixes.size() == 0) return 0u;

    KJ_LOG(INFO, "healing bucket", bucket, fixes.size());
    uint count = fixes.size();
    return collectQuorum(fixes.releaseAsArray(), count)
        .then([](QuorumOutcome&& outcome) -> uint {
      return outcome.successCount;
    });
  });
}

// =======================================================================================
// writes

kj::Promise<FileInfo> ErasureSet::putObject(kj::StringPtr bucket, kj::StringPtr object,
                                            kj::AsyncInputStream& input, int64_t size,
                                            PutOptions putOptions) {
  auto fi = kj::heap<FileInfo>();
  KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() {
    checkVolumeName(bucket);
    checkPathName(object);
    if (object.size() == 0) {
      GRANITE_FAIL(INVALID_ARGUMENT, "empty object name");
    }
  })) {
    return kj::mv(*e);
  }

  fi->volume = kj::heapString(bucket);
  fi->name = kj::heapString(object);
  if (putOptions.versionId.size() > 0) {
    fi->versionId = kj::mv(putOptions.versionId);
  } else if (putOptions.versioned) {
    fi->versionId = newUuid();
  } else {
    fi->versionId = kj::heapString("");
  }
  fi->isLatest = true;
  fi->modTime = nowNanos();
  fi->size = size;
  fi->metadata = kj::mv(putOptions.userDefined);
  fi->erasure.dataBlocks = options.dataBlocks;
  fi->erasure.parityBlocks = options.parityBlocks;
  fi->erasure.blockSize = options.blockSize;
  fi->erasure.distribution = distributionFor(object);
  fi->erasure.checksums.add(ChecksumInfo { 1, options.algorithm, nullptr });
  fi->parts.add(PartInfo { 1, size, size, fi->modTime, kj::heapString("") });

  auto name = nameOf(bucket, object);
  auto& n = *name;
  return locks.lock(bucket, object, "putObject")
      .then([this,&n,&input,KJ_MVCAP(fi)](kj::Own<NsLock>&& lock) mutable {
    bool inlined = fi->size >= 0 && static_cast<uint64_t>(fi->size) <= options.inlineThreshold;
    auto promise = inlined ? putInline(n.bucket, n.object, input, kj::mv(fi))
                           : putErasure(n.bucket, n.object, input, kj::mv(fi));
    return whileHolding(kj::mv(lock), kj::mv(promise));
  }).attach(kj::mv(name));
}

kj::Promise<FileInfo> ErasureSet::putInline(kj::StringPtr bucket, kj::StringPtr object,
                                            kj::AsyncInputStream& input, kj::Own<FileInfo> fi) {
  size_t size = fi->size;
  auto buffer = kj::heapArray<byte>(size);
  auto bufferPtr = buffer.begin();
  kj::Promise<size_t> read = size == 0 ? kj::Promise<size_t>(size_t(0))
                                       : input.tryRead(bufferPtr, size, size);

  return read.then([this,bucket,object,size,KJ_MVCAP(buffer),KJ_MVCAP(fi)](size_t n) mutable {
    if (n < size) {
      return kj::Promise<FileInfo>(GRANITE_ERROR(
          LESS_DATA, "input ended after ", n, " of ", size, " bytes"));
    }
    fi->data = kj::mv(buffer);
    fi->parts[0].size = size;

    auto& ref = *fi;
    auto promise = metadata.createVersion(bucket, object, ref);
    return promise.then([KJ_MVCAP(fi)]() mutable {
      auto result = kj::mv(*fi);
      result.data = nullptr;
      return result;
    });
  });
}

kj::Promise<FileInfo> ErasureSet::putErasure(kj::StringPtr bucket, kj::StringPtr object,
                                             kj::AsyncInputStream& input,
                                             kj::Own<FileInfo> fi) {
  auto erasure = kj::heap<Erasure>(options.dataBlocks, options.parityBlocks, options.blockSize);
  auto tmpPath = pathJoin(TMP_DIR, newUuid());
  fi->dataDir = newUuid();

  auto partPath = pathJoin(tmpPath, fi->dataDir, partFileName(1));
  int64_t fileSize = fi->size < 0 ? -1 : shardFileLength(*erasure, fi->size, options.algorithm);
  auto opens = KJ_MAP(disk, disks) {
    return disk->createFile(SYSTEM_VOLUME, partPath, fileSize);
  };

  auto& erasureRef = *erasure;
  auto& fiRef = *fi;
  auto encoding = collectValues(kj::mv(opens), disks.size())
      .then([this,&erasureRef,&fiRef,&input](QuorumValues<kj::Own<FileWriter>>&& opened) {
    for (uint i = 0; i < disks.size(); i++) {
      KJ_IF_MAYBE(e, opened.outcome.errors[i]) {
        KJ_LOG(WARNING, "cannot stage shard", disks[i]->getEndpoint(), e->getDescription());
      }
    }
    auto writers = openShardWriters(fiRef, erasureRef, opened.values);

    auto encoder = kj::heap<ErasureEncoder>(erasureRef, kj::mv(writers), writeQuorum);
    auto promise = encoder->encode(input, fiRef.size);
    return promise.then([KJ_MVCAP(encoder)](uint64_t total) mutable {
      return std::make_pair(total, kj::mv(encoder));
    });
  });

  return encoding.then([this,bucket,object,&fiRef,tmpPath=kj::heapString(tmpPath)](
      std::pair<uint64_t, kj::Own<ErasureEncoder>>&& encoded) mutable {
    uint64_t total = encoded.first;
    fiRef.size = total;
    fiRef.parts[0].size = total;
    fiRef.parts[0].actualSize = total;

    auto commit = kj::refcounted<PendingCommit>();
    commit->bucket = kj::heapString(bucket);
    commit->object = kj::heapString(object);
    commit->tmpPath = kj::mv(tmpPath);
    commit->oldDataDirs = kj::heapArray<kj::Maybe<kj::String>>(disks.size());
    auto copies = kj::heapArrayBuilder<FileInfo>(disks.size());
    for (uint i = 0; i < disks.size(); i++) {
      copies.add(copyForDisk(fiRef, i));
    }
    commit->copies = copies.finish();

    // A shard whose writer was dropped while encoding is left out of the commit; that disk is
    // healed afterwards.
    auto shardErrors = encoded.second->getErrors();
    auto& c = *commit;
    auto commits = kj::heapArrayBuilder<kj::Promise<void>>(disks.size());
    for (uint i = 0; i < disks.size(); i++) {
      KJ_IF_MAYBE(e, shardErrors[fiRef.erasure.distribution[i] - 1]) {
        commits.add(kj::Exception(*e));
      } else {
        commits.add(disks[i]->renameData(SYSTEM_VOLUME, c.tmpPath, c.copies[i], bucket, object)
            .then([&c,i](kj::Maybe<kj::String>&& oldDataDir) {
          c.oldDataDirs[i] = kj::mv(oldDataDir);
        }).attach(kj::addRef(c)));
      }
    }

    auto onLate = [this,commit=kj::addRef(c)](uint index, kj::Maybe<kj::Exception>&& error) {
      auto& c = *commit;
      if (c.failed) {
        if (error == nullptr) {
          tasks.add(undoCommit(c, index));
        } else {
          cleanupStaging(c.tmpPath, index);
        }
        return;
      }

      KJ_IF_MAYBE(e, error) {
        KJ_LOG(WARNING, "late shard commit failed", disks[index]->getEndpoint(),
               e->getDescription());
        queueHeal(c.bucket, c.object, c.copies[index].versionId);
      }
      cleanupStaging(c.tmpPath, index);
    };
    auto promise = collectQuorum(commits.finish(), writeQuorum, tasks, kj::mv(onLate));
    return promise.then([this,KJ_MVCAP(commit)](QuorumOutcome&& outcome) -> kj::Promise<void> {
      auto& c = *commit;
      KJ_IF_MAYBE(e, outcome.reduce(ErrorCode::ERASURE_WRITE_QUORUM)) {
        // Disks that did commit would otherwise serve a write that was reported as failed.
        KJ_LOG(WARNING, "object write quorum failed", c.bucket, c.object, *e);
        c.failed = true;
        kj::Vector<kj::Promise<void>> undos;
        for (uint i = 0; i < disks.size(); i++) {
          if (outcome.succeeded(i)) {
            undos.add(undoCommit(c, i));
          } else if (outcome.settled[i]) {
            cleanupStaging(c.tmpPath, i);
          }
        }
        return kj::joinPromises(undos.releaseAsArray())
            .then([KJ_MVCAP(commit),error=kj::mv(*e)]() mutable -> kj::Promise<void> {
          return kj::mv(error);
        });
      }

      for (uint i = 0; i < disks.size(); i++) {
        if (!outcome.settled[i]) continue;
        if (outcome.errors[i] != nullptr) {
          queueHeal(c.bucket, c.object, c.copies[i].versionId);
        }
        cleanupStaging(c.tmpPath, i);
      }
      return kj::READY_NOW;
    });
  }, [this,tmpPath=kj::heapString(tmpPath)](kj::Exception&& e) -> kj::Promise<void> {
    cleanupStaging(tmpPath);
    return kj::mv(e);
  }).then([KJ_MVCAP(fi)]() mutable {
    return kj::mv(*fi);
  }).attach(kj::mv(erasure));
}

// =======================================================================================
// reads

kj::Promise<void> ErasureSet::readErasure(kj::StringPtr bucket, kj::StringPtr object,
                                          ResolvedVersion& resolved, uint64_t offset,
                                          uint64_t length, kj::AsyncOutputStream& output) {
  auto& fi = resolved.info;
  KJ_REQUIRE(fi.erasure.distribution.size() == disks.size(),
             "object was written with a different erasure set layout");

  auto erasure = kj::heap<Erasure>(fi.erasure.dataBlocks, fi.erasure.parityBlocks,
                                   fi.erasure.blockSize);
  auto algorithm = fi.erasure.algorithmFor(1);
  auto partPath = pathJoin(object, fi.dataDir, partFileName(1));

  auto readers = kj::heapArray<kj::Maybe<kj::Own<BitrotReader>>>(disks.size());
  for (uint i = 0; i < disks.size(); i++) {
    if (resolved.current[i] && disks[i]->isOnline()) {
      readers[fi.erasure.distribution[i] - 1] = kj::heap<BitrotReader>(
          *disks[i], kj::heapString(bucket), kj::heapString(partPath),
          erasure->shardFileSize(fi.size), algorithm, erasure->shardSize());
    }
  }

  auto decoder = kj::heap<ErasureDecoder>(*erasure, kj::mv(readers));
  auto& decoderRef = *decoder;
  auto promise = decoder->decode(output, offset, length, fi.size);
  return promise.then([this,&decoderRef,name=nameOf(bucket, object, fi.versionId)]() {
    if (decoderRef.hasErrors()) {
      queueHeal(name->bucket, name->object, name->versionId);
    }
  }).attach(kj::mv(decoder), kj::mv(erasure));
}

kj::Promise<FileInfo> ErasureSet::getObject(kj::StringPtr bucket, kj::StringPtr object,
                                            kj::StringPtr versionId, int64_t offset,
                                            int64_t length, kj::AsyncOutputStream& output) {
  auto name = nameOf(bucket, object, versionId);
  auto& n = *name;
  return locks.rlock(bucket, object, "getObject")
      .then([this,&n,&output,offset,length](kj::Own<NsLock>&& lock) {
    auto promise = metadata.getVersion(n.bucket, n.object, n.versionId, true)
        .then([this,&n,&output,offset,length](ResolvedVersion&& resolvedParam)
            -> kj::Promise<FileInfo> {
      auto resolved = kj::heap<ResolvedVersion>(kj::mv(resolvedParam));
      auto& fi = resolved->info;
      if (fi.deleted) {
        if (n.versionId.size() == 0 || n.versionId == LATEST_VERSION) {
          return GRANITE_ERROR(FILE_NOT_FOUND, n.bucket, "/", n.object, " is deleted");
        }
        return GRANITE_ERROR(METHOD_NOT_ALLOWED, "version ", n.versionId, " is a delete marker");
      }

      if (offset < 0 || offset > fi.size ||
          (length >= 0 && offset + length > fi.size)) {
        return GRANITE_ERROR(INVALID_ARGUMENT, "range ", offset, "+", length,
                             " outside object of ", fi.size, " bytes");
      }
      uint64_t actualLength = length < 0 ? fi.size - offset : length;

      if (resolved->currentCount() < disks.size()) {
        queueHeal(n.bucket, n.object, fi.versionId);
      }

      kj::Promise<void> transfer = nullptr;
      KJ_IF_MAYBE(data, fi.data) {
        transfer = output.write(data->begin() + offset, actualLength);
      } else if (actualLength == 0) {
        transfer = kj::READY_NOW;
      } else {
        transfer = readErasure(n.bucket, n.object, *resolved, offset, actualLength, output);
      }

      return transfer.then([KJ_MVCAP(resolved)]() mutable {
        auto result = kj::mv(resolved->info);
        result.data = nullptr;
        return result;
      });
    });
    return whileHolding(kj::mv(lock), kj::mv(promise));
  }).attach(kj::mv(name));
}

kj::Promise<FileInfo> ErasureSet::getObjectInfo(kj::StringPtr bucket, kj::StringPtr object,
                                                kj::StringPtr versionId) {
  auto name = nameOf(bucket, object, versionId);
  auto& n = *name;
  return locks.rlock(bucket, object, "getObjectInfo")
      .then([this,&n](kj::Own<NsLock>&& lock) {
    auto promise = metadata.getVersion(n.bucket, n.object, n.versionId, false)
        .then([&n](ResolvedVersion&& resolved) -> FileInfo {
      if (resolved.info.deleted) {
        if (n.versionId.size() == 0 || n.versionId == LATEST_VERSION) {
          GRANITE_FAIL(FILE_NOT_FOUND, n.bucket, "/", n.object, " is deleted");
        }
        GRANITE_FAIL(METHOD_NOT_ALLOWED, "version ", n.versionId, " is a delete marker");
      }
      return kj::mv(resolved.info);
    });
    return whileHolding(kj::mv(lock), kj::mv(promise));
  }).attach(kj::mv(name));
}

kj::Promise<kj::Array<FileInfo>> ErasureSet::listObjectVersions(kj::StringPtr bucket,
                                                                kj::StringPtr object) {
  auto name = nameOf(bucket, object);
  auto& n = *name;
  return locks.rlock(bucket, object, "listObjectVersions")
      .then([this,&n](kj::Own<NsLock>&& lock) {
    return whileHolding(kj::mv(lock), metadata.listVersions(n.bucket, n.object));
  }).attach(kj::mv(name));
}

kj::Promise<ListObjectsResult> ErasureSet::listObjects(kj::StringPtr bucket, kj::StringPtr prefix,
                                                       bool recursive, int limit) {
  WalkDirOptions walk;
  walk.bucket = kj::heapString(bucket);
  KJ_IF_MAYBE(slash, prefix.findLast('/')) {
    walk.baseDir = kj::heapString(prefix.slice(0, *slash + 1));
    walk.filterPrefix = kj::heapString(prefix.slice(*slash + 1));
  } else {
    walk.baseDir = kj::heapString("");
    walk.filterPrefix = kj::heapString(prefix);
  }
  walk.forwardTo = kj::heapString("");
  walk.recursive = recursive;

  auto sinks = kj::heapArrayBuilder<kj::Own<CollectingSink>>(disks.size());
  auto walks = kj::heapArrayBuilder<kj::Promise<void>>(disks.size());
  for (auto& disk: disks) {
    auto sink = kj::heap<CollectingSink>();
    walks.add(disk->walkDir(walk, *sink));
    sinks.add(kj::mv(sink));
  }

  return collectQuorum(walks.finish(), options.dataBlocks)
      .then([this,bucket=kj::heapString(bucket),limit,sinks=sinks.finish()](
          QuorumOutcome&& outcome) {
    KJ_IF_MAYBE(e, outcome.reduce(ErrorCode::METADATA_QUORUM_MISMATCH)) {
      kj::throwFatalException(kj::mv(*e));
    }

    // name -> metadata blobs of the disks that reported it.
    std::map<kj::StringPtr, kj::Vector<kj::ArrayPtr<const byte>>> seen;
    for (uint i = 0; i < sinks.size(); i++) {
      if (!outcome.succeeded(i)) continue;
      for (auto& entry: sinks[i]->entries) {
        seen[entry.name].add(entry.metadata);
      }
    }

    ListObjectsResult result;
    for (auto& slot: seen) {
      if (limit > 0 && result.objects.size() + result.prefixes.size() >= uint(limit)) break;

      auto& copies = slot.second;
      if (copies.size() < options.dataBlocks) continue;

      if (slot.first.endsWith("/")) {
        result.prefixes.add(kj::heapString(slot.first));
        continue;
      }

      // The chain a quorum of disks agrees on.
      kj::Vector<FileMeta> metas;
      for (auto& copy: copies) {
        KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() {
          metas.add(FileMeta::parse(copy));
        })) {
          KJ_LOG(WARNING, "skipping unreadable metadata in listing", bucket, slot.first,
                 e->getDescription());
        }
      }
      for (auto& meta: metas) {
        uint64_t signature = meta.signature();
        uint count = 0;
        for (auto& other: metas) {
          if (other.signature() == signature) ++count;
        }
        if (count >= options.dataBlocks) {
          if (!meta.empty()) {
            auto latest = meta.findVersion(bucket, slot.first, LATEST_VERSION, false);
            if (!latest.deleted) result.objects.add(kj::mv(latest));
          }
          break;
        }
      }
    }
    return result;
  });
}

// =======================================================================================
// other mutations

kj::Promise<FileInfo> ErasureSet::deleteObject(kj::StringPtr bucket, kj::StringPtr object,
                                               kj::StringPtr versionId, bool versioned) {
  auto name = nameOf(bucket, object, versionId);
  auto& n = *name;
  return locks.lock(bucket, object, "deleteObject")
      .then([this,&n,versioned](kj::Own<NsLock>&& lock) {
    bool permanent = !versioned || n.versionId.size() > 0;
    return whileHolding(kj::mv(lock),
                        metadata.deleteVersion(n.bucket, n.object, n.versionId, permanent));
  }).attach(kj::mv(name));
}

kj::Promise<void> ErasureSet::putObjectMetadata(kj::StringPtr bucket, kj::StringPtr object,
                                                kj::StringPtr versionId,
                                                std::map<kj::String, kj::String> userDefined) {
  auto name = nameOf(bucket, object, versionId);
  auto& n = *name;
  auto values = kj::heap<std::map<kj::String, kj::String>>(kj::mv(userDefined));
  return locks.lock(bucket, object, "putObjectMetadata")
      .then([this,&n,KJ_MVCAP(values)](kj::Own<NsLock>&& lock) mutable {
    auto promise = metadata.getVersion(n.bucket, n.object, n.versionId, false)
        .then([this,&n,KJ_MVCAP(values)](ResolvedVersion&& resolved) mutable {
      auto fi = kj::heap<FileInfo>(kj::mv(resolved.info));
      if (fi->deleted) {
        return kj::Promise<void>(GRANITE_ERROR(METHOD_NOT_ALLOWED,
            "cannot set metadata on a delete marker"));
      }
      fi->metadata = kj::mv(*values);
      auto promise = metadata.updateMetadata(n.bucket, n.object, *fi);
      return promise.attach(kj::mv(fi));
    });
    return whileHolding(kj::mv(lock), kj::mv(promise));
  }).attach(kj::mv(name));
}

// =======================================================================================
// healing

kj::Promise<void> ErasureSet::healObject(kj::StringPtr bucket, kj::StringPtr object,
                                         kj::StringPtr versionId) {
  auto name = nameOf(bucket, object, versionId);
  auto& n = *name;
  return locks.lock(bucket, object, "healObject").then([this,&n](kj::Own<NsLock>&& lock) {
    auto promise = metadata.readAllCopies(n.bucket, n.object, n.versionId, true)
        .then([this,&n](kj::Array<kj::Maybe<FileInfo>>&& copies) -> kj::Promise<void> {
      // The version a quorum agrees on is the one to restore.
      auto best = findQuorumVersion(copies, options.dataBlocks, n.bucket, n.object);
      if (best == nullptr) {
        return GRANITE_ERROR(METADATA_QUORUM_MISMATCH, "cannot heal ", n.bucket, "/", n.object,
                             ": no version is on ", options.dataBlocks, " disks");
      }

      auto& chosen = KJ_ASSERT_NONNULL(copies[KJ_ASSERT_NONNULL(best)]);
      auto latest = kj::heap<FileInfo>(chosen.clone());
      auto outdated = kj::heapArray<bool>(disks.size());
      for (uint i = 0; i < disks.size(); i++) {
        outdated[i] = true;
        KJ_IF_MAYBE(copy, copies[i]) {
          outdated[i] = !copy->sameVersion(*latest);
        }
      }

      if (latest->deleted || latest->isInline() || latest->dataDir.size() == 0) {
        return healVersion(n.bucket, n.object, kj::mv(latest), kj::mv(outdated));
      }

      // Disks with current metadata may still have lost or corrupt shards.
      auto& ref = *latest;
      auto checks = kj::heapArrayBuilder<kj::Promise<kj::Array<uint32_t>>>(disks.size());
      for (uint i = 0; i < disks.size(); i++) {
        if (outdated[i]) {
          checks.add(kj::heapArray<uint32_t>(0));
        } else {
          checks.add(disks[i]->verifyFile(n.bucket, n.object, ref));
        }
      }
      auto verified = collectValues(checks.finish(), disks.size());
      return verified.then([this,&n,KJ_MVCAP(latest),KJ_MVCAP(outdated)](
          QuorumValues<kj::Array<uint32_t>>&& results) mutable {
        for (uint i = 0; i < disks.size(); i++) {
          if (outdated[i]) continue;
          KJ_IF_MAYBE(codes, results.values[i]) {
            for (auto code: *codes) {
              if (code != CHECK_PART_SUCCESS) outdated[i] = true;
            }
          } else KJ_IF_MAYBE(e, results.outcome.errors[i]) {
            if (!isTransient(classify(*e))) outdated[i] = true;
          }
        }
        return healVersion(n.bucket, n.object, kj::mv(latest), kj::mv(outdated));
      });
    });
    return whileHolding(kj::mv(lock), kj::mv(promise));
  }).attach(kj::mv(name));
}

kj::Array<kj::Maybe<kj::Own<BitrotWriter>>> ErasureSet::openShardWriters(
    const FileInfo& fi, const Erasure& erasure,
    kj::ArrayPtr<kj::Maybe<kj::Own<FileWriter>>> files) {
  auto algorithm = fi.erasure.algorithmFor(1);
  auto writers = kj::heapArray<kj::Maybe<kj::Own<BitrotWriter>>>(disks.size());
  for (uint i = 0; i < files.size(); i++) {
    KJ_IF_MAYBE(file, files[i]) {
      writers[fi.erasure.distribution[i] - 1] =
          kj::heap<BitrotWriter>(kj::mv(*file), algorithm, erasure.shardSize());
    }
  }
  return writers;
}

kj::Promise<void> ErasureSet::healVersion(kj::StringPtr bucket, kj::StringPtr object,
                                          kj::Own<FileInfo> latest, kj::Array<bool> outdated) {
  kj::Vector<uint> targets;
  for (uint i = 0; i < outdated.size(); i++) {
    if (outdated[i]) targets.add(i);
  }
  if (targets.size() == 0) return kj::READY_NOW;

  KJ_LOG(INFO, "healing object", bucket, object, latest->versionId, targets.size());

  // The bucket itself may be missing on a replaced disk.
  auto prepared = KJ_MAP(i, targets) {
    return ignoreCode(disks[i]->makeVolume(bucket), ErrorCode::VOLUME_EXISTS);
  };
  uint targetCount = targets.size();
  auto targetArray = targets.releaseAsArray();

  auto checkAll = [targetCount](QuorumOutcome&& outcome) {
    if (outcome.successCount < targetCount) {
      GRANITE_FAIL(TRANSIENT_DISK_ERROR, targetCount - outcome.successCount, " of ",
                   targetCount, " outdated disks could not be healed yet");
    }
  };

  if (latest->deleted || latest->isInline() || latest->dataDir.size() == 0) {
    // Everything lives in the metadata.
    auto& fi = *latest;
    auto writes = kj::heapArrayBuilder<kj::Promise<void>>(targetCount);
    for (uint j = 0; j < targetCount; j++) {
      uint i = targetArray[j];
      auto copy = kj::heap<FileInfo>(copyForDisk(fi, i));
      auto& copyRef = *copy;
      writes.add(prepared[j].then([this,i,bucket,object,&copyRef]() {
        return disks[i]->writeMetadata(bucket, object, copyRef);
      }).attach(kj::mv(copy)));
    }
    return collectQuorum(writes.finish(), targetCount).then(kj::mv(checkAll))
        .attach(kj::mv(latest));
  }

  // Rebuild the shards of the outdated disks from the others, stage them and commit them the
  // same way a write does.
  auto erasure = kj::heap<Erasure>(latest->erasure.dataBlocks, latest->erasure.parityBlocks,
                                   latest->erasure.blockSize);
  auto algorithm = latest->erasure.algorithmFor(1);
  auto tmpPath = pathJoin(TMP_DIR, newUuid());
  auto stagedPart = pathJoin(tmpPath, latest->dataDir, partFileName(1));
  auto livePart = pathJoin(object, latest->dataDir, partFileName(1));

  auto readers = kj::heapArray<kj::Maybe<kj::Own<BitrotReader>>>(disks.size());
  for (uint i = 0; i < disks.size(); i++) {
    if (!outdated[i] && disks[i]->isOnline()) {
      readers[latest->erasure.distribution[i] - 1] = kj::heap<BitrotReader>(
          *disks[i], kj::heapString(bucket), kj::heapString(livePart),
          erasure->shardFileSize(latest->size), algorithm, erasure->shardSize());
    }
  }
  auto decoder = kj::heap<ErasureDecoder>(*erasure, kj::mv(readers));

  uint64_t fileSize = shardFileLength(*erasure, latest->size, algorithm);
  auto opens = kj::heapArrayBuilder<kj::Promise<kj::Own<FileWriter>>>(disks.size());
  for (uint i = 0; i < disks.size(); i++) {
    if (outdated[i]) {
      opens.add(disks[i]->createFile(SYSTEM_VOLUME, stagedPart, fileSize));
    } else {
      opens.add(GRANITE_ERROR(INVALID_ARGUMENT, "disk is up to date"));
    }
  }

  auto& fi = *latest;
  auto& erasureRef = *erasure;
  auto& decoderRef = *decoder;
  auto rebuilt = collectValues(opens.finish(), targetCount)
      .then([this,&fi,&erasureRef,&decoderRef](QuorumValues<kj::Own<FileWriter>>&& opened) {
    auto writers = openShardWriters(fi, erasureRef, opened.values);
    auto promise = erasureHeal(erasureRef, decoderRef, writers, fi.size);
    return promise.attach(kj::mv(writers));
  });

  return rebuilt.then([this,bucket,object,&fi,KJ_MVCAP(prepared),KJ_MVCAP(targetArray),
                       tmpPath=kj::heapString(tmpPath)]() mutable {
    auto commits = kj::heapArrayBuilder<kj::Promise<void>>(targetArray.size());
    for (uint j = 0; j < targetArray.size(); j++) {
      uint i = targetArray[j];
      auto copy = kj::heap<FileInfo>(copyForDisk(fi, i));
      auto& copyRef = *copy;
      commits.add(prepared[j].then([this,i,bucket,object,&copyRef,
                                    tmpPath=kj::heapString(tmpPath)]() {
        return disks[i]->renameData(SYSTEM_VOLUME, tmpPath, copyRef, bucket, object)
            .ignoreResult();
      }).attach(kj::mv(copy)));
    }
    return collectQuorum(commits.finish(), targetArray.size())
        .then([this,KJ_MVCAP(tmpPath)](QuorumOutcome&& outcome) {
      // Holds the chains and data the commits replaced.
      cleanupStaging(tmpPath);
      return kj::mv(outcome);
    });
  }, [this,tmpPath=kj::heapString(tmpPath)](kj::Exception&& e) -> kj::Promise<QuorumOutcome> {
    cleanupStaging(tmpPath);
    return kj::mv(e);
  }).then(kj::mv(checkAll)).attach(kj::mv(decoder), kj::mv(erasure), kj::mv(latest));
}

}  // namespace storage
}  // namespace granite
