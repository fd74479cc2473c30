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


#include "node-service.h"
#include "quorum.h"
#include <kj/debug.h>

namespace granite {

using storage::DataUsage;
using storage::DeleteOptions;
using storage::FileInfo;
using storage::FileInfoVersions;
using storage::VolumeInfo;
namespace wire = storage::wire;

namespace {

static constexpr uint32_t MAX_READ_CHUNK = 4 << 20;
static constexpr uint WALK_BATCH = 64;

template <typename Context>
void reportError(Context& context, const kj::Exception& exception) {
  auto code = classify(exception);
  if (code == ErrorCode::UNEXPECTED) {
    KJ_LOG(ERROR, "node call failed unexpectedly", exception);
  }
  auto results = context.getResults();
  results.setSuccess(false);
  auto error = results.initError();
  error.setCode(static_cast<uint32_t>(code));
  error.setMessage(exception.getDescription());
}

template <typename Context, typename Func>
kj::Promise<void> respond(Context& context, Func&& func) {
  // Runs func(), which fills in the results, and reports its outcome in `success` and `error`.
  return kj::evalNow(kj::fwd<Func>(func)).then([context]() mutable {
    context.getResults().setSuccess(true);
  }, [context](kj::Exception&& exception) mutable {
    reportError(context, exception);
  });
}

kj::Array<kj::StringPtr> textList(capnp::List<capnp::Text>::Reader list) {
  return KJ_MAP(text, list) -> kj::StringPtr { return text; };
}

template <typename Builder>
void setEncoded(Builder builder, kj::ArrayPtr<const kj::Array<byte>> items) {
  for (uint i = 0; i < items.size(); i++) {
    builder.set(i, items[i]);
  }
}

kj::Array<byte> encodeCheckParts(kj::ArrayPtr<const uint32_t> codes) {
  return storage::buildMessage<wire::CheckPartsResult>([&](wire::CheckPartsResult::Builder b) {
    auto list = b.initResults(codes.size());
    for (uint i = 0; i < codes.size(); i++) {
      list.set(i, codes[i]);
    }
  });
}

void throwIfFailed(const QuorumOutcome& outcome, ErrorCode quorumError) {
  KJ_IF_MAYBE(error, outcome.reduce(quorumError)) {
    kj::throwFatalException(kj::mv(*error));
  }
}

}  // namespace

// =======================================================================================
// Streams

class NodeServiceImpl::ShardWriterImpl final: public ShardWriter::Server {
  // Calls must not overlap; the client waits for each write before sending the next.

public:
  explicit ShardWriterImpl(kj::Own<storage::FileWriter> inner): inner(kj::mv(inner)) {}

protected:
  kj::Promise<void> write(WriteContext context) override {
    return respond(context, [&]() {
      return get().write(context.getParams().getData());
    });
  }

  kj::Promise<void> done(DoneContext context) override {
    return respond(context, [&]() {
      return get().close().then([this]() { inner = nullptr; });
    });
  }

private:
  kj::Maybe<kj::Own<storage::FileWriter>> inner;

  storage::FileWriter& get() {
    KJ_IF_MAYBE(writer, inner) {
      return **writer;
    } else {
      GRANITE_FAIL(INVALID_ARGUMENT, "shard writer already closed");
    }
  }
};

class NodeServiceImpl::ShardReaderImpl final: public ShardReader::Server {
public:
  explicit ShardReaderImpl(kj::Own<storage::FileReader> inner): inner(kj::mv(inner)) {}

protected:
  kj::Promise<void> read(ReadContext context) override {
    return respond(context, [&]() {
      auto buffer = kj::heapArray<byte>(kj::min(context.getParams().getSize(), MAX_READ_CHUNK));
      auto promise = inner->read(buffer);
      return promise.then([context,KJ_MVCAP(buffer)](size_t n) mutable {
        context.getResults().setData(kj::ArrayPtr<const byte>(buffer.begin(), n));
      });
    });
  }

private:
  kj::Own<storage::FileReader> inner;
};

class NodeServiceImpl::RemoteWalkSink final: public storage::WalkSink {
  // Forwards walk entries to the caller's EntrySink in batches.

public:
  explicit RemoteWalkSink(EntrySink::Client sink): sink(kj::mv(sink)) {}

  kj::Promise<void> push(storage::MetaCacheEntry&& entry) override {
    batch.add(storage::encode<wire::MetaCacheEntry>(entry));
    if (batch.size() < WALK_BATCH) return kj::READY_NOW;
    return flush();
  }

  kj::Promise<void> flush() {
    if (batch.size() == 0) return kj::READY_NOW;

    size_t words = 0;
    for (auto& item: batch) words += item.size() / sizeof(capnp::word) + 1;
    auto req = sink.pushRequest(capnp::MessageSize { words + 8, 0 });
    setEncoded(req.initEntries(batch.size()), batch);
    batch.clear();
    return req.send().ignoreResult();
  }

private:
  EntrySink::Client sink;
  kj::Vector<kj::Array<byte>> batch;
};

class NodeServiceImpl::RemoteUsageSink final: public storage::UsageSink {
public:
  RemoteUsageSink(UsageSink::Client sink, kj::TaskSet& tasks)
      : sink(kj::mv(sink)), tasks(tasks) {}

  void update(const DataUsage& usage) override {
    auto req = sink.updateRequest();
    req.setUsage(storage::encode<wire::DataUsageCache>(usage));
    tasks.add(req.send().ignoreResult());
  }

private:
  UsageSink::Client sink;
  kj::TaskSet& tasks;
};

// =======================================================================================

NodeServiceImpl::NodeServiceImpl(kj::ArrayPtr<storage::Disk* const> localDisks, Locker& locker,
                                 kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets,
                                 Peer& peer)
    : localDisks(kj::heapArray(localDisks)), locker(locker), sets(sets), peer(peer),
      tasks(*this) {}

NodeServiceImpl::~NodeServiceImpl() noexcept(false) {}

void NodeServiceImpl::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "node service task failed", exception);
}

storage::Disk& NodeServiceImpl::findDisk(kj::StringPtr endpoint) {
  for (auto disk: localDisks) {
    if (disk->getEndpoint() == endpoint) return *disk;
  }
  GRANITE_FAIL(DISK_NOT_FOUND, "not a disk of this node: ", endpoint);
}

// ---------------------------------------------------------------------------------------
// meta

kj::Promise<void> NodeServiceImpl::ping(PingContext context) {
  return respond(context, [&]() {
    context.getResults().setBody(context.getParams().getBody());
  });
}

kj::Promise<void> NodeServiceImpl::healBucket(HealBucketContext context) {
  return respond(context, [&]() {
    auto bucket = kj::heapString(context.getParams().getBucket());

    // Only recreate a bucket the cluster still agrees exists.
    kj::Promise<void> check = kj::READY_NOW;
    if (sets.size() > 0) {
      check = sets[0]->getBucketInfo(bucket).ignoreResult();
    }

    return check.then([this,KJ_MVCAP(bucket)]() mutable {
      auto promises = KJ_MAP(disk, localDisks) -> kj::Promise<bool> {
        return disk->makeVolume(bucket).then([]() { return true; })
            .catch_([](kj::Exception&& exception) -> kj::Promise<bool> {
          if (isError(exception, ErrorCode::VOLUME_EXISTS)) return false;
          return kj::mv(exception);
        });
      };
      return collectValues(kj::mv(promises), localQuorum())
          .then([KJ_MVCAP(bucket)](QuorumValues<bool>&& result) {
        throwIfFailed(result.outcome, ErrorCode::ERASURE_WRITE_QUORUM);
        uint created = 0;
        for (auto& value: result.values) {
          KJ_IF_MAYBE(v, value) { if (*v) ++created; }
        }
        if (created > 0) {
          KJ_LOG(INFO, "recreated bucket on local disks", bucket, created);
        }
      });
    });
  });
}

kj::Promise<void> NodeServiceImpl::listBucket(ListBucketContext context) {
  return respond(context, [&]() {
    auto promises = KJ_MAP(disk, localDisks) { return disk->listVolumes(); };
    return collectValues(kj::mv(promises), localDisks.size() == 0 ? 0 : 1)
        .then([context](QuorumValues<kj::Array<VolumeInfo>>&& result) mutable {
      throwIfFailed(result.outcome, ErrorCode::VOLUME_NOT_FOUND);

      std::map<kj::StringPtr, const VolumeInfo*> merged;
      for (auto& value: result.values) {
        KJ_IF_MAYBE(volumes, value) {
          for (auto& volume: *volumes) {
            auto iter = merged.find(volume.name);
            if (iter == merged.end() || volume.created < iter->second->created) {
              merged[volume.name] = &volume;
            }
          }
        }
      }

      auto list = context.getResults().initBuckets(merged.size());
      uint i = 0;
      for (auto& entry: merged) {
        list.set(i++, storage::encode<wire::VolumeInfo>(*entry.second));
      }
    });
  });
}

kj::Promise<void> NodeServiceImpl::makeBucket(MakeBucketContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    bool force = params.getForceCreate();
    auto promises = KJ_MAP(disk, localDisks) -> kj::Promise<void> {
      return disk->makeVolume(params.getName())
          .catch_([force](kj::Exception&& exception) -> kj::Promise<void> {
        if (force && isError(exception, ErrorCode::VOLUME_EXISTS)) return kj::READY_NOW;
        return kj::mv(exception);
      });
    };
    return collectQuorum(kj::mv(promises), localQuorum()).then([](QuorumOutcome&& outcome) {
      throwIfFailed(outcome, ErrorCode::ERASURE_WRITE_QUORUM);
    });
  });
}

kj::Promise<void> NodeServiceImpl::getBucketInfo(GetBucketInfoContext context) {
  return respond(context, [&]() {
    auto bucket = context.getParams().getBucket();
    auto promises = KJ_MAP(disk, localDisks) { return disk->statVolume(bucket); };
    return collectValues(kj::mv(promises), 1)
        .then([context](QuorumValues<VolumeInfo>&& result) mutable {
      throwIfFailed(result.outcome, ErrorCode::VOLUME_NOT_FOUND);
      for (auto& value: result.values) {
        KJ_IF_MAYBE(info, value) {
          context.getResults().setInfo(storage::encode<wire::VolumeInfo>(*info));
          return;
        }
      }
    });
  });
}

kj::Promise<void> NodeServiceImpl::deleteBucket(DeleteBucketContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    bool force = params.getForce();
    auto promises = KJ_MAP(disk, localDisks) -> kj::Promise<void> {
      return disk->deleteVolume(params.getBucket(), force)
          .catch_([](kj::Exception&& exception) -> kj::Promise<void> {
        if (isError(exception, ErrorCode::VOLUME_NOT_FOUND)) return kj::READY_NOW;
        return kj::mv(exception);
      });
    };
    return collectQuorum(kj::mv(promises), localQuorum()).then([](QuorumOutcome&& outcome) {
      throwIfFailed(outcome, ErrorCode::ERASURE_WRITE_QUORUM);
    });
  });
}

// ---------------------------------------------------------------------------------------
// disk

kj::Promise<void> NodeServiceImpl::readAll(ReadAllContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).readAll(params.getVolume(), params.getPath())
        .then([context](kj::Array<byte>&& data) mutable {
      context.getResults().setData(data);
    });
  });
}

kj::Promise<void> NodeServiceImpl::writeAll(WriteAllContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).writeAll(
        params.getVolume(), params.getPath(), params.getData());
  });
}

kj::Promise<void> NodeServiceImpl::deleteFile(DeleteFileContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto options = kj::heap(storage::decode<wire::DeleteOptions, DeleteOptions>(
        params.getOptions()));
    auto promise = findDisk(params.getDisk()).deleteFile(
        params.getVolume(), params.getPath(), *options);
    return promise.attach(kj::mv(options));
  });
}

kj::Promise<void> NodeServiceImpl::verifyFile(VerifyFileContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto promise = findDisk(params.getDisk()).verifyFile(params.getVolume(), params.getPath(), *fi);
    return promise.then([context](kj::Array<uint32_t>&& codes) mutable {
      context.getResults().setResult(encodeCheckParts(codes));
    }).attach(kj::mv(fi));
  });
}

kj::Promise<void> NodeServiceImpl::checkParts(CheckPartsContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto promise = findDisk(params.getDisk()).checkParts(params.getVolume(), params.getPath(), *fi);
    return promise.then([context](kj::Array<uint32_t>&& codes) mutable {
      context.getResults().setResult(encodeCheckParts(codes));
    }).attach(kj::mv(fi));
  });
}

kj::Promise<void> NodeServiceImpl::renamePart(RenamePartContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).renamePart(
        params.getSrcVolume(), params.getSrcPath(), params.getDstVolume(), params.getDstPath(),
        params.getMeta());
  });
}

kj::Promise<void> NodeServiceImpl::renameFile(RenameFileContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).renameFile(
        params.getSrcVolume(), params.getSrcPath(), params.getDstVolume(), params.getDstPath());
  });
}

kj::Promise<void> NodeServiceImpl::renameData(RenameDataContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto promise = findDisk(params.getDisk()).renameData(
        params.getSrcVolume(), params.getSrcPath(), *fi,
        params.getDstVolume(), params.getDstPath());
    return promise.then([context](kj::Maybe<kj::String>&& oldDataDir) mutable {
      context.getResults().setResult(storage::buildMessage<wire::RenameDataResult>(
          [&](wire::RenameDataResult::Builder builder) {
        KJ_IF_MAYBE(dir, oldDataDir) {
          builder.setOldDataDir(*dir);
        }
      }));
    }).attach(kj::mv(fi));
  });
}

kj::Promise<void> NodeServiceImpl::createFile(CreateFileContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).createFile(
        params.getVolume(), params.getPath(), params.getSize())
        .then([context](kj::Own<storage::FileWriter>&& writer) mutable {
      context.getResults().setWriter(kj::heap<ShardWriterImpl>(kj::mv(writer)));
    });
  });
}

kj::Promise<void> NodeServiceImpl::appendFile(AppendFileContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).appendFile(params.getVolume(), params.getPath())
        .then([context](kj::Own<storage::FileWriter>&& writer) mutable {
      context.getResults().setWriter(kj::heap<ShardWriterImpl>(kj::mv(writer)));
    });
  });
}

kj::Promise<void> NodeServiceImpl::readFileStream(ReadFileStreamContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).readFileStream(
        params.getVolume(), params.getPath(), params.getOffset(), params.getLength())
        .then([context](kj::Own<storage::FileReader>&& reader) mutable {
      context.getResults().setReader(kj::heap<ShardReaderImpl>(kj::mv(reader)));
    });
  });
}

kj::Promise<void> NodeServiceImpl::listDir(ListDirContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).listDir(
        params.getVolume(), params.getDirPath(), params.getCount())
        .then([context](kj::Array<kj::String>&& entries) mutable {
      auto list = context.getResults().initEntries(entries.size());
      for (uint i = 0; i < entries.size(); i++) {
        list.set(i, entries[i]);
      }
    });
  });
}

kj::Promise<void> NodeServiceImpl::walkDir(WalkDirContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto& disk = findDisk(params.getDisk());
    auto options = kj::heap(storage::decode<wire::WalkDirOptions, storage::WalkDirOptions>(
        params.getOptions()));
    auto sink = kj::heap<RemoteWalkSink>(params.getSink());
    auto& sinkRef = *sink;
    auto promise = disk.walkDir(*options, sinkRef);
    return promise.then([&sinkRef]() { return sinkRef.flush(); })
        .attach(kj::mv(options), kj::mv(sink));
  });
}

kj::Promise<void> NodeServiceImpl::makeVolumes(MakeVolumesContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto volumes = textList(params.getVolumes());
    auto promise = findDisk(params.getDisk()).makeVolumes(volumes);
    return promise.attach(kj::mv(volumes));
  });
}

kj::Promise<void> NodeServiceImpl::makeVolume(MakeVolumeContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).makeVolume(params.getVolume());
  });
}

kj::Promise<void> NodeServiceImpl::listVolumes(ListVolumesContext context) {
  return respond(context, [&]() {
    return findDisk(context.getParams().getDisk()).listVolumes()
        .then([context](kj::Array<VolumeInfo>&& volumes) mutable {
      auto list = context.getResults().initVolumes(volumes.size());
      for (uint i = 0; i < volumes.size(); i++) {
        list.set(i, storage::encode<wire::VolumeInfo>(volumes[i]));
      }
    });
  });
}

kj::Promise<void> NodeServiceImpl::statVolume(StatVolumeContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).statVolume(params.getVolume())
        .then([context](VolumeInfo&& info) mutable {
      context.getResults().setInfo(storage::encode<wire::VolumeInfo>(info));
    });
  });
}

kj::Promise<void> NodeServiceImpl::deleteVolume(DeleteVolumeContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).deleteVolume(params.getVolume(), params.getForce());
  });
}

kj::Promise<void> NodeServiceImpl::deletePaths(DeletePathsContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto paths = textList(params.getPaths());
    auto promise = findDisk(params.getDisk()).deletePaths(params.getVolume(), paths);
    return promise.attach(kj::mv(paths));
  });
}

kj::Promise<void> NodeServiceImpl::updateMetadata(UpdateMetadataContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto options = kj::heap(storage::decode<wire::UpdateMetadataOptions,
                                            storage::UpdateMetadataOptions>(params.getOptions()));
    auto promise = findDisk(params.getDisk()).updateMetadata(
        params.getVolume(), params.getPath(), *fi, *options);
    return promise.attach(kj::mv(fi), kj::mv(options));
  });
}

kj::Promise<void> NodeServiceImpl::writeMetadata(WriteMetadataContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto promise = findDisk(params.getDisk()).writeMetadata(
        params.getVolume(), params.getPath(), *fi);
    return promise.attach(kj::mv(fi));
  });
}

kj::Promise<void> NodeServiceImpl::readVersion(ReadVersionContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto options = kj::heap(storage::decode<wire::ReadOptions, storage::ReadOptions>(
        params.getOptions()));
    auto promise = findDisk(params.getDisk()).readVersion(
        params.getVolume(), params.getPath(), params.getVersionId(), *options);
    return promise.then([context](FileInfo&& fi) mutable {
      context.getResults().setFileInfo(fi.encode());
    }).attach(kj::mv(options));
  });
}

kj::Promise<void> NodeServiceImpl::readXl(ReadXlContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).readXl(
        params.getVolume(), params.getPath(), params.getReadData())
        .then([context](kj::Array<byte>&& raw) mutable {
      context.getResults().setRawFileInfo(raw);
    });
  });
}

kj::Promise<void> NodeServiceImpl::deleteVersion(DeleteVersionContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto fi = kj::heap(FileInfo::decode(params.getFileInfo()));
    auto options = kj::heap(storage::decode<wire::DeleteOptions, DeleteOptions>(
        params.getOptions()));
    auto promise = findDisk(params.getDisk()).deleteVersion(
        params.getVolume(), params.getPath(), *fi, params.getForceDelMarker(), *options);
    return promise.attach(kj::mv(fi), kj::mv(options));
  });
}

kj::Promise<void> NodeServiceImpl::deleteVersions(DeleteVersionsContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto list = params.getVersions();
    auto versions = KJ_MAP(item, list) {
      return storage::decode<wire::FileInfoVersions, FileInfoVersions>(item);
    };
    auto options = kj::heap(storage::decode<wire::DeleteOptions, DeleteOptions>(
        params.getOptions()));
    auto promise = findDisk(params.getDisk()).deleteVersions(
        params.getVolume(), versions, *options);
    return promise.then([context](kj::Array<kj::Maybe<kj::Exception>>&& results) mutable {
      auto errors = context.getResults().initErrors(results.size());
      for (uint i = 0; i < results.size(); i++) {
        KJ_IF_MAYBE(exception, results[i]) {
          errors[i].setCode(static_cast<uint32_t>(classify(*exception)));
          errors[i].setMessage(exception->getDescription());
        }
      }
    }).attach(kj::mv(versions), kj::mv(options));
  });
}

kj::Promise<void> NodeServiceImpl::readMultiple(ReadMultipleContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto request = kj::heap(storage::decode<wire::ReadMultipleRequest,
                                            storage::ReadMultipleRequest>(params.getRequest()));
    auto promise = findDisk(params.getDisk()).readMultiple(*request);
    return promise.then([context](kj::Array<storage::ReadMultipleResult>&& results) mutable {
      auto encoded = KJ_MAP(result, results) {
        return storage::encode<wire::ReadMultipleResult>(result);
      };
      size_t words = 0;
      for (auto& item: encoded) words += item.size() / sizeof(capnp::word) + 1;
      setEncoded(context.getResults(capnp::MessageSize { words + 16, 0 })
                     .initResults(encoded.size()), encoded);
    }).attach(kj::mv(request));
  });
}

kj::Promise<void> NodeServiceImpl::diskInfo(DiskInfoContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return findDisk(params.getDisk()).diskInfo(params.getMetrics())
        .then([context](storage::DiskInfo&& info) mutable {
      context.getResults().setInfo(storage::encode<wire::DiskInfo>(info));
    });
  });
}

kj::Promise<void> NodeServiceImpl::nsScanner(NsScannerContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    auto& disk = findDisk(params.getDisk());
    auto cache = storage::decode<wire::DataUsageCache, DataUsage>(params.getCache());
    auto sink = kj::heap<RemoteUsageSink>(params.getUpdates(), tasks);
    auto promise = disk.nsScanner(kj::mv(cache), *sink);
    return promise.then([context](DataUsage&& usage) mutable {
      context.getResults().setCache(storage::encode<wire::DataUsageCache>(usage));
    }).attach(kj::mv(sink));
  });
}

// ---------------------------------------------------------------------------------------
// lock

template <typename Context, typename Func>
kj::Promise<void> NodeServiceImpl::lockCall(Context& context, ErrorCode refusal, Func&& func) {
  return respond(context, [&]() {
    auto args = kj::heap(LockRequest::decode(context.getParams().getArgs()));
    auto promise = func(*args);
    return promise.then([refusal](bool granted) {
      if (!granted) {
        kj::throwFatalException(makeError(refusal, __FILE__, __LINE__,
                                          kj::str("refused by lock service")));
      }
    }).attach(kj::mv(args));
  });
}

kj::Promise<void> NodeServiceImpl::lock(LockContext context) {
  return lockCall(context, ErrorCode::LOCK_CONFLICT,
                  [this](const LockRequest& args) { return locker.lock(args); });
}

kj::Promise<void> NodeServiceImpl::unlock(UnlockContext context) {
  return lockCall(context, ErrorCode::LOCK_NOT_HELD,
                  [this](const LockRequest& args) { return locker.unlock(args); });
}

kj::Promise<void> NodeServiceImpl::rLock(RLockContext context) {
  return lockCall(context, ErrorCode::LOCK_CONFLICT,
                  [this](const LockRequest& args) { return locker.rlock(args); });
}

kj::Promise<void> NodeServiceImpl::rUnlock(RUnlockContext context) {
  return lockCall(context, ErrorCode::LOCK_NOT_HELD,
                  [this](const LockRequest& args) { return locker.runlock(args); });
}

kj::Promise<void> NodeServiceImpl::forceUnlock(ForceUnlockContext context) {
  return lockCall(context, ErrorCode::LOCK_NOT_HELD,
                  [this](const LockRequest& args) { return locker.forceUnlock(args); });
}

kj::Promise<void> NodeServiceImpl::refresh(RefreshContext context) {
  return lockCall(context, ErrorCode::LOCK_NOT_HELD,
                  [this](const LockRequest& args) { return locker.refresh(args); });
}

// ---------------------------------------------------------------------------------------
// peer

kj::Promise<void> NodeServiceImpl::localStorageInfo(LocalStorageInfoContext context) {
  return respond(context, [&]() {
    return peer.localStorageInfo(context.getParams().getMetrics())
        .then([context](kj::Array<storage::DiskInfo>&& infos) mutable {
      auto list = context.getResults().initStorageInfo(infos.size());
      for (uint i = 0; i < infos.size(); i++) {
        list.set(i, storage::encode<wire::DiskInfo>(infos[i]));
      }
    });
  });
}

kj::Promise<void> NodeServiceImpl::serverInfo(ServerInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setServerProperties(
        encodeProperties(peer.serverInfo(context.getParams().getMetrics())));
  });
}

kj::Promise<void> NodeServiceImpl::getCpus(GetCpusContext context) {
  return respond(context, [&]() {
    context.getResults().setCpus(encodeProperties(peer.getCpus()));
  });
}

kj::Promise<void> NodeServiceImpl::getNetInfo(GetNetInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setNetInfo(encodeProperties(peer.getNetInfo()));
  });
}

kj::Promise<void> NodeServiceImpl::getPartitions(GetPartitionsContext context) {
  return respond(context, [&]() {
    context.getResults().setPartitions(encodeProperties(peer.getPartitions()));
  });
}

kj::Promise<void> NodeServiceImpl::getOsInfo(GetOsInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setOsInfo(encodeProperties(peer.getOsInfo()));
  });
}

kj::Promise<void> NodeServiceImpl::getSeLinuxInfo(GetSeLinuxInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setSeLinuxInfo(encodeProperties(peer.getSeLinuxInfo()));
  });
}

kj::Promise<void> NodeServiceImpl::getSysConfig(GetSysConfigContext context) {
  return respond(context, [&]() {
    context.getResults().setSysConfig(encodeProperties(peer.getSysConfig()));
  });
}

kj::Promise<void> NodeServiceImpl::getSysErrors(GetSysErrorsContext context) {
  return respond(context, [&]() {
    context.getResults().setSysErrors(encodeProperties(peer.getSysErrors()));
  });
}

kj::Promise<void> NodeServiceImpl::getMemInfo(GetMemInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setMemInfo(encodeProperties(peer.getMemInfo()));
  });
}

kj::Promise<void> NodeServiceImpl::getMetrics(GetMetricsContext context) {
  return respond(context, [&]() {
    context.getResults().setMetrics(
        encodeProperties(peer.getMetrics(context.getParams().getMetricType())));
  });
}

kj::Promise<void> NodeServiceImpl::getProcInfo(GetProcInfoContext context) {
  return respond(context, [&]() {
    context.getResults().setProcInfo(encodeProperties(peer.getProcInfo()));
  });
}

kj::Promise<void> NodeServiceImpl::startProfiling(StartProfilingContext context) {
  return respond(context, [&]() {
    return peer.getHooks().startProfiling(context.getParams().getProfiler());
  });
}

kj::Promise<void> NodeServiceImpl::downloadProfileData(DownloadProfileDataContext context) {
  return respond(context, [&]() {
    return peer.getHooks().downloadProfileData()
        .then([context](kj::Array<byte>&& data) mutable {
      context.getResults().setData(data);
    });
  });
}

kj::Promise<void> NodeServiceImpl::getBucketStats(GetBucketStatsContext context) {
  return respond(context, [&]() {
    context.getResults().setBucketStats(storage::encode<wire::DataUsageCache>(
        peer.getBucketStats(context.getParams().getBucket())));
  });
}

kj::Promise<void> NodeServiceImpl::getSrMetrics(GetSrMetricsContext context) {
  return respond(context, [&]() {
    context.getResults().setSrMetricsSummary(encodeProperties(peer.getSrMetrics()));
  });
}

kj::Promise<void> NodeServiceImpl::getAllBucketStats(GetAllBucketStatsContext context) {
  return respond(context, [&]() {
    context.getResults().setBucketStatsMap(
        storage::encode<wire::DataUsageCache>(peer.getUsage()));
  });
}

kj::Promise<void> NodeServiceImpl::loadBucketMetadata(LoadBucketMetadataContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadBucketMetadata(context.getParams().getBucket());
  });
}

kj::Promise<void> NodeServiceImpl::deleteBucketMetadata(DeleteBucketMetadataContext context) {
  return respond(context, [&]() {
    return peer.getHooks().deleteBucketMetadata(context.getParams().getBucket());
  });
}

kj::Promise<void> NodeServiceImpl::deletePolicy(DeletePolicyContext context) {
  return respond(context, [&]() {
    return peer.getHooks().deletePolicy(context.getParams().getPolicyName());
  });
}

kj::Promise<void> NodeServiceImpl::loadPolicy(LoadPolicyContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadPolicy(context.getParams().getPolicyName());
  });
}

kj::Promise<void> NodeServiceImpl::loadPolicyMapping(LoadPolicyMappingContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return peer.getHooks().loadPolicyMapping(
        params.getUserOrGroup(), params.getUserType(), params.getIsGroup());
  });
}

kj::Promise<void> NodeServiceImpl::deleteUser(DeleteUserContext context) {
  return respond(context, [&]() {
    return peer.getHooks().deleteUser(context.getParams().getAccessKey());
  });
}

kj::Promise<void> NodeServiceImpl::deleteServiceAccount(DeleteServiceAccountContext context) {
  return respond(context, [&]() {
    return peer.getHooks().deleteServiceAccount(context.getParams().getAccessKey());
  });
}

kj::Promise<void> NodeServiceImpl::loadUser(LoadUserContext context) {
  return respond(context, [&]() {
    auto params = context.getParams();
    return peer.getHooks().loadUser(params.getAccessKey(), params.getTemp());
  });
}

kj::Promise<void> NodeServiceImpl::loadServiceAccount(LoadServiceAccountContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadServiceAccount(context.getParams().getAccessKey());
  });
}

kj::Promise<void> NodeServiceImpl::loadGroup(LoadGroupContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadGroup(context.getParams().getGroup());
  });
}

kj::Promise<void> NodeServiceImpl::reloadSiteReplicationConfig(
    ReloadSiteReplicationConfigContext context) {
  return respond(context, [&]() {
    return peer.getHooks().reloadSiteReplicationConfig();
  });
}

kj::Promise<void> NodeServiceImpl::signalService(SignalServiceContext context) {
  return respond(context, [&]() {
    auto vars = decodeProperties(context.getParams().getVars());
    auto iter = vars.find(kj::heapString("signal"));
    if (iter == vars.end()) {
      GRANITE_FAIL(INVALID_ARGUMENT, "signal not specified");
    }
    auto signal = kj::mv(iter->second);
    auto promise = peer.getHooks().signalService(signal);
    return promise.attach(kj::mv(signal));
  });
}

kj::Promise<void> NodeServiceImpl::backgroundHealStatus(BackgroundHealStatusContext context) {
  return respond(context, [&]() {
    context.getResults().setBgHealState(peer.getHealState());
  });
}

kj::Promise<void> NodeServiceImpl::getMetacacheListing(GetMetacacheListingContext context) {
  return respond(context, [&]() {
    auto listing = peer.getMetacache(decodeProperties(context.getParams().getOptions()));
    context.getResults().setMetacache(encodeProperties(listing));
  });
}

kj::Promise<void> NodeServiceImpl::updateMetacacheListing(
    UpdateMetacacheListingContext context) {
  return respond(context, [&]() {
    auto listing = peer.updateMetacache(decodeProperties(context.getParams().getMetacache()));
    context.getResults().setMetacache(encodeProperties(listing));
  });
}

kj::Promise<void> NodeServiceImpl::reloadPoolMeta(ReloadPoolMetaContext context) {
  return respond(context, [&]() {
    return peer.getHooks().reloadPoolMeta();
  });
}

kj::Promise<void> NodeServiceImpl::stopRebalance(StopRebalanceContext context) {
  return respond(context, [&]() {
    return peer.getHooks().stopRebalance();
  });
}

kj::Promise<void> NodeServiceImpl::loadRebalanceMeta(LoadRebalanceMetaContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadRebalanceMeta(context.getParams().getStartRebalance());
  });
}

kj::Promise<void> NodeServiceImpl::loadTransitionTierConfig(
    LoadTransitionTierConfigContext context) {
  return respond(context, [&]() {
    return peer.getHooks().loadTransitionTierConfig();
  });
}

}  // namespace granite
