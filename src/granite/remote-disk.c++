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

#include "remote-disk.h"
#include <kj/debug.h>
#include <string.h>

namespace granite {

using storage::DataUsage;
using storage::DeleteOptions;
using storage::DiskInfo;
using storage::FileInfo;
using storage::FileInfoVersions;
using storage::MetaCacheEntry;
using storage::ReadMultipleRequest;
using storage::ReadMultipleResult;
using storage::ReadOptions;
using storage::UpdateMetadataOptions;
using storage::VolumeInfo;
using storage::WalkDirOptions;
namespace wire = storage::wire;

RetryPolicy RetryPolicy::fromConfig(DiskHealthConfig::Reader config) {
  RetryPolicy result;
  result.maxRetries = config.getMaxRetries();
  return result;
}

namespace {

typedef kj::Function<kj::Promise<bool>()> Check;

static constexpr uint32_t MAX_READ_CHUNK = 1 << 20;

template <typename T>
kj::Promise<T> appliedResult() { return T(); }
template <>
kj::Promise<void> appliedResult<void>() { return kj::READY_NOW; }

template <typename Sink>
class SinkRef: public kj::Refcounted {
  // Lets a sink capability outlive the local sink it forwards to. Once the call that handed the
  // sink out completes, further pushes fail instead of touching the sink.

public:
  explicit SinkRef(Sink& sink): sink(sink) {}

  kj::Maybe<Sink&> get() { return sink; }
  void detach() { sink = nullptr; }

private:
  kj::Maybe<Sink&> sink;
};

template <typename Sink>
class SinkDetacher {
public:
  explicit SinkDetacher(kj::Own<SinkRef<Sink>> ref): ref(kj::mv(ref)) {}
  ~SinkDetacher() noexcept(false) { ref->detach(); }
  KJ_DISALLOW_COPY(SinkDetacher);

private:
  kj::Own<SinkRef<Sink>> ref;
};

kj::Array<kj::String> copyStrings(kj::ArrayPtr<const kj::StringPtr> strings) {
  return KJ_MAP(s, strings) { return kj::heapString(s); };
}

template <typename Builder>
void setStrings(Builder builder, kj::ArrayPtr<const kj::String> strings) {
  for (uint i = 0; i < strings.size(); i++) {
    builder.set(i, strings[i]);
  }
}

kj::Array<uint32_t> decodeCheckParts(capnp::Data::Reader bytes) {
  storage::MessageBlob<wire::CheckPartsResult> blob(bytes);
  auto results = blob.get().getResults();
  auto result = kj::heapArray<uint32_t>(results.size());
  for (uint i = 0; i < results.size(); i++) {
    result[i] = results[i];
  }
  return result;
}

kj::StringPtr versionToRead(kj::StringPtr versionId) {
  return versionId.size() == 0 ? kj::StringPtr(storage::NULL_VERSION) : versionId;
}

bool isNotFound(const kj::Exception& exception) {
  auto code = classify(exception);
  return code == ErrorCode::FILE_NOT_FOUND || code == ErrorCode::FILE_VERSION_NOT_FOUND ||
         code == ErrorCode::VOLUME_NOT_FOUND;
}

}  // namespace

// =======================================================================================

class RemoteDisk::WriterImpl final: public storage::FileWriter {
public:
  explicit WriterImpl(ShardWriter::Client writer): writer(kj::mv(writer)) {}

  kj::Promise<void> write(kj::ArrayPtr<const byte> data) override {
    auto req = writer.writeRequest(
        capnp::MessageSize { data.size() / sizeof(capnp::word) + 8, 0 });
    req.setData(data);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }

  kj::Promise<void> close() override {
    return writer.doneRequest().send().then([](auto&& response) { checkResponse(response); });
  }

private:
  ShardWriter::Client writer;
};

class RemoteDisk::ReaderImpl final: public storage::FileReader {
public:
  explicit ReaderImpl(ShardReader::Client reader): reader(kj::mv(reader)) {}

  kj::Promise<size_t> read(kj::ArrayPtr<byte> buffer) override {
    return readMore(buffer, 0);
  }

private:
  ShardReader::Client reader;
  bool ended = false;

  kj::Promise<size_t> readMore(kj::ArrayPtr<byte> buffer, size_t filled) {
    if (ended || filled == buffer.size()) return filled;

    auto req = reader.readRequest();
    req.setSize(kj::min(buffer.size() - filled, size_t(MAX_READ_CHUNK)));
    return req.send().then([this,buffer,filled](auto&& response) -> kj::Promise<size_t> {
      checkResponse(response);
      auto data = response.getData();
      if (data.size() == 0) {
        ended = true;
        return filled;
      }
      KJ_REQUIRE(data.size() <= buffer.size() - filled, "peer returned more than requested");
      memcpy(buffer.begin() + filled, data.begin(), data.size());
      return readMore(buffer, filled + data.size());
    });
  }
};

class RemoteDisk::EntrySinkImpl final: public EntrySink::Server {
public:
  explicit EntrySinkImpl(kj::Own<SinkRef<storage::WalkSink>> target)
      : target(kj::mv(target)) {}

protected:
  kj::Promise<void> push(PushContext context) override {
    auto entries = context.getParams().getEntries();
    auto decoded = kj::heapArrayBuilder<MetaCacheEntry>(entries.size());
    for (auto entry: entries) {
      decoded.add(storage::decode<wire::MetaCacheEntry, MetaCacheEntry>(entry));
    }
    context.releaseParams();
    return pushFrom(decoded.finish(), 0);
  }

private:
  kj::Own<SinkRef<storage::WalkSink>> target;

  kj::Promise<void> pushFrom(kj::Array<MetaCacheEntry> entries, uint i) {
    if (i == entries.size()) return kj::READY_NOW;

    KJ_IF_MAYBE(sink, target->get()) {
      auto promise = sink->push(kj::mv(entries[i]));
      return promise.then([this,KJ_MVCAP(entries),i]() mutable {
        return pushFrom(kj::mv(entries), i + 1);
      });
    } else {
      return KJ_EXCEPTION(DISCONNECTED, "directory walk was cancelled");
    }
  }
};

class RemoteDisk::UsageSinkImpl final: public UsageSink::Server {
public:
  explicit UsageSinkImpl(kj::Own<SinkRef<storage::UsageSink>> target)
      : target(kj::mv(target)) {}

protected:
  kj::Promise<void> update(UpdateContext context) override {
    KJ_IF_MAYBE(sink, target->get()) {
      sink->update(storage::decode<wire::DataUsageCache, DataUsage>(
          context.getParams().getUsage()));
      return kj::READY_NOW;
    } else {
      return KJ_EXCEPTION(DISCONNECTED, "namespace scan was cancelled");
    }
  }

private:
  kj::Own<SinkRef<storage::UsageSink>> target;
};

// =======================================================================================

RemoteDisk::RemoteDisk(kj::StringPtr endpoint, NodeConnections& connections, kj::Timer& timer,
                       RetryPolicy policy)
    : endpoint(kj::heapString(endpoint)), node(Endpoint::parse(endpoint).node),
      connections(connections), timer(timer), policy(policy) {}

RemoteDisk::~RemoteDisk() noexcept(false) {}

template <typename T>
kj::Promise<T> RemoteDisk::retrying(kj::Function<kj::Promise<T>()> call,
                                    kj::Maybe<kj::Function<kj::Promise<bool>()>> applied) {
  auto retry = kj::heap<Retry<T>>(Retry<T> { kj::mv(call), kj::mv(applied), 0 });
  auto promise = attempt(*retry);
  return promise.attach(kj::mv(retry));
}

template <typename T>
kj::Promise<T> RemoteDisk::attempt(Retry<T>& retry) {
  auto promise = kj::evalNow([&]() { return retry.call(); });
  return promise.catch_([this,&retry](kj::Exception&& exception) -> kj::Promise<T> {
    if (classify(exception) != ErrorCode::TRANSIENT_DISK_ERROR) {
      return kj::mv(exception);
    }
    if (retry.attempt >= policy.maxRetries) {
      KJ_LOG(WARNING, "remote disk unreachable", endpoint, retry.attempt + 1,
             exception.getDescription());
      return GRANITE_ERROR(DISK_OFFLINE, endpoint, ": ", exception.getDescription());
    }

    ++retry.attempt;
    auto delay = timer.afterDelay(policy.retryDelay * retry.attempt);
    KJ_IF_MAYBE(applied, retry.applied) {
      auto& check = *applied;
      return delay.then([&check]() { return check(); })
          .catch_([](kj::Exception&& exception) -> kj::Promise<bool> {
        if (isTransient(classify(exception))) return false;
        return kj::mv(exception);
      }).then([this,&retry](bool done) -> kj::Promise<T> {
        if (done) {
          KJ_LOG(INFO, "remote call took effect before its connection failed", endpoint);
          return appliedResult<T>();
        }
        return attempt(retry);
      });
    }

    return delay.then([this,&retry]() { return attempt(retry); });
  });
}

kj::Promise<bool> RemoteDisk::exists(kj::StringPtr volume, kj::StringPtr path) {
  kj::String dir;
  kj::String name;
  KJ_IF_MAYBE(slash, path.findLast('/')) {
    dir = kj::heapString(path.slice(0, *slash));
    name = kj::heapString(path.slice(*slash + 1));
  } else {
    dir = kj::heapString("");
    name = kj::heapString(path);
  }

  return listDir(volume, dir, -1).then([KJ_MVCAP(name)](kj::Array<kj::String>&& entries) {
    for (auto& entry: entries) {
      if (entry == name) return true;
      if (entry.size() == name.size() + 1 && entry.startsWith(name) && entry.endsWith("/")) {
        return true;
      }
    }
    return false;
  }).catch_([](kj::Exception&& exception) -> kj::Promise<bool> {
    if (isNotFound(exception)) return false;
    return kj::mv(exception);
  });
}

// ---------------------------------------------------------------------------------------

kj::Promise<kj::String> RemoteDisk::getDiskId() {
  return diskInfo(false).then([](DiskInfo&& info) { return kj::mv(info.id); });
}

kj::Promise<DiskInfo> RemoteDisk::diskInfo(bool metrics) {
  return retrying<DiskInfo>([this,metrics]() {
    auto req = service().diskInfoRequest();
    req.setDisk(endpoint);
    req.setMetrics(metrics);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return storage::decode<wire::DiskInfo, DiskInfo>(response.getInfo());
    });
  });
}

kj::Promise<void> RemoteDisk::makeVolume(kj::StringPtr volume) {
  return retrying<void>([this,volume=kj::heapString(volume)]() {
    auto req = service().makeVolumeRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,volume=kj::heapString(volume)]() {
    return statVolume(volume).then([](VolumeInfo&&) { return true; });
  }));
}

kj::Promise<void> RemoteDisk::makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) {
  return retrying<void>([this,volumes=copyStrings(volumes)]() {
    auto req = service().makeVolumesRequest();
    req.setDisk(endpoint);
    setStrings(req.initVolumes(volumes.size()), volumes);
    return req.send().then([](auto&& response) { checkResponse(response); });
  });
}

kj::Promise<kj::Array<VolumeInfo>> RemoteDisk::listVolumes() {
  return retrying<kj::Array<VolumeInfo>>([this]() {
    auto req = service().listVolumesRequest();
    req.setDisk(endpoint);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      auto volumes = response.getVolumes();
      return KJ_MAP(volume, volumes) {
        return storage::decode<wire::VolumeInfo, VolumeInfo>(volume);
      };
    });
  });
}

kj::Promise<VolumeInfo> RemoteDisk::statVolume(kj::StringPtr volume) {
  return retrying<VolumeInfo>([this,volume=kj::heapString(volume)]() {
    auto req = service().statVolumeRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return storage::decode<wire::VolumeInfo, VolumeInfo>(response.getInfo());
    });
  });
}

kj::Promise<void> RemoteDisk::deleteVolume(kj::StringPtr volume, bool force) {
  return retrying<void>([this,volume=kj::heapString(volume),force]() {
    auto req = service().deleteVolumeRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setForce(force);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,volume=kj::heapString(volume)]() {
    return statVolume(volume).then([](VolumeInfo&&) { return false; })
        .catch_([](kj::Exception&& exception) -> kj::Promise<bool> {
      if (isError(exception, ErrorCode::VOLUME_NOT_FOUND)) return true;
      return kj::mv(exception);
    });
  }));
}

// ---------------------------------------------------------------------------------------

kj::Promise<kj::Array<kj::String>> RemoteDisk::listDir(
    kj::StringPtr volume, kj::StringPtr dirPath, int count) {
  return retrying<kj::Array<kj::String>>(
      [this,volume=kj::heapString(volume),dirPath=kj::heapString(dirPath),count]() {
    auto req = service().listDirRequest();
    req.setDisk(endpoint);
    req.setOrigVolume(volume);
    req.setVolume(volume);
    req.setDirPath(dirPath);
    req.setCount(count);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      auto entries = response.getEntries();
      return KJ_MAP(entry, entries) { return kj::heapString(entry); };
    });
  });
}

kj::Promise<void> RemoteDisk::walkDir(const WalkDirOptions& options, storage::WalkSink& sink) {
  // Not retried: entries already pushed would be pushed again.
  auto target = kj::refcounted<SinkRef<storage::WalkSink>>(sink);
  auto req = service().walkDirRequest();
  req.setDisk(endpoint);
  req.setOptions(storage::encode<wire::WalkDirOptions>(options));
  req.setSink(kj::heap<EntrySinkImpl>(kj::addRef(*target)));
  return req.send().then([](auto&& response) { checkResponse(response); })
      .attach(kj::heap<SinkDetacher<storage::WalkSink>>(kj::mv(target)));
}

kj::Promise<kj::Array<byte>> RemoteDisk::readAll(kj::StringPtr volume, kj::StringPtr path) {
  return retrying<kj::Array<byte>>(
      [this,volume=kj::heapString(volume),path=kj::heapString(path)]() {
    auto req = service().readAllRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return kj::heapArray<byte>(response.getData());
    });
  });
}

kj::Promise<void> RemoteDisk::writeAll(kj::StringPtr volume, kj::StringPtr path,
                                       kj::ArrayPtr<const byte> data) {
  return retrying<void>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                         data=kj::heapArray<byte>(data)]() {
    auto req = service().writeAllRequest(
        capnp::MessageSize { data.size() / sizeof(capnp::word) + 16, 0 });
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setData(data);
    return req.send().then([](auto&& response) { checkResponse(response); });
  });
}

kj::Promise<kj::Own<storage::FileWriter>> RemoteDisk::createFile(
    kj::StringPtr volume, kj::StringPtr path, int64_t size) {
  return retrying<kj::Own<storage::FileWriter>>(
      [this,volume=kj::heapString(volume),path=kj::heapString(path),size]() {
    auto req = service().createFileRequest();
    req.setDisk(endpoint);
    req.setOrigVolume(volume);
    req.setVolume(volume);
    req.setPath(path);
    req.setSize(size);
    return req.send().then([](auto&& response) -> kj::Own<storage::FileWriter> {
      checkResponse(response);
      return kj::heap<WriterImpl>(response.getWriter());
    });
  });
}

kj::Promise<kj::Own<storage::FileWriter>> RemoteDisk::appendFile(
    kj::StringPtr volume, kj::StringPtr path) {
  return retrying<kj::Own<storage::FileWriter>>(
      [this,volume=kj::heapString(volume),path=kj::heapString(path)]() {
    auto req = service().appendFileRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    return req.send().then([](auto&& response) -> kj::Own<storage::FileWriter> {
      checkResponse(response);
      return kj::heap<WriterImpl>(response.getWriter());
    });
  });
}

kj::Promise<kj::Own<storage::FileReader>> RemoteDisk::readFileStream(
    kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) {
  return retrying<kj::Own<storage::FileReader>>(
      [this,volume=kj::heapString(volume),path=kj::heapString(path),offset,length]() {
    auto req = service().readFileStreamRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setOffset(offset);
    req.setLength(length);
    return req.send().then([](auto&& response) -> kj::Own<storage::FileReader> {
      checkResponse(response);
      return kj::heap<ReaderImpl>(response.getReader());
    });
  });
}

kj::Promise<void> RemoteDisk::renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                         kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return retrying<void>([this,srcVolume=kj::heapString(srcVolume),
                         srcPath=kj::heapString(srcPath),dstVolume=kj::heapString(dstVolume),
                         dstPath=kj::heapString(dstPath)]() {
    auto req = service().renameFileRequest();
    req.setDisk(endpoint);
    req.setSrcVolume(srcVolume);
    req.setSrcPath(srcPath);
    req.setDstVolume(dstVolume);
    req.setDstPath(dstPath);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,srcVolume=kj::heapString(srcVolume),srcPath=kj::heapString(srcPath),
            dstVolume=kj::heapString(dstVolume),dstPath=kj::heapString(dstPath)]() {
    return exists(dstVolume, dstPath).then([this,&srcVolume,&srcPath](bool moved) {
      if (!moved) return kj::Promise<bool>(false);
      return exists(srcVolume, srcPath).then([](bool left) { return !left; });
    });
  }));
}

kj::Promise<void> RemoteDisk::renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                         kj::StringPtr dstVolume, kj::StringPtr dstPath,
                                         kj::ArrayPtr<const byte> meta) {
  return retrying<void>([this,srcVolume=kj::heapString(srcVolume),
                         srcPath=kj::heapString(srcPath),dstVolume=kj::heapString(dstVolume),
                         dstPath=kj::heapString(dstPath),meta=kj::heapArray<byte>(meta)]() {
    auto req = service().renamePartRequest();
    req.setDisk(endpoint);
    req.setSrcVolume(srcVolume);
    req.setSrcPath(srcPath);
    req.setDstVolume(dstVolume);
    req.setDstPath(dstPath);
    req.setMeta(meta);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,srcVolume=kj::heapString(srcVolume),srcPath=kj::heapString(srcPath),
            dstVolume=kj::heapString(dstVolume),dstPath=kj::heapString(dstPath)]() {
    return exists(dstVolume, dstPath).then([this,&srcVolume,&srcPath](bool moved) {
      if (!moved) return kj::Promise<bool>(false);
      return exists(srcVolume, srcPath).then([](bool left) { return !left; });
    });
  }));
}

kj::Promise<void> RemoteDisk::deleteFile(kj::StringPtr volume, kj::StringPtr path,
                                         const DeleteOptions& options) {
  return retrying<void>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                         options=storage::encode<wire::DeleteOptions>(options)]() {
    auto req = service().deleteFileRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setOptions(options);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,volume=kj::heapString(volume),path=kj::heapString(path)]() {
    return exists(volume, path).then([](bool there) { return !there; });
  }));
}

kj::Promise<void> RemoteDisk::deletePaths(kj::StringPtr volume,
                                          kj::ArrayPtr<const kj::StringPtr> paths) {
  // Missing paths are not an error, so repeating the call is harmless.
  return retrying<void>([this,volume=kj::heapString(volume),paths=copyStrings(paths)]() {
    auto req = service().deletePathsRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    setStrings(req.initPaths(paths.size()), paths);
    return req.send().then([](auto&& response) { checkResponse(response); });
  });
}

kj::Promise<kj::Array<uint32_t>> RemoteDisk::verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                                        const FileInfo& fi) {
  return retrying<kj::Array<uint32_t>>([this,volume=kj::heapString(volume),
                                        path=kj::heapString(path),fi=fi.encode()]() {
    auto req = service().verifyFileRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setFileInfo(fi);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return decodeCheckParts(response.getResult());
    });
  });
}

kj::Promise<kj::Array<uint32_t>> RemoteDisk::checkParts(kj::StringPtr volume, kj::StringPtr path,
                                                        const FileInfo& fi) {
  return retrying<kj::Array<uint32_t>>([this,volume=kj::heapString(volume),
                                        path=kj::heapString(path),fi=fi.encode()]() {
    auto req = service().checkPartsRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setFileInfo(fi);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return decodeCheckParts(response.getResult());
    });
  });
}

// ---------------------------------------------------------------------------------------

kj::Promise<void> RemoteDisk::writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                            const FileInfo& fi) {
  return retrying<void>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                         fi=fi.encode()]() {
    auto req = service().writeMetadataRequest(
        capnp::MessageSize { fi.size() / sizeof(capnp::word) + 16, 0 });
    req.setDisk(endpoint);
    req.setOrigVolume(volume);
    req.setVolume(volume);
    req.setPath(path);
    req.setFileInfo(fi);
    return req.send().then([](auto&& response) { checkResponse(response); });
  });
}

kj::Promise<void> RemoteDisk::updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                             const FileInfo& fi,
                                             const UpdateMetadataOptions& options) {
  return retrying<void>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                         fi=fi.encode(),
                         options=storage::encode<wire::UpdateMetadataOptions>(options)]() {
    auto req = service().updateMetadataRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setFileInfo(fi);
    req.setOptions(options);
    return req.send().then([](auto&& response) { checkResponse(response); });
  });
}

kj::Promise<FileInfo> RemoteDisk::readVersion(kj::StringPtr volume, kj::StringPtr path,
                                              kj::StringPtr versionId,
                                              const ReadOptions& options) {
  return retrying<FileInfo>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                             versionId=kj::heapString(versionId),
                             options=storage::encode<wire::ReadOptions>(options)]() {
    auto req = service().readVersionRequest();
    req.setDisk(endpoint);
    req.setOrigVolume(volume);
    req.setVolume(volume);
    req.setPath(path);
    req.setVersionId(versionId);
    req.setOptions(options);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return FileInfo::decode(response.getFileInfo());
    });
  });
}

kj::Promise<kj::Array<byte>> RemoteDisk::readXl(kj::StringPtr volume, kj::StringPtr path,
                                                bool readData) {
  return retrying<kj::Array<byte>>([this,volume=kj::heapString(volume),
                                    path=kj::heapString(path),readData]() {
    auto req = service().readXlRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setReadData(readData);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      return kj::heapArray<byte>(response.getRawFileInfo());
    });
  });
}

kj::Promise<kj::Maybe<kj::String>> RemoteDisk::renameData(
    kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
    kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return retrying<kj::Maybe<kj::String>>([this,srcVolume=kj::heapString(srcVolume),
                                          srcPath=kj::heapString(srcPath),fi=fi.encode(),
                                          dstVolume=kj::heapString(dstVolume),
                                          dstPath=kj::heapString(dstPath)]() {
    auto req = service().renameDataRequest(
        capnp::MessageSize { fi.size() / sizeof(capnp::word) + 32, 0 });
    req.setDisk(endpoint);
    req.setSrcVolume(srcVolume);
    req.setSrcPath(srcPath);
    req.setFileInfo(fi);
    req.setDstVolume(dstVolume);
    req.setDstPath(dstPath);
    return req.send().then([](auto&& response) -> kj::Maybe<kj::String> {
      checkResponse(response);
      auto bytes = response.getResult();
      if (bytes.size() == 0) return nullptr;
      storage::MessageBlob<wire::RenameDataResult> blob(bytes);
      auto oldDataDir = blob.get().getOldDataDir();
      if (oldDataDir.size() == 0) return nullptr;
      return kj::heapString(oldDataDir);
    });
  }, Check([this,dstVolume=kj::heapString(dstVolume),dstPath=kj::heapString(dstPath),
            versionId=kj::heapString(versionToRead(fi.versionId)),
            dataDir=kj::heapString(fi.dataDir),modTime=fi.modTime]() {
    // The commit went through if the destination already lists this exact version.
    return readVersion(dstVolume, dstPath, versionId, ReadOptions())
        .then([&dataDir,modTime](FileInfo&& stored) {
      return stored.dataDir == dataDir && stored.modTime == modTime;
    }).catch_([](kj::Exception&& exception) -> kj::Promise<bool> {
      if (isNotFound(exception)) return false;
      return kj::mv(exception);
    });
  }));
}

kj::Promise<void> RemoteDisk::deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                            const FileInfo& fi, bool forceDelMarker,
                                            const DeleteOptions& options) {
  return retrying<void>([this,volume=kj::heapString(volume),path=kj::heapString(path),
                         fi=fi.encode(),forceDelMarker,
                         options=storage::encode<wire::DeleteOptions>(options)]() {
    auto req = service().deleteVersionRequest();
    req.setDisk(endpoint);
    req.setVolume(volume);
    req.setPath(path);
    req.setFileInfo(fi);
    req.setForceDelMarker(forceDelMarker);
    req.setOptions(options);
    return req.send().then([](auto&& response) { checkResponse(response); });
  }, Check([this,volume=kj::heapString(volume),path=kj::heapString(path),
            versionId=kj::heapString(versionToRead(fi.versionId)),
            marker=fi.deleted || forceDelMarker]() {
    // A delete marker went through if it is now stored; a removal if the version is gone.
    return readVersion(volume, path, versionId, ReadOptions())
        .then([marker](FileInfo&& stored) { return marker && stored.deleted; })
        .catch_([marker](kj::Exception&& exception) -> kj::Promise<bool> {
      if (isNotFound(exception)) return !marker;
      return kj::mv(exception);
    });
  }));
}

kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> RemoteDisk::deleteVersions(
    kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
    const DeleteOptions& options) {
  // Not retried: a second attempt would report versions removed by the first as missing.
  auto req = service().deleteVersionsRequest();
  req.setDisk(endpoint);
  req.setVolume(volume);
  auto list = req.initVersions(versions.size());
  for (uint i = 0; i < versions.size(); i++) {
    list.set(i, storage::encode<wire::FileInfoVersions>(versions[i]));
  }
  req.setOptions(storage::encode<wire::DeleteOptions>(options));

  return req.send().then([](auto&& response) {
    checkResponse(response);
    auto errors = response.getErrors();
    return KJ_MAP(error, errors) -> kj::Maybe<kj::Exception> {
      if (error.getCode() == 0) return nullptr;
      return peerError(static_cast<ErrorCode>(error.getCode()), error.getMessage());
    };
  });
}

kj::Promise<kj::Array<ReadMultipleResult>> RemoteDisk::readMultiple(
    const ReadMultipleRequest& request) {
  return retrying<kj::Array<ReadMultipleResult>>(
      [this,request=storage::encode<wire::ReadMultipleRequest>(request)]() {
    auto req = service().readMultipleRequest();
    req.setDisk(endpoint);
    req.setRequest(request);
    return req.send().then([](auto&& response) {
      checkResponse(response);
      auto results = response.getResults();
      return KJ_MAP(result, results) {
        return storage::decode<wire::ReadMultipleResult, ReadMultipleResult>(result);
      };
    });
  });
}

kj::Promise<DataUsage> RemoteDisk::nsScanner(DataUsage&& cache, storage::UsageSink& updates) {
  auto target = kj::refcounted<SinkRef<storage::UsageSink>>(updates);
  auto req = service().nsScannerRequest();
  req.setDisk(endpoint);
  req.setCache(storage::encode<wire::DataUsageCache>(cache));
  req.setUpdates(kj::heap<UsageSinkImpl>(kj::addRef(*target)));
  return req.send().then([](auto&& response) {
    checkResponse(response);
    return storage::decode<wire::DataUsageCache, DataUsage>(response.getCache());
  }).attach(kj::heap<SinkDetacher<storage::UsageSink>>(kj::mv(target)));
}

}  // namespace granite
