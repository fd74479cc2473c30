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

#include "disk-health.h"
#include <kj/debug.h>

namespace granite {
namespace storage {

HealthPolicy HealthPolicy::fromConfig(DiskHealthConfig::Reader config) {
  HealthPolicy result;
  result.callTimeout = config.getCallTimeoutMs() * kj::MILLISECONDS;
  result.maxTransientFailures = kj::max(config.getMaxTransientFailures(), 1u);
  result.failureWindow = config.getFailureWindowSeconds() * kj::SECONDS;
  result.checkInterval = config.getCheckIntervalSeconds() * kj::SECONDS;
  return result;
}

namespace {

template <typename P> struct PromiseValue_;
template <typename T> struct PromiseValue_<kj::Promise<T>> { typedef T Type; };
template <typename P> using PromiseValue = typename PromiseValue_<P>::Type;

}  // namespace

template <typename T>
struct Tracker {
  // Reports the outcome of one call to the disk's failure accounting.

  static kj::Promise<T> track(HealthCheckedDisk& disk, kj::Promise<T>&& promise) {
    return promise.then([&disk](T&& value) -> kj::Promise<T> {
      disk.succeeded();
      return kj::mv(value);
    }, [&disk](kj::Exception&& e) -> kj::Promise<T> {
      disk.failed(e);
      return kj::mv(e);
    });
  }
};

template <>
struct Tracker<void> {
  static kj::Promise<void> track(HealthCheckedDisk& disk, kj::Promise<void>&& promise) {
    return promise.then([&disk]() -> kj::Promise<void> {
      disk.succeeded();
      return kj::READY_NOW;
    }, [&disk](kj::Exception&& e) -> kj::Promise<void> {
      disk.failed(e);
      return kj::mv(e);
    });
  }
};

// =======================================================================================

class HealthCheckedDisk::TrackedWriter final: public FileWriter {
public:
  TrackedWriter(HealthCheckedDisk& disk, kj::Own<FileWriter> inner)
      : disk(disk), inner(kj::mv(inner)) {}

  kj::Promise<void> write(kj::ArrayPtr<const byte> data) override {
    return disk.call([&]() { return inner->write(data); });
  }

  kj::Promise<void> close() override {
    return disk.call([&]() { return inner->close(); });
  }

private:
  HealthCheckedDisk& disk;
  kj::Own<FileWriter> inner;
};

class HealthCheckedDisk::TrackedReader final: public FileReader {
public:
  TrackedReader(HealthCheckedDisk& disk, kj::Own<FileReader> inner)
      : disk(disk), inner(kj::mv(inner)) {}

  kj::Promise<size_t> read(kj::ArrayPtr<byte> buffer) override {
    return disk.call([&]() { return inner->read(buffer); });
  }

private:
  HealthCheckedDisk& disk;
  kj::Own<FileReader> inner;
};

// =======================================================================================

HealthCheckedDisk::HealthCheckedDisk(kj::Own<Disk> inner, kj::Timer& timer, HealthPolicy policy)
    : inner(kj::mv(inner)), timer(timer), policy(policy), tasks(*this) {}

HealthCheckedDisk::~HealthCheckedDisk() noexcept(false) {}

template <typename Func>
auto HealthCheckedDisk::call(Func&& func) -> decltype(func()) {
  using T = PromiseValue<decltype(func())>;
  if (!online) {
    return GRANITE_ERROR(DISK_OFFLINE, inner->getEndpoint());
  }
  auto promise = kj::evalNow(kj::fwd<Func>(func));
  return Tracker<T>::track(*this, timer.timeoutAfter(policy.callTimeout, kj::mv(promise)));
}

template <typename Func>
auto HealthCheckedDisk::untimed(Func&& func) -> decltype(func()) {
  using T = PromiseValue<decltype(func())>;
  if (!online) {
    return GRANITE_ERROR(DISK_OFFLINE, inner->getEndpoint());
  }
  return Tracker<T>::track(*this, kj::evalNow(kj::fwd<Func>(func)));
}

void HealthCheckedDisk::succeeded() {
  recentFailures.clear();
}

void HealthCheckedDisk::failed(const kj::Exception& exception) {
  // DISK_OFFLINE here comes from the inner disk, e.g. a remote disk that ran out of retries.
  auto code = classify(exception);
  if (!isTransient(code) && code != ErrorCode::FAULTY_DISK) return;

  auto now = timer.now();
  kj::Vector<kj::TimePoint> kept;
  for (auto t: recentFailures) {
    if (now - t < policy.failureWindow) kept.add(t);
  }
  kept.add(now);
  recentFailures = kj::mv(kept);

  if (recentFailures.size() >= policy.maxTransientFailures) {
    goOffline();
  }
}

void HealthCheckedDisk::goOffline() {
  if (!online) return;
  online = false;
  KJ_LOG(WARNING, "disk offline after repeated failures", inner->getEndpoint(),
         recentFailures.size());
  recentFailures.clear();
  tasks.add(checkLoop());
}

kj::Promise<void> HealthCheckedDisk::checkLoop() {
  return timer.afterDelay(policy.checkInterval).then([this]() {
    return timer.timeoutAfter(policy.callTimeout, inner->diskInfo(false));
  }).then([this](DiskInfo&&) -> kj::Promise<void> {
    online = true;
    KJ_LOG(INFO, "disk back online", inner->getEndpoint());
    return kj::READY_NOW;
  }, [this](kj::Exception&& e) -> kj::Promise<void> {
    return checkLoop();
  });
}

void HealthCheckedDisk::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "disk health check failed", inner->getEndpoint(), exception);
}

// ---------------------------------------------------------------------------------------

kj::Promise<kj::String> HealthCheckedDisk::getDiskId() {
  return call([&]() { return inner->getDiskId(); });
}

kj::Promise<DiskInfo> HealthCheckedDisk::diskInfo(bool metrics) {
  return call([&]() { return inner->diskInfo(metrics); });
}

kj::Promise<void> HealthCheckedDisk::makeVolume(kj::StringPtr volume) {
  return call([&]() { return inner->makeVolume(volume); });
}

kj::Promise<void> HealthCheckedDisk::makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) {
  return call([&]() { return inner->makeVolumes(volumes); });
}

kj::Promise<kj::Array<VolumeInfo>> HealthCheckedDisk::listVolumes() {
  return call([&]() { return inner->listVolumes(); });
}

kj::Promise<VolumeInfo> HealthCheckedDisk::statVolume(kj::StringPtr volume) {
  return call([&]() { return inner->statVolume(volume); });
}

kj::Promise<void> HealthCheckedDisk::deleteVolume(kj::StringPtr volume, bool force) {
  return call([&]() { return inner->deleteVolume(volume, force); });
}

kj::Promise<kj::Array<kj::String>> HealthCheckedDisk::listDir(
    kj::StringPtr volume, kj::StringPtr dirPath, int count) {
  return call([&]() { return inner->listDir(volume, dirPath, count); });
}

kj::Promise<void> HealthCheckedDisk::walkDir(const WalkDirOptions& options, WalkSink& sink) {
  return untimed([&]() { return inner->walkDir(options, sink); });
}

kj::Promise<kj::Array<byte>> HealthCheckedDisk::readAll(kj::StringPtr volume,
                                                         kj::StringPtr path) {
  return call([&]() { return inner->readAll(volume, path); });
}

kj::Promise<void> HealthCheckedDisk::writeAll(kj::StringPtr volume, kj::StringPtr path,
                                              kj::ArrayPtr<const byte> data) {
  return call([&]() { return inner->writeAll(volume, path, data); });
}

kj::Promise<kj::Own<FileWriter>> HealthCheckedDisk::createFile(
    kj::StringPtr volume, kj::StringPtr path, int64_t size) {
  return call([&]() { return inner->createFile(volume, path, size); })
      .then([this](kj::Own<FileWriter>&& writer) -> kj::Own<FileWriter> {
    return kj::heap<TrackedWriter>(*this, kj::mv(writer));
  });
}

kj::Promise<kj::Own<FileWriter>> HealthCheckedDisk::appendFile(kj::StringPtr volume,
                                                               kj::StringPtr path) {
  return call([&]() { return inner->appendFile(volume, path); })
      .then([this](kj::Own<FileWriter>&& writer) -> kj::Own<FileWriter> {
    return kj::heap<TrackedWriter>(*this, kj::mv(writer));
  });
}

kj::Promise<kj::Own<FileReader>> HealthCheckedDisk::readFileStream(
    kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) {
  return call([&]() { return inner->readFileStream(volume, path, offset, length); })
      .then([this](kj::Own<FileReader>&& reader) -> kj::Own<FileReader> {
    return kj::heap<TrackedReader>(*this, kj::mv(reader));
  });
}

kj::Promise<void> HealthCheckedDisk::renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                                kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return call([&]() { return inner->renameFile(srcVolume, srcPath, dstVolume, dstPath); });
}

kj::Promise<void> HealthCheckedDisk::renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                                kj::StringPtr dstVolume, kj::StringPtr dstPath,
                                                kj::ArrayPtr<const byte> meta) {
  return call([&]() {
    return inner->renamePart(srcVolume, srcPath, dstVolume, dstPath, meta);
  });
}

kj::Promise<void> HealthCheckedDisk::deleteFile(kj::StringPtr volume, kj::StringPtr path,
                                                const DeleteOptions& options) {
  return call([&]() { return inner->deleteFile(volume, path, options); });
}

kj::Promise<void> HealthCheckedDisk::deletePaths(kj::StringPtr volume,
                                                 kj::ArrayPtr<const kj::StringPtr> paths) {
  return call([&]() { return inner->deletePaths(volume, paths); });
}

kj::Promise<kj::Array<uint32_t>> HealthCheckedDisk::verifyFile(
    kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi) {
  // Reads every byte of the object; no call timeout.
  return untimed([&]() { return inner->verifyFile(volume, path, fi); });
}

kj::Promise<kj::Array<uint32_t>> HealthCheckedDisk::checkParts(
    kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi) {
  return call([&]() { return inner->checkParts(volume, path, fi); });
}

kj::Promise<void> HealthCheckedDisk::writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                                   const FileInfo& fi) {
  return call([&]() { return inner->writeMetadata(volume, path, fi); });
}

kj::Promise<void> HealthCheckedDisk::updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                                    const FileInfo& fi,
                                                    const UpdateMetadataOptions& options) {
  return call([&]() { return inner->updateMetadata(volume, path, fi, options); });
}

kj::Promise<FileInfo> HealthCheckedDisk::readVersion(kj::StringPtr volume, kj::StringPtr path,
                                                     kj::StringPtr versionId,
                                                     const ReadOptions& options) {
  return call([&]() { return inner->readVersion(volume, path, versionId, options); });
}

kj::Promise<kj::Array<byte>> HealthCheckedDisk::readXl(kj::StringPtr volume, kj::StringPtr path,
                                                       bool readData) {
  return call([&]() { return inner->readXl(volume, path, readData); });
}

kj::Promise<kj::Maybe<kj::String>> HealthCheckedDisk::renameData(
    kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
    kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return call([&]() { return inner->renameData(srcVolume, srcPath, fi, dstVolume, dstPath); });
}

kj::Promise<void> HealthCheckedDisk::deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                                   const FileInfo& fi, bool forceDelMarker,
                                                   const DeleteOptions& options) {
  return call([&]() {
    return inner->deleteVersion(volume, path, fi, forceDelMarker, options);
  });
}

kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> HealthCheckedDisk::deleteVersions(
    kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
    const DeleteOptions& options) {
  return call([&]() { return inner->deleteVersions(volume, versions, options); });
}

kj::Promise<kj::Array<ReadMultipleResult>> HealthCheckedDisk::readMultiple(
    const ReadMultipleRequest& request) {
  return call([&]() { return inner->readMultiple(request); });
}

kj::Promise<DataUsage> HealthCheckedDisk::nsScanner(DataUsage&& cache, UsageSink& updates) {
  return untimed([&]() { return inner->nsScanner(kj::mv(cache), updates); });
}

}  // namespace storage
}  // namespace granite
