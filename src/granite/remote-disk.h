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

#ifndef GRANITE_REMOTE_DISK_H_
#define GRANITE_REMOTE_DISK_H_

#include "node-connection.h"
#include <granite/storage/disk.h>
#include <granite/config.capnp.h>
#include <kj/function.h>
#include <kj/timer.h>

namespace granite {

struct RetryPolicy {
  uint maxRetries = 3;
  kj::Duration retryDelay = 100 * kj::MILLISECONDS;
  // Multiplied by the attempt number.

  static RetryPolicy fromConfig(DiskHealthConfig::Reader config);
};

template <typename Reader>
void checkResponse(const Reader& response) {
  // Throws the error carried by a NodeService response, if it reports failure.
  if (!response.getSuccess()) {
    auto error = response.getError();
    auto code = error.getCode() == 0 ? ErrorCode::UNEXPECTED
                                     : static_cast<ErrorCode>(error.getCode());
    throwError(code, error.getMessage());
  }
}

class RemoteDisk final: public storage::Disk {
  // A disk mounted by another node, reached through that node's NodeService. Every argument
  // is copied into the request before the call returns.
  //
  // Calls that fail in transport are retried up to `maxRetries` times and then fail with
  // DISK_OFFLINE. Renames and deletes are only retried after checking that the first attempt
  // did not already take effect. Errors the remote disk reported are passed through unchanged.

public:
  RemoteDisk(kj::StringPtr endpoint, NodeConnections& connections, kj::Timer& timer,
             RetryPolicy policy);
  ~RemoteDisk() noexcept(false);

  kj::StringPtr getEndpoint() override { return endpoint; }
  bool isLocal() override { return false; }
  bool isOnline() override { return true; }
  kj::Promise<kj::String> getDiskId() override;
  kj::Promise<storage::DiskInfo> diskInfo(bool metrics) override;

  kj::Promise<void> makeVolume(kj::StringPtr volume) override;
  kj::Promise<void> makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) override;
  kj::Promise<kj::Array<storage::VolumeInfo>> listVolumes() override;
  kj::Promise<storage::VolumeInfo> statVolume(kj::StringPtr volume) override;
  kj::Promise<void> deleteVolume(kj::StringPtr volume, bool force) override;

  kj::Promise<kj::Array<kj::String>> listDir(
      kj::StringPtr volume, kj::StringPtr dirPath, int count) override;
  kj::Promise<void> walkDir(const storage::WalkDirOptions& options,
                            storage::WalkSink& sink) override;
  kj::Promise<kj::Array<byte>> readAll(kj::StringPtr volume, kj::StringPtr path) override;
  kj::Promise<void> writeAll(kj::StringPtr volume, kj::StringPtr path,
                             kj::ArrayPtr<const byte> data) override;
  kj::Promise<kj::Own<storage::FileWriter>> createFile(
      kj::StringPtr volume, kj::StringPtr path, int64_t size) override;
  kj::Promise<kj::Own<storage::FileWriter>> appendFile(
      kj::StringPtr volume, kj::StringPtr path) override;
  kj::Promise<kj::Own<storage::FileReader>> readFileStream(
      kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) override;
  kj::Promise<void> renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath) override;
  kj::Promise<void> renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                               kj::StringPtr dstVolume, kj::StringPtr dstPath,
                               kj::ArrayPtr<const byte> meta) override;
  kj::Promise<void> deleteFile(kj::StringPtr volume, kj::StringPtr path,
                               const storage::DeleteOptions& options) override;
  kj::Promise<void> deletePaths(kj::StringPtr volume,
                                kj::ArrayPtr<const kj::StringPtr> paths) override;
  kj::Promise<kj::Array<uint32_t>> verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                              const storage::FileInfo& fi) override;
  kj::Promise<kj::Array<uint32_t>> checkParts(kj::StringPtr volume, kj::StringPtr path,
                                              const storage::FileInfo& fi) override;

  kj::Promise<void> writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                  const storage::FileInfo& fi) override;
  kj::Promise<void> updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                   const storage::FileInfo& fi,
                                   const storage::UpdateMetadataOptions& options) override;
  kj::Promise<storage::FileInfo> readVersion(kj::StringPtr volume, kj::StringPtr path,
                                             kj::StringPtr versionId,
                                             const storage::ReadOptions& options) override;
  kj::Promise<kj::Array<byte>> readXl(kj::StringPtr volume, kj::StringPtr path,
                                      bool readData) override;
  kj::Promise<kj::Maybe<kj::String>> renameData(
      kj::StringPtr srcVolume, kj::StringPtr srcPath, const storage::FileInfo& fi,
      kj::StringPtr dstVolume, kj::StringPtr dstPath) override;
  kj::Promise<void> deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                  const storage::FileInfo& fi, bool forceDelMarker,
                                  const storage::DeleteOptions& options) override;
  kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> deleteVersions(
      kj::StringPtr volume, kj::ArrayPtr<const storage::FileInfoVersions> versions,
      const storage::DeleteOptions& options) override;
  kj::Promise<kj::Array<storage::ReadMultipleResult>> readMultiple(
      const storage::ReadMultipleRequest& request) override;
  kj::Promise<storage::DataUsage> nsScanner(storage::DataUsage&& cache,
                                            storage::UsageSink& updates) override;

private:
  class WriterImpl;
  class ReaderImpl;
  class EntrySinkImpl;
  class UsageSinkImpl;

  template <typename T>
  struct Retry {
    kj::Function<kj::Promise<T>()> call;
    kj::Maybe<kj::Function<kj::Promise<bool>()>> applied;
    // Resolves true if a failed attempt turns out to have taken effect anyway. Null for calls
    // that are safe to repeat.
    uint attempt = 0;
  };

  kj::String endpoint;
  kj::String node;
  NodeConnections& connections;
  kj::Timer& timer;
  RetryPolicy policy;

  NodeService::Client service() { return connections.get(node); }

  template <typename T>
  kj::Promise<T> retrying(kj::Function<kj::Promise<T>()> call,
                          kj::Maybe<kj::Function<kj::Promise<bool>()>> applied = nullptr);
  template <typename T>
  kj::Promise<T> attempt(Retry<T>& retry);

  kj::Promise<bool> exists(kj::StringPtr volume, kj::StringPtr path);
  // Single-attempt check used to decide whether a failed rename or delete went through.
};

}  // namespace granite

#endif // GRANITE_REMOTE_DISK_H_
