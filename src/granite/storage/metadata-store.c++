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

#include "metadata-store.h"
#include <kj/debug.h>

namespace granite {
namespace storage {

uint ResolvedVersion::currentCount() const {
  uint count = 0;
  for (bool c: current) {
    if (c) ++count;
  }
  return count;
}

FileInfo copyForDisk(const FileInfo& fi, uint diskIndex) {
  auto result = fi.clone();
  if (diskIndex < fi.erasure.distribution.size()) {
    result.erasure.index = fi.erasure.distribution[diskIndex];
  }
  return result;
}

kj::Maybe<uint> findQuorumVersion(kj::ArrayPtr<const kj::Maybe<FileInfo>> copies, uint quorum,
                                  kj::StringPtr volume, kj::StringPtr path) {
  kj::Maybe<uint> result;
  for (uint i = 0; i < copies.size(); i++) {
    KJ_IF_MAYBE(copy, copies[i]) {
      uint count = 0;
      bool seen = false;
      for (uint j = 0; j < copies.size(); j++) {
        KJ_IF_MAYBE(other, copies[j]) {
          if (copy->sameVersion(*other)) {
            ++count;
            if (j < i) seen = true;
          }
        }
      }
      if (seen || count < quorum) continue;

      KJ_IF_MAYBE(r, result) {
        auto& first = KJ_ASSERT_NONNULL(copies[*r]);
        GRANITE_FAIL(METADATA_QUORUM_MISMATCH, volume, "/", path, ": versions ",
                     first.versionId, " (", first.modTime, ") and ", copy->versionId, " (",
                     copy->modTime, ") both have ", quorum, " disks");
      }
      result = i;
    }
  }
  return result;
}

MetadataStore::MetadataStore(kj::ArrayPtr<const kj::Own<Disk>> disks, uint readQuorum,
                             uint writeQuorum, PartialWriteCallback onPartialWrite)
    : disks(disks), readQuorum(readQuorum), writeQuorum(writeQuorum),
      onPartialWrite(kj::mv(onPartialWrite)) {
  KJ_REQUIRE(readQuorum > 0 && readQuorum <= disks.size(), "bad read quorum", readQuorum);
  KJ_REQUIRE(writeQuorum > 0 && writeQuorum <= disks.size(), "bad write quorum", writeQuorum);
}

kj::Exception MetadataStore::noQuorum(kj::ArrayPtr<const kj::Maybe<kj::Exception>> errors,
                                      uint answered, kj::StringPtr volume, kj::StringPtr path) {
  // A quorum of disks agreeing on an error (typically "not found") is an answer. Otherwise
  // either too few disks answered or they disagree, and neither is resolved by picking one.
  KJ_IF_MAYBE(e, reduceErrors(errors, nullptr, readQuorum, ErrorCode::METADATA_QUORUM_MISMATCH)) {
    if (classify(*e) != ErrorCode::METADATA_QUORUM_MISMATCH) return kj::mv(*e);
  }
  return GRANITE_ERROR(METADATA_QUORUM_MISMATCH, volume, "/", path, ": no ", readQuorum,
                       " disks agree (", answered, " of ", disks.size(), " answered)");
}

kj::Promise<ResolvedVersion> MetadataStore::getVersion(
    kj::StringPtr volume, kj::StringPtr path, kj::StringPtr versionId, bool readData) {
  ReadOptions options;
  options.readData = readData;

  auto reads = kj::heapArrayBuilder<kj::Promise<FileInfo>>(disks.size());
  for (auto& disk: disks) {
    reads.add(disk->readVersion(volume, path, versionId, options));
  }

  return collectValues(reads.finish(), readQuorum)
      .then([this,volume=kj::heapString(volume),path=kj::heapString(path)](
          QuorumValues<FileInfo>&& result) -> ResolvedVersion {
    auto& values = result.values;

    uint answered = 0;
    for (auto& v: values) {
      if (v != nullptr) ++answered;
    }

    kj::Maybe<uint> best = findQuorumVersion(values, readQuorum, volume, path);
    if (best == nullptr) {
      kj::throwFatalException(noQuorum(result.outcome.errors, answered, volume, path));
    }

    auto& chosen = KJ_ASSERT_NONNULL(values[KJ_ASSERT_NONNULL(best)]);
    auto current = kj::heapArray<bool>(values.size());
    for (uint i = 0; i < values.size(); i++) {
      current[i] = false;
      KJ_IF_MAYBE(v, values[i]) {
        current[i] = v->sameVersion(chosen);
      }
    }

    return ResolvedVersion { chosen.clone(), kj::mv(current), kj::mv(result.outcome.errors) };
  });
}

kj::Promise<kj::Array<FileInfo>> MetadataStore::listVersions(kj::StringPtr volume,
                                                            kj::StringPtr path) {
  auto reads = kj::heapArrayBuilder<kj::Promise<FileMeta>>(disks.size());
  for (auto& disk: disks) {
    reads.add(disk->readXl(volume, path, false).then([](kj::Array<byte>&& bytes) {
      return FileMeta::parse(bytes);
    }));
  }

  return collectValues(reads.finish(), readQuorum)
      .then([this,volume=kj::heapString(volume),path=kj::heapString(path)](
          QuorumValues<FileMeta>&& result) {
    auto& values = result.values;
    auto signatures = kj::heapArray<uint64_t>(values.size());
    uint answered = 0;
    for (uint i = 0; i < values.size(); i++) {
      KJ_IF_MAYBE(meta, values[i]) {
        signatures[i] = meta->signature();
        ++answered;
      }
    }

    for (uint i = 0; i < values.size(); i++) {
      KJ_IF_MAYBE(meta, values[i]) {
        uint count = 0;
        for (uint j = 0; j < values.size(); j++) {
          if (values[j] != nullptr && signatures[j] == signatures[i]) ++count;
        }
        if (count >= readQuorum) {
          return meta->listVersions(volume, path);
        }
      }
    }

    kj::throwFatalException(noQuorum(result.outcome.errors, answered, volume, path));
  });
}

template <typename Func>
kj::Promise<void> MetadataStore::applyEverywhere(
    kj::StringPtr volume, kj::StringPtr path, kj::StringPtr versionId, Func&& perDisk,
    kj::ArrayPtr<const ErrorCode> alreadyDone) {
  auto participants = kj::heapArrayBuilder<kj::Promise<void>>(disks.size());
  for (uint i = 0; i < disks.size(); i++) {
    Disk& disk = *disks[i];
    participants.add(kj::evalNow([&]() { return perDisk(disk, i); }));
  }

  return collectQuorum(participants.finish(), disks.size())
      .then([this,volume=kj::heapString(volume),path=kj::heapString(path),
             versionId=kj::heapString(versionId),done=kj::heapArray(alreadyDone)](
          QuorumOutcome&& outcome) {
    // Disks on which the mutation had already happened count as successes.
    bool partial = false;
    auto errors = kj::heapArrayBuilder<kj::Maybe<kj::Exception>>(outcome.errors.size());
    for (auto& error: outcome.errors) {
      KJ_IF_MAYBE(e, error) {
        auto code = classify(*e);
        bool skip = false;
        for (auto d: done) {
          if (d == code) skip = true;
        }
        if (skip) {
          errors.add(nullptr);
        } else {
          partial = true;
          errors.add(kj::mv(*e));
        }
      } else {
        errors.add(nullptr);
      }
    }

    auto reduced = errors.finish();
    KJ_IF_MAYBE(e, reduceErrors(reduced, nullptr, writeQuorum,
                                ErrorCode::ERASURE_WRITE_QUORUM)) {
      KJ_LOG(WARNING, "metadata write quorum failed", volume, path, *e);
      kj::throwFatalException(kj::mv(*e));
    }
    if (partial) {
      onPartialWrite(volume, path, versionId);
    }
  });
}

kj::Promise<void> MetadataStore::createVersion(kj::StringPtr volume, kj::StringPtr path,
                                               const FileInfo& fi) {
  return applyEverywhere(volume, path, fi.versionId, [&](Disk& disk, uint i) {
    return disk.writeMetadata(volume, path, copyForDisk(fi, i));
  });
}

kj::Promise<FileInfo> MetadataStore::deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                                   kj::StringPtr versionId, bool permanent) {
  if (!permanent) {
    FileInfo marker;
    marker.volume = kj::heapString(volume);
    marker.name = kj::heapString(path);
    marker.versionId = newUuid();
    marker.deleted = true;
    marker.modTime = nowNanos();

    auto promise = applyEverywhere(volume, path, marker.versionId, [&](Disk& disk, uint) {
      return disk.deleteVersion(volume, path, marker, true, DeleteOptions());
    });
    return promise.then([KJ_MVCAP(marker)]() mutable {
      return kj::mv(marker);
    });
  }

  return getVersion(volume, path, versionId, false).then(
      [this,volume=kj::heapString(volume),path=kj::heapString(path)](
          ResolvedVersion&& resolved) mutable {
    // Remove by id, whether the version is an object or a delete marker.
    auto target = kj::heap<FileInfo>(kj::mv(resolved.info));
    bool wasMarker = target->deleted;
    target->deleted = false;

    static constexpr ErrorCode ALREADY_GONE[] = {
      ErrorCode::FILE_NOT_FOUND, ErrorCode::FILE_VERSION_NOT_FOUND
    };
    auto& targetRef = *target;
    auto promise = applyEverywhere(volume, path, target->versionId,
        [&](Disk& disk, uint) {
      return disk.deleteVersion(volume, path, targetRef, false, DeleteOptions());
    }, ALREADY_GONE);
    return promise.then([KJ_MVCAP(target),wasMarker]() mutable {
      target->deleted = wasMarker;
      return kj::mv(*target);
    });
  });
}

kj::Promise<void> MetadataStore::updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                                const FileInfo& fi) {
  return applyEverywhere(volume, path, fi.versionId, [&](Disk& disk, uint) {
    return disk.updateMetadata(volume, path, fi, UpdateMetadataOptions());
  });
}

kj::Promise<kj::Array<kj::Maybe<FileInfo>>> MetadataStore::readAllCopies(
    kj::StringPtr volume, kj::StringPtr path, kj::StringPtr versionId, bool readData) {
  ReadOptions options;
  options.readData = readData;
  options.healing = true;

  auto reads = kj::heapArrayBuilder<kj::Promise<FileInfo>>(disks.size());
  for (auto& disk: disks) {
    reads.add(disk->readVersion(volume, path, versionId, options));
  }
  return collectValues(reads.finish(), readQuorum).then([](QuorumValues<FileInfo>&& result) {
    return kj::mv(result.values);
  });
}

}  // namespace storage
}  // namespace granite
