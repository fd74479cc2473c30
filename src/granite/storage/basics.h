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

#ifndef GRANITE_STORAGE_BASICS_H_
#define GRANITE_STORAGE_BASICS_H_

#include <granite/common.h>
#include <granite/errors.h>
#include <granite/storage/storage.capnp.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/array.h>
#include <string.h>

namespace granite {
namespace storage {

using wire::BitrotAlgorithm;
using wire::DiskFormat;
using wire::StoredFileInfo;
using wire::StoredFileMeta;
using wire::StoredVersion;
// The persisted records are used directly. Other schema types have C++ counterparts in disk.h.

constexpr const char SYSTEM_VOLUME[] = ".granite.sys";
// Per-disk system volume. Never listed as a bucket.

constexpr const char TMP_DIR[] = "tmp";
constexpr const char TRASH_DIR[] = "tmp/.trash";
constexpr const char MULTIPART_DIR[] = "multipart";
constexpr const char BUCKET_META_DIR[] = "buckets";
// Directories inside SYSTEM_VOLUME.

constexpr const char FORMAT_FILE[] = "format.bin";
constexpr const char HEALING_FILE[] = "healing.bin";
// Files inside SYSTEM_VOLUME.

constexpr const char METADATA_FILE[] = "xl.meta";
// Version chain of one object, stored in the object's directory.

constexpr const char METADATA_BACKUP_FILE[] = "xl.meta.bkp";
// The chain an object had before a commit, kept in the commit's staging directory until the
// write is known to have reached its quorum.

constexpr uint MAX_VERSIONS = 10000;
// Versions per object path before writes fail with MAX_VERSIONS_EXCEEDED.

enum CheckPart: uint32_t {
  // Per-part result of Disk::checkParts() and Disk::verifyFile().
  CHECK_PART_UNKNOWN = 0,
  CHECK_PART_SUCCESS = 1,
  CHECK_PART_DISK_NOT_FOUND = 2,
  CHECK_PART_VOLUME_NOT_FOUND = 3,
  CHECK_PART_FILE_NOT_FOUND = 4,
  CHECK_PART_FILE_CORRUPT = 5,
};

kj::String pathJoin(kj::StringPtr a, kj::StringPtr b);
kj::String pathJoin(kj::StringPtr a, kj::StringPtr b, kj::StringPtr c);
// Join path components with '/', ignoring empty components.

kj::String partFileName(uint partNumber);
// "part.N"

void checkVolumeName(kj::StringPtr volume);
void checkPathName(kj::StringPtr path);
// Throw INVALID_ARGUMENT for names that could escape the disk root.

// =======================================================================================
// Serialized payloads
//
// Structured arguments are passed between disks as flat capnp messages. These helpers convert
// them to and from byte arrays.

template <typename T, typename Func>
kj::Array<byte> buildMessage(Func&& init) {
  // Build a message whose root is a T, initialized by `init(T::Builder)`, and flatten it.
  capnp::MallocMessageBuilder message;
  init(message.initRoot<T>());
  return capnp::messageToFlatArray(message).releaseAsBytes();
}

template <typename T>
class MessageBlob {
  // Reads a flat message out of an unaligned byte array.

public:
  explicit MessageBlob(kj::ArrayPtr<const byte> bytes)
      : words(copyToWords(bytes)), reader(words) {}

  KJ_DISALLOW_COPY(MessageBlob);

  typename T::Reader get() { return reader.getRoot<T>(); }

private:
  kj::Array<capnp::word> words;
  capnp::FlatArrayMessageReader reader;

  static kj::Array<capnp::word> copyToWords(kj::ArrayPtr<const byte> bytes) {
    if (bytes.size() % sizeof(capnp::word) != 0 || bytes.size() == 0) {
      GRANITE_FAIL(INVALID_ARGUMENT, "malformed message blob of ", bytes.size(), " bytes");
    }
    auto result = kj::heapArray<capnp::word>(bytes.size() / sizeof(capnp::word));
    memcpy(result.begin(), bytes.begin(), bytes.size());
    return result;
  }
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_BASICS_H_
