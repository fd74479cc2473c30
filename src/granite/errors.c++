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

#include "errors.h"
#include <kj/debug.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

namespace granite {

namespace {

static constexpr const char ERROR_TAG[] = "granite error ";
// Every error made by makeError() has a description starting with this tag followed by the
// decimal code. capnp prefixes descriptions of remote exceptions, so we search rather than
// compare prefixes.

static const char* const ERROR_NAMES[] = {
  "NONE",
  "UNEXPECTED",
  "NOT_IMPLEMENTED",
  "INVALID_ARGUMENT",
  "METHOD_NOT_ALLOWED",
  "TRANSIENT_DISK_ERROR",
  "DISK_OFFLINE",
  "FAULTY_DISK",
  "DISK_NOT_FOUND",
  "DISK_FULL",
  "DISK_ACCESS_DENIED",
  "UNFORMATTED_DISK",
  "INCONSISTENT_DISK",
  "VOLUME_NOT_FOUND",
  "VOLUME_EXISTS",
  "VOLUME_NOT_EMPTY",
  "FILE_NOT_FOUND",
  "FILE_VERSION_NOT_FOUND",
  "FILE_ACCESS_DENIED",
  "FILE_NAME_TOO_LONG",
  "IS_NOT_REGULAR",
  "LESS_DATA",
  "MORE_DATA",
  "MAX_VERSIONS_EXCEEDED",
  "CORRUPT_SHARD",
  "INSUFFICIENT_SHARDS",
  "ERASURE_WRITE_QUORUM",
  "METADATA_QUORUM_MISMATCH",
  "LOCK_CONFLICT",
  "LOCK_QUORUM_UNAVAILABLE",
  "LOCK_NOT_HELD",
};

constexpr uint ERROR_COUNT = sizeof(ERROR_NAMES) / sizeof(ERROR_NAMES[0]);

}  // namespace

kj::StringPtr KJ_STRINGIFY(ErrorCode code) {
  uint n = static_cast<uint>(code);
  if (n < ERROR_COUNT) {
    return ERROR_NAMES[n];
  } else {
    return "UNKNOWN_ERROR";
  }
}

bool isTransient(ErrorCode code) {
  return code == ErrorCode::TRANSIENT_DISK_ERROR || code == ErrorCode::DISK_OFFLINE;
}

kj::Exception makeError(ErrorCode code, const char* file, int line, kj::String detail) {
  auto type = isTransient(code) ? kj::Exception::Type::DISCONNECTED
                                : kj::Exception::Type::FAILED;
  auto description = detail.size() == 0
      ? kj::str(ERROR_TAG, static_cast<uint>(code), " (", code, ")")
      : kj::str(ERROR_TAG, static_cast<uint>(code), " (", code, "): ", detail);
  return kj::Exception(type, file, line, kj::mv(description));
}

kj::Exception peerError(ErrorCode code, kj::StringPtr message) {
  if (strstr(message.cStr(), ERROR_TAG) != nullptr) {
    // The peer's message already carries its tag.
    auto type = isTransient(code) ? kj::Exception::Type::DISCONNECTED
                                  : kj::Exception::Type::FAILED;
    return kj::Exception(type, __FILE__, __LINE__, kj::heapString(message));
  }
  return makeError(code, __FILE__, __LINE__, kj::heapString(message));
}

void throwError(ErrorCode code, kj::StringPtr message) {
  kj::throwFatalException(peerError(code, message));
}

kj::Maybe<ErrorCode> getErrorCode(const kj::Exception& exception) {
  kj::StringPtr description = exception.getDescription();
  const char* pos = strstr(description.cStr(), ERROR_TAG);
  if (pos == nullptr) return nullptr;

  pos += strlen(ERROR_TAG);
  char* end;
  unsigned long value = strtoul(pos, &end, 10);
  if (end == pos || value == 0 || value >= ERROR_COUNT) return nullptr;
  return static_cast<ErrorCode>(value);
}

ErrorCode classify(const kj::Exception& exception) {
  KJ_IF_MAYBE(code, getErrorCode(exception)) {
    return *code;
  }

  switch (exception.getType()) {
    case kj::Exception::Type::DISCONNECTED:
    case kj::Exception::Type::OVERLOADED:
      return ErrorCode::TRANSIENT_DISK_ERROR;
    case kj::Exception::Type::UNIMPLEMENTED:
      return ErrorCode::NOT_IMPLEMENTED;
    default:
      return ErrorCode::UNEXPECTED;
  }
}

bool isError(const kj::Exception& exception, ErrorCode code) {
  return classify(exception) == code;
}

ErrorCode errnoToFileError(int error) {
  switch (error) {
    case ENOENT:
    case ENOTDIR:
      return ErrorCode::FILE_NOT_FOUND;
    case EACCES:
    case EPERM:
    case ENOTEMPTY:
      return ErrorCode::FILE_ACCESS_DENIED;
    case EISDIR:
      return ErrorCode::IS_NOT_REGULAR;
    case ENAMETOOLONG:
      return ErrorCode::FILE_NAME_TOO_LONG;
    case ENOSPC:
    case EDQUOT:
      return ErrorCode::DISK_FULL;
    case EROFS:
      return ErrorCode::DISK_ACCESS_DENIED;
    case EIO:
      return ErrorCode::FAULTY_DISK;
    default:
      return ErrorCode::UNEXPECTED;
  }
}

ErrorCode errnoToVolumeError(int error) {
  switch (error) {
    case ENOENT:
    case ENOTDIR:
      return ErrorCode::VOLUME_NOT_FOUND;
    case EEXIST:
      return ErrorCode::VOLUME_EXISTS;
    case ENOTEMPTY:
      return ErrorCode::VOLUME_NOT_EMPTY;
    case EACCES:
    case EPERM:
    case EROFS:
      return ErrorCode::DISK_ACCESS_DENIED;
    case ENOSPC:
    case EDQUOT:
      return ErrorCode::DISK_FULL;
    case EIO:
      return ErrorCode::FAULTY_DISK;
    default:
      return ErrorCode::UNEXPECTED;
  }
}

kj::Maybe<kj::Exception> reduceErrors(kj::ArrayPtr<const kj::Maybe<kj::Exception>> errors,
                                      kj::ArrayPtr<const ErrorCode> ignored,
                                      uint quorum, ErrorCode quorumError) {
  uint successes = 0;
  uint counts[ERROR_COUNT];
  memset(counts, 0, sizeof(counts));
  kj::Maybe<const kj::Exception&> firstOf[ERROR_COUNT];

  for (auto& error: errors) {
    KJ_IF_MAYBE(e, error) {
      auto code = classify(*e);
      bool skip = false;
      for (auto i: ignored) {
        if (i == code) skip = true;
      }
      if (skip) continue;

      uint n = static_cast<uint>(code);
      if (counts[n]++ == 0) firstOf[n] = *e;
    } else {
      ++successes;
    }
  }

  if (successes >= quorum) return nullptr;

  uint best = 0;
  for (uint i = 1; i < ERROR_COUNT; i++) {
    if (counts[i] > counts[best]) best = i;
  }

  if (best != 0 && counts[best] >= quorum) {
    KJ_IF_MAYBE(e, firstOf[best]) {
      return kj::Exception(*e);
    }
  }

  return makeError(quorumError, __FILE__, __LINE__,
      kj::str(successes, " of ", errors.size(), " disks succeeded, ", quorum, " needed"));
}

}  // namespace granite
