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

#ifndef GRANITE_ERRORS_H_
#define GRANITE_ERRORS_H_

#include "common.h"
#include <kj/exception.h>
#include <kj/array.h>

namespace granite {

enum class ErrorCode: uint32_t {
  // Storage error taxonomy. These values travel on the wire as RpcError.code, so never renumber.
  // (zero skipped: zero on the wire means "no error")

  UNEXPECTED = 1,
  NOT_IMPLEMENTED,
  INVALID_ARGUMENT,
  METHOD_NOT_ALLOWED,

  TRANSIENT_DISK_ERROR,
  // Timeout or connection reset. Retryable a bounded number of times.
  DISK_OFFLINE,
  // The disk is excluded from quorum until a health check succeeds.
  FAULTY_DISK,
  DISK_NOT_FOUND,
  DISK_FULL,
  DISK_ACCESS_DENIED,
  UNFORMATTED_DISK,
  INCONSISTENT_DISK,

  VOLUME_NOT_FOUND,
  VOLUME_EXISTS,
  VOLUME_NOT_EMPTY,

  FILE_NOT_FOUND,
  FILE_VERSION_NOT_FOUND,
  FILE_ACCESS_DENIED,
  FILE_NAME_TOO_LONG,
  IS_NOT_REGULAR,
  LESS_DATA,
  MORE_DATA,
  MAX_VERSIONS_EXCEEDED,

  CORRUPT_SHARD,
  // Bitrot mismatch. Excludes one shard from a read.
  INSUFFICIENT_SHARDS,
  // Fewer than dataBlocks verified shards. Data loss until healed.
  ERASURE_WRITE_QUORUM,
  METADATA_QUORUM_MISMATCH,

  LOCK_CONFLICT,
  LOCK_QUORUM_UNAVAILABLE,
  LOCK_NOT_HELD,
  // unlock() or refresh() with a token that no longer holds the lock.
};

kj::StringPtr KJ_STRINGIFY(ErrorCode code);

bool isTransient(ErrorCode code);
// Errors that say nothing about the data: the disk or its node could not be reached.

kj::Exception makeError(ErrorCode code, const char* file, int line, kj::String detail);
// Build an exception carrying `code`. The code is recoverable with getErrorCode() even after
// the exception has been stringified across an RPC boundary.

#define GRANITE_ERROR(code, ...) \
  ::granite::makeError(::granite::ErrorCode::code, __FILE__, __LINE__, ::kj::str(__VA_ARGS__))
#define GRANITE_FAIL(code, ...) \
  ::kj::throwFatalException(GRANITE_ERROR(code, ##__VA_ARGS__))

kj::Exception peerError(ErrorCode code, kj::StringPtr message);
[[noreturn]] void throwError(ErrorCode code, kj::StringPtr message);
// Rebuild (or rethrow) an error received from a peer.

kj::Maybe<ErrorCode> getErrorCode(const kj::Exception& exception);
// The code carried by an exception made with makeError(), if any.

ErrorCode classify(const kj::Exception& exception);
// Like getErrorCode(), but also maps untagged exceptions: transport disconnects and timeouts
// become TRANSIENT_DISK_ERROR, anything else UNEXPECTED.

bool isError(const kj::Exception& exception, ErrorCode code);

ErrorCode errnoToFileError(int error);
ErrorCode errnoToVolumeError(int error);
// Map a failed syscall's errno onto the taxonomy, for operations on a file or a volume.

kj::Maybe<kj::Exception> reduceErrors(kj::ArrayPtr<const kj::Maybe<kj::Exception>> errors,
                                      kj::ArrayPtr<const ErrorCode> ignored,
                                      uint quorum, ErrorCode quorumError);
// Collapse per-disk outcomes into the single error the operation reports. Null entries are
// successes. Returns null if successes reach `quorum`. Otherwise returns the most frequent
// error if it occurred at least `quorum` times, and `quorumError` if nothing did. Codes in
// `ignored` never count as the operation's error.

}  // namespace granite

#endif // GRANITE_ERRORS_H_
