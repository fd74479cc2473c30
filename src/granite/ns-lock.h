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

#ifndef GRANITE_NS_LOCK_H_
#define GRANITE_NS_LOCK_H_

#include "local-locker.h"
#include "errors.h"
#include <granite/config.capnp.h>
#include <kj/function.h>

namespace granite {

struct LockPolicy {
  uint quorum = 0;
  // Grants needed for a write lock. Zero means n/2 + 1 (and n - n/2 for read locks).

  kj::Duration lease = 60 * kj::SECONDS;
  kj::Duration refreshInterval = 10 * kj::SECONDS;
  kj::Duration acquireTimeout = 5 * kj::SECONDS;
  // Acquisition retries until this much time has passed. Zero means one attempt.

  kj::Duration retryInterval = 250 * kj::MILLISECONDS;
  // Mean delay between attempts; the actual delay is randomized.

  kj::Duration callTimeout = 2 * kj::SECONDS;

  static LockPolicy fromConfig(LockConfig::Reader config);
};

class NsLockMap;

class NsLock {
  // A lock held on a quorum of lock services. Released when destroyed; release() does the same
  // but lets the caller wait for it.

public:
  NsLock(NsLockMap& map, LockRequest args, bool writer);
  ~NsLock() noexcept(false);
  KJ_DISALLOW_COPY(NsLock);

  kj::StringPtr getUid() { return args.uid; }
  bool isWriter() { return writer; }

  bool isLost() { return lost; }
  kj::Promise<void> whenLost();
  // Resolves if a refresh finds the lock no longer held by a quorum. The holder should abandon
  // what it is doing; the lock was already reclaimed.

  kj::Promise<void> release();

private:
  NsLock(NsLockMap& map, LockRequest args, bool writer, kj::PromiseFulfillerPair<void> paf);

  NsLockMap& map;
  LockRequest args;
  bool writer;
  bool lost = false;
  bool released = false;
  kj::ForkedPromise<void> lostPromise;
  kj::Own<kj::PromiseFulfiller<void>> lostFulfiller;
  kj::Promise<void> refreshTask;

  kj::Promise<void> refreshLoop();
  kj::Promise<void> sendRelease();
  void markLost();
};

class NsLockMap: private kj::TaskSet::ErrorHandler {
  // Namespace locks on "volume/path" resources, acquired from every lock service of the
  // cluster. A write lock needs the write quorum of services to grant it, a read lock the read
  // quorum. Partial grants are handed back before retrying after a randomized delay.
  //
  // Acquisition fails with LOCK_CONFLICT when enough services answered but too few granted,
  // and with LOCK_QUORUM_UNAVAILABLE when too few services could be reached.
  //
  // Must outlive every NsLock it hands out.

public:
  NsLockMap(kj::Array<kj::Own<Locker>> lockers, kj::Timer& timer, LockPolicy policy,
            kj::String owner);
  ~NsLockMap() noexcept(false);

  kj::Promise<kj::Own<NsLock>> lock(kj::StringPtr volume, kj::StringPtr path,
                                    kj::StringPtr source = nullptr);
  kj::Promise<kj::Own<NsLock>> rlock(kj::StringPtr volume, kj::StringPtr path,
                                     kj::StringPtr source = nullptr);

  kj::Promise<kj::Own<NsLock>> lockResources(kj::Array<kj::String> resources, bool writer,
                                             kj::StringPtr source);

  kj::Promise<void> forceUnlock(kj::StringPtr volume, kj::StringPtr path);

  uint writeQuorum() const;
  uint readQuorum() const;

private:
  friend class NsLock;

  kj::Array<kj::Own<Locker>> lockers;
  kj::Timer& timer;
  LockPolicy policy;
  kj::String owner;
  kj::TaskSet tasks;

  enum class Attempt { GRANTED, CONFLICT, UNAVAILABLE };

  kj::Promise<Attempt> tryAcquire(const LockRequest& args, bool writer);
  kj::Promise<kj::Own<NsLock>> acquireLoop(kj::Own<LockRequest> args, bool writer,
                                           kj::TimePoint deadline);
  kj::Promise<kj::Array<kj::Maybe<bool>>> askAll(
      const LockRequest& args, kj::Function<kj::Promise<bool>(Locker&)> call);
  void releaseOn(const LockRequest& args, bool writer,
                 kj::ArrayPtr<const kj::Maybe<bool>> granted);
  kj::Duration retryDelay();

  void taskFailed(kj::Exception&& exception) override;
};

kj::String lockResource(kj::StringPtr volume, kj::StringPtr path);

}  // namespace granite

#endif // GRANITE_NS_LOCK_H_
