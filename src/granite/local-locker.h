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

#ifndef GRANITE_LOCAL_LOCKER_H_
#define GRANITE_LOCAL_LOCKER_H_

#include "common.h"
#include <granite/node.capnp.h>
#include <kj/async.h>
#include <kj/timer.h>
#include <kj/vector.h>
#include <map>

namespace granite {

struct LockRequest {
  // Arguments of every lock service call. Travels as a serialized LockArgs.

  kj::String uid;
  // Token identifying the holder. unlock(), runlock() and refresh() must present the token the
  // lock was granted to.

  kj::Array<kj::String> resources;
  kj::String owner;
  // Node that requested the lock.
  kj::String source;
  // Call site, for debugging stuck locks.
  uint quorum = 0;

  LockRequest clone() const;

  static LockRequest fromReader(LockArgs::Reader reader);
  void copyTo(LockArgs::Builder builder) const;

  kj::Array<byte> encode() const;
  static LockRequest decode(kj::ArrayPtr<const byte> bytes);
};

class Locker {
  // One lock service. A refused request resolves to false; exceptions mean the service could
  // not be asked (and count against the quorum as unavailable rather than refused).

public:
  virtual ~Locker() noexcept(false) {}

  virtual kj::StringPtr getEndpoint() = 0;

  virtual kj::Promise<bool> lock(const LockRequest& args) = 0;
  virtual kj::Promise<bool> unlock(const LockRequest& args) = 0;
  virtual kj::Promise<bool> rlock(const LockRequest& args) = 0;
  virtual kj::Promise<bool> runlock(const LockRequest& args) = 0;
  virtual kj::Promise<bool> forceUnlock(const LockRequest& args) = 0;
  virtual kj::Promise<bool> refresh(const LockRequest& args) = 0;
  // False if the lock is no longer held under `args.uid` (expired or force-unlocked).
};

class LocalLocker final: public Locker, private kj::TaskSet::ErrorHandler {
  // The lock table of this node. Entries are leased: each lock or refresh extends the lease,
  // and an entry whose lease lapsed is dropped, both when its resource is next touched and by
  // a periodic sweep.

public:
  LocalLocker(kj::String endpoint, kj::Timer& timer, kj::Duration lease);
  ~LocalLocker() noexcept(false);

  kj::StringPtr getEndpoint() override { return endpoint; }

  kj::Promise<bool> lock(const LockRequest& args) override;
  kj::Promise<bool> unlock(const LockRequest& args) override;
  kj::Promise<bool> rlock(const LockRequest& args) override;
  kj::Promise<bool> runlock(const LockRequest& args) override;
  kj::Promise<bool> forceUnlock(const LockRequest& args) override;
  kj::Promise<bool> refresh(const LockRequest& args) override;

  size_t size() { return table.size(); }
  // Number of locked resources.

  void expireOld();

private:
  struct Entry {
    kj::String uid;
    kj::String owner;
    kj::String source;
    bool writer;
    kj::TimePoint expires;
  };

  kj::String endpoint;
  kj::Timer& timer;
  kj::Duration lease;
  std::map<kj::String, kj::Vector<Entry>> table;
  kj::TaskSet tasks;

  bool isFree(kj::StringPtr resource);
  bool hasWriter(kj::StringPtr resource);
  void expire(kj::StringPtr resource);
  bool removeEntry(kj::StringPtr resource, kj::StringPtr uid, bool writer);
  kj::Promise<void> sweepLoop();

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace granite

#endif // GRANITE_LOCAL_LOCKER_H_
