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

#ifndef GRANITE_STORAGE_HEAL_H_
#define GRANITE_STORAGE_HEAL_H_

#include "basics.h"
#include <granite/config.capnp.h>
#include <kj/async.h>
#include <kj/timer.h>
#include <kj/vector.h>
#include <set>

namespace granite {
namespace storage {

class Healer {
public:
  virtual kj::Promise<void> healObject(kj::StringPtr bucket, kj::StringPtr object,
                                       kj::StringPtr versionId) = 0;
  // Bring every disk's copy of the version up to date. Fails with a transient error if some
  // disk could not be repaired yet; the queue then tries again later.
};

struct HealPolicy {
  kj::Duration retryInterval = 10 * kj::SECONDS;
  // Delay before the first attempt; doubles after each failure.
  uint maxAttempts = 5;

  static HealPolicy fromConfig(HealConfig::Reader config);
};

struct HealStats {
  uint64_t queued = 0;
  // Currently waiting or running.
  uint64_t healed = 0;
  uint64_t failed = 0;
  // Given up after maxAttempts.
};

class HealQueue: private kj::TaskSet::ErrorHandler {
  // Objects whose last write or read found some disk missing, stale or corrupt. Each entry is
  // healed in the background after a delay and retried with backoff until it succeeds or runs
  // out of attempts. An object already in the queue is not queued twice.

public:
  HealQueue(kj::Timer& timer, HealPolicy policy);
  ~HealQueue() noexcept(false);

  void add(Healer& healer, kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId);

  bool contains(kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId);

  HealStats getStats() { return stats; }

  kj::Promise<void> onEmpty();
  // Resolves once nothing is queued.

private:
  kj::Timer& timer;
  HealPolicy policy;
  std::set<kj::String> pending;
  HealStats stats;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> emptyWaiters;
  kj::TaskSet tasks;

  struct Entry {
    Healer& healer;
    kj::String key;
    kj::String bucket;
    kj::String object;
    kj::String versionId;
    uint attempts;
    kj::Duration delay;
  };

  kj::Promise<void> attempt(kj::Own<Entry> entry);
  void finish(kj::StringPtr key);

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace storage
}  // namespace granite

#endif // GRANITE_STORAGE_HEAL_H_
