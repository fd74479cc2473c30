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

#include "heal.h"
#include <kj/debug.h>

namespace granite {
namespace storage {

HealPolicy HealPolicy::fromConfig(HealConfig::Reader config) {
  HealPolicy result;
  result.retryInterval = config.getRetryIntervalSeconds() * kj::SECONDS;
  result.maxAttempts = kj::max(config.getMaxAttempts(), 1u);
  return result;
}

namespace {

kj::String healKey(kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId) {
  return kj::str(bucket, '/', object, '\0', versionId);
}

}  // namespace

HealQueue::HealQueue(kj::Timer& timer, HealPolicy policy)
    : timer(timer), policy(policy), tasks(*this) {}

HealQueue::~HealQueue() noexcept(false) {}

void HealQueue::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "heal task failed", exception);
}

bool HealQueue::contains(kj::StringPtr bucket, kj::StringPtr object, kj::StringPtr versionId) {
  return pending.count(healKey(bucket, object, versionId)) > 0;
}

void HealQueue::add(Healer& healer, kj::StringPtr bucket, kj::StringPtr object,
                    kj::StringPtr versionId) {
  auto key = healKey(bucket, object, versionId);
  if (pending.count(key) > 0) return;
  pending.insert(kj::heapString(key));
  ++stats.queued;

  KJ_LOG(INFO, "queued heal", bucket, object, versionId);
  tasks.add(attempt(kj::heap<Entry>(Entry {
    healer, kj::mv(key), kj::heapString(bucket), kj::heapString(object),
    kj::heapString(versionId), 0, policy.retryInterval
  })));
}

kj::Promise<void> HealQueue::attempt(kj::Own<Entry> entry) {
  auto& e = *entry;
  auto heal = timer.afterDelay(e.delay).then([&e]() {
    ++e.attempts;
    return e.healer.healObject(e.bucket, e.object, e.versionId);
  });

  return heal.then([this,&e]() {
    KJ_LOG(INFO, "healed", e.bucket, e.object, e.versionId, e.attempts);
    ++stats.healed;
    finish(e.key);
    return false;
  }, [this,&e](kj::Exception&& exception) {
    if (e.attempts >= policy.maxAttempts) {
      KJ_LOG(ERROR, "giving up on heal", e.bucket, e.object, e.versionId, e.attempts,
             exception);
      ++stats.failed;
      finish(e.key);
      return false;
    }

    KJ_LOG(WARNING, "heal failed; will retry", e.bucket, e.object, e.versionId, e.attempts,
           exception.getDescription());
    e.delay = e.delay * 2;
    return true;
  }).then([this,KJ_MVCAP(entry)](bool retry) mutable -> kj::Promise<void> {
    if (!retry) return kj::READY_NOW;
    return attempt(kj::mv(entry));
  });
}

void HealQueue::finish(kj::StringPtr key) {
  pending.erase(kj::heapString(key));
  --stats.queued;
  if (pending.empty()) {
    for (auto& waiter: emptyWaiters) {
      waiter->fulfill();
    }
    emptyWaiters.clear();
  }
}

kj::Promise<void> HealQueue::onEmpty() {
  if (pending.empty()) return kj::READY_NOW;
  auto paf = kj::newPromiseAndFulfiller<void>();
  emptyWaiters.add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

}  // namespace storage
}  // namespace granite
