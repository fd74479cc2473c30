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

#include "ns-lock.h"
#include "quorum.h"
#include <kj/debug.h>
#include <sodium/randombytes.h>

namespace granite {

LockPolicy LockPolicy::fromConfig(LockConfig::Reader config) {
  LockPolicy result;
  result.quorum = config.getQuorum();
  result.lease = config.getLeaseSeconds() * kj::SECONDS;
  result.refreshInterval = config.getRefreshSeconds() * kj::SECONDS;
  result.acquireTimeout = config.getAcquireTimeoutMs() * kj::MILLISECONDS;
  result.retryInterval = config.getRetryIntervalMs() * kj::MILLISECONDS;
  result.callTimeout = config.getCallTimeoutMs() * kj::MILLISECONDS;
  return result;
}

kj::String lockResource(kj::StringPtr volume, kj::StringPtr path) {
  if (path.size() == 0) return kj::heapString(volume);
  return kj::str(volume, '/', path);
}

// =======================================================================================

NsLock::NsLock(NsLockMap& map, LockRequest args, bool writer)
    : NsLock(map, kj::mv(args), writer, kj::newPromiseAndFulfiller<void>()) {}

NsLock::NsLock(NsLockMap& map, LockRequest args, bool writer,
               kj::PromiseFulfillerPair<void> paf)
    : map(map), args(kj::mv(args)), writer(writer),
      lostPromise(paf.promise.fork()), lostFulfiller(kj::mv(paf.fulfiller)),
      refreshTask(nullptr) {
  refreshTask = refreshLoop().eagerlyEvaluate([this](kj::Exception&& e) {
    KJ_LOG(ERROR, "lock refresh failed", this->args.resources, e);
    markLost();
  });
}

NsLock::~NsLock() noexcept(false) {
  if (!released) {
    released = true;
    map.tasks.add(sendRelease());
  }
}

kj::Promise<void> NsLock::whenLost() {
  return lostPromise.addBranch();
}

kj::Promise<void> NsLock::release() {
  if (released) return kj::READY_NOW;
  released = true;
  refreshTask = nullptr;
  return sendRelease();
}

kj::Promise<void> NsLock::sendRelease() {
  bool w = writer;
  auto& a = args;
  return map.askAll(args, [w,&a](Locker& locker) {
    return w ? locker.unlock(a) : locker.runlock(a);
  }).ignoreResult();
}

kj::Promise<void> NsLock::refreshLoop() {
  return map.timer.afterDelay(map.policy.refreshInterval).then([this]() {
    auto& a = args;
    return map.askAll(args, [&a](Locker& locker) { return locker.refresh(a); });
  }).then([this](kj::Array<kj::Maybe<bool>>&& answers) -> kj::Promise<void> {
    uint refreshed = 0;
    for (auto& answer: answers) {
      KJ_IF_MAYBE(ok, answer) {
        if (*ok) ++refreshed;
      }
    }

    uint quorum = writer ? map.writeQuorum() : map.readQuorum();
    if (refreshed < quorum) {
      markLost();
      return kj::READY_NOW;
    }
    return refreshLoop();
  });
}

void NsLock::markLost() {
  if (lost) return;
  lost = true;
  KJ_LOG(WARNING, "lock lost; refresh not acknowledged by a quorum", args.resources, args.uid);
  lostFulfiller->fulfill();
}

// =======================================================================================

NsLockMap::NsLockMap(kj::Array<kj::Own<Locker>> lockers, kj::Timer& timer, LockPolicy policy,
                     kj::String owner)
    : lockers(kj::mv(lockers)), timer(timer), policy(policy), owner(kj::mv(owner)),
      tasks(*this) {
  KJ_REQUIRE(this->lockers.size() > 0, "no lock services");
}

NsLockMap::~NsLockMap() noexcept(false) {}

void NsLockMap::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "lock release failed", exception);
}

uint NsLockMap::writeQuorum() const {
  uint n = lockers.size();
  if (policy.quorum != 0) return kj::min(policy.quorum, n);
  return n / 2 + 1;
}

uint NsLockMap::readQuorum() const {
  uint n = lockers.size();
  if (policy.quorum != 0) return kj::min(policy.quorum, n);
  return n - n / 2;
}

kj::Duration NsLockMap::retryDelay() {
  int64_t mean = kj::max<int64_t>(policy.retryInterval / kj::MILLISECONDS, 1);
  int64_t jitter = randombytes_uniform(static_cast<uint32_t>(mean) + 1);
  return (mean / 2 + jitter) * kj::MILLISECONDS;
}

kj::Promise<kj::Array<kj::Maybe<bool>>> NsLockMap::askAll(
    const LockRequest& args, kj::Function<kj::Promise<bool>(Locker&)> call) {
  auto calls = kj::heapArrayBuilder<kj::Promise<bool>>(lockers.size());
  for (auto& locker: lockers) {
    calls.add(timer.timeoutAfter(policy.callTimeout, kj::evalNow([&]() {
      return call(*locker);
    })));
  }
  return collectValues(calls.finish(), lockers.size())
      .then([](QuorumValues<bool>&& result) {
    return kj::mv(result.values);
  });
}

void NsLockMap::releaseOn(const LockRequest& args, bool writer,
                          kj::ArrayPtr<const kj::Maybe<bool>> granted) {
  for (uint i = 0; i < lockers.size(); i++) {
    KJ_IF_MAYBE(g, granted[i]) {
      if (*g) {
        auto& locker = *lockers[i];
        auto promise = kj::evalNow([&]() {
          return writer ? locker.unlock(args) : locker.runlock(args);
        });
        tasks.add(timer.timeoutAfter(policy.callTimeout, kj::mv(promise)).ignoreResult());
      }
    }
  }
}

kj::Promise<NsLockMap::Attempt> NsLockMap::tryAcquire(const LockRequest& args, bool writer) {
  auto answers = askAll(args, [writer,&args](Locker& locker) {
    return writer ? locker.lock(args) : locker.rlock(args);
  });

  return answers.then([this,writer,args=args.clone()](
      kj::Array<kj::Maybe<bool>>&& answers) {
    uint granted = 0;
    uint answered = 0;
    for (auto& answer: answers) {
      KJ_IF_MAYBE(g, answer) {
        ++answered;
        if (*g) ++granted;
      }
    }

    uint quorum = writer ? writeQuorum() : readQuorum();
    if (granted >= quorum) return Attempt::GRANTED;

    releaseOn(args, writer, answers);
    return answered >= quorum ? Attempt::CONFLICT : Attempt::UNAVAILABLE;
  });
}

kj::Promise<kj::Own<NsLock>> NsLockMap::acquireLoop(kj::Own<LockRequest> args, bool writer,
                                                    kj::TimePoint deadline) {
  auto& ref = *args;
  return tryAcquire(ref, writer).then([this,KJ_MVCAP(args),writer,deadline](
      Attempt attempt) mutable -> kj::Promise<kj::Own<NsLock>> {
    if (attempt == Attempt::GRANTED) {
      return kj::heap<NsLock>(*this, kj::mv(*args), writer);
    }

    auto now = timer.now();
    if (now >= deadline) {
      auto resources = kj::strArray(args->resources, ", ");
      if (attempt == Attempt::CONFLICT) {
        return GRANITE_ERROR(LOCK_CONFLICT, resources, " is locked by another holder");
      } else {
        KJ_LOG(WARNING, "lock quorum unavailable", resources, writeQuorum(), lockers.size());
        return GRANITE_ERROR(LOCK_QUORUM_UNAVAILABLE, "too few lock services answered for ",
                             resources);
      }
    }

    auto delay = kj::min(retryDelay(), deadline - now);
    return timer.afterDelay(delay).then([this,KJ_MVCAP(args),writer,deadline]() mutable {
      return acquireLoop(kj::mv(args), writer, deadline);
    });
  });
}

kj::Promise<kj::Own<NsLock>> NsLockMap::lockResources(
    kj::Array<kj::String> resources, bool writer, kj::StringPtr source) {
  auto args = kj::heap<LockRequest>();
  args->uid = newUuid();
  args->resources = kj::mv(resources);
  args->owner = kj::heapString(owner);
  args->source = kj::heapString(source);
  args->quorum = writer ? writeQuorum() : readQuorum();
  return acquireLoop(kj::mv(args), writer, timer.now() + policy.acquireTimeout);
}

kj::Promise<kj::Own<NsLock>> NsLockMap::lock(kj::StringPtr volume, kj::StringPtr path,
                                             kj::StringPtr source) {
  auto resources = kj::heapArray<kj::String>(1);
  resources[0] = lockResource(volume, path);
  return lockResources(kj::mv(resources), true, source);
}

kj::Promise<kj::Own<NsLock>> NsLockMap::rlock(kj::StringPtr volume, kj::StringPtr path,
                                              kj::StringPtr source) {
  auto resources = kj::heapArray<kj::String>(1);
  resources[0] = lockResource(volume, path);
  return lockResources(kj::mv(resources), false, source);
}

kj::Promise<void> NsLockMap::forceUnlock(kj::StringPtr volume, kj::StringPtr path) {
  LockRequest args;
  args.resources = kj::heapArray<kj::String>(1);
  args.resources[0] = lockResource(volume, path);
  args.owner = kj::heapString(owner);
  KJ_LOG(WARNING, "forcibly unlocking", args.resources[0]);
  auto& a = args;
  return askAll(args, [&a](Locker& locker) { return locker.forceUnlock(a); }).ignoreResult();
}

}  // namespace granite
