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
#include <kj/test.h>

namespace granite {
namespace {

class UnreachableLocker final: public Locker {
public:
  kj::StringPtr getEndpoint() override { return "10.0.0.9:9000"; }

  kj::Promise<bool> lock(const LockRequest& args) override { return down(); }
  kj::Promise<bool> unlock(const LockRequest& args) override { return down(); }
  kj::Promise<bool> rlock(const LockRequest& args) override { return down(); }
  kj::Promise<bool> runlock(const LockRequest& args) override { return down(); }
  kj::Promise<bool> forceUnlock(const LockRequest& args) override { return down(); }
  kj::Promise<bool> refresh(const LockRequest& args) override { return down(); }

private:
  kj::Promise<bool> down() {
    return KJ_EXCEPTION(DISCONNECTED, "lock service unreachable");
  }
};

struct ClusterFixture {
  // Three lock services shared by two nodes.

  ClusterFixture()
      : waitScope(loop), timer(kj::origin<kj::TimePoint>()) {
    initCrypto();
    for (uint i = 0; i < 3; i++) {
      lockers.add(kj::heap<LocalLocker>(kj::str("node", i), timer, 60 * kj::SECONDS));
    }
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  kj::Vector<kj::Own<LocalLocker>> lockers;
  UnreachableLocker unreachable;

  kj::Own<NsLockMap> newMap(kj::StringPtr owner, kj::Duration acquireTimeout,
                            uint unreachableCount = 0) {
    auto list = kj::heapArrayBuilder<kj::Own<Locker>>(lockers.size());
    for (uint i = 0; i < lockers.size(); i++) {
      if (i < unreachableCount) {
        list.add(kj::Own<Locker>(&unreachable, kj::NullDisposer::instance));
      } else {
        list.add(kj::Own<Locker>(lockers[i].get(), kj::NullDisposer::instance));
      }
    }
    LockPolicy policy;
    policy.acquireTimeout = acquireTimeout;
    return kj::heap<NsLockMap>(list.finish(), timer, policy, kj::heapString(owner));
  }

  void advance(kj::Duration delay) {
    timer.advanceTo(timer.now() + delay);
    settle();
  }

  void settle() {
    for (uint i = 0; i < 20; i++) {
      kj::evalLater([]() {}).wait(waitScope);
    }
  }

  size_t entries() {
    size_t total = 0;
    for (auto& locker: lockers) total += locker->size();
    return total;
  }
};

LockRequest foreign(kj::StringPtr resource) {
  LockRequest result;
  result.uid = kj::heapString("foreign");
  result.resources = kj::heapArray<kj::String>(1);
  result.resources[0] = kj::heapString(resource);
  result.owner = kj::heapString("elsewhere");
  return result;
}

KJ_TEST("quorum sizes") {
  ClusterFixture env;
  auto map = env.newMap("a", 0 * kj::SECONDS);
  KJ_EXPECT(map->writeQuorum() == 2);
  KJ_EXPECT(map->readQuorum() == 2);
  KJ_EXPECT(lockResource("bucket", "a/b") == "bucket/a/b");
  KJ_EXPECT(lockResource("bucket", "") == "bucket");
}

KJ_TEST("two nodes racing for one object") {
  ClusterFixture env;
  auto& ws = env.waitScope;
  auto a = env.newMap("node-a", 0 * kj::SECONDS);
  auto b = env.newMap("node-b", 0 * kj::SECONDS);

  auto held = a->lock("bucket", "obj").wait(ws);
  KJ_EXPECT(held->isWriter());
  KJ_EXPECT(env.entries() == 3);

  KJ_EXPECT_THROW_MESSAGE("LOCK_CONFLICT", b->lock("bucket", "obj").wait(ws));
  KJ_EXPECT_THROW_MESSAGE("LOCK_CONFLICT", b->rlock("bucket", "obj").wait(ws));
  KJ_EXPECT(env.entries() == 3);

  b->lock("bucket", "other").wait(ws)->release().wait(ws);

  held->release().wait(ws);
  KJ_EXPECT(env.entries() == 0);
  auto second = b->lock("bucket", "obj").wait(ws);
  KJ_EXPECT(env.entries() == 3);

  // Dropping a lock releases it in the background.
  second = nullptr;
  env.settle();
  KJ_EXPECT(env.entries() == 0);
}

KJ_TEST("partial grants are handed back") {
  ClusterFixture env;
  auto& ws = env.waitScope;
  auto map = env.newMap("node-a", 0 * kj::SECONDS);

  KJ_EXPECT(env.lockers[0]->lock(foreign("bucket/obj")).wait(ws));
  KJ_EXPECT(env.lockers[1]->lock(foreign("bucket/obj")).wait(ws));

  KJ_EXPECT_THROW_MESSAGE("LOCK_CONFLICT", map->lock("bucket", "obj").wait(ws));
  env.settle();
  KJ_EXPECT(env.lockers[2]->size() == 0);

  // Two of three services make a read quorum.
  KJ_EXPECT(env.lockers[0]->unlock(foreign("bucket/obj")).wait(ws));
  auto reader = map->rlock("bucket", "obj").wait(ws);
  KJ_EXPECT(!reader->isWriter());
}

KJ_TEST("acquisition retries until the holder lets go") {
  ClusterFixture env;
  auto& ws = env.waitScope;
  auto map = env.newMap("node-a", 5 * kj::SECONDS);

  KJ_EXPECT(env.lockers[0]->lock(foreign("bucket/obj")).wait(ws));
  KJ_EXPECT(env.lockers[1]->lock(foreign("bucket/obj")).wait(ws));

  kj::Maybe<kj::Own<NsLock>> held;
  auto pending = map->lock("bucket", "obj")
      .then([&held](kj::Own<NsLock>&& lock) { held = kj::mv(lock); })
      .eagerlyEvaluate(nullptr);
  env.advance(1 * kj::SECONDS);
  KJ_EXPECT(held == nullptr);

  KJ_EXPECT(env.lockers[0]->unlock(foreign("bucket/obj")).wait(ws));
  KJ_EXPECT(env.lockers[1]->unlock(foreign("bucket/obj")).wait(ws));
  env.advance(1 * kj::SECONDS);
  pending.wait(ws);
  KJ_EXPECT(held != nullptr);

  // Gives up once the deadline passes.
  auto blocked = map->lock("bucket", "obj").eagerlyEvaluate(nullptr);
  for (uint i = 0; i < 6; i++) {
    env.advance(1 * kj::SECONDS);
  }
  KJ_EXPECT_THROW_MESSAGE("LOCK_CONFLICT", blocked.wait(ws));
}

KJ_TEST("unreachable lock services") {
  ClusterFixture env;
  auto& ws = env.waitScope;

  auto degraded = env.newMap("node-a", 0 * kj::SECONDS, 1);
  degraded->lock("bucket", "obj").wait(ws)->release().wait(ws);

  auto broken = env.newMap("node-b", 0 * kj::SECONDS, 2);
  KJ_EXPECT_THROW_MESSAGE("LOCK_QUORUM_UNAVAILABLE", broken->lock("bucket", "obj").wait(ws));
  env.settle();
  KJ_EXPECT(env.entries() == 0);
}

KJ_TEST("a lock reclaimed by force is reported lost") {
  ClusterFixture env;
  auto& ws = env.waitScope;
  auto a = env.newMap("node-a", 0 * kj::SECONDS);
  auto admin = env.newMap("admin", 0 * kj::SECONDS);

  auto held = a->lock("bucket", "obj").wait(ws);
  auto lost = held->whenLost().eagerlyEvaluate(nullptr);

  // Refreshes keep the lease alive well past its length.
  for (uint i = 0; i < 12; i++) {
    env.advance(10 * kj::SECONDS);
  }
  KJ_EXPECT(!held->isLost());

  admin->forceUnlock("bucket", "obj").wait(ws);
  env.advance(10 * kj::SECONDS);
  KJ_EXPECT(held->isLost());
  lost.wait(ws);

  auto next = admin->lock("bucket", "obj").wait(ws);
  KJ_EXPECT(next->getUid() != held->getUid());
}

}  // namespace
}  // namespace granite
