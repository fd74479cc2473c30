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

#include "local-locker.h"
#include <kj/test.h>

namespace granite {
namespace {

LockRequest request(kj::StringPtr uid, kj::StringPtr resource) {
  LockRequest result;
  result.uid = kj::heapString(uid);
  result.resources = kj::heapArray<kj::String>(1);
  result.resources[0] = kj::heapString(resource);
  result.owner = kj::heapString("node-a");
  result.source = kj::heapString("test");
  result.quorum = 1;
  return result;
}

struct LockerFixture {
  LockerFixture()
      : waitScope(loop), timer(kj::origin<kj::TimePoint>()),
        locker(kj::heapString("127.0.0.1:9000"), timer, 60 * kj::SECONDS) {}

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  LocalLocker locker;

  void advance(kj::Duration delay) {
    timer.advanceTo(timer.now() + delay);
  }
};

KJ_TEST("write locks exclude everyone") {
  LockerFixture env;
  auto& locker = env.locker;
  auto& ws = env.waitScope;

  KJ_EXPECT(locker.lock(request("one", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.lock(request("two", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.rlock(request("two", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.lock(request("two", "bucket/other")).wait(ws));
  KJ_EXPECT(locker.size() == 2);

  // Only the holder's token releases it.
  KJ_EXPECT(!locker.unlock(request("two", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.runlock(request("one", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.unlock(request("one", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.unlock(request("one", "bucket/obj")).wait(ws));

  KJ_EXPECT(locker.lock(request("two", "bucket/obj")).wait(ws));
}

KJ_TEST("read locks are shared") {
  LockerFixture env;
  auto& locker = env.locker;
  auto& ws = env.waitScope;

  KJ_EXPECT(locker.rlock(request("r1", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.rlock(request("r2", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.rlock(request("r2", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.lock(request("w", "bucket/obj")).wait(ws));

  KJ_EXPECT(locker.runlock(request("r1", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.runlock(request("r2", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.lock(request("w", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.runlock(request("r2", "bucket/obj")).wait(ws));

  KJ_EXPECT(locker.size() == 0);
  KJ_EXPECT(locker.lock(request("w", "bucket/obj")).wait(ws));
}

KJ_TEST("multi-resource locks are all or nothing") {
  LockerFixture env;
  auto& locker = env.locker;
  auto& ws = env.waitScope;

  KJ_EXPECT(locker.lock(request("one", "bucket/b")).wait(ws));

  auto args = request("two", "bucket/a");
  args.resources = kj::heapArray<kj::String>(2);
  args.resources[0] = kj::heapString("bucket/a");
  args.resources[1] = kj::heapString("bucket/b");
  KJ_EXPECT(!locker.lock(args).wait(ws));
  KJ_EXPECT(locker.size() == 1);

  KJ_EXPECT(locker.unlock(request("one", "bucket/b")).wait(ws));
  KJ_EXPECT(locker.lock(args).wait(ws));
  KJ_EXPECT(locker.size() == 2);
  KJ_EXPECT(locker.unlock(args).wait(ws));
  KJ_EXPECT(locker.size() == 0);

  KJ_EXPECT_THROW_MESSAGE("exactly one resource", locker.rlock(args).wait(ws));
}

KJ_TEST("leases expire unless refreshed") {
  LockerFixture env;
  auto& locker = env.locker;
  auto& ws = env.waitScope;

  KJ_EXPECT(locker.lock(request("old", "bucket/obj")).wait(ws));
  KJ_EXPECT(locker.lock(request("kept", "bucket/kept")).wait(ws));

  env.advance(40 * kj::SECONDS);
  KJ_EXPECT(locker.refresh(request("kept", "bucket/kept")).wait(ws));
  KJ_EXPECT(!locker.refresh(request("other", "bucket/kept")).wait(ws));

  env.advance(40 * kj::SECONDS);
  KJ_EXPECT(locker.lock(request("new", "bucket/obj")).wait(ws));
  KJ_EXPECT(!locker.lock(request("new", "bucket/kept")).wait(ws));
  KJ_EXPECT(!locker.refresh(request("old", "bucket/obj")).wait(ws));

  // The sweep drops expired entries nobody touches.
  env.advance(120 * kj::SECONDS);
  locker.expireOld();
  KJ_EXPECT(locker.size() == 0);
}

KJ_TEST("force unlock") {
  LockerFixture env;
  auto& locker = env.locker;
  auto& ws = env.waitScope;

  KJ_EXPECT(locker.lock(request("one", "bucket/a")).wait(ws));
  KJ_EXPECT(locker.rlock(request("two", "bucket/b")).wait(ws));
  KJ_EXPECT(locker.rlock(request("three", "bucket/b")).wait(ws));
  KJ_EXPECT(locker.lock(request("two", "bucket/c")).wait(ws));

  KJ_EXPECT(locker.forceUnlock(request("", "bucket/a")).wait(ws));
  KJ_EXPECT(locker.size() == 2);

  // By token alone.
  auto byToken = request("two", "");
  byToken.resources = nullptr;
  KJ_EXPECT(locker.forceUnlock(byToken).wait(ws));
  KJ_EXPECT(locker.size() == 1);
  KJ_EXPECT(!locker.forceUnlock(byToken).wait(ws));
  KJ_EXPECT(!locker.lock(request("four", "bucket/b")).wait(ws));
  KJ_EXPECT(locker.runlock(request("three", "bucket/b")).wait(ws));
}

KJ_TEST("lock requests survive encoding") {
  auto args = request("uid-1", "bucket/obj");
  args.quorum = 3;
  auto decoded = LockRequest::decode(args.encode());
  KJ_EXPECT(decoded.uid == "uid-1");
  KJ_ASSERT(decoded.resources.size() == 1);
  KJ_EXPECT(decoded.resources[0] == "bucket/obj");
  KJ_EXPECT(decoded.owner == "node-a");
  KJ_EXPECT(decoded.source == "test");
  KJ_EXPECT(decoded.quorum == 3);
}

}  // namespace
}  // namespace granite
