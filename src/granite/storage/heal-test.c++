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
#include <kj/test.h>

namespace granite {
namespace storage {
namespace {

class ScriptedHealer final: public Healer {
  // Fails the first `failures` attempts, then succeeds.

public:
  explicit ScriptedHealer(uint failures): failures(failures) {}

  uint calls = 0;

  kj::Promise<void> healObject(kj::StringPtr bucket, kj::StringPtr object,
                               kj::StringPtr versionId) override {
    if (calls++ < failures) {
      return GRANITE_ERROR(TRANSIENT_DISK_ERROR, "disk still missing");
    }
    return kj::READY_NOW;
  }

private:
  uint failures;
};

struct QueueFixture {
  QueueFixture()
      : waitScope(loop), timer(kj::origin<kj::TimePoint>()), queue(timer, policy()) {}

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  HealQueue queue;

  static HealPolicy policy() {
    HealPolicy result;
    result.retryInterval = 10 * kj::SECONDS;
    result.maxAttempts = 3;
    return result;
  }

  void advance(kj::Duration delay) {
    timer.advanceTo(timer.now() + delay);
    for (uint i = 0; i < 10; i++) {
      kj::evalLater([]() {}).wait(waitScope);
    }
  }
};

KJ_TEST("heals are retried with backoff") {
  QueueFixture env;
  ScriptedHealer healer(2);

  env.queue.add(healer, "bucket", "obj", "");
  env.queue.add(healer, "bucket", "obj", "");
  KJ_EXPECT(env.queue.contains("bucket", "obj", ""));
  KJ_EXPECT(!env.queue.contains("bucket", "obj", "v1"));
  KJ_EXPECT(env.queue.getStats().queued == 1);
  auto empty = env.queue.onEmpty();

  env.advance(9 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 0);
  env.advance(1 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 1);

  // The delay doubles after each failure.
  env.advance(19 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 1);
  env.advance(1 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 2);
  env.advance(39 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 2);
  env.advance(1 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 3);

  auto stats = env.queue.getStats();
  KJ_EXPECT(stats.queued == 0);
  KJ_EXPECT(stats.healed == 1);
  KJ_EXPECT(stats.failed == 0);
  KJ_EXPECT(!env.queue.contains("bucket", "obj", ""));
  empty.wait(env.waitScope);
}

KJ_TEST("heals give up after maxAttempts") {
  QueueFixture env;
  ScriptedHealer healer(100);

  KJ_EXPECT_LOG(ERROR, "giving up on heal");
  env.queue.add(healer, "bucket", "obj", "v1");
  env.advance(10 * kj::SECONDS);
  env.advance(20 * kj::SECONDS);
  KJ_EXPECT(env.queue.contains("bucket", "obj", "v1"));
  env.advance(40 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 3);

  auto stats = env.queue.getStats();
  KJ_EXPECT(stats.queued == 0);
  KJ_EXPECT(stats.healed == 0);
  KJ_EXPECT(stats.failed == 1);
  KJ_EXPECT(!env.queue.contains("bucket", "obj", "v1"));

  // Nothing is retried after giving up, but the object can be queued again.
  env.advance(100 * kj::SECONDS);
  KJ_EXPECT(healer.calls == 3);
  env.queue.add(healer, "bucket", "obj", "v1");
  KJ_EXPECT(env.queue.getStats().queued == 1);
}

}  // namespace
}  // namespace storage
}  // namespace granite
