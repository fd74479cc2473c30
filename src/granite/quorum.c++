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

#include "quorum.h"
#include <kj/debug.h>

namespace granite {

kj::Array<kj::Maybe<kj::Exception>> QuorumOutcome::errorsWithPending() const {
  auto result = kj::heapArrayBuilder<kj::Maybe<kj::Exception>>(errors.size());
  for (uint i = 0; i < errors.size(); i++) {
    if (!settled[i]) {
      result.add(GRANITE_ERROR(TRANSIENT_DISK_ERROR, "participant did not respond in time"));
    } else KJ_IF_MAYBE(e, errors[i]) {
      result.add(kj::Exception(*e));
    } else {
      result.add(nullptr);
    }
  }
  return result.finish();
}

kj::Maybe<kj::Exception> QuorumOutcome::reduce(
    ErrorCode quorumError, kj::ArrayPtr<const ErrorCode> ignored) const {
  if (reached()) return nullptr;
  auto all = errorsWithPending();
  KJ_IF_MAYBE(e, reduceErrors(all, ignored, threshold, quorumError)) {
    return kj::mv(*e);
  } else {
    // Ignored errors can make reduceErrors() see a quorum of "successes" that we did not count.
    return makeError(quorumError, __FILE__, __LINE__,
        kj::str(successCount, " of ", errors.size(), " succeeded, ", threshold, " needed"));
  }
}

namespace {

class QuorumCollector: public kj::Refcounted {
  // Shared state of one collectQuorum() call. Participants report here; the collector fulfills
  // once the outcome is decided.

public:
  QuorumCollector(uint count, uint threshold, QuorumMode mode,
                  kj::Own<kj::PromiseFulfiller<void>> fulfiller)
      : threshold(threshold), mode(mode), waitingCount(count),
        errors(kj::heapArray<kj::Maybe<kj::Exception>>(count)),
        settled(kj::heapArray<bool>(count)),
        fulfiller(kj::mv(fulfiller)) {
    for (auto& s: settled) s = false;
    check();
  }

  void succeed(uint i) {
    KJ_ASSERT(waitingCount > 0);
    --waitingCount;
    if (resolved) {
      reportLate(i, nullptr);
      return;
    }
    settled[i] = true;
    ++successCount;
    check();
  }

  void fail(uint i, kj::Exception&& e) {
    KJ_ASSERT(waitingCount > 0);
    --waitingCount;
    if (resolved) {
      reportLate(i, kj::mv(e));
      return;
    }
    settled[i] = true;
    errors[i] = kj::mv(e);
    check();
  }

  QuorumOutcome takeOutcome() {
    auto errorsCopy = kj::heapArrayBuilder<kj::Maybe<kj::Exception>>(errors.size());
    for (auto& error: errors) {
      KJ_IF_MAYBE(e, error) {
        errorsCopy.add(kj::Exception(*e));
      } else {
        errorsCopy.add(nullptr);
      }
    }
    auto settledCopy = kj::heapArray<bool>(settled.asPtr());
    return { errorsCopy.finish(), kj::mv(settledCopy), successCount, threshold };
  }

  kj::Vector<kj::Promise<void>> ownedParticipants;
  // Participants in WAIT_ALL and CANCEL_REST modes. Destroying the collector cancels them.

  kj::Maybe<kj::Function<void(uint, kj::Maybe<kj::Exception>&&)>> onLateResult;

private:
  uint threshold;
  QuorumMode mode;
  uint successCount = 0;
  uint waitingCount;
  kj::Array<kj::Maybe<kj::Exception>> errors;
  kj::Array<bool> settled;
  kj::Own<kj::PromiseFulfiller<void>> fulfiller;
  bool resolved = false;

  void check() {
    if (resolved) return;

    bool done;
    if (mode == QuorumMode::WAIT_ALL) {
      done = waitingCount == 0;
    } else {
      done = waitingCount == 0 || successCount >= threshold ||
             successCount + waitingCount < threshold;
    }

    if (done) {
      resolved = true;
      fulfiller->fulfill();
    }
  }

  void reportLate(uint i, kj::Maybe<kj::Exception>&& error) {
    KJ_IF_MAYBE(callback, onLateResult) {
      (*callback)(i, kj::mv(error));
    }
  }
};

}  // namespace

kj::Promise<QuorumOutcome> collectQuorum(
    kj::Array<kj::Promise<void>>&& participants, uint threshold, QuorumMode mode) {
  KJ_REQUIRE(mode != QuorumMode::BACKGROUND_REST,
             "background participants need a TaskSet; use the other overload");

  auto paf = kj::newPromiseAndFulfiller<void>();
  auto collector = kj::refcounted<QuorumCollector>(
      participants.size(), threshold, mode, kj::mv(paf.fulfiller));

  for (uint i = 0; i < participants.size(); i++) {
    auto& collectorRef = *collector;
    collector->ownedParticipants.add(participants[i].then([&collectorRef,i]() {
      collectorRef.succeed(i);
    }, [&collectorRef,i](kj::Exception&& e) {
      collectorRef.fail(i, kj::mv(e));
    }).eagerlyEvaluate(nullptr));
  }

  return paf.promise.then([KJ_MVCAP(collector)]() mutable {
    return collector->takeOutcome();
  });
}

kj::Promise<QuorumOutcome> collectQuorum(
    kj::Array<kj::Promise<void>>&& participants, uint threshold, kj::TaskSet& background,
    kj::Function<void(uint index, kj::Maybe<kj::Exception>&& error)> onLateResult) {
  auto paf = kj::newPromiseAndFulfiller<void>();
  auto collector = kj::refcounted<QuorumCollector>(
      participants.size(), threshold, QuorumMode::BACKGROUND_REST, kj::mv(paf.fulfiller));
  collector->onLateResult = kj::mv(onLateResult);

  for (uint i = 0; i < participants.size(); i++) {
    auto& collectorRef = *collector;
    background.add(participants[i].then([&collectorRef,i]() {
      collectorRef.succeed(i);
    }, [&collectorRef,i](kj::Exception&& e) {
      collectorRef.fail(i, kj::mv(e));
    }).attach(kj::addRef(*collector)));
  }

  return paf.promise.then([KJ_MVCAP(collector)]() mutable {
    return collector->takeOutcome();
  });
}

}  // namespace granite
