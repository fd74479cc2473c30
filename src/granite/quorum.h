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

#ifndef GRANITE_QUORUM_H_
#define GRANITE_QUORUM_H_

#include "errors.h"
#include <kj/async.h>
#include <kj/function.h>
#include <kj/vector.h>

namespace granite {

enum class QuorumMode {
  WAIT_ALL,
  // Resolve once every participant has settled.

  CANCEL_REST,
  // Resolve as soon as `threshold` participants succeeded (or can no longer succeed). Unsettled
  // participants are cancelled.

  BACKGROUND_REST
  // Resolve as soon as `threshold` participants succeeded (or can no longer succeed). Unsettled
  // participants keep running in a caller-supplied TaskSet and report their outcome to a
  // callback.
};

struct QuorumOutcome {
  kj::Array<kj::Maybe<kj::Exception>> errors;
  // Per participant. Null if the participant succeeded or had not settled at resolution.

  kj::Array<bool> settled;
  uint successCount;
  uint threshold;

  bool reached() const { return successCount >= threshold; }

  bool succeeded(uint i) const { return settled[i] && errors[i] == nullptr; }

  kj::Array<kj::Maybe<kj::Exception>> errorsWithPending() const;
  // Like `errors`, but unsettled participants count as TRANSIENT_DISK_ERROR failures.

  kj::Maybe<kj::Exception> reduce(ErrorCode quorumError,
                                  kj::ArrayPtr<const ErrorCode> ignored = nullptr) const;
  // The single error the whole operation reports, or null if the quorum was reached.
};

kj::Promise<QuorumOutcome> collectQuorum(
    kj::Array<kj::Promise<void>>&& participants, uint threshold,
    QuorumMode mode = QuorumMode::WAIT_ALL);
// Join the participants of one quorum operation (shard writes, shard reads, lock grants,
// metadata reads). Never rejects: failures are reported per participant in the outcome.

kj::Promise<QuorumOutcome> collectQuorum(
    kj::Array<kj::Promise<void>>&& participants, uint threshold, kj::TaskSet& background,
    kj::Function<void(uint index, kj::Maybe<kj::Exception>&& error)> onLateResult);
// BACKGROUND_REST mode. `onLateResult` is called for each participant that settles after the
// returned promise resolved.

template <typename T>
struct QuorumValues {
  kj::Array<kj::Maybe<T>> values;
  QuorumOutcome outcome;
};

template <typename T>
kj::Promise<QuorumValues<T>> collectValues(
    kj::Array<kj::Promise<T>>&& promises, uint threshold,
    QuorumMode mode = QuorumMode::WAIT_ALL);
// collectQuorum() for participants that produce a value.

// =======================================================================================
// inline implementation details

namespace _ {  // private

template <typename T>
struct ValueHolder: public kj::Refcounted {
  explicit ValueHolder(size_t count): values(kj::heapArray<kj::Maybe<T>>(count)) {}

  kj::Array<kj::Maybe<T>> values;
  bool closed = false;
};

}  // namespace _ (private)

template <typename T>
kj::Promise<QuorumValues<T>> collectValues(
    kj::Array<kj::Promise<T>>&& promises, uint threshold, QuorumMode mode) {
  KJ_REQUIRE(mode != QuorumMode::BACKGROUND_REST,
             "values of background participants would be lost");

  auto holder = kj::refcounted<_::ValueHolder<T>>(promises.size());
  auto participants = kj::heapArrayBuilder<kj::Promise<void>>(promises.size());
  for (uint i = 0; i < promises.size(); i++) {
    auto& holderRef = *holder;
    participants.add(promises[i].then([&holderRef,i](T&& value) {
      if (!holderRef.closed) holderRef.values[i] = kj::mv(value);
    }).attach(kj::addRef(*holder)));
  }

  return collectQuorum(participants.finish(), threshold, mode)
      .then([KJ_MVCAP(holder)](QuorumOutcome&& outcome) mutable {
    holder->closed = true;
    return QuorumValues<T> { kj::mv(holder->values), kj::mv(outcome) };
  });
}

}  // namespace granite

#endif // GRANITE_QUORUM_H_
