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
#include <kj/test.h>
#include <kj/debug.h>

namespace granite {
namespace {

kj::Array<kj::Maybe<kj::Exception>> outcomes(
    std::initializer_list<kj::Maybe<ErrorCode>> codes) {
  auto builder = kj::heapArrayBuilder<kj::Maybe<kj::Exception>>(codes.size());
  for (auto& code: codes) {
    KJ_IF_MAYBE(c, code) {
      builder.add(makeError(*c, __FILE__, __LINE__, kj::str("disk failed")));
    } else {
      builder.add(nullptr);
    }
  }
  return builder.finish();
}

ErrorCode codeOf(kj::Maybe<kj::Exception>&& error) {
  KJ_IF_MAYBE(e, error) {
    return classify(*e);
  } else {
    KJ_FAIL_EXPECT("expected an error");
    return ErrorCode::UNEXPECTED;
  }
}

KJ_TEST("error codes survive stringification") {
  auto error = GRANITE_ERROR(LOCK_CONFLICT, "held by ", "someone");
  KJ_EXPECT(classify(error) == ErrorCode::LOCK_CONFLICT);

  // What a caller sees after the error crossed an RPC boundary.
  auto remote = kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                              kj::str("remote exception: ", error.getDescription()));
  KJ_EXPECT(classify(remote) == ErrorCode::LOCK_CONFLICT);

  auto rebuilt = peerError(ErrorCode::LOCK_CONFLICT, error.getDescription());
  KJ_EXPECT(classify(rebuilt) == ErrorCode::LOCK_CONFLICT);
  KJ_EXPECT(rebuilt.getDescription() == error.getDescription());

  auto fromMessage = peerError(ErrorCode::DISK_FULL, "no space left");
  KJ_EXPECT(classify(fromMessage) == ErrorCode::DISK_FULL);
}

KJ_TEST("untagged exceptions are classified by type") {
  KJ_EXPECT(classify(KJ_EXCEPTION(DISCONNECTED, "connection reset")) ==
            ErrorCode::TRANSIENT_DISK_ERROR);
  KJ_EXPECT(classify(KJ_EXCEPTION(OVERLOADED, "timed out")) == ErrorCode::TRANSIENT_DISK_ERROR);
  KJ_EXPECT(classify(KJ_EXCEPTION(UNIMPLEMENTED, "no such method")) ==
            ErrorCode::NOT_IMPLEMENTED);
  KJ_EXPECT(classify(KJ_EXCEPTION(FAILED, "oops")) == ErrorCode::UNEXPECTED);

  // Transient errors use the DISCONNECTED type so capnp treats them alike.
  KJ_EXPECT(GRANITE_ERROR(DISK_OFFLINE).getType() == kj::Exception::Type::DISCONNECTED);
  KJ_EXPECT(GRANITE_ERROR(CORRUPT_SHARD).getType() == kj::Exception::Type::FAILED);
}

KJ_TEST("reduceErrors") {
  // Enough successes.
  KJ_EXPECT(reduceErrors(outcomes({nullptr, nullptr, ErrorCode::DISK_FULL}), nullptr, 2,
                         ErrorCode::ERASURE_WRITE_QUORUM) == nullptr);

  // A common error reaching the quorum is reported as is.
  KJ_EXPECT(codeOf(reduceErrors(
      outcomes({ErrorCode::FILE_NOT_FOUND, ErrorCode::FILE_NOT_FOUND, nullptr,
                ErrorCode::DISK_OFFLINE}),
      nullptr, 2, ErrorCode::ERASURE_WRITE_QUORUM)) == ErrorCode::FILE_NOT_FOUND);

  // Scattered errors become the quorum error.
  KJ_EXPECT(codeOf(reduceErrors(
      outcomes({ErrorCode::FILE_NOT_FOUND, ErrorCode::DISK_FULL, nullptr,
                ErrorCode::DISK_OFFLINE}),
      nullptr, 3, ErrorCode::ERASURE_WRITE_QUORUM)) == ErrorCode::ERASURE_WRITE_QUORUM);

  // Ignored errors never win.
  const ErrorCode ignored[] = { ErrorCode::DISK_OFFLINE };
  KJ_EXPECT(codeOf(reduceErrors(
      outcomes({ErrorCode::DISK_OFFLINE, ErrorCode::DISK_OFFLINE, ErrorCode::DISK_OFFLINE}),
      ignored, 2, ErrorCode::ERASURE_WRITE_QUORUM)) == ErrorCode::ERASURE_WRITE_QUORUM);
}

KJ_TEST("collectQuorum waits for everyone") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto paf0 = kj::newPromiseAndFulfiller<void>();
  auto paf1 = kj::newPromiseAndFulfiller<void>();
  auto paf2 = kj::newPromiseAndFulfiller<void>();

  auto builder = kj::heapArrayBuilder<kj::Promise<void>>(3);
  builder.add(kj::mv(paf0.promise));
  builder.add(kj::mv(paf1.promise));
  builder.add(kj::mv(paf2.promise));
  auto promise = collectQuorum(builder.finish(), 2);

  paf0.fulfiller->fulfill();
  paf1.fulfiller->reject(GRANITE_ERROR(FAULTY_DISK, "bad sector"));
  paf2.fulfiller->fulfill();

  auto outcome = promise.wait(waitScope);
  KJ_EXPECT(outcome.reached());
  KJ_EXPECT(outcome.successCount == 2);
  KJ_EXPECT(outcome.succeeded(0));
  KJ_EXPECT(!outcome.succeeded(1));
  KJ_EXPECT(outcome.succeeded(2));
  KJ_EXPECT(outcome.reduce(ErrorCode::ERASURE_WRITE_QUORUM) == nullptr);
}

KJ_TEST("collectQuorum resolves early and counts stragglers as transient") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  {
    auto builder = kj::heapArrayBuilder<kj::Promise<void>>(3);
    builder.add(kj::READY_NOW);
    builder.add(kj::READY_NOW);
    builder.add(kj::Promise<void>(kj::NEVER_DONE));
    auto outcome = collectQuorum(builder.finish(), 2, QuorumMode::CANCEL_REST).wait(waitScope);
    KJ_EXPECT(outcome.reached());
    KJ_EXPECT(!outcome.settled[2]);
  }

  {
    // Two failures out of three: a quorum of two is impossible without waiting for the last.
    auto builder = kj::heapArrayBuilder<kj::Promise<void>>(3);
    builder.add(kj::Promise<void>(GRANITE_ERROR(DISK_FULL)));
    builder.add(kj::Promise<void>(GRANITE_ERROR(DISK_FULL)));
    builder.add(kj::Promise<void>(kj::NEVER_DONE));
    auto outcome = collectQuorum(builder.finish(), 2, QuorumMode::CANCEL_REST).wait(waitScope);
    KJ_EXPECT(!outcome.reached());

    auto all = outcome.errorsWithPending();
    KJ_EXPECT(codeOf(kj::mv(all[2])) == ErrorCode::TRANSIENT_DISK_ERROR);
    KJ_EXPECT(codeOf(outcome.reduce(ErrorCode::ERASURE_WRITE_QUORUM)) == ErrorCode::DISK_FULL);
  }
}

KJ_TEST("collectQuorum reports late results in the background") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  struct ErrorHandlerImpl: public kj::TaskSet::ErrorHandler {
    void taskFailed(kj::Exception&& exception) override {
      KJ_FAIL_EXPECT(exception);
    }
  };
  ErrorHandlerImpl errorHandler;
  kj::TaskSet background(errorHandler);

  auto slow = kj::newPromiseAndFulfiller<void>();
  auto builder = kj::heapArrayBuilder<kj::Promise<void>>(2);
  builder.add(kj::READY_NOW);
  builder.add(kj::mv(slow.promise));

  kj::Vector<uint> late;
  auto outcome = collectQuorum(builder.finish(), 1, background,
      [&](uint index, kj::Maybe<kj::Exception>&& error) {
    KJ_EXPECT(error == nullptr);
    late.add(index);
  }).wait(waitScope);
  KJ_EXPECT(outcome.reached());
  KJ_EXPECT(late.size() == 0);

  slow.fulfiller->fulfill();
  for (uint i = 0; i < 4; i++) {
    kj::evalLater([]() {}).wait(waitScope);
  }
  KJ_ASSERT(late.size() == 1);
  KJ_EXPECT(late[0] == 1);
}

KJ_TEST("collectValues") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto builder = kj::heapArrayBuilder<kj::Promise<kj::String>>(3);
  builder.add(kj::Promise<kj::String>(kj::str("a")));
  builder.add(kj::Promise<kj::String>(GRANITE_ERROR(VOLUME_NOT_FOUND)));
  builder.add(kj::Promise<kj::String>(kj::str("c")));

  auto result = collectValues(builder.finish(), 2).wait(waitScope);
  KJ_EXPECT(result.outcome.reached());
  KJ_EXPECT(result.values[1] == nullptr);
  KJ_IF_MAYBE(value, result.values[2]) {
    KJ_EXPECT(*value == "c");
  } else {
    KJ_FAIL_EXPECT("missing value");
  }
}

}  // namespace
}  // namespace granite
