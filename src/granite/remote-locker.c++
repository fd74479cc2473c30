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

#include "remote-locker.h"
#include <kj/debug.h>

namespace granite {

RemoteLocker::RemoteLocker(kj::StringPtr node, NodeConnections& connections)
    : node(kj::heapString(node)), connections(connections) {}

template <typename Request>
kj::Promise<bool> RemoteLocker::send(Request&& request, const LockRequest& args) {
  request.setArgs(args.encode());
  return request.send().then([](auto&& response) {
    if (response.getSuccess()) return true;

    auto error = response.getError();
    auto code = static_cast<ErrorCode>(error.getCode());
    if (code == ErrorCode::LOCK_CONFLICT || code == ErrorCode::LOCK_NOT_HELD) {
      return false;
    }
    throwError(error.getCode() == 0 ? ErrorCode::UNEXPECTED : code, error.getMessage());
  });
}

kj::Promise<bool> RemoteLocker::lock(const LockRequest& args) {
  return send(connections.get(node).lockRequest(), args);
}

kj::Promise<bool> RemoteLocker::unlock(const LockRequest& args) {
  return send(connections.get(node).unlockRequest(), args);
}

kj::Promise<bool> RemoteLocker::rlock(const LockRequest& args) {
  return send(connections.get(node).rLockRequest(), args);
}

kj::Promise<bool> RemoteLocker::runlock(const LockRequest& args) {
  return send(connections.get(node).rUnlockRequest(), args);
}

kj::Promise<bool> RemoteLocker::forceUnlock(const LockRequest& args) {
  return send(connections.get(node).forceUnlockRequest(), args);
}

kj::Promise<bool> RemoteLocker::refresh(const LockRequest& args) {
  return send(connections.get(node).refreshRequest(), args);
}

}  // namespace granite
