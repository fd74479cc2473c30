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

#ifndef GRANITE_REMOTE_LOCKER_H_
#define GRANITE_REMOTE_LOCKER_H_

#include "local-locker.h"
#include "node-connection.h"

namespace granite {

class RemoteLocker final: public Locker {
  // The lock table of another node. A refusal (LOCK_CONFLICT or LOCK_NOT_HELD from the peer)
  // resolves to false; anything else, including transport failures, is thrown. Calls are not
  // retried here: NsLockMap counts an unreachable service against the quorum and tries again
  // as a whole.

public:
  RemoteLocker(kj::StringPtr node, NodeConnections& connections);

  kj::StringPtr getEndpoint() override { return node; }

  kj::Promise<bool> lock(const LockRequest& args) override;
  kj::Promise<bool> unlock(const LockRequest& args) override;
  kj::Promise<bool> rlock(const LockRequest& args) override;
  kj::Promise<bool> runlock(const LockRequest& args) override;
  kj::Promise<bool> forceUnlock(const LockRequest& args) override;
  kj::Promise<bool> refresh(const LockRequest& args) override;

private:
  kj::String node;
  NodeConnections& connections;

  template <typename Request>
  kj::Promise<bool> send(Request&& request, const LockRequest& args);
};

}  // namespace granite

#endif // GRANITE_REMOTE_LOCKER_H_
