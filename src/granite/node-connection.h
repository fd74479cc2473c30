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

#ifndef GRANITE_NODE_CONNECTION_H_
#define GRANITE_NODE_CONNECTION_H_

#include "errors.h"
#include <granite/node.capnp.h>
#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <map>

namespace granite {

class NodeConnections: private kj::TaskSet::ErrorHandler {
  // Two-party RPC connections to the other nodes of the cluster, one per "host:port", opened on
  // first use. A connection that drops (or never comes up) is forgotten, so the next call
  // reconnects. Calls made on a dead connection fail with DISCONNECTED exceptions, which the
  // storage layer treats as transient.

public:
  NodeConnections(kj::Network& network);
  ~NodeConnections() noexcept(false);
  KJ_DISALLOW_COPY(NodeConnections);

  NodeService::Client get(kj::StringPtr address);

  size_t size() { return connections.size(); }

private:
  struct Connection {
    uint64_t generation;
    kj::Own<kj::AsyncIoStream> stream;
    kj::Own<capnp::TwoPartyClient> rpc;
    kj::Maybe<NodeService::Client> service;
  };

  kj::Network& network;
  std::map<kj::String, kj::Own<Connection>> connections;
  uint64_t nextGeneration = 0;
  kj::TaskSet tasks;

  kj::Promise<NodeService::Client> connect(kj::String address, Connection& connection);
  void forget(kj::StringPtr address, uint64_t generation);

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace granite

#endif // GRANITE_NODE_CONNECTION_H_
