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

#include "node-connection.h"
#include <kj/debug.h>

namespace granite {

NodeConnections::NodeConnections(kj::Network& network)
    : network(network), tasks(*this) {}

NodeConnections::~NodeConnections() noexcept(false) {}

void NodeConnections::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "node connection task failed", exception);
}

NodeService::Client NodeConnections::get(kj::StringPtr address) {
  auto key = kj::heapString(address);
  auto iter = connections.find(key);
  if (iter != connections.end()) {
    KJ_IF_MAYBE(service, iter->second->service) {
      return *service;
    }
  }

  auto connection = kj::heap<Connection>();
  connection->generation = nextGeneration++;
  auto& ref = *connection;
  NodeService::Client client = connect(kj::heapString(address), ref);
  ref.service = client;

  connections.erase(key);
  connections.insert(std::make_pair(kj::mv(key), kj::mv(connection)));
  return client;
}

kj::Promise<NodeService::Client> NodeConnections::connect(
    kj::String address, Connection& connection) {
  uint64_t generation = connection.generation;
  auto failedAddress = kj::heapString(address);
  auto promise = network.parseAddress(address);
  return promise.then([](kj::Own<kj::NetworkAddress>&& addr) {
    auto connected = addr->connect();
    return connected.attach(kj::mv(addr));
  }).then([this,&connection,generation,KJ_MVCAP(address)](
      kj::Own<kj::AsyncIoStream>&& stream) mutable {
    KJ_LOG(INFO, "connected to node", address);
    connection.stream = kj::mv(stream);
    connection.rpc = kj::heap<capnp::TwoPartyClient>(*connection.stream);
    tasks.add(connection.rpc->onDisconnect().then([this,KJ_MVCAP(address),generation]() {
      KJ_LOG(WARNING, "lost connection to node", address);
      forget(address, generation);
    }));
    return connection.rpc->bootstrap().castAs<NodeService>();
  }, [this,generation,KJ_MVCAP(failedAddress)](
      kj::Exception&& exception) -> NodeService::Client {
    auto& address = failedAddress;
    KJ_LOG(WARNING, "couldn't connect to node", address, exception.getDescription());
    forget(address, generation);
    kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "couldn't connect to node", address,
                                         exception.getDescription()));
  });
}

void NodeConnections::forget(kj::StringPtr address, uint64_t generation) {
  // Runs from continuations owned by the connection itself, so the erase is deferred.
  tasks.add(kj::evalLater([this,address=kj::heapString(address),generation]() {
    auto iter = connections.find(address);
    if (iter != connections.end() && iter->second->generation == generation) {
      connections.erase(iter);
    }
  }));
}

}  // namespace granite
