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


#ifndef GRANITE_NODE_H_
#define GRANITE_NODE_H_

#include "node-service.h"
#include "node-connection.h"
#include "remote-disk.h"
#include <granite/config.capnp.h>
#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>

namespace granite {

class Node: private kj::TaskSet::ErrorHandler {
  // One storage server: its disks, the erasure sets they form with the other nodes' disks,
  // the cluster-wide lock map, and the NodeService that exposes all of it.
  //
  // Disk endpoints whose "host:port" is the configured address are opened locally; every other
  // endpoint is reached through its node's NodeService. All disks are health-checked.

public:
  Node(NodeConfig::Reader config, kj::Network& network, kj::Timer& timer, PeerHooks& hooks);
  ~Node() noexcept(false);
  KJ_DISALLOW_COPY(Node);

  kj::StringPtr getAddress() { return address; }
  NodeService::Client getService() { return service; }
  kj::ArrayPtr<const kj::Own<storage::ErasureSet>> getSets() { return sets; }
  storage::ErasureSet& setForObject(kj::StringPtr object);
  NsLockMap& getLocks() { return *locks; }

  kj::Promise<void> listen();
  // Serves the configured address until the returned promise is cancelled.

  kj::Promise<void> acceptLoop(kj::Own<kj::ConnectionReceiver> receiver);
  // Serves every connection accepted from `receiver`.

private:
  struct Connection {
    // A peer connected to us. Lives until the peer disconnects.
    kj::Own<kj::AsyncIoStream> stream;
    capnp::TwoPartyVatNetwork network;
    capnp::RpcSystem<capnp::rpc::twoparty::VatId> rpcSystem;

    Connection(kj::Own<kj::AsyncIoStream> streamParam, NodeService::Client bootstrap);
  };

  kj::String address;
  kj::Network& network;
  kj::Timer& timer;
  NodeConnections connections;
  LocalLocker localLocker;
  kj::Own<NsLockMap> locks;
  kj::Array<kj::Own<storage::ErasureSet>> sets;
  kj::Vector<storage::Disk*> localDisks;
  // Health-checked local disks, owned by `sets`.
  kj::Own<Peer> peer;
  NodeService::Client service;
  kj::TaskSet tasks;

  kj::Own<storage::Disk> openDisk(kj::StringPtr endpoint, uint setIndex, uint diskIndex,
                                  uint setDriveCount, DiskHealthConfig::Reader health);

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace granite

#endif // GRANITE_NODE_H_
