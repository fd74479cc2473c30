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


#include "node.h"
#include "remote-locker.h"
#include <granite/storage/local-disk.h>
#include <granite/storage/disk-health.h>
#include <kj/debug.h>
#include <set>

namespace granite {

Node::Connection::Connection(kj::Own<kj::AsyncIoStream> streamParam,
                             NodeService::Client bootstrap)
    : stream(kj::mv(streamParam)),
      network(*stream, capnp::rpc::twoparty::Side::SERVER),
      rpcSystem(capnp::makeRpcServer(network, kj::mv(bootstrap))) {}

Node::Node(NodeConfig::Reader config, kj::Network& network, kj::Timer& timer, PeerHooks& hooks)
    : address(kj::heapString(config.getAddress())),
      network(network), timer(timer),
      connections(network),
      localLocker(kj::heapString(address), timer,
                  config.getLock().getLeaseSeconds() * kj::SECONDS),
      service(nullptr),
      tasks(*this) {
  KJ_REQUIRE(address.size() > 0, "node address not configured");

  // Every node that owns a disk runs a lock service.
  std::set<kj::String> nodes;
  nodes.insert(kj::heapString(address));
  for (auto set: config.getSets()) {
    for (auto endpoint: set.getDisks()) {
      nodes.insert(kj::mv(Endpoint::parse(endpoint).node));
    }
  }

  auto lockers = kj::heapArrayBuilder<kj::Own<Locker>>(nodes.size());
  for (auto& node: nodes) {
    if (node == address) {
      lockers.add(kj::Own<Locker>(&localLocker, kj::NullDisposer::instance));
    } else {
      lockers.add(kj::heap<RemoteLocker>(node, connections));
    }
  }
  locks = kj::heap<NsLockMap>(lockers.finish(), timer, LockPolicy::fromConfig(config.getLock()),
                              kj::heapString(address));

  auto setConfigs = config.getSets();
  auto erasure = storage::ErasureSetOptions::fromConfig(config.getErasure());
  auto builder = kj::heapArrayBuilder<kj::Own<storage::ErasureSet>>(setConfigs.size());
  for (uint i = 0; i < setConfigs.size(); i++) {
    auto endpoints = setConfigs[i].getDisks();
    auto disks = kj::heapArrayBuilder<kj::Own<storage::Disk>>(endpoints.size());
    for (uint j = 0; j < endpoints.size(); j++) {
      disks.add(openDisk(endpoints[j], i, j, endpoints.size(), config.getDisk()));
    }
    builder.add(kj::heap<storage::ErasureSet>(
        i, disks.finish(), erasure, *locks, timer,
        storage::HealPolicy::fromConfig(config.getHeal())));
  }
  sets = builder.finish();

  peer = kj::heap<Peer>(address, localDisks.asPtr(), sets, hooks, timer,
                        config.getScanIntervalSeconds() * kj::SECONDS);
  service = kj::heap<NodeServiceImpl>(localDisks.asPtr(), localLocker, sets, *peer);

  KJ_LOG(INFO, "node ready", address, sets.size(), localDisks.size(), nodes.size());
}

Node::~Node() noexcept(false) {}

void Node::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "node connection failed", exception);
}

kj::Own<storage::Disk> Node::openDisk(kj::StringPtr endpoint, uint setIndex, uint diskIndex,
                                      uint setDriveCount, DiskHealthConfig::Reader health) {
  auto parsed = Endpoint::parse(endpoint);

  kj::Own<storage::Disk> inner;
  if (parsed.node == address) {
    storage::LocalDisk::Placement placement;
    placement.setIndex = setIndex;
    placement.diskIndex = diskIndex;
    placement.setDriveCount = setDriveCount;
    inner = kj::heap<storage::LocalDisk>(kj::heapString(endpoint), parsed.path, placement);
  } else {
    inner = kj::heap<RemoteDisk>(endpoint, connections, timer, RetryPolicy::fromConfig(health));
  }

  auto disk = kj::heap<storage::HealthCheckedDisk>(
      kj::mv(inner), timer, storage::HealthPolicy::fromConfig(health));
  if (disk->isLocal()) {
    localDisks.add(disk.get());
  }
  return kj::mv(disk);
}

storage::ErasureSet& Node::setForObject(kj::StringPtr object) {
  return storage::setForObject(sets, object);
}

kj::Promise<void> Node::listen() {
  return network.parseAddress(address).then([this](kj::Own<kj::NetworkAddress>&& addr) {
    auto receiver = addr->listen();
    KJ_LOG(INFO, "listening", address, receiver->getPort());
    return acceptLoop(kj::mv(receiver));
  });
}

kj::Promise<void> Node::acceptLoop(kj::Own<kj::ConnectionReceiver> receiver) {
  auto promise = receiver->accept();
  return promise.then([this,KJ_MVCAP(receiver)](kj::Own<kj::AsyncIoStream>&& stream) mutable {
    auto connection = kj::heap<Connection>(kj::mv(stream), service);
    auto promise = connection->network.onDisconnect();
    tasks.add(promise.attach(kj::mv(connection)));
    return acceptLoop(kj::mv(receiver));
  });
}

}  // namespace granite
