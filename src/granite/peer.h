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


#ifndef GRANITE_PEER_H_
#define GRANITE_PEER_H_

#include <granite/storage/erasure-set.h>
#include <granite/node.capnp.h>
#include <kj/timer.h>
#include <map>

namespace granite {

typedef std::map<kj::String, kj::String> PropertyMap;
// Decoded form of a Properties payload.

kj::Array<byte> encodeProperties(const PropertyMap& properties);
PropertyMap decodeProperties(kj::ArrayPtr<const byte> bytes);
void setProperty(PropertyMap& properties, kj::StringPtr key, kj::String value);

class PeerHooks {
  // Caches and services owned by whatever embeds the node. Peers call these after changing
  // shared state so every node drops its stale copy.

public:
  virtual ~PeerHooks() noexcept(false) {}

  virtual kj::Promise<void> loadBucketMetadata(kj::StringPtr bucket) = 0;
  virtual kj::Promise<void> deleteBucketMetadata(kj::StringPtr bucket) = 0;
  virtual kj::Promise<void> loadPolicy(kj::StringPtr policyName) = 0;
  virtual kj::Promise<void> deletePolicy(kj::StringPtr policyName) = 0;
  virtual kj::Promise<void> loadPolicyMapping(kj::StringPtr userOrGroup, uint64_t userType,
                                              bool isGroup) = 0;
  virtual kj::Promise<void> loadUser(kj::StringPtr accessKey, bool temp) = 0;
  virtual kj::Promise<void> deleteUser(kj::StringPtr accessKey) = 0;
  virtual kj::Promise<void> loadServiceAccount(kj::StringPtr accessKey) = 0;
  virtual kj::Promise<void> deleteServiceAccount(kj::StringPtr accessKey) = 0;
  virtual kj::Promise<void> loadGroup(kj::StringPtr group) = 0;
  virtual kj::Promise<void> reloadSiteReplicationConfig() = 0;
  virtual kj::Promise<void> reloadPoolMeta() = 0;
  virtual kj::Promise<void> stopRebalance() = 0;
  virtual kj::Promise<void> loadRebalanceMeta(bool startRebalance) = 0;
  virtual kj::Promise<void> loadTransitionTierConfig() = 0;

  virtual kj::Promise<void> signalService(kj::StringPtr signal) = 0;
  // "restart", "stop", "reload-config" and so on.

  virtual kj::Promise<void> startProfiling(kj::StringPtr profiler) = 0;
  virtual kj::Promise<kj::Array<byte>> downloadProfileData() = 0;
};

class LoggingPeerHooks: public PeerHooks {
  // Acknowledges every call after logging it. Profiling is not supported.

public:
  kj::Promise<void> loadBucketMetadata(kj::StringPtr bucket) override;
  kj::Promise<void> deleteBucketMetadata(kj::StringPtr bucket) override;
  kj::Promise<void> loadPolicy(kj::StringPtr policyName) override;
  kj::Promise<void> deletePolicy(kj::StringPtr policyName) override;
  kj::Promise<void> loadPolicyMapping(kj::StringPtr userOrGroup, uint64_t userType,
                                      bool isGroup) override;
  kj::Promise<void> loadUser(kj::StringPtr accessKey, bool temp) override;
  kj::Promise<void> deleteUser(kj::StringPtr accessKey) override;
  kj::Promise<void> loadServiceAccount(kj::StringPtr accessKey) override;
  kj::Promise<void> deleteServiceAccount(kj::StringPtr accessKey) override;
  kj::Promise<void> loadGroup(kj::StringPtr group) override;
  kj::Promise<void> reloadSiteReplicationConfig() override;
  kj::Promise<void> reloadPoolMeta() override;
  kj::Promise<void> stopRebalance() override;
  kj::Promise<void> loadRebalanceMeta(bool startRebalance) override;
  kj::Promise<void> loadTransitionTierConfig() override;
  kj::Promise<void> signalService(kj::StringPtr signal) override;
  kj::Promise<void> startProfiling(kj::StringPtr profiler) override;
  kj::Promise<kj::Array<byte>> downloadProfileData() override;
};

class Peer: private kj::TaskSet::ErrorHandler {
  // What a node reports about itself to the rest of the cluster: the machine it runs on, its
  // local disks, usage counted by the namespace scanner, and heal progress.
  //
  // Usage is recomputed every `scanInterval` by scanning one online local disk of each erasure
  // set that has any. Objects are counted once per set, not once per disk.

public:
  Peer(kj::StringPtr address, kj::ArrayPtr<storage::Disk* const> localDisks,
       kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets, PeerHooks& hooks,
       kj::Timer& timer, kj::Duration scanInterval);
  ~Peer() noexcept(false);
  KJ_DISALLOW_COPY(Peer);

  PeerHooks& getHooks() { return hooks; }

  kj::Promise<kj::Array<storage::DiskInfo>> localStorageInfo(bool metrics);
  // One entry per local disk. Disks that could not be queried report only their endpoint.

  PropertyMap serverInfo(bool metrics);
  PropertyMap getCpus();
  PropertyMap getNetInfo();
  PropertyMap getPartitions();
  PropertyMap getOsInfo();
  PropertyMap getSeLinuxInfo();
  PropertyMap getSysConfig();
  PropertyMap getSysErrors();
  PropertyMap getMemInfo();
  PropertyMap getProcInfo();

  static constexpr uint64_t METRIC_DISK = 1;
  static constexpr uint64_t METRIC_HEAL = 2;
  static constexpr uint64_t METRIC_USAGE = 4;
  PropertyMap getMetrics(uint64_t metricType);
  // `metricType` is a bitmask of METRIC_*. Zero means all.

  PropertyMap getSrMetrics();

  kj::Promise<void> scanUsage();
  // Recompute usage now.

  const storage::DataUsage& getUsage() { return usage; }
  storage::DataUsage getBucketStats(kj::StringPtr bucket);
  // Usage restricted to one bucket. Empty if the bucket was not seen by the last scan.

  kj::Array<byte> getHealState();
  // Serialized HealState summed over every erasure set's heal queue.

  PropertyMap getMetacache(const PropertyMap& options);
  // Fails with FILE_NOT_FOUND if no listing has the requested "id".
  PropertyMap updateMetacache(PropertyMap&& update);
  // Merges `update` into the listing with the same "id", creating it if needed.

private:
  class ScanSink;

  kj::String address;
  kj::Array<storage::Disk*> localDisks;
  // Not owned.
  kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets;
  PeerHooks& hooks;
  kj::Timer& timer;
  kj::Duration scanInterval;
  int64_t startTime;

  storage::DataUsage usage;
  bool scanning = false;
  std::map<kj::String, PropertyMap> metacache;
  kj::TaskSet tasks;

  kj::Promise<void> scanLoop();
  kj::Promise<storage::DataUsage> scanSet(storage::ErasureSet& set, uint diskIndex);

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace granite

#endif // GRANITE_PEER_H_
