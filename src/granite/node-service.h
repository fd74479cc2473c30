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


#ifndef GRANITE_NODE_SERVICE_H_
#define GRANITE_NODE_SERVICE_H_

#include "peer.h"
#include "local-locker.h"
#include <granite/node.capnp.h>

namespace granite {

class NodeServiceImpl final: public NodeService::Server, private kj::TaskSet::ErrorHandler {
  // Serves this node's disks, lock table and peer calls to the rest of the cluster.
  //
  // Failures never reject the RPC itself: each call answers with `success` false and an error
  // carrying its ErrorCode, so the caller can tell a refused operation from a lost connection.

public:
  NodeServiceImpl(kj::ArrayPtr<storage::Disk* const> localDisks, Locker& locker,
                  kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets, Peer& peer);
  ~NodeServiceImpl() noexcept(false);

protected:
  // meta
  kj::Promise<void> ping(PingContext context) override;
  kj::Promise<void> healBucket(HealBucketContext context) override;
  kj::Promise<void> listBucket(ListBucketContext context) override;
  kj::Promise<void> makeBucket(MakeBucketContext context) override;
  kj::Promise<void> getBucketInfo(GetBucketInfoContext context) override;
  kj::Promise<void> deleteBucket(DeleteBucketContext context) override;

  // disk
  kj::Promise<void> readAll(ReadAllContext context) override;
  kj::Promise<void> writeAll(WriteAllContext context) override;
  kj::Promise<void> deleteFile(DeleteFileContext context) override;
  kj::Promise<void> verifyFile(VerifyFileContext context) override;
  kj::Promise<void> checkParts(CheckPartsContext context) override;
  kj::Promise<void> renamePart(RenamePartContext context) override;
  kj::Promise<void> renameFile(RenameFileContext context) override;
  kj::Promise<void> renameData(RenameDataContext context) override;
  kj::Promise<void> createFile(CreateFileContext context) override;
  kj::Promise<void> appendFile(AppendFileContext context) override;
  kj::Promise<void> readFileStream(ReadFileStreamContext context) override;
  kj::Promise<void> listDir(ListDirContext context) override;
  kj::Promise<void> walkDir(WalkDirContext context) override;
  kj::Promise<void> makeVolumes(MakeVolumesContext context) override;
  kj::Promise<void> makeVolume(MakeVolumeContext context) override;
  kj::Promise<void> listVolumes(ListVolumesContext context) override;
  kj::Promise<void> statVolume(StatVolumeContext context) override;
  kj::Promise<void> deleteVolume(DeleteVolumeContext context) override;
  kj::Promise<void> deletePaths(DeletePathsContext context) override;
  kj::Promise<void> updateMetadata(UpdateMetadataContext context) override;
  kj::Promise<void> writeMetadata(WriteMetadataContext context) override;
  kj::Promise<void> readVersion(ReadVersionContext context) override;
  kj::Promise<void> readXl(ReadXlContext context) override;
  kj::Promise<void> deleteVersion(DeleteVersionContext context) override;
  kj::Promise<void> deleteVersions(DeleteVersionsContext context) override;
  kj::Promise<void> readMultiple(ReadMultipleContext context) override;
  kj::Promise<void> diskInfo(DiskInfoContext context) override;
  kj::Promise<void> nsScanner(NsScannerContext context) override;

  // lock
  kj::Promise<void> lock(LockContext context) override;
  kj::Promise<void> unlock(UnlockContext context) override;
  kj::Promise<void> rLock(RLockContext context) override;
  kj::Promise<void> rUnlock(RUnlockContext context) override;
  kj::Promise<void> forceUnlock(ForceUnlockContext context) override;
  kj::Promise<void> refresh(RefreshContext context) override;

  // peer
  kj::Promise<void> localStorageInfo(LocalStorageInfoContext context) override;
  kj::Promise<void> serverInfo(ServerInfoContext context) override;
  kj::Promise<void> getCpus(GetCpusContext context) override;
  kj::Promise<void> getNetInfo(GetNetInfoContext context) override;
  kj::Promise<void> getPartitions(GetPartitionsContext context) override;
  kj::Promise<void> getOsInfo(GetOsInfoContext context) override;
  kj::Promise<void> getSeLinuxInfo(GetSeLinuxInfoContext context) override;
  kj::Promise<void> getSysConfig(GetSysConfigContext context) override;
  kj::Promise<void> getSysErrors(GetSysErrorsContext context) override;
  kj::Promise<void> getMemInfo(GetMemInfoContext context) override;
  kj::Promise<void> getMetrics(GetMetricsContext context) override;
  kj::Promise<void> getProcInfo(GetProcInfoContext context) override;
  kj::Promise<void> startProfiling(StartProfilingContext context) override;
  kj::Promise<void> downloadProfileData(DownloadProfileDataContext context) override;
  kj::Promise<void> getBucketStats(GetBucketStatsContext context) override;
  kj::Promise<void> getSrMetrics(GetSrMetricsContext context) override;
  kj::Promise<void> getAllBucketStats(GetAllBucketStatsContext context) override;
  kj::Promise<void> loadBucketMetadata(LoadBucketMetadataContext context) override;
  kj::Promise<void> deleteBucketMetadata(DeleteBucketMetadataContext context) override;
  kj::Promise<void> deletePolicy(DeletePolicyContext context) override;
  kj::Promise<void> loadPolicy(LoadPolicyContext context) override;
  kj::Promise<void> loadPolicyMapping(LoadPolicyMappingContext context) override;
  kj::Promise<void> deleteUser(DeleteUserContext context) override;
  kj::Promise<void> deleteServiceAccount(DeleteServiceAccountContext context) override;
  kj::Promise<void> loadUser(LoadUserContext context) override;
  kj::Promise<void> loadServiceAccount(LoadServiceAccountContext context) override;
  kj::Promise<void> loadGroup(LoadGroupContext context) override;
  kj::Promise<void> reloadSiteReplicationConfig(
      ReloadSiteReplicationConfigContext context) override;
  kj::Promise<void> signalService(SignalServiceContext context) override;
  kj::Promise<void> backgroundHealStatus(BackgroundHealStatusContext context) override;
  kj::Promise<void> getMetacacheListing(GetMetacacheListingContext context) override;
  kj::Promise<void> updateMetacacheListing(UpdateMetacacheListingContext context) override;
  kj::Promise<void> reloadPoolMeta(ReloadPoolMetaContext context) override;
  kj::Promise<void> stopRebalance(StopRebalanceContext context) override;
  kj::Promise<void> loadRebalanceMeta(LoadRebalanceMetaContext context) override;
  kj::Promise<void> loadTransitionTierConfig(LoadTransitionTierConfigContext context) override;

private:
  class ShardWriterImpl;
  class ShardReaderImpl;
  class RemoteWalkSink;
  class RemoteUsageSink;

  kj::Array<storage::Disk*> localDisks;
  Locker& locker;
  kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets;
  Peer& peer;
  kj::TaskSet tasks;

  storage::Disk& findDisk(kj::StringPtr endpoint);
  // Fails with DISK_NOT_FOUND unless the disk is one of ours.

  uint localQuorum() { return localDisks.size() / 2 + 1; }

  template <typename Context, typename Func>
  kj::Promise<void> lockCall(Context& context, ErrorCode refusal, Func&& func);

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace granite

#endif // GRANITE_NODE_SERVICE_H_
