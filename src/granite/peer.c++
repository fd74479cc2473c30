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


#include "peer.h"
#include <kj/debug.h>
#include <sandstorm/util.h>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <sys/types.h>
#include <ifaddrs.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <unistd.h>

namespace granite {

using storage::DataUsage;
using storage::DiskInfo;

kj::Array<byte> encodeProperties(const PropertyMap& properties) {
  return storage::buildMessage<Properties>([&](Properties::Builder builder) {
    auto entries = builder.initEntries(properties.size());
    uint i = 0;
    for (auto& property: properties) {
      entries[i].setKey(property.first);
      entries[i].setValue(property.second);
      ++i;
    }
  });
}

PropertyMap decodeProperties(kj::ArrayPtr<const byte> bytes) {
  PropertyMap result;
  if (bytes.size() == 0) return result;
  storage::MessageBlob<Properties> blob(bytes);
  for (auto entry: blob.get().getEntries()) {
    setProperty(result, entry.getKey(), kj::heapString(entry.getValue()));
  }
  return result;
}

void setProperty(PropertyMap& properties, kj::StringPtr key, kj::String value) {
  properties[kj::heapString(key)] = kj::mv(value);
}

namespace {

kj::Maybe<kj::String> readSystemFile(kj::StringPtr path) {
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenIfExists(path, O_RDONLY | O_CLOEXEC)) {
    return sandstorm::readAll(*fd);
  } else {
    return nullptr;
  }
}

void readColonLines(kj::StringPtr path, PropertyMap& out) {
  // "Key: value" files such as /proc/meminfo. The first occurrence of each key wins.
  KJ_IF_MAYBE(text, readSystemFile(path)) {
    for (auto& line: sandstorm::splitLines(kj::mv(*text))) {
      KJ_IF_MAYBE(colon, line.findFirst(':')) {
        auto key = sandstorm::trim(line.slice(0, *colon));
        if (key.size() == 0 || out.count(key) > 0) continue;
        setProperty(out, key, sandstorm::trim(line.slice(*colon + 1)));
      }
    }
  }
}

kj::String firstWord(kj::StringPtr text) {
  auto words = sandstorm::splitSpace(text);
  return words.size() == 0 ? kj::heapString("") : kj::heapString(words[0]);
}

int64_t uptimeSeconds() {
  KJ_IF_MAYBE(text, readSystemFile("/proc/uptime")) {
    auto word = firstWord(*text);
    KJ_IF_MAYBE(dot, word.findFirst('.')) {
      word = kj::heapString(word.slice(0, *dot));
    }
    KJ_IF_MAYBE(seconds, sandstorm::parseUInt(word, 10)) {
      return *seconds;
    }
  }
  return 0;
}

}  // namespace

// =======================================================================================

kj::Promise<void> LoggingPeerHooks::loadBucketMetadata(kj::StringPtr bucket) {
  KJ_LOG(INFO, "peer: load bucket metadata", bucket);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::deleteBucketMetadata(kj::StringPtr bucket) {
  KJ_LOG(INFO, "peer: delete bucket metadata", bucket);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadPolicy(kj::StringPtr policyName) {
  KJ_LOG(INFO, "peer: load policy", policyName);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::deletePolicy(kj::StringPtr policyName) {
  KJ_LOG(INFO, "peer: delete policy", policyName);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadPolicyMapping(
    kj::StringPtr userOrGroup, uint64_t userType, bool isGroup) {
  KJ_LOG(INFO, "peer: load policy mapping", userOrGroup, userType, isGroup);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadUser(kj::StringPtr accessKey, bool temp) {
  KJ_LOG(INFO, "peer: load user", accessKey, temp);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::deleteUser(kj::StringPtr accessKey) {
  KJ_LOG(INFO, "peer: delete user", accessKey);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadServiceAccount(kj::StringPtr accessKey) {
  KJ_LOG(INFO, "peer: load service account", accessKey);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::deleteServiceAccount(kj::StringPtr accessKey) {
  KJ_LOG(INFO, "peer: delete service account", accessKey);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadGroup(kj::StringPtr group) {
  KJ_LOG(INFO, "peer: load group", group);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::reloadSiteReplicationConfig() {
  KJ_LOG(INFO, "peer: reload site replication config");
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::reloadPoolMeta() {
  KJ_LOG(INFO, "peer: reload pool metadata");
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::stopRebalance() {
  KJ_LOG(INFO, "peer: stop rebalance");
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadRebalanceMeta(bool startRebalance) {
  KJ_LOG(INFO, "peer: load rebalance metadata", startRebalance);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::loadTransitionTierConfig() {
  KJ_LOG(INFO, "peer: load transition tier config");
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::signalService(kj::StringPtr signal) {
  KJ_LOG(INFO, "peer: signal", signal);
  return kj::READY_NOW;
}

kj::Promise<void> LoggingPeerHooks::startProfiling(kj::StringPtr profiler) {
  return GRANITE_ERROR(NOT_IMPLEMENTED, "profiler not available: ", profiler);
}

kj::Promise<kj::Array<byte>> LoggingPeerHooks::downloadProfileData() {
  return GRANITE_ERROR(NOT_IMPLEMENTED, "no profile data");
}

// =======================================================================================

class Peer::ScanSink final: public storage::UsageSink {
public:
  void update(const DataUsage& usage) override {
    // Partial results are not published; the previous scan stays current until this one ends.
  }
};

Peer::Peer(kj::StringPtr address, kj::ArrayPtr<storage::Disk* const> localDisks,
           kj::ArrayPtr<const kj::Own<storage::ErasureSet>> sets, PeerHooks& hooks,
           kj::Timer& timer, kj::Duration scanInterval)
    : address(kj::heapString(address)), localDisks(kj::heapArray(localDisks)), sets(sets),
      hooks(hooks), timer(timer), scanInterval(scanInterval), startTime(nowNanos()),
      tasks(*this) {
  tasks.add(scanLoop());
}

Peer::~Peer() noexcept(false) {}

void Peer::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "peer background task failed", exception);
}

kj::Promise<void> Peer::scanLoop() {
  return timer.afterDelay(scanInterval).then([this]() {
    return scanUsage();
  }).then([this]() {
    return scanLoop();
  });
}

kj::Promise<void> Peer::scanUsage() {
  if (scanning) return kj::READY_NOW;
  scanning = true;

  auto promises = KJ_MAP(set, sets) {
    return scanSet(*set, 0);
  };

  return kj::joinPromises(kj::mv(promises)).then([this](kj::Array<DataUsage>&& results) {
    DataUsage merged;
    merged.lastUpdate = nowNanos();
    for (auto& result: results) {
      for (auto& bucket: result.buckets) {
        KJ_IF_MAYBE(existing, merged.find(bucket.name)) {
          existing->objects += bucket.objects;
          existing->versions += bucket.versions;
          existing->deleteMarkers += bucket.deleteMarkers;
          existing->size += bucket.size;
        } else {
          merged.buckets.add(storage::BucketUsage {
            kj::heapString(bucket.name), bucket.objects, bucket.versions,
            bucket.deleteMarkers, bucket.size });
        }
      }
    }
    usage = kj::mv(merged);
    scanning = false;
  }, [this](kj::Exception&& exception) {
    scanning = false;
    KJ_LOG(WARNING, "namespace scan failed", exception);
  });
}

kj::Promise<DataUsage> Peer::scanSet(storage::ErasureSet& set, uint diskIndex) {
  auto disks = set.getDisks();
  while (diskIndex < disks.size() &&
         !(disks[diskIndex]->isLocal() && disks[diskIndex]->isOnline())) {
    ++diskIndex;
  }
  if (diskIndex == disks.size()) {
    // No local disk in this set, or none online: another node counts it.
    return DataUsage();
  }

  auto sink = kj::heap<ScanSink>();
  auto promise = disks[diskIndex]->nsScanner(DataUsage(), *sink);
  return promise.attach(kj::mv(sink))
      .catch_([this,&set,diskIndex](kj::Exception&& exception) {
    KJ_LOG(WARNING, "namespace scan of disk failed", set.getDisks()[diskIndex]->getEndpoint(),
           exception.getDescription());
    return scanSet(set, diskIndex + 1);
  });
}

DataUsage Peer::getBucketStats(kj::StringPtr bucket) {
  DataUsage result;
  result.lastUpdate = usage.lastUpdate;
  KJ_IF_MAYBE(found, usage.find(bucket)) {
    result.buckets.add(storage::BucketUsage {
      kj::heapString(found->name), found->objects, found->versions,
      found->deleteMarkers, found->size });
  }
  return result;
}

kj::Array<byte> Peer::getHealState() {
  return storage::buildMessage<HealState>([&](HealState::Builder builder) {
    storage::HealStats total;
    kj::Vector<kj::StringPtr> offline;
    for (auto& set: sets) {
      auto stats = set->getHealQueue().getStats();
      total.queued += stats.queued;
      total.healed += stats.healed;
      total.failed += stats.failed;
      for (auto& disk: set->getDisks()) {
        if (!disk->isOnline()) offline.add(disk->getEndpoint());
      }
    }
    builder.setQueued(total.queued);
    builder.setHealed(total.healed);
    builder.setFailed(total.failed);
    auto list = builder.initOfflineDisks(offline.size());
    for (uint i = 0; i < offline.size(); i++) {
      list.set(i, offline[i]);
    }
  });
}

// ---------------------------------------------------------------------------------------

kj::Promise<kj::Array<DiskInfo>> Peer::localStorageInfo(bool metrics) {
  auto promises = KJ_MAP(disk, localDisks) {
    auto endpoint = kj::heapString(disk->getEndpoint());
    return disk->diskInfo(metrics).catch_([KJ_MVCAP(endpoint)](kj::Exception&& exception) {
      KJ_LOG(WARNING, "couldn't query local disk", endpoint, exception.getDescription());
      DiskInfo info;
      info.endpoint = kj::heapString(endpoint);
      return info;
    });
  };
  return kj::joinPromises(kj::mv(promises));
}

PropertyMap Peer::serverInfo(bool metrics) {
  PropertyMap result;
  setProperty(result, "address", kj::heapString(address));
  setProperty(result, "state", kj::heapString("online"));
  setProperty(result, "uptime", kj::str((nowNanos() - startTime) / 1000000000));
  setProperty(result, "sets", kj::str(sets.size()));
  setProperty(result, "localDisks", kj::str(localDisks.size()));

  uint online = 0;
  for (auto disk: localDisks) {
    if (disk->isOnline()) ++online;
  }
  setProperty(result, "localDisksOnline", kj::str(online));

  char hostname[256];
  if (gethostname(hostname, sizeof(hostname)) == 0) {
    hostname[sizeof(hostname) - 1] = '\0';
    setProperty(result, "hostname", kj::heapString(hostname));
  }

  if (metrics) {
    for (auto& metric: getMetrics(0)) {
      setProperty(result, metric.first, kj::heapString(metric.second));
    }
  }
  return result;
}

PropertyMap Peer::getCpus() {
  PropertyMap result;
  uint count = 0;
  KJ_IF_MAYBE(text, readSystemFile("/proc/cpuinfo")) {
    for (auto& line: sandstorm::splitLines(kj::mv(*text))) {
      KJ_IF_MAYBE(colon, line.findFirst(':')) {
        auto key = sandstorm::trim(line.slice(0, *colon));
        if (key == "processor") {
          ++count;
        } else if (count == 1 && result.count(key) == 0) {
          setProperty(result, key, sandstorm::trim(line.slice(*colon + 1)));
        }
      }
    }
  }
  if (count == 0) {
    count = sysconf(_SC_NPROCESSORS_ONLN);
  }
  setProperty(result, "count", kj::str(count));
  return result;
}

PropertyMap Peer::getNetInfo() {
  PropertyMap result;

  struct ifaddrs* addrs;
  KJ_SYSCALL(getifaddrs(&addrs));
  KJ_DEFER(freeifaddrs(addrs));

  for (auto ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr) continue;

    char buffer[INET6_ADDRSTRLEN];
    const char* text = nullptr;
    switch (ifa->ifa_addr->sa_family) {
      case AF_INET:
        text = inet_ntop(AF_INET,
            &reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr)->sin_addr,
            buffer, sizeof(buffer));
        break;
      case AF_INET6:
        text = inet_ntop(AF_INET6,
            &reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr)->sin6_addr,
            buffer, sizeof(buffer));
        break;
      default:
        continue;
    }
    if (text == nullptr) continue;

    auto key = kj::str("interface.", ifa->ifa_name);
    auto iter = result.find(key);
    if (iter == result.end()) {
      setProperty(result, key, kj::heapString(text));
    } else {
      iter->second = kj::str(iter->second, ",", text);
    }
  }

  return result;
}

PropertyMap Peer::getPartitions() {
  PropertyMap result;
  KJ_IF_MAYBE(text, readSystemFile("/proc/mounts")) {
    for (auto& line: sandstorm::splitLines(kj::mv(*text))) {
      auto cols = sandstorm::splitSpace(line);
      if (cols.size() < 3) continue;
      auto device = kj::str(cols[0]);
      if (!device.startsWith("/dev/")) continue;
      auto mountPoint = kj::str(cols[1]);

      struct statvfs stats;
      if (statvfs(mountPoint.cStr(), &stats) < 0) {
        setProperty(result, mountPoint, kj::str(device, " ", cols[2], " unavailable"));
        continue;
      }
      uint64_t total = uint64_t(stats.f_blocks) * stats.f_frsize;
      uint64_t free = uint64_t(stats.f_bavail) * stats.f_frsize;
      setProperty(result, mountPoint,
                  kj::str(device, " ", cols[2], " total=", total, " free=", free));
    }
  }
  return result;
}

PropertyMap Peer::getOsInfo() {
  PropertyMap result;
  struct utsname name;
  KJ_SYSCALL(uname(&name));
  setProperty(result, "sysname", kj::heapString(name.sysname));
  setProperty(result, "nodename", kj::heapString(name.nodename));
  setProperty(result, "release", kj::heapString(name.release));
  setProperty(result, "version", kj::heapString(name.version));
  setProperty(result, "machine", kj::heapString(name.machine));
  setProperty(result, "uptime", kj::str(uptimeSeconds()));
  return result;
}

PropertyMap Peer::getSeLinuxInfo() {
  PropertyMap result;
  KJ_IF_MAYBE(enforce, readSystemFile("/sys/fs/selinux/enforce")) {
    setProperty(result, "status", kj::heapString("enabled"));
    setProperty(result, "mode", kj::heapString(
        sandstorm::trim(*enforce) == "1" ? "enforcing" : "permissive"));
  } else {
    setProperty(result, "status", kj::heapString("disabled"));
  }
  return result;
}

PropertyMap Peer::getSysConfig() {
  PropertyMap result;

  struct rlimit limit;
  KJ_SYSCALL(getrlimit(RLIMIT_NOFILE, &limit));
  setProperty(result, "rlimit.nofile.soft", kj::str(uint64_t(limit.rlim_cur)));
  setProperty(result, "rlimit.nofile.hard", kj::str(uint64_t(limit.rlim_max)));

  static constexpr const char* SYSCTLS[][2] = {
    { "fs.file-max", "/proc/sys/fs/file-max" },
    { "kernel.threads-max", "/proc/sys/kernel/threads-max" },
    { "vm.swappiness", "/proc/sys/vm/swappiness" },
    { "vm.max_map_count", "/proc/sys/vm/max_map_count" },
    { "transparent_hugepage", "/sys/kernel/mm/transparent_hugepage/enabled" },
  };
  for (auto& sysctl: SYSCTLS) {
    KJ_IF_MAYBE(value, readSystemFile(sysctl[1])) {
      setProperty(result, sysctl[0], sandstorm::trim(*value));
    }
  }

  return result;
}

PropertyMap Peer::getSysErrors() {
  // Host settings known to hurt a storage node.
  PropertyMap result;

  struct rlimit limit;
  KJ_SYSCALL(getrlimit(RLIMIT_NOFILE, &limit));
  if (limit.rlim_cur < 4096) {
    setProperty(result, "rlimit.nofile",
                kj::str("open file limit ", uint64_t(limit.rlim_cur), " is below 4096"));
  }

  KJ_IF_MAYBE(thp, readSystemFile("/sys/kernel/mm/transparent_hugepage/enabled")) {
    if (thp->startsWith("[always]")) {
      setProperty(result, "transparent_hugepage",
                  kj::heapString("transparent huge pages are always on"));
    }
  }

  return result;
}

PropertyMap Peer::getMemInfo() {
  PropertyMap result;
  readColonLines("/proc/meminfo", result);
  return result;
}

PropertyMap Peer::getProcInfo() {
  PropertyMap result;
  setProperty(result, "pid", kj::str(getpid()));
  setProperty(result, "uptime", kj::str((nowNanos() - startTime) / 1000000000));

  PropertyMap status;
  readColonLines("/proc/self/status", status);
  for (auto key: { "Name", "State", "Threads", "VmRSS", "VmSize", "VmPeak" }) {
    auto iter = status.find(kj::heapString(key));
    if (iter != status.end()) {
      setProperty(result, key, kj::heapString(iter->second));
    }
  }

  setProperty(result, "openFiles", kj::str(sandstorm::listDirectory("/proc/self/fd").size()));

  KJ_IF_MAYBE(cmdline, readSystemFile("/proc/self/cmdline")) {
    auto chars = cmdline->asArray();
    for (auto& c: chars) {
      if (c == '\0') c = ' ';
    }
    setProperty(result, "cmdline", sandstorm::trim(chars));
  }

  return result;
}

PropertyMap Peer::getMetrics(uint64_t metricType) {
  if (metricType == 0) metricType = METRIC_DISK | METRIC_HEAL | METRIC_USAGE;
  PropertyMap result;

  if (metricType & METRIC_DISK) {
    for (auto disk: localDisks) {
      setProperty(result, kj::str("disk.", disk->getEndpoint(), ".online"),
                  kj::str(disk->isOnline()));
    }
  }

  if (metricType & METRIC_HEAL) {
    storage::HealStats total;
    for (auto& set: sets) {
      auto stats = set->getHealQueue().getStats();
      total.queued += stats.queued;
      total.healed += stats.healed;
      total.failed += stats.failed;
    }
    setProperty(result, "heal.queued", kj::str(total.queued));
    setProperty(result, "heal.healed", kj::str(total.healed));
    setProperty(result, "heal.failed", kj::str(total.failed));
  }

  if (metricType & METRIC_USAGE) {
    uint64_t objects = 0;
    uint64_t size = 0;
    for (auto& bucket: usage.buckets) {
      objects += bucket.objects;
      size += bucket.size;
    }
    setProperty(result, "usage.buckets", kj::str(usage.buckets.size()));
    setProperty(result, "usage.objects", kj::str(objects));
    setProperty(result, "usage.size", kj::str(size));
    setProperty(result, "usage.lastUpdate", kj::str(usage.lastUpdate));
  }

  return result;
}

PropertyMap Peer::getSrMetrics() {
  PropertyMap result;
  setProperty(result, "enabled", kj::heapString("false"));
  return result;
}

// ---------------------------------------------------------------------------------------

PropertyMap Peer::getMetacache(const PropertyMap& options) {
  auto id = options.find(kj::heapString("id"));
  if (id == options.end()) {
    GRANITE_FAIL(INVALID_ARGUMENT, "metacache request without an id");
  }
  auto iter = metacache.find(id->second);
  if (iter == metacache.end()) {
    GRANITE_FAIL(FILE_NOT_FOUND, "no metacache listing ", id->second);
  }

  PropertyMap result;
  for (auto& entry: iter->second) {
    setProperty(result, entry.first, kj::heapString(entry.second));
  }
  return result;
}

PropertyMap Peer::updateMetacache(PropertyMap&& update) {
  auto id = update.find(kj::heapString("id"));
  if (id == update.end()) {
    GRANITE_FAIL(INVALID_ARGUMENT, "metacache update without an id");
  }

  auto& listing = metacache[kj::heapString(id->second)];
  for (auto& entry: update) {
    setProperty(listing, entry.first, kj::mv(entry.second));
  }
  setProperty(listing, "lastUpdate", kj::str(nowNanos()));

  PropertyMap result;
  for (auto& entry: listing) {
    setProperty(result, entry.first, kj::heapString(entry.second));
  }
  return result;
}

}  // namespace granite
