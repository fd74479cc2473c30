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

#include "node-service.h"
#include "remote-disk.h"
#include "remote-locker.h"
#include <granite/storage/test-util.h>
#include <capnp/rpc-twoparty.h>
#include <kj/test.h>

namespace granite {
namespace {

using storage::LocalDisk;
using storage::TestTempdir;

class RecordingHooks final: public LoggingPeerHooks {
public:
  kj::Vector<kj::String> signals;

  kj::Promise<void> signalService(kj::StringPtr signal) override {
    signals.add(kj::heapString(signal));
    return kj::READY_NOW;
  }
};

class NameSink final: public storage::WalkSink {
public:
  kj::Vector<kj::String> names;

  kj::Promise<void> push(storage::MetaCacheEntry&& entry) override {
    names.add(kj::mv(entry.name));
    return kj::READY_NOW;
  }
};

struct ServiceFixture {
  // A node serving two local disks on a loopback port, and a client side to reach it.

  explicit ServiceFixture(kj::StringPtr name)
      : io(kj::setupAsyncIo()), tmp(name) {
    initCrypto();
    auto& network = io.provider->getNetwork();
    auto& timer = io.provider->getTimer();

    listener = network.parseAddress("127.0.0.1", 0).wait(io.waitScope)->listen();
    address = kj::str("127.0.0.1:", listener->getPort());

    auto ptrs = kj::heapArrayBuilder<storage::Disk*>(2);
    for (uint i = 0; i < 2; i++) {
      auto path = tmp.subdir(kj::str("disk", i));
      LocalDisk::Placement placement;
      placement.diskIndex = i;
      placement.setDriveCount = 2;
      disks.add(kj::heap<LocalDisk>(kj::str(address, path), path, placement));
      ptrs.add(disks.back().get());
      diskPaths.add(kj::mv(path));
    }
    diskPtrs = ptrs.finish();

    locker = kj::heap<LocalLocker>(kj::heapString(address), timer, 60 * kj::SECONDS);
    peer = kj::heap<Peer>(address, diskPtrs.asPtr(), nullptr, hooks, timer,
                          3600 * kj::SECONDS);
    server = kj::heap<capnp::TwoPartyServer>(NodeService::Client(
        kj::heap<NodeServiceImpl>(diskPtrs.asPtr(), *locker, nullptr, *peer)));
    serving = server->listen(*listener).eagerlyEvaluate([](kj::Exception&& e) {
      KJ_LOG(ERROR, "test server failed", e);
    });
    connections = kj::heap<NodeConnections>(network);
  }

  kj::AsyncIoContext io;
  TestTempdir tmp;
  kj::Own<kj::ConnectionReceiver> listener;
  kj::String address;
  kj::Vector<kj::Own<LocalDisk>> disks;
  kj::Vector<kj::String> diskPaths;
  kj::Array<storage::Disk*> diskPtrs;
  RecordingHooks hooks;
  kj::Own<LocalLocker> locker;
  kj::Own<Peer> peer;
  kj::Own<capnp::TwoPartyServer> server;
  kj::Promise<void> serving = nullptr;
  kj::Own<NodeConnections> connections;

  kj::Own<RemoteDisk> remoteDisk(uint index) {
    return kj::heap<RemoteDisk>(kj::str(address, diskPaths[index]), *connections,
                                io.provider->getTimer(), RetryPolicy());
  }
};

kj::ArrayPtr<const byte> bytesOf(kj::StringPtr text) {
  return kj::arrayPtr(reinterpret_cast<const byte*>(text.begin()), text.size());
}

kj::String textOf(capnp::Data::Reader data) {
  return kj::heapString(reinterpret_cast<const char*>(data.begin()), data.size());
}

storage::FileInfo inlineVersion(kj::StringPtr versionId, kj::StringPtr content) {
  storage::FileInfo fi;
  fi.versionId = kj::heapString(versionId);
  fi.modTime = 1000;
  fi.size = content.size();
  fi.data = kj::heapArray(bytesOf(content));
  fi.erasure.dataBlocks = 1;
  fi.erasure.parityBlocks = 1;
  fi.erasure.blockSize = 1 << 20;
  fi.erasure.index = 1;
  fi.erasure.distribution = kj::heapArray<uint8_t>({1, 2});
  storage::PartInfo part;
  part.number = 1;
  part.size = content.size();
  part.actualSize = content.size();
  fi.parts.add(kj::mv(part));
  return fi;
}

KJ_TEST("remote disk calls reach the serving node") {
  ServiceFixture env("node-service-disk-test");
  auto& ws = env.io.waitScope;
  auto remote = env.remoteDisk(0);

  KJ_EXPECT(!remote->isLocal());
  KJ_EXPECT(remote->getDiskId().wait(ws) == env.disks[0]->getDiskId().wait(ws));

  remote->makeVolume("bucket").wait(ws);
  KJ_EXPECT_THROW_MESSAGE("VOLUME_EXISTS", remote->makeVolume("bucket").wait(ws));
  KJ_EXPECT_THROW_MESSAGE("VOLUME_NOT_FOUND", remote->statVolume("nope").wait(ws));
  KJ_EXPECT(remote->statVolume("bucket").wait(ws).name == "bucket");

  remote->writeAll("bucket", "config.json", bytesOf("{}")).wait(ws);
  KJ_EXPECT(env.disks[0]->readAll("bucket", "config.json").wait(ws).size() == 2);
  KJ_EXPECT(remote->readAll("bucket", "config.json").wait(ws).size() == 2);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", remote->readAll("bucket", "missing").wait(ws));

  // Streamed in several writes, read back in a range.
  auto data = storage::testData(300000);
  {
    auto file = remote->createFile("bucket", "dir/blob", data.size()).wait(ws);
    file->write(data.slice(0, 100000)).wait(ws);
    file->write(data.slice(100000, data.size())).wait(ws);
    file->close().wait(ws);
  }
  {
    auto reader = remote->readFileStream("bucket", "dir/blob", 250000, 40000).wait(ws);
    auto buffer = kj::heapArray<byte>(40000);
    storage::readExactly(*reader, buffer).wait(ws);
    KJ_EXPECT(buffer.asPtr() == data.slice(250000, 290000));
  }
  {
    auto file = remote->createFile("bucket", "short", 10).wait(ws);
    file->write(data.slice(0, 5)).wait(ws);
    KJ_EXPECT_THROW_MESSAGE("LESS_DATA", file->close().wait(ws));
  }

  auto entries = remote->listDir("bucket", "", -1).wait(ws);
  KJ_EXPECT(entries.size() >= 2);

  remote->renameFile("bucket", "dir/blob", "bucket", "moved").wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", env.disks[0]->readAll("bucket", "dir/blob").wait(ws));

  storage::DeleteOptions options;
  remote->deleteFile("bucket", "moved", options).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", remote->readAll("bucket", "moved").wait(ws));

  auto info = remote->diskInfo(false).wait(ws);
  KJ_EXPECT(info.endpoint == remote->getEndpoint());
}

KJ_TEST("remote metadata calls") {
  ServiceFixture env("node-service-meta-test");
  auto& ws = env.io.waitScope;
  auto remote = env.remoteDisk(1);

  remote->makeVolume("bucket").wait(ws);
  auto fi = inlineVersion("v1", "hello world");
  remote->writeMetadata("bucket", "obj", fi).wait(ws);

  storage::ReadOptions options;
  options.readData = true;
  auto read = remote->readVersion("bucket", "obj", "", options).wait(ws);
  KJ_EXPECT(read.versionId == "v1");
  KJ_EXPECT(read.size == 11);
  KJ_ASSERT(read.isInline());
  KJ_EXPECT(KJ_ASSERT_NONNULL(read.data).size() == 11);

  KJ_EXPECT_THROW_MESSAGE("FILE_VERSION_NOT_FOUND",
      remote->readVersion("bucket", "obj", "v2", options).wait(ws));

  NameSink sink;
  storage::WalkDirOptions walk;
  walk.bucket = kj::heapString("bucket");
  walk.baseDir = kj::heapString("");
  walk.recursive = true;
  remote->walkDir(walk, sink).wait(ws);
  KJ_ASSERT(sink.names.size() == 1);
  KJ_EXPECT(sink.names[0] == "obj");

  storage::DeleteOptions deleteOptions;
  remote->deleteVersion("bucket", "obj", fi, false, deleteOptions).wait(ws);
  KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND",
      remote->readVersion("bucket", "obj", "", options).wait(ws));
}

KJ_TEST("requests for disks a node does not have") {
  ServiceFixture env("node-service-unknown-test");
  auto& ws = env.io.waitScope;

  RemoteDisk stranger(kj::str(env.address, "/not/a/disk"), *env.connections,
                      env.io.provider->getTimer(), RetryPolicy());
  KJ_EXPECT_THROW_MESSAGE("DISK_NOT_FOUND", stranger.readAll("bucket", "x").wait(ws));
}

KJ_TEST("remote lock service") {
  ServiceFixture env("node-service-lock-test");
  auto& ws = env.io.waitScope;
  RemoteLocker locker(env.address, *env.connections);

  LockRequest first;
  first.uid = kj::heapString("first");
  first.resources = kj::heapArray<kj::String>(1);
  first.resources[0] = kj::heapString("bucket/obj");
  first.owner = kj::heapString("node-a");
  auto second = first.clone();
  second.uid = kj::heapString("second");

  KJ_EXPECT(locker.lock(first).wait(ws));
  KJ_EXPECT(env.locker->size() == 1);
  KJ_EXPECT(!locker.lock(second).wait(ws));
  KJ_EXPECT(!locker.rlock(second).wait(ws));
  KJ_EXPECT(locker.refresh(first).wait(ws));
  KJ_EXPECT(!locker.refresh(second).wait(ws));
  KJ_EXPECT(!locker.unlock(second).wait(ws));
  KJ_EXPECT(locker.unlock(first).wait(ws));
  KJ_EXPECT(env.locker->size() == 0);

  KJ_EXPECT(locker.rlock(first).wait(ws));
  KJ_EXPECT(locker.rlock(second).wait(ws));
  KJ_EXPECT(locker.forceUnlock(first).wait(ws));
  KJ_EXPECT(env.locker->size() == 0);
}

KJ_TEST("peer calls") {
  ServiceFixture env("node-service-peer-test");
  auto& ws = env.io.waitScope;
  auto client = env.connections->get(env.address);

  {
    auto request = client.pingRequest();
    request.setBody(bytesOf("hello"));
    auto response = request.send().wait(ws);
    checkResponse(response);
    KJ_EXPECT(textOf(response.getBody()) == "hello");
  }

  {
    auto request = client.serverInfoRequest();
    auto response = request.send().wait(ws);
    checkResponse(response);
    auto properties = decodeProperties(response.getServerProperties());
    KJ_EXPECT(properties[kj::heapString("address")] == env.address);
    KJ_EXPECT(properties[kj::heapString("localDisks")] == "2");
  }

  {
    PropertyMap vars;
    setProperty(vars, "signal", kj::heapString("reload-config"));
    auto request = client.signalServiceRequest();
    request.setVars(encodeProperties(vars));
    checkResponse(request.send().wait(ws));
    KJ_ASSERT(env.hooks.signals.size() == 1);
    KJ_EXPECT(env.hooks.signals[0] == "reload-config");
  }

  {
    // Failures come back as an error in the response, not a broken call.
    auto request = client.signalServiceRequest();
    request.setVars(encodeProperties(PropertyMap()));
    auto response = request.send().wait(ws);
    KJ_EXPECT(!response.getSuccess());
    KJ_EXPECT_THROW_MESSAGE("INVALID_ARGUMENT", checkResponse(response));
  }

  {
    auto request = client.startProfilingRequest();
    request.setProfiler("cpu");
    KJ_EXPECT_THROW_MESSAGE("NOT_IMPLEMENTED", checkResponse(request.send().wait(ws)));
  }

  {
    PropertyMap query;
    setProperty(query, "id", kj::heapString("listing-1"));
    auto get = client.getMetacacheListingRequest();
    get.setOptions(encodeProperties(query));
    KJ_EXPECT_THROW_MESSAGE("FILE_NOT_FOUND", checkResponse(get.send().wait(ws)));

    PropertyMap update;
    setProperty(update, "id", kj::heapString("listing-1"));
    setProperty(update, "status", kj::heapString("started"));
    auto put = client.updateMetacacheListingRequest();
    put.setMetacache(encodeProperties(update));
    checkResponse(put.send().wait(ws));

    auto again = client.getMetacacheListingRequest();
    again.setOptions(encodeProperties(query));
    auto response = again.send().wait(ws);
    checkResponse(response);
    auto listing = decodeProperties(response.getMetacache());
    KJ_EXPECT(listing[kj::heapString("status")] == "started");
  }
}

KJ_TEST("unreachable nodes") {
  ServiceFixture env("node-service-down-test");
  auto& ws = env.io.waitScope;

  // A port nothing listens on any more.
  auto closed = env.io.provider->getNetwork().parseAddress("127.0.0.1", 0).wait(ws)->listen();
  auto deadAddress = kj::str("127.0.0.1:", closed->getPort());
  closed = nullptr;

  RetryPolicy policy;
  policy.maxRetries = 1;
  policy.retryDelay = 10 * kj::MILLISECONDS;
  RemoteDisk disk(kj::str(deadAddress, "/data"), *env.connections, env.io.provider->getTimer(),
                  policy);
  KJ_EXPECT_THROW_MESSAGE("DISK_OFFLINE", disk.readAll("bucket", "x").wait(ws));

  RemoteLocker locker(deadAddress, *env.connections);
  LockRequest args;
  args.uid = kj::heapString("uid");
  args.resources = kj::heapArray<kj::String>(1);
  args.resources[0] = kj::heapString("bucket/obj");
  KJ_EXPECT_THROW_MESSAGE("couldn't connect", locker.lock(args).wait(ws));
}

}  // namespace
}  // namespace granite
