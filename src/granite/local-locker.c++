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

#include "local-locker.h"
#include <granite/storage/basics.h>
#include <kj/debug.h>

namespace granite {

LockRequest LockRequest::clone() const {
  LockRequest result;
  result.uid = kj::heapString(uid);
  result.resources = KJ_MAP(r, resources) { return kj::heapString(r); };
  result.owner = kj::heapString(owner);
  result.source = kj::heapString(source);
  result.quorum = quorum;
  return result;
}

LockRequest LockRequest::fromReader(LockArgs::Reader reader) {
  LockRequest result;
  result.uid = kj::heapString(reader.getUid());
  result.resources = KJ_MAP(r, reader.getResources()) { return kj::heapString(r); };
  result.owner = kj::heapString(reader.getOwner());
  result.source = kj::heapString(reader.getSource());
  result.quorum = reader.getQuorum();
  return result;
}

void LockRequest::copyTo(LockArgs::Builder builder) const {
  builder.setUid(uid);
  auto list = builder.initResources(resources.size());
  for (uint i = 0; i < resources.size(); i++) {
    list.set(i, resources[i]);
  }
  builder.setOwner(owner);
  builder.setSource(source);
  builder.setQuorum(quorum);
}

kj::Array<byte> LockRequest::encode() const {
  return storage::buildMessage<LockArgs>([this](LockArgs::Builder builder) { copyTo(builder); });
}

LockRequest LockRequest::decode(kj::ArrayPtr<const byte> bytes) {
  storage::MessageBlob<LockArgs> blob(bytes);
  return fromReader(blob.get());
}

// =======================================================================================

LocalLocker::LocalLocker(kj::String endpoint, kj::Timer& timer, kj::Duration lease)
    : endpoint(kj::mv(endpoint)), timer(timer), lease(lease), tasks(*this) {
  tasks.add(sweepLoop());
}

LocalLocker::~LocalLocker() noexcept(false) {}

void LocalLocker::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "lock table sweep failed", exception);
}

kj::Promise<void> LocalLocker::sweepLoop() {
  return timer.afterDelay(lease / 2).then([this]() {
    expireOld();
    return sweepLoop();
  });
}

void LocalLocker::expire(kj::StringPtr resource) {
  auto iter = table.find(kj::heapString(resource));
  if (iter == table.end()) return;

  auto now = timer.now();
  kj::Vector<Entry> kept;
  for (auto& entry: iter->second) {
    if (entry.expires > now) {
      kept.add(kj::mv(entry));
    } else {
      KJ_LOG(INFO, "lock lease expired", resource, entry.uid, entry.owner, entry.source);
    }
  }
  if (kept.size() == 0) {
    table.erase(iter);
  } else {
    iter->second = kj::mv(kept);
  }
}

void LocalLocker::expireOld() {
  kj::Vector<kj::String> resources;
  for (auto& slot: table) {
    resources.add(kj::heapString(slot.first));
  }
  for (auto& resource: resources) {
    expire(resource);
  }
}

bool LocalLocker::isFree(kj::StringPtr resource) {
  expire(resource);
  return table.find(kj::heapString(resource)) == table.end();
}

bool LocalLocker::hasWriter(kj::StringPtr resource) {
  expire(resource);
  auto iter = table.find(kj::heapString(resource));
  if (iter == table.end()) return false;
  for (auto& entry: iter->second) {
    if (entry.writer) return true;
  }
  return false;
}

bool LocalLocker::removeEntry(kj::StringPtr resource, kj::StringPtr uid, bool writer) {
  auto iter = table.find(kj::heapString(resource));
  if (iter == table.end()) return false;

  auto& entries = iter->second;
  for (uint i = 0; i < entries.size(); i++) {
    if (entries[i].uid == uid && entries[i].writer == writer) {
      // Shared holders with the same token each hold one entry; remove one.
      kj::Vector<Entry> kept(entries.size() - 1);
      for (uint j = 0; j < entries.size(); j++) {
        if (j != i) kept.add(kj::mv(entries[j]));
      }
      if (kept.size() == 0) {
        table.erase(iter);
      } else {
        entries = kj::mv(kept);
      }
      return true;
    }
  }
  return false;
}

kj::Promise<bool> LocalLocker::lock(const LockRequest& args) {
  KJ_REQUIRE(args.resources.size() > 0, "lock without resources");
  for (auto& resource: args.resources) {
    if (!isFree(resource)) return false;
  }

  auto expires = timer.now() + lease;
  for (auto& resource: args.resources) {
    table[kj::heapString(resource)].add(Entry {
      kj::heapString(args.uid), kj::heapString(args.owner), kj::heapString(args.source),
      true, expires
    });
  }
  return true;
}

kj::Promise<bool> LocalLocker::rlock(const LockRequest& args) {
  KJ_REQUIRE(args.resources.size() == 1, "read locks cover exactly one resource");
  auto& resource = args.resources[0];
  if (hasWriter(resource)) return false;

  table[kj::heapString(resource)].add(Entry {
    kj::heapString(args.uid), kj::heapString(args.owner), kj::heapString(args.source),
    false, timer.now() + lease
  });
  return true;
}

kj::Promise<bool> LocalLocker::unlock(const LockRequest& args) {
  bool all = true;
  for (auto& resource: args.resources) {
    expire(resource);
    if (!removeEntry(resource, args.uid, true)) all = false;
  }
  return all;
}

kj::Promise<bool> LocalLocker::runlock(const LockRequest& args) {
  KJ_REQUIRE(args.resources.size() == 1, "read locks cover exactly one resource");
  expire(args.resources[0]);
  return removeEntry(args.resources[0], args.uid, false);
}

kj::Promise<bool> LocalLocker::forceUnlock(const LockRequest& args) {
  if (args.resources.size() > 0) {
    for (auto& resource: args.resources) {
      table.erase(kj::heapString(resource));
    }
    return true;
  }

  // No resources: drop everything held under the token.
  bool found = false;
  kj::Vector<kj::String> resources;
  for (auto& slot: table) {
    for (auto& entry: slot.second) {
      if (entry.uid == args.uid) {
        resources.add(kj::heapString(slot.first));
        break;
      }
    }
  }
  for (auto& resource: resources) {
    while (removeEntry(resource, args.uid, true) || removeEntry(resource, args.uid, false)) {
      found = true;
    }
  }
  return found;
}

kj::Promise<bool> LocalLocker::refresh(const LockRequest& args) {
  auto expires = timer.now() + lease;
  for (auto& resource: args.resources) {
    expire(resource);
    auto iter = table.find(kj::heapString(resource));
    if (iter == table.end()) return false;

    bool found = false;
    for (auto& entry: iter->second) {
      if (entry.uid == args.uid) {
        entry.expires = expires;
        found = true;
      }
    }
    if (!found) return false;
  }
  return true;
}

}  // namespace granite
