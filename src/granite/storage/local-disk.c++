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

#include "local-disk.h"
#include "bitrot.h"
#include <kj/debug.h>
#include <sandstorm/util.h>
#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace granite {
namespace storage {

namespace {

template <typename Call>
int retryOnEintr(Call&& call) {
  for (;;) {
    int result = call();
    if (result >= 0 || errno != EINTR) return result;
  }
}

[[noreturn]] void failFile(int error, kj::StringPtr what) {
  kj::throwFatalException(makeError(errnoToFileError(error), __FILE__, __LINE__,
                                    kj::str(what, ": ", strerror(error))));
}

[[noreturn]] void failVolume(int error, kj::StringPtr what) {
  kj::throwFatalException(makeError(errnoToVolumeError(error), __FILE__, __LINE__,
                                    kj::str(what, ": ", strerror(error))));
}

kj::Maybe<struct stat> statAt(int dirfd, kj::StringPtr path) {
  struct stat stats;
  if (retryOnEintr([&]() { return fstatat(dirfd, path.cStr(), &stats, 0); }) < 0) {
    int error = errno;
    if (error == ENOENT || error == ENOTDIR) return nullptr;
    failFile(error, path);
  }
  return stats;
}

int64_t toNanos(const struct timespec& ts) {
  return static_cast<int64_t>(ts.tv_sec) * 1000000000ll + ts.tv_nsec;
}

kj::Array<byte> readFd(int fd) {
  struct stat stats;
  KJ_SYSCALL(fstat(fd, &stats));
  auto result = kj::heapArray<byte>(stats.st_size);
  auto buffer = result.asPtr();
  uint64_t offset = 0;
  while (buffer.size() > 0) {
    ssize_t n;
    KJ_SYSCALL(n = pread(fd, buffer.begin(), buffer.size(), offset));
    if (n == 0) {
      // Truncated under us.
      return kj::heapArray<byte>(result.slice(0, offset));
    }
    buffer = buffer.slice(n, buffer.size());
    offset += n;
  }
  return result;
}

void writeFd(int fd, kj::ArrayPtr<const byte> data, uint64_t offset) {
  while (data.size() > 0) {
    ssize_t n = pwrite(fd, data.begin(), data.size(), offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      failFile(errno, "write");
    }
    KJ_ASSERT(n != 0, "zero-sized write?");
    data = data.slice(n, data.size());
    offset += n;
  }
}

void deleteTree(int dirfd, kj::StringPtr name) {
  // Remove `name` under `dirfd` along with everything beneath it. Missing is fine.
  KJ_IF_MAYBE(stats, statAt(dirfd, name)) {
    if (S_ISDIR(stats->st_mode)) {
      auto fd = sandstorm::raiiOpenAt(dirfd, name, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
      for (auto& child: sandstorm::listDirectoryFd(fd)) {
        deleteTree(fd, child);
      }
      if (unlinkat(dirfd, name.cStr(), AT_REMOVEDIR) < 0 && errno != ENOENT) {
        failFile(errno, name);
      }
    } else if (unlinkat(dirfd, name.cStr(), 0) < 0 && errno != ENOENT) {
      failFile(errno, name);
    }
  }
}

bool matchesPrefix(kj::StringPtr name, kj::StringPtr prefix) {
  return name.startsWith(prefix);
}

}  // namespace

// =======================================================================================

class LocalDisk::FileWriterImpl final: public FileWriter {
public:
  FileWriterImpl(kj::AutoCloseFd fd, int64_t expectedSize, uint64_t offset, kj::String name)
      : fd(kj::mv(fd)), expectedSize(expectedSize), offset(offset), name(kj::mv(name)) {}

  kj::Promise<void> write(kj::ArrayPtr<const byte> data) override {
    return kj::evalNow([&]() {
      KJ_REQUIRE(!closed, "write after close");
      if (expectedSize >= 0 && written + data.size() > static_cast<uint64_t>(expectedSize)) {
        GRANITE_FAIL(MORE_DATA, name, ": more than ", expectedSize, " bytes written");
      }
      writeFd(fd, data, offset + written);
      written += data.size();
    });
  }

  kj::Promise<void> close() override {
    return kj::evalNow([&]() {
      KJ_REQUIRE(!closed, "already closed");
      if (expectedSize >= 0 && written < static_cast<uint64_t>(expectedSize)) {
        GRANITE_FAIL(LESS_DATA, name, ": ", written, " of ", expectedSize, " bytes written");
      }
      KJ_SYSCALL(fdatasync(fd));
      closed = true;
    });
  }

private:
  kj::AutoCloseFd fd;
  int64_t expectedSize;
  uint64_t offset;
  uint64_t written = 0;
  kj::String name;
  bool closed = false;
};

class LocalDisk::FileReaderImpl final: public FileReader {
public:
  FileReaderImpl(kj::AutoCloseFd fd, uint64_t offset, uint64_t length)
      : fd(kj::mv(fd)), offset(offset), remaining(length) {}

  kj::Promise<size_t> read(kj::ArrayPtr<byte> buffer) override {
    return kj::evalNow([&]() -> size_t {
      size_t total = 0;
      buffer = buffer.slice(0, kj::min<uint64_t>(buffer.size(), remaining));
      while (buffer.size() > 0) {
        ssize_t n = pread(fd, buffer.begin(), buffer.size(), offset);
        if (n < 0) {
          if (errno == EINTR) continue;
          failFile(errno, "read");
        }
        if (n == 0) break;
        buffer = buffer.slice(n, buffer.size());
        offset += n;
        remaining -= n;
        total += n;
      }
      return total;
    });
  }

private:
  kj::AutoCloseFd fd;
  uint64_t offset;
  uint64_t remaining;
};

// =======================================================================================

LocalDisk::LocalDisk(kj::String endpoint, kj::StringPtr path, Placement placement)
    : endpoint(kj::mv(endpoint)), path(kj::heapString(path)), tasks(*this) {
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenIfExists(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC)) {
    rootFd = kj::mv(*fd);
  } else {
    GRANITE_FAIL(DISK_NOT_FOUND, path);
  }

  format(placement);

  // Anything staged by a previous run was never committed.
  auto tmp = pathJoin(SYSTEM_VOLUME, TMP_DIR);
  deleteTree(rootFd, tmp);
  KJ_SYSCALL(mkdirat(rootFd, tmp.cStr(), 0700));
  KJ_SYSCALL(mkdirat(rootFd, pathJoin(SYSTEM_VOLUME, TRASH_DIR).cStr(), 0700));
}

LocalDisk::~LocalDisk() noexcept(false) {}

void LocalDisk::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "background disk task failed", endpoint, exception);
}

void LocalDisk::format(Placement placement) {
  if (retryOnEintr([&]() { return mkdirat(rootFd, SYSTEM_VOLUME, 0700); }) < 0 &&
      errno != EEXIST) {
    failVolume(errno, SYSTEM_VOLUME);
  }
  for (auto dir: { TMP_DIR, MULTIPART_DIR, BUCKET_META_DIR }) {
    auto rel = pathJoin(SYSTEM_VOLUME, dir);
    if (retryOnEintr([&]() { return mkdirat(rootFd, rel.cStr(), 0700); }) < 0 &&
        errno != EEXIST) {
      failVolume(errno, rel);
    }
  }

  auto formatPath = pathJoin(SYSTEM_VOLUME, FORMAT_FILE);
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, formatPath, O_RDONLY | O_CLOEXEC)) {
    auto bytes = readFd(*fd);
    MessageBlob<DiskFormat> blob(bytes);
    auto existing = blob.get();
    if (placement.setDriveCount != 0 &&
        (existing.getSetIndex() != placement.setIndex ||
         existing.getDiskIndex() != placement.diskIndex ||
         existing.getSetDriveCount() != placement.setDriveCount)) {
      GRANITE_FAIL(INCONSISTENT_DISK, endpoint, " is formatted as disk ", existing.getDiskIndex(),
                   " of set ", existing.getSetIndex(), " but configured as disk ",
                   placement.diskIndex, " of set ", placement.setIndex);
    }
    diskId = kj::heapString(existing.getDiskId());
  } else {
    diskId = newUuid();
    auto bytes = buildMessage<DiskFormat>([&](DiskFormat::Builder builder) {
      builder.setDiskId(diskId);
      builder.setSetIndex(placement.setIndex);
      builder.setDiskIndex(placement.diskIndex);
      builder.setSetDriveCount(placement.setDriveCount);
    });
    writeAtomically(formatPath, bytes);
    KJ_LOG(INFO, "formatted disk", endpoint, diskId);
  }
}

void LocalDisk::purgeTrash() {
  auto trash = pathJoin(SYSTEM_VOLUME, TRASH_DIR);
  auto trashFd = sandstorm::raiiOpenAt(rootFd, trash, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  for (auto& name: sandstorm::listDirectoryFd(trashFd)) {
    deleteTree(trashFd, name);
  }
}

void LocalDisk::requireVolume(kj::StringPtr volume) {
  checkVolumeName(volume);
  KJ_IF_MAYBE(stats, statAt(rootFd, volume)) {
    if (!S_ISDIR(stats->st_mode)) {
      GRANITE_FAIL(VOLUME_NOT_FOUND, volume);
    }
  } else {
    GRANITE_FAIL(VOLUME_NOT_FOUND, volume);
  }
}

void LocalDisk::makeParents(kj::StringPtr relPath) {
  KJ_IF_MAYBE(slash, relPath.findLast('/')) {
    auto parent = kj::heapString(relPath.slice(0, *slash));
    if (statAt(rootFd, parent) != nullptr) return;
    makeParents(parent);
    if (retryOnEintr([&]() { return mkdirat(rootFd, parent.cStr(), 0755); }) < 0 &&
        errno != EEXIST) {
      failFile(errno, parent);
    }
  }
}

void LocalDisk::removeEmptyParents(kj::StringPtr volume, kj::StringPtr relPath) {
  // Remove now-empty directories between relPath and the volume root. rmdir() refuses to
  // remove a directory that is not empty, which ends the walk.
  kj::String current = kj::heapString(relPath);
  for (;;) {
    KJ_IF_MAYBE(slash, current.findLast('/')) {
      auto parent = kj::heapString(current.slice(0, *slash));
      if (parent == volume) return;
      if (unlinkat(rootFd, parent.cStr(), AT_REMOVEDIR) < 0) return;
      current = kj::mv(parent);
    } else {
      return;
    }
  }
}

void LocalDisk::moveToTrash(kj::StringPtr relPath) {
  auto target = pathJoin(SYSTEM_VOLUME, TRASH_DIR, newUuid());
  if (retryOnEintr([&]() {
    return renameat(rootFd, relPath.cStr(), rootFd, target.cStr());
  }) < 0) {
    int error = errno;
    if (error == ENOENT) return;
    failFile(error, relPath);
  }

  tasks.add(kj::evalLater([this,KJ_MVCAP(target)]() {
    deleteTree(rootFd, target);
  }));
}

void LocalDisk::writeAtomically(kj::StringPtr relPath, kj::ArrayPtr<const byte> data,
                                bool sync) {
  auto tmp = pathJoin(SYSTEM_VOLUME, TMP_DIR, newUuid());
  {
    auto fd = sandstorm::raiiOpenAt(rootFd, tmp, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    KJ_ON_SCOPE_FAILURE(unlinkat(rootFd, tmp.cStr(), 0));
    writeFd(fd, data, 0);
    if (sync) KJ_SYSCALL(fdatasync(fd));
  }

  makeParents(relPath);
  if (retryOnEintr([&]() { return renameat(rootFd, tmp.cStr(), rootFd, relPath.cStr()); }) < 0) {
    int error = errno;
    unlinkat(rootFd, tmp.cStr(), 0);
    failFile(error, relPath);
  }
}

// =======================================================================================

kj::Promise<kj::String> LocalDisk::getDiskId() {
  return kj::heapString(diskId);
}

kj::Promise<DiskInfo> LocalDisk::diskInfo(bool metrics) {
  return kj::evalNow([&]() {
    struct statvfs stats;
    if (retryOnEintr([&]() { return fstatvfs(rootFd, &stats); }) < 0) {
      failVolume(errno, path);
    }

    DiskInfo info;
    info.total = static_cast<uint64_t>(stats.f_blocks) * stats.f_frsize;
    info.free = static_cast<uint64_t>(stats.f_bavail) * stats.f_frsize;
    info.used = info.total - static_cast<uint64_t>(stats.f_bfree) * stats.f_frsize;
    info.usedInodes = stats.f_files - stats.f_ffree;
    info.freeInodes = stats.f_ffree;
    info.healing = statAt(rootFd, pathJoin(SYSTEM_VOLUME, HEALING_FILE)) != nullptr;
    info.endpoint = kj::heapString(endpoint);
    info.mountPath = kj::heapString(path);
    info.id = kj::heapString(diskId);

    struct stat rootStats;
    struct stat diskStats;
    if (stat("/", &rootStats) == 0 && fstat(rootFd, &diskStats) == 0) {
      info.rootDisk = rootStats.st_dev == diskStats.st_dev;
    }
    return info;
  });
}

// ---------------------------------------------------------------------------------------
// volumes

kj::Promise<void> LocalDisk::makeVolume(kj::StringPtr volume) {
  return kj::evalNow([&]() {
    checkVolumeName(volume);
    if (volume == SYSTEM_VOLUME) {
      GRANITE_FAIL(VOLUME_EXISTS, volume);
    }
    if (retryOnEintr([&]() { return mkdirat(rootFd, volume.cStr(), 0755); }) < 0) {
      failVolume(errno, volume);
    }
  });
}

kj::Promise<void> LocalDisk::makeVolumes(kj::ArrayPtr<const kj::StringPtr> volumes) {
  return kj::evalNow([&]() {
    for (auto volume: volumes) {
      checkVolumeName(volume);
      if (retryOnEintr([&]() { return mkdirat(rootFd, volume.cStr(), 0755); }) < 0 &&
          errno != EEXIST) {
        failVolume(errno, volume);
      }
    }
  });
}

kj::Promise<kj::Array<VolumeInfo>> LocalDisk::listVolumes() {
  return kj::evalNow([&]() {
    kj::Vector<VolumeInfo> result;
    for (auto& name: sandstorm::listDirectoryFd(rootFd)) {
      if (name == SYSTEM_VOLUME) continue;
      KJ_IF_MAYBE(stats, statAt(rootFd, name)) {
        if (S_ISDIR(stats->st_mode)) {
          result.add(VolumeInfo { kj::mv(name), toNanos(stats->st_ctim) });
        }
      }
    }
    std::sort(result.begin(), result.end(), [](const VolumeInfo& a, const VolumeInfo& b) {
      return a.name < b.name;
    });
    return result.releaseAsArray();
  });
}

kj::Promise<VolumeInfo> LocalDisk::statVolume(kj::StringPtr volume) {
  return kj::evalNow([&]() {
    checkVolumeName(volume);
    KJ_IF_MAYBE(stats, statAt(rootFd, volume)) {
      if (S_ISDIR(stats->st_mode)) {
        return VolumeInfo { kj::heapString(volume), toNanos(stats->st_ctim) };
      }
    }
    GRANITE_FAIL(VOLUME_NOT_FOUND, volume);
  });
}

kj::Promise<void> LocalDisk::deleteVolume(kj::StringPtr volume, bool force) {
  return kj::evalNow([&]() {
    checkVolumeName(volume);
    if (volume == SYSTEM_VOLUME) {
      GRANITE_FAIL(METHOD_NOT_ALLOWED, "cannot delete the system volume");
    }
    requireVolume(volume);
    if (force) {
      moveToTrash(volume);
    } else if (retryOnEintr([&]() {
      return unlinkat(rootFd, volume.cStr(), AT_REMOVEDIR);
    }) < 0) {
      failVolume(errno, volume);
    }
  });
}

// ---------------------------------------------------------------------------------------
// files

kj::Promise<kj::Array<kj::String>> LocalDisk::listDir(
    kj::StringPtr volume, kj::StringPtr dirPath, int count) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(dirPath);
    auto rel = pathJoin(volume, dirPath);

    KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(
        rootFd, rel, O_RDONLY | O_DIRECTORY | O_CLOEXEC)) {
      kj::Vector<kj::String> result;
      for (auto& name: sandstorm::listDirectoryFd(*fd)) {
        KJ_IF_MAYBE(stats, statAt(*fd, name)) {
          result.add(S_ISDIR(stats->st_mode) ? kj::str(name, '/') : kj::mv(name));
        }
      }
      std::sort(result.begin(), result.end());
      if (count > 0 && result.size() > static_cast<uint>(count)) {
        result.resize(count);
      }
      return result.releaseAsArray();
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", dirPath);
    }
  });
}

struct LocalDisk::WalkState {
  WalkDirOptions options;
  WalkSink& sink;
  kj::String prefix;
  // baseDir + filterPrefix: every reported name starts with this.
  int reported = 0;

  WalkState(const WalkDirOptions& opts, WalkSink& sink)
      : sink(sink), prefix(kj::str(opts.baseDir, opts.filterPrefix)) {
    options.bucket = kj::heapString(opts.bucket);
    options.baseDir = kj::heapString(opts.baseDir);
    options.recursive = opts.recursive;
    options.filterPrefix = kj::heapString(opts.filterPrefix);
    options.forwardTo = kj::heapString(opts.forwardTo);
    options.limit = opts.limit;
  }

  bool full() { return options.limit > 0 && reported >= options.limit; }
};

kj::Promise<void> LocalDisk::walkDir(const WalkDirOptions& options, WalkSink& sink) {
  return kj::evalNow([&]() -> kj::Promise<void> {
    requireVolume(options.bucket);
    if (options.baseDir.size() > 0) checkPathName(options.baseDir);

    auto base = kj::heapString(options.baseDir);
    if (base.size() > 0 && !base.endsWith("/")) {
      // A base that is not a directory name only filters.
      KJ_IF_MAYBE(slash, base.findLast('/')) {
        base = kj::heapString(base.slice(0, *slash + 1));
      } else {
        base = kj::heapString("");
      }
    }

    auto rel = pathJoin(options.bucket, base);
    auto stats = statAt(rootFd, rel);
    if (stats == nullptr || !S_ISDIR(KJ_ASSERT_NONNULL(stats).st_mode)) {
      if (options.reportNotFound) {
        return GRANITE_ERROR(FILE_NOT_FOUND, options.bucket, "/", options.baseDir);
      }
      return kj::READY_NOW;
    }

    auto state = kj::heap<WalkState>(options, sink);
    auto promise = walkInto(*state, kj::mv(base));
    return promise.attach(kj::mv(state));
  });
}

kj::Promise<void> LocalDisk::walkInto(WalkState& state, kj::String dir) {
  if (state.full()) return kj::READY_NOW;

  auto rel = pathJoin(state.options.bucket, dir);
  kj::Vector<kj::String> entries;
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_DIRECTORY | O_CLOEXEC)) {
    for (auto& name: sandstorm::listDirectoryFd(*fd)) {
      KJ_IF_MAYBE(stats, statAt(*fd, name)) {
        if (S_ISDIR(stats->st_mode)) entries.add(kj::str(name, '/'));
      }
    }
  } else {
    // Deleted while we walked.
    return kj::READY_NOW;
  }
  std::sort(entries.begin(), entries.end());

  // Each entry becomes a step run after the previous one has been pushed.
  kj::Promise<void> chain = kj::READY_NOW;
  for (auto& entry: entries) {
    auto name = kj::str(dir, entry);
    if (!matchesPrefix(name, state.prefix) && !matchesPrefix(state.prefix, name)) continue;

    chain = chain.then([this,&state,KJ_MVCAP(name)]() mutable -> kj::Promise<void> {
      if (state.full()) return kj::READY_NOW;

      auto objectName = kj::heapString(name.slice(0, name.size() - 1));
      auto metaPath = pathJoin(state.options.bucket, objectName, METADATA_FILE);
      KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, metaPath, O_RDONLY | O_CLOEXEC)) {
        if (!matchesPrefix(objectName, state.prefix) || objectName < state.options.forwardTo) {
          return kj::READY_NOW;
        }
        ++state.reported;
        return state.sink.push(MetaCacheEntry { kj::mv(objectName), readFd(*fd) });
      }

      if (state.options.recursive) {
        return walkInto(state, kj::mv(name));
      }
      if (!matchesPrefix(name, state.prefix) || name < state.options.forwardTo) {
        return kj::READY_NOW;
      }
      return state.sink.push(MetaCacheEntry { kj::mv(name), nullptr });
    });
  }
  return chain;
}

kj::Promise<kj::Array<byte>> LocalDisk::readAll(kj::StringPtr volume, kj::StringPtr path) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    auto rel = pathJoin(volume, path);
    KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_CLOEXEC)) {
      struct stat stats;
      KJ_SYSCALL(fstat(*fd, &stats));
      if (!S_ISREG(stats.st_mode)) {
        GRANITE_FAIL(IS_NOT_REGULAR, rel);
      }
      return readFd(*fd);
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, rel);
    }
  });
}

kj::Promise<void> LocalDisk::writeAll(kj::StringPtr volume, kj::StringPtr path,
                                      kj::ArrayPtr<const byte> data) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    writeAtomically(pathJoin(volume, path), data);
  });
}

kj::Promise<kj::Own<FileWriter>> LocalDisk::createFile(
    kj::StringPtr volume, kj::StringPtr path, int64_t size) {
  return kj::evalNow([&]() -> kj::Own<FileWriter> {
    requireVolume(volume);
    checkPathName(path);
    auto rel = pathJoin(volume, path);
    makeParents(rel);

    int fd;
    if ((fd = retryOnEintr([&]() {
      return openat(rootFd, rel.cStr(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    })) < 0) {
      failFile(errno, rel);
    }
    kj::AutoCloseFd ownFd(fd);

    if (size > 0) {
      // Reserve the space now so that a full disk fails the write up front.
      int error = posix_fallocate(ownFd, 0, size);
      if (error != 0 && error != EOPNOTSUPP && error != EINVAL) {
        failFile(error, rel);
      }
    }
    return kj::heap<FileWriterImpl>(kj::mv(ownFd), size, 0, kj::mv(rel));
  });
}

kj::Promise<kj::Own<FileWriter>> LocalDisk::appendFile(kj::StringPtr volume, kj::StringPtr path) {
  return kj::evalNow([&]() -> kj::Own<FileWriter> {
    requireVolume(volume);
    checkPathName(path);
    auto rel = pathJoin(volume, path);
    makeParents(rel);

    int fd;
    if ((fd = retryOnEintr([&]() {
      return openat(rootFd, rel.cStr(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    })) < 0) {
      failFile(errno, rel);
    }
    kj::AutoCloseFd ownFd(fd);
    struct stat stats;
    KJ_SYSCALL(fstat(ownFd, &stats));
    return kj::heap<FileWriterImpl>(kj::mv(ownFd), -1, stats.st_size, kj::mv(rel));
  });
}

kj::Promise<kj::Own<FileReader>> LocalDisk::readFileStream(
    kj::StringPtr volume, kj::StringPtr path, int64_t offset, int64_t length) {
  return kj::evalNow([&]() -> kj::Own<FileReader> {
    requireVolume(volume);
    checkPathName(path);
    if (offset < 0 || length < 0) {
      GRANITE_FAIL(INVALID_ARGUMENT, "negative range ", offset, " ", length);
    }
    auto rel = pathJoin(volume, path);
    KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_CLOEXEC)) {
      struct stat stats;
      KJ_SYSCALL(fstat(*fd, &stats));
      if (!S_ISREG(stats.st_mode)) {
        GRANITE_FAIL(IS_NOT_REGULAR, rel);
      }
      if (offset + length > stats.st_size) {
        GRANITE_FAIL(LESS_DATA, rel, " has ", stats.st_size, " bytes, ", offset + length,
                     " requested");
      }
      return kj::heap<FileReaderImpl>(kj::mv(*fd), offset, length);
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, rel);
    }
  });
}

kj::Promise<void> LocalDisk::renameFile(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                        kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return kj::evalNow([&]() {
    requireVolume(srcVolume);
    requireVolume(dstVolume);
    checkPathName(srcPath);
    checkPathName(dstPath);
    auto src = pathJoin(srcVolume, srcPath);
    auto dst = pathJoin(dstVolume, dstPath);

    KJ_IF_MAYBE(stats, statAt(rootFd, dst)) {
      if (S_ISDIR(stats->st_mode)) {
        // Replacing a directory: move the old one out of the way first.
        moveToTrash(dst);
      }
    }
    makeParents(dst);
    if (retryOnEintr([&]() { return renameat(rootFd, src.cStr(), rootFd, dst.cStr()); }) < 0) {
      failFile(errno, src);
    }
    removeEmptyParents(srcVolume, src);
  });
}

kj::Promise<void> LocalDisk::renamePart(kj::StringPtr srcVolume, kj::StringPtr srcPath,
                                        kj::StringPtr dstVolume, kj::StringPtr dstPath,
                                        kj::ArrayPtr<const byte> meta) {
  return renameFile(srcVolume, srcPath, dstVolume, dstPath).then(
      [this,dstVolume,dstPath,meta]() {
    writeAtomically(pathJoin(dstVolume, kj::str(dstPath, ".meta")), meta);
  });
}

kj::Promise<void> LocalDisk::deleteFile(kj::StringPtr volume, kj::StringPtr path,
                                        const DeleteOptions& options) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    auto rel = pathJoin(volume, path);

    KJ_IF_MAYBE(stats, statAt(rootFd, rel)) {
      if (S_ISDIR(stats->st_mode)) {
        if (options.recursive) {
          if (options.immediate) {
            deleteTree(rootFd, rel);
          } else {
            moveToTrash(rel);
          }
        } else if (retryOnEintr([&]() {
          return unlinkat(rootFd, rel.cStr(), AT_REMOVEDIR);
        }) < 0) {
          failFile(errno, rel);
        }
      } else if (retryOnEintr([&]() { return unlinkat(rootFd, rel.cStr(), 0); }) < 0) {
        failFile(errno, rel);
      }
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, rel);
    }

    removeEmptyParents(volume, rel);
  });
}

kj::Promise<void> LocalDisk::deletePaths(kj::StringPtr volume,
                                         kj::ArrayPtr<const kj::StringPtr> paths) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    for (auto p: paths) {
      checkPathName(p);
      auto rel = pathJoin(volume, p);
      if (statAt(rootFd, rel) != nullptr) {
        moveToTrash(rel);
        removeEmptyParents(volume, rel);
      }
    }
  });
}

uint32_t LocalDisk::checkPart(kj::StringPtr relPath, uint64_t expectedSize, bool verify,
                              BitrotAlgorithm algorithm, uint64_t shardSize) {
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, relPath, O_RDONLY | O_CLOEXEC)) {
    struct stat stats;
    KJ_SYSCALL(fstat(*fd, &stats));
    if (!S_ISREG(stats.st_mode) || static_cast<uint64_t>(stats.st_size) != expectedSize) {
      return CHECK_PART_FILE_CORRUPT;
    }
    if (!verify) return CHECK_PART_SUCCESS;

    // Walk the file block by block checking every hash.
    size_t hsize = hashSize(algorithm);
    auto buffer = kj::heapArray<byte>(hsize + shardSize);
    uint64_t offset = 0;
    while (offset < expectedSize) {
      size_t want = kj::min<uint64_t>(buffer.size(), expectedSize - offset);
      auto chunk = buffer.slice(0, want);
      size_t got = 0;
      while (got < want) {
        ssize_t n = pread(*fd, chunk.begin() + got, want - got, offset + got);
        if (n < 0) {
          if (errno == EINTR) continue;
          return CHECK_PART_FILE_CORRUPT;
        }
        if (n == 0) return CHECK_PART_FILE_CORRUPT;
        got += n;
      }
      if (want <= hsize ||
          !verifyBlock(algorithm, chunk.slice(0, hsize), chunk.slice(hsize, want))) {
        return CHECK_PART_FILE_CORRUPT;
      }
      offset += want;
    }
    return CHECK_PART_SUCCESS;
  } else {
    return CHECK_PART_FILE_NOT_FOUND;
  }
}

kj::Promise<kj::Array<uint32_t>> LocalDisk::verifyFile(kj::StringPtr volume, kj::StringPtr path,
                                                       const FileInfo& fi) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    auto result = kj::heapArray<uint32_t>(fi.parts.size());
    for (uint i = 0; i < fi.parts.size(); i++) {
      auto& part = fi.parts[i];
      if (fi.isInline() || fi.dataDir.size() == 0) {
        result[i] = CHECK_PART_SUCCESS;
        continue;
      }
      auto algorithm = fi.erasure.algorithmFor(part.number);
      uint64_t shardSize = fi.erasure.shardSize();
      uint64_t expected = bitrotShardFileSize(
          fi.erasure.shardFileSize(part.size), shardSize, algorithm);
      result[i] = checkPart(pathJoin(volume, path, pathJoin(fi.dataDir, partFileName(part.number))),
                            expected, true, algorithm, shardSize);
    }
    return result;
  });
}

kj::Promise<kj::Array<uint32_t>> LocalDisk::checkParts(kj::StringPtr volume, kj::StringPtr path,
                                                       const FileInfo& fi) {
  return kj::evalNow([&]() {
    checkVolumeName(volume);
    checkPathName(path);
    auto result = kj::heapArray<uint32_t>(fi.parts.size());
    bool volumeExists = statAt(rootFd, volume) != nullptr;
    for (uint i = 0; i < fi.parts.size(); i++) {
      auto& part = fi.parts[i];
      if (!volumeExists) {
        result[i] = CHECK_PART_VOLUME_NOT_FOUND;
        continue;
      }
      if (fi.isInline() || fi.dataDir.size() == 0) {
        result[i] = CHECK_PART_SUCCESS;
        continue;
      }
      auto algorithm = fi.erasure.algorithmFor(part.number);
      uint64_t shardSize = fi.erasure.shardSize();
      uint64_t expected = bitrotShardFileSize(
          fi.erasure.shardFileSize(part.size), shardSize, algorithm);
      result[i] = checkPart(pathJoin(volume, path, pathJoin(fi.dataDir, partFileName(part.number))),
                            expected, false, algorithm, shardSize);
    }
    return result;
  });
}

// ---------------------------------------------------------------------------------------
// metadata

kj::Maybe<FileMeta> LocalDisk::readMeta(kj::StringPtr volume, kj::StringPtr path) {
  auto rel = pathJoin(volume, path, METADATA_FILE);
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_CLOEXEC)) {
    return FileMeta::parse(readFd(*fd));
  } else {
    return nullptr;
  }
}

void LocalDisk::writeMeta(kj::StringPtr volume, kj::StringPtr path, const FileMeta& meta,
                          bool sync) {
  auto rel = pathJoin(volume, path, METADATA_FILE);
  if (meta.empty()) {
    if (unlinkat(rootFd, rel.cStr(), 0) < 0 && errno != ENOENT) {
      failFile(errno, rel);
    }
    removeEmptyParents(volume, rel);
  } else {
    writeAtomically(rel, meta.serialize(), sync);
  }
}

kj::Promise<void> LocalDisk::writeMetadata(kj::StringPtr volume, kj::StringPtr path,
                                           const FileInfo& fi) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    FileMeta meta;
    if (!fi.fresh) {
      KJ_IF_MAYBE(existing, readMeta(volume, path)) {
        meta = kj::mv(*existing);
      }
    }
    meta.addVersion(fi.clone());
    writeMeta(volume, path, meta);
  });
}

kj::Promise<void> LocalDisk::updateMetadata(kj::StringPtr volume, kj::StringPtr path,
                                            const FileInfo& fi,
                                            const UpdateMetadataOptions& options) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    KJ_IF_MAYBE(meta, readMeta(volume, path)) {
      meta->updateVersion(fi);
      writeMeta(volume, path, *meta, !options.noPersistence);
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", path);
    }
  });
}

kj::Promise<FileInfo> LocalDisk::readVersion(kj::StringPtr volume, kj::StringPtr path,
                                             kj::StringPtr versionId,
                                             const ReadOptions& options) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    KJ_IF_MAYBE(meta, readMeta(volume, path)) {
      return meta->findVersion(volume, path, versionId, options.readData);
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", path);
    }
  });
}

kj::Promise<kj::Array<byte>> LocalDisk::readXl(kj::StringPtr volume, kj::StringPtr path,
                                               bool readData) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    auto rel = pathJoin(volume, path, METADATA_FILE);
    KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_CLOEXEC)) {
      auto bytes = readFd(*fd);
      if (readData) return kj::mv(bytes);
      return FileMeta::parse(bytes).serialize(false);
    } else {
      GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", path);
    }
  });
}

kj::Promise<kj::Maybe<kj::String>> LocalDisk::renameData(
    kj::StringPtr srcVolume, kj::StringPtr srcPath, const FileInfo& fi,
    kj::StringPtr dstVolume, kj::StringPtr dstPath) {
  return kj::evalNow([&]() -> kj::Maybe<kj::String> {
    requireVolume(srcVolume);
    requireVolume(dstVolume);
    checkPathName(srcPath);
    checkPathName(dstPath);

    auto staging = pathJoin(srcVolume, srcPath);
    FileMeta meta;
    bool backedUp = false;
    KJ_IF_MAYBE(existing, readMeta(dstVolume, dstPath)) {
      meta = kj::mv(*existing);
      writeAtomically(pathJoin(staging, METADATA_BACKUP_FILE), meta.serialize(), false);
      backedUp = true;
    }

    kj::String oldDataDir;
    KJ_IF_MAYBE(old, meta.findById(fi.versionId)) {
      oldDataDir = kj::heapString(old->dataDir);
    }

    if (fi.dataDir.size() > 0 && !fi.isInline()) {
      auto src = pathJoin(srcVolume, srcPath, fi.dataDir);
      auto dst = pathJoin(dstVolume, dstPath, fi.dataDir);
      if (statAt(rootFd, dst) != nullptr) {
        // Left behind by an earlier attempt of this same commit.
        moveToTrash(dst);
      }
      makeParents(dst);
      if (retryOnEintr([&]() { return renameat(rootFd, src.cStr(), rootFd, dst.cStr()); }) < 0) {
        failFile(errno, src);
      }
    }

    meta.addVersion(fi.clone());
    writeMeta(dstVolume, dstPath, meta);

    if (!backedUp) {
      // The staging directory is empty now, or only holds leftovers.
      if (statAt(rootFd, staging) != nullptr) {
        moveToTrash(staging);
      }
      return nullptr;
    }

    if (oldDataDir.size() > 0 && oldDataDir != fi.dataDir && !meta.sharesDataDir(oldDataDir)) {
      auto from = pathJoin(dstVolume, dstPath, oldDataDir);
      auto to = pathJoin(staging, oldDataDir);
      if (retryOnEintr([&]() { return renameat(rootFd, from.cStr(), rootFd, to.cStr()); }) < 0 &&
          errno != ENOENT) {
        failFile(errno, from);
      }
      return kj::mv(oldDataDir);
    }
    return nullptr;
  });
}

void LocalDisk::undoRenameData(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                               const DeleteOptions& options) {
  checkPathName(options.stagingPath);
  auto staging = pathJoin(SYSTEM_VOLUME, options.stagingPath);

  if (fi.dataDir.size() > 0 && fi.dataDir != options.oldDataDir) {
    moveToTrash(pathJoin(volume, path, fi.dataDir));
  }

  if (options.oldDataDir.size() > 0) {
    auto from = pathJoin(staging, options.oldDataDir);
    auto to = pathJoin(volume, path, options.oldDataDir);
    if (retryOnEintr([&]() { return renameat(rootFd, from.cStr(), rootFd, to.cStr()); }) < 0 &&
        errno != ENOENT) {
      failFile(errno, from);
    }
  }

  auto backup = pathJoin(staging, METADATA_BACKUP_FILE);
  if (statAt(rootFd, backup) != nullptr) {
    auto rel = pathJoin(volume, path, METADATA_FILE);
    if (retryOnEintr([&]() { return renameat(rootFd, backup.cStr(), rootFd, rel.cStr()); }) < 0) {
      failFile(errno, backup);
    }
    return;
  }

  // The commit created the object.
  KJ_IF_MAYBE(meta, readMeta(volume, path)) {
    if (meta->findById(fi.versionId) != nullptr) {
      meta->deleteVersion(fi);
      writeMeta(volume, path, *meta);
    }
  }
}

void LocalDisk::deleteVersionNow(kj::StringPtr volume, kj::StringPtr path, const FileInfo& fi,
                                 bool forceDelMarker) {
  FileMeta meta;
  KJ_IF_MAYBE(existing, readMeta(volume, path)) {
    meta = kj::mv(*existing);
  } else if (!(fi.deleted && forceDelMarker)) {
    // Only a forced delete marker may be placed on a path with no versions.
    GRANITE_FAIL(FILE_NOT_FOUND, volume, "/", path);
  }

  KJ_IF_MAYBE(dataDir, meta.deleteVersion(fi)) {
    moveToTrash(pathJoin(volume, path, *dataDir));
  }
  writeMeta(volume, path, meta);
}

kj::Promise<void> LocalDisk::deleteVersion(kj::StringPtr volume, kj::StringPtr path,
                                           const FileInfo& fi, bool forceDelMarker,
                                           const DeleteOptions& options) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    checkPathName(path);
    if (options.undoWrite) {
      undoRenameData(volume, path, fi, options);
    } else {
      deleteVersionNow(volume, path, fi, forceDelMarker);
    }
  });
}

kj::Promise<kj::Array<kj::Maybe<kj::Exception>>> LocalDisk::deleteVersions(
    kj::StringPtr volume, kj::ArrayPtr<const FileInfoVersions> versions,
    const DeleteOptions& options) {
  return kj::evalNow([&]() {
    requireVolume(volume);
    auto results = kj::heapArrayBuilder<kj::Maybe<kj::Exception>>(versions.size());
    for (auto& entry: versions) {
      results.add(kj::runCatchingExceptions([&]() {
        checkPathName(entry.name);
        for (auto& fi: entry.versions) {
          deleteVersionNow(volume, entry.name, fi, false);
        }
      }));
    }
    return results.finish();
  });
}

kj::Promise<kj::Array<ReadMultipleResult>> LocalDisk::readMultiple(
    const ReadMultipleRequest& request) {
  return kj::evalNow([&]() {
    requireVolume(request.bucket);
    kj::Vector<ReadMultipleResult> results;
    for (auto& file: request.files) {
      if (request.maxResults > 0 && results.size() >= request.maxResults) break;

      ReadMultipleResult result;
      result.bucket = kj::heapString(request.bucket);
      result.prefix = kj::heapString(request.prefix);
      result.file = kj::heapString(file);

      auto rel = request.metadataOnly
          ? pathJoin(request.bucket, pathJoin(request.prefix, file), METADATA_FILE)
          : pathJoin(request.bucket, pathJoin(request.prefix, file));
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        checkPathName(pathJoin(request.prefix, file));
        KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_CLOEXEC)) {
          struct stat stats;
          KJ_SYSCALL(fstat(*fd, &stats));
          result.exists = true;
          result.modTime = toNanos(stats.st_mtim);
          if (request.maxSize > 0 && stats.st_size > request.maxSize) {
            result.error = kj::str("file larger than ", request.maxSize, " bytes");
            return;
          }
          auto bytes = readFd(*fd);
          result.data = request.metadataOnly ? FileMeta::parse(bytes).serialize(false)
                                             : kj::mv(bytes);
        }
      })) {
        result.error = kj::str(exception->getDescription());
      }

      bool missing = !result.exists;
      results.add(kj::mv(result));
      if (missing && request.abortOn404) break;
    }
    return results.releaseAsArray();
  });
}

void LocalDisk::scanBucket(kj::StringPtr volume, kj::StringPtr dir, BucketUsage& usage) {
  auto rel = pathJoin(volume, dir);
  KJ_IF_MAYBE(fd, sandstorm::raiiOpenAtIfExists(rootFd, rel, O_RDONLY | O_DIRECTORY | O_CLOEXEC)) {
    for (auto& name: sandstorm::listDirectoryFd(*fd)) {
      KJ_IF_MAYBE(stats, statAt(*fd, name)) {
        if (!S_ISDIR(stats->st_mode)) continue;
      } else {
        continue;
      }

      auto child = pathJoin(dir, name);
      KJ_IF_MAYBE(metaFd, sandstorm::raiiOpenAtIfExists(
          rootFd, pathJoin(volume, child, METADATA_FILE), O_RDONLY | O_CLOEXEC)) {
        KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
          auto meta = FileMeta::parse(readFd(*metaFd));
          for (auto& version: meta.listVersions(volume, child)) {
            ++usage.versions;
            if (version.deleted) ++usage.deleteMarkers;
            if (version.isLatest && !version.deleted) {
              ++usage.objects;
              usage.size += version.size;
            }
          }
        })) {
          KJ_LOG(WARNING, "skipping unreadable object metadata", endpoint, volume, child,
                 *exception);
        }
      } else {
        scanBucket(volume, child, usage);
      }
    }
  }
}

kj::Promise<DataUsage> LocalDisk::nsScanner(DataUsage&& cache, UsageSink& updates) {
  return listVolumes().then([this,KJ_MVCAP(cache),&updates](
      kj::Array<VolumeInfo>&& volumes) mutable {
    // Buckets are replaced one at a time so that each update carries the previous pass's
    // numbers for buckets not yet rescanned.
    kj::Vector<BucketUsage> previous = kj::mv(cache.buckets);
    for (auto& volume: volumes) {
      bool found = false;
      for (auto& old: previous) {
        if (old.name == volume.name) {
          cache.buckets.add(kj::mv(old));
          found = true;
          break;
        }
      }
      if (!found) {
        BucketUsage fresh;
        fresh.name = kj::heapString(volume.name);
        cache.buckets.add(kj::mv(fresh));
      }
    }

    for (auto& bucket: cache.buckets) {
      BucketUsage usage;
      usage.name = kj::mv(bucket.name);
      scanBucket(usage.name, "", usage);
      bucket = kj::mv(usage);
      cache.lastUpdate = nowNanos();
      updates.update(cache);
    }
    cache.lastUpdate = nowNanos();
    return kj::mv(cache);
  });
}

}  // namespace storage
}  // namespace granite
