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


#include <kj/main.h>
#include <kj/debug.h>
#include <capnp/pretty-print.h>
#include <sandstorm/util.h>
#include <granite/storage/file-meta.h>
#include <stdio.h>
#include <time.h>

namespace granite {
namespace storage {

class InspectTool {
public:
  InspectTool(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Granite version " GRANITE_VERSION,
          "Prints the stored metadata of an object as found on one disk.")
        .addOption({'r', "raw"}, KJ_BIND_METHOD(*this, setRaw),
            "print the stored message as is, inline data included")
        .expectArg("<disk-path>", KJ_BIND_METHOD(*this, setDiskPath))
        .expectArg("<bucket>", KJ_BIND_METHOD(*this, setBucket))
        .expectArg("<object>", KJ_BIND_METHOD(*this, setObject))
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::StringPtr diskPath;
  kj::StringPtr bucket;
  kj::StringPtr object;
  bool raw = false;

  bool setRaw() { raw = true; return true; }
  bool setDiskPath(kj::StringPtr arg) { diskPath = arg; return true; }
  bool setBucket(kj::StringPtr arg) { bucket = arg; return true; }
  bool setObject(kj::StringPtr arg) { object = arg; return true; }

  static kj::String formatTime(int64_t nanos) {
    char buffer[64];
    time_t seconds = nanos / 1000000000;
    struct tm utc;
    KJ_ASSERT(gmtime_r(&seconds, &utc) != nullptr);
    size_t n = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buffer + n, sizeof(buffer) - n, ".%09lldZ",
             static_cast<long long>(nanos % 1000000000));
    return kj::heapString(buffer);
  }

  static kj::StringPtr algorithmName(BitrotAlgorithm algorithm) {
    switch (algorithm) {
      case BitrotAlgorithm::BLAKE2B256: return "blake2b256";
      case BitrotAlgorithm::BLAKE2B512: return "blake2b512";
      case BitrotAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
  }

  void printVersion(const FileInfo& fi) {
    auto id = fi.versionId.size() == 0 ? kj::StringPtr(NULL_VERSION) : fi.versionId.asPtr();
    context.warning(kj::str(
        "version ", id, fi.isLatest ? " (latest)" : "", fi.deleted ? " DELETE MARKER" : ""));
    context.warning(kj::str("  modified   ", formatTime(fi.modTime)));
    if (fi.deleted) return;

    context.warning(kj::str("  size       ", fi.size));
    if (fi.isInline()) {
      context.warning(kj::str("  storage    inline"));
    } else {
      context.warning(kj::str("  data dir   ", fi.dataDir));
    }

    auto& e = fi.erasure;
    context.warning(kj::str("  erasure    ", e.dataBlocks, "+", e.parityBlocks,
                            ", block size ", e.blockSize, ", this disk holds shard ", e.index));
    context.warning(kj::str("  layout     ", kj::strArray(e.distribution, " ")));

    for (auto& part: fi.parts) {
      context.warning(kj::str("  part ", part.number, "     size ", part.size,
                              ", actual size ", part.actualSize,
                              part.etag.size() == 0 ? kj::str() : kj::str(", etag ", part.etag)));
    }
    for (auto& checksum: e.checksums) {
      context.warning(kj::str("  checksum   part ", checksum.partNumber, " ",
                              algorithmName(checksum.algorithm), " ",
                              hexEncode(checksum.hash)));
    }
    for (auto& entry: fi.metadata) {
      context.warning(kj::str("  meta       ", entry.first, " = ", entry.second));
    }
  }

  kj::MainBuilder::Validity run() {
    auto path = kj::str(diskPath, '/', bucket, '/', object, '/', METADATA_FILE);
    auto contents = sandstorm::readAll(path);
    auto bytes = contents.asBytes();

    if (raw) {
      MessageBlob<StoredFileMeta> blob(bytes);
      context.warning(capnp::prettyPrint(blob.get()).flatten());
      return true;
    }

    auto meta = FileMeta::parse(bytes);
    auto versions = meta.listVersions(bucket, object);
    context.warning(kj::str(path, ": ", versions.size(), " version(s), signature ",
                            kj::hex(meta.signature())));
    for (auto& version: versions) {
      printVersion(version);
    }
    return true;
  }
};

}  // namespace storage
}  // namespace granite

KJ_MAIN(granite::storage::InspectTool)
