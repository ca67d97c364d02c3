//===- ArtifactCache.h ------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
//
// This file defines the content addressed cache of build artifacts, keyed by
// the hash of a normalized build specification.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_CORE_ARTIFACTCACHE_H
#define FORGELINE_CORE_ARTIFACTCACHE_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace forgeline {
namespace core {

/// The default lifetime of a cache entry, one week.
static const double DefaultArtifactCacheTTL = 7 * 24 * 60 * 60;

struct ArtifactCacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  /// The lookups which found an entry past its lifetime.
  uint64_t expired = 0;
  uint64_t entries = 0;
};

class ArtifactCache {
public:
  virtual ~ArtifactCache();

  /// Look up the artifact reference stored for a specification hash.
  ///
  /// Entries past their lifetime are treated as absent.
  virtual Optional<std::string> lookup(StringRef specHash) = 0;

  /// Store an artifact reference, replacing any previous entry.
  ///
  /// \param ttl The lifetime of the entry, in seconds.
  virtual void store(StringRef specHash, StringRef artifactRef,
                     double ttl = DefaultArtifactCacheTTL) = 0;

  /// Remove the entry for a specification hash, if any.
  virtual void invalidate(StringRef specHash) = 0;

  virtual ArtifactCacheStats getStats() = 0;
};

/// An artifact cache held in process memory.
///
/// Expired entries are evicted lazily, when a lookup finds them.
class InMemoryArtifactCache: public ArtifactCache {
  struct Entry {
    std::string value;
    basic::Clock::Timestamp createdAt;
    double ttl;
  };

  basic::Clock::Source clock;

  llvm::StringMap<Entry> entries;
  ArtifactCacheStats stats;
  std::mutex cacheMutex;

public:
  explicit InMemoryArtifactCache(
      basic::Clock::Source clock = basic::Clock::system())
    : clock(clock) { }
  ~InMemoryArtifactCache();

  Optional<std::string> lookup(StringRef specHash) override;

  void store(StringRef specHash, StringRef artifactRef,
             double ttl = DefaultArtifactCacheTTL) override;

  void invalidate(StringRef specHash) override;

  ArtifactCacheStats getStats() override;
};

}
}

#endif
