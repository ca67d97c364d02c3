//===-- ArtifactCache.cpp -------------------------------------------------===//
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

#include "forgeline/Core/ArtifactCache.h"

using namespace forgeline;
using namespace forgeline::core;

ArtifactCache::~ArtifactCache() { }

InMemoryArtifactCache::~InMemoryArtifactCache() { }

Optional<std::string> InMemoryArtifactCache::lookup(StringRef specHash) {
  auto now = clock();

  std::lock_guard<std::mutex> lock(cacheMutex);
  auto it = entries.find(specHash);
  if (it == entries.end()) {
    ++stats.misses;
    return None;
  }

  // A hit is only honored within the entry's lifetime.
  const Entry& entry = it->second;
  if (!(now < entry.createdAt + entry.ttl)) {
    entries.erase(it);
    ++stats.expired;
    ++stats.misses;
    return None;
  }

  ++stats.hits;
  return entry.value;
}

void InMemoryArtifactCache::store(StringRef specHash, StringRef artifactRef,
                                  double ttl) {
  auto now = clock();

  std::lock_guard<std::mutex> lock(cacheMutex);
  entries[specHash] = Entry{ artifactRef.str(), now, ttl };
}

void InMemoryArtifactCache::invalidate(StringRef specHash) {
  std::lock_guard<std::mutex> lock(cacheMutex);
  entries.erase(specHash);
}

ArtifactCacheStats InMemoryArtifactCache::getStats() {
  std::lock_guard<std::mutex> lock(cacheMutex);
  ArtifactCacheStats result = stats;
  result.entries = entries.size();
  return result;
}
