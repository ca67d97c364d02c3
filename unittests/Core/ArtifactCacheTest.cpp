//===- unittests/Core/ArtifactCacheTest.cpp -------------------------------===//
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

#include "TestSupport.h"

#include "gtest/gtest.h"

using namespace forgeline;
using namespace forgeline::core;
using namespace forgeline::unittests;

namespace {

TEST(ArtifactCacheTest, storeAndLookup) {
  FakeClock clock;
  InMemoryArtifactCache cache(clock.source());

  EXPECT_FALSE(cache.lookup("abc").hasValue());
  cache.store("abc", "image://forgeline/arch:abc");

  auto hit = cache.lookup("abc");
  ASSERT_TRUE(hit.hasValue());
  EXPECT_EQ("image://forgeline/arch:abc", *hit);

  // Storing again replaces the entry.
  cache.store("abc", "image://forgeline/arch:def");
  EXPECT_EQ("image://forgeline/arch:def", *cache.lookup("abc"));

  auto stats = cache.getStats();
  EXPECT_EQ(2u, stats.hits);
  EXPECT_EQ(1u, stats.misses);
  EXPECT_EQ(0u, stats.expired);
  EXPECT_EQ(1u, stats.entries);
}

TEST(ArtifactCacheTest, entriesExpire) {
  FakeClock clock;
  InMemoryArtifactCache cache(clock.source());

  cache.store("short", "a", 10);
  cache.store("default", "b");

  clock.advance(9.5);
  EXPECT_TRUE(cache.lookup("short").hasValue());

  // An entry is absent once its lifetime has passed.
  clock.advance(0.5);
  EXPECT_FALSE(cache.lookup("short").hasValue());
  EXPECT_TRUE(cache.lookup("default").hasValue());

  clock.advance(DefaultArtifactCacheTTL);
  EXPECT_FALSE(cache.lookup("default").hasValue());

  auto stats = cache.getStats();
  EXPECT_EQ(2u, stats.hits);
  EXPECT_EQ(2u, stats.misses);
  EXPECT_EQ(2u, stats.expired);
  EXPECT_EQ(0u, stats.entries);
}

TEST(ArtifactCacheTest, invalidate) {
  InMemoryArtifactCache cache;
  cache.store("abc", "ref");
  cache.invalidate("abc");
  cache.invalidate("missing");
  EXPECT_FALSE(cache.lookup("abc").hasValue());
  EXPECT_EQ(0u, cache.getStats().entries);
}

}
