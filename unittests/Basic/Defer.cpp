//===- unittests/Basic/Defer.cpp ------------------------------------------===//
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

#include "forgeline/Basic/Defer.h"

#include "gtest/gtest.h"

#include <functional>

using namespace forgeline;
using namespace forgeline::basic;

namespace {

TEST(DeferTest, basic) {
  int defer_count = 0;

  // Test basic macro use
  {
    forgeline_defer { defer_count++; };
    EXPECT_EQ(0, defer_count);
  }
  EXPECT_EQ(1, defer_count);

  // Test multiple defers, which run in reverse order
  int last = 0;
  {
    forgeline_defer { last = 1; };
    forgeline_defer { last = 2; };
  }
  EXPECT_EQ(1, last);

  // Test/show direct use of RAII builder
  defer_count = 0;
  {
    auto deferred = makeScopeDefer([&](){ defer_count += 1; });
    EXPECT_EQ(0, defer_count);
  }
  EXPECT_EQ(1, defer_count);

  // Test/show direct use of ScopeDefer template
  defer_count = 0;
  {
    auto deferred = ScopeDefer<std::function<void()>>([&](){ defer_count += 1; });
    EXPECT_EQ(0, defer_count);
  }
  EXPECT_EQ(1, defer_count);
}

TEST(DeferTest, runsOnEarlyReturn) {
  int defer_count = 0;
  auto fn = [&](bool early) {
    forgeline_defer { defer_count++; };
    if (early)
      return 1;
    return 2;
  };
  EXPECT_EQ(1, fn(true));
  EXPECT_EQ(2, fn(false));
  EXPECT_EQ(2, defer_count);
}

}
