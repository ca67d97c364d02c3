//===- unittests/Basic/HashingTest.cpp ------------------------------------===//
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

#include "forgeline/Basic/Hashing.h"

#include "llvm/ADT/StringRef.h"

#include "gtest/gtest.h"

#include <set>

using namespace forgeline;
using namespace forgeline::basic;

namespace {

TEST(HashingTest, sha256Hex) {
  EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
            sha256Hex(""));
  EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            sha256Hex("abc"));
}

TEST(HashingTest, hashStringIsStable) {
  EXPECT_EQ(hashString("forgeline"), hashString(std::string("forgeline")));
  EXPECT_NE(hashString("a"), hashString("b"));
}

TEST(HashingTest, generateIdentifier) {
  std::set<std::string> ids;
  for (int i = 0; i != 100; ++i) {
    std::string id = generateIdentifier("job");
    ASSERT_EQ(4u + 22u, id.size());
    EXPECT_TRUE(StringRef(id).startswith("job-"));
    EXPECT_EQ(StringRef::npos,
              StringRef(id).substr(4).find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"
                  "0123456789-_"));
    ids.insert(id);
  }
  EXPECT_EQ(100u, ids.size());
}

}
