//===- unittests/Basic/ErrorsTest.cpp -------------------------------------===//
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

#include "forgeline/Basic/Errors.h"

#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

using namespace forgeline;
using namespace forgeline::basic;

namespace {

TEST(ErrorsTest, codeAndMessage) {
  llvm::Error error = makeError(errc::quota_exceeded, "tenant 't' is full");
  EXPECT_EQ(errc::quota_exceeded, errorCodeOf(error));

  // Inspecting the code does not consume the error.
  errc code = errc::unknown;
  EXPECT_EQ("tenant 't' is full", takeErrorMessage(std::move(error), &code));
  EXPECT_EQ(errc::quota_exceeded, code);
}

TEST(ErrorsTest, foreignErrors) {
  llvm::Error error = llvm::make_error<llvm::StringError>(
      "boom", llvm::inconvertibleErrorCode());
  EXPECT_EQ(errc::unknown, errorCodeOf(error));
  EXPECT_EQ("boom", takeErrorMessage(std::move(error)));

  llvm::Error success = llvm::Error::success();
  EXPECT_EQ(errc::unknown, errorCodeOf(success));
  EXPECT_FALSE(bool(success));
}

TEST(ErrorsTest, errorCodeConversion) {
  std::error_code ec = errc::invalid_spec;
  EXPECT_EQ(&forgelineCategory(), &ec.category());
  EXPECT_EQ("invalid build specification", ec.message());
  EXPECT_STREQ("forgeline", ec.category().name());
}

}
