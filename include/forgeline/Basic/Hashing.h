//===- Hashing.h ------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_HASHING_H
#define FORGELINE_BASIC_HASHING_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/Hashing.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>

namespace forgeline {
namespace basic {

uint64_t hashString(StringRef value);

/// Compute the lowercase hexadecimal SHA-256 digest of \arg data.
std::string sha256Hex(StringRef data);

/// Generate a random, collision resistant identifier of the form
/// "<prefix>-<22 characters>", with 128 random bits encoded as unpadded
/// web safe base64.
std::string generateIdentifier(StringRef prefix);

}
}

#endif
