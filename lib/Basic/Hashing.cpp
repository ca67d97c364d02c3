//===-- Hashing.cpp -------------------------------------------------------===//
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

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/SHA256.h"

#include "absl/strings/escaping.h"

#include <mutex>
#include <random>

namespace forgeline {
namespace basic {

uint64_t hashString(StringRef value) {
  return hash_value(value);
}

std::string sha256Hex(StringRef data) {
  llvm::SHA256 hasher;
  hasher.update(data);
  return llvm::toHex(hasher.final(), /*LowerCase=*/true);
}

std::string generateIdentifier(StringRef prefix) {
  static std::mutex generatorMutex;
  static std::mt19937_64 generator{std::random_device{}()};

  std::string bytes(16, '\0');
  {
    std::lock_guard<std::mutex> guard(generatorMutex);
    for (size_t i = 0; i != bytes.size(); i += 8) {
      uint64_t part = generator();
      for (int j = 0; j != 8; ++j)
        bytes[i + j] = char(part >> (56 - 8 * j));
    }
  }

  return prefix.str() + "-" + absl::WebSafeBase64Escape(bytes);
}

}
}
