//===-- CancellationRegistry.cpp ------------------------------------------===//
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

#include "forgeline/Core/CancellationRegistry.h"

using namespace forgeline;
using namespace forgeline::core;

CancellationRegistry::~CancellationRegistry() { }

InMemoryCancellationRegistry::~InMemoryCancellationRegistry() { }

bool InMemoryCancellationRegistry::request(StringRef buildID) {
  std::lock_guard<std::mutex> lock(cancelledMutex);
  return cancelled.insert(buildID).second;
}

bool InMemoryCancellationRegistry::isCancelled(StringRef buildID) const {
  std::lock_guard<std::mutex> lock(cancelledMutex);
  return cancelled.count(buildID) != 0;
}

void InMemoryCancellationRegistry::remove(StringRef buildID) {
  std::lock_guard<std::mutex> lock(cancelledMutex);
  cancelled.erase(buildID);
}

uint64_t InMemoryCancellationRegistry::size() const {
  std::lock_guard<std::mutex> lock(cancelledMutex);
  return cancelled.size();
}
