//===-- PlatformUtility.cpp -----------------------------------------------===//
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

#include "forgeline/Basic/PlatformUtility.h"

#include "llvm/ADT/SmallString.h"

#include <algorithm>
#include <thread>

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

using namespace forgeline;
using namespace forgeline::basic;

void sys::setCurrentThreadName(const Twine& name) {
  SmallString<32> storage;
  StringRef value = name.toNullTerminatedStringRef(storage);
#if defined(__APPLE__)
  pthread_setname_np(value.data());
#elif defined(__linux__)
  // Linux limits names to 15 characters plus the terminator.
  std::string truncated = value.take_front(15).str();
  pthread_setname_np(pthread_self(), truncated.c_str());
#else
  (void)value;
#endif
}

unsigned sys::getNumberOfCPUs() {
  return std::max(1u, std::thread::hardware_concurrency());
}
