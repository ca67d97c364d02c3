//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
// This file declares small platform wrappers used by the worker threads.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_BASIC_PLATFORMUTILITY_H
#define FORGELINE_BASIC_PLATFORMUTILITY_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/Twine.h"

namespace forgeline {
namespace basic {
namespace sys {

/// Name the calling thread, for debuggers and process listings.
///
/// Names longer than the platform limit are truncated. Does nothing where
/// threads cannot be named.
void setCurrentThreadName(const Twine& name);

/// The number of hardware threads, at least 1.
unsigned getNumberOfCPUs();

}
}
}

#endif
