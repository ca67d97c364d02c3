//===- CancellationRegistry.h -----------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_CORE_CANCELLATIONREGISTRY_H
#define FORGELINE_CORE_CANCELLATIONREGISTRY_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace forgeline {
namespace core {

/// The set of builds for which cancellation was requested.
///
/// A flag is set at most once and is never cleared while its build is
/// tracked. Implementations must be safe to query from concurrently running
/// steps.
class CancellationRegistry {
public:
  virtual ~CancellationRegistry();

  /// Request cancellation of a build.
  ///
  /// \returns True if this call set the flag, false if it was already set.
  virtual bool request(StringRef buildID) = 0;

  /// Check whether cancellation of a build was requested.
  virtual bool isCancelled(StringRef buildID) const = 0;

  /// Drop the flag of a build which is no longer tracked.
  virtual void remove(StringRef buildID) = 0;
};

class InMemoryCancellationRegistry: public CancellationRegistry {
  llvm::StringSet<> cancelled;
  mutable std::mutex cancelledMutex;

public:
  InMemoryCancellationRegistry() { }
  ~InMemoryCancellationRegistry();

  bool request(StringRef buildID) override;

  bool isCancelled(StringRef buildID) const override;

  void remove(StringRef buildID) override;

  /// Get the number of cancelled builds.
  uint64_t size() const;
};

}
}

#endif
