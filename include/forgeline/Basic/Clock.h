//===- Clock.h --------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_CLOCK_H
#define FORGELINE_BASIC_CLOCK_H

#include "forgeline/Basic/Compiler.h"

#include <chrono>
#include <functional>

namespace forgeline {
namespace basic {

class Clock {
public:
  /// A timestamp is the number of seconds since the clock's epoch time.
  typedef double Timestamp;

  /// A source of timestamps, used where tests need to control time.
  typedef std::function<Timestamp()> Source;

  Clock() FORGELINE_DELETED_FUNCTION;

  /// Returns a global timestamp that represents the current time in seconds
  /// since a reference date.
  ///
  /// *NOTE*: This function uses a monotonic clock, so don't compare between
  /// systems.
  inline static Timestamp now() {
    // steady_clock is monotonic
    auto now = std::chrono::steady_clock::now();
    auto difference = std::chrono::duration_cast<std::chrono::duration<double>>(
        now.time_since_epoch());
    return difference.count();
  }

  /// The default timestamp source.
  static Source system() { return &Clock::now; }

  /// Convert a (possibly fractional) number of seconds into a duration
  /// suitable for the steady clock.
  inline static std::chrono::steady_clock::duration toDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
  }
};

}
}

#endif
