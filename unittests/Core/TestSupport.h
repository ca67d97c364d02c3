//===- unittests/Core/TestSupport.h ---------------------------------------===//
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

#ifndef FORGELINE_UNITTESTS_CORE_TESTSUPPORT_H
#define FORGELINE_UNITTESTS_CORE_TESTSUPPORT_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Errors.h"
#include "forgeline/Basic/Logging.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace forgeline {
namespace unittests {

/// A clock which only moves when told to.
class FakeClock {
  std::atomic<double> current;

public:
  explicit FakeClock(double start = 1000) : current(start) {}

  basic::Clock::Timestamp now() const { return current; }
  void advance(double seconds) { current = current + seconds; }

  basic::Clock::Source source() { return [this]() { return now(); }; }
};

/// A logger which keeps every message.
class CapturingLogger : public basic::Logger {
  std::mutex mutex;
  std::vector<std::string> messages;

public:
  void log(basic::LogLevel level, const basic::LoggingContext& context,
           const Twine& message) override {
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back((basic::getLogLevelName(level) + ": " + message).str());
  }

  std::vector<std::string> getMessages() {
    std::lock_guard<std::mutex> lock(mutex);
    return messages;
  }

  bool contains(StringRef text) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& message: messages) {
      if (StringRef(message).contains(text))
        return true;
    }
    return false;
  }
};

/// Consume the error of an operation expected to fail, returning its code.
inline basic::errc expectError(llvm::Error error) {
  if (!error) {
    ADD_FAILURE() << "expected an error";
    return basic::errc::unknown;
  }
  basic::errc code = basic::errorCodeOf(error);
  llvm::consumeError(std::move(error));
  return code;
}

template <typename T>
basic::errc expectError(llvm::Expected<T> value) {
  if (value) {
    ADD_FAILURE() << "expected an error";
    return basic::errc::unknown;
  }
  return expectError(value.takeError());
}

}
}

#endif
