//===-- Logging.cpp -------------------------------------------------------===//
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

#include "forgeline/Basic/Logging.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

#include <mutex>

using namespace forgeline;
using namespace forgeline::basic;

Logger::~Logger() {}

NullLogger::~NullLogger() {}

void NullLogger::log(LogLevel, const LoggingContext&, const Twine&) {}

StringRef forgeline::basic::getLogLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Error: return "error";
  case LogLevel::Warning: return "warning";
  case LogLevel::Note: return "note";
  case LogLevel::Debug: return "debug";
  }
  return "<unknown>";
}

bool forgeline::basic::parseLogLevel(StringRef name, LogLevel* level_out) {
  int value = llvm::StringSwitch<int>(name)
    .Case("error", int(LogLevel::Error))
    .Case("warning", int(LogLevel::Warning))
    .Case("note", int(LogLevel::Note))
    .Case("debug", int(LogLevel::Debug))
    .Default(-1);
  if (value < 0)
    return false;
  *level_out = LogLevel(value);
  return true;
}

namespace {

/// Logger writing one line per message to a stream:
///
///   <level>: [<buildID>/<jobID>] <message>
class StreamLogger : public Logger {
  raw_ostream& os;
  LogLevel minimumLevel;

  /// Serializes writes to the stream.
  std::mutex streamMutex;

public:
  StreamLogger(raw_ostream& os, LogLevel minimumLevel)
    : os(os), minimumLevel(minimumLevel) {}

  void log(LogLevel level, const LoggingContext& context,
           const Twine& message) override {
    if (int(level) > int(minimumLevel))
      return;

    // Format outside of the lock.
    SmallString<256> line;
    llvm::raw_svector_ostream lineOS(line);
    lineOS << getLogLevelName(level) << ": ";
    if (!context.buildID.empty() || !context.jobID.empty()) {
      lineOS << "[" << context.buildID;
      if (!context.jobID.empty() && context.jobID != context.buildID)
        lineOS << "/" << context.jobID;
      lineOS << "] ";
    }
    lineOS << message << "\n";

    std::lock_guard<std::mutex> guard(streamMutex);
    os << line;
    os.flush();
  }
};

}

std::unique_ptr<Logger> forgeline::basic::createStreamLogger(
    raw_ostream& os, LogLevel minimumLevel) {
  return std::unique_ptr<Logger>(new StreamLogger(os, minimumLevel));
}
