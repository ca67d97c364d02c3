//===- Logging.h ------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_LOGGING_H
#define FORGELINE_BASIC_LOGGING_H

#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <memory>
#include <string>

namespace forgeline {
namespace basic {

enum class LogLevel {
  Error = 0,
  Warning = 1,
  Note = 2,
  Debug = 3
};

StringRef getLogLevelName(LogLevel level);

/// Parse a level name ("error", "warning", "note", "debug").
///
/// \returns False if the name is not recognized.
bool parseLogLevel(StringRef name, LogLevel* level_out);

/// The build and job a message is about, either of which may be empty.
struct LoggingContext {
  std::string buildID;
  std::string jobID;

  LoggingContext() {}
  LoggingContext(StringRef buildID, StringRef jobID = "")
    : buildID(buildID), jobID(jobID) {}
};

class Logger {
  // DO NOT COPY
  Logger(const Logger&) FORGELINE_DELETED_FUNCTION;
  void operator=(const Logger&) FORGELINE_DELETED_FUNCTION;

public:
  Logger() {}
  virtual ~Logger();

  /// Emit a message.
  ///
  /// NOTE: Loggers *MUST* be thread-safe, messages arrive concurrently from
  /// queue workers and from running steps.
  virtual void log(LogLevel level, const LoggingContext& context,
                   const Twine& message) = 0;

  void error(const LoggingContext& context, const Twine& message) {
    log(LogLevel::Error, context, message);
  }
  void warning(const LoggingContext& context, const Twine& message) {
    log(LogLevel::Warning, context, message);
  }
  void note(const LoggingContext& context, const Twine& message) {
    log(LogLevel::Note, context, message);
  }
  void debug(const LoggingContext& context, const Twine& message) {
    log(LogLevel::Debug, context, message);
  }
};

class NullLogger: public Logger {
public:
  NullLogger() { }
  ~NullLogger();

  void log(LogLevel, const LoggingContext&, const Twine&) override;
};

/// Create a logger writing one line per message to \arg os.
///
/// Messages less severe than \arg minimumLevel are dropped. The stream must
/// outlive the logger.
std::unique_ptr<Logger> createStreamLogger(raw_ostream& os,
                                           LogLevel minimumLevel);

}
}

#endif
