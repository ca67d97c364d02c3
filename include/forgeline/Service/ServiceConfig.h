//===- ServiceConfig.h ------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_SERVICE_SERVICECONFIG_H
#define FORGELINE_SERVICE_SERVICECONFIG_H

#include "forgeline/Basic/ExecutionQueue.h"
#include "forgeline/Basic/LLVM.h"
#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/ArtifactCache.h"
#include "forgeline/Core/JobQueue.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace forgeline {
namespace service {

/// The configuration of a build service.
///
/// Configuration files are YAML documents:
///
///   workers: 2
///   log-level: note
///   queue:
///     tenant-quota: 2
///     max-attempts: 3
///     backoff-base: 5
///     backoff-cap: 0
///     rate-limit-max: 5
///     rate-limit-window: 60
///     retain-completed: 100
///     retain-dead-lettered: 1000
///   scheduler:
///     max-concurrency: 4
///     lanes: 0
///     lane-order: fifo
///   cache:
///     ttl: 604800
///   store:
///     path: forgeline.db
///
/// Every key is optional.
struct ServiceConfig {
  /// The number of worker threads running builds.
  unsigned workers = 2;

  core::JobQueueOptions queue;

  /// The concurrency bound of the steps of one phase.
  unsigned maxConcurrency = 4;

  /// The number of step execution lanes, 0 to use one per CPU.
  int lanes = 0;

  /// The order in which queued steps take a free lane, "fifo" or "name".
  /// A single FIFO lane runs steps on a serial queue.
  basic::SchedulerAlgorithm laneOrder = basic::SchedulerAlgorithm::FIFO;

  /// The lifetime of artifact cache entries, in seconds.
  double cacheTTL = core::DefaultArtifactCacheTTL;

  /// The SQLite database to persist to, empty to keep state in memory.
  std::string storePath;

  basic::LogLevel logLevel = basic::LogLevel::Note;

  /// Parse a configuration document.
  ///
  /// Fails with \see basic::errc::invalid_config, with a diagnostic naming
  /// the offending line, for malformed YAML, unknown keys and bad values.
  static llvm::Expected<ServiceConfig> parse(StringRef contents,
                                             StringRef filename = "<config>");

  /// Load a configuration file.
  static llvm::Expected<ServiceConfig> load(StringRef filename);
};

}
}

#endif
