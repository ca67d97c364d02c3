//===- BuildLifecycle.h -----------------------------------------*- C++ -*-===//
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
// This file defines the state machine which drives one build through its
// phases.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_CORE_BUILDLIFECYCLE_H
#define FORGELINE_CORE_BUILDLIFECYCLE_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/LLVM.h"
#include "forgeline/Core/ArtifactCache.h"
#include "forgeline/Core/BuildPhase.h"
#include "forgeline/Core/BuildSpec.h"
#include "forgeline/Core/Job.h"
#include "forgeline/Core/StepScheduler.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <mutex>
#include <string>
#include <vector>

namespace forgeline {
namespace basic {
  class Logger;
}

namespace core {

class BuildStore;
class CancellationRegistry;

/// The inputs of one build.
struct BuildContext {
  std::string buildID;
  std::string jobID;
  Tier tier = Tier::Free;
  BuildSpec spec;
  /// The hash of the normalized specification.
  std::string specHash;
  /// The artifacts produced so far, or restored from the artifact cache.
  std::vector<std::string> artifacts;
};

/// Provider of the units of work of each phase.
class BuildPlan {
public:
  virtual ~BuildPlan();

  /// Get the steps of a phase.
  ///
  /// Called once for each phase the build enters, other than the terminal
  /// ones. A phase with no steps completes immediately.
  virtual std::vector<StepDescription> getSteps(BuildPhase phase,
                                                const BuildContext& context) = 0;

  /// Remove whatever the build left behind. Called once when the build ends,
  /// failures must be handled by the plan.
  virtual void cleanup(const BuildContext& context) { (void)context; }
};

/// Why a build failed.
enum class BuildFailureKind : uint8_t {
  None = 0,
  InvalidSpec,
  InvalidGraph,
  StepFailed,
  Deadlocked,
  Cancelled
};

StringRef getBuildFailureKindName(BuildFailureKind kind);

/// The lifecycle record of a build.
struct BuildRecord {
  std::string buildID;
  std::string jobID;
  BuildPhase phase = BuildPhase::Pending;
  bool cancelRequested = false;
  std::vector<std::string> artifacts;

  /// Whether the build phases were skipped on an artifact cache hit.
  bool cacheHit = false;

  BuildFailureKind failureKind = BuildFailureKind::None;

  /// The phase which failed, if any.
  BuildPhase failedPhase = BuildPhase::Pending;
  std::string failureReason;

  basic::Clock::Timestamp startedAt = 0;
  basic::Clock::Timestamp finishedAt = 0;

  bool succeeded() const { return phase == BuildPhase::Complete; }
  bool cancelled() const {
    return failureKind == BuildFailureKind::Cancelled;
  }
  double getDuration() const { return finishedAt - startedAt; }
};

/// Observer of phase transitions.
class BuildLifecycleDelegate {
public:
  virtual ~BuildLifecycleDelegate();

  virtual void phaseChanged(StringRef buildID, BuildPhase from,
                            BuildPhase to) = 0;
};

struct LifecycleOptions {
  /// The concurrency bound of each phase's steps.
  unsigned maxConcurrency = 4;

  /// The lifetime of artifact cache entries, in seconds.
  double cacheTTL = DefaultArtifactCacheTTL;
};

/// Drives builds through their phases.
///
/// One instance serves many concurrent builds; \see run() is called by a
/// worker and returns when the build is terminal. Records of finished builds
/// are kept for status queries until \see forgetBuild() is called.
class BuildLifecycle {
  StepScheduler& scheduler;
  CancellationRegistry& cancellation;
  ArtifactCache* cache;
  BuildStore* store;
  basic::Logger& logger;
  BuildLifecycleDelegate* delegate;
  LifecycleOptions options;
  basic::Clock::Source clock;

  llvm::StringMap<BuildRecord> records;
  std::mutex recordsMutex;

  // DO NOT COPY
  BuildLifecycle(const BuildLifecycle&) FORGELINE_DELETED_FUNCTION;
  void operator=(const BuildLifecycle&) FORGELINE_DELETED_FUNCTION;

  void transition(BuildRecord& record, BuildPhase to);
  void fail(BuildRecord& record, BuildFailureKind kind, const Twine& reason);
  void persistLog(StringRef buildID, const Twine& message);
  bool runPhase(BuildRecord& record, BuildContext& context, BuildPlan& plan,
                Tier tier);
  void publish(const BuildRecord& record);

public:
  BuildLifecycle(StepScheduler& scheduler, CancellationRegistry& cancellation,
                 ArtifactCache* cache, BuildStore* store,
                 basic::Logger& logger,
                 const LifecycleOptions& options = LifecycleOptions(),
                 BuildLifecycleDelegate* delegate = nullptr,
                 basic::Clock::Source clock = basic::Clock::system())
    : scheduler(scheduler), cancellation(cancellation), cache(cache),
      store(store), logger(logger), delegate(delegate), options(options),
      clock(clock) {}

  /// Run a build of a job to a terminal phase.
  ///
  /// Each attempt of a job starts a new record in the pending phase. The
  /// specification is parsed in the parsing phase; before the building phase
  /// the artifact cache is consulted and on a hit the build moves straight to
  /// uploading with the cached artifacts. Cancellation is checked before each
  /// phase and by the step scheduler.
  BuildRecord run(const Job& job, BuildPlan& plan);

  /// Request cancellation of a build.
  ///
  /// \returns True if this call set the cancellation flag.
  bool requestCancellation(StringRef buildID);

  /// Get the current phase of a build, if it is known.
  ///
  /// A retried job reuses its build identifier, so the phase of a failed
  /// build goes back to pending when the next attempt starts.
  Optional<BuildPhase> getBuildPhase(StringRef buildID);

  /// Get a copy of the record of a build, if it is known.
  Optional<BuildRecord> getBuildRecord(StringRef buildID);

  /// Drop the record and the cancellation flag of a finished build.
  void forgetBuild(StringRef buildID);

  /// Get the identifiers of the builds which have not reached a terminal
  /// phase.
  std::vector<std::string> getRunningBuildIDs();

  /// Get the number of builds with a record.
  size_t getNumRecords();
};

}
}

#endif
