//===- BuildService.h -------------------------------------------*- C++ -*-===//
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
// This file defines the service which ties the job queue, the lifecycle state
// machine and the step scheduler together behind the submission, query,
// cancellation and notification interfaces.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_SERVICE_BUILDSERVICE_H
#define FORGELINE_SERVICE_BUILDSERVICE_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/ExecutionQueue.h"
#include "forgeline/Basic/LLVM.h"
#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/ArtifactCache.h"
#include "forgeline/Core/BuildEvents.h"
#include "forgeline/Core/BuildLifecycle.h"
#include "forgeline/Core/BuildStore.h"
#include "forgeline/Core/CancellationRegistry.h"
#include "forgeline/Core/JobQueue.h"
#include "forgeline/Core/StepScheduler.h"
#include "forgeline/Service/ServiceConfig.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace forgeline {
namespace service {

/// A build service running jobs on a fixed pool of worker threads.
///
/// Each worker takes a job from the queue, runs its build to a terminal
/// phase and reports the result to the queue before taking the next one. The
/// queue always receives a report, also when a worker leaves a build without
/// one.
class BuildService : private core::JobQueueDelegate,
                     private core::StepSchedulerDelegate {
  ServiceConfig config;
  basic::Logger& logger;
  core::BuildPlan& plan;
  basic::Clock::Source clock;

  std::unique_ptr<core::BuildStore> store;
  core::InMemoryCancellationRegistry cancellation;
  core::InMemoryArtifactCache cache;

  basic::LoggingExecutionQueueDelegate executionDelegate;
  std::unique_ptr<basic::ExecutionQueue> executionQueue;
  std::unique_ptr<core::StepScheduler> scheduler;
  std::unique_ptr<core::BuildLifecycle> lifecycle;
  std::unique_ptr<core::JobQueue> queue;

  std::vector<core::BuildNotifier*> notifiers;
  std::mutex notifiersMutex;

  std::vector<std::thread> workers;
  bool started = false;

  // DO NOT COPY
  BuildService(const BuildService&) FORGELINE_DELETED_FUNCTION;
  void operator=(const BuildService&) FORGELINE_DELETED_FUNCTION;

  void workerLoop(unsigned index);
  void notify(const core::BuildEvent& event);

  // JobQueueDelegate
  void jobRetryScheduled(const core::Job& job, double delaySeconds) override;
  void jobDeadLettered(const core::Job& job,
                       const core::DeadLetterRecord& record) override;
  void jobRetired(StringRef jobID) override;

  // StepSchedulerDelegate
  void stepStarted(StringRef buildID, StringRef stepID) override;
  void stepFinished(StringRef buildID, const core::StepResult& result) override;

public:
  /// \param store The persistence backend, or null to keep state in memory.
  BuildService(const ServiceConfig& config, basic::Logger& logger,
               core::BuildPlan& plan,
               std::unique_ptr<core::BuildStore> store = nullptr,
               basic::Clock::Source clock = basic::Clock::system());
  ~BuildService();

  /// Create a service, opening the store named by the configuration.
  static llvm::Expected<std::unique_ptr<BuildService>>
  create(const ServiceConfig& config, basic::Logger& logger,
         core::BuildPlan& plan);

  const ServiceConfig& getConfig() const { return config; }
  core::JobQueue& getQueue() { return *queue; }
  core::ArtifactCache& getArtifactCache() { return cache; }
  core::BuildLifecycle& getLifecycle() { return *lifecycle; }
  basic::ExecutionQueue& getExecutionQueue() { return *executionQueue; }
  core::InMemoryCancellationRegistry& getCancellationRegistry() {
    return cancellation;
  }
  core::BuildStore& getStore() { return *store; }

  /// Register a notifier for terminal build events (does not take ownership).
  void addNotifier(core::BuildNotifier* notifier);

  /// @name Submission
  /// @{

  /// Validate a specification and admit a job building it.
  ///
  /// Fails with \see basic::errc::invalid_spec or
  /// \see basic::errc::quota_exceeded.
  ///
  /// \returns The job identifier, which is also the build identifier.
  llvm::Expected<std::string> submit(StringRef specText,
                                     StringRef tenantKey = "",
                                     core::Tier tier = core::Tier::Free);

  /// Queue a dead-lettered job again.
  llvm::Error resubmitDeadLettered(StringRef jobID);

  /// @}

  /// @name Queries
  /// @{

  /// Get the status of a job, falling back to the store for jobs the queue
  /// no longer retains.
  llvm::Expected<core::JobStatus> getJobStatus(StringRef jobID);

  /// Get the current phase of a build, if it is known, falling back to the
  /// store for builds which are no longer retained.
  ///
  /// A retried job reuses its build identifier, so the phase of a failed
  /// build goes back to pending when the next attempt starts.
  Optional<core::BuildPhase> getBuildPhase(StringRef buildID);

  Optional<core::BuildRecord> getBuildRecord(StringRef buildID);

  std::vector<core::DeadLetterRecord> getDeadLetters();

  core::JobQueueStats getQueueStats();

  /// @}

  /// Request cancellation of a build, whether it is queued or running.
  ///
  /// \returns True if this call set the cancellation flag.
  bool requestCancellation(StringRef buildID);

  /// Start the worker threads.
  void start();

  /// Take one job, if one can be dispatched now, and run it on the calling
  /// thread.
  ///
  /// \returns True if a job was run.
  bool runOnce();

  /// Run one dequeued job to completion and report its result.
  void processJob(const core::Job& job);

  /// Block until the queue is idle.
  void waitUntilIdle();

  /// Stop dispatching and join the workers, after they finish their current
  /// builds.
  void stop();

  /// Stop dispatching, cancel the running builds and join the workers.
  ///
  /// Steps which have not started are dropped, also those of builds started
  /// concurrently with the call. The service runs no further builds.
  void abort();
};

}
}

#endif
