//===- StepScheduler.h ------------------------------------------*- C++ -*-===//
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
// This file defines the scheduler which runs the dependency graph of steps
// making up one phase of a build.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_CORE_STEPSCHEDULER_H
#define FORGELINE_CORE_STEPSCHEDULER_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/LLVM.h"
#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/Job.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace forgeline {
namespace basic {
  class ExecutionQueue;
}

namespace core {

class CancellationRegistry;

/// The context a step runs in.
///
/// A context is only used by the step it was created for, but the
/// cancellation state it reports may change concurrently.
class StepContext {
  std::string buildID;
  std::string stepID;
  const CancellationRegistry* cancellation;
  basic::Logger& logger;
  const TierLimits& limits;
  unsigned laneID;

  std::vector<std::string> artifacts;

  // DO NOT COPY
  StepContext(const StepContext&) FORGELINE_DELETED_FUNCTION;
  void operator=(const StepContext&) FORGELINE_DELETED_FUNCTION;

public:
  StepContext(StringRef buildID, StringRef stepID,
              const CancellationRegistry* cancellation, basic::Logger& logger,
              const TierLimits& limits, unsigned laneID)
    : buildID(buildID), stepID(stepID), cancellation(cancellation),
      logger(logger), limits(limits), laneID(laneID) {}

  StringRef getBuildID() const { return buildID; }
  StringRef getStepID() const { return stepID; }

  /// Check whether the build was cancelled.
  ///
  /// Long running steps should poll this and stop their own work (and any
  /// subprocess they spawned) when it becomes true; the scheduler never
  /// interrupts a running step.
  bool isCancelled() const;

  /// The resource limits the step should impose on the work it launches.
  const TierLimits& getTierLimits() const { return limits; }

  /// The execution lane the step is running on.
  unsigned getLaneID() const { return laneID; }

  basic::Logger& getLogger() { return logger; }

  /// Log a message on behalf of the step.
  void log(basic::LogLevel level, const Twine& message);

  /// Record an artifact produced by the step.
  void addArtifact(StringRef artifactRef) {
    artifacts.push_back(artifactRef.str());
  }

  const std::vector<std::string>& getArtifacts() const { return artifacts; }
  std::vector<std::string> takeArtifacts() { return std::move(artifacts); }
};

/// The work of a step. Returning an error fails the step.
///
/// Actions run on execution lanes and must report failures through the
/// returned error; an exception escaping an action terminates the process.
typedef std::function<llvm::Error(StepContext&)> StepAction;

/// A node in the step graph.
struct StepDescription {
  /// The step identifier, unique within one execution.
  std::string id;

  /// The identifiers of the steps which must complete first.
  std::vector<std::string> dependencies;

  /// The relative cost of the step; heavier ready steps are launched first.
  unsigned weight = 1;

  /// The work to perform. An empty action completes immediately.
  StepAction action;

  StepDescription() {}
  StepDescription(StringRef id, std::vector<std::string> dependencies,
                  StepAction action, unsigned weight = 1)
    : id(id), dependencies(std::move(dependencies)), weight(weight),
      action(std::move(action)) {}
};

enum class StepStatus : uint8_t {
  Pending = 0,
  Running,
  Completed,
  Failed
};

StringRef getStepStatusName(StepStatus status);

/// The state of a step at the end of an execution.
struct StepResult {
  std::string id;
  StepStatus status = StepStatus::Pending;

  /// When the step started running.
  basic::Clock::Timestamp startedAt = 0;

  /// How long the step ran, in seconds.
  double duration = 0;

  /// The failure message, set iff the step failed.
  std::string error;

  /// The artifacts the step recorded.
  std::vector<std::string> artifacts;
};

struct ExecutionResult {
  enum class Outcome {
    /// Every step completed.
    Succeeded,

    /// At least one step failed and every remaining step terminated.
    StepFailed,

    /// Some steps can never run, because of a cycle or a failed dependency.
    Deadlocked,

    /// Cancellation was observed before all steps ran.
    Cancelled,

    /// The step graph or the options were malformed; no step was run.
    InvalidGraph
  };

  Outcome outcome = Outcome::Succeeded;

  /// The wall time of the execution, in seconds.
  double totalDuration = 0;

  /// The per step results, in the order the steps were given.
  std::vector<StepResult> steps;

  /// The step identifiers, in the order the steps were launched.
  std::vector<std::string> launchOrder;

  /// A human readable explanation of an unsuccessful outcome.
  std::string diagnostic;

  bool success() const { return outcome == Outcome::Succeeded; }

  /// Get the artifacts of all steps, in step order.
  std::vector<std::string> getArtifacts() const;

  /// Get the result for a step, or null if there is no such step.
  const StepResult* getStep(StringRef id) const;
};

StringRef getOutcomeName(ExecutionResult::Outcome outcome);

/// Observer of step transitions.
///
/// Callbacks arrive on the scheduler thread (for \see stepStarted) and on
/// execution lanes (for \see stepFinished), and must be thread safe.
class StepSchedulerDelegate {
public:
  virtual ~StepSchedulerDelegate();

  /// Called when a step transitions to running, before its work is queued.
  virtual void stepStarted(StringRef buildID, StringRef stepID) = 0;

  /// Called when a step terminates.
  virtual void stepFinished(StringRef buildID, const StepResult& result) = 0;
};

struct StepExecutionOptions {
  /// The build the steps belong to, used for cancellation and logging.
  std::string buildID;

  /// The maximum number of steps running at once, must be at least 1.
  unsigned maxConcurrency = 4;

  /// The registry consulted before each scheduling tick, if any.
  const CancellationRegistry* cancellation = nullptr;

  /// The tier whose limits are handed to the steps.
  Tier tier = Tier::Free;
};

/// Runs a graph of steps with bounded concurrency.
///
/// Launched steps run as jobs of an execution queue, the scheduler itself only
/// decides which steps to launch and then waits for one of them to finish. No
/// scheduler lock is held while a step runs.
class StepScheduler {
  basic::ExecutionQueue& queue;
  basic::Logger& logger;
  StepSchedulerDelegate* delegate;

public:
  /// \param queue The queue running the launched steps. Its lane count should
  /// be at least the largest concurrency used, otherwise the effective bound is
  /// the lane count.
  StepScheduler(basic::ExecutionQueue& queue, basic::Logger& logger,
                StepSchedulerDelegate* delegate = nullptr)
    : queue(queue), logger(logger), delegate(delegate) {}

  /// Run the steps until every step terminated, no further progress is
  /// possible, or cancellation is observed.
  ///
  /// At each tick the ready steps (pending, with every dependency completed)
  /// are launched heaviest first, up to the concurrency bound. A failed step
  /// does not stop its running siblings, but its dependents never become
  /// ready, which is reported as a deadlock naming them. Once cancellation is
  /// observed no further step is launched; the call returns after the running
  /// steps finish.
  ExecutionResult execute(std::vector<StepDescription> steps,
                          const StepExecutionOptions& options);
};

}
}

#endif
