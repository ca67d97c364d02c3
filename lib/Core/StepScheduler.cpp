//===-- StepScheduler.cpp -------------------------------------------------===//
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

#include "forgeline/Core/StepScheduler.h"

#include "forgeline/Basic/ExecutionQueue.h"
#include "forgeline/Core/CancellationRegistry.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <condition_variable>
#include <memory>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;

bool StepContext::isCancelled() const {
  return cancellation && cancellation->isCancelled(buildID);
}

void StepContext::log(LogLevel level, const Twine& message) {
  logger.log(level, LoggingContext(buildID), "[" + stepID + "] " + message);
}

StepSchedulerDelegate::~StepSchedulerDelegate() { }

StringRef core::getStepStatusName(StepStatus status) {
  switch (status) {
  case StepStatus::Pending: return "pending";
  case StepStatus::Running: return "running";
  case StepStatus::Completed: return "completed";
  case StepStatus::Failed: return "failed";
  }
  return "<unknown>";
}

StringRef core::getOutcomeName(ExecutionResult::Outcome outcome) {
  switch (outcome) {
  case ExecutionResult::Outcome::Succeeded: return "succeeded";
  case ExecutionResult::Outcome::StepFailed: return "step-failed";
  case ExecutionResult::Outcome::Deadlocked: return "deadlocked";
  case ExecutionResult::Outcome::Cancelled: return "cancelled";
  case ExecutionResult::Outcome::InvalidGraph: return "invalid-graph";
  }
  return "<unknown>";
}

std::vector<std::string> ExecutionResult::getArtifacts() const {
  std::vector<std::string> result;
  for (const auto& step: steps)
    result.insert(result.end(), step.artifacts.begin(), step.artifacts.end());
  return result;
}

const StepResult* ExecutionResult::getStep(StringRef id) const {
  for (const auto& step: steps) {
    if (step.id == id)
      return &step;
  }
  return nullptr;
}

namespace {

/// The descriptor of a launched step, as seen by the execution queue.
class StepJobDescriptor : public JobDescriptor {
  std::string buildID;
  std::string stepID;

public:
  StepJobDescriptor(StringRef buildID, StringRef stepID)
    : buildID(buildID), stepID(stepID) {}

  StringRef getOrdinalName() const override { return stepID; }

  void getDescription(SmallVectorImpl<char>& result) const override {
    llvm::raw_svector_ostream(result) << "step '" << stepID << "' of build '"
                                      << buildID << "'";
  }
};

/// The shared state of one execution.
///
/// Launched jobs hold a reference to the state, so that it outlives the
/// last step even if the queue reports on it after the scheduler returned.
struct ExecutionState {
  std::vector<StepDescription> steps;
  std::vector<StepResult> results;
  std::vector<std::unique_ptr<StepJobDescriptor>> descriptors;

  /// The indices of each step's dependencies.
  std::vector<std::vector<size_t>> dependencyIndices;

  /// The number of steps currently running.
  unsigned numRunning = 0;

  /// The number of steps which terminated.
  size_t numFinished = 0;

  std::mutex stateMutex;
  std::condition_variable finishedCondition;
};

/// Validate the graph, filling in the dependency indices.
bool validateGraph(ExecutionState& state, const StepExecutionOptions& options,
                   std::string* error_out) {
  if (options.maxConcurrency < 1) {
    *error_out = "maximum concurrency must be at least 1";
    return false;
  }

  llvm::StringMap<size_t> indices;
  for (size_t i = 0; i != state.steps.size(); ++i) {
    const auto& step = state.steps[i];
    if (step.id.empty()) {
      *error_out = "step " + std::to_string(i) + " has no identifier";
      return false;
    }
    if (step.weight < 1) {
      *error_out = "step '" + step.id + "' must have a positive weight";
      return false;
    }
    if (!indices.insert({ step.id, i }).second) {
      *error_out = "duplicate step '" + step.id + "'";
      return false;
    }
  }

  state.dependencyIndices.resize(state.steps.size());
  for (size_t i = 0; i != state.steps.size(); ++i) {
    for (const auto& dependency: state.steps[i].dependencies) {
      auto it = indices.find(dependency);
      if (it == indices.end()) {
        *error_out = "step '" + state.steps[i].id +
          "' depends on unknown step '" + dependency + "'";
        return false;
      }
      state.dependencyIndices[i].push_back(it->second);
    }
  }

  return true;
}

bool isReady(const ExecutionState& state, size_t index) {
  if (state.results[index].status != StepStatus::Pending)
    return false;
  for (size_t dependency: state.dependencyIndices[index]) {
    if (state.results[dependency].status != StepStatus::Completed)
      return false;
  }
  return true;
}

/// Describe the steps which can never run.
std::string describeDeadlock(const ExecutionState& state) {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << "deadlock: no step can make progress; pending steps:";
  for (size_t i = 0; i != state.steps.size(); ++i) {
    if (state.results[i].status != StepStatus::Pending)
      continue;
    os << " '" << state.steps[i].id << "' (waiting on";
    bool first = true;
    for (size_t dependency: state.dependencyIndices[i]) {
      auto status = state.results[dependency].status;
      if (status == StepStatus::Completed)
        continue;
      os << (first ? " " : ", ") << "'" << state.steps[dependency].id
         << "' [" << getStepStatusName(status) << "]";
      first = false;
    }
    os << ")";
  }
  os.flush();
  return result;
}

}

ExecutionResult StepScheduler::execute(std::vector<StepDescription> steps,
                                       const StepExecutionOptions& options) {
  ExecutionResult result;
  auto startTime = Clock::now();
  LoggingContext logContext(options.buildID);
  const TierLimits& limits = getTierLimits(options.tier);

  auto state = std::make_shared<ExecutionState>();
  state->steps = std::move(steps);
  state->results.resize(state->steps.size());
  for (size_t i = 0; i != state->steps.size(); ++i)
    state->results[i].id = state->steps[i].id;

  std::string error;
  if (!validateGraph(*state, options, &error)) {
    logger.error(logContext, "invalid step graph: " + error);
    result.outcome = ExecutionResult::Outcome::InvalidGraph;
    result.diagnostic = error;
    result.steps = state->results;
    return result;
  }

  auto finishStep = [this, state, buildID = options.buildID](
      size_t index, Clock::Timestamp startedAt, llvm::Error error,
      std::vector<std::string> artifacts) {
    StepResult finished;
    {
      std::lock_guard<std::mutex> lock(state->stateMutex);
      auto& stepResult = state->results[index];
      stepResult.duration = Clock::now() - startedAt;
      stepResult.artifacts = std::move(artifacts);
      if (error) {
        stepResult.status = StepStatus::Failed;
        stepResult.error = llvm::toString(std::move(error));
      } else {
        stepResult.status = StepStatus::Completed;
      }
      finished = stepResult;
    }

    if (finished.status == StepStatus::Failed) {
      logger.error(LoggingContext(buildID),
                   "step '" + finished.id + "' failed: " + finished.error);
    } else {
      logger.debug(LoggingContext(buildID),
                   "step '" + finished.id + "' completed");
    }
    if (delegate)
      delegate->stepFinished(buildID, finished);

    // Only release the step after its result is visible, so a dependent is
    // never launched before it.
    std::lock_guard<std::mutex> lock(state->stateMutex);
    --state->numRunning;
    ++state->numFinished;
    state->finishedCondition.notify_all();
  };

  bool cancelled = false;
  std::unique_lock<std::mutex> lock(state->stateMutex);
  while (true) {
    // Steps which terminate from here on are observed by the wait below.
    size_t numFinished = state->numFinished;

    // Check for cancellation before each tick.
    if (!cancelled && options.cancellation &&
        options.cancellation->isCancelled(options.buildID)) {
      cancelled = true;
      logger.note(logContext, "cancellation observed, no further steps "
                  "will be started");
    }

    std::vector<size_t> launched;
    if (!cancelled) {
      std::vector<size_t> ready;
      for (size_t i = 0; i != state->steps.size(); ++i) {
        if (isReady(*state, i))
          ready.push_back(i);
      }

      // Launch the heaviest steps first.
      std::stable_sort(ready.begin(), ready.end(), [&](size_t a, size_t b) {
          return state->steps[a].weight > state->steps[b].weight;
        });

      for (size_t index: ready) {
        if (state->numRunning >= options.maxConcurrency)
          break;
        auto& stepResult = state->results[index];
        stepResult.status = StepStatus::Running;
        stepResult.startedAt = Clock::now();
        ++state->numRunning;
        result.launchOrder.push_back(state->steps[index].id);
        launched.push_back(index);
      }
    }

    if (state->numRunning == 0) {
      // No step is running and none could be launched, the execution is over.
      break;
    }

    // Hand the launched steps to the execution queue, without holding the
    // lock since the queue may call back into us.
    if (!launched.empty()) {
      lock.unlock();
      // Steps launched together are all reported before any of them runs.
      for (size_t index: launched) {
        const auto& step = state->steps[index];
        if (delegate)
          delegate->stepStarted(options.buildID, step.id);
        logger.debug(logContext, "starting step '" + step.id + "'");
      }
      for (size_t index: launched) {
        const auto& step = state->steps[index];
        state->descriptors.emplace_back(
            new StepJobDescriptor(options.buildID, step.id));
        auto startedAt = state->results[index].startedAt;
        auto cancellation = options.cancellation;
        auto buildID = options.buildID;
        QueueJob job{ state->descriptors.back().get(),
          [this, state, index, startedAt, cancellation, buildID, &limits,
           finishStep](QueueJobContext* context) {
            const auto& step = state->steps[index];
            StepContext stepContext(buildID, step.id, cancellation, logger,
                                    limits, context->laneID());
            llvm::Error error = llvm::Error::success();
            if (step.action)
              error = step.action(stepContext);
            finishStep(index, startedAt, std::move(error),
                       stepContext.takeArtifacts());
          },
          [state, index, startedAt, finishStep]() {
            finishStep(index, startedAt,
                       llvm::make_error<llvm::StringError>(
                           "step was dropped before it started",
                           llvm::inconvertibleErrorCode()),
                       {});
          }};
        queue.addJob(job);
      }
      lock.lock();
    }

    // Wait for at least one running step to terminate.
    state->finishedCondition.wait(lock, [&]() {
        return state->numFinished != numFinished;
      });
  }

  result.steps = state->results;
  lock.unlock();

  result.totalDuration = Clock::now() - startTime;

  bool anyFailed = false, anyPending = false;
  for (const auto& step: result.steps) {
    anyFailed |= step.status == StepStatus::Failed;
    anyPending |= step.status == StepStatus::Pending;
  }

  if (cancelled && anyPending) {
    result.outcome = ExecutionResult::Outcome::Cancelled;
    result.diagnostic = "Cancelled";
  } else if (anyPending) {
    result.outcome = ExecutionResult::Outcome::Deadlocked;
    lock.lock();
    result.diagnostic = describeDeadlock(*state);
    lock.unlock();
    logger.error(logContext, result.diagnostic);
  } else if (anyFailed) {
    result.outcome = ExecutionResult::Outcome::StepFailed;
    for (const auto& step: result.steps) {
      if (step.status != StepStatus::Failed)
        continue;
      if (!result.diagnostic.empty())
        result.diagnostic += "; ";
      result.diagnostic += "step '" + step.id + "' failed: " + step.error;
    }
  } else {
    result.outcome = ExecutionResult::Outcome::Succeeded;
  }

  return result;
}
