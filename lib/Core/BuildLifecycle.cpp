//===-- BuildLifecycle.cpp ------------------------------------------------===//
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

#include "forgeline/Core/BuildLifecycle.h"

#include "forgeline/Basic/Defer.h"
#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/BuildStore.h"
#include "forgeline/Core/CancellationRegistry.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"

#include <cassert>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;

BuildPlan::~BuildPlan() { }

BuildLifecycleDelegate::~BuildLifecycleDelegate() { }

StringRef core::getBuildFailureKindName(BuildFailureKind kind) {
  switch (kind) {
  case BuildFailureKind::None: return "none";
  case BuildFailureKind::InvalidSpec: return "invalid-spec";
  case BuildFailureKind::InvalidGraph: return "invalid-graph";
  case BuildFailureKind::StepFailed: return "step-failed";
  case BuildFailureKind::Deadlocked: return "deadlocked";
  case BuildFailureKind::Cancelled: return "cancelled";
  }
  return "<unknown>";
}

/// The phases which carry a unit of work, in order.
static const BuildPhase WorkPhases[] = {
  BuildPhase::Parsing,
  BuildPhase::Validating,
  BuildPhase::Resolving,
  BuildPhase::Generating,
  BuildPhase::Building,
  BuildPhase::ArtifactGenerating,
  BuildPhase::Uploading,
};

void BuildLifecycle::publish(const BuildRecord& record) {
  std::lock_guard<std::mutex> lock(recordsMutex);
  BuildRecord& stored = records[record.buildID];
  bool cancelRequested = stored.cancelRequested;
  stored = record;
  stored.cancelRequested |= cancelRequested;
}

void BuildLifecycle::persistLog(StringRef buildID, const Twine& message) {
  if (!store)
    return;

  std::string error;
  if (!store->appendLog(buildID, message.str(), &error)) {
    logger.warning(LoggingContext(buildID),
                   "unable to persist build log: " + error);
  }
}

void BuildLifecycle::transition(BuildRecord& record, BuildPhase to) {
  BuildPhase from = record.phase;
  assert(isValidPhaseTransition(from, to) && "invalid phase transition");

  record.phase = to;
  if (isTerminalPhase(to))
    record.finishedAt = clock();
  publish(record);

  logger.note(LoggingContext(record.buildID, record.jobID),
              "phase " + getBuildPhaseName(from) + " -> " +
              getBuildPhaseName(to));

  // A persistence failure never changes the outcome of the build.
  if (store) {
    std::string error;
    if (!store->saveBuildPhase(record.buildID, to, &error)) {
      logger.warning(LoggingContext(record.buildID, record.jobID),
                     "unable to persist build phase: " + error);
    }
  }
  persistLog(record.buildID, "entered phase " + getBuildPhaseName(to));

  if (delegate)
    delegate->phaseChanged(record.buildID, from, to);
}

void BuildLifecycle::fail(BuildRecord& record, BuildFailureKind kind,
                          const Twine& reason) {
  record.failureKind = kind;
  record.failedPhase = record.phase;
  record.failureReason = reason.str();

  if (kind == BuildFailureKind::Cancelled) {
    logger.note(LoggingContext(record.buildID, record.jobID),
                "build cancelled in phase " +
                getBuildPhaseName(record.phase));
  } else {
    logger.error(LoggingContext(record.buildID, record.jobID),
                 llvm::formatv("build failed in phase {0} ({1}): {2}",
                               getBuildPhaseName(record.phase),
                               getBuildFailureKindName(kind),
                               record.failureReason));
  }
  persistLog(record.buildID, "build failed: " + record.failureReason);

  transition(record, BuildPhase::Failed);
}

bool BuildLifecycle::runPhase(BuildRecord& record, BuildContext& context,
                              BuildPlan& plan, Tier tier) {
  std::vector<StepDescription> steps = plan.getSteps(record.phase, context);
  if (steps.empty())
    return true;

  StepExecutionOptions stepOptions;
  stepOptions.buildID = record.buildID;
  stepOptions.maxConcurrency = options.maxConcurrency;
  stepOptions.cancellation = &cancellation;
  stepOptions.tier = tier;
  ExecutionResult result = scheduler.execute(std::move(steps), stepOptions);

  for (auto& artifact: result.getArtifacts())
    context.artifacts.push_back(artifact);
  record.artifacts = context.artifacts;

  // A step which stopped because of cancellation fails like any other step,
  // the build still ends as cancelled.
  if (result.outcome != ExecutionResult::Outcome::Succeeded &&
      result.outcome != ExecutionResult::Outcome::InvalidGraph &&
      cancellation.isCancelled(record.buildID))
    result.outcome = ExecutionResult::Outcome::Cancelled;

  switch (result.outcome) {
  case ExecutionResult::Outcome::Succeeded:
    return true;
  case ExecutionResult::Outcome::Cancelled:
    record.cancelRequested = true;
    fail(record, BuildFailureKind::Cancelled, "Cancelled");
    return false;
  case ExecutionResult::Outcome::Deadlocked:
    fail(record, BuildFailureKind::Deadlocked, result.diagnostic);
    return false;
  case ExecutionResult::Outcome::StepFailed:
    fail(record, BuildFailureKind::StepFailed, result.diagnostic);
    return false;
  case ExecutionResult::Outcome::InvalidGraph:
    fail(record, BuildFailureKind::InvalidGraph,
         "invalid step graph: " + result.diagnostic);
    return false;
  }
  return false;
}

BuildRecord BuildLifecycle::run(const Job& job, BuildPlan& plan) {
  BuildRecord record;
  record.buildID = job.id;
  record.jobID = job.id;
  record.startedAt = clock();
  publish(record);

  LoggingContext logContext(record.buildID, record.jobID);
  if (store) {
    std::string error;
    if (!store->saveBuildPhase(record.buildID, record.phase, &error)) {
      logger.warning(logContext, "unable to persist build phase: " + error);
    }
  }

  BuildContext context;
  context.buildID = record.buildID;
  context.jobID = record.jobID;
  context.tier = job.tier;

  // Cleanup is best effort and runs however the build ends.
  bool started = false;
  forgeline_defer {
    if (started)
      plan.cleanup(context);
  };

  // The number of artifacts produced before uploading, which are the ones
  // worth caching.
  size_t numBuildArtifacts = 0;

  for (BuildPhase phase: WorkPhases) {
    if (record.cacheHit && (phase == BuildPhase::Building ||
                            phase == BuildPhase::ArtifactGenerating))
      continue;

    if (cancellation.isCancelled(record.buildID)) {
      record.cancelRequested = true;
      fail(record, BuildFailureKind::Cancelled, "Cancelled");
      break;
    }

    if (phase == BuildPhase::Building && cache) {
      if (auto cached = cache->lookup(context.specHash)) {
        SmallVector<StringRef, 4> artifacts;
        StringRef(*cached).split(artifacts, '\n', -1, /*KeepEmpty=*/false);
        for (StringRef artifact: artifacts)
          context.artifacts.push_back(artifact.str());
        record.artifacts = context.artifacts;
        record.cacheHit = true;
        numBuildArtifacts = context.artifacts.size();
        logger.note(logContext, "artifact cache hit for " + context.specHash +
                    ", skipping build");
        persistLog(record.buildID, "artifact cache hit, skipping build");
        continue;
      }
    }

    if (phase == BuildPhase::Uploading && !record.cacheHit)
      numBuildArtifacts = context.artifacts.size();

    transition(record, phase);

    if (phase == BuildPhase::Parsing) {
      auto spec = BuildSpec::parse(job.spec);
      if (!spec) {
        fail(record, BuildFailureKind::InvalidSpec,
             llvm::toString(spec.takeError()));
        break;
      }
      context.spec = std::move(*spec);
      context.specHash = context.spec.hash();
      started = true;
    }

    if (!runPhase(record, context, plan, job.tier))
      break;
  }

  if (!isTerminalPhase(record.phase)) {
    transition(record, BuildPhase::Complete);

    if (cache && !record.cacheHit && numBuildArtifacts != 0) {
      std::vector<std::string> built(context.artifacts.begin(),
                                     context.artifacts.begin() +
                                     numBuildArtifacts);
      cache->store(context.specHash, llvm::join(built, "\n"),
                   options.cacheTTL);
    }
    logger.note(logContext,
                llvm::formatv("build complete with {0} artifacts in {1}s",
                              record.artifacts.size(), record.getDuration()));
  }

  return record;
}

bool BuildLifecycle::requestCancellation(StringRef buildID) {
  {
    std::lock_guard<std::mutex> lock(recordsMutex);
    auto it = records.find(buildID);
    if (it != records.end())
      it->second.cancelRequested = true;
  }

  bool first = cancellation.request(buildID);
  if (first)
    logger.note(LoggingContext(buildID), "cancellation requested");
  return first;
}

Optional<BuildPhase> BuildLifecycle::getBuildPhase(StringRef buildID) {
  std::lock_guard<std::mutex> lock(recordsMutex);
  auto it = records.find(buildID);
  if (it == records.end())
    return None;
  return it->second.phase;
}

Optional<BuildRecord> BuildLifecycle::getBuildRecord(StringRef buildID) {
  std::lock_guard<std::mutex> lock(recordsMutex);
  auto it = records.find(buildID);
  if (it == records.end())
    return None;
  return it->second;
}

void BuildLifecycle::forgetBuild(StringRef buildID) {
  {
    std::lock_guard<std::mutex> lock(recordsMutex);
    records.erase(buildID);
  }
  cancellation.remove(buildID);
}

std::vector<std::string> BuildLifecycle::getRunningBuildIDs() {
  std::lock_guard<std::mutex> lock(recordsMutex);
  std::vector<std::string> result;
  for (const auto& entry: records) {
    if (!isTerminalPhase(entry.second.phase))
      result.push_back(entry.first().str());
  }
  return result;
}

size_t BuildLifecycle::getNumRecords() {
  std::lock_guard<std::mutex> lock(recordsMutex);
  return records.size();
}
