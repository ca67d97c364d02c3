//===-- BuildService.cpp --------------------------------------------------===//
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

#include "forgeline/Service/BuildService.h"

#include "forgeline/Basic/Defer.h"
#include "forgeline/Basic/Errors.h"
#include "forgeline/Basic/PlatformUtility.h"
#include "forgeline/Core/BuildSpec.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/FormatVariadic.h"

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;
using namespace forgeline::service;

BuildService::BuildService(const ServiceConfig& config, Logger& logger,
                           BuildPlan& plan, std::unique_ptr<BuildStore> store,
                           Clock::Source clock)
  : config(config), logger(logger), plan(plan), clock(clock),
    store(std::move(store)), cache(clock), executionDelegate(logger)
{
  if (!this->store)
    this->store = createInMemoryBuildStore();

  if (config.lanes == 1 && config.laneOrder == SchedulerAlgorithm::FIFO) {
    executionQueue = createSerialQueue(executionDelegate);
  } else {
    executionQueue = createLaneBasedExecutionQueue(
        executionDelegate, config.lanes, config.laneOrder);
  }
  scheduler.reset(new StepScheduler(*executionQueue, logger, this));

  LifecycleOptions lifecycleOptions;
  lifecycleOptions.maxConcurrency = config.maxConcurrency;
  lifecycleOptions.cacheTTL = config.cacheTTL;
  lifecycle.reset(new BuildLifecycle(*scheduler, cancellation, &cache,
                                     this->store.get(), logger,
                                     lifecycleOptions, nullptr, clock));

  queue.reset(new JobQueue(config.queue, logger, this->store.get(), this,
                           clock));
}

BuildService::~BuildService() {
  stop();
}

llvm::Expected<std::unique_ptr<BuildService>>
BuildService::create(const ServiceConfig& config, Logger& logger,
                     BuildPlan& plan) {
  std::unique_ptr<BuildStore> store;
  if (!config.storePath.empty()) {
    std::string error;
    store = createSQLiteBuildStore(config.storePath, &error);
    if (!store) {
      return makeError(errc::invalid_config,
                       "unable to open store '" + config.storePath + "': " +
                       error);
    }
  }

  return std::unique_ptr<BuildService>(
      new BuildService(config, logger, plan, std::move(store)));
}

void BuildService::addNotifier(BuildNotifier* notifier) {
  std::lock_guard<std::mutex> lock(notifiersMutex);
  notifiers.push_back(notifier);
}

void BuildService::notify(const BuildEvent& event) {
  std::vector<BuildNotifier*> targets;
  {
    std::lock_guard<std::mutex> lock(notifiersMutex);
    targets = notifiers;
  }
  for (auto notifier: targets)
    notifier->buildFinished(event);
}

llvm::Expected<std::string> BuildService::submit(StringRef specText,
                                                 StringRef tenantKey,
                                                 Tier tier) {
  // Specifications are schema checked at admission, and queued in their
  // canonical form.
  auto spec = BuildSpec::parse(specText);
  if (!spec)
    return spec.takeError();

  JobSubmission submission;
  submission.spec = spec->canonicalText();
  submission.tenantKey = tenantKey.str();
  submission.tier = tier;
  return queue->submit(submission);
}

llvm::Error BuildService::resubmitDeadLettered(StringRef jobID) {
  return queue->resubmitDeadLettered(jobID);
}

llvm::Expected<JobStatus> BuildService::getJobStatus(StringRef jobID) {
  auto status = queue->getStatus(jobID);
  if (status)
    return status;

  llvm::Error error = status.takeError();
  if (errorCodeOf(error) != errc::unknown_job)
    return std::move(error);

  // Jobs no longer retained by the queue may still have a stored record.
  Job job;
  std::string storeError;
  if (!store->loadJob(jobID, &job, &storeError)) {
    if (!storeError.empty())
      logger.warning(LoggingContext("", jobID),
                     "unable to load job: " + storeError);
    return std::move(error);
  }
  llvm::consumeError(std::move(error));

  JobStatus result;
  result.state = job.state;
  result.attempts = job.attempts;
  result.reason = job.lastError;
  return result;
}

Optional<BuildPhase> BuildService::getBuildPhase(StringRef buildID) {
  if (auto phase = lifecycle->getBuildPhase(buildID))
    return phase;

  BuildPhase phase;
  std::string error;
  if (store->loadBuildPhase(buildID, &phase, &error))
    return phase;
  if (!error.empty())
    logger.warning(LoggingContext(buildID),
                   "unable to load build phase: " + error);
  return None;
}

Optional<BuildRecord> BuildService::getBuildRecord(StringRef buildID) {
  return lifecycle->getBuildRecord(buildID);
}

std::vector<DeadLetterRecord> BuildService::getDeadLetters() {
  return queue->getDeadLetters();
}

JobQueueStats BuildService::getQueueStats() {
  return queue->getStats();
}

bool BuildService::requestCancellation(StringRef buildID) {
  return lifecycle->requestCancellation(buildID);
}

void BuildService::jobRetryScheduled(const Job& job, double delaySeconds) {
  std::string error;
  if (!store->appendLog(job.id, llvm::formatv("attempt {0} failed, retrying "
                                              "in {1}s: {2}", job.attempts,
                                              delaySeconds, job.lastError)
                        .str(), &error)) {
    logger.warning(LoggingContext(job.id),
                   "unable to persist build log: " + error);
  }
}

void BuildService::jobDeadLettered(const Job& job,
                                   const DeadLetterRecord& record) {
  std::string error;
  if (!store->appendLog(job.id, "dead-lettered: " + record.reason, &error)) {
    logger.warning(LoggingContext(job.id),
                   "unable to persist build log: " + error);
  }
}

void BuildService::jobRetired(StringRef jobID) {
  lifecycle->forgetBuild(jobID);
}

void BuildService::stepStarted(StringRef buildID, StringRef stepID) {
  std::string error;
  if (!store->appendLog(buildID, "step '" + stepID.str() + "' started",
                        &error)) {
    logger.warning(LoggingContext(buildID),
                   "unable to persist build log: " + error);
  }
}

void BuildService::stepFinished(StringRef buildID, const StepResult& result) {
  std::string message = "step '" + result.id + "' " +
    getStepStatusName(result.status).str();
  if (result.status == StepStatus::Failed)
    message += ": " + result.error;

  std::string error;
  if (!store->appendLog(buildID, message, &error)) {
    logger.warning(LoggingContext(buildID),
                   "unable to persist build log: " + error);
  }
}

void BuildService::processJob(const Job& job) {
  // The queue must always receive a terminal report for the job.
  bool reported = false;
  forgeline_defer {
    if (reported)
      return;
    auto state = queue->reportResult(job.id, false,
                                     "worker exited without a result");
    if (!state) {
      logger.error(LoggingContext(job.id),
                   "unable to report result: " +
                   llvm::toString(state.takeError()));
    }
  };

  BuildRecord record = lifecycle->run(job, plan);

  BuildEvent event;
  event.buildID = record.buildID;
  event.jobID = job.id;
  event.artifacts = record.artifacts;
  event.durationSeconds = record.getDuration();

  bool retryable = true;
  if (record.succeeded()) {
    event.status = BuildEventStatus::Completed;
  } else if (record.cancelled()) {
    // Cancelled builds are never retried.
    retryable = false;
    event.status = BuildEventStatus::Cancelled;
    event.reason = record.failureReason;
  } else {
    event.status = BuildEventStatus::Failed;
    event.reason = record.failureReason;
  }

  auto state = queue->reportResult(job.id, record.succeeded(),
                                   record.failureReason, retryable);
  reported = true;

  if (!state) {
    logger.error(LoggingContext(job.id),
                 "unable to report result: " +
                 llvm::toString(state.takeError()));
    return;
  }
  if (*state == JobState::DeadLettered)
    event.status = BuildEventStatus::DeadLettered;

  notify(event);
}

bool BuildService::runOnce() {
  auto job = queue->tryDequeue();
  if (!job)
    return false;
  processJob(*job);
  return true;
}

void BuildService::workerLoop(unsigned index) {
  sys::setCurrentThreadName("fl-worker-" + Twine(index));

  while (auto job = queue->dequeue())
    processJob(*job);
}

void BuildService::start() {
  if (started)
    return;
  started = true;

  logger.note(LoggingContext(),
              llvm::formatv("starting {0} workers", config.workers));
  for (unsigned i = 0; i != config.workers; ++i)
    workers.emplace_back(&BuildService::workerLoop, this, i);
}

void BuildService::waitUntilIdle() {
  queue->waitUntilIdle();
}

void BuildService::abort() {
  queue->shutdown();

  for (const auto& buildID: lifecycle->getRunningBuildIDs())
    lifecycle->requestCancellation(buildID);
  logger.warning(LoggingContext(), "aborting, dropping steps not yet started");
  executionQueue->cancelAllJobs();

  stop();
}

void BuildService::stop() {
  queue->shutdown();
  for (auto& worker: workers)
    worker.join();
  workers.clear();
}
