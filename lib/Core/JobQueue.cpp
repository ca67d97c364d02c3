//===-- JobQueue.cpp ------------------------------------------------------===//
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

#include "forgeline/Core/JobQueue.h"

#include "forgeline/Basic/Errors.h"
#include "forgeline/Basic/Hashing.h"
#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/BuildStore.h"

#include "llvm/Support/FormatVariadic.h"

#include <algorithm>
#include <chrono>
#include <cmath>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;

JobQueueDelegate::~JobQueueDelegate() { }

JobQueue::JobQueue(const JobQueueOptions& options, basic::Logger& logger,
                   BuildStore* store, JobQueueDelegate* delegate,
                   basic::Clock::Source clock)
  : options(options), logger(logger), store(store), delegate(delegate),
    clock(clock)
{
}

JobQueue::~JobQueue() {
}

unsigned JobQueue::countTenantJobs(StringRef tenantKey) const {
  unsigned count = 0;
  for (const auto& entry: jobs) {
    const Job& job = entry.getValue();
    if (job.tenantKey != tenantKey)
      continue;
    if (job.state == JobState::Queued || job.state == JobState::Active ||
        (job.state == JobState::Failed && job.readyAt != 0))
      ++count;
  }
  return count;
}

void JobQueue::enqueueLocked(Job& job) {
  job.state = JobState::Queued;
  job.readyAt = 0;
  readyJobs.insert({ { job.priority, nextSequence++ }, job.id });
  readyCondition.notify_one();
}

void JobQueue::promoteRetriesLocked(Clock::Timestamp now,
                                    std::vector<Job>& changed) {
  while (!retryingJobs.empty() && retryingJobs.begin()->first.first <= now) {
    std::string id = retryingJobs.begin()->second;
    retryingJobs.erase(retryingJobs.begin());

    auto it = jobs.find(id);
    if (it == jobs.end())
      continue;
    enqueueLocked(it->second);
    changed.push_back(it->second);
  }
}

bool JobQueue::isRateLimitedLocked(Clock::Timestamp now,
                                   Clock::Timestamp* release_out) {
  if (options.rateLimitMax == 0)
    return false;

  // Forget the dispatches which left the window.
  while (!dispatchTimes.empty() &&
         dispatchTimes.front() <= now - options.rateLimitWindow)
    dispatchTimes.pop_front();

  if (dispatchTimes.size() < options.rateLimitMax)
    return false;

  *release_out = dispatchTimes.front() + options.rateLimitWindow;
  return true;
}

Optional<Job> JobQueue::takeNextLocked(Clock::Timestamp now,
                                       std::vector<Job>& changed) {
  promoteRetriesLocked(now, changed);
  if (readyJobs.empty())
    return None;

  Clock::Timestamp release;
  if (isRateLimitedLocked(now, &release))
    return None;

  std::string id = readyJobs.begin()->second;
  readyJobs.erase(readyJobs.begin());

  Job& job = jobs[id];
  job.state = JobState::Active;
  ++numActive;
  dispatchTimes.push_back(now);
  changed.push_back(job);
  return job;
}

void JobQueue::retainFinishedLocked(StringRef jobID,
                                    std::vector<std::string>& retired) {
  finishedJobs.push_back(jobID.str());
  while (finishedJobs.size() > options.retainCompleted) {
    jobs.erase(finishedJobs.front());
    retired.push_back(std::move(finishedJobs.front()));
    finishedJobs.pop_front();
  }
}

void JobQueue::retainDeadLetteredLocked(std::vector<std::string>& retired) {
  while (deadLetters.size() > options.retainDeadLettered) {
    auto it = jobs.find(deadLetters.front().jobID);
    if (it != jobs.end() && it->second.state == JobState::DeadLettered) {
      jobs.erase(it);
      retired.push_back(deadLetters.front().jobID);
    }
    deadLetters.pop_front();
  }
}

bool JobQueue::isIdleLocked() const {
  return readyJobs.empty() && numActive == 0 && retryingJobs.empty();
}

void JobQueue::persist(const std::vector<Job>& changed) {
  if (!store)
    return;

  for (const auto& job: changed) {
    std::string error;
    if (!store->saveJobState(job, &error)) {
      logger.warning(LoggingContext(job.id),
                     "unable to persist job state: " + error);
    }
  }
}

llvm::Expected<std::string> JobQueue::submit(const JobSubmission& submission) {
  std::string id = submission.id;
  if (id.empty())
    id = generateIdentifier("job");

  Job job;
  {
    std::lock_guard<std::mutex> lock(queueMutex);

    if (isShutdown)
      return makeError(errc::shutting_down,
                       "job queue is shutting down, job '" + id +
                       "' rejected");
    if (jobs.count(id))
      return makeError(errc::duplicate_job, "job '" + id + "' already exists");

    // The quota is checked against the current queue state under the same
    // lock as the insertion.
    if (!submission.tenantKey.empty() && options.tenantQuota != 0) {
      unsigned count = countTenantJobs(submission.tenantKey);
      if (count >= options.tenantQuota) {
        return makeError(
            errc::quota_exceeded,
            llvm::formatv("tenant '{0}' already has {1} unfinished jobs "
                          "(quota {2})", submission.tenantKey, count,
                          options.tenantQuota));
      }
    }

    job.id = id;
    job.spec = submission.spec;
    job.tenantKey = submission.tenantKey;
    job.tier = submission.tier;
    job.priority = getTierPriority(submission.tier);
    job.maxAttempts = submission.maxAttempts ? submission.maxAttempts
      : std::max(1u, options.maxAttempts);
    job.submittedAt = clock();

    Job& stored = jobs[id];
    stored = job;
    enqueueLocked(stored);
    job = stored;
  }

  logger.note(LoggingContext(id),
              llvm::formatv("job queued (tier {0}, priority {1})",
                            getTierName(job.tier), job.priority));
  persist({ job });
  return id;
}

Optional<Job> JobQueue::dequeue() {
  std::vector<Job> changed;
  Optional<Job> result;
  {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (!isShutdown) {
      auto now = clock();
      result = takeNextLocked(now, changed);
      if (result)
        break;

      // Sleep until the next retry is due or, when jobs are waiting on the
      // rate limiter, until the oldest dispatch leaves the window.
      Optional<Clock::Timestamp> wakeAt;
      if (!retryingJobs.empty())
        wakeAt = retryingJobs.begin()->first.first;
      Clock::Timestamp release;
      if (!readyJobs.empty() && isRateLimitedLocked(now, &release)) {
        if (!wakeAt || release < *wakeAt)
          wakeAt = release;
      }

      if (wakeAt) {
        readyCondition.wait_until(
            lock, std::chrono::steady_clock::now() +
            Clock::toDuration(std::max(0.0, *wakeAt - now)));
      } else {
        readyCondition.wait(lock);
      }
    }
  }

  persist(changed);
  if (result) {
    logger.note(LoggingContext(result->id),
                llvm::formatv("job dispatched (attempt {0} of {1})",
                              result->attempts + 1, result->maxAttempts));
  }
  return result;
}

Optional<Job> JobQueue::tryDequeue() {
  std::vector<Job> changed;
  Optional<Job> result;
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    if (!isShutdown)
      result = takeNextLocked(clock(), changed);
  }

  persist(changed);
  if (result) {
    logger.note(LoggingContext(result->id),
                llvm::formatv("job dispatched (attempt {0} of {1})",
                              result->attempts + 1, result->maxAttempts));
  }
  return result;
}

double JobQueue::getBackoffDelay(unsigned attempts) const {
  double delay = std::ldexp(options.backoffBase,
                            attempts > 0 ? int(attempts) - 1 : 0);
  if (options.backoffCap > 0)
    delay = std::min(delay, options.backoffCap);
  return delay;
}

llvm::Expected<JobState> JobQueue::reportResult(StringRef jobID,
                                                bool success, StringRef reason,
                                                bool retryable) {
  Job job;
  double retryDelay = -1;
  Optional<DeadLetterRecord> deadLetter;
  std::vector<std::string> retired;
  {
    std::lock_guard<std::mutex> lock(queueMutex);

    auto it = jobs.find(jobID);
    if (it == jobs.end())
      return makeError(errc::unknown_job, "unknown job '" + jobID + "'");
    Job& stored = it->second;
    if (stored.state != JobState::Active)
      return makeError(errc::unknown_job, "job '" + jobID + "' is not active");

    --numActive;
    if (success) {
      stored.state = JobState::Completed;
      stored.lastError.clear();
      job = stored;
      retainFinishedLocked(jobID, retired);
    } else {
      ++stored.attempts;
      stored.lastError = reason.str();
      if (!retryable) {
        stored.state = JobState::Failed;
        job = stored;
        retainFinishedLocked(jobID, retired);
      } else if (stored.attempts < stored.maxAttempts) {
        // The job waits for its delay without occupying a worker.
        retryDelay = getBackoffDelay(stored.attempts);
        stored.state = JobState::Failed;
        stored.readyAt = clock() + retryDelay;
        retryingJobs.insert({ { stored.readyAt, nextSequence++ }, stored.id });
        job = stored;
        readyCondition.notify_all();
      } else {
        stored.state = JobState::DeadLettered;
        job = stored;
        deadLetter = DeadLetterRecord{ stored.id, stored.tenantKey,
                                       stored.attempts, stored.lastError,
                                       clock() };
        deadLetters.push_back(*deadLetter);
        retainDeadLetteredLocked(retired);
      }
    }

    idleCondition.notify_all();
  }

  LoggingContext context(job.id);
  if (success) {
    logger.note(context, "job completed");
  } else if (retryDelay >= 0) {
    logger.warning(context,
                   llvm::formatv("job failed (attempt {0} of {1}), retrying "
                                 "in {2}s: {3}", job.attempts,
                                 job.maxAttempts, retryDelay, reason));
  } else if (deadLetter) {
    logger.error(context,
                 llvm::formatv("job dead-lettered after {0} attempts: {1}",
                               job.attempts, reason));
  } else {
    logger.error(context, "job failed: " + reason);
  }

  persist({ job });

  if (delegate) {
    if (retryDelay >= 0)
      delegate->jobRetryScheduled(job, retryDelay);
    else if (deadLetter)
      delegate->jobDeadLettered(job, *deadLetter);
    for (const auto& retiredID: retired)
      delegate->jobRetired(retiredID);
  }

  return job.state;
}

llvm::Expected<JobStatus> JobQueue::getStatus(StringRef jobID) {
  std::vector<Job> changed;
  JobStatus status;
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    promoteRetriesLocked(clock(), changed);

    auto it = jobs.find(jobID);
    if (it == jobs.end())
      return makeError(errc::unknown_job, "unknown job '" + jobID + "'");
    status = JobStatus{ it->second.state, it->second.attempts,
                        it->second.lastError };
  }

  persist(changed);
  return status;
}

Optional<Job> JobQueue::getJob(StringRef jobID) {
  std::lock_guard<std::mutex> lock(queueMutex);
  auto it = jobs.find(jobID);
  if (it == jobs.end())
    return None;
  return it->second;
}

std::vector<DeadLetterRecord> JobQueue::getDeadLetters() {
  std::lock_guard<std::mutex> lock(queueMutex);
  return std::vector<DeadLetterRecord>(deadLetters.begin(), deadLetters.end());
}

llvm::Error JobQueue::resubmitDeadLettered(StringRef jobID) {
  Job job;
  {
    std::lock_guard<std::mutex> lock(queueMutex);

    auto it = jobs.find(jobID);
    if (it == jobs.end())
      return makeError(errc::unknown_job, "unknown job '" + jobID + "'");
    Job& stored = it->second;
    if (stored.state != JobState::DeadLettered)
      return makeError(errc::not_dead_lettered,
                       "job '" + jobID + "' is " +
                       getJobStateName(stored.state) + ", not dead-lettered");
    if (isShutdown)
      return makeError(errc::shutting_down,
                       "job queue is shutting down, job '" + jobID +
                       "' rejected");

    if (stored.hasTenant() && options.tenantQuota != 0) {
      unsigned count = countTenantJobs(stored.tenantKey);
      if (count >= options.tenantQuota) {
        return makeError(
            errc::quota_exceeded,
            llvm::formatv("tenant '{0}' already has {1} unfinished jobs "
                          "(quota {2})", stored.tenantKey, count,
                          options.tenantQuota));
      }
    }

    deadLetters.erase(
        std::remove_if(deadLetters.begin(), deadLetters.end(),
                       [&](const DeadLetterRecord& record) {
                         return record.jobID == jobID;
                       }),
        deadLetters.end());

    stored.attempts = 0;
    stored.lastError.clear();
    enqueueLocked(stored);
    job = stored;
  }

  logger.note(LoggingContext(job.id), "dead-lettered job resubmitted");
  persist({ job });
  return llvm::Error::success();
}

JobQueueStats JobQueue::getStats() {
  std::vector<Job> changed;
  JobQueueStats stats;
  {
    std::lock_guard<std::mutex> lock(queueMutex);
    promoteRetriesLocked(clock(), changed);

    stats.queued = readyJobs.size();
    stats.active = numActive;
    stats.retrying = retryingJobs.size();
    stats.deadLettered = deadLetters.size();
    for (const auto& entry: jobs) {
      const Job& job = entry.getValue();
      if (job.state == JobState::Completed)
        ++stats.completed;
      else if (job.state == JobState::Failed && job.readyAt == 0)
        ++stats.failed;
    }
  }

  persist(changed);
  return stats;
}

void JobQueue::waitUntilIdle() {
  std::unique_lock<std::mutex> lock(queueMutex);
  idleCondition.wait(lock, [&]() { return isShutdown || isIdleLocked(); });
}

void JobQueue::shutdown() {
  std::lock_guard<std::mutex> lock(queueMutex);
  if (isShutdown)
    return;
  isShutdown = true;
  readyCondition.notify_all();
  idleCondition.notify_all();
}
