//===- JobQueue.h -----------------------------------------------*- C++ -*-===//
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
// This file defines the queue which admits build jobs, orders them by tier,
// limits dispatch, retries failed jobs and dead-letters exhausted ones.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_CORE_JOBQUEUE_H
#define FORGELINE_CORE_JOBQUEUE_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/LLVM.h"
#include "forgeline/Core/Job.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace forgeline {
namespace basic {
  class Logger;
}

namespace core {

class BuildStore;

/// Observer of the retry decisions of a queue.
///
/// Callbacks are made without the queue lock held, from the thread reporting
/// the result.
class JobQueueDelegate {
public:
  virtual ~JobQueueDelegate();

  /// Called when a failed job was scheduled for another attempt.
  virtual void jobRetryScheduled(const Job& job, double delaySeconds) = 0;

  /// Called when a job exhausted its attempts. This is the job's terminal
  /// failure.
  virtual void jobDeadLettered(const Job& job,
                               const DeadLetterRecord& record) = 0;

  /// Called when a terminal job is dropped by the retention limits. The
  /// queue no longer knows the job.
  virtual void jobRetired(StringRef jobID) { (void)jobID; }
};

struct JobQueueOptions {
  /// The maximum number of queued, active or retrying jobs per tenant.
  unsigned tenantQuota = 2;

  /// The default number of executions of a job.
  unsigned maxAttempts = 3;

  /// The delay before the first retry, in seconds.
  double backoffBase = 5;

  /// The maximum retry delay in seconds, or 0 for no maximum.
  double backoffCap = 0;

  /// The number of dequeues allowed per window, or 0 for no limit.
  unsigned rateLimitMax = 5;

  /// The rate limiting window, in seconds.
  double rateLimitWindow = 60;

  /// The number of finished jobs kept for queries.
  unsigned retainCompleted = 100;

  /// The number of dead-lettered jobs kept.
  unsigned retainDeadLettered = 1000;
};

struct JobQueueStats {
  uint64_t queued = 0;
  uint64_t active = 0;
  uint64_t retrying = 0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t deadLettered = 0;
};

/// A request to admit a job.
struct JobSubmission {
  /// The job identifier; one is generated if empty.
  std::string id;

  std::string spec;
  std::string tenantKey;
  Tier tier = Tier::Free;

  /// The number of executions, or 0 for the queue default.
  unsigned maxAttempts = 0;
};

/// A thread safe priority queue of build jobs.
///
/// Jobs are dequeued by ascending priority and in submission order within a
/// priority. Failed jobs wait for their backoff delay without occupying a
/// worker: they are promoted back to the queue by the next dequeue or query
/// which finds the delay elapsed.
class JobQueue {
  JobQueueOptions options;
  basic::Logger& logger;
  BuildStore* store;
  JobQueueDelegate* delegate;
  basic::Clock::Source clock;

  /// All known jobs.
  llvm::StringMap<Job> jobs;

  /// The queued jobs, ordered by (priority, sequence).
  std::set<std::pair<std::pair<int, uint64_t>, std::string>> readyJobs;

  /// The failed jobs waiting for a retry, ordered by (readyAt, sequence).
  std::set<std::pair<std::pair<basic::Clock::Timestamp, uint64_t>,
                     std::string>> retryingJobs;

  uint64_t numActive = 0;
  uint64_t nextSequence = 0;

  /// The finished jobs, oldest first.
  std::deque<std::string> finishedJobs;

  /// The dead-lettered jobs, oldest first.
  std::deque<DeadLetterRecord> deadLetters;

  /// The recent dispatch times, for rate limiting.
  std::deque<basic::Clock::Timestamp> dispatchTimes;

  bool isShutdown = false;

  std::mutex queueMutex;
  std::condition_variable readyCondition;
  std::condition_variable idleCondition;

  // DO NOT COPY
  JobQueue(const JobQueue&) FORGELINE_DELETED_FUNCTION;
  void operator=(const JobQueue&) FORGELINE_DELETED_FUNCTION;

  unsigned countTenantJobs(StringRef tenantKey) const;
  void enqueueLocked(Job& job);
  void promoteRetriesLocked(basic::Clock::Timestamp now,
                            std::vector<Job>& changed);
  bool isRateLimitedLocked(basic::Clock::Timestamp now,
                           basic::Clock::Timestamp* release_out);
  Optional<Job> takeNextLocked(basic::Clock::Timestamp now,
                               std::vector<Job>& changed);
  void retainFinishedLocked(StringRef jobID,
                            std::vector<std::string>& retired);
  void retainDeadLetteredLocked(std::vector<std::string>& retired);
  bool isIdleLocked() const;

  void persist(const std::vector<Job>& changed);

public:
  JobQueue(const JobQueueOptions& options, basic::Logger& logger,
           BuildStore* store = nullptr, JobQueueDelegate* delegate = nullptr,
           basic::Clock::Source clock = basic::Clock::system());
  ~JobQueue();

  const JobQueueOptions& getOptions() const { return options; }

  /// Admit a job.
  ///
  /// Fails with \see basic::errc::quota_exceeded if the tenant already has
  /// its quota of unfinished jobs, \see basic::errc::duplicate_job if the
  /// identifier is in use and \see basic::errc::shutting_down after
  /// \see shutdown().
  ///
  /// \returns The job identifier.
  llvm::Expected<std::string> submit(const JobSubmission& submission);

  /// Take the most urgent queued job, marking it active.
  ///
  /// Blocks while no job is available or dispatch is rate limited.
  ///
  /// \returns The job, or None once the queue is shut down.
  Optional<Job> dequeue();

  /// Take the most urgent queued job if one may be dispatched now.
  Optional<Job> tryDequeue();

  /// Report the result of an active job.
  ///
  /// A failed job is retried after its backoff delay until it has failed
  /// \see Job::maxAttempts times, and then dead-lettered. A failure which is
  /// not \p retryable (such as a cancelled build) ends the job immediately.
  ///
  /// \returns The state of the job after the report: completed, failed (a
  /// retry may be pending) or dead-lettered.
  llvm::Expected<JobState> reportResult(StringRef jobID, bool success,
                                        StringRef reason = "",
                                        bool retryable = true);

  /// Get the state of a job, failing with \see basic::errc::unknown_job.
  llvm::Expected<JobStatus> getStatus(StringRef jobID);

  /// Get a copy of a job, if it is known.
  Optional<Job> getJob(StringRef jobID);

  /// Get the retained dead-lettered jobs, oldest first.
  std::vector<DeadLetterRecord> getDeadLetters();

  /// Queue a dead-lettered job again, with its attempts reset.
  ///
  /// The tenant quota applies as for a new submission.
  llvm::Error resubmitDeadLettered(StringRef jobID);

  JobQueueStats getStats();

  /// Get the delay before the retry following the \p attempts-th failure.
  double getBackoffDelay(unsigned attempts) const;

  /// Block until no job is queued, active or waiting for a retry, or the queue
  /// is shut down.
  void waitUntilIdle();

  /// Stop dispatching: blocked and future dequeues return None and new
  /// submissions are rejected. Active jobs may still report their results.
  void shutdown();
};

}
}

#endif
