//===-- SerialQueue.cpp ---------------------------------------------------===//
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

#include "forgeline/Basic/ExecutionQueue.h"

#include "forgeline/Basic/PlatformUtility.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace forgeline;
using namespace forgeline::basic;

namespace {

struct SerialQueueJobContext : public QueueJobContext {
  unsigned laneID() const override { return 0; }
};

/// Execution queue which runs its jobs in submission order on a single
/// dedicated thread.
class SerialExecutionQueue : public ExecutionQueue {
  /// The thread executing the jobs.
  std::unique_ptr<std::thread> jobsThread;

  /// The queue of jobs.
  std::deque<QueueJob> jobs;

  /// The mutex protecting access to the queue.
  std::mutex jobsMutex;

  /// Condition variable used to signal when jobs are available.
  std::condition_variable readyJobsCondition;

  bool cancelled = false;
  bool shutdown = false;

  /// Thread function to execute jobs.
  void run() {
    sys::setCurrentThreadName("fl-serial");

    SerialQueueJobContext context;
    while (true) {
      // Get the next job from the queue.
      QueueJob job;
      {
        std::unique_lock<std::mutex> lock(jobsMutex);

        // While the queue is empty, wait for an item.
        while (!shutdown && jobs.empty()) {
          readyJobsCondition.wait(lock);
        }
        if (jobs.empty())
          return;

        job = jobs.front();
        jobs.pop_front();
      }

      getDelegate().queueJobStarted(job.getDescriptor());
      job.execute(&context);
      getDelegate().queueJobFinished(job.getDescriptor());
    }
  }

public:
  SerialExecutionQueue(ExecutionQueueDelegate& delegate)
    : ExecutionQueue(delegate)
  {
    // Ensure the queue is fully initialized before creating the worker thread.
    jobsThread = std::make_unique<std::thread>(
        &SerialExecutionQueue::run, this);
  }

  ~SerialExecutionQueue() {
    // Signal the worker to shut down, once the queued jobs have drained.
    {
      std::lock_guard<std::mutex> guard(jobsMutex);
      shutdown = true;
      readyJobsCondition.notify_one();
    }

    jobsThread->join();
  }

  void addJob(QueueJob job) override {
    {
      std::lock_guard<std::mutex> guard(jobsMutex);
      if (!cancelled) {
        jobs.push_back(job);
        readyJobsCondition.notify_one();
        return;
      }
    }

    getDelegate().queueJobCancelled(job.getDescriptor());
    job.cancel();
  }

  void cancelAllJobs() override {
    std::deque<QueueJob> dropped;
    {
      std::lock_guard<std::mutex> guard(jobsMutex);
      cancelled = true;
      std::swap(dropped, jobs);
    }

    for (auto& job: dropped) {
      getDelegate().queueJobCancelled(job.getDescriptor());
      job.cancel();
    }
  }

  unsigned getNumLanes() const override { return 1; }
};

}

std::unique_ptr<ExecutionQueue>
forgeline::basic::createSerialQueue(ExecutionQueueDelegate& delegate) {
  return std::unique_ptr<ExecutionQueue>(new SerialExecutionQueue(delegate));
}
