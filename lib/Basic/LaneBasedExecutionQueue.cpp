//===-- LaneBasedExecutionQueue.cpp ---------------------------------------===//
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

#include "llvm/ADT/Twine.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

using namespace forgeline;
using namespace forgeline::basic;

namespace {

struct LaneContext : public QueueJobContext {
  unsigned laneNumber;

  explicit LaneContext(unsigned laneNumber) : laneNumber(laneNumber) {}

  unsigned laneID() const override { return laneNumber; }
};

/// The jobs waiting for a lane, in the order of one scheduler algorithm.
class ReadyJobs {
public:
  virtual ~ReadyJobs() { }

  virtual void push(QueueJob job) = 0;
  virtual QueueJob pop() = 0;
  virtual bool empty() const = 0;

  static std::unique_ptr<ReadyJobs> create(SchedulerAlgorithm alg);
};

class NamePriorityReadyJobs : public ReadyJobs {
  struct OrdinalNameGreater {
    bool operator()(const QueueJob& lhs, const QueueJob& rhs) const {
      return lhs.getDescriptor()->getOrdinalName() >
        rhs.getDescriptor()->getOrdinalName();
    }
  };

  std::priority_queue<QueueJob, std::vector<QueueJob>, OrdinalNameGreater> jobs;

public:
  void push(QueueJob job) override { jobs.push(std::move(job)); }

  QueueJob pop() override {
    QueueJob job = jobs.top();
    jobs.pop();
    return job;
  }

  bool empty() const override { return jobs.empty(); }
};

class FIFOReadyJobs : public ReadyJobs {
  std::deque<QueueJob> jobs;

public:
  void push(QueueJob job) override { jobs.push_back(std::move(job)); }

  QueueJob pop() override {
    QueueJob job = std::move(jobs.front());
    jobs.pop_front();
    return job;
  }

  bool empty() const override { return jobs.empty(); }
};

std::unique_ptr<ReadyJobs> ReadyJobs::create(SchedulerAlgorithm alg) {
  switch (alg) {
  case SchedulerAlgorithm::NamePriority:
    return std::unique_ptr<ReadyJobs>(new NamePriorityReadyJobs);
  case SchedulerAlgorithm::FIFO:
    break;
  }
  return std::unique_ptr<ReadyJobs>(new FIFOReadyJobs);
}

/// Execution queue running jobs on a fixed set of lane threads.
///
/// The lanes drain the ready jobs before exiting, so destroying the queue
/// waits for every job added before it was cancelled.
class LaneBasedExecutionQueue : public ExecutionQueue {
  std::vector<std::thread> lanes;

  std::unique_ptr<ReadyJobs> readyJobs;
  std::mutex readyJobsMutex;
  std::condition_variable readyJobsCondition;

  /// Whether cancelAllJobs() was called.
  bool cancelled = false;

  /// Whether the lanes should exit once the ready jobs are drained.
  bool shutdown = false;

  void executeLane(unsigned laneNumber) {
    sys::setCurrentThreadName("fl-lane-" + Twine(laneNumber));

    LaneContext context(laneNumber);
    while (true) {
      QueueJob job;
      {
        std::unique_lock<std::mutex> lock(readyJobsMutex);
        readyJobsCondition.wait(lock, [&] {
            return shutdown || !readyJobs->empty();
          });
        if (readyJobs->empty())
          return;
        job = readyJobs->pop();
      }

      getDelegate().queueJobStarted(job.getDescriptor());
      job.execute(&context);
      getDelegate().queueJobFinished(job.getDescriptor());
    }
  }

  void dropJob(QueueJob& job) {
    getDelegate().queueJobCancelled(job.getDescriptor());
    job.cancel();
  }

public:
  LaneBasedExecutionQueue(ExecutionQueueDelegate& delegate,
                          unsigned numLanes, SchedulerAlgorithm alg)
    : ExecutionQueue(delegate), readyJobs(ReadyJobs::create(alg))
  {
    lanes.reserve(numLanes);
    for (unsigned i = 0; i != numLanes; ++i)
      lanes.emplace_back(&LaneBasedExecutionQueue::executeLane, this, i);
  }

  ~LaneBasedExecutionQueue() override {
    {
      std::lock_guard<std::mutex> lock(readyJobsMutex);
      shutdown = true;
    }
    readyJobsCondition.notify_all();

    for (auto& lane: lanes)
      lane.join();
  }

  void addJob(QueueJob job) override {
    {
      std::lock_guard<std::mutex> lock(readyJobsMutex);
      if (!cancelled) {
        readyJobs->push(std::move(job));
        readyJobsCondition.notify_one();
        return;
      }
    }
    dropJob(job);
  }

  void cancelAllJobs() override {
    std::vector<QueueJob> dropped;
    {
      std::lock_guard<std::mutex> lock(readyJobsMutex);
      if (cancelled)
        return;
      cancelled = true;
      while (!readyJobs->empty())
        dropped.push_back(readyJobs->pop());
    }

    // Cancellation handlers may re-enter the queue.
    for (auto& job: dropped)
      dropJob(job);
  }

  unsigned getNumLanes() const override { return lanes.size(); }
};

}

std::unique_ptr<ExecutionQueue> forgeline::basic::createLaneBasedExecutionQueue(
    ExecutionQueueDelegate& delegate, int numLanes, SchedulerAlgorithm alg) {
  unsigned lanes = numLanes > 0 ? unsigned(numLanes) : sys::getNumberOfCPUs();
  return std::unique_ptr<ExecutionQueue>(
      new LaneBasedExecutionQueue(delegate, lanes, alg));
}
