//===- unittests/Basic/LaneBasedExecutionQueueTest.cpp --------------------===//
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

#include "forgeline/Basic/Logging.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

using namespace forgeline;
using namespace forgeline::basic;

namespace {
  class CountingDelegate : public ExecutionQueueDelegate {
  public:
    std::atomic<int> started { 0 };
    std::atomic<int> finished { 0 };
    std::atomic<int> cancelled { 0 };

    CountingDelegate() {}

    virtual void queueJobStarted(JobDescriptor*) override { started++; }
    virtual void queueJobFinished(JobDescriptor*) override { finished++; }
    virtual void queueJobCancelled(JobDescriptor*) override { cancelled++; }
  };

  class DummyCommand : public JobDescriptor {
    std::string name;

  public:
    DummyCommand(StringRef name = "") : name(name) {}

    virtual StringRef getOrdinalName() const override { return name; }
    virtual void getDescription(SmallVectorImpl<char> &result) const override {
      result.append(name.begin(), name.end());
    }
  };

  /// A gate which jobs block on until the test opens it.
  class Gate {
    bool open = false;
    std::mutex mutex;
    std::condition_variable condition;

  public:
    void wait() {
      std::unique_lock<std::mutex> lock(mutex);
      condition.wait(lock, [&]() { return open; });
    }
    void release() {
      std::lock_guard<std::mutex> lock(mutex);
      open = true;
      condition.notify_all();
    }
  };

  TEST(LaneBasedExecutionQueueTest, basic) {
    CountingDelegate delegate;
    std::atomic<int> executions { 0 };
    DummyCommand a("a"), b("b"), c("c");
    {
      auto queue = createLaneBasedExecutionQueue(
          delegate, 2, SchedulerAlgorithm::NamePriority);
      EXPECT_EQ(2u, queue->getNumLanes());

      for (auto* command: { &a, &b, &c }) {
        queue->addJob(QueueJob(command, [&](QueueJobContext* context) {
              EXPECT_LT(context->laneID(), 2u);
              executions++;
            }));
      }
    }

    // Destroying the queue waits for the queued jobs.
    EXPECT_EQ(3, executions);
    EXPECT_EQ(3, delegate.started);
    EXPECT_EQ(3, delegate.finished);
    EXPECT_EQ(0, delegate.cancelled);
  }

  TEST(LaneBasedExecutionQueueTest, defaultLaneCount) {
    CountingDelegate delegate;
    auto queue = createLaneBasedExecutionQueue(delegate, 0,
                                               SchedulerAlgorithm::FIFO);
    EXPECT_GE(queue->getNumLanes(), 1u);
  }

  TEST(LaneBasedExecutionQueueTest, fifoOrderOnSingleLane) {
    CountingDelegate delegate;
    std::vector<std::string> order;
    std::mutex orderMutex;
    Gate gate;
    DummyCommand blocker("blocker"), c("c"), a("a"), b("b");
    {
      auto queue = createLaneBasedExecutionQueue(delegate, 1,
                                                 SchedulerAlgorithm::FIFO);

      // Occupy the lane until every job is queued.
      queue->addJob(QueueJob(&blocker, [&](QueueJobContext*) {
            gate.wait();
          }));

      for (auto* command: { &c, &a, &b }) {
        queue->addJob(QueueJob(command, [&, command](QueueJobContext*) {
              std::lock_guard<std::mutex> lock(orderMutex);
              order.push_back(command->getOrdinalName().str());
            }));
      }
      gate.release();
    }

    EXPECT_EQ(std::vector<std::string>({ "c", "a", "b" }), order);
  }

  TEST(LaneBasedExecutionQueueTest, namePriorityOrderOnSingleLane) {
    CountingDelegate delegate;
    std::vector<std::string> order;
    std::mutex orderMutex;
    Gate gate;
    DummyCommand blocker("blocker"), c("c"), a("a"), b("b");
    {
      auto queue = createLaneBasedExecutionQueue(
          delegate, 1, SchedulerAlgorithm::NamePriority);

      queue->addJob(QueueJob(&blocker, [&](QueueJobContext*) {
            gate.wait();
          }));

      for (auto* command: { &c, &a, &b }) {
        queue->addJob(QueueJob(command, [&, command](QueueJobContext*) {
              std::lock_guard<std::mutex> lock(orderMutex);
              order.push_back(command->getOrdinalName().str());
            }));
      }
      gate.release();
    }

    EXPECT_EQ(std::vector<std::string>({ "a", "b", "c" }), order);
  }

  TEST(LaneBasedExecutionQueueTest, cancelDropsPendingJobs) {
    CountingDelegate delegate;
    std::atomic<int> executions { 0 };
    std::atomic<int> dropped { 0 };
    Gate started, gate;
    DummyCommand running("running"), pending1("pending1"),
        pending2("pending2"), late("late");
    {
      auto queue = createLaneBasedExecutionQueue(delegate, 1,
                                                 SchedulerAlgorithm::FIFO);

      queue->addJob(QueueJob(&running, [&](QueueJobContext*) {
            started.release();
            gate.wait();
            executions++;
          }, [&]() { dropped++; }));
      started.wait();

      for (auto* command: { &pending1, &pending2 }) {
        queue->addJob(QueueJob(command, [&](QueueJobContext*) {
              executions++;
            }, [&]() { dropped++; }));
      }

      queue->cancelAllJobs();
      EXPECT_EQ(2, dropped);

      // Jobs added after cancellation are dropped as well.
      queue->addJob(QueueJob(&late, [&](QueueJobContext*) {
            executions++;
          }, [&]() { dropped++; }));
      EXPECT_EQ(3, dropped);

      gate.release();
    }

    // The running job was allowed to finish.
    EXPECT_EQ(1, executions);
    EXPECT_EQ(3, delegate.cancelled);
    EXPECT_EQ(1, delegate.finished);
  }

  TEST(LaneBasedExecutionQueueTest, exhaustsQueueAfterCancellation) {
    CountingDelegate delegate;
    DummyCommand dummyCommand1("1"), dummyCommand2("2");
    auto queue = createLaneBasedExecutionQueue(delegate, 1,
                                               SchedulerAlgorithm::NamePriority);

    bool buildStarted { false };
    std::condition_variable buildStartedCondition;
    std::mutex buildStartedMutex;
    std::atomic<int> executions { 0 };
    std::atomic<int> dropped { 0 };

    auto fn = [&buildStarted, &buildStartedCondition, &buildStartedMutex,
               &executions, &queue](QueueJobContext* context) {
      executions++;
      if (queue) { queue->cancelAllJobs(); }

      std::unique_lock<std::mutex> lock(buildStartedMutex);
      buildStarted = true;
      buildStartedCondition.notify_all();
    };

    queue->addJob(QueueJob(&dummyCommand1, fn, [&]() { dropped++; }));
    queue->addJob(QueueJob(&dummyCommand2, fn, [&]() { dropped++; }));

    {
      std::unique_lock<std::mutex> lock(buildStartedMutex);
      while (!buildStarted) {
        buildStartedCondition.wait(lock);
      }
    }

    queue.reset();

    // Every job either ran or was dropped, exactly once.
    EXPECT_EQ(2, executions + dropped);
    EXPECT_GE(executions, 1);
  }

  TEST(LaneBasedExecutionQueueTest, loggingDelegate) {
    std::string output;
    llvm::raw_string_ostream os(output);
    auto logger = createStreamLogger(os, LogLevel::Debug);
    LoggingExecutionQueueDelegate delegate(*logger);
    DummyCommand compileStep("compile"), linkStep("link");
    {
      auto queue = createLaneBasedExecutionQueue(delegate, 1,
                                                 SchedulerAlgorithm::FIFO);
      queue->addJob(QueueJob(&compileStep, [](QueueJobContext*) {}));
    }
    {
      auto queue = createSerialQueue(delegate);
      queue->cancelAllJobs();
      queue->addJob(QueueJob(&linkStep, [](QueueJobContext*) {}));
    }

    EXPECT_EQ("debug: lane started compile\n"
              "debug: lane finished compile\n"
              "warning: dropped link before it started\n", os.str());
  }

  TEST(SerialQueueTest, runsJobsInOrder) {
    CountingDelegate delegate;
    std::vector<std::string> order;
    DummyCommand b("b"), a("a"), c("c");
    {
      auto queue = createSerialQueue(delegate);
      EXPECT_EQ(1u, queue->getNumLanes());

      for (auto* command: { &b, &a, &c }) {
        queue->addJob(QueueJob(command, [&, command](QueueJobContext* context) {
              EXPECT_EQ(0u, context->laneID());
              order.push_back(command->getOrdinalName().str());
            }));
      }
    }

    EXPECT_EQ(std::vector<std::string>({ "b", "a", "c" }), order);
    EXPECT_EQ(3, delegate.finished);
  }

}
