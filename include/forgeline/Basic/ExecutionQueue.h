//===- ExecutionQueue.h -----------------------------------------*- C++ -*-===//
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
// This file defines the execution queue on which build steps run, each
// launched step occupying one lane until it returns.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_BASIC_EXECUTIONQUEUE_H
#define FORGELINE_BASIC_EXECUTIONQUEUE_H

#include "forgeline/Basic/Compiler.h"
#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace forgeline {
  namespace basic {

    class ExecutionQueueDelegate;
    class Logger;

    /// Description of a queued job, used for ordering and diagnostics.
    class JobDescriptor {
    public:
      JobDescriptor() {}
      virtual ~JobDescriptor();

      /// Get the name the NamePriority algorithm orders jobs by.
      virtual StringRef getOrdinalName() const = 0;

      /// Get a description of the job for log messages.
      virtual void getDescription(SmallVectorImpl<char>& result) const = 0;
    };

    /// The lane a job executes on, passed to its work function.
    class QueueJobContext {
    public:
      virtual ~QueueJobContext();

      /// The index of the lane, less than the queue's lane count.
      virtual unsigned laneID() const = 0;
    };

    /// A unit of work added to an execution queue.
    ///
    /// Exactly one of the work and cancellation functions runs: the work when
    /// a lane picks the job up, the cancellation when the queue drops it.
    ///
    /// The queue orders pending jobs through their descriptors, so the
    /// descriptor must outlive the queue it was added to.
    class QueueJob {
    public:
      typedef std::function<void(QueueJobContext*)> work_fn_ty;
      typedef std::function<void()> cancel_fn_ty;

    private:
      JobDescriptor* desc = nullptr;
      work_fn_ty work;
      cancel_fn_ty cancelFn;

    public:
      QueueJob() {}
      QueueJob(JobDescriptor* desc, work_fn_ty work,
               cancel_fn_ty cancelFn = {})
      : desc(desc), work(std::move(work)), cancelFn(std::move(cancelFn)) {}

      JobDescriptor* getDescriptor() const { return desc; }

      void execute(QueueJobContext* context) { work(context); }

      void cancel() { if (cancelFn) cancelFn(); }
    };

    /// A queue running jobs concurrently on a bounded number of lanes.
    class ExecutionQueue {
      // DO NOT COPY
      ExecutionQueue(const ExecutionQueue&) FORGELINE_DELETED_FUNCTION;
      void operator=(const ExecutionQueue&) FORGELINE_DELETED_FUNCTION;
      ExecutionQueue& operator=(ExecutionQueue&&) FORGELINE_DELETED_FUNCTION;

      ExecutionQueueDelegate& delegate;

    public:
      explicit ExecutionQueue(ExecutionQueueDelegate& delegate);
      virtual ~ExecutionQueue();

      ExecutionQueueDelegate& getDelegate() { return delegate; }

      /// Add a job to be executed.
      ///
      /// A queue which was cancelled drops the job immediately.
      virtual void addJob(QueueJob job) = 0;

      /// Drop every job which has not started, and all jobs added later.
      ///
      /// Jobs already running on a lane finish normally.
      virtual void cancelAllJobs() = 0;

      /// The number of jobs which may execute concurrently.
      virtual unsigned getNumLanes() const = 0;
    };

    /// Observer of the jobs of an execution queue.
    ///
    /// Calls arrive synchronously from the lanes, concurrently and on no
    /// particular thread, so implementations must be thread safe and quick.
    class ExecutionQueueDelegate {
      // DO NOT COPY
      ExecutionQueueDelegate(const ExecutionQueueDelegate&)
          FORGELINE_DELETED_FUNCTION;
      void operator=(const ExecutionQueueDelegate&) FORGELINE_DELETED_FUNCTION;

    public:
      ExecutionQueueDelegate() {}
      virtual ~ExecutionQueueDelegate();

      /// Called on the lane, right before the job's work runs.
      ///
      /// Every call is paired with exactly one \see queueJobFinished().
      virtual void queueJobStarted(JobDescriptor*) = 0;

      /// Called on the lane, right after the job's work returned.
      virtual void queueJobFinished(JobDescriptor*) = 0;

      /// Called when the queue drops a job which never started.
      virtual void queueJobCancelled(JobDescriptor*) {}
    };

    /// A delegate which ignores all queue events.
    class NullExecutionQueueDelegate : public ExecutionQueueDelegate {
    public:
      NullExecutionQueueDelegate() {}
      ~NullExecutionQueueDelegate();

      void queueJobStarted(JobDescriptor*) override {}
      void queueJobFinished(JobDescriptor*) override {}
    };

    /// A delegate which logs job starts and finishes at debug level, and
    /// dropped jobs as warnings.
    class LoggingExecutionQueueDelegate : public ExecutionQueueDelegate {
      Logger& logger;

    public:
      explicit LoggingExecutionQueueDelegate(Logger& logger) : logger(logger) {}
      ~LoggingExecutionQueueDelegate();

      void queueJobStarted(JobDescriptor* desc) override;
      void queueJobFinished(JobDescriptor* desc) override;
      void queueJobCancelled(JobDescriptor* desc) override;
    };

    enum class SchedulerAlgorithm {
      /// Lowest ordinal name first.
      NamePriority = 0,

      /// First in, first out.
      FIFO = 1
    };

    /// Create a queue which runs jobs on \p numLanes threads, or one per CPU
    /// if \p numLanes is not positive.
    std::unique_ptr<ExecutionQueue> createLaneBasedExecutionQueue(
        ExecutionQueueDelegate& delegate, int numLanes, SchedulerAlgorithm alg);

    /// Create a queue which runs jobs one at a time, in the order they were
    /// added, on a single thread.
    std::unique_ptr<ExecutionQueue> createSerialQueue(
        ExecutionQueueDelegate& delegate);
  }
}

#endif
