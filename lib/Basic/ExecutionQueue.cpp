//===-- ExecutionQueue.cpp ------------------------------------------------===//
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

#include "llvm/ADT/SmallString.h"

using namespace forgeline;
using namespace forgeline::basic;

JobDescriptor::~JobDescriptor() {
}

QueueJobContext::~QueueJobContext() {
}

ExecutionQueue::ExecutionQueue(ExecutionQueueDelegate& delegate)
  : delegate(delegate)
{
}

ExecutionQueue::~ExecutionQueue() {
}

ExecutionQueueDelegate::~ExecutionQueueDelegate() {
}

NullExecutionQueueDelegate::~NullExecutionQueueDelegate() {
}

LoggingExecutionQueueDelegate::~LoggingExecutionQueueDelegate() {
}

void LoggingExecutionQueueDelegate::queueJobStarted(JobDescriptor* desc) {
  SmallString<64> description;
  desc->getDescription(description);
  logger.debug(LoggingContext(), "lane started " + description);
}

void LoggingExecutionQueueDelegate::queueJobFinished(JobDescriptor* desc) {
  SmallString<64> description;
  desc->getDescription(description);
  logger.debug(LoggingContext(), "lane finished " + description);
}

void LoggingExecutionQueueDelegate::queueJobCancelled(JobDescriptor* desc) {
  SmallString<64> description;
  desc->getDescription(description);
  logger.warning(LoggingContext(), "dropped " + description +
                 " before it started");
}
