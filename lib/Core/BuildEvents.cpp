//===-- BuildEvents.cpp ---------------------------------------------------===//
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

#include "forgeline/Core/BuildEvents.h"

#include "llvm/Support/raw_ostream.h"

#include <mutex>

using namespace forgeline;
using namespace forgeline::core;

StringRef core::getBuildEventStatusName(BuildEventStatus status) {
  switch (status) {
  case BuildEventStatus::Completed: return "completed";
  case BuildEventStatus::Failed: return "failed";
  case BuildEventStatus::Cancelled: return "cancelled";
  case BuildEventStatus::DeadLettered: return "dead-lettered";
  }
  return "<unknown>";
}

llvm::json::Value BuildEvent::toJSON() const {
  llvm::json::Object result{
    { "buildId", buildID },
    { "jobId", jobID },
    { "status", getBuildEventStatusName(status) },
    { "duration", durationSeconds },
  };
  if (!artifacts.empty())
    result["artifacts"] = artifacts;
  if (!reason.empty())
    result["reason"] = reason;
  return llvm::json::Value(std::move(result));
}

BuildNotifier::~BuildNotifier() { }

namespace {

class LogStreamNotifier : public BuildNotifier {
  raw_ostream& os;
  std::mutex streamMutex;

public:
  LogStreamNotifier(raw_ostream& os) : os(os) { }

  void buildFinished(const BuildEvent& event) override {
    std::lock_guard<std::mutex> lock(streamMutex);
    os << event.toJSON() << "\n";
    os.flush();
  }
};

}

std::unique_ptr<BuildNotifier> core::createLogStreamNotifier(raw_ostream& os) {
  return std::unique_ptr<BuildNotifier>(new LogStreamNotifier(os));
}
