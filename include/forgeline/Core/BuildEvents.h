//===- BuildEvents.h --------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_CORE_BUILDEVENTS_H
#define FORGELINE_CORE_BUILDEVENTS_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace forgeline {
namespace core {

/// The terminal status of a build, as announced to integrations.
enum class BuildEventStatus : uint8_t {
  Completed = 0,
  Failed,
  Cancelled,
  DeadLettered
};

StringRef getBuildEventStatusName(BuildEventStatus status);

struct BuildEvent {
  std::string buildID;
  std::string jobID;
  BuildEventStatus status = BuildEventStatus::Completed;
  std::vector<std::string> artifacts;
  /// The failure reason, empty on completion.
  std::string reason;
  double durationSeconds = 0;

  llvm::json::Value toJSON() const;
};

/// Receiver of terminal build events.
///
/// Notifiers are called from queue workers, and must be thread safe.
class BuildNotifier {
public:
  virtual ~BuildNotifier();

  virtual void buildFinished(const BuildEvent& event) = 0;
};

/// Create a notifier writing each event as one line of JSON.
std::unique_ptr<BuildNotifier> createLogStreamNotifier(raw_ostream& os);

}
}

#endif
