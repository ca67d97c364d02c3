//===- Job.h ----------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_CORE_JOB_H
#define FORGELINE_CORE_JOB_H

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>

namespace forgeline {
namespace core {

/// A tenant's service class.
enum class Tier : uint8_t {
  Free = 0,
  Standard,
  Premium
};

StringRef getTierName(Tier tier);

bool parseTier(StringRef name, Tier* tier_out);

/// Get the queue priority of a tier (lower values are dequeued first).
int getTierPriority(Tier tier);

/// The resource limits of a tier, handed to step implementations.
struct TierLimits {
  /// The container memory limit, e.g., "4g".
  std::string memory;
  unsigned cpus;
  unsigned pidsLimit;
  /// The wall clock limit of a full build.
  unsigned timeoutSeconds;
};

const TierLimits& getTierLimits(Tier tier);

/// The state of a job, as observed by callers.
enum class JobState : uint8_t {
  Queued = 0,
  Active,
  Completed,
  Failed,
  DeadLettered
};

StringRef getJobStateName(JobState state);

bool parseJobState(StringRef name, JobState* state_out);

/// A unit of work admitted to the job queue.
struct Job {
  /// The unique job identifier, also used as the identifier of its builds.
  std::string id;

  /// The canonical text of the build specification.
  std::string spec;

  /// The submitting tenant, if any.
  std::string tenantKey;

  Tier tier = Tier::Free;

  /// The queue priority, derived from the tier.
  int priority = 10;

  /// The number of executions which have failed.
  unsigned attempts = 0;

  unsigned maxAttempts = 3;

  JobState state = JobState::Queued;

  /// The reason of the most recent failure.
  std::string lastError;

  /// The submission time.
  basic::Clock::Timestamp submittedAt = 0;

  /// For a failed job awaiting retry, when it becomes eligible again.
  basic::Clock::Timestamp readyAt = 0;

  bool hasTenant() const { return !tenantKey.empty(); }
};

/// The status of a job, as reported to callers.
struct JobStatus {
  JobState state;
  unsigned attempts;
  std::string reason;
};

/// A job which exhausted its attempts.
struct DeadLetterRecord {
  std::string jobID;
  std::string tenantKey;
  unsigned attempts;
  /// The reason of the final failure.
  std::string reason;
  basic::Clock::Timestamp deadLetteredAt;
};

}
}

#endif
