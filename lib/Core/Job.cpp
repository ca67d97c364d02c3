//===-- Job.cpp -----------------------------------------------------------===//
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

#include "forgeline/Core/Job.h"

#include "llvm/ADT/StringSwitch.h"

using namespace forgeline;
using namespace forgeline::core;

StringRef core::getTierName(Tier tier) {
  switch (tier) {
  case Tier::Free: return "free";
  case Tier::Standard: return "standard";
  case Tier::Premium: return "premium";
  }
  return "<unknown>";
}

bool core::parseTier(StringRef name, Tier* tier_out) {
  int value = llvm::StringSwitch<int>(name)
    .Case("free", int(Tier::Free))
    .Case("standard", int(Tier::Standard))
    .Case("premium", int(Tier::Premium))
    .Default(-1);
  if (value < 0)
    return false;
  *tier_out = Tier(value);
  return true;
}

int core::getTierPriority(Tier tier) {
  switch (tier) {
  case Tier::Premium: return 1;
  case Tier::Standard: return 5;
  case Tier::Free: return 10;
  }
  return 10;
}

const TierLimits& core::getTierLimits(Tier tier) {
  static const TierLimits freeLimits{ "2g", 2, 100, 1800 };
  static const TierLimits standardLimits{ "4g", 4, 200, 3600 };
  static const TierLimits premiumLimits{ "8g", 8, 500, 7200 };

  switch (tier) {
  case Tier::Premium: return premiumLimits;
  case Tier::Standard: return standardLimits;
  case Tier::Free: return freeLimits;
  }
  return freeLimits;
}

StringRef core::getJobStateName(JobState state) {
  switch (state) {
  case JobState::Queued: return "queued";
  case JobState::Active: return "active";
  case JobState::Completed: return "completed";
  case JobState::Failed: return "failed";
  case JobState::DeadLettered: return "dead-lettered";
  }
  return "<unknown>";
}

bool core::parseJobState(StringRef name, JobState* state_out) {
  int value = llvm::StringSwitch<int>(name)
    .Case("queued", int(JobState::Queued))
    .Case("active", int(JobState::Active))
    .Case("completed", int(JobState::Completed))
    .Case("failed", int(JobState::Failed))
    .Case("dead-lettered", int(JobState::DeadLettered))
    .Default(-1);
  if (value < 0)
    return false;
  *state_out = JobState(value);
  return true;
}
