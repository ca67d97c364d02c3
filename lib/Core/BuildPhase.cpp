//===-- BuildPhase.cpp ----------------------------------------------------===//
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

#include "forgeline/Core/BuildPhase.h"

using namespace forgeline;
using namespace forgeline::core;

StringRef core::getBuildPhaseName(BuildPhase phase) {
  switch (phase) {
  case BuildPhase::Pending: return "pending";
  case BuildPhase::Parsing: return "parsing";
  case BuildPhase::Validating: return "validating";
  case BuildPhase::Resolving: return "resolving";
  case BuildPhase::Generating: return "generating";
  case BuildPhase::Building: return "building";
  case BuildPhase::ArtifactGenerating: return "artifact-generating";
  case BuildPhase::Uploading: return "uploading";
  case BuildPhase::Complete: return "complete";
  case BuildPhase::Failed: return "failed";
  }
  return "<unknown>";
}

bool core::parseBuildPhase(StringRef name, BuildPhase* phase_out) {
  for (unsigned i = 0; i != NumBuildPhases; ++i) {
    if (name == getBuildPhaseName(BuildPhase(i))) {
      *phase_out = BuildPhase(i);
      return true;
    }
  }
  return false;
}
