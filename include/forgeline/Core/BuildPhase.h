//===- BuildPhase.h ---------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_CORE_BUILDPHASE_H
#define FORGELINE_CORE_BUILDPHASE_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>

namespace forgeline {
namespace core {

/// The phases of a build, in the order a build passes through them.
///
/// \c Failed is reachable from every non-terminal phase, otherwise a build
/// only ever moves forward.
enum class BuildPhase : uint8_t {
  Pending = 0,
  Parsing,
  Validating,
  Resolving,
  Generating,
  Building,
  ArtifactGenerating,
  Uploading,
  Complete,
  Failed
};

/// The number of phases a build can be in.
static const unsigned NumBuildPhases = unsigned(BuildPhase::Failed) + 1;

/// Get the name of a phase, e.g., "artifact-generating".
StringRef getBuildPhaseName(BuildPhase phase);

/// Parse a phase name.
///
/// \returns False if the name is not a known phase.
bool parseBuildPhase(StringRef name, BuildPhase* phase_out);

/// Check whether a phase is terminal.
inline bool isTerminalPhase(BuildPhase phase) {
  return phase == BuildPhase::Complete || phase == BuildPhase::Failed;
}

/// Check whether a build may move from \p from to \p to.
inline bool isValidPhaseTransition(BuildPhase from, BuildPhase to) {
  if (isTerminalPhase(from))
    return false;
  if (to == BuildPhase::Failed)
    return true;
  return uint8_t(to) > uint8_t(from);
}

}
}

#endif
