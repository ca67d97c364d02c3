//===- DryRunBuildPlan.h ----------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_SERVICE_DRYRUNBUILDPLAN_H
#define FORGELINE_SERVICE_DRYRUNBUILDPLAN_H

#include "forgeline/Basic/LLVM.h"
#include "forgeline/Core/BuildLifecycle.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace forgeline {
namespace service {

/// A build plan whose steps only log what they would do.
///
/// The step graph follows a real image build:
///
///   validate
///   resolve-packages     <- validate
///   generate-configs     <- validate
///   generate-dockerfile  <- resolve-packages
///   docker-build         <- generate-dockerfile, generate-configs
///   generate-iso         <- docker-build
///   upload               <- generate-iso
///
/// validate runs in the validating phase. The building phase runs the steps
/// from resolve-packages to docker-build, so package resolution and
/// configuration generation proceed in parallel and join at the image build.
/// generate-iso and upload run in the artifact-generating and uploading
/// phases. The resolving and generating phases have no separate work.
///
/// Steps record artifact references derived from the specification hash, so
/// identical specifications produce identical artifacts.
class DryRunBuildPlan : public core::BuildPlan {
public:
  struct Options {
    /// How long each step pretends to work, in seconds. Steps stop early when
    /// the build is cancelled.
    double stepDuration = 0;

    /// The name of a step which fails, for exercising failure handling.
    std::string failingStep;
  };

private:
  Options options;

public:
  DryRunBuildPlan() {}
  explicit DryRunBuildPlan(const Options& options) : options(options) {}

  std::vector<core::StepDescription>
  getSteps(core::BuildPhase phase, const core::BuildContext& context) override;
};

}
}

#endif
