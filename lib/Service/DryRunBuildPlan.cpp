//===-- DryRunBuildPlan.cpp -----------------------------------------------===//
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

#include "forgeline/Service/DryRunBuildPlan.h"

#include "forgeline/Basic/Clock.h"
#include "forgeline/Basic/Errors.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FormatVariadic.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;
using namespace forgeline::service;

namespace {

/// Pretend to work for \p duration seconds, stopping if the build is
/// cancelled.
llvm::Error simulateWork(StepContext& context, double duration) {
  auto deadline = Clock::now() + duration;
  while (Clock::now() < deadline) {
    if (context.isCancelled())
      return llvm::make_error<llvm::StringError>(
          "interrupted by cancellation", llvm::inconvertibleErrorCode());
    double remaining = deadline - Clock::now();
    std::this_thread::sleep_for(Clock::toDuration(std::min(remaining, 0.01)));
  }
  return llvm::Error::success();
}

}

std::vector<StepDescription>
DryRunBuildPlan::getSteps(BuildPhase phase, const BuildContext& context) {
  // Everything a step needs is captured by value, steps run on other threads.
  const Options options = this->options;
  const BuildSpec spec = context.spec;
  const std::string shortHash = context.specHash.substr(0, 12);
  const std::string imageName = spec.name.empty() ? spec.base : spec.name;

  // The whole graph, each step tagged with the phase running it.
  std::vector<std::pair<BuildPhase, StepDescription>> graph;
  auto addStep = [&](BuildPhase stepPhase, StringRef id,
                     std::vector<std::string> dependencies, unsigned weight,
                     std::function<void(StepContext&)> work) {
    std::string stepID = id.str();
    graph.emplace_back(stepPhase, StepDescription(
        id, std::move(dependencies),
        [options, stepID, work](StepContext& ctx) -> llvm::Error {
          ctx.log(LogLevel::Debug, "starting");
          if (auto error = simulateWork(ctx, options.stepDuration))
            return error;
          if (stepID == options.failingStep)
            return llvm::make_error<llvm::StringError>(
                "simulated failure", llvm::inconvertibleErrorCode());
          work(ctx);
          return llvm::Error::success();
        },
        weight));
  };

  addStep(BuildPhase::Validating, "validate", {}, 1,
          [spec](StepContext& ctx) {
    ctx.log(LogLevel::Note,
            llvm::formatv("validated {0} image for {1} with {2} init",
                          spec.base, spec.architecture, spec.init));
  });

  addStep(BuildPhase::Building, "resolve-packages", { "validate" }, 2,
          [spec](StepContext& ctx) {
    ctx.log(LogLevel::Note, llvm::formatv("resolved {0} packages for {1}",
                                          spec.packages.size(), spec.base));
  });
  addStep(BuildPhase::Building, "generate-configs", { "validate" }, 1,
          [spec](StepContext& ctx) {
    ctx.log(LogLevel::Note,
            llvm::formatv("generated configuration for kernel {0}",
                          spec.kernelVersion));
  });
  addStep(BuildPhase::Building, "generate-dockerfile", { "resolve-packages" },
          1, [spec](StepContext& ctx) {
    ctx.log(LogLevel::Note, "generated Dockerfile from " + spec.base +
            ":latest");
  });
  addStep(BuildPhase::Building, "docker-build",
          { "generate-dockerfile", "generate-configs" }, 10,
          [imageName, shortHash](StepContext& ctx) {
    const TierLimits& limits = ctx.getTierLimits();
    ctx.log(LogLevel::Note,
            llvm::formatv("built image (memory {0}, cpus {1}, pids {2})",
                          limits.memory, limits.cpus, limits.pidsLimit));
    ctx.addArtifact("image://forgeline/" + imageName + ":" + shortHash);
  });

  addStep(BuildPhase::ArtifactGenerating, "generate-iso", { "docker-build" },
          8, [imageName, shortHash](StepContext& ctx) {
    ctx.addArtifact("iso://" + imageName + "-" + shortHash + ".iso");
  });

  std::vector<std::string> artifacts = context.artifacts;
  std::string buildID = context.buildID;
  addStep(BuildPhase::Uploading, "upload", { "generate-iso" }, 1,
          [artifacts, buildID](StepContext& ctx) {
    for (const auto& artifact: artifacts) {
      StringRef name = StringRef(artifact).rsplit('/').second;
      if (name.empty())
        name = artifact;
      ctx.addArtifact("download://" + buildID + "/" + name.str());
    }
  });

  // Dependencies on steps of earlier phases are met by the phase order.
  llvm::StringSet<> inPhase;
  for (const auto& node: graph) {
    if (node.first == phase)
      inPhase.insert(node.second.id);
  }

  std::vector<StepDescription> steps;
  for (auto& node: graph) {
    if (node.first != phase)
      continue;
    StepDescription& step = node.second;
    step.dependencies.erase(
        std::remove_if(step.dependencies.begin(), step.dependencies.end(),
                       [&](const std::string& dependency) {
                         return !inPhase.count(dependency);
                       }),
        step.dependencies.end());
    steps.push_back(std::move(step));
  }
  return steps;
}
