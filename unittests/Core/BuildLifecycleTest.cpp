//===- unittests/Core/BuildLifecycleTest.cpp ------------------------------===//
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

#include "forgeline/Core/BuildLifecycle.h"

#include "forgeline/Basic/ExecutionQueue.h"
#include "forgeline/Core/ArtifactCache.h"
#include "forgeline/Core/BuildStore.h"
#include "forgeline/Core/CancellationRegistry.h"
#include "forgeline/Core/StepScheduler.h"

#include "TestSupport.h"

#include "llvm/ADT/STLExtras.h"

#include "gtest/gtest.h"

#include <functional>
#include <map>
#include <mutex>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;
using namespace forgeline::unittests;

namespace {

/// A plan built from per phase step lists.
class TestPlan : public BuildPlan {
  std::mutex mutex;

public:
  std::map<BuildPhase, std::vector<StepDescription>> steps;
  std::vector<BuildPhase> requestedPhases;
  std::vector<std::string> cleanedUp;

  std::vector<StepDescription> getSteps(BuildPhase phase,
                                        const BuildContext&) override {
    std::lock_guard<std::mutex> lock(mutex);
    requestedPhases.push_back(phase);
    auto it = steps.find(phase);
    if (it == steps.end())
      return {};
    return it->second;
  }

  void cleanup(const BuildContext& context) override {
    std::lock_guard<std::mutex> lock(mutex);
    cleanedUp.push_back(context.buildID);
  }

  void add(BuildPhase phase, StringRef id, StepAction action) {
    steps[phase].emplace_back(id, std::vector<std::string>{},
                              std::move(action));
  }
};

class RecordingLifecycleDelegate : public BuildLifecycleDelegate {
  std::mutex mutex;

public:
  std::vector<BuildPhase> phases;

  void phaseChanged(StringRef, BuildPhase, BuildPhase to) override {
    std::lock_guard<std::mutex> lock(mutex);
    phases.push_back(to);
  }
};

/// A store whose every operation fails.
class BrokenBuildStore : public BuildStore {
public:
  bool saveBuildPhase(StringRef, BuildPhase, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool appendLog(StringRef, StringRef, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool saveJobState(const Job&, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool loadJob(StringRef, Job*, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool loadBuildPhase(StringRef, BuildPhase*, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool getBuildLog(StringRef, std::vector<std::string>&,
                   std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
  bool getJobIDs(std::vector<std::string>&, std::string* error_out) override {
    *error_out = "disk full";
    return false;
  }
};

StepAction produce(StringRef artifact) {
  std::string ref = artifact.str();
  return [ref](StepContext& context) {
    context.addArtifact(ref);
    return llvm::Error::success();
  };
}

StepAction fail(StringRef message) {
  std::string text = message.str();
  return [text](StepContext&) -> llvm::Error {
    return llvm::make_error<llvm::StringError>(text,
                                               llvm::inconvertibleErrorCode());
  };
}

class BuildLifecycleTest : public ::testing::Test {
protected:
  NullExecutionQueueDelegate queueDelegate;
  CapturingLogger logger;
  std::unique_ptr<ExecutionQueue> queue;
  std::unique_ptr<StepScheduler> scheduler;
  InMemoryCancellationRegistry cancellation;
  FakeClock clock;
  std::unique_ptr<InMemoryArtifactCache> cache;
  std::unique_ptr<BuildStore> store;
  RecordingLifecycleDelegate delegate;
  std::unique_ptr<BuildLifecycle> lifecycle;
  TestPlan plan;

  void SetUp() override {
    queue = createLaneBasedExecutionQueue(queueDelegate, 4,
                                          SchedulerAlgorithm::FIFO);
    scheduler.reset(new StepScheduler(*queue, logger));
    cache.reset(new InMemoryArtifactCache(clock.source()));
    store = createInMemoryBuildStore();
    makeLifecycle(store.get());
  }

  void makeLifecycle(BuildStore* buildStore) {
    LifecycleOptions options;
    options.cacheTTL = 3600;
    lifecycle.reset(new BuildLifecycle(*scheduler, cancellation, cache.get(),
                                       buildStore, logger, options, &delegate,
                                       clock.source()));
  }

  static Job makeJob(StringRef id,
                     StringRef spec = R"({"base": "arch", "name": "desk"})") {
    Job job;
    job.id = id.str();
    job.spec = spec.str();
    job.tier = Tier::Standard;
    return job;
  }

  void addStandardSteps() {
    plan.add(BuildPhase::Validating, "validate", StepAction());
    plan.add(BuildPhase::Building, "docker-build", produce("image://desk"));
    plan.add(BuildPhase::ArtifactGenerating, "generate-iso",
             produce("iso://desk.iso"));
    plan.add(BuildPhase::Uploading, "upload", produce("download://desk.iso"));
  }
};

TEST_F(BuildLifecycleTest, phasesInOrder) {
  addStandardSteps();
  BuildRecord record = lifecycle->run(makeJob("b1"), plan);

  EXPECT_TRUE(record.succeeded());
  EXPECT_EQ(BuildPhase::Complete, record.phase);
  EXPECT_EQ(BuildFailureKind::None, record.failureKind);
  EXPECT_FALSE(record.cacheHit);
  EXPECT_EQ(std::vector<BuildPhase>({
        BuildPhase::Parsing, BuildPhase::Validating, BuildPhase::Resolving,
        BuildPhase::Generating, BuildPhase::Building,
        BuildPhase::ArtifactGenerating, BuildPhase::Uploading,
        BuildPhase::Complete }),
    delegate.phases);
  EXPECT_EQ(std::vector<std::string>({ "image://desk", "iso://desk.iso",
                                       "download://desk.iso" }),
            record.artifacts);
  EXPECT_EQ(std::vector<std::string>({ "b1" }), plan.cleanedUp);

  // The record and the stored phase answer queries after the build.
  EXPECT_EQ(BuildPhase::Complete, *lifecycle->getBuildPhase("b1"));
  auto stored = lifecycle->getBuildRecord("b1");
  ASSERT_TRUE(stored.hasValue());
  EXPECT_EQ(record.artifacts, stored->artifacts);
  EXPECT_FALSE(lifecycle->getBuildPhase("unknown").hasValue());

  BuildPhase phase;
  std::string error;
  ASSERT_TRUE(store->loadBuildPhase("b1", &phase, &error));
  EXPECT_EQ(BuildPhase::Complete, phase);
  std::vector<std::string> log;
  ASSERT_TRUE(store->getBuildLog("b1", log, &error));
  EXPECT_TRUE(llvm::is_contained(log, "entered phase building"));
}

TEST_F(BuildLifecycleTest, forgetBuild) {
  addStandardSteps();
  lifecycle->run(makeJob("b1"), plan);
  lifecycle->requestCancellation("b2");
  lifecycle->run(makeJob("b2"), plan);
  EXPECT_EQ(2u, lifecycle->getNumRecords());
  EXPECT_TRUE(lifecycle->getRunningBuildIDs().empty());

  lifecycle->forgetBuild("b2");
  EXPECT_EQ(1u, lifecycle->getNumRecords());
  EXPECT_FALSE(lifecycle->getBuildRecord("b2").hasValue());
  EXPECT_FALSE(cancellation.isCancelled("b2"));
  EXPECT_TRUE(lifecycle->getBuildRecord("b1").hasValue());
}

TEST_F(BuildLifecycleTest, invalidSpecFailsInParsing) {
  addStandardSteps();
  BuildRecord record = lifecycle->run(makeJob("b1", R"({"base": "beos"})"),
                                      plan);

  EXPECT_EQ(BuildPhase::Failed, record.phase);
  EXPECT_EQ(BuildFailureKind::InvalidSpec, record.failureKind);
  EXPECT_EQ(BuildPhase::Parsing, record.failedPhase);
  EXPECT_NE(std::string::npos,
            record.failureReason.find("invalid build specification"));
  EXPECT_TRUE(plan.requestedPhases.empty());
  EXPECT_TRUE(plan.cleanedUp.empty());
}

TEST_F(BuildLifecycleTest, stepFailureFailsTheBuild) {
  addStandardSteps();
  plan.add(BuildPhase::Resolving, "resolve-packages", fail("no such package"));
  BuildRecord record = lifecycle->run(makeJob("b1"), plan);

  EXPECT_EQ(BuildPhase::Failed, record.phase);
  EXPECT_EQ(BuildFailureKind::StepFailed, record.failureKind);
  EXPECT_EQ(BuildPhase::Resolving, record.failedPhase);
  EXPECT_EQ("step 'resolve-packages' failed: no such package",
            record.failureReason);
  EXPECT_FALSE(llvm::is_contained(plan.requestedPhases, BuildPhase::Building));
  EXPECT_EQ(BuildPhase::Failed, delegate.phases.back());
  EXPECT_EQ(std::vector<std::string>({ "b1" }), plan.cleanedUp);

  // Nothing is cached for a failed build.
  EXPECT_EQ(0u, cache->getStats().entries);
}

TEST_F(BuildLifecycleTest, invalidStepGraph) {
  plan.steps[BuildPhase::Generating].emplace_back(
      "dockerfile", std::vector<std::string>{ "missing" }, StepAction());
  BuildRecord record = lifecycle->run(makeJob("b1"), plan);
  EXPECT_EQ(BuildFailureKind::InvalidGraph, record.failureKind);
  EXPECT_EQ(BuildPhase::Generating, record.failedPhase);
}

TEST_F(BuildLifecycleTest, cacheHitSkipsBuildPhases) {
  addStandardSteps();
  BuildRecord first = lifecycle->run(makeJob("b1"), plan);
  ASSERT_TRUE(first.succeeded());
  EXPECT_EQ(1u, cache->getStats().entries);

  // The same specification, written differently.
  plan.requestedPhases.clear();
  delegate.phases.clear();
  BuildRecord second = lifecycle->run(
      makeJob("b2", R"({"name": "desk", "init": "systemd", "base": "arch"})"),
      plan);

  ASSERT_TRUE(second.succeeded());
  EXPECT_TRUE(second.cacheHit);
  EXPECT_FALSE(llvm::is_contained(delegate.phases, BuildPhase::Building));
  EXPECT_FALSE(llvm::is_contained(delegate.phases,
                                  BuildPhase::ArtifactGenerating));
  EXPECT_FALSE(llvm::is_contained(plan.requestedPhases, BuildPhase::Building));
  EXPECT_TRUE(llvm::is_contained(delegate.phases, BuildPhase::Uploading));

  // The cached build artifacts are reused, and uploaded again.
  EXPECT_EQ(std::vector<std::string>({ "image://desk", "iso://desk.iso",
                                       "download://desk.iso" }),
            second.artifacts);
  EXPECT_EQ(1u, cache->getStats().hits);
}

TEST_F(BuildLifecycleTest, expiredCacheEntryRebuilds) {
  addStandardSteps();
  ASSERT_TRUE(lifecycle->run(makeJob("b1"), plan).succeeded());

  clock.advance(3600);
  BuildRecord second = lifecycle->run(makeJob("b2"), plan);
  ASSERT_TRUE(second.succeeded());
  EXPECT_FALSE(second.cacheHit);
  EXPECT_EQ(1u, cache->getStats().expired);
}

TEST_F(BuildLifecycleTest, cancelledBeforeStart) {
  addStandardSteps();
  EXPECT_TRUE(lifecycle->requestCancellation("b1"));
  EXPECT_FALSE(lifecycle->requestCancellation("b1"));

  BuildRecord record = lifecycle->run(makeJob("b1"), plan);
  EXPECT_EQ(BuildPhase::Failed, record.phase);
  EXPECT_TRUE(record.cancelled());
  EXPECT_TRUE(record.cancelRequested);
  EXPECT_EQ("Cancelled", record.failureReason);
  EXPECT_EQ(BuildPhase::Pending, record.failedPhase);
  EXPECT_TRUE(plan.requestedPhases.empty());
}

TEST_F(BuildLifecycleTest, cancelledBetweenPhases) {
  addStandardSteps();
  plan.steps[BuildPhase::Building].clear();
  plan.add(BuildPhase::Building, "docker-build", [&](StepContext& context) {
      lifecycle->requestCancellation(context.getBuildID());
      context.addArtifact("image://partial");
      return llvm::Error::success();
    });

  BuildRecord record = lifecycle->run(makeJob("b1"), plan);
  EXPECT_TRUE(record.cancelled());
  EXPECT_EQ(BuildPhase::Building, record.failedPhase);
  EXPECT_FALSE(llvm::is_contained(plan.requestedPhases,
                                  BuildPhase::ArtifactGenerating));
  EXPECT_EQ(std::vector<std::string>({ "b1" }), plan.cleanedUp);
  EXPECT_EQ(0u, cache->getStats().entries);
}

TEST_F(BuildLifecycleTest, interruptedStepEndsAsCancelled) {
  addStandardSteps();
  plan.steps[BuildPhase::Building].clear();
  plan.add(BuildPhase::Building, "docker-build", [&](StepContext& context) {
      lifecycle->requestCancellation(context.getBuildID());
      return llvm::make_error<llvm::StringError>(
          "interrupted", llvm::inconvertibleErrorCode());
    });

  BuildRecord record = lifecycle->run(makeJob("b1"), plan);
  EXPECT_EQ(BuildFailureKind::Cancelled, record.failureKind);
  EXPECT_EQ("Cancelled", record.failureReason);
}

TEST_F(BuildLifecycleTest, storeFailuresAreTolerated) {
  BrokenBuildStore broken;
  makeLifecycle(&broken);
  addStandardSteps();

  BuildRecord record = lifecycle->run(makeJob("b1"), plan);
  EXPECT_TRUE(record.succeeded());
  EXPECT_TRUE(logger.contains("unable to persist build phase: disk full"));
}

}
