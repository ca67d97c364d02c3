//===- unittests/Core/JobQueueTest.cpp ------------------------------------===//
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

#include "forgeline/Core/JobQueue.h"

#include "forgeline/Basic/Errors.h"
#include "forgeline/Core/BuildStore.h"

#include "TestSupport.h"

#include "gtest/gtest.h"

#include <thread>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::core;
using namespace forgeline::unittests;

namespace {

class RecordingQueueDelegate : public JobQueueDelegate {
public:
  std::vector<double> retryDelays;
  std::vector<DeadLetterRecord> deadLettered;
  std::vector<std::string> retired;

  void jobRetryScheduled(const Job&, double delaySeconds) override {
    retryDelays.push_back(delaySeconds);
  }
  void jobDeadLettered(const Job&, const DeadLetterRecord& record) override {
    deadLettered.push_back(record);
  }
  void jobRetired(StringRef jobID) override {
    retired.push_back(jobID.str());
  }
};

class JobQueueTest : public ::testing::Test {
protected:
  FakeClock clock;
  NullLogger logger;
  RecordingQueueDelegate delegate;
  JobQueueOptions options;

  JobQueueTest() {
    // Most tests are not about rate limiting.
    options.rateLimitMax = 0;
  }

  std::unique_ptr<JobQueue> makeQueue(BuildStore* store = nullptr) {
    return std::unique_ptr<JobQueue>(
        new JobQueue(options, logger, store, &delegate, clock.source()));
  }

  static JobSubmission submission(StringRef id, Tier tier = Tier::Free,
                                  StringRef tenantKey = "") {
    JobSubmission result;
    result.id = id.str();
    result.spec = "{\"base\":\"arch\"}";
    result.tier = tier;
    result.tenantKey = tenantKey.str();
    return result;
  }

  static std::string submit(JobQueue& queue, const JobSubmission& job) {
    auto id = queue.submit(job);
    EXPECT_TRUE(bool(id));
    if (!id) {
      ADD_FAILURE() << llvm::toString(id.takeError());
      return "";
    }
    return *id;
  }

  static JobState report(JobQueue& queue, StringRef id, bool success,
                         StringRef reason = "", bool retryable = true) {
    auto state = queue.reportResult(id, success, reason, retryable);
    if (!state) {
      ADD_FAILURE() << llvm::toString(state.takeError());
      return JobState::Queued;
    }
    return *state;
  }
};

TEST_F(JobQueueTest, generatesIdentifiers) {
  auto queue = makeQueue();
  JobSubmission job = submission("");
  std::string id = submit(*queue, job);
  EXPECT_TRUE(StringRef(id).startswith("job-"));

  auto status = queue->getStatus(id);
  ASSERT_TRUE(bool(status));
  EXPECT_EQ(JobState::Queued, status->state);
  EXPECT_EQ(0u, status->attempts);
}

TEST_F(JobQueueTest, premiumDequeuedBeforeFree) {
  for (bool premiumFirst: { false, true }) {
    auto queue = makeQueue();
    if (premiumFirst) {
      submit(*queue, submission("premium", Tier::Premium));
      submit(*queue, submission("free", Tier::Free));
    } else {
      submit(*queue, submission("free", Tier::Free));
      submit(*queue, submission("premium", Tier::Premium));
    }

    auto first = queue->tryDequeue();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ("premium", first->id);
    EXPECT_EQ(1, first->priority);
    auto second = queue->tryDequeue();
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ("free", second->id);
    EXPECT_FALSE(queue->tryDequeue().hasValue());
  }
}

TEST_F(JobQueueTest, submissionOrderWithinPriority) {
  auto queue = makeQueue();
  submit(*queue, submission("a", Tier::Standard));
  submit(*queue, submission("b", Tier::Free));
  submit(*queue, submission("c", Tier::Standard));
  submit(*queue, submission("d", Tier::Free));

  std::vector<std::string> order;
  while (auto job = queue->tryDequeue())
    order.push_back(job->id);
  EXPECT_EQ(std::vector<std::string>({ "a", "c", "b", "d" }), order);
}

TEST_F(JobQueueTest, tenantQuota) {
  auto queue = makeQueue();
  submit(*queue, submission("j1", Tier::Free, "tenant"));
  submit(*queue, submission("j2", Tier::Free, "tenant"));

  auto third = queue->submit(submission("j3", Tier::Free, "tenant"));
  ASSERT_FALSE(bool(third));
  errc code = errc::unknown;
  EXPECT_EQ("tenant 'tenant' already has 2 unfinished jobs (quota 2)",
            takeErrorMessage(third.takeError(), &code));
  EXPECT_EQ(errc::quota_exceeded, code);

  // Other tenants and anonymous submissions are unaffected.
  submit(*queue, submission("other", Tier::Free, "other-tenant"));
  submit(*queue, submission("anonymous-1"));
  submit(*queue, submission("anonymous-2"));
  submit(*queue, submission("anonymous-3"));

  // Finishing a job frees a slot, an active one does not.
  auto job = queue->tryDequeue();
  ASSERT_TRUE(job.hasValue());
  EXPECT_EQ("j1", job->id);
  EXPECT_EQ(errc::quota_exceeded,
            expectError(queue->submit(submission("j3", Tier::Free, "tenant"))));
  EXPECT_EQ(JobState::Completed, report(*queue, "j1", true));
  submit(*queue, submission("j3", Tier::Free, "tenant"));
}

TEST_F(JobQueueTest, quotaDisabled) {
  options.tenantQuota = 0;
  auto queue = makeQueue();
  for (int i = 0; i != 5; ++i)
    submit(*queue, submission("j" + std::to_string(i), Tier::Free, "tenant"));
  EXPECT_EQ(5u, queue->getStats().queued);
}

TEST_F(JobQueueTest, duplicateIdentifier) {
  auto queue = makeQueue();
  submit(*queue, submission("same"));
  EXPECT_EQ(errc::duplicate_job, expectError(queue->submit(submission("same"))));
}

TEST_F(JobQueueTest, retryWithBackoffThenDeadLetter) {
  auto queue = makeQueue();
  submit(*queue, submission("flaky", Tier::Free, "tenant"));

  std::vector<double> delays;
  for (unsigned attempt = 1; attempt <= 3; ++attempt) {
    auto job = queue->tryDequeue();
    ASSERT_TRUE(job.hasValue()) << "attempt " << attempt;
    EXPECT_EQ(attempt - 1, job->attempts);

    JobState state = report(*queue, "flaky", false, "exit status 1");
    if (attempt < 3) {
      EXPECT_EQ(JobState::Failed, state);
      auto status = queue->getStatus("flaky");
      ASSERT_TRUE(bool(status));
      EXPECT_EQ(JobState::Failed, status->state);
      EXPECT_EQ(attempt, status->attempts);
      EXPECT_EQ("exit status 1", status->reason);

      // The job is not eligible until its delay elapsed.
      double delay = delegate.retryDelays.back();
      delays.push_back(delay);
      clock.advance(delay - 0.5);
      EXPECT_FALSE(queue->tryDequeue().hasValue());
      EXPECT_EQ(1u, queue->getStats().retrying);
      clock.advance(0.5);
    } else {
      EXPECT_EQ(JobState::DeadLettered, state);
    }
  }

  EXPECT_EQ(std::vector<double>({ 5, 10 }), delays);

  auto status = queue->getStatus("flaky");
  ASSERT_TRUE(bool(status));
  EXPECT_EQ(JobState::DeadLettered, status->state);
  EXPECT_EQ(3u, status->attempts);

  ASSERT_EQ(1u, delegate.deadLettered.size());
  EXPECT_EQ("flaky", delegate.deadLettered[0].jobID);
  EXPECT_EQ("tenant", delegate.deadLettered[0].tenantKey);
  EXPECT_EQ(3u, delegate.deadLettered[0].attempts);
  EXPECT_EQ("exit status 1", delegate.deadLettered[0].reason);

  auto deadLetters = queue->getDeadLetters();
  ASSERT_EQ(1u, deadLetters.size());
  EXPECT_EQ("flaky", deadLetters[0].jobID);

  // Dead-lettered jobs are never retried.
  clock.advance(3600);
  EXPECT_FALSE(queue->tryDequeue().hasValue());

  // They no longer count against the quota.
  submit(*queue, submission("next", Tier::Free, "tenant"));
  submit(*queue, submission("next-2", Tier::Free, "tenant"));
}

TEST_F(JobQueueTest, backoffDelays) {
  options.backoffBase = 2;
  auto queue = makeQueue();
  EXPECT_EQ(2, queue->getBackoffDelay(1));
  EXPECT_EQ(4, queue->getBackoffDelay(2));
  EXPECT_EQ(8, queue->getBackoffDelay(3));
  EXPECT_EQ(1024, queue->getBackoffDelay(10));

  options.backoffCap = 30;
  auto capped = makeQueue();
  EXPECT_EQ(16, capped->getBackoffDelay(4));
  EXPECT_EQ(30, capped->getBackoffDelay(5));
  EXPECT_EQ(30, capped->getBackoffDelay(20));
}

TEST_F(JobQueueTest, retryWaitCountsAgainstQuota) {
  auto queue = makeQueue();
  submit(*queue, submission("j1", Tier::Free, "tenant"));
  ASSERT_TRUE(queue->tryDequeue().hasValue());
  EXPECT_EQ(JobState::Failed, report(*queue, "j1", false, "boom"));

  submit(*queue, submission("j2", Tier::Free, "tenant"));
  EXPECT_EQ(errc::quota_exceeded,
            expectError(queue->submit(submission("j3", Tier::Free, "tenant"))));
}

TEST_F(JobQueueTest, retryWaitsBehindQueuedJobs) {
  auto queue = makeQueue();
  submit(*queue, submission("retried"));
  ASSERT_TRUE(queue->tryDequeue().hasValue());
  report(*queue, "retried", false, "boom");

  submit(*queue, submission("fresh"));
  clock.advance(10);

  // The retry rejoins the queue behind the jobs submitted meanwhile.
  auto job = queue->tryDequeue();
  ASSERT_TRUE(job.hasValue());
  EXPECT_EQ("fresh", job->id);
  job = queue->tryDequeue();
  ASSERT_TRUE(job.hasValue());
  EXPECT_EQ("retried", job->id);
  EXPECT_EQ(1u, job->attempts);
}

TEST_F(JobQueueTest, nonRetryableFailure) {
  auto queue = makeQueue();
  submit(*queue, submission("cancelled"));
  ASSERT_TRUE(queue->tryDequeue().hasValue());
  EXPECT_EQ(JobState::Failed,
            report(*queue, "cancelled", false, "Cancelled", false));

  clock.advance(3600);
  EXPECT_FALSE(queue->tryDequeue().hasValue());
  EXPECT_TRUE(delegate.retryDelays.empty());
  EXPECT_TRUE(delegate.deadLettered.empty());

  auto stats = queue->getStats();
  EXPECT_EQ(1u, stats.failed);
  EXPECT_EQ(0u, stats.retrying);
  EXPECT_EQ(0u, stats.deadLettered);
}

TEST_F(JobQueueTest, perJobMaxAttempts) {
  auto queue = makeQueue();
  JobSubmission job = submission("once");
  job.maxAttempts = 1;
  submit(*queue, job);
  ASSERT_TRUE(queue->tryDequeue().hasValue());
  EXPECT_EQ(JobState::DeadLettered, report(*queue, "once", false, "boom"));
}

TEST_F(JobQueueTest, reportErrors) {
  auto queue = makeQueue();
  EXPECT_EQ(errc::unknown_job,
            expectError(queue->reportResult("missing", true)));

  // A queued job is not active.
  submit(*queue, submission("queued"));
  EXPECT_EQ(errc::unknown_job,
            expectError(queue->reportResult("queued", true)));

  EXPECT_EQ(errc::unknown_job, expectError(queue->getStatus("missing")));
}

TEST_F(JobQueueTest, resubmitDeadLettered) {
  options.maxAttempts = 1;
  auto queue = makeQueue();
  submit(*queue, submission("job"));

  EXPECT_EQ(errc::not_dead_lettered,
            expectError(queue->resubmitDeadLettered("job")));

  ASSERT_TRUE(queue->tryDequeue().hasValue());
  EXPECT_EQ(JobState::DeadLettered, report(*queue, "job", false, "boom"));
  EXPECT_EQ(1u, queue->getDeadLetters().size());

  llvm::Error resubmitted = queue->resubmitDeadLettered("job");
  EXPECT_FALSE(bool(resubmitted)) << llvm::toString(std::move(resubmitted));
  EXPECT_TRUE(queue->getDeadLetters().empty());

  auto job = queue->tryDequeue();
  ASSERT_TRUE(job.hasValue());
  EXPECT_EQ(0u, job->attempts);
  EXPECT_EQ(JobState::Completed, report(*queue, "job", true));
}

TEST_F(JobQueueTest, rateLimit) {
  options.rateLimitMax = 2;
  options.rateLimitWindow = 60;
  auto queue = makeQueue();
  for (int i = 0; i != 3; ++i)
    submit(*queue, submission("j" + std::to_string(i)));

  EXPECT_TRUE(queue->tryDequeue().hasValue());
  clock.advance(1);
  EXPECT_TRUE(queue->tryDequeue().hasValue());
  EXPECT_FALSE(queue->tryDequeue().hasValue());
  EXPECT_EQ(1u, queue->getStats().queued);

  // The window slides past the first dispatch.
  clock.advance(59);
  EXPECT_TRUE(queue->tryDequeue().hasValue());
}

TEST_F(JobQueueTest, statsAndRetention) {
  options.retainCompleted = 2;
  auto queue = makeQueue();
  for (int i = 0; i != 3; ++i) {
    std::string id = "j" + std::to_string(i);
    submit(*queue, submission(id));
    ASSERT_TRUE(queue->tryDequeue().hasValue());
    report(*queue, id, true);
  }
  submit(*queue, submission("queued"));
  submit(*queue, submission("active"));
  ASSERT_TRUE(queue->tryDequeue().hasValue());

  auto stats = queue->getStats();
  EXPECT_EQ(1u, stats.queued);
  EXPECT_EQ(1u, stats.active);
  EXPECT_EQ(2u, stats.completed);

  // The oldest finished job was forgotten.
  EXPECT_FALSE(queue->getJob("j0").hasValue());
  EXPECT_TRUE(queue->getJob("j2").hasValue());
  EXPECT_EQ(errc::unknown_job, expectError(queue->getStatus("j0")));
  EXPECT_EQ(std::vector<std::string>({ "j0" }), delegate.retired);
}

TEST_F(JobQueueTest, deadLetterRetention) {
  options.retainDeadLettered = 1;
  options.maxAttempts = 1;
  auto queue = makeQueue();
  for (StringRef id: { "d0", "d1" }) {
    submit(*queue, submission(id));
    ASSERT_TRUE(queue->tryDequeue().hasValue());
    EXPECT_EQ(JobState::DeadLettered, report(*queue, id, false, "broken"));
  }

  ASSERT_EQ(1u, queue->getDeadLetters().size());
  EXPECT_EQ("d1", queue->getDeadLetters()[0].jobID);
  EXPECT_FALSE(queue->getJob("d0").hasValue());
  EXPECT_EQ(std::vector<std::string>({ "d0" }), delegate.retired);
}

TEST_F(JobQueueTest, shutdown) {
  auto queue = makeQueue();
  std::thread waiter([&]() {
      EXPECT_FALSE(queue->dequeue().hasValue());
    });
  queue->shutdown();
  waiter.join();

  EXPECT_EQ(errc::shutting_down,
            expectError(queue->submit(submission("late"))));

  // Shut down queues are never waited on.
  queue->waitUntilIdle();
}

TEST_F(JobQueueTest, blockingDequeueWakesOnSubmit) {
  auto queue = makeQueue();
  Optional<Job> taken;
  std::thread worker([&]() { taken = queue->dequeue(); });
  submit(*queue, submission("wake"));
  worker.join();
  ASSERT_TRUE(taken.hasValue());
  EXPECT_EQ("wake", taken->id);
  EXPECT_EQ(JobState::Active, taken->state);
}

TEST_F(JobQueueTest, persistsStateChanges) {
  auto store = createInMemoryBuildStore();
  auto queue = makeQueue(store.get());
  submit(*queue, submission("stored", Tier::Standard, "tenant"));

  Job job;
  std::string error;
  ASSERT_TRUE(store->loadJob("stored", &job, &error)) << error;
  EXPECT_EQ(JobState::Queued, job.state);
  EXPECT_EQ(Tier::Standard, job.tier);
  EXPECT_EQ("tenant", job.tenantKey);

  ASSERT_TRUE(queue->tryDequeue().hasValue());
  ASSERT_TRUE(store->loadJob("stored", &job, &error)) << error;
  EXPECT_EQ(JobState::Active, job.state);

  report(*queue, "stored", false, "boom");
  ASSERT_TRUE(store->loadJob("stored", &job, &error)) << error;
  EXPECT_EQ(JobState::Failed, job.state);
  EXPECT_EQ(1u, job.attempts);
  EXPECT_EQ("boom", job.lastError);
  EXPECT_EQ(clock.now() + 5, job.readyAt);
}

}
