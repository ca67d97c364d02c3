//===- unittests/Core/SQLiteBuildStoreTest.cpp ----------------------------===//
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

#include "forgeline/Core/BuildStore.h"

#include "forgeline/Core/BuildPhase.h"
#include "forgeline/Core/Job.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <sqlite3.h>

using namespace forgeline;
using namespace forgeline::core;

namespace {

class SQLiteBuildStoreTest : public ::testing::Test {
protected:
  llvm::SmallString<256> dbPath;

  void SetUp() override {
    auto ec = llvm::sys::fs::createTemporaryFile("forgeline", "db", dbPath);
    ASSERT_FALSE(bool(ec));
  }

  void TearDown() override {
    llvm::sys::fs::remove(dbPath);
  }

  std::unique_ptr<BuildStore> open() {
    std::string error;
    auto store = createSQLiteBuildStore(dbPath, &error);
    EXPECT_TRUE(store != nullptr) << error;
    return store;
  }

  static Job makeJob(StringRef id) {
    Job job;
    job.id = id.str();
    job.spec = "{\"base\":\"arch\"}";
    job.tenantKey = "tenant";
    job.tier = Tier::Premium;
    job.priority = getTierPriority(Tier::Premium);
    job.maxAttempts = 3;
    job.submittedAt = 1234.5;
    return job;
  }
};

TEST_F(SQLiteBuildStoreTest, jobsRoundTrip) {
  {
    auto store = open();
    ASSERT_TRUE(store);

    std::string error;
    Job job = makeJob("job-1");
    ASSERT_TRUE(store->saveJobState(job, &error)) << error;
    ASSERT_TRUE(store->saveJobState(makeJob("job-2"), &error)) << error;

    // Saving again replaces the record.
    job.state = JobState::Failed;
    job.attempts = 1;
    job.lastError = "boom";
    job.readyAt = 1240;
    ASSERT_TRUE(store->saveJobState(job, &error)) << error;
  }

  // The records survive reopening the database.
  auto store = open();
  ASSERT_TRUE(store);

  std::string error;
  std::vector<std::string> ids;
  ASSERT_TRUE(store->getJobIDs(ids, &error)) << error;
  EXPECT_EQ(std::vector<std::string>({ "job-1", "job-2" }), ids);

  Job loaded;
  ASSERT_TRUE(store->loadJob("job-1", &loaded, &error)) << error;
  EXPECT_EQ("job-1", loaded.id);
  EXPECT_EQ("{\"base\":\"arch\"}", loaded.spec);
  EXPECT_EQ("tenant", loaded.tenantKey);
  EXPECT_EQ(Tier::Premium, loaded.tier);
  EXPECT_EQ(1, loaded.priority);
  EXPECT_EQ(JobState::Failed, loaded.state);
  EXPECT_EQ(1u, loaded.attempts);
  EXPECT_EQ(3u, loaded.maxAttempts);
  EXPECT_EQ("boom", loaded.lastError);
  EXPECT_EQ(1234.5, loaded.submittedAt);
  EXPECT_EQ(1240, loaded.readyAt);

  error.clear();
  EXPECT_FALSE(store->loadJob("missing", &loaded, &error));
  EXPECT_EQ("", error);
}

TEST_F(SQLiteBuildStoreTest, phasesAndLogs) {
  auto store = open();
  ASSERT_TRUE(store);

  std::string error;
  BuildPhase phase;
  EXPECT_FALSE(store->loadBuildPhase("build-1", &phase, &error));
  EXPECT_EQ("", error);

  ASSERT_TRUE(store->saveBuildPhase("build-1", BuildPhase::Building, &error));
  ASSERT_TRUE(store->saveBuildPhase("build-1", BuildPhase::Complete, &error));
  ASSERT_TRUE(store->loadBuildPhase("build-1", &phase, &error)) << error;
  EXPECT_EQ(BuildPhase::Complete, phase);

  ASSERT_TRUE(store->appendLog("build-1", "first", &error)) << error;
  ASSERT_TRUE(store->appendLog("build-2", "other", &error)) << error;
  ASSERT_TRUE(store->appendLog("build-1", "second", &error)) << error;

  std::vector<std::string> messages;
  ASSERT_TRUE(store->getBuildLog("build-1", messages, &error)) << error;
  EXPECT_EQ(std::vector<std::string>({ "first", "second" }), messages);

  messages.clear();
  ASSERT_TRUE(store->getBuildLog("build-3", messages, &error)) << error;
  EXPECT_TRUE(messages.empty());
}

TEST_F(SQLiteBuildStoreTest, dump) {
  auto store = open();
  ASSERT_TRUE(store);

  std::string error;
  ASSERT_TRUE(store->saveJobState(makeJob("job-1"), &error)) << error;
  ASSERT_TRUE(store->saveBuildPhase("job-1", BuildPhase::Uploading, &error));

  std::string output;
  llvm::raw_string_ostream os(output);
  store->dump(os);
  os.flush();
  EXPECT_NE(std::string::npos, output.find("job job-1 {"));
  EXPECT_NE(std::string::npos, output.find("tenant_key: \"tenant\""));
  EXPECT_NE(std::string::npos, output.find("build job-1: uploading"));
}

TEST_F(SQLiteBuildStoreTest, schemaMismatchDiscardsContents) {
  {
    auto store = open();
    ASSERT_TRUE(store);
    std::string error;
    ASSERT_TRUE(store->saveJobState(makeJob("job-1"), &error)) << error;
  }

  // Pretend the database was written by an older version.
  sqlite3* db = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(dbPath.c_str(), &db));
  EXPECT_EQ(SQLITE_OK, sqlite3_exec(db, "UPDATE info SET version = 1;",
                                    nullptr, nullptr, nullptr));
  sqlite3_close(db);

  auto store = open();
  ASSERT_TRUE(store);
  std::string error;
  std::vector<std::string> ids;
  ASSERT_TRUE(store->getJobIDs(ids, &error)) << error;
  EXPECT_TRUE(ids.empty());
}

TEST_F(SQLiteBuildStoreTest, recreatedDatabaseReopens) {
  {
    auto store = open();
    ASSERT_TRUE(store);
  }

  sqlite3* db = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(dbPath.c_str(), &db));
  EXPECT_EQ(SQLITE_OK, sqlite3_exec(db, "UPDATE info SET version = 1;",
                                    nullptr, nullptr, nullptr));
  sqlite3_close(db);

  {
    auto store = open();
    ASSERT_TRUE(store);
    std::string error;
    ASSERT_TRUE(store->saveJobState(makeJob("job-2"), &error)) << error;
  }

  // The recreated database has the current version and keeps its contents.
  auto store = open();
  ASSERT_TRUE(store);
  Job job;
  std::string error;
  ASSERT_TRUE(store->loadJob("job-2", &job, &error)) << error;
  EXPECT_EQ("job-2", job.id);
}

TEST_F(SQLiteBuildStoreTest, failedInitializationReleasesDatabase) {
  {
    auto store = open();
    ASSERT_TRUE(store);
  }

  // A current version with a damaged table cannot prepare its statements.
  sqlite3* db = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(dbPath.c_str(), &db));
  EXPECT_EQ(SQLITE_OK, sqlite3_exec(db, "DROP TABLE build_logs;",
                                    nullptr, nullptr, nullptr));
  sqlite3_close(db);

  std::string error;
  auto store = createSQLiteBuildStore(dbPath, &error);
  EXPECT_TRUE(store == nullptr);
  EXPECT_NE(std::string::npos, error.find("no such table: build_logs"))
    << error;

  // No connection is left holding the file.
  ASSERT_EQ(SQLITE_OK, sqlite3_open(dbPath.c_str(), &db));
  EXPECT_EQ(SQLITE_OK, sqlite3_exec(db, "BEGIN EXCLUSIVE; COMMIT;",
                                    nullptr, nullptr, nullptr));
  sqlite3_close(db);
}

TEST_F(SQLiteBuildStoreTest, lookupsEndTheirReads) {
  auto store = open();
  ASSERT_TRUE(store);

  std::string error;
  ASSERT_TRUE(store->saveJobState(makeJob("job-1"), &error)) << error;
  ASSERT_TRUE(store->saveBuildPhase("job-1", BuildPhase::Building, &error));
  ASSERT_TRUE(store->appendLog("job-1", "message", &error)) << error;

  Job job;
  ASSERT_TRUE(store->loadJob("job-1", &job, &error)) << error;
  BuildPhase phase;
  ASSERT_TRUE(store->loadBuildPhase("job-1", &phase, &error)) << error;
  std::vector<std::string> messages;
  ASSERT_TRUE(store->getBuildLog("job-1", messages, &error)) << error;

  // Another connection can take an exclusive lock while the store is open.
  sqlite3* db = nullptr;
  ASSERT_EQ(SQLITE_OK, sqlite3_open(dbPath.c_str(), &db));
  EXPECT_EQ(SQLITE_OK, sqlite3_exec(db, "BEGIN EXCLUSIVE; COMMIT;",
                                    nullptr, nullptr, nullptr));
  sqlite3_close(db);
}

TEST_F(SQLiteBuildStoreTest, unopenableDatabase) {
  std::string error;
  auto store = createSQLiteBuildStore("/nonexistent-directory/forgeline.db",
                                      &error);
  EXPECT_TRUE(store == nullptr);
  EXPECT_NE("", error);
}

}
