//===-- SQLiteBuildStore.cpp ----------------------------------------------===//
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

#include "forgeline/Basic/Defer.h"
#include "forgeline/Core/BuildRecords.pb.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <google/protobuf/text_format.h>

#include <cassert>
#include <mutex>

#include <sqlite3.h>

using namespace forgeline;
using namespace forgeline::core;

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

namespace {

proto::JobRecord toRecord(const Job& job) {
  proto::JobRecord record;
  record.set_id(job.id);
  record.set_spec(job.spec);
  record.set_tenant_key(job.tenantKey);
  record.set_tier(proto::JobRecord::Tier(job.tier));
  record.set_priority(job.priority);
  record.set_attempts(job.attempts);
  record.set_max_attempts(job.maxAttempts);
  record.set_state(proto::JobRecord::State(job.state));
  record.set_last_error(job.lastError);
  record.set_submitted_at(job.submittedAt);
  if (job.readyAt != 0)
    record.set_ready_at(job.readyAt);
  return record;
}

bool fromRecord(const proto::JobRecord& record, Job* job_out) {
  if (!proto::JobRecord::Tier_IsValid(record.tier()) ||
      !proto::JobRecord::State_IsValid(record.state()))
    return false;

  job_out->id = record.id();
  job_out->spec = record.spec();
  job_out->tenantKey = record.tenant_key();
  job_out->tier = Tier(record.tier());
  job_out->priority = record.priority();
  job_out->attempts = record.attempts();
  job_out->maxAttempts = record.max_attempts();
  job_out->state = JobState(record.state());
  job_out->lastError = record.last_error();
  job_out->submittedAt = record.submitted_at();
  job_out->readyAt = record.has_ready_at() ? record.ready_at() : 0;
  return true;
}

class SQLiteBuildStore : public BuildStore {
  /// Version History:
  /// * 2: Job records stored as serialized messages.
  /// * 1: Pre-history
  static const int currentSchemaVersion = 2;

  std::string path;

  sqlite3 *db = nullptr;

  /// The mutex to protect all access to the database and statements.
  std::mutex dbMutex;

  std::string getCurrentErrorMessage() {
    int err_code = sqlite3_errcode(db);
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "error: accessing build store \"" << filename << "\": "
              << err_message;

    if (err_code == SQLITE_BUSY || err_code == SQLITE_LOCKED) {
      outStream << " Possibly another forgeline process is using the same "
        "database.";
    }

    outStream.flush();
    return out;
  }

  bool createSchema(std::string *error_out) {
    char *cError = nullptr;

    // Create the schema in a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr,
                              &cError);
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE info ("
             "id INTEGER PRIMARY KEY, "
             "version INTEGER);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      char* query = sqlite3_mprintf(
        "INSERT INTO info VALUES (0, %d);", currentSchemaVersion);
      result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
      sqlite3_free(query);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE jobs ("
             "id TEXT PRIMARY KEY, "
             "record BLOB);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE build_phases ("
             "build_id TEXT PRIMARY KEY, "
             "phase TEXT);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE build_logs ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT, "
             "build_id TEXT, "
             "message TEXT);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      // Logs are always read per build.
      result = sqlite3_exec(
          db, "CREATE INDEX build_logs_idx ON build_logs (build_id);",
          nullptr, nullptr, &cError);
    }

    // Sync changes to disk.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
    }

    if (result != SQLITE_OK) {
      *error_out = (std::string("unable to initialize database (") +
                    (cError ? cError : sqlite3_errstr(result)) + ")");
      sqlite3_free(cError);
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    return true;
  }

  bool open(std::string *error_out) {
    // The db is opened lazily whenever an operation on it occurs. Thus if it is
    // already open, we don't need to do any further work.
    if (db) return true;

    // A connection which failed to initialize is never left half open.
    if (!openDatabase(error_out)) {
      close();
      return false;
    }
    return true;
  }

  bool openDatabase(std::string *error_out) {
    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open database: " + std::string(
          sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    // Check the schema version.
    int version = -1;
    sqlite3_stmt* stmt;
    result = sqlite3_prepare_v2(
      db, "SELECT version FROM info LIMIT 1",
      -1, &stmt, nullptr);
    if (result != SQLITE_ERROR) {
      if (result != SQLITE_OK) {
        *error_out = getCurrentErrorMessage();
        return false;
      }
      result = sqlite3_step(stmt);
      if (result == SQLITE_ROW) {
        assert(sqlite3_column_count(stmt) == 1);
        version = sqlite3_column_int(stmt, 0);
      } else if (result != SQLITE_DONE) {
        *error_out = getCurrentErrorMessage();
        sqlite3_finalize(stmt);
        return false;
      }
      sqlite3_finalize(stmt);
    }

    if (version != currentSchemaVersion) {
      // Always recreate the database from scratch when the schema changes.
      sqlite3_close(db);
      db = nullptr;

      if (auto ec = llvm::sys::fs::remove(path)) {
        *error_out = "unable to remove existing database: " + ec.message();
        return false;
      }

      result = sqlite3_open(path.c_str(), &db);
      if (result != SQLITE_OK) {
        *error_out = "unable to open database: " + std::string(
            sqlite3_errstr(result));
        sqlite3_close(db);
        db = nullptr;
        return false;
      }
      sqlite3_busy_timeout(db, 5000);

      if (!createSchema(error_out))
        return false;
    }

    // Initialize prepared statements.
    result = sqlite3_prepare_v2(
      db, insertJobStmtSQL, -1, &insertJobStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findJobStmtSQL, -1, &findJobStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertPhaseStmtSQL, -1, &insertPhaseStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findPhaseStmtSQL, -1, &findPhaseStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, insertLogStmtSQL, -1, &insertLogStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_prepare_v2(
      db, findLogStmtSQL, -1, &findLogStmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    return true;
  }

  void close() {
    if (!db) return;

    // Destroy prepared statements.
    for (sqlite3_stmt** stmt: { &insertJobStmt, &findJobStmt,
            &insertPhaseStmt, &findPhaseStmt, &insertLogStmt, &findLogStmt }) {
      sqlite3_finalize(*stmt);
      *stmt = nullptr;
    }

    int result = sqlite3_close(db);
    (void)result; // use the variable if we're building without asserts
    assert(result == SQLITE_OK && "The database connection could not be closed. That means there are prepared statements that are not finalized.");
    db = nullptr;
  }

  /// Reset a cached statement for a new use.
  bool resetStatement(sqlite3_stmt* stmt, std::string* error_out) {
    int result = sqlite3_reset(stmt);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_clear_bindings(stmt);
    checkSQLiteResultOKReturnFalse(result);
    return true;
  }

  /// Run a cached statement which returns no rows.
  bool stepToCompletion(sqlite3_stmt* stmt, std::string* error_out) {
    int result = sqlite3_step(stmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }
    return true;
  }

public:
  SQLiteBuildStore(StringRef path) : path(path) { }

  virtual ~SQLiteBuildStore() {
    std::lock_guard<std::mutex> guard(dbMutex);
    if (db)
      close();
  }

  /// Open the database eagerly, so that errors surface at creation.
  bool initialize(std::string* error_out) {
    std::lock_guard<std::mutex> guard(dbMutex);
    return open(error_out);
  }

  /// @name BuildStore API
  /// @{

  static constexpr const char *insertJobStmtSQL = (
      "INSERT INTO jobs (id, record) VALUES (?, ?) "
      "ON CONFLICT(id) DO UPDATE SET record = excluded.record;");
  sqlite3_stmt* insertJobStmt = nullptr;

  static constexpr const char *findJobStmtSQL = (
      "SELECT record FROM jobs WHERE id == ?;");
  sqlite3_stmt* findJobStmt = nullptr;

  static constexpr const char *insertPhaseStmtSQL = (
      "INSERT OR REPLACE INTO build_phases (build_id, phase) VALUES (?, ?);");
  sqlite3_stmt* insertPhaseStmt = nullptr;

  static constexpr const char *findPhaseStmtSQL = (
      "SELECT phase FROM build_phases WHERE build_id == ?;");
  sqlite3_stmt* findPhaseStmt = nullptr;

  static constexpr const char *insertLogStmtSQL = (
      "INSERT INTO build_logs (build_id, message) VALUES (?, ?);");
  sqlite3_stmt* insertLogStmt = nullptr;

  static constexpr const char *findLogStmtSQL = (
      "SELECT message FROM build_logs WHERE build_id == ? ORDER BY id;");
  sqlite3_stmt* findLogStmt = nullptr;

  virtual bool saveBuildPhase(StringRef buildID, BuildPhase phase,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(insertPhaseStmt, error_out))
      return false;

    StringRef name = getBuildPhaseName(phase);
    int result = sqlite3_bind_text(insertPhaseStmt, /*index=*/1,
                                   buildID.data(), buildID.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertPhaseStmt, /*index=*/2,
                               name.data(), name.size(), SQLITE_STATIC);
    checkSQLiteResultOKReturnFalse(result);

    return stepToCompletion(insertPhaseStmt, error_out);
  }

  virtual bool appendLog(StringRef buildID, StringRef message,
                         std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(insertLogStmt, error_out))
      return false;

    int result = sqlite3_bind_text(insertLogStmt, /*index=*/1,
                                   buildID.data(), buildID.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_text(insertLogStmt, /*index=*/2,
                               message.data(), message.size(),
                               SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    return stepToCompletion(insertLogStmt, error_out);
  }

  virtual bool saveJobState(const Job& job, std::string* error_out) override {
    std::string data;
    if (!toRecord(job).SerializeToString(&data)) {
      *error_out = "unable to encode record of job '" + job.id + "'";
      return false;
    }

    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(insertJobStmt, error_out))
      return false;

    int result = sqlite3_bind_text(insertJobStmt, /*index=*/1,
                                   job.id.data(), job.id.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);
    result = sqlite3_bind_blob(insertJobStmt, /*index=*/2,
                               data.data(), data.size(), SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    return stepToCompletion(insertJobStmt, error_out);
  }

  virtual bool loadJob(StringRef jobID, Job* job_out,
                       std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(findJobStmt, error_out))
      return false;

    int result = sqlite3_bind_text(findJobStmt, /*index=*/1,
                                   jobID.data(), jobID.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    // End the read as soon as the row was consumed.
    forgeline_defer { sqlite3_reset(findJobStmt); };

    // If the job wasn't found, we are done.
    result = sqlite3_step(findJobStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    assert(sqlite3_column_count(findJobStmt) == 1);
    proto::JobRecord record;
    if (!record.ParseFromArray(sqlite3_column_blob(findJobStmt, 0),
                               sqlite3_column_bytes(findJobStmt, 0)) ||
        !fromRecord(record, job_out)) {
      *error_out = "malformed record for job '" + jobID.str() + "'";
      return false;
    }

    return true;
  }

  virtual bool loadBuildPhase(StringRef buildID, BuildPhase* phase_out,
                              std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(findPhaseStmt, error_out))
      return false;

    int result = sqlite3_bind_text(findPhaseStmt, /*index=*/1,
                                   buildID.data(), buildID.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    forgeline_defer { sqlite3_reset(findPhaseStmt); };

    result = sqlite3_step(findPhaseStmt);
    if (result == SQLITE_DONE)
      return false;
    if (result != SQLITE_ROW) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    StringRef name(
        reinterpret_cast<const char*>(sqlite3_column_text(findPhaseStmt, 0)),
        sqlite3_column_bytes(findPhaseStmt, 0));
    if (!parseBuildPhase(name, phase_out)) {
      *error_out = "unknown phase '" + name.str() + "' for build '" +
        buildID.str() + "'";
      return false;
    }

    return true;
  }

  virtual bool getBuildLog(StringRef buildID,
                           std::vector<std::string>& messages_out,
                           std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out) || !resetStatement(findLogStmt, error_out))
      return false;

    int result = sqlite3_bind_text(findLogStmt, /*index=*/1,
                                   buildID.data(), buildID.size(),
                                   SQLITE_TRANSIENT);
    checkSQLiteResultOKReturnFalse(result);

    forgeline_defer { sqlite3_reset(findLogStmt); };

    while ((result = sqlite3_step(findLogStmt)) == SQLITE_ROW) {
      messages_out.emplace_back(
          reinterpret_cast<const char*>(sqlite3_column_text(findLogStmt, 0)),
          sqlite3_column_bytes(findLogStmt, 0));
    }
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    return true;
  }

  virtual bool getJobIDs(std::vector<std::string>& ids_out,
                         std::string* error_out) override {
    std::lock_guard<std::mutex> guard(dbMutex);

    if (!open(error_out)) {
      return false;
    }

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
      db, "SELECT id FROM jobs ORDER BY rowid;", -1, &stmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
      ids_out.emplace_back(
          reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)),
          sqlite3_column_bytes(stmt, 0));
    }
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }

    sqlite3_finalize(stmt);
    return true;
  }

  virtual void dump(raw_ostream& os) override {
    std::vector<std::string> ids;
    std::string error;
    if (!getJobIDs(ids, &error)) {
      os << error << "\n";
      return;
    }

    for (const auto& id: ids) {
      Job job;
      if (!loadJob(id, &job, &error)) {
        os << "job " << id << ": " << error << "\n";
        continue;
      }

      std::string text;
      google::protobuf::TextFormat::Printer printer;
      printer.SetSingleLineMode(true);
      printer.PrintToString(toRecord(job), &text);
      os << "job " << id << " { " << StringRef(text).rtrim() << " }\n";

      BuildPhase phase;
      if (loadBuildPhase(id, &phase, &error))
        os << "build " << id << ": " << getBuildPhaseName(phase) << "\n";
    }
  }

  /// @}
};

}

std::unique_ptr<BuildStore> core::createSQLiteBuildStore(
    StringRef path, std::string* error_out) {
  std::unique_ptr<SQLiteBuildStore> store(new SQLiteBuildStore(path));
  if (!store->initialize(error_out))
    return nullptr;
  return std::move(store);
}
