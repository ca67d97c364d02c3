//===- BuildStore.h ---------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_CORE_BUILDSTORE_H
#define FORGELINE_CORE_BUILDSTORE_H

#include "forgeline/Basic/LLVM.h"
#include "forgeline/Core/BuildPhase.h"
#include "forgeline/Core/Job.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace forgeline {
namespace core {

/// Persistent storage of jobs, build phases and build logs.
///
/// The engine calls the store synchronously at job and phase transitions and
/// treats its failures as non-fatal: they are logged, never propagated into
/// the queue or the lifecycle state. Implementations must be thread safe.
class BuildStore {
public:
  virtual ~BuildStore();

  /// Record the current phase of a build.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool saveBuildPhase(StringRef buildID, BuildPhase phase,
                              std::string* error_out) = 0;

  /// Append a message to the log of a build.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool appendLog(StringRef buildID, StringRef message,
                         std::string* error_out) = 0;

  /// Record the current state of a job, replacing any previous record.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool saveJobState(const Job& job, std::string* error_out) = 0;

  /// Look up the stored record of a job.
  ///
  /// \param job_out [out] The job, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the store had a record for the job.
  virtual bool loadJob(StringRef jobID, Job* job_out,
                       std::string* error_out) = 0;

  /// Look up the stored phase of a build.
  ///
  /// \param phase_out [out] The phase, if found.
  /// \param error_out [out] Error string if an error occurred.
  /// \returns True if the store had a phase for the build.
  virtual bool loadBuildPhase(StringRef buildID, BuildPhase* phase_out,
                              std::string* error_out) = 0;

  /// Get the log of a build, oldest message first.
  ///
  /// \param messages_out [out] The messages will be appended to this vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getBuildLog(StringRef buildID,
                           std::vector<std::string>& messages_out,
                           std::string* error_out) = 0;

  /// Get the identifiers of all stored jobs, in submission order.
  ///
  /// \param ids_out [out] The identifiers will be appended to this vector.
  /// \param error_out [out] Error string if return value is false.
  virtual bool getJobIDs(std::vector<std::string>& ids_out,
                         std::string* error_out) = 0;

  /// Dump a debug view of the store contents
  virtual void dump(raw_ostream& os) { (void)os; }
};

/// Create a store held in process memory.
std::unique_ptr<BuildStore> createInMemoryBuildStore();

/// Create a store backed by a SQLite3 database.
///
/// If the schema of an existing database does not match the current version,
/// its contents are discarded.
///
/// \param path The database file, which is created if missing.
/// \param error_out [out] Error string if the database could not be opened.
/// \returns The store, or null on error.
std::unique_ptr<BuildStore> createSQLiteBuildStore(StringRef path,
                                                   std::string* error_out);

}
}

#endif
