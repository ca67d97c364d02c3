//===-- DBCommand.cpp -----------------------------------------------------===//
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
//
// This file implements the "db" subtool, for inspecting the state persisted by
// "run --db".
//
//===----------------------------------------------------------------------===//

#include "forgeline/Commands/Commands.h"

#include "forgeline/Core/BuildPhase.h"
#include "forgeline/Core/BuildStore.h"
#include "forgeline/Core/Job.h"

#include "CommandUtil.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace forgeline;
using namespace forgeline::commands;
using namespace forgeline::core;

static void usage() {
  fprintf(stderr, "Usage: %s db [--help] --db <PATH> <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  dump          -- Dump the database contents\n");
  fprintf(stderr, "  jobs          -- List the stored jobs\n");
  fprintf(stderr, "  log <BUILD>   -- Print the log of a build\n");
  fprintf(stderr, "\n");
  exit(1);
}

static int executeJobsCommand(BuildStore& store) {
  std::vector<std::string> ids;
  std::string error;
  if (!store.getJobIDs(ids, &error)) {
    util::emitError(error);
    return 1;
  }

  for (const auto& id: ids) {
    Job job;
    if (!store.loadJob(id, &job, &error)) {
      util::emitError("unable to load job '" + id + "': " + error);
      return 1;
    }

    llvm::outs() << id << "\t" << getJobStateName(job.state) << "\t"
                 << getTierName(job.tier) << "\tattempts=" << job.attempts;
    BuildPhase phase;
    error.clear();
    if (store.loadBuildPhase(id, &phase, &error)) {
      llvm::outs() << "\tphase=" << getBuildPhaseName(phase);
    } else if (!error.empty()) {
      util::emitError("unable to load phase of '" + id + "': " + error);
      return 1;
    }
    if (!job.lastError.empty())
      llvm::outs() << "\terror=" << job.lastError;
    llvm::outs() << "\n";
  }
  return 0;
}

static int executeLogCommand(BuildStore& store, StringRef buildID) {
  std::vector<std::string> messages;
  std::string error;
  if (!store.getBuildLog(buildID, messages, &error)) {
    util::emitError(error);
    return 1;
  }
  for (const auto& message: messages)
    llvm::outs() << message << "\n";
  return 0;
}

int commands::executeDBCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args = argsIn;
  std::string dbPath;
  while (!args.empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      usage();
    } else if (option == "--db") {
      if (!util::takeOptionArgument(option, args, &dbPath))
        usage();
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      usage();
    }
  }

  if (args.empty())
    usage();
  if (dbPath.empty()) {
    fprintf(stderr, "error: %s: missing '--db <PATH>'\n\n", getProgramName());
    usage();
  }

  // Do not create a database as a side effect of inspecting one.
  if (!llvm::sys::fs::exists(dbPath)) {
    util::emitError("no database at '" + dbPath + "'");
    return 1;
  }

  std::string error;
  auto store = createSQLiteBuildStore(dbPath, &error);
  if (!store) {
    util::emitError(error);
    return 1;
  }

  const std::string& command = args[0];
  if (command == "dump" && args.size() == 1) {
    store->dump(llvm::outs());
    return 0;
  } else if (command == "jobs" && args.size() == 1) {
    return executeJobsCommand(*store);
  } else if (command == "log" && args.size() == 2) {
    return executeLogCommand(*store, args[1]);
  } else if (command == "dump" || command == "jobs" || command == "log") {
    fprintf(stderr, "error: %s: invalid number of arguments\n\n",
            getProgramName());
    usage();
  }

  fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
          command.c_str());
  return 1;
}
