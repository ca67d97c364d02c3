//===-- RunCommand.cpp ----------------------------------------------------===//
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
// This file implements the "run" subtool, which submits specifications to an
// in-process build service and waits for every build to finish.
//
//===----------------------------------------------------------------------===//

#include "forgeline/Commands/Commands.h"

#include "forgeline/Basic/Logging.h"
#include "forgeline/Core/BuildEvents.h"
#include "forgeline/Core/Job.h"
#include "forgeline/Service/BuildService.h"
#include "forgeline/Service/DryRunBuildPlan.h"
#include "forgeline/Service/ServiceConfig.h"

#include "CommandUtil.h"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace forgeline;
using namespace forgeline::basic;
using namespace forgeline::commands;
using namespace forgeline::core;
using namespace forgeline::service;

static void usage() {
  int optionWidth = 28;
  fprintf(stderr, "Usage: %s run [options] <spec-file>...\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-c, --config <PATH>",
          "load the service configuration from PATH");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--db <PATH>",
          "persist job state and build logs to the database at PATH");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "-j, --workers <N>",
          "run up to N builds at once");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--tenant <KEY>",
          "submit the builds on behalf of tenant KEY");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--tier <TIER>",
          "submit the builds at TIER (free, standard, premium)");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--log-level <LEVEL>",
          "log messages at LEVEL and above (error, warning, note, debug)");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--step-duration <SECONDS>",
          "make each build step take SECONDS");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--fail-step <NAME>",
          "make the build step NAME fail");
  ::exit(1);
}

int commands::executeRunCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args = argsIn;
  std::string configPath, dbPath, workers, tenantKey, tierName, logLevelName;
  DryRunBuildPlan::Options planOptions;
  while (!args.empty() && args[0][0] == '-' && args[0] != "-") {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      usage();
    } else if (option == "-c" || option == "--config") {
      if (!util::takeOptionArgument(option, args, &configPath))
        usage();
    } else if (option == "--db") {
      if (!util::takeOptionArgument(option, args, &dbPath))
        usage();
    } else if (option == "-j" || option == "--workers") {
      if (!util::takeOptionArgument(option, args, &workers))
        usage();
    } else if (option == "--tenant") {
      if (!util::takeOptionArgument(option, args, &tenantKey))
        usage();
    } else if (option == "--tier") {
      if (!util::takeOptionArgument(option, args, &tierName))
        usage();
    } else if (option == "--log-level") {
      if (!util::takeOptionArgument(option, args, &logLevelName))
        usage();
    } else if (option == "--step-duration") {
      std::string value;
      if (!util::takeOptionArgument(option, args, &value))
        usage();
      if (!util::parseSeconds(value, &planOptions.stepDuration)) {
        fprintf(stderr, "error: %s: invalid argument to '%s'\n\n",
                getProgramName(), option.c_str());
        usage();
      }
    } else if (option == "--fail-step") {
      if (!util::takeOptionArgument(option, args, &planOptions.failingStep))
        usage();
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      usage();
    }
  }

  if (args.empty()) {
    fprintf(stderr, "error: %s: no specifications given\n\n",
            getProgramName());
    usage();
  }

  // Load the configuration, then apply the command line overrides.
  ServiceConfig config;
  if (!configPath.empty()) {
    auto loaded = ServiceConfig::load(configPath);
    if (!loaded) {
      util::emitError(loaded.takeError());
      return 1;
    }
    config = *loaded;
  }
  if (!dbPath.empty())
    config.storePath = dbPath;
  if (!workers.empty()) {
    if (!util::parseUnsigned(workers, &config.workers) ||
        config.workers == 0) {
      util::emitError("invalid worker count '" + workers + "'");
      return 1;
    }
  }
  if (!logLevelName.empty() &&
      !parseLogLevel(logLevelName, &config.logLevel)) {
    util::emitError("invalid log level '" + logLevelName + "'");
    return 1;
  }
  Tier tier = Tier::Free;
  if (!tierName.empty() && !parseTier(tierName, &tier)) {
    util::emitError("invalid tier '" + tierName + "'");
    return 1;
  }

  auto logger = createStreamLogger(llvm::errs(), config.logLevel);
  DryRunBuildPlan plan(planOptions);
  auto serviceOrError = BuildService::create(config, *logger, plan);
  if (!serviceOrError) {
    util::emitError(serviceOrError.takeError());
    return 1;
  }
  auto& service = **serviceOrError;

  auto notifier = createLogStreamNotifier(llvm::outs());
  service.addNotifier(notifier.get());

  // Submit everything before starting the workers, so admission errors are
  // reported up front.
  bool hadError = false;
  std::vector<std::string> jobIDs;
  for (const auto& filename: args) {
    auto buffer = util::readFileContents(filename);
    if (!buffer) {
      util::emitError(buffer.takeError());
      hadError = true;
      continue;
    }

    auto jobID = service.submit((*buffer)->getBuffer(), tenantKey, tier);
    if (!jobID) {
      util::emitError(filename + ": " + llvm::toString(jobID.takeError()));
      hadError = true;
      continue;
    }
    logger->note(LoggingContext(*jobID, *jobID),
                 "submitted '" + filename + "'");
    jobIDs.push_back(*jobID);
  }

  service.start();
  service.waitUntilIdle();
  service.stop();

  for (const auto& jobID: jobIDs) {
    auto status = service.getJobStatus(jobID);
    if (!status) {
      util::emitError(status.takeError());
      hadError = true;
      continue;
    }
    if (status->state != JobState::Completed)
      hadError = true;
  }

  return hadError ? 1 : 0;
}
