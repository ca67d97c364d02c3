//===-- forgeline.cpp -----------------------------------------------------===//
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

#include "forgeline/Basic/Version.h"

#include "forgeline/Commands/Commands.h"

#include "llvm/Support/Path.h"

#include <cstdio>
#include <cstdlib>

using namespace forgeline;
using namespace forgeline::commands;

static void usage() {
  fprintf(stderr, "Usage: %s [--version] [--help] <command> [<args>]\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  run           -- Build specifications with the dry-run plan\n");
  fprintf(stderr, "  spec          -- Validate, hash or normalize a specification\n");
  fprintf(stderr, "  db            -- Inspect a build database\n");
  fprintf(stderr, "\n");
  exit(1);
}

int main(int argc, const char **argv) {
  setProgramName(llvm::sys::path::filename(argv[0]));

  // Expect the first argument to be the name of a subtool to delegate to.
  if (argc == 1 || std::string(argv[1]) == "--help")
    usage();

  if (std::string(argv[1]) == "--version") {
    // Print the version and exit.
    printf("%s\n", getForgelineFullVersion().c_str());
    return 0;
  }

  // Otherwise, expect a command name.
  std::string command(argv[1]);
  std::vector<std::string> args;
  for (int i = 2; i != argc; ++i) {
    args.push_back(argv[i]);
  }

  if (command == "run") {
    return executeRunCommand(args);
  } else if (command == "spec") {
    return executeSpecCommand(args);
  } else if (command == "db") {
    return executeDBCommand(args);
  } else {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    return 1;
  }
}
