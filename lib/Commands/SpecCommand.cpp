//===-- SpecCommand.cpp ---------------------------------------------------===//
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
// This file implements the "spec" subtool, for checking build specifications
// without running them.
//
//===----------------------------------------------------------------------===//

#include "forgeline/Commands/Commands.h"

#include "forgeline/Core/BuildSpec.h"

#include "CommandUtil.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace forgeline;
using namespace forgeline::commands;
using namespace forgeline::core;

static void usage() {
  fprintf(stderr, "Usage: %s spec [--help] <command> <spec-file>\n",
          getProgramName());
  fprintf(stderr, "\n");
  fprintf(stderr, "Available commands:\n");
  fprintf(stderr, "  validate      -- Check a specification\n");
  fprintf(stderr, "  hash          -- Print the content hash of a specification\n");
  fprintf(stderr, "  canonical     -- Print the normalized specification\n");
  fprintf(stderr, "\n");
  fprintf(stderr, "A <spec-file> of '-' reads standard input.\n");
  exit(1);
}

static llvm::Expected<BuildSpec> loadSpec(StringRef filename) {
  auto buffer = util::readFileContents(filename);
  if (!buffer)
    return buffer.takeError();
  return BuildSpec::parse((*buffer)->getBuffer());
}

int commands::executeSpecCommand(const std::vector<std::string> &args) {
  if (args.empty() || args[0] == "--help")
    usage();

  const std::string& command = args[0];
  if (command != "validate" && command != "hash" && command != "canonical") {
    fprintf(stderr, "error: %s: unknown command '%s'\n", getProgramName(),
            command.c_str());
    return 1;
  }

  if (args.size() != 2) {
    fprintf(stderr, "error: %s: invalid number of arguments\n\n",
            getProgramName());
    usage();
  }

  auto spec = loadSpec(args[1]);
  if (!spec) {
    util::emitError(spec.takeError());
    return 1;
  }

  if (command == "validate") {
    llvm::outs() << args[1] << ": ok\n";
  } else if (command == "hash") {
    llvm::outs() << spec->hash() << "\n";
  } else {
    llvm::outs() << llvm::formatv("{0:2}", spec->toJSON()) << "\n";
  }
  return 0;
}
