//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "CommandUtil.h"
#include "forgeline/Commands/Commands.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>

using namespace forgeline;
using namespace forgeline::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  assert(programName.empty());
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return nullptr;
  
  return programName.c_str();
}

llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>> util::readFileContents(
    StringRef filename) {
  if (filename == "-") {
    auto bufferOrError = llvm::MemoryBuffer::getSTDIN();
    if (!bufferOrError) {
      auto ec = bufferOrError.getError();
      return llvm::make_error<llvm::StringError>(
          Twine("unable to read standard input (") + ec.message() + ")", ec);
    }
    return std::move(*bufferOrError);
  }

  SmallString<256> path(filename);
  llvm::sys::fs::make_absolute(path);

  auto bufferOrError = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrError) {
    auto ec = bufferOrError.getError();
    return llvm::make_error<llvm::StringError>(
        Twine("unable to read input \"") + path + "\" (" + ec.message() + ")",
        ec);
  }
  return std::move(*bufferOrError);
}

bool util::takeOptionArgument(StringRef option, std::vector<std::string>& args,
                              std::string* value_out) {
  if (args.empty()) {
    llvm::errs() << "error: " << getProgramName()
                 << ": missing argument to '" << option << "'\n\n";
    return false;
  }
  *value_out = args[0];
  args.erase(args.begin());
  return true;
}

bool util::parseUnsigned(StringRef text, unsigned* value_out) {
  return !text.getAsInteger(10, *value_out);
}

bool util::parseSeconds(StringRef text, double* value_out) {
  if (text.getAsDouble(*value_out))
    return false;
  return *value_out >= 0;
}

void util::emitError(llvm::Error error) {
  llvm::errs() << "error: " << getProgramName() << ": "
               << llvm::toString(std::move(error)) << "\n";
}

void util::emitError(const Twine& message) {
  llvm::errs() << "error: " << getProgramName() << ": " << message << "\n";
}
