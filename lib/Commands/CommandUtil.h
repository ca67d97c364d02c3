//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_COMMANDS_COMMANDUTIL_H
#define FORGELINE_COMMANDS_COMMANDUTIL_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace llvm {
class MemoryBuffer;
}

namespace forgeline {
namespace commands {
namespace util {

/// Load the contents of the given file. Relative files will be resolved using
/// the current working directory of the process, and "-" names standard input.
llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>> readFileContents(
    StringRef filename);

/// Remove and return the argument of an option, reporting a missing argument.
///
/// \returns False if \arg args is empty.
bool takeOptionArgument(StringRef option, std::vector<std::string>& args,
                        std::string* value_out);

/// Parse a non-negative decimal integer.
bool parseUnsigned(StringRef text, unsigned* value_out);

/// Parse a non-negative decimal number.
bool parseSeconds(StringRef text, double* value_out);

/// Report \arg error on stderr prefixed by the program name, consuming it.
void emitError(llvm::Error error);

void emitError(const Twine& message);

}
}
}

#endif
