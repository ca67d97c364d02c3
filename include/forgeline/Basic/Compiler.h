//===- Compiler.h -----------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_COMPILER_H
#define FORGELINE_BASIC_COMPILER_H

/// Marks a special member function as deleted, for classes which must not be
/// copied.
#define FORGELINE_DELETED_FUNCTION = delete

#endif
