//===- BuildSpec.h ----------------------------------------------*- C++ -*-===//
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
// This file defines the schema-checked build specification accepted at
// submission time.
//
//===----------------------------------------------------------------------===//

#ifndef FORGELINE_CORE_BUILDSPEC_H
#define FORGELINE_CORE_BUILDSPEC_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <string>
#include <vector>

namespace forgeline {
namespace core {

/// A validated, default-filled build specification.
///
/// Specifications arrive as JSON documents. Parsing checks the fields the
/// engine understands against their allowed values, fills in defaults and
/// normalizes the package list; every other field is preserved so that it
/// still participates in the canonical hash.
class BuildSpec {
public:
  /// The base distribution (required).
  std::string base;

  /// The optional display name of the image.
  std::string name;

  /// The target architecture, "x86_64" or "aarch64".
  std::string architecture = "x86_64";

  /// The init system.
  std::string init = "systemd";

  /// The kernel flavor.
  std::string kernelVersion = "linux-lts";

  /// The requested packages, flattened across categories, sorted and unique.
  std::vector<std::string> packages;

  /// The mandatory access control frameworks, sorted and unique.
  std::vector<std::string> macFeatures;

  /// Additional members of the "kernel" object.
  llvm::json::Object kernelOptions;

  /// Additional members of the "securityFeatures" object.
  llvm::json::Object securityOptions;

  /// Top-level fields not interpreted by the engine.
  llvm::json::Object extra;

public:
  /// Parse and validate a specification document.
  ///
  /// Fails with \see basic::errc::invalid_spec.
  static llvm::Expected<BuildSpec> parse(StringRef text);

  /// Validate and normalize an already parsed JSON value.
  static llvm::Expected<BuildSpec> fromJSON(const llvm::json::Value& value);

  /// Get the normalized JSON form, with all defaults filled in.
  llvm::json::Value toJSON() const;

  /// Get the canonical text of the specification, compact JSON with object
  /// keys in sorted order.
  ///
  /// Specifications which differ only in field order or in the order and
  /// grouping of their packages have identical canonical text.
  std::string canonicalText() const;

  /// Get the SHA-256 (lowercase hex) of the canonical text.
  std::string hash() const;
};

}
}

#endif
