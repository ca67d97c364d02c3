//===- Errors.h -------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_ERRORS_H
#define FORGELINE_BASIC_ERRORS_H

#include "forgeline/Basic/LLVM.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

namespace forgeline {
namespace basic {

/// Error codes reported across the service boundary.
enum class errc: int {
  // 100 - Admission Errors
  quota_exceeded = 100,
  invalid_spec = 101,
  duplicate_job = 102,
  shutting_down = 103,

  // 200 - Query Errors
  unknown_job = 200,
  not_dead_lettered = 201,

  // 300 - Configuration Errors
  invalid_config = 300,

  // Unknown
  unknown = 0
};

const std::error_category& forgelineCategory();

inline std::error_code make_error_code(errc code) {
  return std::error_code(static_cast<int>(code), forgelineCategory());
}

/// Create an error carrying \arg code and a human readable \arg message.
llvm::Error makeError(errc code, const Twine& message);

/// Get the forgeline error code carried by \arg error, without consuming it.
///
/// Errors that did not originate from \see makeError() report errc::unknown.
errc errorCodeOf(llvm::Error& error);

/// Consume \arg error, returning its message and (optionally) its code.
std::string takeErrorMessage(llvm::Error error, errc* code_out = nullptr);

}
}

namespace std {
template <> struct is_error_code_enum<forgeline::basic::errc> : std::true_type {};
}

#endif
