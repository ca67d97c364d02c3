//===-- Errors.cpp --------------------------------------------------------===//
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

#include "forgeline/Basic/Errors.h"

#include <string>

using namespace forgeline;
using namespace forgeline::basic;

namespace {

class ForgelineErrorCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "forgeline"; }

  std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
    case errc::quota_exceeded: return "tenant quota exceeded";
    case errc::invalid_spec: return "invalid build specification";
    case errc::duplicate_job: return "duplicate job";
    case errc::shutting_down: return "queue is shutting down";
    case errc::unknown_job: return "unknown job";
    case errc::not_dead_lettered: return "job is not dead-lettered";
    case errc::invalid_config: return "invalid configuration";
    case errc::unknown: return "unknown error";
    }
    return "unknown error";
  }
};

}

const std::error_category& forgeline::basic::forgelineCategory() {
  static ForgelineErrorCategory category;
  return category;
}

llvm::Error forgeline::basic::makeError(errc code, const Twine& message) {
  return llvm::make_error<llvm::StringError>(message, make_error_code(code));
}

errc forgeline::basic::errorCodeOf(llvm::Error& error) {
  llvm::Error taken = std::move(error);
  // The moved-from error must be marked checked before it is reassigned.
  (void)static_cast<bool>(error);
  if (!taken) {
    error = std::move(taken);
    return errc::unknown;
  }

  errc result = errc::unknown;
  taken = llvm::handleErrors(
      std::move(taken), [&](std::unique_ptr<llvm::ErrorInfoBase> info) {
        std::error_code ec = info->convertToErrorCode();
        if (ec.category() == forgelineCategory())
          result = static_cast<errc>(ec.value());
        return llvm::Error(std::move(info));
      });

  error = std::move(taken);
  return result;
}

std::string forgeline::basic::takeErrorMessage(llvm::Error error,
                                               errc* code_out) {
  errc code = errorCodeOf(error);
  if (code_out)
    *code_out = code;
  return llvm::toString(std::move(error));
}
