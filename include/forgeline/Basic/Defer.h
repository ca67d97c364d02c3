//===- Defer.h --------------------------------------------------*- C++ -*-===//
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

#ifndef FORGELINE_BASIC_DEFER_H
#define FORGELINE_BASIC_DEFER_H

#include <functional>
#include <utility>
#include <type_traits>

namespace forgeline {
namespace basic {

template <typename T>
class ScopeDefer {
  T deferredWork;
  void operator=(ScopeDefer&) = delete;
public:
  ScopeDefer(T&& work) : deferredWork(std::move(work)) { }
  ~ScopeDefer() { deferredWork(); }
};

template <typename T>
ScopeDefer<T> makeScopeDefer(T&& work) {
  return ScopeDefer<typename std::decay<T>::type>(std::forward<T>(work));
}

namespace impl {
  struct ScopeDeferTask {};
  template<typename T>
  ScopeDefer<typename std::decay<T>::type> operator+(ScopeDeferTask, T&& work) {
    return ScopeDefer<typename std::decay<T>::type>(std::forward<T>(work));
  }
}

}
}

#define FORGELINE_DEFER_VAR_NAME(C) _defer_##C
#define FORGELINE_DEFER_INTERMEDIATE(C) FORGELINE_DEFER_VAR_NAME(C)
#define FORGELINE_DEFER_UNIQUE_VAR_NAME FORGELINE_DEFER_INTERMEDIATE(__COUNTER__)

#define forgeline_defer \
  auto FORGELINE_DEFER_UNIQUE_VAR_NAME = \
    forgeline::basic::impl::ScopeDeferTask() + [&]()

#endif
