////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2025 SereneDB GmbH, Berlin, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is SereneDB GmbH, Berlin, Germany
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <utility>

#include "basics/assert.h"

#ifdef REX_DEV
#define REX_UNREACHABLE()                          \
  do {                                             \
    REX_ASSERT(false, "unreachable code reached"); \
    std::unreachable();                            \
  } while (false)
#else
#define REX_UNREACHABLE() std::unreachable()
#endif

// likely/unlikely branch indicator
#if defined(__GNUC__) || defined(__GNUG__)
#define REX_LIKELY(v) __builtin_expect(!!(v), 1)
#define REX_UNLIKELY(v) __builtin_expect(!!(v), 0)
#else
#define REX_LIKELY(v) v
#define REX_UNLIKELY(v) v
#endif

#if defined(__GNUC__) || defined(__clang__)
#define REX_FORCE_INLINE inline __attribute__((always_inline))
#else
#define REX_FORCE_INLINE inline
#endif

// pretty function name macro
#if defined(__clang__) || defined(__GNUC__)
#define REX_PRETTY_FUNCTION __PRETTY_FUNCTION__
#else
#define REX_PRETTY_FUNCTION __func__
#endif
