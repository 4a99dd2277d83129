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

#include <source_location>
#include <string_view>

namespace rex::detail {

[[noreturn]] void AssertionFailed(std::string_view expr,
                                  std::source_location location,
                                  std::string_view message = {}) noexcept;

}  // namespace rex::detail

#ifdef REX_DEV
#define REX_ASSERT(expr, ...)                                          \
  do {                                                                 \
    if (!(expr)) [[unlikely]] {                                        \
      ::rex::detail::AssertionFailed(#expr,                            \
                                     std::source_location::current()  \
                                       __VA_OPT__(, ) __VA_ARGS__);    \
    }                                                                  \
  } while (false)
#else
#define REX_ASSERT(expr, ...) \
  do {                        \
    if (false) {              \
      (void)(expr);           \
    }                         \
  } while (false)
#endif
