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

#include <absl/strings/string_view.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "basics/system-compiler.h"

namespace rex::basics {

// absl may be configured with its own string_view type, these convert
// at the boundary and are no-ops otherwise
REX_FORCE_INLINE absl::string_view AsAbsl(std::string_view v) noexcept {
  return {v.data(), v.size()};
}

template<typename T>
REX_FORCE_INLINE const T& AsAbsl(const T& v) noexcept {
  return v;
}

REX_FORCE_INLINE std::string_view AsStd(absl::string_view v) noexcept {
  return {v.data(), v.size()};
}

template<typename Str>
REX_FORCE_INLINE void StrReserveAmortized(Str& str, size_t len) {
  const size_t cap = str.capacity();
  if (len > cap) {
    // Make sure to always grow by at least a factor of 2x.
    str.reserve(std::max(len, 2 * cap));
  }
}

}  // namespace rex::basics
