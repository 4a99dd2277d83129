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

#include "error.hpp"

#include <absl/strings/str_cat.h>

#include "basics/string_utils.h"

namespace rex {

std::string_view ToString(PatternErrorKind kind) noexcept {
  switch (kind) {
    case PatternErrorKind::kParse:
      return "parse error";
    case PatternErrorKind::kUnsupportedFeature:
      return "unsupported feature";
  }
  return "unknown error";
}

std::string PatternError::ToString() const {
  return absl::StrCat(basics::AsAbsl(rex::ToString(kind)), ": ", message);
}

}  // namespace rex
