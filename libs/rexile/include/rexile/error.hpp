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

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace rex {

enum class PatternErrorKind : uint8_t {
  kParse,
  // syntactically valid, but not realized by any matcher
  kUnsupportedFeature,
};

struct PatternError {
  static PatternError Parse(std::string message) {
    return {PatternErrorKind::kParse, std::move(message)};
  }

  static PatternError Unsupported(std::string message) {
    return {PatternErrorKind::kUnsupportedFeature, std::move(message)};
  }

  std::string ToString() const;

  bool operator==(const PatternError&) const = default;

  PatternErrorKind kind;
  std::string message;
};

std::string_view ToString(PatternErrorKind kind) noexcept;

template<typename T>
using Expected = std::expected<T, PatternError>;

}  // namespace rex
