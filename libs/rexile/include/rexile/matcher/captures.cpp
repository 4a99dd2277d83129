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

#include "captures.hpp"

#include "basics/logger/logger.h"

namespace rex {

std::optional<Span> Captures::Pos(size_t i) const noexcept {
  if (i >= Size() || _slots[2 * i] == kNoPos || _slots[2 * i + 1] == kNoPos) {
    return std::nullopt;
  }
  return Span{_slots[2 * i], _slots[2 * i + 1]};
}

std::optional<std::string_view> Captures::Get(size_t i) const noexcept {
  const auto span = Pos(i);
  if (!span) {
    return std::nullopt;
  }
  return span->In(_text);
}

std::optional<std::string_view> Captures::Name(
  std::string_view name) const noexcept {
  if (!_names || name.empty()) {
    return std::nullopt;
  }
  for (size_t i = 1; i < _names->size(); ++i) {
    if ((*_names)[i] == name) {
      return Get(i);
    }
  }
  return std::nullopt;
}

std::string_view Captures::operator[](size_t i) const {
  if (i >= Size()) [[unlikely]] {
    REX_FATAL("c4e01", Logger::REGEX, "capture group index ", i,
              " out of range, pattern has ", Size(), " groups");
  }
  return Get(i).value_or(std::string_view{});
}

}  // namespace rex
