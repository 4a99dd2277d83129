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

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rex {

// Half open byte range [start, end) of a match.
struct Span {
  size_t Length() const noexcept { return end - start; }
  bool Empty() const noexcept { return start == end; }
  std::string_view In(std::string_view text) const noexcept {
    return text.substr(start, end - start);
  }

  bool operator==(const Span&) const noexcept = default;

  size_t start = 0;
  size_t end = 0;
};

inline constexpr size_t kNoPos = std::numeric_limits<size_t>::max();

// Capture positions, slot 2*i and 2*i+1 hold start and end of group i.
// Groups which did not participate hold kNoPos.
using Slots = std::vector<size_t>;

inline Slots MakeSlots(size_t group_count) {
  return Slots(2 * (group_count + 1), kNoPos);
}

using GroupNames = std::shared_ptr<const std::vector<std::string>>;

// Result of a capturing search: a view of the searched text, one optional
// span per group (group 0 is the whole match) and the group names.
class Captures {
 public:
  Captures(std::string_view text, Slots slots, GroupNames names) noexcept
    : _text{text}, _slots{std::move(slots)}, _names{std::move(names)} {}

  // number of groups including group 0
  size_t Size() const noexcept { return _slots.size() / 2; }

  std::optional<Span> Pos(size_t i) const noexcept;
  std::optional<std::string_view> Get(size_t i) const noexcept;
  std::optional<std::string_view> Name(std::string_view name) const noexcept;

  // Non-participating groups yield an empty view. An index past Size() is
  // a contract violation.
  std::string_view operator[](size_t i) const;

  Span Match() const noexcept { return {_slots[0], _slots[1]}; }
  std::string_view Text() const noexcept { return _text; }
  const Slots& GetSlots() const noexcept { return _slots; }

 private:
  std::string_view _text;
  Slots _slots;
  GroupNames _names;
};

}  // namespace rex
