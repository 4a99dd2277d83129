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

#include <memory>
#include <optional>
#include <string_view>

#include "rexile/parser/ast.hpp"

namespace rex {

class Nfa;

// Zero-width look-ahead or look-behind around a compiled sub-pattern.
class Lookaround {
 public:
  // For look-behind the inner automaton must only accept at the end of
  // the text it is run on. min_length and max_length bound the bytes the
  // inner pattern consumes, max_length is unset if unbounded.
  Lookaround(LookaroundKind kind, std::shared_ptr<const Nfa> inner,
             size_t min_length, std::optional<size_t> max_length) noexcept
    : _kind{kind},
      _inner{std::move(inner)},
      _min_length{min_length},
      _max_length{max_length} {}

  bool MatchesAt(std::string_view text, size_t pos) const;

  LookaroundKind Kind() const noexcept { return _kind; }

 private:
  bool MatchesAhead(std::string_view text, size_t pos) const;
  bool MatchesBehind(std::string_view text, size_t pos) const;

  LookaroundKind _kind;
  std::shared_ptr<const Nfa> _inner;
  size_t _min_length;
  std::optional<size_t> _max_length;
};

}  // namespace rex
