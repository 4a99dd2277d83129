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

#include "lookaround.hpp"

#include "basics/utf8_utils.hpp"
#include "rexile/engine/nfa.hpp"

namespace rex {

bool Lookaround::MatchesAt(std::string_view text, size_t pos) const {
  const bool found = IsLookbehind(_kind) ? MatchesBehind(text, pos)
                                         : MatchesAhead(text, pos);
  return found != IsNegative(_kind);
}

bool Lookaround::MatchesAhead(std::string_view text, size_t pos) const {
  Slots slots(2, kNoPos);
  return _inner->Search(text, pos, true, slots);
}

// Runs the inner pattern anchored on text[start..pos) for every start the
// length bounds allow.
bool Lookaround::MatchesBehind(std::string_view text, size_t pos) const {
  if (pos < _min_length) {
    return false;
  }
  const auto window = text.substr(0, pos);
  size_t start = 0;
  if (_max_length && pos > *_max_length) {
    start = pos - *_max_length;
  }
  Slots slots(2, kNoPos);
  for (; start <= pos - _min_length; ++start) {
    if (!utf8_utils::IsCharBoundary(window, start)) {
      continue;
    }
    if (_inner->Search(window, start, true, slots)) {
      return true;
    }
  }
  return false;
}

}  // namespace rex
