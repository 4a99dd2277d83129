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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rex {

struct AhoCorasickMatch {
  size_t start;
  size_t end;
  // index into the pattern list
  uint32_t pattern;
};

// Multi-literal searcher over a dense byte automaton. Reports the
// leftmost match, ties on the start are broken by pattern order.
class AhoCorasick {
 public:
  // patterns must be non-empty
  explicit AhoCorasick(std::vector<std::string> patterns);

  std::optional<AhoCorasickMatch> FindAt(std::string_view text,
                                         size_t from) const;
  bool IsMatch(std::string_view text) const {
    return FindAt(text, 0).has_value();
  }

  const std::vector<std::string>& Patterns() const noexcept {
    return _patterns;
  }
  size_t StateCount() const noexcept { return _outputs.size(); }

 private:
  static constexpr uint32_t kAlphabet = 256;

  uint32_t& Next(uint32_t state, uint8_t byte) noexcept {
    return _transitions[state * kAlphabet + byte];
  }
  uint32_t Next(uint32_t state, uint8_t byte) const noexcept {
    return _transitions[state * kAlphabet + byte];
  }

  std::vector<std::string> _patterns;
  std::vector<uint32_t> _transitions;
  // patterns ending in each state, own pattern first, then via the
  // failure chain
  std::vector<std::vector<uint32_t>> _outputs;
  size_t _max_length = 0;
};

}  // namespace rex
