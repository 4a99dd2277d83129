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

#include "aho_corasick.hpp"

#include <algorithm>
#include <deque>
#include <limits>

#include "basics/assert.h"

namespace rex {
namespace {

constexpr uint32_t kNoState = std::numeric_limits<uint32_t>::max();

}  // namespace

AhoCorasick::AhoCorasick(std::vector<std::string> patterns)
  : _patterns{std::move(patterns)} {
  auto add_state = [&] {
    _transitions.resize(_transitions.size() + kAlphabet, kNoState);
    _outputs.emplace_back();
    return static_cast<uint32_t>(_outputs.size() - 1);
  };

  add_state();
  for (uint32_t id = 0; id < _patterns.size(); ++id) {
    const auto& pattern = _patterns[id];
    REX_ASSERT(!pattern.empty());
    _max_length = std::max(_max_length, pattern.size());

    uint32_t state = 0;
    for (const char c : pattern) {
      const auto byte = static_cast<uint8_t>(c);
      if (Next(state, byte) == kNoState) {
        const uint32_t child = add_state();
        Next(state, byte) = child;
      }
      state = Next(state, byte);
    }
    _outputs[state].push_back(id);
  }

  std::vector<uint32_t> fail(_outputs.size(), 0);
  std::deque<uint32_t> queue;
  for (uint32_t byte = 0; byte < kAlphabet; ++byte) {
    auto& next = Next(0, byte);
    if (next == kNoState) {
      next = 0;
    } else {
      queue.push_back(next);
    }
  }

  while (!queue.empty()) {
    const uint32_t state = queue.front();
    queue.pop_front();
    const uint32_t link = fail[state];
    for (uint32_t byte = 0; byte < kAlphabet; ++byte) {
      auto& next = Next(state, byte);
      if (next == kNoState) {
        next = Next(link, byte);
        continue;
      }
      fail[next] = Next(link, byte);
      const auto& inherited = _outputs[fail[next]];
      _outputs[next].insert(_outputs[next].end(), inherited.begin(),
                            inherited.end());
      queue.push_back(next);
    }
  }
}

std::optional<AhoCorasickMatch> AhoCorasick::FindAt(std::string_view text,
                                                    size_t from) const {
  std::optional<AhoCorasickMatch> best;
  uint32_t state = 0;
  for (size_t pos = from; pos < text.size(); ++pos) {
    state = Next(state, static_cast<uint8_t>(text[pos]));
    for (const uint32_t id : _outputs[state]) {
      const size_t end = pos + 1;
      const size_t start = end - _patterns[id].size();
      if (!best || start < best->start ||
          (start == best->start && id < best->pattern)) {
        best = AhoCorasickMatch{start, end, id};
      }
    }
    // a later match cannot start at or before the best one
    if (best && pos + 2 > best->start + _max_length) {
      break;
    }
  }
  return best;
}

}  // namespace rex
