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

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "rexile/engine/nfa.hpp"
#include "rexile/matcher/captures.hpp"

namespace rex {

// Deterministic simulation of a capture-free automaton. Subset states are
// built on demand while searching and live only for one call. A subset is
// an ordered list of instructions, so priorities and therefore
// leftmost-first semantics are preserved. The search is a single
// unanchored pass: until a match is seen every position adds the start
// instructions with the lowest priority. The pass decides whether and
// where a match ends, the automaton then reports its start. Once a call
// has built more than max_states states the search is handed to the
// automaton itself.
class LazyDfa {
 public:
  static constexpr size_t kDefaultMaxStates = 2048;

  // Fails if the program contains assertions, lookaround or
  // backreferences.
  static std::optional<LazyDfa> Build(std::shared_ptr<const Nfa> nfa,
                                      size_t max_states = kDefaultMaxStates);

  std::optional<Span> FindAt(std::string_view text, size_t from) const;
  bool IsMatch(std::string_view text) const;

 private:
  struct Cache;

  enum class ScanResult : uint8_t {
    kNoMatch,
    kMatch,
    kOverflow,
  };

  LazyDfa(std::shared_ptr<const Nfa> nfa, size_t max_states);

  bool MayStartWith(uint32_t cp) const noexcept;
  bool StartsWith(uint32_t cp) const noexcept;
  // Unanchored pass from `from`. With `earliest` it stops at the first
  // match state, otherwise end receives the end of the leftmost-first
  // match.
  ScanResult Scan(Cache& cache, std::string_view text, size_t from,
                  bool earliest, size_t& end) const;

  std::shared_ptr<const Nfa> _nfa;
  size_t _max_states;
  // consuming instructions reachable from the start
  std::vector<uint32_t> _start_pcs;
  std::array<uint64_t, 2> _first_ascii{};
  bool _nullable = false;
};

}  // namespace rex
