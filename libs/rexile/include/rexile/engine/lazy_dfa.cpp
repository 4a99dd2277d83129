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

#include "lazy_dfa.hpp"

#include <absl/algorithm/container.h>
#include <absl/container/flat_hash_map.h>

#include <array>
#include <tuple>
#include <utility>
#include <vector>

#include "basics/assert.h"
#include "basics/logger/logger.h"
#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

using Op = NfaInst::Op;

constexpr int32_t kUnknown = -1;

struct DfaState {
  std::vector<uint32_t> pcs;
  // a match ends before the next character
  bool match = false;
  // start instructions are still added at every position
  bool searching = false;
  std::array<int32_t, 128> next;
};

struct Subset {
  std::vector<uint32_t> pcs;
  bool match = false;
};

bool Consumes(const Nfa& nfa, const NfaInst& inst, uint32_t cp) noexcept {
  return (inst.op == Op::kChar && inst.arg == cp) ||
         (inst.op == Op::kClass && nfa.Class(inst.arg).Matches(cp));
}

// Consuming instructions reachable from seeds without input, in priority
// order. Reaching Match drops everything of lower priority.
Subset Closure(const Nfa& nfa, const std::vector<uint32_t>& seeds) {
  const auto& program = nfa.Program();
  std::vector<bool> visited(program.size());
  std::vector<uint32_t> pcs;
  std::vector<uint32_t> stack;
  for (const uint32_t seed : seeds) {
    stack.push_back(seed);
    while (!stack.empty()) {
      const uint32_t pc = stack.back();
      stack.pop_back();
      if (visited[pc]) {
        continue;
      }
      visited[pc] = true;
      const auto& inst = program[pc];
      switch (inst.op) {
        case Op::kChar:
        case Op::kClass:
          pcs.push_back(pc);
          break;
        case Op::kMatch:
          return {std::move(pcs), true};
        case Op::kSplit:
          stack.push_back(inst.alt);
          stack.push_back(inst.out);
          break;
        case Op::kJump:
        case Op::kSave:
          stack.push_back(inst.out);
          break;
        default:
          break;
      }
    }
  }
  return {std::move(pcs), false};
}

}  // namespace

struct LazyDfa::Cache {
  using Key = std::tuple<std::vector<uint32_t>, bool, bool>;

  explicit Cache(const Nfa& nfa) : nfa{nfa} {}

  // id of the state for the subset, kUnknown once the limit is reached
  int32_t Intern(Subset subset, bool searching, size_t max_states) {
    searching = searching && !subset.match;
    Key key{std::move(subset.pcs), subset.match, searching};
    if (auto it = ids.find(key); it != ids.end()) {
      return it->second;
    }
    if (states.size() >= max_states) {
      overflow = true;
      return kUnknown;
    }
    const auto id = static_cast<int32_t>(states.size());
    auto& state = states.emplace_back();
    state.pcs = std::get<0>(key);
    state.match = std::get<1>(key);
    state.searching = searching;
    state.next.fill(kUnknown);
    ids.emplace(std::move(key), id);
    return id;
  }

  int32_t Start(size_t max_states) {
    return Intern(Closure(nfa, {nfa.Start()}), true, max_states);
  }

  int32_t Step(int32_t id, uint32_t cp, size_t max_states) {
    if (cp < 128 && states[id].next[cp] != kUnknown) {
      return states[id].next[cp];
    }
    std::vector<uint32_t> seeds;
    for (const uint32_t pc : states[id].pcs) {
      const auto& inst = nfa.Program()[pc];
      if (Consumes(nfa, inst, cp)) {
        seeds.push_back(inst.out);
      }
    }
    const bool searching = states[id].searching;
    if (searching) {
      seeds.push_back(nfa.Start());
    }
    const int32_t next = Intern(Closure(nfa, seeds), searching, max_states);
    if (cp < 128 && next != kUnknown) {
      states[id].next[cp] = next;
    }
    return next;
  }

  const Nfa& nfa;
  std::vector<DfaState> states;
  absl::flat_hash_map<Key, int32_t> ids;
  bool overflow = false;
};

LazyDfa::LazyDfa(std::shared_ptr<const Nfa> nfa, size_t max_states)
  : _nfa{std::move(nfa)}, _max_states{max_states} {
  auto start = Closure(*_nfa, {_nfa->Start()});
  _start_pcs = std::move(start.pcs);
  _nullable = start.match;
  for (uint32_t c = 0; c < 128; ++c) {
    if (StartsWith(c)) {
      _first_ascii[c >> 6] |= uint64_t{1} << (c & 63);
    }
  }
}

std::optional<LazyDfa> LazyDfa::Build(std::shared_ptr<const Nfa> nfa,
                                      size_t max_states) {
  const bool supported = absl::c_all_of(nfa->Program(), [](const NfaInst& i) {
    return i.op != Op::kAssert && i.op != Op::kLookaround &&
           i.op != Op::kBackref;
  });
  if (!supported) {
    return std::nullopt;
  }
  return LazyDfa{std::move(nfa), max_states};
}

bool LazyDfa::MayStartWith(uint32_t cp) const noexcept {
  if (cp < 128) {
    return (_first_ascii[cp >> 6] >> (cp & 63)) & 1;
  }
  return StartsWith(cp);
}

bool LazyDfa::StartsWith(uint32_t cp) const noexcept {
  return absl::c_any_of(_start_pcs, [&](uint32_t pc) {
    return Consumes(*_nfa, _nfa->Program()[pc], cp);
  });
}

LazyDfa::ScanResult LazyDfa::Scan(Cache& cache, std::string_view text,
                                  size_t from, bool earliest,
                                  size_t& end) const {
  const int32_t start = cache.Start(_max_states);
  if (start == kUnknown) {
    return ScanResult::kOverflow;
  }
  int32_t state = start;
  bool matched = false;
  size_t pos = from;
  while (true) {
    if (state == start && !_nullable) {
      // only the start instructions are alive, skip to a possible start
      while (pos < text.size() &&
             !MayStartWith(utf8_utils::Decode(text, pos).cp)) {
        pos = utf8_utils::Next(text, pos);
      }
    }
    if (cache.states[state].match) {
      matched = true;
      end = pos;
      if (earliest) {
        break;
      }
    }
    if (pos >= text.size() || cache.states[state].pcs.empty()) {
      break;
    }
    const auto decoded = utf8_utils::Decode(text, pos);
    state = cache.Step(state, decoded.cp, _max_states);
    if (state == kUnknown) {
      return ScanResult::kOverflow;
    }
    pos += decoded.length;
  }
  return matched ? ScanResult::kMatch : ScanResult::kNoMatch;
}

bool LazyDfa::IsMatch(std::string_view text) const {
  Cache cache{*_nfa};
  size_t end = 0;
  switch (Scan(cache, text, 0, true, end)) {
    case ScanResult::kNoMatch:
      return false;
    case ScanResult::kMatch:
      return true;
    case ScanResult::kOverflow:
      break;
  }
  REX_TRACE("1a2f1", Logger::REGEX, "lazy DFA exceeded ", _max_states,
            " states, continuing with the NFA");
  return _nfa->IsMatch(text);
}

std::optional<Span> LazyDfa::FindAt(std::string_view text, size_t from) const {
  if (from > text.size()) {
    return std::nullopt;
  }
  Cache cache{*_nfa};
  size_t end = 0;
  switch (Scan(cache, text, from, false, end)) {
    case ScanResult::kNoMatch:
      return std::nullopt;
    case ScanResult::kMatch: {
      auto span = _nfa->FindAt(text, from);
      REX_ASSERT(span && span->end == end);
      return span;
    }
    case ScanResult::kOverflow:
      break;
  }
  REX_TRACE("1a2f0", Logger::REGEX, "lazy DFA exceeded ", _max_states,
            " states, continuing with the NFA");
  return _nfa->FindAt(text, from);
}

}  // namespace rex
