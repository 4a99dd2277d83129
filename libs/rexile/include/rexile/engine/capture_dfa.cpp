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

#include "capture_dfa.hpp"

#include <absl/algorithm/container.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

struct Element {
  CharClass set;
  uint32_t min = 1;
  uint32_t max = 1;
  // group rewritten around every character of the element, as in (x)+
  std::optional<uint32_t> repeat_group;
};

// Search progress of one start position.
struct CaptureRun {
  size_t start = 0;
  uint32_t state = 0;
  Slots current;
  // slots of the longest match so far
  Slots accepted;
  bool matched = false;
};

// capture group spanning elements [first, last]
struct GroupRange {
  uint32_t index;
  size_t first;
  size_t last;
};

}  // namespace

class CaptureDfaBuilder {
 public:
  explicit CaptureDfaBuilder(CaptureDfa& dfa) noexcept : _dfa{dfa} {}

  bool Build(const ParsedPattern& pattern, size_t lookback) {
    _dfa._group_count = pattern.group_count;
    const Ast* body = &pattern.root;
    if (const auto* anchored = body->As<ast::Anchored>()) {
      _dfa._anchored_start = anchored->start;
      _dfa._anchored_end = anchored->end;
      body = anchored->inner.get();
    }
    if (!AddItems(*body, false) || _elements.empty()) {
      return false;
    }
    for (const auto& group : _groups) {
      const bool nullable = std::all_of(
        _elements.begin() + group.first, _elements.begin() + group.last + 1,
        [](const Element& e) { return e.min == 0; });
      if (nullable) {
        return false;
      }
    }
    if (!BuildStates()) {
      return false;
    }
    if (!_dfa._anchored_start) {
      ChooseHint(lookback);
    }
    return true;
  }

 private:
  bool AddItems(const Ast& node, bool in_group) {
    if (const auto* sequence = node.As<ast::Sequence>()) {
      return absl::c_all_of(sequence->items, [&](const Ast& item) {
        return AddItem(item, in_group);
      });
    }
    return AddItem(node, in_group);
  }

  bool AddItem(const Ast& item, bool in_group) {
    if (item.Is<ast::Literal>() || item.Is<ast::Class>()) {
      return AddAtom(item, 1, 1, std::nullopt);
    }
    if (const auto* quantified = item.As<ast::Quantified>()) {
      const auto& q = quantified->quantifier;
      if (!q.greedy || q.max == 0) {
        return false;
      }
      const auto& inner = *quantified->inner;
      if (inner.Is<ast::Literal>() || inner.Is<ast::Class>()) {
        return AddAtom(inner, q.min, q.max, std::nullopt);
      }
      const auto* group = inner.As<ast::Group>();
      if (!group || !group->index || in_group || q.min == 0) {
        return false;
      }
      const auto& atom = *group->inner;
      if (!atom.Is<ast::Literal>() && !atom.Is<ast::Class>()) {
        return false;
      }
      return AddAtom(atom, q.min, q.max, group->index);
    }
    if (const auto* group = item.As<ast::Group>()) {
      if (in_group) {
        return false;
      }
      const size_t first = _elements.size();
      if (!AddItems(*group->inner, true) || _elements.size() == first) {
        return false;
      }
      if (group->index) {
        _groups.push_back({*group->index, first, _elements.size() - 1});
      }
      return true;
    }
    return false;
  }

  bool AddAtom(const Ast& atom, uint32_t min, uint32_t max,
               std::optional<uint32_t> repeat_group) {
    if (const auto* cls = atom.As<ast::Class>()) {
      _elements.push_back({cls->set, min, max, repeat_group});
      return true;
    }
    const auto& text = atom.As<ast::Literal>()->text;
    const bool single = utf8_utils::Decode(text, 0).length == text.size();
    if (!single && (min != 1 || max != 1 || repeat_group)) {
      return false;
    }
    for (size_t pos = 0; pos < text.size();) {
      const auto decoded = utf8_utils::Decode(text, pos);
      _elements.push_back(
        {CharClass::Single(decoded.cp), min, max, repeat_group});
      pos += decoded.length;
    }
    return true;
  }

  static uint32_t StateSpan(const Element& element) noexcept {
    return element.max == Quantifier::kUnbounded ? std::max(element.min, 1U)
                                                 : element.max;
  }

  uint32_t StateId(size_t element, uint32_t count) const noexcept {
    return _offsets[element] + count - 1;
  }

  bool BuildStates() {
    size_t total = 1;
    for (const auto& element : _elements) {
      _offsets.push_back(static_cast<uint32_t>(total));
      total += StateSpan(element);
      if (total > CaptureDfa::kMaxStates) {
        return false;
      }
    }
    for (const auto& element : _elements) {
      _dfa._sets.push_back(element.set);
    }
    _dfa._states.resize(total);

    AddExits(0, -1);
    for (size_t e = 0; e < _elements.size(); ++e) {
      const auto& element = _elements[e];
      const uint32_t span = StateSpan(element);
      for (uint32_t count = 1; count <= span; ++count) {
        const uint32_t id = StateId(e, count);
        if (count < span) {
          AddRepeat(id, e, StateId(e, count + 1));
        } else if (element.max == Quantifier::kUnbounded) {
          AddRepeat(id, e, id);
        }
        if (count >= element.min) {
          AddExits(id, static_cast<ptrdiff_t>(e));
        }
      }
    }

    return absl::c_all_of(_dfa._states, [&](const CaptureDfa::State& state) {
      const auto& transitions = state.transitions;
      for (size_t i = 0; i < transitions.size(); ++i) {
        for (size_t j = i + 1; j < transitions.size(); ++j) {
          if (_dfa._sets[transitions[i].set].OverlapsWith(
                _dfa._sets[transitions[j].set])) {
            return false;
          }
        }
      }
      return true;
    });
  }

  void AddRepeat(uint32_t from, size_t element, uint32_t to) {
    CaptureDfa::Transition transition{.set = static_cast<uint32_t>(element),
                                      .target = to};
    AddRepeatGroup(transition, element);
    _dfa._states[from].transitions.push_back(std::move(transition));
  }

  // Transitions leaving element `after` (-1 for the start) into a later
  // element, skipping nullable elements in between.
  void AddExits(uint32_t from, ptrdiff_t after) {
    auto& state = _dfa._states[from];
    const auto n = static_cast<ptrdiff_t>(_elements.size());
    for (ptrdiff_t next = after + 1; next < n; ++next) {
      CaptureDfa::Transition transition{.set = static_cast<uint32_t>(next),
                                        .target = StateId(next, 1)};
      for (const auto& group : _groups) {
        const auto first = static_cast<ptrdiff_t>(group.first);
        const auto last = static_cast<ptrdiff_t>(group.last);
        if (after <= last && last < next) {
          transition.pre.push_back(2 * group.index + 1);
        }
        if (after < first && first <= next) {
          transition.pre.push_back(2 * group.index);
        }
      }
      AddRepeatGroup(transition, next);
      state.transitions.push_back(std::move(transition));
      if (_elements[next].min > 0) {
        return;
      }
    }

    state.accepting = true;
    for (const auto& group : _groups) {
      if (after <= static_cast<ptrdiff_t>(group.last)) {
        state.accept.push_back(2 * group.index + 1);
      }
    }
  }

  void AddRepeatGroup(CaptureDfa::Transition& transition, size_t element) {
    if (const auto group = _elements[element].repeat_group) {
      transition.pre.push_back(2 * *group);
      transition.post.push_back(2 * *group + 1);
    }
  }

  // Picks the longest run of single characters as the literal every match
  // contains and records how far before it a match may start.
  void ChooseHint(size_t lookback) {
    size_t best_begin = 0;
    size_t best_end = 0;
    for (size_t begin = 0; begin < _elements.size();) {
      size_t end = begin;
      while (end < _elements.size() && IsFixedChar(_elements[end])) {
        ++end;
      }
      if (end - begin > best_end - best_begin) {
        best_begin = begin;
        best_end = end;
      }
      begin = std::max(end, begin + 1);
    }
    if (best_end == best_begin) {
      return;
    }

    for (size_t i = best_begin; i < best_end; ++i) {
      uint32_t cp = 0;
      _elements[i].set.IsSingleChar(&cp);
      utf8_utils::AppendChar32(_dfa._hint, cp);
    }

    size_t min_offset = 0;
    std::optional<size_t> max_offset = 0;
    for (size_t i = 0; i < best_begin; ++i) {
      const auto& element = _elements[i];
      min_offset += element.min;
      if (max_offset && element.max != Quantifier::kUnbounded) {
        const size_t width =
          element.set.IsAsciiOnly() ? 1 : utf8_utils::kMaxCharSize;
        *max_offset += static_cast<size_t>(element.max) * width;
      } else {
        max_offset.reset();
      }
    }
    _dfa._hint_min_offset = min_offset;
    _dfa._hint_window = max_offset && *max_offset <= lookback
                          ? *max_offset
                          : std::max(lookback, min_offset);
  }

  static bool IsFixedChar(const Element& element) noexcept {
    return element.min == 1 && element.max == 1 && !element.repeat_group &&
           element.set.IsSingleChar();
  }

  CaptureDfa& _dfa;
  std::vector<Element> _elements;
  std::vector<GroupRange> _groups;
  std::vector<uint32_t> _offsets;
};

std::optional<CaptureDfa> CaptureDfa::Build(const ParsedPattern& pattern,
                                            size_t lookback) {
  CaptureDfa dfa;
  CaptureDfaBuilder builder{dfa};
  if (!builder.Build(pattern, lookback)) {
    return std::nullopt;
  }
  return dfa;
}

bool CaptureDfa::MayStartWith(uint32_t cp) const noexcept {
  return absl::c_any_of(_states[0].transitions, [&](const Transition& t) {
    return _sets[t.set].Matches(cp);
  });
}

bool CaptureDfa::MatchAt(std::string_view text, size_t start,
                         Slots& slots) const {
  Slots current = MakeSlots(_group_count);
  current[0] = start;
  bool matched = false;

  auto record = [&](const State& state, size_t pos) {
    if (!state.accepting || (_anchored_end && pos != text.size())) {
      return;
    }
    slots = current;
    for (const uint32_t slot : state.accept) {
      slots[slot] = pos;
    }
    slots[1] = pos;
    matched = true;
  };

  uint32_t id = 0;
  size_t pos = start;
  record(_states[id], pos);
  while (pos < text.size()) {
    const auto decoded = utf8_utils::Decode(text, pos);
    const auto& transitions = _states[id].transitions;
    const auto it = absl::c_find_if(transitions, [&](const Transition& t) {
      return _sets[t.set].Matches(decoded.cp);
    });
    if (it == transitions.end()) {
      break;
    }
    for (const uint32_t slot : it->pre) {
      current[slot] = pos;
    }
    pos += decoded.length;
    for (const uint32_t slot : it->post) {
      current[slot] = pos;
    }
    id = it->target;
    record(_states[id], pos);
  }
  return matched;
}

size_t CaptureDfa::NextStart(std::string_view text, size_t pos,
                             size_t& hint_pos) const {
  if (!_hint.empty()) {
    if (hint_pos == std::string_view::npos ||
        hint_pos < pos + _hint_min_offset) {
      hint_pos = text.find(_hint, pos + _hint_min_offset);
      if (hint_pos == std::string_view::npos) {
        return std::string_view::npos;
      }
    }
    if (hint_pos > pos + _hint_window) {
      pos = hint_pos - _hint_window;
      while (!utf8_utils::IsCharBoundary(text, pos)) {
        ++pos;
      }
    }
  }
  if (_states[0].accepting) {
    return pos;
  }
  for (; pos < text.size(); pos = utf8_utils::Next(text, pos)) {
    if (MayStartWith(utf8_utils::Decode(text, pos).cp)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

bool CaptureDfa::FindCapturesAt(std::string_view text, size_t from,
                                Slots& slots) const {
  if (from > text.size()) {
    return false;
  }
  if (_anchored_start) {
    return from == 0 && MatchAt(text, 0, slots);
  }

  // One run per start position, ordered by start. A run entering a state
  // that an earlier run occupies is dropped, the earlier start wins with
  // the same continuation. Once a run has matched no later start can win.
  std::vector<CaptureRun> runs;
  std::vector<CaptureRun> next;
  std::vector<bool> taken(_states.size());
  std::optional<CaptureRun> best;
  size_t cutoff = kNoPos;
  size_t hint_pos = std::string_view::npos;

  auto record = [&](CaptureRun& run, size_t pos) {
    const auto& state = _states[run.state];
    if (!state.accepting || (_anchored_end && pos != text.size())) {
      return;
    }
    run.accepted = run.current;
    for (const uint32_t slot : state.accept) {
      run.accepted[slot] = pos;
    }
    run.accepted[1] = pos;
    run.matched = true;
    cutoff = std::min(cutoff, run.start);
  };
  auto finish = [&](CaptureRun& run) {
    if (run.matched && (!best || run.start < best->start)) {
      best = std::move(run);
    }
  };

  for (size_t pos = from;;) {
    if (runs.empty()) {
      if (best) {
        break;
      }
      pos = NextStart(text, pos, hint_pos);
      if (pos == std::string_view::npos) {
        return false;
      }
    }
    if (cutoff == kNoPos) {
      auto& run = runs.emplace_back();
      run.start = pos;
      run.current = MakeSlots(_group_count);
      run.current[0] = pos;
      record(run, pos);
    }

    if (pos == text.size()) {
      for (auto& run : runs) {
        finish(run);
      }
      break;
    }

    const auto decoded = utf8_utils::Decode(text, pos);
    next.clear();
    for (auto& run : runs) {
      if (run.start > cutoff) {
        break;
      }
      const auto& transitions = _states[run.state].transitions;
      const auto it = absl::c_find_if(transitions, [&](const Transition& t) {
        return _sets[t.set].Matches(decoded.cp);
      });
      if (it == transitions.end() || taken[it->target]) {
        finish(run);
        continue;
      }
      for (const uint32_t slot : it->pre) {
        run.current[slot] = pos;
      }
      for (const uint32_t slot : it->post) {
        run.current[slot] = pos + decoded.length;
      }
      run.state = it->target;
      taken[run.state] = true;
      record(run, pos + decoded.length);
      next.push_back(std::move(run));
    }
    for (const auto& run : next) {
      taken[run.state] = false;
    }
    runs.swap(next);
    pos += decoded.length;
  }

  if (!best) {
    return false;
  }
  slots = std::move(best->accepted);
  return true;
}

std::optional<Span> CaptureDfa::FindAt(std::string_view text,
                                       size_t from) const {
  Slots slots = MakeSlots(_group_count);
  if (!FindCapturesAt(text, from, slots)) {
    return std::nullopt;
  }
  return Span{slots[0], slots[1]};
}

}  // namespace rex
