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

#include "nfa.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>

#include <algorithm>
#include <type_traits>
#include <variant>

#include "basics/assert.h"
#include "basics/utf8_utils.hpp"
#include "rexile/matcher/boundary.hpp"

namespace rex {
namespace {

template<typename T, typename N>
constexpr bool kIs = std::is_same_v<std::decay_t<N>, T>;

using Op = NfaInst::Op;

// Threads of one step in priority order. Membership is a sparse set over
// program counters, so clearing is O(1).
class ThreadList {
 public:
  ThreadList(size_t capacity, size_t width)
    : _sparse(capacity), _dense(capacity), _slots(capacity * width),
      _width{width} {}

  bool Contains(uint32_t pc) const noexcept {
    const uint32_t i = _sparse[pc];
    return i < _size && _dense[i] == pc;
  }

  size_t* Insert(uint32_t pc) noexcept {
    _sparse[pc] = static_cast<uint32_t>(_size);
    _dense[_size] = pc;
    return &_slots[_size++ * _width];
  }

  void Clear() noexcept { _size = 0; }
  bool Empty() const noexcept { return _size == 0; }
  size_t Size() const noexcept { return _size; }
  uint32_t Pc(size_t i) const noexcept { return _dense[i]; }
  const size_t* Slots(size_t i) const noexcept { return &_slots[i * _width]; }

 private:
  std::vector<uint32_t> _sparse;
  std::vector<uint32_t> _dense;
  std::vector<size_t> _slots;
  size_t _width;
  size_t _size = 0;
};

class PikeVm {
 public:
  PikeVm(const Nfa& nfa, std::string_view text, size_t width)
    : _nfa{nfa}, _text{text}, _width{width}, _work(width, kNoPos) {}

  bool Run(size_t from, bool anchored, Slots& slots) {
    const auto& program = _nfa.Program();
    const auto& prefilter = _nfa.GetPrefilter();
    ThreadList clist{program.size(), _width};
    ThreadList nlist{program.size(), _width};

    bool matched = false;
    size_t pos = from;
    while (true) {
      if (auto it = _deferred.find(pos); it != _deferred.end()) {
        // AddThread may defer more threads and rehash the map
        auto node = _deferred.extract(it);
        for (auto& thread : node.mapped()) {
          _work = std::move(thread.slots);
          AddThread(clist, thread.pc, pos);
        }
      }

      if (!matched && (!anchored || pos == from)) {
        if (clist.Empty() && _deferred.empty() && prefilter && !anchored) {
          const auto next = prefilter->Next(_text, pos);
          if (!next) {
            break;
          }
          pos = *next;
        }
        std::fill(_work.begin(), _work.end(), kNoPos);
        AddThread(clist, _nfa.Start(), pos);
      }

      if (clist.Empty() && _deferred.empty() && (matched || anchored)) {
        break;
      }

      utf8_utils::DecodedChar decoded{utf8_utils::kInvalidChar32, 1};
      if (pos < _text.size()) {
        decoded = utf8_utils::Decode(_text, pos);
      }
      const size_t next_pos = pos + decoded.length;

      nlist.Clear();
      for (size_t i = 0; i < clist.Size(); ++i) {
        const auto& inst = program[clist.Pc(i)];
        if (inst.op == Op::kMatch) {
          std::copy_n(clist.Slots(i), std::min(_width, slots.size()),
                      slots.begin());
          matched = true;
          // lower priority threads lose to this match
          break;
        }
        if (pos >= _text.size()) {
          continue;
        }
        const bool step =
          (inst.op == Op::kChar && decoded.cp == inst.arg) ||
          (inst.op == Op::kClass && _nfa.Class(inst.arg).Matches(decoded.cp));
        if (step) {
          std::copy_n(clist.Slots(i), _width, _work.begin());
          AddThread(nlist, inst.out, next_pos);
        }
      }

      if (pos >= _text.size()) {
        break;
      }
      pos = next_pos;
      std::swap(clist, nlist);
    }
    return matched;
  }

 private:
  struct Frame {
    uint32_t pc;
    uint32_t slot;
    size_t value;
    bool restore;
  };

  struct DeferredThread {
    uint32_t pc;
    Slots slots;
  };

  // Follows empty transitions from pc in priority order. _work holds the
  // slots of the thread being added, Save frames are undone on the way
  // back.
  void AddThread(ThreadList& list, uint32_t start, size_t pos) {
    const auto& program = _nfa.Program();
    _stack.push_back({start, 0, 0, false});
    while (!_stack.empty()) {
      const Frame frame = _stack.back();
      _stack.pop_back();
      if (frame.restore) {
        _work[frame.slot] = frame.value;
        continue;
      }
      if (list.Contains(frame.pc)) {
        continue;
      }

      size_t* thread_slots = list.Insert(frame.pc);
      const auto& inst = program[frame.pc];
      switch (inst.op) {
        case Op::kChar:
        case Op::kClass:
        case Op::kMatch:
          std::copy_n(_work.begin(), _width, thread_slots);
          break;
        case Op::kJump:
          Explore(inst.out);
          break;
        case Op::kSplit:
          Explore(inst.alt);
          Explore(inst.out);
          break;
        case Op::kSave:
          if (inst.arg < _width) {
            _stack.push_back({0, inst.arg, _work[inst.arg], true});
            _work[inst.arg] = pos;
          }
          Explore(inst.out);
          break;
        case Op::kAssert:
          if (MatchesAssertion(static_cast<AssertionKind>(inst.arg), _text,
                               pos)) {
            Explore(inst.out);
          }
          break;
        case Op::kLookaround:
          if (_nfa.GetLookaround(inst.arg).MatchesAt(_text, pos)) {
            Explore(inst.out);
          }
          break;
        case Op::kBackref:
          AddBackref(inst, pos);
          break;
      }
    }
  }

  // A backreference consumes the text of its group at once, the thread
  // resumes once the scan reaches the end of that text.
  void AddBackref(const NfaInst& inst, size_t pos) {
    const size_t slot = 2 * inst.arg;
    REX_ASSERT(slot + 1 < _width);
    const size_t start = _work[slot];
    const size_t end = _work[slot + 1];
    if (start == kNoPos || end == kNoPos || end < start) {
      return;
    }
    const auto captured = _text.substr(start, end - start);
    if (!_text.substr(pos).starts_with(captured)) {
      return;
    }
    if (captured.empty()) {
      Explore(inst.out);
      return;
    }
    _deferred[pos + captured.size()].push_back({inst.out, _work});
  }

  void Explore(uint32_t pc) { _stack.push_back({pc, 0, 0, false}); }

  const Nfa& _nfa;
  std::string_view _text;
  size_t _width;
  Slots _work;
  std::vector<Frame> _stack;
  absl::flat_hash_map<size_t, std::vector<DeferredThread>> _deferred;
};

}  // namespace

class NfaBuilder {
 public:
  NfaBuilder(Nfa& nfa, size_t size_limit) noexcept
    : _nfa{nfa}, _size_limit{size_limit} {}

  std::optional<PatternError> Build(const Ast& root, bool match_at_end) {
    Emit({.op = Op::kSave, .arg = 0});
    EmitNode(root);
    if (match_at_end) {
      EmitAssert(AssertionKind::kTextEnd);
    }
    Emit({.op = Op::kSave, .arg = 1});
    Emit({.op = Op::kMatch});
    return std::move(_error);
  }

 private:
  uint32_t Pc() const noexcept {
    return static_cast<uint32_t>(_nfa._program.size());
  }

  uint32_t Emit(NfaInst inst) {
    const uint32_t pc = Pc();
    inst.out = pc + 1;
    _nfa._program.push_back(inst);
    if (!_error && _nfa._program.size() > _size_limit) {
      _error = PatternError::Unsupported(
        absl::StrCat("compiled pattern exceeds the size limit of ",
                     _size_limit, " instructions"));
    }
    return pc;
  }

  void SetSplit(uint32_t pc, uint32_t body, uint32_t exit, bool greedy) {
    auto& inst = _nfa._program[pc];
    inst.out = greedy ? body : exit;
    inst.alt = greedy ? exit : body;
  }

  void EmitAssert(AssertionKind kind) {
    Emit({.op = Op::kAssert, .arg = static_cast<uint32_t>(kind)});
    _nfa._has_zero_width = true;
  }

  void EmitNode(const Ast& node) {
    if (_error) {
      return;
    }
    std::visit(
      [&](const auto& n) {
        using N = decltype(n);
        if constexpr (kIs<ast::Empty, N>) {
          // nothing to match
        } else if constexpr (kIs<ast::Literal, N>) {
          for (size_t pos = 0; pos < n.text.size();) {
            const auto decoded = utf8_utils::Decode(n.text, pos);
            Emit({.op = Op::kChar, .arg = decoded.cp});
            pos += decoded.length;
          }
        } else if constexpr (kIs<ast::Class, N>) {
          const auto index = static_cast<uint32_t>(_nfa._classes.size());
          _nfa._classes.push_back(n.set);
          Emit({.op = Op::kClass, .arg = index});
        } else if constexpr (kIs<ast::Sequence, N>) {
          for (const auto& item : n.items) {
            EmitNode(item);
          }
        } else if constexpr (kIs<ast::Alternation, N>) {
          EmitAlternation(n.branches);
        } else if constexpr (kIs<ast::Group, N>) {
          if (n.index) {
            Emit({.op = Op::kSave, .arg = 2 * *n.index});
          }
          EmitNode(*n.inner);
          if (n.index) {
            Emit({.op = Op::kSave, .arg = 2 * *n.index + 1});
          }
        } else if constexpr (kIs<ast::Quantified, N>) {
          EmitRepeat(*n.inner, n.quantifier);
        } else if constexpr (kIs<ast::Anchored, N>) {
          if (n.start) {
            EmitAssert(AssertionKind::kTextStart);
          }
          EmitNode(*n.inner);
          if (n.end) {
            EmitAssert(AssertionKind::kTextEnd);
          }
        } else if constexpr (kIs<ast::Assertion, N>) {
          EmitAssert(n.kind);
        } else if constexpr (kIs<ast::Lookaround, N>) {
          EmitLookaround(n);
        } else {
          static_assert(kIs<ast::Backreference, N>);
          Emit({.op = Op::kBackref, .arg = n.group});
          _nfa._has_zero_width = true;
          _nfa._has_backrefs = true;
        }
      },
      node.node);
  }

  void EmitAlternation(const std::vector<Ast>& branches) {
    std::vector<uint32_t> jumps;
    for (size_t i = 0; i < branches.size() && !_error; ++i) {
      if (i + 1 == branches.size()) {
        EmitNode(branches[i]);
        break;
      }
      const uint32_t split = Emit({.op = Op::kSplit});
      EmitNode(branches[i]);
      jumps.push_back(Emit({.op = Op::kJump}));
      SetSplit(split, split + 1, Pc(), true);
    }
    for (const uint32_t jump : jumps) {
      _nfa._program[jump].out = Pc();
    }
  }

  void EmitRepeat(const Ast& inner, const Quantifier& quantifier) {
    const bool greedy = quantifier.greedy;
    if (quantifier.IsUnbounded()) {
      if (quantifier.min == 0) {
        const uint32_t split = Emit({.op = Op::kSplit});
        EmitNode(inner);
        const uint32_t jump = Emit({.op = Op::kJump});
        _nfa._program[jump].out = split;
        SetSplit(split, split + 1, Pc(), greedy);
        return;
      }
      for (uint32_t i = 1; i < quantifier.min && !_error; ++i) {
        EmitNode(inner);
      }
      const uint32_t body = Pc();
      EmitNode(inner);
      const uint32_t split = Emit({.op = Op::kSplit});
      SetSplit(split, body, Pc(), greedy);
      return;
    }

    for (uint32_t i = 0; i < quantifier.min && !_error; ++i) {
      EmitNode(inner);
    }
    std::vector<uint32_t> splits;
    for (uint32_t i = quantifier.min; i < quantifier.max && !_error; ++i) {
      splits.push_back(Emit({.op = Op::kSplit}));
      EmitNode(inner);
    }
    for (const uint32_t split : splits) {
      SetSplit(split, split + 1, Pc(), greedy);
    }
  }

  void EmitLookaround(const ast::Lookaround& node) {
    auto inner = Nfa::Compile(*node.inner, _nfa._group_count, _size_limit,
                              IsLookbehind(node.kind));
    if (!inner) {
      _error = std::move(inner.error());
      return;
    }
    const auto index = static_cast<uint32_t>(_nfa._lookarounds.size());
    _nfa._lookarounds.emplace_back(
      node.kind, std::make_shared<const Nfa>(std::move(*inner)),
      MinLength(*node.inner), MaxLength(*node.inner));
    Emit({.op = Op::kLookaround, .arg = index});
    _nfa._has_zero_width = true;
  }

  Nfa& _nfa;
  size_t _size_limit;
  std::optional<PatternError> _error;
};

Expected<Nfa> Nfa::Compile(const Ast& root, uint32_t group_count,
                           size_t size_limit, bool match_at_end) {
  Nfa nfa;
  nfa._group_count = group_count;
  if (const auto* anchored = root.As<ast::Anchored>()) {
    nfa._anchored_start = anchored->start;
  }
  NfaBuilder builder{nfa, size_limit};
  if (auto error = builder.Build(root, match_at_end)) {
    return std::unexpected(std::move(*error));
  }
  return nfa;
}

bool Nfa::Search(std::string_view text, size_t from, bool anchored,
                 Slots& slots) const {
  std::fill(slots.begin(), slots.end(), kNoPos);
  if (from > text.size()) {
    return false;
  }
  if (_anchored_start) {
    if (from != 0) {
      return false;
    }
    anchored = true;
  }
  const size_t width =
    _has_backrefs ? SlotCount() : std::min(slots.size(), SlotCount());
  PikeVm vm{*this, text, width};
  return vm.Run(from, anchored, slots);
}

std::optional<Span> Nfa::FindAt(std::string_view text, size_t from) const {
  Slots slots(2, kNoPos);
  if (!Search(text, from, false, slots)) {
    return std::nullopt;
  }
  return Span{slots[0], slots[1]};
}

}  // namespace rex
