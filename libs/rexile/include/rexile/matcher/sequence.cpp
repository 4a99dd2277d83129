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

#include "sequence.hpp"

#include <algorithm>
#include <cstdint>

#include "basics/utf8_utils.hpp"

namespace rex {
namespace {

bool AppendItem(const Ast& item, std::vector<SequenceElement>& elements) {
  if (const auto* literal = item.As<ast::Literal>()) {
    for (size_t pos = 0; pos < literal->text.size();) {
      const auto decoded = utf8_utils::Decode(literal->text, pos);
      elements.push_back({CharClass::Single(decoded.cp), 1, 1});
      pos += decoded.length;
    }
    return true;
  }
  if (const auto* cls = item.As<ast::Class>()) {
    elements.push_back({cls->set, 1, 1});
    return true;
  }
  const auto* quantified = item.As<ast::Quantified>();
  if (!quantified || !quantified->quantifier.greedy) {
    return false;
  }
  const auto& q = quantified->quantifier;
  if (const auto* cls = quantified->inner->As<ast::Class>()) {
    elements.push_back({cls->set, q.min, q.max});
    return true;
  }
  if (const auto* literal = quantified->inner->As<ast::Literal>()) {
    const auto decoded = utf8_utils::Decode(literal->text, 0);
    if (decoded.length != literal->text.size()) {
      return false;
    }
    elements.push_back({CharClass::Single(decoded.cp), q.min, q.max});
    return true;
  }
  return false;
}

struct SequenceRun {
  uint32_t element = 0;
  uint32_t count = 0;
  size_t start = 0;
};

enum class RunStep : uint8_t {
  kConsumed,
  // the run matched up to the character
  kCompleted,
  kFailed,
};

// Feeds one character to a greedy run. Counts of unbounded elements stop
// at the minimum, beyond it they behave the same.
RunStep Advance(const std::vector<SequenceElement>& elements,
                SequenceRun& run, uint32_t cp) {
  for (; run.element < elements.size(); ++run.element, run.count = 0) {
    const auto& element = elements[run.element];
    if (run.count < element.max && element.set.Matches(cp)) {
      ++run.count;
      if (element.max == Quantifier::kUnbounded) {
        run.count = std::min(run.count, element.min);
      }
      return RunStep::kConsumed;
    }
    if (run.count < element.min) {
      return RunStep::kFailed;
    }
  }
  return RunStep::kCompleted;
}

bool Finishes(const std::vector<SequenceElement>& elements,
              const SequenceRun& run) {
  for (size_t i = run.element; i < elements.size(); ++i) {
    const uint32_t count = i == run.element ? run.count : 0;
    if (count < elements[i].min) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Sequence> Sequence::FromAst(const Ast& root) {
  Sequence sequence;
  const Ast* body = &root;
  if (const auto* anchored = root.As<ast::Anchored>()) {
    sequence._anchored_start = anchored->start;
    sequence._anchored_end = anchored->end;
    body = anchored->inner.get();
  }

  if (const auto* items = body->As<ast::Sequence>()) {
    for (const auto& item : items->items) {
      if (!AppendItem(item, sequence._elements)) {
        return std::nullopt;
      }
    }
  } else if (!AppendItem(*body, sequence._elements)) {
    return std::nullopt;
  }

  if (sequence._elements.empty()) {
    return std::nullopt;
  }
  return sequence;
}

bool Sequence::IsDeterministic() const {
  for (size_t i = 0; i < _elements.size(); ++i) {
    if (!_elements[i].IsVariable()) {
      continue;
    }
    for (size_t j = i + 1; j < _elements.size(); ++j) {
      if (_elements[i].set.OverlapsWith(_elements[j].set)) {
        return false;
      }
      if (!_elements[j].IsNullable()) {
        break;
      }
    }
  }
  return true;
}

std::optional<size_t> Sequence::MatchAt(std::string_view text,
                                        size_t pos) const {
  for (const auto& element : _elements) {
    uint32_t count = 0;
    while (count < element.max && pos < text.size()) {
      const auto decoded = utf8_utils::Decode(text, pos);
      if (!element.set.Matches(decoded.cp)) {
        break;
      }
      pos += decoded.length;
      ++count;
    }
    if (count < element.min) {
      return std::nullopt;
    }
  }
  if (_anchored_end && pos != text.size()) {
    return std::nullopt;
  }
  return pos;
}

CharClass Sequence::FirstSet() const {
  CharClass first;
  for (const auto& element : _elements) {
    first.AddClass(element.set);
    if (!element.IsNullable()) {
      break;
    }
  }
  return first;
}

bool Sequence::IsNullable() const {
  for (const auto& element : _elements) {
    if (!element.IsNullable()) {
      return false;
    }
  }
  return true;
}

std::string Sequence::LiteralPrefix() const {
  std::string prefix;
  for (const auto& element : _elements) {
    uint32_t cp;
    if (element.min != 1 || element.max != 1 ||
        !element.set.IsSingleChar(&cp)) {
      break;
    }
    utf8_utils::AppendChar32(prefix, cp);
  }
  return prefix;
}

std::string Sequence::InnerLiteral() const {
  std::string literal;
  if (_elements.size() < 2 || !_elements[0].IsVariable() ||
      _elements[0].min == 0) {
    return literal;
  }
  for (size_t i = 1; i < _elements.size(); ++i) {
    uint32_t cp;
    const auto& element = _elements[i];
    if (element.min != 1 || element.max != 1 ||
        !element.set.IsSingleChar(&cp)) {
      break;
    }
    utf8_utils::AppendChar32(literal, cp);
  }
  return literal;
}

SequenceMatcher::SequenceMatcher(Sequence sequence)
  : _sequence{std::move(sequence)},
    _prefix{_sequence.LiteralPrefix()},
    _first{_sequence.FirstSet()},
    _nullable{_sequence.IsNullable()} {
  if (_prefix.empty()) {
    _anchor = _sequence.InnerLiteral();
  }
  for (const auto& element : _sequence.Elements()) {
    _offsets.push_back(_state_count);
    const uint32_t counted =
      element.max == Quantifier::kUnbounded ? element.min : element.max;
    _state_count += counted + 1;
  }
}

std::optional<Span> SequenceMatcher::FindAt(std::string_view text,
                                            size_t from) const {
  if (from > text.size()) {
    return std::nullopt;
  }
  if (_sequence.AnchoredStart()) {
    if (from != 0) {
      return std::nullopt;
    }
    if (const auto end = _sequence.MatchAt(text, 0)) {
      return Span{0, *end};
    }
    return std::nullopt;
  }
  if (!_anchor.empty() &&
      text.find(_anchor, from) == std::string_view::npos) {
    return std::nullopt;
  }
  return Scan(text, from);
}

size_t SequenceMatcher::NextStart(std::string_view text, size_t pos) const {
  if (!_prefix.empty()) {
    return text.find(_prefix, pos);
  }
  if (_nullable) {
    return pos;
  }
  for (; pos < text.size(); pos = utf8_utils::Next(text, pos)) {
    if (_first.Matches(utf8_utils::Decode(text, pos).cp)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

std::optional<Span> SequenceMatcher::Scan(std::string_view text,
                                          size_t from) const {
  const auto& elements = _sequence.Elements();
  auto state_of = [&](const SequenceRun& run) {
    return _offsets[run.element] + run.count;
  };

  // runs ordered by start, the earliest start first
  std::vector<SequenceRun> runs;
  std::vector<SequenceRun> next;
  std::vector<bool> taken(_state_count);
  std::optional<Span> best;
  auto offer = [&](const SequenceRun& run, size_t end) {
    if (_sequence.AnchoredEnd() && end != text.size()) {
      return;
    }
    if (!best || run.start < best->start) {
      best = Span{run.start, end};
    }
  };

  for (size_t pos = from;;) {
    if (runs.empty()) {
      if (best) {
        return best;
      }
      pos = NextStart(text, pos);
      if (pos == std::string_view::npos) {
        return std::nullopt;
      }
    }
    if (!best) {
      runs.push_back({0, 0, pos});
    }

    if (pos == text.size()) {
      for (const auto& run : runs) {
        if (Finishes(elements, run)) {
          offer(run, pos);
        }
      }
      return best;
    }

    const auto decoded = utf8_utils::Decode(text, pos);
    next.clear();
    for (auto run : runs) {
      if (best && run.start > best->start) {
        break;
      }
      switch (Advance(elements, run, decoded.cp)) {
        case RunStep::kConsumed:
          if (!taken[state_of(run)]) {
            taken[state_of(run)] = true;
            next.push_back(run);
          }
          break;
        case RunStep::kCompleted:
          offer(run, pos);
          break;
        case RunStep::kFailed:
          break;
      }
    }
    for (const auto& run : next) {
      taken[state_of(run)] = false;
    }
    runs.swap(next);
    pos += decoded.length;
  }
}

}  // namespace rex
