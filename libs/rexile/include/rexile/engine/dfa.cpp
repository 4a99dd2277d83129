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

#include "dfa.hpp"

namespace rex {
namespace {

Dfa::Transition MakeTransition(const CharClass& set, uint32_t target) {
  Dfa::Transition transition;
  transition.target = target;
  uint32_t cp;
  if (set.IsWordClass()) {
    transition.predicate = Dfa::Predicate::kWord;
  } else if (set.IsDigitClass()) {
    transition.predicate = Dfa::Predicate::kDigit;
  } else if (set.IsWhitespaceClass()) {
    transition.predicate = Dfa::Predicate::kWhitespace;
  } else if (set.IsSingleChar(&cp)) {
    transition.predicate = Dfa::Predicate::kByte;
    transition.byte = static_cast<uint8_t>(cp);
  } else {
    transition.predicate = Dfa::Predicate::kClass;
    transition.bitmap = set.AsciiBitmap();
  }
  return transition;
}

}  // namespace

std::optional<Dfa> Dfa::Build(const Sequence& sequence) {
  if (!sequence.IsDeterministic()) {
    return std::nullopt;
  }
  const auto& elements = sequence.Elements();
  for (const auto& element : elements) {
    const bool shape =
      element.min == 1 &&
      (element.max == 1 || element.max == Quantifier::kUnbounded);
    if (!shape || !element.set.IsAsciiOnly()) {
      return std::nullopt;
    }
  }

  // state 0 is the start, state i + 1 is reached by element i
  Dfa dfa;
  dfa._anchored_start = sequence.AnchoredStart();
  dfa._anchored_end = sequence.AnchoredEnd();
  dfa._states.resize(elements.size() + 1);
  for (uint32_t i = 0; i < elements.size(); ++i) {
    const auto& element = elements[i];
    dfa._states[i].advance = MakeTransition(element.set, i + 1);
    if (element.max == Quantifier::kUnbounded) {
      dfa._states[i + 1].loop = MakeTransition(element.set, i + 1);
    }
  }
  for (uint32_t c = 0; c < 128; ++c) {
    dfa._first_bytes[c] = dfa._states[0].advance->Matches(c);
  }
  dfa._literal = sequence.LiteralPrefix();
  dfa._literal_is_prefix = !dfa._literal.empty();
  if (!dfa._literal_is_prefix) {
    dfa._literal = sequence.InnerLiteral();
  }
  return dfa;
}

std::optional<size_t> Dfa::RunAt(std::string_view text, size_t pos) const {
  uint32_t state = 0;
  for (; pos < text.size(); ++pos) {
    const auto c = static_cast<uint8_t>(text[pos]);
    const auto& current = _states[state];
    if (current.loop && current.loop->Matches(c)) {
      continue;
    }
    if (current.advance && current.advance->Matches(c)) {
      state = current.advance->target;
      continue;
    }
    break;
  }
  if (state + 1 != _states.size() || (_anchored_end && pos != text.size())) {
    return std::nullopt;
  }
  return pos;
}

std::optional<Span> Dfa::FindAt(std::string_view text, size_t from) const {
  if (from > text.size()) {
    return std::nullopt;
  }
  if (_anchored_start) {
    if (from != 0) {
      return std::nullopt;
    }
    if (const auto end = RunAt(text, 0)) {
      return Span{0, *end};
    }
    return std::nullopt;
  }
  if (!_literal.empty() &&
      text.find(_literal, from) == std::string_view::npos) {
    return std::nullopt;
  }
  return Scan(text, from);
}

std::optional<Span> Dfa::Scan(std::string_view text, size_t from) const {
  struct Run {
    uint32_t state;
    size_t start;
  };
  const uint32_t last = static_cast<uint32_t>(_states.size() - 1);

  // runs ordered by start, a later run reaching an occupied state is
  // dropped since the earlier one continues the same way
  std::vector<Run> runs;
  std::vector<Run> next;
  std::vector<bool> taken(_states.size());
  std::optional<Span> best;
  auto offer = [&](const Run& run, size_t end) {
    if (_anchored_end && end != text.size()) {
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
      if (_literal_is_prefix) {
        pos = text.find(_literal, pos);
        if (pos == std::string_view::npos) {
          return std::nullopt;
        }
      }
      while (pos < text.size() &&
             !_first_bytes[static_cast<uint8_t>(text[pos])]) {
        ++pos;
      }
      if (pos == text.size()) {
        return std::nullopt;
      }
    }
    if (!best) {
      runs.push_back({0, pos});
    }

    if (pos == text.size()) {
      for (const auto& run : runs) {
        if (run.state == last) {
          offer(run, pos);
        }
      }
      return best;
    }

    const auto c = static_cast<uint8_t>(text[pos]);
    next.clear();
    for (auto run : runs) {
      if (best && run.start > best->start) {
        break;
      }
      const auto& current = _states[run.state];
      const bool loops = current.loop && current.loop->Matches(c);
      if (!loops) {
        if (!current.advance || !current.advance->Matches(c)) {
          if (run.state == last) {
            offer(run, pos);
          }
          continue;
        }
        run.state = current.advance->target;
      }
      if (!taken[run.state]) {
        taken[run.state] = true;
        next.push_back(run);
      }
    }
    for (const auto& run : next) {
      taken[run.state] = false;
    }
    runs.swap(next);
    ++pos;
  }
}

}  // namespace rex
