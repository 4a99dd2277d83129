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

#include "prefilter.hpp"

#include <absl/algorithm/container.h>

#include <algorithm>
#include <cstring>

namespace rex {

std::optional<Prefilter> Prefilter::FromLiterals(
  std::vector<std::string> literals) {
  absl::c_sort(literals);
  literals.erase(std::unique(literals.begin(), literals.end()),
                 literals.end());
  if (literals.empty() ||
      absl::c_any_of(literals, [](const auto& l) { return l.empty(); })) {
    return std::nullopt;
  }

  Prefilter prefilter;
  if (literals.size() == 1) {
    prefilter._kind = literals[0].size() == 1 ? Kind::kByte : Kind::kSubstring;
  } else if (literals.size() <= 3) {
    prefilter._kind = Kind::kFirstBytes;
    for (const auto& literal : literals) {
      prefilter._first_bytes[static_cast<uint8_t>(literal[0])] = true;
    }
  } else {
    prefilter._kind = Kind::kAhoCorasick;
    prefilter._automaton = std::make_shared<const AhoCorasick>(literals);
  }
  prefilter._literals = std::move(literals);
  return prefilter;
}

std::optional<size_t> Prefilter::Next(std::string_view text,
                                      size_t from) const {
  if (from >= text.size()) {
    return std::nullopt;
  }
  switch (_kind) {
    case Kind::kByte: {
      const void* found = std::memchr(text.data() + from, _literals[0][0],
                                      text.size() - from);
      if (found == nullptr) {
        return std::nullopt;
      }
      return static_cast<const char*>(found) - text.data();
    }
    case Kind::kSubstring: {
      const size_t pos = text.find(_literals[0], from);
      if (pos == std::string_view::npos) {
        return std::nullopt;
      }
      return pos;
    }
    case Kind::kFirstBytes:
      return NextFirstByte(text, from);
    case Kind::kAhoCorasick:
      if (const auto match = _automaton->FindAt(text, from)) {
        return match->start;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<size_t> Prefilter::NextFirstByte(std::string_view text,
                                               size_t from) const {
  for (size_t pos = from; pos < text.size(); ++pos) {
    if (!_first_bytes[static_cast<uint8_t>(text[pos])]) {
      continue;
    }
    const auto rest = text.substr(pos);
    if (absl::c_any_of(_literals, [&](const std::string& literal) {
          return rest.starts_with(literal);
        })) {
      return pos;
    }
  }
  return std::nullopt;
}

std::string_view ToString(Prefilter::Kind kind) noexcept {
  switch (kind) {
    case Prefilter::Kind::kByte:
      return "byte";
    case Prefilter::Kind::kSubstring:
      return "substring";
    case Prefilter::Kind::kFirstBytes:
      return "first-bytes";
    case Prefilter::Kind::kAhoCorasick:
      return "aho-corasick";
  }
  return "unknown";
}

}  // namespace rex
