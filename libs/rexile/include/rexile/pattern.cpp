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

#include "pattern.hpp"

#include <absl/strings/ascii.h>

#include <concepts>
#include <type_traits>
#include <utility>

#include "basics/logger/logger.h"
#include "basics/string_utils.h"
#include "basics/utf8_utils.hpp"
#include "rexile/parser/parser.hpp"

namespace rex {
namespace {

template<typename M>
concept CaptureMatcher =
  requires(const M& m, std::string_view text, size_t from, Slots& slots) {
    { m.FindCapturesAt(text, from, slots) } -> std::same_as<bool>;
  };

size_t NextSearchPos(std::string_view text, const Span& match) {
  return match.Empty() ? utf8_utils::Next(text, match.end) : match.end;
}

void AppendExpansion(std::string& out, std::string_view replacement,
                     const Captures& captures) {
  for (size_t i = 0; i < replacement.size(); ++i) {
    const char c = replacement[i];
    if (c == '$' && i + 1 < replacement.size() &&
        absl::ascii_isdigit(static_cast<unsigned char>(replacement[i + 1]))) {
      const size_t group = replacement[++i] - '0';
      if (group < captures.Size()) {
        out.append(captures[group]);
      }
      continue;
    }
    out.push_back(c);
  }
}

}  // namespace

Pattern::Pattern(std::string source, CompiledMatcher matcher,
                 uint32_t group_count, GroupNames names)
  : _source{std::move(source)},
    _matcher{std::make_shared<const CompiledMatcher>(std::move(matcher))},
    _names{std::move(names)},
    _group_count{group_count} {}

Expected<Pattern> Pattern::New(std::string_view source,
                               const PatternOptions& options) {
  auto parsed = Parse(source);
  if (!parsed) {
    REX_DEBUG("9d3e0", Logger::REGEX, "cannot parse '", source,
              "': ", parsed.error().message);
    return std::unexpected(std::move(parsed).error());
  }
  auto matcher = Compile(*parsed, options);
  if (!matcher) {
    return std::unexpected(std::move(matcher).error());
  }
  auto names = std::make_shared<const std::vector<std::string>>(
    std::move(parsed->group_names));
  return Pattern{std::string{source}, std::move(*matcher), parsed->group_count,
                 std::move(names)};
}

std::string_view Pattern::BackendName() const noexcept {
  return rex::BackendName(*_matcher);
}

bool Pattern::IsMatch(std::string_view text) const {
  return std::visit([&](const auto& m) { return m.IsMatch(text); },
                    *_matcher);
}

std::optional<Span> Pattern::FindAt(std::string_view text, size_t pos) const {
  if (pos > text.size()) {
    return std::nullopt;
  }
  while (!utf8_utils::IsCharBoundary(text, pos)) {
    ++pos;
  }
  return std::visit([&](const auto& m) { return m.FindAt(text, pos); },
                    *_matcher);
}

std::vector<Span> Pattern::FindAll(std::string_view text) const {
  std::vector<Span> matches;
  for (size_t pos = 0; pos <= text.size();) {
    const auto match = FindAt(text, pos);
    if (!match) {
      break;
    }
    matches.push_back(*match);
    pos = NextSearchPos(text, *match);
  }
  return matches;
}

std::optional<Captures> Pattern::FindCapturesAt(std::string_view text,
                                                size_t pos) const {
  if (pos > text.size()) {
    return std::nullopt;
  }
  auto slots = MakeSlots(_group_count);
  const bool found = std::visit(
    [&](const auto& m) {
      if constexpr (CaptureMatcher<std::decay_t<decltype(m)>>) {
        return m.FindCapturesAt(text, pos, slots);
      } else {
        const auto match = m.FindAt(text, pos);
        if (!match) {
          return false;
        }
        slots[0] = match->start;
        slots[1] = match->end;
        return true;
      }
    },
    *_matcher);
  if (!found) {
    return std::nullopt;
  }
  return Captures{text, std::move(slots), _names};
}

std::optional<Captures> Pattern::FindCaptures(std::string_view text) const {
  return FindCapturesAt(text, 0);
}

std::vector<Captures> Pattern::FindAllCaptures(std::string_view text) const {
  std::vector<Captures> all;
  for (size_t pos = 0; pos <= text.size();) {
    auto captures = FindCapturesAt(text, pos);
    if (!captures) {
      break;
    }
    pos = NextSearchPos(text, captures->Match());
    all.push_back(std::move(*captures));
  }
  return all;
}

std::string Pattern::Replace(std::string_view text,
                             std::string_view replacement) const {
  const auto captures = FindCaptures(text);
  if (!captures) {
    return std::string{text};
  }
  const auto match = captures->Match();
  std::string out{text.substr(0, match.start)};
  AppendExpansion(out, replacement, *captures);
  out.append(text.substr(match.end));
  return out;
}

std::string Pattern::ReplaceAll(std::string_view text,
                                std::string_view replacement) const {
  std::string out;
  size_t last = 0;
  for (const auto& captures : FindAllCaptures(text)) {
    const auto match = captures.Match();
    basics::StrReserveAmortized(out, out.size() + match.start - last +
                                       replacement.size());
    out.append(text.substr(last, match.start - last));
    AppendExpansion(out, replacement, captures);
    last = match.end;
  }
  out.append(text.substr(last));
  return out;
}

std::vector<std::string_view> Pattern::Split(std::string_view text) const {
  std::vector<std::string_view> parts;
  size_t last = 0;
  for (const auto& match : FindAll(text)) {
    parts.push_back(text.substr(last, match.start - last));
    last = match.end;
  }
  parts.push_back(text.substr(last));
  return parts;
}

}  // namespace rex
