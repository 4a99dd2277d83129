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

#include "compiler.hpp"

#include <memory>
#include <type_traits>
#include <utility>

#include "basics/logger/logger.h"
#include "rexile/optimization/literal.hpp"
#include "rexile/optimization/prefilter.hpp"

namespace rex {
namespace {

template<typename T, typename N>
constexpr bool kIs = std::is_same_v<std::decay_t<N>, T>;

// capture-free back-ends ordered after the capture DFA
std::optional<CompiledMatcher> CompileCaptureFree(const Ast& root) {
  if (auto literals = ExtractAlternation(root)) {
    REX_DEBUG("5b7c1", Logger::REGEX, "literal matcher over ",
              literals->size(), " literal(s)");
    return LiteralMatcher{std::move(*literals)};
  }
  REX_TRACE("5b7c2", Logger::REGEX, "declined literal matcher");

  auto sequence = Sequence::FromAst(root);
  if (!sequence) {
    REX_TRACE("5b7c3", Logger::REGEX, "declined sequence tier, not flat");
    return std::nullopt;
  }
  if (!sequence->IsDeterministic()) {
    REX_TRACE("5b7c4", Logger::REGEX,
              "declined sequence tier, needs backtracking");
    return std::nullopt;
  }
  if (auto dfa = Dfa::Build(*sequence)) {
    REX_DEBUG("5b7c5", Logger::REGEX, "DFA with ", dfa->States().size(),
              " states");
    return std::move(*dfa);
  }
  REX_TRACE("5b7c6", Logger::REGEX, "declined DFA");
  REX_DEBUG("5b7c7", Logger::REGEX, "sequence matcher with ",
            sequence->Elements().size(), " elements");
  return SequenceMatcher{std::move(*sequence)};
}

}  // namespace

Expected<CompiledMatcher> Compile(const ParsedPattern& pattern,
                                  const PatternOptions& options) {
  const Ast& root = pattern.root;
  const bool has_groups = pattern.group_count != 0;

  if (!has_groups && options.enable_fast_path) {
    if (auto fast_path = FastPath::Detect(root)) {
      REX_DEBUG("5b7c0", Logger::REGEX, "fast path ",
                ToString(fast_path->GetKind()));
      return std::move(*fast_path);
    }
    REX_TRACE("5b7c8", Logger::REGEX, "declined fast path");
  }

  if (has_groups && options.enable_capture_dfa) {
    if (auto dfa = CaptureDfa::Build(pattern, options.capture_lookback)) {
      REX_DEBUG("5b7c9", Logger::REGEX, "capture DFA with ",
                dfa->States().size(), " states");
      return std::move(*dfa);
    }
    REX_TRACE("5b7ca", Logger::REGEX, "declined capture DFA");
  }

  if (!has_groups) {
    if (auto matcher = CompileCaptureFree(root)) {
      return std::move(*matcher);
    }
  }

  auto nfa = Nfa::Compile(root, pattern.group_count, options.size_limit);
  if (!nfa) {
    REX_DEBUG("5b7cb", Logger::REGEX, "NFA rejected: ", nfa.error().message);
    return std::unexpected(std::move(nfa).error());
  }
  if (options.enable_prefilter) {
    if (auto literals = ExtractPrefixes(root)) {
      if (auto prefilter = Prefilter::FromLiterals(std::move(*literals))) {
        REX_TRACE("5b7cc", Logger::REGEX, "prefilter ",
                  ToString(prefilter->GetKind()));
        nfa->SetPrefilter(std::move(*prefilter));
      }
    }
  }

  if (!has_groups) {
    auto shared = std::make_shared<const Nfa>(std::move(*nfa));
    if (auto lazy = LazyDfa::Build(shared)) {
      REX_DEBUG("5b7cd", Logger::REGEX, "lazy DFA over ",
                shared->Program().size(), " instructions");
      return std::move(*lazy);
    }
    REX_TRACE("5b7ce", Logger::REGEX, "declined lazy DFA");
    REX_DEBUG("5b7cf", Logger::REGEX, "NFA with ", shared->Program().size(),
              " instructions");
    return *shared;
  }

  REX_DEBUG("5b7d0", Logger::REGEX, "NFA with ", nfa->Program().size(),
            " instructions");
  return std::move(*nfa);
}

std::string_view BackendName(const CompiledMatcher& matcher) noexcept {
  return std::visit(
    [](const auto& m) -> std::string_view {
      using M = decltype(m);
      if constexpr (kIs<FastPath, M>) {
        return "fast-path";
      } else if constexpr (kIs<CaptureDfa, M>) {
        return "capture-dfa";
      } else if constexpr (kIs<LiteralMatcher, M>) {
        return "literal";
      } else if constexpr (kIs<Dfa, M>) {
        return "dfa";
      } else if constexpr (kIs<SequenceMatcher, M>) {
        return "sequence";
      } else if constexpr (kIs<LazyDfa, M>) {
        return "lazy-dfa";
      } else {
        static_assert(kIs<Nfa, M>);
        return "nfa";
      }
    },
    matcher);
}

}  // namespace rex
