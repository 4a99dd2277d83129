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

#include <string_view>
#include <variant>

#include "rexile/engine/capture_dfa.hpp"
#include "rexile/engine/dfa.hpp"
#include "rexile/engine/lazy_dfa.hpp"
#include "rexile/engine/nfa.hpp"
#include "rexile/error.hpp"
#include "rexile/matcher/literal_matcher.hpp"
#include "rexile/matcher/sequence.hpp"
#include "rexile/optimization/fast_path.hpp"
#include "rexile/options.hpp"
#include "rexile/parser/parser.hpp"

namespace rex {

using CompiledMatcher = std::variant<FastPath, CaptureDfa, LiteralMatcher, Dfa,
                                     SequenceMatcher, LazyDfa, Nfa>;

// Picks the first back-end able to run the pattern, in the order
// fast path, capture DFA, literals, sequence tier, NFA.
Expected<CompiledMatcher> Compile(const ParsedPattern& pattern,
                                  const PatternOptions& options);

std::string_view BackendName(const CompiledMatcher& matcher) noexcept;

}  // namespace rex
