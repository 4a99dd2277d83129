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

#include <optional>
#include <string>
#include <vector>

#include "rexile/parser/ast.hpp"

namespace rex {

inline constexpr size_t kMaxLiterals = 16;

// The literals a whole match consists of, e.g. "foo|bar|baz". Fails if
// any branch is not a plain non-empty literal.
std::optional<std::vector<std::string>> ExtractAlternation(const Ast& root);

// Non-empty strings one of which every match starts with, at most
// kMaxLiterals of them.
std::optional<std::vector<std::string>> ExtractPrefixes(const Ast& root);

std::string LongestCommonPrefix(const std::vector<std::string>& literals);

}  // namespace rex
