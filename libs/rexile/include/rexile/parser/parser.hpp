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

#include <string>
#include <string_view>
#include <vector>

#include "rexile/error.hpp"
#include "rexile/parser/ast.hpp"

namespace rex {

struct RegexMeta {
  static constexpr char kDot = '.';
  static constexpr char kStar = '*';
  static constexpr char kPlus = '+';
  static constexpr char kQuestion = '?';
  static constexpr char kPipe = '|';
  static constexpr char kLParen = '(';
  static constexpr char kRParen = ')';
  static constexpr char kLBracket = '[';
  static constexpr char kRBracket = ']';
  static constexpr char kLBrace = '{';
  static constexpr char kCaret = '^';
  static constexpr char kDollar = '$';
  static constexpr char kEscape = '\\';
};

// Inline flags given by a leading (?ims) group. They are applied while
// parsing, the produced tree carries no flag state.
struct ParseFlags {
  bool case_insensitive = false;
  bool multiline = false;
  bool dot_all = false;
};

struct ParsedPattern {
  Ast root;
  // number of capturing groups, group 0 not included
  uint32_t group_count = 0;
  // group_count + 1 entries, empty for unnamed groups
  std::vector<std::string> group_names;
  ParseFlags flags;
};

Expected<ParsedPattern> Parse(std::string_view pattern);

}  // namespace rex
