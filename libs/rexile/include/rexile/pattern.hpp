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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rexile/compiler.hpp"
#include "rexile/error.hpp"
#include "rexile/matcher/captures.hpp"
#include "rexile/options.hpp"

namespace rex {

// A compiled regular expression. Immutable after construction, copies
// share the compiled matcher and may be used from any number of threads.
class Pattern {
 public:
  static Expected<Pattern> New(std::string_view source,
                               const PatternOptions& options = {});

  std::string_view Source() const noexcept { return _source; }
  // number of capture groups, group 0 not included
  uint32_t GroupCount() const noexcept { return _group_count; }
  std::string_view BackendName() const noexcept;

  bool IsMatch(std::string_view text) const;
  std::optional<Span> Find(std::string_view text) const {
    return FindAt(text, 0);
  }
  // Leftmost match starting at or after pos. Text before pos is still
  // visible to anchors, boundaries and look-behind.
  std::optional<Span> FindAt(std::string_view text, size_t pos) const;
  // Non-overlapping matches from left to right.
  std::vector<Span> FindAll(std::string_view text) const;

  std::optional<Captures> FindCaptures(std::string_view text) const;
  std::vector<Captures> FindAllCaptures(std::string_view text) const;

  // $0..$9 in the replacement insert the group text, a group that did
  // not participate inserts nothing, any other $ is literal.
  std::string Replace(std::string_view text,
                      std::string_view replacement) const;
  std::string ReplaceAll(std::string_view text,
                         std::string_view replacement) const;

  // Parts of the text between matches, empty parts included.
  std::vector<std::string_view> Split(std::string_view text) const;

 private:
  Pattern(std::string source, CompiledMatcher matcher, uint32_t group_count,
          GroupNames names);

  std::optional<Captures> FindCapturesAt(std::string_view text,
                                         size_t pos) const;

  std::string _source;
  std::shared_ptr<const CompiledMatcher> _matcher;
  GroupNames _names;
  uint32_t _group_count = 0;
};

}  // namespace rex
