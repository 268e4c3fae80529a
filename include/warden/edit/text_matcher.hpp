#pragma once

#include "warden/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::edit {

enum class MatchStrategy {
  Exact,
  LineTrimmed,
  WhitespaceNormalized,
  IndentationFlexible,
  Fuzzy,
};

[[nodiscard]] std::string_view to_string(MatchStrategy strategy);
[[nodiscard]] std::optional<MatchStrategy> strategy_from_string(std::string_view name);

struct ByteSpan {
  std::size_t offset = 0;
  std::size_t length = 0;
};

struct MatchResult {
  MatchStrategy strategy_used = MatchStrategy::Exact;
  // Grapheme-cluster units.
  std::size_t start_offset = 0;
  std::size_t length = 0;
  // Original bytes covered by the match; used for splicing.
  ByteSpan bytes;
};

using StrategyFn = std::vector<ByteSpan> (*)(std::string_view content, std::string_view target);

struct StrategyEntry {
  MatchStrategy strategy;
  StrategyFn find;
  // Spans cover whole lines, so replacements get re-indented to the match.
  bool line_based;
};

[[nodiscard]] const std::vector<StrategyEntry> &strategy_table();
[[nodiscard]] const StrategyEntry &strategy_entry(MatchStrategy strategy);

class TextMatcher {
public:
  TextMatcher();
  explicit TextMatcher(std::vector<MatchStrategy> enabled);

  /// Runs the enabled strategies in priority order and returns the matches of
  /// the first one that finds anything. NoMatch when none does;
  /// AmbiguousMatch(count) when it finds several and `replace_all` is false.
  [[nodiscard]] common::Result<std::vector<MatchResult>>
  find(std::string_view content, std::string_view target, bool replace_all = false) const;

  [[nodiscard]] const std::vector<MatchStrategy> &strategies() const { return enabled_; }

private:
  std::vector<MatchStrategy> enabled_;
};

} // namespace warden::edit
