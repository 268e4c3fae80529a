#include "warden/edit/text_matcher.hpp"

#include "warden/common/utf8.hpp"

#include <algorithm>
#include <string>

namespace warden::edit {

namespace {

struct Line {
  std::size_t begin = 0;
  // Excludes the line terminator, including the CR of a CRLF.
  std::size_t end = 0;
  std::size_t next = 0;
};

bool is_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), is_space);
}

std::string_view trim_view(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view leading_indent(std::string_view line) {
  std::size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    ++n;
  }
  return line.substr(0, n);
}

std::vector<Line> split_lines(std::string_view text) {
  std::vector<Line> lines;
  std::size_t begin = 0;
  while (begin < text.size()) {
    const auto nl = text.find('\n', begin);
    if (nl == std::string_view::npos) {
      lines.push_back({begin, text.size(), text.size()});
      break;
    }
    std::size_t end = nl;
    if (end > begin && text[end - 1] == '\r') {
      --end;
    }
    lines.push_back({begin, end, nl + 1});
    begin = nl + 1;
  }
  return lines;
}

std::string_view line_text(std::string_view content, const Line &line) {
  return content.substr(line.begin, line.end - line.begin);
}

std::vector<std::string_view> target_lines(std::string_view target) {
  std::vector<std::string_view> out;
  for (const auto &line : split_lines(target)) {
    out.push_back(line_text(target, line));
  }
  return out;
}

bool ends_with_newline(std::string_view text) { return !text.empty() && text.back() == '\n'; }

ByteSpan span_for_lines(const std::vector<Line> &lines, const std::size_t first,
                        const std::size_t last, const bool include_newline) {
  const std::size_t end = include_newline ? lines[last].next : lines[last].end;
  return ByteSpan{.offset = lines[first].begin, .length = end - lines[first].begin};
}

std::vector<ByteSpan> find_exact(std::string_view content, std::string_view target) {
  std::vector<ByteSpan> spans;
  if (target.empty()) {
    return spans;
  }
  auto pos = content.find(target);
  while (pos != std::string_view::npos) {
    spans.push_back({pos, target.size()});
    pos = content.find(target, pos + target.size());
  }
  return spans;
}

std::vector<ByteSpan> find_line_trimmed(std::string_view content, std::string_view target) {
  std::vector<ByteSpan> spans;
  const auto wanted = target_lines(target);
  if (wanted.empty() || std::all_of(wanted.begin(), wanted.end(), is_blank)) {
    return spans;
  }

  std::vector<std::string_view> trimmed;
  trimmed.reserve(wanted.size());
  for (const auto line : wanted) {
    trimmed.push_back(trim_view(line));
  }

  const auto lines = split_lines(content);
  const std::size_t n = trimmed.size();
  for (std::size_t i = 0; i + n <= lines.size();) {
    bool matched = true;
    for (std::size_t k = 0; k < n; ++k) {
      if (trim_view(line_text(content, lines[i + k])) != trimmed[k]) {
        matched = false;
        break;
      }
    }
    if (matched) {
      spans.push_back(span_for_lines(lines, i, i + n - 1, ends_with_newline(target)));
      i += n;
    } else {
      ++i;
    }
  }
  return spans;
}

struct CollapsedText {
  std::string text;
  // Original byte range behind each collapsed character.
  std::vector<std::size_t> begin;
  std::vector<std::size_t> end;
};

CollapsedText collapse_whitespace(std::string_view input) {
  CollapsedText out;
  out.text.reserve(input.size());
  for (std::size_t i = 0; i < input.size();) {
    if (is_space(input[i])) {
      std::size_t j = i;
      while (j < input.size() && is_space(input[j])) {
        ++j;
      }
      out.text.push_back(' ');
      out.begin.push_back(i);
      out.end.push_back(j);
      i = j;
      continue;
    }
    out.text.push_back(input[i]);
    out.begin.push_back(i);
    out.end.push_back(i + 1);
    ++i;
  }
  return out;
}

std::vector<ByteSpan> find_whitespace_normalized(std::string_view content,
                                                 std::string_view target) {
  std::vector<ByteSpan> spans;
  const std::string needle(trim_view(collapse_whitespace(target).text));
  if (needle.empty()) {
    return spans;
  }

  const auto haystack = collapse_whitespace(content);
  auto pos = haystack.text.find(needle);
  while (pos != std::string::npos) {
    const std::size_t last = pos + needle.size() - 1;
    spans.push_back({haystack.begin[pos], haystack.end[last] - haystack.begin[pos]});
    pos = haystack.text.find(needle, pos + needle.size());
  }
  return spans;
}

std::vector<ByteSpan> find_indentation_flexible(std::string_view content,
                                                std::string_view target) {
  std::vector<ByteSpan> spans;
  const auto wanted = target_lines(target);

  std::optional<std::string_view> common_indent;
  for (const auto line : wanted) {
    if (is_blank(line)) {
      continue;
    }
    const auto indent = leading_indent(line);
    if (!common_indent.has_value()) {
      common_indent = indent;
      continue;
    }
    std::size_t shared = 0;
    while (shared < common_indent->size() && shared < indent.size() &&
           (*common_indent)[shared] == indent[shared]) {
      ++shared;
    }
    common_indent = common_indent->substr(0, shared);
  }
  if (!common_indent.has_value()) {
    return spans;
  }

  std::vector<std::string_view> dedented;
  dedented.reserve(wanted.size());
  for (const auto line : wanted) {
    dedented.push_back(is_blank(line) ? std::string_view{} : line.substr(common_indent->size()));
  }

  const auto lines = split_lines(content);
  const std::size_t n = dedented.size();
  for (std::size_t i = 0; i + n <= lines.size();) {
    std::optional<std::string_view> delta;
    bool matched = true;
    for (std::size_t k = 0; k < n && matched; ++k) {
      const auto actual = line_text(content, lines[i + k]);
      if (dedented[k].empty()) {
        matched = is_blank(actual);
        continue;
      }
      if (actual.size() < dedented[k].size() ||
          actual.substr(actual.size() - dedented[k].size()) != dedented[k]) {
        matched = false;
        continue;
      }
      const auto prefix = actual.substr(0, actual.size() - dedented[k].size());
      if (leading_indent(prefix).size() != prefix.size()) {
        matched = false;
      } else if (!delta.has_value()) {
        delta = prefix;
      } else if (*delta != prefix) {
        matched = false;
      }
    }
    if (matched) {
      spans.push_back(span_for_lines(lines, i, i + n - 1, ends_with_newline(target)));
      i += n;
    } else {
      ++i;
    }
  }
  return spans;
}

bool is_fuzzy_punctuation(const char ch) {
  static constexpr std::string_view PUNCT = "()[]{},;:.=+-*/<>!&|^%?\"'`~@#$\\";
  return PUNCT.find(ch) != std::string_view::npos;
}

// Folds typographic quotes, dashes and exotic spaces to ASCII.
std::string fold_typography(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  std::size_t index = 0;
  while (index < line.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (!common::decode_utf8(line, index, cp)) {
      out.push_back(line[start]);
      index = start + 1;
      continue;
    }
    switch (cp) {
    case 0x2018:
    case 0x2019:
    case 0x201A:
    case 0x201B:
    case 0x2032:
      out.push_back('\'');
      break;
    case 0x201C:
    case 0x201D:
    case 0x201E:
    case 0x201F:
    case 0x2033:
      out.push_back('"');
      break;
    case 0x2010:
    case 0x2011:
    case 0x2012:
    case 0x2013:
    case 0x2014:
    case 0x2015:
    case 0x2212:
      out.push_back('-');
      break;
    case 0x2026:
      out += "...";
      break;
    case 0x00A0:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      out.push_back(' ');
      break;
    default:
      if (cp >= 0x2000 && cp <= 0x200A) {
        out.push_back(' ');
      } else {
        out.append(line.substr(start, index - start));
      }
      break;
    }
  }
  return out;
}

std::string normalize_fuzzy_line(std::string_view line) {
  const std::string folded = fold_typography(line);
  const std::string collapsed(trim_view(collapse_whitespace(folded).text));

  std::string out;
  out.reserve(collapsed.size());
  for (std::size_t i = 0; i < collapsed.size(); ++i) {
    const char ch = collapsed[i];
    if (ch == ' ') {
      const bool after_punct = !out.empty() && is_fuzzy_punctuation(out.back());
      const bool before_punct = i + 1 < collapsed.size() && is_fuzzy_punctuation(collapsed[i + 1]);
      if (after_punct || before_punct) {
        continue;
      }
    }
    out.push_back(ch);
  }
  return out;
}

std::vector<ByteSpan> find_fuzzy(std::string_view content, std::string_view target) {
  std::vector<ByteSpan> spans;
  std::vector<std::string> wanted;
  for (const auto line : target_lines(target)) {
    auto normalized = normalize_fuzzy_line(line);
    if (!normalized.empty()) {
      wanted.push_back(std::move(normalized));
    }
  }
  if (wanted.empty()) {
    return spans;
  }

  const auto lines = split_lines(content);
  std::vector<std::size_t> line_index;
  std::vector<std::string> normalized;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto text = normalize_fuzzy_line(line_text(content, lines[i]));
    if (!text.empty()) {
      line_index.push_back(i);
      normalized.push_back(std::move(text));
    }
  }

  const std::size_t n = wanted.size();
  for (std::size_t i = 0; i + n <= normalized.size();) {
    if (std::equal(wanted.begin(), wanted.end(), normalized.begin() + static_cast<long>(i))) {
      spans.push_back(span_for_lines(lines, line_index[i], line_index[i + n - 1],
                                     ends_with_newline(target)));
      i += n;
    } else {
      ++i;
    }
  }
  return spans;
}

} // namespace

std::string_view to_string(const MatchStrategy strategy) {
  switch (strategy) {
  case MatchStrategy::Exact:
    return "exact";
  case MatchStrategy::LineTrimmed:
    return "line_trimmed";
  case MatchStrategy::WhitespaceNormalized:
    return "whitespace_normalized";
  case MatchStrategy::IndentationFlexible:
    return "indentation_flexible";
  case MatchStrategy::Fuzzy:
    return "fuzzy";
  }
  return "exact";
}

std::optional<MatchStrategy> strategy_from_string(const std::string_view name) {
  for (const auto &entry : strategy_table()) {
    if (to_string(entry.strategy) == name) {
      return entry.strategy;
    }
  }
  return std::nullopt;
}

const std::vector<StrategyEntry> &strategy_table() {
  static const std::vector<StrategyEntry> table = {
      {MatchStrategy::Exact, &find_exact, false},
      {MatchStrategy::LineTrimmed, &find_line_trimmed, true},
      {MatchStrategy::WhitespaceNormalized, &find_whitespace_normalized, false},
      {MatchStrategy::IndentationFlexible, &find_indentation_flexible, true},
      {MatchStrategy::Fuzzy, &find_fuzzy, true},
  };
  return table;
}

const StrategyEntry &strategy_entry(const MatchStrategy strategy) {
  const auto &table = strategy_table();
  const auto it = std::find_if(table.begin(), table.end(),
                               [strategy](const auto &entry) { return entry.strategy == strategy; });
  return it == table.end() ? table.front() : *it;
}

TextMatcher::TextMatcher() {
  for (const auto &entry : strategy_table()) {
    enabled_.push_back(entry.strategy);
  }
}

TextMatcher::TextMatcher(std::vector<MatchStrategy> enabled) : enabled_(std::move(enabled)) {}

common::Result<std::vector<MatchResult>> TextMatcher::find(const std::string_view content,
                                                           const std::string_view target,
                                                           const bool replace_all) const {
  using Matches = common::Result<std::vector<MatchResult>>;
  if (target.empty()) {
    return Matches::failure(common::ErrorCode::InvalidArgument, "old_string must not be empty");
  }

  const common::GraphemeIndex index(content);
  for (const auto &entry : strategy_table()) {
    if (std::find(enabled_.begin(), enabled_.end(), entry.strategy) == enabled_.end()) {
      continue;
    }
    auto spans = entry.find(content, target);
    // A span must cover whole clusters, so "e" never matches half of e + U+0301.
    spans.erase(std::remove_if(spans.begin(), spans.end(),
                               [&index](const ByteSpan &span) {
                                 return !index.is_boundary(span.offset) ||
                                        !index.is_boundary(span.offset + span.length);
                               }),
                spans.end());
    if (spans.empty()) {
      continue;
    }
    if (spans.size() > 1 && !replace_all) {
      auto error = common::make_error(
          common::ErrorCode::AmbiguousMatch,
          "Found " + std::to_string(spans.size()) +
              " matches for old_string. Provide more surrounding context to make it unique, "
              "or set replace_all to true.");
      error.match_count = spans.size();
      return Matches::failure(std::move(error));
    }

    std::vector<MatchResult> results;
    results.reserve(spans.size());
    for (const auto &span : spans) {
      const std::size_t start = index.cluster_at(span.offset);
      const std::size_t end = index.clusters_before(span.offset + span.length);
      results.push_back(MatchResult{.strategy_used = entry.strategy,
                                    .start_offset = start,
                                    .length = end - start,
                                    .bytes = span});
    }
    return Matches::success(std::move(results));
  }

  return Matches::failure(common::ErrorCode::NoMatch, "old_string not found in file");
}

} // namespace warden::edit
