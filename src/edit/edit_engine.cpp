#include "warden/edit/edit_engine.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/utf8.hpp"

#include <algorithm>
#include <utility>

namespace warden::edit {

namespace {

bool is_blank_line(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](const char ch) {
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v';
  });
}

std::string_view indent_of(std::string_view line) {
  std::size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    ++n;
  }
  return line.substr(0, n);
}

std::vector<std::string_view> split_view(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (true) {
    const auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

std::vector<std::string_view> non_blank_lines(std::string_view text) {
  std::vector<std::string_view> out;
  for (const auto line : split_view(text)) {
    if (!is_blank_line(line)) {
      out.push_back(line);
    }
  }
  return out;
}

common::Error batch_error(const std::size_t index, const common::Error &inner) {
  auto error = common::make_error(common::ErrorCode::BatchFailed,
                                  "edit " + std::to_string(index) + " failed: " + inner.message);
  error.batch_index = index;
  error.inner = inner.code;
  error.match_count = inner.match_count;
  return error;
}

} // namespace

std::size_t EditOutcome::replacements() const {
  std::size_t total = 0;
  for (const auto &edit : applied) {
    total += edit.matches.size();
  }
  return total;
}

std::string reindent_replacement(const std::string_view matched, const std::string_view old_string,
                                 const std::string_view new_string) {
  const auto matched_lines = non_blank_lines(matched);
  const auto old_lines = non_blank_lines(old_string);
  if (matched_lines.empty() || old_lines.empty()) {
    return std::string(new_string);
  }

  // (indent in old_string, indent in the file) per non-blank line pair.
  std::vector<std::pair<std::string_view, std::string_view>> pairs;
  const std::size_t paired = std::min(matched_lines.size(), old_lines.size());
  bool identical = true;
  for (std::size_t i = 0; i < paired; ++i) {
    pairs.emplace_back(indent_of(old_lines[i]), indent_of(matched_lines[i]));
    identical = identical && pairs.back().first == pairs.back().second;
  }
  if (identical) {
    return std::string(new_string);
  }

  const auto shift = [](std::string_view indent, const std::pair<std::string_view, std::string_view> &pair,
                        std::string &out) {
    if (!common::starts_with(indent, pair.first)) {
      return false;
    }
    out.append(pair.second);
    out.append(indent.substr(pair.first.size()));
    return true;
  };

  std::string out;
  out.reserve(new_string.size() + 16);
  const auto lines = split_view(new_string);
  std::size_t non_blank = 0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    const auto line = lines[i];
    if (is_blank_line(line)) {
      out.append(line);
      continue;
    }
    const auto indent = indent_of(line);
    const auto &pair = pairs[std::min(non_blank, pairs.size() - 1)];
    ++non_blank;
    if (shift(indent, pair, out) || shift(indent, pairs.front(), out)) {
      out.append(line.substr(indent.size()));
    } else {
      out.append(line);
    }
  }
  return out;
}

EditEngine::EditEngine() = default;

EditEngine::EditEngine(EditLimits limits, TextMatcher matcher)
    : limits_(limits), matcher_(std::move(matcher)) {}

common::Status EditEngine::check_caps(const EditRequest &request) const {
  if (request.old_string.size() > limits_.max_string_bytes) {
    return common::Status::error(common::ErrorCode::CapExceeded,
                                 "old_string exceeds the limit of " +
                                     std::to_string(limits_.max_string_bytes) + " bytes");
  }
  if (request.new_string.size() > limits_.max_string_bytes) {
    return common::Status::error(common::ErrorCode::CapExceeded,
                                 "new_string exceeds the limit of " +
                                     std::to_string(limits_.max_string_bytes) + " bytes");
  }
  return common::Status::success();
}

common::Result<AppliedEdit> EditEngine::apply_in_place(std::string &buffer,
                                                       const EditRequest &request) const {
  if (request.old_string == request.new_string) {
    return common::Result<AppliedEdit>::failure(common::ErrorCode::NoOpEdit,
                                                "old_string and new_string are identical");
  }
  if (request.old_string.empty()) {
    return common::Result<AppliedEdit>::failure(common::ErrorCode::NoMatch,
                                                "old_string must not be empty");
  }
  if (!common::is_valid_utf8(request.old_string) || !common::is_valid_utf8(request.new_string)) {
    return common::Result<AppliedEdit>::failure(common::ErrorCode::NotText,
                                                "edit strings must be valid UTF-8 text");
  }

  auto found = matcher_.find(buffer, request.old_string, request.replace_all);
  if (!found.ok()) {
    return common::Result<AppliedEdit>::failure(found.detail());
  }

  AppliedEdit applied;
  applied.matches = std::move(found.value());
  applied.strategy = applied.matches.front().strategy_used;
  const bool line_based = strategy_entry(applied.strategy).line_based;

  // Back to front so earlier spans stay valid.
  for (auto it = applied.matches.rbegin(); it != applied.matches.rend(); ++it) {
    const auto span = it->bytes;
    if (line_based) {
      const std::string_view matched(buffer.data() + span.offset, span.length);
      buffer.replace(span.offset, span.length,
                     reindent_replacement(matched, request.old_string, request.new_string));
    } else {
      buffer.replace(span.offset, span.length, request.new_string);
    }
  }
  return common::Result<AppliedEdit>::success(std::move(applied));
}

common::Result<EditOutcome> EditEngine::apply_edit(const std::string_view content,
                                                   const EditRequest &request) const {
  if (auto caps = check_caps(request); !caps.ok()) {
    return common::Result<EditOutcome>::failure(caps.detail());
  }
  EditOutcome outcome;
  outcome.content.assign(content);
  auto applied = apply_in_place(outcome.content, request);
  if (!applied.ok()) {
    return common::Result<EditOutcome>::failure(applied.detail());
  }
  outcome.applied.push_back(std::move(applied.value()));
  return common::Result<EditOutcome>::success(std::move(outcome));
}

common::Result<EditOutcome> EditEngine::apply_edits(const std::string_view content,
                                                    const std::vector<EditRequest> &edits) const {
  if (edits.empty()) {
    return common::Result<EditOutcome>::failure(common::ErrorCode::InvalidArgument,
                                                "edits must contain at least one edit");
  }
  if (edits.size() > limits_.max_batch_edits) {
    return common::Result<EditOutcome>::failure(
        common::ErrorCode::CapExceeded, "batch of " + std::to_string(edits.size()) +
                                            " edits exceeds the limit of " +
                                            std::to_string(limits_.max_batch_edits));
  }
  for (std::size_t i = 0; i < edits.size(); ++i) {
    if (auto caps = check_caps(edits[i]); !caps.ok()) {
      return common::Result<EditOutcome>::failure(batch_error(i + 1, caps.detail()));
    }
  }

  EditOutcome outcome;
  outcome.content.assign(content);
  for (std::size_t i = 0; i < edits.size(); ++i) {
    auto applied = apply_in_place(outcome.content, edits[i]);
    if (!applied.ok()) {
      return common::Result<EditOutcome>::failure(batch_error(i + 1, applied.detail()));
    }
    outcome.applied.push_back(std::move(applied.value()));
  }
  return common::Result<EditOutcome>::success(std::move(outcome));
}

} // namespace warden::edit
