#pragma once

#include "warden/common/result.hpp"
#include "warden/edit/text_matcher.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace warden::edit {

struct EditRequest {
  std::string old_string;
  std::string new_string;
  bool replace_all = false;
};

struct EditLimits {
  std::size_t max_batch_edits = 100;
  std::size_t max_string_bytes = 512 * 1024;
};

struct AppliedEdit {
  MatchStrategy strategy = MatchStrategy::Exact;
  // Positions refer to the buffer as it was when this edit was applied.
  std::vector<MatchResult> matches;
};

struct EditOutcome {
  std::string content;
  std::vector<AppliedEdit> applied;

  [[nodiscard]] std::size_t replacements() const;
};

class EditEngine {
public:
  EditEngine();
  EditEngine(EditLimits limits, TextMatcher matcher);

  [[nodiscard]] common::Result<EditOutcome> apply_edit(std::string_view content,
                                                       const EditRequest &request) const;

  /// The first failure aborts with BatchFailed naming its 1-based index and cause.
  [[nodiscard]] common::Result<EditOutcome>
  apply_edits(std::string_view content, const std::vector<EditRequest> &edits) const;

  [[nodiscard]] const EditLimits &limits() const { return limits_; }
  [[nodiscard]] const TextMatcher &matcher() const { return matcher_; }

private:
  [[nodiscard]] common::Status check_caps(const EditRequest &request) const;
  [[nodiscard]] common::Result<AppliedEdit> apply_in_place(std::string &buffer,
                                                           const EditRequest &request) const;

  EditLimits limits_;
  TextMatcher matcher_;
};

/// Shifts the indentation of `new_string` from the indentation `old_string`
/// was written with to the indentation of the `matched` block.
[[nodiscard]] std::string reindent_replacement(std::string_view matched,
                                               std::string_view old_string,
                                               std::string_view new_string);

} // namespace warden::edit
