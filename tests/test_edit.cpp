#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/edit/edit_engine.hpp"
#include "warden/edit/file_editor.hpp"
#include "warden/edit/text_matcher.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace {

using warden::common::ErrorCode;
using warden::edit::EditRequest;
using warden::edit::MatchStrategy;

// e followed by U+0301
const std::string E_ACUTE = "e\xCC\x81";

std::shared_ptr<warden::sessions::SessionContext> make_session(const std::filesystem::path &root) {
  auto session = warden::sessions::SessionContext::create("test-session", root);
  if (!session.ok()) {
    throw std::runtime_error(session.error());
  }
  return session.value();
}

warden::edit::FileEditor make_editor(
    warden::edit::LegacyMode legacy_mode = warden::edit::LegacyMode::Deny) {
  warden::edit::FilePolicy policy;
  policy.legacy_mode = legacy_mode;
  policy.max_file_bytes = 4096;
  return warden::edit::FileEditor(warden::edit::EditEngine(), policy);
}

warden::edit::FileScope scope_for(const std::shared_ptr<warden::sessions::SessionContext> &session) {
  return warden::edit::FileScope{.project_root = session->project_root(), .session = session.get()};
}

} // namespace

void register_edit_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace edit = warden::edit;

  // TextMatcher

  tests.push_back({"matcher_exact_reports_grapheme_offsets", [] {
                     const edit::TextMatcher matcher;
                     const std::string content = "caf" + E_ACUTE + " bar";
                     const auto found = matcher.find(content, "bar");
                     require(found.ok(), found.error());
                     const auto &match = found.value().front();
                     require(match.strategy_used == MatchStrategy::Exact, "exact");
                     require(match.start_offset == 5, "five clusters precede the match");
                     require(match.length == 3, "length in clusters");
                     require(match.bytes.offset == content.size() - 3, "byte offset");
                   }});

  tests.push_back({"matcher_never_splits_a_grapheme_cluster", [] {
                     const edit::TextMatcher matcher;
                     const std::string content = "caf" + E_ACUTE + " x";
                     require(matcher.find(content, "cafe").code() == ErrorCode::NoMatch,
                             "base letter without its accent");
                     require(matcher.find("ab" + E_ACUTE, "be").code() == ErrorCode::NoMatch,
                             "span ending inside a cluster");
                     const auto whole = matcher.find(content, "caf" + E_ACUTE);
                     require(whole.ok(), whole.error());
                     require(whole.value().front().length == 4, "four clusters");

                     const edit::EditEngine engine;
                     require(engine.apply_edit(content, EditRequest{"cafe", "tea"}).code() ==
                                 ErrorCode::NoMatch,
                             "accent is not moved onto another letter");
                     const auto edited =
                         engine.apply_edit(content, EditRequest{"caf" + E_ACUTE, "tea"});
                     require(edited.ok() && edited.value().content == "tea x", "whole cluster");
                   }});

  tests.push_back({"matcher_ambiguous_without_replace_all", [] {
                     const edit::TextMatcher matcher;
                     const auto found = matcher.find("foo bar foo", "foo");
                     require(!found.ok(), "two matches should be ambiguous");
                     require(found.code() == ErrorCode::AmbiguousMatch, "code");
                     require(found.detail().match_count == 2, "count");
                     require(found.error().find("Found 2 matches") != std::string::npos, "message");

                     const auto all = matcher.find("foo bar foo", "foo", true);
                     require(all.ok() && all.value().size() == 2, "replace_all returns both");
                   }});

  tests.push_back({"matcher_no_match_and_empty_target", [] {
                     const edit::TextMatcher matcher;
                     require(matcher.find("abc", "zzz").code() == ErrorCode::NoMatch, "no match");
                     require(matcher.find("abc", "").code() == ErrorCode::InvalidArgument, "empty");
                   }});

  tests.push_back({"matcher_line_trimmed_covers_whole_lines", [] {
                     const edit::TextMatcher matcher;
                     const std::string content = "    return a;\n}\n";
                     const auto found = matcher.find(content, "return a;   ");
                     require(found.ok(), found.error());
                     const auto &match = found.value().front();
                     require(match.strategy_used == MatchStrategy::LineTrimmed, "line trimmed");
                     require(match.bytes.offset == 0 && match.bytes.length == 13,
                             "span is the indented line without its newline");
                   }});

  tests.push_back({"matcher_whitespace_normalized_maps_back_to_original", [] {
                     const edit::TextMatcher matcher;
                     const std::string content = "x; int  x =   1; y;";
                     const auto found = matcher.find(content, "int x = 1;");
                     require(found.ok(), found.error());
                     const auto &match = found.value().front();
                     require(match.strategy_used == MatchStrategy::WhitespaceNormalized, "strategy");
                     require(content.substr(match.bytes.offset, match.bytes.length) ==
                                 "int  x =   1;",
                             "original bytes");
                   }});

  tests.push_back({"matcher_indentation_flexible_needs_consistent_prefix", [] {
                     const edit::TextMatcher matcher({MatchStrategy::IndentationFlexible});
                     const std::string content = "class A {\n    void f();\n    void g();\n}\n";
                     const auto found = matcher.find(content, "  void f();\n  void g();\n");
                     require(found.ok(), found.error());
                     const auto &match = found.value().front();
                     require(match.strategy_used == MatchStrategy::IndentationFlexible, "strategy");
                     require(content.substr(match.bytes.offset, match.bytes.length) ==
                                 "    void f();\n    void g();\n",
                             "whole lines including the trailing newline");

                     const auto uneven = matcher.find("  a();\n b();\n", "a();\nb();");
                     require(uneven.code() == ErrorCode::NoMatch, "inconsistent indentation");
                   }});

  tests.push_back({"matcher_default_chain_reaches_line_trimmed_first", [] {
                     const std::string content = "class A {\n    void f();\n    void g();\n}\n";
                     const auto found =
                         edit::TextMatcher().find(content, "  void f();\n  void g();\n");
                     require(found.ok(), found.error());
                     require(found.value().front().strategy_used == MatchStrategy::LineTrimmed,
                             "line trimmed claims the block before indentation flexible");

                     const edit::TextMatcher narrowed(
                         {MatchStrategy::Exact, MatchStrategy::IndentationFlexible,
                          MatchStrategy::Fuzzy});
                     const auto flexible = narrowed.find(content, "  void f();\n  void g();\n");
                     require(flexible.ok(), flexible.error());
                     require(flexible.value().front().strategy_used ==
                                 MatchStrategy::IndentationFlexible,
                             "wins once line trimmed is off");
                   }});

  tests.push_back({"matcher_fuzzy_folds_typography_and_punctuation_spacing", [] {
                     const edit::TextMatcher matcher;
                     // U+201C and U+201D around hello
                     const std::string content = "say(\xE2\x80\x9Chello\xE2\x80\x9D) ;\nnext();\n";
                     const auto found = matcher.find(content, "say(\"hello\");");
                     require(found.ok(), found.error());
                     const auto &match = found.value().front();
                     require(match.strategy_used == MatchStrategy::Fuzzy, "fuzzy");
                     require(content.substr(match.bytes.offset, match.bytes.length) ==
                                 "say(\xE2\x80\x9Chello\xE2\x80\x9D) ;",
                             "original line returned");
                   }});

  tests.push_back({"matcher_fuzzy_skips_blank_lines", [] {
                     const edit::TextMatcher matcher({MatchStrategy::Fuzzy});
                     const std::string content = "a = 1;\n\n   b = 2;\nc = 3;\n";
                     const auto found = matcher.find(content, "a = 1;\nb = 2;");
                     require(found.ok(), found.error());
                     require(content.substr(found.value().front().bytes.offset,
                                            found.value().front().bytes.length) ==
                                 "a = 1;\n\n   b = 2;",
                             "span runs from first to last matched line");
                   }});

  tests.push_back({"matcher_subset_keeps_priority_order", [] {
                     const edit::TextMatcher matcher({MatchStrategy::Fuzzy, MatchStrategy::Exact});
                     const auto found = matcher.find("a  b", "a  b");
                     require(found.ok(), found.error());
                     require(found.value().front().strategy_used == MatchStrategy::Exact,
                             "exact still runs first");
                     require(edit::strategy_from_string("whitespace_normalized") ==
                                 MatchStrategy::WhitespaceNormalized,
                             "name lookup");
                     require(!edit::strategy_from_string("regex").has_value(), "unknown name");
                   }});

  // EditEngine

  tests.push_back({"engine_edit_and_inverse_round_trip", [] {
                     const edit::EditEngine engine;
                     const std::string original = "fn main() {\n    let x = 1;\n}\n";
                     const auto forward =
                         engine.apply_edit(original, EditRequest{"let x = 1;", "let x = 2;"});
                     require(forward.ok(), forward.error());
                     require(forward.value().content == "fn main() {\n    let x = 2;\n}\n",
                             "exactly the span replaced");
                     const auto back = engine.apply_edit(forward.value().content,
                                                         EditRequest{"let x = 2;", "let x = 1;"});
                     require(back.ok(), back.error());
                     require(back.value().content == original, "inverse restores content");
                   }});

  tests.push_back({"engine_rejects_noop_empty_and_binary_edits", [] {
                     const edit::EditEngine engine;
                     require(engine.apply_edit("abc", EditRequest{"b", "b"}).code() ==
                                 ErrorCode::NoOpEdit,
                             "identical strings");
                     require(engine.apply_edit("abc", EditRequest{"", "x"}).code() ==
                                 ErrorCode::NoMatch,
                             "empty old_string");
                     require(engine.apply_edit("abc", EditRequest{"b", "\xFF"}).code() ==
                                 ErrorCode::NotText,
                             "invalid UTF-8 replacement");
                   }});

  tests.push_back({"engine_replace_all_replaces_every_occurrence", [] {
                     const edit::EditEngine engine;
                     const auto ambiguous = engine.apply_edit("foo bar foo", EditRequest{"foo", "baz"});
                     require(ambiguous.code() == ErrorCode::AmbiguousMatch, "ambiguous");
                     require(ambiguous.detail().match_count == 2, "count");

                     const auto all =
                         engine.apply_edit("foo bar foo", EditRequest{"foo", "baz", true});
                     require(all.ok(), all.error());
                     require(all.value().content == "baz bar baz", "both replaced");
                     require(all.value().replacements() == 2, "two replacements");
                   }});

  tests.push_back({"engine_reindents_line_matches", [] {
                     const edit::EditEngine engine;
                     const std::string content = "line1\n  line2\n line3";
                     const auto edited =
                         engine.apply_edit(content, EditRequest{"line2\nline3", "LINE2\nLINE3"});
                     require(edited.ok(), edited.error());
                     require(edited.value().content == "line1\n  LINE2\n LINE3",
                             "surrounding indentation preserved");
                     require(edited.value().applied.front().strategy != MatchStrategy::Exact,
                             "needed a whitespace-tolerant strategy");
                   }});

  tests.push_back({"engine_reindents_nested_replacement_lines", [] {
                     const edit::EditEngine engine(edit::EditLimits{},
                                                   edit::TextMatcher({MatchStrategy::IndentationFlexible}));
                     const std::string content = "impl A {\n    fn f() {\n        a();\n    }\n}\n";
                     const auto edited = engine.apply_edit(
                         content, EditRequest{"fn f() {\n    a();\n}\n",
                                              "fn f() {\n    a();\n    b();\n}\n"});
                     require(edited.ok(), edited.error());
                     require(edited.value().content ==
                                 "impl A {\n    fn f() {\n        a();\n        b();\n    }\n}\n",
                             "new lines shifted by the block's indentation");
                   }});

  tests.push_back({"engine_batch_runs_on_evolving_buffer", [] {
                     const edit::EditEngine engine;
                     const auto edited = engine.apply_edits(
                         "one two", {EditRequest{"one", "uno"}, EditRequest{"uno two", "uno dos"}});
                     require(edited.ok(), edited.error());
                     require(edited.value().content == "uno dos", "second edit sees the first");
                     require(edited.value().applied.size() == 2, "both applied");
                   }});

  tests.push_back({"engine_batch_failure_names_index_and_cause", [] {
                     const edit::EditEngine engine;
                     const auto edited = engine.apply_edits(
                         "a b c", {EditRequest{"a", "x"}, EditRequest{"missing", "y"},
                                   EditRequest{"c", "z"}});
                     require(!edited.ok(), "batch should fail");
                     require(edited.code() == ErrorCode::BatchFailed, "code");
                     require(edited.detail().batch_index == 2, "index");
                     require(edited.detail().inner == ErrorCode::NoMatch, "inner cause");
                     require(edited.error().rfind("edit 2 failed: ", 0) == 0, "message");
                   }});

  tests.push_back({"engine_caps_checked_before_matching", [] {
                     const edit::EditEngine engine(
                         edit::EditLimits{.max_batch_edits = 2, .max_string_bytes = 4},
                         edit::TextMatcher());
                     require(engine.apply_edit("abcdef", EditRequest{"abcde", "x"}).code() ==
                                 ErrorCode::CapExceeded,
                             "old_string cap");
                     const auto batch = engine.apply_edits(
                         "a", {EditRequest{"a", "b"}, EditRequest{"b", "c"}, EditRequest{"c", "d"}});
                     require(batch.code() == ErrorCode::CapExceeded, "batch size cap");
                     const auto late = engine.apply_edits(
                         "a", {EditRequest{"zzz", "b"}, EditRequest{"b", "toolong"}});
                     require(late.code() == ErrorCode::BatchFailed, "caps before matching");
                     require(late.detail().batch_index == 2, "cap names its edit");
                     require(late.detail().inner == ErrorCode::CapExceeded, "inner cap");
                     require(engine.apply_edits("a", {}).code() == ErrorCode::InvalidArgument,
                             "empty batch");
                   }});

  // FileEditor

  tests.push_back({"file_editor_requires_read_before_edit", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "hello world\n");
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();

                     const auto refused =
                         editor.edit_file("a.txt", EditRequest{"world", "there"}, scope_for(session));
                     require(refused.code() == ErrorCode::ReadBeforeWriteRequired, "unread");
                     require(refused.error() == "File must be read before editing: a.txt", "message");

                     require(editor.read_file("a.txt", scope_for(session)).ok(), "read");
                     const auto edited =
                         editor.edit_file("a.txt", EditRequest{"world", "there"}, scope_for(session));
                     require(edited.ok(), edited.error());
                     require(workspace.read_file("a.txt") == "hello there\n", "written");

                     const auto again =
                         editor.edit_file("a.txt", EditRequest{"there", "again"}, scope_for(session));
                     require(again.ok(), "own writes keep the record fresh");
                   }});

  tests.push_back({"file_editor_detects_external_changes", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "v1\n");
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();
                     require(editor.read_file("a.txt", scope_for(session)).ok(), "read");
                     workspace.create_file("a.txt", "v2\n");
                     const auto stale =
                         editor.edit_file("a.txt", EditRequest{"v2", "v3"}, scope_for(session));
                     require(stale.code() == ErrorCode::ReadBeforeWriteRequired, "stale read");
                     require(stale.error() == "File has changed since it was last read: a.txt",
                             "message");
                     require(workspace.read_file("a.txt") == "v2\n", "untouched");
                   }});

  tests.push_back({"file_editor_failed_batch_leaves_file_identical", [] {
                     warden::testing::TempWorkspace workspace;
                     const std::string original = "alpha\nbeta\ngamma\n";
                     workspace.create_file("f.txt", original);
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();
                     require(editor.read_file("f.txt", scope_for(session)).ok(), "read");

                     const auto result = editor.multi_edit_file(
                         "f.txt",
                         {EditRequest{"alpha", "ALPHA"}, EditRequest{"delta", "DELTA"},
                          EditRequest{"gamma", "GAMMA"}},
                         scope_for(session));
                     require(result.code() == ErrorCode::BatchFailed, "batch failed");
                     require(result.detail().batch_index == 2, "names edit 2");
                     require(workspace.read_file("f.txt") == original, "byte-identical");
                     require(workspace.list() == std::vector<std::string>{"f.txt"}, "no temp files");
                   }});

  tests.push_back({"file_editor_multi_edit_commits_once", [] {
                     warden::testing::ObserverGuard guard;
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("f.txt", "a\nb\n");
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();
                     require(editor.read_file("f.txt", scope_for(session)).ok(), "read");
                     const auto result = editor.multi_edit_file(
                         "f.txt", {EditRequest{"a", "A"}, EditRequest{"b", "B"}}, scope_for(session));
                     require(result.ok(), result.error());
                     require(workspace.read_file("f.txt") == "A\nB\n", "both applied");
                     require(guard.observer().metrics().size() == 1, "batch size metric");
                   }});

  tests.push_back({"file_editor_write_creates_and_overwrites", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto session = make_session(workspace.path());
                     warden::edit::FilePolicy policy;
                     policy.default_mode = 0600;
                     const edit::FileEditor editor{edit::EditEngine(), policy};

                     const auto created =
                         editor.write_file("sub/new.txt", "fresh\n", scope_for(session));
                     require(created.ok(), created.error());
                     require(created.value().created, "reported as created");
                     require(workspace.read_file("sub/new.txt") == "fresh\n", "content");
                     struct stat st {};
                     require(::stat((workspace.path() / "sub/new.txt").c_str(), &st) == 0 &&
                                 (st.st_mode & 0777) == 0600,
                             "default mode");

                     const auto rewritten =
                         editor.write_file("sub/new.txt", "second\n", scope_for(session));
                     require(rewritten.ok(), "a session's own write counts as a read");
                     require(!rewritten.value().created, "overwrite");

                     workspace.create_file("existing.txt", "theirs\n");
                     const auto blind = editor.write_file("existing.txt", "mine\n", scope_for(session));
                     require(blind.code() == ErrorCode::ReadBeforeWriteRequired,
                             "overwrite needs a read");
                     require(workspace.read_file("existing.txt") == "theirs\n", "untouched");
                   }});

  tests.push_back({"file_editor_write_rejects_binary_and_directories", [] {
                     warden::testing::TempWorkspace workspace;
                     std::filesystem::create_directory(workspace.path() / "dir");
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();
                     require(editor.write_file("b.bin", std::string("a\0b", 3), scope_for(session))
                                     .code() == ErrorCode::NotText,
                             "NUL content");
                     require(editor.write_file("dir", "x", scope_for(session)).code() ==
                                 ErrorCode::InvalidArgument,
                             "directory target");
                     require(editor.write_file("big.txt", std::string(5000, 'x'), scope_for(session))
                                     .code() == ErrorCode::CapExceeded,
                             "size cap");
                   }});

  tests.push_back({"file_editor_rejects_escaping_and_missing_paths", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto session = make_session(workspace.path());
                     const auto editor = make_editor();
                     require(editor.edit_file("../x.txt", EditRequest{"a", "b"}, scope_for(session))
                                     .code() == ErrorCode::PathTraversal,
                             "traversal");
                     const auto missing =
                         editor.edit_file("missing.txt", EditRequest{"a", "b"}, scope_for(session));
                     require(missing.code() == ErrorCode::NotFound, "missing");
                     require(missing.error() == "file not found: missing.txt", "message");
                   }});

  tests.push_back({"file_editor_legacy_mode_policy", [] {
                     warden::testing::ObserverGuard guard;
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "x\n");
                     const edit::FileScope scope{.project_root = workspace.path(), .session = nullptr};

                     const auto denied = make_editor(edit::LegacyMode::Deny)
                                             .edit_file("a.txt", EditRequest{"x", "y"}, scope);
                     require(denied.code() == ErrorCode::ReadBeforeWriteRequired, "deny");

                     const auto allowed = make_editor(edit::LegacyMode::Warn)
                                              .edit_file("a.txt", EditRequest{"x", "y"}, scope);
                     require(allowed.ok(), allowed.error());
                     require(workspace.read_file("a.txt") == "y\n", "written");
                     require(guard.observer().warnings().size() == 1, "warning logged");
                     require(edit::legacy_mode_from_string("warn") == edit::LegacyMode::Warn,
                             "parse");
                     require(!edit::legacy_mode_from_string("soft").has_value(), "unknown");
                   }});

  tests.push_back({"file_editor_interrupted_commit_is_integrity_error", [] {
                     warden::testing::ObserverGuard guard;
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "stable\n");
                     const auto session = make_session(workspace.path());
                     auto editor = make_editor();
                     editor.set_commit_hook([](const std::filesystem::path &) {
                       return warden::common::Status::error(ErrorCode::Io, "disk full");
                     });
                     require(editor.read_file("a.txt", scope_for(session)).ok(), "read");
                     const auto result =
                         editor.edit_file("a.txt", EditRequest{"stable", "changed"}, scope_for(session));
                     require(result.code() == ErrorCode::IntegrityError, "integrity error");
                     require(result.error().find("disk full") == std::string::npos,
                             "OS detail stays in the log");
                     require(result.error() == "failed to write a.txt; the file was left unchanged",
                             "says the file is untouched");
                     require(workspace.read_file("a.txt") == "stable\n", "original intact");
                     require(workspace.list() == std::vector<std::string>{"a.txt"}, "no temp files");
                     require(!guard.observer().errors().empty(), "failure logged");
                   }});

  tests.push_back({"file_editor_refuses_target_swapped_for_symlink", [] {
                     warden::testing::TempWorkspace workspace;
                     warden::testing::TempWorkspace outside;
                     workspace.create_file("a.txt", "inside\n");
                     outside.create_file("victim.txt", "outside\n");
                     const auto session = make_session(workspace.path());
                     auto editor = make_editor();
                     const auto target = workspace.path() / "a.txt";
                     const auto victim = outside.path() / "victim.txt";
                     editor.set_commit_hook([target, victim](const std::filesystem::path &) {
                       std::filesystem::remove(target);
                       std::filesystem::create_symlink(victim, target);
                       return warden::common::Status::success();
                     });
                     require(editor.read_file("a.txt", scope_for(session)).ok(), "read");
                     const auto result =
                         editor.edit_file("a.txt", EditRequest{"inside", "owned"}, scope_for(session));
                     require(result.code() == ErrorCode::SymlinkEscape, "swap detected");
                     require(outside.read_file("victim.txt") == "outside\n", "victim untouched");
                   }});
}
