#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/files/atomic_writer.hpp"
#include "warden/files/text_file.hpp"

#include <filesystem>
#include <sys/stat.h>

namespace {

using warden::common::ErrorCode;

std::uint32_t mode_of(const std::filesystem::path &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return 0;
  }
  return static_cast<std::uint32_t>(st.st_mode & 07777);
}

} // namespace

void register_files_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace files = warden::files;

  tests.push_back({"atomic_writer_replaces_content_and_cleans_up", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "old\n");
                     files::WriteOptions options;
                     options.permissions = 0640;
                     const auto status = files::write_atomic(workspace.path() / "a.txt", "new\n", options);
                     require(status.ok(), status.error());
                     require(workspace.read_file("a.txt") == "new\n", "content replaced");
                     require(mode_of(workspace.path() / "a.txt") == 0640, "permissions applied");
                     require(workspace.list() == std::vector<std::string>{"a.txt"},
                             "no temp files left behind");
                   }});

  tests.push_back({"atomic_writer_requires_parent_unless_asked", [] {
                     warden::testing::TempWorkspace workspace;
                     const auto target = workspace.path() / "deep" / "dir" / "f.txt";
                     const auto missing = files::write_atomic(target, "x");
                     require(missing.code() == ErrorCode::NotFound, "parent must exist");

                     files::WriteOptions options;
                     options.create_parents = true;
                     const auto created = files::write_atomic(target, "x", options);
                     require(created.ok(), created.error());
                     require(workspace.read_file("deep/dir/f.txt") == "x", "written");
                   }});

  tests.push_back({"atomic_writer_hook_failure_leaves_original", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("keep.txt", "original\n");
                     bool saw_temp = false;
                     files::WriteOptions options;
                     options.before_rename = [&saw_temp](const std::filesystem::path &temp) {
                       saw_temp = std::filesystem::exists(temp) &&
                                  files::is_temp_file_name(temp.filename().string());
                       return warden::common::Status::error(ErrorCode::Io, "interrupted");
                     };
                     const auto status =
                         files::write_atomic(workspace.path() / "keep.txt", "replacement\n", options);
                     require(!status.ok(), "hook failure should abort");
                     require(saw_temp, "hook sees the finished temp file");
                     require(workspace.read_file("keep.txt") == "original\n", "original intact");
                     require(workspace.list() == std::vector<std::string>{"keep.txt"},
                             "temp file removed");
                   }});

  tests.push_back({"atomic_write_integrity_error_only_after_rename", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("keep.txt", "original\n");
                     files::WriteOptions options;
                     options.before_rename = [](const std::filesystem::path &) {
                       return warden::common::Status::error(ErrorCode::IntegrityError, "checksum");
                     };
                     const auto status =
                         files::write_atomic(workspace.path() / "keep.txt", "replacement\n", options);
                     require(status.code() == ErrorCode::Io, "pre-rename failure is not integrity");
                     require(workspace.read_file("keep.txt") == "original\n", "original intact");
                   }});

  tests.push_back({"atomic_writer_temp_names", [] {
                     require(files::is_temp_file_name(".a.txt.warden-0011.tmp"), "ours");
                     require(!files::is_temp_file_name("a.txt"), "plain");
                     require(!files::is_temp_file_name(".hidden.tmp"), "other tools' temp files");
                   }});

  tests.push_back({"text_file_reads_utf8_with_permissions", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("t.txt", "caf\xC3\xA9\n");
                     std::filesystem::permissions(workspace.path() / "t.txt",
                                                  std::filesystem::perms::owner_read |
                                                      std::filesystem::perms::owner_write);
                     const auto file = files::read_text_file(workspace.path() / "t.txt", 1024);
                     require(file.ok(), file.error());
                     require(file.value().content == "caf\xC3\xA9\n", "content");
                     require(file.value().permissions == 0600, "mode");
                   }});

  tests.push_back({"text_file_refuses_binary_large_and_missing", [] {
                     warden::testing::TempWorkspace workspace;
                     workspace.create_file("bin.dat", std::string("\x7F" "ELF\0\0", 6));
                     workspace.create_file("latin1.txt", "caf\xE9\n");
                     workspace.create_file("big.txt", std::string(64, 'x'));
                     std::filesystem::create_directory(workspace.path() / "dir");

                     require(files::read_text_file(workspace.path() / "bin.dat", 1024).code() ==
                                 ErrorCode::NotText,
                             "NUL bytes");
                     require(files::read_text_file(workspace.path() / "latin1.txt", 1024).code() ==
                                 ErrorCode::NotText,
                             "invalid UTF-8");
                     require(files::read_text_file(workspace.path() / "big.txt", 32).code() ==
                                 ErrorCode::CapExceeded,
                             "size cap");
                     require(files::read_text_file(workspace.path() / "none.txt", 32).code() ==
                                 ErrorCode::NotFound,
                             "missing");
                     require(files::read_text_file(workspace.path() / "dir", 32).code() ==
                                 ErrorCode::InvalidArgument,
                             "directory");
                   }});
}
