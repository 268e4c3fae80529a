#include "warden/common/result.hpp"

namespace warden::common {

std::string_view to_string(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::PathTraversal:
    return "path_traversal";
  case ErrorCode::SymlinkEscape:
    return "symlink_escape";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::ReadBeforeWriteRequired:
    return "read_before_write_required";
  case ErrorCode::NoOpEdit:
    return "no_op_edit";
  case ErrorCode::NoMatch:
    return "no_match";
  case ErrorCode::AmbiguousMatch:
    return "ambiguous_match";
  case ErrorCode::IntegrityError:
    return "integrity_error";
  case ErrorCode::BatchFailed:
    return "batch_failed";
  case ErrorCode::Disallowed:
    return "disallowed";
  case ErrorCode::DestructiveRefused:
    return "destructive_refused";
  case ErrorCode::TimedOut:
    return "timed_out";
  case ErrorCode::NotText:
    return "not_text";
  case ErrorCode::CapExceeded:
    return "cap_exceeded";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Io:
    return "io";
  }
  return "io";
}

} // namespace warden::common
