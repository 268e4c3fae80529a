#pragma once

#include "warden/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace warden::common {

[[nodiscard]] Result<std::string> sha256_hex(std::string_view data);

/// `byte_count` bytes from the OpenSSL CSPRNG, hex encoded.
[[nodiscard]] Result<std::string> random_hex(std::size_t byte_count);

} // namespace warden::common
