#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace warden::common {

/// Decodes one scalar value at `index`, advancing past it. Returns false on a
/// malformed, overlong or surrogate sequence and leaves `index` unchanged.
[[nodiscard]] bool decode_utf8(std::string_view input, std::size_t &index, std::uint32_t &cp);

[[nodiscard]] bool is_valid_utf8(std::string_view input);

[[nodiscard]] bool is_text(std::string_view bytes);

/// Byte offsets at which extended grapheme clusters begin, followed by
/// `input.size()`. Invalid bytes form single-byte clusters.
[[nodiscard]] std::vector<std::size_t> grapheme_boundaries(std::string_view input);

[[nodiscard]] std::size_t grapheme_count(std::string_view input);

class GraphemeIndex {
public:
  explicit GraphemeIndex(std::string_view input);

  /// Index of the cluster containing `byte_offset`.
  [[nodiscard]] std::size_t cluster_at(std::size_t byte_offset) const;
  /// Number of clusters that start before `byte_offset`.
  [[nodiscard]] std::size_t clusters_before(std::size_t byte_offset) const;
  [[nodiscard]] bool is_boundary(std::size_t byte_offset) const;
  [[nodiscard]] std::size_t size() const { return boundaries_.size() - 1; }

private:
  std::vector<std::size_t> boundaries_;
};

} // namespace warden::common
