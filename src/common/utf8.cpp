#include "warden/common/utf8.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace warden::common {

namespace {

enum class BreakClass {
  Other,
  CR,
  LF,
  Control,
  Extend,
  ZWJ,
  RegionalIndicator,
  Prepend,
  SpacingMark,
  L,
  V,
  T,
  LV,
  LVT,
  Pictographic,
};

using Range = std::pair<std::uint32_t, std::uint32_t>;

constexpr std::array kControl{
    Range{0x0000, 0x0009}, Range{0x000B, 0x000C}, Range{0x000E, 0x001F},
    Range{0x007F, 0x009F}, Range{0x00AD, 0x00AD}, Range{0x061C, 0x061C},
    Range{0x180E, 0x180E}, Range{0x200B, 0x200B}, Range{0x200E, 0x200F},
    Range{0x2028, 0x202E}, Range{0x2060, 0x206F}, Range{0xFEFF, 0xFEFF},
    Range{0xFFF0, 0xFFFB}, Range{0xE0000, 0xE001F}, Range{0xE0080, 0xE00FF},
};

constexpr std::array kExtend{
    Range{0x0300, 0x036F},   Range{0x0483, 0x0489},   Range{0x0591, 0x05BD},
    Range{0x05BF, 0x05BF},   Range{0x05C1, 0x05C2},   Range{0x05C4, 0x05C5},
    Range{0x05C7, 0x05C7},   Range{0x0610, 0x061A},   Range{0x064B, 0x065F},
    Range{0x0670, 0x0670},   Range{0x06D6, 0x06DC},   Range{0x06DF, 0x06E4},
    Range{0x06E7, 0x06E8},   Range{0x06EA, 0x06ED},   Range{0x0711, 0x0711},
    Range{0x0730, 0x074A},   Range{0x07A6, 0x07B0},   Range{0x07EB, 0x07F3},
    Range{0x0816, 0x082D},   Range{0x0859, 0x085B},   Range{0x08D3, 0x08E1},
    Range{0x08E3, 0x0902},   Range{0x093A, 0x093A},   Range{0x093C, 0x093C},
    Range{0x0941, 0x0948},   Range{0x094D, 0x094D},   Range{0x0951, 0x0957},
    Range{0x0962, 0x0963},   Range{0x0981, 0x0981},   Range{0x09BC, 0x09BC},
    Range{0x09BE, 0x09BE},   Range{0x09C1, 0x09C4},   Range{0x09CD, 0x09CD},
    Range{0x09D7, 0x09D7},   Range{0x09E2, 0x09E3},   Range{0x0A01, 0x0A02},
    Range{0x0A3C, 0x0A3C},   Range{0x0A41, 0x0A51},   Range{0x0A70, 0x0A71},
    Range{0x0A75, 0x0A75},   Range{0x0A81, 0x0A82},   Range{0x0ABC, 0x0ABC},
    Range{0x0AC1, 0x0AC8},   Range{0x0ACD, 0x0ACD},   Range{0x0B01, 0x0B01},
    Range{0x0B3C, 0x0B3C},   Range{0x0B3F, 0x0B3F},   Range{0x0B41, 0x0B44},
    Range{0x0B4D, 0x0B4D},   Range{0x0BC0, 0x0BC0},   Range{0x0BCD, 0x0BCD},
    Range{0x0C3E, 0x0C40},   Range{0x0C46, 0x0C56},   Range{0x0CBC, 0x0CBC},
    Range{0x0CCC, 0x0CCD},   Range{0x0D41, 0x0D44},   Range{0x0D4D, 0x0D4D},
    Range{0x0E31, 0x0E31},   Range{0x0E34, 0x0E3A},   Range{0x0E47, 0x0E4E},
    Range{0x0EB1, 0x0EB1},   Range{0x0EB4, 0x0EBC},   Range{0x0EC8, 0x0ECD},
    Range{0x0F18, 0x0F19},   Range{0x0F35, 0x0F35},   Range{0x0F37, 0x0F37},
    Range{0x0F39, 0x0F39},   Range{0x0F71, 0x0F7E},   Range{0x0F80, 0x0F84},
    Range{0x102D, 0x1030},   Range{0x1032, 0x1037},   Range{0x1039, 0x103A},
    Range{0x135D, 0x135F},   Range{0x1712, 0x1714},   Range{0x17B4, 0x17B5},
    Range{0x17B7, 0x17BD},   Range{0x17C6, 0x17C6},   Range{0x17C9, 0x17D3},
    Range{0x180B, 0x180D},   Range{0x1AB0, 0x1AFF},   Range{0x1DC0, 0x1DFF},
    Range{0x200C, 0x200C},   Range{0x20D0, 0x20F0},   Range{0x2CEF, 0x2CF1},
    Range{0x2DE0, 0x2DFF},   Range{0x302A, 0x302F},   Range{0x3099, 0x309A},
    Range{0xA66F, 0xA672},   Range{0xA674, 0xA67D},   Range{0xA69E, 0xA69F},
    Range{0xA8E0, 0xA8F1},   Range{0xFB1E, 0xFB1E},   Range{0xFE00, 0xFE0F},
    Range{0xFE20, 0xFE2F},   Range{0xFF9E, 0xFF9F},   Range{0x1F3FB, 0x1F3FF},
    Range{0xE0020, 0xE007F}, Range{0xE0100, 0xE01EF},
};

constexpr std::array kSpacingMark{
    Range{0x0903, 0x0903}, Range{0x093B, 0x093B}, Range{0x093E, 0x0940},
    Range{0x0949, 0x094C}, Range{0x094E, 0x094F}, Range{0x0982, 0x0983},
    Range{0x09BF, 0x09C0}, Range{0x09C7, 0x09C8}, Range{0x09CB, 0x09CC},
    Range{0x0A03, 0x0A03}, Range{0x0A3E, 0x0A40}, Range{0x0A83, 0x0A83},
    Range{0x0ABE, 0x0AC0}, Range{0x0AC9, 0x0AC9}, Range{0x0ACB, 0x0ACC},
    Range{0x0B02, 0x0B03}, Range{0x0B40, 0x0B40}, Range{0x0B47, 0x0B4C},
    Range{0x0BBF, 0x0BBF}, Range{0x0BC1, 0x0BCC}, Range{0x0C01, 0x0C03},
    Range{0x0C41, 0x0C44}, Range{0x0D02, 0x0D03}, Range{0x0D3F, 0x0D40},
    Range{0x0D46, 0x0D4C}, Range{0x0E33, 0x0E33}, Range{0x0EB3, 0x0EB3},
    Range{0x0F3E, 0x0F3F}, Range{0x0F7F, 0x0F7F}, Range{0x1031, 0x1031},
    Range{0x103B, 0x103C}, Range{0x17B6, 0x17B6}, Range{0x17BE, 0x17C5},
    Range{0x17C7, 0x17C8},
};

constexpr std::array kPrepend{
    Range{0x0600, 0x0605}, Range{0x06DD, 0x06DD}, Range{0x070F, 0x070F},
    Range{0x0890, 0x0891}, Range{0x08E2, 0x08E2}, Range{0x0D4E, 0x0D4E},
    Range{0x110BD, 0x110BD}, Range{0x110CD, 0x110CD},
};

constexpr std::array kPictographic{
    Range{0x00A9, 0x00A9},   Range{0x00AE, 0x00AE},   Range{0x203C, 0x203C},
    Range{0x2049, 0x2049},   Range{0x2122, 0x2122},   Range{0x2139, 0x2139},
    Range{0x2194, 0x2199},   Range{0x21A9, 0x21AA},   Range{0x231A, 0x231B},
    Range{0x2328, 0x2328},   Range{0x2388, 0x2388},   Range{0x23CF, 0x23CF},
    Range{0x23E9, 0x23F3},   Range{0x23F8, 0x23FA},   Range{0x24C2, 0x24C2},
    Range{0x25AA, 0x25AB},   Range{0x25B6, 0x25B6},   Range{0x25C0, 0x25C0},
    Range{0x25FB, 0x25FE},   Range{0x2600, 0x2605},   Range{0x2607, 0x2612},
    Range{0x2614, 0x2685},   Range{0x2690, 0x2705},   Range{0x2708, 0x2712},
    Range{0x2714, 0x2714},   Range{0x2716, 0x2716},   Range{0x271D, 0x271D},
    Range{0x2721, 0x2721},   Range{0x2728, 0x2728},   Range{0x2733, 0x2734},
    Range{0x2744, 0x2744},   Range{0x2747, 0x2747},   Range{0x274C, 0x274C},
    Range{0x274E, 0x274E},   Range{0x2753, 0x2755},   Range{0x2757, 0x2757},
    Range{0x2763, 0x2767},   Range{0x2795, 0x2797},   Range{0x27A1, 0x27A1},
    Range{0x27B0, 0x27B0},   Range{0x27BF, 0x27BF},   Range{0x2934, 0x2935},
    Range{0x2B05, 0x2B07},   Range{0x2B1B, 0x2B1C},   Range{0x2B50, 0x2B50},
    Range{0x2B55, 0x2B55},   Range{0x3030, 0x3030},   Range{0x303D, 0x303D},
    Range{0x3297, 0x3297},   Range{0x3299, 0x3299},   Range{0x1F000, 0x1F0FF},
    Range{0x1F10D, 0x1F10F}, Range{0x1F12F, 0x1F12F}, Range{0x1F16C, 0x1F171},
    Range{0x1F17E, 0x1F17F}, Range{0x1F18E, 0x1F18E}, Range{0x1F191, 0x1F19A},
    Range{0x1F1AD, 0x1F1E5}, Range{0x1F201, 0x1F20F}, Range{0x1F21A, 0x1F21A},
    Range{0x1F22F, 0x1F22F}, Range{0x1F232, 0x1F23A}, Range{0x1F23C, 0x1F23F},
    Range{0x1F249, 0x1F3FA}, Range{0x1F400, 0x1F53D}, Range{0x1F546, 0x1F64F},
    Range{0x1F680, 0x1F6FF}, Range{0x1F774, 0x1F77F}, Range{0x1F7D5, 0x1F7FF},
    Range{0x1F80C, 0x1F80F}, Range{0x1F848, 0x1F84F}, Range{0x1F85A, 0x1F85F},
    Range{0x1F888, 0x1F88F}, Range{0x1F8AE, 0x1F8FF}, Range{0x1F90C, 0x1F93A},
    Range{0x1F93C, 0x1F945}, Range{0x1F947, 0x1FAFF}, Range{0x1FC00, 0x1FFFD},
};

template <std::size_t N>
bool in_ranges(const std::array<Range, N> &ranges, const std::uint32_t cp) {
  const auto it = std::upper_bound(ranges.begin(), ranges.end(), cp,
                                   [](std::uint32_t value, const Range &range) {
                                     return value < range.first;
                                   });
  if (it == ranges.begin()) {
    return false;
  }
  return cp <= std::prev(it)->second;
}

BreakClass classify(const std::uint32_t cp) {
  if (cp == 0x0D) {
    return BreakClass::CR;
  }
  if (cp == 0x0A) {
    return BreakClass::LF;
  }
  if (cp == 0x200D) {
    return BreakClass::ZWJ;
  }
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
    return BreakClass::Control;
  }
  if (cp < 0x00A9) {
    return BreakClass::Other;
  }
  if (cp >= 0x1F1E6 && cp <= 0x1F1FF) {
    return BreakClass::RegionalIndicator;
  }
  if ((cp >= 0x1100 && cp <= 0x115F) || (cp >= 0xA960 && cp <= 0xA97C)) {
    return BreakClass::L;
  }
  if ((cp >= 0x1160 && cp <= 0x11A7) || (cp >= 0xD7B0 && cp <= 0xD7C6)) {
    return BreakClass::V;
  }
  if ((cp >= 0x11A8 && cp <= 0x11FF) || (cp >= 0xD7CB && cp <= 0xD7FB)) {
    return BreakClass::T;
  }
  if (cp >= 0xAC00 && cp <= 0xD7A3) {
    return (cp - 0xAC00) % 28 == 0 ? BreakClass::LV : BreakClass::LVT;
  }
  if (in_ranges(kExtend, cp)) {
    return BreakClass::Extend;
  }
  if (in_ranges(kControl, cp)) {
    return BreakClass::Control;
  }
  if (in_ranges(kSpacingMark, cp)) {
    return BreakClass::SpacingMark;
  }
  if (in_ranges(kPrepend, cp)) {
    return BreakClass::Prepend;
  }
  if (in_ranges(kPictographic, cp)) {
    return BreakClass::Pictographic;
  }
  return BreakClass::Other;
}

bool is_control_like(const BreakClass c) {
  return c == BreakClass::CR || c == BreakClass::LF || c == BreakClass::Control;
}

struct SegmenterState {
  // Pictographic followed by Extend* so far; a ZWJ then joins the next pictograph.
  bool in_emoji_sequence = false;
  bool emoji_zwj_pending = false;
  std::size_t regional_run = 0;
};

bool is_break(const BreakClass prev, const BreakClass next, const SegmenterState &state) {
  if (prev == BreakClass::CR && next == BreakClass::LF) {
    return false;
  }
  if (is_control_like(prev) || is_control_like(next)) {
    return true;
  }
  if (prev == BreakClass::L && (next == BreakClass::L || next == BreakClass::V ||
                                next == BreakClass::LV || next == BreakClass::LVT)) {
    return false;
  }
  if ((prev == BreakClass::LV || prev == BreakClass::V) &&
      (next == BreakClass::V || next == BreakClass::T)) {
    return false;
  }
  if ((prev == BreakClass::LVT || prev == BreakClass::T) && next == BreakClass::T) {
    return false;
  }
  if (next == BreakClass::Extend || next == BreakClass::ZWJ ||
      next == BreakClass::SpacingMark) {
    return false;
  }
  if (prev == BreakClass::Prepend) {
    return false;
  }
  if (prev == BreakClass::ZWJ && next == BreakClass::Pictographic && state.emoji_zwj_pending) {
    return false;
  }
  if (prev == BreakClass::RegionalIndicator && next == BreakClass::RegionalIndicator) {
    return state.regional_run % 2 == 0;
  }
  return true;
}

void advance_state(SegmenterState &state, const BreakClass cls) {
  switch (cls) {
  case BreakClass::Pictographic:
    state.in_emoji_sequence = true;
    state.emoji_zwj_pending = false;
    break;
  case BreakClass::Extend:
    state.emoji_zwj_pending = false;
    break;
  case BreakClass::ZWJ:
    state.emoji_zwj_pending = state.in_emoji_sequence;
    state.in_emoji_sequence = false;
    break;
  default:
    state.in_emoji_sequence = false;
    state.emoji_zwj_pending = false;
    break;
  }
  state.regional_run = cls == BreakClass::RegionalIndicator ? state.regional_run + 1 : 0;
}

} // namespace

bool decode_utf8(const std::string_view input, std::size_t &index, std::uint32_t &cp) {
  if (index >= input.size()) {
    return false;
  }

  const auto lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  std::uint32_t minimum = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
    minimum = 0x80;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
    minimum = 0x800;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
    minimum = 0x10000;
  } else {
    return false;
  }

  if (index + extra >= input.size()) {
    return false;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto next = static_cast<unsigned char>(input[index + i]);
    if ((next & 0xC0U) != 0x80U) {
      return false;
    }
    value = (value << 6U) | (next & 0x3FU);
  }

  if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    return false;
  }

  cp = value;
  index += extra + 1;
  return true;
}

bool is_valid_utf8(const std::string_view input) {
  std::size_t index = 0;
  std::uint32_t cp = 0;
  while (index < input.size()) {
    if (!decode_utf8(input, index, cp)) {
      return false;
    }
  }
  return true;
}

bool is_text(const std::string_view bytes) {
  return bytes.find('\0') == std::string_view::npos && is_valid_utf8(bytes);
}

std::vector<std::size_t> grapheme_boundaries(const std::string_view input) {
  std::vector<std::size_t> boundaries;
  boundaries.reserve(input.size() + 1);

  SegmenterState state;
  BreakClass prev = BreakClass::Control;
  bool first = true;
  std::size_t index = 0;
  while (index < input.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    BreakClass cls = BreakClass::Other;
    if (decode_utf8(input, index, cp)) {
      cls = classify(cp);
    } else {
      index = start + 1;
      cls = BreakClass::Control;
    }

    if (first || is_break(prev, cls, state)) {
      boundaries.push_back(start);
    }
    advance_state(state, cls);
    prev = cls;
    first = false;
  }

  boundaries.push_back(input.size());
  return boundaries;
}

std::size_t grapheme_count(const std::string_view input) {
  return grapheme_boundaries(input).size() - 1;
}

GraphemeIndex::GraphemeIndex(const std::string_view input)
    : boundaries_(grapheme_boundaries(input)) {}

std::size_t GraphemeIndex::cluster_at(const std::size_t byte_offset) const {
  const auto it = std::upper_bound(boundaries_.begin(), boundaries_.end(), byte_offset);
  if (it == boundaries_.begin()) {
    return 0;
  }
  return std::min(static_cast<std::size_t>(std::distance(boundaries_.begin(), it)) - 1, size());
}

bool GraphemeIndex::is_boundary(const std::size_t byte_offset) const {
  return std::binary_search(boundaries_.begin(), boundaries_.end(), byte_offset);
}

std::size_t GraphemeIndex::clusters_before(const std::size_t byte_offset) const {
  const auto it = std::lower_bound(boundaries_.begin(), boundaries_.end(), byte_offset);
  return std::min(static_cast<std::size_t>(std::distance(boundaries_.begin(), it)), size());
}

} // namespace warden::common
