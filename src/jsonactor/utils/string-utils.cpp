#include "string-utils.hpp"

#include <cstdint>

namespace jsonactor {

// ------------------------------------------------------------------------ Trim

std::string_view trim_leading(std::string_view s, char ch) {
  const auto pos = s.find_first_not_of(ch);
  return (pos == std::string_view::npos) ? std::string_view{} : s.substr(pos);
}

// ------------------------------------------------------------------------ UTF8

bool is_valid_utf8(std::string_view s) noexcept {
  // Smallest code point that needs a sequence of a given length
  static constexpr uint32_t k_min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};

  const auto* pos = reinterpret_cast<const unsigned char*>(s.data());
  const auto* end = pos + s.size();

  while (pos < end) {
    const unsigned char lead = *pos;
    if (lead < 0x80) {
      ++pos;
      continue;
    }

    std::size_t length = 0;
    uint32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false; // stray continuation byte, or 0xF8..0xFF
    }

    if (static_cast<std::size_t>(end - pos) < length)
      return false; // truncated

    for (std::size_t i = 1; i < length; ++i) {
      if ((pos[i] & 0xC0) != 0x80)
        return false;
      code_point = (code_point << 6) | (pos[i] & 0x3F);
    }

    if (code_point < k_min_code_point[length] || code_point > 0x10FFFF
        || (code_point >= 0xD800 && code_point <= 0xDFFF))
      return false;

    pos += length;
  }

  return true;
}

} // namespace jsonactor
