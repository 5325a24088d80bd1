#include <cstdint>

#include "entry_name.hpp"

namespace zipstream {

namespace {

constexpr std::string_view replacement_char = "\xEF\xBF\xBD";

struct sequence_shape {
  size_t length = 0;
  // allowed range of the second byte, the rest are always 0x80..0xBF
  uint8_t lo = 0x80;
  uint8_t hi = 0xBF;
};

// Table 3-7 "Well-Formed UTF-8 Byte Sequences" of the Unicode standard
constexpr sequence_shape shape_of(uint8_t lead) noexcept {
  if (lead < 0x80)
    return {.length = 1};
  if (lead >= 0xC2 && lead <= 0xDF)
    return {.length = 2};
  if (lead == 0xE0)
    return {.length = 3, .lo = 0xA0};
  if (lead == 0xED)
    return {.length = 3, .hi = 0x9F};
  if (lead >= 0xE1 && lead <= 0xEF)
    return {.length = 3};
  if (lead == 0xF0)
    return {.length = 4, .lo = 0x90};
  if (lead >= 0xF1 && lead <= 0xF3)
    return {.length = 4};
  if (lead == 0xF4)
    return {.length = 4, .hi = 0x8F};
  return {};
}

} // namespace

std::string to_utf8_lossy(std::string_view name) {
  std::string res;
  res.reserve(name.size());
  size_t pos = 0;
  while (pos < name.size()) {
    auto shape = shape_of(static_cast<uint8_t>(name[pos]));
    if (shape.length == 0) {
      res += replacement_char;
      ++pos;
      continue;
    }
    size_t valid = 1;
    while (valid < shape.length && pos + valid < name.size()) {
      const auto byte = static_cast<uint8_t>(name[pos + valid]);
      if (byte < shape.lo || byte > shape.hi)
        break;
      shape.lo = 0x80;
      shape.hi = 0xBF;
      ++valid;
    }
    if (valid == shape.length)
      res += name.substr(pos, valid);
    else
      res += replacement_char;
    pos += valid;
  }
  return res;
}

} // namespace zipstream
