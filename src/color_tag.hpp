#pragma once
/*
 * ColorTag
 *
 * Purpose: display colour stored next to every character of a note.
 * Encoding: one byte per tag, 0 = no colour, 1..15 = terminal colour number.
 */
#include <cstdint>
#include <string>
#include <string_view>

enum class ColorTag : std::uint8_t {
  None = 0,
  Maroon = 1,
  Green = 2,
  Olive = 3,
  Navy = 4,
  Purple = 5,
  Teal = 6,
  Silver = 7,
  Grey = 8,
  Red = 9,
  Lime = 10,
  Yellow = 11,
  Blue = 12,
  Fuchsia = 13,
  Aqua = 14,
  White = 15,
};

std::uint8_t encode_color_tag(ColorTag c);
bool decode_color_tag(std::uint8_t b, ColorTag& out);

std::string_view color_tag_name(ColorTag c);
// Accepts a colour name (any case) or its decimal byte value.
bool color_tag_from_name(std::string_view name, ColorTag& out);
