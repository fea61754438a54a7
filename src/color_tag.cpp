#include "color_tag.hpp"
#include <array>
#include <cctype>
#include <charconv>

struct ColorEntry {
  ColorTag tag;
  std::uint8_t byte;
  std::string_view name;
};

static constexpr std::array<ColorEntry, 16> kColors = {{
  {ColorTag::None, 0, "none"},
  {ColorTag::Maroon, 1, "maroon"},
  {ColorTag::Green, 2, "green"},
  {ColorTag::Olive, 3, "olive"},
  {ColorTag::Navy, 4, "navy"},
  {ColorTag::Purple, 5, "purple"},
  {ColorTag::Teal, 6, "teal"},
  {ColorTag::Silver, 7, "silver"},
  {ColorTag::Grey, 8, "grey"},
  {ColorTag::Red, 9, "red"},
  {ColorTag::Lime, 10, "lime"},
  {ColorTag::Yellow, 11, "yellow"},
  {ColorTag::Blue, 12, "blue"},
  {ColorTag::Fuchsia, 13, "fuchsia"},
  {ColorTag::Aqua, 14, "aqua"},
  {ColorTag::White, 15, "white"},
}};

static std::string to_lower(std::string_view s) {
  std::string r(s);
  for (auto& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return r;
}

std::uint8_t encode_color_tag(ColorTag c) {
  switch (c) {
    case ColorTag::None: return 0;
    case ColorTag::Maroon: return 1;
    case ColorTag::Green: return 2;
    case ColorTag::Olive: return 3;
    case ColorTag::Navy: return 4;
    case ColorTag::Purple: return 5;
    case ColorTag::Teal: return 6;
    case ColorTag::Silver: return 7;
    case ColorTag::Grey: return 8;
    case ColorTag::Red: return 9;
    case ColorTag::Lime: return 10;
    case ColorTag::Yellow: return 11;
    case ColorTag::Blue: return 12;
    case ColorTag::Fuchsia: return 13;
    case ColorTag::Aqua: return 14;
    case ColorTag::White: return 15;
  }
  return 0;
}

bool decode_color_tag(std::uint8_t b, ColorTag& out) {
  for (const auto& e : kColors) {
    if (e.byte == b) { out = e.tag; return true; }
  }
  return false;
}

std::string_view color_tag_name(ColorTag c) {
  for (const auto& e : kColors) if (e.tag == c) return e.name;
  return "none";
}

bool color_tag_from_name(std::string_view name, ColorTag& out) {
  if (name.empty()) return false;
  if (std::isdigit(static_cast<unsigned char>(name[0]))) {
    unsigned v = 0;
    auto [p, ec] = std::from_chars(name.data(), name.data() + name.size(), v);
    if (ec != std::errc() || p != name.data() + name.size() || v > 255) return false;
    return decode_color_tag(static_cast<std::uint8_t>(v), out);
  }
  std::string lower = to_lower(name);
  if (lower == "gray") lower = "grey";
  for (const auto& e : kColors) {
    if (e.name == lower) { out = e.tag; return true; }
  }
  return false;
}
