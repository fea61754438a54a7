#pragma once
#include <vector>
#include "color_tag.hpp"

struct ColoredChar {
  char ch = ' ';
  ColorTag color = ColorTag::None;

  bool operator==(const ColoredChar&) const = default;
  bool is_space() const { return ch == ' '; }
};

using Line = std::vector<ColoredChar>;
