#include "ascii_fold.hpp"
#include <array>
#include <string_view>

struct FoldEntry {
  char base;
  std::u32string_view variants;
};

static constexpr std::array<FoldEntry, 19> kFoldTable = {{
  {'A', U"ÀÁÂÃÄÅÆ"},
  {'E', U"ÈÉÊË"},
  {'I', U"ÌÍÎÏ"},
  {'O', U"ÒÓÔÕÖØ"},
  {'U', U"ÙÚÛÜ"},
  {'Y', U"Ý"},
  {'C', U"Ç"},
  {'D', U"Ð"},
  {'N', U"Ñ"},
  {'a', U"àáâãäåæ"},
  {'e', U"èéêë"},
  {'i', U"ìíîï"},
  {'o', U"òóôõöø"},
  {'u', U"ùúûü"},
  {'y', U"ý"},
  {'c', U"ç"},
  {'n', U"ñ"},
  {'d', U"ð"},
  {'s', U"ß"},
}};

char fold_to_ascii(char32_t cp) {
  if (cp < 128) return static_cast<char>(cp);
  for (const auto& e : kFoldTable) {
    if (e.variants.find(cp) != std::u32string_view::npos) return e.base;
  }
  return '?';
}
