#include "viewport_fit.hpp"
#include <algorithm>
#include <string_view>
#include <utility>

static constexpr std::string_view kEllipsis = " ...";

static Line ellipsis_tail(int n) {
  Line l;
  std::string_view s = kEllipsis.substr(kEllipsis.size() - static_cast<size_t>(n));
  for (char c : s) l.push_back({c, ColorTag::None});
  return l;
}

bool fits_viewport(const NoteBuffer& buf, int max_width, int max_height) {
  max_width = std::max(1, max_width);
  max_height = std::max(1, max_height);
  if (buf.line_count() > max_height) return false;
  for (int i = 0; i < buf.line_count(); ++i) {
    if (buf.line_length(i) > max_width) return false;
  }
  return true;
}

bool fit_to_viewport(NoteBuffer& buf, int max_width, int max_height) {
  max_width = std::max(1, max_width);
  max_height = std::max(1, max_height);
  bool cut = false;

  if (buf.line_count() > max_height) {
    buf.erase_lines_from(max_height);
    buf.replace_line(max_height - 1, ellipsis_tail(3));
    cut = true;
  }

  int tail = std::min(max_width, kEllipsisLength);
  int keep = max_width - tail;
  for (int i = 0; i < buf.line_count(); ++i) {
    if (buf.line_length(i) <= max_width) continue;
    const Line& src = buf.line(i);
    Line l(src.begin(), src.begin() + keep);
    Line e = ellipsis_tail(tail);
    l.insert(l.end(), e.begin(), e.end());
    buf.replace_line(i, std::move(l));
    cut = true;
  }
  return cut;
}
