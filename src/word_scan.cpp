#include "word_scan.hpp"
#include <algorithm>

static int clamp_col(const Line& line, int col) {
  return std::clamp(col, 0, static_cast<int>(line.size()));
}

int prev_word_start(const Line& line, int col) {
  int i = clamp_col(line, col);
  while (i > 0 && line[i - 1].is_space()) i--;
  while (i > 0 && !line[i - 1].is_space()) i--;
  while (i > 0 && line[i - 1].is_space()) i--;
  while (i > 0 && !line[i - 1].is_space()) i--;
  return i;
}

int next_word_end(const Line& line, int col) {
  int len = static_cast<int>(line.size());
  int i = clamp_col(line, col);
  while (i < len && line[i].is_space()) i++;
  while (i < len && !line[i].is_space()) i++;
  while (i < len && line[i].is_space()) i++;
  return i;
}
