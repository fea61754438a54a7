#pragma once
/*
 * NoteBuffer
 *
 * Purpose: line-based buffer of coloured characters; the grid of one note.
 * Invariant: always holds at least one line (an empty note is one empty line).
 * Note: bounds (viewport width/height) are enforced by BufferEngine, not here.
 */
#include <string>
#include <string_view>
#include <vector>
#include "colored_char.hpp"

class NoteBuffer {
public:
  NoteBuffer();

  static NoteBuffer from_strings(const std::vector<std::string>& lines, ColorTag color = ColorTag::None);

  bool empty() const;
  int line_count() const;
  int line_length(int r) const;
  int char_count() const;
  const Line& line(int r) const;
  std::string line_text(int r) const;
  const std::vector<Line>& lines() const { return lines_; }

  void init_from_lines(std::vector<Line> lines);
  NoteBuffer clone() const;

  void insert_line(int row, Line l);
  void erase_line(int row);
  void erase_lines_from(int row);
  void replace_line(int row, Line l);
  void swap_lines(int a, int b);
  void append_to_line(int row, const Line& tail);

  void insert_char(int row, int col, ColoredChar c);
  void set_char(int row, int col, ColoredChar c);
  void erase_chars(int row, int col, int count);

  bool operator==(const NoteBuffer&) const = default;

private:
  void ensure_not_empty();
  bool valid_row(int r) const { return r >= 0 && r < static_cast<int>(lines_.size()); }

  std::vector<Line> lines_;
};
