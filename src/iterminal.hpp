#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: decouple the note view from ncurses.
 */
#include <string>
#include "color_tag.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, ColorTag color) = 0;
  virtual void draw_gutter(int row, int col, const std::string& text) = 0;
  virtual void draw_reversed(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
