#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses (wide build) for drawing.
 * Lifetime: owns the curses session; the constructor puts the terminal in
 *           raw/noecho/keypad mode, the destructor restores it. One per process.
 * Colours: pair N (1..15) paints ColorTag N; pair 16 is the line-number gutter.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, ColorTag color) override;
  void draw_gutter(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
private:
  void init_colors();
  bool colors_ = false;
};
