#include "ncurses_terminal.hpp"
#include <locale.h>

static constexpr short kGutterPair = 16;

NcursesTerminal::NcursesTerminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  init_colors();
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

void NcursesTerminal::init_colors() {
  if (!has_colors()) return;
  start_color();
  colors_ = true;
  short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
  for (short tag = 1; tag <= 15; ++tag) {
    // 8-colour terminals: fold the bright half onto the base colours
    short fg = COLORS >= 16 ? tag : static_cast<short>(tag % 8);
    init_pair(tag, fg, bg);
  }
  init_pair(kGutterPair, COLOR_YELLOW, bg);
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, ColorTag color) {
  short pair = static_cast<short>(encode_color_tag(color));
  if (!colors_ || pair == 0) { draw_text(row, col, text); return; }
  attron(COLOR_PAIR(pair));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(pair));
}

void NcursesTerminal::draw_gutter(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(kGutterPair));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(kGutterPair));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
