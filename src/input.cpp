#include "input.hpp"
#include <ncurses.h>
#include <string_view>

static constexpr char32_t ctrl(char c) { return static_cast<char32_t>(c - 'A' + 1); }
static constexpr char32_t ESC = 27;

KeyEvent Input::translate(bool is_key_code, std::uint32_t key) const {
  if (is_key_code) return translate_key_code(key);
  return translate_char(static_cast<char32_t>(key));
}

KeyEvent Input::translate_key_code(std::uint32_t key) const {
  switch (static_cast<int>(key)) {
    case KEY_UP: return {Action::MoveUp};
    case KEY_DOWN: return {Action::MoveDown};
    case KEY_LEFT: return {Action::MoveLeft};
    case KEY_RIGHT: return {Action::MoveRight};
    case KEY_HOME: return {Action::LineStart};
    case KEY_END: return {Action::LineEnd};
    case KEY_SR: return {Action::MoveLineUp};
    case KEY_SF: return {Action::MoveLineDown};
    case KEY_IC: return {Action::ToggleWriteMode};
    case KEY_DC: return {Action::DeleteCharForward};
    case KEY_BACKSPACE: return {Action::DeleteCharBackward};
    case KEY_ENTER: return {Action::InsertLine};
    case KEY_RESIZE: return {Action::Resize};
    default: break;
  }
  // xterm-style modified keys have no KEY_ constant, only a terminfo name
  const char* name = keyname(static_cast<int>(key));
  if (!name) return {};
  std::string_view n(name);
  if (n == "kLFT5") return {Action::WordLeft};
  if (n == "kRIT5") return {Action::WordRight};
  if (n == "kHOM5") return {Action::BufferStart};
  if (n == "kEND5") return {Action::BufferEnd};
  if (n == "kDC5") return {Action::DeleteWordForward};
  if (n == "kUP2") return {Action::MoveLineUp};
  if (n == "kDN2") return {Action::MoveLineDown};
  return {};
}

KeyEvent Input::translate_char(char32_t ch) const {
  switch (ch) {
    case '\r': case '\n': return {Action::InsertLine};
    case '\t': return {Action::InsertTab};
    case 127: return {Action::DeleteCharBackward};
    case ctrl('H'): return {Action::DeleteWordBackward};
    case ctrl('S'): return {Action::Save};
    case ctrl('R'): return {Action::Reload};
    case ctrl('Q'): return {Action::Quit};
    case ctrl('D'): return {Action::DeleteLine};
    case ctrl('Z'): return {Action::Undo};
    case ctrl('Y'): return {Action::Redo};
    case ctrl('K'): return {Action::ToggleWriteMode};
    case ctrl('B'): return {Action::TogglePrimaryColor};
    case ctrl('U'): return {Action::ToggleSecondaryColor};
    case ctrl('T'): return {Action::ToggleTertiaryColor};
    case ctrl('G'): return {Action::CommandLine};
    case ESC: return {Action::Cancel};
    default: break;
  }
  if (ch < 32) return {};
  return {Action::InsertChar, ch};
}
