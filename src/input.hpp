#pragma once
/*
 * Input
 *
 * Purpose: translate raw ncurses key codes into note editing actions.
 * Extend: bindings live in one table-like switch; decoupled from the engine.
 */
#include <cstdint>

enum class Action {
  None,
  InsertChar,
  InsertLine,
  InsertTab,
  DeleteCharBackward,
  DeleteCharForward,
  DeleteWordBackward,
  DeleteWordForward,
  DeleteLine,
  MoveUp,
  MoveDown,
  MoveLeft,
  MoveRight,
  WordLeft,
  WordRight,
  LineStart,
  LineEnd,
  BufferStart,
  BufferEnd,
  MoveLineUp,
  MoveLineDown,
  Undo,
  Redo,
  Save,
  Reload,
  Quit,
  ToggleWriteMode,
  TogglePrimaryColor,
  ToggleSecondaryColor,
  ToggleTertiaryColor,
  CommandLine,
  Cancel,
  Resize,
};

struct KeyEvent {
  Action action = Action::None;
  char32_t ch = 0;
};

class Input {
public:
  // is_key_code: get_wch() returned KEY_CODE_YES (function/arrow keys).
  KeyEvent translate(bool is_key_code, std::uint32_t key) const;
private:
  KeyEvent translate_key_code(std::uint32_t key) const;
  KeyEvent translate_char(char32_t ch) const;
};
