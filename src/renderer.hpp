#pragma once
/*
 * Renderer
 *
 * Purpose: paint the open note (line-number gutter + coloured text), the status
 *          line and the message/command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; the editable grid is whatever is left after the gutter
 *             and the two bottom lines, see text_area().
 */
#include <string>
#include "iterminal.hpp"
#include "note_session.hpp"

struct TextArea {
  int gutter = 0;
  int width = 1;
  int height = 1;
};

class Renderer {
public:
  static TextArea text_area(TermSize sz);
  void render(ITerminal& term,
              const NoteSession& session,
              const std::string& message,
              const std::string& cmdline,
              bool command_mode);
private:
  void render_line(ITerminal& term, int row, int col, const Line& line);
  std::string status_text(const BufferEngine& eng, const std::string& id) const;
};
