#include "renderer.hpp"
#include <algorithm>
#include <cstdio>

static int digits_for(int n) {
  int d = 1;
  while (n >= 10) { n /= 10; d++; }
  return d;
}

TextArea Renderer::text_area(TermSize sz) {
  TextArea a;
  int height = std::max(1, sz.rows - 2);
  int digits = std::max(2, digits_for(height));
  a.gutter = digits + 3;  // "NN | "
  a.width = std::max(1, sz.cols - a.gutter);
  a.height = height;
  return a;
}

void Renderer::render_line(ITerminal& term, int row, int col, const Line& line) {
  size_t i = 0;
  while (i < line.size()) {
    ColorTag color = line[i].color;
    std::string run;
    size_t j = i;
    while (j < line.size() && line[j].color == color) run.push_back(line[j++].ch);
    term.draw_colored(row, col + static_cast<int>(i), run, color);
    i = j;
  }
}

std::string Renderer::status_text(const BufferEngine& eng, const std::string& id) const {
  std::string s = " " + id;
  if (eng.typing_disabled()) return s + " - enlarge terminal to edit note";
  if (eng.has_unsaved_changes()) s += " *";
  s += eng.write_mode() == WriteMode::Insert ? " | INS" : " | OVR";
  if (eng.active_color() != ActiveColor::None) {
    s += " | color ";
    s += color_tag_name(eng.active_color_tag());
  }
  Cursor c = eng.cursor();
  s += " | Ln " + std::to_string(c.row + 1) + ", Col " + std::to_string(c.col + 1);
  s += " | " + std::to_string(eng.char_count()) + " chars";
  if (eng.buffer_full()) s += " | full";
  return s;
}

void Renderer::render(ITerminal& term,
                      const NoteSession& session,
                      const std::string& message,
                      const std::string& cmdline,
                      bool command_mode) {
  TermSize sz = term.get_size();
  TextArea area = text_area(sz);
  term.clear();
  const BufferEngine* eng = session.engine();
  if (!eng) {
    term.draw_text(0, 0, "No note open");
  } else {
    int digits = area.gutter - 3;
    for (int r = 0; r < area.height; ++r) {
      char num[16];
      std::snprintf(num, sizeof(num), "%0*d | ", digits, r + 1);
      term.draw_gutter(r, 0, num);
      if (r < eng->line_count()) render_line(term, r, area.gutter, eng->buffer().line(r));
    }
    std::string status = status_text(*eng, session.note_id());
    status.resize(static_cast<size_t>(std::max(0, sz.cols)), ' ');
    term.draw_reversed(area.height, 0, status);
  }
  int last = sz.rows - 1;
  if (command_mode) {
    term.draw_text(last, 0, ":" + cmdline);
    term.clear_to_eol(last, static_cast<int>(cmdline.size()) + 1);
    term.set_cursor_visible(true);
    term.move_cursor(last, static_cast<int>(cmdline.size()) + 1);
  } else {
    term.draw_text(last, 0, message.substr(0, static_cast<size_t>(std::max(0, sz.cols - 1))));
    bool show = eng && !eng->typing_disabled();
    term.set_cursor_visible(show);
    if (show) term.move_cursor(eng->cursor().row, std::min(sz.cols - 1, area.gutter + eng->cursor().col));
  }
  term.refresh();
}
