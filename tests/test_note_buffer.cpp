#include "note_buffer.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  NoteBuffer b;
  assert(b.line_count() == 1);
  assert(b.empty());
  assert(b.char_count() == 0);

  b = NoteBuffer::from_strings({"a", "b", "c"});
  assert(b.line_count() == 3);
  assert(!b.empty());
  b.insert_line(1, Line{{'x', ColorTag::Red}});
  assert(b.line_count() == 4);
  assert(b.line_text(1) == "x");
  assert(b.line(1)[0].color == ColorTag::Red);
  b.erase_line(2);
  assert(b.line_text(0) == "a");
  assert(b.line_text(1) == "x");
  assert(b.line_text(2) == "c");
  b.swap_lines(0, 2);
  assert(b.line_text(0) == "c");
  assert(b.line_text(2) == "a");

  b.insert_char(0, 1, {'d', ColorTag::None});
  b.set_char(0, 0, {'C', ColorTag::Blue});
  assert(b.line_text(0) == "Cd");
  b.set_char(0, 2, {'!', ColorTag::None});
  assert(b.line_text(0) == "Cd!");
  b.erase_chars(0, 1, 5);
  assert(b.line_text(0) == "C");
  b.append_to_line(0, b.line(2));
  assert(b.line_text(0) == "Ca");
  assert(b.char_count() == 4);

  NoteBuffer copy = b.clone();
  assert(copy == b);
  copy.replace_line(0, Line());
  assert(copy != b);
  assert(b.line_text(0) == "Ca");

  // out-of-range rows are ignored and read as empty
  b.erase_line(10);
  b.replace_line(-1, Line());
  assert(b.line_count() == 3);
  assert(b.line(7).empty());
  assert(b.line_length(7) == 0);

  b.erase_lines_from(0);
  assert(b.line_count() == 1);
  assert(b.empty());
  return 0;
}
