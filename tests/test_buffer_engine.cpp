#include "buffer_engine.hpp"
#include <cassert>
#include <string>
#include <vector>

static EngineConfig small(int w, int h) {
  EngineConfig cfg;
  cfg.width = w;
  cfg.height = h;
  return cfg;
}

static void type(BufferEngine& e, const std::string& s) {
  for (char c : s) e.insert_char(static_cast<char32_t>(c));
}

static BufferEngine with_lines(const std::vector<std::string>& lines, int w = 20, int h = 10) {
  BufferEngine e(small(w, h));
  e.load_buffer(NoteBuffer::from_strings(lines));
  return e;
}

static void test_typing() {
  BufferEngine e(small(5, 3));
  assert(!e.has_unsaved_changes());
  type(e, "abc");
  assert(e.buffer().line_text(0) == "abc");
  assert((e.cursor() == Cursor{0, 3}));
  assert(e.has_unsaved_changes());
  type(e, "def");
  assert(e.buffer().line_text(0) == "abcde");
  assert(e.line_full());

  e.move_to_line_start();
  e.toggle_write_mode();
  assert(e.write_mode() == WriteMode::Overwrite);
  type(e, "X");
  assert(e.buffer().line_text(0) == "Xbcde");
  e.move_to_line_end();
  type(e, "z");
  assert(e.buffer().line_text(0) == "Xbcde");

  e.insert_char(U'é');
  e.set_write_mode(WriteMode::Insert);
  e.move_to_line_start();
  e.delete_char_forward();
  e.insert_char(U'ç');
  assert(e.buffer().line_text(0) == "cbcde");
  e.insert_char(1);
  assert(e.buffer().line_text(0) == "cbcde");
  e.mark_saved();
  assert(!e.has_unsaved_changes());
}

static void test_lines() {
  BufferEngine e(small(10, 3));
  type(e, "ab");
  e.move_left();
  e.insert_char(U'\n');
  assert(e.line_count() == 2);
  assert(e.buffer().line_text(0) == "a");
  assert(e.buffer().line_text(1) == "b");
  assert((e.cursor() == Cursor{1, 0}));
  e.insert_line();
  e.insert_line();
  assert(e.buffer_full());
  assert(e.line_count() == 3);

  BufferEngine m = with_lines({"abc", "def"});
  m.move_down();
  assert((m.cursor() == Cursor{1, 0}));
  m.delete_char_backward();
  assert(m.line_count() == 1);
  assert(m.buffer().line_text(0) == "abcdef");
  assert((m.cursor() == Cursor{0, 3}));
  m.insert_line();
  m.move_up();
  m.move_to_line_end();
  m.delete_char_forward();
  assert(m.buffer().line_text(0) == "abcdef");

  // a merge that would overflow the width is refused
  BufferEngine narrow = with_lines({"abc", "def"}, 5, 3);
  narrow.move_down();
  narrow.delete_char_backward();
  assert(narrow.line_count() == 2);
  assert(!narrow.history().can_undo());

  BufferEngine d = with_lines({"one", "two", "three"});
  d.move_down();
  d.delete_line();
  assert(d.line_count() == 2);
  assert(d.buffer().line_text(1) == "three");
  d.move_line_up();
  assert(d.buffer().line_text(0) == "three");
  assert(d.cursor().row == 0);
  d.move_line_up();
  assert(d.cursor().row == 0);
  d.move_line_down();
  assert(d.buffer().line_text(1) == "three");
  d.move_line_down();
  assert(d.cursor().row == 1);

  BufferEngine single(small(10, 3));
  single.delete_line();
  assert(!single.history().can_undo());
  assert(!single.has_unsaved_changes());
}

static void test_words() {
  BufferEngine e = with_lines({"My name is John Smith"}, 40, 3);
  e.go_to_line(1);
  for (int i = 0; i < 11; ++i) e.move_right();
  e.delete_word_backward();
  assert(e.buffer().line_text(0) == "My John Smith");
  assert((e.cursor() == Cursor{0, 3}));
  e.move_to_line_start();
  e.delete_word_forward();
  assert(e.buffer().line_text(0) == "John Smith");
  e.move_word_right();
  assert(e.cursor().col == 5);
  e.move_to_line_end();
  e.move_word_left();
  assert(e.cursor().col == 0);
  e.move_word_left();
  assert((e.cursor() == Cursor{0, 0}));
  e.undo();
  e.undo();
  assert(e.buffer().line_text(0) == "My name is John Smith");
}

static void test_delete_word_example() {
  BufferEngine e = with_lines({"My name is John Smith"}, 40, 3);
  for (int i = 0; i < 11; ++i) e.move_right();
  assert((e.cursor() == Cursor{0, 11}));
  e.delete_word_backward();
  assert(e.buffer().line_text(0) == "My John Smith");
  assert(e.cursor().col == 3);
}

static void test_navigation() {
  BufferEngine e = with_lines({"abc", "de"});
  e.move_left();
  e.move_up();
  assert((e.cursor() == Cursor{0, 0}));
  e.move_to_line_end();
  e.move_right();
  assert((e.cursor() == Cursor{1, 0}));
  e.move_left();
  assert((e.cursor() == Cursor{0, 3}));
  e.move_down();
  assert((e.cursor() == Cursor{1, 2}));
  e.move_to_line_start();
  e.move_down();
  assert((e.cursor() == Cursor{1, 2}));
  e.move_right();
  assert((e.cursor() == Cursor{1, 2}));
  e.move_to_buffer_start();
  assert((e.cursor() == Cursor{0, 0}));
  e.move_to_buffer_end();
  assert((e.cursor() == Cursor{1, 2}));
  e.go_to_line(1);
  assert((e.cursor() == Cursor{0, 0}));
  e.go_to_line(99);
  assert(e.cursor().row == 1);
  e.go_to_line(-3);
  assert(e.cursor().row == 0);
  assert(!e.has_unsaved_changes());
}

static void test_history() {
  BufferEngine e(small(20, 3));
  type(e, "a");
  e.undo();
  assert(e.buffer().empty());
  assert((e.cursor() == Cursor{0, 0}));
  e.redo();
  assert(e.buffer().line_text(0) == "a");
  assert((e.cursor() == Cursor{0, 1}));
  e.undo();
  type(e, "b");
  assert(!e.history().can_redo());
  e.redo();
  assert(e.buffer().line_text(0) == "b");

  // character edits are snapshotted every BN_SNAPSHOT_INTERVAL keystrokes
  BufferEngine t(small(20, 3));
  type(t, "abcdefghijkl");
  assert(t.history().undo_size() == 2);
  t.undo();
  assert(t.buffer().line_text(0) == "abcdefghij");
  t.undo();
  assert(t.buffer().empty());
  t.undo();
  assert(t.buffer().empty());

  EngineConfig cfg = small(20, 30);
  cfg.history_capacity = 3;
  BufferEngine c(cfg);
  for (int i = 0; i < 5; ++i) c.insert_line();
  assert(c.history().undo_size() == 3);
  for (int i = 0; i < 5; ++i) c.undo();
  assert(c.line_count() == 3);
}

// Every coarse edit snapshots, so undoing as many times as there were edits
// restores the starting buffer and cursor.
static void test_undo_restores_coarse_edits() {
  NoteBuffer start = NoteBuffer::from_strings({"alpha beta", "gamma", "delta"});
  BufferEngine e(small(20, 10));
  e.load_buffer(start);
  e.insert_line();
  e.move_line_down();
  e.delete_word_forward();
  e.delete_line();
  e.move_line_up();
  assert(e.history().undo_size() == 5);
  assert(e.buffer().line_text(1) == "delta");
  for (int i = 0; i < 5; ++i) e.undo();
  assert(e.buffer() == start);
  assert((e.cursor() == Cursor{0, 0}));
  for (int i = 0; i < 5; ++i) e.redo();
  assert(e.buffer().line_text(2) == "gamma");
  assert((e.cursor() == Cursor{1, 0}));

  // with a snapshot per keystroke character edits undo one by one as well
  EngineConfig cfg = small(20, 10);
  cfg.snapshot_interval = 1;
  BufferEngine c(cfg);
  c.load_buffer(start);
  c.insert_line();
  type(c, "xyz");
  for (int i = 0; i < 4; ++i) c.undo();
  assert(c.buffer() == start);
  assert((c.cursor() == Cursor{0, 0}));
}

static void test_colors_and_tabs() {
  BufferEngine e(small(10, 3));
  e.toggle_color(ActiveColor::Primary);
  assert(e.active_color_tag() == ColorTag::Blue);
  type(e, "x");
  e.toggle_color(ActiveColor::Tertiary);
  type(e, "y");
  e.toggle_color(ActiveColor::Tertiary);
  assert(e.active_color() == ActiveColor::None);
  type(e, "z");
  std::vector<std::uint8_t> expect = {'x', 12, 'y', 9, 'z', 0};
  assert(e.serialize() == expect);

  BufferEngine t(small(10, 3));
  t.insert_tab();
  assert(t.buffer().line_text(0) == "    ");
  assert(t.cursor().col == 4);
  type(t, "abc");
  t.insert_tab();
  assert(t.buffer().line_text(0) == "    abc");

  EngineConfig cfg = small(10, 3);
  cfg.tab_size = 2;
  cfg.write_mode = WriteMode::Overwrite;
  BufferEngine o(cfg);
  o.load_buffer(NoteBuffer::from_strings({"abcdefghij"}));
  o.insert_tab();
  assert(o.buffer().line_text(0) == "  cdefghij");
  o.move_to_line_end();
  o.insert_tab();
  assert(o.buffer().line_text(0) == "  cdefghij");
}

static void test_viewable() {
  NoteBuffer big = NoteBuffer::from_strings({"1", "2", "3", "4", "5"});
  BufferEngine e(small(10, 3));
  e.load_buffer(big);
  assert(e.typing_disabled());
  assert(e.edit_mode() == EditMode::Viewable);
  assert(e.line_count() == 3);
  assert(e.buffer().line_text(2) == "...");
  type(e, "x");
  e.delete_line();
  e.undo();
  assert(e.buffer().line_text(0) == "1");
  assert(!e.has_unsaved_changes());
  assert(e.serialize() == encode_note(big));

  // navigation still works on the truncated view
  e.move_down();
  assert(e.cursor().row == 1);

  e.resize(10, 5);
  assert(!e.typing_disabled());
  assert(e.line_count() == 5);
  assert(e.buffer() == big);
  e.resize(10, 2);
  assert(e.typing_disabled());
  assert(e.cursor().row <= 1);
  e.resize(10, 8);
  assert(e.buffer() == big);

  BufferEngine w(small(10, 3));
  w.load_buffer(NoteBuffer::from_strings({"abcdefghijkl"}));
  assert(w.typing_disabled());
  assert(w.buffer().line_text(0) == "abcdef ...");
  w.resize(12, 3);
  assert(w.buffer().line_text(0) == "abcdefghijkl");
}

static void test_load() {
  BufferEngine e(small(10, 3));
  LoadError err = LoadError::None;
  std::string msg;
  std::vector<std::uint8_t> good = {'h', 0, 'i', 2};
  assert(e.load(good, err, msg));
  assert(e.buffer().line_text(0) == "hi");
  assert(e.buffer().line(0)[1].color == ColorTag::Green);
  assert(e.serialize() == good);
  type(e, "!");
  std::vector<std::uint8_t> bad = {'h', 0, 'i'};
  assert(!e.load(bad, err, msg));
  assert(err == LoadError::MalformedLength);
  assert(e.buffer().line_text(0) == "!hi");
  assert(e.has_unsaved_changes());
}

int main() {
  test_typing();
  test_lines();
  test_words();
  test_delete_word_example();
  test_navigation();
  test_history();
  test_undo_restores_coarse_edits();
  test_colors_and_tabs();
  test_viewable();
  test_load();
  return 0;
}
