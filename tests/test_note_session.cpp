#include "file_reader.hpp"
#include "note_session.hpp"
#include "note_store.hpp"
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unistd.h>
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

static void test_memory_store() {
  MemoryNoteStore store;
  NoteSession s(store, small(10, 3));
  std::string msg;
  LoadError err = LoadError::None;
  assert(!s.is_open());
  assert(!s.save(msg));
  assert(msg == "no note open");

  assert(s.open("a", err, msg));
  assert(msg == "new note: a");
  assert(s.is_open());
  assert(s.note_id() == "a");
  assert(s.engine()->buffer().empty());
  assert(!store.exists("a"));

  type(*s.engine(), "hi");
  assert(s.save(msg));
  assert(store.write_count() == 1);
  assert(!s.engine()->has_unsaved_changes());
  std::vector<std::uint8_t> bytes;
  assert(store.read("a", bytes, msg));
  std::vector<std::uint8_t> expect = {'h', 0, 'i', 0};
  assert(bytes == expect);

  assert(s.save(msg));
  assert(msg == "no changes to save");
  assert(store.write_count() == 1);

  // failed opens keep the current note
  store.put("bad", {'x', 0, 'y'});
  assert(!s.open("bad", err, msg));
  assert(err == LoadError::MalformedLength);
  assert(s.note_id() == "a");
  assert(s.engine()->buffer().line_text(0) == "hi");

  store.put("colors", {'z', 99});
  assert(!s.open("colors", err, msg));
  assert(err == LoadError::InvalidColorTag);

  type(*s.engine(), "!!");
  assert(s.reload(err, msg));
  assert(s.engine()->buffer().line_text(0) == "hi");
  assert(!s.engine()->has_unsaved_changes());

  // the session keeps the viewport for notes it opens later
  s.resize(1, 1);
  assert(s.engine()->typing_disabled());
  assert(s.open("other", err, msg));
  assert(s.engine()->width() == 1);
  s.resize(10, 3);
  assert(s.open("a", err, msg));
  assert(!s.engine()->typing_disabled());

  EngineConfig cfg = small(40, 40);
  cfg.tab_size = 2;
  cfg.write_mode = WriteMode::Overwrite;
  s.apply_config(cfg);
  assert(s.engine()->width() == 10);
  assert(s.engine()->write_mode() == WriteMode::Overwrite);
  assert(s.config().tab_size == 2);

  s.close();
  assert(!s.is_open());
  assert(!s.reload(err, msg));
}

static void test_file_store() {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / ("boxnote_test_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  FileNoteStore store(dir);
  NoteSession s(store, small(20, 5));
  std::string msg;
  LoadError err = LoadError::None;
  assert(s.open("todo.note", err, msg));
  s.engine()->toggle_color(ActiveColor::Secondary);
  type(*s.engine(), "milk");
  s.engine()->insert_line();
  type(*s.engine(), "eggs");
  assert(s.save(msg));
  assert(store.exists("todo.note"));
  assert(!std::filesystem::exists(store.path_for("todo.note").string() + ".tmp"));

  std::vector<std::uint8_t> bytes;
  assert(mmap_read_bytes(store.path_for("todo.note"), bytes, msg));
  assert(bytes.size() == 18);
  assert(bytes[1] == 2);
  assert(bytes[8] == '\n' && bytes[9] == 0);

  NoteSession again(store, small(20, 5));
  assert(again.open("todo.note", err, msg));
  assert(again.engine()->line_count() == 2);
  assert(again.engine()->buffer().line_text(1) == "eggs");
  assert(again.engine()->buffer().line(1)[0].color == ColorTag::Green);

  NoteSession tiny(store, small(3, 1));
  assert(tiny.open("todo.note", err, msg));
  assert(tiny.engine()->typing_disabled());
  tiny.engine()->insert_char(U'x');
  assert(tiny.save(msg));
  assert(msg == "no changes to save");

  std::filesystem::remove_all(dir);
}

int main() {
  test_memory_store();
  test_file_store();
  return 0;
}
