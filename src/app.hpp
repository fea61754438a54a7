#pragma once
/*
 * App
 *
 * Purpose: the interactive boxnote front-end. Owns the note store, the session
 *          and the terminal view; maps key actions onto BufferEngine calls and
 *          runs the ":" command line (w, q, q!, wq, e <id>, <n>, set ...).
 */
#include <filesystem>
#include <string>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "input.hpp"
#include "ncurses_terminal.hpp"
#include "note_session.hpp"
#include "note_store.hpp"
#include "renderer.hpp"

class App {
public:
  App(const std::filesystem::path& notes_dir, const std::string& note_id);
  void run();

private:
  void render();
  void sync_viewport();
  void handle_key(bool is_key_code, std::uint32_t key);
  void handle_command_input(bool is_key_code, std::uint32_t key);
  void apply_action(const KeyEvent& ev);
  void execute_command();
  void register_commands();
  bool write_note();
  void quit(bool force);
  void open_note(const std::string& id);
  void reload_note();

  FileNoteStore store;
  EngineConfig cfg;
  NoteSession session;
  Input input;
  Renderer renderer;
  NcursesTerminal term;
  CommandRegistry registry;
  std::string message;
  std::string cmdline;
  bool command_mode = false;
  bool should_quit = false;
};
