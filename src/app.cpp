#include "app.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cwchar>

static constexpr std::uint32_t ESC = 27;

App::App(const std::filesystem::path& notes_dir, const std::string& note_id)
    : store(notes_dir), session(store, cfg) {
  std::string m;
  if (!load_rc(default_rc_path(), cfg, m)) message = m;
  session.apply_config(cfg);
  register_commands();
  sync_viewport();
  open_note(note_id);
}

void App::run() {
  while (!should_quit) {
    render();
    wint_t wch = 0;
    int rc = get_wch(&wch);
    if (rc == ERR) continue;
    handle_key(rc == KEY_CODE_YES, static_cast<std::uint32_t>(wch));
  }
}

// The note grid is the text area left over by the renderer; a smaller terminal
// truncates the note and puts the engine into its read-only view.
void App::sync_viewport() {
  TextArea a = Renderer::text_area(term.get_size());
  const EngineConfig& c = session.config();
  if (c.width == a.width && c.height == a.height) return;
  session.resize(a.width, a.height);
}

void App::render() {
  sync_viewport();
  renderer.render(term, session, message, cmdline, command_mode);
}

void App::handle_key(bool is_key_code, std::uint32_t key) {
  if (command_mode) { handle_command_input(is_key_code, key); return; }
  KeyEvent ev = input.translate(is_key_code, key);
  if (ev.action == Action::None) return;
  message.clear();
  apply_action(ev);
}

void App::handle_command_input(bool is_key_code, std::uint32_t key) {
  if (is_key_code) {
    if (key == KEY_BACKSPACE) { if (!cmdline.empty()) cmdline.pop_back(); }
    else if (key == KEY_ENTER) { command_mode = false; execute_command(); }
    return;
  }
  if (key == ESC) { command_mode = false; cmdline.clear(); return; }
  if (key == 127 || key == 8) { if (!cmdline.empty()) cmdline.pop_back(); return; }
  if (key == '\n' || key == '\r') { command_mode = false; execute_command(); return; }
  if (key >= 32 && key <= 126) cmdline.push_back(static_cast<char>(key));
}

void App::apply_action(const KeyEvent& ev) {
  BufferEngine* eng = session.engine();
  if (!eng) return;
  switch (ev.action) {
    case Action::InsertChar: eng->insert_char(ev.ch); break;
    case Action::InsertLine: eng->insert_line(); break;
    case Action::InsertTab: eng->insert_tab(); break;
    case Action::DeleteCharBackward: eng->delete_char_backward(); break;
    case Action::DeleteCharForward: eng->delete_char_forward(); break;
    case Action::DeleteWordBackward: eng->delete_word_backward(); break;
    case Action::DeleteWordForward: eng->delete_word_forward(); break;
    case Action::DeleteLine: eng->delete_line(); break;
    case Action::MoveUp: eng->move_up(); break;
    case Action::MoveDown: eng->move_down(); break;
    case Action::MoveLeft: eng->move_left(); break;
    case Action::MoveRight: eng->move_right(); break;
    case Action::WordLeft: eng->move_word_left(); break;
    case Action::WordRight: eng->move_word_right(); break;
    case Action::LineStart: eng->move_to_line_start(); break;
    case Action::LineEnd: eng->move_to_line_end(); break;
    case Action::BufferStart: eng->move_to_buffer_start(); break;
    case Action::BufferEnd: eng->move_to_buffer_end(); break;
    case Action::MoveLineUp: eng->move_line_up(); break;
    case Action::MoveLineDown: eng->move_line_down(); break;
    case Action::Undo: eng->undo(); break;
    case Action::Redo: eng->redo(); break;
    case Action::Save: write_note(); break;
    case Action::Reload: reload_note(); break;
    case Action::Quit: quit(false); break;
    case Action::ToggleWriteMode: eng->toggle_write_mode(); break;
    case Action::TogglePrimaryColor: eng->toggle_color(ActiveColor::Primary); break;
    case Action::ToggleSecondaryColor: eng->toggle_color(ActiveColor::Secondary); break;
    case Action::ToggleTertiaryColor: eng->toggle_color(ActiveColor::Tertiary); break;
    case Action::CommandLine: command_mode = true; cmdline.clear(); break;
    case Action::Cancel: eng->set_active_color(ActiveColor::None); break;
    case Action::Resize: sync_viewport(); break;
    case Action::None: break;
  }
}

void App::execute_command() {
  std::string line = cmdline;
  cmdline.clear();
  if (line.empty()) return;
  if (std::all_of(line.begin(), line.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    int n = 0;
    auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), n);
    if (ec != std::errc() || p != line.data() + line.size()) { message = "invalid line number: " + line; return; }
    if (BufferEngine* eng = session.engine()) eng->go_to_line(n);
    return;
  }
  std::string name;
  std::vector<std::string> args;
  split_command_line(line, name, args);
  std::string m;
  registry.execute(name, args, m);
  message = m;
}

bool App::write_note() {
  std::string m;
  bool ok = session.save(m);
  message = ok && m.empty() ? "written " + session.note_id() : m;
  return ok;
}

void App::quit(bool force) {
  const BufferEngine* eng = session.engine();
  if (!force && eng && eng->has_unsaved_changes()) {
    message = "unsaved changes, use :wq or :q!";
    return;
  }
  session.close();
  should_quit = true;
}

void App::open_note(const std::string& id) {
  LoadError err = LoadError::None;
  std::string m;
  if (!session.open(id, err, m) && err != LoadError::None) {
    m += std::string(" (") + std::string(load_error_name(err)) + ")";
  }
  message = m;
}

void App::reload_note() {
  LoadError err = LoadError::None;
  std::string m;
  if (!session.reload(err, m) && err != LoadError::None) {
    m += std::string(" (") + std::string(load_error_name(err)) + ")";
  }
  message = m;
}
