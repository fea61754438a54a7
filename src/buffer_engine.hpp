#pragma once
/*
 * BufferEngine
 *
 * Purpose: editing core of one open note; a line/column grid bounded by the
 *          viewport (width x height cells), cursor, undo/redo and colour latch.
 * Contract: every edit/navigation call is total; boundary cases (buffer start/end,
 *           full line, full buffer, Viewable mode) are no-ops, never errors.
 *           Only load() can fail, and then leaves the engine unchanged.
 * Note: the engine never touches storage; callers persist serialize() bytes.
 */
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "config.hpp"
#include "history_manager.hpp"
#include "note_buffer.hpp"
#include "note_codec.hpp"
#include "types.hpp"

class BufferEngine {
public:
  explicit BufferEngine(const EngineConfig& cfg = EngineConfig());

  // Takes tab size, colours and write mode from cfg; keeps the current viewport.
  void reconfigure(const EngineConfig& cfg);

  bool load(std::span<const std::uint8_t> bytes, LoadError& err, std::string& msg);
  void load_buffer(const NoteBuffer& buf);
  std::vector<std::uint8_t> serialize() const;
  void mark_saved();
  void resize(int width, int height);

  void insert_char(char32_t c);
  void insert_tab();
  void delete_char_backward();
  void delete_char_forward();
  void delete_word_backward();
  void delete_word_forward();
  void insert_line();
  void delete_line();
  void move_line_up();
  void move_line_down();

  void move_up();
  void move_down();
  void move_left();
  void move_right();
  void move_to_line_start();
  void move_to_line_end();
  void move_to_buffer_start();
  void move_to_buffer_end();
  void move_word_left();
  void move_word_right();
  void go_to_line(int line_number);

  void undo();
  void redo();

  void toggle_write_mode();
  void set_write_mode(WriteMode m) { write_mode_ = m; }
  void toggle_color(ActiveColor sel);
  void set_active_color(ActiveColor sel) { active_color_ = sel; }

  WriteMode write_mode() const { return write_mode_; }
  ActiveColor active_color() const { return active_color_; }
  ColorTag active_color_tag() const { return cfg_.resolve(active_color_); }
  EditMode edit_mode() const { return mode_; }
  bool typing_disabled() const { return mode_ == EditMode::Viewable; }
  bool has_unsaved_changes() const { return unsaved_; }
  bool line_full() const;
  bool buffer_full() const;
  Cursor cursor() const { return cur_; }
  int line_count() const { return buf_.line_count(); }
  int char_count() const;
  int width() const { return width_; }
  int height() const { return height_; }
  const NoteBuffer& buffer() const { return buf_; }
  const HistoryManager& history() const { return history_; }
  const EngineConfig& config() const { return cfg_; }

private:
  bool editable() const { return mode_ == EditMode::Editable; }
  int cur_line_length() const { return buf_.line_length(cur_.row); }
  bool at_line_end() const { return cur_.col >= cur_line_length(); }
  bool on_last_line() const { return cur_.row + 1 >= buf_.line_count(); }
  bool can_put() const;
  bool put_char(char c);
  bool can_merge_with_next(int row) const;
  void merge_with_next(int row);
  void touch() { unsaved_ = true; }
  void refit();
  void clamp_cursor();

  EngineConfig cfg_;
  NoteBuffer buf_;
  // Untruncated content while Viewable; serialize() and refit() read it.
  NoteBuffer full_;
  Cursor cur_;
  HistoryManager history_;
  int width_;
  int height_;
  EditMode mode_ = EditMode::Editable;
  WriteMode write_mode_;
  ActiveColor active_color_ = ActiveColor::None;
  bool unsaved_ = false;
};
