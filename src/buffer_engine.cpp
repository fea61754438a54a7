#include "buffer_engine.hpp"
#include <algorithm>
#include <utility>
#include "ascii_fold.hpp"
#include "viewport_fit.hpp"
#include "word_scan.hpp"

BufferEngine::BufferEngine(const EngineConfig& cfg)
    : cfg_(cfg),
      history_(cfg.history_capacity, cfg.snapshot_interval),
      width_(std::max(1, cfg.width)),
      height_(std::max(1, cfg.height)),
      write_mode_(cfg.write_mode) {}

void BufferEngine::reconfigure(const EngineConfig& cfg) {
  int w = width_, h = height_;
  cfg_ = cfg;
  cfg_.width = w;
  cfg_.height = h;
  write_mode_ = cfg.write_mode;
}

bool BufferEngine::load(std::span<const std::uint8_t> bytes, LoadError& err, std::string& msg) {
  NoteBuffer b;
  if (!decode_note(bytes, b, err, msg)) return false;
  load_buffer(b);
  msg = typing_disabled() ? "note is larger than the view, enlarge it to edit" : "loaded " + std::to_string(line_count()) + " lines";
  return true;
}

void BufferEngine::load_buffer(const NoteBuffer& b) {
  buf_ = b.clone();
  full_ = NoteBuffer();
  mode_ = EditMode::Editable;
  cur_ = Cursor{};
  history_.clear();
  unsaved_ = false;
  refit();
}

std::vector<std::uint8_t> BufferEngine::serialize() const {
  return encode_note(typing_disabled() ? full_ : buf_);
}

void BufferEngine::mark_saved() { unsaved_ = false; }

void BufferEngine::resize(int width, int height) {
  width_ = std::max(1, width);
  height_ = std::max(1, height);
  refit();
}

void BufferEngine::refit() {
  NoteBuffer content = typing_disabled() ? std::move(full_) : std::move(buf_);
  NoteBuffer shown = content.clone();
  if (fit_to_viewport(shown, width_, height_)) {
    full_ = std::move(content);
    mode_ = EditMode::Viewable;
  } else {
    full_ = NoteBuffer();
    mode_ = EditMode::Editable;
  }
  buf_ = std::move(shown);
  clamp_cursor();
}

void BufferEngine::clamp_cursor() {
  cur_.row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(cur_.col, 0, cur_line_length());
}

bool BufferEngine::line_full() const { return cur_line_length() >= width_; }
bool BufferEngine::buffer_full() const { return buf_.line_count() >= height_; }
int BufferEngine::char_count() const { return buf_.char_count(); }

// A full line accepts nothing in insert mode; overwrite mode may still replace.
bool BufferEngine::can_put() const {
  if (!line_full()) return true;
  return write_mode_ == WriteMode::Overwrite && !at_line_end();
}

bool BufferEngine::put_char(char c) {
  if (!can_put()) return false;
  ColoredChar cc{c, active_color_tag()};
  if (at_line_end()) buf_.insert_char(cur_.row, cur_line_length(), cc);
  else if (write_mode_ == WriteMode::Insert) buf_.insert_char(cur_.row, cur_.col, cc);
  else buf_.set_char(cur_.row, cur_.col, cc);
  cur_.col++;
  touch();
  return true;
}

void BufferEngine::insert_char(char32_t c) {
  if (!editable()) return;
  if (c == U'\n' || c == U'\r') { insert_line(); return; }
  if (c == U'\t') { insert_tab(); return; }
  char ch = fold_to_ascii(c);
  if (static_cast<unsigned char>(ch) < 32 || ch == 127) return;
  if (!can_put()) return;
  history_.record_if_due(buf_, cur_);
  put_char(ch);
}

void BufferEngine::insert_tab() {
  if (!editable()) return;
  int size = std::max(1, cfg_.tab_size);
  bool fits = cur_line_length() + size <= width_;
  if (write_mode_ == WriteMode::Insert) {
    if (!fits) return;
  } else if (!fits && cur_.col > width_ - size) {
    return;
  }
  if (!can_put()) return;
  history_.record_if_due(buf_, cur_);
  for (int i = 0; i < size; ++i) {
    if (!put_char(' ')) break;
  }
}

bool BufferEngine::can_merge_with_next(int row) const {
  if (row < 0 || row + 1 >= buf_.line_count()) return false;
  return buf_.line_length(row) + buf_.line_length(row + 1) <= width_;
}

void BufferEngine::merge_with_next(int row) {
  buf_.append_to_line(row, buf_.line(row + 1));
  buf_.erase_line(row + 1);
  touch();
}

void BufferEngine::delete_char_backward() {
  if (!editable()) return;
  if (cur_.col == 0) {
    if (cur_.row == 0 || !can_merge_with_next(cur_.row - 1)) return;
    history_.record_if_due(buf_, cur_);
    int prev_len = buf_.line_length(cur_.row - 1);
    merge_with_next(cur_.row - 1);
    cur_ = {cur_.row - 1, prev_len};
    return;
  }
  history_.record_if_due(buf_, cur_);
  buf_.erase_chars(cur_.row, cur_.col - 1, 1);
  cur_.col--;
  touch();
}

void BufferEngine::delete_char_forward() {
  if (!editable()) return;
  if (at_line_end()) {
    if (!can_merge_with_next(cur_.row)) return;
    history_.record_if_due(buf_, cur_);
    merge_with_next(cur_.row);
    return;
  }
  history_.record_if_due(buf_, cur_);
  buf_.erase_chars(cur_.row, cur_.col, 1);
  touch();
}

void BufferEngine::delete_word_backward() {
  if (!editable()) return;
  if (cur_.col == 0) {
    if (cur_.row == 0 || !can_merge_with_next(cur_.row - 1)) return;
    history_.record(buf_, cur_);
    int prev_len = buf_.line_length(cur_.row - 1);
    merge_with_next(cur_.row - 1);
    cur_ = {cur_.row - 1, prev_len};
    return;
  }
  int start = prev_word_start(buf_.line(cur_.row), cur_.col);
  history_.record(buf_, cur_);
  buf_.erase_chars(cur_.row, start, cur_.col - start);
  cur_.col = start;
  touch();
}

void BufferEngine::delete_word_forward() {
  if (!editable()) return;
  if (at_line_end()) {
    if (!can_merge_with_next(cur_.row)) return;
    history_.record(buf_, cur_);
    merge_with_next(cur_.row);
    return;
  }
  int end = next_word_end(buf_.line(cur_.row), cur_.col);
  history_.record(buf_, cur_);
  buf_.erase_chars(cur_.row, cur_.col, end - cur_.col);
  touch();
}

void BufferEngine::insert_line() {
  if (!editable() || buffer_full()) return;
  history_.record(buf_, cur_);
  const Line& s = buf_.line(cur_.row);
  Line left(s.begin(), s.begin() + cur_.col);
  Line right(s.begin() + cur_.col, s.end());
  buf_.replace_line(cur_.row, std::move(left));
  buf_.insert_line(cur_.row + 1, std::move(right));
  cur_ = {cur_.row + 1, 0};
  touch();
}

void BufferEngine::delete_line() {
  if (!editable()) return;
  if (buf_.empty()) return;
  history_.record(buf_, cur_);
  if (buf_.line_count() == 1) {
    buf_.replace_line(0, Line());
  } else {
    buf_.erase_line(cur_.row);
    if (cur_.row >= buf_.line_count()) cur_.row = buf_.line_count() - 1;
  }
  cur_.col = 0;
  touch();
}

void BufferEngine::move_line_up() {
  if (!editable() || cur_.row == 0) return;
  history_.record(buf_, cur_);
  buf_.swap_lines(cur_.row, cur_.row - 1);
  cur_.row--;
  touch();
}

void BufferEngine::move_line_down() {
  if (!editable() || on_last_line()) return;
  history_.record(buf_, cur_);
  buf_.swap_lines(cur_.row, cur_.row + 1);
  cur_.row++;
  touch();
}

void BufferEngine::move_up() {
  if (cur_.row == 0) return;
  cur_.row--;
  cur_.col = std::min(cur_.col, cur_line_length());
}

void BufferEngine::move_down() {
  if (on_last_line()) { cur_.col = cur_line_length(); return; }
  cur_.row++;
  cur_.col = std::min(cur_.col, cur_line_length());
}

void BufferEngine::move_left() {
  if (cur_.col > 0) { cur_.col--; return; }
  if (cur_.row == 0) return;
  cur_.row--;
  cur_.col = cur_line_length();
}

void BufferEngine::move_right() {
  if (!at_line_end()) { cur_.col++; return; }
  if (on_last_line()) return;
  cur_ = {cur_.row + 1, 0};
}

void BufferEngine::move_to_line_start() { cur_.col = 0; }
void BufferEngine::move_to_line_end() { cur_.col = cur_line_length(); }
void BufferEngine::move_to_buffer_start() { cur_ = Cursor{}; }

void BufferEngine::move_to_buffer_end() {
  cur_.row = buf_.line_count() - 1;
  cur_.col = cur_line_length();
}

void BufferEngine::move_word_left() {
  if (cur_.col == 0) {
    if (cur_.row == 0) return;
    cur_.row--;
    cur_.col = cur_line_length();
    return;
  }
  cur_.col = prev_word_start(buf_.line(cur_.row), cur_.col);
}

void BufferEngine::move_word_right() {
  if (at_line_end()) {
    if (on_last_line()) return;
    cur_ = {cur_.row + 1, 0};
    return;
  }
  cur_.col = next_word_end(buf_.line(cur_.row), cur_.col);
}

void BufferEngine::go_to_line(int line_number) {
  cur_.row = std::clamp(line_number, 1, buf_.line_count()) - 1;
  cur_.col = 0;
}

void BufferEngine::undo() {
  if (!editable()) return;
  if (!history_.undo(buf_, cur_)) return;
  touch();
  refit();
}

void BufferEngine::redo() {
  if (!editable()) return;
  if (!history_.redo(buf_, cur_)) return;
  touch();
  refit();
}

void BufferEngine::toggle_write_mode() {
  write_mode_ = write_mode_ == WriteMode::Insert ? WriteMode::Overwrite : WriteMode::Insert;
}

void BufferEngine::toggle_color(ActiveColor sel) {
  active_color_ = active_color_ == sel ? ActiveColor::None : sel;
}
