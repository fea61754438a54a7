#include "note_buffer.hpp"
#include <algorithm>
#include <utility>

NoteBuffer::NoteBuffer() { ensure_not_empty(); }

NoteBuffer NoteBuffer::from_strings(const std::vector<std::string>& src, ColorTag color) {
  std::vector<Line> ls;
  ls.reserve(src.size());
  for (const auto& s : src) {
    Line l;
    l.reserve(s.size());
    for (char c : s) l.push_back({c, color});
    ls.push_back(std::move(l));
  }
  NoteBuffer b;
  b.init_from_lines(std::move(ls));
  return b;
}

bool NoteBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }
int NoteBuffer::line_count() const { return static_cast<int>(lines_.size()); }

int NoteBuffer::line_length(int r) const {
  if (!valid_row(r)) return 0;
  return static_cast<int>(lines_[r].size());
}

int NoteBuffer::char_count() const {
  int n = 0;
  for (const auto& l : lines_) n += static_cast<int>(l.size());
  return n;
}

const Line& NoteBuffer::line(int r) const {
  static const Line kEmpty;
  if (!valid_row(r)) return kEmpty;
  return lines_[r];
}

std::string NoteBuffer::line_text(int r) const {
  std::string s;
  for (const auto& c : line(r)) s.push_back(c.ch);
  return s;
}

void NoteBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void NoteBuffer::init_from_lines(std::vector<Line> src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

// Lines hold ColoredChar by value, so copying the vector copies every line.
NoteBuffer NoteBuffer::clone() const {
  NoteBuffer b;
  b.lines_.clear();
  b.lines_.reserve(lines_.size());
  for (const auto& l : lines_) b.lines_.emplace_back(l.begin(), l.end());
  return b;
}

void NoteBuffer::insert_line(int row, Line l) {
  size_t pos = std::min(static_cast<size_t>(std::max(row, 0)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(l));
}

void NoteBuffer::erase_line(int row) {
  if (!valid_row(row)) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void NoteBuffer::erase_lines_from(int row) {
  if (!valid_row(row)) return;
  lines_.erase(lines_.begin() + row, lines_.end());
  ensure_not_empty();
}

void NoteBuffer::replace_line(int row, Line l) {
  if (!valid_row(row)) return;
  lines_[row] = std::move(l);
}

void NoteBuffer::swap_lines(int a, int b) {
  if (!valid_row(a) || !valid_row(b)) return;
  std::swap(lines_[a], lines_[b]);
}

void NoteBuffer::append_to_line(int row, const Line& tail) {
  if (!valid_row(row)) return;
  lines_[row].insert(lines_[row].end(), tail.begin(), tail.end());
}

void NoteBuffer::insert_char(int row, int col, ColoredChar c) {
  if (!valid_row(row)) return;
  Line& l = lines_[row];
  size_t pos = std::min(static_cast<size_t>(std::max(col, 0)), l.size());
  l.insert(l.begin() + static_cast<std::ptrdiff_t>(pos), c);
}

void NoteBuffer::set_char(int row, int col, ColoredChar c) {
  if (!valid_row(row)) return;
  Line& l = lines_[row];
  if (col < 0) return;
  if (col >= static_cast<int>(l.size())) { l.push_back(c); return; }
  l[col] = c;
}

void NoteBuffer::erase_chars(int row, int col, int count) {
  if (!valid_row(row) || count <= 0 || col < 0) return;
  Line& l = lines_[row];
  int len = static_cast<int>(l.size());
  if (col >= len) return;
  int end = std::min(len, col + count);
  l.erase(l.begin() + col, l.begin() + end);
}
