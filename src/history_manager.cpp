#include "history_manager.hpp"
#include <algorithm>
#include <utility>

HistoryManager::HistoryManager(std::size_t capacity, int snapshot_interval)
    : undo_entries_(capacity), redo_entries_(capacity), snapshot_interval_(std::max(1, snapshot_interval)) {}

void HistoryManager::record(const NoteBuffer& buf, const Cursor& cur) {
  redo_entries_.clear();
  undo_entries_.push({buf.clone(), cur});
  edits_since_snapshot_ = 0;
}

bool HistoryManager::record_if_due(const NoteBuffer& buf, const Cursor& cur) {
  redo_entries_.clear();
  bool due = edits_since_snapshot_ == 0;
  if (due) undo_entries_.push({buf.clone(), cur});
  edits_since_snapshot_ = (edits_since_snapshot_ + 1) % snapshot_interval_;
  return due;
}

bool HistoryManager::undo(NoteBuffer& buf, Cursor& cur) {
  auto e = undo_entries_.pop();
  if (!e) return false;
  redo_entries_.push({buf.clone(), cur});
  buf = std::move(e->buf);
  cur = e->cur;
  edits_since_snapshot_ = 0;
  return true;
}

bool HistoryManager::redo(NoteBuffer& buf, Cursor& cur) {
  auto e = redo_entries_.pop();
  if (!e) return false;
  undo_entries_.push({buf.clone(), cur});
  buf = std::move(e->buf);
  cur = e->cur;
  edits_since_snapshot_ = 0;
  return true;
}

void HistoryManager::clear() {
  undo_entries_.clear();
  redo_entries_.clear();
  edits_since_snapshot_ = 0;
}

bool HistoryManager::can_undo() const { return !undo_entries_.empty(); }
bool HistoryManager::can_redo() const { return !redo_entries_.empty(); }
std::size_t HistoryManager::undo_size() const { return undo_entries_.size(); }
std::size_t HistoryManager::redo_size() const { return redo_entries_.size(); }
std::size_t HistoryManager::capacity() const { return undo_entries_.capacity(); }
