#pragma once
/*
 * HistoryManager
 *
 * Purpose: snapshot based undo/redo for one open note.
 * Policy: coarse edits call record() before applying; character edits call
 *         record_if_due(), which snapshots on the first edit after any
 *         snapshot/undo/redo and then every snapshot_interval edits.
 *         Any record*() clears redo. Both stacks keep at most `capacity` entries.
 */
#include <cstddef>
#include "limited_stack.hpp"
#include "note_buffer.hpp"
#include "types.hpp"
#include "config.hpp"

struct HistoryEntry {
  NoteBuffer buf;
  Cursor cur;
};

class HistoryManager {
public:
  explicit HistoryManager(std::size_t capacity = BN_HISTORY_CAPACITY, int snapshot_interval = BN_SNAPSHOT_INTERVAL);

  void record(const NoteBuffer& buf, const Cursor& cur);
  bool record_if_due(const NoteBuffer& buf, const Cursor& cur);
  bool undo(NoteBuffer& buf, Cursor& cur);
  bool redo(NoteBuffer& buf, Cursor& cur);

  void clear();
  bool can_undo() const;
  bool can_redo() const;
  std::size_t undo_size() const;
  std::size_t redo_size() const;
  std::size_t capacity() const;

private:
  LimitedStack<HistoryEntry> undo_entries_;
  LimitedStack<HistoryEntry> redo_entries_;
  int snapshot_interval_;
  int edits_since_snapshot_ = 0;
};
