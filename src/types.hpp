#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Cursor and editor modes).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class WriteMode { Insert, Overwrite };

// Viewable: note is larger than the viewport, shown truncated and read-only.
enum class EditMode { Editable, Viewable };

enum class ActiveColor { None, Primary, Secondary, Tertiary };

struct Cursor {
  int row = 0;
  int col = 0;
  bool operator==(const Cursor&) const = default;
};
