#pragma once
/*
 * ViewportFit
 *
 * Purpose: make a note fit the visible grid no matter what.
 * Policy: too many lines -> keep max_height lines, the last one becomes "...";
 *         too long lines -> cut to max_width - 4 chars and end with " ...".
 * Returns true when anything was cut (the caller switches to Viewable).
 * Applying it to an already fitted buffer changes nothing and returns false.
 */
#include "note_buffer.hpp"

inline constexpr int kEllipsisLength = 4;

bool fit_to_viewport(NoteBuffer& buf, int max_width, int max_height);
bool fits_viewport(const NoteBuffer& buf, int max_width, int max_height);
