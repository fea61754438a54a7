#pragma once
/*
 * WordScan
 *
 * Word = maximal run of non-space characters.
 * prev_word_start: skip spaces left of col, the word, the gap before it and the
 *                  previous word; returns that word's first column (0 if none).
 * next_word_end:   skip spaces right of col, then the word, then trailing spaces;
 *                  returns the column just past them (<= line length).
 */
#include "colored_char.hpp"

int prev_word_start(const Line& line, int col);
int next_word_end(const Line& line, int col);
