#pragma once
/*
 * NoteCodec
 *
 * Purpose: convert between the on-disk note format and NoteBuffer.
 * Format: flat stream of (char byte 0-127, colour byte) pairs; a '\n' pair
 *         separates lines (never trails the last one). Empty stream = empty note.
 * Usage: decode_note(bytes, buf, err, msg); returns false with err/msg on failure,
 *        leaving buf untouched.
 */
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "note_buffer.hpp"

enum class LoadError { None, InvalidEncoding, InvalidColorTag, MalformedLength };

std::string_view load_error_name(LoadError e);

bool decode_note(std::span<const std::uint8_t> bytes, NoteBuffer& out, LoadError& err, std::string& msg);
std::vector<std::uint8_t> encode_note(const NoteBuffer& buf);
