#include "note_codec.hpp"
#include <cstdio>
#include <utility>

static constexpr std::uint8_t kNewline = static_cast<std::uint8_t>('\n');

static std::string hex_byte(std::uint8_t b) {
  char s[8];
  std::snprintf(s, sizeof(s), "0x%02X", static_cast<unsigned>(b));
  return s;
}

std::string_view load_error_name(LoadError e) {
  switch (e) {
    case LoadError::None: return "none";
    case LoadError::InvalidEncoding: return "invalid encoding";
    case LoadError::InvalidColorTag: return "invalid color tag";
    case LoadError::MalformedLength: return "malformed length";
  }
  return "unknown";
}

bool decode_note(std::span<const std::uint8_t> bytes, NoteBuffer& out, LoadError& err, std::string& msg) {
  err = LoadError::None;
  if (bytes.size() % 2 != 0) {
    err = LoadError::MalformedLength;
    msg = "note has odd byte count: " + std::to_string(bytes.size());
    return false;
  }
  std::vector<Line> lines(1);
  for (size_t i = 0; i < bytes.size(); i += 2) {
    std::uint8_t c = bytes[i];
    std::uint8_t color_b = bytes[i + 1];
    if (c > 127) {
      err = LoadError::InvalidEncoding;
      msg = "invalid character byte " + hex_byte(c) + " at offset " + std::to_string(i);
      return false;
    }
    ColorTag color;
    if (!decode_color_tag(color_b, color)) {
      err = LoadError::InvalidColorTag;
      msg = "invalid color byte " + hex_byte(color_b) + " at offset " + std::to_string(i + 1);
      return false;
    }
    if (c == kNewline) {
      lines.emplace_back();
      continue;
    }
    lines.back().push_back({static_cast<char>(c), color});
  }
  out.init_from_lines(std::move(lines));
  return true;
}

std::vector<std::uint8_t> encode_note(const NoteBuffer& buf) {
  std::vector<std::uint8_t> bytes;
  bytes.reserve(static_cast<size_t>(buf.char_count() + buf.line_count()) * 2);
  int n = buf.line_count();
  for (int i = 0; i < n; ++i) {
    for (const auto& c : buf.line(i)) {
      bytes.push_back(static_cast<std::uint8_t>(c.ch));
      bytes.push_back(encode_color_tag(c.color));
    }
    if (i + 1 < n) {
      bytes.push_back(kNewline);
      bytes.push_back(0);
    }
  }
  return bytes;
}
