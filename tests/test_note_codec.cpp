#include "note_codec.hpp"
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

static NoteBuffer sample() {
  NoteBuffer b = NoteBuffer::from_strings({"ab", "c"});
  b.set_char(0, 0, {'a', ColorTag::Blue});
  b.set_char(0, 1, {'b', ColorTag::Blue});
  return b;
}

int main() {
  std::vector<std::uint8_t> bytes = encode_note(sample());
  std::vector<std::uint8_t> expect = {'a', 12, 'b', 12, '\n', 0, 'c', 0};
  assert(bytes == expect);

  NoteBuffer out;
  LoadError err = LoadError::InvalidEncoding;
  std::string msg;
  assert(decode_note(bytes, out, err, msg));
  assert(err == LoadError::None);
  assert(out == sample());

  // empty input is one empty line, and encodes back to nothing
  assert(decode_note(std::vector<std::uint8_t>{}, out, err, msg));
  assert(out.empty());
  assert(encode_note(out).empty());

  // a trailing newline pair keeps its empty last line
  std::vector<std::uint8_t> trailing = {'x', 0, '\n', 0};
  assert(decode_note(trailing, out, err, msg));
  assert(out.line_count() == 2);
  assert(out.line_text(0) == "x");
  assert(out.line_length(1) == 0);
  assert(encode_note(out) == trailing);

  NoteBuffer keep = sample();
  std::vector<std::uint8_t> odd = {'a', 0, 'b'};
  assert(!decode_note(odd, keep, err, msg));
  assert(err == LoadError::MalformedLength);
  assert(keep == sample());

  std::vector<std::uint8_t> high = {'a', 0, 200, 0};
  assert(!decode_note(high, keep, err, msg));
  assert(err == LoadError::InvalidEncoding);
  assert(msg.find("offset 2") != std::string::npos);

  std::vector<std::uint8_t> bad_color = {'a', 16};
  assert(!decode_note(bad_color, keep, err, msg));
  assert(err == LoadError::InvalidColorTag);

  std::vector<std::uint8_t> bad_newline_color = {'a', 0, '\n', 99, 'b', 0};
  assert(!decode_note(bad_newline_color, keep, err, msg));
  assert(err == LoadError::InvalidColorTag);
  assert(keep == sample());

  assert(load_error_name(LoadError::MalformedLength) == "malformed length");
  return 0;
}
