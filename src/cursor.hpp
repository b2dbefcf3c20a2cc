#pragma once
/*
 * Cursor
 *
 * Purpose: byte-offset cursor with an optional selection anchor.
 * Movement steps by grapheme cluster; line moves stop at the line
 * terminator (before "\r\n" on CRLF lines). Positions always sit on
 * UTF-8 boundaries, so a selection is always a valid byte range.
 */
#include <cstdint>
#include <optional>
#include "error.hpp"
#include "types.hpp"

class TextBuffer;

struct Cursor {
  uint64_t pos = 0;
  std::optional<uint64_t> anchor;

  bool has_selection() const { return anchor && *anchor != pos; }
  ByteRange selection() const;
  void clear_selection() { anchor.reset(); }
  bool operator==(const Cursor& o) const { return pos == o.pos && anchor == o.anchor; }
};

bool cursor_right(const TextBuffer& buf, Cursor& cur, bool extend, Error& err);
bool cursor_left(const TextBuffer& buf, Cursor& cur, bool extend, Error& err);
bool cursor_line_start(const TextBuffer& buf, Cursor& cur, Error& err);
bool cursor_line_end(const TextBuffer& buf, Cursor& cur, Error& err);
/* byte offset of the start of the line containing pos */
bool line_start_of(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err);
/* byte offset of the terminator (or end of buffer) of the line containing pos */
bool line_end_of(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err);
/* visual column of the cursor within its line */
bool cursor_column(const TextBuffer& buf, const Cursor& cur, size_t& col, Error& err);
