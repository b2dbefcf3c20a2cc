#include "cursor.hpp"
#include "grapheme.hpp"
#include "text_buffer.hpp"
#include <algorithm>
#include <string>

static constexpr uint64_t SCAN_BYTES = 4096;

ByteRange Cursor::selection() const {
  if (!anchor) return ByteRange{pos, 0};
  uint64_t a = std::min(*anchor, pos);
  uint64_t b = std::max(*anchor, pos);
  return ByteRange{a, b - a};
}

static void begin_extend(Cursor& cur, bool extend) {
  if (!extend) cur.clear_selection();
  else if (!cur.anchor) cur.anchor = cur.pos;
}

bool cursor_right(const TextBuffer& buf, Cursor& cur, bool extend, Error& err) {
  uint64_t next = 0;
  if (!next_grapheme_boundary(buf, cur.pos, next, err)) return false;
  begin_extend(cur, extend);
  cur.pos = next;
  return true;
}

bool cursor_left(const TextBuffer& buf, Cursor& cur, bool extend, Error& err) {
  uint64_t prev = 0;
  if (!prev_grapheme_boundary(buf, cur.pos, prev, err)) return false;
  begin_extend(cur, extend);
  cur.pos = prev;
  return true;
}

bool line_start_of(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err) {
  pos = std::min(pos, buf.total_bytes());
  std::string window;
  uint64_t end = pos;
  while (end > 0) {
    uint64_t start = end > SCAN_BYTES ? end - SCAN_BYTES : 0;
    if (!buf.read_range(start, end - start, window, err)) return false;
    size_t nl = window.rfind('\n');
    if (nl != std::string::npos) { out = start + nl + 1; return true; }
    end = start;
  }
  out = 0;
  return true;
}

bool line_end_of(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err) {
  uint64_t total = buf.total_bytes();
  std::string window;
  for (uint64_t start = std::min(pos, total); start < total;) {
    uint64_t n = std::min(SCAN_BYTES, total - start);
    if (!buf.read_range(start, n, window, err)) return false;
    size_t nl = window.find('\n');
    if (nl != std::string::npos) {
      uint64_t at = start + nl;
      if (at > pos) {
        std::string prev;
        if (!buf.read_range(at - 1, 1, prev, err)) return false;
        if (prev[0] == '\r') at--;
      }
      out = at;
      return true;
    }
    start += n;
  }
  out = total;
  return true;
}

bool cursor_line_start(const TextBuffer& buf, Cursor& cur, Error& err) {
  uint64_t at = 0;
  if (!line_start_of(buf, cur.pos, at, err)) return false;
  cur.clear_selection();
  cur.pos = at;
  return true;
}

bool cursor_line_end(const TextBuffer& buf, Cursor& cur, Error& err) {
  uint64_t at = 0;
  if (!line_end_of(buf, cur.pos, at, err)) return false;
  cur.clear_selection();
  cur.pos = at;
  return true;
}

bool cursor_column(const TextBuffer& buf, const Cursor& cur, size_t& col, Error& err) {
  uint64_t start = 0;
  if (!line_start_of(buf, cur.pos, start, err)) return false;
  std::string line;
  if (!buf.read_range(start, cur.pos - start, line, err)) return false;
  col = column_of(line, line.size());
  return true;
}
