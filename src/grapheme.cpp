#include "grapheme.hpp"
#include "text_buffer.hpp"
#include <unicode/ubrk.h>
#include <unicode/uchar.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>
#include <algorithm>
#include <stdexcept>
#include <string>

static constexpr uint64_t WINDOW_BYTES = 256;

namespace {

/* character break iterator over a UTF-8 view; byte offsets in and out */
class CharBreaker {
public:
  explicit CharBreaker(std::string_view text) {
    UErrorCode status = U_ZERO_ERROR;
    ut_ = utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status);
    if (U_SUCCESS(status)) bi_ = ubrk_open(UBRK_CHARACTER, "", nullptr, 0, &status);
    if (U_SUCCESS(status)) ubrk_setUText(bi_, ut_, &status);
    if (U_FAILURE(status)) {
      close();
      throw std::runtime_error(std::string("ICU break iterator: ") + u_errorName(status));
    }
  }
  ~CharBreaker() { close(); }
  CharBreaker(const CharBreaker&) = delete;
  CharBreaker& operator=(const CharBreaker&) = delete;

  int32_t following(int32_t pos) { return ubrk_following(bi_, pos); }
  int32_t preceding(int32_t pos) { return ubrk_preceding(bi_, pos); }
  int32_t first() { return ubrk_first(bi_); }
  int32_t next() { return ubrk_next(bi_); }

private:
  void close() {
    if (bi_) { ubrk_close(bi_); bi_ = nullptr; }
    if (ut_) { utext_close(ut_); ut_ = nullptr; }
  }
  UText* ut_ = nullptr;
  UBreakIterator* bi_ = nullptr;
};

bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

} // namespace

bool is_code_point_boundary(std::string_view text, size_t pos) {
  return pos == 0 || pos >= text.size() || !is_continuation(text[pos]);
}

size_t next_code_point_boundary(std::string_view text, size_t pos) {
  if (pos >= text.size()) return text.size();
  size_t i = pos + 1;
  while (i < text.size() && is_continuation(text[i])) i++;
  return i;
}

size_t prev_code_point_boundary(std::string_view text, size_t pos) {
  if (pos == 0) return 0;
  size_t i = std::min(pos, text.size()) - 1;
  while (i > 0 && is_continuation(text[i])) i--;
  return i;
}

size_t next_grapheme_boundary(std::string_view text, size_t pos) {
  if (pos >= text.size()) return text.size();
  CharBreaker br(text);
  int32_t r = br.following(static_cast<int32_t>(pos));
  if (r == UBRK_DONE) return text.size();
  return static_cast<size_t>(r);
}

size_t prev_grapheme_boundary(std::string_view text, size_t pos) {
  if (pos == 0) return 0;
  pos = std::min(pos, text.size());
  CharBreaker br(text);
  int32_t r = br.preceding(static_cast<int32_t>(pos));
  if (r == UBRK_DONE) return 0;
  return static_cast<size_t>(r);
}

uint8_t grapheme_width(std::string_view cluster) {
  if (cluster.empty()) return 0;
  int32_t i = 0;
  UChar32 c;
  U8_NEXT(reinterpret_cast<const uint8_t*>(cluster.data()), i, static_cast<int32_t>(cluster.size()), c);
  if (c < 0) return 1;
  if (u_iscntrl(c)) return 0;
  int eaw = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
  if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH) return 2;
  if (u_hasBinaryProperty(c, UCHAR_EMOJI_PRESENTATION)) return 2;
  return 1;
}

std::vector<GraphemeInfo> grapheme_layout(std::string_view text) {
  std::vector<GraphemeInfo> out;
  if (text.empty()) return out;
  CharBreaker br(text);
  int32_t start = br.first();
  for (int32_t end = br.next(); end != UBRK_DONE; start = end, end = br.next()) {
    std::string_view cluster = text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
    out.push_back(GraphemeInfo{static_cast<uint32_t>(cluster.size()), grapheme_width(cluster)});
  }
  return out;
}

size_t column_of(std::string_view line, size_t pos) {
  size_t col = 0, at = 0;
  for (const auto& g : grapheme_layout(line)) {
    if (at >= pos) break;
    at += g.byte_len;
    col += g.width;
  }
  return col;
}

bool next_grapheme_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err) {
  uint64_t total = buf.total_bytes();
  if (pos >= total) { out = total; return true; }
  std::string window;
  for (uint64_t span = WINDOW_BYTES;; span *= 2) {
    uint64_t len = std::min(span, total - pos);
    if (!buf.read_range(pos, len, window, err)) return false;
    if (pos + len == total) { out = pos + next_grapheme_boundary(window, 0); return true; }
    // drop the last code point: it may be cut, and a boundary needs the char after it
    std::string_view view(window);
    view = view.substr(0, prev_code_point_boundary(view, view.size()));
    size_t b = next_grapheme_boundary(view, 0);
    if (b < view.size()) { out = pos + b; return true; }
  }
}

bool prev_grapheme_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err) {
  if (pos == 0) { out = 0; return true; }
  pos = std::min(pos, buf.total_bytes());
  std::string window;
  for (uint64_t span = WINDOW_BYTES;; span *= 2) {
    uint64_t start = pos > span ? pos - span : 0;
    if (!buf.read_range(start, pos - start, window, err)) return false;
    size_t skip = 0;
    while (start > 0 && skip < window.size() && is_continuation(window[skip])) skip++;
    std::string_view view(window);
    view.remove_prefix(skip);
    size_t b = prev_grapheme_boundary(view, view.size());
    if (start == 0) { out = b; return true; }
    // the cluster ending at b must start inside the window, else b rests on the cut
    if (b > 0 && prev_grapheme_boundary(view, b) > 0) { out = start + skip + b; return true; }
  }
}

bool prev_code_point_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err) {
  if (pos == 0) { out = 0; return true; }
  pos = std::min(pos, buf.total_bytes());
  uint64_t start = pos > 4 ? pos - 4 : 0;
  std::string window;
  if (!buf.read_range(start, pos - start, window, err)) return false;
  out = start + prev_code_point_boundary(window, window.size());
  return true;
}
