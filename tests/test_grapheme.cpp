#include "grapheme.hpp"
#include "local_filesystem.hpp"
#include "text_buffer.hpp"
#include <cassert>
#include <memory>
#include <string>
#include <vector>

static const std::string kThai = "\xE0\xB8\x97\xE0\xB8\xB5\xE0\xB9\x88"; /* ที่ */
static const std::string kGrin = "\xF0\x9F\x98\x80";                     /* 😀 */
static const std::string kGlobe = "\xF0\x9F\x8C\x8D";                    /* 🌍 */
static const std::string kAcute = "\xCC\x81";                            /* U+0301 */

static void test_emoji_navigation() {
  std::string text = "Hello " + kGrin + " World " + kGlobe;
  size_t pos = 0;
  for (int i = 0; i < 7; ++i) pos = next_grapheme_boundary(text, pos);
  assert(pos == 10);
  for (int i = 0; i < 7; ++i) pos = prev_grapheme_boundary(text, pos);
  assert(pos == 0);
  assert(next_grapheme_boundary(text, text.size()) == text.size());
  assert(prev_grapheme_boundary(text, 0) == 0);
}

static void test_thai_cluster_boundaries() {
  std::string text = "a" + kThai + "b";
  assert(text.size() == 11);
  assert(next_grapheme_boundary(text, 0) == 1);
  assert(next_grapheme_boundary(text, 1) == 10);
  assert(next_grapheme_boundary(text, 10) == 11);
  assert(prev_grapheme_boundary(text, 11) == 10);
  assert(prev_grapheme_boundary(text, 10) == 1);
  assert(prev_grapheme_boundary(text, 1) == 0);

  // code points inside the cluster
  assert(prev_code_point_boundary(text, 10) == 7);
  assert(prev_code_point_boundary(text, 7) == 4);
  assert(next_code_point_boundary(text, 1) == 4);
  assert(is_code_point_boundary(text, 4));
  assert(!is_code_point_boundary(text, 5));
}

static void test_round_trip_symmetry() {
  std::vector<std::string> samples = {
    "plain ascii",
    "caf\xC3\xA9 na\xC3\xAFve",
    "\xE2\x94\x80\xE2\x94\x82\xE2\x94\x8C box",
    kGrin + kGlobe + kGrin,
    "e" + kAcute + "x" + kThai + kThai,
  };
  for (const auto& s : samples) {
    std::vector<size_t> forward;
    size_t pos = 0;
    while (pos < s.size()) {
      forward.push_back(pos);
      size_t next = next_grapheme_boundary(s, pos);
      assert(next > pos);
      assert(is_code_point_boundary(s, next));
      pos = next;
    }
    for (size_t i = forward.size(); i-- > 0;) {
      pos = prev_grapheme_boundary(s, pos);
      assert(pos == forward[i]);
    }
  }
}

static void test_layout_widths() {
  std::string text = "a\xE4\xBD\xA0" + kGrin + "e" + kAcute + "\t" + "\xE2\x94\x80";
  std::vector<GraphemeInfo> g = grapheme_layout(text);
  assert(g.size() == 6);
  assert(g[0].byte_len == 1 && g[0].width == 1);
  assert(g[1].byte_len == 3 && g[1].width == 2);
  assert(g[2].byte_len == 4 && g[2].width == 2);
  assert(g[3].byte_len == 3 && g[3].width == 1);
  assert(g[4].byte_len == 1 && g[4].width == 0);
  assert(g[5].byte_len == 3 && g[5].width == 1);
  assert(grapheme_layout("").empty());
  assert(column_of(text, 1 + 3 + 4) == 5);
}

static void test_buffer_windows() {
  std::string long_cluster = "a";
  for (int i = 0; i < 200; ++i) long_cluster += kAcute;
  std::string text = long_cluster + "z";
  TextBuffer b = TextBuffer::from_bytes(text, std::make_shared<LocalFileSystem>());
  uint64_t out = 0;
  Error e;
  assert(next_grapheme_boundary(b, 0, out, e) && out == 401);
  assert(prev_grapheme_boundary(b, 401, out, e) && out == 0);
  assert(next_grapheme_boundary(b, 401, out, e) && out == 402);
  assert(prev_code_point_boundary(b, 401, out, e) && out == 399);

  std::string padded = std::string(300, 'x') + kThai + kGrin;
  TextBuffer p = TextBuffer::from_bytes(padded, std::make_shared<LocalFileSystem>());
  assert(prev_grapheme_boundary(p, padded.size(), out, e) && out == 309);
  assert(prev_grapheme_boundary(p, 309, out, e) && out == 300);
  assert(next_grapheme_boundary(p, 300, out, e) && out == 309);
}

int main() {
  test_emoji_navigation();
  test_thai_cluster_boundaries();
  test_round_trip_symmetry();
  test_layout_widths();
  test_buffer_windows();
  return 0;
}
