#include "text_buffer.hpp"
#include "local_filesystem.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static std::shared_ptr<IFileSystem> local() { return std::make_shared<LocalFileSystem>(); }

static std::string contents(const TextBuffer& b) {
  std::string s;
  Error e;
  bool ok = b.to_string(s, e);
  assert(ok);
  return s;
}

static TextBuffer load(const std::filesystem::path& p, size_t threshold, size_t chunk = PE_LOAD_CHUNK_SIZE) {
  TextBuffer b;
  Error e;
  bool ok = TextBuffer::load_from_file(p, threshold, local(), b, e, chunk);
  assert(ok && e.ok());
  return b;
}

static void test_load_small_and_large() {
  TempDir dir;
  std::string data = make_text(300000, 1);
  write_bytes(dir / "f.txt", data);

  TextBuffer small = load(dir / "f.txt", 1 << 20);
  assert(small.total_bytes() == data.size());
  assert(contents(small) == data);

  // above the threshold the original is streamed in chunks and never cached
  TextBuffer large = load(dir / "f.txt", 1024, 4096);
  assert(large.total_bytes() == data.size());
  assert(large.piece_count() == 1);
  std::string mid;
  Error e;
  assert(large.read_range(123456, 1000, mid, e));
  assert(mid == data.substr(123456, 1000));
  assert(contents(large) == data);
}

static void test_load_errors() {
  TempDir dir;
  TextBuffer b;
  Error e;
  assert(!TextBuffer::load_from_file(dir / "missing", 1024, local(), b, e));
  assert(e.kind == ErrorKind::NotFound);
  e.clear();
  assert(!TextBuffer::load_from_file(dir.path(), 1024, local(), b, e));
  assert(e.kind == ErrorKind::Io);
}

static void test_round_trip_unmodified() {
  TempDir dir;
  std::string data = make_text(50000, 3);
  write_bytes(dir / "f.txt", data);
  TextBuffer b = load(dir / "f.txt", 1024, 1000);
  Error e;
  assert(b.save_to_file(dir / "f.txt", e));
  assert(read_bytes(dir / "f.txt") == data);
  assert(!std::filesystem::exists(staging_path(dir / "f.txt")));
}

static void test_write_recipe() {
  TempDir dir;
  write_bytes(dir / "f.txt", "Hello World");
  TextBuffer b = load(dir / "f.txt", 1 << 20);
  b.insert_bytes(5, ",");
  b.insert_bytes(6, " dear");
  b.delete_bytes(0, 1);
  b.insert_bytes(0, "J");
  std::vector<WriteOp> ops = b.build_write_recipe();
  assert(ops.size() == 4);
  assert(std::get<WriteInsert>(ops[0]).data == "J");
  assert(std::get<WriteCopy>(ops[1]).offset == 1 && std::get<WriteCopy>(ops[1]).len == 4);
  assert(std::get<WriteInsert>(ops[2]).data == ", dear");
  assert(std::get<WriteCopy>(ops[3]).offset == 5 && std::get<WriteCopy>(ops[3]).len == 6);

  Error e;
  assert(b.save_to_file(dir / "f.txt", e));
  assert(read_bytes(dir / "f.txt") == "Jello, dear World");
  // re-anchored on the saved bytes
  assert(b.piece_count() == 1);
  assert(b.original_size() == 17);
  assert(b.build_write_recipe().size() == 1);
}

static void test_shadow_random_with_reload() {
  TempDir dir;
  auto path = dir / "shadow.txt";
  std::string shadow = make_text(40000, 11);
  write_bytes(path, shadow);
  // small threshold keeps the original on disk and exercises read_range
  TextBuffer b = load(path, 4096, 4096);
  Rng r(1234);
  for (int i = 1; i <= 600; ++i) {
    if (shadow.empty() || r.below(2) == 0) {
      uint64_t pos = r.below(shadow.size() + 1);
      std::string ins = make_text(1 + r.below(40), r.next());
      b.insert_bytes(pos, ins);
      shadow.insert(pos, ins);
    } else {
      uint64_t pos = r.below(shadow.size());
      uint64_t n = 1 + r.below(std::min<uint64_t>(300, shadow.size() - pos));
      b.delete_bytes(pos, n);
      shadow.erase(pos, n);
    }
    assert(b.total_bytes() == shadow.size());
    if (i % 50 == 0) {
      assert(contents(b) == shadow);
      Error e;
      assert(b.save_to_file(path, e));
      assert(read_bytes(path) == shadow);
      b = load(path, 4096, 4096);
      assert(contents(b) == shadow);
    }
  }
  assert(b.check_invariants());
}

static void test_contract_violations() {
  TextBuffer b = TextBuffer::from_bytes("abc", local());
  bool threw = false;
  try { b.insert_bytes(4, "x"); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
  threw = false;
  try { b.delete_bytes(1, 3); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
  threw = false;
  std::string out;
  Error e;
  try { (void)b.read_range(2, 2, out, e); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
  assert(contents(b) == "abc");
}

static void test_line_endings() {
  TempDir dir;
  write_bytes(dir / "crlf.txt", "one\r\ntwo\r\n");
  TextBuffer b = load(dir / "crlf.txt", 1 << 20);
  assert(b.line_ending() == LineEnding::CRLF);
  uint64_t lines = 0;
  Error e;
  assert(b.line_count(lines, e) && lines == 3);

  b.set_line_ending(LineEnding::LF);
  // conversion happens at save time only
  assert(contents(b) == "one\r\ntwo\r\n");
  assert(b.save_to_file(dir / "crlf.txt", e));
  assert(read_bytes(dir / "crlf.txt") == "one\ntwo\n");
  assert(b.line_ending() == LineEnding::LF);

  TextBuffer n = TextBuffer::from_bytes("a\nb\n", local());
  assert(n.line_ending() == LineEnding::LF);
  n.set_line_ending(LineEnding::CRLF);
  assert(n.save_to_file(dir / "new.txt", e));
  assert(read_bytes(dir / "new.txt") == "a\r\nb\r\n");
  assert(convert_line_endings("x\r\ny\n", LineEnding::CRLF) == "x\r\ny\r\n");
}

static void test_line_ending_across_stream_chunks() {
  TempDir dir;
  // 3-byte chunks put "\r" and "\n" in different pieces
  write_bytes(dir / "split.txt", "ab\r\ncd\r\nef\r\n");
  TextBuffer b = load(dir / "split.txt", 0, 3);
  assert(b.piece_count() >= 1 && b.total_bytes() == 12);
  assert(b.line_ending() == LineEnding::CRLF);

  write_bytes(dir / "lf.txt", "abc\ndef\n");
  TextBuffer l = load(dir / "lf.txt", 0, 3);
  assert(l.line_ending() == LineEnding::LF);
}

static void test_save_as_keeps_source() {
  TempDir dir;
  write_bytes(dir / "a.txt", "original");
  TextBuffer b = load(dir / "a.txt", 1 << 20);
  b.insert_bytes(8, "!");
  Error e;
  assert(b.save_to_file(dir / "b.txt", e));
  assert(read_bytes(dir / "a.txt") == "original");
  assert(read_bytes(dir / "b.txt") == "original!");
  assert(b.file_path() == dir / "b.txt");
  assert(!b.is_modified());
}

static void test_recovery_chunks() {
  TempDir dir;
  std::string original = "Hello, World! This is a test file with some content.";
  write_bytes(dir / "f.txt", original);
  TextBuffer b = load(dir / "f.txt", 8);
  b.delete_bytes(24, 4);
  b.insert_bytes(24, "sample");
  b.delete_bytes(7, 5);
  b.insert_bytes(7, "Universe");
  std::vector<RecoveryChunk> chunks;
  Error e;
  assert(b.build_recovery_chunks(chunks, e));
  assert(chunks.size() == 2);
  assert(chunks[0].offset == 7 && chunks[0].original_len == 5 && chunks[0].content == "Universe");
  assert(chunks[1].offset == 24 && chunks[1].original_len == 4 && chunks[1].content == "sample");

  ChunkedRecoveryData data;
  data.original_size = original.size();
  data.final_size = b.total_bytes();
  data.chunks = chunks;
  std::string rebuilt;
  assert(data.apply(original, rebuilt, e));
  assert(rebuilt == "Hello, Universe! This is a sample file with some content.");

  TextBuffer unbacked = TextBuffer::from_bytes("x", local());
  assert(!unbacked.build_recovery_chunks(chunks, e));
}

static void test_modified_flag() {
  TempDir dir;
  write_bytes(dir / "m.txt", "abc");
  TextBuffer b = load(dir / "m.txt", 1 << 20);
  assert(!b.is_modified());
  b.insert_bytes(3, "d");
  assert(b.is_modified());
  b.delete_bytes(3, 1);
  assert(!b.is_modified());
  // same bytes through different pieces still count as unmodified
  b.delete_bytes(1, 1);
  b.insert_bytes(1, "b");
  assert(b.piece_count() == 3);
  assert(!b.is_modified());
  b.delete_bytes(1, 1);
  b.insert_bytes(1, "B");
  assert(b.is_modified());
}

int main() {
  test_load_small_and_large();
  test_load_errors();
  test_round_trip_unmodified();
  test_write_recipe();
  test_shadow_random_with_reload();
  test_contract_violations();
  test_line_endings();
  test_line_ending_across_stream_chunks();
  test_save_as_keeps_source();
  test_recovery_chunks();
  test_modified_flag();
  return 0;
}
