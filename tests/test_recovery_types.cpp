#include "checksum.hpp"
#include "codec.hpp"
#include "json_util.hpp"
#include "recovery_types.hpp"
#include <unistd.h>
#include <cassert>
#include <string>

static std::string rebuild(const std::string& original, std::vector<RecoveryChunk> chunks, uint64_t final_size,
                           Error& e) {
  ChunkedRecoveryData d;
  d.original_size = original.size();
  d.final_size = final_size;
  d.chunks = std::move(chunks);
  std::string out;
  if (!d.apply(original, out, e)) return "<failed>";
  return out;
}

static void test_reconstruction_examples() {
  Error e;
  std::string text = "Hello, World! This is a test file with some content.";
  std::string expect = "Hello, Universe! This is a sample file with some content.";
  // listed out of order on purpose: application sorts by offset
  std::string got = rebuild(text, {RecoveryChunk::make(24, 4, "sample"), RecoveryChunk::make(7, 5, "Universe")},
                            expect.size(), e);
  assert(got == expect);

  assert(rebuild("AB", {RecoveryChunk::make(1, 0, "XYZ")}, 5, e) == "AXYZB");
  assert(rebuild("Hello World", {RecoveryChunk::make(2, 7, "")}, 4, e) == "Held");
  assert(rebuild("same", {}, 4, e) == "same");
}

static void test_reconstruction_failures() {
  Error e;
  ChunkedRecoveryData d;
  d.original_size = 10;
  d.final_size = 10;
  std::string out;
  assert(!d.apply("short", out, e));
  assert(e.kind == ErrorKind::SizeMismatch);

  e.clear();
  RecoveryChunk bad = RecoveryChunk::make(0, 1, "x");
  bad.content = "y";
  assert(!bad.verify());
  assert(rebuild("abc", {bad}, 3, e) == "<failed>");
  assert(e.kind == ErrorKind::ChecksumMismatch);

  e.clear();
  assert(rebuild("abc", {RecoveryChunk::make(0, 2, "x"), RecoveryChunk::make(1, 1, "y")}, 3, e) == "<failed>");
  assert(e.kind == ErrorKind::InvalidData);

  e.clear();
  assert(rebuild("abc", {RecoveryChunk::make(1, 1, "zz")}, 3, e) == "<failed>");
  assert(e.kind == ErrorKind::SizeMismatch);
}

static void test_checksum_and_base64() {
  assert(compute_checksum("") == "cbf29ce484222325");
  assert(compute_checksum("a") == "af63dc4c8601ec8c");
  assert(compute_checksum("a").size() == 16);
  Fnv1a h;
  h.update("hello ");
  h.update("world");
  assert(h.hex() == compute_checksum("hello world"));

  assert(base64_encode("") == "");
  assert(base64_encode("f") == "Zg==");
  assert(base64_encode("foobar") == "Zm9vYmFy");
  std::string out;
  assert(base64_decode("Zm9vYg==", out) && out == "foob");
  assert(!base64_decode("Zm9vYg=", out));
  assert(!base64_decode("Zm9v!mFy", out));
  std::string binary("\x00\xff\x10\n", 4);
  assert(base64_decode(base64_encode(binary), out) && out == binary);
}

static void test_metadata_json() {
  RecoveryMetadata md;
  md.original_path = "/tmp/x.txt";
  md.checksum = "0011223344556677";
  md.content_size = 42;
  md.created_at = md.updated_at = 1700000000;
  md.format = RecoveryFormat::Chunked;
  md.chunk_count = 3;
  md.original_file_size = 1000;
  Json::Value v = md.to_json();
  assert(v["format"].asString() == "chunked");
  assert(v["buffer_name"].isNull());
  Json::Value parsed;
  Error e;
  assert(json_parse(json_to_pretty(v), parsed, e));
  RecoveryMetadata back;
  assert(RecoveryMetadata::from_json(parsed, back, e));
  assert(back.original_path == md.original_path && !back.buffer_name);
  assert(back.format == RecoveryFormat::Chunked && back.chunk_count == 3u);
  assert(back.original_file_size == 1000u && back.content_size == 42);

  back.update("ffffffffffffffff", 7, 2);
  assert(back.checksum == "ffffffffffffffff" && back.content_size == 7 && back.line_count == 2u);
  assert(back.updated_at >= md.updated_at && back.created_at == md.created_at);

  Json::Value junk;
  assert(json_parse("{\"version\": 1}", junk, e));
  assert(!RecoveryMetadata::from_json(junk, back, e));
  assert(e.kind == ErrorKind::InvalidData);
  e.clear();
  assert(!json_parse("{not json", junk, e));
  assert(e.kind == ErrorKind::InvalidData);
}

static void test_session_info() {
  SessionInfo me = SessionInfo::current();
  assert(me.pid == static_cast<int64_t>(::getpid()));
  assert(me.is_running());
  SessionInfo gone;
  gone.pid = 0x7ffffff0;
  assert(!gone.is_running());
}

int main() {
  test_reconstruction_examples();
  test_reconstruction_failures();
  test_checksum_and_base64();
  test_metadata_json();
  test_session_info();
  return 0;
}
