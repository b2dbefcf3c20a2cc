#include "recovery_manager.hpp"
#include "document.hpp"
#include "local_filesystem.hpp"
#include "test_util.hpp"
#include <cassert>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::shared_ptr<IFileSystem> local() { return std::make_shared<LocalFileSystem>(); }

static void test_full_snapshot_for_small_buffer() {
  TempDir dir;
  write_bytes(dir / "small.txt", "line one\nline two\n");
  RecoveryStorage storage(dir / "rec");
  RecoveryManager mgr(storage, 1 << 20);
  std::unique_ptr<Document> doc;
  Error e;
  assert(Document::open(dir / "small.txt", local(), 1 << 20, doc, e));
  doc->set_cursor(0);
  assert(doc->type_text("// ", e));
  std::string id = mgr.id_for(doc->buffer());
  assert(id == storage.get_buffer_id(dir / "small.txt"));

  assert(mgr.autosave(*doc, id, e));
  assert(!doc->recovery_dirty());
  std::optional<RecoveryMetadata> md;
  assert(storage.read_metadata(id, md, e) && md);
  assert(md->format == RecoveryFormat::Full);
  assert(md->line_count == 3u);
  assert(md->buffer_name == std::string("small.txt"));

  std::string out;
  assert(mgr.recover(id, out, e));
  assert(out == "// line one\nline two\n");
  // the file on disk was never touched
  assert(read_bytes(dir / "small.txt") == "line one\nline two\n");

  assert(mgr.discard(id, e));
  assert(!mgr.recover(id, out, e));
  assert(e.kind == ErrorKind::NotFound);
}

static void test_chunked_snapshot_for_large_buffer() {
  TempDir dir;
  std::string data = make_text(200000, 77);
  write_bytes(dir / "big.txt", data);
  RecoveryStorage storage(dir / "rec");
  RecoveryManager mgr(storage, 64 * 1024);
  TextBuffer b;
  Error e;
  assert(TextBuffer::load_from_file(dir / "big.txt", 4096, local(), b, e, 16384));
  b.insert_bytes(100, "AAA");
  b.delete_bytes(150000, 10);
  b.insert_bytes(199990, "ZZ");
  std::string expect = data;
  expect.insert(100, "AAA");
  expect.erase(150000, 10);
  expect.insert(199990, "ZZ");

  std::string id = mgr.id_for(b);
  RecoveryMetadata md;
  assert(mgr.snapshot(b, id, md, e));
  assert(md.format == RecoveryFormat::Chunked);
  assert(md.chunk_count == 3u);
  // proportional to the edits, not to the file
  assert(md.content_size < 2048);

  std::string out;
  assert(mgr.recover(id, out, e));
  assert(out == expect);
  assert(mgr.restore_to(id, dir / "restored.txt", e));
  assert(read_bytes(dir / "restored.txt") == expect);
}

static void test_unbacked_buffer_is_full() {
  TempDir dir;
  RecoveryStorage storage(dir / "rec");
  RecoveryManager mgr(storage, 1);
  TextBuffer b = TextBuffer::from_bytes("scratch", local());
  std::string id = mgr.id_for(b);
  assert(id.rfind("unnamed-", 0) == 0);
  RecoveryMetadata md;
  Error e;
  assert(mgr.snapshot(b, id, md, e));
  assert(md.format == RecoveryFormat::Full && !md.original_path);
  std::string out;
  assert(mgr.recover(id, out, e) && out == "scratch");
}

static void test_overlapping_snapshots_are_rejected() {
  TempDir dir;
  RecoveryStorage storage(dir / "rec");
  RecoveryManager mgr(storage, 1 << 30);
  TextBuffer b = TextBuffer::from_bytes(make_text(4 << 20, 3), local());
  std::vector<std::thread> threads;
  std::vector<ErrorKind> results(4, ErrorKind::None);
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i]{
      RecoveryMetadata md;
      Error e;
      mgr.snapshot(b, "same", md, e);
      results[i] = e.kind;
    });
  }
  for (auto& t : threads) t.join();
  int ok = 0;
  for (ErrorKind k : results) {
    assert(k == ErrorKind::None || k == ErrorKind::Busy);
    if (k == ErrorKind::None) ok++;
  }
  assert(ok >= 1);
  std::string out;
  Error e;
  assert(mgr.recover("same", out, e) && out.size() == (4u << 20));
}

int main() {
  test_full_snapshot_for_small_buffer();
  test_chunked_snapshot_for_large_buffer();
  test_unbacked_buffer_is_full();
  test_overlapping_snapshots_are_rejected();
  return 0;
}
