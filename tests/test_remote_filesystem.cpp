#include "agent_server.hpp"
#include "recovery_storage.hpp"
#include "remote_filesystem.hpp"
#include "text_buffer.hpp"
#include "test_util.hpp"
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static bool present(IFileSystem& fs, const std::filesystem::path& p) {
  bool out = false;
  Error e;
  bool ok = fs.exists(p, out, e);
  assert(ok);
  return out;
}

static bool directory(IFileSystem& fs, const std::filesystem::path& p) {
  bool out = false;
  Error e;
  bool ok = fs.is_dir(p, out, e);
  assert(ok);
  return out;
}

static std::unique_ptr<LoopbackAgent> spawn(ChannelOptions opts = {}) {
  Error e;
  auto agent = spawn_local_agent(opts, e);
  assert(agent && e.ok());
  return agent;
}

static void test_basic_operations() {
  TempDir dir;
  auto agent = spawn();
  RemoteFileSystem fs(agent->channel(), "tester@loopback");
  assert(fs.remote_connection_info() == "tester@loopback");
  Error e;

  assert(fs.write_file(dir / "a.txt", "Hello World", e));
  assert(read_bytes(dir / "a.txt") == "Hello World");
  std::string out;
  assert(fs.read_file(dir / "a.txt", out, e) && out == "Hello World");
  assert(fs.read_range(dir / "a.txt", 6, 5, out, e) && out == "World");
  assert(!fs.read_range(dir / "a.txt", 6, 50, out, e));
  assert(e.kind == ErrorKind::Io);
  e.clear();

  std::vector<WriteOp> ops = {WriteCopy{0, 5}, WriteInsert{", dear"}, WriteCopy{5, 6}};
  assert(fs.write_patched(dir / "a.txt", dir / "a.txt", ops, e));
  assert(read_bytes(dir / "a.txt") == "Hello, dear World");

  assert(fs.set_file_length(dir / "a.txt", 5, e));
  assert(read_bytes(dir / "a.txt") == "Hello");

  FileMetadata md;
  assert(fs.metadata(dir / "a.txt", md, e));
  assert(md.size == 5 && md.is_file && !md.is_dir);
  assert(present(fs, dir / "a.txt"));
  assert(!present(fs, dir / "b.txt"));

  assert(fs.create_dir_all(dir / "sub" / "deeper", e));
  assert(directory(fs, dir / "sub" / "deeper"));
  std::vector<DirEntry> entries;
  assert(fs.read_dir(dir.path(), entries, e));
  assert(entries.size() == 2);
  assert(entries[0].name == "a.txt" && entries[0].size == 5);
  assert(entries[1].name == "sub" && entries[1].is_dir);

  assert(fs.remove_file(dir / "a.txt", e));
  assert(!present(fs, dir / "a.txt"));
}

static void test_errors_surface_as_io() {
  TempDir dir;
  auto agent = spawn();
  RemoteFileSystem fs(agent->channel(), "");
  std::string out;
  Error e;
  assert(!fs.read_file(dir / "missing", out, e));
  assert(e.kind == ErrorKind::Io);
  assert(e.message.find("not found") != std::string::npos);
  e.clear();
  assert(!fs.remove_file(dir / "missing", e));
  assert(e.kind == ErrorKind::Io);
}

static void test_append_writer() {
  TempDir dir;
  auto agent = spawn();
  RemoteFileSystem fs(agent->channel(), "");
  Error e;
  auto w = fs.open_file_for_append(dir / "log", e);
  assert(w);
  assert(std::filesystem::exists(dir / "log"));
  assert(w->write_all("one\n", e));
  assert(w->write_all("two\n", e));
  assert(w->sync_all(e));
  assert(read_bytes(dir / "log") == "one\ntwo\n");
  assert(w->write_all("three\n", e));
  w.reset();
  assert(read_bytes(dir / "log") == "one\ntwo\nthree\n");
}

static void test_streaming_load_under_backpressure() {
  TempDir dir;
  std::string data = make_text(2200000, 99);
  write_bytes(dir / "big.txt", data);
  ChannelOptions opts;
  opts.data_channel_capacity = 2;
  opts.recv_delay = std::chrono::microseconds(1000);
  auto agent = spawn(opts);
  auto fs = std::make_shared<RemoteFileSystem>(agent->channel(), "");

  // whole-file read: one stream of many chunks against a two-slot queue
  TextBuffer whole;
  Error e;
  assert(TextBuffer::load_from_file(dir / "big.txt", 4 << 20, fs, whole, e));
  assert(whole.total_bytes() == data.size());
  std::string got;
  assert(whole.to_string(got, e) && got == data);

  // chunked load: ranges are fetched on demand
  TextBuffer chunked;
  assert(TextBuffer::load_from_file(dir / "big.txt", 1 << 20, fs, chunked, e, 512 * 1024));
  assert(chunked.total_bytes() == data.size());
  std::string tail;
  assert(chunked.read_range(data.size() - 100, 100, tail, e) && tail == data.substr(data.size() - 100));
}

static void test_edit_and_save_remotely() {
  TempDir dir;
  std::string data = make_text(100000, 5);
  write_bytes(dir / "f.txt", data);
  auto agent = spawn();
  auto fs = std::make_shared<RemoteFileSystem>(agent->channel(), "");
  TextBuffer b;
  Error e;
  assert(TextBuffer::load_from_file(dir / "f.txt", 4096, fs, b, e, 8192));
  b.insert_bytes(50000, "INSERTED");
  b.delete_bytes(10, 20);
  assert(b.save_to_file(dir / "f.txt", e));
  std::string expect = data;
  expect.insert(50000, "INSERTED");
  expect.erase(10, 20);
  assert(read_bytes(dir / "f.txt") == expect);
}

static void test_agent_disconnect() {
  TempDir dir;
  write_bytes(dir / "a", "x");
  auto agent = spawn();
  RemoteFileSystem fs(agent->channel(), "");
  std::string out;
  Error e;
  assert(fs.read_file(dir / "a", out, e));
  agent->stop();
  for (int i = 0; i < 100 && agent->channel()->is_connected(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(!agent->channel()->is_connected());
  assert(!fs.read_file(dir / "a", out, e));
  assert(e.kind == ErrorKind::Io);
}

static void test_recovery_over_lost_agent() {
  TempDir dir;
  auto agent = spawn();
  auto fs = std::make_shared<RemoteFileSystem>(agent->channel(), "");
  RecoveryStorage st(dir / "rec", fs);
  RecoveryMetadata md;
  Error e;
  assert(st.save_recovery("abc", "draft", std::nullopt, std::string("draft"), 1, md, e));
  // a pid above any pid_max never runs
  write_bytes(st.session_lock_path(), "{\"pid\": 999999999, \"started_at\": 1}");
  bool crashed = false;
  assert(st.detect_crash(crashed, e) && crashed);

  agent->stop();
  for (int i = 0; i < 100 && agent->channel()->is_connected(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  // a dead transport is an error, never "absent"
  bool there = false;
  assert(!fs->exists(dir / "rec", there, e));
  assert(e.kind == ErrorKind::Io);
  e.clear();
  crashed = false;
  assert(!st.detect_crash(crashed, e));
  assert(e.kind == ErrorKind::Io);
  e.clear();
  std::optional<RecoveryMetadata> meta;
  assert(!st.read_metadata("abc", meta, e));
  e.clear();
  std::vector<RecoveryEntry> entries;
  assert(!st.list_entries(entries, e));
  e.clear();
  size_t cleaned = 0;
  assert(!st.cleanup_orphans(cleaned, e));
  assert(read_bytes(st.content_path("abc")) == "draft");
}

int main() {
  test_basic_operations();
  test_errors_surface_as_io();
  test_append_writer();
  test_streaming_load_under_backpressure();
  test_edit_and_save_remotely();
  test_agent_disconnect();
  test_recovery_over_lost_agent();
  return 0;
}
