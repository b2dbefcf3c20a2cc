#include "cli.hpp"
#include "recovery_storage.hpp"
#include "test_util.hpp"
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

struct Run {
  int rc = 0;
  std::string out;
  std::string err;
};

static Run run_cli(const TempDir& dir, const std::vector<std::string>& args) {
  Config cfg = Config::defaults();
  cfg.recovery_dir = dir / "rec";
  std::ostringstream out, err;
  Run r;
  r.rc = Cli(cfg, out, err).run(args);
  r.out = out.str();
  r.err = err.str();
  return r;
}

static void test_usage() {
  TempDir dir;
  Run r = run_cli(dir, {});
  assert(r.rc == 2);
  assert(r.err.find("usage: pedit") != std::string::npos);
  assert(r.err.find("recover restore <id> <out>") != std::string::npos);
  r = run_cli(dir, {"frobnicate"});
  assert(r.rc == 2);
  assert(r.err.find("unknown command: frobnicate") != std::string::npos);
  r = run_cli(dir, {"insert", "x.txt", "notanumber", "a"});
  assert(r.rc == 2);
}

static void test_edit_commands() {
  TempDir dir;
  auto f = dir / "a.txt";
  write_bytes(f, "hello world\n");
  Run r = run_cli(dir, {"cat", f.string()});
  assert(r.rc == 0 && r.out == "hello world\n");

  r = run_cli(dir, {"insert", f.string(), "5", ","});
  assert(r.rc == 0);
  assert(read_bytes(f) == "hello, world\n");
  r = run_cli(dir, {"delete", f.string(), "0", "7"});
  assert(r.rc == 0);
  assert(read_bytes(f) == "world\n");

  r = run_cli(dir, {"delete", f.string(), "3", "10"});
  assert(r.rc == 1);
  assert(read_bytes(f) == "world\n");

  r = run_cli(dir, {"cat", (dir / "missing.txt").string()});
  assert(r.rc == 1);
  assert(r.err.find("not found") != std::string::npos);
}

static void test_loopback_routes_through_agent() {
  TempDir dir;
  auto f = dir / "remote.txt";
  std::string data = make_text(300000, 9);
  write_bytes(f, data);
  Run r = run_cli(dir, {"--loopback", "cat", f.string()});
  assert(r.rc == 0);
  assert(r.out == data);
  r = run_cli(dir, {"--loopback", "insert", f.string(), "0", ">>"});
  assert(r.rc == 0);
  assert(read_bytes(f) == ">>" + data);
}

static void test_recover_commands() {
  TempDir dir;
  Run r = run_cli(dir, {"recover", "list"});
  assert(r.rc == 0 && r.out == "no recovery entries\n");

  RecoveryStorage storage(dir / "rec");
  RecoveryMetadata md;
  Error e;
  assert(storage.save_recovery("unnamed-1", "draft text", std::nullopt, std::string("draft"), 1u, md, e));

  r = run_cli(dir, {"recover", "list"});
  assert(r.rc == 0);
  assert(r.out.find("unnamed-1") != std::string::npos);
  assert(r.out.find("full") != std::string::npos);
  assert(r.out.find("draft") != std::string::npos);

  r = run_cli(dir, {"recover", "show", "unnamed-1"});
  assert(r.rc == 0 && r.out == "draft text");
  r = run_cli(dir, {"recover", "show", "nope"});
  assert(r.rc == 1);

  auto dst = dir / "restored.txt";
  r = run_cli(dir, {"recover", "restore", "unnamed-1", dst.string()});
  assert(r.rc == 0);
  assert(read_bytes(dst) == "draft text");

  // content without metadata is an orphan
  write_bytes(storage.content_path("stray"), "x");
  r = run_cli(dir, {"recover", "cleanup"});
  assert(r.rc == 0 && r.out == "removed 1 orphaned recovery entries\n");
  assert(!std::filesystem::exists(storage.content_path("stray")));
  assert(std::filesystem::exists(storage.content_path("unnamed-1")));

  r = run_cli(dir, {"recover", "cleanup", "--all"});
  assert(r.rc == 0 && r.out == "removed 2 file(s)\n");
  r = run_cli(dir, {"recover", "list"});
  assert(r.out == "no recovery entries\n");
}

static void test_session_check() {
  TempDir dir;
  Run r = run_cli(dir, {"session", "check"});
  assert(r.rc == 0 && r.out == "no session lock\n");

  RecoveryStorage storage(dir / "rec");
  SessionInfo info;
  Error e;
  assert(storage.create_session_lock(info, e));
  r = run_cli(dir, {"session", "check"});
  assert(r.rc == 0);
  assert(r.out.find(": running") != std::string::npos);

  // above any pid_max, so never a live process
  write_bytes(storage.session_lock_path(), "{\"pid\": 999999999, \"started_at\": 1700000000}");
  r = run_cli(dir, {"session", "check"});
  assert(r.rc == 3);
  assert(r.out.find("session pid 999999999") != std::string::npos);
  assert(r.out.find(": crashed") != std::string::npos);
}

int main() {
  test_usage();
  test_edit_commands();
  test_loopback_routes_through_agent();
  test_recover_commands();
  test_session_check();
  return 0;
}
