#include "cli.hpp"
#include "agent_server.hpp"
#include "log.hpp"
#include "recovery_manager.hpp"
#include "recovery_storage.hpp"
#include "remote_filesystem.hpp"
#include "local_filesystem.hpp"
#include "text_buffer.hpp"
#include <algorithm>
#include <ctime>
#include <ostream>
#include <stdexcept>

static bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty()) return false;
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(s, &used, 10);
    if (used != s.size()) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static std::string format_time(uint64_t secs) {
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
  return buf;
}

Cli::Cli(Config cfg, std::ostream& out, std::ostream& err) : cfg_(std::move(cfg)), out_(out), err_(err) {
  register_commands();
}

Cli::~Cli() = default;

int Cli::report(const std::string& what, const Error& e) {
  err_ << "pedit: " << what << ": " << e.to_string() << "\n";
  return 1;
}

int Cli::usage() {
  err_ << "usage: pedit [--loopback] <command> [args]\n";
  for (const auto& line : registry_.usage_lines()) err_ << "  " << line << "\n";
  return 2;
}

bool Cli::setup_filesystem(bool loopback) {
  if (!loopback) {
    fs_ = std::make_shared<LocalFileSystem>();
    return true;
  }
  ChannelOptions opts;
  opts.data_channel_capacity = cfg_.data_channel_capacity;
  Error e;
  agent_ = spawn_local_agent(opts, e);
  if (!agent_) {
    report("loopback agent", e);
    return false;
  }
  fs_ = std::make_shared<RemoteFileSystem>(agent_->channel(), "loopback");
  log_debug("file I/O routed through loopback agent");
  return true;
}

int Cli::run(const std::vector<std::string>& args) {
  std::vector<std::string> words;
  bool loopback = false;
  for (const auto& a : args) {
    if (a == "--loopback") loopback = true;
    else if (a == "-h" || a == "--help") return usage();
    else words.push_back(a);
  }
  if (words.empty()) return usage();
  if (!setup_filesystem(loopback)) return 1;
  int rc = 0;
  if (!registry_.execute(words, rc)) {
    err_ << "pedit: unknown command: " << words[0] << "\n";
    return usage();
  }
  return rc;
}

void Cli::register_commands() {
  registry_.register_command("cat", "<file>", [this](const std::vector<std::string>& args){
    if (args.size() != 1) return usage();
    TextBuffer b;
    Error e;
    if (!TextBuffer::load_from_file(args[0], cfg_.large_file_threshold, fs_, b, e, cfg_.load_chunk_size)) {
      return report(args[0], e);
    }
    std::string window;
    for (uint64_t pos = 0; pos < b.total_bytes(); pos += window.size()) {
      uint64_t n = std::min<uint64_t>(cfg_.load_chunk_size, b.total_bytes() - pos);
      if (!b.read_range(pos, n, window, e)) return report(args[0], e);
      out_ << window;
    }
    return 0;
  });

  registry_.register_command("insert", "<file> <pos> <text>", [this](const std::vector<std::string>& args){
    uint64_t pos = 0;
    if (args.size() != 3 || !parse_u64(args[1], pos)) return usage();
    TextBuffer b;
    Error e;
    if (!TextBuffer::load_from_file(args[0], cfg_.large_file_threshold, fs_, b, e, cfg_.load_chunk_size)) {
      return report(args[0], e);
    }
    if (pos > b.total_bytes()) {
      err_ << "pedit: position " << pos << " beyond end of file (" << b.total_bytes() << " bytes)\n";
      return 1;
    }
    b.insert_bytes(pos, args[2]);
    if (!b.save_to_file(args[0], e)) return report(args[0], e);
    return 0;
  });

  registry_.register_command("delete", "<file> <pos> <len>", [this](const std::vector<std::string>& args){
    uint64_t pos = 0, len = 0;
    if (args.size() != 3 || !parse_u64(args[1], pos) || !parse_u64(args[2], len)) return usage();
    TextBuffer b;
    Error e;
    if (!TextBuffer::load_from_file(args[0], cfg_.large_file_threshold, fs_, b, e, cfg_.load_chunk_size)) {
      return report(args[0], e);
    }
    if (pos > b.total_bytes() || len > b.total_bytes() - pos) {
      err_ << "pedit: range " << pos << "+" << len << " beyond end of file (" << b.total_bytes() << " bytes)\n";
      return 1;
    }
    b.delete_bytes(pos, len);
    if (!b.save_to_file(args[0], e)) return report(args[0], e);
    return 0;
  });

  registry_.register_command("recover list", "", [this](const std::vector<std::string>&){
    RecoveryStorage storage(cfg_.recovery_dir);
    std::vector<RecoveryEntry> entries;
    Error e;
    if (!storage.list_entries(entries, e)) return report("recover list", e);
    if (entries.empty()) {
      out_ << "no recovery entries\n";
      return 0;
    }
    for (const auto& en : entries) {
      const auto& md = en.metadata;
      out_ << en.id << "  " << (md.format == RecoveryFormat::Chunked ? "chunked" : "full") << "  "
           << format_time(md.updated_at) << "  " << md.original_path.value_or(md.buffer_name.value_or("[No Name]"))
           << "\n";
    }
    return 0;
  });

  registry_.register_command("recover show", "<id>", [this](const std::vector<std::string>& args){
    if (args.size() != 1) return usage();
    RecoveryStorage storage(cfg_.recovery_dir);
    RecoveryManager mgr(storage, cfg_.chunked_recovery_threshold);
    std::string content;
    Error e;
    if (!mgr.recover(args[0], content, e)) return report(args[0], e);
    out_ << content;
    return 0;
  });

  registry_.register_command("recover restore", "<id> <out>", [this](const std::vector<std::string>& args){
    if (args.size() != 2) return usage();
    RecoveryStorage storage(cfg_.recovery_dir);
    RecoveryManager mgr(storage, cfg_.chunked_recovery_threshold);
    Error e;
    if (!mgr.restore_to(args[0], args[1], e)) return report(args[0], e);
    out_ << "restored " << args[0] << " to " << args[1] << "\n";
    return 0;
  });

  registry_.register_command("recover cleanup", "[--all]", [this](const std::vector<std::string>& args){
    bool all = !args.empty() && args[0] == "--all";
    if (!args.empty() && !all) return usage();
    RecoveryStorage storage(cfg_.recovery_dir);
    size_t cleaned = 0;
    Error e;
    bool ok = all ? storage.cleanup_all(cleaned, e) : storage.cleanup_orphans(cleaned, e);
    if (!ok) return report("recover cleanup", e);
    out_ << "removed " << cleaned << (all ? " file(s)\n" : " orphaned recovery entries\n");
    return 0;
  });

  registry_.register_command("session check", "", [this](const std::vector<std::string>&){
    RecoveryStorage storage(cfg_.recovery_dir);
    std::optional<SessionInfo> info;
    Error e;
    if (!storage.read_session_lock(info, e)) return report("session check", e);
    if (!info) {
      out_ << "no session lock\n";
      return 0;
    }
    bool running = info->is_running();
    out_ << "session pid " << info->pid << " started " << format_time(info->started_at)
         << (running ? ": running\n" : ": crashed\n");
    return running ? 0 : 3;
  });
}
