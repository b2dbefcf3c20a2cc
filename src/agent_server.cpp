#include "agent_server.hpp"
#include "config.hpp"
#include "json_util.hpp"
#include "local_filesystem.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "codec.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>

AgentServer::AgentServer(UniqueFd fd, std::shared_ptr<IFileSystem> fs) : fd_(std::move(fd)), fs_(std::move(fs)) {}

bool AgentServer::send_line(const std::string& line) {
  return send_fully(fd_.get(), line.data(), line.size()) == 0;
}

bool AgentServer::send_error(uint64_t id, const Error& err) {
  std::string msg = err.message;
  if (err.kind == ErrorKind::NotFound) msg = std::string(PE_NOT_FOUND_PREFIX) + " " + msg;
  log_debug("agent: request " + std::to_string(id) + " failed: " + msg);
  return send_line(encode_error(id, msg));
}

void AgentServer::serve() {
  std::string buf;
  char chunk[64 * 1024];
  for (;;) {
    ssize_t n = ::read(fd_.get(), chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;
    buf.append(chunk, static_cast<size_t>(n));
    size_t start = 0;
    for (;;) {
      size_t nl = buf.find('\n', start);
      if (nl == std::string::npos) break;
      std::string line = buf.substr(start, nl - start);
      start = nl + 1;
      if (line.empty()) continue;
      Json::Value req;
      Error perr;
      if (!json_parse(line, req, perr) || !req["id"].isUInt64() || !req["method"].isString()) {
        log_warn("agent: dropping malformed request line");
        continue;
      }
      served_++;
      uint64_t id = req["id"].asUInt64();
      Json::Value params = req["params"].isObject() ? req["params"] : Json::Value(Json::objectValue);
      bool alive = true;
      try {
        alive = dispatch(id, req["method"].asString(), params);
      } catch (const Json::Exception& e) {
        Error err;
        fail(err, ErrorKind::InvalidData, std::string("malformed params: ") + e.what());
        alive = send_error(id, err);
      }
      if (!alive) return;
    }
    buf.erase(0, start);
  }
}

bool AgentServer::handle_read(uint64_t id, const Json::Value& params) {
  std::filesystem::path path = params["path"].asString();
  Error err;
  uint64_t off = params.get("off", 0).asUInt64();
  uint64_t len = 0;
  if (params.isMember("len")) {
    len = params["len"].asUInt64();
  } else {
    FileMetadata md;
    if (!fs_->metadata(path, md, err)) return send_error(id, err);
    if (off > md.size) off = md.size;
    len = md.size - off;
  }
  uint64_t sent = 0;
  std::string bytes;
  while (sent < len) {
    uint64_t n = std::min<uint64_t>(PE_STREAM_CHUNK_SIZE, len - sent);
    if (!fs_->read_range(path, off + sent, n, bytes, err)) return send_error(id, err);
    if (!send_line(encode_data(id, data_chunk(bytes)))) return false;
    sent += n;
  }
  Json::Value result(Json::objectValue);
  result["size"] = Json::UInt64(sent);
  return send_line(encode_result(id, result));
}

bool AgentServer::dispatch(uint64_t id, const std::string& method, const Json::Value& params) {
  if (method == "read") return handle_read(id, params);

  Error err;
  Json::Value result(Json::objectValue);
  std::filesystem::path path = params.get("path", "").asString();
  bool ok = false;
  if (method == "write" || method == "append") {
    std::string data;
    if (!params["data"].isString() || !base64_decode(params["data"].asString(), data)) {
      fail(err, ErrorKind::InvalidData, "malformed data payload");
    } else if (method == "write") {
      ok = fs_->write_file(path, data, err);
    } else {
      auto w = fs_->open_file_for_append(path, err);
      ok = w && w->write_all(data, err) && w->sync_all(err);
    }
  } else if (method == "patch") {
    std::vector<WriteOp> ops;
    if (decode_write_ops(params["ops"], ops, err)) {
      ok = fs_->write_patched(params["src"].asString(), params["dst"].asString(), ops, err);
    }
  } else if (method == "truncate") {
    ok = fs_->set_file_length(path, params.get("len", 0).asUInt64(), err);
  } else if (method == "stat") {
    FileMetadata md;
    ok = fs_->metadata(path, md, err);
    if (ok) result = metadata_to_json(md);
  } else if (method == "ls") {
    std::vector<DirEntry> entries;
    ok = fs_->read_dir(path, entries, err);
    if (ok) {
      Json::Value arr(Json::arrayValue);
      for (const auto& e : entries) arr.append(dir_entry_to_json(e));
      result["entries"] = arr;
    }
  } else if (method == "mkdir") {
    ok = fs_->create_dir_all(path, err);
  } else if (method == "rm") {
    ok = fs_->remove_file(path, err);
  } else if (method == "cancel") {
    // requests are served sequentially; nothing is in flight here
    ok = true;
  } else {
    fail(err, ErrorKind::InvalidData, "unknown method: " + method);
  }
  if (!ok) return send_error(id, err);
  return send_line(encode_result(id, result));
}

void AgentServer::stop() { ::shutdown(fd_.get(), SHUT_RDWR); }

LoopbackAgent::LoopbackAgent(std::shared_ptr<AgentChannel> channel, std::shared_ptr<AgentServer> server)
    : channel_(std::move(channel)), server_(std::move(server)) {
  thread_ = std::thread([srv = server_]{ srv->serve(); });
}

LoopbackAgent::~LoopbackAgent() {
  stop();
  if (thread_.joinable()) thread_.join();
  channel_->shutdown();
}

void LoopbackAgent::stop() { server_->stop(); }

std::unique_ptr<LoopbackAgent> spawn_local_agent(ChannelOptions options, Error& err) {
  int sv[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
    fail_errno(err, "socketpair failed", errno);
    return nullptr;
  }
  UniqueFd client(sv[0]);
  UniqueFd server(sv[1]);
  UniqueFd client_write(::dup(client.get()));
  if (!client_write.valid()) {
    fail_errno(err, "dup failed", errno);
    return nullptr;
  }
  auto channel = std::make_shared<AgentChannel>(std::move(client), std::move(client_write), options);
  auto srv = std::make_shared<AgentServer>(std::move(server), std::make_shared<LocalFileSystem>());
  return std::make_unique<LoopbackAgent>(std::move(channel), std::move(srv));
}
