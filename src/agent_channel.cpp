#include "agent_channel.hpp"
#include "json_util.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

ResponseStream::ResponseStream(uint64_t id, std::shared_ptr<RequestState> state, std::shared_ptr<PendingTable> table,
                               std::chrono::milliseconds timeout)
    : id_(id), state_(std::move(state)), table_(std::move(table)), result_(state_->result.get_future()),
      timeout_(timeout) {}

ResponseStream::~ResponseStream() {
  state_->receiver_alive.store(false);
  state_->data.drop_receiver();
  table_->erase(id_);
}

StreamStatus ResponseStream::next(Json::Value& out, Error& err) {
  PopStatus st;
  if (timeout_.count() > 0) st = state_->data.pop_for(out, timeout_);
  else st = state_->data.pop(out);
  if (st == PopStatus::Item) return StreamStatus::Data;
  if (st == PopStatus::Timeout) {
    table_->erase(id_);
    fail(err, ErrorKind::Timeout, "request " + std::to_string(id_) + " timed out");
    return StreamStatus::Failed;
  }
  return StreamStatus::End;
}

bool ResponseStream::finish(Json::Value& result, Error& err) {
  Json::Value chunk;
  for (;;) {
    StreamStatus st = next(chunk, err);
    if (st == StreamStatus::Failed) return false;
    if (st == StreamStatus::End) break;
  }
  if (timeout_.count() > 0 && result_.wait_for(timeout_) != std::future_status::ready) {
    table_->erase(id_);
    return fail(err, ErrorKind::Timeout, "request " + std::to_string(id_) + " timed out");
  }
  RemoteOutcome o = result_.get();
  if (!o.err.ok()) { err = std::move(o.err); return false; }
  result = std::move(o.value);
  return true;
}

AgentChannel::AgentChannel(UniqueFd read_fd, UniqueFd write_fd, ChannelOptions options)
    : options_(options), read_fd_(std::move(read_fd)), write_fd_(std::move(write_fd)),
      outgoing_(PE_WRITER_QUEUE_CAPACITY) {
  int p[2];
  if (::pipe2(p, O_CLOEXEC) == 0) {
    wake_r_.reset(p[0]);
    wake_w_.reset(p[1]);
  } else {
    log_warn("agent channel: wake pipe unavailable, shutdown waits for EOF");
  }
  writer_ = std::thread([this]{ writer_loop(); });
  reader_ = std::thread([this]{ reader_loop(); });
}

AgentChannel::~AgentChannel() {
  shutdown();
  if (writer_.joinable()) writer_.join();
  if (reader_.joinable()) reader_.join();
}

void AgentChannel::shutdown() {
  if (stopping_.exchange(true)) return;
  outgoing_.close();
  if (wake_w_.valid()) {
    char b = 1;
    (void)write_fully(wake_w_.get(), &b, 1);
  }
}

bool AgentChannel::on_reader_thread() const {
  return std::this_thread::get_id() == reader_.get_id();
}

size_t AgentChannel::pending_count() const {
  std::lock_guard<std::mutex> lk(pending_->mu);
  return pending_->requests.size();
}

void AgentChannel::writer_loop() {
  std::string line;
  while (outgoing_.pop(line) == PopStatus::Item) {
    if (int e = send_fully(write_fd_.get(), line.data(), line.size()); e != 0) {
      log_debug(std::string("agent channel: write failed: ") + std::strerror(e));
      connected_.store(false);
      break;
    }
  }
  outgoing_.drop_receiver();
  ::shutdown(write_fd_.get(), SHUT_WR);
}

void AgentChannel::reader_loop() {
  std::string buf;
  char chunk[64 * 1024];
  for (;;) {
    pollfd fds[2];
    fds[0] = {read_fd_.get(), POLLIN, 0};
    fds[1] = {wake_r_.get(), POLLIN, 0};
    int nfds = wake_r_.valid() ? 2 : 1;
    int pr = ::poll(fds, static_cast<nfds_t>(nfds), -1);
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (nfds == 2 && (fds[1].revents & POLLIN)) break;
    if (fds[0].revents == 0) continue;
    ssize_t n = ::read(read_fd_.get(), chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
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
      Json::Value resp;
      Error perr;
      if (!json_parse(line, resp, perr) || !resp.isObject() || !resp["id"].isUInt64()) {
        log_debug("agent channel: ignoring malformed response line");
        continue;
      }
      handle_response(resp);
    }
    buf.erase(0, start);
  }
  connected_.store(false);
  outgoing_.close();
  fail_all_pending();
}

void AgentChannel::handle_response(const Json::Value& resp) {
  uint64_t id = resp["id"].asUInt64();
  if (resp.isMember("data")) {
    std::shared_ptr<RequestState> st;
    {
      std::lock_guard<std::mutex> lk(pending_->mu);
      auto it = pending_->requests.find(id);
      if (it != pending_->requests.end()) st = it->second;
    }
    if (st && !st->data.push(resp["data"])) {
      log_warn("request " + std::to_string(id) + ": data receiver dropped mid-stream");
      pending_->erase(id);
      return;
    }
  }
  if (!resp.isMember("result") && !resp.isMember("error")) return;
  std::shared_ptr<RequestState> st;
  {
    std::lock_guard<std::mutex> lk(pending_->mu);
    auto it = pending_->requests.find(id);
    if (it == pending_->requests.end()) {
      log_debug("request " + std::to_string(id) + ": late response after its receiver left");
      return;
    }
    st = std::move(it->second);
    pending_->requests.erase(it);
  }
  RemoteOutcome o;
  if (resp.isMember("result")) {
    o.value = resp["result"];
  } else {
    const Json::Value& e = resp["error"];
    o.err.kind = ErrorKind::Remote;
    o.err.message = e.isString() ? e.asString() : json_to_compact(e);
  }
  st->data.close();
  if (!st->receiver_alive.load()) log_warn("request " + std::to_string(id) + ": result receiver dropped");
  st->result.set_value(std::move(o));
}

void AgentChannel::fail_all_pending() {
  std::map<uint64_t, std::shared_ptr<RequestState>> drained;
  {
    std::lock_guard<std::mutex> lk(pending_->mu);
    pending_->closed = true;
    drained.swap(pending_->requests);
  }
  for (auto& [id, st] : drained) {
    st->data.close();
    if (!st->receiver_alive.load()) {
      log_warn("request " + std::to_string(id) + ": receiver dropped during disconnect cleanup");
    }
    RemoteOutcome o;
    o.err.kind = ErrorKind::ChannelClosed;
    o.err.message = "connection closed";
    st->result.set_value(std::move(o));
  }
  if (!drained.empty()) log_info("agent channel closed; resolved " + std::to_string(drained.size()) + " pending request(s)");
}

std::unique_ptr<ResponseStream> AgentChannel::request_streaming(const std::string& method, const Json::Value& params,
                                                                Error& err) {
  if (!is_connected()) { fail(err, ErrorKind::ChannelClosed, "connection closed"); return nullptr; }
  uint64_t id = next_id_.fetch_add(1);
  auto st = std::make_shared<RequestState>(options_.data_channel_capacity);
  {
    std::lock_guard<std::mutex> lk(pending_->mu);
    if (pending_->closed) { fail(err, ErrorKind::ChannelClosed, "connection closed"); return nullptr; }
    pending_->requests.emplace(id, st);
  }
  auto stream = std::make_unique<ResponseStream>(id, st, pending_, options_.request_timeout);
  if (!outgoing_.push(encode_request(id, method, params))) {
    pending_->erase(id);
    fail(err, ErrorKind::ChannelClosed, "connection closed");
    return nullptr;
  }
  return stream;
}

bool AgentChannel::request_blocking(const std::string& method, const Json::Value& params, Json::Value& result,
                                    Error& err) {
  if (on_reader_thread()) return fail(err, ErrorKind::WouldDeadlock, "blocking request from the channel reader thread");
  auto stream = request_streaming(method, params, err);
  if (!stream) return false;
  return stream->finish(result, err);
}

bool AgentChannel::request_with_data_blocking(const std::string& method, const Json::Value& params,
                                              std::vector<Json::Value>& data, Json::Value& result, Error& err) {
  if (on_reader_thread()) return fail(err, ErrorKind::WouldDeadlock, "blocking request from the channel reader thread");
  data.clear();
  auto stream = request_streaming(method, params, err);
  if (!stream) return false;
  Json::Value chunk;
  for (;;) {
    StreamStatus st = stream->next(chunk, err);
    if (st == StreamStatus::Failed) return false;
    if (st == StreamStatus::End) break;
    data.push_back(std::move(chunk));
    if (options_.recv_delay.count() > 0) std::this_thread::sleep_for(options_.recv_delay);
  }
  return stream->finish(result, err);
}

std::future<ChannelResult> AgentChannel::request(const std::string& method, const Json::Value& params) {
  return std::async(std::launch::async, [this, method, params]{
    ChannelResult r;
    request_blocking(method, params, r.value, r.err);
    return r;
  });
}

std::future<ChannelDataResult> AgentChannel::request_with_data(const std::string& method, const Json::Value& params) {
  return std::async(std::launch::async, [this, method, params]{
    ChannelDataResult r;
    request_with_data_blocking(method, params, r.data, r.value, r.err);
    return r;
  });
}

bool AgentChannel::cancel(uint64_t request_id, Error& err) {
  Json::Value ignored;
  return request_blocking("cancel", cancel_params(request_id), ignored, err);
}
