#include "agent_channel.hpp"
#include "json_util.hpp"
#include "protocol.hpp"
#include <sys/socket.h>
#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/* scripted far end of the transport */
struct Peer {
  UniqueFd fd;
  std::string buf;

  bool read_request(Json::Value& out) {
    for (;;) {
      size_t nl = buf.find('\n');
      if (nl != std::string::npos) {
        std::string line = buf.substr(0, nl);
        buf.erase(0, nl + 1);
        Error e;
        return json_parse(line, out, e);
      }
      char tmp[4096];
      ssize_t n = ::read(fd.get(), tmp, sizeof(tmp));
      if (n <= 0) return false;
      buf.append(tmp, static_cast<size_t>(n));
    }
  }
  void send(const std::string& line) {
    int rc = write_fully(fd.get(), line.data(), line.size());
    assert(rc == 0);
  }
};

static std::shared_ptr<AgentChannel> connect(Peer& peer, ChannelOptions opts = {}) {
  int sv[2];
  int rc = ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv);
  assert(rc == 0);
  peer.fd.reset(sv[1]);
  UniqueFd r(sv[0]);
  UniqueFd w(::dup(sv[0]));
  return std::make_shared<AgentChannel>(std::move(r), std::move(w), opts);
}

static Json::Value data_of(const std::string& s) {
  Json::Value v(Json::objectValue);
  v["n"] = s;
  return v;
}

static void test_out_of_order_responses() {
  Peer peer;
  auto ch = connect(peer);
  auto f1 = ch->request("stat", path_params("/a"));
  Json::Value r1;
  assert(peer.read_request(r1));
  auto f2 = ch->request("stat", path_params("/b"));
  Json::Value r2;
  assert(peer.read_request(r2));
  assert(r1["method"].asString() == "stat");
  assert(r1["id"].asUInt64() != r2["id"].asUInt64());

  Json::Value res(Json::objectValue);
  res["which"] = "b";
  peer.send(encode_result(r2["id"].asUInt64(), res));
  res["which"] = "a";
  peer.send(encode_result(r1["id"].asUInt64(), res));

  ChannelResult a = f1.get();
  ChannelResult b = f2.get();
  assert(a.err.ok() && a.value["which"].asString() == "a");
  assert(b.err.ok() && b.value["which"].asString() == "b");
  assert(ch->pending_count() == 0);
}

static void test_streamed_data_then_result() {
  Peer peer;
  auto ch = connect(peer);
  auto f = ch->request_with_data("read", read_all_params("/x"));
  Json::Value req;
  assert(peer.read_request(req));
  uint64_t id = req["id"].asUInt64();
  peer.send(encode_data(id, data_of("one")));
  peer.send(encode_data(id, data_of("two")));
  Json::Value done(Json::objectValue);
  done["size"] = 6;
  peer.send(encode_result(id, done));
  ChannelDataResult r = f.get();
  assert(r.err.ok());
  assert(r.data.size() == 2);
  assert(r.data[0]["n"].asString() == "one" && r.data[1]["n"].asString() == "two");
  assert(r.value["size"].asUInt64() == 6);
}

static void test_remote_error() {
  Peer peer;
  auto ch = connect(peer);
  auto f = ch->request("rm", path_params("/nope"));
  Json::Value req;
  assert(peer.read_request(req));
  peer.send(encode_error(req["id"].asUInt64(), "not found: /nope"));
  ChannelResult r = f.get();
  assert(r.err.kind == ErrorKind::Remote);
  assert(r.err.message == "not found: /nope");
}

static void test_disconnect_resolves_everything() {
  Peer peer;
  auto ch = connect(peer);
  std::vector<std::future<ChannelResult>> futures;
  for (int i = 0; i < 5; ++i) futures.push_back(ch->request("stat", path_params("/p")));
  auto stream_f = ch->request_with_data("read", read_all_params("/big"));
  Json::Value req;
  for (int i = 0; i < 6; ++i) assert(peer.read_request(req));
  peer.send(encode_data(req["id"].asUInt64(), data_of("partial")));
  peer.fd.reset();

  for (auto& f : futures) {
    ChannelResult r = f.get();
    assert(r.err.kind == ErrorKind::ChannelClosed);
  }
  ChannelDataResult sr = stream_f.get();
  assert(sr.err.kind == ErrorKind::ChannelClosed);
  assert(ch->pending_count() == 0);

  for (int i = 0; i < 50 && ch->is_connected(); ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  assert(!ch->is_connected());
  Json::Value ignored;
  Error e;
  assert(!ch->request_blocking("stat", path_params("/late"), ignored, e));
  assert(e.kind == ErrorKind::ChannelClosed);
}

static void test_timeout() {
  Peer peer;
  ChannelOptions opts;
  opts.request_timeout = std::chrono::milliseconds(50);
  auto ch = connect(peer, opts);
  Json::Value result;
  Error e;
  assert(!ch->request_blocking("stat", path_params("/slow"), result, e));
  assert(e.kind == ErrorKind::Timeout);
  // a timed-out request leaves the table at once
  assert(ch->pending_count() == 0);

  // its late answer is ignored and the channel keeps serving
  Json::Value req;
  assert(peer.read_request(req));
  peer.send(encode_result(req["id"].asUInt64(), Json::Value(Json::objectValue)));
  auto f = ch->request("stat", path_params("/fast"));
  assert(peer.read_request(req));
  assert(req["params"]["path"].asString() == "/fast");
  Json::Value answer(Json::objectValue);
  answer["size"] = 3;
  peer.send(encode_result(req["id"].asUInt64(), answer));
  ChannelResult r = f.get();
  assert(r.err.ok() && r.value["size"].asUInt64() == 3);
  assert(ch->pending_count() == 0);
}

static void test_dropped_stream_does_not_stall_channel() {
  Peer peer;
  ChannelOptions opts;
  opts.data_channel_capacity = 1;
  auto ch = connect(peer, opts);
  Error e;
  {
    auto stream = ch->request_streaming("read", read_all_params("/abandoned"), e);
    assert(stream);
    Json::Value req;
    assert(peer.read_request(req));
    peer.send(encode_data(req["id"].asUInt64(), data_of("1")));
    Json::Value chunk;
    assert(stream->next(chunk, e) == StreamStatus::Data);
  }
  // the reader thread must not block on the abandoned stream's full queue
  auto f = ch->request("stat", path_params("/next"));
  Json::Value req;
  assert(peer.read_request(req));
  uint64_t first = req["id"].asUInt64() - 1;
  for (int i = 0; i < 4; ++i) peer.send(encode_data(first, data_of("late")));
  peer.send(encode_result(req["id"].asUInt64(), Json::Value(Json::objectValue)));
  ChannelResult r = f.get();
  assert(r.err.ok());
  assert(ch->pending_count() == 0);
}

static void test_cancel_is_a_request() {
  Peer peer;
  auto ch = connect(peer);
  std::thread agent([&]{
    Json::Value req;
    assert(peer.read_request(req));
    assert(req["method"].asString() == "cancel");
    assert(req["params"]["id"].asUInt64() == 77);
    peer.send(encode_result(req["id"].asUInt64(), Json::Value(Json::objectValue)));
  });
  Error e;
  assert(ch->cancel(77, e));
  agent.join();
}

int main() {
  test_out_of_order_responses();
  test_streamed_data_then_result();
  test_remote_error();
  test_disconnect_resolves_everything();
  test_timeout();
  test_dropped_stream_does_not_stall_channel();
  test_cancel_is_a_request();
  return 0;
}
