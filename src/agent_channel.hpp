#pragma once
/*
 * AgentChannel
 *
 * Purpose: multiplex requests to a file agent over one byte stream.
 * Design:
 *   - writer thread drains a bounded queue of outgoing lines
 *   - reader thread parses response lines and routes them by id through a
 *     pending table; the table mutex is held only for insert/lookup/remove
 *   - streamed "data" goes into a per-request BoundedQueue; a full queue
 *     blocks the reader (backpressure), it never drops a chunk
 *   - on EOF/read error every pending request resolves once with
 *     ChannelClosed "connection closed"
 * Note: blocking calls made from the reader thread fail with WouldDeadlock.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <json/json.h>
#include "bounded_queue.hpp"
#include "config.hpp"
#include "error.hpp"
#include "posix_fd.hpp"

struct ChannelOptions {
  size_t data_channel_capacity = PE_DATA_CHANNEL_CAPACITY;
  /* consumer pause after each collected chunk; zero outside stress tests */
  std::chrono::microseconds recv_delay{0};
  /* zero waits forever */
  std::chrono::milliseconds request_timeout{0};
};

struct ChannelResult {
  Error err;
  Json::Value value;
};

struct ChannelDataResult {
  Error err;
  std::vector<Json::Value> data;
  Json::Value value;
};

struct RemoteOutcome {
  Error err;
  Json::Value value;
};

struct RequestState {
  explicit RequestState(size_t capacity) : data(capacity) {}
  BoundedQueue<Json::Value> data;
  std::promise<RemoteOutcome> result;
  std::atomic<bool> receiver_alive{true};
};

/* in-flight requests by id, shared by the channel and its streams */
struct PendingTable {
  std::mutex mu;
  std::map<uint64_t, std::shared_ptr<RequestState>> requests;
  bool closed = false;

  void erase(uint64_t id) {
    std::lock_guard<std::mutex> lk(mu);
    requests.erase(id);
  }
};

enum class StreamStatus { Data, End, Failed };

/* caller side of one in-flight request */
class ResponseStream {
public:
  ResponseStream(uint64_t id, std::shared_ptr<RequestState> state, std::shared_ptr<PendingTable> table,
                 std::chrono::milliseconds timeout);
  /* leaves the pending table; a late response is then ignored */
  ~ResponseStream();
  ResponseStream(const ResponseStream&) = delete;
  ResponseStream& operator=(const ResponseStream&) = delete;

  uint64_t id() const { return id_; }
  /* next streamed chunk; End once the terminal response arrived */
  StreamStatus next(Json::Value& out, Error& err);
  /* discards remaining chunks, then waits for the terminal response */
  bool finish(Json::Value& result, Error& err);

private:
  uint64_t id_;
  std::shared_ptr<RequestState> state_;
  std::shared_ptr<PendingTable> table_;
  std::future<RemoteOutcome> result_;
  std::chrono::milliseconds timeout_;
};

class AgentChannel {
public:
  /* takes ownership of both fds; they may refer to the same socket */
  AgentChannel(UniqueFd read_fd, UniqueFd write_fd, ChannelOptions options = {});
  ~AgentChannel();
  AgentChannel(const AgentChannel&) = delete;
  AgentChannel& operator=(const AgentChannel&) = delete;

  bool is_connected() const { return connected_.load(); }
  const ChannelOptions& options() const { return options_; }

  std::unique_ptr<ResponseStream> request_streaming(const std::string& method, const Json::Value& params, Error& err);

  std::future<ChannelResult> request(const std::string& method, const Json::Value& params);
  std::future<ChannelDataResult> request_with_data(const std::string& method, const Json::Value& params);
  bool request_blocking(const std::string& method, const Json::Value& params, Json::Value& result, Error& err);
  bool request_with_data_blocking(const std::string& method, const Json::Value& params,
                                  std::vector<Json::Value>& data, Json::Value& result, Error& err);

  /* advisory; the request may still complete */
  bool cancel(uint64_t request_id, Error& err);
  /* stops both threads; pending requests resolve with ChannelClosed */
  void shutdown();

  size_t pending_count() const;
  uint64_t last_request_id() const { return next_id_.load() - 1; }

private:
  void reader_loop();
  void writer_loop();
  void handle_response(const Json::Value& resp);
  void fail_all_pending();
  bool on_reader_thread() const;

  ChannelOptions options_;
  UniqueFd read_fd_;
  UniqueFd write_fd_;
  UniqueFd wake_r_;
  UniqueFd wake_w_;

  std::shared_ptr<PendingTable> pending_ = std::make_shared<PendingTable>();

  BoundedQueue<std::string> outgoing_;
  std::atomic<uint64_t> next_id_{1};
  std::atomic<bool> connected_{true};
  std::atomic<bool> stopping_{false};
  std::thread reader_;
  std::thread writer_;
};
