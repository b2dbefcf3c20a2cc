#pragma once
/*
 * AgentServer
 *
 * Purpose: serve the file-agent protocol over a stream fd from a local
 *          filesystem; requests are handled one at a time in arrival order.
 * LoopbackAgent: AgentServer on one end of a socketpair and an
 *          AgentChannel on the other, in one process.
 */
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <json/json.h>
#include "agent_channel.hpp"
#include "ifilesystem.hpp"
#include "posix_fd.hpp"

class AgentServer {
public:
  AgentServer(UniqueFd fd, std::shared_ptr<IFileSystem> fs);
  /* runs until EOF or a write failure */
  void serve();
  /* unblocks serve() from another thread */
  void stop();
  uint64_t requests_served() const { return served_; }

private:
  bool dispatch(uint64_t id, const std::string& method, const Json::Value& params);
  bool handle_read(uint64_t id, const Json::Value& params);
  bool send_line(const std::string& line);
  bool send_error(uint64_t id, const Error& err);

  UniqueFd fd_;
  std::shared_ptr<IFileSystem> fs_;
  std::atomic<uint64_t> served_{0};
};

class LoopbackAgent {
public:
  LoopbackAgent(std::shared_ptr<AgentChannel> channel, std::shared_ptr<AgentServer> server);
  ~LoopbackAgent();
  LoopbackAgent(const LoopbackAgent&) = delete;
  LoopbackAgent& operator=(const LoopbackAgent&) = delete;

  std::shared_ptr<AgentChannel> channel() const { return channel_; }
  /* drops the agent side; the channel observes a disconnect */
  void stop();

private:
  std::shared_ptr<AgentChannel> channel_;
  std::shared_ptr<AgentServer> server_;
  std::thread thread_;
};

std::unique_ptr<LoopbackAgent> spawn_local_agent(ChannelOptions options, Error& err);
