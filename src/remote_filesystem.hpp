#pragma once
/*
 * RemoteFileSystem
 *
 * Purpose: IFileSystem backed by a file agent reached through AgentChannel.
 * Note: each operation is one request; atomicity of writes is the agent's.
 *       Every channel or agent failure is reported as ErrorKind::Io.
 */
#include <memory>
#include <optional>
#include <string>
#include "agent_channel.hpp"
#include "ifilesystem.hpp"

class RemoteFileSystem : public IFileSystem {
public:
  RemoteFileSystem(std::shared_ptr<AgentChannel> channel, std::string connection_info);

  bool read_file(const std::filesystem::path& path, std::string& out, Error& err) override;
  bool read_range(const std::filesystem::path& path, uint64_t offset, uint64_t len,
                  std::string& out, Error& err) override;
  bool write_file(const std::filesystem::path& path, const std::string& data, Error& err) override;
  bool write_patched(const std::filesystem::path& src, const std::filesystem::path& dst,
                     const std::vector<WriteOp>& ops, Error& err) override;
  bool set_file_length(const std::filesystem::path& path, uint64_t len, Error& err) override;
  std::unique_ptr<IFileWriter> open_file_for_append(const std::filesystem::path& path, Error& err) override;
  bool metadata(const std::filesystem::path& path, FileMetadata& out, Error& err) override;
  bool is_dir(const std::filesystem::path& path, bool& out, Error& err) override;
  bool exists(const std::filesystem::path& path, bool& out, Error& err) override;
  bool read_dir(const std::filesystem::path& path, std::vector<DirEntry>& out, Error& err) override;
  bool remove_file(const std::filesystem::path& path, Error& err) override;
  bool create_dir_all(const std::filesystem::path& path, Error& err) override;
  std::string remote_connection_info() const override { return connection_info_; }

  AgentChannel& channel() { return *channel_; }

private:
  bool call(const char* method, const Json::Value& params, Json::Value& result, Error& err);
  bool stream_read(const Json::Value& params, std::string& out, Error& err);
  /* out stays empty when the agent reports the path missing */
  bool stat_if_present(const std::filesystem::path& path, std::optional<FileMetadata>& out, Error& err);

  std::shared_ptr<AgentChannel> channel_;
  std::string connection_info_;
};
