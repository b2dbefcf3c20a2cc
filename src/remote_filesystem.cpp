#include "remote_filesystem.hpp"
#include "config.hpp"
#include "log.hpp"
#include "protocol.hpp"

namespace {

/* transport and agent failures collapse to Io, keeping the detail */
bool as_io(Error& err) {
  if (err.kind != ErrorKind::Io) {
    err.message = std::string(error_kind_name(err.kind)) + ": " + err.message;
    err.kind = ErrorKind::Io;
  }
  return false;
}

class RemoteFileWriter : public IFileWriter {
public:
  RemoteFileWriter(std::shared_ptr<AgentChannel> channel, std::filesystem::path path)
      : channel_(std::move(channel)), path_(std::move(path)) {}
  ~RemoteFileWriter() override {
    Error err;
    if (!flush(err)) log_warn("remote append to " + path_.string() + " lost on close: " + err.message);
  }
  bool write_all(const std::string& data, Error& err) override {
    pending_ += data;
    if (pending_.size() >= PE_STREAM_CHUNK_SIZE) return flush(err);
    return true;
  }
  bool sync_all(Error& err) override { return flush(err); }

private:
  bool flush(Error& err) {
    if (pending_.empty()) return true;
    Json::Value ignored;
    if (!channel_->request_blocking("append", append_params(path_, pending_), ignored, err)) return as_io(err);
    pending_.clear();
    return true;
  }

  std::shared_ptr<AgentChannel> channel_;
  std::filesystem::path path_;
  std::string pending_;
};

} // namespace

RemoteFileSystem::RemoteFileSystem(std::shared_ptr<AgentChannel> channel, std::string connection_info)
    : channel_(std::move(channel)), connection_info_(std::move(connection_info)) {}

bool RemoteFileSystem::call(const char* method, const Json::Value& params, Json::Value& result, Error& err) {
  if (!channel_->request_blocking(method, params, result, err)) return as_io(err);
  return true;
}

bool RemoteFileSystem::stream_read(const Json::Value& params, std::string& out, Error& err) {
  out.clear();
  std::vector<Json::Value> chunks;
  Json::Value result;
  if (!channel_->request_with_data_blocking("read", params, chunks, result, err)) return as_io(err);
  std::string piece;
  for (const auto& c : chunks) {
    if (!decode_data_chunk(c, piece, err)) return as_io(err);
    out += piece;
  }
  if (!result["size"].isUInt64()) return fail(err, ErrorKind::Io, "read result without size");
  if (result["size"].asUInt64() != out.size()) {
    return fail(err, ErrorKind::Io, "short read: expected " + std::to_string(result["size"].asUInt64()) +
                                   " bytes, received " + std::to_string(out.size()));
  }
  return true;
}

bool RemoteFileSystem::read_file(const std::filesystem::path& path, std::string& out, Error& err) {
  return stream_read(read_all_params(path), out, err);
}

bool RemoteFileSystem::read_range(const std::filesystem::path& path, uint64_t offset, uint64_t len,
                                  std::string& out, Error& err) {
  if (!stream_read(read_params(path, offset, len), out, err)) return false;
  if (out.size() != len) {
    return fail(err, ErrorKind::Io, "short read: expected " + std::to_string(len) +
                                   " bytes, received " + std::to_string(out.size()));
  }
  return true;
}

bool RemoteFileSystem::write_file(const std::filesystem::path& path, const std::string& data, Error& err) {
  Json::Value result;
  return call("write", write_params(path, data), result, err);
}

bool RemoteFileSystem::write_patched(const std::filesystem::path& src, const std::filesystem::path& dst,
                                     const std::vector<WriteOp>& ops, Error& err) {
  Json::Value result;
  return call("patch", patch_params(src, dst, ops), result, err);
}

bool RemoteFileSystem::set_file_length(const std::filesystem::path& path, uint64_t len, Error& err) {
  Json::Value result;
  return call("truncate", truncate_params(path, len), result, err);
}

std::unique_ptr<IFileWriter> RemoteFileSystem::open_file_for_append(const std::filesystem::path& path, Error& err) {
  Json::Value result;
  if (!call("append", append_params(path, std::string()), result, err)) return nullptr;
  return std::make_unique<RemoteFileWriter>(channel_, path);
}

bool RemoteFileSystem::metadata(const std::filesystem::path& path, FileMetadata& out, Error& err) {
  Json::Value result;
  if (!call("stat", path_params(path), result, err)) return false;
  if (!metadata_from_json(result, out, err)) return as_io(err);
  return true;
}

bool RemoteFileSystem::stat_if_present(const std::filesystem::path& path, std::optional<FileMetadata>& out, Error& err) {
  out.reset();
  Json::Value result;
  Error e;
  if (!channel_->request_blocking("stat", path_params(path), result, e)) {
    // only the agent's own not-found answer means absent; transport failures propagate
    if (e.kind == ErrorKind::Remote && e.message.rfind(PE_NOT_FOUND_PREFIX, 0) == 0) return true;
    err = std::move(e);
    return as_io(err);
  }
  FileMetadata md;
  if (!metadata_from_json(result, md, err)) return as_io(err);
  out = md;
  return true;
}

bool RemoteFileSystem::is_dir(const std::filesystem::path& path, bool& out, Error& err) {
  std::optional<FileMetadata> md;
  if (!stat_if_present(path, md, err)) return false;
  out = md && md->is_dir;
  return true;
}

bool RemoteFileSystem::exists(const std::filesystem::path& path, bool& out, Error& err) {
  std::optional<FileMetadata> md;
  if (!stat_if_present(path, md, err)) return false;
  out = md.has_value();
  return true;
}

bool RemoteFileSystem::read_dir(const std::filesystem::path& path, std::vector<DirEntry>& out, Error& err) {
  out.clear();
  Json::Value result;
  if (!call("ls", path_params(path), result, err)) return false;
  const Json::Value& entries = result["entries"];
  if (!entries.isArray()) return fail(err, ErrorKind::Io, "malformed ls result");
  for (const auto& e : entries) {
    DirEntry d;
    if (!dir_entry_from_json(e, d, err)) return as_io(err);
    out.push_back(std::move(d));
  }
  return true;
}

bool RemoteFileSystem::remove_file(const std::filesystem::path& path, Error& err) {
  Json::Value result;
  return call("rm", path_params(path), result, err);
}

bool RemoteFileSystem::create_dir_all(const std::filesystem::path& path, Error& err) {
  Json::Value result;
  return call("mkdir", path_params(path), result, err);
}
