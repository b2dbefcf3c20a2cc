#pragma once
/*
 * IFileSystem
 *
 * Purpose: file I/O capability used by TextBuffer and RecoveryStorage.
 * Impls: LocalFileSystem (POSIX), RemoteFileSystem (agent channel).
 * Contract: every call is safe to retry after a transient failure, and no
 *           call leaves a partially written destination visible to readers.
 * Errors: bool + Error&; remote transport failures surface as ErrorKind::Io.
 */
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <filesystem>
#include "error.hpp"

struct WriteCopy { uint64_t offset = 0; uint64_t len = 0; };
struct WriteInsert { std::string data; };
/* Copy reads from the patch source; Insert supplies new bytes */
using WriteOp = std::variant<WriteCopy, WriteInsert>;

inline uint64_t write_op_output_len(const WriteOp& op) {
  if (const auto* c = std::get_if<WriteCopy>(&op)) return c->len;
  return std::get<WriteInsert>(op).data.size();
}

struct FileMetadata {
  uint64_t size = 0;
  uint64_t mtime = 0;
  uint32_t mode = 0;
  bool is_dir = false;
  bool is_file = false;
};

struct DirEntry {
  std::string name;
  std::filesystem::path path;
  bool is_dir = false;
  bool is_file = false;
  uint64_t size = 0;
};

class IFileWriter {
public:
  virtual ~IFileWriter() = default;
  virtual bool write_all(const std::string& data, Error& err) = 0;
  virtual bool sync_all(Error& err) = 0;
};

class IFileSystem {
public:
  virtual ~IFileSystem() = default;
  virtual bool read_file(const std::filesystem::path& path, std::string& out, Error& err) = 0;
  /* exactly len bytes, or Range error when offset+len exceeds the file */
  virtual bool read_range(const std::filesystem::path& path, uint64_t offset, uint64_t len,
                          std::string& out, Error& err) = 0;
  virtual bool write_file(const std::filesystem::path& path, const std::string& data, Error& err) = 0;
  /* src == dst is an in-place patch */
  virtual bool write_patched(const std::filesystem::path& src, const std::filesystem::path& dst,
                             const std::vector<WriteOp>& ops, Error& err) = 0;
  /* truncate or zero-extend */
  virtual bool set_file_length(const std::filesystem::path& path, uint64_t len, Error& err) = 0;
  /* creates the file if absent */
  virtual std::unique_ptr<IFileWriter> open_file_for_append(const std::filesystem::path& path, Error& err) = 0;
  virtual bool metadata(const std::filesystem::path& path, FileMetadata& out, Error& err) = 0;
  /* a missing path is out = false; any other failure is an error */
  virtual bool is_dir(const std::filesystem::path& path, bool& out, Error& err) = 0;
  virtual bool exists(const std::filesystem::path& path, bool& out, Error& err) = 0;
  virtual bool read_dir(const std::filesystem::path& path, std::vector<DirEntry>& out, Error& err) = 0;
  virtual bool remove_file(const std::filesystem::path& path, Error& err) = 0;
  virtual bool create_dir_all(const std::filesystem::path& path, Error& err) = 0;
  /* "user@host" for remote filesystems, empty for local */
  virtual std::string remote_connection_info() const { return std::string(); }
};
