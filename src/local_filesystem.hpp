#pragma once
/*
 * LocalFileSystem
 *
 * Purpose: IFileSystem over POSIX calls.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename) for
 *          write_file and write_patched; the destination keeps its mode.
 */
#include "ifilesystem.hpp"

class LocalFileSystem : public IFileSystem {
public:
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
};

/* temp path used by the atomic writers: "<path>.tmp" */
std::filesystem::path staging_path(const std::filesystem::path& path);
