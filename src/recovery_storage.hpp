#pragma once
/*
 * RecoveryStorage
 *
 * Purpose: crash-recovery files in one directory.
 *   <id>.meta.json   pretty-printed RecoveryMetadata
 *   <id>.content     raw bytes (full) or ChunkedRecoveryData JSON (chunked)
 *   session.lock     {pid, started_at} of the running editor
 * Writes: every file goes through IFileSystem::write_file, which stages to
 *         "<target>.tmp", syncs and renames. Content is written before
 *         metadata, so a metadata file always describes complete content.
 * Ids: a hash of the original path, or "unnamed-..." for new buffers.
 */
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "ifilesystem.hpp"
#include "recovery_types.hpp"

struct RecoveryEntry {
  std::string id;
  RecoveryMetadata metadata;
  std::filesystem::path content_path;
  std::filesystem::path metadata_path;

  /* false with ChecksumMismatch when the content no longer matches metadata */
  bool verify_checksum(IFileSystem& fs, Error& err) const;
};

/* Copy/Insert recipe that rebuilds the recovered content from the original */
bool chunks_to_write_ops(const ChunkedRecoveryData& data, std::vector<WriteOp>& out, Error& err);

class RecoveryStorage {
public:
  static constexpr const char* META_EXT = ".meta.json";
  static constexpr const char* CONTENT_EXT = ".content";
  static constexpr const char* SESSION_LOCK = "session.lock";

  explicit RecoveryStorage(std::filesystem::path dir, std::shared_ptr<IFileSystem> fs = nullptr);

  const std::filesystem::path& base_dir() const { return dir_; }
  IFileSystem& fs() const { return *fs_; }
  bool ensure_dir(Error& err);

  bool create_session_lock(SessionInfo& out, Error& err);
  /* rewrites the lock with a fresh timestamp, if it exists */
  bool update_session_lock(Error& err);
  bool remove_session_lock(Error& err);
  bool read_session_lock(std::optional<SessionInfo>& out, Error& err);
  /* lock present and its pid is no longer running */
  bool detect_crash(bool& crashed, Error& err);

  std::string get_buffer_id(const std::optional<std::filesystem::path>& path) const;

  bool save_recovery(const std::string& id, const std::string& content,
                     const std::optional<std::filesystem::path>& original_path,
                     const std::optional<std::string>& buffer_name, std::optional<uint64_t> line_count,
                     RecoveryMetadata& out, Error& err);
  bool save_chunked_recovery(const std::string& id, std::vector<RecoveryChunk> chunks,
                             const std::optional<std::filesystem::path>& original_path,
                             const std::optional<std::string>& buffer_name, std::optional<uint64_t> line_count,
                             uint64_t original_file_size, uint64_t final_size,
                             RecoveryMetadata& out, Error& err);

  bool read_chunked_content(const std::string& id, std::optional<ChunkedRecoveryData>& out, Error& err);
  bool reconstruct_from_chunks(const std::string& id, const std::filesystem::path& original_file,
                               std::string& out, Error& err);
  /* streams the reconstruction into dst without loading the original */
  bool restore_chunked_to(const std::string& id, const std::filesystem::path& original_file,
                          const std::filesystem::path& dst, Error& err);

  bool read_metadata(const std::string& id, std::optional<RecoveryMetadata>& out, Error& err);
  bool read_content(const std::string& id, std::optional<std::string>& out, Error& err);
  bool load_entry(const std::string& id, std::optional<RecoveryEntry>& out, Error& err);
  bool delete_recovery(const std::string& id, Error& err);
  /* newest first */
  bool list_entries(std::vector<RecoveryEntry>& out, Error& err);
  bool cleanup_orphans(size_t& cleaned, Error& err);
  /* everything but the session lock */
  bool cleanup_all(size_t& cleaned, Error& err);

  std::filesystem::path metadata_path(const std::string& id) const { return dir_ / (id + META_EXT); }
  std::filesystem::path content_path(const std::string& id) const { return dir_ / (id + CONTENT_EXT); }
  std::filesystem::path session_lock_path() const { return dir_ / SESSION_LOCK; }

private:
  std::optional<uint64_t> mtime_of(const std::optional<std::filesystem::path>& path);
  bool write_metadata(const std::string& id, const RecoveryMetadata& md, Error& err);
  bool read_existing_metadata(const std::string& id, std::optional<RecoveryMetadata>& out, Error& err);
  bool remove_if_present(const std::filesystem::path& path, Error& err);
  bool read_json(const std::filesystem::path& path, std::optional<Json::Value>& out, Error& err);

  std::filesystem::path dir_;
  std::shared_ptr<IFileSystem> fs_;
};
