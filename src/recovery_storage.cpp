#include "recovery_storage.hpp"
#include "checksum.hpp"
#include "json_util.hpp"
#include "local_filesystem.hpp"
#include "log.hpp"
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <chrono>

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool RecoveryEntry::verify_checksum(IFileSystem& fs, Error& err) const {
  std::string content;
  if (!fs.read_file(content_path, content, err)) return false;
  std::string sum = compute_checksum(content);
  if (sum != metadata.checksum) {
    return fail(err, ErrorKind::ChecksumMismatch,
                "recovery " + id + ": content checksum " + sum + " does not match " + metadata.checksum);
  }
  return true;
}

bool chunks_to_write_ops(const ChunkedRecoveryData& data, std::vector<WriteOp>& out, Error& err) {
  out.clear();
  std::vector<const RecoveryChunk*> order;
  for (const auto& c : data.chunks) order.push_back(&c);
  std::stable_sort(order.begin(), order.end(),
                   [](const RecoveryChunk* a, const RecoveryChunk* b){ return a->offset < b->offset; });
  uint64_t pos = 0;
  for (const RecoveryChunk* c : order) {
    if (!c->verify()) {
      return fail(err, ErrorKind::ChecksumMismatch,
                  "chunk at offset " + std::to_string(c->offset) + " failed checksum verification");
    }
    if (c->offset < pos || c->offset + c->original_len > data.original_size) {
      return fail(err, ErrorKind::InvalidData,
                  "chunk at offset " + std::to_string(c->offset) + " is out of order or out of range");
    }
    if (c->offset > pos) out.emplace_back(WriteCopy{pos, c->offset - pos});
    if (!c->content.empty()) out.emplace_back(WriteInsert{c->content});
    pos = c->offset + c->original_len;
  }
  if (pos < data.original_size) out.emplace_back(WriteCopy{pos, data.original_size - pos});
  uint64_t total = 0;
  for (const auto& op : out) total += write_op_output_len(op);
  if (total != data.final_size) {
    return fail(err, ErrorKind::SizeMismatch,
                "reconstructed size mismatch: expected " + std::to_string(data.final_size) +
                ", got " + std::to_string(total));
  }
  return true;
}

RecoveryStorage::RecoveryStorage(std::filesystem::path dir, std::shared_ptr<IFileSystem> fs)
    : dir_(std::move(dir)), fs_(std::move(fs)) {
  if (!fs_) fs_ = std::make_shared<LocalFileSystem>();
}

bool RecoveryStorage::ensure_dir(Error& err) { return fs_->create_dir_all(dir_, err); }

bool RecoveryStorage::read_json(const std::filesystem::path& path, std::optional<Json::Value>& out, Error& err) {
  out.reset();
  bool present = false;
  if (!fs_->exists(path, present, err)) return false;
  if (!present) return true;
  std::string text;
  if (!fs_->read_file(path, text, err)) return false;
  Json::Value v;
  if (!json_parse(text, v, err)) {
    err.message = path.string() + ": " + err.message;
    return false;
  }
  out = std::move(v);
  return true;
}

bool RecoveryStorage::create_session_lock(SessionInfo& out, Error& err) {
  if (!ensure_dir(err)) return false;
  SessionInfo info = SessionInfo::current();
  if (!fs_->write_file(session_lock_path(), json_to_pretty(info.to_json()), err)) return false;
  out = info;
  return true;
}

bool RecoveryStorage::update_session_lock(Error& err) {
  bool present = false;
  if (!fs_->exists(session_lock_path(), present, err)) return false;
  if (!present) return true;
  return fs_->write_file(session_lock_path(), json_to_pretty(SessionInfo::current().to_json()), err);
}

bool RecoveryStorage::remove_session_lock(Error& err) {
  bool present = false;
  if (!fs_->exists(session_lock_path(), present, err)) return false;
  if (!present) return true;
  return fs_->remove_file(session_lock_path(), err);
}

bool RecoveryStorage::read_session_lock(std::optional<SessionInfo>& out, Error& err) {
  out.reset();
  std::optional<Json::Value> v;
  if (!read_json(session_lock_path(), v, err)) return false;
  if (!v) return true;
  SessionInfo info;
  if (!SessionInfo::from_json(*v, info, err)) return false;
  out = info;
  return true;
}

bool RecoveryStorage::detect_crash(bool& crashed, Error& err) {
  std::optional<SessionInfo> info;
  if (!read_session_lock(info, err)) return false;
  crashed = info && !info->is_running();
  return true;
}

std::string RecoveryStorage::get_buffer_id(const std::optional<std::filesystem::path>& path) const {
  if (path) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(*path, ec);
    return to_hex64(fnv1a64((ec ? *path : abs).lexically_normal().string()));
  }
  static std::atomic<uint64_t> counter{0};
  Fnv1a h;
  uint64_t parts[3] = {
    static_cast<uint64_t>(::getpid()),
    static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()),
    counter.fetch_add(1),
  };
  h.update(parts, sizeof(parts));
  return "unnamed-" + h.hex();
}

std::optional<uint64_t> RecoveryStorage::mtime_of(const std::optional<std::filesystem::path>& path) {
  if (!path) return std::nullopt;
  FileMetadata md;
  Error ignored;
  if (!fs_->metadata(*path, md, ignored)) return std::nullopt;
  return md.mtime;
}

bool RecoveryStorage::write_metadata(const std::string& id, const RecoveryMetadata& md, Error& err) {
  return fs_->write_file(metadata_path(id), json_to_pretty(md.to_json()), err);
}

/* a corrupt metadata file is replaced; any other read failure aborts the save */
bool RecoveryStorage::read_existing_metadata(const std::string& id, std::optional<RecoveryMetadata>& out, Error& err) {
  Error merr;
  if (read_metadata(id, out, merr)) return true;
  if (merr.kind != ErrorKind::InvalidData) {
    err = std::move(merr);
    return false;
  }
  log_warn("recovery " + id + ": replacing unreadable metadata: " + merr.message);
  out.reset();
  return true;
}

bool RecoveryStorage::save_recovery(const std::string& id, const std::string& content,
                                    const std::optional<std::filesystem::path>& original_path,
                                    const std::optional<std::string>& buffer_name,
                                    std::optional<uint64_t> line_count, RecoveryMetadata& out, Error& err) {
  if (!ensure_dir(err)) return false;
  std::string sum = compute_checksum(content);
  std::optional<RecoveryMetadata> existing;
  if (!read_existing_metadata(id, existing, err)) return false;

  RecoveryMetadata md;
  if (existing) {
    md = *existing;
    md.format = RecoveryFormat::Full;
    md.chunk_count.reset();
    md.original_file_size.reset();
    md.update(sum, content.size(), line_count);
  } else {
    md.original_path = original_path ? std::optional<std::string>(original_path->string()) : std::nullopt;
    md.buffer_name = buffer_name;
    md.checksum = sum;
    md.content_size = content.size();
    md.line_count = line_count;
    md.original_mtime = mtime_of(original_path);
    md.created_at = md.updated_at = unix_now();
  }
  if (!fs_->write_file(content_path(id), content, err)) return false;
  if (!write_metadata(id, md, err)) return false;
  out = std::move(md);
  return true;
}

bool RecoveryStorage::save_chunked_recovery(const std::string& id, std::vector<RecoveryChunk> chunks,
                                            const std::optional<std::filesystem::path>& original_path,
                                            const std::optional<std::string>& buffer_name,
                                            std::optional<uint64_t> line_count, uint64_t original_file_size,
                                            uint64_t final_size, RecoveryMetadata& out, Error& err) {
  if (!ensure_dir(err)) return false;
  ChunkedRecoveryData data;
  data.original_size = original_file_size;
  data.final_size = final_size;
  data.chunks = std::move(chunks);
  std::string body = json_to_compact(data.to_json());
  std::string sum = compute_checksum(body);

  std::optional<RecoveryMetadata> existing;
  if (!read_existing_metadata(id, existing, err)) return false;

  RecoveryMetadata md;
  if (existing) {
    md = *existing;
    md.update(sum, body.size(), line_count);
  } else {
    md.original_path = original_path ? std::optional<std::string>(original_path->string()) : std::nullopt;
    md.buffer_name = buffer_name;
    md.checksum = sum;
    md.content_size = body.size();
    md.line_count = line_count;
    md.original_mtime = mtime_of(original_path);
    md.created_at = md.updated_at = unix_now();
  }
  md.format = RecoveryFormat::Chunked;
  md.chunk_count = data.chunks.size();
  md.original_file_size = original_file_size;

  if (!fs_->write_file(content_path(id), body, err)) return false;
  if (!write_metadata(id, md, err)) return false;
  out = std::move(md);
  return true;
}

bool RecoveryStorage::read_chunked_content(const std::string& id, std::optional<ChunkedRecoveryData>& out,
                                           Error& err) {
  out.reset();
  std::optional<Json::Value> v;
  if (!read_json(content_path(id), v, err)) return false;
  if (!v) return true;
  ChunkedRecoveryData data;
  if (!ChunkedRecoveryData::from_json(*v, data, err)) return false;
  out = std::move(data);
  return true;
}

bool RecoveryStorage::reconstruct_from_chunks(const std::string& id, const std::filesystem::path& original_file,
                                              std::string& out, Error& err) {
  std::optional<ChunkedRecoveryData> data;
  if (!read_chunked_content(id, data, err)) return false;
  if (!data) return fail(err, ErrorKind::NotFound, "chunked recovery data not found: " + id);
  std::string original;
  if (!fs_->read_file(original_file, original, err)) return false;
  return data->apply(original, out, err);
}

bool RecoveryStorage::restore_chunked_to(const std::string& id, const std::filesystem::path& original_file,
                                         const std::filesystem::path& dst, Error& err) {
  std::optional<ChunkedRecoveryData> data;
  if (!read_chunked_content(id, data, err)) return false;
  if (!data) return fail(err, ErrorKind::NotFound, "chunked recovery data not found: " + id);
  FileMetadata md;
  if (!fs_->metadata(original_file, md, err)) return false;
  if (md.size != data->original_size) {
    return fail(err, ErrorKind::SizeMismatch,
                "original file size mismatch: expected " + std::to_string(data->original_size) +
                ", got " + std::to_string(md.size));
  }
  std::vector<WriteOp> ops;
  if (!chunks_to_write_ops(*data, ops, err)) return false;
  return fs_->write_patched(original_file, dst, ops, err);
}

bool RecoveryStorage::read_metadata(const std::string& id, std::optional<RecoveryMetadata>& out, Error& err) {
  out.reset();
  std::optional<Json::Value> v;
  if (!read_json(metadata_path(id), v, err)) return false;
  if (!v) return true;
  RecoveryMetadata md;
  if (!RecoveryMetadata::from_json(*v, md, err)) return false;
  out = std::move(md);
  return true;
}

bool RecoveryStorage::read_content(const std::string& id, std::optional<std::string>& out, Error& err) {
  out.reset();
  bool present = false;
  if (!fs_->exists(content_path(id), present, err)) return false;
  if (!present) return true;
  std::string content;
  if (!fs_->read_file(content_path(id), content, err)) return false;
  out = std::move(content);
  return true;
}

bool RecoveryStorage::load_entry(const std::string& id, std::optional<RecoveryEntry>& out, Error& err) {
  out.reset();
  bool has_meta = false, has_content = false;
  if (!fs_->exists(metadata_path(id), has_meta, err)) return false;
  if (!fs_->exists(content_path(id), has_content, err)) return false;
  if (!has_meta || !has_content) return true;
  std::optional<RecoveryMetadata> md;
  if (!read_metadata(id, md, err)) return false;
  if (!md) return fail(err, ErrorKind::NotFound, "metadata vanished while loading: " + id);
  out = RecoveryEntry{id, std::move(*md), content_path(id), metadata_path(id)};
  return true;
}

bool RecoveryStorage::remove_if_present(const std::filesystem::path& path, Error& err) {
  bool present = false;
  if (!fs_->exists(path, present, err)) return false;
  return !present || fs_->remove_file(path, err);
}

bool RecoveryStorage::delete_recovery(const std::string& id, Error& err) {
  return remove_if_present(content_path(id), err) && remove_if_present(metadata_path(id), err);
}

bool RecoveryStorage::list_entries(std::vector<RecoveryEntry>& out, Error& err) {
  out.clear();
  bool present = false;
  if (!fs_->exists(dir_, present, err)) return false;
  if (!present) return true;
  std::vector<DirEntry> files;
  if (!fs_->read_dir(dir_, files, err)) return false;
  for (const auto& f : files) {
    if (!ends_with(f.name, META_EXT)) continue;
    std::string id = f.name.substr(0, f.name.size() - std::char_traits<char>::length(META_EXT));
    std::optional<RecoveryEntry> e;
    Error lerr;
    if (!load_entry(id, e, lerr)) {
      if (lerr.kind != ErrorKind::InvalidData) {
        err = std::move(lerr);
        return false;
      }
      log_warn("skipping recovery entry " + id + ": " + lerr.message);
      continue;
    }
    if (e) out.push_back(std::move(*e));
  }
  std::stable_sort(out.begin(), out.end(), [](const RecoveryEntry& a, const RecoveryEntry& b){
    return a.metadata.updated_at > b.metadata.updated_at;
  });
  return true;
}

bool RecoveryStorage::cleanup_orphans(size_t& cleaned, Error& err) {
  cleaned = 0;
  bool present = false;
  if (!fs_->exists(dir_, present, err)) return false;
  if (!present) return true;
  std::vector<DirEntry> files;
  if (!fs_->read_dir(dir_, files, err)) return false;
  for (const auto& f : files) {
    if (f.name == SESSION_LOCK) continue;
    std::string id;
    if (ends_with(f.name, META_EXT)) id = f.name.substr(0, f.name.size() - std::char_traits<char>::length(META_EXT));
    else if (ends_with(f.name, CONTENT_EXT)) id = f.name.substr(0, f.name.size() - std::char_traits<char>::length(CONTENT_EXT));
    else continue;
    bool has_meta = false, has_content = false;
    if (!fs_->exists(metadata_path(id), has_meta, err)) return false;
    if (!fs_->exists(content_path(id), has_content, err)) return false;
    if (has_meta && has_content) continue;
    if (!has_meta && !has_content) continue;
    if (!delete_recovery(id, err)) return false;
    log_info("removed orphaned recovery file: " + f.name);
    cleaned++;
  }
  return true;
}

bool RecoveryStorage::cleanup_all(size_t& cleaned, Error& err) {
  cleaned = 0;
  bool present = false;
  if (!fs_->exists(dir_, present, err)) return false;
  if (!present) return true;
  std::vector<DirEntry> files;
  if (!fs_->read_dir(dir_, files, err)) return false;
  for (const auto& f : files) {
    if (f.name == SESSION_LOCK || f.is_dir) continue;
    Error rerr;
    if (!fs_->remove_file(f.path, rerr)) {
      log_warn("cleanup: " + rerr.message);
      continue;
    }
    cleaned++;
  }
  return true;
}
