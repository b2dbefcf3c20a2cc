#include "recovery_manager.hpp"
#include "document.hpp"
#include "log.hpp"
#include "text_buffer.hpp"

RecoveryManager::RecoveryManager(RecoveryStorage& storage, size_t chunked_threshold)
    : storage_(storage), chunked_threshold_(chunked_threshold) {}

std::string RecoveryManager::id_for(const TextBuffer& buf) const {
  if (buf.has_backing_file()) return storage_.get_buffer_id(buf.file_path());
  return storage_.get_buffer_id(std::nullopt);
}

bool RecoveryManager::try_begin(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  return in_flight_.insert(id).second;
}

void RecoveryManager::end(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  in_flight_.erase(id);
}

bool RecoveryManager::snapshot(const TextBuffer& buf, const std::string& id, RecoveryMetadata& out, Error& err) {
  if (!try_begin(id)) return fail(err, ErrorKind::Busy, "recovery snapshot already in progress: " + id);
  struct Release {
    RecoveryManager* m; const std::string& id;
    ~Release() { m->end(id); }
  } release{this, id};

  std::optional<std::filesystem::path> original;
  std::optional<std::string> name;
  if (buf.has_backing_file()) {
    original = buf.file_path();
    name = buf.file_path().filename().string();
  }
  uint64_t lines = 0;
  if (!buf.line_count(lines, err)) return false;

  if (buf.has_backing_file() && buf.total_bytes() >= chunked_threshold_) {
    std::vector<RecoveryChunk> chunks;
    if (!buf.build_recovery_chunks(chunks, err)) return false;
    log_debug("recovery " + id + ": chunked snapshot with " + std::to_string(chunks.size()) + " chunk(s)");
    return storage_.save_chunked_recovery(id, std::move(chunks), original, name, lines,
                                          buf.original_size(), buf.total_bytes(), out, err);
  }
  std::string content;
  if (!buf.to_string(content, err)) return false;
  return storage_.save_recovery(id, content, original, name, lines, out, err);
}

bool RecoveryManager::autosave(Document& doc, const std::string& id, Error& err) {
  if (!doc.recovery_dirty()) return true;
  RecoveryMetadata md;
  if (!snapshot(doc.buffer(), id, md, err)) return false;
  doc.clear_recovery_dirty();
  return true;
}

bool RecoveryManager::recover(const std::string& id, std::string& out, Error& err) {
  std::optional<RecoveryEntry> entry;
  if (!storage_.load_entry(id, entry, err)) return false;
  if (!entry) return fail(err, ErrorKind::NotFound, "no recovery entry: " + id);
  if (!entry->verify_checksum(storage_.fs(), err)) return false;
  if (entry->metadata.format == RecoveryFormat::Full) {
    std::optional<std::string> content;
    if (!storage_.read_content(id, content, err)) return false;
    if (!content) return fail(err, ErrorKind::NotFound, "recovery content missing: " + id);
    out = std::move(*content);
    return true;
  }
  if (!entry->metadata.original_path) return fail(err, ErrorKind::InvalidData, "chunked recovery without original path: " + id);
  return storage_.reconstruct_from_chunks(id, *entry->metadata.original_path, out, err);
}

bool RecoveryManager::restore_to(const std::string& id, const std::filesystem::path& dst, Error& err) {
  std::optional<RecoveryEntry> entry;
  if (!storage_.load_entry(id, entry, err)) return false;
  if (!entry) return fail(err, ErrorKind::NotFound, "no recovery entry: " + id);
  if (!entry->verify_checksum(storage_.fs(), err)) return false;
  if (entry->metadata.format == RecoveryFormat::Chunked) {
    if (!entry->metadata.original_path) return fail(err, ErrorKind::InvalidData, "chunked recovery without original path: " + id);
    return storage_.restore_chunked_to(id, *entry->metadata.original_path, dst, err);
  }
  std::string content;
  if (!recover(id, content, err)) return false;
  return storage_.fs().write_file(dst, content, err);
}

bool RecoveryManager::discard(const std::string& id, Error& err) { return storage_.delete_recovery(id, err); }
