#pragma once
/*
 * RecoveryManager
 *
 * Purpose: snapshots documents into RecoveryStorage and restores them.
 * Policy: chunked snapshots for backed buffers whose size reaches the
 *         chunked threshold, full snapshots otherwise.
 * Concurrency: at most one snapshot per id at a time; an overlapping
 *              attempt fails with ErrorKind::Busy instead of interleaving.
 */
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include "config.hpp"
#include "error.hpp"
#include "recovery_storage.hpp"

class Document;
class TextBuffer;

class RecoveryManager {
public:
  RecoveryManager(RecoveryStorage& storage, size_t chunked_threshold = PE_CHUNKED_RECOVERY_THRESHOLD);

  /* id of a buffer: path hash for backed buffers, otherwise a fresh "unnamed-" id */
  std::string id_for(const TextBuffer& buf) const;
  bool snapshot(const TextBuffer& buf, const std::string& id, RecoveryMetadata& out, Error& err);
  /* snapshots only when the recovery-dirty flag is set, then clears it */
  bool autosave(Document& doc, const std::string& id, Error& err);
  /* reconstructed content for either format */
  bool recover(const std::string& id, std::string& out, Error& err);
  /* writes the recovered content to dst */
  bool restore_to(const std::string& id, const std::filesystem::path& dst, Error& err);
  bool discard(const std::string& id, Error& err);

  RecoveryStorage& storage() { return storage_; }

private:
  bool try_begin(const std::string& id);
  void end(const std::string& id);

  RecoveryStorage& storage_;
  size_t chunked_threshold_;
  std::mutex mu_;
  std::set<std::string> in_flight_;
};
