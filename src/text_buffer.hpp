#pragma once
/*
 * TextBuffer
 *
 * Purpose: piece-structured byte buffer over an original file plus an
 *          append-only "added" region; loads and saves through IFileSystem.
 * Feature: saves to the load path replay a minimal Copy/Insert recipe via
 *          write_patched; new paths, save-as and line-ending conversion
 *          write the full content. After a save the buffer re-anchors on
 *          the saved file.
 * Note: large files (above the threshold) are never held in memory;
 *       Original pieces are resolved with read_range on demand.
 *       Offsets outside the buffer throw std::out_of_range.
 */
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "error.hpp"
#include "ifilesystem.hpp"
#include "piece_tree.hpp"
#include "recovery_types.hpp"
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::shared_ptr<IFileSystem> fs);
  TextBuffer(TextBuffer&&) noexcept = default;
  TextBuffer& operator=(TextBuffer&&) noexcept = default;

  static TextBuffer from_bytes(std::string bytes, std::shared_ptr<IFileSystem> fs);
  static bool load_from_file(const std::filesystem::path& path, size_t large_file_threshold,
                             std::shared_ptr<IFileSystem> fs, TextBuffer& out, Error& err,
                             size_t load_chunk_size = PE_LOAD_CHUNK_SIZE);

  uint64_t total_bytes() const { return tree_.total_bytes(); }
  bool empty() const { return total_bytes() == 0; }
  void insert_bytes(uint64_t pos, std::string_view data);
  void delete_bytes(uint64_t pos, uint64_t len);
  bool read_range(uint64_t pos, uint64_t len, std::string& out, Error& err) const;
  bool to_string(std::string& out, Error& err) const;
  /* newline count + 1 */
  bool line_count(uint64_t& out, Error& err) const;

  bool save_to_file(const std::filesystem::path& path, Error& err);
  /* Original pieces become Copy, Added pieces Insert; neighbours are merged */
  std::vector<WriteOp> build_write_recipe() const;
  /* replaced ranges of the backing original, ascending */
  bool build_recovery_chunks(std::vector<RecoveryChunk>& out, Error& err) const;

  bool is_modified() const;
  void mark_saved();
  bool content_checksum(std::string& out, Error& err) const;

  LineEnding line_ending() const { return line_ending_; }
  void set_line_ending(LineEnding le) { line_ending_ = le; }
  const std::filesystem::path& file_path() const { return file_path_; }
  bool has_backing_file() const { return tracked_; }
  uint64_t original_size() const { return original_size_; }
  size_t piece_count() const { return tree_.piece_count(); }
  std::vector<Piece> pieces() const { return tree_.pieces(); }
  bool check_invariants() const { return tree_.check_invariants(); }
  const std::shared_ptr<IFileSystem>& fs() const { return fs_; }

private:
  bool read_original(uint64_t offset, uint64_t len, std::string& out, Error& err) const;
  bool read_piece(const Piece& p, uint64_t skip, uint64_t take, std::string& out, Error& err) const;
  bool checksum_of(const std::vector<Piece>& pieces, std::string& out, Error& err) const;
  void reanchor(const std::filesystem::path& path, uint64_t size, std::optional<std::string> content);

  std::shared_ptr<IFileSystem> fs_;
  std::filesystem::path file_path_;
  bool tracked_ = false;
  uint64_t original_size_ = 0;
  std::optional<std::string> original_cache_;
  std::string added_;
  PieceTree tree_;
  LineEnding line_ending_ = LineEnding::LF;
  LineEnding file_line_ending_ = LineEnding::LF;
  size_t large_file_threshold_ = PE_LARGE_FILE_THRESHOLD;
  size_t load_chunk_size_ = PE_LOAD_CHUNK_SIZE;

  uint64_t saved_len_ = 0;
  std::vector<Piece> saved_pieces_;
  mutable std::optional<std::string> saved_checksum_;
};

std::string convert_line_endings(std::string_view text, LineEnding to);
