#pragma once
/*
 * Document
 *
 * Purpose: one open buffer with its cursor, undo history and recovery
 *          dirty flag; edit commands route through the undo manager.
 * Deletion: backspace removes one code point, forward delete removes a
 *           whole grapheme cluster. A non-empty selection is deleted
 *           instead by either.
 */
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include "cursor.hpp"
#include "error.hpp"
#include "text_buffer.hpp"
#include "undo_manager.hpp"

class Document {
public:
  explicit Document(TextBuffer buf);

  static bool open(const std::filesystem::path& path, std::shared_ptr<IFileSystem> fs, size_t large_file_threshold,
                   std::unique_ptr<Document>& out, Error& err);

  bool type_text(std::string_view text, Error& err);
  bool backspace(Error& err);
  bool delete_forward(Error& err);
  bool delete_selection(Error& err);

  bool move_left(Error& err) { return cursor_left(buf_, cur_, false, err); }
  bool move_right(Error& err) { return cursor_right(buf_, cur_, false, err); }
  bool select_left(Error& err) { return cursor_left(buf_, cur_, true, err); }
  bool select_right(Error& err) { return cursor_right(buf_, cur_, true, err); }
  bool move_home(Error& err) { return cursor_line_start(buf_, cur_, err); }
  bool move_end(Error& err) { return cursor_line_end(buf_, cur_, err); }
  void set_cursor(uint64_t pos);

  bool undo();
  bool redo();

  bool save(Error& err);
  bool save_as(const std::filesystem::path& path, Error& err);

  bool is_modified() const { return buf_.is_modified(); }
  bool recovery_dirty() const { return recovery_dirty_; }
  void clear_recovery_dirty() { recovery_dirty_ = false; }
  std::string display_name() const;

  const Cursor& cursor() const { return cur_; }
  TextBuffer& buffer() { return buf_; }
  const TextBuffer& buffer() const { return buf_; }
  const UndoManager& undo_manager() const { return um_; }

private:
  bool erase(uint64_t pos, uint64_t len, Error& err);
  void insert(uint64_t pos, std::string_view text);

  TextBuffer buf_;
  UndoManager um_;
  Cursor cur_;
  bool recovery_dirty_ = false;
};
