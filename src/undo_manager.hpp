#pragma once
/*
 * UndoManager
 *
 * Purpose: grouped undo/redo over byte-level edits.
 * Design: an edit command opens a group with the cursor before it, pushes
 *         each Insert/Delete it applies, and commits with the cursor after.
 *         Undo replays a group's inverse ops in reverse order.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "cursor.hpp"

class TextBuffer;

struct Operation {
  enum Type { Insert, Delete } type;
  uint64_t pos;
  std::string payload; /* inserted or removed bytes */
};

struct UndoEntry {
  std::vector<Operation> ops;
  Cursor pre;
  Cursor post;
};

class UndoManager {
public:
  void begin_group(const Cursor& pre);
  void push_op(const Operation& op);
  void commit_group(const Cursor& post);
  void clear();
  bool can_undo() const { return !undo_entries_.empty(); }
  bool can_redo() const { return !redo_entries_.empty(); }
  size_t undo_depth() const { return undo_entries_.size(); }
  bool undo(TextBuffer& buf, Cursor& cur);
  bool redo(TextBuffer& buf, Cursor& cur);

private:
  static void apply(TextBuffer& buf, const Operation& op, bool inverse);

  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  UndoEntry current_;
};
