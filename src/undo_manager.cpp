#include "undo_manager.hpp"
#include "text_buffer.hpp"

void UndoManager::begin_group(const Cursor& pre) {
  if (!grouping_) {
    grouping_ = true;
    current_.ops.clear();
    current_.pre = pre;
  }
}

void UndoManager::push_op(const Operation& op) {
  if (grouping_) current_.ops.push_back(op);
}

void UndoManager::commit_group(const Cursor& post) {
  if (!grouping_) return;
  grouping_ = false;
  current_.post = post;
  if (!current_.ops.empty()) {
    undo_entries_.push_back(std::move(current_));
    redo_entries_.clear();
  }
  current_ = UndoEntry{};
}

void UndoManager::clear() {
  undo_entries_.clear();
  redo_entries_.clear();
  grouping_ = false;
  current_ = UndoEntry{};
}

void UndoManager::apply(TextBuffer& buf, const Operation& op, bool inverse) {
  bool insert = (op.type == Operation::Insert) != inverse;
  if (insert) buf.insert_bytes(op.pos, op.payload);
  else buf.delete_bytes(op.pos, op.payload.size());
}

bool UndoManager::undo(TextBuffer& buf, Cursor& cur) {
  if (undo_entries_.empty()) return false;
  UndoEntry e = std::move(undo_entries_.back());
  undo_entries_.pop_back();
  for (auto it = e.ops.rbegin(); it != e.ops.rend(); ++it) apply(buf, *it, true);
  cur = e.pre;
  redo_entries_.push_back(std::move(e));
  return true;
}

bool UndoManager::redo(TextBuffer& buf, Cursor& cur) {
  if (redo_entries_.empty()) return false;
  UndoEntry e = std::move(redo_entries_.back());
  redo_entries_.pop_back();
  for (const auto& op : e.ops) apply(buf, op, false);
  cur = e.post;
  undo_entries_.push_back(std::move(e));
  return true;
}
