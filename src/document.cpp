#include "document.hpp"
#include "grapheme.hpp"
#include <stdexcept>

Document::Document(TextBuffer buf) : buf_(std::move(buf)) {}

bool Document::open(const std::filesystem::path& path, std::shared_ptr<IFileSystem> fs, size_t large_file_threshold,
                    std::unique_ptr<Document>& out, Error& err) {
  TextBuffer b;
  if (!TextBuffer::load_from_file(path, large_file_threshold, std::move(fs), b, err)) return false;
  out = std::make_unique<Document>(std::move(b));
  return true;
}

void Document::set_cursor(uint64_t pos) {
  if (pos > buf_.total_bytes()) {
    throw std::out_of_range("cursor " + std::to_string(pos) + " beyond length " + std::to_string(buf_.total_bytes()));
  }
  cur_.clear_selection();
  cur_.pos = pos;
}

/* caller holds an open undo group */
void Document::insert(uint64_t pos, std::string_view text) {
  buf_.insert_bytes(pos, text);
  um_.push_op(Operation{Operation::Insert, pos, std::string(text)});
  recovery_dirty_ = true;
}

bool Document::erase(uint64_t pos, uint64_t len, Error& err) {
  std::string removed;
  if (!buf_.read_range(pos, len, removed, err)) return false;
  buf_.delete_bytes(pos, len);
  um_.push_op(Operation{Operation::Delete, pos, std::move(removed)});
  recovery_dirty_ = true;
  return true;
}

bool Document::type_text(std::string_view text, Error& err) {
  if (text.empty() && !cur_.has_selection()) return true;
  um_.begin_group(cur_);
  if (cur_.has_selection()) {
    ByteRange r = cur_.selection();
    if (!erase(r.offset, r.len, err)) { um_.commit_group(cur_); return false; }
    cur_.pos = r.offset;
  }
  cur_.clear_selection();
  insert(cur_.pos, text);
  cur_.pos += text.size();
  um_.commit_group(cur_);
  return true;
}

bool Document::delete_selection(Error& err) {
  if (!cur_.has_selection()) { cur_.clear_selection(); return true; }
  ByteRange r = cur_.selection();
  um_.begin_group(cur_);
  bool ok = erase(r.offset, r.len, err);
  if (ok) {
    cur_.clear_selection();
    cur_.pos = r.offset;
  }
  um_.commit_group(cur_);
  return ok;
}

bool Document::backspace(Error& err) {
  if (cur_.has_selection()) return delete_selection(err);
  cur_.clear_selection();
  if (cur_.pos == 0) return true;
  uint64_t prev = 0;
  if (!prev_code_point_boundary(buf_, cur_.pos, prev, err)) return false;
  um_.begin_group(cur_);
  bool ok = erase(prev, cur_.pos - prev, err);
  if (ok) cur_.pos = prev;
  um_.commit_group(cur_);
  return ok;
}

bool Document::delete_forward(Error& err) {
  if (cur_.has_selection()) return delete_selection(err);
  cur_.clear_selection();
  if (cur_.pos >= buf_.total_bytes()) return true;
  uint64_t next = 0;
  if (!next_grapheme_boundary(buf_, cur_.pos, next, err)) return false;
  um_.begin_group(cur_);
  bool ok = erase(cur_.pos, next - cur_.pos, err);
  um_.commit_group(cur_);
  return ok;
}

bool Document::undo() {
  if (!um_.undo(buf_, cur_)) return false;
  recovery_dirty_ = true;
  return true;
}

bool Document::redo() {
  if (!um_.redo(buf_, cur_)) return false;
  recovery_dirty_ = true;
  return true;
}

bool Document::save(Error& err) {
  if (!buf_.has_backing_file()) return fail(err, ErrorKind::Io, "no file name");
  return save_as(buf_.file_path(), err);
}

bool Document::save_as(const std::filesystem::path& path, Error& err) {
  // undo history stays valid: ops replay by byte offset, not by piece
  return buf_.save_to_file(path, err);
}

std::string Document::display_name() const {
  if (!buf_.has_backing_file()) return "[No Name]";
  return buf_.file_path().filename().string();
}
