#include "text_buffer.hpp"
#include "checksum.hpp"
#include "file_reader.hpp"
#include "local_filesystem.hpp"
#include "log.hpp"
#include <algorithm>
#include <stdexcept>

TextBuffer::TextBuffer() : fs_(std::make_shared<LocalFileSystem>()) {}

TextBuffer::TextBuffer(std::shared_ptr<IFileSystem> fs) : fs_(std::move(fs)) {
  if (!fs_) fs_ = std::make_shared<LocalFileSystem>();
}

TextBuffer TextBuffer::from_bytes(std::string bytes, std::shared_ptr<IFileSystem> fs) {
  TextBuffer b(std::move(fs));
  b.line_ending_ = b.file_line_ending_ = detect_line_ending(bytes.data(), bytes.size());
  if (!bytes.empty()) {
    uint64_t n = bytes.size();
    b.added_ = std::move(bytes);
    b.tree_.assign({Piece::added(0, n)});
  }
  b.mark_saved();
  return b;
}

bool TextBuffer::load_from_file(const std::filesystem::path& path, size_t large_file_threshold,
                                std::shared_ptr<IFileSystem> fs, TextBuffer& out, Error& err,
                                size_t load_chunk_size) {
  TextBuffer b(std::move(fs));
  b.large_file_threshold_ = large_file_threshold;
  b.load_chunk_size_ = std::max<size_t>(load_chunk_size, 1);
  FileMetadata md;
  if (!b.fs_->metadata(path, md, err)) return false;
  if (md.is_dir) return fail(err, ErrorKind::Io, "is a directory: " + path.string());

  std::vector<Piece> pieces;
  if (md.size <= large_file_threshold) {
    std::string data;
    if (!b.fs_->read_file(path, data, err)) return false;
    b.original_size_ = data.size();
    b.file_line_ending_ = detect_line_ending(data.data(), data.size());
    if (!data.empty()) pieces.push_back(Piece::original(0, data.size()));
    b.original_cache_ = std::move(data);
  } else {
    std::string chunk;
    uint64_t off = 0;
    bool have_ending = false;
    char prev_last = '\0';
    while (off < md.size) {
      uint64_t n = std::min<uint64_t>(b.load_chunk_size_, md.size - off);
      if (!b.fs_->read_range(path, off, n, chunk, err)) return false;
      if (chunk.size() != n) {
        return fail(err, ErrorKind::Io, "short read at offset " + std::to_string(off) + ": " + path.string());
      }
      if (!have_ending) {
        size_t nl = chunk.find('\n');
        if (nl != std::string::npos) {
          // a "\r\n" may straddle the chunk seam
          char before = nl > 0 ? chunk[nl - 1] : prev_last;
          b.file_line_ending_ = before == '\r' ? LineEnding::CRLF : LineEnding::LF;
          have_ending = true;
        }
        if (n > 0) prev_last = chunk.back();
      }
      pieces.push_back(Piece::original(off, n));
      off += n;
    }
    b.original_size_ = md.size;
    log_debug("streamed " + std::to_string(md.size) + " bytes in " + std::to_string(pieces.size()) +
              " chunk(s): " + path.string());
  }
  b.tree_.assign(pieces);
  b.file_path_ = path;
  b.tracked_ = true;
  b.line_ending_ = b.file_line_ending_;
  b.mark_saved();
  out = std::move(b);
  return true;
}

void TextBuffer::insert_bytes(uint64_t pos, std::string_view data) {
  if (pos > total_bytes()) {
    throw std::out_of_range("insert at " + std::to_string(pos) + " beyond length " + std::to_string(total_bytes()));
  }
  if (data.empty()) return;
  uint64_t off = added_.size();
  added_.append(data.data(), data.size());
  tree_.insert(pos, Piece::added(off, data.size()));
}

void TextBuffer::delete_bytes(uint64_t pos, uint64_t len) { tree_.erase(pos, len); }

bool TextBuffer::read_original(uint64_t offset, uint64_t len, std::string& out, Error& err) const {
  if (original_cache_) {
    out.append(*original_cache_, static_cast<size_t>(offset), static_cast<size_t>(len));
    return true;
  }
  std::string tmp;
  if (!fs_->read_range(file_path_, offset, len, tmp, err)) return false;
  out += tmp;
  return true;
}

bool TextBuffer::read_piece(const Piece& p, uint64_t skip, uint64_t take, std::string& out, Error& err) const {
  if (p.source == Piece::Source::Added) {
    out.append(added_, static_cast<size_t>(p.offset + skip), static_cast<size_t>(take));
    return true;
  }
  return read_original(p.offset + skip, take, out, err);
}

bool TextBuffer::read_range(uint64_t pos, uint64_t len, std::string& out, Error& err) const {
  out.clear();
  out.reserve(static_cast<size_t>(len));
  bool ok = true;
  tree_.for_each_in_range(pos, len, [&](const Piece& p, uint64_t skip, uint64_t take) {
    if (ok) ok = read_piece(p, skip, take, out, err);
  });
  if (!ok) out.clear();
  return ok;
}

bool TextBuffer::to_string(std::string& out, Error& err) const { return read_range(0, total_bytes(), out, err); }

bool TextBuffer::line_count(uint64_t& out, Error& err) const {
  uint64_t newlines = 0;
  uint64_t total = total_bytes();
  std::string window;
  for (uint64_t pos = 0; pos < total; pos += window.size()) {
    uint64_t n = std::min<uint64_t>(load_chunk_size_, total - pos);
    if (!read_range(pos, n, window, err)) return false;
    newlines += count_newlines(window.data(), window.size());
  }
  out = newlines + 1;
  return true;
}

std::vector<WriteOp> TextBuffer::build_write_recipe() const {
  std::vector<WriteOp> ops;
  for (const Piece& p : tree_.pieces()) {
    if (p.source == Piece::Source::Original) {
      if (!ops.empty()) {
        if (auto* c = std::get_if<WriteCopy>(&ops.back()); c && c->offset + c->len == p.offset) {
          c->len += p.len;
          continue;
        }
      }
      ops.emplace_back(WriteCopy{p.offset, p.len});
    } else {
      std::string_view bytes(added_.data() + p.offset, static_cast<size_t>(p.len));
      if (!ops.empty()) {
        if (auto* ins = std::get_if<WriteInsert>(&ops.back())) {
          ins->data.append(bytes.data(), bytes.size());
          continue;
        }
      }
      ops.emplace_back(WriteInsert{std::string(bytes)});
    }
  }
  return ops;
}

bool TextBuffer::build_recovery_chunks(std::vector<RecoveryChunk>& out, Error& err) const {
  out.clear();
  if (!tracked_) return fail(err, ErrorKind::InvalidData, "buffer has no backing file to diff against");
  uint64_t orig_pos = 0;
  std::string pending;
  for (const Piece& p : tree_.pieces()) {
    if (p.source == Piece::Source::Original && p.offset >= orig_pos) {
      if (p.offset > orig_pos || !pending.empty()) {
        out.push_back(RecoveryChunk::make(orig_pos, p.offset - orig_pos, std::move(pending)));
        pending.clear();
      }
      orig_pos = p.offset + p.len;
      continue;
    }
    if (!read_piece(p, 0, p.len, pending, err)) return false;
  }
  if (orig_pos < original_size_ || !pending.empty()) {
    out.push_back(RecoveryChunk::make(orig_pos, original_size_ - orig_pos, std::move(pending)));
  }
  return true;
}

std::string convert_line_endings(std::string_view text, LineEnding to) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (to == LineEnding::LF) {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
      out.push_back(c);
    } else {
      if (c == '\n' && (i == 0 || text[i - 1] != '\r')) out.push_back('\r');
      out.push_back(c);
    }
  }
  return out;
}

void TextBuffer::reanchor(const std::filesystem::path& path, uint64_t size, std::optional<std::string> content) {
  file_path_ = path;
  tracked_ = true;
  original_size_ = size;
  original_cache_ = std::move(content);
  added_.clear();
  if (size > 0) tree_.assign({Piece::original(0, size)});
  else tree_.clear();
  file_line_ending_ = line_ending_;
}

bool TextBuffer::save_to_file(const std::filesystem::path& path, Error& err) {
  bool same_file = tracked_ && path == file_path_;
  bool convert = line_ending_ != file_line_ending_;
  std::optional<std::string> content;
  uint64_t new_size = 0;
  bool ok = false;
  if (same_file && !convert) {
    if (total_bytes() <= large_file_threshold_) {
      std::string s;
      if (!to_string(s, err)) return false;
      content = std::move(s);
    }
    std::vector<WriteOp> ops = build_write_recipe();
    for (const auto& op : ops) new_size += write_op_output_len(op);
    ok = fs_->write_patched(file_path_, path, ops, err);
  } else {
    std::string s;
    if (!to_string(s, err)) return false;
    if (convert) s = convert_line_endings(s, line_ending_);
    new_size = s.size();
    ok = fs_->write_file(path, s, err);
    if (new_size <= large_file_threshold_) content = std::move(s);
  }
  if (!ok) return false;
  reanchor(path, new_size, std::move(content));
  mark_saved();
  log_info("saved file: " + path.string());
  return true;
}

bool TextBuffer::checksum_of(const std::vector<Piece>& pieces, std::string& out, Error& err) const {
  Fnv1a h;
  std::string window;
  for (const Piece& p : pieces) {
    for (uint64_t done = 0; done < p.len;) {
      uint64_t n = std::min<uint64_t>(load_chunk_size_, p.len - done);
      window.clear();
      if (!read_piece(p, done, n, window, err)) return false;
      h.update(window);
      done += n;
    }
  }
  out = h.hex();
  return true;
}

bool TextBuffer::content_checksum(std::string& out, Error& err) const { return checksum_of(tree_.pieces(), out, err); }

void TextBuffer::mark_saved() {
  saved_len_ = total_bytes();
  saved_pieces_ = tree_.pieces();
  saved_checksum_.reset();
}

bool TextBuffer::is_modified() const {
  if (total_bytes() != saved_len_) return true;
  std::vector<Piece> now = tree_.pieces();
  if (now == saved_pieces_) return false;
  Error err;
  if (!saved_checksum_) {
    std::string sum;
    if (!checksum_of(saved_pieces_, sum, err)) {
      log_debug("modified check: saved state unreadable: " + err.message);
      return true;
    }
    saved_checksum_ = std::move(sum);
  }
  std::string cur;
  if (!checksum_of(now, cur, err)) {
    log_debug("modified check: content unreadable: " + err.message);
    return true;
  }
  return cur != *saved_checksum_;
}
