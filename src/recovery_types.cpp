#include "recovery_types.hpp"
#include "checksum.hpp"
#include "codec.hpp"
#include "json_util.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <type_traits>
#include <signal.h>
#include <unistd.h>
#include <cerrno>

uint64_t unix_now() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

static bool get_u64(const Json::Value& v, const char* key, uint64_t& out, Error& err) {
  const Json::Value& f = v[key];
  if (!f.isUInt64()) return fail(err, ErrorKind::InvalidData, std::string("missing or invalid field: ") + key);
  out = f.asUInt64();
  return true;
}

static bool get_opt_u64(const Json::Value& v, const char* key, std::optional<uint64_t>& out, Error& err) {
  const Json::Value& f = v[key];
  if (f.isNull()) { out.reset(); return true; }
  if (!f.isUInt64()) return fail(err, ErrorKind::InvalidData, std::string("invalid field: ") + key);
  out = f.asUInt64();
  return true;
}

static bool get_opt_str(const Json::Value& v, const char* key, std::optional<std::string>& out, Error& err) {
  const Json::Value& f = v[key];
  if (f.isNull()) { out.reset(); return true; }
  if (!f.isString()) return fail(err, ErrorKind::InvalidData, std::string("invalid field: ") + key);
  out = f.asString();
  return true;
}

template <typename T>
static Json::Value opt_json(const std::optional<T>& o) {
  if (!o) return Json::Value(Json::nullValue);
  if constexpr (std::is_same_v<T, uint64_t>) return Json::Value(Json::UInt64(*o));
  else return Json::Value(*o);
}

RecoveryChunk RecoveryChunk::make(uint64_t offset, uint64_t original_len, std::string content) {
  RecoveryChunk c;
  c.offset = offset;
  c.original_len = original_len;
  c.checksum = compute_checksum(content);
  c.content = std::move(content);
  return c;
}

bool RecoveryChunk::verify() const { return compute_checksum(content) == checksum; }

Json::Value RecoveryChunk::to_json() const {
  Json::Value v(Json::objectValue);
  v["offset"] = Json::UInt64(offset);
  v["original_len"] = Json::UInt64(original_len);
  v["content"] = base64_encode(content);
  v["checksum"] = checksum;
  return v;
}

bool RecoveryChunk::from_json(const Json::Value& v, RecoveryChunk& out, Error& err) {
  if (!v.isObject()) return fail(err, ErrorKind::InvalidData, "chunk is not an object");
  if (!get_u64(v, "offset", out.offset, err)) return false;
  if (!get_u64(v, "original_len", out.original_len, err)) return false;
  if (!v["content"].isString() || !v["checksum"].isString()) {
    return fail(err, ErrorKind::InvalidData, "chunk content/checksum missing");
  }
  if (!base64_decode(v["content"].asString(), out.content)) {
    return fail(err, ErrorKind::InvalidData, "chunk content is not valid base64");
  }
  out.checksum = v["checksum"].asString();
  return true;
}

bool ChunkedRecoveryData::apply(const std::string& original, std::string& out, Error& err) const {
  out.clear();
  if (original.size() != original_size) {
    return fail(err, ErrorKind::SizeMismatch,
                "original file size mismatch: expected " + std::to_string(original_size) +
                ", got " + std::to_string(original.size()));
  }
  std::vector<const RecoveryChunk*> order;
  order.reserve(chunks.size());
  for (const auto& c : chunks) order.push_back(&c);
  std::stable_sort(order.begin(), order.end(),
                   [](const RecoveryChunk* a, const RecoveryChunk* b){ return a->offset < b->offset; });

  out.reserve(static_cast<size_t>(final_size));
  uint64_t pos = 0;
  for (const RecoveryChunk* c : order) {
    if (!c->verify()) {
      return fail(err, ErrorKind::ChecksumMismatch,
                  "chunk at offset " + std::to_string(c->offset) + " failed checksum verification");
    }
    if (c->offset < pos || c->offset + c->original_len > original.size()) {
      return fail(err, ErrorKind::InvalidData,
                  "chunk at offset " + std::to_string(c->offset) + " is out of order or out of range");
    }
    out.append(original, static_cast<size_t>(pos), static_cast<size_t>(c->offset - pos));
    out += c->content;
    pos = c->offset + c->original_len;
  }
  if (pos < original.size()) out.append(original, static_cast<size_t>(pos), std::string::npos);
  if (out.size() != final_size) {
    return fail(err, ErrorKind::SizeMismatch,
                "reconstructed size mismatch: expected " + std::to_string(final_size) +
                ", got " + std::to_string(out.size()));
  }
  return true;
}

Json::Value ChunkedRecoveryData::to_json() const {
  Json::Value v(Json::objectValue);
  v["original_size"] = Json::UInt64(original_size);
  v["final_size"] = Json::UInt64(final_size);
  Json::Value arr(Json::arrayValue);
  for (const auto& c : chunks) arr.append(c.to_json());
  v["chunks"] = arr;
  return v;
}

bool ChunkedRecoveryData::from_json(const Json::Value& v, ChunkedRecoveryData& out, Error& err) {
  if (!v.isObject()) return fail(err, ErrorKind::InvalidData, "chunked data is not an object");
  if (!get_u64(v, "original_size", out.original_size, err)) return false;
  if (!get_u64(v, "final_size", out.final_size, err)) return false;
  const Json::Value& arr = v["chunks"];
  if (!arr.isArray()) return fail(err, ErrorKind::InvalidData, "chunks is not an array");
  out.chunks.clear();
  out.chunks.reserve(arr.size());
  for (const auto& item : arr) {
    RecoveryChunk c;
    if (!RecoveryChunk::from_json(item, c, err)) return false;
    out.chunks.push_back(std::move(c));
  }
  return true;
}

void RecoveryMetadata::update(std::string new_checksum, uint64_t new_size, std::optional<uint64_t> new_lines) {
  checksum = std::move(new_checksum);
  content_size = new_size;
  line_count = new_lines;
  updated_at = unix_now();
}

Json::Value RecoveryMetadata::to_json() const {
  Json::Value v(Json::objectValue);
  v["version"] = version;
  v["original_path"] = opt_json(original_path);
  v["buffer_name"] = opt_json(buffer_name);
  v["checksum"] = checksum;
  v["content_size"] = Json::UInt64(content_size);
  v["line_count"] = opt_json(line_count);
  v["original_mtime"] = opt_json(original_mtime);
  v["created_at"] = Json::UInt64(created_at);
  v["updated_at"] = Json::UInt64(updated_at);
  v["format"] = (format == RecoveryFormat::Chunked) ? "chunked" : "full";
  v["chunk_count"] = opt_json(chunk_count);
  v["original_file_size"] = opt_json(original_file_size);
  return v;
}

bool RecoveryMetadata::from_json(const Json::Value& v, RecoveryMetadata& out, Error& err) {
  if (!v.isObject()) return fail(err, ErrorKind::InvalidData, "metadata is not an object");
  out.version = v.get("version", kVersion).asInt();
  if (!get_opt_str(v, "original_path", out.original_path, err)) return false;
  if (!get_opt_str(v, "buffer_name", out.buffer_name, err)) return false;
  if (!v["checksum"].isString()) return fail(err, ErrorKind::InvalidData, "missing or invalid field: checksum");
  out.checksum = v["checksum"].asString();
  if (!get_u64(v, "content_size", out.content_size, err)) return false;
  if (!get_opt_u64(v, "line_count", out.line_count, err)) return false;
  if (!get_opt_u64(v, "original_mtime", out.original_mtime, err)) return false;
  if (!get_u64(v, "created_at", out.created_at, err)) return false;
  if (!get_u64(v, "updated_at", out.updated_at, err)) return false;
  std::string fmt = v.get("format", "full").asString();
  if (fmt == "full") out.format = RecoveryFormat::Full;
  else if (fmt == "chunked") out.format = RecoveryFormat::Chunked;
  else return fail(err, ErrorKind::InvalidData, "unknown recovery format: " + fmt);
  if (!get_opt_u64(v, "chunk_count", out.chunk_count, err)) return false;
  if (!get_opt_u64(v, "original_file_size", out.original_file_size, err)) return false;
  return true;
}

SessionInfo SessionInfo::current() {
  SessionInfo s;
  s.pid = static_cast<int64_t>(::getpid());
  s.started_at = unix_now();
  return s;
}

bool SessionInfo::is_running() const {
  if (pid <= 0) return false;
  if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
  return errno == EPERM;
}

Json::Value SessionInfo::to_json() const {
  Json::Value v(Json::objectValue);
  v["pid"] = Json::Int64(pid);
  v["started_at"] = Json::UInt64(started_at);
  return v;
}

bool SessionInfo::from_json(const Json::Value& v, SessionInfo& out, Error& err) {
  if (!v.isObject() || !v["pid"].isInt64()) return fail(err, ErrorKind::InvalidData, "invalid session lock");
  out.pid = v["pid"].asInt64();
  return get_u64(v, "started_at", out.started_at, err);
}
