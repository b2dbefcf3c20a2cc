#include "protocol.hpp"
#include "codec.hpp"
#include "json_util.hpp"

static std::string line_of(const Json::Value& v) {
  std::string s = json_to_compact(v);
  s.push_back('\n');
  return s;
}

std::string encode_request(uint64_t id, const std::string& method, const Json::Value& params) {
  Json::Value v(Json::objectValue);
  v["id"] = Json::UInt64(id);
  v["method"] = method;
  v["params"] = params;
  return line_of(v);
}

std::string encode_data(uint64_t id, const Json::Value& data) {
  Json::Value v(Json::objectValue);
  v["id"] = Json::UInt64(id);
  v["data"] = data;
  return line_of(v);
}

std::string encode_result(uint64_t id, const Json::Value& result) {
  Json::Value v(Json::objectValue);
  v["id"] = Json::UInt64(id);
  v["result"] = result;
  return line_of(v);
}

std::string encode_error(uint64_t id, const std::string& message) {
  Json::Value v(Json::objectValue);
  v["id"] = Json::UInt64(id);
  v["error"] = message;
  return line_of(v);
}

Json::Value path_params(const std::filesystem::path& path) {
  Json::Value v(Json::objectValue);
  v["path"] = path.string();
  return v;
}

Json::Value read_params(const std::filesystem::path& path, uint64_t offset, uint64_t len) {
  Json::Value v = path_params(path);
  v["off"] = Json::UInt64(offset);
  v["len"] = Json::UInt64(len);
  return v;
}

Json::Value read_all_params(const std::filesystem::path& path) { return path_params(path); }

Json::Value write_params(const std::filesystem::path& path, const std::string& data) {
  Json::Value v = path_params(path);
  v["data"] = base64_encode(data);
  return v;
}

Json::Value patch_params(const std::filesystem::path& src, const std::filesystem::path& dst,
                         const std::vector<WriteOp>& ops) {
  Json::Value v(Json::objectValue);
  v["src"] = src.string();
  v["dst"] = dst.string();
  Json::Value arr(Json::arrayValue);
  for (const WriteOp& op : ops) {
    Json::Value o(Json::objectValue);
    if (const auto* c = std::get_if<WriteCopy>(&op)) {
      Json::Value pair(Json::arrayValue);
      pair.append(Json::UInt64(c->offset));
      pair.append(Json::UInt64(c->len));
      o["copy"] = pair;
    } else {
      o["insert"] = base64_encode(std::get<WriteInsert>(op).data);
    }
    arr.append(o);
  }
  v["ops"] = arr;
  return v;
}

Json::Value truncate_params(const std::filesystem::path& path, uint64_t len) {
  Json::Value v = path_params(path);
  v["len"] = Json::UInt64(len);
  return v;
}

Json::Value append_params(const std::filesystem::path& path, const std::string& data) {
  return write_params(path, data);
}

Json::Value cancel_params(uint64_t request_id) {
  Json::Value v(Json::objectValue);
  v["id"] = Json::UInt64(request_id);
  return v;
}

bool decode_write_ops(const Json::Value& arr, std::vector<WriteOp>& out, Error& err) {
  out.clear();
  if (!arr.isArray()) return fail(err, ErrorKind::InvalidData, "ops is not an array");
  for (const auto& o : arr) {
    if (o.isMember("copy")) {
      const Json::Value& pair = o["copy"];
      if (!pair.isArray() || pair.size() != 2 || !pair[0].isUInt64() || !pair[1].isUInt64()) {
        return fail(err, ErrorKind::InvalidData, "malformed copy op");
      }
      out.emplace_back(WriteCopy{pair[0].asUInt64(), pair[1].asUInt64()});
    } else if (o.isMember("insert")) {
      WriteInsert ins;
      if (!o["insert"].isString() || !base64_decode(o["insert"].asString(), ins.data)) {
        return fail(err, ErrorKind::InvalidData, "malformed insert op");
      }
      out.emplace_back(std::move(ins));
    } else {
      return fail(err, ErrorKind::InvalidData, "unknown write op");
    }
  }
  return true;
}

Json::Value metadata_to_json(const FileMetadata& md) {
  Json::Value v(Json::objectValue);
  v["size"] = Json::UInt64(md.size);
  v["mtime"] = Json::UInt64(md.mtime);
  v["mode"] = Json::UInt(md.mode);
  v["is_dir"] = md.is_dir;
  v["is_file"] = md.is_file;
  return v;
}

bool metadata_from_json(const Json::Value& v, FileMetadata& out, Error& err) {
  if (!v.isObject() || !v["size"].isUInt64()) return fail(err, ErrorKind::InvalidData, "malformed stat result");
  out.size = v["size"].asUInt64();
  out.mtime = v.get("mtime", 0).asUInt64();
  out.mode = v.get("mode", 0).asUInt();
  out.is_dir = v.get("is_dir", false).asBool();
  out.is_file = v.get("is_file", false).asBool();
  return true;
}

Json::Value dir_entry_to_json(const DirEntry& e) {
  Json::Value v(Json::objectValue);
  v["name"] = e.name;
  v["path"] = e.path.string();
  v["is_dir"] = e.is_dir;
  v["is_file"] = e.is_file;
  v["size"] = Json::UInt64(e.size);
  return v;
}

bool dir_entry_from_json(const Json::Value& v, DirEntry& out, Error& err) {
  if (!v.isObject() || !v["name"].isString() || !v["path"].isString()) {
    return fail(err, ErrorKind::InvalidData, "malformed directory entry");
  }
  out.name = v["name"].asString();
  out.path = v["path"].asString();
  out.is_dir = v.get("is_dir", false).asBool();
  out.is_file = v.get("is_file", false).asBool();
  out.size = v.get("size", 0).asUInt64();
  return true;
}

Json::Value data_chunk(const std::string& bytes) {
  Json::Value v(Json::objectValue);
  v["data"] = base64_encode(bytes);
  return v;
}

bool decode_data_chunk(const Json::Value& v, std::string& out, Error& err) {
  if (!v.isObject() || !v["data"].isString() || !base64_decode(v["data"].asString(), out)) {
    return fail(err, ErrorKind::InvalidData, "malformed data chunk");
  }
  return true;
}
