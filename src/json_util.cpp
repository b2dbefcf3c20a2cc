#include "json_util.hpp"
#include <memory>

std::string json_to_pretty(const Json::Value& v) {
  Json::StreamWriterBuilder b;
  b["indentation"] = "  ";
  return Json::writeString(b, v);
}

std::string json_to_compact(const Json::Value& v) {
  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  return Json::writeString(b, v);
}

bool json_parse(const std::string& text, Json::Value& out, Error& err) {
  Json::CharReaderBuilder b;
  std::unique_ptr<Json::CharReader> reader(b.newCharReader());
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
    return fail(err, ErrorKind::InvalidData, "invalid json: " + errs);
  }
  return true;
}
