#include "verikit/json/json_codec.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace verikit {
namespace json {

#define VK_JSON_STATUS(code, message, detail_id) \
  api::Status::FromModule((code), (message), api::ErrorModule::kJson, (detail_id))

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::parse_error& ex) {
    return api::Result<Json>(VK_JSON_STATUS(api::StatusCode::kInvalidArgument,
                                            std::string("json parse failed: ") + ex.what(),
                                            api::detail::kJsonParseFailed));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kNotFound, "cannot open json file: " + path, api::ErrorModule::kJson));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  api::Result<Json> parsed = Parse(buffer.str());
  if (!parsed.ok()) {
    return api::Result<Json>(VK_JSON_STATUS(parsed.status().code(),
                                            path + ": " + parsed.status().message(),
                                            api::detail::kJsonParseFailed));
  }
  return parsed;
}

api::Status JsonCodec::SaveFile(const std::string& path, const Json& value, int indent) {
  // Invalid UTF-8 is replaced rather than rejected, as in Dump().
  const std::string text = Dump(value, indent);
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return VK_JSON_STATUS(api::StatusCode::kIoError, "cannot open for write: " + tmp_path,
                            api::detail::kJsonWriteFailed);
    }
    out << text << "\n";
    out.flush();
    if (!out) {
      out.close();
      std::remove(tmp_path.c_str());
      return VK_JSON_STATUS(api::StatusCode::kIoError, "write failed: " + tmp_path,
                            api::detail::kJsonWriteFailed);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    std::remove(tmp_path.c_str());
    return VK_JSON_STATUS(api::StatusCode::kIoError, "rename failed: " + path,
                          api::detail::kJsonWriteFailed);
  }
  return api::Status::Ok();
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

#undef VK_JSON_STATUS

}  // namespace json
}  // namespace verikit
