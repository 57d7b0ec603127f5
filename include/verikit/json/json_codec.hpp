#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"

namespace verikit {
namespace json {

using Json = nlohmann::json;

class VERIKIT_API JsonCodec {
 public:
  // Parse JSON text into a DOM object.
  // Returns JSON_PARSE_FAILED when text is not valid JSON.
  static api::Result<Json> Parse(const std::string& text);

  // Load and parse a JSON file. Returns kNotFound when the file cannot be opened.
  static api::Result<Json> LoadFile(const std::string& path);

  // Serialize to "<path>.tmp" and rename over <path>, so readers never see a
  // partially written document. Returns JSON_WRITE_FAILED on I/O errors.
  static api::Status SaveFile(const std::string& path, const Json& value, int indent = 2);

  // Serialize for logging; invalid UTF-8 is replaced rather than thrown.
  static std::string Dump(const Json& value, int indent = -1);
};

}  // namespace json
}  // namespace verikit
