#include "rtk_data/serialization.h"

#include <fstream>

namespace rtk::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "JSON read failed: " + path.string();
    return false;
  }
  try {
    in >> out;
  } catch (const nlohmann::json::exception& e) {
    error = std::string("JSON parse failed: ") + e.what();
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node, std::string& error) {
  // Invalid UTF-8 in upstream display names becomes U+FFFD instead of a failed run.
  std::string text = node.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  text += "\n";
  return write_text_file_atomic(path, text, error);
}

} // namespace rtk::data
