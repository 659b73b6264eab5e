#include "rtk_data/serialization.h"

#include <fstream>

namespace rtk::data {

bool write_text_file_atomic(const std::filesystem::path& path, const std::string& contents, std::string& error) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "failed to open for write: " + tmp.string();
      return false;
    }
    out << contents;
    out.flush();
    if (!out) {
      error = "failed to write file: " + tmp.string();
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    error = "failed to replace " + path.string() + ": " + ec.message();
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return false;
  }
  return true;
}

} // namespace rtk::data
