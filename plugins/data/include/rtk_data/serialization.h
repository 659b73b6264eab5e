#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace rtk::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);
// Pretty-printed with two-space indentation, written through write_text_file_atomic.
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node, std::string& error);

// Writes a sibling temp file and renames it over path, so readers only ever
// see the previous or the complete new contents.
bool write_text_file_atomic(const std::filesystem::path& path, const std::string& contents, std::string& error);

} // namespace rtk::data
