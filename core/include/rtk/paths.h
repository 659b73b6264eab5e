#pragma once

#include "rtk/error.h"

#include <filesystem>
#include <string>

namespace rtk {

struct ResolvedPaths {
  std::filesystem::path workspace;
  std::filesystem::path output_dir;
  std::filesystem::path snapshot_file;
  std::filesystem::path logs_dir;
};

// Pure path arithmetic; nothing is created.
ResolvedPaths resolve_paths(const std::filesystem::path& workspace, const std::string& output);

// Creates the output directory; the workspace itself must already exist.
bool prepare_output_dir(const ResolvedPaths& paths, RunError& error);

} // namespace rtk
