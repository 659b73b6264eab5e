#include "rtk/paths.h"

#include "rtk/snapshot.h"

#include <cstdlib>

namespace rtk {

ResolvedPaths resolve_paths(const std::filesystem::path& workspace, const std::string& output) {
  ResolvedPaths out;
  std::error_code ec;
  out.workspace = std::filesystem::absolute(workspace, ec);
  if (ec) {
    out.workspace = workspace;
  }
  out.output_dir = out.workspace / output;
  out.snapshot_file = out.output_dir / snapshot::kSnapshotFileName;
  if (const char* env = std::getenv("RTK_LOG_DIR")) {
    out.logs_dir = std::filesystem::path(env);
  } else {
    out.logs_dir = out.workspace / ".roletrack" / "logs";
  }
  return out;
}

bool prepare_output_dir(const ResolvedPaths& paths, RunError& error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(paths.workspace, ec)) {
    set_error(error, ErrorKind::Config, "workspace not found: " + paths.workspace.string());
    return false;
  }
  std::filesystem::create_directories(paths.output_dir, ec);
  if (ec) {
    set_error(error, ErrorKind::Output, "cannot create output dir " + paths.output_dir.string() + ": " + ec.message());
    return false;
  }
  return true;
}

} // namespace rtk
