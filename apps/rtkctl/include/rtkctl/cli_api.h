#pragma once

#include "rtk/config.h"
#include "rtk/snapshot.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct TrackArgs {
  rtk::TrackerConfig config;
  std::optional<std::filesystem::path> config_path;
};

struct InspectArgs {
  std::filesystem::path in_path;
  // "<contextId>" or "<contextId>/<roleId>".
  std::optional<std::string> filter;
};

// args excludes the program name and the command word.
bool parse_track_args(const std::vector<std::string>& args, TrackArgs& out, std::string& error);
bool parse_inspect_args(const std::vector<std::string>& args, InspectArgs& out, std::string& error);

int track_command(const TrackArgs& args);
int inspect_command(const InspectArgs& args);

// Prints every context's roles with member display names.
bool write_inspect_report(const rtk::snapshot::Snapshot& snap, const std::optional<std::string>& filter,
                          std::ostream& out, std::string& error);
