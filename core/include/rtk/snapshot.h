#pragma once

#include "rtk/directory.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rtk::snapshot {

constexpr const char* kSnapshotFileName = "data.json";

struct WorldInfo {
  std::string id;
  std::string name;
  int64_t visits = 0;
  int64_t favorites = 0;
  int64_t occupants = 0;
};

struct TrackedRole {
  std::string name;
  bool is_admin = false;
  bool is_moderator = false;
  std::vector<int> vrc_users;
};

struct TrackedContext {
  std::string name;
  std::vector<int> vrc_users;
  std::map<std::string, TrackedRole> roles;
};

struct TrackedWorld {
  std::string name;
  int64_t visits = 0;
  int64_t favorites = 0;
  int64_t occupants = 0;
};

struct Snapshot {
  std::vector<std::string> vrc_user_display_names;
  std::map<std::string, TrackedContext> vrc_groups_by_id;
  std::map<std::string, TrackedContext> discord_servers_by_id;
  std::map<std::string, TrackedWorld> vrc_worlds_by_id;
};

Snapshot assemble(const directory::Directory& dir, const std::vector<WorldInfo>& worlds);

// Default-valued fields (false, 0, empty) are left out.
nlohmann::json to_json(const Snapshot& snap);
bool from_json(const nlohmann::json& j, Snapshot& out, std::string& error);

// Role id -> member display names, resolving indices through the canonical list.
std::map<std::string, std::vector<std::string>> role_members(const Snapshot& snap,
                                                             const TrackedContext& context);

} // namespace rtk::snapshot
