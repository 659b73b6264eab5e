#pragma once

#include <string>
#include <vector>

namespace rtk::directory {

struct PermissionMarkers {
  std::string admin;
  std::string moderator;
};

// VRChat group role permissions.
inline const PermissionMarkers kVrcGroupMarkers{"*", "group-instance-moderate"};
// Names the Discord client gives the administrator and moderate-members bits.
inline const PermissionMarkers kDiscordMarkers{"administrator", "moderate_members"};

struct RoleDefinition {
  std::string id;
  std::string name;
  std::vector<std::string> permissions;
};

struct ContextMember {
  std::string display_name;
  std::vector<std::string> role_ids;
};

// A VRChat group or a Discord server, reduced to what the directory needs.
struct MembershipContext {
  std::string id;
  std::string name;
  std::vector<RoleDefinition> roles;
  std::vector<ContextMember> members;
  PermissionMarkers markers;
};

struct RoleProjection {
  std::string id;
  std::string name;
  bool is_admin = false;
  bool is_moderator = false;
  std::vector<int> users;
};

struct ContextProjection {
  std::string id;
  std::string name;
  std::vector<int> users;
  std::vector<RoleProjection> roles;
};

struct Directory {
  std::vector<std::string> display_names;
  std::vector<ContextProjection> groups;
  std::vector<ContextProjection> servers;
};

constexpr int kNotFound = -1;

std::vector<std::string> build_canonical_names(const std::vector<MembershipContext>& groups,
                                               const std::vector<MembershipContext>& servers);

// Position of name in the sorted canonical list, or kNotFound.
int canonical_index(const std::vector<std::string>& names, const std::string& name);

bool is_admin_role(const RoleDefinition& role, const PermissionMarkers& markers);
bool is_moderator_role(const RoleDefinition& role, const PermissionMarkers& markers);

std::vector<RoleDefinition> roles_held_by_members(const std::vector<RoleDefinition>& roles,
                                                  const std::vector<ContextMember>& members);

ContextProjection project_context(const MembershipContext& context,
                                  const std::vector<std::string>& names);

Directory build_directory(const std::vector<MembershipContext>& groups,
                          const std::vector<MembershipContext>& servers);

} // namespace rtk::directory
