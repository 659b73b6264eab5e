#include "rtk/directory.h"

#include <algorithm>
#include <unordered_set>

namespace rtk::directory {

namespace {
bool contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void append_index(std::vector<int>& out, const std::vector<std::string>& names, const std::string& name) {
  const int index = canonical_index(names, name);
  if (index != kNotFound) {
    out.push_back(index);
  }
}

void sort_unique(std::vector<int>& values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
}
} // namespace

std::vector<std::string> build_canonical_names(const std::vector<MembershipContext>& groups,
                                               const std::vector<MembershipContext>& servers) {
  std::vector<std::string> names;
  for (const auto* contexts : {&groups, &servers}) {
    for (const auto& context : *contexts) {
      for (const auto& member : context.members) {
        names.push_back(member.display_name);
      }
    }
  }
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

int canonical_index(const std::vector<std::string>& names, const std::string& name) {
  const auto it = std::lower_bound(names.begin(), names.end(), name);
  if (it == names.end() || *it != name) {
    return kNotFound;
  }
  return static_cast<int>(it - names.begin());
}

bool is_admin_role(const RoleDefinition& role, const PermissionMarkers& markers) {
  return contains(role.permissions, markers.admin);
}

bool is_moderator_role(const RoleDefinition& role, const PermissionMarkers& markers) {
  return is_admin_role(role, markers) || contains(role.permissions, markers.moderator);
}

std::vector<RoleDefinition> roles_held_by_members(const std::vector<RoleDefinition>& roles,
                                                  const std::vector<ContextMember>& members) {
  std::unordered_set<std::string> held;
  for (const auto& member : members) {
    held.insert(member.role_ids.begin(), member.role_ids.end());
  }
  std::vector<RoleDefinition> out;
  for (const auto& role : roles) {
    if (held.count(role.id) > 0) {
      out.push_back(role);
    }
  }
  return out;
}

ContextProjection project_context(const MembershipContext& context,
                                  const std::vector<std::string>& names) {
  ContextProjection out;
  out.id = context.id;
  out.name = context.name;
  for (const auto& member : context.members) {
    append_index(out.users, names, member.display_name);
  }
  sort_unique(out.users);

  for (const auto& role : context.roles) {
    RoleProjection projected;
    projected.id = role.id;
    projected.name = role.name;
    projected.is_admin = is_admin_role(role, context.markers);
    projected.is_moderator = is_moderator_role(role, context.markers);
    for (const auto& member : context.members) {
      if (contains(member.role_ids, role.id)) {
        append_index(projected.users, names, member.display_name);
      }
    }
    sort_unique(projected.users);
    out.roles.push_back(std::move(projected));
  }
  return out;
}

Directory build_directory(const std::vector<MembershipContext>& groups,
                          const std::vector<MembershipContext>& servers) {
  Directory dir;
  dir.display_names = build_canonical_names(groups, servers);
  for (const auto& group : groups) {
    dir.groups.push_back(project_context(group, dir.display_names));
  }
  for (const auto& server : servers) {
    dir.servers.push_back(project_context(server, dir.display_names));
  }
  return dir;
}

} // namespace rtk::directory
