#include "rtk/snapshot.h"

#include <cstdint>

namespace rtk::snapshot {

using json = nlohmann::json;

namespace {
TrackedContext assemble_context(const directory::ContextProjection& projection) {
  TrackedContext out;
  out.name = projection.name;
  out.vrc_users = projection.users;
  for (const auto& role : projection.roles) {
    TrackedRole tracked;
    tracked.name = role.name;
    tracked.is_admin = role.is_admin;
    tracked.is_moderator = role.is_moderator;
    tracked.vrc_users = role.users;
    out.roles[role.id] = std::move(tracked);
  }
  return out;
}

void put_string(json& j, const char* key, const std::string& value) {
  if (!value.empty()) j[key] = value;
}

void put_bool(json& j, const char* key, bool value) {
  if (value) j[key] = true;
}

void put_int(json& j, const char* key, int64_t value) {
  if (value != 0) j[key] = value;
}

void put_indices(json& j, const char* key, const std::vector<int>& values) {
  if (!values.empty()) j[key] = values;
}

json context_to_json(const TrackedContext& context) {
  json j = json::object();
  put_string(j, "name", context.name);
  put_indices(j, "vrcUsers", context.vrc_users);
  json roles = json::object();
  for (const auto& [id, role] : context.roles) {
    json r = json::object();
    put_string(r, "name", role.name);
    put_bool(r, "isAdmin", role.is_admin);
    put_bool(r, "isModerator", role.is_moderator);
    put_indices(r, "vrcUsers", role.vrc_users);
    roles[id] = std::move(r);
  }
  if (!roles.empty()) j["roles"] = std::move(roles);
  return j;
}

// Optional typed fields: absent keeps the default, a wrong type is an error.
bool read_string(const json& j, const char* key, std::string& out, std::string& error) {
  if (!j.contains(key)) return true;
  if (!j[key].is_string()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = j[key].get<std::string>();
  return true;
}

bool read_bool(const json& j, const char* key, bool& out, std::string& error) {
  if (!j.contains(key)) return true;
  if (!j[key].is_boolean()) {
    error = std::string(key) + " must be a boolean";
    return false;
  }
  out = j[key].get<bool>();
  return true;
}

bool read_int(const json& j, const char* key, int64_t& out, std::string& error) {
  if (!j.contains(key)) return true;
  const auto& v = j[key];
  if (!v.is_number_integer() || (v.is_number_unsigned() && v.get<uint64_t>() > uint64_t(INT64_MAX))) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  out = v.get<int64_t>();
  return true;
}

// Indices are range-checked against the canonical list before narrowing.
bool read_indices(const json& j, size_t name_count, std::vector<int>& out, std::string& error) {
  if (!j.contains("vrcUsers")) return true;
  const auto& users = j["vrcUsers"];
  if (!users.is_array()) {
    error = "vrcUsers must be an array";
    return false;
  }
  for (const auto& v : users) {
    if (!v.is_number_integer()) {
      error = "vrcUsers entries must be integers";
      return false;
    }
    const bool negative = !v.is_number_unsigned() && v.get<int64_t>() < 0;
    if (negative || v.get<uint64_t>() >= name_count) {
      error = "user index out of range: " + v.dump();
      return false;
    }
    out.push_back(static_cast<int>(v.get<uint64_t>()));
  }
  return true;
}

bool context_from_json(const json& j, size_t name_count, TrackedContext& out, std::string& error) {
  if (!j.is_object()) {
    error = "context must be an object";
    return false;
  }
  if (!read_string(j, "name", out.name, error)) return false;
  if (!read_indices(j, name_count, out.vrc_users, error)) return false;
  if (j.contains("roles")) {
    if (!j["roles"].is_object()) {
      error = "roles must be an object";
      return false;
    }
    for (const auto& [id, r] : j["roles"].items()) {
      if (!r.is_object()) {
        error = "role " + id + " must be an object";
        return false;
      }
      TrackedRole role;
      if (!read_string(r, "name", role.name, error) || !read_bool(r, "isAdmin", role.is_admin, error) ||
          !read_bool(r, "isModerator", role.is_moderator, error) ||
          !read_indices(r, name_count, role.vrc_users, error)) {
        error = "role " + id + ": " + error;
        return false;
      }
      out.roles[id] = std::move(role);
    }
  }
  return true;
}

bool contexts_from_json(const json& j, const char* key, size_t name_count,
                        std::map<std::string, TrackedContext>& out, std::string& error) {
  if (!j.contains(key)) return true;
  if (!j[key].is_object()) {
    error = std::string(key) + " must be an object";
    return false;
  }
  for (const auto& [id, value] : j[key].items()) {
    TrackedContext context;
    if (!context_from_json(value, name_count, context, error)) {
      error = std::string(key) + "." + id + ": " + error;
      return false;
    }
    out[id] = std::move(context);
  }
  return true;
}
} // namespace

Snapshot assemble(const directory::Directory& dir, const std::vector<WorldInfo>& worlds) {
  Snapshot snap;
  snap.vrc_user_display_names = dir.display_names;
  for (const auto& group : dir.groups) {
    snap.vrc_groups_by_id[group.id] = assemble_context(group);
  }
  for (const auto& server : dir.servers) {
    snap.discord_servers_by_id[server.id] = assemble_context(server);
  }
  for (const auto& world : worlds) {
    snap.vrc_worlds_by_id[world.id] = TrackedWorld{world.name, world.visits, world.favorites, world.occupants};
  }
  return snap;
}

json to_json(const Snapshot& snap) {
  json j = json::object();
  if (!snap.vrc_user_display_names.empty()) {
    j["vrcUserDisplayNames"] = snap.vrc_user_display_names;
  }

  json groups = json::object();
  for (const auto& [id, group] : snap.vrc_groups_by_id) {
    groups[id] = context_to_json(group);
  }
  if (!groups.empty()) j["vrcGroupsById"] = std::move(groups);

  json servers = json::object();
  for (const auto& [id, server] : snap.discord_servers_by_id) {
    servers[id] = context_to_json(server);
  }
  if (!servers.empty()) j["discordServersById"] = std::move(servers);

  json worlds = json::object();
  for (const auto& [id, world] : snap.vrc_worlds_by_id) {
    json w = json::object();
    put_string(w, "name", world.name);
    put_int(w, "visits", world.visits);
    put_int(w, "favorites", world.favorites);
    put_int(w, "occupants", world.occupants);
    worlds[id] = std::move(w);
  }
  if (!worlds.empty()) j["vrcWorldsById"] = std::move(worlds);
  return j;
}

bool from_json(const json& j, Snapshot& out, std::string& error) {
  if (!j.is_object()) {
    error = "snapshot root must be an object";
    return false;
  }
  Snapshot snap;
  if (j.contains("vrcUserDisplayNames")) {
    const auto& names = j["vrcUserDisplayNames"];
    if (!names.is_array()) {
      error = "vrcUserDisplayNames must be an array";
      return false;
    }
    for (const auto& v : names) {
      if (!v.is_string()) {
        error = "vrcUserDisplayNames entries must be strings";
        return false;
      }
      snap.vrc_user_display_names.push_back(v.get<std::string>());
    }
  }
  const size_t name_count = snap.vrc_user_display_names.size();
  if (!contexts_from_json(j, "vrcGroupsById", name_count, snap.vrc_groups_by_id, error)) return false;
  if (!contexts_from_json(j, "discordServersById", name_count, snap.discord_servers_by_id, error)) return false;

  if (j.contains("vrcWorldsById")) {
    if (!j["vrcWorldsById"].is_object()) {
      error = "vrcWorldsById must be an object";
      return false;
    }
    for (const auto& [id, w] : j["vrcWorldsById"].items()) {
      if (!w.is_object()) {
        error = "world " + id + " must be an object";
        return false;
      }
      TrackedWorld world;
      if (!read_string(w, "name", world.name, error) || !read_int(w, "visits", world.visits, error) ||
          !read_int(w, "favorites", world.favorites, error) || !read_int(w, "occupants", world.occupants, error)) {
        error = "world " + id + ": " + error;
        return false;
      }
      snap.vrc_worlds_by_id[id] = std::move(world);
    }
  }
  out = std::move(snap);
  return true;
}

std::map<std::string, std::vector<std::string>> role_members(const Snapshot& snap,
                                                             const TrackedContext& context) {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto& [id, role] : context.roles) {
    auto& names = out[id];
    for (int index : role.vrc_users) {
      if (index >= 0 && static_cast<size_t>(index) < snap.vrc_user_display_names.size()) {
        names.push_back(snap.vrc_user_display_names[static_cast<size_t>(index)]);
      }
    }
  }
  return out;
}

} // namespace rtk::snapshot
