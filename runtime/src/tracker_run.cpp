#include "rtk/tracker_run.h"

#include "rtk/interrupt.h"
#include "rtk/log.h"
#include "rtk_data/serialization.h"
#include "rtk_vrchat/totp.h"

#include <algorithm>
#include <utility>

namespace rtk::runtime {

namespace {
std::chrono::milliseconds seconds_ms(int seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
}

std::string strip_blanks(const std::string& text) {
  std::string out;
  for (char c : text) {
    if (c != ' ') out.push_back(c);
  }
  return out;
}
} // namespace

ClockFn system_clock_seconds() {
  return [] {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
  };
}

bool login(vrchat::IVrcApi& api, const VrcCredentials& credentials, int min_remaining_seconds, Pacer& pacer,
           const ClockFn& now, vrchat::CurrentUser& out, RunError& error) {
  log::info("logging in to VRChat...");
  vrchat::LoginState state;
  if (!api.get_current_user(state, error)) {
    if (error.http_status == 401) error.kind = ErrorKind::Auth;
    return false;
  }

  if (!state.logged_in && state.requires_two_factor) {
    log::info("2FA needed...");
    const auto& methods = state.two_factor_methods;
    if (std::find(methods.begin(), methods.end(), "totp") == methods.end()) {
      set_error(error, ErrorKind::Auth, "account does not offer TOTP two-factor authentication");
      return false;
    }

    std::vector<uint8_t> key;
    std::string key_error;
    if (!vrchat::base32_decode(strip_blanks(credentials.totp_secret), key, key_error)) {
      set_error(error, ErrorKind::Auth, "two-factor key: " + key_error);
      return false;
    }

    const int remaining = vrchat::totp_remaining_seconds(now());
    if (remaining < min_remaining_seconds) {
      log::info("waiting for new token...");
      pacer.wait(seconds_ms(remaining + 1));
    }

    std::string code;
    if (!vrchat::totp_code(key, now(), code, key_error)) {
      set_error(error, ErrorKind::Auth, "two-factor code: " + key_error);
      return false;
    }
    log::info("using 2FA code...");
    if (!api.verify_totp(code, error)) return false;
    if (!api.get_current_user(state, error)) {
      if (error.http_status == 401) error.kind = ErrorKind::Auth;
      return false;
    }
  }

  if (!state.logged_in) {
    set_error(error, ErrorKind::Auth, "failed to validate 2FA");
    return false;
  }
  out = state.user;
  log::info("logged in as " + out.display_name);
  return true;
}

bool collect_group_members(vrchat::IVrcApi& api, const vrchat::Group& group, const vrchat::CurrentUser& self,
                           Pacer& pacer, std::chrono::milliseconds page_delay,
                           std::vector<vrchat::GroupMember>& out, RunError& error) {
  if (!group.my_member) {
    set_error(error, ErrorKind::Membership, "user must be a member of group " + group.id);
    return false;
  }

  out.clear();
  const size_t others = group.member_count > 0 ? static_cast<size_t>(group.member_count - 1) : 0;
  while (out.size() < others) {
    std::vector<vrchat::GroupMember> page;
    if (!api.get_group_members(group.id, vrchat::kGroupMemberPageSize, static_cast<int>(out.size()), page, error)) {
      return false;
    }
    pacer.wait(page_delay);
    if (page.empty()) {
      log::warn("group " + group.id + " listed " + std::to_string(out.size()) + " of " + std::to_string(others) +
                " members");
      break;
    }
    out.insert(out.end(), page.begin(), page.end());
    log::info(std::to_string(out.size()));
  }

  vrchat::GroupMember me;
  me.id = group.my_member->id;
  me.user_id = self.id;
  me.display_name = self.display_name;
  me.role_ids = group.my_member->role_ids;
  out.push_back(std::move(me));
  return true;
}

bool collect_guild_roster(discord::IDiscordApi& api, const std::string& guild_id, Pacer& pacer,
                          std::chrono::milliseconds page_delay, reconcile::Roster& out, RunError& error) {
  out.clear();
  std::string after = "0";
  for (;;) {
    std::vector<discord::Member> page;
    if (!api.list_guild_members(guild_id, after, discord::kMemberPageSize, page, error)) {
      return false;
    }
    pacer.wait(page_delay);
    for (const auto& member : page) {
      // The member listing omits @everyone, whose role id is the server id.
      auto& role_ids = out[member.user_id];
      role_ids = member.role_ids;
      if (std::find(role_ids.begin(), role_ids.end(), guild_id) == role_ids.end()) {
        role_ids.push_back(guild_id);
      }
    }
    if (page.size() < static_cast<size_t>(discord::kMemberPageSize)) {
      break;
    }
    after = page.back().user_id;
  }
  return true;
}

bool collect_channel_messages(discord::IDiscordApi& api, const std::string& channel_id, size_t max_messages,
                              Pacer& pacer, std::chrono::milliseconds page_delay,
                              std::vector<reconcile::ChatMessage>& out, RunError& error) {
  std::vector<discord::Message> newest_first;
  std::string before;
  while (newest_first.size() < max_messages) {
    const size_t wanted = std::min(max_messages - newest_first.size(), static_cast<size_t>(discord::kMessagePageSize));
    std::vector<discord::Message> page;
    if (!api.list_channel_messages(channel_id, before, static_cast<int>(wanted), page, error)) {
      return false;
    }
    pacer.wait(page_delay);
    if (page.empty()) {
      break;
    }
    newest_first.insert(newest_first.end(), page.begin(), page.end());
    if (page.size() < wanted) {
      break;
    }
    before = page.back().id;
  }

  out.clear();
  out.reserve(newest_first.size());
  uint64_t sequence = 0;
  for (auto it = newest_first.rbegin(); it != newest_first.rend(); ++it) {
    reconcile::ChatMessage message;
    message.id = it->id;
    message.author_id = it->author_id;
    message.timestamp_ms = it->timestamp_ms;
    message.sequence = sequence++;
    message.content = it->content;
    out.push_back(std::move(message));
  }
  return true;
}

directory::MembershipContext group_context(const GroupCollection& collection) {
  directory::MembershipContext context;
  context.id = collection.group.id;
  context.name = collection.group.name;
  context.markers = directory::kVrcGroupMarkers;
  for (const auto& role : collection.roles) {
    context.roles.push_back({role.id, role.name, role.permissions});
  }
  for (const auto& member : collection.members) {
    context.members.push_back({member.display_name, member.role_ids});
  }
  return context;
}

directory::MembershipContext server_context(const ServerCollection& collection) {
  directory::MembershipContext context;
  context.id = collection.id;
  context.name = collection.name;
  context.markers = directory::kDiscordMarkers;
  for (const auto& user : collection.users) {
    context.members.push_back({user.display_name, user.role_ids});
  }
  std::vector<directory::RoleDefinition> all_roles;
  for (const auto& role : collection.roles) {
    all_roles.push_back({role.id, role.name, discord::permission_names(role.permissions)});
  }
  context.roles = directory::roles_held_by_members(all_roles, context.members);
  return context;
}

TrackerRun::TrackerRun(TrackerConfig config, TrackerDeps deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (!deps_.now) {
    deps_.now = system_clock_seconds();
  }
}

bool TrackerRun::check_interrupt(const std::string& where, RunError& error) const {
  if (!interrupt::requested()) return true;
  set_error(error, ErrorKind::Interrupted, "interrupted before " + where);
  return false;
}

bool TrackerRun::collect(RunError& error) {
  if (!deps_.vrchat || !deps_.pacer) {
    set_error(error, ErrorKind::Config, "tracker run is missing its VRChat client or pacer");
    return false;
  }
  groups_.clear();
  servers_.clear();
  worlds_.clear();

  if (config_.use_discord()) {
    if (!collect_discord(error)) return false;
  } else {
    log::info("skipping Discord integration...");
  }

  if (!check_interrupt("VRChat login", error)) return false;
  if (!login(*deps_.vrchat, config_.vrchat, config_.totp_min_remaining_seconds, *deps_.pacer, deps_.now, self_,
             error)) {
    return false;
  }

  if (!collect_groups(error)) return false;
  if (!resolve_linked_users(error)) return false;
  return collect_worlds(error);
}

bool TrackerRun::collect_discord(RunError& error) {
  if (!deps_.discord) {
    set_error(error, ErrorKind::Config, "Discord integration enabled without a Discord client");
    return false;
  }
  log::info("logging in to Discord bot...");
  std::string bot_name;
  if (!deps_.discord->get_current_bot(bot_name, error)) {
    if (error.http_status == 401) error.kind = ErrorKind::Auth;
    return false;
  }
  log::info("logged in to Discord bot " + bot_name);

  for (size_t i = 0; i < config_.server_ids.size(); ++i) {
    if (!check_interrupt("Discord server " + config_.server_ids[i], error)) return false;
    if (!collect_server(config_.server_ids[i], config_.channel_ids[i], error)) return false;
  }
  return true;
}

bool TrackerRun::collect_server(const std::string& server_id, const std::string& channel_id, RunError& error) {
  auto& api = *deps_.discord;
  auto& pacer = *deps_.pacer;

  log::info("getting Discord users from server " + server_id + "...");
  discord::Guild guild;
  if (!api.get_guild(server_id, guild, error)) return false;
  pacer.wait(config_.pacing.discord_delay);

  discord::Channel channel;
  if (!api.get_channel(channel_id, channel, error)) return false;
  pacer.wait(config_.pacing.discord_delay);
  if (channel.guild_id != server_id) {
    set_error(error, ErrorKind::Config, "channel " + channel_id + " does not belong to server " + server_id);
    return false;
  }

  ServerCollection server;
  server.id = server_id;
  server.name = guild.name;
  if (!api.get_guild_roles(server_id, server.roles, error)) return false;
  pacer.wait(config_.pacing.discord_delay);

  reconcile::Roster roster;
  if (!collect_guild_roster(api, server_id, pacer, config_.pacing.discord_delay, roster, error)) return false;
  log::info("got Discord users: " + std::to_string(roster.size()));

  log::info("getting VRC-Discord connections from server " + server_id + " channel " + channel_id + "...");
  std::vector<reconcile::ChatMessage> messages;
  const bool listed = retry_fixed(
      config_.retry, pacer, "listing messages of channel " + channel_id,
      [&](RunError& attempt_error) {
        return collect_channel_messages(api, channel_id, config_.discord_max_messages, pacer,
                                        config_.pacing.listing_delay, messages, attempt_error);
      },
      error);
  if (!listed) return false;

  const auto result = reconcile::reconcile(messages, roster);
  if (result.conflicts_dropped > 0) {
    log::info(std::to_string(result.conflicts_dropped) + " duplicate VRC id claims dropped in channel " + channel_id);
  }
  if (result.missing_from_roster > 0) {
    log::info(std::to_string(result.missing_from_roster) + " linked authors are no longer in server " + server_id);
  }
  log::info("got VRC-Discord connections: " + std::to_string(result.roles_by_vr_id.size()));
  server.roles_by_vr_id = result.roles_by_vr_id;
  servers_.push_back(std::move(server));
  return true;
}

bool TrackerRun::collect_groups(RunError& error) {
  auto& api = *deps_.vrchat;
  auto& pacer = *deps_.pacer;
  for (const auto& group_id : config_.group_ids) {
    if (!check_interrupt("group " + group_id, error)) return false;

    GroupCollection collection;
    if (!api.get_group(group_id, collection.group, error)) return false;
    log::info("got group " + collection.group.name + ", members: " + std::to_string(collection.group.member_count));

    log::info("getting group members...");
    if (!collect_group_members(api, collection.group, self_, pacer, config_.pacing.listing_delay,
                               collection.members, error)) {
      return false;
    }
    log::info("got group members: " + std::to_string(collection.members.size()));

    log::info("getting group roles...");
    if (!api.get_group_roles(group_id, collection.roles, error)) return false;
    pacer.wait(config_.pacing.listing_delay);
    log::info("got group roles: " + std::to_string(collection.roles.size()));

    groups_.push_back(std::move(collection));
  }
  return true;
}

bool TrackerRun::resolve_linked_users(RunError& error) {
  if (servers_.empty()) return true;
  log::info("getting Discord users from VRChat...");
  for (auto& server : servers_) {
    server.users.clear();
    for (const auto& [vr_id, role_ids] : server.roles_by_vr_id) {
      if (!check_interrupt("user " + vr_id, error)) return false;
      vrchat::User user;
      if (!deps_.vrchat->get_user(vr_id, user, error)) return false;
      deps_.pacer->wait(config_.pacing.lookup_delay);
      server.users.push_back({vr_id, user.display_name, role_ids});
    }
  }
  return true;
}

bool TrackerRun::collect_worlds(RunError& error) {
  for (const auto& world_id : config_.world_ids) {
    if (!check_interrupt("world " + world_id, error)) return false;
    vrchat::World world;
    if (!deps_.vrchat->get_world(world_id, world, error)) return false;
    deps_.pacer->wait(config_.pacing.lookup_delay);
    log::info("got world " + world.name);
    worlds_.push_back({world_id, world.name, world.visits, world.favorites, world.occupants});
  }
  return true;
}

snapshot::Snapshot TrackerRun::build() const {
  std::vector<directory::MembershipContext> groups;
  for (const auto& group : groups_) {
    groups.push_back(group_context(group));
  }
  std::vector<directory::MembershipContext> servers;
  for (const auto& server : servers_) {
    servers.push_back(server_context(server));
  }
  const auto dir = directory::build_directory(groups, servers);
  return snapshot::assemble(dir, worlds_);
}

bool TrackerRun::run(const ResolvedPaths& paths, RunSummary& summary, RunError& error) {
  if (!prepare_output_dir(paths, error)) return false;
  if (!collect(error)) return false;
  if (!check_interrupt("writing the snapshot", error)) return false;

  const auto snap = build();
  const auto document = snapshot::to_json(snap);
  log::info(document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  std::string write_error;
  if (!data::save_json_file(paths.snapshot_file, document, write_error)) {
    set_error(error, ErrorKind::Output, write_error);
    return false;
  }

  summary.users = snap.vrc_user_display_names.size();
  summary.groups = snap.vrc_groups_by_id.size();
  summary.servers = snap.discord_servers_by_id.size();
  summary.worlds = snap.vrc_worlds_by_id.size();
  summary.snapshot_file = paths.snapshot_file;
  log::info("snapshot written: " + paths.snapshot_file.string() + " (" + std::to_string(summary.users) +
            " users, " + std::to_string(summary.groups) + " groups, " + std::to_string(summary.servers) +
            " servers, " + std::to_string(summary.worlds) + " worlds)");
  return true;
}

} // namespace rtk::runtime
