#pragma once

#include "rtk/config.h"
#include "rtk/directory.h"
#include "rtk/error.h"
#include "rtk/pacing.h"
#include "rtk/paths.h"
#include "rtk/reconcile.h"
#include "rtk/snapshot.h"
#include "rtk_discord/discord.h"
#include "rtk_vrchat/vrchat.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace rtk::runtime {

// Unix time in seconds; injectable so two-factor timing is testable.
using ClockFn = std::function<int64_t()>;
ClockFn system_clock_seconds();

struct TrackerDeps {
  vrchat::IVrcApi* vrchat = nullptr;
  // Only required when the config enables the Discord integration.
  discord::IDiscordApi* discord = nullptr;
  Pacer* pacer = nullptr;
  ClockFn now;
};

struct GroupCollection {
  vrchat::Group group;
  std::vector<vrchat::GroupMember> members;
  std::vector<vrchat::GroupRole> roles;
};

struct LinkedUser {
  std::string vr_id;
  std::string display_name;
  std::vector<std::string> role_ids;
};

struct ServerCollection {
  std::string id;
  std::string name;
  std::vector<discord::Role> roles;
  reconcile::RoleMap roles_by_vr_id;
  std::vector<LinkedUser> users;
};

struct RunSummary {
  size_t users = 0;
  size_t groups = 0;
  size_t servers = 0;
  size_t worlds = 0;
  std::filesystem::path snapshot_file;
};

bool login(vrchat::IVrcApi& api, const VrcCredentials& credentials, int min_remaining_seconds, Pacer& pacer,
           const ClockFn& now, vrchat::CurrentUser& out, RunError& error);

// Pages through the group until memberCount - 1 members are listed, then adds
// the caller from myMember.
bool collect_group_members(vrchat::IVrcApi& api, const vrchat::Group& group, const vrchat::CurrentUser& self,
                           Pacer& pacer, std::chrono::milliseconds page_delay,
                           std::vector<vrchat::GroupMember>& out, RunError& error);

// Every member also holds @everyone, whose role id is the server id.
bool collect_guild_roster(discord::IDiscordApi& api, const std::string& guild_id, Pacer& pacer,
                          std::chrono::milliseconds page_delay, reconcile::Roster& out, RunError& error);

// Full channel history, oldest first, with sequence numbers assigned in that order.
bool collect_channel_messages(discord::IDiscordApi& api, const std::string& channel_id, size_t max_messages,
                              Pacer& pacer, std::chrono::milliseconds page_delay,
                              std::vector<reconcile::ChatMessage>& out, RunError& error);

directory::MembershipContext group_context(const GroupCollection& collection);
directory::MembershipContext server_context(const ServerCollection& collection);

class TrackerRun {
 public:
  TrackerRun(TrackerConfig config, TrackerDeps deps);

  // Every upstream call of the run, in order. Stops at the first fatal error.
  bool collect(RunError& error);
  snapshot::Snapshot build() const;
  bool run(const ResolvedPaths& paths, RunSummary& summary, RunError& error);

  const vrchat::CurrentUser& self() const { return self_; }
  const std::vector<GroupCollection>& groups() const { return groups_; }
  const std::vector<ServerCollection>& servers() const { return servers_; }
  const std::vector<snapshot::WorldInfo>& worlds() const { return worlds_; }

 private:
  bool check_interrupt(const std::string& where, RunError& error) const;
  bool collect_discord(RunError& error);
  bool collect_server(const std::string& server_id, const std::string& channel_id, RunError& error);
  bool collect_groups(RunError& error);
  bool resolve_linked_users(RunError& error);
  bool collect_worlds(RunError& error);

  TrackerConfig config_;
  TrackerDeps deps_;
  vrchat::CurrentUser self_;
  std::vector<GroupCollection> groups_;
  std::vector<ServerCollection> servers_;
  std::vector<snapshot::WorldInfo> worlds_;
};

} // namespace rtk::runtime
