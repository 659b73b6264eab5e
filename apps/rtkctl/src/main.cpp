#include "rtk/config.h"
#include "rtk/error.h"
#include "rtk/interrupt.h"
#include "rtk/log.h"
#include "rtk/pacing.h"
#include "rtk/paths.h"
#include "rtk/snapshot.h"
#include "rtk/tracker_run.h"
#include "rtk_data/serialization.h"
#include "rtk_discord/discord.h"
#include "rtk_net/http.h"
#include "rtk_vrchat/vrchat.h"
#include "rtkctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
std::string get_env(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool take_value(const std::vector<std::string>& args, size_t& i, std::string& out, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + args[i];
    return false;
  }
  out = args[++i];
  return true;
}

void print_usage() {
  std::cerr << "Usage:\n"
            << "  rtkctl track -w <workspace> -o <output> -u <username> -p <password> -k <totp-key>\n"
            << "               [-g <group,...>] [-W <world,...>] [-b <bot-token>] [-d <server,...>] [-c <channel,...>]\n"
            << "               [--config <tracker.yaml|tracker.json>]\n"
            << "  rtkctl inspect --in <data.json> [--filter <contextId>[/<roleId>]]\n"
            << "Environment: RTK_VRC_PASSWORD, RTK_VRC_KEY, RTK_DISCORD_BOT fill missing secrets.\n";
}

// Returns false when role_filter names no role of the context.
bool print_context(const rtk::snapshot::Snapshot& snap, const std::string& kind, const std::string& id,
                   const rtk::snapshot::TrackedContext& context, const std::optional<std::string>& role_filter,
                   std::ostream& out) {
  out << kind << " " << id << " \"" << context.name << "\" (" << context.vrc_users.size() << " users)\n";
  const auto members = rtk::snapshot::role_members(snap, context);
  for (const auto& [role_id, role] : context.roles) {
    if (role_filter && *role_filter != role_id) continue;
    out << "  role " << role_id << " \"" << role.name << "\"";
    if (role.is_admin) out << " [admin]";
    if (role.is_moderator) out << " [moderator]";
    out << "\n";
    for (const auto& name : members.at(role_id)) {
      out << "    " << name << "\n";
    }
  }
  return !role_filter || context.roles.count(*role_filter) > 0;
}
} // namespace

bool parse_track_args(const std::vector<std::string>& args, TrackArgs& out, std::string& error) {
  TrackArgs parsed;
  auto& cfg = parsed.config;
  std::string groups, worlds, servers, channels, workspace;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    bool ok = true;
    if (arg == "-w" || arg == "--workspace") {
      ok = take_value(args, i, workspace, error);
    } else if (arg == "-o" || arg == "--output") {
      ok = take_value(args, i, cfg.output, error);
    } else if (arg == "-u" || arg == "--username") {
      ok = take_value(args, i, cfg.vrchat.username, error);
    } else if (arg == "-p" || arg == "--password") {
      ok = take_value(args, i, cfg.vrchat.password, error);
    } else if (arg == "-k" || arg == "--key") {
      ok = take_value(args, i, cfg.vrchat.totp_secret, error);
    } else if (arg == "-g" || arg == "--groups") {
      ok = take_value(args, i, groups, error);
    } else if (arg == "-W" || arg == "--worlds") {
      ok = take_value(args, i, worlds, error);
    } else if (arg == "-b" || arg == "--bot") {
      ok = take_value(args, i, cfg.bot_token, error);
    } else if (arg == "-d" || arg == "--discords") {
      ok = take_value(args, i, servers, error);
    } else if (arg == "-c" || arg == "--channels") {
      ok = take_value(args, i, channels, error);
    } else if (arg == "--config") {
      std::string path;
      ok = take_value(args, i, path, error);
      parsed.config_path = fs::path(path);
    } else {
      error = "unknown option: " + arg;
      return false;
    }
    if (!ok) return false;
  }

  if (cfg.vrchat.password.empty()) cfg.vrchat.password = get_env("RTK_VRC_PASSWORD");
  if (cfg.vrchat.totp_secret.empty()) cfg.vrchat.totp_secret = get_env("RTK_VRC_KEY");
  if (cfg.bot_token.empty()) cfg.bot_token = get_env("RTK_DISCORD_BOT");

  cfg.workspace = workspace;
  cfg.group_ids = rtk::split_delimited(groups);
  cfg.world_ids = rtk::split_delimited(worlds);
  cfg.server_ids = rtk::split_delimited(servers);
  cfg.channel_ids = rtk::split_delimited(channels);

  if (workspace.empty() || cfg.output.empty() || cfg.vrchat.username.empty()) {
    error = "--workspace, --output and --username are required";
    return false;
  }
  out = std::move(parsed);
  return true;
}

bool parse_inspect_args(const std::vector<std::string>& args, InspectArgs& out, std::string& error) {
  InspectArgs parsed;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string value;
    if (args[i] == "--in") {
      if (!take_value(args, i, value, error)) return false;
      parsed.in_path = fs::path(value);
    } else if (args[i] == "--filter") {
      if (!take_value(args, i, value, error)) return false;
      parsed.filter = value;
    } else {
      error = "unknown option: " + args[i];
      return false;
    }
  }
  if (parsed.in_path.empty()) {
    error = "--in is required";
    return false;
  }
  out = std::move(parsed);
  return true;
}

int track_command(const TrackArgs& args) {
  rtk::TrackerConfig cfg = args.config;
  rtk::log::add_secret(cfg.vrchat.password);
  rtk::log::add_secret(cfg.vrchat.totp_secret);
  rtk::log::add_secret(cfg.bot_token);

  // Nothing is created on disk until the configuration is known to be good;
  // until then log lines only go to stdout.
  rtk::RunError error;
  bool ok = true;
  if (args.config_path) {
    ok = rtk::load_tracker_config(*args.config_path, cfg, error);
  }
  ok = ok && rtk::validate_tracker_config(cfg, error);
  if (!ok) {
    rtk::log::error(rtk::describe(error));
    return rtk::exit_code_for(error);
  }

  const auto paths = rtk::resolve_paths(cfg.workspace, cfg.output);
  rtk::log::init("rtk_track", paths.logs_dir);
  rtk::log::install_crash_handlers();
  rtk::interrupt::install_handlers();

  auto vrchat_transport = rtk::net::make_curl_transport(cfg.user_agent, cfg.http_timeout_seconds);
  auto vrchat_api = rtk::vrchat::make_web_api(
      *vrchat_transport, {cfg.vrchat_base_url, cfg.vrchat.username, cfg.vrchat.password});

  std::unique_ptr<rtk::net::IHttpTransport> discord_transport;
  std::unique_ptr<rtk::discord::IDiscordApi> discord_api;
  if (cfg.use_discord()) {
    discord_transport = rtk::net::make_curl_transport(cfg.user_agent, cfg.http_timeout_seconds);
    discord_api = rtk::discord::make_rest_api(*discord_transport, {cfg.discord_base_url, cfg.bot_token});
  }

  rtk::Pacer pacer;
  rtk::runtime::TrackerDeps deps;
  deps.vrchat = vrchat_api.get();
  deps.discord = discord_api.get();
  deps.pacer = &pacer;

  rtk::runtime::TrackerRun run(cfg, deps);
  rtk::runtime::RunSummary summary;
  ok = run.run(paths, summary, error);

  const int code = rtk::exit_code_for(error);
  if (!ok) {
    rtk::log::error(rtk::describe(error));
  } else {
    rtk::log::info("done");
  }
  rtk::log::shutdown();
  return code;
}

bool write_inspect_report(const rtk::snapshot::Snapshot& snap, const std::optional<std::string>& filter,
                          std::ostream& out, std::string& error) {
  std::optional<std::string> context_filter;
  std::optional<std::string> role_filter;
  if (filter) {
    const auto slash = filter->find('/');
    context_filter = filter->substr(0, slash);
    if (slash != std::string::npos) role_filter = filter->substr(slash + 1);
  }

  bool matched = false;
  bool role_matched = false;
  for (const auto& [id, group] : snap.vrc_groups_by_id) {
    if (context_filter && *context_filter != id) continue;
    role_matched = print_context(snap, "group", id, group, role_filter, out) || role_matched;
    matched = true;
  }
  for (const auto& [id, server] : snap.discord_servers_by_id) {
    if (context_filter && *context_filter != id) continue;
    role_matched = print_context(snap, "server", id, server, role_filter, out) || role_matched;
    matched = true;
  }
  if (!context_filter) {
    for (const auto& [id, world] : snap.vrc_worlds_by_id) {
      out << "world " << id << " \"" << world.name << "\" visits=" << world.visits
          << " favorites=" << world.favorites << " occupants=" << world.occupants << "\n";
    }
  }
  if (context_filter && !matched) {
    error = "no group or server with id " + *context_filter;
    return false;
  }
  if (role_filter && !role_matched) {
    error = "no role " + *role_filter + " in " + *context_filter;
    return false;
  }
  return true;
}

int inspect_command(const InspectArgs& args) {
  json j;
  std::string error;
  rtk::snapshot::Snapshot snap;
  if (!rtk::data::load_json_file(args.in_path, j, error) || !rtk::snapshot::from_json(j, snap, error) ||
      !write_inspect_report(snap, args.filter, std::cout, error)) {
    std::cerr << error << "\n";
    return 2;
  }
  return 0;
}

#ifndef RTKCTL_LIB
int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);
  std::string error;

  if (command == "track") {
    TrackArgs track;
    if (!parse_track_args(args, track, error)) {
      std::cerr << error << "\n";
      print_usage();
      return 2;
    }
    return track_command(track);
  }

  if (command == "inspect") {
    InspectArgs inspect;
    if (!parse_inspect_args(args, inspect, error)) {
      std::cerr << error << "\n";
      print_usage();
      return 2;
    }
    return inspect_command(inspect);
  }

  print_usage();
  return 1;
}
#endif
