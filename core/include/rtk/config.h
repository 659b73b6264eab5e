#pragma once

#include "rtk/error.h"
#include "rtk/pacing.h"

#include <filesystem>
#include <string>
#include <vector>

namespace rtk {

struct VrcCredentials {
  std::string username;
  std::string password;
  std::string totp_secret;
};

struct PacingConfig {
  std::chrono::milliseconds listing_delay{1000};
  std::chrono::milliseconds discord_delay{5000};
  std::chrono::milliseconds lookup_delay{1000};
};

struct TrackerConfig {
  std::filesystem::path workspace;
  std::string output;

  VrcCredentials vrchat;
  std::vector<std::string> group_ids;
  std::vector<std::string> world_ids;

  std::string bot_token;
  std::vector<std::string> server_ids;
  std::vector<std::string> channel_ids;

  std::string user_agent = "roletrack/0.1.0";
  int http_timeout_seconds = 30;
  std::string vrchat_base_url = "https://api.vrchat.cloud/api/1";
  std::string discord_base_url = "https://discord.com/api/v10";
  size_t discord_max_messages = 100000;
  int totp_min_remaining_seconds = 5;

  PacingConfig pacing;
  RetryPolicy retry;

  bool use_groups() const { return !group_ids.empty(); }
  bool use_worlds() const { return !world_ids.empty(); }
  bool use_discord() const { return !bot_token.empty() && !server_ids.empty() && !channel_ids.empty(); }
};

// Splits a comma-delimited list, trimming blanks and dropping empty entries.
std::vector<std::string> split_delimited(const std::string& text, char delimiter = ',');

bool is_snowflake(const std::string& text);

// Merges the optional fields of a YAML or JSON file into cfg.
bool load_tracker_config(const std::filesystem::path& path, TrackerConfig& cfg, RunError& error);

// Checks everything that can be checked before any network call.
bool validate_tracker_config(const TrackerConfig& cfg, RunError& error);

} // namespace rtk
