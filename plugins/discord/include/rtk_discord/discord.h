#pragma once

#include "rtk/error.h"
#include "rtk_net/http.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rtk::discord {

constexpr uint64_t kAdministratorBit = uint64_t{1} << 3;
constexpr uint64_t kModerateMembersBit = uint64_t{1} << 40;
constexpr int64_t kDiscordEpochMs = 1420070400000;

constexpr int kMemberPageSize = 1000;
constexpr int kMessagePageSize = 100;

struct Guild {
  std::string id;
  std::string name;
};

struct Role {
  std::string id;
  std::string name;
  uint64_t permissions = 0;
};

struct Channel {
  std::string id;
  std::string guild_id;
  std::string name;
};

struct Member {
  std::string user_id;
  std::string username;
  std::vector<std::string> role_ids;
};

struct Message {
  std::string id;
  std::string author_id;
  std::string content;
  int64_t timestamp_ms = 0;
};

bool parse_snowflake(const std::string& text, uint64_t& out);
// Creation time encoded in a snowflake, in unix milliseconds.
int64_t snowflake_timestamp_ms(uint64_t snowflake);

// Permission names the directory understands for the given bitfield.
std::vector<std::string> permission_names(uint64_t permissions);

class IDiscordApi {
 public:
  virtual ~IDiscordApi() = default;
  virtual bool get_current_bot(std::string& username, RunError& error) = 0;
  virtual bool get_guild(const std::string& guild_id, Guild& out, RunError& error) = 0;
  virtual bool get_guild_roles(const std::string& guild_id, std::vector<Role>& out, RunError& error) = 0;
  virtual bool get_channel(const std::string& channel_id, Channel& out, RunError& error) = 0;
  // One page in ascending user id order, starting after the given id ("0" for the first page).
  virtual bool list_guild_members(const std::string& guild_id, const std::string& after, int limit,
                                  std::vector<Member>& out, RunError& error) = 0;
  // One page, newest first, older than the given message id (empty for the latest).
  virtual bool list_channel_messages(const std::string& channel_id, const std::string& before, int limit,
                                     std::vector<Message>& out, RunError& error) = 0;
};

struct RestApiOptions {
  std::string base_url = "https://discord.com/api/v10";
  std::string bot_token;
};

std::unique_ptr<IDiscordApi> make_rest_api(net::IHttpTransport& transport, RestApiOptions options);

bool parse_guild(const std::string& body, Guild& out, std::string& error);
bool parse_roles(const std::string& body, std::vector<Role>& out, std::string& error);
bool parse_channel(const std::string& body, Channel& out, std::string& error);
bool parse_members(const std::string& body, std::vector<Member>& out, std::string& error);
bool parse_messages(const std::string& body, std::vector<Message>& out, std::string& error);

} // namespace rtk::discord
