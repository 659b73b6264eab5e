#include "rtk_discord/discord.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <utility>

namespace rtk::discord {

using json = nlohmann::json;

namespace {
bool parse_body(const std::string& body, json& out, std::string& error) {
  try {
    out = json::parse(body);
  } catch (const json::exception& e) {
    error = std::string("response parse failed: ") + e.what();
    return false;
  }
  return true;
}

std::string string_field(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

// Discord error bodies look like {"message":"Missing Access","code":50001}.
std::string error_message(const std::string& body) {
  json j;
  std::string parse_error;
  if (parse_body(body, j, parse_error) && j.is_object() && j.contains("message") && j["message"].is_string()) {
    std::string message = j["message"].get<std::string>();
    if (j.contains("code") && j["code"].is_number_integer()) {
      message += " (code " + std::to_string(j["code"].get<int64_t>()) + ")";
    }
    return message;
  }
  return body.size() > 200 ? body.substr(0, 200) : body;
}

template <typename T, typename ParseFn>
bool parse_array(const std::string& body, std::vector<T>& out, std::string& error, const char* what,
                 ParseFn parse_item) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_array()) {
    error = std::string(what) + " must be an array";
    return false;
  }
  out.clear();
  for (const auto& item : j) {
    if (!item.is_object()) continue;
    T value;
    if (parse_item(item, value)) {
      out.push_back(std::move(value));
    }
  }
  return true;
}

class DiscordRestApi final : public IDiscordApi {
 public:
  DiscordRestApi(net::IHttpTransport& transport, RestApiOptions options)
      : transport_(transport), options_(std::move(options)) {
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
      options_.base_url.pop_back();
    }
  }

  bool get_current_bot(std::string& username, RunError& error) override {
    std::string body;
    if (!perform("/users/@me", "get bot user", body, error)) return false;
    json j;
    std::string parse_error;
    if (!parse_body(body, j, parse_error) || !j.is_object()) {
      set_error(error, ErrorKind::Api, "get bot user: " + (parse_error.empty() ? "not an object" : parse_error));
      return false;
    }
    username = string_field(j, "username");
    return true;
  }

  bool get_guild(const std::string& guild_id, Guild& out, RunError& error) override {
    std::string body;
    if (!perform("/guilds/" + guild_id, "get server " + guild_id, body, error)) return false;
    return decode(parse_guild, body, out, "server " + guild_id, error);
  }

  bool get_guild_roles(const std::string& guild_id, std::vector<Role>& out, RunError& error) override {
    std::string body;
    if (!perform("/guilds/" + guild_id + "/roles", "get server roles " + guild_id, body, error)) return false;
    return decode(parse_roles, body, out, "server roles " + guild_id, error);
  }

  bool get_channel(const std::string& channel_id, Channel& out, RunError& error) override {
    std::string body;
    if (!perform("/channels/" + channel_id, "get channel " + channel_id, body, error)) return false;
    return decode(parse_channel, body, out, "channel " + channel_id, error);
  }

  bool list_guild_members(const std::string& guild_id, const std::string& after, int limit,
                          std::vector<Member>& out, RunError& error) override {
    std::string body;
    const auto path = "/guilds/" + guild_id + "/members" +
                      net::build_query({{"limit", std::to_string(limit)}, {"after", after.empty() ? "0" : after}});
    if (!perform(path, "list server members " + guild_id, body, error)) return false;
    return decode(parse_members, body, out, "server members " + guild_id, error);
  }

  bool list_channel_messages(const std::string& channel_id, const std::string& before, int limit,
                             std::vector<Message>& out, RunError& error) override {
    std::vector<std::pair<std::string, std::string>> params{{"limit", std::to_string(limit)}};
    if (!before.empty()) {
      params.emplace_back("before", before);
    }
    std::string body;
    const auto path = "/channels/" + channel_id + "/messages" + net::build_query(params);
    if (!perform(path, "list channel messages " + channel_id, body, error)) return false;
    return decode(parse_messages, body, out, "channel messages " + channel_id, error);
  }

 private:
  bool perform(const std::string& path, const std::string& what, std::string& body, RunError& error) {
    net::HttpRequest request;
    request.url = options_.base_url + path;
    request.headers.push_back("Authorization: Bot " + options_.bot_token);
    request.headers.push_back("Accept: application/json");

    const net::HttpResponse response = transport_.send(request);
    if (!response.transport_ok()) {
      set_error(error, ErrorKind::Api, what + ": " + response.error);
      return false;
    }
    if (!response.success()) {
      const ErrorKind kind = response.status == 401 ? ErrorKind::Auth : ErrorKind::Api;
      set_error(error, kind, what + ": " + error_message(response.body), response.status);
      return false;
    }
    body = response.body;
    return true;
  }

  template <typename T, typename ParseFn>
  static bool decode(ParseFn parse, const std::string& body, T& out, const std::string& what, RunError& error) {
    std::string parse_error;
    if (!parse(body, out, parse_error)) {
      set_error(error, ErrorKind::Api, what + ": " + parse_error);
      return false;
    }
    return true;
  }

  net::IHttpTransport& transport_;
  RestApiOptions options_;
};
} // namespace

bool parse_snowflake(const std::string& text, uint64_t& out) {
  if (text.empty()) return false;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc() && result.ptr == end;
}

int64_t snowflake_timestamp_ms(uint64_t snowflake) {
  return static_cast<int64_t>(snowflake >> 22) + kDiscordEpochMs;
}

std::vector<std::string> permission_names(uint64_t permissions) {
  std::vector<std::string> out;
  if (permissions & kAdministratorBit) out.push_back("administrator");
  if (permissions & kModerateMembersBit) out.push_back("moderate_members");
  return out;
}

bool parse_guild(const std::string& body, Guild& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object() || string_field(j, "id").empty()) {
    error = "server missing id";
    return false;
  }
  out.id = string_field(j, "id");
  out.name = string_field(j, "name");
  return true;
}

bool parse_roles(const std::string& body, std::vector<Role>& out, std::string& error) {
  return parse_array(body, out, error, "roles", [](const json& item, Role& role) {
    role.id = string_field(item, "id");
    role.name = string_field(item, "name");
    // Permissions are serialized as a decimal string.
    const std::string bits = string_field(item, "permissions");
    if (!bits.empty() && !parse_snowflake(bits, role.permissions)) {
      role.permissions = 0;
    }
    return !role.id.empty();
  });
}

bool parse_channel(const std::string& body, Channel& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object() || string_field(j, "id").empty()) {
    error = "channel missing id";
    return false;
  }
  out.id = string_field(j, "id");
  out.guild_id = string_field(j, "guild_id");
  out.name = string_field(j, "name");
  return true;
}

bool parse_members(const std::string& body, std::vector<Member>& out, std::string& error) {
  return parse_array(body, out, error, "members", [](const json& item, Member& member) {
    if (!item.contains("user") || !item["user"].is_object()) return false;
    member.user_id = string_field(item["user"], "id");
    member.username = string_field(item["user"], "username");
    if (item.contains("roles") && item["roles"].is_array()) {
      for (const auto& r : item["roles"]) {
        if (r.is_string()) member.role_ids.push_back(r.get<std::string>());
      }
    }
    return !member.user_id.empty();
  });
}

bool parse_messages(const std::string& body, std::vector<Message>& out, std::string& error) {
  return parse_array(body, out, error, "messages", [](const json& item, Message& message) {
    message.id = string_field(item, "id");
    message.content = string_field(item, "content");
    if (item.contains("author") && item["author"].is_object()) {
      message.author_id = string_field(item["author"], "id");
    }
    uint64_t snowflake = 0;
    if (message.id.empty() || message.author_id.empty() || !parse_snowflake(message.id, snowflake)) {
      return false;
    }
    message.timestamp_ms = snowflake_timestamp_ms(snowflake);
    return true;
  });
}

std::unique_ptr<IDiscordApi> make_rest_api(net::IHttpTransport& transport, RestApiOptions options) {
  return std::make_unique<DiscordRestApi>(transport, std::move(options));
}

} // namespace rtk::discord
