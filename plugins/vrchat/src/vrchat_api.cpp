#include "rtk_vrchat/vrchat.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace rtk::vrchat {

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

std::vector<std::string> string_array(const json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& v : j[key]) {
    if (v.is_string()) out.push_back(v.get<std::string>());
  }
  return out;
}

std::string string_field(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

int64_t int_field(const json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number_integer()) return 0;
  return j[key].get<int64_t>();
}

GroupMember member_from_json(const json& j) {
  GroupMember member;
  member.id = string_field(j, "id");
  member.user_id = string_field(j, "userId");
  member.role_ids = string_array(j, "roleIds");
  if (j.contains("user") && j["user"].is_object()) {
    member.display_name = string_field(j["user"], "displayName");
    if (member.user_id.empty()) member.user_id = string_field(j["user"], "id");
  }
  return member;
}

// VRChat error bodies look like {"error":{"message":"...","status_code":401}}.
std::string error_message(const std::string& body) {
  const std::string raw = body.size() > 200 ? body.substr(0, 200) : body;
  json j;
  std::string parse_error;
  if (!parse_body(body, j, parse_error) || !j.is_object() || !j.contains("error")) return raw;
  const auto& e = j["error"];
  if (e.is_object() && e.contains("message") && e["message"].is_string()) {
    return e["message"].get<std::string>();
  }
  if (e.is_string()) return e.get<std::string>();
  return raw;
}

class VrcWebApi final : public IVrcApi {
 public:
  VrcWebApi(net::IHttpTransport& transport, WebApiOptions options)
      : transport_(transport), options_(std::move(options)) {
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
      options_.base_url.pop_back();
    }
  }

  bool get_current_user(LoginState& out, RunError& error) override {
    net::HttpRequest request = make_request("GET", "/auth/user");
    request.basic_auth = net::BasicAuth{net::url_encode(options_.username), net::url_encode(options_.password)};
    std::string body;
    if (!perform(request, "get current user", body, error)) return false;
    return decode(parse_login_state, body, out, "current user", error);
  }

  bool verify_totp(const std::string& code, RunError& error) override {
    net::HttpRequest request = make_request("POST", "/auth/twofactorauth/totp/verify");
    request.body = json{{"code", code}}.dump();
    std::string body;
    if (!perform(request, "verify 2FA", body, error)) {
      if (error.http_status == 400 || error.http_status == 401) error.kind = ErrorKind::Auth;
      return false;
    }
    json j;
    std::string parse_error;
    if (!parse_body(body, j, parse_error)) {
      set_error(error, ErrorKind::Api, "verify 2FA: " + parse_error);
      return false;
    }
    if (!j.value("verified", false)) {
      set_error(error, ErrorKind::Auth, "2FA code was not accepted");
      return false;
    }
    return true;
  }

  bool get_group(const std::string& group_id, Group& out, RunError& error) override {
    std::string body;
    const auto path = "/groups/" + net::url_encode(group_id) + net::build_query({{"includeRoles", "true"}});
    if (!perform(make_request("GET", path), "get group " + group_id, body, error)) return false;
    return decode(parse_group, body, out, "group " + group_id, error);
  }

  bool get_group_members(const std::string& group_id, int count, int offset,
                         std::vector<GroupMember>& out, RunError& error) override {
    std::string body;
    const auto path = "/groups/" + net::url_encode(group_id) + "/members" +
                      net::build_query({{"n", std::to_string(count)}, {"offset", std::to_string(offset)}});
    if (!perform(make_request("GET", path), "get group members " + group_id, body, error)) return false;
    return decode(parse_group_members, body, out, "group members " + group_id, error);
  }

  bool get_group_roles(const std::string& group_id, std::vector<GroupRole>& out, RunError& error) override {
    std::string body;
    const auto path = "/groups/" + net::url_encode(group_id) + "/roles";
    if (!perform(make_request("GET", path), "get group roles " + group_id, body, error)) return false;
    return decode(parse_group_roles, body, out, "group roles " + group_id, error);
  }

  bool get_user(const std::string& user_id, User& out, RunError& error) override {
    std::string body;
    if (!perform(make_request("GET", "/users/" + net::url_encode(user_id)), "get user " + user_id, body, error)) {
      return false;
    }
    return decode(parse_user, body, out, "user " + user_id, error);
  }

  bool get_world(const std::string& world_id, World& out, RunError& error) override {
    std::string body;
    if (!perform(make_request("GET", "/worlds/" + net::url_encode(world_id)), "get world " + world_id, body,
                 error)) {
      return false;
    }
    return decode(parse_world, body, out, "world " + world_id, error);
  }

 private:
  net::HttpRequest make_request(const char* method, const std::string& path) const {
    net::HttpRequest request;
    request.method = method;
    request.url = options_.base_url + path;
    request.headers.push_back("Accept: application/json");
    if (request.method == "POST") {
      request.headers.push_back("Content-Type: application/json");
    }
    return request;
  }

  bool perform(const net::HttpRequest& request, const std::string& what, std::string& body, RunError& error) {
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
  WebApiOptions options_;
};
} // namespace

bool parse_login_state(const std::string& body, LoginState& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object()) {
    error = "current user must be an object";
    return false;
  }
  LoginState state;
  state.two_factor_methods = string_array(j, "requiresTwoFactorAuth");
  if (!state.two_factor_methods.empty()) {
    state.requires_two_factor = true;
    out = std::move(state);
    return true;
  }
  state.user.id = string_field(j, "id");
  state.user.display_name = string_field(j, "displayName");
  if (state.user.id.empty()) {
    error = "current user missing id";
    return false;
  }
  state.logged_in = true;
  out = std::move(state);
  return true;
}

bool parse_group(const std::string& body, Group& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object() || string_field(j, "id").empty()) {
    error = "group missing id";
    return false;
  }
  Group group;
  group.id = string_field(j, "id");
  group.name = string_field(j, "name");
  group.member_count = static_cast<int>(int_field(j, "memberCount"));
  if (j.contains("myMember") && j["myMember"].is_object()) {
    const auto& m = j["myMember"];
    GroupMyMember my;
    my.id = string_field(m, "id");
    my.group_id = string_field(m, "groupId");
    my.user_id = string_field(m, "userId");
    my.role_ids = string_array(m, "roleIds");
    group.my_member = std::move(my);
  }
  out = std::move(group);
  return true;
}

bool parse_group_members(const std::string& body, std::vector<GroupMember>& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_array()) {
    error = "group members must be an array";
    return false;
  }
  out.clear();
  for (const auto& item : j) {
    if (!item.is_object()) continue;
    out.push_back(member_from_json(item));
  }
  return true;
}

bool parse_group_roles(const std::string& body, std::vector<GroupRole>& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_array()) {
    error = "group roles must be an array";
    return false;
  }
  out.clear();
  for (const auto& item : j) {
    if (!item.is_object()) continue;
    GroupRole role;
    role.id = string_field(item, "id");
    role.name = string_field(item, "name");
    role.permissions = string_array(item, "permissions");
    out.push_back(std::move(role));
  }
  return true;
}

bool parse_user(const std::string& body, User& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object() || string_field(j, "id").empty()) {
    error = "user missing id";
    return false;
  }
  out.id = string_field(j, "id");
  out.display_name = string_field(j, "displayName");
  return true;
}

bool parse_world(const std::string& body, World& out, std::string& error) {
  json j;
  if (!parse_body(body, j, error)) return false;
  if (!j.is_object() || string_field(j, "id").empty()) {
    error = "world missing id";
    return false;
  }
  out.id = string_field(j, "id");
  out.name = string_field(j, "name");
  out.visits = int_field(j, "visits");
  out.favorites = int_field(j, "favorites");
  out.occupants = int_field(j, "occupants");
  return true;
}

std::unique_ptr<IVrcApi> make_web_api(net::IHttpTransport& transport, WebApiOptions options) {
  return std::make_unique<VrcWebApi>(transport, std::move(options));
}

} // namespace rtk::vrchat
