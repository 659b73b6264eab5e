#pragma once

#include "rtk/error.h"
#include "rtk_net/http.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtk::vrchat {

struct CurrentUser {
  std::string id;
  std::string display_name;
};

struct LoginState {
  bool logged_in = false;
  bool requires_two_factor = false;
  std::vector<std::string> two_factor_methods;
  CurrentUser user;
};

struct GroupMyMember {
  std::string id;
  std::string group_id;
  std::string user_id;
  std::vector<std::string> role_ids;
};

struct GroupMember {
  std::string id;
  std::string user_id;
  std::string display_name;
  std::vector<std::string> role_ids;
};

struct GroupRole {
  std::string id;
  std::string name;
  std::vector<std::string> permissions;
};

struct Group {
  std::string id;
  std::string name;
  int member_count = 0;
  std::optional<GroupMyMember> my_member;
};

struct User {
  std::string id;
  std::string display_name;
};

struct World {
  std::string id;
  std::string name;
  int64_t visits = 0;
  int64_t favorites = 0;
  int64_t occupants = 0;
};

constexpr int kGroupMemberPageSize = 100;

class IVrcApi {
 public:
  virtual ~IVrcApi() = default;
  virtual bool get_current_user(LoginState& out, RunError& error) = 0;
  virtual bool verify_totp(const std::string& code, RunError& error) = 0;
  virtual bool get_group(const std::string& group_id, Group& out, RunError& error) = 0;
  // One page of members; the API never lists the caller.
  virtual bool get_group_members(const std::string& group_id, int count, int offset,
                                 std::vector<GroupMember>& out, RunError& error) = 0;
  virtual bool get_group_roles(const std::string& group_id, std::vector<GroupRole>& out, RunError& error) = 0;
  virtual bool get_user(const std::string& user_id, User& out, RunError& error) = 0;
  virtual bool get_world(const std::string& world_id, World& out, RunError& error) = 0;
};

struct WebApiOptions {
  std::string base_url = "https://api.vrchat.cloud/api/1";
  std::string username;
  std::string password;
};

std::unique_ptr<IVrcApi> make_web_api(net::IHttpTransport& transport, WebApiOptions options);

// Response decoders, shared with tests.
bool parse_login_state(const std::string& body, LoginState& out, std::string& error);
bool parse_group(const std::string& body, Group& out, std::string& error);
bool parse_group_members(const std::string& body, std::vector<GroupMember>& out, std::string& error);
bool parse_group_roles(const std::string& body, std::vector<GroupRole>& out, std::string& error);
bool parse_user(const std::string& body, User& out, std::string& error);
bool parse_world(const std::string& body, World& out, std::string& error);

} // namespace rtk::vrchat
