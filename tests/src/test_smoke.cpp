#include "rtk/config.h"
#include "rtk/directory.h"
#include "rtk/error.h"
#include "rtk/identity.h"
#include "rtk/interrupt.h"
#include "rtk/log.h"
#include "rtk/pacing.h"
#include "rtk/paths.h"
#include "rtk/reconcile.h"
#include "rtk/snapshot.h"
#include "rtk/tracker_run.h"
#include "rtk_data/serialization.h"
#include "rtk_discord/discord.h"
#include "rtk_net/http.h"
#include "rtk_vrchat/totp.h"
#include "rtk_vrchat/vrchat.h"
#include "rtkctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string kIdX = "usr_0a1b2c3d-0000-4000-8000-00000000000a";
const std::string kIdY = "usr_0a1b2c3d-0000-4000-8000-00000000000b";
const std::string kIdZ = "usr_0a1b2c3d-0000-4000-8000-00000000000c";
// RFC 6238 SHA1 test secret "12345678901234567890".
const std::string kRfcSecret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

rtk::reconcile::ChatMessage chat(const std::string& author, int64_t ts, uint64_t seq, const std::string& text) {
  rtk::reconcile::ChatMessage m;
  m.id = std::to_string(seq);
  m.author_id = author;
  m.timestamp_ms = ts;
  m.sequence = seq;
  m.content = text;
  return m;
}

std::string snowflake_at(uint64_t n) {
  return std::to_string(n << 22);
}

rtk::discord::Message discord_message(uint64_t n, const std::string& author, const std::string& content) {
  rtk::discord::Message m;
  m.id = snowflake_at(n);
  m.author_id = author;
  m.content = content;
  m.timestamp_ms = rtk::discord::snowflake_timestamp_ms(n << 22);
  return m;
}

struct RecordingSleep {
  std::vector<std::chrono::milliseconds> waits;

  rtk::SleepFn fn() {
    return [this](std::chrono::milliseconds d) { waits.push_back(d); };
  }
};

class FakeTransport final : public rtk::net::IHttpTransport {
 public:
  std::vector<rtk::net::HttpRequest> requests;
  std::vector<rtk::net::HttpResponse> responses;
  size_t next = 0;

  void push(int status, const std::string& body) {
    rtk::net::HttpResponse r;
    r.status = status;
    r.body = body;
    responses.push_back(r);
  }

  rtk::net::HttpResponse send(const rtk::net::HttpRequest& request) override {
    requests.push_back(request);
    if (next < responses.size()) return responses[next++];
    rtk::net::HttpResponse r;
    r.error = "no canned response";
    return r;
  }
};

class FakeVrcApi final : public rtk::vrchat::IVrcApi {
 public:
  std::vector<rtk::vrchat::LoginState> login_states;
  size_t login_calls = 0;
  std::vector<std::string> verified_codes;
  bool accept_code = true;
  std::map<std::string, rtk::vrchat::Group> groups;
  std::map<std::string, std::vector<rtk::vrchat::GroupMember>> members;
  std::map<std::string, std::vector<rtk::vrchat::GroupRole>> roles;
  std::map<std::string, rtk::vrchat::User> users;
  std::map<std::string, rtk::vrchat::World> worlds;
  int member_page_calls = 0;

  bool get_current_user(rtk::vrchat::LoginState& out, rtk::RunError& error) override {
    if (login_states.empty()) {
      rtk::set_error(error, rtk::ErrorKind::Auth, "Invalid Username/Email or Password", 401);
      return false;
    }
    out = login_states[std::min(login_calls, login_states.size() - 1)];
    ++login_calls;
    return true;
  }

  bool verify_totp(const std::string& code, rtk::RunError& error) override {
    verified_codes.push_back(code);
    if (!accept_code) {
      rtk::set_error(error, rtk::ErrorKind::Auth, "2FA code was not accepted");
      return false;
    }
    return true;
  }

  bool get_group(const std::string& id, rtk::vrchat::Group& out, rtk::RunError& error) override {
    auto it = groups.find(id);
    if (it == groups.end()) {
      rtk::set_error(error, rtk::ErrorKind::Api, "get group " + id + ": not found", 404);
      return false;
    }
    out = it->second;
    return true;
  }

  bool get_group_members(const std::string& id, int count, int offset, std::vector<rtk::vrchat::GroupMember>& out,
                         rtk::RunError&) override {
    ++member_page_calls;
    out.clear();
    const auto& all = members[id];
    for (size_t i = static_cast<size_t>(offset); i < all.size() && out.size() < static_cast<size_t>(count); ++i) {
      out.push_back(all[i]);
    }
    return true;
  }

  bool get_group_roles(const std::string& id, std::vector<rtk::vrchat::GroupRole>& out, rtk::RunError&) override {
    out = roles[id];
    return true;
  }

  bool get_user(const std::string& id, rtk::vrchat::User& out, rtk::RunError& error) override {
    auto it = users.find(id);
    if (it == users.end()) {
      rtk::set_error(error, rtk::ErrorKind::Api, "get user " + id + ": not found", 404);
      return false;
    }
    out = it->second;
    return true;
  }

  bool get_world(const std::string& id, rtk::vrchat::World& out, rtk::RunError& error) override {
    auto it = worlds.find(id);
    if (it == worlds.end()) {
      rtk::set_error(error, rtk::ErrorKind::Api, "get world " + id + ": not found", 404);
      return false;
    }
    out = it->second;
    return true;
  }
};

class FakeDiscordApi final : public rtk::discord::IDiscordApi {
 public:
  rtk::discord::Guild guild;
  rtk::discord::Channel channel;
  std::vector<rtk::discord::Role> roles;
  std::vector<rtk::discord::Member> members;
  // Newest first, as the API returns them.
  std::vector<rtk::discord::Message> messages;
  int failing_listings = 0;
  int message_calls = 0;

  bool get_current_bot(std::string& username, rtk::RunError&) override {
    username = "tracker-bot";
    return true;
  }

  bool get_guild(const std::string& id, rtk::discord::Guild& out, rtk::RunError& error) override {
    if (id != guild.id) {
      rtk::set_error(error, rtk::ErrorKind::Api, "get server " + id + ": Unknown Guild", 404);
      return false;
    }
    out = guild;
    return true;
  }

  bool get_guild_roles(const std::string&, std::vector<rtk::discord::Role>& out, rtk::RunError&) override {
    out = roles;
    return true;
  }

  bool get_channel(const std::string& id, rtk::discord::Channel& out, rtk::RunError& error) override {
    if (id != channel.id) {
      rtk::set_error(error, rtk::ErrorKind::Api, "get channel " + id + ": Unknown Channel", 404);
      return false;
    }
    out = channel;
    return true;
  }

  bool list_guild_members(const std::string&, const std::string& after, int limit,
                          std::vector<rtk::discord::Member>& out, rtk::RunError&) override {
    out.clear();
    const uint64_t after_id = std::stoull(after);
    for (const auto& m : members) {
      if (std::stoull(m.user_id) > after_id && out.size() < static_cast<size_t>(limit)) {
        out.push_back(m);
      }
    }
    return true;
  }

  bool list_channel_messages(const std::string&, const std::string& before, int limit,
                             std::vector<rtk::discord::Message>& out, rtk::RunError& error) override {
    ++message_calls;
    if (failing_listings > 0) {
      --failing_listings;
      rtk::set_error(error, rtk::ErrorKind::Api, "list channel messages: Service Unavailable", 503);
      return false;
    }
    out.clear();
    size_t start = 0;
    if (!before.empty()) {
      while (start < messages.size() && messages[start].id != before) ++start;
      ++start;
    }
    for (size_t i = start; i < messages.size() && out.size() < static_cast<size_t>(limit); ++i) {
      out.push_back(messages[i]);
    }
    return true;
  }
};

rtk::vrchat::LoginState needs_two_factor() {
  rtk::vrchat::LoginState s;
  s.requires_two_factor = true;
  s.two_factor_methods = {"totp", "otp"};
  return s;
}

rtk::vrchat::LoginState logged_in(const std::string& id, const std::string& name) {
  rtk::vrchat::LoginState s;
  s.logged_in = true;
  s.user = {id, name};
  return s;
}

rtk::vrchat::GroupMember group_member(const std::string& name, std::vector<std::string> roles) {
  rtk::vrchat::GroupMember m;
  m.id = "gmem_" + name;
  m.user_id = "usr_" + name;
  m.display_name = name;
  m.role_ids = std::move(roles);
  return m;
}

void populate_world(FakeVrcApi& vrc, FakeDiscordApi& discord) {
  vrc.login_states = {needs_two_factor(), logged_in("usr_self", "Self")};

  rtk::vrchat::Group alpha;
  alpha.id = "grp_1";
  alpha.name = "Alpha";
  alpha.member_count = 3;
  alpha.my_member = rtk::vrchat::GroupMyMember{"gmem_self", "grp_1", "usr_self", {"grol_owner"}};
  vrc.groups["grp_1"] = alpha;
  vrc.members["grp_1"] = {group_member("Zed", {"grol_mod"}), group_member("Amy", {})};
  vrc.roles["grp_1"] = {{"grol_owner", "Owner", {"*"}},
                        {"grol_mod", "Moderator", {"group-instance-moderate", "group-members-viewall"}},
                        {"grol_member", "Member", {}}};

  rtk::vrchat::Group beta;
  beta.id = "grp_2";
  beta.name = "Beta";
  beta.member_count = 2;
  beta.my_member = rtk::vrchat::GroupMyMember{"gmem_self2", "grp_2", "usr_self", {}};
  vrc.groups["grp_2"] = beta;
  vrc.members["grp_2"] = {group_member("Zed", {"grol_b"})};
  vrc.roles["grp_2"] = {{"grol_b", "Builder", {"group-galleries-manage"}}};

  vrc.users[kIdX] = {kIdX, "Zed"};
  vrc.users[kIdY] = {kIdY, "Bob VR"};
  vrc.worlds["wrld_1"] = {"wrld_1", "Hub", 10, 0, 3};

  discord.guild = {"100", "Guild"};
  discord.channel = {"200", "100", "link-your-account"};
  discord.roles = {{"100", "@everyone", 0},
                   {"300", "Admin", rtk::discord::kAdministratorBit},
                   {"301", "Mods", rtk::discord::kModerateMembersBit},
                   {"302", "Unused", 0}};
  discord.members = {{"500", "alice", {"300"}}, {"501", "bob", {"301"}}, {"502", "carol", {"302"}}};
  // Chronological order first, then reversed into API order.
  std::vector<rtk::discord::Message> chronological = {
      discord_message(1000, "500", "my id is " + kIdX),
      discord_message(1001, "501", "mine: " + kIdX),
      discord_message(1002, "501", "actually " + kIdY),
      discord_message(1003, "502", "hello"),
      discord_message(1004, "599", kIdZ),
  };
  discord.messages.assign(chronological.rbegin(), chronological.rend());
}

rtk::TrackerConfig e2e_config(const fs::path& workspace, const std::string& output) {
  rtk::TrackerConfig cfg;
  cfg.workspace = workspace;
  cfg.output = output;
  cfg.vrchat = {"tracker", "secret", kRfcSecret};
  cfg.group_ids = {"grp_1", "grp_2"};
  cfg.world_ids = {"wrld_1"};
  cfg.bot_token = "token";
  cfg.server_ids = {"100"};
  cfg.channel_ids = {"200"};
  cfg.retry.attempts = 3;
  cfg.retry.delay = std::chrono::milliseconds(10);
  return cfg;
}

} // namespace

int main(int, char**) {
  const fs::path test_root = fs::current_path() / "rtk_test_output";
  std::error_code cleanup_ec;
  fs::remove_all(test_root, cleanup_ec);
  fs::create_directories(test_root);
  rtk::log::init("rtk_tests", test_root / "logs");

  int failures = 0;

  // Test: id extraction.
  {
    using rtk::identity::extract_vrc_id;
    if (extract_vrc_id("no id in here").has_value()) {
      std::cerr << "extract without prefix should be empty\n";
      ++failures;
    }
    const auto upper = extract_vrc_id("link: usr_0A1B2C3D-0000-4000-8000-00000000000A thanks");
    if (!upper || *upper != kIdX) {
      std::cerr << "extract should lowercase the id\n";
      ++failures;
    }
    if (extract_vrc_id("usr_0a1b2c3d-0000-4000-8000-00000000000").has_value()) {
      std::cerr << "extract should reject a short tail\n";
      ++failures;
    }
    if (extract_vrc_id("usr_0a1b2c3d_0000_4000_8000_00000000000a").has_value()) {
      std::cerr << "extract should reject a malformed body\n";
      ++failures;
    }
    if (extract_vrc_id("usr_zzzzzzzz-0000-4000-8000-00000000000a").has_value()) {
      std::cerr << "extract should reject non-hex digits\n";
      ++failures;
    }
    const auto last = extract_vrc_id(kIdX + " then " + kIdY);
    if (!last || *last != kIdY) {
      std::cerr << "extract should use the last prefix\n";
      ++failures;
    }
    if (extract_vrc_id(kIdX + " then usr_broken").has_value()) {
      std::cerr << "extract should only consider the last prefix\n";
      ++failures;
    }
    const auto again = extract_vrc_id(*last);
    if (!again || *again != *last) {
      std::cerr << "extract should be idempotent on its output\n";
      ++failures;
    }
    if (!rtk::identity::is_uuid("123e4567-e89b-12d3-a456-426614174000") ||
        rtk::identity::is_uuid("123e4567e89b12d3a456426614174000")) {
      std::cerr << "uuid shape check failed\n";
      ++failures;
    }
  }

  // Test: reconcile, single claim.
  {
    rtk::reconcile::Roster roster{{"alice", {"roleA"}}};
    const auto result = rtk::reconcile::reconcile({chat("alice", 1, 0, kIdX)}, roster);
    const rtk::reconcile::RoleMap expected{{kIdX, {"roleA"}}};
    if (result.roles_by_vr_id != expected) {
      std::cerr << "reconcile single claim mismatch\n";
      ++failures;
    }
  }

  // Test: reconcile, two authors claim one id; the older claim wins.
  {
    rtk::reconcile::Roster roster{{"alice", {"roleA"}}, {"bob", {"roleB"}}};
    const auto result =
        rtk::reconcile::reconcile({chat("bob", 2, 1, kIdX), chat("alice", 1, 0, kIdX)}, roster);
    if (result.roles_by_vr_id.size() != 1 || result.author_by_vr_id.at(kIdX) != "alice" ||
        result.roles_by_vr_id.at(kIdX) != std::vector<std::string>{"roleA"}) {
      std::cerr << "reconcile should keep the oldest claim per id\n";
      ++failures;
    }
    if (result.conflicts_dropped != 1) {
      std::cerr << "reconcile conflict count wrong\n";
      ++failures;
    }
  }

  // Test: reconcile, one author updates their id; the newest claim wins.
  {
    rtk::reconcile::Roster roster{{"alice", {"roleA"}}};
    const auto result =
        rtk::reconcile::reconcile({chat("alice", 1, 0, kIdX), chat("alice", 2, 1, kIdY)}, roster);
    if (result.roles_by_vr_id.size() != 1 || result.roles_by_vr_id.count(kIdY) != 1) {
      std::cerr << "reconcile should keep the newest claim per author\n";
      ++failures;
    }
  }

  // Test: reconcile passes run in order (author pass first, then id pass).
  {
    rtk::reconcile::Roster roster{{"alice", {"a"}}, {"bob", {"b"}}};
    const auto result = rtk::reconcile::reconcile(
        {chat("alice", 1, 0, kIdX), chat("bob", 2, 1, kIdX), chat("alice", 3, 2, kIdY)}, roster);
    if (result.author_by_vr_id.size() != 2 || result.author_by_vr_id.at(kIdX) != "bob" ||
        result.author_by_vr_id.at(kIdY) != "alice") {
      std::cerr << "reconcile two-pass ordering wrong\n";
      ++failures;
    }
  }

  // Test: reconcile equal timestamps fall back to sequence.
  {
    rtk::reconcile::Roster roster{{"alice", {"a"}}, {"bob", {"b"}}};
    const auto result =
        rtk::reconcile::reconcile({chat("bob", 5, 4, kIdX), chat("alice", 5, 3, kIdX)}, roster);
    if (result.author_by_vr_id.count(kIdX) != 1 || result.author_by_vr_id.at(kIdX) != "alice") {
      std::cerr << "reconcile tie-break on sequence wrong\n";
      ++failures;
    }
    const auto per_author = rtk::reconcile::newest_claim_per_author(
        {{kIdX, "alice", 5, 1}, {kIdY, "alice", 5, 2}});
    if (per_author.size() != 1 || per_author[0].vr_id != kIdY) {
      std::cerr << "newest per author tie-break wrong\n";
      ++failures;
    }
  }

  // Test: reconcile drops authors missing from the roster and ignores noise.
  {
    rtk::reconcile::Roster roster{{"alice", {"b", "a", "a"}}};
    const auto result = rtk::reconcile::reconcile(
        {chat("alice", 1, 0, kIdX), chat("ghost", 2, 1, kIdY), chat("alice", 3, 2, "hi")}, roster);
    if (result.roles_by_vr_id.size() != 1 || result.missing_from_roster != 1 || result.messages_with_id != 2) {
      std::cerr << "reconcile roster drop wrong\n";
      ++failures;
    }
    if (result.roles_by_vr_id.at(kIdX) != std::vector<std::string>{"a", "b"}) {
      std::cerr << "reconcile role set should be sorted and unique\n";
      ++failures;
    }
  }

  // Test: directory canonical list and projections.
  {
    using namespace rtk::directory;
    MembershipContext g1{"grp_1", "One", {{"r_admin", "Admin", {"*"}}, {"r_mod", "Mod", {"group-instance-moderate"}}},
                         {{"Zed", {"r_admin"}}, {"amy", {"r_mod"}}, {"Bob", {}}}, kVrcGroupMarkers};
    MembershipContext g2{"grp_2", "Two", {{"r_plain", "Plain", {}}}, {{"Zed", {"r_plain"}}}, kVrcGroupMarkers};
    const auto dir = build_directory({g1, g2}, {});
    const std::vector<std::string> expected_names{"Bob", "Zed", "amy"};
    if (dir.display_names != expected_names) {
      std::cerr << "canonical names should be sorted and deduplicated\n";
      ++failures;
    }
    if (std::count(dir.display_names.begin(), dir.display_names.end(), "Zed") != 1) {
      std::cerr << "Zed should appear once\n";
      ++failures;
    }
    const auto again = build_directory({g2, g1}, {});
    if (again.display_names != dir.display_names) {
      std::cerr << "canonical names should not depend on input order\n";
      ++failures;
    }
    if (dir.groups.size() != 2 || dir.groups[0].users != std::vector<int>{0, 1, 2}) {
      std::cerr << "group users projection wrong\n";
      ++failures;
    }
    const auto& roles = dir.groups[0].roles;
    if (roles.size() != 2 || !roles[0].is_admin || !roles[0].is_moderator || roles[1].is_admin ||
        !roles[1].is_moderator) {
      std::cerr << "admin/moderator flags wrong\n";
      ++failures;
    }
    if (roles[0].users != std::vector<int>{1} || dir.groups[1].roles[0].users != std::vector<int>{1}) {
      std::cerr << "shared canonical index across groups wrong\n";
      ++failures;
    }
  }

  // Test: directory never emits -1.
  {
    using namespace rtk::directory;
    MembershipContext g{"grp", "G", {{"r", "R", {}}}, {{"Known", {"r"}}, {"Unknown", {"r"}}}, kVrcGroupMarkers};
    const auto projected = project_context(g, {"Known"});
    if (projected.users != std::vector<int>{0} || projected.roles[0].users != std::vector<int>{0}) {
      std::cerr << "unknown names should be filtered\n";
      ++failures;
    }
    if (canonical_index({"a", "b"}, "c") != kNotFound || canonical_index({"a", "b"}, "b") != 1) {
      std::cerr << "canonical_index wrong\n";
      ++failures;
    }
    const auto held = roles_held_by_members({{"1", "One", {}}, {"2", "Two", {}}}, {{"x", {"2"}}});
    if (held.size() != 1 || held[0].id != "2") {
      std::cerr << "roles_held_by_members wrong\n";
      ++failures;
    }
  }

  // Test: snapshot sparse serialization and read-back.
  {
    using namespace rtk::directory;
    MembershipContext g{"grp_1", "Group", {{"r_admin", "Admin", {"*"}}, {"r_empty", "Empty", {}}},
                        {{"Zed", {"r_admin"}}, {"Amy", {}}}, kVrcGroupMarkers};
    MembershipContext s{"100", "Server", {{"300", "Mods", {"moderate_members"}}}, {{"Zed", {"300"}}},
                        kDiscordMarkers};
    const auto snap = rtk::snapshot::assemble(build_directory({g}, {s}), {{"wrld_1", "Hub", 5, 0, 0}});
    const json j = rtk::snapshot::to_json(snap);
    const auto& empty_role = j["vrcGroupsById"]["grp_1"]["roles"]["r_empty"];
    if (empty_role.contains("isAdmin") || empty_role.contains("isModerator") || empty_role.contains("vrcUsers")) {
      std::cerr << "sparse serialization should omit defaults\n";
      ++failures;
    }
    if (j["discordServersById"]["100"]["roles"]["300"].contains("isAdmin") ||
        !j["discordServersById"]["100"]["roles"]["300"].value("isModerator", false)) {
      std::cerr << "server role flags wrong\n";
      ++failures;
    }
    if (j["vrcWorldsById"]["wrld_1"].contains("favorites") || j["vrcWorldsById"]["wrld_1"].value("visits", 0) != 5) {
      std::cerr << "world serialization wrong\n";
      ++failures;
    }

    rtk::snapshot::Snapshot back;
    std::string error;
    if (!rtk::snapshot::from_json(json::parse(j.dump()), back, error)) {
      std::cerr << "snapshot read-back failed: " << error << "\n";
      ++failures;
    } else {
      const auto original = rtk::snapshot::role_members(snap, snap.vrc_groups_by_id.at("grp_1"));
      const auto recovered = rtk::snapshot::role_members(back, back.vrc_groups_by_id.at("grp_1"));
      if (original != recovered || recovered.at("r_admin") != std::vector<std::string>{"Zed"}) {
        std::cerr << "role associations not recovered\n";
        ++failures;
      }
      if (back.discord_servers_by_id.at("100").vrc_users != snap.discord_servers_by_id.at("100").vrc_users) {
        std::cerr << "server users not recovered\n";
        ++failures;
      }
    }

    json bad = j;
    bad["vrcGroupsById"]["grp_1"]["vrcUsers"] = json::array({7});
    if (rtk::snapshot::from_json(bad, back, error)) {
      std::cerr << "out of range index should be rejected\n";
      ++failures;
    }

    const json wide = json::parse(R"({"vrcUserDisplayNames":["Zed"],"vrcGroupsById":{"g":{"vrcUsers":[4294967296]}}})");
    if (rtk::snapshot::from_json(wide, back, error)) {
      std::cerr << "index beyond int range should be rejected\n";
      ++failures;
    }

    const std::vector<std::string> mistyped = {
        R"({"vrcGroupsById":{"g":{"roles":{"r":{"name":5}}}}})",
        R"({"vrcGroupsById":{"g":{"name":true}}})",
        R"({"discordServersById":{"s":{"roles":{"r":{"isAdmin":"yes"}}}}})",
        R"({"vrcWorldsById":{"w":{"visits":"many"}}})",
        R"({"vrcGroupsById":{"g":{"vrcUsers":[-1]}},"vrcUserDisplayNames":["Zed"]})",
    };
    for (const auto& text : mistyped) {
      error.clear();
      if (rtk::snapshot::from_json(json::parse(text), back, error) || error.empty()) {
        std::cerr << "mistyped snapshot field should be an error: " << text << "\n";
        ++failures;
      }
    }
  }

  // Test: base32 and TOTP against RFC 6238.
  {
    std::vector<uint8_t> key;
    std::string error;
    if (!rtk::vrchat::base32_decode("gezd gnbv gy3t qojq gezd gnbv gy3t qojq", key, error) ||
        std::string(key.begin(), key.end()) != "12345678901234567890") {
      std::cerr << "base32 decode failed\n";
      ++failures;
    }
    std::string code;
    if (!rtk::vrchat::totp_code(key, 59, code, error) || code != "287082") {
      std::cerr << "totp at 59 wrong: " << code << "\n";
      ++failures;
    }
    if (!rtk::vrchat::totp_code(key, 1234567890, code, error) || code != "005924") {
      std::cerr << "totp at 1234567890 wrong: " << code << "\n";
      ++failures;
    }
    if (rtk::vrchat::base32_decode("not base32!", key, error)) {
      std::cerr << "base32 should reject invalid characters\n";
      ++failures;
    }
    if (rtk::vrchat::totp_remaining_seconds(59) != 1 || rtk::vrchat::totp_remaining_seconds(60) != 30) {
      std::cerr << "totp remaining seconds wrong\n";
      ++failures;
    }
  }

  // Test: config helpers and validation.
  {
    if (rtk::split_delimited(" a, ,b ,") != std::vector<std::string>{"a", "b"}) {
      std::cerr << "split_delimited wrong\n";
      ++failures;
    }
    if (!rtk::is_snowflake("175928847299117063") || rtk::is_snowflake("12a") ||
        rtk::is_snowflake("18446744073709551616")) {
      std::cerr << "is_snowflake wrong\n";
      ++failures;
    }

    TrackArgs args;
    std::string error;
    const std::vector<std::string> argv{"-w", test_root.string(), "-o", "out", "-u", "tracker", "-p", "pw",
                                        "-k", kRfcSecret, "-b", "token", "-d", "1,2", "-c", "3"};
    if (!parse_track_args(argv, args, error)) {
      std::cerr << "parse_track_args failed: " << error << "\n";
      ++failures;
    } else {
      rtk::RunError run_error;
      if (rtk::validate_tracker_config(args.config, run_error) || run_error.kind != rtk::ErrorKind::Config ||
          rtk::exit_code_for(run_error) != 2) {
        std::cerr << "mismatched servers/channels should be a config error\n";
        ++failures;
      }
    }
    if (parse_track_args({"-w", "x", "--bogus"}, args, error)) {
      std::cerr << "unknown option should fail\n";
      ++failures;
    }

    rtk::TrackerConfig cfg = e2e_config(test_root, "out");
    cfg.channel_ids = {"not-a-number"};
    rtk::RunError run_error;
    if (rtk::validate_tracker_config(cfg, run_error)) {
      std::cerr << "non-numeric channel should be rejected\n";
      ++failures;
    }
    cfg = e2e_config(test_root, "out");
    run_error = {};
    if (!rtk::validate_tracker_config(cfg, run_error)) {
      std::cerr << "valid config rejected: " << run_error.message << "\n";
      ++failures;
    }
  }

  // Test: config file merge.
  {
    const fs::path path = test_root / "tracker.json";
    {
      std::ofstream out(path);
      out << R"({"tracker":{"user_agent":"custom/1.0","pacing":{"listing_delay_ms":0,"lookup_delay_ms":250},)"
          << R"("retry":{"attempts":2,"delay_ms":5},"discord":{"max_messages":500}}})";
    }
    rtk::TrackerConfig cfg;
    rtk::RunError error;
    if (!rtk::load_tracker_config(path, cfg, error) || cfg.user_agent != "custom/1.0" ||
        cfg.pacing.listing_delay.count() != 0 || cfg.pacing.lookup_delay.count() != 250 ||
        cfg.pacing.discord_delay.count() != 5000 || cfg.retry.attempts != 2 || cfg.discord_max_messages != 500) {
      std::cerr << "json config merge wrong: " << error.message << "\n";
      ++failures;
    }

    const fs::path bad_path = test_root / "bad.json";
    {
      std::ofstream out(bad_path);
      out << R"({"retry":{"attempts":0}})";
    }
    error = {};
    if (rtk::load_tracker_config(bad_path, cfg, error) || error.kind != rtk::ErrorKind::Config) {
      std::cerr << "zero retry attempts should be rejected\n";
      ++failures;
    }

#if RTK_ENABLE_DATA_YAML
    const fs::path yaml_path = test_root / "tracker.yaml";
    {
      std::ofstream out(yaml_path);
      out << "tracker:\n  http:\n    timeout_seconds: 12\n  totp:\n    min_remaining_seconds: 8\n";
    }
    rtk::TrackerConfig yaml_cfg;
    error = {};
    if (!rtk::load_tracker_config(yaml_path, yaml_cfg, error) || yaml_cfg.http_timeout_seconds != 12 ||
        yaml_cfg.totp_min_remaining_seconds != 8) {
      std::cerr << "yaml config merge wrong: " << error.message << "\n";
      ++failures;
    }
#endif
  }

  // Test: fixed retry.
  {
    RecordingSleep sleep;
    rtk::Pacer pacer(sleep.fn());
    rtk::RetryPolicy policy{5, std::chrono::milliseconds(30)};
    int calls = 0;
    rtk::RunError error;
    const bool ok = rtk::retry_fixed(policy, pacer, "flaky", [&](rtk::RunError& e) {
      if (++calls < 3) {
        rtk::set_error(e, rtk::ErrorKind::Api, "busy", 503);
        return false;
      }
      return true;
    }, error);
    if (!ok || calls != 3 || sleep.waits.size() != 2 || pacer.total_waited().count() != 60) {
      std::cerr << "retry should recover after two failures\n";
      ++failures;
    }

    calls = 0;
    error = {};
    const bool exhausted = rtk::retry_fixed(policy, pacer, "down", [&](rtk::RunError& e) {
      ++calls;
      rtk::set_error(e, rtk::ErrorKind::Api, "down", 500);
      return false;
    }, error);
    if (exhausted || calls != 5 || error.kind != rtk::ErrorKind::Transient || error.http_status != 500) {
      std::cerr << "retry exhaustion should be transient\n";
      ++failures;
    }

    calls = 0;
    error = {};
    rtk::retry_fixed(policy, pacer, "auth", [&](rtk::RunError& e) {
      ++calls;
      rtk::set_error(e, rtk::ErrorKind::Auth, "401 Unauthorized", 401);
      return false;
    }, error);
    if (calls != 1 || error.kind != rtk::ErrorKind::Auth) {
      std::cerr << "auth failures should not be retried\n";
      ++failures;
    }
  }

  // Test: Discord decoding.
  {
    uint64_t id = 0;
    if (!rtk::discord::parse_snowflake("175928847299117063", id) ||
        rtk::discord::snowflake_timestamp_ms(id) != 1462015105796) {
      std::cerr << "snowflake timestamp wrong\n";
      ++failures;
    }
    const auto names = rtk::discord::permission_names(rtk::discord::kAdministratorBit |
                                                      rtk::discord::kModerateMembersBit | 1);
    if (names != std::vector<std::string>{"administrator", "moderate_members"}) {
      std::cerr << "permission names wrong\n";
      ++failures;
    }
    std::vector<rtk::discord::Role> roles;
    std::string error;
    if (!rtk::discord::parse_roles(
            R"([{"id":"1","name":"@everyone","permissions":"104324673"},{"id":"2","name":"Admin","permissions":"8"}])",
            roles, error) ||
        roles.size() != 2 || roles[1].permissions != 8 ||
        rtk::discord::permission_names(roles[0].permissions).size() != 0) {
      std::cerr << "discord roles parse wrong\n";
      ++failures;
    }
    std::vector<rtk::discord::Message> messages;
    if (!rtk::discord::parse_messages(
            R"([{"id":"175928847299117063","content":"hi","author":{"id":"5"}},{"id":"x","author":{"id":"6"}}])",
            messages, error) ||
        messages.size() != 1 || messages[0].author_id != "5" || messages[0].timestamp_ms != 1462015105796) {
      std::cerr << "discord messages parse wrong\n";
      ++failures;
    }

    FakeTransport transport;
    transport.push(200, R"([{"user":{"id":"9","username":"z"},"roles":["2"]}])");
    transport.push(403, R"({"message":"Missing Access","code":50001})");
    auto api = rtk::discord::make_rest_api(transport, {"https://discord.test/api/", "tok"});
    std::vector<rtk::discord::Member> members;
    rtk::RunError run_error;
    if (!api->list_guild_members("100", "0", 1000, members, run_error) || members.size() != 1 ||
        members[0].role_ids != std::vector<std::string>{"2"}) {
      std::cerr << "discord members request failed\n";
      ++failures;
    }
    const auto& req = transport.requests[0];
    if (req.url != "https://discord.test/api/guilds/100/members?limit=1000&after=0" ||
        std::find(req.headers.begin(), req.headers.end(), "Authorization: Bot tok") == req.headers.end()) {
      std::cerr << "discord request shape wrong: " << req.url << "\n";
      ++failures;
    }
    if (api->list_channel_messages("200", "55", 100, messages, run_error) || run_error.http_status != 403 ||
        run_error.message.find("Missing Access") == std::string::npos ||
        transport.requests[1].url.find("before=55") == std::string::npos) {
      std::cerr << "discord error mapping wrong\n";
      ++failures;
    }
  }

  // Test: VRChat decoding and requests.
  {
    FakeTransport transport;
    transport.push(200, R"({"requiresTwoFactorAuth":["totp","otp"]})");
    transport.push(401, R"({"error":{"message":"Invalid Username/Email or Password","status_code":401}})");
    transport.push(200, R"({"id":"grp_1","name":"G","memberCount":4,"myMember":{"id":"gmem_1","groupId":"grp_1","userId":"usr_me","roleIds":["grol_1"]}})");
    transport.push(200, R"([{"id":"gmem_2","userId":"usr_a","user":{"id":"usr_a","displayName":"A"},"roleIds":[]}])");
    auto api = rtk::vrchat::make_web_api(transport, {"https://vrchat.test/api/1", "me@example.com", "p@ss word"});

    rtk::vrchat::LoginState state;
    rtk::RunError error;
    if (!api->get_current_user(state, error) || !state.requires_two_factor || state.logged_in) {
      std::cerr << "vrchat 2FA state not detected\n";
      ++failures;
    }
    const auto& auth = transport.requests[0].basic_auth;
    if (!auth || auth->username != "me%40example.com" || auth->password != "p%40ss%20word") {
      std::cerr << "vrchat credentials should be url-encoded\n";
      ++failures;
    }
    if (api->get_current_user(state, error) || error.kind != rtk::ErrorKind::Auth || error.http_status != 401 ||
        error.message.find("Invalid Username") == std::string::npos) {
      std::cerr << "vrchat 401 should be an auth error\n";
      ++failures;
    }
    rtk::vrchat::Group group;
    error = {};
    if (!api->get_group("grp_1", group, error) || group.member_count != 4 || !group.my_member ||
        group.my_member->role_ids != std::vector<std::string>{"grol_1"} ||
        transport.requests[2].url != "https://vrchat.test/api/1/groups/grp_1?includeRoles=true") {
      std::cerr << "vrchat group decode wrong\n";
      ++failures;
    }
    std::vector<rtk::vrchat::GroupMember> members;
    if (!api->get_group_members("grp_1", 100, 0, members, error) || members.size() != 1 ||
        members[0].display_name != "A" ||
        transport.requests[3].url != "https://vrchat.test/api/1/groups/grp_1/members?n=100&offset=0") {
      std::cerr << "vrchat members decode wrong\n";
      ++failures;
    }
    rtk::vrchat::World world;
    std::string parse_error;
    if (!rtk::vrchat::parse_world(R"({"id":"wrld_1","name":"Hub","visits":12,"favorites":3,"occupants":1})", world,
                                  parse_error) ||
        world.visits != 12 || world.favorites != 3 || world.occupants != 1) {
      std::cerr << "vrchat world decode wrong\n";
      ++failures;
    }
  }

  // Test: two-factor login waits for a fresh code.
  {
    FakeVrcApi vrc;
    vrc.login_states = {needs_two_factor(), logged_in("usr_self", "Self")};
    RecordingSleep sleep;
    rtk::Pacer pacer(sleep.fn());
    int64_t clock = 57;
    const rtk::runtime::ClockFn now = [&clock] { return clock; };
    rtk::vrchat::CurrentUser user;
    rtk::RunError error;
    if (!rtk::runtime::login(vrc, {"u", "p", kRfcSecret}, 5, pacer, now, user, error) || user.id != "usr_self") {
      std::cerr << "two-factor login failed: " << error.message << "\n";
      ++failures;
    }
    if (sleep.waits.size() != 1 || sleep.waits[0].count() != 4000) {
      std::cerr << "login should wait for a fresh TOTP window\n";
      ++failures;
    }
    std::vector<uint8_t> key;
    std::string code;
    std::string key_error;
    rtk::vrchat::base32_decode(kRfcSecret, key, key_error);
    rtk::vrchat::totp_code(key, clock, code, key_error);
    if (vrc.verified_codes != std::vector<std::string>{code}) {
      std::cerr << "login verified the wrong code\n";
      ++failures;
    }

    FakeVrcApi stuck;
    stuck.login_states = {needs_two_factor()};
    error = {};
    if (rtk::runtime::login(stuck, {"u", "p", kRfcSecret}, 5, pacer, now, user, error) ||
        error.kind != rtk::ErrorKind::Auth) {
      std::cerr << "unvalidated 2FA should be an auth error\n";
      ++failures;
    }

    FakeVrcApi rejected;
    error = {};
    if (rtk::runtime::login(rejected, {"u", "p", kRfcSecret}, 5, pacer, now, user, error) ||
        error.kind != rtk::ErrorKind::Auth) {
      std::cerr << "bad credentials should be an auth error\n";
      ++failures;
    }
  }

  // Test: group member paging adds the caller.
  {
    FakeVrcApi vrc;
    rtk::vrchat::Group group;
    group.id = "grp_big";
    group.member_count = 251;
    group.my_member = rtk::vrchat::GroupMyMember{"gmem_me", "grp_big", "usr_me", {"grol_x"}};
    for (int i = 0; i < 250; ++i) {
      vrc.members["grp_big"].push_back(group_member("m" + std::to_string(i), {}));
    }
    RecordingSleep sleep;
    rtk::Pacer pacer(sleep.fn());
    std::vector<rtk::vrchat::GroupMember> members;
    rtk::RunError error;
    if (!rtk::runtime::collect_group_members(vrc, group, {"usr_me", "Me"}, pacer, std::chrono::milliseconds(1000),
                                             members, error) ||
        members.size() != 251 || vrc.member_page_calls != 3 || sleep.waits.size() != 3) {
      std::cerr << "group member paging wrong\n";
      ++failures;
    }
    if (members.back().display_name != "Me" || members.back().role_ids != std::vector<std::string>{"grol_x"}) {
      std::cerr << "caller should be appended from myMember\n";
      ++failures;
    }

    group.my_member.reset();
    error = {};
    if (rtk::runtime::collect_group_members(vrc, group, {"usr_me", "Me"}, pacer, std::chrono::milliseconds(0),
                                            members, error) ||
        error.kind != rtk::ErrorKind::Membership) {
      std::cerr << "non-member group should be a membership error\n";
      ++failures;
    }
  }

  // Test: channel message paging.
  {
    FakeDiscordApi discord;
    for (uint64_t n = 250; n > 0; --n) {
      discord.messages.push_back(discord_message(n, "1", "m"));
    }
    RecordingSleep sleep;
    rtk::Pacer pacer(sleep.fn());
    std::vector<rtk::reconcile::ChatMessage> messages;
    rtk::RunError error;
    if (!rtk::runtime::collect_channel_messages(discord, "200", 100000, pacer, std::chrono::milliseconds(1),
                                                messages, error) ||
        messages.size() != 250 || discord.message_calls != 3) {
      std::cerr << "message paging wrong\n";
      ++failures;
    } else if (messages.front().id != snowflake_at(1) || messages.front().sequence != 0 ||
               messages.back().sequence != 249 || messages.back().timestamp_ms <= messages.front().timestamp_ms) {
      std::cerr << "messages should be oldest first\n";
      ++failures;
    }
    if (!rtk::runtime::collect_channel_messages(discord, "200", 150, pacer, std::chrono::milliseconds(1), messages,
                                                error) ||
        messages.size() != 150 || messages.back().id != snowflake_at(250)) {
      std::cerr << "message cap wrong\n";
      ++failures;
    }
  }

  // Test: end-to-end run writes the snapshot.
  {
    FakeVrcApi vrc;
    FakeDiscordApi discord;
    populate_world(vrc, discord);
    discord.failing_listings = 1;
    RecordingSleep sleep;
    rtk::Pacer pacer(sleep.fn());

    rtk::runtime::TrackerDeps deps;
    deps.vrchat = &vrc;
    deps.discord = &discord;
    deps.pacer = &pacer;
    deps.now = [] { return int64_t{1000}; };

    const auto cfg = e2e_config(test_root, "out");
    const auto paths = rtk::resolve_paths(cfg.workspace, cfg.output);
    rtk::runtime::TrackerRun run(cfg, deps);
    rtk::runtime::RunSummary summary;
    rtk::RunError error;
    if (!run.run(paths, summary, error)) {
      std::cerr << "end-to-end run failed: " << rtk::describe(error) << "\n";
      ++failures;
    } else {
      json j;
      std::string load_error;
      if (!rtk::data::load_json_file(paths.snapshot_file, j, load_error)) {
        std::cerr << "snapshot not readable: " << load_error << "\n";
        ++failures;
      } else {
        if (j["vrcUserDisplayNames"] != json::array({"Amy", "Bob VR", "Self", "Zed"})) {
          std::cerr << "e2e names wrong: " << j["vrcUserDisplayNames"].dump() << "\n";
          ++failures;
        }
        const auto& alpha = j["vrcGroupsById"]["grp_1"];
        if (alpha["vrcUsers"] != json::array({0, 2, 3}) || alpha["roles"]["grol_owner"]["vrcUsers"] != json::array({2}) ||
            !alpha["roles"]["grol_owner"].value("isAdmin", false) ||
            alpha["roles"]["grol_mod"].contains("isAdmin") ||
            !alpha["roles"]["grol_mod"].value("isModerator", false) ||
            alpha["roles"]["grol_member"].contains("vrcUsers")) {
          std::cerr << "e2e group projection wrong: " << alpha.dump() << "\n";
          ++failures;
        }
        if (j["vrcGroupsById"]["grp_2"]["vrcUsers"] != json::array({2, 3})) {
          std::cerr << "e2e second group wrong\n";
          ++failures;
        }
        const auto& server = j["discordServersById"]["100"];
        if (server.value("name", "") != "Guild" || server["vrcUsers"] != json::array({1, 3}) ||
            server["roles"]["300"]["vrcUsers"] != json::array({3}) ||
            server["roles"]["301"]["vrcUsers"] != json::array({1}) || server["roles"].contains("302") ||
            server["roles"]["100"].value("name", "") != "@everyone" ||
            server["roles"]["100"]["vrcUsers"] != json::array({1, 3}) || server["roles"]["100"].contains("isAdmin")) {
          std::cerr << "e2e server projection wrong: " << server.dump() << "\n";
          ++failures;
        }
        if (j["vrcWorldsById"]["wrld_1"].value("visits", 0) != 10 ||
            j["vrcWorldsById"]["wrld_1"].contains("favorites")) {
          std::cerr << "e2e world wrong\n";
          ++failures;
        }
      }
      if (summary.users != 4 || summary.groups != 2 || summary.servers != 1 || summary.worlds != 1) {
        std::cerr << "e2e summary wrong\n";
        ++failures;
      }
      if (discord.message_calls != 2 ||
          std::find(sleep.waits.begin(), sleep.waits.end(), std::chrono::milliseconds(10)) == sleep.waits.end()) {
        std::cerr << "e2e listing should have been retried once\n";
        ++failures;
      }
      if (vrc.verified_codes.size() != 1) {
        std::cerr << "e2e should have passed 2FA\n";
        ++failures;
      }
      bool document_logged = false;
      for (const auto& line : rtk::log::recent()) {
        if (line.find("\"vrcUserDisplayNames\":[\"Amy\",\"Bob VR\",\"Self\",\"Zed\"]") != std::string::npos) {
          document_logged = true;
        }
      }
      if (!document_logged) {
        std::cerr << "e2e should log the written document\n";
        ++failures;
      }
    }

    std::ostringstream report;
    std::string report_error;
    rtk::snapshot::Snapshot snap = run.build();
    if (!write_inspect_report(snap, std::string("100/300"), report, report_error) ||
        report.str().find("    Zed\n") == std::string::npos || report.str().find("Bob VR") != std::string::npos) {
      std::cerr << "inspect report wrong: " << report.str() << "\n";
      ++failures;
    }
    if (write_inspect_report(snap, std::string("nope"), report, report_error)) {
      std::cerr << "inspect should reject unknown context\n";
      ++failures;
    }
    report_error.clear();
    if (write_inspect_report(snap, std::string("100/999"), report, report_error) ||
        report_error.find("999") == std::string::npos) {
      std::cerr << "inspect should reject unknown role\n";
      ++failures;
    }
  }

  // Test: a fatal error writes nothing.
  {
    FakeVrcApi vrc;
    FakeDiscordApi discord;
    populate_world(vrc, discord);
    vrc.groups["grp_2"].my_member.reset();
    rtk::Pacer pacer([](std::chrono::milliseconds) {});
    rtk::runtime::TrackerDeps deps{&vrc, &discord, &pacer, [] { return int64_t{1000}; }};
    const auto cfg = e2e_config(test_root, "out_membership");
    const auto paths = rtk::resolve_paths(cfg.workspace, cfg.output);
    rtk::runtime::TrackerRun run(cfg, deps);
    rtk::runtime::RunSummary summary;
    rtk::RunError error;
    if (run.run(paths, summary, error) || error.kind != rtk::ErrorKind::Membership || fs::exists(paths.snapshot_file)) {
      std::cerr << "membership failure should abort without output\n";
      ++failures;
    }

    FakeDiscordApi flaky;
    FakeVrcApi vrc2;
    populate_world(vrc2, flaky);
    flaky.failing_listings = 10;
    const auto cfg2 = e2e_config(test_root, "out_transient");
    const auto paths2 = rtk::resolve_paths(cfg2.workspace, cfg2.output);
    rtk::runtime::TrackerRun run2(cfg2, {&vrc2, &flaky, &pacer, [] { return int64_t{1000}; }});
    error = {};
    if (run2.run(paths2, summary, error) || error.kind != rtk::ErrorKind::Transient || flaky.message_calls != 3 ||
        fs::exists(paths2.snapshot_file)) {
      std::cerr << "exhausted listing should abort without output\n";
      ++failures;
    }

    FakeVrcApi vrc3;
    FakeDiscordApi discord3;
    populate_world(vrc3, discord3);
    const auto cfg3 = e2e_config(test_root, "out_interrupt");
    const auto paths3 = rtk::resolve_paths(cfg3.workspace, cfg3.output);
    rtk::runtime::TrackerRun run3(cfg3, {&vrc3, &discord3, &pacer, [] { return int64_t{1000}; }});
    rtk::interrupt::request();
    error = {};
    const bool interrupted_ok = run3.run(paths3, summary, error);
    rtk::interrupt::reset();
    if (interrupted_ok || error.kind != rtk::ErrorKind::Interrupted || fs::exists(paths3.snapshot_file) ||
        discord3.message_calls != 0) {
      std::cerr << "interrupt should stop before the next server\n";
      ++failures;
    }
  }

  // Test: a missing workspace is a config error and nothing is created.
  {
    const fs::path missing = test_root / "no_such_workspace";
    rtk::TrackerConfig cfg = e2e_config(missing, "out");
    cfg.vrchat.password = "missing-ws-password";
    cfg.bot_token = "missing-ws-token";
    rtk::RunError error;
    if (rtk::validate_tracker_config(cfg, error) || error.kind != rtk::ErrorKind::Config) {
      std::cerr << "missing workspace should fail validation\n";
      ++failures;
    }
    TrackArgs args;
    args.config = cfg;
    if (track_command(args) != 2 || fs::exists(missing)) {
      std::cerr << "track with a missing workspace should exit 2 without creating it\n";
      ++failures;
    }
  }

  // Test: registered secrets never reach the log.
  {
    rtk::log::add_secret("hunter2");
    rtk::log::info("login with hunter2 then hunter2");
    const auto lines = rtk::log::recent(1);
    if (lines.size() != 1 || lines[0].find("hunter2") != std::string::npos ||
        lines[0].find("login with *** then ***") == std::string::npos) {
      std::cerr << "secret not redacted\n";
      ++failures;
    }
  }

  rtk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
