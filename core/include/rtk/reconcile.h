#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtk::reconcile {

struct ChatMessage {
  std::string id;
  std::string author_id;
  int64_t timestamp_ms = 0;
  // Position in the channel listing, oldest first. Breaks timestamp ties:
  // a lower sequence is treated as the older message.
  uint64_t sequence = 0;
  std::string content;
};

struct IdentityClaim {
  std::string vr_id;
  std::string author_id;
  int64_t timestamp_ms = 0;
  uint64_t sequence = 0;
};

// Chat author id -> role ids held in the server.
using Roster = std::unordered_map<std::string, std::vector<std::string>>;
// VR user id -> sorted, unique role ids.
using RoleMap = std::map<std::string, std::vector<std::string>>;

struct ReconcileResult {
  RoleMap roles_by_vr_id;
  std::map<std::string, std::string> author_by_vr_id;
  size_t messages_with_id = 0;
  size_t authors = 0;
  size_t conflicts_dropped = 0;
  size_t missing_from_roster = 0;
};

bool is_newer(const IdentityClaim& a, const IdentityClaim& b);

std::vector<IdentityClaim> extract_claims(const std::vector<ChatMessage>& messages);

// Pass 1: one claim per author, the newest one.
std::vector<IdentityClaim> newest_claim_per_author(const std::vector<IdentityClaim>& claims);

// Pass 2: one claim per VR id, the oldest one among competing authors.
std::vector<IdentityClaim> oldest_claim_per_id(const std::vector<IdentityClaim>& claims);

ReconcileResult reconcile(const std::vector<ChatMessage>& messages, const Roster& roster);

} // namespace rtk::reconcile
