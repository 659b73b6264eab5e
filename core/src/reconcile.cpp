#include "rtk/reconcile.h"

#include "rtk/identity.h"

#include <algorithm>

namespace rtk::reconcile {

namespace {
// Output order of both passes follows the claim key so results do not depend
// on hash iteration order.
std::vector<IdentityClaim> values_of(const std::map<std::string, IdentityClaim>& table) {
  std::vector<IdentityClaim> out;
  out.reserve(table.size());
  for (const auto& [key, claim] : table) {
    out.push_back(claim);
  }
  return out;
}

std::vector<std::string> sorted_unique(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}
} // namespace

bool is_newer(const IdentityClaim& a, const IdentityClaim& b) {
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms > b.timestamp_ms;
  }
  return a.sequence > b.sequence;
}

std::vector<IdentityClaim> extract_claims(const std::vector<ChatMessage>& messages) {
  std::vector<IdentityClaim> claims;
  for (const auto& message : messages) {
    auto vr_id = identity::extract_vrc_id(message.content);
    if (!vr_id) continue;
    claims.push_back({std::move(*vr_id), message.author_id, message.timestamp_ms, message.sequence});
  }
  return claims;
}

std::vector<IdentityClaim> newest_claim_per_author(const std::vector<IdentityClaim>& claims) {
  std::map<std::string, IdentityClaim> by_author;
  for (const auto& claim : claims) {
    auto it = by_author.find(claim.author_id);
    if (it == by_author.end()) {
      by_author.emplace(claim.author_id, claim);
    } else if (is_newer(claim, it->second)) {
      it->second = claim;
    }
  }
  return values_of(by_author);
}

std::vector<IdentityClaim> oldest_claim_per_id(const std::vector<IdentityClaim>& claims) {
  std::map<std::string, IdentityClaim> by_id;
  for (const auto& claim : claims) {
    auto it = by_id.find(claim.vr_id);
    if (it == by_id.end()) {
      by_id.emplace(claim.vr_id, claim);
    } else if (is_newer(it->second, claim)) {
      it->second = claim;
    }
  }
  return values_of(by_id);
}

ReconcileResult reconcile(const std::vector<ChatMessage>& messages, const Roster& roster) {
  ReconcileResult result;

  const auto claims = extract_claims(messages);
  result.messages_with_id = claims.size();

  const auto per_author = newest_claim_per_author(claims);
  result.authors = per_author.size();

  const auto per_id = oldest_claim_per_id(per_author);
  result.conflicts_dropped = per_author.size() - per_id.size();

  for (const auto& claim : per_id) {
    const auto member = roster.find(claim.author_id);
    if (member == roster.end()) {
      ++result.missing_from_roster;
      continue;
    }
    result.roles_by_vr_id[claim.vr_id] = sorted_unique(member->second);
    result.author_by_vr_id[claim.vr_id] = claim.author_id;
  }
  return result;
}

} // namespace rtk::reconcile
