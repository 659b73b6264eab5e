#include "rtk/identity.h"

#include <cctype>

namespace rtk::identity {

namespace {
bool is_hex(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}
} // namespace

bool is_uuid(std::string_view text) {
  if (text.size() != kUuidLength) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    const bool hyphen_slot = i == 8 || i == 13 || i == 18 || i == 23;
    if (hyphen_slot) {
      if (text[i] != '-') return false;
    } else if (!is_hex(text[i])) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> extract_vrc_id(std::string_view text) {
  const size_t pos = text.rfind(kVrcUserPrefix);
  if (pos == std::string_view::npos) return std::nullopt;
  if (text.size() - pos < kVrcUserIdLength) return std::nullopt;

  const std::string_view candidate = text.substr(pos, kVrcUserIdLength);
  if (!is_uuid(candidate.substr(kVrcUserPrefix.size()))) return std::nullopt;

  std::string out(candidate);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace rtk::identity
