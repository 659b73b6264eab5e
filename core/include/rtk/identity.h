#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rtk::identity {

constexpr std::string_view kVrcUserPrefix = "usr_";
constexpr size_t kUuidLength = 36;
constexpr size_t kVrcUserIdLength = 40;

// 8-4-4-4-12 hex digits separated by hyphens.
bool is_uuid(std::string_view text);

// Finds the last "usr_" in text and returns the 40 character id that follows
// it, lowercased, when its body is a well-formed UUID.
std::optional<std::string> extract_vrc_id(std::string_view text);

} // namespace rtk::identity
