#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rtk::vrchat {

constexpr int kTotpStepSeconds = 30;
constexpr int kTotpDigits = 6;

// RFC 4648 alphabet; case-insensitive, blanks and padding ignored.
bool base32_decode(const std::string& text, std::vector<uint8_t>& out, std::string& error);

// RFC 6238 code (HMAC-SHA1) for the step containing unix_seconds.
bool totp_code(const std::vector<uint8_t>& key, int64_t unix_seconds, std::string& out, std::string& error);

int totp_remaining_seconds(int64_t unix_seconds);

} // namespace rtk::vrchat
